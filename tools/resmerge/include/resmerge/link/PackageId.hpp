#pragma once

#include <resmerge/diag/DiagCode.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace resmerge::link {

inline constexpr uint32_t k_app_package_id = 0x7f;
inline constexpr uint32_t k_shared_package_id = 0x00;

struct PackageIdPolicy {
    std::optional<uint32_t> explicit_id{};
    std::string package_name{};
    std::map<std::string, uint32_t> name_to_id{};
    bool shared_resources = false;
};

/// Hex byte, with or without `0x`.
std::optional<uint32_t> parse_package_id(std::string_view text);

/// `name=id` entries.
bool parse_name_to_id_mapping(const std::vector<std::string>& entries,
                              std::map<std::string, uint32_t>& out,
                              diag::Bag& bag);

/// ID to request from the linker, if any: explicit, or looked up by package name.
bool requested_package_id(const PackageIdPolicy& policy, std::optional<uint32_t>& out, diag::Bag& bag);

/// ID the linked archive must carry.
bool expected_package_id(const PackageIdPolicy& policy, uint32_t& out, diag::Bag& bag);

struct DumpedPackage {
    std::string name{};
    uint32_t id = 0;
};

/// First `Package name=<name> id=<hex>` line of `aapt2 dump resources` output.
bool parse_dumped_package(std::string_view dump, DumpedPackage& out, std::string& err);

bool check_package_id(uint32_t expected, uint32_t actual, std::string_view subject, diag::Bag& bag);

} // namespace resmerge::link
