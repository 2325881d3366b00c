#include <resmerge/link/PackageId.hpp>

#include <resmerge/text/Strings.hpp>

#include <charconv>

namespace resmerge::link {

std::optional<uint32_t> parse_package_id(std::string_view text) {
    std::string_view s = text;
    if (s.starts_with("0x") || s.starts_with("0X")) s.remove_prefix(2);
    if (s.empty() || s.size() > 2) return std::nullopt;
    uint32_t v = 0;
    const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v, 16);
    if (ec != std::errc{} || ptr != s.data() + s.size()) return std::nullopt;
    return v;
}

bool parse_name_to_id_mapping(const std::vector<std::string>& entries,
                              std::map<std::string, uint32_t>& out,
                              diag::Bag& bag) {
    bool ok = true;
    for (const auto& entry : entries) {
        const size_t eq = entry.find('=');
        const auto id = (eq == std::string::npos) ? std::nullopt : parse_package_id(text::trim(entry.substr(eq + 1)));
        if (eq == std::string::npos || eq == 0 || !id) {
            bag.error(diag::Code::kConfigurationContradiction, entry, "expected <package-name>=<package-id>");
            ok = false;
            continue;
        }
        out[text::trim(entry.substr(0, eq))] = *id;
    }
    return ok;
}

bool requested_package_id(const PackageIdPolicy& policy, std::optional<uint32_t>& out, diag::Bag& bag) {
    out = policy.explicit_id;
    if (policy.package_name.empty()) return true;
    const auto it = policy.name_to_id.find(policy.package_name);
    if (it == policy.name_to_id.end()) {
        bag.error(diag::Code::kMissingResource, policy.package_name,
                  "package name " + policy.package_name + " is not present in the package name to ID mapping");
        return false;
    }
    out = it->second;
    return true;
}

bool expected_package_id(const PackageIdPolicy& policy, uint32_t& out, diag::Bag& bag) {
    std::optional<uint32_t> requested{};
    if (!requested_package_id(policy, requested, bag)) return false;
    if (requested) out = *requested;
    else out = policy.shared_resources ? k_shared_package_id : k_app_package_id;
    return true;
}

bool parse_dumped_package(std::string_view dump, DumpedPackage& out, std::string& err) {
    for (const auto& line : text::split_lines(dump)) {
        const auto fields = text::split_ws(line);
        if (fields.size() < 3 || fields[0] != "Package") continue;
        if (!fields[1].starts_with("name=") || !fields[2].starts_with("id=")) continue;
        const auto id = parse_package_id(std::string_view(fields[2]).substr(3));
        if (!id) {
            err = "unreadable package id in line: " + line;
            return false;
        }
        out.name = fields[1].substr(5);
        out.id = *id;
        return true;
    }
    err = "no package line in resource dump";
    return false;
}

bool check_package_id(uint32_t expected, uint32_t actual, std::string_view subject, diag::Bag& bag) {
    if (expected == actual) return true;
    bag.error(diag::Code::kPolicyMismatch, std::string(subject),
              "Invalid package ID " + text::hex_byte(actual) + " (expected " + text::hex_byte(expected) + ")");
    return false;
}

} // namespace resmerge::link
