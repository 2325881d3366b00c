#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace resmerge::config {

using Value = std::variant<std::string, int64_t, bool, std::vector<std::string>>;
using FlatMap = std::map<std::string, Value>;

/// Human name of the type held by `v`, for diagnostics.
const char* value_kind(const Value& v);

namespace toml_lite {

/// Flat `[section]` tables with `key = value` lines. Keys come out as `section.key`.
/// A repeated key keeps its last value and adds a warning.
bool parse_text(std::string_view text,
                std::string_view source,
                FlatMap& out,
                std::vector<std::string>& warnings,
                std::string& err);

bool parse_file(const std::filesystem::path& path,
                FlatMap& out,
                std::vector<std::string>& warnings,
                std::string& err);

} // namespace toml_lite

} // namespace resmerge::config
