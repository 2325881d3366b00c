#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace resmerge::text {

std::string trim(std::string_view s);
std::vector<std::string> split(std::string_view s, char sep);
std::vector<std::string> split_ws(std::string_view s);
std::vector<std::string> split_lines(std::string_view s);
std::string join(const std::vector<std::string>& parts, std::string_view sep);

/// Parses `["a", "b"]` (GN list syntax) or `a,b`. Empty input yields an empty list.
bool parse_list(std::string_view text, std::vector<std::string>& out, std::string& err);

/// Accepts `0x`-prefixed hex or plain decimal.
std::optional<uint32_t> parse_u32(std::string_view text);

std::string hex_byte(uint32_t v);

} // namespace resmerge::text
