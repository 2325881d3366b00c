#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace resmerge::xml {

/// The `package` attribute of the root `<manifest>` element; empty when absent.
bool read_manifest_package(std::string_view doc, std::string& out, std::string& err);

/// CRLF to LF, trailing whitespace trimmed per line, trailing blank lines dropped.
std::string normalize_manifest_text(std::string_view doc);

/// `-`/`+` prefixed lines describing how `actual` differs from `expected`.
std::vector<std::string> diff_lines(std::string_view expected, std::string_view actual);

} // namespace resmerge::xml
