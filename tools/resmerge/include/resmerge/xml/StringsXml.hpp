#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace resmerge::xml {

/// A `<string name="...">` element directly under the root, as a byte range of the
/// source document (closing tag included).
struct StringElement {
    std::string name{};
    size_t begin = 0;
    size_t end = 0;
};

bool scan_string_elements(std::string_view doc, std::vector<StringElement>& out, std::string& err);

struct FilterResult {
    std::string text{};
    size_t kept = 0;
    size_t dropped = 0;
};

/// Removes every root-level `<string>` whose name fails `keep`, along with the line it
/// sat on when it was alone there. Everything else is preserved byte for byte and in
/// source order.
bool filter_strings(std::string_view doc,
                    const std::function<bool(std::string_view)>& keep,
                    FilterResult& out,
                    std::string& err);

} // namespace resmerge::xml
