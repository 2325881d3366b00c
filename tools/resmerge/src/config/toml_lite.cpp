#include <resmerge/config/TomlLite.hpp>

#include <resmerge/os/File.hpp>
#include <resmerge/text/Strings.hpp>

#include <cctype>
#include <charconv>

namespace resmerge::config {

const char* value_kind(const Value& v) {
    switch (v.index()) {
        case 0: return "string";
        case 1: return "integer";
        case 2: return "boolean";
        case 3: return "string array";
    }
    return "value";
}

namespace toml_lite {

namespace {

/// Cuts a trailing `#` comment that is not inside a quoted string.
std::string_view without_comment(std::string_view line) {
    bool quoted = false;
    for (size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (quoted) {
            if (c == '\\') ++i;
            else if (c == '"') quoted = false;
            continue;
        }
        if (c == '"') quoted = true;
        else if (c == '#') return line.substr(0, i);
    }
    return line;
}

bool unquote(std::string_view text, std::string& out, std::string& err) {
    if (text.size() < 2 || text.front() != '"' || text.back() != '"') {
        err = "expected a quoted string";
        return false;
    }
    out.clear();
    for (size_t i = 1; i + 1 < text.size(); ++i) {
        char c = text[i];
        if (c != '\\') {
            out.push_back(c);
            continue;
        }
        if (i + 2 >= text.size()) {
            err = "dangling escape in string";
            return false;
        }
        c = text[++i];
        switch (c) {
            case 'n': out.push_back('\n'); break;
            case 't': out.push_back('\t'); break;
            case 'r': out.push_back('\r'); break;
            default: out.push_back(c); break;
        }
    }
    return true;
}

bool parse_integer(std::string_view text, int64_t& out) {
    if (text.starts_with('+')) text.remove_prefix(1);
    if (text.empty()) return false;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    return ec == std::errc{} && ptr == text.data() + text.size();
}

bool parse_string_array(std::string_view inner, std::vector<std::string>& out, std::string& err) {
    size_t i = 0;
    while (i < inner.size()) {
        while (i < inner.size() && (std::isspace(static_cast<unsigned char>(inner[i])) || inner[i] == ',')) ++i;
        if (i >= inner.size()) break;
        if (inner[i] != '"') {
            err = "arrays may only hold quoted strings";
            return false;
        }
        size_t j = i + 1;
        while (j < inner.size() && inner[j] != '"') {
            if (inner[j] == '\\') ++j;
            ++j;
        }
        if (j >= inner.size()) {
            err = "unterminated string in array";
            return false;
        }
        std::string item{};
        if (!unquote(inner.substr(i, j - i + 1), item, err)) return false;
        out.push_back(std::move(item));
        i = j + 1;
    }
    return true;
}

bool parse_value(std::string_view raw, Value& out, std::string& err) {
    const std::string v = text::trim(raw);
    if (v.empty()) {
        err = "missing value";
        return false;
    }
    if (v == "true" || v == "false") {
        out = (v == "true");
        return true;
    }
    if (v.front() == '"') {
        std::string s{};
        if (!unquote(v, s, err)) return false;
        out = std::move(s);
        return true;
    }
    if (v.front() == '[') {
        if (v.back() != ']') {
            err = "unterminated array";
            return false;
        }
        std::vector<std::string> items{};
        if (!parse_string_array(std::string_view(v).substr(1, v.size() - 2), items, err)) return false;
        out = std::move(items);
        return true;
    }
    int64_t n = 0;
    if (parse_integer(v, n)) {
        out = n;
        return true;
    }
    err = "unsupported value '" + v + "'";
    return false;
}

bool is_key(std::string_view key) {
    if (key.empty()) return false;
    for (const char c : key) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '-' && c != '.') return false;
    }
    return true;
}

} // namespace

bool parse_text(std::string_view body,
                std::string_view source,
                FlatMap& out,
                std::vector<std::string>& warnings,
                std::string& err) {
    std::string section{};
    size_t line_no = 0;
    for (const auto& raw_line : text::split_lines(body)) {
        ++line_no;
        const std::string where = std::string(source) + ":" + std::to_string(line_no) + ": ";
        const std::string line = text::trim(without_comment(raw_line));
        if (line.empty()) continue;

        if (line.front() == '[') {
            const std::string name = line.back() == ']' ? text::trim(std::string_view(line).substr(1, line.size() - 2)) : std::string{};
            if (!is_key(name)) {
                err = where + "malformed section header";
                return false;
            }
            section = name;
            continue;
        }

        const size_t eq = line.find('=');
        if (eq == std::string::npos) {
            err = where + "expected 'key = value'";
            return false;
        }
        const std::string key = text::trim(std::string_view(line).substr(0, eq));
        if (!is_key(key)) {
            err = where + "malformed key";
            return false;
        }

        Value value{};
        std::string value_err{};
        if (!parse_value(std::string_view(line).substr(eq + 1), value, value_err)) {
            err = where + value_err;
            return false;
        }

        std::string full = section.empty() ? key : section + "." + key;
        if (out.contains(full)) warnings.push_back(where + "'" + full + "' set twice; the later value wins");
        out[std::move(full)] = std::move(value);
    }
    return true;
}

bool parse_file(const std::filesystem::path& path,
                FlatMap& out,
                std::vector<std::string>& warnings,
                std::string& err) {
    auto r = os::read_file(path);
    if (!r.ok) {
        err = r.err;
        return false;
    }
    return parse_text(r.data, path.string(), out, warnings, err);
}

} // namespace toml_lite

} // namespace resmerge::config
