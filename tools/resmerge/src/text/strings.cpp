#include <resmerge/text/Strings.hpp>

#include <cctype>
#include <charconv>

namespace resmerge::text {

namespace {

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

} // namespace

std::string trim(std::string_view s) {
    size_t b = 0;
    while (b < s.size() && is_space(s[b])) ++b;
    size_t e = s.size();
    while (e > b && is_space(s[e - 1])) --e;
    return std::string(s.substr(b, e - b));
}

std::vector<std::string> split(std::string_view s, char sep) {
    std::vector<std::string> out{};
    size_t begin = 0;
    for (;;) {
        const size_t pos = s.find(sep, begin);
        if (pos == std::string_view::npos) {
            out.emplace_back(s.substr(begin));
            break;
        }
        out.emplace_back(s.substr(begin, pos - begin));
        begin = pos + 1;
    }
    return out;
}

std::vector<std::string> split_ws(std::string_view s) {
    std::vector<std::string> out{};
    size_t i = 0;
    while (i < s.size()) {
        while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
        if (i >= s.size()) break;
        size_t j = i;
        while (j < s.size() && !std::isspace(static_cast<unsigned char>(s[j]))) ++j;
        out.emplace_back(s.substr(i, j - i));
        i = j;
    }
    return out;
}

std::vector<std::string> split_lines(std::string_view s) {
    std::vector<std::string> out{};
    size_t begin = 0;
    while (begin < s.size()) {
        size_t end = s.find('\n', begin);
        if (end == std::string_view::npos) end = s.size();
        std::string line(s.substr(begin, end - begin));
        if (!line.empty() && line.back() == '\r') line.pop_back();
        out.push_back(std::move(line));
        begin = end + 1;
    }
    return out;
}

std::string join(const std::vector<std::string>& parts, std::string_view sep) {
    std::string out{};
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i) out += sep;
        out += parts[i];
    }
    return out;
}

bool parse_list(std::string_view text, std::vector<std::string>& out, std::string& err) {
    out.clear();
    const std::string t = trim(text);
    if (t.empty()) return true;

    if (t.front() != '[') {
        for (auto& item : split(t, ',')) {
            auto v = trim(item);
            if (!v.empty()) out.push_back(std::move(v));
        }
        return true;
    }

    if (t.back() != ']') {
        err = "unterminated list: " + t;
        return false;
    }

    size_t i = 1;
    const size_t end = t.size() - 1;
    while (i < end) {
        while (i < end && (is_space(t[i]) || t[i] == ',')) ++i;
        if (i >= end) break;
        if (t[i] != '"') {
            err = "list items must be quoted strings: " + t;
            return false;
        }
        ++i;
        std::string item{};
        bool closed = false;
        for (; i < end; ++i) {
            const char c = t[i];
            if (c == '\\' && i + 1 < end) {
                item.push_back(t[++i]);
                continue;
            }
            if (c == '"') {
                closed = true;
                ++i;
                break;
            }
            item.push_back(c);
        }
        if (!closed) {
            err = "unterminated string in list: " + t;
            return false;
        }
        out.push_back(std::move(item));
    }
    return true;
}

std::optional<uint32_t> parse_u32(std::string_view text) {
    std::string_view s = text;
    int base = 10;
    if (s.size() > 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X')) {
        s.remove_prefix(2);
        base = 16;
    }
    if (s.empty()) return std::nullopt;
    uint32_t v = 0;
    const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v, base);
    if (ec != std::errc{} || ptr != s.data() + s.size()) return std::nullopt;
    return v;
}

std::string hex_byte(uint32_t v) {
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string out{"0x"};
    out.push_back(kDigits[(v >> 4) & 0xF]);
    out.push_back(kDigits[v & 0xF]);
    return out;
}

} // namespace resmerge::text
