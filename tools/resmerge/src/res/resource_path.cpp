#include <resmerge/res/ResourcePath.hpp>

#include <resmerge/res/Locale.hpp>
#include <resmerge/text/Strings.hpp>

#include <algorithm>
#include <array>
#include <cctype>

namespace resmerge::res {

namespace {

constexpr std::array<std::string_view, 9> kNamedDensities{
    "ldpi", "mdpi", "tvdpi", "hdpi", "xhdpi", "xxhdpi", "xxxhdpi", "nodpi", "anydpi",
};

bool is_identifier_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '+';
}

} // namespace

std::string ResourcePath::directory() const {
    if (qualifiers.empty()) return type;
    return type + "-" + qualifier_suffix();
}

std::string ResourcePath::qualifier_suffix() const {
    return text::join(qualifiers, "-");
}

std::string ResourcePath::str() const {
    if (!governed) return raw;
    return directory() + "/" + file_name;
}

ResourcePath classify(std::string_view rel_path) {
    ResourcePath out{};
    out.raw = std::string(rel_path);

    const size_t slash = rel_path.find('/');
    if (slash == std::string_view::npos || slash == 0) return out;
    if (rel_path.find('/', slash + 1) != std::string_view::npos) return out;

    const std::string_view dir = rel_path.substr(0, slash);
    const std::string_view file = rel_path.substr(slash + 1);
    if (file.empty()) return out;

    auto tokens = text::split(dir, '-');
    if (tokens.empty() || tokens.front().empty()) return out;
    for (const auto& t : tokens) {
        if (t.empty()) return out;
        if (!std::all_of(t.begin(), t.end(), is_identifier_char)) return out;
    }

    out.type = tokens.front();
    out.qualifiers.assign(tokens.begin() + 1, tokens.end());
    out.file_name = std::string(file);

    const size_t first_dot = file.find('.');
    out.name = std::string(file.substr(0, first_dot));
    const size_t last_dot = file.rfind('.');
    if (last_dot != std::string_view::npos && last_dot != 0) {
        out.extension = std::string(file.substr(last_dot));
    }
    out.governed = true;
    return out;
}

bool is_dotfile(std::string_view rel_path) {
    const size_t slash = rel_path.rfind('/');
    const std::string_view base = (slash == std::string_view::npos) ? rel_path : rel_path.substr(slash + 1);
    return !base.empty() && base.front() == '.';
}

std::optional<std::string> string_table_locale(const ResourcePath& path) {
    if (!path.governed || path.type != "values" || path.qualifiers.empty()) return std::nullopt;
    if (path.extension != ".xml") return std::nullopt;
    std::string suffix = path.qualifier_suffix();
    if (!is_locale_qualifier(suffix)) return std::nullopt;
    return suffix;
}

bool is_density_token(std::string_view token) {
    for (const auto d : kNamedDensities) {
        if (token == d) return true;
    }
    if (token.size() <= 3 || !token.ends_with("dpi")) return false;
    const auto digits = token.substr(0, token.size() - 3);
    return std::all_of(digits.begin(), digits.end(), [](char c) {
        return std::isdigit(static_cast<unsigned char>(c)) != 0;
    });
}

std::optional<std::string> density_qualifier(const ResourcePath& path) {
    if (!path.governed) return std::nullopt;
    for (const auto& q : path.qualifiers) {
        if (is_density_token(q)) return q;
    }
    return std::nullopt;
}

bool is_image_bucket(const ResourcePath& path) {
    return path.governed && (path.type == "drawable" || path.type == "mipmap");
}

bool is_mipmap(const ResourcePath& path) {
    return path.governed && path.type == "mipmap";
}

std::optional<ResourcePath> with_locale_replaced(const ResourcePath& path,
                                                 std::string_view from_locale,
                                                 std::string_view to_locale) {
    if (!path.governed) return std::nullopt;
    const auto from = text::split(from_locale, '-');
    const auto to = text::split(to_locale, '-');
    if (from.empty() || from.size() > path.qualifiers.size()) return std::nullopt;

    for (size_t i = 0; i + from.size() <= path.qualifiers.size(); ++i) {
        if (!std::equal(from.begin(), from.end(), path.qualifiers.begin() + static_cast<std::ptrdiff_t>(i))) {
            continue;
        }
        // A bare language must not match the language half of a longer locale.
        const size_t after = i + from.size();
        if (after < path.qualifiers.size() && path.qualifiers[after].size() == 3 &&
            path.qualifiers[after][0] == 'r' && from.size() == 1) {
            continue;
        }
        ResourcePath out = path;
        out.qualifiers.erase(out.qualifiers.begin() + static_cast<std::ptrdiff_t>(i),
                             out.qualifiers.begin() + static_cast<std::ptrdiff_t>(after));
        out.qualifiers.insert(out.qualifiers.begin() + static_cast<std::ptrdiff_t>(i), to.begin(), to.end());
        out.raw = out.str();
        return out;
    }
    return std::nullopt;
}

ResourcePath with_qualifier_suffix(const ResourcePath& path, std::string_view suffix) {
    ResourcePath out = path;
    out.qualifiers = suffix.empty() ? std::vector<std::string>{} : text::split(suffix, '-');
    out.raw = out.str();
    return out;
}

ResourcePath without_qualifier(const ResourcePath& path, std::string_view token) {
    ResourcePath out = path;
    out.qualifiers.erase(std::remove(out.qualifiers.begin(), out.qualifiers.end(), token), out.qualifiers.end());
    out.raw = out.str();
    return out;
}

ResourcePath with_extension(const ResourcePath& path, std::string_view extension) {
    ResourcePath out = path;
    const size_t cut = out.file_name.size() - out.extension.size();
    out.file_name = out.file_name.substr(0, cut) + std::string(extension);
    out.extension = std::string(extension);
    out.raw = out.str();
    return out;
}

} // namespace resmerge::res
