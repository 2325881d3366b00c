#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace resmerge::res {

/// Structured view of `<type>(-<qualifier>)*/<file>` relative to a resource root.
/// Anything else (no directory, nested directories, empty type) is ungoverned and is
/// left alone by every transform.
struct ResourcePath {
    bool governed = false;
    std::string raw{};

    std::string type{};
    std::vector<std::string> qualifiers{};
    std::string file_name{};
    std::string name{};
    std::string extension{};

    std::string directory() const;
    std::string qualifier_suffix() const;
    std::string str() const;
};

ResourcePath classify(std::string_view rel_path);

bool is_dotfile(std::string_view rel_path);

/// The locale qualifier of a `values-<locale>/<name>.xml` string table, where the whole
/// qualifier suffix must be a locale qualifier.
std::optional<std::string> string_table_locale(const ResourcePath& path);

/// The density qualifier token (`mdpi`, `xxhdpi`, `nodpi`, `320dpi`, ...), if any.
std::optional<std::string> density_qualifier(const ResourcePath& path);

bool is_density_token(std::string_view token);
bool is_image_bucket(const ResourcePath& path);
bool is_mipmap(const ResourcePath& path);

/// Replaces the qualifier tokens spelling `from_locale` (e.g. `zh-rTW`) with those of
/// `to_locale`. Returns nullopt when the path does not carry `from_locale`.
std::optional<ResourcePath> with_locale_replaced(const ResourcePath& path,
                                                 std::string_view from_locale,
                                                 std::string_view to_locale);

/// Replaces the whole qualifier suffix, keeping type and file name.
ResourcePath with_qualifier_suffix(const ResourcePath& path, std::string_view suffix);

ResourcePath without_qualifier(const ResourcePath& path, std::string_view token);

ResourcePath with_extension(const ResourcePath& path, std::string_view extension);

} // namespace resmerge::res
