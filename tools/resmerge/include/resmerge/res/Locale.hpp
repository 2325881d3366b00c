#pragma once

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace resmerge::res {

struct LocaleParts {
    std::string language{};
    std::string script{};
    std::string region{};
    std::string variant{};
};

/// `ll`, `ll-rRR` (legacy) or `b+ll[+Scrp][+RR][+variant]` (extended).
std::optional<LocaleParts> parse_android_qualifier(std::string_view qualifier);
/// `ll[-Scrp][-RR][-variant]`, region may be three digits.
std::optional<LocaleParts> parse_language_tag(std::string_view tag);

bool is_locale_qualifier(std::string_view qualifier);
bool is_legacy_qualifier(std::string_view qualifier);

std::optional<std::string> to_language_tag(std::string_view android_qualifier);
std::optional<std::string> to_android_qualifier(std::string_view language_tag);

enum class LocaleRule : uint8_t {
    kNone,
    kLegacyCode,
    kMacrolanguage,
    kThreeLetterCollapse,
    kExtendedTag,
    kRegionAlias,
};

const char* rule_name(LocaleRule rule);

struct CanonicalLocale {
    std::string qualifier{};
    LocaleRule rule = LocaleRule::kNone;
};

/// Qualifier the platform expects for `qualifier`; nullopt when the qualifier cannot be
/// translated (it is then reported and left untouched, never dropped).
std::optional<CanonicalLocale> canonicalize_qualifier(std::string_view qualifier);

/// Resolves allow-list entries (language tags or legacy qualifiers) to legacy
/// qualifiers, adding the bare-language fallback of each. Extended forms are rejected.
bool resolve_locale_list(const std::vector<std::string>& entries,
                         std::set<std::string>& out,
                         std::string& err);

std::string language_of(std::string_view qualifier);

} // namespace resmerge::res
