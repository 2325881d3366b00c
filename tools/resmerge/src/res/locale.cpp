#include <resmerge/res/Locale.hpp>

#include <resmerge/text/Strings.hpp>

#include <array>
#include <cctype>
#include <initializer_list>
#include <utility>

namespace resmerge::res {

namespace {

using NamePair = std::pair<std::string_view, std::string_view>;

// Platform spelling -> tag spelling.
constexpr std::array<NamePair, 5> kQualifierToTagLanguage{{
    {"tl", "fil"},
    {"in", "id"},
    {"iw", "he"},
    {"ji", "yi"},
    {"no", "nb"},
}};

// Tag spelling -> platform spelling. `nb` has no reverse entry: `no` is not a language.
constexpr std::array<NamePair, 4> kTagToQualifierLanguage{{
    {"fil", "tl"},
    {"he", "iw"},
    {"id", "in"},
    {"yi", "ji"},
}};

std::string_view lookup(std::string_view key, const auto& table) {
    for (const auto& [from, to] : table) {
        if (from == key) return to;
    }
    return {};
}

template <typename Pred>
bool all_chars(std::string_view s, Pred pred) {
    if (s.empty()) return false;
    for (const char c : s) {
        if (!pred(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

constexpr auto kLower = [](unsigned char c) { return std::islower(c) != 0; };
constexpr auto kUpper = [](unsigned char c) { return std::isupper(c) != 0; };
constexpr auto kDigit = [](unsigned char c) { return std::isdigit(c) != 0; };
constexpr auto kAlpha = [](unsigned char c) { return std::isalpha(c) != 0; };
constexpr auto kAlnum = [](unsigned char c) { return std::isalnum(c) != 0; };

bool is_language(std::string_view s) {
    return (s.size() == 2 || s.size() == 3) && all_chars(s, kLower);
}

bool is_region(std::string_view s) {
    if (s.size() == 2) return all_chars(s, kUpper);
    if (s.size() == 3) return all_chars(s, kDigit);
    return false;
}

bool is_script(std::string_view s) {
    return s.size() == 4 && all_chars(s, kAlpha);
}

bool is_variant(std::string_view s) {
    if (s.size() < 4 || s.size() > 8) return false;
    if (s.size() == 4 && !std::isdigit(static_cast<unsigned char>(s[0]))) return false;
    return all_chars(s, kAlnum);
}

std::string title_case(std::string_view s) {
    std::string out(s);
    for (size_t i = 0; i < out.size(); ++i) {
        const auto c = static_cast<unsigned char>(out[i]);
        out[i] = static_cast<char>(i == 0 ? std::toupper(c) : std::tolower(c));
    }
    return out;
}

std::string lower(std::string_view s) {
    std::string out(s);
    for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

std::string upper(std::string_view s) {
    std::string out(s);
    for (auto& c : out) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return out;
}

// Assigns subtags after the language in BCP 47 order: script, region, variant.
bool assign_subtags(const std::vector<std::string>& subtags, size_t first, LocaleParts& out, bool normalize_case) {
    int stage = 0;
    for (size_t i = first; i < subtags.size(); ++i) {
        const std::string& s = subtags[i];
        if (stage < 1 && is_script(s)) {
            out.script = title_case(s);
            stage = 1;
            continue;
        }
        const std::string region = normalize_case ? upper(s) : s;
        if (stage < 2 && is_region(region)) {
            out.region = region;
            stage = 2;
            continue;
        }
        const std::string variant = normalize_case ? lower(s) : s;
        if (stage < 3 && is_variant(variant)) {
            out.variant = variant;
            stage = 3;
            continue;
        }
        return false;
    }
    return true;
}

std::string render_tag(const LocaleParts& p) {
    std::string out = p.language;
    for (const auto* part : {&p.script, &p.region, &p.variant}) {
        if (part->empty()) continue;
        out += "-";
        out += *part;
    }
    return out;
}

std::string render_qualifier(const LocaleParts& p) {
    if (p.script.empty() && p.variant.empty()) {
        if (p.region.empty()) return p.language;
        return p.language + "-r" + p.region;
    }
    std::string out = "b+" + p.language;
    for (const auto* part : {&p.script, &p.region, &p.variant}) {
        if (part->empty()) continue;
        out += "+";
        out += *part;
    }
    return out;
}

} // namespace

std::optional<LocaleParts> parse_android_qualifier(std::string_view qualifier) {
    if (qualifier.starts_with("b+")) {
        const auto subtags = text::split(qualifier.substr(2), '+');
        if (subtags.empty()) return std::nullopt;
        LocaleParts out{};
        out.language = lower(subtags.front());
        if (!is_language(out.language)) return std::nullopt;
        if (!assign_subtags(subtags, 1, out, true)) return std::nullopt;
        return out;
    }

    const auto parts = text::split(qualifier, '-');
    if (parts.empty() || parts.size() > 2) return std::nullopt;
    LocaleParts out{};
    out.language = parts[0];
    if (!is_language(out.language)) return std::nullopt;
    if (parts.size() == 2) {
        const std::string& r = parts[1];
        if (r.size() < 2 || r[0] != 'r' || !is_region(std::string_view(r).substr(1))) return std::nullopt;
        out.region = r.substr(1);
    }
    return out;
}

std::optional<LocaleParts> parse_language_tag(std::string_view tag) {
    const auto subtags = text::split(tag, '-');
    if (subtags.empty()) return std::nullopt;
    LocaleParts out{};
    out.language = subtags.front();
    if (!is_language(out.language)) return std::nullopt;
    if (!assign_subtags(subtags, 1, out, false)) return std::nullopt;
    return out;
}

bool is_locale_qualifier(std::string_view qualifier) {
    return parse_android_qualifier(qualifier).has_value();
}

bool is_legacy_qualifier(std::string_view qualifier) {
    return !qualifier.starts_with("b+") && parse_android_qualifier(qualifier).has_value();
}

std::optional<std::string> to_language_tag(std::string_view android_qualifier) {
    auto parts = parse_android_qualifier(android_qualifier);
    if (!parts) return std::nullopt;
    if (const auto mapped = lookup(parts->language, kQualifierToTagLanguage); !mapped.empty()) {
        parts->language = std::string(mapped);
    }
    if (parts->language == "es" && parts->region == "US" && parts->script.empty() && parts->variant.empty()) {
        return std::string("es-419");
    }
    return render_tag(*parts);
}

std::optional<std::string> to_android_qualifier(std::string_view language_tag) {
    if (language_tag == "es-419") return std::string("es-rUS");
    auto parts = parse_language_tag(language_tag);
    if (!parts) return std::nullopt;
    if (const auto mapped = lookup(parts->language, kTagToQualifierLanguage); !mapped.empty()) {
        parts->language = std::string(mapped);
    }
    return render_qualifier(*parts);
}

const char* rule_name(LocaleRule rule) {
    switch (rule) {
        case LocaleRule::kNone: return "none";
        case LocaleRule::kLegacyCode: return "legacy-code";
        case LocaleRule::kMacrolanguage: return "macrolanguage";
        case LocaleRule::kThreeLetterCollapse: return "three-letter-collapse";
        case LocaleRule::kExtendedTag: return "extended-tag";
        case LocaleRule::kRegionAlias: return "region-alias";
    }
    return "none";
}

std::optional<CanonicalLocale> canonicalize_qualifier(std::string_view qualifier) {
    const auto observed = parse_android_qualifier(qualifier);
    if (!observed) return std::nullopt;
    const auto tag = to_language_tag(qualifier);
    if (!tag) return std::nullopt;
    auto back = to_android_qualifier(*tag);
    if (!back) return std::nullopt;

    CanonicalLocale out{};
    out.qualifier = std::move(*back);
    if (out.qualifier == qualifier) return out;

    const std::string& lang = observed->language;
    if (lang == "id" || lang == "he" || lang == "yi") {
        out.rule = LocaleRule::kLegacyCode;
    } else if (lang == "no") {
        out.rule = LocaleRule::kMacrolanguage;
    } else if (lang == "fil") {
        out.rule = LocaleRule::kThreeLetterCollapse;
    } else if (qualifier.starts_with("b+")) {
        out.rule = LocaleRule::kExtendedTag;
    } else {
        out.rule = LocaleRule::kRegionAlias;
    }
    return out;
}

std::string language_of(std::string_view qualifier) {
    const auto parts = parse_android_qualifier(qualifier);
    if (parts) return parts->language;
    return std::string(qualifier.substr(0, qualifier.find('-')));
}

bool resolve_locale_list(const std::vector<std::string>& entries,
                         std::set<std::string>& out,
                         std::string& err) {
    for (const auto& entry : entries) {
        std::optional<std::string> qualifier = to_android_qualifier(entry);
        if (!qualifier) {
            if (auto c = canonicalize_qualifier(entry); c.has_value()) qualifier = c->qualifier;
        }
        if (!qualifier || qualifier->starts_with("b+")) {
            err = "unsupported locale name: " + entry;
            return false;
        }
        out.insert(*qualifier);
        out.insert(language_of(*qualifier));
    }
    return true;
}

} // namespace resmerge::res
