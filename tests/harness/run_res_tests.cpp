#include <resmerge/res/Locale.hpp>
#include <resmerge/res/ResourcePath.hpp>
#include <resmerge/res/SymbolTable.hpp>
#include <resmerge/text/Strings.hpp>

#include <iostream>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace {

    static bool require_(bool cond, const char* msg) {
        if (cond) return true;
        std::cerr << "  - " << msg << "\n";
        return false;
    }

    static bool test_path_classifier_table_() {
        struct Row {
            std::string_view path;
            bool governed;
            std::string_view type;
            std::string_view suffix;
            std::string_view name;
            std::string_view ext;
        };
        const Row rows[] = {
            {"values/strings.xml", true, "values", "", "strings", ".xml"},
            {"values-fr/strings.xml", true, "values", "fr", "strings", ".xml"},
            {"values-zh-rTW/strings.xml", true, "values", "zh-rTW", "strings", ".xml"},
            {"values-b+sr+Latn/strings.xml", true, "values", "b+sr+Latn", "strings", ".xml"},
            {"drawable-mdpi-v4/icon.png", true, "drawable", "mdpi-v4", "icon", ".png"},
            {"drawable-xxhdpi/btn.9.png", true, "drawable", "xxhdpi", "btn", ".png"},
            {"mipmap-hdpi/ic_launcher.webp", true, "mipmap", "hdpi", "ic_launcher", ".webp"},
            {"AndroidManifest.xml", false, "", "", "", ""},
            {"raw/nested/file.bin", false, "", "", "", ""},
            {"/values/strings.xml", false, "", "", "", ""},
            {"values--fr/strings.xml", false, "", "", "", ""},
            {"values/", false, "", "", "", ""},
        };

        bool ok = true;
        for (const auto& r : rows) {
            const auto p = resmerge::res::classify(r.path);
            if (p.governed != r.governed) {
                std::cerr << "  - governed mismatch for " << r.path << "\n";
                ok = false;
                continue;
            }
            if (!p.governed) {
                ok &= require_(p.str() == r.path, "ungoverned paths must round-trip unchanged");
                continue;
            }
            const bool same = p.type == r.type && p.qualifier_suffix() == r.suffix && p.name == r.name && p.extension == r.ext;
            if (!same) {
                std::cerr << "  - field mismatch for " << r.path << "\n";
                ok = false;
            }
            ok &= require_(p.str() == r.path, "governed paths must round-trip through str()");
        }
        return ok;
    }

    static bool test_path_predicates_() {
        using namespace resmerge::res;
        bool ok = true;
        ok &= require_(is_dotfile("values/.DS_Store"), "basename starting with a dot is a dotfile");
        ok &= require_(!is_dotfile("values/strings.xml"), "plain file is not a dotfile");

        ok &= require_(string_table_locale(classify("values-fr/strings.xml")) == std::optional<std::string>("fr"),
                       "values-fr xml is a French string table");
        ok &= require_(!string_table_locale(classify("values-v21/styles.xml")), "values-v21 has no locale");
        ok &= require_(!string_table_locale(classify("values-fr-v21/strings.xml")), "mixed suffix is not a pure locale");
        ok &= require_(!string_table_locale(classify("drawable-fr/a.xml")), "only values directories hold string tables");
        ok &= require_(!string_table_locale(classify("values-fr/notes.txt")), "only xml files are string tables");

        ok &= require_(density_qualifier(classify("drawable-mdpi-v4/a.png")) == std::optional<std::string>("mdpi"),
                       "mdpi density must be found among other qualifiers");
        ok &= require_(density_qualifier(classify("drawable-320dpi/a.png")) == std::optional<std::string>("320dpi"),
                       "numeric density must be recognised");
        ok &= require_(!density_qualifier(classify("drawable-land/a.png")), "land is not a density");
        ok &= require_(is_mipmap(classify("mipmap-hdpi/a.png")), "mipmap bucket");
        ok &= require_(is_image_bucket(classify("drawable/a.png")), "drawable bucket");
        ok &= require_(!is_image_bucket(classify("layout/a.xml")), "layout is not an image bucket");
        return ok;
    }

    static bool test_path_rewrites_() {
        using namespace resmerge::res;
        bool ok = true;

        const auto tw = with_locale_replaced(classify("values-zh-rTW-v21/strings.xml"), "zh-rTW", "zh-rHK");
        ok &= require_(tw.has_value() && tw->str() == "values-zh-rHK-v21/strings.xml", "zh-rTW must become zh-rHK in place");

        const auto bare = with_locale_replaced(classify("values-zh-rTW/strings.xml"), "zh", "en");
        ok &= require_(!bare.has_value(), "bare language must not match a regional locale");

        ok &= require_(without_qualifier(classify("drawable-mdpi-v4/icon.png"), "mdpi").str() == "drawable-v4/icon.png",
                       "removing the density qualifier keeps the rest");
        ok &= require_(without_qualifier(classify("drawable-mdpi/icon.png"), "mdpi").str() == "drawable/icon.png",
                       "removing the only qualifier leaves the bare type");
        ok &= require_(with_extension(classify("drawable/icon.png"), ".webp").str() == "drawable/icon.webp",
                       "extension swap");
        ok &= require_(with_qualifier_suffix(classify("values-iw/strings.xml"), "he").str() == "values-he/strings.xml",
                       "suffix swap");
        return ok;
    }

    static bool test_locale_conversions_() {
        using namespace resmerge::res;
        bool ok = true;

        ok &= require_(is_legacy_qualifier("en"), "en is legacy");
        ok &= require_(is_legacy_qualifier("es-r419") || is_legacy_qualifier("pt-rBR"), "regional legacy form");
        ok &= require_(!is_legacy_qualifier("b+sr+Latn"), "extended form is not legacy");
        ok &= require_(is_locale_qualifier("b+sr+Latn"), "extended form is a locale");
        ok &= require_(!is_locale_qualifier("v21"), "v21 is not a locale");
        ok &= require_(!is_locale_qualifier("land"), "land is not a locale");

        ok &= require_(to_language_tag("tl") == std::optional<std::string>("fil"), "tl -> fil");
        ok &= require_(to_language_tag("in") == std::optional<std::string>("id"), "in -> id");
        ok &= require_(to_language_tag("iw-rIL") == std::optional<std::string>("he-IL"), "iw-rIL -> he-IL");
        ok &= require_(to_language_tag("es-rUS") == std::optional<std::string>("es-419"), "es-rUS -> es-419");
        ok &= require_(to_language_tag("b+sr+Latn") == std::optional<std::string>("sr-Latn"), "b+sr+Latn -> sr-Latn");

        ok &= require_(to_android_qualifier("fil") == std::optional<std::string>("tl"), "fil -> tl");
        ok &= require_(to_android_qualifier("he") == std::optional<std::string>("iw"), "he -> iw");
        ok &= require_(to_android_qualifier("es-419") == std::optional<std::string>("es-rUS"), "es-419 -> es-rUS");
        ok &= require_(to_android_qualifier("zh-TW") == std::optional<std::string>("zh-rTW"), "zh-TW -> zh-rTW");
        ok &= require_(to_android_qualifier("sr-Latn") == std::optional<std::string>("b+sr+Latn"), "script needs b+ form");
        return ok;
    }

    static bool test_locale_canonicalization_() {
        using namespace resmerge::res;
        bool ok = true;

        const auto in = canonicalize_qualifier("id");
        ok &= require_(in.has_value() && in->qualifier == "in", "id is spelled in");
        ok &= require_(in.has_value() && in->rule == LocaleRule::kLegacyCode, "id uses the legacy code rule");

        const auto fil = canonicalize_qualifier("fil");
        ok &= require_(fil.has_value() && fil->qualifier == "tl", "fil collapses to tl");

        const auto ext = canonicalize_qualifier("b+es+419");
        ok &= require_(ext.has_value() && ext->qualifier == "es-rUS", "b+es+419 becomes es-rUS");

        const auto same = canonicalize_qualifier("fr-rCA");
        ok &= require_(same.has_value() && same->qualifier == "fr-rCA" && same->rule == LocaleRule::kNone,
                       "canonical qualifiers map to themselves");

        std::set<std::string> out{};
        std::string err{};
        ok &= require_(resolve_locale_list({"en-US", "zh-rTW", "he"}, out, err), "allow-list must resolve");
        ok &= require_(out.contains("en-rUS") && out.contains("en"), "en-US adds its bare language");
        ok &= require_(out.contains("zh-rTW") && out.contains("zh"), "legacy entries are accepted as is");
        ok &= require_(out.contains("iw"), "he resolves to iw");

        std::set<std::string> bad{};
        ok &= require_(!resolve_locale_list({"sr-Latn"}, bad, err), "extended results are rejected");
        ok &= require_(err.find("sr-Latn") != std::string::npos, "error names the entry");
        return ok;
    }

    static bool test_symbol_table_() {
        const auto table = resmerge::res::parse_symbol_table(
            "int string app_name 0x7f010000\n"
            "int string title 0x7f010001\r\n"
            "int id root_view 0x7f020000\n"
            "int[] styleable Widget { 0x7f030000, 0x7f030001 }\n"
            "\n"
            "garbage\n");

        bool ok = true;
        ok &= require_(table.symbols.size() == 4, "four well-formed lines");
        const auto strings = table.names_of_type("string");
        ok &= require_(strings.size() == 2 && strings.contains("app_name") && strings.contains("title"), "string names");
        ok &= require_(table.names_of_type("id") == std::set<std::string>{"root_view"}, "id names");
        ok &= require_(table.symbols.back().value == "{ 0x7f030000, 0x7f030001 }", "value keeps its spacing tokens");
        return ok;
    }

    static bool test_text_helpers_() {
        using namespace resmerge::text;
        bool ok = true;

        std::vector<std::string> items{};
        std::string err{};
        ok &= require_(parse_list("[\"a\", \"b c\"]", items, err) && items == std::vector<std::string>{"a", "b c"}, "GN list");
        ok &= require_(parse_list("x, y,,z", items, err) && items == std::vector<std::string>{"x", "y", "z"}, "comma list");
        ok &= require_(parse_list("", items, err) && items.empty(), "empty list");
        ok &= require_(!parse_list("[\"a\"", items, err), "unterminated GN list fails");

        ok &= require_(parse_u32("0x7f") == std::optional<uint32_t>(0x7f), "hex u32");
        ok &= require_(parse_u32("21") == std::optional<uint32_t>(21), "decimal u32");
        ok &= require_(!parse_u32("21a"), "trailing junk rejected");
        ok &= require_(hex_byte(0x2) == "0x02", "hex byte is zero padded");
        ok &= require_(split_lines("a\r\nb\n") == std::vector<std::string>{"a", "b"}, "split_lines strips CR");
        return ok;
    }

} // namespace

int main() {
    struct Case {
        const char* name;
        bool (*fn)();
    };

    const Case cases[] = {
        {"path_classifier_table", test_path_classifier_table_},
        {"path_predicates", test_path_predicates_},
        {"path_rewrites", test_path_rewrites_},
        {"locale_conversions", test_locale_conversions_},
        {"locale_canonicalization", test_locale_canonicalization_},
        {"symbol_table", test_symbol_table_},
        {"text_helpers", test_text_helpers_},
    };

    int failed = 0;
    for (const auto& c : cases) {
        std::cout << "[TEST] " << c.name << "\n";
        if (!c.fn()) {
            ++failed;
            std::cout << "  -> FAIL\n";
        } else {
            std::cout << "  -> PASS\n";
        }
    }

    if (failed != 0) {
        std::cout << "\nFAILED " << failed << " test(s)\n";
        return 1;
    }
    std::cout << "\nALL TESTS PASSED\n";
    return 0;
}
