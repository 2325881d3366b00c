#include <resmerge/log/Reporter.hpp>
#include <resmerge/merge/DensityMigrator.hpp>
#include <resmerge/merge/ImageRecompressor.hpp>
#include <resmerge/merge/KeepFilter.hpp>
#include <resmerge/merge/LocaleNormalizer.hpp>
#include <resmerge/merge/LocaleStringFilter.hpp>
#include <resmerge/merge/MergePipeline.hpp>
#include <resmerge/merge/PlatformDuplicator.hpp>
#include <resmerge/tree/ResourceTree.hpp>

#include <iostream>
#include <map>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace {

    using resmerge::diag::Bag;
    using resmerge::diag::Code;
    using resmerge::ledger::LedgerDelta;
    using resmerge::tree::MemoryTree;

    static bool require_(bool cond, const char* msg) {
        if (cond) return true;
        std::cerr << "  - " << msg << "\n";
        return false;
    }

    static std::string read_(const MemoryTree& tree, const std::string& rel) {
        std::string out{};
        std::string err{};
        if (!tree.read(rel, out, err)) return "<missing>";
        return out;
    }

    /// Writes "webp:<png bytes>"; fails on any file whose name contains "broken".
    class FakeEncoder final : public resmerge::merge::ImageEncoder {
    public:
        bool convert(resmerge::tree::ResourceTree& tree, std::string_view src, std::string_view dst, std::string& err) override {
            if (src.find("broken") != std::string_view::npos) {
                err = "cannot encode " + std::string(src);
                return false;
            }
            std::string data{};
            if (!tree.read(src, data, err)) return false;
            return tree.write(dst, "webp:" + data, err);
        }
    };

    const char* kEnStrings =
        "<resources>\n"
        "  <string name=\"hello\">Hello</string>\n"
        "</resources>\n";

    const char* kFrStrings =
        "<resources>\n"
        "  <string name=\"app_name\">Appli</string>\n"
        "  <string name=\"hello\">Bonjour</string>\n"
        "  <plurals name=\"count\"/>\n"
        "</resources>\n";

    static bool test_scenario_a_locale_filter_() {
        MemoryTree tree("dep.zip", {
            {"values/strings.xml", kEnStrings},
            {"values-en/strings.xml", kEnStrings},
            {"values-fr/strings.xml", kFrStrings},
            {"values-zh-rTW/strings.xml", kFrStrings},
            {"drawable-zh-rTW/flag.png", "png"},
        });

        Bag bag{};
        resmerge::merge::LocalePolicy policy{};
        bool ok = require_(resmerge::merge::resolve_locale_policy({"en"}, {"fr"}, {}, policy, bag), "policy resolves");
        policy.shared_names = {"app_name"};

        const auto partition = resmerge::merge::partition_locales(resmerge::merge::observed_locales({&tree}), policy);
        ok &= require_(partition.size() == 3, "one fate per observed locale");
        ok &= require_(partition.at("en") == resmerge::merge::LocaleFate::kNonSharedOnly, "en keeps non-shared names");
        ok &= require_(partition.at("fr") == resmerge::merge::LocaleFate::kSharedOnly, "fr keeps shared names");
        ok &= require_(partition.at("zh-rTW") == resmerge::merge::LocaleFate::kRemove, "zh-rTW is removed");

        LedgerDelta delta{};
        resmerge::merge::StringFilterStats stats{};
        ok &= require_(resmerge::merge::filter_locale_strings(tree, partition, policy.shared_names, delta, bag, &stats),
                       "filter succeeds");

        ok &= require_(!tree.exists("values-zh-rTW/strings.xml"), "zh-TW string table deleted");
        ok &= require_(tree.exists("drawable-zh-rTW/flag.png"), "only string tables are filtered");
        ok &= require_(read_(tree, "values-en/strings.xml") == kEnStrings, "en strings untouched");
        ok &= require_(read_(tree, "values/strings.xml") == kEnStrings, "default strings untouched");
        ok &= require_(read_(tree, "values-fr/strings.xml") ==
                           "<resources>\n"
                           "  <string name=\"app_name\">Appli</string>\n"
                           "  <plurals name=\"count\"/>\n"
                           "</resources>\n",
                       "fr keeps only app_name and non-string elements");
        ok &= require_(stats.removed_files == 1 && stats.rewritten_files == 1 && stats.dropped_strings == 1, "stats");
        ok &= require_(delta.ops.size() == 1 && delta.ops[0].op == resmerge::ledger::Op::kRemove, "one removal recorded");

        for (const auto& [locale, fate] : partition) {
            if (fate != resmerge::merge::LocaleFate::kRemove) continue;
            for (const auto& rel : tree.list_files()) {
                const auto found = resmerge::res::string_table_locale(resmerge::res::classify(rel));
                ok &= require_(!found || *found != locale, "removed locales leave no string tables");
            }
        }
        return ok;
    }

    static bool test_no_allow_lists_is_noop_() {
        resmerge::merge::LocalePolicy policy{};
        Bag bag{};
        bool ok = require_(resmerge::merge::resolve_locale_policy({}, {}, {"zh-rHK"}, policy, bag), "empty lists resolve");
        ok &= require_(!policy.active(), "no lists means inactive policy");
        const auto partition = resmerge::merge::partition_locales({"en", "fr", "zh-rTW"}, policy);
        for (const auto& [_, fate] : partition) {
            ok &= require_(fate == resmerge::merge::LocaleFate::kKeepAll, "every locale kept");
        }

        resmerge::merge::LocalePolicy bad{};
        ok &= require_(!resmerge::merge::resolve_locale_policy({"sr-Latn"}, {}, {}, bad, bag), "extended locale rejected");
        ok &= require_(bag.has_code(Code::kConfigurationContradiction), "rejection is a contradiction");
        return ok;
    }

    static bool test_scenario_c_density_closure_() {
        MemoryTree tree("dep.zip", {
            {"drawable-hdpi/unused.png", "h"},
            {"drawable-mdpi/unused.png", "m"},
            {"drawable-hdpi/gone.png", "h"},
            {"drawable-xhdpi/gone.xml", "x"},
            {"mipmap-hdpi/gone.png", "mip"},
            {"layout/blocked.xml", "l"},
            {"layout/dropped.xml", "l"},
            {"drawable/.hidden", "dot"},
        });

        resmerge::merge::KeepPolicy policy{};
        policy.blacklist_regex = "drawable-hdpi/unused|gone|blocked|dropped";
        policy.exception_globs = {"*/layout/blocked.xml"};

        Bag bag{};
        auto filter = resmerge::merge::KeepFilter::create(policy, bag);
        bool ok = require_(filter.has_value(), "filter compiles");
        if (!filter) return false;
        filter->observe(tree);

        const auto naive = filter->naive_keep("dep.zip", resmerge::res::classify("drawable-hdpi/unused.png"));
        ok &= require_(!naive, "naive result blacklists hdpi unused");
        ok &= require_(filter->keep("dep.zip", "drawable-hdpi/unused.png"), "closure keeps hdpi unused");
        ok &= require_(filter->keep("dep.zip", "drawable-mdpi/unused.png"), "mdpi unused kept");
        ok &= require_(!filter->keep("dep.zip", "drawable-hdpi/gone.png"), "gone is blacklisted in every density");
        ok &= require_(!filter->keep("dep.zip", "drawable-xhdpi/gone.xml"), "closure is keyed on surviving names only");
        ok &= require_(filter->keep("dep.zip", "mipmap-hdpi/gone.png"), "mipmaps are always kept");
        ok &= require_(filter->keep("dep.zip", "layout/blocked.xml"), "exception glob keeps blocked layout");
        ok &= require_(!filter->keep("dep.zip", "layout/dropped.xml"), "blacklisted layout dropped");
        ok &= require_(!filter->keep("dep.zip", "drawable/.hidden"), "dotfiles never survive");

        auto open = resmerge::merge::KeepFilter::create({}, bag);
        ok &= require_(open.has_value() && open->keep("dep.zip", "drawable-hdpi/gone.png"), "empty blacklist keeps all");
        ok &= require_(open.has_value() && !open->keep("dep.zip", "values/.DS_Store"), "dotfiles dropped without a blacklist");

        Bag bad{};
        resmerge::merge::KeepPolicy broken{};
        broken.blacklist_regex = "(unclosed";
        ok &= require_(!resmerge::merge::KeepFilter::create(broken, bad).has_value(), "invalid regex rejected");
        ok &= require_(bad.has_code(Code::kConfigurationContradiction), "invalid regex is a contradiction");
        return ok;
    }

    static bool test_recompress_with_fake_encoder_() {
        MemoryTree tree("dep.zip", {
            {"drawable/a.png", "A"},
            {"drawable-hdpi/b.png", "B"},
            {"drawable/btn.9.png", "nine"},
            {"drawable/star_gray.png", "star"},
            {"drawable/daydream_icon_x.png", "dd"},
            {"drawable/c.webp", "C"},
            {"values/strings.xml", "<resources/>"},
        });

        FakeEncoder encoder{};
        const resmerge::exec::WorkerPool pool(4);
        LedgerDelta delta{};
        Bag bag{};
        bool ok = require_(resmerge::merge::recompress_images({{&tree, &delta}}, encoder, pool, bag), "recompression succeeds");

        ok &= require_(read_(tree, "drawable/a.webp") == "webp:A", "a converted");
        ok &= require_(read_(tree, "drawable-hdpi/b.webp") == "webp:B", "b converted");
        ok &= require_(!tree.exists("drawable/a.png") && !tree.exists("drawable-hdpi/b.png"), "source PNGs removed");
        ok &= require_(tree.exists("drawable/btn.9.png"), "nine-patch excluded");
        ok &= require_(tree.exists("drawable/star_gray.png"), "star_gray excluded");
        ok &= require_(tree.exists("drawable/daydream_icon_x.png"), "daydream icon excluded");
        ok &= require_(delta.ops.size() == 2, "one ledger move per conversion");
        ok &= require_(delta.ops.size() == 2 && delta.ops[0].from == "drawable-hdpi/b.png" && delta.ops[1].from == "drawable/a.png",
                       "moves follow the sorted listing");
        return ok;
    }

    static bool test_recompress_failure_is_total_() {
        MemoryTree tree("dep.zip", {
            {"drawable/a.png", "A"},
            {"drawable/broken.png", "X"},
            {"drawable/z.png", "Z"},
        });
        FakeEncoder encoder{};
        const resmerge::exec::WorkerPool pool(2);
        LedgerDelta delta{};
        Bag bag{};

        bool ok = require_(!resmerge::merge::recompress_images({{&tree, &delta}}, encoder, pool, bag), "one failure fails the stage");
        ok &= require_(bag.has_code(Code::kExternalToolFailure), "failure is an external tool failure");
        ok &= require_(bag.error_count() == 1, "only the failed item is reported");
        ok &= require_(tree.exists("drawable/a.png") && tree.exists("drawable/z.png"), "no PNG removed on failure");
        ok &= require_(delta.empty(), "no ledger entries on failure");

        MemoryTree clash("dep.zip", {{"drawable/d.png", "D"}, {"drawable/d.webp", "W"}});
        LedgerDelta clash_delta{};
        Bag clash_bag{};
        ok &= require_(!resmerge::merge::recompress_images({{&clash, &clash_delta}}, encoder, pool, clash_bag), "collision fails");
        ok &= require_(clash_bag.has_code(Code::kInvariantViolation), "collision is an invariant violation");
        return ok;
    }

    static bool test_scenario_b_density_migration_() {
        MemoryTree tree("dep.zip", {
            {"drawable-mdpi-v4/icon.png", "icon"},
            {"drawable-hdpi-v4/icon.png", "hicon"},
            {"drawable-mdpi/shape.xml", "<shape/>"},
            {"mipmap-mdpi/launcher.png", "mip"},
        });
        LedgerDelta delta{};
        Bag bag{};
        bool ok = require_(resmerge::merge::migrate_density_bucket(tree, {}, delta, bag), "migration succeeds");
        ok &= require_(read_(tree, "drawable-v4/icon.png") == "icon", "icon moved out of mdpi-v4");
        ok &= require_(!tree.exists("drawable-mdpi-v4/icon.png"), "source gone");
        ok &= require_(tree.exists("drawable-hdpi-v4/icon.png"), "other densities untouched");
        ok &= require_(tree.exists("drawable-mdpi/shape.xml"), "non-image files stay");
        ok &= require_(tree.exists("mipmap-mdpi/launcher.png"), "mipmaps are not migrated");

        resmerge::ledger::RenameLedger ledger{};
        std::string err{};
        ok &= require_(ledger.apply(delta, err), "delta applies");
        ok &= require_(ledger.render_lines() == std::vector<std::string>{"Rename:drawable-v4/icon.png,drawable-mdpi-v4/icon.png"},
                       "ledger holds the migration");

        MemoryTree clash("dep.zip", {{"drawable-mdpi-v4/icon.png", "a"}, {"drawable-v4/icon.png", "b"}});
        LedgerDelta clash_delta{};
        Bag clash_bag{};
        ok &= require_(!resmerge::merge::migrate_density_bucket(clash, {}, clash_delta, clash_bag), "existing destination aborts");
        ok &= require_(clash_bag.has_code(Code::kInvariantViolation), "collision is an invariant violation");
        ok &= require_(read_(clash, "drawable-v4/icon.png") == "b", "destination not overwritten");
        return ok;
    }

    static bool test_duplicator_() {
        Bag bag{};
        const resmerge::merge::DuplicationRule rule{};
        bool ok = require_(!resmerge::merge::check_duplication_policy(rule, {"en", "zh-HK"}, bag), "zh-HK in allow-list contradicts");
        ok &= require_(bag.has_code(Code::kConfigurationContradiction), "reported as contradiction");
        Bag fine{};
        ok &= require_(resmerge::merge::check_duplication_policy(rule, {"zh-TW", "zh-rTW"}, fine), "zh-TW is allowed");

        MemoryTree tree("dep.zip", {
            {"values-zh-rTW/strings.xml", "tw"},
            {"raw-zh-rTW/clip.ogg", "ogg"},
            {"values-zh-rHK/strings.xml", "hk"},
            {"values-zh/strings.xml", "zh"},
        });
        LedgerDelta delta{};
        Bag run{};
        ok &= require_(resmerge::merge::duplicate_locale(tree, rule, delta, run), "duplication succeeds");
        ok &= require_(read_(tree, "values-zh-rHK/strings.xml") == "hk", "shipped target left alone");
        ok &= require_(read_(tree, "raw-zh-rHK/clip.ogg") == "ogg", "any resource type is duplicated");
        ok &= require_(read_(tree, "values-zh-rTW/strings.xml") == "tw", "source kept");
        ok &= require_(delta.ops.size() == 1 && delta.ops[0].op == resmerge::ledger::Op::kCopy, "one copy recorded");
        ok &= require_(!run.has_error(), "skip is not an error");
        return ok;
    }

    static bool test_normalizer_idempotent_() {
        MemoryTree tree("dep.zip", {
            {"values-id/strings.xml", "id"},
            {"values-iw-rIL/strings.xml", "he"},
            {"values-b+es+419/strings.xml", "es"},
            {"values-fil/strings.xml", "fil"},
            {"values-fr/strings.xml", "fr"},
            {"values-ji/strings.xml", "old"},
            {"values-yi/strings.xml", "new"},
        });

        LedgerDelta first{};
        Bag bag{};
        resmerge::merge::NormalizeStats stats{};
        bool ok = require_(resmerge::merge::normalize_locales(tree, first, bag, &stats), "first pass succeeds");
        ok &= require_(read_(tree, "values-in/strings.xml") == "id", "id -> in");
        ok &= require_(read_(tree, "values-es-rUS/strings.xml") == "es", "b+es+419 -> es-rUS");
        ok &= require_(read_(tree, "values-tl/strings.xml") == "fil", "fil -> tl");
        ok &= require_(read_(tree, "values-iw-rIL/strings.xml") == "he", "iw-rIL already canonical");
        ok &= require_(read_(tree, "values-ji/strings.xml") == "old", "existing destination wins");
        ok &= require_(read_(tree, "values-yi/strings.xml") == "new", "skipped source stays");
        ok &= require_(stats.renamed == 3 && stats.skipped == 1, "three renames, one skip");

        LedgerDelta second{};
        resmerge::merge::NormalizeStats again{};
        ok &= require_(resmerge::merge::normalize_locales(tree, second, bag, &again), "second pass succeeds");
        ok &= require_(second.empty() && again.renamed == 0, "normalization is idempotent");
        return ok;
    }

    static bool test_pipeline_states_() {
        std::ostringstream sink{};
        resmerge::log::Reporter reporter(sink, resmerge::log::ColorMode::kNever, true, false);
        const resmerge::exec::WorkerPool pool(2);

        std::vector<resmerge::merge::Dependency> deps(2);
        deps[0].label = "a.zip";
        deps[0].tree = std::make_unique<MemoryTree>("a.zip", std::map<std::string, std::string>{
            {"values-zh-rTW/strings.xml", kFrStrings},
            {"values-id/strings.xml", kEnStrings},
            {"drawable-hdpi/unused.png", "h"},
        });
        deps[1].label = "b.zip";
        deps[1].tree = std::make_unique<MemoryTree>("b.zip", std::map<std::string, std::string>{
            {"drawable-mdpi/unused.png", "m"},
            {"drawable-mdpi-v4/icon.png", "i"},
        });

        resmerge::merge::MergePolicy policy{};
        policy.duplication = resmerge::merge::DuplicationRule{};
        policy.keep.blacklist_regex = "a.zip/drawable-hdpi";

        Bag bag{};
        resmerge::merge::RunTracker tracker{};
        bool ok = require_(tracker.advance(resmerge::merge::RunState::kExtracted, bag), "extracted");
        resmerge::merge::MergePipeline pipeline(policy, pool, nullptr, reporter);
        ok &= require_(pipeline.run(deps, tracker, bag), "pipeline succeeds");
        ok &= require_(tracker.state() == resmerge::merge::RunState::kRecompressed, "pipeline ends at Recompressed");

        ok &= require_(deps[0].tree->exists("drawable-hdpi/unused.png"), "closure spans dependencies");
        ok &= require_(deps[0].tree->exists("values-zh-rHK/strings.xml"), "zh-rHK synthesized");
        ok &= require_(deps[0].ledger.original_of("values-in/strings.xml") == "values-id/strings.xml", "normalization ledgered");
        ok &= require_(deps[1].ledger.original_of("drawable-v4/icon.png") == "drawable-mdpi-v4/icon.png", "migration ledgered");
        ok &= require_(sink.str().find("[ 40%]") != std::string::npos, "progress reported");

        resmerge::merge::MergePolicy webp{};
        webp.recompress = true;
        Bag failed{};
        resmerge::merge::RunTracker t2{};
        t2.advance(resmerge::merge::RunState::kExtracted, failed);
        resmerge::merge::MergePipeline no_encoder(webp, pool, nullptr, reporter);
        ok &= require_(!no_encoder.run(deps, t2, failed), "recompression without an encoder fails");
        ok &= require_(t2.failed() && t2.state() == resmerge::merge::RunState::kFiltered, "run stops after Filtered");

        Bag skip{};
        resmerge::merge::RunTracker t3{};
        ok &= require_(!t3.advance(resmerge::merge::RunState::kNormalized, skip), "states cannot be skipped");
        ok &= require_(skip.has_code(Code::kInvariantViolation), "skipping is an invariant violation");
        return ok;
    }

} // namespace

int main() {
    struct Case {
        const char* name;
        bool (*fn)();
    };

    const Case cases[] = {
        {"scenario_a_locale_filter", test_scenario_a_locale_filter_},
        {"no_allow_lists_is_noop", test_no_allow_lists_is_noop_},
        {"scenario_c_density_closure", test_scenario_c_density_closure_},
        {"recompress_with_fake_encoder", test_recompress_with_fake_encoder_},
        {"recompress_failure_is_total", test_recompress_failure_is_total_},
        {"scenario_b_density_migration", test_scenario_b_density_migration_},
        {"duplicator", test_duplicator_},
        {"normalizer_idempotent", test_normalizer_idempotent_},
        {"pipeline_states", test_pipeline_states_},
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
