#include <resmerge/Version.hpp>
#include <resmerge/cli/Options.hpp>
#include <resmerge/config/Settings.hpp>
#include <resmerge/driver/Driver.hpp>
#include <resmerge/os/File.hpp>
#include <resmerge/proc/Process.hpp>

#include <unistd.h>

#include <filesystem>
#include <initializer_list>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#ifndef RESMERGE_BUILD_BIN
#define RESMERGE_BUILD_BIN "resmerge"
#endif

namespace {

    namespace fs = std::filesystem;
    using resmerge::cli::Mode;
    using resmerge::cli::Options;
    using resmerge::diag::Code;

    static bool require_(bool cond, const char* msg) {
        if (cond) return true;
        std::cerr << "  - " << msg << "\n";
        return false;
    }

    static Options parse_(std::initializer_list<const char*> args) {
        std::vector<std::string> storage{"resmerge"};
        for (const char* a : args) storage.emplace_back(a);
        std::vector<char*> argv{};
        for (auto& s : storage) argv.push_back(s.data());
        return resmerge::cli::parse_options(static_cast<int>(argv.size()), argv.data());
    }

    static bool test_modes_() {
        bool ok = require_(parse_({}).mode == Mode::kUsage, "no arguments prints usage");
        ok &= require_(parse_({"--arsc-path", "x", "--help"}).mode == Mode::kUsage, "help wins");
        ok &= require_(parse_({"--version"}).mode == Mode::kVersion, "version");
        ok &= require_(parse_({"--arsc-path", "x"}).mode == Mode::kRun, "anything else runs");
        return ok;
    }

    static bool test_run_flags_() {
        const auto opt = parse_({
            "--aapt2-path", "/sdk/aapt2",
            "--android-manifest", "AndroidManifest.xml",
            "--dependencies-res-zips", "[\"gen/a.zip\", \"gen/b.zip\"]",
            "--dependencies-res-zips=gen/c.zip",
            "-I", "android.jar",
            "--locale-whitelist=en,fr",
            "--support-zh-hk",
            "--no-migrate-mdpi",
            "--package-id", "0x7f",
            "--min-sdk-version", "21",
            "--target-sdk-version", "33",
            "--arsc-path", "out/resources.ap_",
            "--info-path", "out/resources.info",
            "--jobs", "4",
            "--color", "never",
            "--ignore-stderr", "^W: ",
            "--keep-workspace",
            "-v",
        });

        bool ok = require_(opt.ok, "flags parse");
        if (!opt.ok) std::cerr << opt.error << "\n";
        ok &= require_(opt.mode == Mode::kRun, "run mode");
        ok &= require_(opt.ambient.aapt2 == std::string("/sdk/aapt2"), "aapt2 is an ambient flag");
        ok &= require_(opt.run.android_manifest == "AndroidManifest.xml", "manifest");
        ok &= require_(opt.run.dependencies_res_zips.size() == 3 && opt.run.dependencies_res_zips[2] == "gen/c.zip",
                       "repeated list flag appends");
        ok &= require_(opt.run.include_resources == std::vector<std::string>{"android.jar"}, "short -I");
        ok &= require_(opt.run.locale_whitelist == std::vector<std::string>{"en", "fr"}, "comma list");
        ok &= require_(opt.run.support_zh_hk && !opt.run.migrate_mdpi, "switches");
        ok &= require_(opt.run.package_id == "0x7f", "package id");
        ok &= require_(opt.run.arsc_path == fs::path("out/resources.ap_"), "arsc path");
        ok &= require_(opt.ambient.jobs == 4u, "jobs");
        ok &= require_(opt.ambient.color == resmerge::log::ColorMode::kNever, "color");
        ok &= require_(opt.ambient.ignored_stderr == std::vector<std::string>{"^W: "}, "ignored stderr");
        ok &= require_(opt.ambient.keep_workspace == true && opt.ambient.verbose == true, "ambient switches");
        ok &= require_(!opt.ambient.progress.has_value(), "unset ambient flags stay unset");
        return ok;
    }

    static bool test_bad_flags_() {
        auto opt = parse_({"--bogus"});
        bool ok = require_(!opt.ok && opt.error == "unknown option: --bogus", "unknown option");
        opt = parse_({"stray"});
        ok &= require_(!opt.ok && opt.error.find("unexpected argument") != std::string::npos, "positional rejected");
        opt = parse_({"--arsc-path"});
        ok &= require_(!opt.ok && opt.error == "--arsc-path requires a value", "missing value");
        opt = parse_({"--jobs", "0"});
        ok &= require_(!opt.ok && opt.error.find("positive integer") != std::string::npos, "zero jobs");
        opt = parse_({"--color", "purple"});
        ok &= require_(!opt.ok, "bad color");
        opt = parse_({"--locale-whitelist", "[\"en\""});
        ok &= require_(!opt.ok && opt.error.find("unterminated list") != std::string::npos, "bad list");
        return ok;
    }

    static bool test_settings_materialize_() {
        resmerge::config::FlatMap values{
            {"toolchain.aapt2", std::string("/opt/aapt2")},
            {"pool.jobs", int64_t{8}},
            {"ui.verbose", true},
            {"link.ignored_stderr", std::vector<std::string>{"^note: "}},
            {"workspace.debug_root", std::string("/tmp/rm-debug")},
            {"mystery.key", std::string("x")},
        };
        resmerge::config::Settings s{};
        resmerge::diag::Bag bag{};
        bool ok = require_(resmerge::config::materialize(values, "settings.toml", s, bag), "settings materialize");
        ok &= require_(s.aapt2 == std::string("/opt/aapt2") && s.jobs == 8 && s.verbose == true, "typed values");
        ok &= require_(s.debug_root == fs::path("/tmp/rm-debug"), "debug root");
        ok &= require_(s.ignored_stderr == std::vector<std::string>{"^note: "}, "list value");
        ok &= require_(!bag.has_error() && bag.all().size() == 1, "unknown key is a single warning");

        resmerge::config::Settings wrong{};
        resmerge::diag::Bag wrong_bag{};
        ok &= require_(!resmerge::config::materialize({{"pool.jobs", std::string("eight")}}, "s", wrong, wrong_bag),
                       "wrong type rejected");
        ok &= require_(wrong_bag.has_code(Code::kConfigurationContradiction), "wrong type is a contradiction");

        resmerge::diag::Bag zero_bag{};
        ok &= require_(!resmerge::config::materialize({{"pool.jobs", int64_t{0}}}, "s", wrong, zero_bag), "zero jobs");

        resmerge::diag::Bag missing{};
        ok &= require_(!resmerge::config::load_settings("/nonexistent/resmerge.toml", wrong, missing), "missing file");
        ok &= require_(missing.has_code(Code::kMissingResource), "missing file is a missing resource");

        const fs::path file = fs::temp_directory_path() / ("resmerge-cli-" + std::to_string(::getpid()) + ".toml");
        std::string err{};
        resmerge::os::write_file_atomic(file, "[toolchain]\ncwebp = \"/opt/cwebp\"\n[ui]\nprogress = false\n", err);
        resmerge::config::Settings loaded{};
        resmerge::diag::Bag load_bag{};
        ok &= require_(resmerge::config::load_settings(file, loaded, load_bag), "file loads");
        ok &= require_(loaded.cwebp == std::string("/opt/cwebp") && loaded.progress == false, "file values");
        std::error_code ec{};
        fs::remove(file, ec);
        return ok;
    }

    static bool test_effective_config_layers_() {
        auto opt = parse_({"--aapt2-path", "/cli/aapt2", "--ignore-stderr", "cli", "--arsc-path", "x.ap_"});
        resmerge::config::Settings s{};
        s.aapt2 = "/file/aapt2";
        s.cwebp = "/file/cwebp";
        s.jobs = 6;
        s.ignored_stderr = {"file"};

        const auto cfg = resmerge::driver::effective_config(opt, s);
        bool ok = require_(cfg.aapt2_path == "/cli/aapt2", "command line beats the settings file");
        ok &= require_(cfg.webp_binary == "/file/cwebp", "settings file fills the rest");
        ok &= require_(cfg.jobs == 6, "jobs from file");
        ok &= require_(cfg.ignored_stderr == std::vector<std::string>{"file", "cli"}, "stderr patterns accumulate");

        const auto defaults = resmerge::driver::effective_config(opt, {});
        ok &= require_(defaults.jobs == resmerge::exec::k_default_jobs, "default jobs");
        return ok;
    }

    static bool test_binary_surface_() {
        resmerge::proc::Captured cap{};
        std::string err{};
        bool ok = require_(resmerge::proc::run_argv_capture({RESMERGE_BUILD_BIN, "--version"}, cap, err), "binary runs");
        ok &= require_(cap.exit_code == 0, "--version exits 0");
        ok &= require_(cap.out == std::string(resmerge::k_version_string) + "\n", "version printed");

        ok &= require_(resmerge::proc::run_argv_capture({RESMERGE_BUILD_BIN, "--bogus"}, cap, err), "binary runs again");
        ok &= require_(cap.exit_code == 1, "bad option exits 1");
        ok &= require_(cap.err.find("unknown option: --bogus") != std::string::npos, "error on stderr");

        ok &= require_(resmerge::proc::run_argv_capture({RESMERGE_BUILD_BIN, "--arsc-path", "x.ap_", "--no-progress"}, cap, err),
                       "incomplete run starts");
        ok &= require_(cap.exit_code == 1, "incomplete run fails");
        ok &= require_(cap.err.find("CONFIGURATION_CONTRADICTION") != std::string::npos, "contradictions reported");
        ok &= require_(cap.err.find("stopped after Init") != std::string::npos, "final state reported");
        return ok;
    }

    static bool test_usage_documents_match_subjects_() {
        std::ostringstream os{};
        resmerge::cli::print_usage(os);
        const std::string text = os.str();
        bool ok = require_(text.find("--resource-blacklist-regex") != std::string::npos, "blacklist flag listed");
        ok &= require_(text.find("'<dependency label>/<resource path>'") != std::string::npos,
                       "blacklist subject documented");
        ok &= require_(text.find("<dir>/<arsc file name>") != std::string::npos, "debug workspace location documented");
        return ok;
    }

} // namespace

int main() {
    struct Case {
        const char* name;
        bool (*fn)();
    };

    const Case cases[] = {
        {"modes", test_modes_},
        {"run_flags", test_run_flags_},
        {"bad_flags", test_bad_flags_},
        {"usage_documents_match_subjects", test_usage_documents_match_subjects_},
        {"settings_materialize", test_settings_materialize_},
        {"effective_config_layers", test_effective_config_layers_},
        {"binary_surface", test_binary_surface_},
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
