#include <resmerge/link/Orchestrator.hpp>

#include <resmerge/ledger/LedgerWriter.hpp>
#include <resmerge/link/PackageId.hpp>
#include <resmerge/log/Reporter.hpp>
#include <resmerge/os/File.hpp>
#include <resmerge/res/SymbolTable.hpp>
#include <resmerge/text/Strings.hpp>
#include <resmerge/xml/Manifest.hpp>
#include <resmerge/zip/Zip.hpp>

#include <utility>

namespace resmerge::link {

namespace {

bool require_input(const std::filesystem::path& path, std::string_view flag, diag::Bag& bag) {
    std::error_code ec{};
    if (std::filesystem::is_regular_file(path, ec)) return true;
    bag.error(diag::Code::kMissingResource, path.string(), std::string(flag) + " does not name a readable file");
    return false;
}

bool read_input(const std::filesystem::path& path, std::string& out, diag::Bag& bag) {
    auto r = os::read_file(path);
    if (!r.ok) {
        bag.error(diag::Code::kIoFailure, path.string(), r.err);
        return false;
    }
    out = std::move(r.data);
    return true;
}

PackageIdPolicy package_policy(const RunConfig& cfg, diag::Bag& bag, bool& ok) {
    PackageIdPolicy policy{};
    if (!cfg.package_id.empty()) policy.explicit_id = parse_package_id(cfg.package_id);
    policy.package_name = cfg.package_name;
    policy.shared_resources = cfg.shared_resources;
    ok = parse_name_to_id_mapping(cfg.package_name_to_id_mapping, policy.name_to_id, bag);
    return policy;
}

// Subdirectory of the debug root owned by this run, named after its primary output.
std::string debug_run_name(const RunConfig& cfg) {
    if (cfg.arsc_path) return cfg.arsc_path->filename().string();
    if (cfg.proto_path) return cfg.proto_path->filename().string();
    return "resmerge";
}

} // namespace

Orchestrator::Orchestrator(RunConfig cfg, log::Reporter& reporter, merge::ImageEncoder* encoder)
    : cfg_(std::move(cfg)), reporter_(reporter), encoder_(encoder), pool_(cfg_.jobs == 0 ? 1 : cfg_.jobs) {
    if (encoder_ == nullptr && cfg_.png_to_webp && !cfg_.webp_binary.empty()) {
        owned_encoder_ = std::make_unique<merge::CwebpEncoder>(cfg_.webp_binary, &reporter_);
        encoder_ = owned_encoder_.get();
    }
}

bool Orchestrator::step(bool ok, merge::RunState next, diag::Bag& bag) {
    if (ok && tracker_.advance(next, bag)) return true;
    tracker_.fail();
    return false;
}

bool Orchestrator::run(diag::Bag& bag) {
    reporter_.progress(0, "Checking options");
    if (!prepare(bag)) {
        tracker_.fail();
        return false;
    }

    reporter_.progress(10, "Extracting " + std::to_string(cfg_.dependencies_res_zips.size()) + " dependency archive(s)");
    if (!step(extract(bag), merge::RunState::kExtracted, bag)) return false;

    if (!merge_resources(bag)) return false;

    reporter_.progress(50, "Writing rename ledger");
    if (!step(write_ledger(bag), merge::RunState::kLedgerWritten, bag)) return false;

    if (!step(link(bag), merge::RunState::kLinked, bag)) return false;

    reporter_.progress(90, "Validating linked resources");
    if (!step(validate(bag), merge::RunState::kValidated, bag)) return false;

    if (!step(publish(bag), merge::RunState::kFinalized, bag)) return false;
    reporter_.done("resources packaged");
    return true;
}

bool Orchestrator::prepare(diag::Bag& bag) {
    if (!validate_run_config(cfg_, bag)) return false;

    filter_ = StderrFilter::create(cfg_.ignored_stderr, bag);
    if (!filter_) return false;

    bool ok = require_input(cfg_.android_manifest, "--android-manifest", bag);
    for (const auto& archive : cfg_.dependencies_res_zips) {
        ok = require_input(archive, "--dependencies-res-zips", bag) && ok;
    }
    if (cfg_.shared_resources_whitelist) {
        ok = require_input(*cfg_.shared_resources_whitelist, "--shared-resources-whitelist", bag) && ok;
    }
    if (cfg_.r_text_in) ok = require_input(*cfg_.r_text_in, "--r-text-in", bag) && ok;
    if (cfg_.use_resource_ids_path) ok = require_input(*cfg_.use_resource_ids_path, "--use-resource-ids-path", bag) && ok;
    if (cfg_.resources_config_path) ok = require_input(*cfg_.resources_config_path, "--resources-config-path", bag) && ok;
    if (cfg_.android_manifest_expected) {
        ok = require_input(*cfg_.android_manifest_expected, "--android-manifest-expected", bag) && ok;
    }
    if (!ok) return false;

    if (!read_input(cfg_.android_manifest, manifest_text_, bag)) return false;

    if (cfg_.shared_resources_whitelist) {
        std::string err{};
        const auto table = res::load_symbol_table(*cfg_.shared_resources_whitelist, err);
        if (!table) {
            bag.error(diag::Code::kMissingResource, cfg_.shared_resources_whitelist->string(), err);
            return false;
        }
        shared_names_ = table->names_of_type("string");
    }

    std::string err{};
    if (!workspace_.create(cfg_.debug_temp_dir, debug_run_name(cfg_), cfg_.keep_workspace, err)) {
        bag.error(diag::Code::kIoFailure, cfg_.debug_temp_dir ? cfg_.debug_temp_dir->string() : std::string{}, err);
        return false;
    }
    staged_ = workspace_.staged();
    if (workspace_.kept()) reporter_.note("workspace kept at " + workspace_.root().string());
    return true;
}

bool Orchestrator::extract(diag::Bag& bag) {
    std::vector<std::string> labels{};
    if (!dependency_labels(cfg_.dependencies_res_zips, labels, bag)) return false;

    deps_.clear();
    deps_.reserve(labels.size());
    for (size_t i = 0; i < labels.size(); ++i) {
        const auto& archive = cfg_.dependencies_res_zips[i];
        const auto dir = workspace_.dep_dir(labels[i]);
        std::error_code ec{};
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            bag.error(diag::Code::kIoFailure, dir.string(), ec.message());
            return false;
        }

        std::string err{};
        if (!zip::extract_all(archive, dir, nullptr, err)) {
            bag.error(diag::Code::kIoFailure, archive.string(), err);
            return false;
        }

        merge::Dependency dep{};
        dep.label = labels[i];
        dep.archive = archive;
        dep.tree = std::make_unique<tree::DiskTree>(labels[i], dir);
        deps_.push_back(std::move(dep));
    }
    return true;
}

bool Orchestrator::merge_resources(diag::Bag& bag) {
    merge::MergePolicy policy{};
    if (cfg_.support_zh_hk) policy.duplication = merge::DuplicationRule{};

    std::vector<std::string> extra{};
    if (policy.duplication) extra.push_back(policy.duplication->to_locale);
    if (!merge::resolve_locale_policy(cfg_.locale_whitelist, cfg_.shared_resources_whitelist_locales, extra, policy.locales, bag)) {
        tracker_.fail();
        return false;
    }
    policy.locales.shared_names = shared_names_;

    policy.keep.blacklist_regex = cfg_.resource_blacklist_regex;
    policy.keep.exception_globs = cfg_.resource_blacklist_exceptions;
    policy.recompress = cfg_.png_to_webp;
    if (!cfg_.migrate_mdpi) policy.migration.reset();

    merge::MergePipeline pipeline(std::move(policy), pool_, encoder_, reporter_);
    return pipeline.run(deps_, tracker_, bag);
}

bool Orchestrator::write_ledger(diag::Bag& bag) {
    ledger::LedgerWriter writer{};
    for (const auto& dep : deps_) {
        if (!writer.add(dep.ledger, dep.archive.string(), bag)) return false;
        if (!writer.add_upstream(dep.archive, bag)) return false;
    }
    if (!writer.write(staged_.info, bag)) return false;
    reporter_.note(std::to_string(writer.lines().size()) + " ledger line(s) written");
    return true;
}

bool Orchestrator::compile_partials(std::vector<std::filesystem::path>& partials, diag::Bag& bag) {
    const ToolRunner runner(*filter_, reporter_);
    std::vector<diag::Bag> slots(deps_.size());
    partials.assign(deps_.size(), {});

    std::vector<exec::TaskFailure> failures{};
    const bool ok = pool_.run(deps_.size(), [&](size_t i, std::string& err) {
        const auto& dep = deps_[i];
        const auto unsorted = workspace_.partials_dir() / (dep.label + ".zip");
        const auto sorted = workspace_.partials_dir() / (dep.label + ".sorted.zip");

        const auto cmd = compile_command(cfg_.aapt2_path, workspace_.dep_dir(dep.label), unsorted);
        if (!runner.run(cmd, "aapt2 compile " + dep.label, slots[i])) {
            err = "aapt2 compile failed for " + dep.label;
            return false;
        }
        if (!zip::sort_zip(unsorted, sorted, err)) {
            slots[i].error(diag::Code::kIoFailure, unsorted.string(), err);
            return false;
        }
        partials[i] = sorted;
        return true;
    }, failures);

    for (auto& slot : slots) bag.merge(std::move(slot));
    if (!ok && !bag.has_error()) {
        for (const auto& f : failures) bag.error(diag::Code::kExternalToolFailure, deps_[f.index].label, f.message);
    }
    return ok;
}

bool Orchestrator::write_stable_ids(const std::string& package, diag::Bag& bag) {
    std::string in{};
    if (!read_input(*cfg_.use_resource_ids_path, in, bag)) return false;

    std::string out{};
    for (const auto& line : text::split_lines(in)) {
        const size_t colon = line.find(':');
        if (colon == std::string::npos) out += line;
        else out += package + line.substr(colon);
        out.push_back('\n');
    }

    std::string err{};
    if (!os::write_file_atomic(staged_.stable_ids, out, err)) {
        bag.error(diag::Code::kIoFailure, staged_.stable_ids.string(), err);
        return false;
    }
    return true;
}

bool Orchestrator::write_obfuscation_config(diag::Bag& bag) {
    std::string config{};
    if (cfg_.resources_config_path && !read_input(*cfg_.resources_config_path, config, bag)) return false;
    if (!config.empty() && config.back() != '\n') config.push_back('\n');

    std::string err{};
    const auto table = res::load_symbol_table(staged_.r_txt, err);
    if (!table) {
        bag.error(diag::Code::kMissingResource, staged_.r_txt.string(), err);
        return false;
    }
    for (const auto& name : table->names_of_type("id")) config += "id/" + name + "#no_obfuscate\n";

    if (!os::write_file_atomic(staged_.obfuscation_config, config, err)) {
        bag.error(diag::Code::kIoFailure, staged_.obfuscation_config.string(), err);
        return false;
    }
    return true;
}

bool Orchestrator::link(diag::Bag& bag) {
    const ToolRunner runner(*filter_, reporter_);

    reporter_.progress(60, "Compiling " + std::to_string(deps_.size()) + " resource director(ies)");
    std::vector<std::filesystem::path> partials{};
    if (!compile_partials(partials, bag)) return false;

    std::string package = cfg_.rename_manifest_package;
    if (package.empty()) {
        std::string err{};
        if (!xml::read_manifest_package(manifest_text_, package, err)) {
            bag.error(diag::Code::kIoFailure, cfg_.android_manifest.string(), err);
            return false;
        }
    }

    bool ok = false;
    const auto policy = package_policy(cfg_, bag, ok);
    if (!ok) return false;

    LinkInputs in{};
    in.manifest = cfg_.android_manifest;
    in.manifest_package = package;
    in.partials = std::move(partials);
    if (!requested_package_id(policy, in.package_id, bag)) return false;

    if (cfg_.use_resource_ids_path) {
        if (!write_stable_ids(package, bag)) return false;
        in.stable_ids = true;
    }

    if (cfg_.r_text_in) {
        std::error_code ec{};
        std::filesystem::copy_file(*cfg_.r_text_in, staged_.r_txt, std::filesystem::copy_options::overwrite_existing, ec);
        if (ec) {
            bag.error(diag::Code::kIoFailure, cfg_.r_text_in->string(), ec.message());
            return false;
        }
    }

    reporter_.progress(70, "Linking resources");
    if (!runner.run(link_command(cfg_, staged_, in), "aapt2 link", bag)) return false;

    if (cfg_.proto_path && cfg_.arsc_path) {
        if (!runner.run(convert_command(cfg_.aapt2_path, staged_.arsc, staged_.proto), "aapt2 convert", bag)) return false;
    }

    if (cfg_.optimized_arsc_path || cfg_.optimized_proto_path) {
        reporter_.progress(80, "Optimizing resources");
        if (cfg_.strip_resource_names && !write_obfuscation_config(bag)) return false;
        const auto& unoptimized = cfg_.optimized_proto_path ? staged_.proto : staged_.arsc;
        const auto cmd = optimize_command(cfg_, staged_, unoptimized, cfg_.strip_resource_names);
        if (!runner.run(cmd, "aapt2 optimize", bag)) return false;
    }
    return true;
}

bool Orchestrator::check_manifest(diag::Bag& bag) {
    if (!cfg_.android_manifest_expected) return true;

    std::string expected{};
    if (!read_input(*cfg_.android_manifest_expected, expected, bag)) return false;

    const std::string actual = xml::normalize_manifest_text(manifest_text_);
    if (cfg_.android_manifest_normalized) {
        std::string err{};
        if (!os::write_file_atomic(staged_.normalized_manifest, actual, err)) {
            bag.error(diag::Code::kIoFailure, staged_.normalized_manifest.string(), err);
            return false;
        }
    }

    const std::string want = xml::normalize_manifest_text(expected);
    if (want == actual) return true;

    std::string msg = "AndroidManifest.xml differs from " + cfg_.android_manifest_expected->string() + ":";
    for (const auto& line : xml::diff_lines(want, actual)) msg += "\n" + line;
    if (cfg_.fail_if_unexpected_android_manifest) {
        bag.error(diag::Code::kPolicyMismatch, cfg_.android_manifest.string(), std::move(msg));
        return false;
    }
    bag.warning(diag::Code::kPolicyMismatch, cfg_.android_manifest.string(), std::move(msg));
    return true;
}

bool Orchestrator::check_package(diag::Bag& bag) {
    const ToolRunner runner(*filter_, reporter_);
    const auto& archive = cfg_.arsc_path ? staged_.arsc : staged_.proto;

    std::string dump{};
    if (!runner.run(dump_resources_command(cfg_.aapt2_path, archive), "aapt2 dump resources", bag, &dump)) return false;

    DumpedPackage pkg{};
    std::string err{};
    if (!parse_dumped_package(dump, pkg, err)) {
        bag.error(diag::Code::kExternalToolFailure, archive.string(), err);
        return false;
    }

    bool ok = false;
    const auto policy = package_policy(cfg_, bag, ok);
    if (!ok) return false;
    uint32_t expected = 0;
    if (!expected_package_id(policy, expected, bag)) return false;
    return check_package_id(expected, pkg.id, pkg.name, bag);
}

bool Orchestrator::validate(diag::Bag& bag) {
    const bool manifest_ok = check_manifest(bag);
    return check_package(bag) && manifest_ok;
}

bool Orchestrator::publish(diag::Bag& bag) {
    std::vector<std::pair<std::filesystem::path, std::filesystem::path>> outputs{};
    const auto want = [&](const OptPath& dst, const std::filesystem::path& src) {
        if (dst) outputs.emplace_back(*dst, src);
    };
    want(cfg_.arsc_path, staged_.arsc);
    want(cfg_.proto_path, staged_.proto);
    want(cfg_.optimized_arsc_path, staged_.optimized);
    want(cfg_.optimized_proto_path, staged_.optimized);
    want(cfg_.r_text_out, staged_.r_txt);
    want(cfg_.proguard_file, staged_.proguard);
    want(cfg_.proguard_file_main_dex, staged_.proguard_main_dex);
    want(cfg_.emit_ids_out, staged_.emit_ids);
    want(cfg_.info_path, staged_.info);
    want(cfg_.resources_path_map_out_path, staged_.path_map);
    want(cfg_.obfuscation_config_out, staged_.obfuscation_config);
    want(cfg_.android_manifest_normalized, staged_.normalized_manifest);

    // Every staged product is read before the first output is touched.
    std::vector<std::string> contents(outputs.size());
    for (size_t i = 0; i < outputs.size(); ++i) {
        auto r = os::read_file(outputs[i].second);
        if (!r.ok) {
            bag.error(diag::Code::kMissingResource, outputs[i].second.string(), "expected output was not produced: " + r.err);
            return false;
        }
        contents[i] = std::move(r.data);
    }

    size_t written = 0;
    for (size_t i = 0; i < outputs.size(); ++i) {
        bool changed = false;
        std::string err{};
        if (!os::write_if_changed(outputs[i].first, contents[i], changed, err)) {
            bag.error(diag::Code::kIoFailure, outputs[i].first.string(), err);
            return false;
        }
        if (changed) ++written;
    }
    reporter_.note(std::to_string(written) + " of " + std::to_string(outputs.size()) + " output(s) updated");
    return true;
}

} // namespace resmerge::link
