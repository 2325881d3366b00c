#include <resmerge/link/Aapt2.hpp>

#include <resmerge/log/Reporter.hpp>
#include <resmerge/proc/Process.hpp>
#include <resmerge/text/Strings.hpp>

namespace resmerge::link {

std::optional<StderrFilter> StderrFilter::create(const std::vector<std::string>& extra_patterns, diag::Bag& bag) {
    StderrFilter out{};
    out.patterns_.emplace_back(k_ignored_configuration_pattern);
    bool ok = true;
    for (const auto& p : extra_patterns) {
        llvm::Regex re(p);
        std::string err{};
        if (!re.isValid(err)) {
            bag.error(diag::Code::kConfigurationContradiction, p, "invalid stderr filter pattern: " + err);
            ok = false;
            continue;
        }
        out.patterns_.push_back(std::move(re));
    }
    if (!ok) return std::nullopt;
    return out;
}

std::string StderrFilter::apply(std::string_view text) const {
    std::string out{};
    for (const auto& line : text::split_lines(text)) {
        bool drop = false;
        for (const auto& re : patterns_) {
            if (re.match(line)) {
                drop = true;
                break;
            }
        }
        if (drop) continue;
        out += line;
        out.push_back('\n');
    }
    return out;
}

bool ToolRunner::run(const std::vector<std::string>& argv, std::string_view what, diag::Bag& bag, std::string* out) const {
    reporter_.command(argv);

    proc::Captured cap{};
    std::string err{};
    if (!proc::run_argv_capture(argv, cap, err)) {
        bag.error(diag::Code::kExternalToolFailure, argv.empty() ? std::string{} : argv[0], err);
        return false;
    }

    const std::string detail = text::trim(filter_.apply(cap.err));
    if (cap.exit_code != 0) {
        std::string msg = std::string(what) + " failed (exit=" + std::to_string(cap.exit_code) + ")";
        if (!detail.empty()) msg += "\n" + detail;
        bag.error(diag::Code::kExternalToolFailure, text::join(argv, " "), std::move(msg));
        return false;
    }
    if (!detail.empty()) bag.warning(diag::Code::kExternalToolFailure, std::string(what), detail);
    if (out != nullptr) *out = std::move(cap.out);
    return true;
}

std::vector<std::string> compile_command(std::string_view aapt2,
                                         const std::filesystem::path& dir,
                                         const std::filesystem::path& out) {
    return {std::string(aapt2), "compile", "--dir", dir.string(), "-o", out.string()};
}

std::vector<std::string> link_command(const RunConfig& cfg, const StagedPaths& staged, const LinkInputs& in) {
    std::vector<std::string> cmd{
        cfg.aapt2_path,
        "link",
        "--auto-add-overlay",
        "--no-version-vectors",
        "--min-sdk-version",
        cfg.min_sdk_version,
        "--target-sdk-version",
        cfg.target_sdk_version,
    };

    for (const auto& jar : cfg.include_resources) {
        cmd.push_back("-I");
        cmd.push_back(jar);
    }
    if (!cfg.version_code.empty()) {
        cmd.push_back("--version-code");
        cmd.push_back(cfg.version_code);
    }
    if (!cfg.version_name.empty()) {
        cmd.push_back("--version-name");
        cmd.push_back(cfg.version_name);
    }
    if (cfg.proguard_file) {
        cmd.push_back("--proguard");
        cmd.push_back(staged.proguard.string());
    }
    if (cfg.proguard_file_main_dex) {
        cmd.push_back("--proguard-main-dex");
        cmd.push_back(staged.proguard_main_dex.string());
    }
    if (cfg.emit_ids_out) {
        cmd.push_back("--emit-ids");
        cmd.push_back(staged.emit_ids.string());
    }
    if (!cfg.r_text_in) {
        cmd.push_back("--output-text-symbols");
        cmd.push_back(staged.r_txt.string());
    }

    // Recent aapt2 accepts only one of --proto-format, --shared-lib and --app-as-shared-lib.
    if (cfg.shared_resources && !cfg.proto_path) cmd.push_back("--shared-lib");
    if (cfg.no_xml_namespaces) cmd.push_back("--no-xml-namespaces");

    if (in.package_id) {
        cmd.push_back("--package-id");
        cmd.push_back(text::hex_byte(*in.package_id));
        cmd.push_back("--allow-reserved-package-id");
    }

    cmd.push_back("--manifest");
    cmd.push_back(in.manifest.string());
    if (!in.manifest_package.empty()) {
        cmd.push_back("--rename-manifest-package");
        cmd.push_back(in.manifest_package);
    }
    if (in.stable_ids) {
        cmd.push_back("--stable-ids");
        cmd.push_back(staged.stable_ids.string());
    }
    for (const auto& partial : in.partials) {
        cmd.push_back("-R");
        cmd.push_back(partial.string());
    }

    if (cfg.proto_path) {
        cmd.push_back("--proto-format");
        cmd.push_back("-o");
        cmd.push_back(staged.proto.string());
    } else {
        cmd.push_back("-o");
        cmd.push_back(staged.arsc.string());
    }
    return cmd;
}

std::vector<std::string> convert_command(std::string_view aapt2,
                                         const std::filesystem::path& arsc_out,
                                         const std::filesystem::path& proto_in) {
    return {std::string(aapt2), "convert", "-o", arsc_out.string(), proto_in.string()};
}

std::vector<std::string> optimize_command(const RunConfig& cfg,
                                          const StagedPaths& staged,
                                          const std::filesystem::path& in,
                                          bool with_obfuscation_config) {
    std::vector<std::string> cmd{cfg.aapt2_path, "optimize", in.string(), "-o", staged.optimized.string()};
    if (with_obfuscation_config) {
        cmd.push_back("--enable-resource-obfuscation");
        cmd.push_back("--resources-config-path");
        cmd.push_back(staged.obfuscation_config.string());
    }
    if (cfg.short_resource_paths) cmd.push_back("--enable-resource-path-shortening");
    if (cfg.resources_path_map_out_path) {
        cmd.push_back("--resource-path-shortening-map");
        cmd.push_back(staged.path_map.string());
    }
    return cmd;
}

std::vector<std::string> dump_resources_command(std::string_view aapt2, const std::filesystem::path& archive) {
    return {std::string(aapt2), "dump", "resources", archive.string()};
}

} // namespace resmerge::link
