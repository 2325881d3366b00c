#include <resmerge/cli/Options.hpp>

#include <resmerge/text/Strings.hpp>

#include <functional>
#include <string_view>

namespace resmerge::cli {

namespace {

using Setter = std::function<bool(std::string, std::string&)>;

struct ValueFlag {
    std::string_view name{};
    Setter set{};
};

struct SwitchFlag {
    std::string_view name{};
    std::function<void()> set{};
};

Setter to_string(std::string& dst) {
    return [&dst](std::string v, std::string&) {
        dst = std::move(v);
        return true;
    };
}

Setter to_path(link::OptPath& dst) {
    return [&dst](std::string v, std::string&) {
        dst = std::filesystem::path(std::move(v));
        return true;
    };
}

/// Each occurrence appends its items, so a list flag may be repeated.
Setter to_list(std::vector<std::string>& dst) {
    return [&dst](std::string v, std::string& err) {
        std::vector<std::string> items{};
        if (!text::parse_list(v, items, err)) return false;
        for (auto& it : items) dst.push_back(std::move(it));
        return true;
    };
}

Setter to_path_list(std::vector<std::filesystem::path>& dst) {
    return [&dst](std::string v, std::string& err) {
        std::vector<std::string> items{};
        if (!text::parse_list(v, items, err)) return false;
        for (auto& it : items) dst.emplace_back(std::move(it));
        return true;
    };
}

/// `--key value` or `--key=value`. Returns false with `err` set when the value is missing.
bool take_value(const std::vector<std::string_view>& args,
                size_t& i,
                std::string_view key,
                std::string& out,
                std::string& err) {
    const auto a = args[i];
    if (a.size() > key.size() && a.starts_with(key) && a[key.size()] == '=') {
        out = std::string(a.substr(key.size() + 1));
    } else if (i + 1 < args.size()) {
        out = std::string(args[++i]);
    } else {
        err = std::string(key) + " requires a value";
        return false;
    }
    return true;
}

bool names_flag(std::string_view arg, std::string_view key) {
    return arg == key || (arg.size() > key.size() && arg.starts_with(key) && arg[key.size()] == '=');
}

} // namespace

void print_usage(std::ostream& os) {
    os
        << "resmerge [options]\n"
        << "\n"
        << "Merges Android resource archives and links them with aapt2.\n"
        << "List values take GN syntax [\"a\", \"b\"] or a,b and may be repeated.\n"
        << "\n"
        << "Inputs:\n"
        << "  --aapt2-path <path>               --android-manifest <path>\n"
        << "  --dependencies-res-zips <list>    -I, --include-resources <list>\n"
        << "  --min-sdk-version <N>             --target-sdk-version <N>\n"
        << "  --max-sdk-version <N>             --version-code <N>  --version-name <s>\n"
        << "  --r-text-in <path>                --use-resource-ids-path <path>\n"
        << "\n"
        << "Package identity:\n"
        << "  --shared-resources                --app-as-shared-lib\n"
        << "  --package-id <hex>                --package-name <name>\n"
        << "  --package-name-to-id-mapping <list of name=id>\n"
        << "  --rename-manifest-package <name>\n"
        << "\n"
        << "Merge policy:\n"
        << "  --locale-whitelist <list>         --support-zh-hk\n"
        << "  --shared-resources-whitelist <R.txt>\n"
        << "  --shared-resources-whitelist-locales <list>\n"
        << "  --resource-blacklist-regex <re>   --resource-blacklist-exceptions <list>\n"
        << "      (both match '<dependency label>/<resource path>', e.g. 'dep.zip/drawable-hdpi/x.png')\n"
        << "  --png-to-webp --webp-binary <path>\n"
        << "  --no-migrate-mdpi\n"
        << "\n"
        << "Link and optimize:\n"
        << "  --no-xml-namespaces  --short-resource-paths  --strip-resource-names\n"
        << "  --resources-config-path <path>\n"
        << "\n"
        << "Outputs:\n"
        << "  --arsc-path  --proto-path  --optimized-arsc-path  --optimized-proto-path\n"
        << "  --info-path  --r-text-out  --proguard-file  --proguard-file-main-dex\n"
        << "  --emit-ids-out  --resources-path-map-out-path  --obfuscation-config-out\n"
        << "\n"
        << "Manifest check:\n"
        << "  --android-manifest-expected <path>  --android-manifest-normalized <path>\n"
        << "  --fail-if-unexpected-android-manifest\n"
        << "\n"
        << "General:\n"
        << "  --config <settings.toml>  --jobs <N>  --keep-workspace\n"
        << "  --debug-temp-dir <dir>    keep the workspace in <dir>/<arsc file name>\n"
        << "  --ignore-stderr <regex>   --color <auto|always|never>  --no-progress\n"
        << "  -v, --verbose  -h, --help  --version\n";
}

Options parse_options(int argc, char** argv) {
    Options out{};
    auto& run = out.run;
    auto& amb = out.ambient;

    std::vector<std::string_view> args{};
    for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);
    if (args.empty()) return out;

    const std::vector<ValueFlag> values{
        {"--aapt2-path", [&amb](std::string v, std::string&) { amb.aapt2 = std::move(v); return true; }},
        {"--webp-binary", [&amb](std::string v, std::string&) { amb.cwebp = std::move(v); return true; }},
        {"--android-manifest", [&run](std::string v, std::string&) { run.android_manifest = std::move(v); return true; }},
        {"--android-manifest-expected", to_path(run.android_manifest_expected)},
        {"--android-manifest-normalized", to_path(run.android_manifest_normalized)},
        {"--dependencies-res-zips", to_path_list(run.dependencies_res_zips)},
        {"--include-resources", to_list(run.include_resources)},
        {"-I", to_list(run.include_resources)},
        {"--package-id", to_string(run.package_id)},
        {"--package-name-to-id-mapping", to_list(run.package_name_to_id_mapping)},
        {"--package-name", to_string(run.package_name)},
        {"--rename-manifest-package", to_string(run.rename_manifest_package)},
        {"--shared-resources-whitelist", to_path(run.shared_resources_whitelist)},
        {"--shared-resources-whitelist-locales", to_list(run.shared_resources_whitelist_locales)},
        {"--locale-whitelist", to_list(run.locale_whitelist)},
        {"--resource-blacklist-regex", to_string(run.resource_blacklist_regex)},
        {"--resource-blacklist-exceptions", to_list(run.resource_blacklist_exceptions)},
        {"--version-code", to_string(run.version_code)},
        {"--version-name", to_string(run.version_name)},
        {"--min-sdk-version", to_string(run.min_sdk_version)},
        {"--target-sdk-version", to_string(run.target_sdk_version)},
        {"--max-sdk-version", to_string(run.max_sdk_version)},
        {"--resources-config-path", to_path(run.resources_config_path)},
        {"--use-resource-ids-path", to_path(run.use_resource_ids_path)},
        {"--r-text-in", to_path(run.r_text_in)},
        {"--arsc-path", to_path(run.arsc_path)},
        {"--proto-path", to_path(run.proto_path)},
        {"--optimized-arsc-path", to_path(run.optimized_arsc_path)},
        {"--optimized-proto-path", to_path(run.optimized_proto_path)},
        {"--info-path", to_path(run.info_path)},
        {"--r-text-out", to_path(run.r_text_out)},
        {"--proguard-file", to_path(run.proguard_file)},
        {"--proguard-file-main-dex", to_path(run.proguard_file_main_dex)},
        {"--emit-ids-out", to_path(run.emit_ids_out)},
        {"--resources-path-map-out-path", to_path(run.resources_path_map_out_path)},
        {"--obfuscation-config-out", to_path(run.obfuscation_config_out)},
        {"--config", [&out](std::string v, std::string&) { out.config_path = std::filesystem::path(std::move(v)); return true; }},
        {"--debug-temp-dir", [&amb](std::string v, std::string&) { amb.debug_root = std::filesystem::path(std::move(v)); return true; }},
        {"--ignore-stderr", [&amb](std::string v, std::string&) { amb.ignored_stderr.push_back(std::move(v)); return true; }},
        {"--jobs", [&amb](std::string v, std::string& err) {
             const auto n = text::parse_u32(v);
             if (!n || *n == 0) {
                 err = "--jobs expects a positive integer, got '" + v + "'";
                 return false;
             }
             amb.jobs = *n;
             return true;
         }},
        {"--color", [&amb](std::string v, std::string& err) {
             log::ColorMode mode{};
             if (!log::parse_color_mode(v, mode)) {
                 err = "--color expects auto, always or never";
                 return false;
             }
             amb.color = mode;
             return true;
         }},
    };

    const std::vector<SwitchFlag> switches{
        {"--fail-if-unexpected-android-manifest", [&run] { run.fail_if_unexpected_android_manifest = true; }},
        {"--shared-resources", [&run] { run.shared_resources = true; }},
        {"--app-as-shared-lib", [&run] { run.app_as_shared_lib = true; }},
        {"--support-zh-hk", [&run] { run.support_zh_hk = true; }},
        {"--png-to-webp", [&run] { run.png_to_webp = true; }},
        {"--no-migrate-mdpi", [&run] { run.migrate_mdpi = false; }},
        {"--no-xml-namespaces", [&run] { run.no_xml_namespaces = true; }},
        {"--short-resource-paths", [&run] { run.short_resource_paths = true; }},
        {"--strip-resource-names", [&run] { run.strip_resource_names = true; }},
        {"--keep-workspace", [&amb] { amb.keep_workspace = true; }},
        {"--no-progress", [&amb] { amb.progress = false; }},
        {"--verbose", [&amb] { amb.verbose = true; }},
        {"-v", [&amb] { amb.verbose = true; }},
    };

    out.mode = Mode::kRun;
    for (size_t i = 0; i < args.size(); ++i) {
        const auto a = args[i];
        if (a == "-h" || a == "--help") {
            out.mode = Mode::kUsage;
            return out;
        }
        if (a == "--version") {
            out.mode = Mode::kVersion;
            return out;
        }

        bool matched = false;
        for (const auto& sw : switches) {
            if (a != sw.name) continue;
            sw.set();
            matched = true;
            break;
        }
        if (matched) continue;

        for (const auto& vf : values) {
            if (!names_flag(a, vf.name)) continue;
            std::string v{};
            if (!take_value(args, i, vf.name, v, out.error) || !vf.set(std::move(v), out.error)) {
                out.ok = false;
                return out;
            }
            matched = true;
            break;
        }
        if (matched) continue;

        out.ok = false;
        out.error = (!a.empty() && a[0] == '-') ? "unknown option: " + std::string(a)
                                                : "unexpected argument: " + std::string(a);
        return out;
    }
    return out;
}

} // namespace resmerge::cli
