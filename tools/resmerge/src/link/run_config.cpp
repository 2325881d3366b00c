#include <resmerge/link/RunConfig.hpp>

#include <resmerge/link/PackageId.hpp>
#include <resmerge/merge/PlatformDuplicator.hpp>
#include <resmerge/text/Strings.hpp>

#include <map>

namespace resmerge::link {

namespace {

void contradiction(diag::Bag& bag, std::string subject, std::string message) {
    bag.error(diag::Code::kConfigurationContradiction, std::move(subject), std::move(message));
}

bool check_sdk_version(const std::string& flag, const std::string& value, std::optional<uint32_t>& out, diag::Bag& bag) {
    if (value.empty()) return true;
    out = text::parse_u32(value);
    if (!out) {
        contradiction(bag, flag, "not a platform version number: " + value);
        return false;
    }
    return true;
}

} // namespace

bool validate_run_config(const RunConfig& cfg, diag::Bag& bag) {
    const size_t before = bag.error_count();

    if (cfg.aapt2_path.empty()) contradiction(bag, "--aapt2-path", "path to aapt2 is required");
    if (cfg.android_manifest.empty()) contradiction(bag, "--android-manifest", "manifest path is required");
    if (cfg.min_sdk_version.empty()) contradiction(bag, "--min-sdk-version", "minimum SDK version is required");
    if (cfg.target_sdk_version.empty()) contradiction(bag, "--target-sdk-version", "target SDK version is required");

    if (cfg.shared_resources && cfg.app_as_shared_lib) {
        contradiction(bag, "--shared-resources", "--shared-resources and --app-as-shared-lib are mutually exclusive");
    }
    if (!cfg.package_id.empty()) {
        if (!parse_package_id(cfg.package_id)) contradiction(bag, "--package-id", "not a package ID: " + cfg.package_id);
        if (cfg.shared_resources || cfg.app_as_shared_lib) {
            contradiction(bag, "--package-id", "--package-id cannot be combined with shared resources");
        }
        if (!cfg.package_name.empty()) {
            contradiction(bag, "--package-id", "--package-id and --package-name are mutually exclusive");
        }
    }
    if (cfg.optimized_arsc_path && cfg.optimized_proto_path) {
        contradiction(bag, "--optimized-arsc-path", "--optimized-arsc-path and --optimized-proto-path are mutually exclusive");
    }
    if (cfg.optimized_proto_path && !cfg.proto_path) {
        contradiction(bag, "--optimized-proto-path", "--optimized-proto-path requires --proto-path");
    }
    if (cfg.optimized_arsc_path && !cfg.arsc_path) {
        contradiction(bag, "--optimized-arsc-path", "--optimized-arsc-path requires --arsc-path");
    }
    if (!cfg.arsc_path && !cfg.proto_path) {
        contradiction(bag, "--arsc-path", "one of --arsc-path or --proto-path is required");
    }
    if (cfg.resources_path_map_out_path && !cfg.short_resource_paths) {
        contradiction(bag, "--resources-path-map-out-path", "--resources-path-map-out-path requires --short-resource-paths");
    }
    if ((cfg.short_resource_paths || cfg.strip_resource_names) && !cfg.optimized_arsc_path && !cfg.optimized_proto_path) {
        contradiction(bag, "--short-resource-paths",
                      "--short-resource-paths and --strip-resource-names need an optimized output path");
    }
    if (cfg.obfuscation_config_out && !cfg.strip_resource_names) {
        contradiction(bag, "--obfuscation-config-out", "--obfuscation-config-out requires --strip-resource-names");
    }
    if (cfg.png_to_webp && cfg.webp_binary.empty()) {
        contradiction(bag, "--png-to-webp", "--png-to-webp requires --webp-binary");
    }
    if (!cfg.shared_resources_whitelist_locales.empty() && !cfg.shared_resources_whitelist) {
        contradiction(bag, "--shared-resources-whitelist-locales",
                      "--shared-resources-whitelist-locales requires --shared-resources-whitelist");
    }
    if (cfg.android_manifest_normalized && !cfg.android_manifest_expected) {
        contradiction(bag, "--android-manifest-normalized", "--android-manifest-normalized requires --android-manifest-expected");
    }
    if (cfg.support_zh_hk) {
        const merge::DuplicationRule rule{};
        merge::check_duplication_policy(rule, cfg.locale_whitelist, bag);
        merge::check_duplication_policy(rule, cfg.shared_resources_whitelist_locales, bag);
    }

    std::optional<uint32_t> min_sdk{};
    std::optional<uint32_t> target_sdk{};
    std::optional<uint32_t> max_sdk{};
    bool versions_ok = check_sdk_version("--min-sdk-version", cfg.min_sdk_version, min_sdk, bag);
    versions_ok = check_sdk_version("--target-sdk-version", cfg.target_sdk_version, target_sdk, bag) && versions_ok;
    versions_ok = check_sdk_version("--max-sdk-version", cfg.max_sdk_version, max_sdk, bag) && versions_ok;
    if (versions_ok) {
        if (min_sdk && target_sdk && *min_sdk > *target_sdk) {
            contradiction(bag, "--min-sdk-version", "minimum SDK version exceeds target SDK version");
        }
        if (max_sdk && target_sdk && *target_sdk > *max_sdk) {
            contradiction(bag, "--max-sdk-version", "target SDK version exceeds maximum SDK version");
        }
    }

    if (cfg.jobs == 0) contradiction(bag, "--jobs", "worker count must be positive");

    std::vector<std::string> labels{};
    dependency_labels(cfg.dependencies_res_zips, labels, bag);

    return bag.error_count() == before;
}

bool dependency_labels(const std::vector<std::filesystem::path>& archives,
                       std::vector<std::string>& out,
                       diag::Bag& bag) {
    out.clear();
    std::map<std::string, std::filesystem::path> seen{};
    bool ok = true;
    for (const auto& archive : archives) {
        std::string label = archive.filename().string();
        const auto [it, inserted] = seen.emplace(label, archive);
        if (!inserted) {
            contradiction(bag, archive.string(),
                          "dependency archive name '" + label + "' clashes with " + it->second.string());
            ok = false;
        }
        out.push_back(std::move(label));
    }
    return ok;
}

} // namespace resmerge::link
