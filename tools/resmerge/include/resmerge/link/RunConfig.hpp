#pragma once

#include <resmerge/diag/DiagCode.hpp>
#include <resmerge/exec/WorkerPool.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace resmerge::link {

using OptPath = std::optional<std::filesystem::path>;

/// Everything one packaging run needs, after CLI and settings-file merging.
struct RunConfig {
    std::string aapt2_path{};
    std::string webp_binary{};

    std::filesystem::path android_manifest{};
    OptPath android_manifest_expected{};
    OptPath android_manifest_normalized{};
    bool fail_if_unexpected_android_manifest = false;

    std::vector<std::filesystem::path> dependencies_res_zips{};
    std::vector<std::string> include_resources{};

    bool shared_resources = false;
    bool app_as_shared_lib = false;
    std::string package_id{};
    std::vector<std::string> package_name_to_id_mapping{};
    std::string package_name{};
    std::string rename_manifest_package{};

    OptPath shared_resources_whitelist{};
    std::vector<std::string> shared_resources_whitelist_locales{};
    std::vector<std::string> locale_whitelist{};
    bool support_zh_hk = false;

    std::string resource_blacklist_regex{};
    std::vector<std::string> resource_blacklist_exceptions{};
    bool png_to_webp = false;
    bool migrate_mdpi = true;

    std::string version_code{};
    std::string version_name{};
    std::string min_sdk_version{};
    std::string target_sdk_version{};
    std::string max_sdk_version{};

    bool no_xml_namespaces = false;
    bool short_resource_paths = false;
    bool strip_resource_names = false;
    OptPath resources_config_path{};
    OptPath use_resource_ids_path{};
    OptPath r_text_in{};

    OptPath arsc_path{};
    OptPath proto_path{};
    OptPath optimized_arsc_path{};
    OptPath optimized_proto_path{};
    OptPath info_path{};
    OptPath r_text_out{};
    OptPath proguard_file{};
    OptPath proguard_file_main_dex{};
    OptPath emit_ids_out{};
    OptPath resources_path_map_out_path{};
    OptPath obfuscation_config_out{};

    unsigned jobs = exec::k_default_jobs;
    OptPath debug_temp_dir{};
    bool keep_workspace = false;
    std::vector<std::string> ignored_stderr{};
};

/// Reports every contradictory or incomplete option combination, not just the first.
bool validate_run_config(const RunConfig& cfg, diag::Bag& bag);

/// Workspace subdirectory name of each dependency archive. Two archives with the same
/// file name would share a directory and are rejected.
bool dependency_labels(const std::vector<std::filesystem::path>& archives,
                       std::vector<std::string>& out,
                       diag::Bag& bag);

} // namespace resmerge::link
