#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace resmerge::link {

/// Where link products are staged before publishing.
struct StagedPaths {
    std::filesystem::path arsc{};
    std::filesystem::path proto{};
    std::filesystem::path optimized{};
    std::filesystem::path r_txt{};
    std::filesystem::path proguard{};
    std::filesystem::path proguard_main_dex{};
    std::filesystem::path emit_ids{};
    std::filesystem::path info{};
    std::filesystem::path stable_ids{};
    std::filesystem::path obfuscation_config{};
    std::filesystem::path path_map{};
    std::filesystem::path normalized_manifest{};
};

/// Scratch directory owned by one run. Removed on destruction unless kept; a debug
/// workspace is always kept so it can be inspected.
class Workspace {
public:
    Workspace() = default;
    ~Workspace();
    Workspace(const Workspace&) = delete;
    Workspace& operator=(const Workspace&) = delete;

    /// Creates a fresh directory under the system temp dir. With `debug_root`, uses
    /// `debug_root/run_name` instead, clearing only that subdirectory.
    bool create(const std::optional<std::filesystem::path>& debug_root,
                const std::string& run_name,
                bool keep,
                std::string& err);

    const std::filesystem::path& root() const { return root_; }
    bool kept() const { return keep_; }

    std::filesystem::path deps_dir() const { return root_ / "deps"; }
    std::filesystem::path partials_dir() const { return root_ / "partials"; }
    std::filesystem::path dep_dir(const std::string& label) const { return deps_dir() / label; }
    StagedPaths staged() const;

private:
    std::filesystem::path root_{};
    bool keep_ = false;
};

} // namespace resmerge::link
