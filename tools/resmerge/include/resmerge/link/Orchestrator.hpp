#pragma once

#include <resmerge/diag/DiagCode.hpp>
#include <resmerge/exec/WorkerPool.hpp>
#include <resmerge/link/Aapt2.hpp>
#include <resmerge/link/RunConfig.hpp>
#include <resmerge/link/Workspace.hpp>
#include <resmerge/merge/MergePipeline.hpp>
#include <resmerge/merge/RunState.hpp>

#include <filesystem>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace resmerge::log {
class Reporter;
}

namespace resmerge::link {

/// One packaging run: extract, merge, link, validate, publish. Outputs are only written
/// once every phase has succeeded.
class Orchestrator {
public:
    /// `encoder` overrides the cwebp encoder built from the config.
    Orchestrator(RunConfig cfg, log::Reporter& reporter, merge::ImageEncoder* encoder = nullptr);

    bool run(diag::Bag& bag);

    const merge::RunTracker& tracker() const { return tracker_; }
    /// Empty when the run stopped before the workspace was created.
    const std::filesystem::path& workspace_root() const { return workspace_.root(); }

private:
    bool prepare(diag::Bag& bag);
    bool extract(diag::Bag& bag);
    bool merge_resources(diag::Bag& bag);
    bool write_ledger(diag::Bag& bag);
    bool link(diag::Bag& bag);
    bool validate(diag::Bag& bag);
    bool publish(diag::Bag& bag);

    bool compile_partials(std::vector<std::filesystem::path>& partials, diag::Bag& bag);
    bool write_stable_ids(const std::string& package, diag::Bag& bag);
    bool write_obfuscation_config(diag::Bag& bag);
    bool check_manifest(diag::Bag& bag);
    bool check_package(diag::Bag& bag);

    bool step(bool ok, merge::RunState next, diag::Bag& bag);

    RunConfig cfg_{};
    log::Reporter& reporter_;
    merge::ImageEncoder* encoder_ = nullptr;
    std::unique_ptr<merge::ImageEncoder> owned_encoder_{};

    exec::WorkerPool pool_{};
    std::optional<StderrFilter> filter_{};
    Workspace workspace_{};
    StagedPaths staged_{};
    merge::RunTracker tracker_{};

    std::vector<merge::Dependency> deps_{};
    std::set<std::string> shared_names_{};
    std::string manifest_text_{};
};

} // namespace resmerge::link
