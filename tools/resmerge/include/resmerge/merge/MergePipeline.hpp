#pragma once

#include <resmerge/diag/DiagCode.hpp>
#include <resmerge/exec/WorkerPool.hpp>
#include <resmerge/ledger/RenameLedger.hpp>
#include <resmerge/merge/DensityMigrator.hpp>
#include <resmerge/merge/ImageRecompressor.hpp>
#include <resmerge/merge/KeepFilter.hpp>
#include <resmerge/merge/LocaleStringFilter.hpp>
#include <resmerge/merge/PlatformDuplicator.hpp>
#include <resmerge/merge/RunState.hpp>
#include <resmerge/tree/ResourceTree.hpp>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace resmerge::log {
class Reporter;
}

namespace resmerge::merge {

/// One extracted dependency: its resource root and the renames applied to it so far.
struct Dependency {
    std::string label{};
    std::filesystem::path archive{};
    std::unique_ptr<tree::ResourceTree> tree{};
    ledger::RenameLedger ledger{};
};

struct MergePolicy {
    std::optional<DuplicationRule> duplication{};
    LocalePolicy locales{};
    KeepPolicy keep{};
    bool recompress = false;
    std::optional<MigrationRule> migration{MigrationRule{}};
};

/// Runs the merge transforms over every dependency in their fixed order, moving the
/// run from Extracted to Recompressed.
class MergePipeline {
public:
    MergePipeline(MergePolicy policy, const exec::WorkerPool& pool, ImageEncoder* encoder, log::Reporter& reporter);

    bool run(std::vector<Dependency>& deps, RunTracker& tracker, diag::Bag& bag);

    bool normalize(std::vector<Dependency>& deps, diag::Bag& bag);
    bool filter(std::vector<Dependency>& deps, diag::Bag& bag);
    bool recompress(std::vector<Dependency>& deps, diag::Bag& bag);

private:
    MergePolicy policy_{};
    const exec::WorkerPool& pool_;
    ImageEncoder* encoder_ = nullptr;
    log::Reporter& reporter_;
};

/// Applies `delta` to the dependency's ledger, reporting conflicts.
bool commit_delta(Dependency& dep, const ledger::LedgerDelta& delta, diag::Bag& bag);

} // namespace resmerge::merge
