#include <resmerge/merge/MergePipeline.hpp>

#include <resmerge/log/Reporter.hpp>
#include <resmerge/merge/LocaleNormalizer.hpp>

namespace resmerge::merge {

bool commit_delta(Dependency& dep, const ledger::LedgerDelta& delta, diag::Bag& bag) {
    std::string err{};
    if (!dep.ledger.apply(delta, err)) {
        bag.error(diag::Code::kInvariantViolation, dep.label, err);
        return false;
    }
    return true;
}

MergePipeline::MergePipeline(MergePolicy policy, const exec::WorkerPool& pool, ImageEncoder* encoder, log::Reporter& reporter)
    : policy_(std::move(policy)), pool_(pool), encoder_(encoder), reporter_(reporter) {}

bool MergePipeline::normalize(std::vector<Dependency>& deps, diag::Bag& bag) {
    for (auto& dep : deps) {
        if (policy_.duplication.has_value()) {
            ledger::LedgerDelta delta{};
            if (!duplicate_locale(*dep.tree, *policy_.duplication, delta, bag)) return false;
            if (!commit_delta(dep, delta, bag)) return false;
        }

        ledger::LedgerDelta delta{};
        NormalizeStats stats{};
        if (!normalize_locales(*dep.tree, delta, bag, &stats)) return false;
        if (!commit_delta(dep, delta, bag)) return false;
        if (stats.renamed > 0) {
            reporter_.note(dep.label + ": " + std::to_string(stats.renamed) + " locale file(s) renamed");
        }
    }
    return true;
}

bool MergePipeline::filter(std::vector<Dependency>& deps, diag::Bag& bag) {
    if (policy_.locales.active()) {
        std::vector<const tree::ResourceTree*> trees{};
        trees.reserve(deps.size());
        for (const auto& dep : deps) trees.push_back(dep.tree.get());

        const auto partition = partition_locales(observed_locales(trees), policy_.locales);
        for (const auto& [locale, fate] : partition) {
            if (fate != LocaleFate::kKeepAll) reporter_.note("locale " + locale + ": " + fate_name(fate));
        }
        for (auto& dep : deps) {
            ledger::LedgerDelta delta{};
            if (!filter_locale_strings(*dep.tree, partition, policy_.locales.shared_names, delta, bag)) return false;
            if (!commit_delta(dep, delta, bag)) return false;
        }
    }

    auto keep = KeepFilter::create(policy_.keep, bag);
    if (!keep) return false;
    for (const auto& dep : deps) keep->observe(*dep.tree);

    for (auto& dep : deps) {
        ledger::LedgerDelta delta{};
        for (const auto& rel : dep.tree->list_files()) {
            if (keep->keep(dep.label, rel)) continue;
            std::string err{};
            if (!dep.tree->remove(rel, err)) {
                bag.error(diag::Code::kIoFailure, dep.label + "/" + rel, err);
                return false;
            }
            delta.removed(rel);
        }
        if (!commit_delta(dep, delta, bag)) return false;
    }
    return true;
}

bool MergePipeline::recompress(std::vector<Dependency>& deps, diag::Bag& bag) {
    if (policy_.recompress) {
        if (encoder_ == nullptr) {
            bag.error(diag::Code::kConfigurationContradiction, "png-to-webp", "image recompression requested without an encoder");
            return false;
        }
        std::vector<ledger::LedgerDelta> deltas(deps.size());
        std::vector<RecompressTarget> targets{};
        targets.reserve(deps.size());
        for (size_t i = 0; i < deps.size(); ++i) targets.push_back(RecompressTarget{deps[i].tree.get(), &deltas[i]});

        if (!recompress_images(targets, *encoder_, pool_, bag)) return false;
        for (size_t i = 0; i < deps.size(); ++i) {
            if (!commit_delta(deps[i], deltas[i], bag)) return false;
        }
    }

    if (policy_.migration.has_value()) {
        for (auto& dep : deps) {
            ledger::LedgerDelta delta{};
            if (!migrate_density_bucket(*dep.tree, *policy_.migration, delta, bag)) return false;
            if (!commit_delta(dep, delta, bag)) return false;
        }
    }
    return true;
}

bool MergePipeline::run(std::vector<Dependency>& deps, RunTracker& tracker, diag::Bag& bag) {
    reporter_.progress(20, "Normalizing locales");
    if (!normalize(deps, bag) || !tracker.advance(RunState::kNormalized, bag)) {
        tracker.fail();
        return false;
    }

    reporter_.progress(30, "Filtering resources");
    if (!filter(deps, bag) || !tracker.advance(RunState::kFiltered, bag)) {
        tracker.fail();
        return false;
    }

    reporter_.progress(40, policy_.recompress ? "Recompressing images" : "Migrating density buckets");
    if (!recompress(deps, bag) || !tracker.advance(RunState::kRecompressed, bag)) {
        tracker.fail();
        return false;
    }
    return true;
}

} // namespace resmerge::merge
