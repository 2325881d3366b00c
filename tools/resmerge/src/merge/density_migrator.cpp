#include <resmerge/merge/DensityMigrator.hpp>

#include <resmerge/res/ResourcePath.hpp>

#include <algorithm>

namespace resmerge::merge {

bool migrate_density_bucket(tree::ResourceTree& tree,
                            const MigrationRule& rule,
                            ledger::LedgerDelta& delta,
                            diag::Bag& bag) {
    for (const auto& rel : tree.list_files()) {
        const auto path = res::classify(rel);
        if (!path.governed || path.type != "drawable") continue;
        if (std::find(path.qualifiers.begin(), path.qualifiers.end(), rule.density) == path.qualifiers.end()) continue;
        if (std::find(rule.extensions.begin(), rule.extensions.end(), path.extension) == rule.extensions.end()) continue;

        const std::string dst = res::without_qualifier(path, rule.density).str();
        if (tree.exists(dst)) {
            bag.error(diag::Code::kInvariantViolation, tree.label() + "/" + dst,
                      "cannot move " + rel + " out of the " + rule.density + " bucket: destination exists");
            return false;
        }
        std::string err{};
        if (!tree.move(rel, dst, err)) {
            bag.error(diag::Code::kIoFailure, tree.label() + "/" + rel, err);
            return false;
        }
        delta.moved(rel, dst);
    }
    return true;
}

} // namespace resmerge::merge
