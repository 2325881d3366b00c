#pragma once

#include <resmerge/diag/DiagCode.hpp>
#include <resmerge/ledger/RenameLedger.hpp>
#include <resmerge/tree/ResourceTree.hpp>

#include <string>
#include <vector>

namespace resmerge::merge {

/// Legacy compatibility move for one density: images in `drawable-*-<density>-*`
/// directories go to the same directory without that qualifier.
struct MigrationRule {
    std::string density{"mdpi"};
    std::vector<std::string> extensions{".png", ".webp"};
};

/// A destination that already exists is an invariant violation and aborts the stage.
bool migrate_density_bucket(tree::ResourceTree& tree,
                            const MigrationRule& rule,
                            ledger::LedgerDelta& delta,
                            diag::Bag& bag);

} // namespace resmerge::merge
