#pragma once

#include <resmerge/diag/DiagCode.hpp>
#include <resmerge/ledger/RenameLedger.hpp>
#include <resmerge/tree/ResourceTree.hpp>

#include <cstddef>

namespace resmerge::merge {

struct NormalizeStats {
    size_t renamed = 0;
    size_t skipped = 0;
    size_t untranslatable = 0;
};

/// Moves every locale string table to the directory spelled with the platform's
/// canonical qualifier. A destination that already exists wins and the source stays.
/// A rule that maps a path onto itself is a contradiction and aborts.
bool normalize_locales(tree::ResourceTree& tree,
                       ledger::LedgerDelta& delta,
                       diag::Bag& bag,
                       NormalizeStats* stats = nullptr);

} // namespace resmerge::merge
