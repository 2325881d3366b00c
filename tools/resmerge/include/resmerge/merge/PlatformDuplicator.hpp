#pragma once

#include <resmerge/diag/DiagCode.hpp>
#include <resmerge/ledger/RenameLedger.hpp>
#include <resmerge/tree/ResourceTree.hpp>

#include <string>
#include <vector>

namespace resmerge::merge {

/// Copies every resource qualified with `from_locale` to the same path qualified with
/// `to_locale`. zh-rTW resources stand in for zh-rHK, which the app does not ship.
struct DuplicationRule {
    std::string from_locale{"zh-rTW"};
    std::string to_locale{"zh-rHK"};
};

/// Rejects allow-lists that already name the target locale.
bool check_duplication_policy(const DuplicationRule& rule,
                              const std::vector<std::string>& allow_list,
                              diag::Bag& bag);

bool duplicate_locale(tree::ResourceTree& tree,
                      const DuplicationRule& rule,
                      ledger::LedgerDelta& delta,
                      diag::Bag& bag);

} // namespace resmerge::merge
