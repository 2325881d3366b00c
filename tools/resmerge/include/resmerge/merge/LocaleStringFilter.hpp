#pragma once

#include <resmerge/diag/DiagCode.hpp>
#include <resmerge/ledger/RenameLedger.hpp>
#include <resmerge/tree/ResourceTree.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace resmerge::merge {

/// Resolved locale policy. An unset list means "every observed locale" for `wanted`
/// and "same as wanted" for `shared`.
struct LocalePolicy {
    std::optional<std::set<std::string>> wanted{};
    std::optional<std::set<std::string>> shared{};
    std::set<std::string> shared_names{};

    bool active() const { return wanted.has_value() || shared.has_value(); }
};

/// Resolves raw allow-lists (tags or qualifiers) into a policy. `extra` qualifiers are
/// added to every non-empty list (the synthesized zh-rHK, for instance).
bool resolve_locale_policy(const std::vector<std::string>& wanted,
                           const std::vector<std::string>& shared,
                           const std::vector<std::string>& extra,
                           LocalePolicy& out,
                           diag::Bag& bag);

enum class LocaleFate : uint8_t {
    kKeepAll,
    kNonSharedOnly,
    kSharedOnly,
    kRemove,
};

const char* fate_name(LocaleFate fate);

using LocalePartition = std::map<std::string, LocaleFate>;

/// Locales of every string table across `trees`.
std::set<std::string> observed_locales(const std::vector<const tree::ResourceTree*>& trees);

/// One fate per observed locale; each locale's fate depends only on its own membership.
LocalePartition partition_locales(const std::set<std::string>& observed, const LocalePolicy& policy);

struct StringFilterStats {
    size_t removed_files = 0;
    size_t rewritten_files = 0;
    size_t dropped_strings = 0;
};

bool filter_locale_strings(tree::ResourceTree& tree,
                           const LocalePartition& partition,
                           const std::set<std::string>& shared_names,
                           ledger::LedgerDelta& delta,
                           diag::Bag& bag,
                           StringFilterStats* stats = nullptr);

} // namespace resmerge::merge
