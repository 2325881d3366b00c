#pragma once

#include <resmerge/diag/DiagCode.hpp>
#include <resmerge/ledger/RenameLedger.hpp>

#include <filesystem>
#include <map>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace resmerge::ledger {

/// Consolidates the ledgers of one run: this run's per-dependency ledgers plus the
/// `<archive>.info` files shipped beside dependency archives.
///
/// A new path maps to one original across every source. Exact repeats are merged;
/// a new path arriving with a different original is an invariant violation.
class LedgerWriter {
public:
    bool add(const RenameLedger& ledger, std::string_view source, diag::Bag& bag);
    bool add_lines(const std::vector<std::string>& lines, std::string_view source, diag::Bag& bag);

    /// Reads `<archive>.info` when present. A missing file is not an error.
    bool add_upstream(const std::filesystem::path& archive, diag::Bag& bag);

    /// Sorted, deduplicated lines.
    std::vector<std::string> lines() const;
    std::string render() const;

    /// Writes the consolidated ledger. Only one write per writer; afterwards the
    /// writer rejects further input.
    bool write(const std::filesystem::path& path, diag::Bag& bag);
    bool sealed() const { return sealed_; }

private:
    struct Claim {
        std::string original{};
        std::string source{};
    };

    bool check_open(diag::Bag& bag, std::string_view subject);
    bool claim(std::string_view new_path, std::string_view original, std::string_view source, diag::Bag& bag);

    std::set<std::string> lines_{};
    std::map<std::string, Claim, std::less<>> claims_{};
    bool sealed_ = false;
};

std::filesystem::path upstream_ledger_path(const std::filesystem::path& archive);

} // namespace resmerge::ledger
