#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace resmerge::ledger {

enum class Op : uint8_t {
    kMove,
    kCopy,
    kRemove,
};

/// One filesystem effect performed by a transform, in the order it happened.
struct LedgerOp {
    Op op = Op::kMove;
    std::string from{};
    std::string to{};
};

/// What a transform did to one tree. Applied to that tree's ledger by the caller.
struct LedgerDelta {
    std::vector<LedgerOp> ops{};

    void moved(std::string from, std::string to) { ops.push_back(LedgerOp{Op::kMove, std::move(from), std::move(to)}); }
    void copied(std::string from, std::string to) { ops.push_back(LedgerOp{Op::kCopy, std::move(from), std::move(to)}); }
    void removed(std::string path) { ops.push_back(LedgerOp{Op::kRemove, std::move(path), {}}); }
    bool empty() const { return ops.empty(); }
};

struct RenameEntry {
    std::string new_path{};
    std::string original_path{};
    Op kind = Op::kMove;
};

/// Maps each renamed or duplicated resident path of one resource root back to the
/// path it had in the dependency archive. Keys are unique.
class RenameLedger {
public:
    /// Records `from -> to`. A move of an already renamed path composes onto its
    /// original. Fails when `to` is already mapped to a different original.
    bool record(std::string_view from, std::string_view to, Op kind, std::string& err);

    /// Drops the entry of a path that no longer exists.
    void forget(std::string_view path);

    bool apply(const LedgerDelta& delta, std::string& err);

    /// The archive path of `path`: its entry's original, or `path` itself.
    std::string original_of(std::string_view path) const;

    bool contains(std::string_view path) const;
    size_t size() const { return entries_.size(); }
    std::vector<RenameEntry> entries() const;

    /// `Rename:<new>,<original>` lines in key order.
    std::vector<std::string> render_lines() const;

private:
    struct Slot {
        std::string original{};
        Op kind = Op::kMove;
    };
    std::map<std::string, Slot, std::less<>> entries_{};
};

std::string format_rename_line(std::string_view new_path, std::string_view original_path);

} // namespace resmerge::ledger
