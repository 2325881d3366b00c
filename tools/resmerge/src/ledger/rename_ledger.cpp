#include <resmerge/ledger/RenameLedger.hpp>

namespace resmerge::ledger {

std::string format_rename_line(std::string_view new_path, std::string_view original_path) {
    std::string out = "Rename:";
    out.append(new_path);
    out.push_back(',');
    out.append(original_path);
    return out;
}

bool RenameLedger::record(std::string_view from, std::string_view to, Op kind, std::string& err) {
    if (kind == Op::kRemove) {
        forget(from);
        return true;
    }

    std::string original = original_of(from);
    Op effective = kind;
    if (kind == Op::kMove) {
        const auto it = entries_.find(from);
        if (it != entries_.end()) {
            // A renamed copy stays a copy of its original.
            if (it->second.kind == Op::kCopy) effective = Op::kCopy;
            entries_.erase(it);
        }
    }

    if (original == to) {
        // Moved back to where it started.
        entries_.erase(std::string(to));
        return true;
    }

    const auto it = entries_.find(to);
    if (it != entries_.end()) {
        if (it->second.original == original) return true;
        err = "ledger conflict for " + std::string(to) + ": already maps to " + it->second.original +
              ", cannot also map to " + original;
        return false;
    }
    entries_.emplace(std::string(to), Slot{std::move(original), effective});
    return true;
}

void RenameLedger::forget(std::string_view path) {
    const auto it = entries_.find(path);
    if (it != entries_.end()) entries_.erase(it);
}

bool RenameLedger::apply(const LedgerDelta& delta, std::string& err) {
    for (const auto& op : delta.ops) {
        if (!record(op.from, op.to, op.op, err)) return false;
    }
    return true;
}

std::string RenameLedger::original_of(std::string_view path) const {
    const auto it = entries_.find(path);
    if (it == entries_.end()) return std::string(path);
    return it->second.original;
}

bool RenameLedger::contains(std::string_view path) const {
    return entries_.find(path) != entries_.end();
}

std::vector<RenameEntry> RenameLedger::entries() const {
    std::vector<RenameEntry> out{};
    out.reserve(entries_.size());
    for (const auto& [k, slot] : entries_) {
        out.push_back(RenameEntry{k, slot.original, slot.kind});
    }
    return out;
}

std::vector<std::string> RenameLedger::render_lines() const {
    std::vector<std::string> out{};
    out.reserve(entries_.size());
    for (const auto& [k, slot] : entries_) out.push_back(format_rename_line(k, slot.original));
    return out;
}

} // namespace resmerge::ledger
