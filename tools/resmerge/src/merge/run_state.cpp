#include <resmerge/merge/RunState.hpp>

#include <string>

namespace resmerge::merge {

const char* state_name(RunState s) {
    switch (s) {
        case RunState::kInit: return "Init";
        case RunState::kExtracted: return "Extracted";
        case RunState::kNormalized: return "Normalized";
        case RunState::kFiltered: return "Filtered";
        case RunState::kRecompressed: return "Recompressed";
        case RunState::kLedgerWritten: return "LedgerWritten";
        case RunState::kLinked: return "Linked";
        case RunState::kValidated: return "Validated";
        case RunState::kFinalized: return "Finalized";
    }
    return "Unknown";
}

bool RunTracker::advance(RunState next, diag::Bag& bag) {
    if (failed_) {
        bag.error(diag::Code::kInvariantViolation, state_name(next),
                  std::string("run already aborted in state ") + state_name(state_));
        return false;
    }
    if (state_ == RunState::kFinalized ||
        static_cast<uint8_t>(next) != static_cast<uint8_t>(state_) + 1) {
        failed_ = true;
        bag.error(diag::Code::kInvariantViolation, state_name(next),
                  std::string("illegal run transition ") + state_name(state_) + " -> " + state_name(next));
        return false;
    }
    state_ = next;
    return true;
}

} // namespace resmerge::merge
