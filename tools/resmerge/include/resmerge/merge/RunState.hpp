#pragma once

#include <resmerge/diag/DiagCode.hpp>

#include <cstdint>

namespace resmerge::merge {

enum class RunState : uint8_t {
    kInit,
    kExtracted,
    kNormalized,
    kFiltered,
    kRecompressed,
    kLedgerWritten,
    kLinked,
    kValidated,
    kFinalized,
};

const char* state_name(RunState s);

/// Tracks one run through its fixed sequence of states. A run only ever moves to the
/// state directly after its current one; it never moves after a failure.
class RunTracker {
public:
    RunState state() const { return state_; }
    bool failed() const { return failed_; }

    bool advance(RunState next, diag::Bag& bag);
    void fail() { failed_ = true; }

private:
    RunState state_ = RunState::kInit;
    bool failed_ = false;
};

} // namespace resmerge::merge
