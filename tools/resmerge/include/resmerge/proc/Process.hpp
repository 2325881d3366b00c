#pragma once

#include <string>
#include <vector>

namespace resmerge::proc {

struct Captured {
    int exit_code = 1;
    std::string out{};
    std::string err{};
};

/// Runs `argv` collecting stdout and stderr separately. `exit_code` is 128+N when the
/// child was killed by signal N. Returns false only when the process could not be
/// started or waited for.
bool run_argv_capture(const std::vector<std::string>& argv, Captured& out, std::string& err);

} // namespace resmerge::proc
