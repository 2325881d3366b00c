#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace resmerge::exec {

inline constexpr unsigned k_default_jobs = 10;

struct TaskFailure {
    size_t index = 0;
    std::string message{};
};

/// Fixed-size pool for independent work items. Each item writes only its own result
/// slot; failures are collected after every worker has joined, ordered by index.
class WorkerPool {
public:
    explicit WorkerPool(unsigned jobs = k_default_jobs);

    unsigned jobs() const { return jobs_; }

    /// Runs `task(i, err)` for every i in [0, count). Returns true only when every
    /// call returned true.
    bool run(size_t count,
             const std::function<bool(size_t, std::string&)>& task,
             std::vector<TaskFailure>& failures) const;

private:
    unsigned jobs_ = k_default_jobs;
};

} // namespace resmerge::exec
