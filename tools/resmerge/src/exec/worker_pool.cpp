#include <resmerge/exec/WorkerPool.hpp>

#include <llvm/Config/llvm-config.h>
#include <llvm/Support/ThreadPool.h>
#include <llvm/Support/Threading.h>

#include <algorithm>

namespace resmerge::exec {

namespace {

#if LLVM_VERSION_MAJOR >= 19
using Pool = llvm::DefaultThreadPool;
#else
using Pool = llvm::ThreadPool;
#endif

struct Slot {
    bool ok = false;
    std::string err{};
};

} // namespace

WorkerPool::WorkerPool(unsigned jobs)
    : jobs_(jobs == 0 ? k_default_jobs : jobs) {}

bool WorkerPool::run(size_t count,
                     const std::function<bool(size_t, std::string&)>& task,
                     std::vector<TaskFailure>& failures) const {
    failures.clear();
    if (count == 0) return true;

    std::vector<Slot> slots(count);
    {
        const unsigned threads = static_cast<unsigned>(std::min<size_t>(jobs_, count));
        Pool pool(llvm::hardware_concurrency(threads));
        for (size_t i = 0; i < count; ++i) {
            pool.async([&task, &slots, i] {
                Slot& s = slots[i];
                s.ok = task(i, s.err);
            });
        }
        pool.wait();
    }

    for (size_t i = 0; i < count; ++i) {
        if (!slots[i].ok) failures.push_back(TaskFailure{i, std::move(slots[i].err)});
    }
    return failures.empty();
}

} // namespace resmerge::exec
