#ifndef DOCBINDER_UNIT_WORKER_POOL_H
#define DOCBINDER_UNIT_WORKER_POOL_H

#include <cstddef>
#include <exception>
#include <functional>
#include <vector>

namespace DocBinder {

// Bounded pool for independent per-item work. Every task owns one result
// slot; a failing task leaves its exception in its own slot and the others
// keep running.
class UnitWorkerPool {
public:
    explicit UnitWorkerPool(int workers);

    // Runs task(0..count-1) and joins. Returns one entry per task, null on success.
    std::vector<std::exception_ptr> run(size_t count, const std::function<void(size_t)>& task) const;

    int workers() const { return workers_; }

private:
    int workers_;
};

} // namespace DocBinder

#endif // DOCBINDER_UNIT_WORKER_POOL_H
