#include "unit_worker_pool.h"

#include <algorithm>
#include <atomic>
#include <thread>

namespace DocBinder {

UnitWorkerPool::UnitWorkerPool(int workers)
    : workers_(std::max(1, workers)) {}

std::vector<std::exception_ptr> UnitWorkerPool::run(size_t count, const std::function<void(size_t)>& task) const {
    std::vector<std::exception_ptr> failures(count);
    std::atomic<size_t> next{0};

    auto worker = [&]() {
        for (;;) {
            size_t i = next.fetch_add(1);
            if (i >= count) return;
            try {
                task(i);
            } catch (...) {
                // Kept for the caller, which rethrows after the join
                failures[i] = std::current_exception();
            }
        }
    };

    size_t threads = std::min(static_cast<size_t>(workers_), count);
    if (threads <= 1) {
        worker();
        return failures;
    }

    std::vector<std::thread> pool;
    pool.reserve(threads);
    for (size_t t = 0; t < threads; ++t) pool.emplace_back(worker);
    for (auto& th : pool) th.join();

    return failures;
}

} // namespace DocBinder
