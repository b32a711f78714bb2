#include "pan_series/core/parallel.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <thread>
#include <vector>

namespace pan_series::core {

int compute_worker_count(int requested, size_t task_count) {
    int workers = requested;
    if (workers < 1) {
        workers = 1;
    }
    int cpu_cores = static_cast<int>(std::thread::hardware_concurrency());
    if (cpu_cores > 0) {
        workers = std::min(workers, cpu_cores);
    }
    if (task_count > 0) {
        workers = std::min(workers, static_cast<int>(std::max<size_t>(1, task_count)));
    }
    return std::max(1, workers);
}

int compute_io_worker_count(int requested, size_t task_count) {
    size_t workers = static_cast<size_t>(std::max(1, requested));
    if (task_count > 0) {
        workers = std::min(workers, task_count);
    }
    return static_cast<int>(workers);
}

void run_parallel(size_t task_count, int workers, const std::function<void(size_t)>& fn) {
    if (task_count == 0) {
        return;
    }

    std::atomic<size_t> next{0};
    std::atomic<bool> failed{false};
    std::mutex error_mutex;
    std::exception_ptr first_error;

    auto worker = [&]() {
        while (!failed.load(std::memory_order_relaxed)) {
            const size_t i = next.fetch_add(1);
            if (i >= task_count) {
                break;
            }
            try {
                fn(i);
            } catch (...) {
                std::lock_guard<std::mutex> lock(error_mutex);
                if (!first_error) {
                    first_error = std::current_exception();
                }
                failed.store(true, std::memory_order_relaxed);
            }
        }
    };

    const int n = compute_io_worker_count(workers, task_count);
    if (n > 1) {
        std::vector<std::thread> threads;
        threads.reserve(static_cast<size_t>(n));
        for (int w = 0; w < n; ++w) {
            threads.emplace_back(worker);
        }
        for (auto& t : threads) {
            if (t.joinable()) {
                t.join();
            }
        }
    } else {
        worker();
    }

    if (first_error) {
        std::rethrow_exception(first_error);
    }
}

} // namespace pan_series::core
