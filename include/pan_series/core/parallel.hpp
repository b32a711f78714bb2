#pragma once

#include <cstddef>
#include <functional>

namespace pan_series::core {

// Clamp a requested worker count to [1, hardware threads] and to the task count.
int compute_worker_count(int requested, size_t task_count);

// Pool size for work that blocks on the network or the disk: the requested
// count bounded by the task count only.
int compute_io_worker_count(int requested, size_t task_count);

// Run fn(i) for i in [0, task_count) on min(workers, task_count) threads (at
// least one) pulling from a shared cursor. The first exception thrown by fn is rethrown after all
// workers have joined; remaining tasks are not started once one has failed.
void run_parallel(size_t task_count, int workers, const std::function<void(size_t)>& fn);

} // namespace pan_series::core
