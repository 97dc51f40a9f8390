#pragma once

#include <exception>
#include <vector>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace Tmber {
namespace Utils {

/**
 * @brief Number of worker threads to use; 0 means all available cores.
 */
inline int resolve_threads(int requested) {
    if (requested > 0) {
        return requested;
    }
#ifdef _OPENMP
    return omp_get_num_procs();
#else
    return 1;
#endif
}

/**
 * @brief Share of @p total_threads for each of @p num_tasks concurrent tasks
 * (at least 1). Used to size per-file decompression threads.
 */
inline int threads_per_task(int total_threads, int num_tasks) {
    if (num_tasks <= 0) {
        return total_threads > 0 ? total_threads : 1;
    }
    int share = total_threads / num_tasks;
    return share > 0 ? share : 1;
}

/**
 * @brief Rethrows the failure of the lowest-indexed task, if any.
 *
 * Picking the lowest index keeps the reported error independent of the order
 * in which tasks finished.
 */
inline void rethrow_first_error(const std::vector<std::exception_ptr>& errors) {
    for (const auto& e : errors) {
        if (e) {
            std::rethrow_exception(e);
        }
    }
}

/**
 * @brief Runs fn(i) for i in [0, n) on up to @p threads OpenMP threads.
 *
 * Exceptions cannot cross an OpenMP region, so each task's exception is
 * captured and the first one (by index) is rethrown after all tasks have
 * joined. Tasks must only write to their own output slot.
 */
template <typename Fn>
void parallel_for_each(int n, int threads, Fn&& fn) {
    std::vector<std::exception_ptr> errors(n > 0 ? n : 0);

#pragma omp parallel for schedule(dynamic) num_threads(resolve_threads(threads))
    for (int i = 0; i < n; ++i) {
        try {
            fn(i);
        } catch (...) {
            errors[i] = std::current_exception();
        }
    }

    rethrow_first_error(errors);
}

} // namespace Utils
} // namespace Tmber
