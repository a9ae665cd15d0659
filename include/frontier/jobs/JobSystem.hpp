#pragma once

// Taskflow core and algorithms
#include <taskflow/taskflow.hpp>                  // tf::Executor, tf::Taskflow, tf::Future
#include <taskflow/algorithm/for_each.hpp>        // tf::Taskflow::for_each, for_each_index

#include <cstddef>
#include <thread>
#include <type_traits>
#include <utility>

namespace frontier::jobs {

// Thin wrapper over one tf::Executor. Owned by whoever drives the simulation
// (TickOrchestrator users, the CLI, tests); there is no process-wide instance.
class JobSystem {
public:
    // 0 = one worker per hardware thread.
    explicit JobSystem(std::size_t workers = 0)
        : _executor(workers == 0 ? Concurrency() : workers) {}

    JobSystem(const JobSystem&) = delete;
    JobSystem& operator=(const JobSystem&) = delete;

    tf::Executor& executor() noexcept { return _executor; }
    std::size_t Workers() const noexcept { return _executor.num_workers(); }

    // Launch a callable asynchronously; returns std::future<R>.
    template <typename F>
    auto Async(F&& f) {
        return _executor.async(std::forward<F>(f));
    }

    // Fire-and-forget. Track completion with WaitAll().
    template <typename F>
    void SilentAsync(F&& f) {
        _executor.silent_async(std::forward<F>(f));
    }

    // Iterator-based parallel for_each over [first, last), non-blocking.
    template <typename It, typename F>
    tf::Future<void> ParallelForAsync(It first, It last, F&& fn) {
        tf::Taskflow taskflow;
        taskflow.for_each(first, last, std::forward<F>(fn));
        return _executor.run(std::move(taskflow));
    }

    // Blocking variant for external threads. Do NOT call from inside a task
    // running on this executor.
    template <typename It, typename F>
    void ParallelFor(It first, It last, F&& fn) {
        ParallelForAsync(first, last, std::forward<F>(fn)).wait();
    }

    // Wait for all outstanding work (safe from external threads).
    void WaitAll() { _executor.wait_for_all(); }

    static std::size_t Concurrency() noexcept {
        const unsigned n = std::thread::hardware_concurrency();
        return n == 0 ? 1 : n;
    }

private:
    tf::Executor _executor;
};

} // namespace frontier::jobs
