/**
 * @file batch_dispatcher.hpp
 * @brief In-order launcher for batch requests
 *
 * One dispatching thread hands jobs out in submission order and never keeps
 * more than `ceiling` of them in flight. A job therefore always finds a free
 * admission slot, and admissions happen in the order the jobs were
 * submitted.
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <mutex>
#include <vector>

namespace timebox {
namespace core {

/**
 * @class BatchDispatcher
 * @brief Bounded, first-come-first-served job launcher
 *
 * Jobs return a process exit code; Wait() folds them into the worst one.
 * Dispatch() and Wait() must be called from the same thread.
 */
class BatchDispatcher {
public:
    using Job = std::function<int()>;

    BatchDispatcher(std::size_t ceiling, std::chrono::milliseconds admission_timeout);
    ~BatchDispatcher();

    BatchDispatcher(const BatchDispatcher&) = delete;
    BatchDispatcher& operator=(const BatchDispatcher&) = delete;

    /**
     * @brief Launch @p job once fewer than ceiling jobs are running
     * @return false if no job finished within the admission timeout; @p job
     *         was not started
     */
    bool Dispatch(Job job);

    /**
     * @brief Wait for every launched job
     * @return Highest exit code returned by a job (0 when none ran)
     * @throws Whatever a job threw
     */
    int Wait();

    std::size_t Launched() const { return launched_; }

private:
    void Finished();

    const std::size_t ceiling_;
    const std::chrono::milliseconds admission_timeout_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::size_t in_flight_{0};
    std::size_t launched_{0};
    std::vector<std::future<int>> jobs_;
};

} // namespace core
} // namespace timebox
