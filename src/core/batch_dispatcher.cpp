/**
 * @file batch_dispatcher.cpp
 * @brief Implementation of the in-order batch launcher
 *
 * @date 2025
 */

#include "timebox/core/batch_dispatcher.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <system_error>

namespace timebox {
namespace core {

namespace {

/// Marks a job finished on every exit path
class FinishGuard {
public:
    explicit FinishGuard(std::function<void()> done) : done_(std::move(done)) {}
    ~FinishGuard() { done_(); }

    FinishGuard(const FinishGuard&) = delete;
    FinishGuard& operator=(const FinishGuard&) = delete;

private:
    std::function<void()> done_;
};

} // anonymous namespace

BatchDispatcher::BatchDispatcher(std::size_t ceiling, std::chrono::milliseconds admission_timeout)
    : ceiling_(std::max<std::size_t>(ceiling, 1))
    , admission_timeout_(admission_timeout) {
}

BatchDispatcher::~BatchDispatcher() {
    // Running jobs still update mutex_ and in_flight_
    for (auto& job : jobs_) {
        if (job.valid()) {
            job.wait();
        }
    }
}

bool BatchDispatcher::Dispatch(Job job) {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        bool admitted = cv_.wait_for(lock, admission_timeout_, [this] {
            return in_flight_ < ceiling_;
        });
        if (!admitted) {
            spdlog::warn("Batch job {} not started: {} job(s) still running after {} ms",
                         launched_ + 1, in_flight_, admission_timeout_.count());
            return false;
        }
        ++in_flight_;
    }

    try {
        jobs_.push_back(std::async(std::launch::async, [this, job = std::move(job)]() {
            FinishGuard guard([this] { Finished(); });
            return job();
        }));
    } catch (const std::system_error& e) {
        spdlog::error("Cannot start batch job: {}", e.what());
        Finished();
        throw;
    }
    ++launched_;
    return true;
}

int BatchDispatcher::Wait() {
    int worst = 0;
    for (auto& job : jobs_) {
        worst = std::max(worst, job.get());
    }
    jobs_.clear();
    return worst;
}

void BatchDispatcher::Finished() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        --in_flight_;
    }
    cv_.notify_all();
}

} // namespace core
} // namespace timebox
