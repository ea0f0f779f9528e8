#include "timebox/core/batch_dispatcher.hpp"
#include "timebox/core/sandbox_manager.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace timebox::core;
using namespace std::chrono_literals;

TEST(BatchDispatcherTest, AdmitsInSubmissionOrder) {
    AdmissionGate gate(1);
    BatchDispatcher dispatcher(gate.Ceiling(), 2s);
    std::mutex mutex;
    std::vector<int> admitted;

    for (int i = 0; i < 6; ++i) {
        ASSERT_TRUE(dispatcher.Dispatch([&, i] {
            auto slot = gate.Acquire(100ms);
            {
                std::lock_guard<std::mutex> lock(mutex);
                admitted.push_back(i);
            }
            std::this_thread::sleep_for(5ms);
            return 0;
        }));
    }

    EXPECT_EQ(dispatcher.Wait(), 0);
    EXPECT_EQ(admitted, (std::vector<int>{0, 1, 2, 3, 4, 5}));
}

TEST(BatchDispatcherTest, NeverExceedsCeiling) {
    BatchDispatcher dispatcher(2, 2s);
    std::atomic<int> running{0};
    std::atomic<int> peak{0};

    for (int i = 0; i < 8; ++i) {
        ASSERT_TRUE(dispatcher.Dispatch([&] {
            int now = ++running;
            int seen = peak.load();
            while (now > seen && !peak.compare_exchange_weak(seen, now)) {
            }
            std::this_thread::sleep_for(10ms);
            --running;
            return 0;
        }));
    }

    EXPECT_EQ(dispatcher.Wait(), 0);
    EXPECT_LE(peak.load(), 2);
    EXPECT_EQ(dispatcher.Launched(), 8u);
}

TEST(BatchDispatcherTest, GivesUpWhenBusyPastTimeout) {
    BatchDispatcher dispatcher(1, 30ms);
    std::promise<void> release;
    auto released = release.get_future().share();

    ASSERT_TRUE(dispatcher.Dispatch([released] {
        released.wait();
        return 0;
    }));
    EXPECT_FALSE(dispatcher.Dispatch([] { return 5; }));

    release.set_value();
    EXPECT_EQ(dispatcher.Wait(), 0);
    EXPECT_EQ(dispatcher.Launched(), 1u);
}

TEST(BatchDispatcherTest, WaitReportsWorstExitCode) {
    BatchDispatcher dispatcher(4, 1s);
    for (int code : {0, 3, 2}) {
        ASSERT_TRUE(dispatcher.Dispatch([code] { return code; }));
    }
    EXPECT_EQ(dispatcher.Wait(), 3);
}

TEST(BatchDispatcherTest, JobFailureSurfacesAndFreesItsSlot) {
    BatchDispatcher dispatcher(1, 1s);
    ASSERT_TRUE(dispatcher.Dispatch([]() -> int { throw std::runtime_error("boom"); }));
    // The failed job must not keep the only slot
    ASSERT_TRUE(dispatcher.Dispatch([] { return 0; }));

    EXPECT_THROW(dispatcher.Wait(), std::runtime_error);
}
