#include "timebox/core/errors.hpp"
#include "timebox/core/sandbox_manager.hpp"
#include "../mocks/mock_container_engine.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <future>
#include <thread>

using namespace timebox::core;
using timebox::testing::MakeImage;
using timebox::testing::MockContainerEngine;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;
using namespace std::chrono_literals;

// ============================================================================
// ADMISSION GATE
// ============================================================================

TEST(AdmissionGateTest, AdmitsUpToCeiling) {
    AdmissionGate gate(2);
    auto first = gate.Acquire(10ms);
    auto second = gate.Acquire(10ms);

    EXPECT_TRUE(first.Held());
    EXPECT_EQ(gate.InUse(), 2u);
    EXPECT_THROW(gate.Acquire(30ms), AdmissionRejected);
    EXPECT_EQ(gate.Waiting(), 0u);
}

TEST(AdmissionGateTest, ReleasedSlotAdmitsWaiter) {
    AdmissionGate gate(1);
    auto held = gate.Acquire(10ms);

    auto waiter = std::async(std::launch::async, [&gate] {
        auto slot = gate.Acquire(2s);
        return slot.Held();
    });

    std::this_thread::sleep_for(50ms);
    held.Release();
    EXPECT_TRUE(waiter.get());
    EXPECT_EQ(gate.InUse(), 0u);
}

TEST(AdmissionGateTest, MovedSlotReleasesOnce) {
    AdmissionGate gate(1);
    {
        auto slot = gate.Acquire(10ms);
        AdmissionGate::Slot moved = std::move(slot);
        EXPECT_FALSE(slot.Held());
        EXPECT_TRUE(moved.Held());
        EXPECT_EQ(gate.InUse(), 1u);
    }
    EXPECT_EQ(gate.InUse(), 0u);
}

TEST(AdmissionGateTest, RejectionReportsCeiling) {
    AdmissionGate gate(1);
    auto held = gate.Acquire(10ms);
    try {
        gate.Acquire(20ms);
        FAIL() << "expected AdmissionRejected";
    } catch (const AdmissionRejected& e) {
        EXPECT_EQ(e.GetCeiling(), 1u);
        EXPECT_GE(e.GetWaited(), 20ms);
    }
}

// ============================================================================
// SANDBOX MANAGER
// ============================================================================

class SandboxManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        work_root_ = std::filesystem::temp_directory_path() /
            ("timebox_manager_" + std::string(
                ::testing::UnitTest::GetInstance()->current_test_info()->name()));
        std::filesystem::remove_all(work_root_);

        config_ = RunnerConfigBuilder(EngineKind::LOCAL_PROCESS)
            .WithMaxConcurrency(2)
            .WithAdmissionTimeout(20ms)
            .WithWorkRoot(work_root_)
            .Build();
        config_.runtimes = {{"sh", RuntimeProfile{"sh", {"{image}", "{file}"}, "main.sh"}}};
        config_.default_runtime = "sh";

        ON_CALL(engine_, Name()).WillByDefault(Return("mock"));
        ON_CALL(engine_, InspectImage(_)).WillByDefault(Return(MakeImage("sh", "/bin/sh")));
        ON_CALL(engine_, Provision(_)).WillByDefault([](const timebox::utils::ProvisionSpec& spec) {
            return "engine-" + spec.name;
        });
        ON_CALL(engine_, Destroy(_)).WillByDefault(Return(true));

        registry_ = std::make_unique<ImageRegistry>(engine_, config_.runtimes);
        registry_->ResolveAll();
        manager_ = std::make_unique<SandboxManager>(engine_, *registry_, config_);

        limits_ = ResourceLimiter(config_).Resolve(ExecutionRequest{});
    }

    void TearDown() override {
        manager_.reset();
        std::filesystem::remove_all(work_root_);
    }

    std::filesystem::path work_root_;
    RunnerConfig config_;
    NiceMock<MockContainerEngine> engine_;
    std::unique_ptr<ImageRegistry> registry_;
    std::unique_ptr<SandboxManager> manager_;
    EffectiveLimits limits_;
};

TEST_F(SandboxManagerTest, AcquireProvisionsPrivateDirectory) {
    timebox::utils::ProvisionSpec seen;
    EXPECT_CALL(engine_, Provision(_)).WillOnce([&seen](const timebox::utils::ProvisionSpec& spec) {
        seen = spec;
        return std::string("engine-1");
    });

    auto lease = manager_->Acquire("sh", limits_, {{"FOO", "bar"}});

    EXPECT_EQ(lease.State(), SandboxState::PROVISIONING);
    EXPECT_EQ(lease.EngineId(), "engine-1");
    EXPECT_EQ(lease.Image().pinned_id, "/bin/sh");
    ASSERT_TRUE(std::filesystem::is_directory(lease.WorkingDirectory()));
    EXPECT_EQ(lease.WorkingDirectory().parent_path(), work_root_);

    auto perms = std::filesystem::status(lease.WorkingDirectory()).permissions();
    EXPECT_EQ(perms & std::filesystem::perms::all, std::filesystem::perms::owner_all);

    EXPECT_EQ(seen.name, lease.Id());
    EXPECT_EQ(seen.image, "/bin/sh");
    EXPECT_EQ(seen.host_workdir, lease.WorkingDirectory());
    EXPECT_EQ(seen.command, (std::vector<std::string>{"/bin/sh", "main.sh"}));
    EXPECT_EQ(seen.environment.at("FOO"), "bar");
    EXPECT_EQ(seen.memory_limit_mb, limits_.memory_limit_mb);
}

TEST_F(SandboxManagerTest, InstanceIdsAreUnique) {
    auto first = manager_->Acquire("sh", limits_, {});
    auto second = manager_->Acquire("sh", limits_, {});
    EXPECT_NE(first.Id(), second.Id());
    EXPECT_NE(first.WorkingDirectory(), second.WorkingDirectory());
}

TEST_F(SandboxManagerTest, ReleaseDestroysEverything) {
    EXPECT_CALL(engine_, Destroy("engine-x")).WillOnce(Return(true));
    EXPECT_CALL(engine_, Provision(_)).WillOnce(Return("engine-x"));

    std::filesystem::path workdir;
    {
        auto lease = manager_->Acquire("sh", limits_, {});
        workdir = lease.WorkingDirectory();
        EXPECT_EQ(manager_->LiveCount(), 1u);
    }

    EXPECT_FALSE(std::filesystem::exists(workdir));
    EXPECT_EQ(manager_->LiveCount(), 0u);
    EXPECT_EQ(manager_->Gate().InUse(), 0u);
}

TEST_F(SandboxManagerTest, ReleaseIsIdempotent) {
    EXPECT_CALL(engine_, Destroy(_)).Times(1).WillOnce(Return(true));

    auto lease = manager_->Acquire("sh", limits_, {});
    std::string id = lease.Id();
    lease.Release();
    manager_->Release(id);
    lease.Release();

    EXPECT_FALSE(lease.Active());
    EXPECT_EQ(manager_->LiveCount(), 0u);
}

TEST_F(SandboxManagerTest, TeardownFailureStillFreesSlot) {
    ON_CALL(engine_, Destroy(_)).WillByDefault(Return(false));
    {
        auto lease = manager_->Acquire("sh", limits_, {});
    }
    EXPECT_EQ(manager_->Gate().InUse(), 0u);
    EXPECT_EQ(manager_->LiveCount(), 0u);
}

TEST_F(SandboxManagerTest, CeilingRejectsExtraRequest) {
    auto first = manager_->Acquire("sh", limits_, {});
    auto second = manager_->Acquire("sh", limits_, {});

    EXPECT_THROW(manager_->Acquire("sh", limits_, {}), AdmissionRejected);
    EXPECT_EQ(manager_->LiveCount(), 2u);

    first.Release();
    auto third = manager_->Acquire("sh", limits_, {});
    EXPECT_TRUE(third.Active());
}

TEST_F(SandboxManagerTest, ProvisionFailureLeaksNothing) {
    EXPECT_CALL(engine_, Provision(_))
        .WillOnce(Throw(InfrastructureFailure("daemon unreachable")));
    EXPECT_CALL(engine_, Destroy(_)).Times(0);

    EXPECT_THROW(manager_->Acquire("sh", limits_, {}), InfrastructureFailure);

    EXPECT_EQ(manager_->LiveCount(), 0u);
    EXPECT_EQ(manager_->Gate().InUse(), 0u);
    EXPECT_TRUE(std::filesystem::is_empty(work_root_));
}

TEST_F(SandboxManagerTest, UnexpectedProvisionErrorBecomesInfrastructureFailure) {
    EXPECT_CALL(engine_, Provision(_)).WillOnce(Throw(std::runtime_error("boom")));

    EXPECT_THROW(manager_->Acquire("sh", limits_, {}), InfrastructureFailure);
    EXPECT_EQ(manager_->Gate().InUse(), 0u);
}

TEST_F(SandboxManagerTest, UnknownRuntimeIsInvalidRequest) {
    EXPECT_CALL(engine_, Provision(_)).Times(0);
    EXPECT_THROW(manager_->Acquire("cobol", limits_, {}), InvalidRequestError);
    EXPECT_EQ(manager_->Gate().InUse(), 0u);
}

TEST_F(SandboxManagerTest, LeaseFollowsLifecycle) {
    auto lease = manager_->Acquire("sh", limits_, {});

    EXPECT_THROW(lease.Transition(SandboxState::COMPLETED), TimeboxError);
    lease.Transition(SandboxState::RUNNING);
    lease.Transition(SandboxState::TIMED_OUT);
    EXPECT_EQ(lease.State(), SandboxState::TIMED_OUT);
    EXPECT_THROW(lease.Transition(SandboxState::RUNNING), TimeboxError);
}

TEST_F(SandboxManagerTest, ConcurrentRequestsNeverExceedCeiling) {
    config_.admission_timeout = 5s;
    std::atomic<std::size_t> peak{0};

    auto worker = [this, &peak] {
        auto lease = manager_->Acquire("sh", limits_, {});
        std::size_t live = manager_->Gate().InUse();
        std::size_t seen = peak.load();
        while (live > seen && !peak.compare_exchange_weak(seen, live)) {
        }
        std::this_thread::sleep_for(20ms);
    };

    std::vector<std::thread> threads;
    for (int i = 0; i < 6; ++i) {
        threads.emplace_back(worker);
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_LE(peak.load(), config_.max_concurrency);
    EXPECT_EQ(manager_->LiveCount(), 0u);
    EXPECT_TRUE(std::filesystem::is_empty(work_root_));
}

TEST(SandboxStateTest, TransitionTable) {
    EXPECT_TRUE(SandboxManager::IsValidTransition(SandboxState::CREATED, SandboxState::PROVISIONING));
    EXPECT_TRUE(SandboxManager::IsValidTransition(SandboxState::PROVISIONING, SandboxState::KILLED));
    EXPECT_TRUE(SandboxManager::IsValidTransition(SandboxState::RUNNING, SandboxState::CRASHED));
    EXPECT_TRUE(SandboxManager::IsValidTransition(SandboxState::COMPLETED, SandboxState::RECLAIMED));
    EXPECT_TRUE(SandboxManager::IsValidTransition(SandboxState::PROVISIONING, SandboxState::RECLAIMED));

    EXPECT_FALSE(SandboxManager::IsValidTransition(SandboxState::CREATED, SandboxState::RUNNING));
    EXPECT_FALSE(SandboxManager::IsValidTransition(SandboxState::PROVISIONING, SandboxState::COMPLETED));
    EXPECT_FALSE(SandboxManager::IsValidTransition(SandboxState::COMPLETED, SandboxState::RUNNING));
    EXPECT_FALSE(SandboxManager::IsValidTransition(SandboxState::RECLAIMED, SandboxState::RECLAIMED));
}
