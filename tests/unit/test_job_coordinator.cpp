/**
 * @file test_job_coordinator.cpp
 * @brief Unit tests for the training job state machine.
 */

#include "engine/layers.hpp"
#include "training/job_coordinator.hpp"
#include "telemetry/json_sink.hpp"
#include "telemetry/metrics_collector.hpp"

#include <gtest/gtest.h>

#include <thread>

using namespace archetype;
using json = nlohmann::json;
using namespace std::chrono_literals;

namespace {

Device test_cpu() {
    Device dev;
    dev.id = "cpu:0";
    dev.name = "Test CPU";
    dev.backend = BackendKind::CpuFallback;
    dev.performance_score = 100;
    return dev;
}

class RecordingChannel : public IProgressChannel {
public:
    Result<void> send(const json& frame) override {
        std::lock_guard lock(mutex_);
        frames_.push_back(frame);
        return {};
    }

    std::vector<json> frames() const {
        std::lock_guard lock(mutex_);
        return frames_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<json> frames_;
};

struct NonStandardFailure {};

/// Appended to a network so that the next training step throws something
/// outside the std::exception hierarchy.
class ThrowingLayer : public Layer {
public:
    [[nodiscard]] std::string_view kind() const noexcept override { return "throwing"; }
    Tensor forward(const Tensor& /*input*/, bool /*training*/) override { throw NonStandardFailure{}; }
    Tensor backward(const Tensor& grad_output) override { return grad_output; }
};

const json kSmallDataset = {{"type", "dummy"}, {"num_samples", 100}};
const json kShortTraining = {{"epochs", 3}, {"batch_size", 10}, {"learning_rate", 0.01}};
const json kLongTraining = {{"epochs", 100000}, {"batch_size", 10}};

}  // namespace

class JobCoordinatorTest : public ::testing::Test {
protected:
    Logger logger_{std::make_unique<NullSink>()};
    CpuReferenceEngine engine_;
    DeviceCatalog catalog_{logger_, std::make_unique<MockProbe>(BackendKind::CpuFallback,
                                                               std::vector<Device>{test_cpu()})};
    DeviceSelector selector_{catalog_, engine_, logger_};
    ModelBuilderRegistry builders_;
    InMemoryMetadataStore store_;
    MetricsCollector metrics_{std::make_unique<NullSink>()};
    UnitRegistry units_{builders_, selector_, engine_, store_, logger_,
                        UnitRegistry::Options{std::filesystem::temp_directory_path()
                                              / "archetype_coordinator_test"}};
    ProgressBroadcaster broadcaster_{logger_};
    std::unique_ptr<JobCoordinator> jobs_;
    UnitId unit_;

    void SetUp() override {
        ASSERT_TRUE(selector_.auto_select().has_value());
        auto created = units_.create("tiny", "mlp", {{"layers", {4, 8, 3}}}, json::object());
        ASSERT_TRUE(created.has_value());
        unit_ = created->id;
        make_coordinator({.epoch_yield = 1ms});
    }

    void make_coordinator(JobCoordinator::Options options) {
        if (jobs_) jobs_->shutdown();
        jobs_ = std::make_unique<JobCoordinator>(units_, broadcaster_, logger_, options, &metrics_);
    }

    JobId start_long() {
        auto id = jobs_->start(unit_, kSmallDataset, kLongTraining);
        EXPECT_TRUE(id.has_value());
        return *id;
    }

    bool wait_for_state(const JobId& id, JobState state, std::chrono::milliseconds timeout = 5s) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            auto s = jobs_->status(id);
            if (s && s->state == state) return true;
            std::this_thread::sleep_for(2ms);
        }
        return false;
    }
};

// ── Lifecycle ──

TEST_F(JobCoordinatorTest, RunsToCompletion) {
    auto id = jobs_->start(unit_, kSmallDataset, kShortTraining);
    ASSERT_TRUE(id.has_value());

    auto final_state = jobs_->wait(*id, 20s);
    ASSERT_TRUE(final_state.has_value());
    EXPECT_EQ(*final_state, JobState::Completed);

    auto status = jobs_->status(*id);
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(status->current_epoch, 3u);
    EXPECT_EQ(status->total_epochs, 3u);
    EXPECT_DOUBLE_EQ(status->progress(), 1.0);
    EXPECT_DOUBLE_EQ(status->eta_seconds, 0.0);
    EXPECT_TRUE(status->finished_after_s.has_value());
    EXPECT_FALSE(status->error.has_value());

    ASSERT_EQ(status->history.size(), 3u);
    for (size_t i = 0; i < status->history.size(); ++i) {
        EXPECT_EQ(status->history[i].epoch, i + 1);
        EXPECT_GE(status->history[i].accuracy, 0.0);
        EXPECT_LE(status->history[i].accuracy, 100.0);
    }
}

TEST_F(JobCoordinatorTest, ValidationMetricsRecorded) {
    auto id = jobs_->start(unit_, kSmallDataset, kShortTraining, {{"num_samples", 20}});
    ASSERT_TRUE(id.has_value());
    ASSERT_EQ(*jobs_->wait(*id, 20s), JobState::Completed);

    auto status = jobs_->status(*id);
    ASSERT_TRUE(status.has_value());
    for (const auto& row : status->history) {
        EXPECT_TRUE(row.val_loss.has_value());
        EXPECT_TRUE(row.val_accuracy.has_value());
    }
    EXPECT_FALSE(status->validation_config.is_null());
}

TEST_F(JobCoordinatorTest, StartRejectsBadRequests) {
    auto missing = jobs_->start("no-such-model", kSmallDataset, kShortTraining);
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, ErrorCode::NotFound);

    auto zero_epochs = jobs_->start(unit_, kSmallDataset, {{"epochs", 0}});
    ASSERT_FALSE(zero_epochs.has_value());
    EXPECT_EQ(zero_epochs.error().code, ErrorCode::InvalidArgument);

    auto bad_validation = jobs_->start(unit_, kSmallDataset, kShortTraining, json::array());
    ASSERT_FALSE(bad_validation.has_value());
    EXPECT_EQ(bad_validation.error().code, ErrorCode::InvalidArgument);

    EXPECT_TRUE(jobs_->list().empty());
}

TEST_F(JobCoordinatorTest, BadDatasetFailsTheJob) {
    auto id = jobs_->start(unit_, {{"type", "imagenet"}}, kShortTraining);
    ASSERT_TRUE(id.has_value());
    ASSERT_EQ(*jobs_->wait(*id, 10s), JobState::Failed);

    auto status = jobs_->status(*id);
    ASSERT_TRUE(status->error.has_value());
    EXPECT_NE(status->error->find("imagenet"), std::string::npos);
}

TEST_F(JobCoordinatorTest, NonStandardExceptionFailsTheJob) {
    {
        auto unit = units_.acquire(unit_);
        ASSERT_TRUE(unit.has_value());
        (*unit)->network().add(std::make_unique<ThrowingLayer>());
    }

    auto id = jobs_->start(unit_, kSmallDataset, kShortTraining);
    ASSERT_TRUE(id.has_value());
    ASSERT_EQ(*jobs_->wait(*id, 10s), JobState::Failed);

    auto status = jobs_->status(*id);
    ASSERT_TRUE(status->error.has_value());
    EXPECT_EQ(*status->error, "unknown error");
    // the borrow ended with the job
    EXPECT_TRUE(units_.remove(unit_).has_value());
}

TEST_F(JobCoordinatorTest, InputSizeMismatchFailsTheJob) {
    auto id = jobs_->start(unit_, {{"num_samples", 10}, {"input_size", 784}}, kShortTraining);
    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(*jobs_->wait(*id, 10s), JobState::Failed);
}

// ── Control ──

TEST_F(JobCoordinatorTest, StopCancelsRunningJob) {
    auto id = start_long();
    ASSERT_TRUE(wait_for_state(id, JobState::Running));

    ASSERT_TRUE(jobs_->stop(id).has_value());
    ASSERT_EQ(*jobs_->wait(id, 10s), JobState::Cancelled);

    auto status = jobs_->status(id);
    EXPECT_LT(status->current_epoch, status->total_epochs);
    EXPECT_EQ(status->history.size(), status->current_epoch);

    // stopping a terminal job is a no-op
    EXPECT_TRUE(jobs_->stop(id).has_value());
    EXPECT_EQ(jobs_->status(id)->state, JobState::Cancelled);
}

TEST_F(JobCoordinatorTest, PauseAndResumeAreStatusOnly) {
    auto id = start_long();
    ASSERT_TRUE(wait_for_state(id, JobState::Running));

    ASSERT_TRUE(jobs_->pause(id).has_value());
    EXPECT_EQ(jobs_->status(id)->state, JobState::Paused);

    // pausing again is ignored
    ASSERT_TRUE(jobs_->pause(id).has_value());
    EXPECT_EQ(jobs_->status(id)->state, JobState::Paused);

    ASSERT_TRUE(jobs_->resume(id).has_value());
    EXPECT_EQ(jobs_->status(id)->state, JobState::Running);

    ASSERT_TRUE(jobs_->pause(id).has_value());
    ASSERT_TRUE(jobs_->stop(id).has_value());
    EXPECT_EQ(*jobs_->wait(id, 10s), JobState::Cancelled);

    // resume of a cancelled job does nothing
    ASSERT_TRUE(jobs_->resume(id).has_value());
    EXPECT_EQ(jobs_->status(id)->state, JobState::Cancelled);
}

TEST_F(JobCoordinatorTest, ControlOfUnknownJobIsNotFound) {
    EXPECT_EQ(jobs_->pause("nope").error().code, ErrorCode::NotFound);
    EXPECT_EQ(jobs_->resume("nope").error().code, ErrorCode::NotFound);
    EXPECT_EQ(jobs_->stop("nope").error().code, ErrorCode::NotFound);
    EXPECT_EQ(jobs_->status("nope").error().code, ErrorCode::NotFound);
    EXPECT_EQ(jobs_->metrics("nope").error().code, ErrorCode::NotFound);
}

TEST_F(JobCoordinatorTest, ExcessJobsWaitInInitializing) {
    make_coordinator({.max_concurrent_jobs = 1, .epoch_yield = 1ms});
    auto first = start_long();
    auto second = start_long();
    ASSERT_TRUE(wait_for_state(first, JobState::Running));
    EXPECT_EQ(jobs_->status(second)->state, JobState::Initializing);
    EXPECT_EQ(jobs_->active_count(), 2u);

    ASSERT_TRUE(jobs_->stop(second).has_value());
    EXPECT_EQ(jobs_->status(second)->state, JobState::Initializing);
    ASSERT_TRUE(jobs_->stop(first).has_value());

    EXPECT_EQ(*jobs_->wait(first, 10s), JobState::Cancelled);
    EXPECT_EQ(*jobs_->wait(second, 10s), JobState::Cancelled);
    EXPECT_EQ(jobs_->status(second)->current_epoch, 0u);
}

// ── Queries ──

TEST_F(JobCoordinatorTest, ListFiltersByState) {
    auto done = jobs_->start(unit_, kSmallDataset, kShortTraining);
    ASSERT_TRUE(done.has_value());
    ASSERT_EQ(*jobs_->wait(*done, 20s), JobState::Completed);
    auto live = start_long();
    ASSERT_TRUE(wait_for_state(live, JobState::Running));

    auto all = jobs_->list();
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[0].id, *done);
    EXPECT_EQ(all[1].id, live);

    auto completed = jobs_->list(JobState::Completed);
    ASSERT_EQ(completed.size(), 1u);
    EXPECT_EQ(completed[0].id, *done);

    auto metrics = jobs_->metrics(live);
    ASSERT_TRUE(metrics.has_value());
    EXPECT_EQ((*metrics)["status"], "running");

    ASSERT_TRUE(jobs_->stop(live).has_value());
    jobs_->wait(live, 10s);
}

TEST_F(JobCoordinatorTest, RemoveOnlyTerminalJobs) {
    auto id = start_long();
    auto live = jobs_->remove(id);
    ASSERT_FALSE(live.has_value());
    EXPECT_EQ(live.error().code, ErrorCode::InvalidState);

    ASSERT_TRUE(jobs_->stop(id).has_value());
    ASSERT_EQ(*jobs_->wait(id, 10s), JobState::Cancelled);
    ASSERT_TRUE(jobs_->remove(id).has_value());
    EXPECT_EQ(jobs_->status(id).error().code, ErrorCode::NotFound);
    EXPECT_EQ(jobs_->remove(id).error().code, ErrorCode::NotFound);
}

TEST_F(JobCoordinatorTest, UnitReleasedAfterTerminalState) {
    auto id = start_long();
    ASSERT_TRUE(wait_for_state(id, JobState::Running));
    EXPECT_EQ(units_.remove(unit_).error().code, ErrorCode::InvalidState);

    ASSERT_TRUE(jobs_->stop(id).has_value());
    ASSERT_EQ(*jobs_->wait(id, 10s), JobState::Cancelled);
    EXPECT_TRUE(units_.remove(unit_).has_value());
}

// ── Progress frames ──

TEST_F(JobCoordinatorTest, PublishesProgressAndStatusFrames) {
    auto connection = std::make_shared<RecordingChannel>();
    broadcaster_.subscribe_all(connection);

    auto id = jobs_->start(unit_, kSmallDataset, kShortTraining);
    ASSERT_TRUE(id.has_value());
    ASSERT_EQ(*jobs_->wait(*id, 20s), JobState::Completed);
    jobs_->shutdown();

    auto frames = connection->frames();
    ASSERT_GE(frames.size(), 2u);
    EXPECT_EQ(frames.front()["type"], "training_status");
    EXPECT_EQ(frames.front()["status"], "running");
    EXPECT_EQ(frames.back()["type"], "training_status");
    EXPECT_EQ(frames.back()["status"], "completed");
    EXPECT_EQ(frames.back()["training_id"], *id);
}

TEST_F(JobCoordinatorTest, SubscriberSeesEpochsInOrder) {
    auto id = start_long();
    auto subscriber = std::make_shared<RecordingChannel>();
    broadcaster_.subscribe(id, subscriber);

    ASSERT_TRUE(wait_for_state(id, JobState::Running));
    std::this_thread::sleep_for(50ms);
    ASSERT_TRUE(jobs_->stop(id).has_value());
    jobs_->wait(id, 10s);
    jobs_->shutdown();

    auto frames = subscriber->frames();
    ASSERT_FALSE(frames.empty());
    int64_t last_epoch = -1;
    for (const auto& frame : frames) {
        if (frame["type"] != "training_progress") continue;
        auto epoch = frame["data"]["current_epoch"].get<int64_t>();
        EXPECT_GE(epoch, last_epoch);
        last_epoch = epoch;
    }
    EXPECT_EQ(frames.back()["type"], "training_status");
    EXPECT_EQ(frames.back()["status"], "cancelled");
}

// ── Shutdown ──

TEST_F(JobCoordinatorTest, ShutdownStopsLiveJobsAndRejectsNewOnes) {
    auto id = start_long();
    ASSERT_TRUE(wait_for_state(id, JobState::Running));
    jobs_->shutdown();
    EXPECT_EQ(jobs_->status(id)->state, JobState::Cancelled);

    auto rejected = jobs_->start(unit_, kSmallDataset, kShortTraining);
    ASSERT_FALSE(rejected.has_value());
    EXPECT_EQ(rejected.error().code, ErrorCode::InvalidState);

    jobs_->shutdown();
}
