/**
 * @file test_job.cpp
 * @brief Unit tests for training request parsing and job JSON projections.
 */

#include "training/job.hpp"
#include "telemetry/json_sink.hpp"

#include <gtest/gtest.h>

using namespace archetype;
using json = nlohmann::json;

// ─────────────────────────────────────────────
// Request parsing
// ─────────────────────────────────────────────

TEST(DatasetSpecTest, Defaults) {
    auto spec = parse_dataset_spec(json::object());
    ASSERT_TRUE(spec.has_value());
    EXPECT_EQ(spec->type, "dummy");
    EXPECT_EQ(spec->num_samples, 1000u);
    EXPECT_FALSE(spec->input_size.has_value());
    EXPECT_FALSE(spec->num_classes.has_value());

    EXPECT_TRUE(parse_dataset_spec(json()).has_value());
}

TEST(DatasetSpecTest, ReadsFields) {
    auto spec = parse_dataset_spec({{"type", "dummy"}, {"num_samples", 64},
                                    {"input_size", 4}, {"num_classes", 3}, {"seed", 9}});
    ASSERT_TRUE(spec.has_value());
    EXPECT_EQ(spec->num_samples, 64u);
    EXPECT_EQ(*spec->input_size, 4u);
    EXPECT_EQ(*spec->num_classes, 3u);
    EXPECT_EQ(spec->seed, 9u);
}

TEST(DatasetSpecTest, RejectsBadTypes) {
    EXPECT_FALSE(parse_dataset_spec({{"num_samples", -5}}).has_value());
    EXPECT_FALSE(parse_dataset_spec({{"num_samples", "many"}}).has_value());
    EXPECT_FALSE(parse_dataset_spec({{"type", 3}}).has_value());
    EXPECT_FALSE(parse_dataset_spec(json::array()).has_value());
}

class TrainingSpecTest : public ::testing::Test {
protected:
    Logger logger_{std::make_unique<NullSink>()};
};

TEST_F(TrainingSpecTest, DefaultsComeFromConfig) {
    auto spec = parse_training_spec(json::object(), 7, 16, logger_);
    ASSERT_TRUE(spec.has_value());
    EXPECT_EQ(spec->epochs, 7u);
    EXPECT_EQ(spec->batch_size, 16u);
    EXPECT_EQ(spec->optimizer.kind, OptimizerKind::Adam);
    EXPECT_EQ(spec->loss, LossKind::CrossEntropy);
}

TEST_F(TrainingSpecTest, ReadsOptimizerAndLoss) {
    auto spec = parse_training_spec({{"epochs", 3}, {"batch_size", 10}, {"optimizer", "sgd"},
                                     {"loss_function", "mse"}, {"learning_rate", 0.1},
                                     {"momentum", 0.5}},
                                    100, 32, logger_);
    ASSERT_TRUE(spec.has_value());
    EXPECT_EQ(spec->epochs, 3u);
    EXPECT_EQ(spec->batch_size, 10u);
    EXPECT_EQ(spec->optimizer.kind, OptimizerKind::Sgd);
    EXPECT_EQ(spec->loss, LossKind::Mse);
    EXPECT_FLOAT_EQ(spec->optimizer.learning_rate, 0.1f);
    EXPECT_FLOAT_EQ(spec->optimizer.momentum, 0.5f);
}

TEST_F(TrainingSpecTest, UnknownNamesFallBack) {
    auto spec = parse_training_spec({{"optimizer", "lbfgs"}, {"loss_function", "hinge"}},
                                    10, 32, logger_);
    ASSERT_TRUE(spec.has_value());
    EXPECT_EQ(spec->optimizer.kind, OptimizerKind::Adam);
    EXPECT_EQ(spec->loss, LossKind::CrossEntropy);
}

TEST_F(TrainingSpecTest, RejectsZeroAndNegative) {
    auto zero_epochs = parse_training_spec({{"epochs", 0}}, 10, 32, logger_);
    ASSERT_FALSE(zero_epochs.has_value());
    EXPECT_EQ(zero_epochs.error().code, ErrorCode::InvalidArgument);

    EXPECT_FALSE(parse_training_spec({{"batch_size", 0}}, 10, 32, logger_).has_value());
    EXPECT_FALSE(parse_training_spec({{"epochs", -1}}, 10, 32, logger_).has_value());
    EXPECT_FALSE(parse_training_spec({{"learning_rate", 0.0}}, 10, 32, logger_).has_value());
    EXPECT_FALSE(parse_training_spec({{"learning_rate", "fast"}}, 10, 32, logger_).has_value());
}

TEST(ValidationSpecTest, RequiresObjectAndSamples) {
    auto spec = parse_validation_spec({{"num_samples", 50}});
    ASSERT_TRUE(spec.has_value());
    EXPECT_EQ(spec->num_samples, 50u);

    EXPECT_FALSE(parse_validation_spec(json()).has_value());
    EXPECT_FALSE(parse_validation_spec({{"num_samples", 0}}).has_value());
}

// ─────────────────────────────────────────────
// Projections
// ─────────────────────────────────────────────

namespace {

JobRecord sample_job() {
    JobRecord job;
    job.id = "job-1";
    job.unit_id = "unit-1";
    job.state = JobState::Running;
    job.current_epoch = 2;
    job.total_epochs = 4;
    job.metrics.loss = 0.5;
    job.metrics.accuracy = 80.0;
    job.training_config = {{"epochs", 4}};
    job.history.push_back(EpochRecord{1, 0.9, 50.0, std::nullopt, std::nullopt});
    job.history.push_back(EpochRecord{2, 0.5, 80.0, 0.6, 75.0});
    return job;
}

}  // namespace

TEST(JobRecordTest, ProgressAndElapsed) {
    auto job = sample_job();
    EXPECT_DOUBLE_EQ(job.progress(), 0.5);
    EXPECT_DOUBLE_EQ(job.elapsed_seconds(std::chrono::steady_clock::now()), 0.0);

    job.started = std::chrono::steady_clock::now() - std::chrono::seconds(3);
    EXPECT_GE(job.elapsed_seconds(std::chrono::steady_clock::now()), 3.0);

    job.finished_after_s = 1.25;
    EXPECT_DOUBLE_EQ(job.elapsed_seconds(std::chrono::steady_clock::now()), 1.25);

    job.total_epochs = 0;
    EXPECT_DOUBLE_EQ(job.progress(), 0.0);
}

TEST(JobRecordTest, SnapshotJson) {
    auto job = sample_job();
    auto j = to_snapshot_json(job, SnapshotDetail::Summary);
    EXPECT_EQ(j["training_id"], "job-1");
    EXPECT_EQ(j["model_id"], "unit-1");
    EXPECT_EQ(j["status"], "running");
    EXPECT_EQ(j["current_epoch"], 2);
    EXPECT_EQ(j["total_epochs"], 4);
    EXPECT_DOUBLE_EQ(j["metrics"]["accuracy"].get<double>(), 80.0);
    EXPECT_FALSE(j.contains("history"));
    EXPECT_FALSE(j.contains("config"));
    EXPECT_FALSE(j.contains("error"));

    auto full = to_snapshot_json(job, SnapshotDetail::Full);
    ASSERT_EQ(full["history"].size(), 2u);
    EXPECT_TRUE(full["history"][0]["val_loss"].is_null());
    EXPECT_DOUBLE_EQ(full["history"][1]["val_accuracy"].get<double>(), 75.0);
    EXPECT_EQ(full["config"]["epochs"], 4);
    EXPECT_TRUE(full["validation_config"].is_null());
}

TEST(JobRecordTest, ProgressFrameSizeIndependentOfHistory) {
    auto job = sample_job();
    job.history.assign(1, EpochRecord{1, 0.5, 50.0, std::nullopt, std::nullopt});
    job.current_epoch = 1;
    job.total_epochs = 10000;
    const auto early = make_progress_frame(job).dump().size();

    for (uint32_t e = 2; e <= 10000; ++e) {
        job.history.push_back(EpochRecord{e, 0.5, 50.0, std::nullopt, std::nullopt});
    }
    job.current_epoch = 10000;
    const auto late = make_progress_frame(job).dump().size();

    EXPECT_LE(late, early + 8);
    EXPECT_EQ(to_snapshot_json(job, SnapshotDetail::Full)["history"].size(), 10000u);
}

TEST(JobRecordTest, MetricsJson) {
    auto job = sample_job();
    auto j = to_metrics_json(job, std::chrono::steady_clock::now());
    EXPECT_EQ(j["training_id"], "job-1");
    EXPECT_DOUBLE_EQ(j["progress"].get<double>(), 0.5);
    EXPECT_EQ(j["status"], "running");
    EXPECT_TRUE(j.contains("current_metrics"));
    EXPECT_TRUE(j.contains("elapsed_time"));
    EXPECT_TRUE(j.contains("estimated_remaining"));
}

TEST(JobRecordTest, Frames) {
    auto job = sample_job();
    auto progress = make_progress_frame(job);
    EXPECT_EQ(progress["type"], "training_progress");
    EXPECT_EQ(progress["training_id"], "job-1");
    EXPECT_EQ(progress["data"]["current_epoch"], 2);

    job.state = JobState::Failed;
    job.error = "boom";
    auto status = make_status_frame(job);
    EXPECT_EQ(status["type"], "training_status");
    EXPECT_EQ(status["status"], "failed");
    EXPECT_EQ(status["error"], "boom");
}
