/**
 * @file job_coordinator.hpp
 * @brief JobCoordinator: training job state machine and execution.
 *
 * States:
 *   INITIALIZING → RUNNING → {PAUSED ⇄ RUNNING} → {COMPLETED | CANCELLED | FAILED}
 *   RUNNING | PAUSED → STOPPING → CANCELLED
 *
 * Each job runs as one task on a shared ThreadPool sized by
 * max_concurrent_jobs; further jobs wait in INITIALIZING. The task checks for
 * a stop request before every epoch and every batch. PAUSED is reported in
 * status queries only; the task keeps training through it.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "executor/thread_pool.hpp"
#include "model/unit_registry.hpp"
#include "training/job.hpp"
#include "training/progress_broadcaster.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <condition_variable>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <stop_token>
#include <unordered_map>
#include <vector>

namespace archetype {

class MetricsCollector;

class JobCoordinator {
public:
    struct Options {
        uint32_t max_concurrent_jobs = 4;
        uint32_t default_epochs = 100;
        uint32_t default_batch_size = 32;
        std::chrono::milliseconds epoch_yield{10};
    };

    JobCoordinator(UnitRegistry& units, ProgressBroadcaster& broadcaster, Logger& logger,
                   Options options, MetricsCollector* metrics = nullptr);
    ~JobCoordinator();

    JobCoordinator(const JobCoordinator&) = delete;
    JobCoordinator& operator=(const JobCoordinator&) = delete;

    /**
     * @brief Create a job and queue its execution task. Returns immediately.
     *
     * NotFound for an unknown unit, InvalidArgument for a malformed
     * training or validation config. Dataset problems surface later as FAILED.
     */
    Result<JobId> start(const UnitId& unit, const nlohmann::json& dataset_config,
                        const nlohmann::json& training_config,
                        const nlohmann::json& validation_config = nullptr);

    // ── Control (invalid transitions are logged no-ops) ──
    Result<void> pause(const JobId& id);
    Result<void> resume(const JobId& id);
    Result<void> stop(const JobId& id);

    [[nodiscard]] Result<JobRecord> status(const JobId& id) const;

    /// Creation order, optionally filtered by state.
    [[nodiscard]] std::vector<JobRecord> list(std::optional<JobState> filter = std::nullopt) const;

    [[nodiscard]] Result<nlohmann::json> metrics(const JobId& id) const;

    /// Forget a terminal job. InvalidState while it is still live.
    Result<void> remove(const JobId& id);

    /// Block until the job is terminal or @p timeout passes; returns the state seen last.
    Result<JobState> wait(const JobId& id, std::chrono::milliseconds timeout) const;

    /// Stop every live job and wait for all execution tasks to finish.
    void shutdown();

    [[nodiscard]] size_t active_count() const;

private:
    struct JobSlot {
        mutable std::mutex mutex;
        mutable std::condition_variable terminal_cv;
        JobRecord record;
        std::stop_source stop;
        std::future<void> done;
    };

    struct RunPlan {
        DatasetSpec dataset;
        TrainingSpec training;
        std::optional<ValidationSpec> validation;
    };

    void run_job(std::shared_ptr<JobSlot> slot, std::shared_ptr<TrainableUnit> unit, RunPlan plan,
                 std::stop_token pool_stop);

    /// Runs the epoch loop; returns false when interrupted by a stop request.
    bool train_epochs(JobSlot& slot, TrainableUnit& unit, const RunPlan& plan,
                      const std::stop_token& pool_stop);

    void finish(JobSlot& slot, JobState final_state, std::optional<std::string> error = std::nullopt);
    void announce(const JobRecord& snapshot);

    [[nodiscard]] std::shared_ptr<JobSlot> find(const JobId& id) const;
    [[nodiscard]] static bool stop_requested(const JobSlot& slot, const std::stop_token& pool_stop);

    UnitRegistry& units_;
    ProgressBroadcaster& broadcaster_;
    Logger& logger_;
    Options options_;
    MetricsCollector* metrics_;

    mutable std::shared_mutex jobs_mutex_;
    std::unordered_map<JobId, std::shared_ptr<JobSlot>> jobs_;
    std::vector<JobId> order_;
    bool accepting_{true};

    ThreadPool pool_;
};

}  // namespace archetype
