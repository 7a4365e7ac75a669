/**
 * @file job.hpp
 * @brief Training job record, request specs and their JSON projections.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "engine/optimizer.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace archetype {

// ─────────────────────────────────────────────
// Request Specs
// ─────────────────────────────────────────────

struct DatasetSpec {
    std::string type = "dummy";
    size_t num_samples = 1000;
    std::optional<size_t> input_size;     ///< must match the unit when given
    std::optional<size_t> num_classes;    ///< defaults to the unit's output width
    uint32_t seed = 42;
};

struct TrainingSpec {
    uint32_t epochs = 100;
    uint32_t batch_size = 32;
    OptimizerOptions optimizer;
    LossKind loss = LossKind::CrossEntropy;
};

struct ValidationSpec {
    size_t num_samples = 200;
    uint32_t seed = 7;
};

/// Type errors are InvalidArgument; unknown dataset types are left for the job to reject.
Result<DatasetSpec> parse_dataset_spec(const nlohmann::json& j);

/**
 * @brief Read epochs, batch_size, optimizer, loss_function and optimizer knobs.
 *
 * Missing fields take the supplied defaults; unknown optimizer or loss names
 * fall back to adam / cross_entropy with a warning.
 */
Result<TrainingSpec> parse_training_spec(const nlohmann::json& j, uint32_t default_epochs,
                                         uint32_t default_batch_size, Logger& logger);

Result<ValidationSpec> parse_validation_spec(const nlohmann::json& j);

// ─────────────────────────────────────────────
// Job Record
// ─────────────────────────────────────────────

struct JobMetrics {
    double loss{0.0};
    double accuracy{0.0};        ///< percent
    double val_loss{0.0};
    double val_accuracy{0.0};    ///< percent
};

struct EpochRecord {
    uint32_t epoch{0};
    double loss{0.0};
    double accuracy{0.0};
    std::optional<double> val_loss;
    std::optional<double> val_accuracy;
};

/**
 * @brief Everything known about one training run.
 *
 * Mutated only by the job's execution task and by control calls, always
 * under the owning slot's mutex.
 */
struct JobRecord {
    JobId id;
    UnitId unit_id;
    JobState state{JobState::Initializing};
    uint32_t current_epoch{0};
    uint32_t total_epochs{0};
    JobMetrics metrics;
    Timestamp start_time{};
    SteadyTime started{};                    ///< unset until the task starts running
    double eta_seconds{0.0};
    std::optional<double> finished_after_s;   ///< elapsed time frozen at the terminal state

    nlohmann::json training_config = nlohmann::json::object();
    nlohmann::json dataset_config = nlohmann::json::object();
    nlohmann::json validation_config;         ///< null when not supplied

    std::vector<EpochRecord> history;
    std::optional<std::string> error;

    [[nodiscard]] double elapsed_seconds(SteadyTime now) const noexcept;
    [[nodiscard]] double progress() const noexcept;
};

/// Summary is fixed-size; Full adds the per-epoch history and the request configs.
enum class SnapshotDetail : uint8_t { Summary, Full };

[[nodiscard]] nlohmann::json to_snapshot_json(const JobRecord& job, SnapshotDetail detail);

/// {"training_id", "current_metrics", "progress", "elapsed_time", "estimated_remaining", "status"}
[[nodiscard]] nlohmann::json to_metrics_json(const JobRecord& job, SteadyTime now);

/// {"type": "training_progress", "training_id", "data": <summary snapshot>}
[[nodiscard]] nlohmann::json make_progress_frame(const JobRecord& job);

/// {"type": "training_status", "training_id", "status", "error"?}
[[nodiscard]] nlohmann::json make_status_frame(const JobRecord& job);

}  // namespace archetype
