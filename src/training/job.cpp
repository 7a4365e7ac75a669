/**
 * @file job.cpp
 * @brief Request parsing and JSON projections for training jobs.
 */

#include "training/job.hpp"

#include <algorithm>
#include <limits>

namespace archetype {

namespace {

/// Unsigned field with a default; InvalidArgument on a negative or non-integer value.
template <typename T>
Result<T> read_unsigned(const nlohmann::json& j, const char* key, T fallback) {
    if (!j.contains(key) || j.at(key).is_null()) return fallback;
    const auto& v = j.at(key);
    if (v.is_number_unsigned()) {
        auto n = v.get<uint64_t>();
        if (n > std::numeric_limits<T>::max()) {
            return Error{ErrorCode::InvalidArgument, std::string{key} + " is out of range"};
        }
        return static_cast<T>(n);
    }
    return Error{ErrorCode::InvalidArgument, std::string{key} + " must be a non-negative integer"};
}

Result<float> read_float(const nlohmann::json& j, const char* key, float fallback) {
    if (!j.contains(key) || j.at(key).is_null()) return fallback;
    const auto& v = j.at(key);
    if (!v.is_number()) {
        return Error{ErrorCode::InvalidArgument, std::string{key} + " must be a number"};
    }
    return v.get<float>();
}

nlohmann::json metrics_json(const JobMetrics& m) {
    return nlohmann::json{
        {"loss", m.loss},
        {"accuracy", m.accuracy},
        {"val_loss", m.val_loss},
        {"val_accuracy", m.val_accuracy}
    };
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Spec Parsing
// ─────────────────────────────────────────────

Result<DatasetSpec> parse_dataset_spec(const nlohmann::json& j) {
    DatasetSpec spec;
    if (j.is_null()) return spec;
    if (!j.is_object()) return Error{ErrorCode::InvalidArgument, "dataset_config must be an object"};

    if (j.contains("type")) {
        if (!j.at("type").is_string()) {
            return Error{ErrorCode::InvalidArgument, "dataset type must be a string"};
        }
        spec.type = j.at("type").get<std::string>();
    }

    auto samples = read_unsigned<size_t>(j, "num_samples", spec.num_samples);
    if (!samples) return samples.error();
    spec.num_samples = *samples;

    if (j.contains("input_size") && !j.at("input_size").is_null()) {
        auto v = read_unsigned<size_t>(j, "input_size", 0);
        if (!v) return v.error();
        spec.input_size = *v;
    }
    if (j.contains("num_classes") && !j.at("num_classes").is_null()) {
        auto v = read_unsigned<size_t>(j, "num_classes", 0);
        if (!v) return v.error();
        spec.num_classes = *v;
    }

    auto seed = read_unsigned<uint32_t>(j, "seed", spec.seed);
    if (!seed) return seed.error();
    spec.seed = *seed;
    return spec;
}

Result<TrainingSpec> parse_training_spec(const nlohmann::json& j, uint32_t default_epochs,
                                         uint32_t default_batch_size, Logger& logger) {
    TrainingSpec spec;
    spec.epochs = default_epochs;
    spec.batch_size = default_batch_size;
    if (j.is_null()) return spec;
    if (!j.is_object()) return Error{ErrorCode::InvalidArgument, "training_config must be an object"};

    auto epochs = read_unsigned<uint32_t>(j, "epochs", spec.epochs);
    if (!epochs) return epochs.error();
    if (*epochs == 0) return Error{ErrorCode::InvalidArgument, "epochs must be at least 1"};
    spec.epochs = *epochs;

    auto batch = read_unsigned<uint32_t>(j, "batch_size", spec.batch_size);
    if (!batch) return batch.error();
    if (*batch == 0) return Error{ErrorCode::InvalidArgument, "batch_size must be at least 1"};
    spec.batch_size = *batch;

    if (j.contains("optimizer") && j.at("optimizer").is_string()) {
        auto name = j.at("optimizer").get<std::string>();
        if (auto kind = parse_optimizer(name)) {
            spec.optimizer.kind = *kind;
        } else {
            logger.warn("Unknown optimizer '" + name + "', using adam");
        }
    }
    if (j.contains("loss_function") && j.at("loss_function").is_string()) {
        auto name = j.at("loss_function").get<std::string>();
        if (auto kind = parse_loss(name)) {
            spec.loss = *kind;
        } else {
            logger.warn("Unknown loss function '" + name + "', using cross_entropy");
        }
    }

    auto& opt = spec.optimizer;
    for (auto [key, field] : {std::pair{"learning_rate", &opt.learning_rate},
                              std::pair{"weight_decay", &opt.weight_decay},
                              std::pair{"momentum", &opt.momentum}}) {
        auto v = read_float(j, key, *field);
        if (!v) return v.error();
        *field = *v;
    }
    if (opt.learning_rate <= 0.0f) {
        return Error{ErrorCode::InvalidArgument, "learning_rate must be positive"};
    }
    if (opt.weight_decay < 0.0f) {
        return Error{ErrorCode::InvalidArgument, "weight_decay must not be negative"};
    }
    return spec;
}

Result<ValidationSpec> parse_validation_spec(const nlohmann::json& j) {
    ValidationSpec spec;
    if (!j.is_object()) return Error{ErrorCode::InvalidArgument, "validation_config must be an object"};

    auto samples = read_unsigned<size_t>(j, "num_samples", spec.num_samples);
    if (!samples) return samples.error();
    if (*samples == 0) return Error{ErrorCode::InvalidArgument, "validation num_samples must be at least 1"};
    spec.num_samples = *samples;

    auto seed = read_unsigned<uint32_t>(j, "seed", spec.seed);
    if (!seed) return seed.error();
    spec.seed = *seed;
    return spec;
}

// ─────────────────────────────────────────────
// JobRecord
// ─────────────────────────────────────────────

double JobRecord::elapsed_seconds(SteadyTime now) const noexcept {
    if (finished_after_s) return *finished_after_s;
    if (started == SteadyTime{}) return 0.0;
    return std::chrono::duration<double>(now - started).count();
}

double JobRecord::progress() const noexcept {
    if (total_epochs == 0) return 0.0;
    return std::min(1.0, static_cast<double>(current_epoch) / static_cast<double>(total_epochs));
}

nlohmann::json to_snapshot_json(const JobRecord& job, SnapshotDetail detail) {
    nlohmann::json j{
        {"training_id", job.id},
        {"model_id", job.unit_id},
        {"status", to_string(job.state)},
        {"current_epoch", job.current_epoch},
        {"total_epochs", job.total_epochs},
        {"metrics", metrics_json(job.metrics)},
        {"start_time", to_unix_seconds(job.start_time)},
        {"estimated_time_remaining", job.eta_seconds}
    };

    if (job.error) j["error"] = *job.error;
    if (detail == SnapshotDetail::Summary) return j;

    auto history = nlohmann::json::array();
    for (const auto& e : job.history) {
        nlohmann::json row{{"epoch", e.epoch}, {"loss", e.loss}, {"accuracy", e.accuracy}};
        row["val_loss"] = e.val_loss ? nlohmann::json(*e.val_loss) : nlohmann::json();
        row["val_accuracy"] = e.val_accuracy ? nlohmann::json(*e.val_accuracy) : nlohmann::json();
        history.push_back(std::move(row));
    }
    j["history"] = std::move(history);
    j["config"] = job.training_config;
    j["dataset_config"] = job.dataset_config;
    j["validation_config"] = job.validation_config;
    return j;
}

nlohmann::json to_metrics_json(const JobRecord& job, SteadyTime now) {
    return nlohmann::json{
        {"training_id", job.id},
        {"current_metrics", metrics_json(job.metrics)},
        {"progress", job.progress()},
        {"elapsed_time", job.elapsed_seconds(now)},
        {"estimated_remaining", job.eta_seconds},
        {"status", to_string(job.state)}
    };
}

nlohmann::json make_progress_frame(const JobRecord& job) {
    return nlohmann::json{
        {"type", "training_progress"},
        {"training_id", job.id},
        {"data", to_snapshot_json(job, SnapshotDetail::Summary)}
    };
}

nlohmann::json make_status_frame(const JobRecord& job) {
    nlohmann::json frame{
        {"type", "training_status"},
        {"training_id", job.id},
        {"status", to_string(job.state)},
        {"current_epoch", job.current_epoch}
    };
    if (job.error) frame["error"] = *job.error;
    return frame;
}

}  // namespace archetype
