/**
 * @file job_coordinator.cpp
 * @brief JobCoordinator implementation.
 */

#include "training/job_coordinator.hpp"
#include "training/dataset.hpp"
#include "telemetry/metrics_collector.hpp"

#include <algorithm>
#include <stdexcept>
#include <thread>

namespace archetype {

JobCoordinator::JobCoordinator(UnitRegistry& units, ProgressBroadcaster& broadcaster,
                               Logger& logger, Options options, MetricsCollector* metrics)
    : units_(units)
    , broadcaster_(broadcaster)
    , logger_(logger)
    , options_(options)
    , metrics_(metrics)
    , pool_(options.max_concurrent_jobs == 0 ? 1 : options.max_concurrent_jobs) {}

JobCoordinator::~JobCoordinator() {
    shutdown();
}

// ─────────────────────────────────────────────
// Start
// ─────────────────────────────────────────────

Result<JobId> JobCoordinator::start(const UnitId& unit_id, const nlohmann::json& dataset_config,
                                    const nlohmann::json& training_config,
                                    const nlohmann::json& validation_config) {
    auto unit = units_.acquire(unit_id);
    if (!unit) return unit.error();

    RunPlan plan;
    auto dataset = parse_dataset_spec(dataset_config);
    if (!dataset) return dataset.error();
    plan.dataset = *dataset;

    auto training = parse_training_spec(training_config, options_.default_epochs,
                                        options_.default_batch_size, logger_);
    if (!training) return training.error();
    plan.training = *training;

    if (!validation_config.is_null()) {
        auto validation = parse_validation_spec(validation_config);
        if (!validation) return validation.error();
        plan.validation = *validation;
    }

    auto slot = std::make_shared<JobSlot>();
    auto& record = slot->record;
    record.id = generate_uuid();
    record.unit_id = unit_id;
    record.total_epochs = plan.training.epochs;
    record.start_time = std::chrono::system_clock::now();
    record.training_config = training_config.is_object() ? training_config : nlohmann::json::object();
    record.dataset_config = dataset_config.is_object() ? dataset_config : nlohmann::json::object();
    record.validation_config = validation_config;
    const JobId id = record.id;
    const uint32_t epochs = record.total_epochs;

    {
        std::unique_lock lock(jobs_mutex_);
        if (!accepting_) {
            return Error{ErrorCode::InvalidState, "Training service is shutting down"};
        }
        slot->done = pool_.submit_cancellable(
            [this, slot, unit = std::move(*unit), plan = std::move(plan)](std::stop_token stop) mutable {
                run_job(std::move(slot), std::move(unit), std::move(plan), stop);
            });
        jobs_.emplace(id, slot);
        order_.push_back(id);
    }

    logger_.log(LogLevel::Info, "Started training",
                {{"training_id", id}, {"model_id", unit_id}, {"epochs", epochs}});
    if (metrics_) metrics_->record_job_event(id, unit_id, JobState::Initializing, 0);
    return id;
}

// ─────────────────────────────────────────────
// Execution Task
// ─────────────────────────────────────────────

bool JobCoordinator::stop_requested(const JobSlot& slot, const std::stop_token& pool_stop) {
    return slot.stop.stop_requested() || pool_stop.stop_requested();
}

void JobCoordinator::run_job(std::shared_ptr<JobSlot> slot, std::shared_ptr<TrainableUnit> unit,
                             RunPlan plan, std::stop_token pool_stop) {
    JobRecord snapshot;
    {
        std::lock_guard lock(slot->mutex);
        if (stop_requested(*slot, pool_stop)) {
            slot->record.state = JobState::Stopping;
        } else {
            slot->record.state = JobState::Running;
            slot->record.started = std::chrono::steady_clock::now();
        }
        snapshot = slot->record;
    }
    if (snapshot.state == JobState::Stopping) {
        unit.reset();
        finish(*slot, JobState::Cancelled);
        return;
    }
    announce(snapshot);

    try {
        bool completed = train_epochs(*slot, *unit, plan, pool_stop);
        // The borrow must end before the job is observably terminal
        unit.reset();
        finish(*slot, completed ? JobState::Completed : JobState::Cancelled);
    } catch (const std::exception& e) {
        unit.reset();
        finish(*slot, JobState::Failed, std::string{e.what()});
    } catch (...) {
        unit.reset();
        finish(*slot, JobState::Failed, std::string{"unknown error"});
    }
}

bool JobCoordinator::train_epochs(JobSlot& slot, TrainableUnit& unit, const RunPlan& plan,
                                  const std::stop_token& pool_stop) {
    auto dataset = make_dataset(plan.dataset, unit);
    if (!dataset) throw std::runtime_error(dataset.error().message);

    std::optional<SyntheticDataset> validation;
    if (plan.validation) {
        auto made = make_validation_set(*plan.validation, plan.dataset, unit);
        if (!made) throw std::runtime_error(made.error().message);
        validation = std::move(*made);
    }

    Optimizer optimizer(plan.training.optimizer);
    std::mt19937 shuffle_rng(plan.dataset.seed);
    const size_t batch_size = plan.training.batch_size;
    const size_t num_batches = dataset->num_batches(batch_size);
    const uint32_t total = plan.training.epochs;

    for (uint32_t epoch = 1; epoch <= total; ++epoch) {
        if (stop_requested(slot, pool_stop)) return false;

        dataset->shuffle(shuffle_rng);
        double loss_sum = 0.0;
        size_t correct = 0;
        size_t seen = 0;
        for (size_t b = 0; b < num_batches; ++b) {
            if (stop_requested(slot, pool_stop)) return false;
            auto batch = dataset->batch(b, batch_size);
            auto step = unit.train_step(batch.inputs, batch.labels, optimizer, plan.training.loss);
            loss_sum += step.loss;
            correct += step.correct;
            seen += batch.labels.size();
        }

        EpochRecord row;
        row.epoch = epoch;
        row.loss = num_batches > 0 ? loss_sum / static_cast<double>(num_batches) : 0.0;
        row.accuracy = seen > 0 ? 100.0 * static_cast<double>(correct) / static_cast<double>(seen) : 0.0;

        if (validation) {
            double val_loss = 0.0;
            size_t val_correct = 0;
            size_t val_batches = validation->num_batches(batch_size);
            for (size_t b = 0; b < val_batches; ++b) {
                auto batch = validation->batch(b, batch_size);
                auto eval = unit.evaluate(batch.inputs, batch.labels, plan.training.loss);
                val_loss += eval.loss;
                val_correct += eval.correct;
            }
            row.val_loss = val_batches > 0 ? val_loss / static_cast<double>(val_batches) : 0.0;
            row.val_accuracy = 100.0 * static_cast<double>(val_correct)
                             / static_cast<double>(validation->size());
        }

        nlohmann::json frame;
        {
            std::lock_guard lock(slot.mutex);
            auto& record = slot.record;
            record.current_epoch = epoch;
            record.metrics.loss = row.loss;
            record.metrics.accuracy = row.accuracy;
            if (row.val_loss) record.metrics.val_loss = *row.val_loss;
            if (row.val_accuracy) record.metrics.val_accuracy = *row.val_accuracy;
            record.history.push_back(row);

            double elapsed = record.elapsed_seconds(std::chrono::steady_clock::now());
            record.eta_seconds = elapsed / epoch * static_cast<double>(total - epoch);
            frame = make_progress_frame(record);
        }
        broadcaster_.publish(slot.record.id, frame);

        if (epoch % 10 == 0 || epoch == total) {
            logger_.log(LogLevel::Debug, "Epoch completed",
                        {{"training_id", slot.record.id}, {"epoch", epoch}, {"total_epochs", total},
                         {"loss", row.loss}, {"accuracy", row.accuracy}});
        }

        if (options_.epoch_yield.count() > 0) {
            std::this_thread::sleep_for(options_.epoch_yield);
        }
    }
    return !stop_requested(slot, pool_stop);
}

void JobCoordinator::finish(JobSlot& slot, JobState final_state, std::optional<std::string> error) {
    JobRecord snapshot;
    {
        std::lock_guard lock(slot.mutex);
        auto& record = slot.record;
        auto now = std::chrono::steady_clock::now();
        record.finished_after_s = record.elapsed_seconds(now);
        record.state = final_state;
        if (final_state == JobState::Completed) record.eta_seconds = 0.0;
        if (error) record.error = std::move(error);
        snapshot = record;
    }
    slot.terminal_cv.notify_all();

    broadcaster_.publish(snapshot.id, make_progress_frame(snapshot));
    announce(snapshot);

    nlohmann::json fields{{"training_id", snapshot.id}, {"model_id", snapshot.unit_id},
                          {"epoch", snapshot.current_epoch},
                          {"elapsed_s", snapshot.finished_after_s.value_or(0.0)}};
    switch (final_state) {
        case JobState::Completed:
            logger_.log(LogLevel::Info, "Training completed", fields);
            break;
        case JobState::Cancelled:
            logger_.log(LogLevel::Info, "Training cancelled", fields);
            break;
        default:
            fields["error"] = snapshot.error.value_or("unknown error");
            logger_.log(LogLevel::Error, "Training failed", fields);
            break;
    }
}

// Job subscribers get the status frame after the last progress frame;
// connection-wide channels see every state change.
void JobCoordinator::announce(const JobRecord& snapshot) {
    auto frame = make_status_frame(snapshot);
    if (is_terminal(snapshot.state)) broadcaster_.publish(snapshot.id, frame);
    broadcaster_.broadcast(frame);
    if (metrics_) {
        metrics_->record_job_event(snapshot.id, snapshot.unit_id, snapshot.state,
                                   snapshot.current_epoch);
    }
}

// ─────────────────────────────────────────────
// Control
// ─────────────────────────────────────────────

Result<void> JobCoordinator::pause(const JobId& id) {
    auto slot = find(id);
    if (!slot) return Error{ErrorCode::NotFound, "Training not found: " + id};

    JobRecord snapshot;
    {
        std::lock_guard lock(slot->mutex);
        if (slot->record.state != JobState::Running) {
            logger_.warn("Ignoring pause of training " + id + " in state "
                         + std::string{to_string(slot->record.state)});
            return {};
        }
        slot->record.state = JobState::Paused;
        snapshot = slot->record;
    }
    logger_.info("Paused training " + id);
    announce(snapshot);
    return {};
}

Result<void> JobCoordinator::resume(const JobId& id) {
    auto slot = find(id);
    if (!slot) return Error{ErrorCode::NotFound, "Training not found: " + id};

    JobRecord snapshot;
    {
        std::lock_guard lock(slot->mutex);
        if (slot->record.state != JobState::Paused) {
            logger_.warn("Ignoring resume of training " + id + " in state "
                         + std::string{to_string(slot->record.state)});
            return {};
        }
        slot->record.state = JobState::Running;
        snapshot = slot->record;
    }
    logger_.info("Resumed training " + id);
    announce(snapshot);
    return {};
}

Result<void> JobCoordinator::stop(const JobId& id) {
    auto slot = find(id);
    if (!slot) return Error{ErrorCode::NotFound, "Training not found: " + id};

    JobRecord snapshot;
    {
        std::lock_guard lock(slot->mutex);
        auto state = slot->record.state;
        if (is_terminal(state) || state == JobState::Stopping) {
            logger_.warn("Ignoring stop of training " + id + " in state "
                         + std::string{to_string(state)});
            return {};
        }
        // A queued job stays INITIALIZING until its task observes the request
        if (state != JobState::Initializing) slot->record.state = JobState::Stopping;
        slot->stop.request_stop();
        snapshot = slot->record;
    }
    logger_.info("Stopping training " + id);
    if (snapshot.state == JobState::Stopping) announce(snapshot);
    return {};
}

// ─────────────────────────────────────────────
// Queries
// ─────────────────────────────────────────────

std::shared_ptr<JobCoordinator::JobSlot> JobCoordinator::find(const JobId& id) const {
    std::shared_lock lock(jobs_mutex_);
    auto it = jobs_.find(id);
    return it == jobs_.end() ? nullptr : it->second;
}

Result<JobRecord> JobCoordinator::status(const JobId& id) const {
    auto slot = find(id);
    if (!slot) return Error{ErrorCode::NotFound, "Training not found: " + id};
    std::lock_guard lock(slot->mutex);
    return slot->record;
}

std::vector<JobRecord> JobCoordinator::list(std::optional<JobState> filter) const {
    std::vector<std::shared_ptr<JobSlot>> slots;
    {
        std::shared_lock lock(jobs_mutex_);
        slots.reserve(order_.size());
        for (const auto& id : order_) slots.push_back(jobs_.at(id));
    }

    std::vector<JobRecord> out;
    for (const auto& slot : slots) {
        std::lock_guard lock(slot->mutex);
        if (!filter || slot->record.state == *filter) out.push_back(slot->record);
    }
    return out;
}

Result<nlohmann::json> JobCoordinator::metrics(const JobId& id) const {
    auto slot = find(id);
    if (!slot) return Error{ErrorCode::NotFound, "Training not found: " + id};
    std::lock_guard lock(slot->mutex);
    return to_metrics_json(slot->record, std::chrono::steady_clock::now());
}

Result<void> JobCoordinator::remove(const JobId& id) {
    {
        std::unique_lock lock(jobs_mutex_);
        auto it = jobs_.find(id);
        if (it == jobs_.end()) return Error{ErrorCode::NotFound, "Training not found: " + id};
        {
            std::lock_guard slot_lock(it->second->mutex);
            if (!is_terminal(it->second->record.state)) {
                return Error{ErrorCode::InvalidState,
                             "Training " + id + " is still "
                             + std::string{to_string(it->second->record.state)}};
            }
        }
        jobs_.erase(it);
        order_.erase(std::remove(order_.begin(), order_.end(), id), order_.end());
    }
    broadcaster_.drop_job(id);
    logger_.info("Removed training " + id);
    return {};
}

Result<JobState> JobCoordinator::wait(const JobId& id, std::chrono::milliseconds timeout) const {
    auto slot = find(id);
    if (!slot) return Error{ErrorCode::NotFound, "Training not found: " + id};
    std::unique_lock lock(slot->mutex);
    slot->terminal_cv.wait_for(lock, timeout, [&] { return is_terminal(slot->record.state); });
    return slot->record.state;
}

size_t JobCoordinator::active_count() const {
    size_t live = 0;
    for (const auto& job : list()) {
        if (!is_terminal(job.state)) ++live;
    }
    return live;
}

// ─────────────────────────────────────────────
// Shutdown
// ─────────────────────────────────────────────

void JobCoordinator::shutdown() {
    std::vector<std::pair<JobId, std::shared_ptr<JobSlot>>> slots;
    {
        std::unique_lock lock(jobs_mutex_);
        if (!accepting_) return;
        accepting_ = false;
        for (const auto& id : order_) slots.emplace_back(id, jobs_.at(id));
    }

    size_t stopped = 0;
    for (const auto& [id, slot] : slots) {
        bool live = false;
        {
            std::lock_guard lock(slot->mutex);
            live = !is_terminal(slot->record.state);
        }
        if (live) {
            auto result = stop(id);
            if (!result) logger_.warn("Stop of " + id + " failed: " + result.error().message);
            ++stopped;
        }
    }

    for (const auto& [id, slot] : slots) {
        if (!slot->done.valid()) continue;
        try {
            slot->done.get();
        } catch (const std::exception& e) {
            logger_.error("Training task " + id + " ended abnormally: " + e.what());
        } catch (...) {
            logger_.error("Training task " + id + " ended with an unknown exception");
        }
    }

    pool_.shutdown();
    logger_.info("Training service shut down (" + std::to_string(stopped) + " job(s) stopped)");
}

}  // namespace archetype
