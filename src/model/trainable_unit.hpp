/**
 * @file trainable_unit.hpp
 * @brief TrainableUnit: a built network bound to a device, plus its metadata.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "engine/layers.hpp"
#include "engine/optimizer.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <memory>
#include <mutex>
#include <random>
#include <string>

namespace archetype {

/**
 * @brief Persisted description of a unit; the network itself is rebuilt from it.
 */
struct UnitMetadata {
    UnitId id;
    std::string name;
    UnitType type{UnitType::Mlp};
    nlohmann::json architecture = nlohmann::json::object();
    nlohmann::json hyperparameters = nlohmann::json::object();
    uint64_t parameter_count{0};
    Timestamp created_at{};
    Timestamp updated_at{};
    std::string status = "created";
    DeviceId device_id;
};

void to_json(nlohmann::json& j, const UnitMetadata& meta);
void from_json(const nlohmann::json& j, UnitMetadata& meta);

struct StepResult {
    float loss{0.0f};
    size_t correct{0};
};

/**
 * @brief A network plus the shapes needed to feed it.
 *
 * All access to the parameters goes through the unit's mutex, so several jobs
 * may train the same unit with their batches interleaved.
 */
class TrainableUnit {
public:
    /// @param sample_shape  per-sample input shape without the batch axis
    TrainableUnit(UnitType type, Shape sample_shape, size_t num_outputs, DeviceId device,
                  uint32_t seed);

    TrainableUnit(const TrainableUnit&) = delete;
    TrainableUnit& operator=(const TrainableUnit&) = delete;

    [[nodiscard]] UnitType type() const noexcept { return type_; }
    [[nodiscard]] const Shape& sample_shape() const noexcept { return sample_shape_; }
    [[nodiscard]] size_t sample_size() const noexcept { return shape_size(sample_shape_); }
    [[nodiscard]] size_t num_outputs() const noexcept { return num_outputs_; }
    [[nodiscard]] const DeviceId& device_id() const noexcept { return device_id_; }

    /// Build-time access; not synchronized.
    [[nodiscard]] Sequential& network() noexcept { return network_; }
    [[nodiscard]] std::mt19937& rng() noexcept { return *rng_; }

    [[nodiscard]] size_t parameter_count();

    /// Batch input shape: [N, sample_shape...]
    [[nodiscard]] Shape batch_shape(size_t batch) const;

    /// One optimizer step on a batch. Throws on shape errors.
    StepResult train_step(const Tensor& inputs, const std::vector<uint32_t>& labels,
                          Optimizer& optimizer, LossKind loss);

    /// Loss and accuracy without updating parameters.
    StepResult evaluate(const Tensor& inputs, const std::vector<uint32_t>& labels, LossKind loss);

    Tensor predict(const Tensor& inputs);

    /// Native binary snapshot: metadata, shapes and every parameter.
    Result<void> save_native(const std::filesystem::path& path, const UnitMetadata& meta);

    /// JSON interchange document with layer descriptions and weights.
    Result<void> save_interchange(const std::filesystem::path& path, const UnitMetadata& meta);

private:
    Shape traced_output_shape();

    UnitType type_;
    Shape sample_shape_;
    size_t num_outputs_;
    DeviceId device_id_;
    std::unique_ptr<std::mt19937> rng_;   ///< heap-held so layers can keep a stable reference
    Sequential network_;
    std::mutex mutex_;
};

}  // namespace archetype
