/**
 * @file optimizer.hpp
 * @brief Gradient-descent optimizers and loss functions.
 */

#pragma once

#include "engine/layers.hpp"
#include "engine/tensor.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace archetype {

// ─────────────────────────────────────────────
// Optimizers
// ─────────────────────────────────────────────

enum class OptimizerKind : uint8_t { Adam, AdamW, Sgd, RmsProp };

[[nodiscard]] std::optional<OptimizerKind> parse_optimizer(std::string_view name);
[[nodiscard]] std::string_view to_string(OptimizerKind kind) noexcept;

struct OptimizerOptions {
    OptimizerKind kind = OptimizerKind::Adam;
    float learning_rate = 0.001f;
    float weight_decay = 0.0f;
    float momentum = 0.9f;      ///< SGD
    float beta1 = 0.9f;         ///< Adam/AdamW
    float beta2 = 0.999f;       ///< Adam/AdamW
    float alpha = 0.99f;        ///< RMSprop smoothing
    float epsilon = 1e-8f;
};

/**
 * @brief Applies accumulated gradients to parameters.
 *
 * Per-parameter state is keyed by Parameter address, so one optimizer
 * instance belongs to exactly one parameter set.
 */
class Optimizer {
public:
    explicit Optimizer(OptimizerOptions options) : options_(options) {}

    void step(const std::vector<Parameter*>& params);

    [[nodiscard]] const OptimizerOptions& options() const noexcept { return options_; }

private:
    struct State {
        Tensor first;
        Tensor second;
        uint64_t steps{0};
    };

    OptimizerOptions options_;
    std::unordered_map<const Parameter*, State> state_;
};

// ─────────────────────────────────────────────
// Losses
// ─────────────────────────────────────────────

enum class LossKind : uint8_t { CrossEntropy, Mse, Mae };

[[nodiscard]] std::optional<LossKind> parse_loss(std::string_view name);
[[nodiscard]] std::string_view to_string(LossKind kind) noexcept;

struct LossOutput {
    float loss{0.0f};        ///< batch mean
    Tensor grad;             ///< d(loss)/d(logits), same shape as logits
    size_t correct{0};       ///< argmax(logits) == label
};

/**
 * @brief Loss of [N,C] logits against class labels.
 *
 * Regression losses compare against one-hot targets.
 */
[[nodiscard]] LossOutput compute_loss(LossKind kind, const Tensor& logits,
                                      const std::vector<uint32_t>& labels);

}  // namespace archetype
