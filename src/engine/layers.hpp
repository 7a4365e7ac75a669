/**
 * @file layers.hpp
 * @brief Differentiable layers and the Sequential container.
 *
 * Layers cache what they need from forward() for the following backward()
 * call. A layer instance therefore serves one forward/backward pair at a
 * time; TrainableUnit serializes access with its own lock.
 */

#pragma once

#include "engine/numeric_engine.hpp"
#include "engine/tensor.hpp"

#include <nlohmann/json_fwd.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <vector>

namespace archetype {

struct Parameter {
    std::string name;
    Tensor value;
    Tensor grad;

    Parameter(std::string n, Tensor v)
        : name(std::move(n)), value(std::move(v)), grad(value.shape()) {}
};

// ─────────────────────────────────────────────
// Layer
// ─────────────────────────────────────────────

class Layer {
public:
    virtual ~Layer() = default;

    [[nodiscard]] virtual std::string_view kind() const noexcept = 0;

    virtual Tensor forward(const Tensor& input, bool training) = 0;

    /// Accumulates parameter gradients and returns the gradient w.r.t. the input.
    virtual Tensor backward(const Tensor& grad_output) = 0;

    virtual std::vector<Parameter*> parameters() { return {}; }

    /// Layer configuration for the interchange export.
    virtual void describe(nlohmann::json& out) const;
};

// ─────────────────────────────────────────────
// Concrete Layers
// ─────────────────────────────────────────────

/// input [N,in] -> [N,out]
class Dense : public Layer {
public:
    Dense(INumericEngine& engine, size_t in_features, size_t out_features, std::mt19937& rng);

    [[nodiscard]] std::string_view kind() const noexcept override { return "dense"; }
    Tensor forward(const Tensor& input, bool training) override;
    Tensor backward(const Tensor& grad_output) override;
    std::vector<Parameter*> parameters() override { return {&weight_, &bias_}; }
    void describe(nlohmann::json& out) const override;

private:
    INumericEngine& engine_;
    Parameter weight_;  ///< [in, out]
    Parameter bias_;    ///< [out]
    Tensor input_;
};

enum class ActivationKind : uint8_t { Relu, Tanh, Sigmoid, LeakyRelu, Gelu };

[[nodiscard]] std::optional<ActivationKind> parse_activation(std::string_view name);
[[nodiscard]] std::string_view to_string(ActivationKind kind) noexcept;

class Activation : public Layer {
public:
    explicit Activation(ActivationKind kind) : kind_(kind) {}

    [[nodiscard]] std::string_view kind() const noexcept override { return to_string(kind_); }
    Tensor forward(const Tensor& input, bool training) override;
    Tensor backward(const Tensor& grad_output) override;

private:
    ActivationKind kind_;
    Tensor input_;
    Tensor output_;
};

class Dropout : public Layer {
public:
    Dropout(float probability, std::mt19937& rng) : p_(probability), rng_(rng) {}

    [[nodiscard]] std::string_view kind() const noexcept override { return "dropout"; }
    Tensor forward(const Tensor& input, bool training) override;
    Tensor backward(const Tensor& grad_output) override;
    void describe(nlohmann::json& out) const override;

private:
    float p_;
    std::mt19937& rng_;
    Tensor mask_;   ///< empty when the last forward was in eval mode
};

/// input [N,C,H,W] -> [N,O,H,W] (stride 1, padding preserves size for k=3,p=1)
class Conv2d : public Layer {
public:
    Conv2d(INumericEngine& engine, size_t in_channels, size_t out_channels,
           size_t kernel_size, uint32_t padding, std::mt19937& rng);

    [[nodiscard]] std::string_view kind() const noexcept override { return "conv2d"; }
    Tensor forward(const Tensor& input, bool training) override;
    Tensor backward(const Tensor& grad_output) override;
    std::vector<Parameter*> parameters() override { return {&weight_, &bias_}; }
    void describe(nlohmann::json& out) const override;

private:
    INumericEngine& engine_;
    uint32_t padding_;
    Parameter weight_;  ///< [O,C,K,K]
    Parameter bias_;    ///< [O]
    Tensor input_;
};

enum class PoolKind : uint8_t { Max, Avg };

/// 2x2 window, stride 2. input [N,C,H,W] -> [N,C,H/2,W/2]
class Pool2d : public Layer {
public:
    explicit Pool2d(PoolKind kind) : kind_(kind) {}

    [[nodiscard]] std::string_view kind() const noexcept override {
        return kind_ == PoolKind::Max ? "max_pool2d" : "avg_pool2d";
    }
    Tensor forward(const Tensor& input, bool training) override;
    Tensor backward(const Tensor& grad_output) override;

private:
    PoolKind kind_;
    Shape input_shape_;
    std::vector<size_t> argmax_;
};

/// [N, ...] -> [N, prod(...)]
class Flatten : public Layer {
public:
    [[nodiscard]] std::string_view kind() const noexcept override { return "flatten"; }
    Tensor forward(const Tensor& input, bool training) override;
    Tensor backward(const Tensor& grad_output) override;

private:
    Shape input_shape_;
};

enum class CellType : uint8_t { Elman, Lstm, Gru };

/// "RNN", "LSTM", "GRU"
[[nodiscard]] std::string_view to_string(CellType cell) noexcept;
[[nodiscard]] std::optional<CellType> parse_cell_type(std::string_view name);

/**
 * @brief One recurrent layer of Elman, LSTM or GRU cells, optionally bidirectional.
 *
 * input [N,T,I] -> [N,T,H*directions]; gradients by backpropagation through time.
 * Gate weights are stored concatenated along the output axis: LSTM keeps
 * (input, forget, cell, output) and GRU keeps (reset, update, candidate).
 */
class Recurrent : public Layer {
public:
    Recurrent(INumericEngine& engine, CellType cell, size_t input_size, size_t hidden_size,
              bool bidirectional, std::mt19937& rng);

    [[nodiscard]] std::string_view kind() const noexcept override;
    [[nodiscard]] CellType cell() const noexcept { return cell_; }
    Tensor forward(const Tensor& input, bool training) override;
    Tensor backward(const Tensor& grad_output) override;
    std::vector<Parameter*> parameters() override;
    void describe(nlohmann::json& out) const override;

private:
    /// Everything one time step needs for its backward pass.
    struct StepCache {
        Tensor input;        ///< [N,I]
        Tensor h_prev;       ///< [N,H]
        Tensor c_prev;       ///< [N,H], LSTM only
        Tensor gates;        ///< [N,G*H] after activation
        Tensor c;            ///< [N,H], LSTM only
        Tensor h;            ///< [N,H]
        Tensor hidden_cand;  ///< [N,H] h_prev · W_hn, GRU only
    };

    struct Direction {
        Parameter w_input;    ///< [I,G*H]
        Parameter w_hidden;   ///< [H,G*H]
        Parameter bias;       ///< [G*H]
        bool reverse;
        std::vector<StepCache> steps;
    };

    [[nodiscard]] size_t gate_count() const noexcept;
    void step_forward(Direction& dir, StepCache& step) const;
    /// Returns dL/dx_t; updates @p dh and @p dc to the gradients w.r.t. h_{t-1} and c_{t-1}.
    Tensor step_backward(Direction& dir, const StepCache& step, Tensor& dh, Tensor& dc) const;

    Tensor run_direction(Direction& dir, const Tensor& input);
    Tensor backprop_direction(Direction& dir, const Tensor& grad_output, size_t offset);

    INumericEngine& engine_;
    CellType cell_;
    size_t input_size_;
    size_t hidden_size_;
    std::vector<Direction> directions_;
    Shape input_shape_;
};

/// [N,T,F] -> [N,F] taking the final time step.
class LastStep : public Layer {
public:
    [[nodiscard]] std::string_view kind() const noexcept override { return "last_step"; }
    Tensor forward(const Tensor& input, bool training) override;
    Tensor backward(const Tensor& grad_output) override;

private:
    Shape input_shape_;
};

// ─────────────────────────────────────────────
// Sequential
// ─────────────────────────────────────────────

class Sequential {
public:
    void add(std::unique_ptr<Layer> layer);

    Tensor forward(const Tensor& input, bool training);
    void backward(const Tensor& grad_output);

    [[nodiscard]] std::vector<Parameter*> parameters();
    [[nodiscard]] size_t parameter_count();
    void zero_grad();

    [[nodiscard]] const std::vector<std::unique_ptr<Layer>>& layers() const noexcept { return layers_; }

private:
    std::vector<std::unique_ptr<Layer>> layers_;
};

}  // namespace archetype
