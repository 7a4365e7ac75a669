/**
 * @file layers.cpp
 * @brief Feed-forward, convolutional and pooling layers.
 */

#include "engine/layers.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace archetype {

void Layer::describe(nlohmann::json& out) const {
    out = nlohmann::json{{"type", kind()}};
}

// ─────────────────────────────────────────────
// Dense
// ─────────────────────────────────────────────

Dense::Dense(INumericEngine& engine, size_t in_features, size_t out_features, std::mt19937& rng)
    : engine_(engine)
    , weight_("weight", Tensor::uniform({in_features, out_features},
                                        1.0f / std::sqrt(static_cast<float>(in_features)), rng))
    , bias_("bias", Tensor::uniform({out_features},
                                    1.0f / std::sqrt(static_cast<float>(in_features)), rng)) {}

Tensor Dense::forward(const Tensor& input, bool /*training*/) {
    if (input.rank() != 2 || input.dim(1) != weight_.value.dim(0)) {
        throw std::invalid_argument("Dense expects [N," + std::to_string(weight_.value.dim(0))
                                    + "], got " + shape_to_string(input.shape()));
    }
    input_ = input;
    Tensor out = engine_.matmul(input, weight_.value);
    const size_t n = out.dim(0);
    const size_t f = out.dim(1);
    for (size_t i = 0; i < n; ++i) {
        for (size_t j = 0; j < f; ++j) out.at(i, j) += bias_.value[j];
    }
    return out;
}

Tensor Dense::backward(const Tensor& grad_output) {
    weight_.grad.add_scaled(engine_.matmul(input_, grad_output, true, false));
    const size_t n = grad_output.dim(0);
    const size_t f = grad_output.dim(1);
    for (size_t i = 0; i < n; ++i) {
        for (size_t j = 0; j < f; ++j) bias_.grad[j] += grad_output.at(i, j);
    }
    return engine_.matmul(grad_output, weight_.value, false, true);
}

void Dense::describe(nlohmann::json& out) const {
    out = nlohmann::json{
        {"type", kind()},
        {"in_features", weight_.value.dim(0)},
        {"out_features", weight_.value.dim(1)}
    };
}

// ─────────────────────────────────────────────
// Activation
// ─────────────────────────────────────────────

std::optional<ActivationKind> parse_activation(std::string_view name) {
    if (name == "relu") return ActivationKind::Relu;
    if (name == "tanh") return ActivationKind::Tanh;
    if (name == "sigmoid") return ActivationKind::Sigmoid;
    if (name == "leaky_relu") return ActivationKind::LeakyRelu;
    if (name == "gelu") return ActivationKind::Gelu;
    return std::nullopt;
}

std::string_view to_string(ActivationKind kind) noexcept {
    switch (kind) {
        case ActivationKind::Relu:      return "relu";
        case ActivationKind::Tanh:      return "tanh";
        case ActivationKind::Sigmoid:   return "sigmoid";
        case ActivationKind::LeakyRelu: return "leaky_relu";
        case ActivationKind::Gelu:      return "gelu";
    }
    return "relu";
}

namespace {

constexpr float kLeakySlope = 0.01f;
constexpr float kGeluCoeff = 0.044715f;
const float kSqrt2OverPi = std::sqrt(2.0f / 3.14159265358979f);

}  // anonymous namespace

Tensor Activation::forward(const Tensor& input, bool /*training*/) {
    input_ = input;
    Tensor out(input.shape());
    for (size_t i = 0; i < input.size(); ++i) {
        float x = input[i];
        switch (kind_) {
            case ActivationKind::Relu:      out[i] = x > 0.0f ? x : 0.0f; break;
            case ActivationKind::Tanh:      out[i] = std::tanh(x); break;
            case ActivationKind::Sigmoid:   out[i] = 1.0f / (1.0f + std::exp(-x)); break;
            case ActivationKind::LeakyRelu: out[i] = x > 0.0f ? x : kLeakySlope * x; break;
            case ActivationKind::Gelu: {
                float inner = kSqrt2OverPi * (x + kGeluCoeff * x * x * x);
                out[i] = 0.5f * x * (1.0f + std::tanh(inner));
                break;
            }
        }
    }
    output_ = out;
    return out;
}

Tensor Activation::backward(const Tensor& grad_output) {
    Tensor grad(grad_output.shape());
    for (size_t i = 0; i < grad.size(); ++i) {
        float x = input_[i];
        float y = output_[i];
        float d = 1.0f;
        switch (kind_) {
            case ActivationKind::Relu:      d = x > 0.0f ? 1.0f : 0.0f; break;
            case ActivationKind::Tanh:      d = 1.0f - y * y; break;
            case ActivationKind::Sigmoid:   d = y * (1.0f - y); break;
            case ActivationKind::LeakyRelu: d = x > 0.0f ? 1.0f : kLeakySlope; break;
            case ActivationKind::Gelu: {
                float inner = kSqrt2OverPi * (x + kGeluCoeff * x * x * x);
                float t = std::tanh(inner);
                float d_inner = kSqrt2OverPi * (1.0f + 3.0f * kGeluCoeff * x * x);
                d = 0.5f * (1.0f + t) + 0.5f * x * (1.0f - t * t) * d_inner;
                break;
            }
        }
        grad[i] = grad_output[i] * d;
    }
    return grad;
}

// ─────────────────────────────────────────────
// Dropout
// ─────────────────────────────────────────────

Tensor Dropout::forward(const Tensor& input, bool training) {
    if (!training || p_ <= 0.0f) {
        mask_ = Tensor{};
        return input;
    }
    const float keep = 1.0f - p_;
    std::bernoulli_distribution keep_dist(keep);
    mask_ = Tensor(input.shape());
    Tensor out(input.shape());
    for (size_t i = 0; i < input.size(); ++i) {
        mask_[i] = keep_dist(rng_) ? 1.0f / keep : 0.0f;
        out[i] = input[i] * mask_[i];
    }
    return out;
}

Tensor Dropout::backward(const Tensor& grad_output) {
    if (mask_.empty()) return grad_output;
    Tensor grad(grad_output.shape());
    for (size_t i = 0; i < grad.size(); ++i) grad[i] = grad_output[i] * mask_[i];
    return grad;
}

void Dropout::describe(nlohmann::json& out) const {
    out = nlohmann::json{{"type", kind()}, {"p", p_}};
}

// ─────────────────────────────────────────────
// Conv2d
// ─────────────────────────────────────────────

Conv2d::Conv2d(INumericEngine& engine, size_t in_channels, size_t out_channels,
               size_t kernel_size, uint32_t padding, std::mt19937& rng)
    : engine_(engine)
    , padding_(padding)
    , weight_("weight", Tensor::uniform({out_channels, in_channels, kernel_size, kernel_size},
                                        1.0f / std::sqrt(static_cast<float>(
                                            in_channels * kernel_size * kernel_size)), rng))
    , bias_("bias", Tensor({out_channels})) {}

Tensor Conv2d::forward(const Tensor& input, bool /*training*/) {
    input_ = input;
    return engine_.conv2d(input, weight_.value, bias_.value, padding_);
}

Tensor Conv2d::backward(const Tensor& grad_output) {
    auto grads = engine_.conv2d_backward(input_, weight_.value, grad_output, padding_);
    weight_.grad.add_scaled(grads.weight);
    bias_.grad.add_scaled(grads.bias);
    return std::move(grads.input);
}

void Conv2d::describe(nlohmann::json& out) const {
    out = nlohmann::json{
        {"type", kind()},
        {"in_channels", weight_.value.dim(1)},
        {"out_channels", weight_.value.dim(0)},
        {"kernel_size", weight_.value.dim(2)},
        {"padding", padding_}
    };
}

// ─────────────────────────────────────────────
// Pool2d
// ─────────────────────────────────────────────

Tensor Pool2d::forward(const Tensor& input, bool /*training*/) {
    if (input.rank() != 4) {
        throw std::invalid_argument("Pool2d expects [N,C,H,W], got " + shape_to_string(input.shape()));
    }
    input_shape_ = input.shape();
    const size_t n = input.dim(0), c = input.dim(1), h = input.dim(2), w = input.dim(3);
    const size_t oh = h / 2, ow = w / 2;
    Tensor out({n, c, oh, ow});
    argmax_.assign(out.size(), 0);

    for (size_t plane = 0; plane < n * c; ++plane) {
        const float* in = input.data() + plane * h * w;
        for (size_t y = 0; y < oh; ++y) {
            for (size_t x = 0; x < ow; ++x) {
                size_t out_idx = (plane * oh + y) * ow + x;
                float best = -std::numeric_limits<float>::infinity();
                size_t best_idx = 0;
                float sum = 0.0f;
                for (size_t dy = 0; dy < 2; ++dy) {
                    for (size_t dx = 0; dx < 2; ++dx) {
                        size_t idx = (2 * y + dy) * w + (2 * x + dx);
                        sum += in[idx];
                        if (in[idx] > best) {
                            best = in[idx];
                            best_idx = plane * h * w + idx;
                        }
                    }
                }
                out[out_idx] = kind_ == PoolKind::Max ? best : sum * 0.25f;
                argmax_[out_idx] = best_idx;
            }
        }
    }
    return out;
}

Tensor Pool2d::backward(const Tensor& grad_output) {
    Tensor grad(input_shape_);
    const size_t h = input_shape_[2], w = input_shape_[3];
    const size_t oh = h / 2, ow = w / 2;
    const size_t planes = input_shape_[0] * input_shape_[1];

    for (size_t plane = 0; plane < planes; ++plane) {
        for (size_t y = 0; y < oh; ++y) {
            for (size_t x = 0; x < ow; ++x) {
                size_t out_idx = (plane * oh + y) * ow + x;
                float g = grad_output[out_idx];
                if (kind_ == PoolKind::Max) {
                    grad[argmax_[out_idx]] += g;
                } else {
                    for (size_t dy = 0; dy < 2; ++dy) {
                        for (size_t dx = 0; dx < 2; ++dx) {
                            grad[plane * h * w + (2 * y + dy) * w + (2 * x + dx)] += 0.25f * g;
                        }
                    }
                }
            }
        }
    }
    return grad;
}

// ─────────────────────────────────────────────
// Flatten / LastStep
// ─────────────────────────────────────────────

Tensor Flatten::forward(const Tensor& input, bool /*training*/) {
    input_shape_ = input.shape();
    const size_t n = input.dim(0);
    return input.reshaped({n, n == 0 ? 0 : input.size() / n});
}

Tensor Flatten::backward(const Tensor& grad_output) {
    return grad_output.reshaped(input_shape_);
}

Tensor LastStep::forward(const Tensor& input, bool /*training*/) {
    if (input.rank() != 3) {
        throw std::invalid_argument("LastStep expects [N,T,F], got " + shape_to_string(input.shape()));
    }
    input_shape_ = input.shape();
    const size_t n = input.dim(0), t = input.dim(1), f = input.dim(2);
    Tensor out({n, f});
    for (size_t i = 0; i < n; ++i) {
        const float* src = input.data() + (i * t + (t - 1)) * f;
        std::copy(src, src + f, out.data() + i * f);
    }
    return out;
}

Tensor LastStep::backward(const Tensor& grad_output) {
    Tensor grad(input_shape_);
    const size_t n = input_shape_[0], t = input_shape_[1], f = input_shape_[2];
    for (size_t i = 0; i < n; ++i) {
        const float* src = grad_output.data() + i * f;
        std::copy(src, src + f, grad.data() + (i * t + (t - 1)) * f);
    }
    return grad;
}

// ─────────────────────────────────────────────
// Sequential
// ─────────────────────────────────────────────

void Sequential::add(std::unique_ptr<Layer> layer) {
    layers_.push_back(std::move(layer));
}

Tensor Sequential::forward(const Tensor& input, bool training) {
    Tensor x = input;
    for (auto& layer : layers_) x = layer->forward(x, training);
    return x;
}

void Sequential::backward(const Tensor& grad_output) {
    Tensor g = grad_output;
    for (auto it = layers_.rbegin(); it != layers_.rend(); ++it) g = (*it)->backward(g);
}

std::vector<Parameter*> Sequential::parameters() {
    std::vector<Parameter*> params;
    for (auto& layer : layers_) {
        auto lp = layer->parameters();
        params.insert(params.end(), lp.begin(), lp.end());
    }
    return params;
}

size_t Sequential::parameter_count() {
    size_t total = 0;
    for (auto* p : parameters()) total += p->value.size();
    return total;
}

void Sequential::zero_grad() {
    for (auto* p : parameters()) p->grad.fill(0.0f);
}

}  // namespace archetype
