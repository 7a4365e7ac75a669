/**
 * @file optimizer.cpp
 * @brief Optimizer updates and loss functions.
 */

#include "engine/optimizer.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace archetype {

std::optional<OptimizerKind> parse_optimizer(std::string_view name) {
    if (name == "adam") return OptimizerKind::Adam;
    if (name == "adamw") return OptimizerKind::AdamW;
    if (name == "sgd") return OptimizerKind::Sgd;
    if (name == "rmsprop") return OptimizerKind::RmsProp;
    return std::nullopt;
}

std::string_view to_string(OptimizerKind kind) noexcept {
    switch (kind) {
        case OptimizerKind::Adam:    return "adam";
        case OptimizerKind::AdamW:   return "adamw";
        case OptimizerKind::Sgd:     return "sgd";
        case OptimizerKind::RmsProp: return "rmsprop";
    }
    return "adam";
}

void Optimizer::step(const std::vector<Parameter*>& params) {
    const auto& o = options_;
    for (auto* p : params) {
        auto& st = state_[p];
        if (st.first.empty()) {
            st.first = Tensor(p->value.shape());
            st.second = Tensor(p->value.shape());
        }
        ++st.steps;

        auto& w = p->value.values();
        const auto& g = p->grad.values();

        switch (o.kind) {
            case OptimizerKind::Sgd:
                for (size_t i = 0; i < w.size(); ++i) {
                    float grad = g[i] + o.weight_decay * w[i];
                    st.first[i] = o.momentum * st.first[i] + grad;
                    w[i] -= o.learning_rate * st.first[i];
                }
                break;

            case OptimizerKind::RmsProp:
                for (size_t i = 0; i < w.size(); ++i) {
                    float grad = g[i] + o.weight_decay * w[i];
                    st.second[i] = o.alpha * st.second[i] + (1.0f - o.alpha) * grad * grad;
                    w[i] -= o.learning_rate * grad / (std::sqrt(st.second[i]) + o.epsilon);
                }
                break;

            case OptimizerKind::Adam:
            case OptimizerKind::AdamW: {
                const bool decoupled = o.kind == OptimizerKind::AdamW;
                const auto t = static_cast<float>(st.steps);
                const float bias1 = 1.0f - std::pow(o.beta1, t);
                const float bias2 = 1.0f - std::pow(o.beta2, t);
                for (size_t i = 0; i < w.size(); ++i) {
                    float grad = decoupled ? g[i] : g[i] + o.weight_decay * w[i];
                    if (decoupled) w[i] -= o.learning_rate * o.weight_decay * w[i];
                    st.first[i] = o.beta1 * st.first[i] + (1.0f - o.beta1) * grad;
                    st.second[i] = o.beta2 * st.second[i] + (1.0f - o.beta2) * grad * grad;
                    float m_hat = st.first[i] / bias1;
                    float v_hat = st.second[i] / bias2;
                    w[i] -= o.learning_rate * m_hat / (std::sqrt(v_hat) + o.epsilon);
                }
                break;
            }
        }
    }
}

// ─────────────────────────────────────────────
// Losses
// ─────────────────────────────────────────────

std::optional<LossKind> parse_loss(std::string_view name) {
    if (name == "cross_entropy") return LossKind::CrossEntropy;
    if (name == "mse") return LossKind::Mse;
    if (name == "mae") return LossKind::Mae;
    return std::nullopt;
}

std::string_view to_string(LossKind kind) noexcept {
    switch (kind) {
        case LossKind::CrossEntropy: return "cross_entropy";
        case LossKind::Mse:          return "mse";
        case LossKind::Mae:          return "mae";
    }
    return "cross_entropy";
}

LossOutput compute_loss(LossKind kind, const Tensor& logits, const std::vector<uint32_t>& labels) {
    if (logits.rank() != 2 || logits.dim(0) != labels.size()) {
        throw std::invalid_argument("Loss expects [N,C] logits with N labels, got "
                                    + shape_to_string(logits.shape()) + " and "
                                    + std::to_string(labels.size()) + " labels");
    }
    const size_t n = logits.dim(0);
    const size_t c = logits.dim(1);
    LossOutput out;
    out.grad = Tensor(logits.shape());
    if (n == 0) return out;

    const float inv_n = 1.0f / static_cast<float>(n);
    double total = 0.0;

    for (size_t i = 0; i < n; ++i) {
        const uint32_t label = labels[i];
        if (label >= c) {
            throw std::invalid_argument("Label " + std::to_string(label) + " out of range for "
                                        + std::to_string(c) + " classes");
        }
        const float* row = logits.data() + i * c;
        float* grow = out.grad.data() + i * c;

        size_t best = static_cast<size_t>(std::max_element(row, row + c) - row);
        if (best == label) ++out.correct;

        switch (kind) {
            case LossKind::CrossEntropy: {
                float max_logit = row[best];
                double denom = 0.0;
                for (size_t j = 0; j < c; ++j) denom += std::exp(row[j] - max_logit);
                for (size_t j = 0; j < c; ++j) {
                    auto prob = static_cast<float>(std::exp(row[j] - max_logit) / denom);
                    grow[j] = (prob - (j == label ? 1.0f : 0.0f)) * inv_n;
                }
                total += -(row[label] - max_logit - std::log(denom));
                break;
            }
            case LossKind::Mse: {
                const float inv_nc = inv_n / static_cast<float>(c);
                for (size_t j = 0; j < c; ++j) {
                    float diff = row[j] - (j == label ? 1.0f : 0.0f);
                    total += static_cast<double>(diff) * diff / c;
                    grow[j] = 2.0f * diff * inv_nc;
                }
                break;
            }
            case LossKind::Mae: {
                const float inv_nc = inv_n / static_cast<float>(c);
                for (size_t j = 0; j < c; ++j) {
                    float diff = row[j] - (j == label ? 1.0f : 0.0f);
                    total += std::fabs(diff) / c;
                    grow[j] = (diff > 0.0f ? 1.0f : (diff < 0.0f ? -1.0f : 0.0f)) * inv_nc;
                }
                break;
            }
        }
    }
    out.loss = static_cast<float>(total / static_cast<double>(n));
    return out;
}

}  // namespace archetype
