/**
 * @file recurrent.cpp
 * @brief Elman, LSTM and GRU recurrent layers with backpropagation through time.
 *
 *   Elman:  h_t = tanh(x_t · W_x + h_{t-1} · W_h + b)
 *
 *   LSTM:   [i f g o] = x_t · W_x + h_{t-1} · W_h + b
 *           c_t = σ(f) ⊙ c_{t-1} + σ(i) ⊙ tanh(g)
 *           h_t = σ(o) ⊙ tanh(c_t)
 *
 *   GRU:    [r z n]_x = x_t · W_x + b,  [r z n]_h = h_{t-1} · W_h
 *           r = σ(r_x + r_h),  z = σ(z_x + z_h)
 *           n = tanh(n_x + r ⊙ n_h)
 *           h_t = (1 - z) ⊙ n + z ⊙ h_{t-1}
 *
 * with h_{-1} = c_{-1} = 0. The reverse direction walks t = T-1 .. 0 and
 * writes its states to the upper half of the feature axis.
 */

#include "engine/layers.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace archetype {

namespace {

float sigmoid(float x) { return 1.0f / (1.0f + std::exp(-x)); }

/// Copy step t of [N,T,F] into an [N,F] tensor.
Tensor slice_step(const Tensor& seq, size_t t) {
    const size_t n = seq.dim(0), steps = seq.dim(1), f = seq.dim(2);
    Tensor out({n, f});
    for (size_t i = 0; i < n; ++i) {
        const float* src = seq.data() + (i * steps + t) * f;
        std::copy(src, src + f, out.data() + i * f);
    }
    return out;
}

/// Write [N,H] into features [offset, offset+H) of step t in [N,T,F].
void store_step(Tensor& seq, const Tensor& step, size_t t, size_t offset) {
    const size_t n = seq.dim(0), steps = seq.dim(1), f = seq.dim(2), h = step.dim(1);
    for (size_t i = 0; i < n; ++i) {
        std::copy(step.data() + i * h, step.data() + (i + 1) * h,
                  seq.data() + (i * steps + t) * f + offset);
    }
}

/// Read features [offset, offset+H) of step t from [N,T,F].
Tensor load_step(const Tensor& seq, size_t t, size_t offset, size_t h) {
    const size_t n = seq.dim(0), steps = seq.dim(1), f = seq.dim(2);
    Tensor out({n, h});
    for (size_t i = 0; i < n; ++i) {
        const float* src = seq.data() + (i * steps + t) * f + offset;
        std::copy(src, src + h, out.data() + i * h);
    }
    return out;
}

}  // anonymous namespace

std::string_view to_string(CellType cell) noexcept {
    switch (cell) {
        case CellType::Elman: return "RNN";
        case CellType::Lstm:  return "LSTM";
        case CellType::Gru:   return "GRU";
    }
    return "RNN";
}

std::optional<CellType> parse_cell_type(std::string_view name) {
    if (name == "RNN") return CellType::Elman;
    if (name == "LSTM") return CellType::Lstm;
    if (name == "GRU") return CellType::Gru;
    return std::nullopt;
}

Recurrent::Recurrent(INumericEngine& engine, CellType cell, size_t input_size, size_t hidden_size,
                     bool bidirectional, std::mt19937& rng)
    : engine_(engine), cell_(cell), input_size_(input_size), hidden_size_(hidden_size) {
    const float limit = 1.0f / std::sqrt(static_cast<float>(hidden_size));
    const size_t width = gate_count() * hidden_size;
    const size_t count = bidirectional ? 2 : 1;
    directions_.reserve(count);
    for (size_t d = 0; d < count; ++d) {
        std::string suffix = d == 0 ? "" : "_reverse";
        directions_.push_back(Direction{
            Parameter("weight_ih" + suffix, Tensor::uniform({input_size, width}, limit, rng)),
            Parameter("weight_hh" + suffix, Tensor::uniform({hidden_size, width}, limit, rng)),
            Parameter("bias" + suffix, Tensor::uniform({width}, limit, rng)),
            d == 1,
            {}
        });
    }
}

std::string_view Recurrent::kind() const noexcept {
    switch (cell_) {
        case CellType::Elman: return "rnn";
        case CellType::Lstm:  return "lstm";
        case CellType::Gru:   return "gru";
    }
    return "rnn";
}

size_t Recurrent::gate_count() const noexcept {
    switch (cell_) {
        case CellType::Elman: return 1;
        case CellType::Lstm:  return 4;
        case CellType::Gru:   return 3;
    }
    return 1;
}

std::vector<Parameter*> Recurrent::parameters() {
    std::vector<Parameter*> params;
    for (auto& dir : directions_) {
        params.push_back(&dir.w_input);
        params.push_back(&dir.w_hidden);
        params.push_back(&dir.bias);
    }
    return params;
}

void Recurrent::step_forward(Direction& dir, StepCache& step) const {
    const size_t n = step.input.dim(0), hs = hidden_size_, width = gate_count() * hs;

    Tensor pre = engine_.matmul(step.input, dir.w_input.value);
    for (size_t i = 0; i < n; ++i) {
        for (size_t k = 0; k < width; ++k) pre.at(i, k) += dir.bias.value[k];
    }
    Tensor hid = engine_.matmul(step.h_prev, dir.w_hidden.value);
    step.h = Tensor({n, hs});

    switch (cell_) {
        case CellType::Elman:
            for (size_t i = 0; i < n; ++i) {
                for (size_t j = 0; j < hs; ++j) {
                    step.h.at(i, j) = std::tanh(pre.at(i, j) + hid.at(i, j));
                }
            }
            break;

        case CellType::Lstm:
            pre.add_scaled(hid);
            step.c = Tensor({n, hs});
            for (size_t i = 0; i < n; ++i) {
                for (size_t j = 0; j < hs; ++j) {
                    float in_gate = sigmoid(pre.at(i, j));
                    float forget = sigmoid(pre.at(i, hs + j));
                    float cand = std::tanh(pre.at(i, 2 * hs + j));
                    float out_gate = sigmoid(pre.at(i, 3 * hs + j));
                    pre.at(i, j) = in_gate;
                    pre.at(i, hs + j) = forget;
                    pre.at(i, 2 * hs + j) = cand;
                    pre.at(i, 3 * hs + j) = out_gate;

                    float c = forget * step.c_prev.at(i, j) + in_gate * cand;
                    step.c.at(i, j) = c;
                    step.h.at(i, j) = out_gate * std::tanh(c);
                }
            }
            break;

        case CellType::Gru:
            step.hidden_cand = Tensor({n, hs});
            for (size_t i = 0; i < n; ++i) {
                for (size_t j = 0; j < hs; ++j) {
                    float reset = sigmoid(pre.at(i, j) + hid.at(i, j));
                    float update = sigmoid(pre.at(i, hs + j) + hid.at(i, hs + j));
                    float h_cand = hid.at(i, 2 * hs + j);
                    float cand = std::tanh(pre.at(i, 2 * hs + j) + reset * h_cand);
                    pre.at(i, j) = reset;
                    pre.at(i, hs + j) = update;
                    pre.at(i, 2 * hs + j) = cand;
                    step.hidden_cand.at(i, j) = h_cand;
                    step.h.at(i, j) = (1.0f - update) * cand + update * step.h_prev.at(i, j);
                }
            }
            break;
    }
    step.gates = std::move(pre);
}

Tensor Recurrent::step_backward(Direction& dir, const StepCache& step, Tensor& dh, Tensor& dc) const {
    const size_t n = dh.dim(0), hs = hidden_size_, width = gate_count() * hs;

    // d_in: gradient w.r.t. the input-side pre-activations (and the bias).
    // d_hid: gradient w.r.t. h_{t-1} · W_h; differs from d_in only for GRU.
    Tensor d_in({n, width});
    Tensor d_hid;
    Tensor dh_carry({n, hs});

    switch (cell_) {
        case CellType::Elman:
            for (size_t i = 0; i < n; ++i) {
                for (size_t j = 0; j < hs; ++j) {
                    float h = step.h.at(i, j);
                    d_in.at(i, j) = dh.at(i, j) * (1.0f - h * h);
                }
            }
            break;

        case CellType::Lstm:
            for (size_t i = 0; i < n; ++i) {
                for (size_t j = 0; j < hs; ++j) {
                    float in_gate = step.gates.at(i, j);
                    float forget = step.gates.at(i, hs + j);
                    float cand = step.gates.at(i, 2 * hs + j);
                    float out_gate = step.gates.at(i, 3 * hs + j);
                    float tc = std::tanh(step.c.at(i, j));

                    float dct = dh.at(i, j) * out_gate * (1.0f - tc * tc) + dc.at(i, j);
                    d_in.at(i, j) = dct * cand * in_gate * (1.0f - in_gate);
                    d_in.at(i, hs + j) = dct * step.c_prev.at(i, j) * forget * (1.0f - forget);
                    d_in.at(i, 2 * hs + j) = dct * in_gate * (1.0f - cand * cand);
                    d_in.at(i, 3 * hs + j) = dh.at(i, j) * tc * out_gate * (1.0f - out_gate);
                    dc.at(i, j) = dct * forget;
                }
            }
            break;

        case CellType::Gru:
            d_hid = Tensor({n, width});
            for (size_t i = 0; i < n; ++i) {
                for (size_t j = 0; j < hs; ++j) {
                    float reset = step.gates.at(i, j);
                    float update = step.gates.at(i, hs + j);
                    float cand = step.gates.at(i, 2 * hs + j);
                    float g = dh.at(i, j);

                    float d_cand = g * (1.0f - update) * (1.0f - cand * cand);
                    float d_update = g * (step.h_prev.at(i, j) - cand) * update * (1.0f - update);
                    float d_reset = d_cand * step.hidden_cand.at(i, j) * reset * (1.0f - reset);

                    d_in.at(i, j) = d_reset;
                    d_in.at(i, hs + j) = d_update;
                    d_in.at(i, 2 * hs + j) = d_cand;
                    d_hid.at(i, j) = d_reset;
                    d_hid.at(i, hs + j) = d_update;
                    d_hid.at(i, 2 * hs + j) = d_cand * reset;
                    dh_carry.at(i, j) = g * update;
                }
            }
            break;
    }

    const Tensor& d_h = cell_ == CellType::Gru ? d_hid : d_in;
    dir.w_input.grad.add_scaled(engine_.matmul(step.input, d_in, true, false));
    dir.w_hidden.grad.add_scaled(engine_.matmul(step.h_prev, d_h, true, false));
    for (size_t i = 0; i < n; ++i) {
        for (size_t k = 0; k < width; ++k) dir.bias.grad[k] += d_in.at(i, k);
    }

    dh = engine_.matmul(d_h, dir.w_hidden.value, false, true);
    dh.add_scaled(dh_carry);
    return engine_.matmul(d_in, dir.w_input.value, false, true);
}

Tensor Recurrent::run_direction(Direction& dir, const Tensor& input) {
    const size_t n = input.dim(0), steps = input.dim(1);
    dir.steps.assign(steps, StepCache{});

    Tensor output({n, steps, hidden_size_});
    Tensor h({n, hidden_size_});
    Tensor c({n, hidden_size_});
    for (size_t s = 0; s < steps; ++s) {
        size_t t = dir.reverse ? steps - 1 - s : s;
        auto& step = dir.steps[t];
        step.input = slice_step(input, t);
        step.h_prev = h;
        if (cell_ == CellType::Lstm) step.c_prev = c;

        step_forward(dir, step);
        h = step.h;
        if (cell_ == CellType::Lstm) c = step.c;
        store_step(output, h, t, 0);
    }
    return output;
}

Tensor Recurrent::forward(const Tensor& input, bool /*training*/) {
    if (input.rank() != 3 || input.dim(2) != input_size_) {
        throw std::invalid_argument("Recurrent expects [N,T," + std::to_string(input_size_)
                                    + "], got " + shape_to_string(input.shape()));
    }
    input_shape_ = input.shape();
    const size_t n = input.dim(0), steps = input.dim(1);
    const size_t features = hidden_size_ * directions_.size();

    Tensor output({n, steps, features});
    for (size_t d = 0; d < directions_.size(); ++d) {
        Tensor part = run_direction(directions_[d], input);
        for (size_t t = 0; t < steps; ++t) {
            store_step(output, slice_step(part, t), t, d * hidden_size_);
        }
    }
    return output;
}

Tensor Recurrent::backprop_direction(Direction& dir, const Tensor& grad_output, size_t offset) {
    const size_t n = input_shape_[0], steps = input_shape_[1];
    Tensor grad_input(input_shape_);
    Tensor dh_next({n, hidden_size_});
    Tensor dc_next({n, hidden_size_});

    for (size_t s = 0; s < steps; ++s) {
        // walk opposite to the forward order
        size_t t = dir.reverse ? s : steps - 1 - s;
        Tensor dh = load_step(grad_output, t, offset, hidden_size_);
        dh.add_scaled(dh_next);

        Tensor dx = step_backward(dir, dir.steps[t], dh, dc_next);
        store_step(grad_input, dx, t, 0);
        dh_next = std::move(dh);
    }
    return grad_input;
}

Tensor Recurrent::backward(const Tensor& grad_output) {
    Tensor grad_input(input_shape_);
    for (size_t d = 0; d < directions_.size(); ++d) {
        grad_input.add_scaled(backprop_direction(directions_[d], grad_output, d * hidden_size_));
    }
    return grad_input;
}

void Recurrent::describe(nlohmann::json& out) const {
    out = nlohmann::json{
        {"type", kind()},
        {"cell", to_string(cell_)},
        {"input_size", input_size_},
        {"hidden_size", hidden_size_},
        {"bidirectional", directions_.size() == 2}
    };
}

}  // namespace archetype
