/**
 * @file tensor.cpp
 * @brief Tensor implementation.
 */

#include "engine/tensor.hpp"

#include <algorithm>
#include <functional>
#include <numeric>
#include <stdexcept>

namespace archetype {

size_t shape_size(const Shape& shape) noexcept {
    if (shape.empty()) return 0;
    return std::accumulate(shape.begin(), shape.end(), size_t{1}, std::multiplies<>{});
}

std::string shape_to_string(const Shape& shape) {
    std::string out = "[";
    for (size_t i = 0; i < shape.size(); ++i) {
        if (i > 0) out += ", ";
        out += std::to_string(shape[i]);
    }
    return out + "]";
}

Tensor::Tensor(Shape shape, float fill)
    : shape_(std::move(shape)), data_(shape_size(shape_), fill) {}

Tensor::Tensor(Shape shape, std::vector<float> data)
    : shape_(std::move(shape)), data_(std::move(data)) {
    if (data_.size() != shape_size(shape_)) {
        throw std::invalid_argument("Tensor data size " + std::to_string(data_.size())
                                    + " does not match shape " + shape_to_string(shape_));
    }
}

Tensor Tensor::randn(Shape shape, float stddev, std::mt19937& rng) {
    Tensor t(std::move(shape));
    std::normal_distribution<float> dist(0.0f, stddev);
    for (auto& v : t.data_) v = dist(rng);
    return t;
}

Tensor Tensor::uniform(Shape shape, float limit, std::mt19937& rng) {
    Tensor t(std::move(shape));
    std::uniform_real_distribution<float> dist(-limit, limit);
    for (auto& v : t.data_) v = dist(rng);
    return t;
}

size_t Tensor::dim(size_t axis) const {
    if (axis >= shape_.size()) {
        throw std::invalid_argument("Axis " + std::to_string(axis) + " out of range for shape "
                                    + shape_to_string(shape_));
    }
    return shape_[axis];
}

Tensor Tensor::reshaped(Shape shape) const {
    if (shape_size(shape) != data_.size()) {
        throw std::invalid_argument("Cannot reshape " + shape_to_string(shape_) + " to "
                                    + shape_to_string(shape));
    }
    return Tensor(std::move(shape), data_);
}

void Tensor::fill(float value) {
    std::fill(data_.begin(), data_.end(), value);
}

void Tensor::add_scaled(const Tensor& other, float scale) {
    if (other.size() != data_.size()) {
        throw std::invalid_argument("add_scaled size mismatch: " + shape_to_string(shape_)
                                    + " vs " + shape_to_string(other.shape_));
    }
    for (size_t i = 0; i < data_.size(); ++i) data_[i] += scale * other.data_[i];
}

}  // namespace archetype
