/**
 * @file tensor.hpp
 * @brief Dense row-major float tensor.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <random>
#include <string>
#include <vector>

namespace archetype {

using Shape = std::vector<size_t>;

[[nodiscard]] size_t shape_size(const Shape& shape) noexcept;
[[nodiscard]] std::string shape_to_string(const Shape& shape);

/**
 * @brief N-dimensional float tensor with contiguous row-major storage.
 *
 * Shape errors throw std::invalid_argument; callers at component
 * boundaries convert them to Result errors.
 */
class Tensor {
public:
    Tensor() = default;
    explicit Tensor(Shape shape, float fill = 0.0f);
    Tensor(Shape shape, std::vector<float> data);

    /// Normal(0, stddev) initialised tensor.
    static Tensor randn(Shape shape, float stddev, std::mt19937& rng);

    /// Uniform(-limit, limit) initialised tensor.
    static Tensor uniform(Shape shape, float limit, std::mt19937& rng);

    [[nodiscard]] const Shape& shape() const noexcept { return shape_; }
    [[nodiscard]] size_t rank() const noexcept { return shape_.size(); }
    [[nodiscard]] size_t dim(size_t axis) const;
    [[nodiscard]] size_t size() const noexcept { return data_.size(); }
    [[nodiscard]] bool empty() const noexcept { return data_.empty(); }

    [[nodiscard]] float* data() noexcept { return data_.data(); }
    [[nodiscard]] const float* data() const noexcept { return data_.data(); }
    [[nodiscard]] std::vector<float>& values() noexcept { return data_; }
    [[nodiscard]] const std::vector<float>& values() const noexcept { return data_; }

    float& operator[](size_t i) { return data_[i]; }
    float operator[](size_t i) const { return data_[i]; }

    /// 2-D element access.
    float& at(size_t row, size_t col) { return data_[row * shape_[1] + col]; }
    [[nodiscard]] float at(size_t row, size_t col) const { return data_[row * shape_[1] + col]; }

    /// Same data, new shape of equal element count.
    [[nodiscard]] Tensor reshaped(Shape shape) const;

    void fill(float value);

    /// Element-wise this += scale * other.
    void add_scaled(const Tensor& other, float scale = 1.0f);

private:
    Shape shape_;
    std::vector<float> data_;
};

}  // namespace archetype
