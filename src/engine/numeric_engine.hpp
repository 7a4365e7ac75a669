/**
 * @file numeric_engine.hpp
 * @brief INumericEngine: the kernel interface used by layers and benchmarks.
 *
 * The engine is bound to the currently selected device. CpuReferenceEngine
 * records the binding and executes every kernel on the host.
 */

#pragma once

#include "device/device.hpp"
#include "engine/tensor.hpp"

#include <mutex>
#include <optional>
#include <string_view>

namespace archetype {

struct Conv2dGrads {
    Tensor input;
    Tensor weight;
    Tensor bias;
};

class INumericEngine {
public:
    virtual ~INumericEngine() = default;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;

    /// Route subsequent kernels to this device.
    virtual void bind(const Device& device) = 0;
    [[nodiscard]] virtual std::optional<Device> bound_device() const = 0;

    /// op(a)[M,K] x op(b)[K,N] where op transposes when requested.
    virtual Tensor matmul(const Tensor& a, const Tensor& b,
                          bool transpose_a = false, bool transpose_b = false) = 0;

    /// input [N,C,H,W], weight [O,C,K,K], bias [O] -> [N,O,H',W'] with stride 1.
    virtual Tensor conv2d(const Tensor& input, const Tensor& weight, const Tensor& bias,
                          uint32_t padding) = 0;

    virtual Conv2dGrads conv2d_backward(const Tensor& input, const Tensor& weight,
                                        const Tensor& grad_output, uint32_t padding) = 0;
};

class CpuReferenceEngine : public INumericEngine {
public:
    [[nodiscard]] std::string_view name() const noexcept override { return "cpu-reference"; }

    void bind(const Device& device) override;
    [[nodiscard]] std::optional<Device> bound_device() const override;

    Tensor matmul(const Tensor& a, const Tensor& b,
                  bool transpose_a = false, bool transpose_b = false) override;

    Tensor conv2d(const Tensor& input, const Tensor& weight, const Tensor& bias,
                  uint32_t padding) override;

    Conv2dGrads conv2d_backward(const Tensor& input, const Tensor& weight,
                                const Tensor& grad_output, uint32_t padding) override;

private:
    mutable std::mutex mutex_;
    std::optional<Device> device_;
};

}  // namespace archetype
