/**
 * @file cpu_engine.cpp
 * @brief Host reference kernels.
 */

#include "engine/numeric_engine.hpp"

#include <stdexcept>

namespace archetype {

void CpuReferenceEngine::bind(const Device& device) {
    std::lock_guard lock(mutex_);
    device_ = device;
}

std::optional<Device> CpuReferenceEngine::bound_device() const {
    std::lock_guard lock(mutex_);
    return device_;
}

Tensor CpuReferenceEngine::matmul(const Tensor& a, const Tensor& b,
                                  bool transpose_a, bool transpose_b) {
    if (a.rank() != 2 || b.rank() != 2) {
        throw std::invalid_argument("matmul expects 2-D operands, got "
                                    + shape_to_string(a.shape()) + " and "
                                    + shape_to_string(b.shape()));
    }
    const size_t m = transpose_a ? a.dim(1) : a.dim(0);
    const size_t k = transpose_a ? a.dim(0) : a.dim(1);
    const size_t kb = transpose_b ? b.dim(1) : b.dim(0);
    const size_t n = transpose_b ? b.dim(0) : b.dim(1);
    if (k != kb) {
        throw std::invalid_argument("matmul inner dimension mismatch: "
                                    + shape_to_string(a.shape()) + " x "
                                    + shape_to_string(b.shape()));
    }

    Tensor out({m, n});
    const size_t a_cols = a.dim(1);
    const size_t b_cols = b.dim(1);
    const float* pa = a.data();
    const float* pb = b.data();
    float* po = out.data();

    // i-p-j ordering keeps the inner loop contiguous for the common case
    for (size_t i = 0; i < m; ++i) {
        for (size_t p = 0; p < k; ++p) {
            float av = transpose_a ? pa[p * a_cols + i] : pa[i * a_cols + p];
            if (av == 0.0f) continue;
            float* row = po + i * n;
            if (!transpose_b) {
                const float* brow = pb + p * b_cols;
                for (size_t j = 0; j < n; ++j) row[j] += av * brow[j];
            } else {
                for (size_t j = 0; j < n; ++j) row[j] += av * pb[j * b_cols + p];
            }
        }
    }
    return out;
}

namespace {

struct ConvDims {
    size_t n, c, h, w, o, k, oh, ow;
};

ConvDims conv_dims(const Tensor& input, const Tensor& weight, uint32_t padding) {
    if (input.rank() != 4 || weight.rank() != 4) {
        throw std::invalid_argument("conv2d expects [N,C,H,W] input and [O,C,K,K] weight");
    }
    ConvDims d{};
    d.n = input.dim(0);
    d.c = input.dim(1);
    d.h = input.dim(2);
    d.w = input.dim(3);
    d.o = weight.dim(0);
    d.k = weight.dim(2);
    if (weight.dim(1) != d.c || weight.dim(3) != d.k) {
        throw std::invalid_argument("conv2d weight " + shape_to_string(weight.shape())
                                    + " incompatible with input " + shape_to_string(input.shape()));
    }
    if (d.h + 2 * padding < d.k || d.w + 2 * padding < d.k) {
        throw std::invalid_argument("conv2d kernel larger than padded input");
    }
    d.oh = d.h + 2 * padding - d.k + 1;
    d.ow = d.w + 2 * padding - d.k + 1;
    return d;
}

}  // anonymous namespace

Tensor CpuReferenceEngine::conv2d(const Tensor& input, const Tensor& weight, const Tensor& bias,
                                  uint32_t padding) {
    auto d = conv_dims(input, weight, padding);
    const auto pad = static_cast<long>(padding);
    Tensor out({d.n, d.o, d.oh, d.ow});

    for (size_t n = 0; n < d.n; ++n) {
        for (size_t o = 0; o < d.o; ++o) {
            float* plane = out.data() + ((n * d.o + o) * d.oh) * d.ow;
            float b = bias.empty() ? 0.0f : bias[o];
            for (size_t i = 0; i < d.oh * d.ow; ++i) plane[i] = b;

            for (size_t c = 0; c < d.c; ++c) {
                const float* in_plane = input.data() + ((n * d.c + c) * d.h) * d.w;
                const float* kern = weight.data() + ((o * d.c + c) * d.k) * d.k;
                for (size_t ky = 0; ky < d.k; ++ky) {
                    for (size_t kx = 0; kx < d.k; ++kx) {
                        float wv = kern[ky * d.k + kx];
                        for (size_t y = 0; y < d.oh; ++y) {
                            long iy = static_cast<long>(y + ky) - pad;
                            if (iy < 0 || iy >= static_cast<long>(d.h)) continue;
                            for (size_t x = 0; x < d.ow; ++x) {
                                long ix = static_cast<long>(x + kx) - pad;
                                if (ix < 0 || ix >= static_cast<long>(d.w)) continue;
                                plane[y * d.ow + x] += wv * in_plane[iy * d.w + ix];
                            }
                        }
                    }
                }
            }
        }
    }
    return out;
}

Conv2dGrads CpuReferenceEngine::conv2d_backward(const Tensor& input, const Tensor& weight,
                                                const Tensor& grad_output, uint32_t padding) {
    auto d = conv_dims(input, weight, padding);
    const auto pad = static_cast<long>(padding);
    Conv2dGrads grads{Tensor(input.shape()), Tensor(weight.shape()), Tensor({d.o})};

    for (size_t n = 0; n < d.n; ++n) {
        for (size_t o = 0; o < d.o; ++o) {
            const float* g_plane = grad_output.data() + ((n * d.o + o) * d.oh) * d.ow;
            for (size_t i = 0; i < d.oh * d.ow; ++i) grads.bias[o] += g_plane[i];

            for (size_t c = 0; c < d.c; ++c) {
                const float* in_plane = input.data() + ((n * d.c + c) * d.h) * d.w;
                float* gin_plane = grads.input.data() + ((n * d.c + c) * d.h) * d.w;
                const float* kern = weight.data() + ((o * d.c + c) * d.k) * d.k;
                float* gkern = grads.weight.data() + ((o * d.c + c) * d.k) * d.k;

                for (size_t ky = 0; ky < d.k; ++ky) {
                    for (size_t kx = 0; kx < d.k; ++kx) {
                        float wv = kern[ky * d.k + kx];
                        float gw = 0.0f;
                        for (size_t y = 0; y < d.oh; ++y) {
                            long iy = static_cast<long>(y + ky) - pad;
                            if (iy < 0 || iy >= static_cast<long>(d.h)) continue;
                            for (size_t x = 0; x < d.ow; ++x) {
                                long ix = static_cast<long>(x + kx) - pad;
                                if (ix < 0 || ix >= static_cast<long>(d.w)) continue;
                                float g = g_plane[y * d.ow + x];
                                gw += g * in_plane[iy * d.w + ix];
                                gin_plane[iy * d.w + ix] += g * wv;
                            }
                        }
                        gkern[ky * d.k + kx] += gw;
                    }
                }
            }
        }
    }
    return grads;
}

}  // namespace archetype
