/**
 * @file dataset.cpp
 * @brief SyntheticDataset implementation.
 */

#include "training/dataset.hpp"
#include "model/trainable_unit.hpp"

#include <algorithm>
#include <numeric>

namespace archetype {

SyntheticDataset::SyntheticDataset(Shape sample_shape, size_t num_classes, size_t num_samples,
                                   uint32_t seed)
    : sample_shape_(std::move(sample_shape))
    , sample_size_(shape_size(sample_shape_))
    , num_classes_(num_classes) {
    std::mt19937 rng(seed);
    std::normal_distribution<float> normal(0.0f, 1.0f);
    std::uniform_int_distribution<uint32_t> label(0, static_cast<uint32_t>(num_classes_ - 1));

    inputs_.resize(num_samples * sample_size_);
    for (auto& v : inputs_) v = normal(rng);
    labels_.resize(num_samples);
    for (auto& l : labels_) l = label(rng);

    order_.resize(num_samples);
    std::iota(order_.begin(), order_.end(), size_t{0});
}

size_t SyntheticDataset::num_batches(size_t batch_size) const noexcept {
    if (batch_size == 0) return 0;
    return (size() + batch_size - 1) / batch_size;
}

void SyntheticDataset::shuffle(std::mt19937& rng) {
    std::shuffle(order_.begin(), order_.end(), rng);
}

Batch SyntheticDataset::batch(size_t index, size_t batch_size) const {
    size_t begin = index * batch_size;
    size_t end = std::min(begin + batch_size, size());
    size_t n = end > begin ? end - begin : 0;

    Shape shape{n};
    shape.insert(shape.end(), sample_shape_.begin(), sample_shape_.end());

    Batch out{Tensor(shape), {}};
    out.labels.reserve(n);
    float* dst = out.inputs.data();
    for (size_t i = 0; i < n; ++i) {
        size_t src = order_[begin + i];
        std::copy_n(inputs_.begin() + static_cast<std::ptrdiff_t>(src * sample_size_),
                    sample_size_, dst + i * sample_size_);
        out.labels.push_back(labels_[src]);
    }
    return out;
}

namespace {

Result<size_t> resolve_classes(const DatasetSpec& spec, const TrainableUnit& unit) {
    size_t classes = spec.num_classes.value_or(unit.num_outputs());
    if (classes == 0) {
        return Error{ErrorCode::InvalidArgument, "num_classes must be at least 1"};
    }
    if (classes > unit.num_outputs()) {
        return Error{ErrorCode::InvalidArgument,
                     "num_classes " + std::to_string(classes) + " exceeds model output size "
                     + std::to_string(unit.num_outputs())};
    }
    return classes;
}

}  // anonymous namespace

Result<SyntheticDataset> make_dataset(const DatasetSpec& spec, const TrainableUnit& unit) {
    if (spec.type != "dummy") {
        return Error{ErrorCode::UnsupportedType, "Unsupported dataset type: " + spec.type};
    }
    if (spec.num_samples == 0) {
        return Error{ErrorCode::InvalidArgument, "num_samples must be at least 1"};
    }
    if (spec.input_size && *spec.input_size != unit.sample_size()) {
        return Error{ErrorCode::InvalidArgument,
                     "input_size " + std::to_string(*spec.input_size)
                     + " does not match model input size " + std::to_string(unit.sample_size())};
    }
    auto classes = resolve_classes(spec, unit);
    if (!classes) return classes.error();
    return SyntheticDataset(unit.sample_shape(), *classes, spec.num_samples, spec.seed);
}

Result<SyntheticDataset> make_validation_set(const ValidationSpec& spec, const DatasetSpec& train,
                                             const TrainableUnit& unit) {
    auto classes = resolve_classes(train, unit);
    if (!classes) return classes.error();
    return SyntheticDataset(unit.sample_shape(), *classes, spec.num_samples, spec.seed);
}

}  // namespace archetype
