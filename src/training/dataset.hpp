/**
 * @file dataset.hpp
 * @brief Synthetic classification data for training jobs.
 */

#pragma once

#include "core/result.hpp"
#include "engine/tensor.hpp"
#include "training/job.hpp"

#include <cstdint>
#include <random>
#include <vector>

namespace archetype {

class TrainableUnit;

struct Batch {
    Tensor inputs;                   ///< [n, sample_shape...]
    std::vector<uint32_t> labels;
};

/**
 * @brief Gaussian inputs with uniform random labels, held in memory.
 *
 * Sample order is an index permutation; shuffle() reorders it without
 * touching the data.
 */
class SyntheticDataset {
public:
    SyntheticDataset(Shape sample_shape, size_t num_classes, size_t num_samples, uint32_t seed);

    [[nodiscard]] size_t size() const noexcept { return labels_.size(); }
    [[nodiscard]] size_t num_classes() const noexcept { return num_classes_; }
    [[nodiscard]] size_t num_batches(size_t batch_size) const noexcept;

    void shuffle(std::mt19937& rng);

    /// The @p index-th batch in the current order; the last one may be short.
    [[nodiscard]] Batch batch(size_t index, size_t batch_size) const;

private:
    Shape sample_shape_;
    size_t sample_size_;
    size_t num_classes_;
    std::vector<float> inputs_;
    std::vector<uint32_t> labels_;
    std::vector<size_t> order_;
};

/**
 * @brief Dataset sized to @p unit.
 *
 * UnsupportedType for anything but "dummy"; InvalidArgument when input_size
 * disagrees with the unit or num_classes exceeds its output width.
 */
Result<SyntheticDataset> make_dataset(const DatasetSpec& spec, const TrainableUnit& unit);

/// Validation split with the same shape rules as the training set.
Result<SyntheticDataset> make_validation_set(const ValidationSpec& spec, const DatasetSpec& train,
                                             const TrainableUnit& unit);

}  // namespace archetype
