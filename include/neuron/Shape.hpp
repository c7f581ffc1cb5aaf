/**
 * @file Shape.hpp
 * @brief Shape descriptors for nested tensor lists.
 *
 * Network parameters are stored as lists of tensors (one per layer) and
 * batch accumulators as lists of such lists (one per sample). These
 * helpers describe those trees, allocate zero-filled trees from a
 * description, and shuffle sequences reproducibly.
 */

#ifndef NEURON_SHAPE_HPP
#define NEURON_SHAPE_HPP

#include <cstdint>
#include <random>
#include <utility>
#include <vector>

#include "Tensor.hpp"

namespace neuron::shape
{

/// Dimensions of a single tensor.
using TensorShape = std::vector<uint64_t>;

/// Dimensions of a list of tensors (one entry per layer).
using LayerShape = std::vector<TensorShape>;

/// Dimensions of a list of layer lists (one entry per batch sample).
using BatchShape = std::vector<LayerShape>;

/**
 * @brief Shape of a single tensor.
 */
template <typename value_t>
TensorShape shape_of(const Tensor<value_t> & tensor);
/// Explicit instantiation of shape_of for float
extern template TensorShape shape_of<float>(const Tensor<float>&);

/**
 * @brief Shape of each tensor of a layer list.
 */
template <typename value_t>
LayerShape shape_of(const std::vector<Tensor<value_t>> & layers);
/// Explicit instantiation of shape_of for float
extern template LayerShape shape_of<float>(const std::vector<Tensor<float>>&);

/**
 * @brief Shape of each layer list of a batch.
 */
template <typename value_t>
BatchShape shape_of(const std::vector<std::vector<Tensor<value_t>>> & batch);
/// Explicit instantiation of shape_of for float
extern template BatchShape shape_of<float>
    (const std::vector<std::vector<Tensor<float>>>&);

/**
 * @brief Repeat a tensor shape @p size times.
 *
 * The result describes a layer-like list with one tensor per slot.
 */
LayerShape expand_by(const TensorShape & shape, uint64_t size);

/**
 * @brief Repeat a layer shape @p size times.
 *
 * Adds a leading dimension holding one slot per batch sample.
 */
BatchShape expand_by(const LayerShape & shape, uint64_t size);

/**
 * @brief Zero-filled tensor of the given shape.
 *
 * @throws validation_error if the shape is empty or has a zero entry.
 */
template <typename value_t>
Tensor<value_t> allocate_like(const TensorShape & shape);
/// Explicit instantiation of allocate_like for float
extern template Tensor<float> allocate_like<float>(const TensorShape&);

/**
 * @brief Zero-filled tensor list, one tensor per entry of @p shape.
 *
 * @throws validation_error if any entry is empty or has a zero entry.
 */
template <typename value_t>
std::vector<Tensor<value_t>> allocate_like(const LayerShape & shape);
/// Explicit instantiation of allocate_like for float
extern template std::vector<Tensor<float>> allocate_like<float>
    (const LayerShape&);

/**
 * @brief Zero-filled batch of tensor lists, one list per entry of @p shape.
 *
 * @throws validation_error if any tensor shape is empty or has a
 * zero entry.
 */
template <typename value_t>
std::vector<std::vector<Tensor<value_t>>> allocate_like
    (const BatchShape & shape);
/// Explicit instantiation of allocate_like for float
extern template std::vector<std::vector<Tensor<float>>> allocate_like<float>
    (const BatchShape&);

/**
 * @brief Process-wide random engine seeded from std::random_device.
 *
 * Only for callers that do not need reproducibility.
 */
std::mt19937 & default_generator();

/**
 * @brief Shuffle @p items in place with the Fisher-Yates algorithm.
 *
 * Walking from the back, each position n swaps with a uniformly drawn
 * position k in [0, n]. The same generator state and input always
 * yield the same permutation.
 *
 * @param items Sequence to permute.
 * @param rng Random source.
 */
template <typename item_t>
void shuffle(std::vector<item_t> & items, std::mt19937 & rng)
{
    uint64_t n = static_cast<uint64_t>(items.size());
    while (n > 1)
    {
        n--;
        std::uniform_int_distribution<uint64_t> pick(0, n);
        const uint64_t k = pick(rng);
        std::swap(items[n], items[k]);
    }
}

/**
 * @brief Shuffle @p items in place with the process-wide generator.
 */
template <typename item_t>
void shuffle(std::vector<item_t> & items)
{
    shuffle(items, default_generator());
}

} // namespace neuron::shape

#endif // NEURON_SHAPE_HPP
