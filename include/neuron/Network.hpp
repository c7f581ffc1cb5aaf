/**
 * @file Network.hpp
 * @brief Fully connected feed-forward network trained by mini-batch SGD.
 */

#ifndef NEURON_NETWORK_HPP
#define NEURON_NETWORK_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <random>
#include <vector>

#include "Tensor.hpp"
#include "Shape.hpp"
#include "ML.hpp"
#include "NN.hpp"
#include "Reporter.hpp"

namespace neuron
{

/**
 * @brief One training example.
 */
template<typename value_t>
struct LabeledData
{
    Tensor<value_t> input;
    Tensor<value_t> expected;
};

/**
 * @brief Per-layer values computed by a forward pass.
 *
 * Both lists hold one vector per layer, input layer included. The
 * input layer's output is the input itself; it has no weighted sum, so
 * its slot holds an empty tensor.
 */
template<typename value_t>
struct ForwardPass
{
    std::vector<Tensor<value_t>> outputs;
    std::vector<Tensor<value_t>> weighted_sums;
};

/**
 * @brief Cost gradients shaped like the network parameters.
 */
template<typename value_t>
struct Gradients
{
    std::vector<Tensor<value_t>> biases;
    std::vector<Tensor<value_t>> weights;
};

/**
 * @brief Fully connected feed-forward neural network.
 *
 * Every layer except the input owns a bias vector of shape {size} and a
 * weight matrix of shape {size, previous size}. Kernels run on
 * g_sycl_queue; the samples of a mini-batch are backpropagated in an
 * OpenMP parallel loop.
 *
 * A network instance is not safe for concurrent use: fit and
 * update_parameters mutate the parameters in place.
 */
template<typename value_t>
class Network
{
public:
    /**
     * @brief Build a network with initializer-generated parameters.
     *
     * Biases are initialized first, layer by layer, then weights, all
     * from one std::mt19937 seeded with @p seed.
     *
     * @param topology Layer sizes, input layer first.
     * @param bias_initializer Produces each bias vector.
     * @param weight_initializer Produces each weight matrix.
     * @param cost Cost function used by training.
     * @param activation Activation applied by every non-input layer.
     * @param seed Random seed; drawn from std::random_device when empty.
     *
     * @throws validation_error if the topology has fewer than two layers
     * or a zero-sized layer, if a collaborator is null, or if an
     * initializer returns a tensor of the wrong shape.
     */
    Network(const std::vector<uint64_t> & topology,
        const nn::BiasInitializer<value_t> & bias_initializer,
        const nn::WeightInitializer<value_t> & weight_initializer,
        std::shared_ptr<const ml::CostFunction<value_t>> cost,
        std::shared_ptr<const nn::ActivationFunction<value_t>> activation,
        std::optional<uint32_t> seed = std::nullopt);

    /**
     * @brief Build a network from existing parameters.
     *
     * @p biases and @p weights are copied.
     *
     * @throws validation_error on an invalid topology, a null
     * collaborator, or parameters whose count or shapes do not match
     * @p topology.
     */
    Network(const std::vector<uint64_t> & topology,
        const std::vector<Tensor<value_t>> & biases,
        const std::vector<Tensor<value_t>> & weights,
        std::shared_ptr<const ml::CostFunction<value_t>> cost,
        std::shared_ptr<const nn::ActivationFunction<value_t>> activation,
        std::optional<uint32_t> seed = std::nullopt);

    /**
     * @brief Propagate @p input through every layer.
     *
     * @throws validation_error if @p input is not a vector of the input
     * layer size.
     */
    ForwardPass<value_t> feed_forward(const Tensor<value_t> & input) const;

    /**
     * @brief Final layer output for @p input.
     *
     * The output is softmax-normalized when the cost is a
     * CrossEntropyCost and returned as is otherwise.
     */
    Tensor<value_t> predict(const Tensor<value_t> & input) const;

    /**
     * @brief Cost gradients of one example.
     *
     * @throws validation_error if @p expected is not a vector of the
     * output layer size, or if @p input is invalid.
     */
    Gradients<value_t> backpropagation(const Tensor<value_t> & input,
        const Tensor<value_t> & expected) const;

    /**
     * @brief Apply one gradient-descent step for a mini-batch.
     *
     * With n the batch length:
     * b = b - (lr / n) * Σ∂b and
     * W = W * (1 - lr * reg / n) - (lr / n) * Σ∂W.
     *
     * If any sample fails, the first failure (in batch order) is
     * rethrown after all workers have finished and the parameters are
     * left untouched.
     *
     * @throws validation_error if @p batch is empty.
     */
    void update_parameters(const std::vector<LabeledData<value_t>> & batch,
        value_t learning_rate,
        value_t regularization);

    /**
     * @brief Train the network with mini-batch stochastic gradient descent.
     *
     * @p data is shuffled and its first tenth (rounded down) is held out
     * as the validation set. Each epoch reshuffles the remaining pool,
     * splits it into consecutive batches of @p batch_size (the last one
     * may be shorter) and applies them in order. The reporter, when set,
     * is notified after every batch and every epoch.
     *
     * @throws validation_error if @p data is empty, @p batch_size is
     * zero, or no training example remains after the split.
     */
    void fit(std::vector<LabeledData<value_t>> data,
        uint64_t epochs,
        uint64_t batch_size,
        value_t learning_rate,
        value_t regularization);

    /**
     * @brief Accuracy and mean cost of the network on @p data.
     *
     * Accuracy counts examples whose output argmax matches the expected
     * argmax. The cost of each example is computed on the raw final
     * layer output; the mean is increased by the L2 penalty
     * 0.5 * (reg / n) * Σw².
     *
     * @throws validation_error if @p data is empty.
     */
    Evaluation evaluate(const ml::CostFunction<value_t> & cost,
        const std::vector<LabeledData<value_t>> & data,
        value_t regularization) const;

    /// Receive progress notifications from fit(). nullptr disables them.
    void set_reporter(std::shared_ptr<TrainingReporter> reporter);

    const std::vector<uint64_t> & get_topology() const noexcept;
    const std::vector<Tensor<value_t>> & get_biases() const noexcept;
    const std::vector<Tensor<value_t>> & get_weights() const noexcept;
    uint32_t get_seed() const noexcept;

private:
    void validate_topology() const;
    void validate_parameters() const;

    std::vector<uint64_t> m_topology;
    std::vector<Tensor<value_t>> m_biases;
    std::vector<Tensor<value_t>> m_weights;

    std::shared_ptr<const ml::CostFunction<value_t>> m_cost;
    std::shared_ptr<const nn::ActivationFunction<value_t>> m_activation;
    std::shared_ptr<TrainingReporter> m_reporter;

    uint32_t m_seed;
    std::mt19937 m_rng;
};
/// Explicit instantiation of Network for float
extern template class Network<float>;

} // namespace neuron

#endif // NEURON_NETWORK_HPP
