/**
 * @file ML.hpp
 * @brief Machine learning utilities.
 *
 * Provides cost functions and output normalization used to train and
 * query the network.
 */

#ifndef NEURON_ML_HPP
#define NEURON_ML_HPP

#include "Tensor.hpp"

namespace neuron::ml
{

/**
 * @brief Compute the softmax of a tensor over all its elements.
 *
 * Produces a tensor where every element is exponentiated and normalized
 * so that the values sum to 1.
 *
 * @param tensor Input tensor. Must contain at least one element.
 * @return A new tensor with the same shape as @p tensor containing
 * the normalized values.
 *
 * @throws validation_error If the tensor is empty.
 */
template<typename value_t>
Tensor<value_t> softmax(const Tensor<value_t> & tensor);
/// Explicit instantiation of softmax for float
extern template Tensor<float> softmax<float>(const Tensor<float>&);

/**
 * @brief Cost function interface.
 *
 * A cost function measures how far the network output is from the
 * expected output, and provides the error signal of the output layer
 * used to start backpropagation.
 *
 * @tparam value_t Floating point type of the network.
 */
template<typename value_t>
class CostFunction
{
public:
    virtual ~CostFunction() = default;

    /**
     * @brief Scalar loss of one example.
     *
     * @param output Final layer activations.
     * @param expected Expected output.
     */
    virtual value_t computation(const Tensor<value_t> & output,
        const Tensor<value_t> & expected) const = 0;

    /**
     * @brief Per-neuron error of the output layer.
     *
     * @param output Final layer activations.
     * @param expected Expected output.
     * @param activation_gradient Activation derivative evaluated at the
     * final layer weighted sums.
     */
    virtual Tensor<value_t> gradient(const Tensor<value_t> & output,
        const Tensor<value_t> & expected,
        const Tensor<value_t> & activation_gradient) const = 0;
};

/**
 * @brief Binary cross-entropy cost.
 *
 * Loss is the mean over neurons of
 * -e * log(o) - (1 - e) * log(1 - o). Each term is passed through
 * NanToNum before the reduction, so a saturated neuron yields a large
 * finite term instead of poisoning the total.
 *
 * @warning gradient() returns output - expected and ignores the
 * activation gradient. The activation derivative cancels only when the
 * output layer is a sigmoid (or softmax); with any other output
 * activation the returned error is wrong. Network::predict also
 * recognizes this class and softmax-normalizes its result.
 */
template<typename value_t>
class CrossEntropyCost : public CostFunction<value_t>
{
public:
    /**
     * @throws validation_error if @p output and @p expected differ in shape.
     */
    value_t computation(const Tensor<value_t> & output,
        const Tensor<value_t> & expected) const override;

    /**
     * @throws validation_error if @p output and @p expected differ in shape.
     */
    Tensor<value_t> gradient(const Tensor<value_t> & output,
        const Tensor<value_t> & expected,
        const Tensor<value_t> & activation_gradient) const override;
};
/// Explicit instantiation of CrossEntropyCost for float
extern template class CrossEntropyCost<float>;

} // namespace neuron::ml

#endif // NEURON_ML_HPP
