/**
 * @file ML.cpp
 * @brief Machine learning utilities definitions.
 */

#include "neuron/ML.hpp"
#include "neuron/Math.hpp"
#include "neuron/Errors.hpp"

namespace neuron::ml
{

template<typename value_t>
Tensor<value_t> softmax(const Tensor<value_t> & tensor)
{
    NEURON_CHECK(tensor.get_rank() == 0,
        validation_error,
        R"(softmax: input tensor has no elements.)");

    // Shifting by the maximum keeps exp finite for large activations.
    const value_t peak = tensor.to_vector()[math::argmax(tensor)];
    Tensor<value_t> ex = math::exp(tensor - peak);

    return ex / math::sum(ex);
}
template Tensor<float> softmax<float>(const Tensor<float>&);

template<typename value_t>
value_t CrossEntropyCost<value_t>::computation(const Tensor<value_t> & output,
    const Tensor<value_t> & expected) const
{
    NEURON_CHECK(output.get_dimensions() != expected.get_dimensions(),
        validation_error,
        R"(CrossEntropyCost(computation):
            output and expected shapes differ.)");

    Tensor<value_t> penalty_for_one_label = -expected * math::log(output);
    Tensor<value_t> penalty_for_zero_label =
        math::one_minus(expected) * math::log(math::one_minus(output));

    Tensor<value_t> terms = penalty_for_one_label - penalty_for_zero_label;

    const value_t total = math::sum(terms, math::NanToNum{});
    return total / static_cast<value_t>(terms.get_num_elements());
}

template<typename value_t>
Tensor<value_t> CrossEntropyCost<value_t>::gradient(
    const Tensor<value_t> & output,
    const Tensor<value_t> & expected,
    const Tensor<value_t> & /*activation_gradient*/) const
{
    NEURON_CHECK(output.get_dimensions() != expected.get_dimensions(),
        validation_error,
        R"(CrossEntropyCost(gradient):
            output and expected shapes differ.)");

    return output - expected;
}

template class CrossEntropyCost<float>;

} // namespace neuron::ml
