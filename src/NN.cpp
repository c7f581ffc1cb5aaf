/**
 * @file NN.cpp
 * @brief Activation function and initializer definitions.
 */

#include "neuron/NN.hpp"
#include "neuron/Math.hpp"
#include "neuron/Errors.hpp"

#include <cmath>

namespace neuron::nn
{

namespace
{

template<typename value_t>
Tensor<value_t> normal_tensor(const shape::TensorShape & shape,
    value_t mean,
    value_t stddev,
    std::mt19937 & rng)
{
    Tensor<value_t> result = shape::allocate_like<value_t>(shape);

    std::normal_distribution<value_t> distribution(mean, stddev);
    std::vector<value_t> values(result.get_num_elements());
    for (value_t & v : values)
    {
        v = distribution(rng);
    }

    result = values;
    return result;
}

} // namespace

template<typename value_t>
Tensor<value_t> Sigmoid<value_t>::compute(const Tensor<value_t> & z) const
{
    return math::map(z, [](value_t v)
    {
        return static_cast<value_t>(1) /
            (static_cast<value_t>(1) + sycl::exp(-v));
    });
}

template<typename value_t>
Tensor<value_t> Sigmoid<value_t>::gradient(const Tensor<value_t> & z) const
{
    return math::map(z, [](value_t v)
    {
        const value_t s = static_cast<value_t>(1) /
            (static_cast<value_t>(1) + sycl::exp(-v));
        return s * (static_cast<value_t>(1) - s);
    });
}

template class Sigmoid<float>;

template<typename value_t>
Tensor<value_t> ReLU<value_t>::compute(const Tensor<value_t> & z) const
{
    return math::map(z, [](value_t v)
    {
        return v > static_cast<value_t>(0) ? v : static_cast<value_t>(0);
    });
}

template<typename value_t>
Tensor<value_t> ReLU<value_t>::gradient(const Tensor<value_t> & z) const
{
    return math::map(z, [](value_t v)
    {
        return v > static_cast<value_t>(0) ?
            static_cast<value_t>(1) : static_cast<value_t>(0);
    });
}

template class ReLU<float>;

template<typename value_t>
Tensor<value_t> Identity<value_t>::compute(const Tensor<value_t> & z) const
{
    return z.clone();
}

template<typename value_t>
Tensor<value_t> Identity<value_t>::gradient(const Tensor<value_t> & z) const
{
    return math::map(z, [](value_t) { return static_cast<value_t>(1); });
}

template class Identity<float>;

template<typename value_t>
Tensor<value_t> ZeroInitializer<value_t>::initialize_bias(
    const shape::TensorShape & shape, std::mt19937 & /*rng*/) const
{
    return shape::allocate_like<value_t>(shape);
}

template<typename value_t>
Tensor<value_t> ZeroInitializer<value_t>::initialize_weight(
    const shape::TensorShape & shape, std::mt19937 & /*rng*/) const
{
    return shape::allocate_like<value_t>(shape);
}

template class ZeroInitializer<float>;

template<typename value_t>
NormalInitializer<value_t>::NormalInitializer(value_t mean, value_t stddev)
    : m_mean(mean),
      m_stddev(stddev)
{
    NEURON_CHECK(!std::isfinite(stddev) || !(stddev > static_cast<value_t>(0)),
        validation_error,
        R"(NormalInitializer: stddev must be finite and positive.)");
}

template<typename value_t>
Tensor<value_t> NormalInitializer<value_t>::initialize_bias(
    const shape::TensorShape & shape, std::mt19937 & rng) const
{
    return normal_tensor(shape, m_mean, m_stddev, rng);
}

template<typename value_t>
Tensor<value_t> NormalInitializer<value_t>::initialize_weight(
    const shape::TensorShape & shape, std::mt19937 & rng) const
{
    return normal_tensor(shape, m_mean, m_stddev, rng);
}

template class NormalInitializer<float>;

template<typename value_t>
Tensor<value_t> ScaledNormalInitializer<value_t>::initialize_bias(
    const shape::TensorShape & shape, std::mt19937 & rng) const
{
    return initialize_weight(shape, rng);
}

template<typename value_t>
Tensor<value_t> ScaledNormalInitializer<value_t>::initialize_weight(
    const shape::TensorShape & shape, std::mt19937 & rng) const
{
    NEURON_CHECK(shape.empty(),
        validation_error,
        R"(ScaledNormalInitializer: shape must not be empty.)");

    const value_t fan_in = static_cast<value_t>(shape.back());
    return normal_tensor(shape, static_cast<value_t>(0),
        static_cast<value_t>(1) / std::sqrt(fan_in), rng);
}

template class ScaledNormalInitializer<float>;

} // namespace neuron::nn
