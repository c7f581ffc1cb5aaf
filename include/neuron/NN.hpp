/**
 * @file NN.hpp
 * @brief Neural network building blocks.
 *
 * Provides the activation function and parameter initializer
 * interfaces consumed by the network engine, with reference
 * implementations.
 */

#ifndef NEURON_NN_HPP
#define NEURON_NN_HPP

#include <random>

#include "Tensor.hpp"
#include "Shape.hpp"

namespace neuron::nn
{

/**
 * @brief Activation function interface.
 *
 * Both operations are elementwise and return a tensor of the same
 * shape as their input.
 */
template<typename value_t>
class ActivationFunction
{
public:
    virtual ~ActivationFunction() = default;

    /// Activation of the weighted sums @p z.
    virtual Tensor<value_t> compute(const Tensor<value_t> & z) const = 0;

    /// Derivative of the activation evaluated at @p z.
    virtual Tensor<value_t> gradient(const Tensor<value_t> & z) const = 0;
};

/**
 * @brief Logistic sigmoid, 1 / (1 + e^-z).
 */
template<typename value_t>
class Sigmoid : public ActivationFunction<value_t>
{
public:
    Tensor<value_t> compute(const Tensor<value_t> & z) const override;

    /// σ(z) * (1 - σ(z)).
    Tensor<value_t> gradient(const Tensor<value_t> & z) const override;
};
/// Explicit instantiation of Sigmoid for float
extern template class Sigmoid<float>;

/**
 * @brief Rectified linear unit, max(0, z).
 */
template<typename value_t>
class ReLU : public ActivationFunction<value_t>
{
public:
    Tensor<value_t> compute(const Tensor<value_t> & z) const override;

    /// 1 where z > 0, else 0.
    Tensor<value_t> gradient(const Tensor<value_t> & z) const override;
};
/// Explicit instantiation of ReLU for float
extern template class ReLU<float>;

/**
 * @brief Identity activation; the network stays linear.
 */
template<typename value_t>
class Identity : public ActivationFunction<value_t>
{
public:
    Tensor<value_t> compute(const Tensor<value_t> & z) const override;

    /// All ones.
    Tensor<value_t> gradient(const Tensor<value_t> & z) const override;
};
/// Explicit instantiation of Identity for float
extern template class Identity<float>;

/**
 * @brief Bias initializer interface.
 *
 * Produces the initial bias vector of one layer.
 */
template<typename value_t>
class BiasInitializer
{
public:
    virtual ~BiasInitializer() = default;

    /**
     * @param shape {layer size}.
     * @param rng Random source owned by the network.
     */
    virtual Tensor<value_t> initialize_bias(const shape::TensorShape & shape,
        std::mt19937 & rng) const = 0;
};

/**
 * @brief Weight initializer interface.
 *
 * Produces the initial weight matrix of one layer.
 */
template<typename value_t>
class WeightInitializer
{
public:
    virtual ~WeightInitializer() = default;

    /**
     * @param shape {layer size, previous layer size}.
     * @param rng Random source owned by the network.
     */
    virtual Tensor<value_t> initialize_weight(const shape::TensorShape & shape,
        std::mt19937 & rng) const = 0;
};

/**
 * @brief All-zero biases and weights.
 */
template<typename value_t>
class ZeroInitializer : public BiasInitializer<value_t>,
                        public WeightInitializer<value_t>
{
public:
    Tensor<value_t> initialize_bias(const shape::TensorShape & shape,
        std::mt19937 & rng) const override;

    Tensor<value_t> initialize_weight(const shape::TensorShape & shape,
        std::mt19937 & rng) const override;
};
/// Explicit instantiation of ZeroInitializer for float
extern template class ZeroInitializer<float>;

/**
 * @brief Values drawn from N(mean, stddev²).
 */
template<typename value_t>
class NormalInitializer : public BiasInitializer<value_t>,
                          public WeightInitializer<value_t>
{
public:
    /**
     * @throws validation_error if @p stddev is not a finite positive value.
     */
    explicit NormalInitializer(value_t mean = static_cast<value_t>(0),
        value_t stddev = static_cast<value_t>(1));

    Tensor<value_t> initialize_bias(const shape::TensorShape & shape,
        std::mt19937 & rng) const override;

    Tensor<value_t> initialize_weight(const shape::TensorShape & shape,
        std::mt19937 & rng) const override;

private:
    value_t m_mean;
    value_t m_stddev;
};
/// Explicit instantiation of NormalInitializer for float
extern template class NormalInitializer<float>;

/**
 * @brief Standard normal values divided by sqrt(fan-in).
 *
 * The fan-in is the last dimension of the requested shape (the previous
 * layer size for a weight matrix). Keeps the weighted sums of a fresh
 * network near unit variance so sigmoid neurons do not start saturated.
 */
template<typename value_t>
class ScaledNormalInitializer : public BiasInitializer<value_t>,
                                public WeightInitializer<value_t>
{
public:
    Tensor<value_t> initialize_bias(const shape::TensorShape & shape,
        std::mt19937 & rng) const override;

    Tensor<value_t> initialize_weight(const shape::TensorShape & shape,
        std::mt19937 & rng) const override;
};
/// Explicit instantiation of ScaledNormalInitializer for float
extern template class ScaledNormalInitializer<float>;

} // namespace neuron::nn

#endif // NEURON_NN_HPP
