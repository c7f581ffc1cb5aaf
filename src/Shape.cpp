/**
 * @file Shape.cpp
 * @brief Shape descriptor and allocation function definitions.
 */

#include "neuron/Shape.hpp"
#include "neuron/Errors.hpp"

namespace neuron::shape
{

template <typename value_t>
TensorShape shape_of(const Tensor<value_t> & tensor)
{
    return tensor.get_dimensions();
}
template TensorShape shape_of<float>(const Tensor<float>&);

template <typename value_t>
LayerShape shape_of(const std::vector<Tensor<value_t>> & layers)
{
    LayerShape result;
    result.reserve(layers.size());
    for (const Tensor<value_t> & t : layers)
    {
        result.push_back(shape_of(t));
    }
    return result;
}
template LayerShape shape_of<float>(const std::vector<Tensor<float>>&);

template <typename value_t>
BatchShape shape_of(const std::vector<std::vector<Tensor<value_t>>> & batch)
{
    BatchShape result;
    result.reserve(batch.size());
    for (const std::vector<Tensor<value_t>> & layers : batch)
    {
        result.push_back(shape_of(layers));
    }
    return result;
}
template BatchShape shape_of<float>
    (const std::vector<std::vector<Tensor<float>>>&);

LayerShape expand_by(const TensorShape & shape, uint64_t size)
{
    return LayerShape(size, shape);
}

BatchShape expand_by(const LayerShape & shape, uint64_t size)
{
    return BatchShape(size, shape);
}

template <typename value_t>
Tensor<value_t> allocate_like(const TensorShape & shape)
{
    NEURON_CHECK(shape.empty(),
        validation_error,
        R"(allocate_like: tensor shape must not be empty.)");

    return Tensor<value_t>(shape);
}
template Tensor<float> allocate_like<float>(const TensorShape&);

template <typename value_t>
std::vector<Tensor<value_t>> allocate_like(const LayerShape & shape)
{
    std::vector<Tensor<value_t>> result;
    result.reserve(shape.size());
    for (const TensorShape & s : shape)
    {
        result.push_back(allocate_like<value_t>(s));
    }
    return result;
}
template std::vector<Tensor<float>> allocate_like<float>(const LayerShape&);

template <typename value_t>
std::vector<std::vector<Tensor<value_t>>> allocate_like
    (const BatchShape & shape)
{
    std::vector<std::vector<Tensor<value_t>>> result;
    result.reserve(shape.size());
    for (const LayerShape & s : shape)
    {
        result.push_back(allocate_like<value_t>(s));
    }
    return result;
}
template std::vector<std::vector<Tensor<float>>> allocate_like<float>
    (const BatchShape&);

std::mt19937 & default_generator()
{
    static std::mt19937 generator{std::random_device{}()};
    return generator;
}

} // namespace neuron::shape
