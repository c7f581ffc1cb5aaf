/**
 * @file Network.cpp
 * @brief Network engine definitions.
 */

#include "neuron/Network.hpp"
#include "neuron/Math.hpp"
#include "neuron/Errors.hpp"

#include <algorithm>
#include <chrono>
#include <exception>

#include <omp.h>

namespace neuron
{

template<typename value_t>
Network<value_t>::Network(const std::vector<uint64_t> & topology,
    const nn::BiasInitializer<value_t> & bias_initializer,
    const nn::WeightInitializer<value_t> & weight_initializer,
    std::shared_ptr<const ml::CostFunction<value_t>> cost,
    std::shared_ptr<const nn::ActivationFunction<value_t>> activation,
    std::optional<uint32_t> seed)
    : m_topology(topology),
      m_cost(std::move(cost)),
      m_activation(std::move(activation)),
      m_seed(seed.has_value() ? *seed : std::random_device{}()),
      m_rng(m_seed)
{
    validate_topology();

    const uint64_t layers = m_topology.size() - 1;
    m_biases.reserve(layers);
    m_weights.reserve(layers);

    for (uint64_t l = 1; l <= layers; ++l)
    {
        m_biases.push_back(
            bias_initializer.initialize_bias({m_topology[l]}, m_rng));
    }
    for (uint64_t l = 1; l <= layers; ++l)
    {
        m_weights.push_back(weight_initializer.initialize_weight(
            {m_topology[l], m_topology[l - 1]}, m_rng));
    }

    validate_parameters();
}

template<typename value_t>
Network<value_t>::Network(const std::vector<uint64_t> & topology,
    const std::vector<Tensor<value_t>> & biases,
    const std::vector<Tensor<value_t>> & weights,
    std::shared_ptr<const ml::CostFunction<value_t>> cost,
    std::shared_ptr<const nn::ActivationFunction<value_t>> activation,
    std::optional<uint32_t> seed)
    : m_topology(topology),
      m_biases(biases),
      m_weights(weights),
      m_cost(std::move(cost)),
      m_activation(std::move(activation)),
      m_seed(seed.has_value() ? *seed : std::random_device{}()),
      m_rng(m_seed)
{
    validate_topology();
    validate_parameters();
}

template<typename value_t>
void Network<value_t>::validate_topology() const
{
    NEURON_CHECK(m_topology.size() < 2,
        validation_error,
        R"(Network: topology needs an input and an output layer.)");

    for (uint64_t size : m_topology)
    {
        NEURON_CHECK(size == 0,
            validation_error,
            R"(Network: layer sizes must be positive.)");
    }

    NEURON_CHECK(!m_cost,
        validation_error,
        R"(Network: cost function must not be null.)");

    NEURON_CHECK(!m_activation,
        validation_error,
        R"(Network: activation function must not be null.)");
}

template<typename value_t>
void Network<value_t>::validate_parameters() const
{
    const uint64_t layers = m_topology.size() - 1;

    NEURON_CHECK(m_biases.size() != layers || m_weights.size() != layers,
        validation_error,
        R"(Network: expected one bias vector and one weight matrix
            per non-input layer.)");

    for (uint64_t p = 0; p < layers; ++p)
    {
        const shape::TensorShape bias_shape{m_topology[p + 1]};
        const shape::TensorShape weight_shape{m_topology[p + 1],
            m_topology[p]};

        NEURON_CHECK(shape::shape_of(m_biases[p]) != bias_shape,
            validation_error,
            R"(Network: bias vector shape does not match topology.)");

        NEURON_CHECK(shape::shape_of(m_weights[p]) != weight_shape,
            validation_error,
            R"(Network: weight matrix shape does not match topology.)");
    }
}

template<typename value_t>
ForwardPass<value_t> Network<value_t>::feed_forward(
    const Tensor<value_t> & input) const
{
    NEURON_CHECK(input.get_rank() != 1 ||
        input.get_dimensions()[0] != m_topology[0],
        validation_error,
        R"(Network(feed_forward):
            input must be a vector of the input layer size.)");

    ForwardPass<value_t> pass;
    pass.outputs.reserve(m_topology.size());
    pass.weighted_sums.reserve(m_topology.size());

    pass.outputs.push_back(input);
    pass.weighted_sums.emplace_back();

    for (uint64_t p = 0; p < m_weights.size(); ++p)
    {
        Tensor<value_t> z =
            math::matmul(m_weights[p], pass.outputs.back()) + m_biases[p];
        pass.outputs.push_back(m_activation->compute(z));
        pass.weighted_sums.push_back(std::move(z));
    }

    return pass;
}

template<typename value_t>
Tensor<value_t> Network<value_t>::predict(const Tensor<value_t> & input) const
{
    ForwardPass<value_t> pass = feed_forward(input);

    if (dynamic_cast<const ml::CrossEntropyCost<value_t>*>(m_cost.get()))
    {
        return ml::softmax(pass.outputs.back());
    }
    return std::move(pass.outputs.back());
}

template<typename value_t>
Gradients<value_t> Network<value_t>::backpropagation(
    const Tensor<value_t> & input,
    const Tensor<value_t> & expected) const
{
    NEURON_CHECK(expected.get_rank() != 1 ||
        expected.get_dimensions()[0] != m_topology.back(),
        validation_error,
        R"(Network(backpropagation):
            expected must be a vector of the output layer size.)");

    const ForwardPass<value_t> pass = feed_forward(input);
    const uint64_t layers = m_weights.size();

    Gradients<value_t> grads;
    grads.biases.resize(layers);
    grads.weights.resize(layers);

    Tensor<value_t> error = m_cost->gradient(pass.outputs[layers],
        expected,
        m_activation->gradient(pass.weighted_sums[layers]));

    grads.weights[layers - 1] = math::outer(error, pass.outputs[layers - 1]);
    grads.biases[layers - 1] = std::move(error);

    // Parameter index p belongs to layer p + 1; the error of layer p + 2
    // flows back through the weights at index p + 1.
    for (uint64_t p = layers - 1; p-- > 0;)
    {
        error = math::matmul(math::transpose(m_weights[p + 1]),
                    grads.biases[p + 1]) *
                m_activation->gradient(pass.weighted_sums[p + 1]);

        grads.weights[p] = math::outer(error, pass.outputs[p]);
        grads.biases[p] = std::move(error);
    }

    return grads;
}

template<typename value_t>
void Network<value_t>::update_parameters(
    const std::vector<LabeledData<value_t>> & batch,
    value_t learning_rate,
    value_t regularization)
{
    NEURON_CHECK(batch.empty(),
        validation_error,
        R"(Network(update_parameters): batch is empty.)");

    const uint64_t n = batch.size();
    const uint64_t layers = m_weights.size();

    std::vector<std::vector<Tensor<value_t>>> bias_slots =
        shape::allocate_like<value_t>(
            shape::expand_by(shape::shape_of(m_biases), n));
    std::vector<std::vector<Tensor<value_t>>> weight_slots =
        shape::allocate_like<value_t>(
            shape::expand_by(shape::shape_of(m_weights), n));
    std::vector<std::exception_ptr> failures(n);

    const int workers = static_cast<int>(
        std::min<uint64_t>(n, static_cast<uint64_t>(omp_get_max_threads())));
    const int64_t samples = static_cast<int64_t>(n);

    // Each sample writes only its own slots; the region end is the join.
    #pragma omp parallel for schedule(static) num_threads(workers)
    for (int64_t i = 0; i < samples; ++i)
    {
        try
        {
            Gradients<value_t> grads =
                backpropagation(batch[i].input, batch[i].expected);
            for (uint64_t p = 0; p < layers; ++p)
            {
                bias_slots[i][p] = std::move(grads.biases[p]);
                weight_slots[i][p] = std::move(grads.weights[p]);
            }
        }
        catch (...)
        {
            failures[i] = std::current_exception();
        }
    }

    for (const std::exception_ptr & failure : failures)
    {
        if (failure)
        {
            std::rethrow_exception(failure);
        }
    }

    const value_t batch_size = static_cast<value_t>(n);
    const value_t step = learning_rate / batch_size;
    const value_t decay = static_cast<value_t>(1) -
        learning_rate * regularization / batch_size;

    for (uint64_t p = 0; p < layers; ++p)
    {
        Tensor<value_t> bias_sum = bias_slots[0][p];
        Tensor<value_t> weight_sum = weight_slots[0][p];
        for (uint64_t i = 1; i < n; ++i)
        {
            bias_sum = bias_sum + bias_slots[i][p];
            weight_sum = weight_sum + weight_slots[i][p];
        }

        m_biases[p] = m_biases[p] - bias_sum * step;
        m_weights[p] = m_weights[p] * decay - weight_sum * step;
    }
}

template<typename value_t>
void Network<value_t>::fit(std::vector<LabeledData<value_t>> data,
    uint64_t epochs,
    uint64_t batch_size,
    value_t learning_rate,
    value_t regularization)
{
    NEURON_CHECK(data.empty(),
        validation_error,
        R"(Network(fit): training data is empty.)");

    NEURON_CHECK(batch_size == 0,
        validation_error,
        R"(Network(fit): batch size must be positive.)");

    shape::shuffle(data, m_rng);

    const uint64_t validation_size = data.size() / 10;
    std::vector<LabeledData<value_t>> validation(data.begin(),
        data.begin() + validation_size);
    std::vector<LabeledData<value_t>> pool(data.begin() + validation_size,
        data.end());

    NEURON_CHECK(pool.empty(),
        validation_error,
        R"(Network(fit): no training data left after the validation split.)");

    const uint64_t batch_count = (pool.size() + batch_size - 1) / batch_size;

    for (uint64_t epoch = 1; epoch <= epochs; ++epoch)
    {
        shape::shuffle(pool, m_rng);

        const auto start = std::chrono::steady_clock::now();

        for (uint64_t b = 0; b < batch_count; ++b)
        {
            const uint64_t first = b * batch_size;
            const uint64_t last = std::min<uint64_t>(first + batch_size,
                pool.size());
            const std::vector<LabeledData<value_t>> batch(
                pool.begin() + first, pool.begin() + last);

            update_parameters(batch, learning_rate, regularization);

            if (m_reporter)
            {
                m_reporter->on_batch(epoch, b + 1, batch_count);
            }
        }

        const std::chrono::duration<double> elapsed =
            std::chrono::steady_clock::now() - start;

        std::optional<Evaluation> evaluation;
        if (!validation.empty())
        {
            evaluation = evaluate(*m_cost, validation, regularization);
        }

        if (m_reporter)
        {
            m_reporter->on_epoch(epoch, evaluation, elapsed);
        }
    }
}

template<typename value_t>
Evaluation Network<value_t>::evaluate(const ml::CostFunction<value_t> & cost,
    const std::vector<LabeledData<value_t>> & data,
    value_t regularization) const
{
    NEURON_CHECK(data.empty(),
        validation_error,
        R"(Network(evaluate): data is empty.)");

    uint64_t correct = 0;
    double total_cost = 0.0;

    for (const LabeledData<value_t> & example : data)
    {
        const ForwardPass<value_t> pass = feed_forward(example.input);
        const Tensor<value_t> & output = pass.outputs.back();

        if (math::argmax(output) == math::argmax(example.expected))
        {
            ++correct;
        }
        total_cost += static_cast<double>(
            cost.computation(output, example.expected));
    }

    double squared_weights = 0.0;
    for (const Tensor<value_t> & w : m_weights)
    {
        squared_weights += static_cast<double>(
            math::sum(w, [](value_t v) { return v * v; }));
    }

    const double n = static_cast<double>(data.size());

    Evaluation result;
    result.accuracy = static_cast<double>(correct) / n;
    result.mean_cost = total_cost / n +
        0.5 * (static_cast<double>(regularization) / n) * squared_weights;
    return result;
}

template<typename value_t>
void Network<value_t>::set_reporter(std::shared_ptr<TrainingReporter> reporter)
{
    m_reporter = std::move(reporter);
}

template<typename value_t>
const std::vector<uint64_t> & Network<value_t>::get_topology() const noexcept
{
    return m_topology;
}

template<typename value_t>
const std::vector<Tensor<value_t>> &
Network<value_t>::get_biases() const noexcept
{
    return m_biases;
}

template<typename value_t>
const std::vector<Tensor<value_t>> &
Network<value_t>::get_weights() const noexcept
{
    return m_weights;
}

template<typename value_t>
uint32_t Network<value_t>::get_seed() const noexcept
{
    return m_seed;
}

template class Network<float>;

} // namespace neuron
