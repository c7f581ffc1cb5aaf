/**
 * @file ut_Network.cpp
 * @brief Google Test suite for the network engine.
 *
 * Forward, backward and update results are checked against values
 * computed by hand on small networks.
 */

#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <numeric>

#include <omp.h>

#include "neuron/Errors.hpp"
#include "neuron/Math.hpp"
#include "neuron/Network.hpp"

using namespace neuron;

namespace Test
{

namespace
{

Tensor<float> vec(const std::vector<float> & values)
{
    Tensor<float> t({static_cast<uint64_t>(values.size())});
    t = values;
    return t;
}

Tensor<float> mat(uint64_t rows, uint64_t cols,
    const std::vector<float> & values)
{
    Tensor<float> t({rows, cols});
    t = values;
    return t;
}

float reference_sigmoid(float z)
{
    return 1.0f / (1.0f + std::exp(-z));
}

/// 0.5 * Σ(o - e)², error (o - e) ⊙ σ'(z).
class QuadraticCost : public ml::CostFunction<float>
{
public:
    float computation(const Tensor<float> & output,
        const Tensor<float> & expected) const override
    {
        Tensor<float> diff = output - expected;
        return 0.5f * math::sum(diff, [](float v) { return v * v; });
    }

    Tensor<float> gradient(const Tensor<float> & output,
        const Tensor<float> & expected,
        const Tensor<float> & activation_gradient) const override
    {
        return (output - expected) * activation_gradient;
    }
};

class CountingReporter : public TrainingReporter
{
public:
    void on_batch(uint64_t epoch, uint64_t batch,
        uint64_t batch_count) override
    {
        ++batches;
        last_epoch = epoch;
        last_batch = batch;
        last_batch_count = batch_count;
    }

    void on_epoch(uint64_t epoch,
        const std::optional<Evaluation> & evaluation,
        std::chrono::duration<double> elapsed) override
    {
        ++epochs;
        last_epoch = epoch;
        evaluated = evaluation.has_value();
        last_evaluation = evaluation;
        EXPECT_GE(elapsed.count(), 0.0);
    }

    uint64_t batches = 0;
    uint64_t epochs = 0;
    uint64_t last_epoch = 0;
    uint64_t last_batch = 0;
    uint64_t last_batch_count = 0;
    bool evaluated = false;
    std::optional<Evaluation> last_evaluation;
};

std::shared_ptr<const ml::CostFunction<float>> quadratic()
{
    return std::make_shared<QuadraticCost>();
}

std::shared_ptr<const ml::CostFunction<float>> cross_entropy()
{
    return std::make_shared<ml::CrossEntropyCost<float>>();
}

std::shared_ptr<const nn::ActivationFunction<float>> identity()
{
    return std::make_shared<nn::Identity<float>>();
}

std::shared_ptr<const nn::ActivationFunction<float>> sigmoid()
{
    return std::make_shared<nn::Sigmoid<float>>();
}

/// Topology [2, 2, 1] with fixed parameters.
Network<float> small_network(
    std::shared_ptr<const nn::ActivationFunction<float>> activation)
{
    std::vector<Tensor<float>> biases{vec({0.5f, -1.0f}), vec({0.25f})};
    std::vector<Tensor<float>> weights{mat(2, 2, {1, 2, 3, 4}),
        mat(1, 2, {1, -1})};
    return Network<float>({2, 2, 1}, biases, weights, quadratic(),
        activation, 0u);
}

/// Topology [1, 1] with w and b, identity activation, quadratic cost.
Network<float> scalar_network(float w, float b)
{
    std::vector<Tensor<float>> biases{vec({b})};
    std::vector<Tensor<float>> weights{mat(1, 1, {w})};
    return Network<float>({1, 1}, biases, weights, quadratic(),
        identity(), 0u);
}

/// Three-class dataset separable by the position of the largest input.
std::vector<LabeledData<float>> make_dataset(uint64_t count)
{
    std::vector<LabeledData<float>> data;
    for (uint64_t i = 0; i < count; ++i)
    {
        const uint64_t cls = i % 3;
        std::vector<float> input(3, 0.1f);
        std::vector<float> label(3, 0.0f);
        input[cls] = 0.9f;
        label[cls] = 1.0f;
        data.push_back({vec(input), vec(label)});
    }
    return data;
}

/// Order the network's first shuffle in fit() gives @p count examples.
std::vector<uint64_t> first_fit_order(uint32_t seed, uint64_t count)
{
    std::vector<uint64_t> order(count);
    std::iota(order.begin(), order.end(), 0);
    std::mt19937 rng(seed);
    shape::shuffle(order, rng);
    return order;
}

/// 19 examples for a [1, 1] identity network at w = b = 0. Only the
/// example at @p marker (1 -> 1) has a nonzero gradient.
std::vector<LabeledData<float>> marker_dataset(uint64_t marker)
{
    std::vector<LabeledData<float>> data;
    for (uint64_t i = 0; i < 19; ++i)
    {
        const float value = (i == marker) ? 1.0f : 0.0f;
        data.push_back({vec({value}), vec({value})});
    }
    return data;
}

} // namespace

/**
 * @test NETWORK.initializer_constructor_shapes
 */
TEST(NETWORK, initializer_constructor_shapes)
{
    nn::ScaledNormalInitializer<float> init;
    Network<float> net({4, 3, 2}, init, init, cross_entropy(), sigmoid(),
        123u);

    EXPECT_EQ(net.get_seed(), 123u);
    EXPECT_EQ(net.get_topology(), std::vector<uint64_t>({4, 3, 2}));

    ASSERT_EQ(net.get_biases().size(), 2u);
    ASSERT_EQ(net.get_weights().size(), 2u);
    EXPECT_EQ(net.get_biases()[0].get_dimensions(),
        std::vector<uint64_t>({3}));
    EXPECT_EQ(net.get_biases()[1].get_dimensions(),
        std::vector<uint64_t>({2}));
    EXPECT_EQ(net.get_weights()[0].get_dimensions(),
        std::vector<uint64_t>({3, 4}));
    EXPECT_EQ(net.get_weights()[1].get_dimensions(),
        std::vector<uint64_t>({2, 3}));
}

/**
 * @test NETWORK.same_seed_same_parameters
 */
TEST(NETWORK, same_seed_same_parameters)
{
    nn::NormalInitializer<float> init;
    Network<float> a({3, 5, 2}, init, init, cross_entropy(), sigmoid(), 9u);
    Network<float> b({3, 5, 2}, init, init, cross_entropy(), sigmoid(), 9u);
    Network<float> c({3, 5, 2}, init, init, cross_entropy(), sigmoid(), 10u);

    for (uint64_t p = 0; p < 2; ++p)
    {
        EXPECT_TRUE(a.get_biases()[p] == b.get_biases()[p]);
        EXPECT_TRUE(a.get_weights()[p] == b.get_weights()[p]);
    }
    EXPECT_FALSE(a.get_weights()[0] == c.get_weights()[0]);
}

/**
 * @test NETWORK.invalid_construction
 */
TEST(NETWORK, invalid_construction)
{
    nn::ZeroInitializer<float> init;

    EXPECT_THROW(Network<float>({3}, init, init, quadratic(), identity()),
        validation_error);
    EXPECT_THROW(Network<float>({3, 0, 2}, init, init, quadratic(),
        identity()), validation_error);
    EXPECT_THROW(Network<float>({3, 2}, init, init, nullptr, identity()),
        validation_error);
    EXPECT_THROW(Network<float>({3, 2}, init, init, quadratic(), nullptr),
        validation_error);

    std::vector<Tensor<float>> biases{vec({0.0f, 0.0f})};
    std::vector<Tensor<float>> good_weights{mat(2, 3, {1, 2, 3, 4, 5, 6})};
    std::vector<Tensor<float>> bad_weights{mat(3, 2, {1, 2, 3, 4, 5, 6})};

    EXPECT_NO_THROW(Network<float>({3, 2}, biases, good_weights, quadratic(),
        identity()));
    EXPECT_THROW(Network<float>({3, 2}, biases, bad_weights, quadratic(),
        identity()), validation_error);
    EXPECT_THROW(Network<float>({3, 2, 1}, biases, good_weights, quadratic(),
        identity()), validation_error);
}

/**
 * @test NETWORK.feed_forward_layer_counts
 */
TEST(NETWORK, feed_forward_layer_counts)
{
    nn::ScaledNormalInitializer<float> init;
    Network<float> net({4, 6, 5, 3}, init, init, cross_entropy(), sigmoid(),
        5u);

    ForwardPass<float> pass = net.feed_forward(vec({0.1f, 0.2f, 0.3f, 0.4f}));

    ASSERT_EQ(pass.outputs.size(), 4u);
    ASSERT_EQ(pass.weighted_sums.size(), 4u);
    for (uint64_t l = 0; l < 4; ++l)
    {
        EXPECT_EQ(pass.outputs[l].get_dimensions(),
            std::vector<uint64_t>({net.get_topology()[l]}));
    }
    for (uint64_t l = 1; l < 4; ++l)
    {
        EXPECT_EQ(pass.weighted_sums[l].get_dimensions(),
            std::vector<uint64_t>({net.get_topology()[l]}));
    }
    EXPECT_EQ(pass.weighted_sums[0].get_rank(), 0);
    EXPECT_EQ(pass.outputs[0].to_vector(),
        std::vector<float>({0.1f, 0.2f, 0.3f, 0.4f}));
}

/**
 * @test NETWORK.feed_forward_identity_by_hand
 * @brief z1 = [3.5, 6], z2 = 3.5 - 6 + 0.25.
 */
TEST(NETWORK, feed_forward_identity_by_hand)
{
    Network<float> net = small_network(identity());

    ForwardPass<float> pass = net.feed_forward(vec({1.0f, 1.0f}));

    EXPECT_EQ(pass.weighted_sums[1].to_vector(),
        std::vector<float>({3.5f, 6.0f}));
    EXPECT_EQ(pass.outputs[1].to_vector(), std::vector<float>({3.5f, 6.0f}));
    EXPECT_FLOAT_EQ(pass.outputs[2][0], -2.25f);
}

/**
 * @test NETWORK.feed_forward_sigmoid_by_hand
 */
TEST(NETWORK, feed_forward_sigmoid_by_hand)
{
    Network<float> net = small_network(sigmoid());

    ForwardPass<float> pass = net.feed_forward(vec({1.0f, 1.0f}));

    const float a1 = reference_sigmoid(3.5f);
    const float a2 = reference_sigmoid(6.0f);
    const float z = a1 - a2 + 0.25f;

    EXPECT_NEAR(pass.outputs[1][0], a1, 1e-6);
    EXPECT_NEAR(pass.outputs[1][1], a2, 1e-6);
    EXPECT_NEAR(pass.weighted_sums[2][0], z, 1e-6);
    EXPECT_NEAR(pass.outputs[2][0], reference_sigmoid(z), 1e-6);
}

/**
 * @test NETWORK.feed_forward_wrong_input_size
 */
TEST(NETWORK, feed_forward_wrong_input_size)
{
    Network<float> net = small_network(identity());

    EXPECT_THROW(net.feed_forward(vec({1.0f, 2.0f, 3.0f})), validation_error);
    EXPECT_THROW(net.feed_forward(mat(1, 2, {1, 2})), validation_error);
}

/**
 * @test NETWORK.predict_cross_entropy_sums_to_one
 */
TEST(NETWORK, predict_cross_entropy_sums_to_one)
{
    nn::ScaledNormalInitializer<float> init;
    Network<float> net({3, 4, 3}, init, init, cross_entropy(), sigmoid(),
        42u);

    std::vector<float> p = net.predict(vec({0.2f, 0.5f, 0.9f})).to_vector();

    ASSERT_EQ(p.size(), 3u);
    EXPECT_NEAR(p[0] + p[1] + p[2], 1.0f, 1e-5);
}

/**
 * @test NETWORK.predict_other_cost_is_raw
 */
TEST(NETWORK, predict_other_cost_is_raw)
{
    Network<float> net = small_network(identity());

    Tensor<float> p = net.predict(vec({1.0f, 1.0f}));

    EXPECT_EQ(p.get_dimensions(), std::vector<uint64_t>({1}));
    EXPECT_FLOAT_EQ(p, -2.25f);
}

/**
 * @test NETWORK.backpropagation_shapes
 */
TEST(NETWORK, backpropagation_shapes)
{
    nn::ScaledNormalInitializer<float> init;
    Network<float> net({4, 6, 5, 3}, init, init, cross_entropy(), sigmoid(),
        8u);

    Gradients<float> g = net.backpropagation(vec({0.1f, 0.2f, 0.3f, 0.4f}),
        vec({0.0f, 1.0f, 0.0f}));

    ASSERT_EQ(g.biases.size(), net.get_biases().size());
    ASSERT_EQ(g.weights.size(), net.get_weights().size());
    for (uint64_t p = 0; p < g.biases.size(); ++p)
    {
        EXPECT_EQ(g.biases[p].get_dimensions(),
            net.get_biases()[p].get_dimensions());
        EXPECT_EQ(g.weights[p].get_dimensions(),
            net.get_weights()[p].get_dimensions());
    }
}

/**
 * @test NETWORK.backpropagation_by_hand
 * @brief [1, 1, 1] linear chain: a1 = 2, o = 6, e2 = 6, e1 = 3 * 6.
 */
TEST(NETWORK, backpropagation_by_hand)
{
    std::vector<Tensor<float>> biases{vec({0.0f}), vec({0.0f})};
    std::vector<Tensor<float>> weights{mat(1, 1, {2}), mat(1, 1, {3})};
    Network<float> net({1, 1, 1}, biases, weights, quadratic(), identity(),
        0u);

    Gradients<float> g = net.backpropagation(vec({1.0f}), vec({0.0f}));

    EXPECT_FLOAT_EQ(g.biases[1][0], 6.0f);
    EXPECT_FLOAT_EQ(g.weights[1][0][0], 12.0f);
    EXPECT_FLOAT_EQ(g.biases[0][0], 18.0f);
    EXPECT_FLOAT_EQ(g.weights[0][0][0], 18.0f);
}

/**
 * @test NETWORK.backpropagation_wrong_expected_size
 */
TEST(NETWORK, backpropagation_wrong_expected_size)
{
    Network<float> net = small_network(identity());

    EXPECT_THROW(net.backpropagation(vec({1.0f, 1.0f}), vec({0.0f, 1.0f})),
        validation_error);
}

/**
 * @test NETWORK.update_single_sample_is_gradient_descent
 * @brief o = 2 * 3 + 1 = 7, error 3: w = 2 - 0.1 * 9, b = 1 - 0.1 * 3.
 */
TEST(NETWORK, update_single_sample_is_gradient_descent)
{
    Network<float> net = scalar_network(2.0f, 1.0f);

    net.update_parameters({{vec({3.0f}), vec({4.0f})}}, 0.1f, 0.0f);

    EXPECT_NEAR(net.get_weights()[0][0][0], 1.1f, 1e-6);
    EXPECT_NEAR(net.get_biases()[0][0], 0.7f, 1e-6);
}

/**
 * @test NETWORK.update_batch_with_weight_decay
 * @brief Gradients (1, 1) and (4, 2) with lr 0.5, reg 1, n 2:
 * b = -0.5 * 3 / 2, w = 1 * (1 - 0.25) - 0.5 * 5 / 2.
 */
TEST(NETWORK, update_batch_with_weight_decay)
{
    Network<float> net = scalar_network(1.0f, 0.0f);

    std::vector<LabeledData<float>> batch{
        {vec({1.0f}), vec({0.0f})},
        {vec({2.0f}), vec({0.0f})}};

    net.update_parameters(batch, 0.5f, 1.0f);

    EXPECT_NEAR(net.get_biases()[0][0], -0.75f, 1e-6);
    EXPECT_NEAR(net.get_weights()[0][0][0], -0.5f, 1e-6);
}

/**
 * @test NETWORK.update_matches_averaged_backpropagation
 */
TEST(NETWORK, update_matches_averaged_backpropagation)
{
    nn::ScaledNormalInitializer<float> init;
    Network<float> net({3, 4, 3}, init, init, cross_entropy(), sigmoid(),
        77u);
    const std::vector<LabeledData<float>> batch = make_dataset(5);

    std::vector<Tensor<float>> expected_weights;
    for (uint64_t p = 0; p < net.get_weights().size(); ++p)
    {
        Tensor<float> sum = math::zeros<float>(
            net.get_weights()[p].get_dimensions());
        for (const LabeledData<float> & ex : batch)
        {
            sum = sum + net.backpropagation(ex.input, ex.expected).weights[p];
        }
        expected_weights.push_back(net.get_weights()[p] -
            sum * (0.3f / 5.0f));
    }

    net.update_parameters(batch, 0.3f, 0.0f);

    for (uint64_t p = 0; p < expected_weights.size(); ++p)
    {
        std::vector<float> got = net.get_weights()[p].to_vector();
        std::vector<float> want = expected_weights[p].to_vector();
        for (size_t i = 0; i < got.size(); ++i)
        {
            EXPECT_NEAR(got[i], want[i], 1e-5);
        }
    }
}

/**
 * @test NETWORK.update_batch_larger_than_thread_count
 * @brief Every sample contributes once when threads handle several each.
 */
TEST(NETWORK, update_batch_larger_than_thread_count)
{
    Network<float> net = scalar_network(1.0f, 0.0f);

    const uint64_t n =
        4 * static_cast<uint64_t>(std::max(1, omp_get_max_threads())) + 3;
    std::vector<LabeledData<float>> batch;
    double error_sum = 0.0;
    for (uint64_t i = 0; i < n; ++i)
    {
        const float expected = -static_cast<float>(i % 3);
        batch.push_back({vec({1.0f}), vec({expected})});
        error_sum += 1.0 - expected;
    }
    const double mean_error = error_sum / static_cast<double>(n);

    net.update_parameters(batch, 0.5f, 0.0f);

    EXPECT_NEAR(net.get_biases()[0][0], -0.5 * mean_error, 1e-5);
    EXPECT_NEAR(net.get_weights()[0][0][0], 1.0 - 0.5 * mean_error, 1e-5);
}

/**
 * @test NETWORK.update_empty_batch_throws
 */
TEST(NETWORK, update_empty_batch_throws)
{
    Network<float> net = scalar_network(1.0f, 0.0f);

    EXPECT_THROW(net.update_parameters({}, 0.1f, 0.0f), validation_error);
}

/**
 * @test NETWORK.update_failure_leaves_parameters
 * @brief A malformed sample fails the batch without touching parameters.
 */
TEST(NETWORK, update_failure_leaves_parameters)
{
    Network<float> net = scalar_network(1.0f, 0.0f);

    std::vector<LabeledData<float>> batch{
        {vec({1.0f}), vec({0.0f})},
        {vec({1.0f, 2.0f}), vec({0.0f})}};

    EXPECT_THROW(net.update_parameters(batch, 0.5f, 0.0f), validation_error);
    EXPECT_FLOAT_EQ(net.get_weights()[0][0][0], 1.0f);
    EXPECT_FLOAT_EQ(net.get_biases()[0][0], 0.0f);
}

/**
 * @test NETWORK.evaluate_accuracy_and_cost
 * @brief Identity weights: one of two examples is right. Mean quadratic
 * cost 0.5 plus L2 penalty 0.5 * (1 / 2) * 2.
 */
TEST(NETWORK, evaluate_accuracy_and_cost)
{
    std::vector<Tensor<float>> biases{vec({0.0f, 0.0f})};
    std::vector<Tensor<float>> weights{mat(2, 2, {1, 0, 0, 1})};
    Network<float> net({2, 2}, biases, weights, quadratic(), identity(), 0u);

    std::vector<LabeledData<float>> data{
        {vec({1.0f, 0.0f}), vec({1.0f, 0.0f})},
        {vec({0.0f, 1.0f}), vec({1.0f, 0.0f})}};

    Evaluation eval = net.evaluate(QuadraticCost(), data, 1.0f);

    EXPECT_DOUBLE_EQ(eval.accuracy, 0.5);
    EXPECT_NEAR(eval.mean_cost, 1.0, 1e-6);

    EXPECT_THROW(net.evaluate(QuadraticCost(), {}, 0.0f), validation_error);
}

/**
 * @test NETWORK.fit_reports_progress
 * @brief 20 examples: 2 held out, 18 in batches of 4 gives 5 batches.
 */
TEST(NETWORK, fit_reports_progress)
{
    nn::ScaledNormalInitializer<float> init;
    Network<float> net({3, 4, 3}, init, init, cross_entropy(), sigmoid(),
        11u);
    auto reporter = std::make_shared<CountingReporter>();
    net.set_reporter(reporter);

    net.fit(make_dataset(20), 2, 4, 0.5f, 0.0f);

    EXPECT_EQ(reporter->batches, 10u);
    EXPECT_EQ(reporter->epochs, 2u);
    EXPECT_EQ(reporter->last_epoch, 2u);
    EXPECT_EQ(reporter->last_batch, 5u);
    EXPECT_EQ(reporter->last_batch_count, 5u);
    EXPECT_TRUE(reporter->evaluated);
}

/**
 * @test NETWORK.fit_small_data_has_no_evaluation
 */
TEST(NETWORK, fit_small_data_has_no_evaluation)
{
    nn::ScaledNormalInitializer<float> init;
    Network<float> net({3, 4, 3}, init, init, cross_entropy(), sigmoid(),
        11u);
    auto reporter = std::make_shared<CountingReporter>();
    net.set_reporter(reporter);

    net.fit(make_dataset(5), 1, 10, 0.5f, 0.0f);

    EXPECT_EQ(reporter->batches, 1u);
    EXPECT_EQ(reporter->epochs, 1u);
    EXPECT_FALSE(reporter->evaluated);
}

/**
 * @test NETWORK.fit_holds_out_first_tenth
 * @brief 19 examples: exactly the first one after the initial shuffle is
 * held out, evaluated, and never trained on.
 */
TEST(NETWORK, fit_holds_out_first_tenth)
{
    const std::vector<uint64_t> order = first_fit_order(0u, 19);

    Network<float> held = scalar_network(0.0f, 0.0f);
    auto reporter = std::make_shared<CountingReporter>();
    held.set_reporter(reporter);

    held.fit(marker_dataset(order[0]), 1, 4, 0.5f, 0.0f);

    EXPECT_FLOAT_EQ(held.get_biases()[0][0], 0.0f);
    EXPECT_FLOAT_EQ(held.get_weights()[0][0][0], 0.0f);
    EXPECT_EQ(reporter->batches, 5u);
    EXPECT_EQ(reporter->last_batch_count, 5u);
    ASSERT_TRUE(reporter->last_evaluation.has_value());
    EXPECT_DOUBLE_EQ(reporter->last_evaluation->accuracy, 1.0);
    EXPECT_NEAR(reporter->last_evaluation->mean_cost, 0.5, 1e-6);

    Network<float> trained = scalar_network(0.0f, 0.0f);
    trained.fit(marker_dataset(order[1]), 1, 4, 0.5f, 0.0f);

    EXPECT_GT(trained.get_biases()[0][0], 0.0f);
    EXPECT_GT(trained.get_weights()[0][0][0], 0.0f);
}

/**
 * @test NETWORK.fit_is_deterministic_for_a_seed
 */
TEST(NETWORK, fit_is_deterministic_for_a_seed)
{
    nn::ScaledNormalInitializer<float> init;
    Network<float> a({3, 5, 3}, init, init, cross_entropy(), sigmoid(), 21u);
    Network<float> b({3, 5, 3}, init, init, cross_entropy(), sigmoid(), 21u);

    a.fit(make_dataset(30), 3, 4, 1.0f, 0.1f);
    b.fit(make_dataset(30), 3, 4, 1.0f, 0.1f);

    for (uint64_t p = 0; p < 2; ++p)
    {
        EXPECT_TRUE(a.get_biases()[p] == b.get_biases()[p]);
        EXPECT_TRUE(a.get_weights()[p] == b.get_weights()[p]);
    }
}

/**
 * @test NETWORK.fit_learns_separable_data
 */
TEST(NETWORK, fit_learns_separable_data)
{
    nn::ScaledNormalInitializer<float> init;
    Network<float> net({3, 6, 3}, init, init, cross_entropy(), sigmoid(),
        2024u);

    std::vector<LabeledData<float>> data = make_dataset(60);
    const Evaluation before = net.evaluate(ml::CrossEntropyCost<float>(),
        data, 0.0f);

    net.fit(data, 30, 6, 2.0f, 0.0f);

    const Evaluation after = net.evaluate(ml::CrossEntropyCost<float>(),
        data, 0.0f);
    EXPECT_LT(after.mean_cost, before.mean_cost);
    EXPECT_DOUBLE_EQ(after.accuracy, 1.0);
}

/**
 * @test NETWORK.fit_invalid_arguments
 */
TEST(NETWORK, fit_invalid_arguments)
{
    Network<float> net = scalar_network(1.0f, 0.0f);

    EXPECT_THROW(net.fit({}, 1, 1, 0.1f, 0.0f), validation_error);
    EXPECT_THROW(net.fit({{vec({1.0f}), vec({0.0f})}}, 1, 0, 0.1f, 0.0f),
        validation_error);
}

} // namespace Test
