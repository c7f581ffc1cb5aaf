/**
 * @file Reporter.hpp
 * @brief Training progress reporting.
 */

#ifndef NEURON_REPORTER_HPP
#define NEURON_REPORTER_HPP

#include <chrono>
#include <cstdint>
#include <iostream>
#include <optional>

namespace neuron
{

/**
 * @brief Result of evaluating a network on a labeled set.
 */
struct Evaluation
{
    /// Fraction of examples whose argmax output matches the label argmax.
    double accuracy = 0.0;

    /// Mean cost including the L2 penalty.
    double mean_cost = 0.0;
};

/**
 * @brief Receives progress notifications from Network::fit.
 *
 * Epoch and batch indices are 1-based.
 */
class TrainingReporter
{
public:
    virtual ~TrainingReporter() = default;

    /// Called after batch @p batch of @p batch_count has been applied.
    virtual void on_batch(uint64_t epoch,
        uint64_t batch,
        uint64_t batch_count) = 0;

    /**
     * @brief Called once an epoch has finished.
     *
     * @param evaluation Validation result, empty when the validation
     * set is empty.
     * @param elapsed Wall time spent applying the epoch's batches.
     */
    virtual void on_epoch(uint64_t epoch,
        const std::optional<Evaluation> & evaluation,
        std::chrono::duration<double> elapsed) = 0;
};

/**
 * @brief Writes progress as plain text to an output stream.
 *
 * Batch lines are rewritten in place with a carriage return; the epoch
 * line terminates them.
 */
class StreamReporter : public TrainingReporter
{
public:
    explicit StreamReporter(std::ostream & os = std::cout);

    void on_batch(uint64_t epoch,
        uint64_t batch,
        uint64_t batch_count) override;

    void on_epoch(uint64_t epoch,
        const std::optional<Evaluation> & evaluation,
        std::chrono::duration<double> elapsed) override;

private:
    std::ostream & m_os;
};

} // namespace neuron

#endif // NEURON_REPORTER_HPP
