/**
 * @file Reporter.cpp
 * @brief Training progress reporting definitions.
 */

#include "neuron/Reporter.hpp"

#include <iomanip>

namespace neuron
{

StreamReporter::StreamReporter(std::ostream & os)
    : m_os(os)
{
}

void StreamReporter::on_batch(uint64_t epoch,
    uint64_t batch,
    uint64_t batch_count)
{
    m_os << "\rEpoch " << std::setw(2) << epoch
         << " | Fit Batches: " << batch << "/" << batch_count
         << std::flush;
}

void StreamReporter::on_epoch(uint64_t epoch,
    const std::optional<Evaluation> & evaluation,
    std::chrono::duration<double> elapsed)
{
    m_os << "\rEpoch " << std::setw(2) << epoch << " | ";
    if (evaluation.has_value())
    {
        m_os << "Accuracy: " << evaluation->accuracy
             << " | Cost: " << evaluation->mean_cost << " | ";
    }
    m_os << "Elapsed: " << elapsed.count() << "s" << std::endl;
}

} // namespace neuron
