/**
 * @file OutlierRejection.cpp
 * @brief Implementation of the median-relative epoch rejection.
 */

#include "lcca/stats/OutlierRejection.hpp"

#include <algorithm>

namespace lcca::stats {

std::vector<double> epochMagnitudes(std::span<const Epoch> epochs)
{
    std::vector<double> magnitudes;
    magnitudes.reserve(epochs.size());
    for (const auto& epoch : epochs)
        magnitudes.push_back(epoch.data.norm());
    return magnitudes;
}

std::vector<bool> selectInlierEpochs(
    std::span<const Epoch> epochs,
    double threshold)
{
    std::vector<bool> keep(epochs.size(), true);

    if (threshold <= 0.0 || epochs.empty())
        return keep;

    const std::vector<double> magnitudes = epochMagnitudes(epochs);

    std::vector<double> sorted = magnitudes;
    const auto middle = sorted.begin() + static_cast<std::ptrdiff_t>(sorted.size() / 2);
    std::nth_element(sorted.begin(), middle, sorted.end());
    double median = *middle;
    if (sorted.size() % 2 == 0)
        median = 0.5 * (median + *std::max_element(sorted.begin(), middle));

    if (median <= 0.0)
        return keep;

    const double limit = threshold * median;
    for (std::size_t i = 0; i < magnitudes.size(); ++i)
        keep[i] = magnitudes[i] <= limit;

    return keep;
}

} // namespace lcca::stats
