/**
 * @file SummaryStatistics.hpp
 * @brief Additive accumulator of the three covariance structures.
 * @author MasterLaplace
 *
 * Accumulates, over time-aligned epochs of channel data x(s) and event
 * indicators Y(s, y, e):
 *
 *  - @f$ C_{xx} = \sum_s x(s)\, x(s)^T @f$                                  (d, d)
 *  - @f$ C_{yx}[y,e,t] = \sum_s Y(s,y,e)\, x(s+t+\text{offset}) @f$          (nY, nE, tau, d)
 *  - @f$ C_{yy}[\delta,y,e,y',e'] = \sum_s Y(s,y,e)\, Y(s+\delta,y',e') @f$  (tau, nY, nE, nY, nE)
 *
 * Sums run over the samples where every index is inside the epoch (zero
 * padding). Raw sums are stored together with the sample count, so two
 * accumulators merge by plain addition whatever the normalization.
 */

#pragma once

#include "lcca/core/Constants.hpp"
#include "lcca/core/Expected.hpp"
#include "lcca/math/Tensor.hpp"
#include "lcca/stats/Epoch.hpp"

#include <span>

namespace lcca::stats {

using core::Index;

/**
 * @brief Accumulation parameters.
 */
struct SummaryStatisticsConfig {
    Index tau = 1;            ///< number of response lags
    Index offset = 0;         ///< data lead (samples) of lag 0 over the event
    bool center = true;       ///< remove each epoch's channel means
    bool unitNorm = false;    ///< report sums divided by the sample count
    double badEpochThreshold = core::kDefaultBadEpochThresh;
};

/**
 * @brief Streaming-friendly accumulator of Cxx, Cyx and compressed Cyy.
 */
class SummaryStatistics {
public:
    /**
     * @param channelCount d
     * @param outputCount  nY
     * @param eventCount   nE
     * @param config       Accumulation parameters
     */
    SummaryStatistics(
        Index channelCount,
        Index outputCount,
        Index eventCount,
        SummaryStatisticsConfig config = {});

    /**
     * @brief Adds the statistics of a batch of epochs.
     *
     * Outlier epochs are rejected first (see selectInlierEpochs()). The
     * whole batch is validated before anything is accumulated.
     *
     * @return Error when an epoch's shape disagrees with the accumulator
     */
    [[nodiscard]] core::ExpectedVoid accumulate(std::span<const Epoch> epochs);

    /**
     * @brief Adds the raw sums of another accumulator.
     *
     * @return Error when shapes or parameters differ
     */
    [[nodiscard]] core::ExpectedVoid merge(const SummaryStatistics& other);

    void reset() noexcept;

    [[nodiscard]] Eigen::MatrixXd cxx() const;
    [[nodiscard]] math::Tensor4 cyx() const;
    [[nodiscard]] math::Tensor5 cyyCompressed() const;

    [[nodiscard]] Index channelCount() const noexcept { return _channelCount; }
    [[nodiscard]] Index outputCount()  const noexcept { return _outputCount; }
    [[nodiscard]] Index eventCount()   const noexcept { return _eventCount; }
    [[nodiscard]] Index sampleCount()  const noexcept { return _sampleCount; }
    [[nodiscard]] Index epochCount()   const noexcept { return _epochCount; }
    [[nodiscard]] Index rejectedEpochCount() const noexcept { return _rejectedCount; }

    [[nodiscard]] const SummaryStatisticsConfig& config() const noexcept { return _config; }

private:
    [[nodiscard]] core::ExpectedVoid validate(const Epoch& epoch) const;
    void accumulateEpoch(const Epoch& epoch);
    [[nodiscard]] double normalization() const noexcept;

    Index _channelCount;
    Index _outputCount;
    Index _eventCount;
    SummaryStatisticsConfig _config;

    Eigen::MatrixXd _cxx;
    math::Tensor4 _cyx;
    math::Tensor5 _cyy;

    Index _sampleCount = 0;
    Index _epochCount = 0;
    Index _rejectedCount = 0;
};

} // namespace lcca::stats
