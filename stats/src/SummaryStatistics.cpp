/**
 * @file SummaryStatistics.cpp
 * @brief Implementation of the additive covariance accumulator.
 */

#include "lcca/stats/SummaryStatistics.hpp"

#include "lcca/core/Log.hpp"
#include "lcca/stats/OutlierRejection.hpp"

#include <algorithm>
#include <sstream>
#include <string>

namespace lcca::stats {

using core::ErrorCode;
using core::Log;
using core::makeError;

namespace {

// Storage extent of a requested dimension; invalid sizes are reported by accumulate().
Index extent(Index n) noexcept { return std::max<Index>(n, 0); }

} // namespace

SummaryStatistics::SummaryStatistics(
    Index channelCount,
    Index outputCount,
    Index eventCount,
    SummaryStatisticsConfig config)
    : _channelCount(channelCount)
    , _outputCount(outputCount)
    , _eventCount(eventCount)
    , _config(config)
    , _cxx(Eigen::MatrixXd::Zero(extent(channelCount), extent(channelCount)))
    , _cyx(extent(outputCount), extent(eventCount), extent(config.tau), extent(channelCount))
    , _cyy(extent(config.tau), extent(outputCount), extent(eventCount), extent(outputCount), extent(eventCount))
{
    _cyx.setZero();
    _cyy.setZero();
}

core::ExpectedVoid SummaryStatistics::validate(const Epoch& epoch) const
{
    const Index n = epoch.data.rows();

    if (epoch.data.cols() != _channelCount || epoch.events.dimension(0) != n
        || epoch.events.dimension(1) != _outputCount || epoch.events.dimension(2) != _eventCount) {
        std::ostringstream os;
        os << "epoch shape mismatch: data(" << n << 'x' << epoch.data.cols() << "), events("
           << epoch.events.dimension(0) << 'x' << epoch.events.dimension(1) << 'x' << epoch.events.dimension(2)
           << "), expected channels=" << _channelCount << " outputs=" << _outputCount << " events=" << _eventCount;
        return makeError(ErrorCode::kShapeMismatch, os.str());
    }

    if (!epoch.data.allFinite() || !math::allFinite(epoch.events))
        return makeError(ErrorCode::kNonFiniteInput, "epoch contains NaN or Inf");

    return {};
}

core::ExpectedVoid SummaryStatistics::accumulate(std::span<const Epoch> epochs)
{
    if (_config.tau < 1)
        return makeError(ErrorCode::kInvalidArgument, "tau must be >= 1, got " + std::to_string(_config.tau));
    if (_channelCount < 0 || _outputCount < 0 || _eventCount < 0)
        return makeError(ErrorCode::kInvalidArgument, "channel, output and event counts must be >= 0");

    for (const auto& epoch : epochs)
        LCCA_TRY_VOID(validate(epoch));

    const std::vector<bool> keep = selectInlierEpochs(epochs, _config.badEpochThreshold);

    Index rejected = 0;
    for (std::size_t i = 0; i < epochs.size(); ++i) {
        if (!keep[i]) {
            ++rejected;
            continue;
        }
        accumulateEpoch(epochs[i]);
    }

    if (rejected > 0)
        Log::info("STATS", "rejected " + std::to_string(rejected) + "/" + std::to_string(epochs.size())
                               + " outlier epochs");

    _rejectedCount += rejected;
    return {};
}

void SummaryStatistics::accumulateEpoch(const Epoch& epoch)
{
    const Index n = epoch.data.rows();
    const Index d = _channelCount;
    const Index tau = _config.tau;
    const Index p = _outputCount * _eventCount;

    Eigen::MatrixXd x = epoch.data;
    if (_config.center && n > 0)
        x.rowwise() -= x.colwise().mean();

    // events as N × (nY * nE), one column per (output, event) pair
    const math::ConstMatrixView y = math::asMatrix(epoch.events, n, p);

    _cxx.noalias() += x.transpose() * x;

    math::MatrixView cyx = math::asMatrix(_cyx, p, tau * d);
    for (Index t = 0; t < tau; ++t) {
        const Index shift = t + _config.offset;
        const Index first = std::max<Index>(0, -shift);
        const Index last = std::min<Index>(n, n - shift);
        if (last <= first)
            continue;
        const Index count = last - first;
        cyx.middleCols(t * d, d).noalias() +=
            y.middleRows(first, count).transpose() * x.middleRows(first + shift, count);
    }

    for (Index delta = 0; delta < std::min(tau, n); ++delta) {
        math::MatrixView lagBlock(_cyy.data() + delta * p * p, p, p);
        lagBlock.noalias() += y.topRows(n - delta).transpose() * y.bottomRows(n - delta);
    }

    _sampleCount += n;
    ++_epochCount;
}

core::ExpectedVoid SummaryStatistics::merge(const SummaryStatistics& other)
{
    if (other._channelCount != _channelCount || other._outputCount != _outputCount
        || other._eventCount != _eventCount || other._config.tau != _config.tau)
        return makeError(ErrorCode::kShapeMismatch, "cannot merge summary statistics of different shapes");

    if (other._config.offset != _config.offset || other._config.center != _config.center
        || other._config.unitNorm != _config.unitNorm)
        return makeError(ErrorCode::kInvalidArgument, "cannot merge summary statistics with different parameters");

    _cxx += other._cxx;
    _cyx += other._cyx;
    _cyy += other._cyy;
    _sampleCount += other._sampleCount;
    _epochCount += other._epochCount;
    _rejectedCount += other._rejectedCount;
    return {};
}

void SummaryStatistics::reset() noexcept
{
    _cxx.setZero();
    _cyx.setZero();
    _cyy.setZero();
    _sampleCount = 0;
    _epochCount = 0;
    _rejectedCount = 0;
}

double SummaryStatistics::normalization() const noexcept
{
    if (!_config.unitNorm || _sampleCount == 0)
        return 1.0;
    return 1.0 / static_cast<double>(_sampleCount);
}

Eigen::MatrixXd SummaryStatistics::cxx() const
{
    return _cxx * normalization();
}

math::Tensor4 SummaryStatistics::cyx() const
{
    return _cyx * normalization();
}

math::Tensor5 SummaryStatistics::cyyCompressed() const
{
    return _cyy * normalization();
}

} // namespace lcca::stats
