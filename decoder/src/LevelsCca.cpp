/**
 * @file LevelsCca.cpp
 * @brief Implementation of the alternating CCA / output-weight optimizer.
 */

#include "lcca/decoder/LevelsCca.hpp"

#include "lcca/core/Log.hpp"
#include "lcca/decoder/WeightSolver.hpp"
#include "lcca/math/Contraction.hpp"
#include "lcca/math/LagCovariance.hpp"
#include "lcca/math/Whitener.hpp"

#include <cmath>
#include <limits>
#include <sstream>
#include <string>

namespace lcca::decoder {

using core::ErrorCode;
using core::Log;
using core::makeError;

namespace {

core::ExpectedVoid validateSeed(const Eigen::VectorXd& seed, Index outputCount)
{
    LCCA_ENSURE(seed.size() == outputCount, ErrorCode::kShapeMismatch,
                "seed has " + std::to_string(seed.size()) + " weights for " + std::to_string(outputCount)
                    + " outputs");
    LCCA_ENSURE(seed.allFinite() && seed.minCoeff() >= 0.0 && seed.sum() > 0.0, ErrorCode::kInvalidArgument,
                "seed weights must be finite, non-negative, with a positive sum");
    return {};
}

} // namespace

core::ExpectedVoid validateCovarianceShapes(
    const Eigen::MatrixXd& cxx,
    const math::Tensor4& cyx,
    const math::Tensor5& cyyCompressed)
{
    const Index d = cxx.rows();
    const Index nY = cyx.dimension(0);
    const Index nE = cyx.dimension(1);
    const Index tau = cyx.dimension(2);

    if (cxx.cols() != d || cyx.dimension(3) != d || cyyCompressed.dimension(0) != tau
        || cyyCompressed.dimension(1) != nY || cyyCompressed.dimension(2) != nE
        || cyyCompressed.dimension(3) != nY || cyyCompressed.dimension(4) != nE) {
        std::ostringstream os;
        os << "inconsistent covariance shapes: Cxx(" << cxx.rows() << 'x' << cxx.cols() << "), Cyx(" << nY << ','
           << nE << ',' << tau << ',' << cyx.dimension(3) << "), Cyy(" << cyyCompressed.dimension(0) << ','
           << cyyCompressed.dimension(1) << ',' << cyyCompressed.dimension(2) << ',' << cyyCompressed.dimension(3)
           << ',' << cyyCompressed.dimension(4) << ')';
        return makeError(ErrorCode::kShapeMismatch, os.str());
    }

    if (d == 0 || nY == 0 || nE == 0 || tau == 0)
        return makeError(ErrorCode::kEmptyInput, "covariance structures have an empty axis");

    if (!cxx.allFinite() || !math::allFinite(cyx) || !math::allFinite(cyyCompressed))
        return makeError(ErrorCode::kNonFiniteInput, "covariance structures contain NaN or Inf");

    return {};
}

LevelsCca::LevelsCca(LevelsCcaConfig config)
    : _config(config)
{
}

core::Expected<LevelsCcaResult> LevelsCca::fit(
    const Eigen::MatrixXd& cxx,
    const math::Tensor4& cyx,
    const math::Tensor5& cyyCompressed) const
{
    LCCA_TRY_VOID(validateCovarianceShapes(cxx, cyx, cyyCompressed));

    const Index nY = cyx.dimension(0);
    return run(cxx, cyx, cyyCompressed, Eigen::VectorXd::Constant(nY, 1.0 / static_cast<double>(nY)));
}

core::Expected<LevelsCcaResult> LevelsCca::fit(
    const Eigen::MatrixXd& cxx,
    const math::Tensor4& cyx,
    const math::Tensor5& cyyCompressed,
    const Eigen::VectorXd& seed) const
{
    LCCA_TRY_VOID(validateCovarianceShapes(cxx, cyx, cyyCompressed));
    LCCA_TRY_VOID(validateSeed(seed, cyx.dimension(0)));

    return run(cxx, cyx, cyyCompressed, seed / seed.sum());
}

core::Expected<LevelsCcaResult> LevelsCca::fit(const stats::SummaryStatistics& statistics) const
{
    if (statistics.epochCount() == 0)
        return makeError(ErrorCode::kEmptyInput, "no epoch has been accumulated");

    return fit(statistics.cxx(), statistics.cyx(), statistics.cyyCompressed());
}

core::Expected<LevelsCcaResult> LevelsCca::fit(
    std::span<const stats::Epoch> epochs,
    const stats::SummaryStatisticsConfig& statsConfig) const
{
    if (epochs.empty())
        return makeError(ErrorCode::kEmptyInput, "no epochs to fit");

    const stats::Epoch& first = epochs.front();
    stats::SummaryStatistics statistics(
        first.data.cols(), first.events.dimension(1), first.events.dimension(2), statsConfig);
    LCCA_TRY_VOID(statistics.accumulate(epochs));

    return fit(statistics);
}

core::Expected<LevelsCcaResult> LevelsCca::run(
    const Eigen::MatrixXd& cxx,
    const math::Tensor4& cyx,
    const math::Tensor5& cyyCompressed,
    Eigen::VectorXd weights) const
{
    const Index nE = cyx.dimension(1);
    const Index tau = cyx.dimension(2);
    const CcaOptions options = _config.ccaOptions();
    const double tolerance = _config.tolerance();

    const math::Tensor6 cyyFull = LCCA_TRY(math::expandLagCovariance(cyyCompressed, tau));

    // Cxx does not depend on S_y: whiten it once.
    const math::Whitener spatial = LCCA_TRY(math::computeWhitener(cxx, options.regX, options.rcondX, options.symmetric));

    LevelsCcaResult result;
    result.diagnostics.degenerateSpatialWhitener = spatial.degenerate();
    if (spatial.degenerate())
        Log::warn("LCCA", "spatial covariance is degenerate, the model will have no component");

    Eigen::MatrixXd trace = Eigen::MatrixXd::Constant(_config.maxIter(), 2, std::numeric_limits<double>::quiet_NaN());
    double objective = std::numeric_limits<double>::infinity();
    CcaSolution solution;
    IterationReport report;
    core::i32 iter = 0;

    while (iter < _config.maxIter()) {
        const Eigen::MatrixXd weightedCyy = math::weightOutputPairs(cyyFull, weights);
        const Eigen::MatrixXd weightedCyx = math::weightOutputs(cyx, weights);

        solution = LCCA_TRY(solveWhitenedCca(spatial, weightedCyx, weightedCyy, options));
        if (solution.degenerateTemporal) {
            ++result.diagnostics.degenerateTemporalWhiteners;
            Log::warn("LCCA", "weighted event covariance is degenerate at iteration " + std::to_string(iter));
        }

        // W'CxxW and R'CyyR should both be close to the identity
        ReducedProblem problem;
        problem.energy = solution.filters.cwiseProduct(cxx * solution.filters).sum();
        problem.cross = math::projectOutputs(cyx, solution.responses, solution.filters);
        problem.gram = math::projectOutputPairs(cyyFull, solution.responses);

        const double objectivePre = problem.objective(weights);

        Eigen::VectorXd updated = LCCA_TRY(solveOutputWeights(problem, weights, _config.weightSolver()));
        updated /= updated.sum();
        double objectivePost = problem.objective(updated);
        bool unstable = false;

        if (!updated.allFinite() || !std::isfinite(objectivePost)) {
            Log::warn("LCCA", "NaN or Inf in the output weights at iteration " + std::to_string(iter)
                                  + ", keeping the previous weighting");
            ++result.diagnostics.nonFiniteWeightUpdates;
            unstable = true;
            updated = weights;
            objectivePost = objectivePre;
        } else if (objectivePost > objectivePre) {
            // The simplex projection can cost more than the solver gained;
            // the next CCA step usually recovers it.
            ++result.diagnostics.objectiveIncreases;
            if (Log::enabled(core::LogLevel::kDebug)) {
                std::ostringstream os;
                os << "J rose from " << objectivePre << " to " << objectivePost << " at iteration " << iter;
                Log::debug("LCCA", os.str());
            }
        }

        trace(iter, 0) = objectivePre;
        trace(iter, 1) = objectivePost;

        report.iteration = iter;
        report.objectivePre = objectivePre;
        report.objectivePost = objectivePost;
        report.weightChange = (updated - weights).lpNorm<1>();
        report.objectiveChange = std::abs(objectivePost - objective);
        report.effectiveRank = solution.rank();
        report.converged = !unstable && (report.weightChange < tolerance || report.objectiveChange < tolerance);

        weights = updated;
        objective = objectivePost;
        report.outputWeights = weights;
        ++iter;

        if (_observer)
            _observer->onIteration(report);

        // Repeating the step from the same weights would reproduce the same failure.
        if (report.converged || unstable)
            break;
    }

    if (_observer)
        _observer->onFinished(report);

    result.objective = objective;
    result.model = toFactoredModel(solution, nE, tau);
    result.outputWeights = weights;
    result.effectiveRank = solution.rank();
    result.iterations = iter;
    result.converged = report.converged;
    result.trace = trace.topRows(iter);

    if (result.effectiveRank < options.rank)
        Log::debug("LCCA", "requested rank " + std::to_string(options.rank) + " reduced to "
                               + std::to_string(result.effectiveRank));

    return result;
}

core::Expected<LevelsCcaResult> fitLevelsCca(
    std::span<const stats::Epoch> epochs,
    const stats::SummaryStatisticsConfig& statsConfig,
    const LevelsCcaConfig& config,
    IIterationObserver* observer)
{
    LevelsCca estimator(config);
    estimator.setObserver(observer);
    return estimator.fit(epochs, statsConfig);
}

} // namespace lcca::decoder
