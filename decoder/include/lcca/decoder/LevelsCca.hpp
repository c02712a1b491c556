/**
 * @file LevelsCca.hpp
 * @brief Alternating CCA / output-weight optimizer over candidate outputs.
 * @author MasterLaplace
 *
 * The target of the CCA is an unknown convex mixture S_y over nY candidate
 * outputs ("levels"). Each outer iteration:
 *
 *  1. contracts Cyy and Cyx with S_y on their output axes,
 *  2. whitens the reduced event covariance (the spatial whitener is
 *     computed once, before the loop),
 *  3. takes the SVD of the doubly-whitened cross matrix and keeps the top
 *     @c rank components,
 *  4. maps them back to filters W and responses R,
 *  5. reduces the statistics to the weight sub-problem (E, c, G),
 *  6. updates S_y with the constrained weight solver,
 *  7. stops when the L1 change of S_y or the change of J drops below the
 *     tolerance, or after @c maxIter iterations.
 *
 * Finally W and R are scaled by the square root of their relative singular
 * values. The optimizer holds no state between calls; independent fits
 * can run concurrently on separate instances.
 *
 * @see WeightSolver, CcaSolver, SummaryStatistics
 */

#pragma once

#include "lcca/core/Expected.hpp"
#include "lcca/decoder/CcaSolver.hpp"
#include "lcca/decoder/Config.hpp"
#include "lcca/decoder/IterationObserver.hpp"
#include "lcca/math/Tensor.hpp"
#include "lcca/stats/SummaryStatistics.hpp"

#include <span>

namespace lcca::decoder {

/**
 * @brief Soft conditions met during a fit.
 */
struct Diagnostics {
    bool degenerateSpatialWhitener = false;
    core::i32 degenerateTemporalWhiteners = 0; ///< iterations with a zero-rank event whitener
    core::i32 nonFiniteWeightUpdates = 0;      ///< updates producing NaN/Inf weights
    core::i32 objectiveIncreases = 0;          ///< accepted updates with J_post > J_pre
};

/**
 * @brief Outcome of a fit.
 */
struct LevelsCcaResult {
    double objective = 0.0;
    FactoredModel model;
    Eigen::VectorXd outputWeights;  ///< S_y, non-negative, sums to 1
    Index effectiveRank = 0;        ///< retained components (<= requested rank)
    core::i32 iterations = 0;
    bool converged = false;
    Eigen::MatrixXd trace;          ///< iterations × 2: (J_pre, J_post)
    Diagnostics diagnostics;
};

/**
 * @brief Multi-level CCA estimator.
 */
class LevelsCca {
public:
    explicit LevelsCca(LevelsCcaConfig config = {});

    /// @brief Installs an iteration observer (nullptr disables).
    void setObserver(IIterationObserver* observer) noexcept { _observer = observer; }

    [[nodiscard]] const LevelsCcaConfig& config() const noexcept { return _config; }

    /**
     * @brief Fits from the three covariance structures, uniform seed.
     *
     * @param cxx           d × d channel covariance
     * @param cyx           (nY, nE, tau, d) cross covariance
     * @param cyyCompressed (tau, nY, nE, nY, nE) lag-compressed event covariance
     * @return Result, or Error on inconsistent shapes / non-finite inputs
     */
    [[nodiscard]] core::Expected<LevelsCcaResult> fit(
        const Eigen::MatrixXd& cxx,
        const math::Tensor4& cyx,
        const math::Tensor5& cyyCompressed) const;

    /**
     * @brief Fits starting from a caller-supplied output weighting.
     *
     * The seed is normalized to sum 1; it must be non-negative with a
     * positive sum.
     */
    [[nodiscard]] core::Expected<LevelsCcaResult> fit(
        const Eigen::MatrixXd& cxx,
        const math::Tensor4& cyx,
        const math::Tensor5& cyyCompressed,
        const Eigen::VectorXd& seed) const;

    /**
     * @brief Fits from an accumulator's current statistics.
     */
    [[nodiscard]] core::Expected<LevelsCcaResult> fit(const stats::SummaryStatistics& statistics) const;

    /**
     * @brief Accumulates @p epochs and fits the result.
     *
     * Channel, output and event counts are taken from the first epoch.
     *
     * @return Error when no epoch survives or on inconsistent shapes
     */
    [[nodiscard]] core::Expected<LevelsCcaResult> fit(
        std::span<const stats::Epoch> epochs,
        const stats::SummaryStatisticsConfig& statsConfig = {}) const;

private:
    [[nodiscard]] core::Expected<LevelsCcaResult> run(
        const Eigen::MatrixXd& cxx,
        const math::Tensor4& cyx,
        const math::Tensor5& cyyCompressed,
        Eigen::VectorXd weights) const;

    LevelsCcaConfig _config;
    IIterationObserver* _observer = nullptr;
};

/**
 * @brief Checks that Cxx, Cyx and Cyy agree on d, nY, nE and tau.
 */
[[nodiscard]] core::ExpectedVoid validateCovarianceShapes(
    const Eigen::MatrixXd& cxx,
    const math::Tensor4& cyx,
    const math::Tensor5& cyyCompressed);

/**
 * @brief One-call fit from raw epochs.
 *
 * @param epochs      Time-aligned trials
 * @param statsConfig Accumulation parameters (tau, offset, centering...)
 * @param config      Optimizer configuration
 * @param observer    Optional iteration observer
 */
[[nodiscard]] core::Expected<LevelsCcaResult> fitLevelsCca(
    std::span<const stats::Epoch> epochs,
    const stats::SummaryStatisticsConfig& statsConfig,
    const LevelsCcaConfig& config = {},
    IIterationObserver* observer = nullptr);

} // namespace lcca::decoder
