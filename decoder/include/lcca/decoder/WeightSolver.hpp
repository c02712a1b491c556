/**
 * @file WeightSolver.hpp
 * @brief Non-negative, sum-normalized output weighting by constrained least squares.
 * @author MasterLaplace
 *
 * Minimizes the reduced objective
 * @f[ J(s) = E - 2\, s^T c + s^T G s \quad \text{s.t.}\ s \ge 0,\ \textstyle\sum s = 1 @f]
 * where E is the filtered spatial energy, c the per-output cross term and
 * G the output-output Gram matrix. A small ridge is added to G, one of the
 * update rules below is iterated, and every iterate is projected back onto
 * the simplex by an epsilon shift and renormalization.
 */

#pragma once

#include "lcca/core/Constants.hpp"
#include "lcca/core/Expected.hpp"
#include "lcca/core/Types.hpp"

#include <Eigen/Dense>
#include <string_view>

namespace lcca::decoder {

using core::Index;

/**
 * @brief Closed set of update rules for the weight sub-problem.
 */
enum class WeightSolverMode : core::u8 {
    kLeastSquares,          ///< unconstrained least squares
    kLeastSquaresClamp,     ///< least squares, negatives clamped to zero
    kExponentiatedGradient, ///< multiplicative exp(-eta * grad) update
    kGradientDescent,       ///< plain gradient step
    kMultiplicative,        ///< NMF-style multiplicative update
    kNegativeRidge          ///< IRWLS penalizing currently-negative weights
};

/**
 * @brief Returns the short configuration name of a solver mode.
 */
[[nodiscard]] constexpr std::string_view weightSolverModeName(WeightSolverMode mode) noexcept
{
    switch (mode) {
        case WeightSolverMode::kLeastSquares:          return "ls";
        case WeightSolverMode::kLeastSquaresClamp:     return "lspos";
        case WeightSolverMode::kExponentiatedGradient: return "expgrad";
        case WeightSolverMode::kGradientDescent:       return "gd";
        case WeightSolverMode::kMultiplicative:        return "mu";
        case WeightSolverMode::kNegativeRidge:         return "negridge";
    }
    return "unknown";
}

/**
 * @brief Parses a configuration name ("ls", "lspos", "expgrad", "gd", "mu",
 *        "negridge" or its alias "irwls").
 *
 * @return The mode, or kUnknownSolverMode for any other name
 */
[[nodiscard]] core::Expected<WeightSolverMode> parseWeightSolverMode(std::string_view name);

/**
 * @brief Parameters of the weight sub-problem.
 */
struct WeightSolverConfig {
    WeightSolverMode mode = WeightSolverMode::kNegativeRidge;
    core::i32 maxIter = core::kWeightMaxIter;
    double tolerance = core::kWeightTolerance;
    double ridge = core::kWeightRidge;
    double epsilon = core::kWeightEpsilon;
    double eta = core::kWeightEta;
    double floor = core::kWeightFloor;
    bool verbose = false;
};

/**
 * @brief The three reduced statistics defining the weight sub-problem.
 */
struct ReducedProblem {
    double energy = 0.0;
    Eigen::VectorXd cross;
    Eigen::MatrixXd gram;

    /// @brief Evaluates J(s).
    [[nodiscard]] double objective(const Eigen::VectorXd& weights) const
    {
        return energy - 2.0 * cross.dot(weights) + weights.dot(gram * weights);
    }
};

/**
 * @brief One update of the weight vector, before simplex projection.
 *
 * @param problem Reduced problem (Gram matrix already ridged)
 * @param current Current weights
 * @param config  Step parameters (eta)
 */
using UpdateRule = Eigen::VectorXd (*)(
    const ReducedProblem& problem,
    const Eigen::VectorXd& current,
    const WeightSolverConfig& config);

/**
 * @brief Returns the update rule implementing @p mode.
 */
[[nodiscard]] UpdateRule updateRuleFor(WeightSolverMode mode) noexcept;

/**
 * @brief Solves the constrained weight sub-problem.
 *
 * Stops early when |ΔJ| drops below the tolerance. On return every weight
 * is at least @c config.floor and the weights sum to one. An identically
 * zero Gram matrix carries no information: @p initial is returned as is.
 *
 * @return Updated weights, or Error when the sizes of @p problem and
 *         @p initial disagree
 */
[[nodiscard]] core::Expected<Eigen::VectorXd> solveOutputWeights(
    const ReducedProblem& problem,
    const Eigen::VectorXd& initial,
    const WeightSolverConfig& config = {});

} // namespace lcca::decoder
