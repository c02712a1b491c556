/**
 * @file WeightSolver.cpp
 * @brief Update rules and driver of the constrained weight solver.
 */

#include "lcca/decoder/WeightSolver.hpp"

#include "lcca/core/Log.hpp"

#include <cmath>
#include <sstream>
#include <string>

namespace lcca::decoder {

using core::ErrorCode;
using core::Log;
using core::makeError;

namespace {

Eigen::VectorXd leastSquares(const Eigen::MatrixXd& gram, const Eigen::VectorXd& cross)
{
    // Minimum-norm solution, equivalent to the pseudo-inverse.
    return Eigen::CompleteOrthogonalDecomposition<Eigen::MatrixXd>(gram).solve(cross);
}

Eigen::VectorXd gradient(const ReducedProblem& problem, const Eigen::VectorXd& current)
{
    return problem.gram * current - problem.cross;
}

Eigen::VectorXd updateLeastSquares(
    const ReducedProblem& problem,
    const Eigen::VectorXd& /*current*/,
    const WeightSolverConfig& /*config*/)
{
    return leastSquares(problem.gram, problem.cross);
}

Eigen::VectorXd updateLeastSquaresClamp(
    const ReducedProblem& problem,
    const Eigen::VectorXd& /*current*/,
    const WeightSolverConfig& /*config*/)
{
    return leastSquares(problem.gram, problem.cross).cwiseMax(0.0);
}

Eigen::VectorXd updateExponentiatedGradient(
    const ReducedProblem& problem,
    const Eigen::VectorXd& current,
    const WeightSolverConfig& config)
{
    const Eigen::ArrayXd step = (-config.eta * gradient(problem, current)).array().exp();
    return (current.array() * step).matrix();
}

Eigen::VectorXd updateGradientDescent(
    const ReducedProblem& problem,
    const Eigen::VectorXd& current,
    const WeightSolverConfig& config)
{
    return current - config.eta * core::kGradientStepScale * gradient(problem, current);
}

Eigen::VectorXd updateMultiplicative(
    const ReducedProblem& problem,
    const Eigen::VectorXd& current,
    const WeightSolverConfig& /*config*/)
{
    const Eigen::ArrayXd denominator = (problem.gram * current).array() + core::kMultiplicativeDamping;
    return (current.array() * problem.cross.array().abs() / denominator).matrix();
}

Eigen::VectorXd updateNegativeRidge(
    const ReducedProblem& problem,
    const Eigen::VectorXd& current,
    const WeightSolverConfig& /*config*/)
{
    const double penalty = problem.gram.diagonal().mean() * core::kNegativePenaltyScale;
    const Eigen::VectorXd negative = (current.array() < 0.0).cast<double>().matrix();

    Eigen::MatrixXd penalized = problem.gram;
    penalized.diagonal() += penalty * negative;
    return leastSquares(penalized, problem.cross);
}

} // namespace

core::Expected<WeightSolverMode> parseWeightSolverMode(std::string_view name)
{
    if (name == "ls")                       return WeightSolverMode::kLeastSquares;
    if (name == "lspos")                    return WeightSolverMode::kLeastSquaresClamp;
    if (name == "expgrad")                  return WeightSolverMode::kExponentiatedGradient;
    if (name == "gd")                       return WeightSolverMode::kGradientDescent;
    if (name == "mu")                       return WeightSolverMode::kMultiplicative;
    if (name == "negridge" || name == "irwls") return WeightSolverMode::kNegativeRidge;

    return makeError(ErrorCode::kUnknownSolverMode, "unknown weight solver mode '" + std::string(name) + "'");
}

UpdateRule updateRuleFor(WeightSolverMode mode) noexcept
{
    switch (mode) {
        case WeightSolverMode::kLeastSquares:          return &updateLeastSquares;
        case WeightSolverMode::kLeastSquaresClamp:     return &updateLeastSquaresClamp;
        case WeightSolverMode::kExponentiatedGradient: return &updateExponentiatedGradient;
        case WeightSolverMode::kGradientDescent:       return &updateGradientDescent;
        case WeightSolverMode::kMultiplicative:        return &updateMultiplicative;
        case WeightSolverMode::kNegativeRidge:         return &updateNegativeRidge;
    }
    return &updateNegativeRidge;
}

core::Expected<Eigen::VectorXd> solveOutputWeights(
    const ReducedProblem& problem,
    const Eigen::VectorXd& initial,
    const WeightSolverConfig& config)
{
    const Index n = initial.size();

    if (problem.cross.size() != n || problem.gram.rows() != n || problem.gram.cols() != n) {
        std::ostringstream os;
        os << "weight problem size mismatch: weights(" << n << "), cross(" << problem.cross.size()
           << "), gram(" << problem.gram.rows() << 'x' << problem.gram.cols() << ')';
        return makeError(ErrorCode::kShapeMismatch, os.str());
    }

    if ((problem.gram.array() == 0.0).all())
        return initial;

    ReducedProblem ridged = problem;
    ridged.gram.diagonal().array() += config.ridge;

    const UpdateRule update = updateRuleFor(config.mode);

    Eigen::VectorXd weights = initial;
    double objective = ridged.objective(weights);

    for (core::i32 iter = 0; iter < config.maxIter; ++iter) {
        const double previous = objective;

        const Eigen::VectorXd shifted = (update(ridged, weights, config).array() + config.epsilon).matrix();
        const double total = shifted.sum();
        if (!std::isfinite(total) || total <= 0.0) {
            Log::debug("WEIGHTS", "update left the simplex (sum=" + std::to_string(total) + "), keeping last iterate");
            break;
        }

        weights = shifted / total;
        objective = ridged.objective(weights);

        if (config.verbose) {
            std::ostringstream os;
            os << iter << ") J=" << objective << " dJ=" << previous - objective;
            Log::debug("WEIGHTS", os.str());
        }

        if (std::abs(previous - objective) < config.tolerance)
            break;
    }

    for (Index i = 0; i < n; ++i) {
        if (!std::isfinite(weights(i)) || weights(i) < config.floor)
            weights(i) = config.floor;
    }

    return weights / weights.sum();
}

} // namespace lcca::decoder
