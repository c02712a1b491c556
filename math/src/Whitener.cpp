/**
 * @file Whitener.cpp
 * @brief Implementation of the regularized, rank-truncated whitener.
 */

#include "lcca/math/Whitener.hpp"

#include "lcca/core/Log.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace lcca::math {

using core::ErrorCode;
using core::Log;
using core::makeError;

Eigen::MatrixXd regularizeCovariance(
    const Eigen::MatrixXd& cov,
    double alpha)
{
    const auto p = cov.rows();

    if (p == 0)
        return cov;

    const double traceOverP = cov.trace() / static_cast<double>(p);
    return (1.0 - alpha) * cov + alpha * traceOverP * Eigen::MatrixXd::Identity(p, p);
}

Index retainedComponentCount(
    const Eigen::VectorXd& descending,
    double rcond) noexcept
{
    const Index n = descending.size();

    Index positive = 0;
    while (positive < n && descending(positive) > 0.0)
        ++positive;

    if (positive == 0)
        return 0;

    if (rcond > 0.0) {
        const double largest = std::max(std::abs(descending(0)), std::abs(descending(n - 1)));
        const double threshold = rcond * largest;
        Index keep = 0;
        while (keep < positive && descending(keep) > threshold)
            ++keep;
        return keep;
    }

    if (rcond == 0.0)
        return positive;

    if (rcond > -1.0) {
        const double total = descending.head(positive).sum();
        const double target = -rcond * total;
        double mass = 0.0;
        for (Index k = 0; k < positive; ++k) {
            mass += descending(k);
            if (mass >= target)
                return k + 1;
        }
        return positive;
    }

    if (-rcond >= static_cast<double>(positive))
        return positive;
    return static_cast<Index>(std::floor(-rcond));
}

core::Expected<Whitener> computeWhitener(
    const Eigen::MatrixXd& cov,
    double reg,
    double rcond,
    bool symmetric)
{
    if (cov.rows() != cov.cols())
        return makeError(
            ErrorCode::kShapeMismatch,
            "whitener expects a square matrix, got " + std::to_string(cov.rows()) + "x"
                + std::to_string(cov.cols()));

    if (!cov.allFinite())
        return makeError(ErrorCode::kNonFiniteInput, "covariance contains NaN or Inf");

    const Index n = cov.rows();

    Whitener result;
    result.symmetric = symmetric;

    if (n == 0) {
        result.matrix = Eigen::MatrixXd::Zero(0, 0);
        return result;
    }

    Eigen::MatrixXd sym = 0.5 * (cov + cov.transpose());
    if (reg > 0.0)
        sym = regularizeCovariance(sym, reg);

    Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> solver(sym);
    if (solver.info() != Eigen::Success)
        return makeError(ErrorCode::kDecompositionFailed, "eigenvalue decomposition failed");

    // Eigen returns ascending eigenvalues.
    const Eigen::VectorXd values = solver.eigenvalues().reverse();
    const Eigen::MatrixXd vectors = solver.eigenvectors().rowwise().reverse();

    const Index keep = retainedComponentCount(values, rcond);

    if (keep == 0) {
        Log::warn("WHITEN", "degenerate covariance (" + std::to_string(n) + "x" + std::to_string(n)
                                + "): no eigenvalue above the cut-off, returning a zero-rank whitener");
        result.matrix = symmetric ? Eigen::MatrixXd::Zero(n, n) : Eigen::MatrixXd::Zero(n, 0);
        return result;
    }

    result.rank = keep;
    result.eigenvalues = values.head(keep);

    const Eigen::VectorXd invSqrt = result.eigenvalues.array().rsqrt().matrix();
    const Eigen::MatrixXd scaledBasis = vectors.leftCols(keep) * invSqrt.asDiagonal();

    if (symmetric)
        result.matrix = scaledBasis * vectors.leftCols(keep).transpose();
    else
        result.matrix = scaledBasis;

    if (keep < n && Log::enabled(core::LogLevel::kDebug))
        Log::debug("WHITEN", "rank truncated " + std::to_string(n) + " -> " + std::to_string(keep));

    return result;
}

} // namespace lcca::math
