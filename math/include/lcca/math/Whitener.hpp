/**
 * @file Whitener.hpp
 * @brief Regularized, rank-truncated inverse square root of a covariance.
 * @author MasterLaplace
 *
 * A whitener W of a symmetric positive-semidefinite matrix C satisfies
 * @f$ W^T C W = I @f$ on the retained eigen-subspace. Eigenvalues at or
 * below the cut-off selected by @c rcond are dropped from the basis, so the
 * effective rank of the whitener can be lower than the matrix size, down
 * to zero for an all-zero input.
 */

#pragma once

#include "lcca/core/Expected.hpp"
#include "lcca/core/Types.hpp"

#include <Eigen/Dense>

namespace lcca::math {

using core::Index;

/**
 * @brief Result of a whitening decomposition.
 */
struct Whitener {
    /// n×n when symmetric, n×rank otherwise.
    Eigen::MatrixXd matrix;
    /// Retained eigenvalues in descending order (after regularization).
    Eigen::VectorXd eigenvalues;
    Index rank = 0;
    bool symmetric = true;

    /// @brief True when every eigenvalue was dropped.
    [[nodiscard]] bool degenerate() const noexcept { return rank == 0; }
};

/**
 * @brief Shrinks a covariance towards a scaled identity.
 *
 * @f$ C' = (1 - \alpha) C + \alpha \frac{\mathrm{tr}(C)}{p} I @f$
 *
 * An all-zero input stays all-zero.
 */
[[nodiscard]] Eigen::MatrixXd regularizeCovariance(
    const Eigen::MatrixXd& cov,
    double alpha);

/**
 * @brief Number of leading eigenvalues kept under a given @p rcond.
 *
 *  - @c rcond > 0        : keep eigenvalues above rcond × the largest magnitude
 *  - @c rcond == 0       : keep every positive eigenvalue
 *  - -1 < @c rcond < 0   : keep the fewest leading eigenvalues whose mass
 *                          reaches |rcond| of the total positive mass
 *  - @c rcond <= -1      : keep exactly floor(-rcond) eigenvalues
 *
 * Non-positive eigenvalues are never kept.
 *
 * @param descending Eigenvalues sorted in descending order
 */
[[nodiscard]] Index retainedComponentCount(
    const Eigen::VectorXd& descending,
    double rcond) noexcept;

/**
 * @brief Computes the whitener of a symmetric matrix.
 *
 * The input is symmetrized, shrunk with @p reg, eigen-decomposed, truncated
 * with @p rcond, and assembled as
 * @f$ W = V \, \Lambda^{-1/2} \, (V^T \text{ if symmetric}) @f$.
 * A fully degenerate input yields a zero-rank whitener (all-zero n×n when
 * symmetric, n×0 otherwise) and a warning, never an error.
 *
 * @return Whitener, or Error on a non-square / non-finite input or a failed
 *         eigen-decomposition
 */
[[nodiscard]] core::Expected<Whitener> computeWhitener(
    const Eigen::MatrixXd& cov,
    double reg,
    double rcond,
    bool symmetric = true);

} // namespace lcca::math
