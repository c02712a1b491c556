/**
 * @file LagCovariance.hpp
 * @brief Expansion of the lag-compressed event autocovariance.
 * @author MasterLaplace
 *
 * The event autocovariance is accumulated once per lag difference
 * @f$ \delta = t - u @f$ instead of once per (t, u) pair. Expanding it
 * back to explicit (lag, lag) axes trades memory for simple contractions.
 *
 * Entry rule (zero-padded convention):
 * @f[
 *   F[y,e,t,y',e',u] =
 *   \begin{cases}
 *     C[t-u,\, y,e,\, y',e'] & t \ge u,\ t-u < L \\
 *     C[u-t,\, y',e',\, y,e] & t < u,\ u-t < L \\
 *     0 & \text{otherwise}
 *   \end{cases}
 * @f]
 * The lag-0 block is symmetrized so the expanded tensor is always exactly
 * symmetric under @f$ (y,e,t) \leftrightarrow (y',e',u) @f$.
 */

#pragma once

#include "lcca/core/Expected.hpp"
#include "lcca/math/Tensor.hpp"

namespace lcca::math {

/**
 * @brief Expands a (lag, nY, nE, nY, nE) tensor to (nY, nE, tau, nY, nE, tau).
 *
 * @param compressed Lag-difference-compressed covariance (L stored lags)
 * @param tau        Number of lags of the expanded tensor; differences
 *                   beyond the L stored lags are zero
 * @return Expanded tensor, or Error on inconsistent output/event axes
 */
[[nodiscard]] core::Expected<Tensor6> expandLagCovariance(
    const Tensor5& compressed,
    Index tau);

/**
 * @brief Expands with tau equal to the number of stored lags.
 */
[[nodiscard]] core::Expected<Tensor6> expandLagCovariance(const Tensor5& compressed);

} // namespace lcca::math
