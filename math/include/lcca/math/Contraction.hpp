/**
 * @file Contraction.hpp
 * @brief Named contractions of the covariance tensors over the output axes.
 * @author MasterLaplace
 *
 * With M = nE * tau, the full event covariance is a grid of nY × nY blocks
 * of size M × M and the cross covariance a stack of nY blocks of size M × d.
 * Every contraction the optimizer needs is expressed over those blocks:
 *
 *  - weightOutputPairs : @f$ \sum_{y,z} s_y s_z \, F_{yz} @f$          → (M, M)
 *  - weightOutputs     : @f$ \sum_{y} s_y \, X_y @f$                     → (M, d)
 *  - projectOutputPairs: @f$ G_{yz} = \sum_k r_k^T F_{yz} r_k @f$        → (nY, nY)
 *  - projectOutputs    : @f$ c_y = \sum_k r_k^T X_y w_k @f$              → (nY)
 *
 * Responses R are (M × k) and filters W are (d × k), one column per
 * component.
 */

#pragma once

#include "lcca/math/Tensor.hpp"

namespace lcca::math {

/**
 * @brief M × M block (y, z) of the full event covariance.
 */
[[nodiscard]] ConstStridedView outputPairBlock(const Tensor6& full, Index y, Index z);

/**
 * @brief M × d block y of the cross covariance.
 */
[[nodiscard]] ConstMatrixView outputBlock(const Tensor4& cyx, Index y);

/**
 * @brief Contracts both output axes of the full covariance with @p weights.
 */
[[nodiscard]] Eigen::MatrixXd weightOutputPairs(
    const Tensor6& full,
    const Eigen::VectorXd& weights);

/**
 * @brief Contracts the output axis of the cross covariance with @p weights.
 */
[[nodiscard]] Eigen::MatrixXd weightOutputs(
    const Tensor4& cyx,
    const Eigen::VectorXd& weights);

/**
 * @brief Output-output Gram matrix of the responses, summed over components.
 */
[[nodiscard]] Eigen::MatrixXd projectOutputPairs(
    const Tensor6& full,
    const Eigen::MatrixXd& responses);

/**
 * @brief Per-output cross term between responses and filters, summed over
 *        components.
 */
[[nodiscard]] Eigen::VectorXd projectOutputs(
    const Tensor4& cyx,
    const Eigen::MatrixXd& responses,
    const Eigen::MatrixXd& filters);

} // namespace lcca::math
