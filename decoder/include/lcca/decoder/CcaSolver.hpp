/**
 * @file CcaSolver.hpp
 * @brief Whitened generalized CCA between spatial channels and lagged events.
 * @author MasterLaplace
 *
 * Given the channel covariance Cxx (d × d), the event/channel cross
 * covariance Cyx (M × d) and the event covariance Cyy (M × M), with
 * M = nE * tau, the canonical pairs are the singular vectors of the
 * doubly-whitened cross matrix @f$ W_y^T \, C_{yx} \, W_x @f$ mapped back
 * through the whiteners:
 * @f[ W = W_x V_k, \qquad R = W_y U_k @f]
 * so that filters and responses apply directly to un-whitened data.
 */

#pragma once

#include "lcca/core/Constants.hpp"
#include "lcca/core/Expected.hpp"
#include "lcca/math/Tensor.hpp"
#include "lcca/math/Whitener.hpp"

#include <Eigen/Dense>

namespace lcca::decoder {

using core::Index;

/**
 * @brief Whitening and truncation settings of a CCA solve.
 */
struct CcaOptions {
    Index rank = core::kDefaultRank;
    double regX = core::kDefaultReg;
    double regY = core::kDefaultReg;
    double rcondX = core::kDefaultRcond;
    double rcondY = core::kDefaultRcond;
    bool symmetric = true;
};

/**
 * @brief Canonical pairs in column layout.
 *
 * The number of retained components is never larger than the requested
 * rank and silently drops to the number of available singular values.
 */
struct CcaSolution {
    Eigen::MatrixXd filters;      ///< d × k
    Eigen::MatrixXd responses;    ///< M × k
    Eigen::VectorXd correlations; ///< k, descending
    bool degenerateTemporal = false;

    [[nodiscard]] Index rank() const noexcept { return correlations.size(); }
};

/**
 * @brief Filters, responses and relative component weights ready for scoring.
 */
struct FactoredModel {
    Eigen::MatrixXd filters;          ///< rank × d
    math::Tensor3 responses;          ///< rank × nE × tau
    Eigen::VectorXd componentWeights; ///< singular values relative to the largest
};

/**
 * @brief Solves the CCA for an already-whitened spatial side.
 *
 * The temporal whitener is computed from @p cyy with @p options.regY /
 * @p options.rcondY.
 *
 * @param spatial Whitener of Cxx
 * @param cyx     M × d cross covariance
 * @param cyy     M × M event covariance
 * @return Canonical pairs, or Error on inconsistent shapes
 */
[[nodiscard]] core::Expected<CcaSolution> solveWhitenedCca(
    const math::Whitener& spatial,
    const Eigen::MatrixXd& cyx,
    const Eigen::MatrixXd& cyy,
    const CcaOptions& options);

/**
 * @brief Solves a single-output generalized CCA from raw covariances.
 */
[[nodiscard]] core::Expected<CcaSolution> solveCca(
    const Eigen::MatrixXd& cxx,
    const Eigen::MatrixXd& cyx,
    const Eigen::MatrixXd& cyy,
    const CcaOptions& options = {});

/**
 * @brief Encodes component importance into the filters and responses.
 *
 * Both factors of component k are scaled by @f$ \sqrt{l_k / \max_j l_j} @f$;
 * a zero largest correlation falls back to unit scaling.
 *
 * @param solution Canonical pairs (responses have M = nE * tau rows)
 * @param nE       Number of event types
 * @param tau      Number of lags
 */
[[nodiscard]] FactoredModel toFactoredModel(
    const CcaSolution& solution,
    Index nE,
    Index tau);

} // namespace lcca::decoder
