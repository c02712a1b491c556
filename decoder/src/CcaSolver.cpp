/**
 * @file CcaSolver.cpp
 * @brief Whitening + SVD implementation of the generalized CCA.
 */

#include "lcca/decoder/CcaSolver.hpp"

#include <Eigen/SVD>
#include <algorithm>
#include <sstream>

namespace lcca::decoder {

using core::ErrorCode;
using core::makeError;

core::Expected<CcaSolution> solveWhitenedCca(
    const math::Whitener& spatial,
    const Eigen::MatrixXd& cyx,
    const Eigen::MatrixXd& cyy,
    const CcaOptions& options)
{
    const Index m = cyy.rows();
    const Index d = spatial.matrix.rows();

    if (cyy.cols() != m || cyx.rows() != m || cyx.cols() != d) {
        std::ostringstream os;
        os << "CCA shape mismatch: Cyx(" << cyx.rows() << 'x' << cyx.cols() << "), Cyy(" << cyy.rows() << 'x'
           << cyy.cols() << "), spatial whitener(" << d << " channels)";
        return makeError(ErrorCode::kShapeMismatch, os.str());
    }

    const math::Whitener temporal = LCCA_TRY(math::computeWhitener(cyy, options.regY, options.rcondY, options.symmetric));

    CcaSolution solution;
    solution.degenerateTemporal = temporal.degenerate();

    if (spatial.degenerate() || temporal.degenerate()) {
        solution.filters = Eigen::MatrixXd::Zero(d, 0);
        solution.responses = Eigen::MatrixXd::Zero(m, 0);
        solution.correlations = Eigen::VectorXd::Zero(0);
        return solution;
    }

    const Eigen::MatrixXd whitened = temporal.matrix.transpose() * cyx * spatial.matrix;

    // Singular values come back in decreasing order.
    const Eigen::JacobiSVD<Eigen::MatrixXd> svd(whitened, Eigen::ComputeThinU | Eigen::ComputeThinV);

    const Index k = std::min(std::max<Index>(options.rank, 1), svd.singularValues().size());

    solution.correlations = svd.singularValues().head(k);
    solution.responses = temporal.matrix * svd.matrixU().leftCols(k);
    solution.filters = spatial.matrix * svd.matrixV().leftCols(k);

    return solution;
}

core::Expected<CcaSolution> solveCca(
    const Eigen::MatrixXd& cxx,
    const Eigen::MatrixXd& cyx,
    const Eigen::MatrixXd& cyy,
    const CcaOptions& options)
{
    const math::Whitener spatial = LCCA_TRY(math::computeWhitener(cxx, options.regX, options.rcondX, options.symmetric));
    return solveWhitenedCca(spatial, cyx, cyy, options);
}

FactoredModel toFactoredModel(
    const CcaSolution& solution,
    Index nE,
    Index tau)
{
    const Index k = solution.rank();

    FactoredModel model;
    model.componentWeights = Eigen::VectorXd::Ones(k);

    const double largest = k > 0 ? solution.correlations.maxCoeff() : 0.0;
    if (largest > 0.0)
        model.componentWeights = solution.correlations / largest;

    const Eigen::VectorXd scale = model.componentWeights.cwiseSqrt();

    model.filters = (solution.filters * scale.asDiagonal()).transpose();

    model.responses = math::Tensor3(k, nE, tau);
    math::MatrixView responses = math::asMatrix(model.responses, k, nE * tau);
    responses = (solution.responses * scale.asDiagonal()).transpose();

    return model;
}

} // namespace lcca::decoder
