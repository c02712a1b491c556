/**
 * @file Contraction.cpp
 * @brief Block-wise implementation of the output-axis contractions.
 */

#include "lcca/math/Contraction.hpp"

namespace lcca::math {

namespace {

Index blockSize(const Tensor6& full)
{
    return full.dimension(1) * full.dimension(2);
}

} // namespace

ConstStridedView outputPairBlock(const Tensor6& full, Index y, Index z)
{
    const Index nY = full.dimension(0);
    const Index m = blockSize(full);
    const double* origin = full.data() + (y * m * nY + z) * m;
    return ConstStridedView(origin, m, m, Eigen::OuterStride<>(nY * m));
}

ConstMatrixView outputBlock(const Tensor4& cyx, Index y)
{
    const Index m = cyx.dimension(1) * cyx.dimension(2);
    const Index d = cyx.dimension(3);
    return ConstMatrixView(cyx.data() + y * m * d, m, d);
}

Eigen::MatrixXd weightOutputPairs(
    const Tensor6& full,
    const Eigen::VectorXd& weights)
{
    const Index nY = full.dimension(0);
    const Index m = blockSize(full);

    Eigen::MatrixXd reduced = Eigen::MatrixXd::Zero(m, m);
    for (Index y = 0; y < nY; ++y)
        for (Index z = 0; z < nY; ++z)
            reduced.noalias() += (weights(y) * weights(z)) * outputPairBlock(full, y, z);

    return reduced;
}

Eigen::MatrixXd weightOutputs(
    const Tensor4& cyx,
    const Eigen::VectorXd& weights)
{
    const Index nY = cyx.dimension(0);
    const Index m = cyx.dimension(1) * cyx.dimension(2);

    Eigen::MatrixXd reduced = Eigen::MatrixXd::Zero(m, cyx.dimension(3));
    for (Index y = 0; y < nY; ++y)
        reduced.noalias() += weights(y) * outputBlock(cyx, y);

    return reduced;
}

Eigen::MatrixXd projectOutputPairs(
    const Tensor6& full,
    const Eigen::MatrixXd& responses)
{
    const Index nY = full.dimension(0);

    Eigen::MatrixXd gram = Eigen::MatrixXd::Zero(nY, nY);
    for (Index y = 0; y < nY; ++y)
        for (Index z = 0; z < nY; ++z) {
            const Eigen::MatrixXd projected = outputPairBlock(full, y, z) * responses;
            gram(y, z) = responses.cwiseProduct(projected).sum();
        }

    return gram;
}

Eigen::VectorXd projectOutputs(
    const Tensor4& cyx,
    const Eigen::MatrixXd& responses,
    const Eigen::MatrixXd& filters)
{
    const Index nY = cyx.dimension(0);

    Eigen::VectorXd cross(nY);
    for (Index y = 0; y < nY; ++y) {
        const Eigen::MatrixXd projected = outputBlock(cyx, y) * filters;
        cross(y) = responses.cwiseProduct(projected).sum();
    }

    return cross;
}

} // namespace lcca::math
