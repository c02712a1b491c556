/**
 * @file Tensor.hpp
 * @brief Labeled covariance tensors and their reshaped matrix views.
 * @author MasterLaplace
 *
 * All covariance structures are row-major Eigen tensors so that the last
 * axis varies fastest. Merging trailing axes into a matrix column (or
 * leading axes into a row) is then a zero-copy Eigen::Map over the tensor
 * storage, which is how every contraction of the optimizer is written.
 *
 * Axis conventions:
 *  - Cyx            (nY, nE, tau, d)
 *  - Cyy compressed (lag, nY, nE, nY, nE)
 *  - Cyy full       (nY, nE, tau, nY, nE, tau)
 *  - responses      (rank, nE, tau)
 */

#pragma once

#include "lcca/core/Types.hpp"

#include <Eigen/Dense>
#include <unsupported/Eigen/CXX11/Tensor>

namespace lcca::math {

using core::Index;

template <int Rank>
using Tensor = Eigen::Tensor<double, Rank, Eigen::RowMajor>;

using Tensor3 = Tensor<3>;
using Tensor4 = Tensor<4>;
using Tensor5 = Tensor<5>;
using Tensor6 = Tensor<6>;

using RowMatrix = Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

using MatrixView        = Eigen::Map<RowMatrix>;
using ConstMatrixView   = Eigen::Map<const RowMatrix>;
using ConstStridedView  = Eigen::Map<const RowMatrix, 0, Eigen::OuterStride<>>;

/**
 * @brief Views a tensor as a rows × cols matrix over its own storage.
 *
 * @pre rows * cols == tensor.size()
 */
template <int Rank>
[[nodiscard]] ConstMatrixView asMatrix(const Tensor<Rank>& tensor, Index rows, Index cols)
{
    return ConstMatrixView(tensor.data(), rows, cols);
}

template <int Rank>
[[nodiscard]] MatrixView asMatrix(Tensor<Rank>& tensor, Index rows, Index cols)
{
    return MatrixView(tensor.data(), rows, cols);
}

/**
 * @brief True when every coefficient of the tensor is finite.
 */
template <int Rank>
[[nodiscard]] bool allFinite(const Tensor<Rank>& tensor)
{
    return asMatrix(tensor, 1, static_cast<Index>(tensor.size())).allFinite();
}

} // namespace lcca::math
