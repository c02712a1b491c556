/**
 * @file Epoch.hpp
 * @brief One time-aligned trial of channel data and event indicators.
 * @author MasterLaplace
 */

#pragma once

#include "lcca/math/Tensor.hpp"

#include <Eigen/Dense>

namespace lcca::stats {

/**
 * @brief A trial of N samples.
 *
 * Memory layout: data(sample, channel) and events(sample, output, event).
 */
struct Epoch {
    Eigen::MatrixXd data;   ///< N × d
    math::Tensor3 events;   ///< N × nY × nE

    [[nodiscard]] core::Index sampleCount() const noexcept { return data.rows(); }
};

} // namespace lcca::stats
