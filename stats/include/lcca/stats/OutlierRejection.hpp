/**
 * @file OutlierRejection.hpp
 * @brief Median-relative rejection of high-magnitude epochs.
 * @author MasterLaplace
 *
 * An epoch's magnitude is the Frobenius norm of its channel data. Epochs
 * whose magnitude exceeds @c threshold times the median magnitude of the
 * batch are excluded from accumulation (artifacts, disconnected
 * electrodes). The median of an even-sized batch is the mean of its two
 * middle magnitudes. A non-positive threshold disables rejection.
 */

#pragma once

#include "lcca/stats/Epoch.hpp"

#include <span>
#include <vector>

namespace lcca::stats {

/**
 * @brief Frobenius norm of every epoch's data.
 */
[[nodiscard]] std::vector<double> epochMagnitudes(std::span<const Epoch> epochs);

/**
 * @brief Flags the epochs to keep.
 *
 * @param epochs    Batch of epochs
 * @param threshold Multiple of the median magnitude above which an epoch
 *                  is rejected (<= 0 keeps everything)
 * @return One flag per epoch, true when kept
 */
[[nodiscard]] std::vector<bool> selectInlierEpochs(
    std::span<const Epoch> epochs,
    double threshold);

} // namespace lcca::stats
