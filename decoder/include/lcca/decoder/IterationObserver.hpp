/**
 * @file IterationObserver.hpp
 * @brief Optional callbacks invoked at the optimizer's iteration boundaries.
 * @author MasterLaplace
 *
 * The optimizer never prints or plots. Anything that wants to follow the
 * run (progress logs, live objective plots, early inspection in tests)
 * implements IIterationObserver and is handed to LevelsCca::setObserver().
 */

#pragma once

#include "lcca/core/Types.hpp"

#include <Eigen/Dense>

namespace lcca::decoder {

/**
 * @brief Snapshot of one outer iteration.
 */
struct IterationReport {
    core::i32 iteration = 0;
    double objectivePre = 0.0;
    double objectivePost = 0.0;
    double weightChange = 0.0;    ///< L1 change of S_y
    double objectiveChange = 0.0; ///< |J - J_previous|
    core::Index effectiveRank = 0;
    bool converged = false;
    Eigen::VectorXd outputWeights;
};

/**
 * @brief Observer of the alternating optimizer.
 */
class IIterationObserver {
public:
    virtual ~IIterationObserver() = default;

    /**
     * @brief Called once per completed outer iteration.
     */
    virtual void onIteration(const IterationReport& report) = 0;

    /**
     * @brief Called once after the loop with the last iteration's report.
     */
    virtual void onFinished(const IterationReport& report) { (void)report; }
};

/**
 * @brief Reports progress through core::Log.
 *
 * Logs the first iterations, then every n-th, and the final state.
 */
class LoggingObserver final : public IIterationObserver {
public:
    void onIteration(const IterationReport& report) override;
    void onFinished(const IterationReport& report) override;
};

} // namespace lcca::decoder
