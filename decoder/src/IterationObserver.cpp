/**
 * @file IterationObserver.cpp
 * @brief Log-backed iteration observer.
 */

#include "lcca/decoder/IterationObserver.hpp"

#include "lcca/core/Constants.hpp"
#include "lcca/core/Log.hpp"

#include <cstdio>
#include <string>

namespace lcca::decoder {

namespace {

std::string formatReport(const IterationReport& report)
{
    char line[160];
    std::snprintf(
        line, sizeof(line),
        "%3d) |S_y|=%4.3f dS_y=%5.4f  J=%4.3f dJ=%5.4f",
        report.iteration,
        report.outputWeights.sum(),
        report.weightChange,
        report.objectivePost,
        report.objectiveChange);
    return line;
}

} // namespace

void LoggingObserver::onIteration(const IterationReport& report)
{
    if (report.iteration < core::kLogFirstIterations || report.iteration % core::kLogEveryIterations == 0)
        core::Log::info("LCCA", formatReport(report));
}

void LoggingObserver::onFinished(const IterationReport& report)
{
    core::Log::info("LCCA", formatReport(report) + (report.converged ? " (converged)" : " (iteration cap)"));
}

} // namespace lcca::decoder
