/**
 * @file Config.hpp
 * @brief Levels-CCA optimizer configuration (Builder pattern).
 * @author MasterLaplace
 *
 * Immutable configuration built through a fluent Builder. Holds the
 * whitening of both sides, the rank, the convergence settings and the
 * weight sub-solver parameters.
 */

#pragma once

#include "lcca/core/Constants.hpp"
#include "lcca/core/Expected.hpp"
#include "lcca/decoder/CcaSolver.hpp"
#include "lcca/decoder/WeightSolver.hpp"

namespace lcca::decoder {

/**
 * @brief Immutable optimizer configuration.
 */
class LevelsCcaConfig
{
public:
    /**
     * @brief Fluent builder for LevelsCcaConfig.
     */
    class Builder
    {
    public:
        Builder& rank(core::i32 components) noexcept;
        Builder& reg(double strength) noexcept;
        Builder& regX(double strength) noexcept;
        Builder& regY(double strength) noexcept;
        Builder& rcond(double value) noexcept;
        Builder& rcondX(double value) noexcept;
        Builder& rcondY(double value) noexcept;
        Builder& symmetricWhitener(bool enabled) noexcept;
        Builder& tolerance(double tol) noexcept;
        Builder& maxIter(core::i32 n) noexcept;
        Builder& weightSolverMode(WeightSolverMode mode) noexcept;
        Builder& weightSolver(const WeightSolverConfig& config) noexcept;

        /// @brief Validates the parameters and produces the configuration.
        [[nodiscard]] core::Expected<LevelsCcaConfig> build() const;

    private:
        core::i32 _rank{core::kDefaultRank};
        double _regX{core::kDefaultReg};
        double _regY{core::kDefaultReg};
        double _rcondX{core::kDefaultRcond};
        double _rcondY{core::kDefaultRcond};
        bool _symmetric{true};
        double _tolerance{core::kDefaultTolerance};
        core::i32 _maxIter{core::kDefaultMaxIter};
        WeightSolverConfig _weightSolver{};
    };

    [[nodiscard]] core::i32 rank()              const noexcept { return _rank; }
    [[nodiscard]] double    regX()              const noexcept { return _regX; }
    [[nodiscard]] double    regY()              const noexcept { return _regY; }
    [[nodiscard]] double    rcondX()            const noexcept { return _rcondX; }
    [[nodiscard]] double    rcondY()            const noexcept { return _rcondY; }
    [[nodiscard]] bool      symmetricWhitener() const noexcept { return _symmetric; }
    [[nodiscard]] double    tolerance()         const noexcept { return _tolerance; }
    [[nodiscard]] core::i32 maxIter()           const noexcept { return _maxIter; }

    [[nodiscard]] const WeightSolverConfig& weightSolver() const noexcept { return _weightSolver; }

    /// @brief Whitening/truncation settings handed to the CCA step.
    [[nodiscard]] CcaOptions ccaOptions() const noexcept;

private:
    core::i32 _rank{core::kDefaultRank};
    double _regX{core::kDefaultReg};
    double _regY{core::kDefaultReg};
    double _rcondX{core::kDefaultRcond};
    double _rcondY{core::kDefaultRcond};
    bool _symmetric{true};
    double _tolerance{core::kDefaultTolerance};
    core::i32 _maxIter{core::kDefaultMaxIter};
    WeightSolverConfig _weightSolver{};
};

} // namespace lcca::decoder
