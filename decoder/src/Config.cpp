/**
 * @file Config.cpp
 * @brief LevelsCcaConfig::Builder implementation.
 */

#include "lcca/decoder/Config.hpp"

#include <cmath>
#include <string>

namespace lcca::decoder {

using core::ErrorCode;

LevelsCcaConfig::Builder& LevelsCcaConfig::Builder::rank(core::i32 components) noexcept
{
    _rank = components;
    return *this;
}

LevelsCcaConfig::Builder& LevelsCcaConfig::Builder::reg(double strength) noexcept
{
    _regX = strength;
    _regY = strength;
    return *this;
}

LevelsCcaConfig::Builder& LevelsCcaConfig::Builder::regX(double strength) noexcept
{
    _regX = strength;
    return *this;
}

LevelsCcaConfig::Builder& LevelsCcaConfig::Builder::regY(double strength) noexcept
{
    _regY = strength;
    return *this;
}

LevelsCcaConfig::Builder& LevelsCcaConfig::Builder::rcond(double value) noexcept
{
    _rcondX = value;
    _rcondY = value;
    return *this;
}

LevelsCcaConfig::Builder& LevelsCcaConfig::Builder::rcondX(double value) noexcept
{
    _rcondX = value;
    return *this;
}

LevelsCcaConfig::Builder& LevelsCcaConfig::Builder::rcondY(double value) noexcept
{
    _rcondY = value;
    return *this;
}

LevelsCcaConfig::Builder& LevelsCcaConfig::Builder::symmetricWhitener(bool enabled) noexcept
{
    _symmetric = enabled;
    return *this;
}

LevelsCcaConfig::Builder& LevelsCcaConfig::Builder::tolerance(double tol) noexcept
{
    _tolerance = tol;
    return *this;
}

LevelsCcaConfig::Builder& LevelsCcaConfig::Builder::maxIter(core::i32 n) noexcept
{
    _maxIter = n;
    return *this;
}

LevelsCcaConfig::Builder& LevelsCcaConfig::Builder::weightSolverMode(WeightSolverMode mode) noexcept
{
    _weightSolver.mode = mode;
    return *this;
}

LevelsCcaConfig::Builder& LevelsCcaConfig::Builder::weightSolver(const WeightSolverConfig& config) noexcept
{
    _weightSolver = config;
    return *this;
}

core::Expected<LevelsCcaConfig> LevelsCcaConfig::Builder::build() const
{
    LCCA_ENSURE(_rank >= 1, ErrorCode::kInvalidArgument, "rank must be >= 1, got " + std::to_string(_rank));
    LCCA_ENSURE(_maxIter >= 1, ErrorCode::kInvalidArgument, "maxIter must be >= 1, got " + std::to_string(_maxIter));
    LCCA_ENSURE(_tolerance >= 0.0, ErrorCode::kInvalidArgument, "tolerance must be >= 0");
    LCCA_ENSURE(_regX >= 0.0 && _regX <= 1.0 && _regY >= 0.0 && _regY <= 1.0, ErrorCode::kInvalidArgument,
                "regularization strengths must lie in [0, 1]");
    LCCA_ENSURE(std::isfinite(_rcondX) && std::isfinite(_rcondY), ErrorCode::kInvalidArgument,
                "rcond values must be finite");
    LCCA_ENSURE(_weightSolver.maxIter >= 1, ErrorCode::kInvalidArgument, "weight solver maxIter must be >= 1");
    LCCA_ENSURE(_weightSolver.ridge >= 0.0 && _weightSolver.epsilon >= 0.0, ErrorCode::kInvalidArgument,
                "weight solver ridge and epsilon must be >= 0");
    LCCA_ENSURE(_weightSolver.floor > 0.0, ErrorCode::kInvalidArgument, "weight solver floor must be > 0");

    LevelsCcaConfig cfg;
    cfg._rank         = _rank;
    cfg._regX         = _regX;
    cfg._regY         = _regY;
    cfg._rcondX       = _rcondX;
    cfg._rcondY       = _rcondY;
    cfg._symmetric    = _symmetric;
    cfg._tolerance    = _tolerance;
    cfg._maxIter      = _maxIter;
    cfg._weightSolver = _weightSolver;
    return cfg;
}

CcaOptions LevelsCcaConfig::ccaOptions() const noexcept
{
    return CcaOptions{
        .rank      = _rank,
        .regX      = _regX,
        .regY      = _regY,
        .rcondX    = _rcondX,
        .rcondY    = _rcondY,
        .symmetric = _symmetric,
    };
}

} // namespace lcca::decoder
