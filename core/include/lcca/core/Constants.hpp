/**
 * @file Constants.hpp
 * @brief Default numeric parameters of the estimation core.
 *
 * All tunable defaults of the whitener, the alternating optimizer and the
 * constrained weight solver are centralised here so that the configuration
 * builders and the free functions agree on a single set of values.
 *
 * @author MasterLaplace
 */
#pragma once

#ifndef LCCA_CORE_CONSTANTS_HPP
    #define LCCA_CORE_CONSTANTS_HPP

    #include "Types.hpp"

namespace lcca::core {

// ---- Whitening -----------------------------------------------------------

inline constexpr f64   kDefaultReg              = 1e-9;
inline constexpr f64   kDefaultRcond            = 1e-8;

// ---- Alternating optimizer -----------------------------------------------

inline constexpr i32   kDefaultRank             = 1;
inline constexpr i32   kDefaultMaxIter          = 100;
inline constexpr f64   kDefaultTolerance        = 1e-3;

// ---- Constrained weight solver -------------------------------------------

inline constexpr i32   kWeightMaxIter           = 30;
inline constexpr f64   kWeightTolerance         = 1e-4;
inline constexpr f64   kWeightRidge             = 1e-4;
inline constexpr f64   kWeightEpsilon           = 1e-3;
inline constexpr f64   kWeightEta               = 0.5;
inline constexpr f64   kWeightFloor             = 1e-6;
inline constexpr f64   kNegativePenaltyScale    = 10.0;
inline constexpr f64   kMultiplicativeDamping   = 1e-6;
inline constexpr f64   kGradientStepScale       = 1e-2;

// ---- Summary statistics --------------------------------------------------

inline constexpr f64   kDefaultBadEpochThresh   = 4.0;

// ---- Diagnostics ---------------------------------------------------------

inline constexpr i32   kLogEveryIterations      = 100;
inline constexpr i32   kLogFirstIterations      = 10;

} // namespace lcca::core

#endif // LCCA_CORE_CONSTANTS_HPP
