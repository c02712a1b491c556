/**
 * @file Types.hpp
 * @brief Primitive type aliases shared by every LevelsCCA module.
 *
 * Provides fixed-width integer aliases, floating-point aliases and the
 * Eigen index type used for all dense array dimensions.
 *
 * @author MasterLaplace
 */
#pragma once

#ifndef LCCA_CORE_TYPES_HPP
    #define LCCA_CORE_TYPES_HPP

    #include <Eigen/Core>

    #include <cstddef>
    #include <cstdint>

namespace lcca::core {

using u8  = std::uint8_t;
using u16 = std::uint16_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;

using i32 = std::int32_t;
using i64 = std::int64_t;

using f64 = double;

using usize = std::size_t;

/// @brief Signed dimension type of every matrix and tensor axis.
using Index = Eigen::Index;

} // namespace lcca::core

#endif // LCCA_CORE_TYPES_HPP
