// config.hpp
#pragma once
#include <cstdint>

// Compile-time configuration for core facilities.
//
// Process-wide constants of the decent mobility criteria live here so the
// evaluator and selector agree on units. Times in the travel-plan model are
// hours; times in alternative catalogs are minutes.

// Global hardening switch for optional runtime assertions in debug/testing code.
// Set via compile flag: -DDM_HARDENED=1
#ifndef DM_HARDENED
#define DM_HARDENED 0
#endif

#if DM_HARDENED
#include <stdexcept>
#define DM_ASSERT_H(cond, msg) do { if(!(cond)) throw std::logic_error(msg); } while(0)
#else
#define DM_ASSERT_H(cond, msg) do { } while(0)
#endif

// Default cap on branch-and-bound nodes per destination (0 => unbounded).
#ifndef DM_NODE_LIMIT_DEFAULT
#define DM_NODE_LIMIT_DEFAULT 5000000ULL
#endif

namespace core {

using count_t = int;

/** @brief Travel time maximum for decent mobility [hours / day]. */
inline constexpr double kTimeBudgetHoursPerDay = 1.2;

/** @brief Default period covered by a travel plan [days]. */
inline constexpr int kDefaultPeriodDays = 7;

/** @brief Days per year, used to rescale plan totals to annual values. */
inline constexpr double kDaysPerYear = 365.0;

/** @brief Default deviation allowed from the typical travel time [minutes]. */
inline constexpr double kDefaultTimeTolerance = 10.0;

inline constexpr std::uint64_t kDefaultNodeLimit = DM_NODE_LIMIT_DEFAULT;

} // namespace core
