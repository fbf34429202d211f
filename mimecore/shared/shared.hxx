/**
 * @file shared.hxx
 * @brief Common includes, macros, and shared namespace for the mimecore.
 */

#ifndef MIMECORE_SHARED_HXX
#define MIMECORE_SHARED_HXX

#include <algorithm>
#include <cmath>
#include <chrono>
#include <concepts>
#include <cstdint>
#include <cstdio>
#include <functional>
#include <istream>
#include <limits>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/chrono.h>
#include <fmt/color.h>
#include <fmt/core.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include <boost/algorithm/string.hpp>
#include <boost/algorithm/string/predicate.hpp>

#include <boost/container_hash/hash.hpp>

#include <boost/lexical_cast.hpp>

#ifdef __MSVC_COMPILER__
/** @brief Forces function inlining. */
#define MIMECORE_INLINE __forceinline

/** @brief Prevents function inlining. */
#define MIMECORE_NOINLINE __declspec(noinline)
#elif __CLANG_COMPILER__ || __GCC_COMPILER__ || __INTEL_COMPILER__
/** @brief Forces function inlining. */
#define MIMECORE_INLINE __attribute__((always_inline)) inline

/** @brief Prevents function inlining. */
#define MIMECORE_NOINLINE __attribute__((noinline))
#else
/** @brief Forces function inlining. */
#define MIMECORE_INLINE inline

/** @brief Prevents function inlining. */
#define MIMECORE_NOINLINE
#endif // ...

#ifdef MIMECORE_USE_LOGGING_IMPL
#include "logging/logging.hxx"
#endif // MIMECORE_USE_LOGGING_IMPL

/**
 * @namespace shared
 * @brief Contains shared types and utilities used across the mimecore.
 *
 * This namespace is intended for common components that are reused by multiple modules,
 * such as logging and platform-specific macros.
 */
namespace shared {
    // ...
}

#endif // MIMECORE_SHARED_HXX
