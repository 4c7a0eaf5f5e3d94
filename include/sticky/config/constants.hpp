#pragma once
/**
 * @file constants.hpp
 * @brief Centralized named defaults for the channel pool and the policy registry.
 * @details These values eliminate magic numbers from the codebase. Override via the
 *          Config Loader (ApiConfig JSON) in production deployments.
 */

#include <cstddef>
#include <cstdint>

namespace sticky::config::constants {

// =====================
// Channel Pool Defaults
// =====================
/// Maximum number of transport channels opened towards one logical server.
inline constexpr uint32_t POOL_MAX_SIZE_DEFAULT          = 10;
/// Reuse the least-loaded channel while its active streams stay below this mark.
inline constexpr uint32_t POOL_LOW_WATERMARK_DEFAULT     = 100;
/// Hard ceiling accepted from configuration.
inline constexpr uint32_t POOL_MAX_SIZE_LIMIT            = 1024;

// =====================
// Policy Registry Limits (bounded memory)
// =====================
inline constexpr std::size_t POLICY_MAX_METHODS          = 1024; ///< Max configured methods
inline constexpr std::size_t POLICY_MAX_METHOD_PATH_LEN  = 256;  ///< "/pkg.Service/Method"
inline constexpr std::size_t POLICY_MAX_FIELD_PATH_LEN   = 256;  ///< "header.session.name"

// =====================
// Affinity Key Resolution
// =====================
/// Nesting bound for dotted key paths; deeper paths are rejected at compile time.
inline constexpr std::size_t FIELD_PATH_MAX_SEGMENTS     = 16;

} // namespace sticky::config::constants
