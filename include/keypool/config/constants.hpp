#pragma once
/**
 * @file constants.hpp
 * @brief Centralized named defaults for credential selection.
 * @details These values eliminate magic numbers from the codebase. Entries in the
 *          YAML configuration override the per-credential ones.
 */

#include <cstddef>
#include <string_view>

namespace keypool::config::constants {

// =====================
// Credential Defaults
// =====================
/// Weight assigned when a config entry omits it (and for the legacy single key)
inline constexpr double CREDENTIAL_DEFAULT_WEIGHT = 1.0;

/// Prefix used by describe()/stats() for unlabeled records: "key_1", "key_2", ...
inline constexpr std::string_view CREDENTIAL_DEFAULT_LABEL_PREFIX = "key_";

/// Number of secret characters shown in stats previews before "..."
inline constexpr std::size_t CREDENTIAL_PREVIEW_CHARS = 8;

/// Suffix appended to truncated previews
inline constexpr std::string_view CREDENTIAL_PREVIEW_ELLIPSIS = "...";

// =====================
// Strategy names (wire/config spelling)
// =====================
inline constexpr std::string_view STRATEGY_NAME_ROUND_ROBIN = "round_robin";
inline constexpr std::string_view STRATEGY_NAME_WEIGHTED    = "weighted";

// =====================
// YAML configuration keys
// =====================
inline constexpr const char* YAML_KEY_LEGACY     = "api_key";            ///< Legacy single secret
inline constexpr const char* YAML_KEY_LIST       = "api_keys";           ///< Ordered credential list
inline constexpr const char* YAML_KEY_SECRET     = "key";                ///< Entry secret (required)
inline constexpr const char* YAML_KEY_WEIGHT     = "weight";             ///< Entry weight (optional)
inline constexpr const char* YAML_KEY_LABEL      = "name";               ///< Entry label (optional)
inline constexpr const char* YAML_KEY_STRATEGY   = "selection_strategy"; ///< Default strategy
inline constexpr const char* YAML_KEY_LOG_LEVEL  = "log_level";          ///< spdlog level name

// =====================
// Logging Defaults
// =====================
inline constexpr std::string_view LOG_LEVEL_DEFAULT = "info";
inline constexpr const char*      LOG_PATTERN       = "[%Y-%m-%d %H:%M:%S.%e][%^%l%$][tid=%t] %v";

} // namespace keypool::config::constants
