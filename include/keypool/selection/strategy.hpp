#pragma once
/**
 * @file strategy.hpp
 * @brief Selection strategies and their textual (config/wire) spelling.
 */

#include <cstdint>
#include <string>
#include <string_view>

#include "keypool/compat/expected.hpp"

namespace keypool::selection {

/**
 * @enum Strategy
 * @brief Closed set of selection algorithms.
 */
enum class Strategy : std::uint8_t {
    RoundRobin = 0, ///< Deterministic cycle in pool order; weights ignored
    Weighted        ///< Random draw proportional to weight
};

/// Strategy used when the caller does not name one.
inline constexpr Strategy kDefaultStrategy = Strategy::RoundRobin;

/**
 * @enum SelectErrc
 * @brief Caller-side selection failures.
 */
enum class SelectErrc : std::uint8_t {
    UnknownStrategy = 1 ///< Requested strategy name is not recognised
};

/**
 * @struct SelectError
 * @brief Selection failure plus the offending request text.
 */
struct SelectError final {
    SelectErrc  code{SelectErrc::UnknownStrategy};
    std::string requested; ///< Strategy text as received

    std::string to_string() const;
};

/// "round_robin" / "weighted".
std::string_view to_string(Strategy s) noexcept;

/**
 * @brief Parse a strategy name. Exact, case-sensitive match only.
 * @return The strategy, or UnknownStrategy carrying @p name. Never falls back.
 */
keypool_detail::expected<Strategy, SelectError> parse_strategy(std::string_view name);

} // namespace keypool::selection
