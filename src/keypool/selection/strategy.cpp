/**
 * @file strategy.cpp
 * @brief Strategy names, parsing and SelectError formatting.
 */
#include "keypool/selection/strategy.hpp"

#include <fmt/format.h>

#include "keypool/config/constants.hpp"

namespace keypool::selection {

using namespace keypool::config::constants;

std::string_view to_string(Strategy s) noexcept {
    switch (s) {
        case Strategy::RoundRobin: return STRATEGY_NAME_ROUND_ROBIN;
        case Strategy::Weighted:   return STRATEGY_NAME_WEIGHTED;
    }
    return "unknown";
}

std::string SelectError::to_string() const {
    return fmt::format("UnknownStrategy: '{}' (expected '{}' or '{}')",
                       requested, STRATEGY_NAME_ROUND_ROBIN, STRATEGY_NAME_WEIGHTED);
}

keypool_detail::expected<Strategy, SelectError> parse_strategy(std::string_view name) {
    if (name == STRATEGY_NAME_ROUND_ROBIN) return Strategy::RoundRobin;
    if (name == STRATEGY_NAME_WEIGHTED)    return Strategy::Weighted;
    return keypool_detail::unexpected(SelectError{SelectErrc::UnknownStrategy, std::string(name)});
}

} // namespace keypool::selection
