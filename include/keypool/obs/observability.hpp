#pragma once
/**
 * @file observability.hpp
 * @brief Observability facade: selection events, counters and logging setup.
 * @details The default observer writes through spdlog; hosts may inject their own.
 */

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include "keypool/selection/strategy.hpp"

namespace keypool::obs {

    /** @struct Counters
     *  @brief Process-level counters for selections.
     */
    struct Counters {
        uint64_t selections{0};   ///< Total selections recorded
        uint64_t round_robin{0};  ///< Selections made by the round-robin strategy
        uint64_t weighted{0};     ///< Selections made by the weighted strategy
    };

    /** @struct SelectionEvent
     *  @brief Payload describing a single credential selection.
     */
    struct SelectionEvent {
        std::string                  label;    ///< Label (or key_N default) of the chosen record
        keypool::selection::Strategy strategy{keypool::selection::Strategy::RoundRobin};
        std::optional<double>        weight;   ///< Weight used; set for weighted selections only
    };

    /** @class Observer
     *  @brief Observability sink interface. Must be thread-safe.
     */
    class Observer {
    public:
        virtual ~Observer() = default;
        /// Record a single selection event.
        virtual void record(const SelectionEvent& e) = 0;
        /// Return a snapshot of counters.
        virtual Counters snapshot() const = 0;
    };

    /// Process-wide observer that counts events and logs them at debug level.
    std::shared_ptr<Observer> make_logging_observer();

    /**
     * @brief Configure the default spdlog logger (colored stdout) on first call.
     * @param level spdlog level name ("trace" .. "off"); unknown names mean "info".
     * @details Later calls only change the level. Thread-safe.
     */
    void init_logging(std::string_view level);

} // namespace keypool::obs
