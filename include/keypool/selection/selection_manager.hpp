#pragma once
/**
 * @file selection_manager.hpp
 * @brief Thread-safe facade choosing which credential backs each request.
 * @details One manager per effective configuration. Reconfiguration builds a
 *          new manager (see ManagerSlot); a manager's pool never changes.
 */

#include <cstddef>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "keypool/compat/expected.hpp"
#include "keypool/obs/observability.hpp"
#include "keypool/selection/credential.hpp"
#include "keypool/selection/pool.hpp"
#include "keypool/selection/random_source.hpp"
#include "keypool/selection/selectors.hpp"
#include "keypool/selection/strategy.hpp"

namespace keypool::selection {

/**
 * @struct ManagerOptions
 * @brief Injected collaborators. Null members select the defaults.
 */
struct ManagerOptions {
    std::shared_ptr<RandomSource>   rng;      ///< Default: SharedRandomSource seeded from random_device
    std::shared_ptr<obs::Observer>  observer; ///< Default: none (no events emitted)
};

/**
 * @struct KeyDescription
 * @brief One entry of describe(): display label and weight.
 */
struct KeyDescription {
    std::string label;  ///< Label, or "key_<n>" for unlabeled records
    double      weight{0.0};

    bool operator==(const KeyDescription&) const = default;
};

/**
 * @struct KeySummary
 * @brief Per-key stats line; the secret is only shown as a masked preview.
 */
struct KeySummary {
    std::string label;
    double      weight{0.0};
    std::string preview; ///< First 8 characters + "..." when longer
};

/**
 * @struct PoolStats
 * @brief Read-only snapshot of the manager for operators.
 */
struct PoolStats {
    std::size_t             total_keys{0};
    double                  total_weight{0.0};
    std::size_t             current_index{0}; ///< Round-robin position of the next call
    std::vector<KeySummary> keys;
};

/**
 * @class SelectionManager
 * @brief Validated pool + round-robin and weighted selectors behind one interface.
 *
 * Thread-safety: all member functions may be called concurrently. The only
 * mutable shared state is the round-robin cursor (lock-free CAS) and whatever
 * the injected random source and observer guard internally.
 */
class SelectionManager final {
public:
    /// Build around an already validated pool. Cannot fail.
    explicit SelectionManager(Pool pool, ManagerOptions opts = {});

    SelectionManager(const SelectionManager&)            = delete;
    SelectionManager& operator=(const SelectionManager&) = delete;

    /**
     * @brief Validate @p specs and build a manager.
     * @return The manager, or the first validation failure (nothing is built).
     */
    static keypool_detail::expected<std::unique_ptr<SelectionManager>, ValidationError>
    create(std::span<const CredentialSpec> specs, ManagerOptions opts = {});

    /// Legacy single secret: one default-weight record (see Pool::from_legacy).
    static keypool_detail::expected<std::unique_ptr<SelectionManager>, ValidationError>
    from_legacy(std::string_view secret, ManagerOptions opts = {});

    // --------------------------- Selection -----------------------------------
    /// Next record in pool order; weights ignored.
    Credential select_round_robin();

    /// Random record with probability weight / total_weight.
    Credential select_weighted();

    /// Dispatch on @p s (exhaustive over Strategy).
    Credential select(Strategy s = kDefaultStrategy);

    /**
     * @brief Dispatch on a strategy name as received from config or a request.
     * @return UnknownStrategy for anything but "round_robin"/"weighted"; in that
     *         case no selector runs and the round-robin cursor is untouched.
     */
    keypool_detail::expected<Credential, SelectError> select(std::string_view strategy);

    // --------------------------- Read-only views -----------------------------
    /// (label_or_default, weight) per record, in pool order.
    [[nodiscard]] std::vector<KeyDescription> describe() const;

    [[nodiscard]] PoolStats stats() const;

    /// Record with the given label; unlabeled records are not found by "key_N".
    [[nodiscard]] std::optional<Credential> find_by_label(std::string_view label) const;

    [[nodiscard]] std::size_t size() const noexcept { return pool_->size(); }
    [[nodiscard]] double total_weight() const noexcept { return pool_->total_weight(); }
    [[nodiscard]] const Pool& pool() const noexcept { return *pool_; }

private:
    /// Resolve @p idx, notify the observer, return a copy of the record.
    Credential emit(std::size_t idx, Strategy s);

    std::shared_ptr<const Pool>    pool_;
    RoundRobinSelector             rr_;
    WeightedSelector               weighted_;
    std::shared_ptr<RandomSource>  rng_;
    std::shared_ptr<obs::Observer> observer_;
};

} // namespace keypool::selection
