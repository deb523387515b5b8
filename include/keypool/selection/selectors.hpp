#pragma once

/**
 * @file selectors.hpp
 * @brief Round-robin and weighted selection over a shared immutable Pool.
 * @note Both selectors return an index into the pool; the manager resolves it.
 */
#include <atomic>
#include <cstddef>
#include <memory>
#include <vector>

#include "keypool/selection/pool.hpp"
#include "keypool/selection/random_source.hpp"

namespace keypool::selection {

/**
 * @class RoundRobinSelector
 * @brief Cursor cycling through the pool in insertion order.
 *
 * The cursor stays in [0, size()). Read-and-advance is one CAS, so concurrent
 * callers each receive a distinct position and every full cycle visits each
 * record exactly once.
 */
class RoundRobinSelector final {
public:
    explicit RoundRobinSelector(std::shared_ptr<const Pool> pool) noexcept;

    /// Return the current position and advance it (mod pool size).
    std::size_t next() noexcept;

    /// Position the next call to next() will return. Does not advance.
    [[nodiscard]] std::size_t position() const noexcept {
        return cursor_.load(std::memory_order_acquire);
    }

private:
    std::shared_ptr<const Pool> pool_;
    std::atomic<std::size_t>    cursor_{0};
};

/**
 * @class WeightedSelector
 * @brief Samples a record with probability weight / total_weight.
 *
 * [0, total) is split into contiguous intervals, one per record in pool order,
 * each as long as the record's weight. A draw r selects the first record whose
 * cumulative weight exceeds r. Holds no mutable state.
 */
class WeightedSelector final {
public:
    explicit WeightedSelector(std::shared_ptr<const Pool> pool);

    /// Draw from @p rng and map the draw to a pool index.
    std::size_t next(RandomSource& rng) const;

    /// Map a draw in [0, total_weight()) to a pool index. Draws past the end map to the last record.
    [[nodiscard]] std::size_t index_for(double r) const noexcept;

    [[nodiscard]] double total_weight() const noexcept { return pool_->total_weight(); }

private:
    std::shared_ptr<const Pool> pool_;
    std::vector<double>         cumulative_; ///< cumulative_[k] = w_0 + ... + w_k
};

} // namespace keypool::selection
