/**
 * @file selectors.cpp
 * @brief Round-robin cursor and cumulative-weight lookup.
 */
#include "keypool/selection/selectors.hpp"

#include <algorithm>

namespace keypool::selection {

// ---------------- Round-robin ----------------

RoundRobinSelector::RoundRobinSelector(std::shared_ptr<const Pool> pool) noexcept
: pool_(std::move(pool)) {}

std::size_t RoundRobinSelector::next() noexcept {
    const auto n = pool_->size();
    auto cur = cursor_.load(std::memory_order_relaxed);
    // Cursor stays in [0, n); read and advance happen in one CAS.
    while (!cursor_.compare_exchange_weak(cur, (cur + 1) % n,
                                          std::memory_order_acq_rel,
                                          std::memory_order_relaxed)) {
    }
    return cur;
}

// ---------------- Weighted ----------------

WeightedSelector::WeightedSelector(std::shared_ptr<const Pool> pool)
: pool_(std::move(pool)) {
    cumulative_.reserve(pool_->size());
    double acc = 0.0;
    for (const auto& c : *pool_) {
        acc += c.weight();
        cumulative_.push_back(acc);
    }
}

std::size_t WeightedSelector::index_for(double r) const noexcept {
    // First boundary strictly greater than r.
    const auto it = std::upper_bound(cumulative_.begin(), cumulative_.end(), r);
    if (it == cumulative_.end()) return cumulative_.size() - 1; // rounding at the top edge
    return static_cast<std::size_t>(it - cumulative_.begin());
}

std::size_t WeightedSelector::next(RandomSource& rng) const {
    return index_for(rng.uniform(pool_->total_weight()));
}

} // namespace keypool::selection
