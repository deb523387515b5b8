/**
 * @file selection_manager.cpp
 * @brief SelectionManager construction, dispatch and read-only views.
 */
#include "keypool/selection/selection_manager.hpp"

#include <exception>
#include <spdlog/spdlog.h>

namespace keypool::selection {

SelectionManager::SelectionManager(Pool pool, ManagerOptions opts)
  : pool_(std::make_shared<const Pool>(std::move(pool))),
    rr_(pool_),
    weighted_(pool_),
    rng_(opts.rng ? std::move(opts.rng) : std::make_shared<SharedRandomSource>()),
    observer_(std::move(opts.observer))
{
    spdlog::info("Initialized API key manager with {} keys", pool_->size());
    for (std::size_t i = 0; i < pool_->size(); ++i) {
        spdlog::info("  {}: weight={}", label_or_default((*pool_)[i], i), (*pool_)[i].weight());
    }
}

keypool_detail::expected<std::unique_ptr<SelectionManager>, ValidationError>
SelectionManager::create(std::span<const CredentialSpec> specs, ManagerOptions opts) {
    auto pool = Pool::create(specs);
    if (!pool) {
        spdlog::error("API key configuration rejected: {}", pool.error().to_string());
        return keypool_detail::unexpected(pool.error());
    }
    return std::make_unique<SelectionManager>(std::move(*pool), std::move(opts));
}

keypool_detail::expected<std::unique_ptr<SelectionManager>, ValidationError>
SelectionManager::from_legacy(std::string_view secret, ManagerOptions opts) {
    auto pool = Pool::from_legacy(secret);
    if (!pool) {
        spdlog::error("Legacy API key rejected: {}", pool.error().to_string());
        return keypool_detail::unexpected(pool.error());
    }
    return std::make_unique<SelectionManager>(std::move(*pool), std::move(opts));
}

// --------------------------- Selection ---------------------------------------

Credential SelectionManager::emit(std::size_t idx, Strategy s) {
    const Credential& c = (*pool_)[idx];
    if (observer_) {
        obs::SelectionEvent ev;
        ev.label    = label_or_default(c, idx);
        ev.strategy = s;
        if (s == Strategy::Weighted) ev.weight = c.weight();
        try {
            observer_->record(ev);
        } catch (const std::exception& ex) {
            // Notification only: the selection stands.
            spdlog::warn("Selection observer failed: {}", ex.what());
        }
    }
    return c;
}

Credential SelectionManager::select_round_robin() {
    return emit(rr_.next(), Strategy::RoundRobin);
}

Credential SelectionManager::select_weighted() {
    return emit(weighted_.next(*rng_), Strategy::Weighted);
}

Credential SelectionManager::select(Strategy s) {
    switch (s) {
        case Strategy::RoundRobin: return select_round_robin();
        case Strategy::Weighted:   return select_weighted();
    }
    return select_round_robin();
}

keypool_detail::expected<Credential, SelectError>
SelectionManager::select(std::string_view strategy) {
    auto parsed = parse_strategy(strategy);
    if (!parsed) {
        spdlog::warn("Rejected selection request: {}", parsed.error().to_string());
        return keypool_detail::unexpected(parsed.error());
    }
    return select(*parsed);
}

// --------------------------- Read-only views ---------------------------------

std::vector<KeyDescription> SelectionManager::describe() const {
    std::vector<KeyDescription> out;
    out.reserve(pool_->size());
    for (std::size_t i = 0; i < pool_->size(); ++i) {
        const auto& c = (*pool_)[i];
        out.push_back(KeyDescription{label_or_default(c, i), c.weight()});
    }
    return out;
}

PoolStats SelectionManager::stats() const {
    PoolStats st;
    st.total_keys    = pool_->size();
    st.total_weight  = pool_->total_weight();
    st.current_index = rr_.position();
    st.keys.reserve(pool_->size());
    for (std::size_t i = 0; i < pool_->size(); ++i) {
        const auto& c = (*pool_)[i];
        st.keys.push_back(KeySummary{label_or_default(c, i), c.weight(), masked_preview(c.secret())});
    }
    return st;
}

std::optional<Credential> SelectionManager::find_by_label(std::string_view label) const {
    if (auto idx = pool_->find_label(label)) return (*pool_)[*idx];
    return std::nullopt;
}

} // namespace keypool::selection
