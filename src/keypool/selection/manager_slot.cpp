
// ManagerSlot: RCU Implementation Notes
// Readers: atomic_load (ACQUIRE) of the shared_ptr. Writers: build, then
// atomic_store (RELEASE). The shared_ptr reference count is the grace period:
// an old manager is destroyed when the last in-flight request releases it.

#include "keypool/selection/manager_slot.hpp"

#include <spdlog/spdlog.h>

namespace keypool::selection {

std::shared_ptr<SelectionManager> ManagerSlot::current() const noexcept {
    return std::atomic_load_explicit(&manager_, std::memory_order_acquire);
}

void ManagerSlot::publish(std::shared_ptr<SelectionManager> manager) noexcept {
    std::atomic_store_explicit(&manager_, std::move(manager), std::memory_order_release);
    version_.fetch_add(1, std::memory_order_relaxed);
}

keypool_detail::expected<std::shared_ptr<SelectionManager>, ValidationError>
ManagerSlot::reload(std::span<const CredentialSpec> specs, ManagerOptions opts) {
    auto built = SelectionManager::create(specs, std::move(opts));
    if (!built) {
        spdlog::error("Reload rejected, keeping previous API key manager: {}",
                      built.error().to_string());
        return keypool_detail::unexpected(built.error());
    }
    std::shared_ptr<SelectionManager> next = std::move(*built);
    publish(next);
    spdlog::info("Published API key manager v{} ({} keys)", version(), next->size());
    return next;
}

} // namespace keypool::selection
