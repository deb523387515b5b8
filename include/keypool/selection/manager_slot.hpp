#pragma once
// keypool: ManagerSlot
// Concurrency Model: RCU (Read-Copy-Update) via atomic shared_ptr swap.
//   • Request threads take current() (shared_ptr copy) with ACQUIRE semantics.
//   • Reload builds a complete new manager off to the side and publishes it with RELEASE.
//   • Readers holding the previous manager keep it alive until they drop it.
//   • A failed reload publishes nothing: the previous manager stays current.

#include <atomic>
#include <cstdint>
#include <memory>
#include <span>

#include "keypool/compat/expected.hpp"
#include "keypool/selection/selection_manager.hpp"

namespace keypool::selection {

///
/// Holds the manager for the effective configuration.
/// - Never partially mutated: a reload replaces the whole manager (pool + cursor).
/// - Empty until the first successful publish()/reload().
///
class ManagerSlot final {
public:
    /// Currently published manager, or null before the first load.
    [[nodiscard]] std::shared_ptr<SelectionManager> current() const noexcept;

    /// Publish @p manager unconditionally (null clears the slot).
    void publish(std::shared_ptr<SelectionManager> manager) noexcept;

    /**
     * @brief Validate @p specs, build a manager and publish it.
     * @return The new manager, or the validation error (slot unchanged).
     */
    keypool_detail::expected<std::shared_ptr<SelectionManager>, ValidationError>
    reload(std::span<const CredentialSpec> specs, ManagerOptions opts = {});

    /// Monotonic version counter. Increments on every publish.
    [[nodiscard]] uint64_t version() const noexcept { return version_.load(std::memory_order_relaxed); }

private:
    std::shared_ptr<SelectionManager> manager_;
    std::atomic<uint64_t> version_{0};
};

} // namespace keypool::selection
