#pragma once
/**
 * @file pool.hpp
 * @brief Validated, ordered, immutable collection of credentials.
 * @details A Pool only exists in a well-formed state: it is produced by
 *          `validate()` (or `Pool::create`), never mutated afterwards, and
 *          therefore safe to share across threads without synchronization.
 */

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "keypool/compat/expected.hpp"
#include "keypool/selection/credential.hpp"

namespace keypool::selection {

/**
 * @class Pool
 * @brief Non-empty ordered credential list with distinct non-empty labels.
 *
 * Invariants:
 *  - size() >= 1
 *  - every record has weight > 0, so total_weight() > 0
 *  - total_weight() is finite
 *  - display names (label, or key_<n> when unlabeled) are pairwise distinct
 *    (exact, case-sensitive)
 *  - order equals input order (significant for round-robin)
 */
class Pool final {
public:
    /**
     * @brief Validate specs and build a pool.
     *
     * Checks run in a fixed order and the first failure is returned:
     *   1. the list is non-empty (EmptyPool)
     *   2. each entry in order: secret non-empty, then weight, then the running
     *      total stays finite (EmptySecret/InvalidWeight)
     *   3. no two entries share a display name, where unlabeled entries
     *      display as key_<n> (DuplicateLabel)
     */
    static keypool_detail::expected<Pool, ValidationError>
    create(std::span<const CredentialSpec> specs);

    /// Legacy single-secret form: one record, default weight, no label.
    static keypool_detail::expected<Pool, ValidationError>
    from_legacy(std::string_view secret);

    [[nodiscard]] std::size_t size() const noexcept { return records_.size(); }
    [[nodiscard]] double total_weight() const noexcept { return total_weight_; }

    /// Record at @p i; @p i must be in [0, size()).
    const Credential& operator[](std::size_t i) const noexcept { return records_[i]; }
    const Credential& at(std::size_t i) const { return records_.at(i); }

    [[nodiscard]] std::span<const Credential> records() const noexcept { return records_; }
    auto begin() const noexcept { return records_.begin(); }
    auto end()   const noexcept { return records_.end(); }

    /// Index of the record carrying @p label, if any. Empty labels never match.
    [[nodiscard]] std::optional<std::size_t> find_label(std::string_view label) const noexcept;

private:
    explicit Pool(std::vector<Credential> records) noexcept;

    std::vector<Credential> records_;
    double total_weight_{0.0};
};

/// Free-function spelling of Pool::create, for call sites that read as "validate the config".
inline keypool_detail::expected<Pool, ValidationError>
validate(std::span<const CredentialSpec> specs) {
    return Pool::create(specs);
}

} // namespace keypool::selection
