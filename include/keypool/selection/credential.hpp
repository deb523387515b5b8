/**
 * @file credential.hpp
 * @brief Credential record model shared across the selection components.
 *
 * Defines the raw configuration tuple (`CredentialSpec`), the validated and
 * immutable `Credential`, and the validation error taxonomy reported when a
 * single entry or a whole list of entries is rejected.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "keypool/compat/expected.hpp"
#include "keypool/config/constants.hpp"

namespace keypool::selection {

/**
 * @brief Reasons a credential or a pool is rejected.
 *
 * @note Codes are ordered by the check that produces them during pool
 *       validation: emptiness first, then per-record checks, then labels.
 */
enum class ValidationErrc : std::uint8_t {
  EmptyPool = 1,   ///< No credential configured
  EmptySecret,     ///< Record has an empty secret
  InvalidWeight,   ///< Record weight is non-positive or not finite
  DuplicateLabel   ///< Two records share the same non-empty label
};

/// Stable name of a validation code ("EmptyPool", "InvalidWeight", ...).
std::string_view to_string(ValidationErrc code) noexcept;

/**
 * @brief Validation failure with enough context to locate the bad entry.
 *
 * `index` is the 0-based position of the offending entry in the input list
 * (for DuplicateLabel: the second occurrence). It is meaningless for EmptyPool.
 */
struct ValidationError final {
  ValidationErrc code{ValidationErrc::EmptyPool};
  std::size_t    index{0};
  std::string    label;

  /// Operator-facing message, e.g. "InvalidWeight: entry #2 (label 'backup')".
  std::string to_string() const;

  bool operator==(const ValidationError&) const = default;
};

/**
 * @brief Raw credential tuple as it arrives from configuration.
 *
 * Nothing is checked here; `Credential::create` and pool validation do that.
 * An empty `label` means the entry is unlabeled.
 */
struct CredentialSpec final {
  /// Key material forwarded upstream.
  std::string secret;

  /// Relative selection weight under the weighted strategy.
  double weight{keypool::config::constants::CREDENTIAL_DEFAULT_WEIGHT};

  /// Optional observability label; unique within a pool when non-empty.
  std::string label;

  bool operator==(const CredentialSpec&) const = default;
};

using CredentialSpecList = std::vector<CredentialSpec>;

/**
 * @brief Immutable, validated credential record.
 *
 * Only obtainable through `create()`, so every instance satisfies
 * `!secret().empty()` and `weight() > 0` (finite).
 */
class Credential final {
public:
  /// Validate a single CredentialSpec. Errors carry index 0; pool validation re-tags them.
  static keypool_detail::expected<Credential, ValidationError>
  create(std::string secret,
         double weight = keypool::config::constants::CREDENTIAL_DEFAULT_WEIGHT,
         std::string label = {});

  static keypool_detail::expected<Credential, ValidationError>
  create(CredentialSpec spec) {
    return create(std::move(spec.secret), spec.weight, std::move(spec.label));
  }

  const std::string& secret() const noexcept { return secret_; }
  double             weight() const noexcept { return weight_; }
  const std::string& label()  const noexcept { return label_; }
  bool               has_label() const noexcept { return !label_.empty(); }

  bool operator==(const Credential&) const = default;

private:
  Credential(std::string secret, double weight, std::string label) noexcept
    : secret_(std::move(secret)), weight_(weight), label_(std::move(label)) {}

  std::string secret_;
  double      weight_{keypool::config::constants::CREDENTIAL_DEFAULT_WEIGHT};
  std::string label_;
};

/// Label if present, otherwise "key_<index+1>".
std::string label_or_default(const Credential& c, std::size_t index);

/// First few characters of the secret followed by "..." (never the full key if longer).
std::string masked_preview(std::string_view secret);

} // namespace keypool::selection
