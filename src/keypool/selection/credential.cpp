/**
 * @file credential.cpp
 * @brief Credential factory, error formatting and display helpers.
 */
#include "keypool/selection/credential.hpp"

#include <cmath>
#include <fmt/format.h>

namespace keypool::selection {

using namespace keypool::config::constants;

std::string_view to_string(ValidationErrc code) noexcept {
    switch (code) {
        case ValidationErrc::EmptyPool:      return "EmptyPool";
        case ValidationErrc::EmptySecret:    return "EmptySecret";
        case ValidationErrc::InvalidWeight:  return "InvalidWeight";
        case ValidationErrc::DuplicateLabel: return "DuplicateLabel";
    }
    return "Unknown";
}

std::string ValidationError::to_string() const {
    const auto name = keypool::selection::to_string(code);
    switch (code) {
        case ValidationErrc::EmptyPool:
            return fmt::format("{}: at least one API key is required", name);
        case ValidationErrc::DuplicateLabel:
            return fmt::format("{}: entry #{} reuses label '{}'", name, index + 1, label);
        case ValidationErrc::EmptySecret:
        case ValidationErrc::InvalidWeight:
            if (label.empty()) return fmt::format("{}: entry #{}", name, index + 1);
            return fmt::format("{}: entry #{} (label '{}')", name, index + 1, label);
    }
    return std::string(name);
}

keypool_detail::expected<Credential, ValidationError>
Credential::create(std::string secret, double weight, std::string label) {
    if (secret.empty()) {
        return keypool_detail::unexpected(
            ValidationError{ValidationErrc::EmptySecret, 0, std::move(label)});
    }
    // !(w > 0) also catches NaN
    if (!(weight > 0.0) || !std::isfinite(weight)) {
        return keypool_detail::unexpected(
            ValidationError{ValidationErrc::InvalidWeight, 0, std::move(label)});
    }
    return Credential(std::move(secret), weight, std::move(label));
}

std::string label_or_default(const Credential& c, std::size_t index) {
    if (c.has_label()) return c.label();
    return fmt::format("{}{}", CREDENTIAL_DEFAULT_LABEL_PREFIX, index + 1);
}

std::string masked_preview(std::string_view secret) {
    if (secret.size() <= CREDENTIAL_PREVIEW_CHARS) return std::string(secret);
    return fmt::format("{}{}", secret.substr(0, CREDENTIAL_PREVIEW_CHARS),
                       CREDENTIAL_PREVIEW_ELLIPSIS);
}

} // namespace keypool::selection
