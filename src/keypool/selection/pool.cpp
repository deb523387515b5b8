/**
 * @file pool.cpp
 * @brief Pool validation and construction.
 */
#include "keypool/selection/pool.hpp"

#include <cmath>
#include <numeric>
#include <string>
#include <unordered_map>

#include "keypool/config/constants.hpp"

namespace keypool::selection {

Pool::Pool(std::vector<Credential> records) noexcept
  : records_(std::move(records)),
    total_weight_(std::accumulate(records_.begin(), records_.end(), 0.0,
                                  [](double acc, const Credential& c) { return acc + c.weight(); })) {}

keypool_detail::expected<Pool, ValidationError>
Pool::create(std::span<const CredentialSpec> specs) {
    // (1) non-empty
    if (specs.empty()) {
        return keypool_detail::unexpected(ValidationError{ValidationErrc::EmptyPool, 0, {}});
    }

    // (2) per-record checks, first failing entry wins. The running total
    // must stay finite; the entry that overflows it is the invalid one.
    std::vector<Credential> records;
    records.reserve(specs.size());
    double total = 0.0;
    for (std::size_t i = 0; i < specs.size(); ++i) {
        auto rec = Credential::create(specs[i]);
        if (!rec) {
            auto err = rec.error();
            err.index = i;
            return keypool_detail::unexpected(std::move(err));
        }
        total += rec->weight();
        if (!std::isfinite(total)) {
            return keypool_detail::unexpected(
                ValidationError{ValidationErrc::InvalidWeight, i, rec->label()});
        }
        records.push_back(std::move(*rec));
    }

    // (3) labels: report the second occurrence of the first repeated display
    // name. Unlabeled records display as key_<n> and clash with an explicit
    // label of the same text.
    std::unordered_map<std::string, std::size_t> seen;
    seen.reserve(records.size());
    for (std::size_t i = 0; i < records.size(); ++i) {
        auto name = label_or_default(records[i], i);
        if (!seen.emplace(name, i).second) {
            return keypool_detail::unexpected(
                ValidationError{ValidationErrc::DuplicateLabel, i, std::move(name)});
        }
    }

    return Pool(std::move(records));
}

keypool_detail::expected<Pool, ValidationError>
Pool::from_legacy(std::string_view secret) {
    const CredentialSpec one{.secret = std::string(secret),
                             .weight = keypool::config::constants::CREDENTIAL_DEFAULT_WEIGHT,
                             .label  = {}};
    return create(std::span<const CredentialSpec>(&one, 1));
}

std::optional<std::size_t> Pool::find_label(std::string_view label) const noexcept {
    if (label.empty()) return std::nullopt;
    for (std::size_t i = 0; i < records_.size(); ++i) {
        if (records_[i].label() == label) return i;
    }
    return std::nullopt;
}

} // namespace keypool::selection
