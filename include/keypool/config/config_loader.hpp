#pragma once
/**
 * @file config_loader.hpp
 * @brief Loader for the credential section of the proxy's YAML configuration.
 * @details All defaults reference named constants to avoid magic numbers.
 */

#include <cstdint>
#include <string>
#include <string_view>
#include "keypool/compat/expected.hpp"
#include "keypool/config/constants.hpp"
#include "keypool/selection/credential.hpp"
#include "keypool/selection/strategy.hpp"

namespace keypool::config {

    /** @enum ConfigErrc
     *  @brief Reasons a configuration document is rejected by the loader.
     */
    enum class ConfigErrc : std::uint8_t {
        FileNotFound = 1, ///< Path does not exist or is unreadable
        ParseError,       ///< Not valid YAML
        InvalidEntry,     ///< Valid YAML with the wrong shape (bad entry, bad weight type, ...)
        UnknownStrategy   ///< selection_strategy is not a known strategy name
    };

    /** @struct ConfigError
     *  @brief Loader failure with a human-readable explanation.
     */
    struct ConfigError {
        ConfigErrc  code{ConfigErrc::ParseError};
        std::string message;

        std::string to_string() const;
    };

    /** @struct PoolConfig
     *  @brief Credential-related configuration, before validation.
     */
    struct PoolConfig {
        std::string                            legacy_key; ///< `api_key`; empty when absent
        keypool::selection::CredentialSpecList keys;       ///< `api_keys`, in file order
        keypool::selection::Strategy strategy{keypool::selection::kDefaultStrategy}; ///< `selection_strategy`
        std::string log_level{constants::LOG_LEVEL_DEFAULT}; ///< `log_level`
    };

    /** @class Loader
     *  @brief Source of credential configuration (YAML via yaml-cpp).
     */
    class Loader {
    public:
        /**
         * @brief Load configuration from a YAML file.
         * @param path File path.
         * @return PoolConfig, or FileNotFound / ParseError / InvalidEntry / UnknownStrategy.
         */
        static keypool_detail::expected<PoolConfig, ConfigError> load_from_file(const std::string& path);

        /// Same as load_from_file() for an in-memory document.
        static keypool_detail::expected<PoolConfig, ConfigError> load_from_string(std::string_view yaml);
    };

    /**
     * @brief Normalize a PoolConfig into the ordered credential list the core consumes.
     *
     * A non-empty `keys` list wins; otherwise a non-empty legacy key becomes one
     * record with the default weight; otherwise the result is empty (and pool
     * validation reports EmptyPool).
     */
    keypool::selection::CredentialSpecList to_credential_specs(const PoolConfig& cfg);

} // namespace keypool::config
