/**
 * @file config_loader.cpp
 * @brief yaml-cpp backed loader for the credential section.
 */
#include "keypool/config/config_loader.hpp"

#include <filesystem>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

namespace keypool::config {
    using namespace keypool::selection;
    using namespace keypool::config::constants;

    namespace {

    keypool_detail::unexpected<ConfigError> fail(ConfigErrc code, std::string message) {
        return keypool_detail::unexpected(ConfigError{code, std::move(message)});
    }

    // yaml-cpp renders `~` as "null" for strings; treat it as absent.
    std::string string_or(const YAML::Node& node, std::string fallback) {
        if (!node || node.IsNull()) return fallback;
        return node.as<std::string>(fallback);
    }

    // One `api_keys` entry: either a bare secret string or a {key, weight, name} map.
    keypool_detail::expected<CredentialSpec, ConfigError>
    parse_entry(const YAML::Node& node, std::size_t index) {
        CredentialSpec spec;
        if (node.IsScalar()) {
            spec.secret = node.as<std::string>();
            return spec;
        }
        if (!node.IsMap()) {
            return fail(ConfigErrc::InvalidEntry,
                        fmt::format("{} entry #{} must be a string or a mapping", YAML_KEY_LIST, index + 1));
        }
        if (!node[YAML_KEY_SECRET] || !node[YAML_KEY_SECRET].IsScalar()) {
            return fail(ConfigErrc::InvalidEntry,
                        fmt::format("{} entry #{} is missing '{}'", YAML_KEY_LIST, index + 1, YAML_KEY_SECRET));
        }
        spec.secret = node[YAML_KEY_SECRET].as<std::string>();

        const auto weight = node[YAML_KEY_WEIGHT];
        if (weight && !weight.IsNull()) {
            try {
                spec.weight = weight.as<double>();
            } catch (const YAML::BadConversion&) {
                return fail(ConfigErrc::InvalidEntry,
                            fmt::format("{} entry #{}: '{}' is not a number", YAML_KEY_LIST, index + 1, YAML_KEY_WEIGHT));
            }
        }
        const auto label = node[YAML_KEY_LABEL];
        if (label && !label.IsNull() && !label.IsScalar()) {
            return fail(ConfigErrc::InvalidEntry,
                        fmt::format("{} entry #{}: '{}' must be a string", YAML_KEY_LIST, index + 1, YAML_KEY_LABEL));
        }
        spec.label = string_or(label, "");
        return spec;
    }

    keypool_detail::expected<PoolConfig, ConfigError> parse_root(const YAML::Node& root) {
        PoolConfig cfg;
        if (!root || root.IsNull()) return cfg; // empty document
        if (!root.IsMap()) {
            return fail(ConfigErrc::InvalidEntry, "top-level configuration must be a mapping");
        }

        cfg.legacy_key = string_or(root[YAML_KEY_LEGACY], "");
        cfg.log_level  = string_or(root[YAML_KEY_LOG_LEVEL], std::string(LOG_LEVEL_DEFAULT));

        if (const auto name = root[YAML_KEY_STRATEGY]; name && !name.IsNull()) {
            auto s = parse_strategy(name.as<std::string>());
            if (!s) return fail(ConfigErrc::UnknownStrategy, s.error().to_string());
            cfg.strategy = *s;
        }

        const auto list = root[YAML_KEY_LIST];
        if (list && !list.IsNull()) {
            if (!list.IsSequence()) {
                return fail(ConfigErrc::InvalidEntry, fmt::format("{} must be a list", YAML_KEY_LIST));
            }
            cfg.keys.reserve(list.size());
            for (std::size_t i = 0; i < list.size(); ++i) {
                auto spec = parse_entry(list[i], i);
                if (!spec) return keypool_detail::unexpected(spec.error());
                cfg.keys.push_back(std::move(*spec));
            }
        }
        return cfg;
    }

    } // namespace

    std::string ConfigError::to_string() const {
        switch (code) {
            case ConfigErrc::FileNotFound:    return "FileNotFound: " + message;
            case ConfigErrc::ParseError:      return "ParseError: " + message;
            case ConfigErrc::InvalidEntry:    return "InvalidEntry: " + message;
            case ConfigErrc::UnknownStrategy: return "UnknownStrategy: " + message;
        }
        return message;
    }

    keypool_detail::expected<PoolConfig, ConfigError> Loader::load_from_file(const std::string& path) {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec)) {
            return fail(ConfigErrc::FileNotFound, path);
        }
        try {
            auto cfg = parse_root(YAML::LoadFile(path));
            if (cfg) spdlog::info("Loaded configuration from {}", path);
            return cfg;
        } catch (const YAML::BadFile& e) {
            return fail(ConfigErrc::FileNotFound, fmt::format("{}: {}", path, e.what()));
        } catch (const YAML::Exception& e) {
            return fail(ConfigErrc::ParseError, fmt::format("{}: {}", path, e.what()));
        }
    }

    keypool_detail::expected<PoolConfig, ConfigError> Loader::load_from_string(std::string_view yaml) {
        try {
            return parse_root(YAML::Load(std::string(yaml)));
        } catch (const YAML::Exception& e) {
            return fail(ConfigErrc::ParseError, e.what());
        }
    }

    CredentialSpecList to_credential_specs(const PoolConfig& cfg) {
        if (!cfg.keys.empty()) {
            if (!cfg.legacy_key.empty()) {
                spdlog::warn("Both '{}' and '{}' are set; ignoring '{}'",
                             YAML_KEY_LEGACY, YAML_KEY_LIST, YAML_KEY_LEGACY);
            }
            return cfg.keys;
        }
        if (!cfg.legacy_key.empty()) {
            return {CredentialSpec{.secret = cfg.legacy_key, .weight = CREDENTIAL_DEFAULT_WEIGHT, .label = {}}};
        }
        return {};
    }

} // namespace keypool::config
