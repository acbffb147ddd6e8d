#pragma once

#include "credential.hpp"
#include "types.hpp"
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace keyring
{

    struct StoreConfig
    {
        std::string kind{"sample"}; // "sample" or "mock"
        std::optional<std::string> backing_file;
    };

    struct LogConfig
    {
        std::string level{"warn"};
    };

    struct KeyringConfig
    {
        StoreConfig store{};
        LogConfig log{};
    };

    /**
     * ConfigLoader loads TOML configs with KEYRING_* environment overrides.
     *
     *   [store]
     *   kind = "sample"
     *   backing_file = "/path/to/credentials.json"
     *
     *   [log]
     *   level = "debug"
     */
    class ConfigLoader
    {
    public:
        /** Load config from a TOML file path. Environment overrides take precedence. */
        static Result<KeyringConfig> load(const std::string &path);

        /** Parse config from TOML string content. */
        static Result<KeyringConfig> from_string(const std::string &toml_content);

        /** Serialize config to JSON for inspection. */
        static nlohmann::json to_json(const KeyringConfig &cfg);

    private:
        static void apply_env_overrides(KeyringConfig &cfg);
    };

    /** Set the spdlog level from cfg.log.level; Invalid for unknown names. */
    Result<void> apply_log_config(const KeyringConfig &cfg);

    /** Create the store cfg describes. */
    Result<std::shared_ptr<CredentialStore>> make_store(const KeyringConfig &cfg);

} // namespace keyring
