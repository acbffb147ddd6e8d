#include "keyring/config.hpp"
#include "keyring/mock.hpp"
#include "keyring/sample_store.hpp"
#include <array>
#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <spdlog/spdlog.h>
#include <sstream>
#include <toml++/toml.h>

namespace keyring
{
    namespace
    {
        constexpr std::array<const char *, 7> kLogLevels{"trace", "debug", "info", "warn", "error", "critical", "off"};

        KeyringConfig parse_toml(const toml::table &tbl, KeyringConfig cfg)
        {
            if (auto store = tbl["store"].as_table())
            {
                if (auto kind = (*store)["kind"].value<std::string>())
                    cfg.store.kind = *kind;
                if (auto path = (*store)["backing_file"].value<std::string>())
                    cfg.store.backing_file = *path;
            }

            if (auto log = tbl["log"].as_table())
            {
                if (auto level = (*log)["level"].value<std::string>())
                    cfg.log.level = *level;
            }

            return cfg;
        }

    } // namespace

    Result<KeyringConfig> ConfigLoader::load(const std::string &path)
    {
        std::ifstream file(path);
        if (!file.is_open())
        {
            return std::unexpected(KeyringError::invalid("config", "Unable to open config file: " + path));
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        return from_string(buffer.str());
    }

    Result<KeyringConfig> ConfigLoader::from_string(const std::string &toml_content)
    {
        KeyringConfig cfg{};

        try
        {
            auto tbl = toml::parse(toml_content);
            cfg = parse_toml(tbl, cfg);
        }
        catch (const toml::parse_error &e)
        {
            return std::unexpected(KeyringError::invalid("config", std::string("Failed to parse TOML: ") + e.what()));
        }

        apply_env_overrides(cfg);
        return cfg;
    }

    void ConfigLoader::apply_env_overrides(KeyringConfig &cfg)
    {
        if (const char *kind = std::getenv("KEYRING_STORE"))
            cfg.store.kind = kind;
        if (const char *path = std::getenv("KEYRING_BACKING_FILE"))
        {
            if (*path)
                cfg.store.backing_file = path;
            else
                cfg.store.backing_file.reset();
        }
        if (const char *level = std::getenv("KEYRING_LOG_LEVEL"))
            cfg.log.level = level;
    }

    nlohmann::json ConfigLoader::to_json(const KeyringConfig &cfg)
    {
        nlohmann::json j;
        j["store"] = {
            {"kind", cfg.store.kind},
            {"backing_file", cfg.store.backing_file ? nlohmann::json(*cfg.store.backing_file) : nlohmann::json(nullptr)}};
        j["log"] = {{"level", cfg.log.level}};
        return j;
    }

    Result<void> apply_log_config(const KeyringConfig &cfg)
    {
        if (std::find(kLogLevels.begin(), kLogLevels.end(), cfg.log.level) == kLogLevels.end())
            return std::unexpected(KeyringError::invalid("log.level", "unknown level: " + cfg.log.level));
        spdlog::set_level(spdlog::level::from_str(cfg.log.level));
        return {};
    }

    Result<std::shared_ptr<CredentialStore>> make_store(const KeyringConfig &cfg)
    {
        if (cfg.store.kind == "mock")
            return mock::default_store();

        if (cfg.store.kind != "sample")
            return std::unexpected(KeyringError::invalid("store.kind", "unknown store: " + cfg.store.kind));

        if (!cfg.store.backing_file)
            return std::shared_ptr<CredentialStore>(sample::Store::create());

        auto store = sample::Store::create_with_backing(*cfg.store.backing_file);
        if (!store)
            return std::unexpected(store.error());
        return std::shared_ptr<CredentialStore>(std::move(*store));
    }

} // namespace keyring
