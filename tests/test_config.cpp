#include <catch2/catch_test_macros.hpp>
#include "keyring/config.hpp"
#include "keyring/sample_store.hpp"
#include <cstdlib>
#include <spdlog/spdlog.h>

using namespace keyring;

namespace
{
    // Sets an environment variable for one test, then unsets it.
    class ScopedEnv
    {
    public:
        ScopedEnv(const char *name, const char *value)
            : name_(name)
        {
            setenv(name_, value, 1);
        }

        ~ScopedEnv()
        {
            unsetenv(name_);
        }

    private:
        const char *name_;
    };

    void clear_env()
    {
        unsetenv("KEYRING_STORE");
        unsetenv("KEYRING_BACKING_FILE");
        unsetenv("KEYRING_LOG_LEVEL");
    }
}

TEST_CASE("Config defaults", "[config]")
{
    clear_env();
    auto cfg = ConfigLoader::from_string("");
    REQUIRE(cfg.has_value());
    REQUIRE(cfg->store.kind == "sample");
    REQUIRE_FALSE(cfg->store.backing_file.has_value());
    REQUIRE(cfg->log.level == "warn");
}

TEST_CASE("Config parses TOML", "[config]")
{
    clear_env();
    auto cfg = ConfigLoader::from_string(R"(
[store]
kind = "mock"
backing_file = "/tmp/creds.json"

[log]
level = "debug"
)");
    REQUIRE(cfg.has_value());
    REQUIRE(cfg->store.kind == "mock");
    REQUIRE(cfg->store.backing_file == "/tmp/creds.json");
    REQUIRE(cfg->log.level == "debug");
}

TEST_CASE("Config rejects malformed TOML", "[config]")
{
    clear_env();
    auto cfg = ConfigLoader::from_string("[store\nkind = ");
    REQUIRE_FALSE(cfg.has_value());
    REQUIRE(cfg.error().code == ErrorCode::Invalid);
    REQUIRE(cfg.error().field() == "config");
}

TEST_CASE("Config file that does not exist", "[config]")
{
    auto cfg = ConfigLoader::load("/nonexistent/keyring.toml");
    REQUIRE_FALSE(cfg.has_value());
    REQUIRE(cfg.error().code == ErrorCode::Invalid);
}

TEST_CASE("Environment overrides config", "[config]")
{
    clear_env();
    const char *toml = R"(
[store]
kind = "sample"
backing_file = "/tmp/creds.json"
)";

    SECTION("store kind and log level")
    {
        ScopedEnv store("KEYRING_STORE", "mock");
        ScopedEnv level("KEYRING_LOG_LEVEL", "error");
        auto cfg = ConfigLoader::from_string(toml).value();
        REQUIRE(cfg.store.kind == "mock");
        REQUIRE(cfg.log.level == "error");
    }

    SECTION("backing file")
    {
        ScopedEnv path("KEYRING_BACKING_FILE", "/tmp/other.json");
        auto cfg = ConfigLoader::from_string(toml).value();
        REQUIRE(cfg.store.backing_file == "/tmp/other.json");
    }

    SECTION("empty backing file clears it")
    {
        ScopedEnv path("KEYRING_BACKING_FILE", "");
        auto cfg = ConfigLoader::from_string(toml).value();
        REQUIRE_FALSE(cfg.store.backing_file.has_value());
    }
}

TEST_CASE("Config serializes to JSON", "[config]")
{
    KeyringConfig cfg;
    auto j = ConfigLoader::to_json(cfg);
    REQUIRE(j["store"]["kind"] == "sample");
    REQUIRE(j["store"]["backing_file"].is_null());
    REQUIRE(j["log"]["level"] == "warn");

    cfg.store.backing_file = "/tmp/creds.json";
    REQUIRE(ConfigLoader::to_json(cfg)["store"]["backing_file"] == "/tmp/creds.json");
}

TEST_CASE("Stores from config", "[config]")
{
    KeyringConfig cfg;

    SECTION("sample without backing")
    {
        auto store = make_store(cfg);
        REQUIRE(store.has_value());
        REQUIRE((*store)->vendor() == sample::Store::vendor_name);
        REQUIRE((*store)->persistence() == Persistence::ProcessOnly);
    }

    SECTION("mock")
    {
        cfg.store.kind = "mock";
        auto store = make_store(cfg);
        REQUIRE(store.has_value());
        REQUIRE((*store)->vendor() == "mock");
    }

    SECTION("unknown kind")
    {
        cfg.store.kind = "keychain";
        auto store = make_store(cfg);
        REQUIRE_FALSE(store.has_value());
        REQUIRE(store.error().code == ErrorCode::Invalid);
        REQUIRE(store.error().field() == "store.kind");
    }
}

TEST_CASE("Log level from config", "[config]")
{
    KeyringConfig cfg;
    cfg.log.level = "debug";
    REQUIRE(apply_log_config(cfg).has_value());
    REQUIRE(spdlog::get_level() == spdlog::level::debug);

    cfg.log.level = "loud";
    auto res = apply_log_config(cfg);
    REQUIRE_FALSE(res.has_value());
    REQUIRE(res.error().field() == "log.level");
    REQUIRE(spdlog::get_level() == spdlog::level::debug);

    cfg.log.level = "warn";
    REQUIRE(apply_log_config(cfg).has_value());
}
