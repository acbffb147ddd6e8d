#include <catch2/catch_test_macros.hpp>
#include "keyring/crypto.hpp"
#include "keyring/entry.hpp"
#include "keyring/sample_store.hpp"
#include "test_support.hpp"
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>

using namespace keyring;
using keyring::testing::random_name;

namespace
{
    // Removes the file on scope exit.
    struct TempPath
    {
        std::filesystem::path path{std::filesystem::temp_directory_path() / ("keyring-test-" + random_name() + ".json")};

        ~TempPath()
        {
            std::error_code ec;
            std::filesystem::remove(path, ec);
        }

        std::string str() const { return path.string(); }
    };

    void write_file(const TempPath &file, const std::string &content)
    {
        std::ofstream out(file.path);
        out << content;
    }

    std::shared_ptr<sample::Store> open_store(const TempPath &file)
    {
        auto store = sample::Store::create_with_backing(file.str());
        REQUIRE(store.has_value());
        return *store;
    }
}

TEST_CASE("A missing backing file gives an empty store", "[persistence]")
{
    TempPath file;
    auto store = open_store(file);
    REQUIRE(store->credential_count() == 0);
    REQUIRE(store->persistence() == Persistence::UntilDelete);
    REQUIRE(store->backing() == file.str());
}

TEST_CASE("Saved credentials reload with the same secrets", "[persistence]")
{
    TempPath file;
    std::vector<std::pair<std::string, std::string>> names;
    {
        auto store = open_store(file);
        for (int i = 0; i < 5; ++i)
        {
            auto name = random_name();
            auto entry = store->build(name, name, std::nullopt).value();
            REQUIRE(entry.set_password("pw-" + name).has_value());
            names.emplace_back(name, "pw-" + name);
        }
        auto forced = store->build("shared", "user", Attributes{{"force-create", "note"}}).value();
        REQUIRE(forced.set_secret(Bytes{0x00, 0xff, 0x10}).has_value());
        REQUIRE(store->save().has_value());
    }

    auto reloaded = open_store(file);
    REQUIRE(reloaded->credential_count() == 6);
    for (const auto &[name, password] : names)
    {
        auto entry = reloaded->build(name, name, std::nullopt).value();
        REQUIRE(entry.get_password().value() == password);
    }

    auto shared = reloaded->build("shared", "user", std::nullopt).value();
    REQUIRE(shared.get_secret().value() == Bytes{0x00, 0xff, 0x10});
    auto attrs = shared.get_attributes().value();
    REQUIRE(attrs.at("comment") == "note");
    REQUIRE(attrs.contains("creation_date"));
}

TEST_CASE("Changes reach the file only when saved", "[persistence]")
{
    TempPath file;
    auto store = open_store(file);
    auto name = random_name();
    auto entry = store->build(name, name, std::nullopt).value();
    REQUIRE(entry.set_password("first").has_value());
    REQUIRE(store->save().has_value());

    auto other = store->build(random_name(), name, std::nullopt).value();
    REQUIRE(other.set_password("unsaved").has_value());

    auto snapshot = open_store(file);
    REQUIRE(snapshot->credential_count() == 1);
    auto copy = snapshot->build(name, name, std::nullopt).value();
    REQUIRE(copy.get_password().value() == "first");
}

TEST_CASE("A store saves itself when released", "[persistence]")
{
    TempPath file;
    auto name = random_name();
    {
        auto store = open_store(file);
        auto entry = store->build(name, name, std::nullopt).value();
        REQUIRE(entry.set_password("saved on release").has_value());
    }
    REQUIRE(std::filesystem::exists(file.path));

    auto reloaded = open_store(file);
    auto entry = reloaded->build(name, name, std::nullopt).value();
    REQUIRE(entry.get_password().value() == "saved on release");
}

TEST_CASE("Backing file format", "[persistence]")
{
    TempPath file;
    {
        auto store = open_store(file);
        auto entry = store->build("svc", "usr", Attributes{{"force-create", "c"}}).value();
        REQUIRE(entry.set_password("ab").has_value());
    }

    std::ifstream in(file.path);
    auto j = nlohmann::json::parse(in);
    REQUIRE(j.at("credentials").size() == 1);
    const auto &cred = j.at("credentials").at(0);
    REQUIRE(cred.at("service") == "svc");
    REQUIRE(cred.at("user") == "usr");
    REQUIRE(cred.at("records").size() == 1);
    const auto &record = cred.at("records").begin().value();
    REQUIRE(record.at("secret") == nlohmann::json::array({0x61, 0x62}));
    REQUIRE(record.at("comment") == "c");
    REQUIRE(record.at("creation_date").is_string());
}

TEST_CASE("A corrupt backing file is a platform failure", "[persistence]")
{
    TempPath file;
    {
        std::ofstream out(file.path);
        out << "{ this is not json";
    }
    auto store = sample::Store::create_with_backing(file.str());
    REQUIRE_FALSE(store.has_value());
    REQUIRE(store.error().code == ErrorCode::PlatformFailure);
    REQUIRE(store.error().inner() != nullptr);
}

TEST_CASE("Well-formed JSON of the wrong shape is a platform failure", "[persistence]")
{
    TempPath file;
    {
        std::ofstream out(file.path);
        out << R"({"credentials": [{"service": "svc"}]})";
    }
    auto store = sample::Store::create_with_backing(file.str());
    REQUIRE_FALSE(store.has_value());
    REQUIRE(store.error().code == ErrorCode::PlatformFailure);
}

TEST_CASE("Backing files with invalid records are platform failures", "[persistence]")
{
    auto record = [](const std::string &secret) {
        return R"({"credentials": [{"service": "svc", "user": "usr", "records": {")" +
               crypto::Uuid::generate() + R"(": {"secret": )" + secret +
               R"(, "comment": null, "creation_date": null}}}]})";
    };

    SECTION("well-formed record loads")
    {
        TempPath file;
        write_file(file, record("[0, 97, 255]"));
        auto store = sample::Store::create_with_backing(file.str());
        REQUIRE(store.has_value());
        auto entry = (*store)->build("svc", "usr", std::nullopt).value();
        REQUIRE(entry.get_secret().value() == Bytes{0x00, 0x61, 0xff});
    }

    for (const auto *secret : {"[300]", "[-1]", "[true]", "[1.7]", "[\"a\"]", "\"abc\""})
    {
        DYNAMIC_SECTION("secret " << secret)
        {
            TempPath file;
            write_file(file, record(secret));
            auto store = sample::Store::create_with_backing(file.str());
            REQUIRE_FALSE(store.has_value());
            REQUIRE(store.error().code == ErrorCode::PlatformFailure);
        }
    }

    SECTION("record key that is not a uuid")
    {
        TempPath file;
        write_file(file, R"({"credentials": [{"service": "svc", "user": "usr", "records": {"not-a-uuid": {"secret": []}}}]})");
        auto store = sample::Store::create_with_backing(file.str());
        REQUIRE_FALSE(store.has_value());
        REQUIRE(store.error().code == ErrorCode::PlatformFailure);
    }

    SECTION("the same service and user twice")
    {
        TempPath file;
        auto bucket = [](const std::string &uuid) {
            return R"({"service": "svc", "user": "usr", "records": {")" + uuid + R"(": {"secret": [1]}}})";
        };
        write_file(file, R"({"credentials": [)" + bucket(crypto::Uuid::generate()) + ", " +
                             bucket(crypto::Uuid::generate()) + "]}");
        auto store = sample::Store::create_with_backing(file.str());
        REQUIRE_FALSE(store.has_value());
        REQUIRE(store.error().code == ErrorCode::PlatformFailure);
        REQUIRE(std::string(store.error().what()).find("duplicate") != std::string::npos);
    }
}

TEST_CASE("Store configuration keys", "[persistence]")
{
    SECTION("no keys gives a process-only store")
    {
        auto store = sample::Store::create_with_configuration({});
        REQUIRE(store.has_value());
        REQUIRE((*store)->persistence() == Persistence::ProcessOnly);
    }

    SECTION("backing-file")
    {
        TempPath file;
        auto store = sample::Store::create_with_configuration({{"backing-file", file.str()}});
        REQUIRE(store.has_value());
        REQUIRE((*store)->backing() == file.str());
    }

    SECTION("unknown keys are invalid")
    {
        auto store = sample::Store::create_with_configuration({{"persist", "true"}});
        REQUIRE_FALSE(store.has_value());
        REQUIRE(store.error().code == ErrorCode::Invalid);
        REQUIRE(store.error().field() == "persist");
    }
}
