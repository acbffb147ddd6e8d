#include <catch2/catch_test_macros.hpp>
#include "keyring/attributes.hpp"

using namespace keyring;

TEST_CASE("parse_attributes with no map is empty", "[attributes]")
{
    auto res = parse_attributes({"force-create"}, std::nullopt);
    REQUIRE(res.has_value());
    REQUIRE(res->empty());
}

TEST_CASE("parse_attributes keeps allowed keys", "[attributes]")
{
    auto res = parse_attributes({"service", "*persist"}, Attributes{{"service", "svc"}, {"persist", "true"}});
    REQUIRE(res.has_value());
    REQUIRE(res->at("service") == "svc");
    REQUIRE(res->at("persist") == "true");
}

TEST_CASE("parse_attributes rejects unknown keys", "[attributes]")
{
    auto res = parse_attributes({"force-create"}, Attributes{{"target", "x"}});
    REQUIRE_FALSE(res.has_value());
    REQUIRE(res.error().code == ErrorCode::Invalid);
    REQUIRE(res.error().field() == "target");
    REQUIRE(res.error().detail() == "unknown key");
}

TEST_CASE("parse_attributes requires booleans for starred keys", "[attributes]")
{
    auto res = parse_attributes({"*persist"}, Attributes{{"persist", "yes"}});
    REQUIRE_FALSE(res.has_value());
    REQUIRE(res.error().code == ErrorCode::Invalid);
    REQUIRE(res.error().field() == "persist");

    auto starred = parse_attributes({"*persist"}, Attributes{{"*persist", "true"}});
    REQUIRE_FALSE(starred.has_value());
}
