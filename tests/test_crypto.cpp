#include <catch2/catch_test_macros.hpp>
#include "keyring/crypto.hpp"
#include <set>
#include <string>

using namespace keyring;
using namespace keyring::crypto;

TEST_CASE("Uuid generation", "[crypto]")
{
    auto uuid = Uuid::generate();
    REQUIRE(uuid.size() == 36);
    REQUIRE(Uuid::is_valid(uuid));
    // version 4, RFC 4122 variant
    REQUIRE(uuid[14] == '4');
    REQUIRE(std::string("89ab").find(uuid[19]) != std::string::npos);
}

TEST_CASE("Uuids are not reused", "[crypto]")
{
    std::set<std::string> seen;
    for (int i = 0; i < 1000; ++i)
        REQUIRE(seen.insert(Uuid::generate()).second);
}

TEST_CASE("Uuid validation", "[crypto]")
{
    REQUIRE(Uuid::is_valid("123e4567-e89b-42d3-a456-426614174000"));
    REQUIRE_FALSE(Uuid::is_valid("123e4567e89b42d3a456426614174000"));
    REQUIRE_FALSE(Uuid::is_valid("123e4567-e89b-42d3-a456-42661417400g"));
    REQUIRE_FALSE(Uuid::is_valid(""));
}

TEST_CASE("Secure random bytes", "[crypto]")
{
    auto a = SecureRandom::generate_bytes(32);
    auto b = SecureRandom::generate_bytes(32);
    REQUIRE(a.size() == 32);
    REQUIRE(a != b);
    REQUIRE(SecureRandom::generate_bytes(0).empty());
}

TEST_CASE("secure_wipe clears the buffer", "[crypto]")
{
    Bytes secret{'h', 'u', 'n', 't', 'e', 'r', '2'};
    secure_wipe(secret);
    REQUIRE(secret.empty());

    Bytes empty;
    secure_wipe(empty);
    REQUIRE(empty.empty());
}
