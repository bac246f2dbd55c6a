/*
 * File: tests/test_auth.cpp
 * Project: Battle Relay
 * Purpose: Shared-secret validation and token extraction
 * Last updated: 2026-10-18
 */

#include <catch2/catch_all.hpp>
#include "relay_auth.hpp"

TEST_CASE("validate accepts only the configured secret")
{
    Authenticator auth{"test_token"};
    REQUIRE(auth.validate(std::string("test_token")));
    REQUIRE_FALSE(auth.validate(std::string("wrong_token")));
    REQUIRE_FALSE(auth.validate(std::string("test_token_longer")));
    REQUIRE_FALSE(auth.validate(std::string("")));
    REQUIRE_FALSE(auth.validate(std::nullopt));
}

TEST_CASE("extract_credential reads the token- subprotocol entry")
{
    auto c = extract_credential("token-abc");
    REQUIRE(c);
    REQUIRE(c->value == "abc");
    REQUIRE(c->protocol == "token-abc");

    auto listed = extract_credential("chat, token-s3cret ,json");
    REQUIRE(listed);
    REQUIRE(listed->value == "s3cret");
    REQUIRE(listed->protocol == "token-s3cret");
}

TEST_CASE("extract_credential without a token entry yields nothing")
{
    REQUIRE_FALSE(extract_credential(""));
    REQUIRE_FALSE(extract_credential("chat"));
    REQUIRE_FALSE(extract_credential("token-"));
    REQUIRE_FALSE(extract_credential("test_token"));
}
