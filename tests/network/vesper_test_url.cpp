// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Vesper, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

using vesper::network::parseUrl;

TEST_CASE("URL parsing", "[url]")
{
  SECTION("Full URL")
  {
    auto url = parseUrl("https://api.example.com:8443/v1/items?limit=5#top");
    REQUIRE(url.scheme == "https");
    REQUIRE(url.isHttps());
    REQUIRE(url.host == "api.example.com");
    REQUIRE(url.port == 8443);
    REQUIRE(url.path == "/v1/items");
    REQUIRE(url.query == "limit=5");
    REQUIRE(url.getPathWithQuery() == "/v1/items?limit=5");
    REQUIRE(url.getHostHeader() == "api.example.com:8443");
  }

  SECTION("Defaults")
  {
    auto url = parseUrl("HTTP://example.com");
    REQUIRE(url.scheme == "http");
    REQUIRE(url.port == 0);
    REQUIRE(url.getEffectivePort() == 80);
    REQUIRE(url.path == "/");
    REQUIRE(url.getHostHeader() == "example.com");
    REQUIRE(parseUrl("https://example.com").getEffectivePort() == 443);
  }

  SECTION("Query without a path")
  {
    auto url = parseUrl("http://example.com?x=1");
    REQUIRE(url.path == "/");
    REQUIRE(url.query == "x=1");
  }

  SECTION("Default port is omitted from Host")
  {
    REQUIRE(parseUrl("http://example.com:80/").getHostHeader() == "example.com");
  }

  SECTION("IPv6 literal")
  {
    auto url = parseUrl("http://[::1]:8080/x");
    REQUIRE(url.host == "::1");
    REQUIRE(url.port == 8080);
    REQUIRE(url.getHostHeader() == "[::1]:8080");
  }

  SECTION("Userinfo is dropped")
  {
    REQUIRE(parseUrl("http://user:pw@example.com/").host == "example.com");
  }
}

TEST_CASE("URL parsing rejects bad input", "[url][invalid]")
{
  REQUIRE_THROWS_AS(parseUrl("example.com/x"), std::invalid_argument);
  REQUIRE_THROWS_AS(parseUrl("ftp://example.com/"), std::invalid_argument);
  REQUIRE_THROWS_AS(parseUrl("http:///path"), std::invalid_argument);
  REQUIRE_THROWS_AS(parseUrl("http://example.com:abc/"), std::invalid_argument);
  REQUIRE_THROWS_AS(parseUrl("http://example.com:0/"), std::invalid_argument);
  REQUIRE_THROWS_AS(parseUrl("http://example.com:70000/"), std::invalid_argument);
  REQUIRE_THROWS_AS(parseUrl("http://[::1/"), std::invalid_argument);
}
