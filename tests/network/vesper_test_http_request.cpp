// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Vesper, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>
#include <limits>

using namespace vesper::network;

TEST_CASE("HttpRequest defaults", "[request]")
{
  HttpRequest request("http://example.com/");
  REQUIRE(request.getURI() == "http://example.com/");
  REQUIRE(request.getMethod() == "GET");
  REQUIRE(request.method() == HttpMethod::GET);
  REQUIRE(request.getTimeout() == Approx(HttpRequest::DEFAULT_TIMEOUT_SECONDS));
  REQUIRE(request.hasFormData());
  REQUIRE(request.encodedBody().empty());
  REQUIRE(request.getHeaders().empty());
}

TEST_CASE("HttpRequest method validation", "[request][method]")
{
  HttpRequest request("http://example.com/");

  SECTION("Supported methods")
  {
    request.setMethod("POST");
    REQUIRE(request.getMethod() == "POST");
    request.setMethod("PUT");
    REQUIRE(request.getMethod() == "PUT");
    request.setMethod(HttpMethod::GET);
    REQUIRE(request.getMethod() == "GET");
  }

  SECTION("Unsupported methods fail immediately and leave the method alone")
  {
    request.setMethod("POST");
    REQUIRE_THROWS_AS(request.setMethod("DELETE"), ConfigurationError);
    REQUIRE_THROWS_AS(request.setMethod("post"), ConfigurationError);
    REQUIRE_THROWS_AS(request.setMethod(""), ConfigurationError);
    REQUIRE(request.getMethod() == "POST");
  }

  SECTION("ConfigurationError is an invalid_argument naming the method")
  {
    try
    {
      request.setMethod("PATCH");
      FAIL("setMethod did not throw");
    }
    catch (const std::invalid_argument& e)
    {
      REQUIRE(std::string(e.what()).find("PATCH") != std::string::npos);
    }
  }
}

TEST_CASE("HttpRequest headers", "[request][headers]")
{
  HttpRequest request("http://example.com/");
  request.addHeader("Accept-Language", "en")
    .addHeader("X-Trace", "1")
    .addHeader("accept-language", "fr")
    .addHeader("Accept-Language", "en");

  SECTION("All headers in insertion order, duplicates kept")
  {
    auto all = request.getHeaders();
    REQUIRE(all.size() == 4);
    REQUIRE(all[0].first == "Accept-Language");
    REQUIRE(all[2].first == "accept-language");
    REQUIRE(all[3].second == "en");
  }

  SECTION("Filter matches case-insensitively in original order")
  {
    auto filtered = request.getHeaders(std::string("ACCEPT-LANGUAGE"));
    REQUIRE(filtered.size() == 3);
    REQUIRE(filtered[0].second == "en");
    REQUIRE(filtered[1].second == "fr");
    REQUIRE(filtered[2].second == "en");
  }

  SECTION("Unknown filter yields nothing")
  {
    REQUIRE(request.getHeaders(std::string("X-None")).empty());
  }

  SECTION("Line breaks cannot split the request")
  {
    REQUIRE_THROWS_AS(request.addHeader("X-A", "1\r\nX-Injected: yes"), ConfigurationError);
    REQUIRE_THROWS_AS(request.addHeader("X-A\nX-B", "1"), ConfigurationError);
    REQUIRE_THROWS_AS(request.addHeader("X-A", std::string("a\0b", 3)), ConfigurationError);
    REQUIRE(request.getHeaders().size() == 4);
  }
}

TEST_CASE("HttpRequest payloads", "[request][data]")
{
  SECTION("Raw string is sent as-is")
  {
    HttpRequest request("http://example.com/", std::string("{\"a\":1}"));
    REQUIRE_FALSE(request.hasFormData());
    REQUIRE(request.encodedBody() == "{\"a\":1}");
  }

  SECTION("Form fields are encoded in order, keys may repeat")
  {
    HttpRequest request("http://example.com/");
    request.setData(FormFields{{"q", "a b"}, {"tag", "x&y"}, {"tag", "z"}});
    REQUIRE(request.hasFormData());
    REQUIRE(request.encodedBody() == "q=a+b&tag=x%26y&tag=z");
    REQUIRE(std::get<FormFields>(request.getData()).size() == 3);
  }

  SECTION("Unreserved characters pass through, others are escaped")
  {
    REQUIRE(formEncode("Az09-_.~") == "Az09-_.~");
    REQUIRE(formEncode("a/b?c=d") == "a%2Fb%3Fc%3Dd");
    REQUIRE(formEncode("\xc3\xa9") == "%C3%A9");
  }
}

TEST_CASE("HttpRequest URI and timeout validation", "[request][config]")
{
  REQUIRE_THROWS_AS(HttpRequest(""), ConfigurationError);

  HttpRequest request("http://example.com/");
  REQUIRE_THROWS_AS(request.setURI(""), ConfigurationError);
  REQUIRE_THROWS_AS(request.setURI("http://example.com/a\r\nX-Injected: yes"),
                    ConfigurationError);
  REQUIRE_THROWS_AS(HttpRequest("http://example.com/\n"), ConfigurationError);
  request.setURI("https://example.org/x");
  REQUIRE(request.getURI() == "https://example.org/x");

  REQUIRE_THROWS_AS(request.setTimeout(0.0), ConfigurationError);
  REQUIRE_THROWS_AS(request.setTimeout(-1.0), ConfigurationError);
  REQUIRE_THROWS_AS(request.setTimeout(std::numeric_limits<double>::infinity()),
                    ConfigurationError);
  REQUIRE_THROWS_AS(request.setTimeout(std::numeric_limits<double>::quiet_NaN()),
                    ConfigurationError);
  request.setTimeout(2.5);
  REQUIRE(request.getTimeout() == Approx(2.5));
}

TEST_CASE("Request serialization", "[request][wire]")
{
  SECTION("GET carries Host, User-Agent and Connection: close")
  {
    HttpRequest request("http://example.com:8080/path?x=1");
    request.addHeader("Accept", "text/plain");
    auto wire = buildRequestBytes(request, parseUrl(request.getURI()), "Vesper/1.0");
    REQUIRE(wire == "GET /path?x=1 HTTP/1.0\r\n"
                    "Host: example.com:8080\r\n"
                    "User-Agent: Vesper/1.0\r\n"
                    "Accept: text/plain\r\n"
                    "Connection: close\r\n"
                    "\r\n");
  }

  SECTION("Form POST adds Content-Type and Content-Length")
  {
    HttpRequest request("http://example.com/submit", FormFields{{"a", "1"}, {"b", "2"}});
    request.setMethod("POST");
    auto wire = buildRequestBytes(request, parseUrl(request.getURI()), "Vesper/1.0");
    REQUIRE(wire.find("POST /submit HTTP/1.0\r\n") == 0);
    REQUIRE(wire.find("Content-Type: application/x-www-form-urlencoded\r\n") != std::string::npos);
    REQUIRE(wire.find("Content-Length: 7\r\n") != std::string::npos);
    REQUIRE(wire.substr(wire.size() - 11) == "\r\n\r\na=1&b=2");
  }

  SECTION("Caller headers override the generated ones")
  {
    HttpRequest request("https://example.com/", std::string("{}"));
    request.setMethod("PUT")
      .addHeader("Content-Type", "application/json")
      .addHeader("User-Agent", "custom")
      .addHeader("Host", "virtual.example");
    auto wire = buildRequestBytes(request, parseUrl(request.getURI()), "Vesper/1.0");
    REQUIRE(wire.find("application/x-www-form-urlencoded") == std::string::npos);
    REQUIRE(wire.find("Vesper/1.0") == std::string::npos);
    REQUIRE(wire.find("Host: example.com") == std::string::npos);
    REQUIRE(wire.find("Host: virtual.example\r\n") != std::string::npos);
    REQUIRE(wire.find("Content-Length: 2\r\n") != std::string::npos);
  }

  SECTION("Bodyless PUT still sends Content-Length: 0")
  {
    HttpRequest request("http://example.com/");
    request.setMethod("PUT");
    auto wire = buildRequestBytes(request, parseUrl(request.getURI()), "");
    REQUIRE(wire.find("Content-Length: 0\r\n") != std::string::npos);
    REQUIRE(wire.find("User-Agent") == std::string::npos);
  }
}
