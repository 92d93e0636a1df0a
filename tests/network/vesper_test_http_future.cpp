// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Vesper, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

using namespace vesper::network;
using vesper::core::ThreadPool;
using vesper::test::LoopbackServer;

namespace
{
/// Transport returning a fixed outcome, recording what it was asked to send.
class ScriptedTransport : public Transport
{
public:
  explicit ScriptedTransport(ExchangeResult outcome,
                             std::chrono::milliseconds delay = std::chrono::milliseconds(0))
    : _outcome(std::move(outcome)), _delay(delay)
  {
  }

  const char* name() const override { return "scripted"; }

  ExchangeResult exchange(const HttpRequest& request, MonoTime deadline) override
  {
    ++calls;
    seenMethod = request.getMethod();
    seenDeadline = deadline;
    std::this_thread::sleep_for(_delay);
    return _outcome;
  }

  std::atomic<int> calls{0};
  std::string seenMethod;
  MonoTime seenDeadline{};

private:
  ExchangeResult _outcome;
  std::chrono::milliseconds _delay;
};

class ThrowingTransport : public Transport
{
public:
  const char* name() const override { return "throwing"; }
  ExchangeResult exchange(const HttpRequest&, MonoTime) override
  {
    throw std::runtime_error("transport exploded");
  }
};
} // namespace

TEST_CASE("HttpFuture resolves a well-formed response", "[future]")
{
  vesper::test::initializeTestLogging();
  ThreadPool pool(2);
  auto transport = std::make_shared<ScriptedTransport>(
    ExchangeResult::received("HTTP/1.1 200 OK\r\nContent-Type: text/plain\r\n\r\nhello"));

  HttpFuture future(HttpRequest("http://example.com/"), transport, pool);
  const auto& response = future.resolve();

  REQUIRE(response.status.statusCode() == 200);
  REQUIRE_FALSE(response.status.isError());
  REQUIRE(response.body == "hello");
  REQUIRE(response.headers ==
          vesper::parsers::HeaderList{{"Content-Type", std::string("text/plain")}});
  REQUIRE(future.isReady());

  SECTION("The result is computed once")
  {
    const auto& again = future.resolve();
    REQUIRE(&again == &response);
    REQUIRE(transport->calls == 1);
  }

  SECTION("resolveOrThrow returns body and headers")
  {
    auto content = future.resolveOrThrow();
    REQUIRE(content.body == "hello");
    REQUIRE(content.headers.size() == 1);
  }
}

TEST_CASE("HttpFuture start is idempotent", "[future][start]")
{
  ThreadPool pool(1);
  auto transport = std::make_shared<ScriptedTransport>(
    ExchangeResult::received("HTTP/1.1 204 No Content\r\n\r\n"));

  HttpFuture future(HttpRequest("http://example.com/"), transport, pool);
  REQUIRE_FALSE(future.isReady());
  future.start().start();
  REQUIRE(future.resolve().status.statusCode() == 204);
  REQUIRE(transport->calls == 1);
}

TEST_CASE("HttpFuture freezes the request", "[future][frozen]")
{
  ThreadPool pool(1);
  auto transport = std::make_shared<ScriptedTransport>(
    ExchangeResult::received("HTTP/1.1 200 OK\r\n\r\n"));

  HttpRequest request("http://example.com/");
  request.setMethod("POST");
  HttpFuture future(request, transport, pool);
  request.setMethod("PUT");

  future.resolve();
  REQUIRE(transport->seenMethod == "POST");
  REQUIRE(future.request().getMethod() == "POST");
}

TEST_CASE("HttpFuture error outcomes", "[future][errors]")
{
  ThreadPool pool(2);

  SECTION("HTTP error codes resolve without throwing")
  {
    auto transport = std::make_shared<ScriptedTransport>(
      ExchangeResult::received("HTTP/1.1 404 Not Found\r\n\r\nmissing"));
    HttpFuture future(HttpRequest("http://example.com/"), transport, pool);

    const auto& response = future.resolve();
    REQUIRE(response.status.isError());
    REQUIRE(response.body == "missing");

    try
    {
      future.resolveOrThrow();
      FAIL("resolveOrThrow did not throw");
    }
    catch (const StatusError& e)
    {
      REQUIRE(e.status().statusCode() == 404);
      REQUIRE(std::string(e.what()) == "[HTTP/404] Not Found");
    }
  }

  SECTION("Malformed bytes become a parse status")
  {
    auto transport =
      std::make_shared<ScriptedTransport>(ExchangeResult::received("not http at all"));
    HttpFuture future(HttpRequest("http://example.com/"), transport, pool);

    const auto& response = future.resolve();
    REQUIRE(response.status.kind() == ResponseStatus::Kind::Parse);
    REQUIRE(response.status.asParse()->rawResponse == "not http at all");
    REQUIRE(response.body.empty());
    REQUIRE(response.headers.empty());
    REQUIRE_THROWS_AS(future.resolveOrThrow(), StatusError);
  }

  SECTION("Continuations beyond the configured cap are malformed")
  {
    auto transport = std::make_shared<ScriptedTransport>(ExchangeResult::received(
      "HTTP/1.1 100 Continue\r\n\r\nHTTP/1.1 100 Continue\r\n\r\nHTTP/1.1 200 OK\r\n\r\n"));
    HttpFuture strict(HttpRequest("http://example.com/"), transport, pool, 1);
    REQUIRE(strict.resolve().status.kind() == ResponseStatus::Kind::Parse);

    HttpFuture lenient(HttpRequest("http://example.com/"), transport, pool);
    REQUIRE(lenient.resolve().status.statusCode() == 200);
  }

  SECTION("Transport failures become transport statuses")
  {
    auto transport = std::make_shared<ScriptedTransport>(
      ExchangeResult::failed(IoResult::failure(TransportError::ConnectionRefused, "refused")));
    HttpFuture future(HttpRequest("http://example.com/"), transport, pool);

    const auto& response = future.resolve();
    REQUIRE(response.status.asTransport()->error == TransportError::ConnectionRefused);
    REQUIRE_FALSE(response.status.isTimeout());
    REQUIRE(response.body.empty());
  }

  SECTION("Exceptions from a transport are contained")
  {
    HttpFuture future(HttpRequest("http://example.com/"), std::make_shared<ThrowingTransport>(),
                      pool);
    const auto& response = future.resolve();
    REQUIRE(response.status.asTransport()->error == TransportError::Unknown);
    REQUIRE(response.status.asTransport()->message == "transport exploded");
  }
}

TEST_CASE("HttpFuture times out", "[future][timeout]")
{
  ThreadPool pool(1);
  auto transport = std::make_shared<ScriptedTransport>(
    ExchangeResult::received("HTTP/1.1 200 OK\r\n\r\nlate"), std::chrono::milliseconds(500));

  HttpRequest request("http://example.com/");
  request.setTimeout(0.1);
  HttpFuture future(request, transport, pool);

  auto begin = std::chrono::steady_clock::now();
  const auto& response = future.resolve();
  auto elapsed = std::chrono::steady_clock::now() - begin;

  REQUIRE(response.status.isTimeout());
  REQUIRE(response.status.isError());
  REQUIRE(elapsed < std::chrono::milliseconds(400));
  REQUIRE(future.isReady());
  REQUIRE_THROWS_AS(future.resolveOrThrow(), StatusError);
}

TEST_CASE("HttpFuture waits out a very large timeout", "[future][timeout]")
{
  ThreadPool pool(1);
  auto transport = std::make_shared<ScriptedTransport>(
    ExchangeResult::received("HTTP/1.1 200 OK\r\n\r\nslow"), std::chrono::milliseconds(200));

  HttpRequest request("http://example.com/");
  request.setTimeout(1e11);
  auto before = MonoClock::now();
  HttpFuture future(request, transport, pool);
  const auto& response = future.resolve();

  REQUIRE(response.status.statusCode() == 200);
  REQUIRE(response.body == "slow");
  REQUIRE(transport->seenDeadline > before + std::chrono::hours(24 * 365));
  REQUIRE(transport->seenDeadline <= MonoClock::now() + MAX_WAIT);
}

TEST_CASE("deadlineAfter saturates", "[future][timeout]")
{
  auto now = MonoClock::now();
  REQUIRE(deadlineAfter(1.5, now) - now == std::chrono::milliseconds(1500));
  REQUIRE(deadlineAfter(1e11, now) == now + MAX_WAIT);
  REQUIRE(deadlineAfter(1e300, now) == now + MAX_WAIT);
}

TEST_CASE("HttpFuture reports rejected scheduling as cancelled", "[future][cancel]")
{
  ThreadPool pool(1);
  pool.shutdown();
  auto transport = std::make_shared<ScriptedTransport>(
    ExchangeResult::received("HTTP/1.1 200 OK\r\n\r\n"));

  HttpFuture future(HttpRequest("http://example.com/"), transport, pool);
  const auto& response = future.resolve();
  REQUIRE(response.status.asTransport()->error == TransportError::Cancelled);
  REQUIRE(transport->calls == 0);
}

TEST_CASE("HttpFuture rejects missing collaborators", "[future]")
{
  ThreadPool pool(1);
  REQUIRE_THROWS_AS(HttpFuture(std::shared_ptr<const HttpRequest>(),
                               std::make_shared<ThrowingTransport>(), pool),
                    std::invalid_argument);
  REQUIRE_THROWS_AS(HttpFuture(HttpRequest("http://example.com/"), nullptr, pool),
                    std::invalid_argument);
}

TEST_CASE("HttpFuture over PlainTransport against a loopback server", "[future][plain]")
{
  ThreadPool pool(2);

  SECTION("Request bytes and response round trip")
  {
    LoopbackServer server("HTTP/1.1 100 Continue\r\n\r\n"
                          "HTTP/1.1 201 Created\r\nX-Id: 42\r\n\r\ncreated");
    HttpRequest request(server.url("/items"), FormFields{{"name", "a b"}});
    request.setMethod("POST").addHeader("X-Trace", "t1");

    HttpFuture future(request, makeTransportFor(request.getURI()), pool);
    auto content = future.resolveOrThrow();
    REQUIRE(content.body == "created");
    REQUIRE(vesper::parsers::findHeader(content.headers, "x-id") == std::string("42"));

    auto sent = server.lastRequest();
    REQUIRE(sent.find("POST /items HTTP/1.0\r\n") == 0);
    REQUIRE(sent.find("X-Trace: t1\r\n") != std::string::npos);
    REQUIRE(sent.find("Content-Type: application/x-www-form-urlencoded\r\n") != std::string::npos);
    REQUIRE(sent.substr(sent.size() - 8) == "name=a+b");
  }

  SECTION("Server that never answers")
  {
    LoopbackServer server("HTTP/1.1 200 OK\r\n\r\n", std::chrono::seconds(10));
    HttpRequest request(server.url());
    request.setTimeout(0.2);

    HttpFuture future(request, std::make_shared<PlainTransport>(), pool);
    REQUIRE(future.resolve().status.isTimeout());
  }

  SECTION("Server that closes without answering")
  {
    LoopbackServer server("");
    HttpFuture future(HttpRequest(server.url()), std::make_shared<PlainTransport>(), pool);
    const auto& response = future.resolve();
    REQUIRE(response.status.asTransport()->error == TransportError::PeerClosed);
  }

  SECTION("Garbage from the server is a parse status")
  {
    LoopbackServer server("hello there\r\n\r\n");
    HttpFuture future(HttpRequest(server.url()), std::make_shared<PlainTransport>(), pool);
    const auto& response = future.resolve();
    REQUIRE(response.status.kind() == ResponseStatus::Kind::Parse);
    REQUIRE(response.status.asParse()->rawResponse == "hello there\r\n\r\n");
  }

  SECTION("Nobody listening")
  {
    std::uint16_t port = 0;
    {
      LoopbackServer server("");
      port = server.port();
    }
    HttpFuture future(HttpRequest("http://127.0.0.1:" + std::to_string(port) + "/"),
                      std::make_shared<PlainTransport>(), pool);
    const auto& response = future.resolve();
    REQUIRE(response.status.asTransport()->error == TransportError::ConnectionRefused);
  }

  SECTION("Unparsable URI is a Config transport status")
  {
    HttpFuture future(HttpRequest("not a url"), makeTransportFor("not a url"), pool);
    const auto& response = future.resolve();
    REQUIRE(response.status.asTransport()->error == TransportError::Config);
    REQUIRE_FALSE(response.status.isTimeout());
  }

  SECTION("Responses above the size cap are rejected")
  {
    LoopbackServer server("HTTP/1.1 200 OK\r\n\r\n" + std::string(4096, 'x'));
    TransportConfig config;
    config.maxResponseSize = 1024;
    config.ioReadChunk = 512;
    HttpFuture future(HttpRequest(server.url()), std::make_shared<PlainTransport>(config), pool);
    REQUIRE(future.resolve().status.asTransport()->error == TransportError::ResponseTooLarge);
  }
}

TEST_CASE("TlsTransport against a plaintext server fails the handshake", "[future][tls]")
{
  ThreadPool pool(1);
  LoopbackServer server("HTTP/1.1 200 OK\r\n\r\nnot tls");
  std::string uri = "https://127.0.0.1:" + std::to_string(server.port()) + "/";

  auto transport = makeTransportFor(uri);
  REQUIRE(std::string(transport->name()) == "tls");

  HttpRequest request(uri);
  request.setTimeout(5.0);
  HttpFuture future(request, transport, pool);
  const auto& response = future.resolve();
  REQUIRE(response.status.kind() == ResponseStatus::Kind::Transport);
  auto error = response.status.asTransport()->error;
  REQUIRE((error == TransportError::TLSHandshake || error == TransportError::PeerClosed));
}

TEST_CASE("TlsTransport with an unreadable CA file reports a Config failure", "[future][tls]")
{
  ThreadPool pool(1);
  TransportConfig config;
  config.tls.caFile = "does_not_exist_ca.pem";
  auto transport = std::make_shared<TlsTransport>(config);
  REQUIRE(transport->lastFatal().code == TransportError::Config);

  HttpFuture future(HttpRequest("https://127.0.0.1:1/"), transport, pool);
  REQUIRE(future.resolve().status.asTransport()->error == TransportError::Config);
}
