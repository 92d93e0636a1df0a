// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Vesper, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

/// \file http_future.hpp
/// \brief Deferred result of one HTTP request.
/// \details
///   The future owns a frozen copy of the request. start() hands the exchange
///   to a ThreadPool worker, which runs the transport and parses the raw
///   bytes; resolve() waits for that worker until the request deadline and
///   always yields a Response, whatever happened. An HttpFuture is meant to
///   be used from one thread; many futures may be in flight at once.

#include <chrono>
#include <exception>
#include <future>
#include <memory>
#include <optional>
#include <stdexcept>
#include <utility>

#include <vesper/core/logger.hpp>
#include <vesper/core/thread_pool.hpp>
#include <vesper/network/http_request.hpp>
#include <vesper/network/response_status.hpp>
#include <vesper/network/transport.hpp>
#include <vesper/parsers/http_response_parser.hpp>

namespace vesper
{
namespace network
{

class HttpFuture
{
public:
  HttpFuture(std::shared_ptr<const HttpRequest> request, std::shared_ptr<Transport> transport,
             core::ThreadPool& pool,
             std::size_t maxContinuations = parsers::HttpResponseParser::DEFAULT_MAX_CONTINUATIONS)
    : _request(std::move(request)), _transport(std::move(transport)), _pool(&pool),
      _parser(maxContinuations)
  {
    if (!_request)
    {
      throw std::invalid_argument("HttpFuture requires a request");
    }
    if (!_transport)
    {
      throw std::invalid_argument("HttpFuture requires a transport");
    }
  }

  /// \brief Copies \p request; later changes to it are not seen.
  HttpFuture(const HttpRequest& request, std::shared_ptr<Transport> transport,
             core::ThreadPool& pool,
             std::size_t maxContinuations = parsers::HttpResponseParser::DEFAULT_MAX_CONTINUATIONS)
    : HttpFuture(std::make_shared<const HttpRequest>(request), std::move(transport), pool,
                 maxContinuations)
  {
  }

  HttpFuture(const HttpFuture&) = delete;
  HttpFuture& operator=(const HttpFuture&) = delete;
  HttpFuture(HttpFuture&&) = default;
  HttpFuture& operator=(HttpFuture&&) = default;

  const HttpRequest& request() const { return *_request; }

  /// \brief Submit the exchange. Calling it again does nothing.
  HttpFuture& start()
  {
    if (_started)
    {
      return *this;
    }
    _started = true;

    _deadline = deadlineAfter(_request->getTimeout());

    VESPER_LOG_DEBUG("HttpFuture: " << _request->getMethod() << " " << _request->getURI()
                                    << " via " << _transport->name() << " transport, timeout "
                                    << _request->getTimeout() << "s");

    auto task = [request = _request, transport = _transport, parser = _parser,
                 deadline = _deadline]() -> Response
    {
      ExchangeResult exchanged = transport->exchange(*request, deadline);
      if (!exchanged.result.ok)
      {
        return Response::fromTransport(exchanged.result);
      }
      return Response::fromParsed(parser.parse(exchanged.raw));
    };

    try
    {
      _pending = _pool->enqueueWithResult(std::move(task));
    }
    catch (const std::runtime_error& e)
    {
      VESPER_LOG_WARN("HttpFuture: " << _request->getURI() << " not scheduled: " << e.what());
      _result = Response{ResponseStatus::transport(TransportError::Cancelled, e.what()), {}, {}};
    }
    return *this;
  }

  /// \brief True once resolve() would return without blocking.
  bool isReady() const
  {
    if (_result)
    {
      return true;
    }
    if (!_pending.valid())
    {
      return false;
    }
    return _pending.wait_for(std::chrono::seconds(0)) == std::future_status::ready ||
           MonoClock::now() >= _deadline;
  }

  /// \brief Block until the exchange completes, fails or times out. Starts
  /// the exchange if start() was not called. Never throws for HTTP, parse or
  /// transport conditions; the result is computed once and kept.
  const Response& resolve()
  {
    if (_result)
    {
      return *_result;
    }
    start();
    if (_result)
    {
      return *_result;
    }

    if (_pending.wait_until(_deadline) != std::future_status::ready)
    {
      VESPER_LOG_WARN("HttpFuture: " << _request->getURI() << " timed out after "
                                     << _request->getTimeout() << "s");
      _result = Response{ResponseStatus::timeout(), {}, {}};
      return *_result;
    }

    try
    {
      _result = _pending.get();
    }
    catch (const std::exception& e)
    {
      _result = Response{ResponseStatus::transport(TransportError::Unknown, e.what()), {}, {}};
    }

    const auto& status = _result->status;
    if (status.kind() == ResponseStatus::Kind::Http)
    {
      VESPER_LOG_DEBUG("HttpFuture: " << _request->getURI() << " -> " << status.statusCode()
                                      << ", " << _result->body.size() << " body bytes");
    }
    else
    {
      VESPER_LOG_WARN("HttpFuture: " << _request->getURI() << " failed: " << status.describe());
    }
    return *_result;
  }

  /// \brief resolve(), then throw StatusError if the status is an error.
  Content resolveOrThrow()
  {
    const Response& response = resolve();
    if (response.status.isError())
    {
      throw StatusError(response.status);
    }
    return Content{response.body, response.headers};
  }

private:
  std::shared_ptr<const HttpRequest> _request;
  std::shared_ptr<Transport> _transport;
  core::ThreadPool* _pool;
  parsers::HttpResponseParser _parser;
  bool _started{false};
  MonoTime _deadline{};
  std::future<Response> _pending;
  std::optional<Response> _result;
};

} // namespace network
} // namespace vesper
