// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Vesper, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <utility>

#include <vesper/core/client_config.hpp>
#include <vesper/core/thread_pool.hpp>
#include <vesper/network/http_future.hpp>
#include <vesper/network/transport_factory.hpp>

namespace vesper
{
namespace network
{

  /// \brief Owns the worker pool and one transport per scheme, and turns
  /// requests into started futures.
  ///
  /// Futures created here reference the client's pool, so the client must
  /// outlive them.
  class HttpClient
  {
  public:
    /// \throws std::invalid_argument for out-of-range settings.
    explicit HttpClient(core::ClientConfig config = {})
      : _config(validated(std::move(config))), _transportConfig(transportConfigFrom(_config)),
        _pool(_config.threads(), _config.queueSize())
    {
    }

    const core::ClientConfig& config() const { return _config; }

    core::ThreadPool& pool() { return _pool; }

    /// \brief A request carrying the configured default timeout.
    HttpRequest newRequest(std::string uri, Payload data = FormFields{}) const
    {
      HttpRequest request(std::move(uri), std::move(data));
      request.setTimeout(_config.timeoutSeconds());
      return request;
    }

    /// \brief Freeze \p request and start its exchange.
    HttpFuture submit(const HttpRequest& request)
    {
      HttpFuture future(request, transportFor(request.getURI()), _pool,
                        _config.maxContinuations());
      future.start();
      return future;
    }

    /// \brief Shorthand for a GET of \p uri.
    HttpFuture get(std::string uri) { return submit(newRequest(std::move(uri))); }

    /// \brief Shorthand for a form POST to \p uri.
    HttpFuture post(std::string uri, Payload data)
    {
      auto request = newRequest(std::move(uri), std::move(data));
      request.setMethod(HttpMethod::POST);
      return submit(request);
    }

    /// \brief Stop accepting work and join the workers. Futures not yet
    /// resolved keep waiting for tasks already queued.
    void shutdown() { _pool.shutdown(); }

  private:
    static core::ClientConfig validated(core::ClientConfig config)
    {
      config.validate();
      return config;
    }

    std::shared_ptr<Transport> transportFor(const std::string& uri)
    {
      std::lock_guard<std::mutex> lock(_mutex);
      auto& slot = isHttpsUri(uri) ? _tls : _plain;
      if (!slot)
      {
        slot = makeTransportFor(uri, _transportConfig);
      }
      return slot;
    }

    core::ClientConfig _config;
    TransportConfig _transportConfig;
    core::ThreadPool _pool;
    std::mutex _mutex;
    std::shared_ptr<Transport> _plain;
    std::shared_ptr<Transport> _tls;
  };

} // namespace network
} // namespace vesper
