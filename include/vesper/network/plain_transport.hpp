// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Vesper, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <cerrno>
#include <stdexcept>
#include <string>
#include <vector>

#include <vesper/network/transport.hpp>

namespace vesper
{
namespace network
{

/// \brief Plaintext TCP transport for http:// URLs.
class PlainTransport : public Transport
{
public:
  explicit PlainTransport(TransportConfig config = {}) : _config(std::move(config)) {}

  const char* name() const override { return "plain"; }

  ExchangeResult exchange(const HttpRequest& request, MonoTime deadline) override
  {
    ParsedUrl url;
    try
    {
      url = parseUrl(request.getURI());
    }
    catch (const std::invalid_argument& e)
    {
      return ExchangeResult::failed(IoResult::failure(TransportError::Config, e.what()));
    }

    detail::Socket sock;
    auto connected = detail::connectTcp(url, deadline, sock);
    if (!connected.ok)
    {
      VESPER_LOG_DEBUG("PlainTransport: connect to " << url.host << ":" << url.getEffectivePort()
                                                     << " failed: " << connected.message);
      return ExchangeResult::failed(connected);
    }

    std::string wire = buildRequestBytes(request, url, _config.userAgent);
    auto sent = sendAll(sock.fd(), wire, deadline);
    if (!sent.ok)
    {
      return ExchangeResult::failed(sent);
    }

    std::string raw;
    auto received = receiveAll(sock.fd(), raw, deadline);
    if (!received.ok)
    {
      return ExchangeResult::failed(received);
    }
    return ExchangeResult::received(std::move(raw));
  }

private:
  TransportConfig _config;

  IoResult sendAll(int fd, const std::string& data, MonoTime deadline) const
  {
    std::size_t offset = 0;
    while (offset < data.size())
    {
      ssize_t n = ::send(fd, data.data() + offset, data.size() - offset, MSG_NOSIGNAL);
      if (n >= 0)
      {
        offset += static_cast<std::size_t>(n);
        continue;
      }
      if (errno == EINTR)
      {
        continue;
      }
      if (errno == EAGAIN || errno == EWOULDBLOCK)
      {
        auto ready = detail::waitFor(fd, POLLOUT, deadline);
        if (!ready.ok)
        {
          return ready;
        }
        continue;
      }
      int err = errno;
      return IoResult::failure(err == EPIPE || err == ECONNRESET ? TransportError::PeerClosed
                                                                 : TransportError::Socket,
                               "send: " + detail::errnoText(err), err);
    }
    return IoResult::success();
  }

  /// Read until the peer closes the connection.
  IoResult receiveAll(int fd, std::string& out, MonoTime deadline) const
  {
    std::vector<char> buffer(_config.ioReadChunk);
    while (true)
    {
      ssize_t n = ::recv(fd, buffer.data(), buffer.size(), 0);
      if (n > 0)
      {
        out.append(buffer.data(), static_cast<std::size_t>(n));
        if (out.size() > _config.maxResponseSize)
        {
          return IoResult::failure(TransportError::ResponseTooLarge,
                                   "Response exceeds " + std::to_string(_config.maxResponseSize) +
                                     " bytes");
        }
        continue;
      }
      if (n == 0)
      {
        break;
      }
      if (errno == EINTR)
      {
        continue;
      }
      if (errno == EAGAIN || errno == EWOULDBLOCK)
      {
        auto ready = detail::waitFor(fd, POLLIN, deadline);
        if (!ready.ok)
        {
          return ready;
        }
        continue;
      }
      int err = errno;
      if (err == ECONNRESET && !out.empty())
      {
        // Some servers reset instead of closing once the response is out
        break;
      }
      return IoResult::failure(err == ECONNRESET ? TransportError::PeerClosed
                                                 : TransportError::Socket,
                               "recv: " + detail::errnoText(err), err);
    }

    if (out.empty())
    {
      return IoResult::failure(TransportError::PeerClosed,
                               "Connection closed before any response was received");
    }
    return IoResult::success();
  }
};

} // namespace network
} // namespace vesper
