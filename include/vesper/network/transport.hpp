// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Vesper, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once
#ifndef __linux__
#error "Linux-only (poll/SOCK_NONBLOCK)"
#endif

/// \file transport.hpp
/// \brief The capability an HttpFuture consumes: send one request, hand back
/// the complete raw response or the reason there is none.
/// \details
///   Implementations are blocking and bounded by the deadline passed in;
///   they report every failure through IoResult and never throw out of
///   exchange(). Common socket plumbing for the TCP based implementations
///   lives in detail::.

#include <cerrno>
#include <cstring>
#include <string>
#include <utility>

#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <vesper/core/logger.hpp>
#include <vesper/network/http_request.hpp>
#include <vesper/network/transport_types.hpp>
#include <vesper/network/url.hpp>

namespace vesper
{
namespace network
{

/// \brief Settings shared by the socket transports.
struct TransportConfig
{
  std::string userAgent{"Vesper/1.0"};
  std::size_t ioReadChunk{64 * 1024};
  std::size_t maxResponseSize{64 * 1024 * 1024};

  struct Tls
  {
    bool verifyPeer{true};
    std::string caFile;
    std::string ciphers;
  } tls;
};

/// \brief Performs one request/response exchange.
class Transport
{
public:
  virtual ~Transport() = default;

  /// \brief Send \p request and read the full response.
  /// \param deadline The exchange fails with TransportError::Timeout once
  /// this point passes.
  virtual ExchangeResult exchange(const HttpRequest& request, MonoTime deadline) = 0;

  /// \brief Short name used in log lines.
  virtual const char* name() const = 0;
};

/// \brief Serialize \p request for the wire.
/// \details HTTP/1.0 framing with "Connection: close", so the response ends
/// when the server closes the connection and is never chunked. Host,
/// User-Agent, Content-Type (form payloads) and Content-Length are added
/// unless the caller supplied them.
inline std::string buildRequestBytes(const HttpRequest& request, const ParsedUrl& url,
                                     const std::string& userAgent)
{
  auto has = [&request](const char* name) { return !request.getHeaders(std::string(name)).empty(); };

  std::string body = request.encodedBody();
  std::string out;
  out.reserve(256 + body.size());

  out += request.getMethod();
  out += ' ';
  out += url.getPathWithQuery();
  out += " HTTP/1.0\r\n";

  if (!has("Host"))
  {
    out += "Host: " + url.getHostHeader() + "\r\n";
  }
  if (!has("User-Agent") && !userAgent.empty())
  {
    out += "User-Agent: " + userAgent + "\r\n";
  }
  if (request.hasFormData() && !body.empty() && !has("Content-Type"))
  {
    out += "Content-Type: application/x-www-form-urlencoded\r\n";
  }
  if ((request.method() != HttpMethod::GET || !body.empty()) && !has("Content-Length"))
  {
    out += "Content-Length: " + std::to_string(body.size()) + "\r\n";
  }
  for (const auto& [name, value] : request.getHeaders())
  {
    out += name + ": " + value + "\r\n";
  }
  if (!has("Connection"))
  {
    out += "Connection: close\r\n";
  }
  out += "\r\n";
  out += body;
  return out;
}

namespace detail
{

inline std::string errnoText(int err) { return std::strerror(err); }

/// \brief Owns a socket descriptor.
class Socket
{
public:
  Socket() = default;
  explicit Socket(int fd) : _fd(fd) {}
  ~Socket() { reset(); }

  Socket(const Socket&) = delete;
  Socket& operator=(const Socket&) = delete;
  Socket(Socket&& other) noexcept : _fd(std::exchange(other._fd, -1)) {}
  Socket& operator=(Socket&& other) noexcept
  {
    if (this != &other)
    {
      reset();
      _fd = std::exchange(other._fd, -1);
    }
    return *this;
  }

  int fd() const { return _fd; }
  bool valid() const { return _fd >= 0; }

  void reset()
  {
    if (_fd >= 0)
    {
      ::close(_fd);
      _fd = -1;
    }
  }

private:
  int _fd{-1};
};

/// \brief Block until \p fd is ready for \p events or \p deadline passes.
inline IoResult waitFor(int fd, short events, MonoTime deadline)
{
  while (true)
  {
    auto remaining =
      std::chrono::duration_cast<std::chrono::milliseconds>(deadline - MonoClock::now());
    if (remaining.count() <= 0)
    {
      return IoResult::failure(TransportError::Timeout, "Request timed out");
    }

    pollfd pfd{};
    pfd.fd = fd;
    pfd.events = events;
    int timeoutMs = remaining.count() > 60000 ? 60000 : static_cast<int>(remaining.count());
    int rc = ::poll(&pfd, 1, timeoutMs);
    if (rc > 0)
    {
      return IoResult::success();
    }
    if (rc < 0 && errno != EINTR)
    {
      return IoResult::failure(TransportError::Socket, "poll: " + errnoText(errno), errno);
    }
  }
}

/// \brief Resolve and connect to \p url's host, trying every address until
/// one accepts.
inline IoResult connectTcp(const ParsedUrl& url, MonoTime deadline, Socket& out)
{
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo* results = nullptr;
  std::string port = std::to_string(url.getEffectivePort());

  // getaddrinfo cannot be bounded by the deadline; a slow resolver delays
  // the exchange, the future's own timeout still applies.
  int rc = ::getaddrinfo(url.host.c_str(), port.c_str(), &hints, &results);
  if (rc != 0)
  {
    return IoResult::failure(TransportError::Resolve,
                             "Cannot resolve " + url.host + ": " + ::gai_strerror(rc));
  }

  IoResult last = IoResult::failure(TransportError::Connect, "No usable address for " + url.host);
  for (addrinfo* ai = results; ai != nullptr; ai = ai->ai_next)
  {
    Socket sock(::socket(ai->ai_family, ai->ai_socktype | SOCK_NONBLOCK | SOCK_CLOEXEC,
                         ai->ai_protocol));
    if (!sock.valid())
    {
      last = IoResult::failure(TransportError::Socket, "socket: " + errnoText(errno), errno);
      continue;
    }

    if (::connect(sock.fd(), ai->ai_addr, ai->ai_addrlen) != 0)
    {
      if (errno != EINPROGRESS)
      {
        int err = errno;
        last = IoResult::failure(err == ECONNREFUSED ? TransportError::ConnectionRefused
                                                     : TransportError::Connect,
                                 "connect: " + errnoText(err), err);
        continue;
      }

      auto ready = waitFor(sock.fd(), POLLOUT, deadline);
      if (!ready.ok)
      {
        last = ready;
        if (ready.code == TransportError::Timeout)
        {
          break;
        }
        continue;
      }

      int soError = 0;
      socklen_t len = sizeof(soError);
      ::getsockopt(sock.fd(), SOL_SOCKET, SO_ERROR, &soError, &len);
      if (soError != 0)
      {
        last = IoResult::failure(soError == ECONNREFUSED ? TransportError::ConnectionRefused
                                                         : TransportError::Connect,
                                 "connect: " + errnoText(soError), soError);
        continue;
      }
    }

    int one = 1;
    ::setsockopt(sock.fd(), IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
    out = std::move(sock);
    ::freeaddrinfo(results);
    return IoResult::success();
  }

  ::freeaddrinfo(results);
  return last;
}

} // namespace detail

} // namespace network
} // namespace vesper
