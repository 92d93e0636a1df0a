// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Vesper, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

/// \file tls_transport.hpp
/// \brief https:// transport over OpenSSL.
/// \details
///   One SSL_CTX per transport, shared by every exchange it performs; one SSL
///   session per exchange. Sockets stay non-blocking and every WANT_READ or
///   WANT_WRITE is turned into a poll() bounded by the exchange deadline.

#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/x509_vfy.h>

#include <vesper/network/transport.hpp>

namespace vesper
{
namespace network
{

class TlsTransport : public Transport
{
public:
  explicit TlsTransport(TransportConfig config = {}) : _config(std::move(config))
  {
    initSslGlobal();
    initContext();
  }

  TlsTransport(const TlsTransport&) = delete;
  TlsTransport& operator=(const TlsTransport&) = delete;

  const char* name() const override { return "tls"; }

  /// \brief Failure recorded while building the TLS context, if any. Every
  /// exchange reports it until the transport is rebuilt.
  const IoResult& lastFatal() const { return _lastFatal; }

  ExchangeResult exchange(const HttpRequest& request, MonoTime deadline) override
  {
    if (!_ctx)
    {
      return ExchangeResult::failed(_lastFatal);
    }

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
      VESPER_LOG_DEBUG("TlsTransport: connect to " << url.host << ":" << url.getEffectivePort()
                                                   << " failed: " << connected.message);
      return ExchangeResult::failed(connected);
    }

    SslPtr ssl(::SSL_new(_ctx.get()), &::SSL_free);
    if (!ssl)
    {
      return ExchangeResult::failed(
        IoResult::failure(TransportError::TLSHandshake, "SSL_new(client) failed"));
    }
    ::SSL_set_fd(ssl.get(), sock.fd());
    ::SSL_set_connect_state(ssl.get());
    ::SSL_set_tlsext_host_name(ssl.get(), url.host.c_str());
    if (_config.tls.verifyPeer)
    {
      ::SSL_set1_host(ssl.get(), url.host.c_str());
    }

    auto handshake = doHandshake(ssl.get(), sock.fd(), deadline);
    if (!handshake.ok)
    {
      VESPER_LOG_WARN("TlsTransport: handshake with " << url.host << " failed: "
                                                      << handshake.message);
      return ExchangeResult::failed(handshake);
    }

    std::string wire = buildRequestBytes(request, url, _config.userAgent);
    auto sent = writeAll(ssl.get(), sock.fd(), wire, deadline);
    if (!sent.ok)
    {
      return ExchangeResult::failed(sent);
    }

    std::string raw;
    auto received = readAll(ssl.get(), sock.fd(), raw, deadline);
    if (!received.ok)
    {
      return ExchangeResult::failed(received);
    }

    ::SSL_shutdown(ssl.get());
    return ExchangeResult::received(std::move(raw));
  }

private:
  using SslPtr = std::unique_ptr<SSL, decltype(&::SSL_free)>;
  using SslCtxPtr = std::unique_ptr<SSL_CTX, decltype(&::SSL_CTX_free)>;

  TransportConfig _config;
  SslCtxPtr _ctx{nullptr, &::SSL_CTX_free};
  IoResult _lastFatal;

  static void initSslGlobal()
  {
    static std::once_flag flag;
    std::call_once(flag, [] {
      OPENSSL_init_ssl(OPENSSL_INIT_LOAD_SSL_STRINGS | OPENSSL_INIT_LOAD_CRYPTO_STRINGS, nullptr);
    });
  }

  static std::string lastSslError(const char* fallback)
  {
    unsigned long e = ::ERR_get_error();
    if (e == 0)
    {
      return fallback;
    }
    char msg[256];
    ::ERR_error_string_n(e, msg, sizeof(msg));
    return msg;
  }

  void initContext()
  {
    SslCtxPtr ctx(::SSL_CTX_new(TLS_client_method()), &::SSL_CTX_free);
    if (!ctx)
    {
      _lastFatal = IoResult::failure(TransportError::Config, "SSL_CTX_new(client) failed");
      VESPER_LOG_ERROR("TlsTransport: " << _lastFatal.message);
      return;
    }
    if (!_config.tls.ciphers.empty() &&
        ::SSL_CTX_set_cipher_list(ctx.get(), _config.tls.ciphers.c_str()) != 1)
    {
      _lastFatal = IoResult::failure(TransportError::Config,
                                     "Invalid cipher list: " + _config.tls.ciphers);
      VESPER_LOG_ERROR("TlsTransport: " << _lastFatal.message);
      return;
    }
    if (_config.tls.verifyPeer)
    {
      ::SSL_CTX_set_verify(ctx.get(), SSL_VERIFY_PEER, nullptr);
      if (!_config.tls.caFile.empty())
      {
        if (::SSL_CTX_load_verify_locations(ctx.get(), _config.tls.caFile.c_str(), nullptr) != 1)
        {
          _lastFatal = IoResult::failure(TransportError::Config,
                                         "Cannot load CA file " + _config.tls.caFile);
          VESPER_LOG_ERROR("TlsTransport: " << _lastFatal.message);
          return;
        }
      }
      else
      {
        ::SSL_CTX_set_default_verify_paths(ctx.get());
      }
    }
    else
    {
      ::SSL_CTX_set_verify(ctx.get(), SSL_VERIFY_NONE, nullptr);
    }
    _ctx = std::move(ctx);
  }

  /// Turn an SSL_get_error code into a wait, or a failure.
  IoResult waitForSsl(SSL* ssl, int rc, int fd, MonoTime deadline, TransportError failCode,
                      const char* what) const
  {
    int errc = ::SSL_get_error(ssl, rc);
    if (errc == SSL_ERROR_WANT_READ)
    {
      return detail::waitFor(fd, POLLIN, deadline);
    }
    if (errc == SSL_ERROR_WANT_WRITE)
    {
      return detail::waitFor(fd, POLLOUT, deadline);
    }
    std::string msg = lastSslError(what);
    if (failCode == TransportError::TLSHandshake)
    {
      long verify = ::SSL_get_verify_result(ssl);
      if (verify != X509_V_OK)
      {
        msg += std::string(" (certificate: ") + ::X509_verify_cert_error_string(verify) + ")";
      }
    }
    return IoResult::failure(failCode, msg, 0, errc);
  }

  IoResult doHandshake(SSL* ssl, int fd, MonoTime deadline) const
  {
    while (true)
    {
      ::ERR_clear_error();
      int rc = ::SSL_connect(ssl);
      if (rc == 1)
      {
        return IoResult::success();
      }
      auto waited =
        waitForSsl(ssl, rc, fd, deadline, TransportError::TLSHandshake, "TLS handshake failed");
      if (!waited.ok)
      {
        return waited;
      }
    }
  }

  IoResult writeAll(SSL* ssl, int fd, const std::string& data, MonoTime deadline) const
  {
    std::size_t offset = 0;
    while (offset < data.size())
    {
      ::ERR_clear_error();
      int n = ::SSL_write(ssl, data.data() + offset, static_cast<int>(data.size() - offset));
      if (n > 0)
      {
        offset += static_cast<std::size_t>(n);
        continue;
      }
      auto waited = waitForSsl(ssl, n, fd, deadline, TransportError::TLSIO, "SSL_write failed");
      if (!waited.ok)
      {
        return waited;
      }
    }
    return IoResult::success();
  }

  IoResult readAll(SSL* ssl, int fd, std::string& out, MonoTime deadline) const
  {
    std::vector<char> buffer(_config.ioReadChunk);
    while (true)
    {
      ::ERR_clear_error();
      int n = ::SSL_read(ssl, buffer.data(), static_cast<int>(buffer.size()));
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

      int errc = ::SSL_get_error(ssl, n);
      if (errc == SSL_ERROR_ZERO_RETURN)
      {
        break;
      }
      // Many servers close the TCP connection without close_notify
      if (errc == SSL_ERROR_SYSCALL && ::ERR_peek_error() == 0 && !out.empty())
      {
        break;
      }
      auto waited = waitForSsl(ssl, n, fd, deadline, TransportError::TLSIO, "SSL_read failed");
      if (!waited.ok)
      {
        return waited;
      }
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
