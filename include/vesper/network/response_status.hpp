// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Vesper, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

#include <vesper/network/transport_types.hpp>
#include <vesper/parsers/http_headers.hpp>
#include <vesper/parsers/http_response_parser.hpp>

namespace vesper
{
namespace network
{

  /// \brief Standard reason phrase for \p code, or an empty string.
  inline const char* reasonPhrase(int code)
  {
    switch (code)
    {
    case 100:
      return "Continue";
    case 200:
      return "OK";
    case 201:
      return "Created";
    case 202:
      return "Accepted";
    case 204:
      return "No Content";
    case 206:
      return "Partial Content";
    case 301:
      return "Moved Permanently";
    case 302:
      return "Found";
    case 303:
      return "See Other";
    case 304:
      return "Not Modified";
    case 307:
      return "Temporary Redirect";
    case 308:
      return "Permanent Redirect";
    case 400:
      return "Bad Request";
    case 401:
      return "Unauthorized";
    case 403:
      return "Forbidden";
    case 404:
      return "Not Found";
    case 405:
      return "Method Not Allowed";
    case 408:
      return "Request Timeout";
    case 409:
      return "Conflict";
    case 413:
      return "Payload Too Large";
    case 429:
      return "Too Many Requests";
    case 500:
      return "Internal Server Error";
    case 501:
      return "Not Implemented";
    case 502:
      return "Bad Gateway";
    case 503:
      return "Service Unavailable";
    case 504:
      return "Gateway Timeout";
    default:
      return "";
    }
  }

  /// \brief The exchange produced an HTTP status code.
  struct HttpStatus
  {
    int code{0};
  };

  enum class ParseError
  {
    MalformedResponse = 1
  };

  /// \brief The response bytes could not be framed.
  struct ParseStatus
  {
    ParseError error{ParseError::MalformedResponse};
    std::string rawResponse;
  };

  /// \brief The exchange never completed.
  struct TransportStatus
  {
    TransportError error{TransportError::Unknown};
    std::string message;
  };

  /// \brief Tagged outcome of one request: HTTP code, parse failure or
  /// transport failure.
  class ResponseStatus
  {
  public:
    enum class Kind
    {
      Http,
      Parse,
      Transport
    };

    static ResponseStatus http(int code) { return ResponseStatus(HttpStatus{code}); }

    static ResponseStatus malformed(std::string rawResponse)
    {
      return ResponseStatus(ParseStatus{ParseError::MalformedResponse, std::move(rawResponse)});
    }

    static ResponseStatus transport(TransportError error, std::string message = {})
    {
      return ResponseStatus(TransportStatus{error, std::move(message)});
    }

    static ResponseStatus timeout(std::string message = "Request timed out")
    {
      return transport(TransportError::Timeout, std::move(message));
    }

    Kind kind() const { return static_cast<Kind>(_detail.index()); }

    /// \brief "HTTP", "Parse" or "Transport".
    const char* errorType() const
    {
      switch (kind())
      {
      case Kind::Http:
        return "HTTP";
      case Kind::Parse:
        return "Parse";
      case Kind::Transport:
        return "Transport";
      }
      return "Unknown";
    }

    /// \brief HTTP codes outside 2xx, every parse failure and every transport
    /// failure are errors.
    bool isError() const
    {
      if (const auto* status = std::get_if<HttpStatus>(&_detail))
      {
        return status->code < 200 || status->code > 299;
      }
      return true;
    }

    bool isTimeout() const
    {
      const auto* status = std::get_if<TransportStatus>(&_detail);
      return status && status->error == TransportError::Timeout;
    }

    /// \brief The HTTP code, or 0 for parse and transport statuses.
    int statusCode() const
    {
      const auto* status = std::get_if<HttpStatus>(&_detail);
      return status ? status->code : 0;
    }

    const HttpStatus* asHttp() const { return std::get_if<HttpStatus>(&_detail); }
    const ParseStatus* asParse() const { return std::get_if<ParseStatus>(&_detail); }
    const TransportStatus* asTransport() const { return std::get_if<TransportStatus>(&_detail); }

    /// \brief Human-readable summary such as "[HTTP/404] Not Found".
    std::string describe() const
    {
      std::string text = std::string("[") + errorType() + "/";
      if (const auto* status = asHttp())
      {
        text += std::to_string(status->code) + "]";
        std::string reason = reasonPhrase(status->code);
        return reason.empty() ? text : text + " " + reason;
      }
      if (const auto* status = asParse())
      {
        return text + std::to_string(static_cast<int>(status->error)) +
               "] Malformed HTTP response (" + std::to_string(status->rawResponse.size()) +
               " bytes)";
      }
      const auto* status = asTransport();
      text += std::string(toString(status->error)) + "]";
      return status->message.empty() ? text : text + " " + status->message;
    }

  private:
    using Detail = std::variant<HttpStatus, ParseStatus, TransportStatus>;

    explicit ResponseStatus(Detail detail) : _detail(std::move(detail)) {}

    Detail _detail;
  };

  /// \brief Uniform resolution result, whatever the outcome.
  struct Response
  {
    ResponseStatus status;
    std::string body;
    parsers::HeaderList headers;

    static Response fromParsed(parsers::ParsedResponse parsed)
    {
      if (auto* result = std::get_if<parsers::HttpResult>(&parsed))
      {
        return Response{ResponseStatus::http(result->statusCode), std::move(result->body),
                        std::move(result->headers)};
      }
      auto& malformed = std::get<parsers::MalformedResult>(parsed);
      return Response{ResponseStatus::malformed(std::move(malformed.rawResponse)), {}, {}};
    }

    static Response fromTransport(const IoResult& failure)
    {
      return Response{ResponseStatus::transport(failure.code, failure.message), {}, {}};
    }
  };

  /// \brief Body and headers of a successful resolution.
  struct Content
  {
    std::string body;
    parsers::HeaderList headers;
  };

  /// \brief Thrown by HttpFuture::resolveOrThrow() for error statuses.
  class StatusError : public std::runtime_error
  {
  public:
    explicit StatusError(ResponseStatus status)
      : std::runtime_error(status.describe()), _status(std::move(status))
    {
    }

    const ResponseStatus& status() const { return _status; }

  private:
    ResponseStatus _status;
  };

} // namespace network
} // namespace vesper
