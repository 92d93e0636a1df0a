// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Vesper, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <cctype>
#include <cmath>
#include <cstdio>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <vesper/parsers/http_headers.hpp>

namespace vesper
{
namespace network
{

  /// \brief Raised by request setters for values that can never be sent.
  class ConfigurationError : public std::invalid_argument
  {
  public:
    using std::invalid_argument::invalid_argument;
  };

  /// \brief Methods a request may use.
  enum class HttpMethod
  {
    GET,
    POST,
    PUT
  };

  inline const char* toString(HttpMethod method)
  {
    switch (method)
    {
    case HttpMethod::GET:
      return "GET";
    case HttpMethod::POST:
      return "POST";
    case HttpMethod::PUT:
      return "PUT";
    }
    return "GET";
  }

  /// \brief Exact, case-sensitive method lookup.
  /// \throws ConfigurationError for anything but GET, POST or PUT.
  inline HttpMethod parseMethod(const std::string& method)
  {
    if (method == "GET")
    {
      return HttpMethod::GET;
    }
    if (method == "POST")
    {
      return HttpMethod::POST;
    }
    if (method == "PUT")
    {
      return HttpMethod::PUT;
    }
    throw ConfigurationError("The HTTP method '" + method +
                             "' is not supported. Supported HTTP methods are: GET, POST, PUT.");
  }

  /// \brief Ordered multi-map of form fields; keys may repeat.
  using FormFields = std::vector<std::pair<std::string, std::string>>;

  /// \brief Raw body bytes, or fields sent as
  /// application/x-www-form-urlencoded.
  using Payload = std::variant<std::string, FormFields>;

  /// \brief Request headers in the order they were added.
  using RequestHeaders = std::vector<std::pair<std::string, std::string>>;

  /// \brief Percent-encode for form bodies: unreserved characters pass,
  /// space becomes '+', everything else is %XX.
  inline std::string formEncode(const std::string& text)
  {
    std::string out;
    out.reserve(text.size());
    for (unsigned char c : text)
    {
      if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~')
      {
        out += static_cast<char>(c);
      }
      else if (c == ' ')
      {
        out += '+';
      }
      else
      {
        char buf[4];
        std::snprintf(buf, sizeof(buf), "%%%02X", c);
        out += buf;
      }
    }
    return out;
  }

  inline std::string formEncode(const FormFields& fields)
  {
    std::string out;
    for (const auto& [key, value] : fields)
    {
      if (!out.empty())
      {
        out += '&';
      }
      out += formEncode(key);
      out += '=';
      out += formEncode(value);
    }
    return out;
  }

  /// \brief Everything needed to issue one HTTP request.
  ///
  /// A request is configured through its setters and then handed to an
  /// HttpFuture, which keeps its own immutable copy; later changes to this
  /// object do not affect a request already submitted.
  class HttpRequest
  {
  public:
    static constexpr double DEFAULT_TIMEOUT_SECONDS = 300.0;

    /// \param uri Fully-qualified URI.
    /// \param data Raw string sent as-is, or form fields to encode.
    explicit HttpRequest(std::string uri, Payload data = FormFields{})
    {
      setURI(std::move(uri));
      setData(std::move(data));
    }

    /// \brief Seconds the future waits before resolving as a timeout.
    HttpRequest& setTimeout(double seconds)
    {
      if (!(seconds > 0.0) || std::isinf(seconds))
      {
        throw ConfigurationError("Timeout must be a positive, finite number of seconds.");
      }
      _timeout = seconds;
      return *this;
    }

    double getTimeout() const { return _timeout; }

    /// \brief Select "GET", "POST" or "PUT"; anything else throws.
    HttpRequest& setMethod(const std::string& method)
    {
      _method = parseMethod(method);
      return *this;
    }

    HttpRequest& setMethod(HttpMethod method)
    {
      _method = method;
      return *this;
    }

    std::string getMethod() const { return toString(_method); }

    HttpMethod method() const { return _method; }

    HttpRequest& setURI(std::string uri)
    {
      if (uri.empty())
      {
        throw ConfigurationError("Request URI must not be empty.");
      }
      rejectLineBreaks(uri, "Request URI");
      _uri = std::move(uri);
      return *this;
    }

    const std::string& getURI() const { return _uri; }

    HttpRequest& setData(Payload data)
    {
      if (data.valueless_by_exception())
      {
        throw ConfigurationError("Data parameter must be a string or a list of form fields.");
      }
      _data = std::move(data);
      return *this;
    }

    const Payload& getData() const { return _data; }

    bool hasFormData() const { return std::holds_alternative<FormFields>(_data); }

    /// \brief Body bytes as they go on the wire.
    std::string encodedBody() const
    {
      if (const auto* raw = std::get_if<std::string>(&_data))
      {
        return *raw;
      }
      return formEncode(std::get<FormFields>(_data));
    }

    /// \brief Append a header. Repeated names are sent repeatedly.
    /// \throws ConfigurationError if either part contains CR, LF or NUL.
    HttpRequest& addHeader(std::string name, std::string value)
    {
      rejectLineBreaks(name, "Header name");
      rejectLineBreaks(value, "Header value");
      _headers.emplace_back(std::move(name), std::move(value));
      return *this;
    }

    /// \brief All headers, or only those whose name matches \p filter
    /// case-insensitively.
    RequestHeaders getHeaders(const std::optional<std::string>& filter = std::nullopt) const
    {
      if (!filter || filter->empty())
      {
        return _headers;
      }
      RequestHeaders result;
      for (const auto& header : _headers)
      {
        if (parsers::iequals(header.first, *filter))
        {
          result.push_back(header);
        }
      }
      return result;
    }

  private:
    static void rejectLineBreaks(const std::string& text, const char* what)
    {
      if (text.find_first_of(std::string("\r\n\0", 3)) != std::string::npos)
      {
        throw ConfigurationError(std::string(what) + " must not contain CR, LF or NUL.");
      }
    }

    std::string _uri;
    HttpMethod _method{HttpMethod::GET};
    Payload _data;
    RequestHeaders _headers;
    double _timeout{DEFAULT_TIMEOUT_SECONDS};
  };

} // namespace network
} // namespace vesper
