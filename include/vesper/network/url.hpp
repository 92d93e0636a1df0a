// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Vesper, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace vesper
{
namespace network
{

  /// \brief Components of an http:// or https:// URL.
  struct ParsedUrl
  {
    std::string scheme; // http, https
    std::string host;
    std::uint16_t port{0}; // 0 means use default for scheme
    std::string path;
    std::string query;

    bool isHttps() const { return scheme == "https"; }
    std::uint16_t getDefaultPort() const { return isHttps() ? 443 : 80; }
    std::uint16_t getEffectivePort() const { return port == 0 ? getDefaultPort() : port; }

    std::string getPathWithQuery() const
    {
      std::string result = path.empty() ? "/" : path;
      if (!query.empty())
      {
        result += "?" + query;
      }
      return result;
    }

    /// \brief Value for the Host header; the port is included only when it
    /// differs from the scheme default.
    std::string getHostHeader() const
    {
      std::string name = host.find(':') == std::string::npos ? host : "[" + host + "]";
      if (port == 0 || port == getDefaultPort())
      {
        return name;
      }
      return name + ":" + std::to_string(port);
    }
  };

  /// \brief Parse \p url. Fragments are dropped.
  /// \throws std::invalid_argument on a missing or unsupported scheme, an
  /// empty host or a bad port.
  inline ParsedUrl parseUrl(const std::string& url)
  {
    ParsedUrl result;

    auto schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos)
    {
      throw std::invalid_argument("URL missing scheme (http:// or https://): " + url);
    }
    result.scheme = url.substr(0, schemeEnd);
    std::transform(result.scheme.begin(), result.scheme.end(), result.scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (result.scheme != "http" && result.scheme != "https")
    {
      throw std::invalid_argument("Unsupported URL scheme: " + result.scheme);
    }

    std::string remaining = url.substr(schemeEnd + 3);

    auto fragmentPos = remaining.find('#');
    if (fragmentPos != std::string::npos)
    {
      remaining.erase(fragmentPos);
    }

    std::string hostPart;
    auto pathStart = remaining.find_first_of("/?");
    if (pathStart != std::string::npos)
    {
      hostPart = remaining.substr(0, pathStart);
      std::string pathPart = remaining.substr(pathStart);
      auto queryStart = pathPart.find('?');
      if (queryStart != std::string::npos)
      {
        result.path = pathPart.substr(0, queryStart);
        result.query = pathPart.substr(queryStart + 1);
      }
      else
      {
        result.path = pathPart;
      }
    }
    else
    {
      hostPart = remaining;
    }
    if (result.path.empty())
    {
      result.path = "/";
    }

    // Userinfo is not supported; strip it so it never reaches the Host header
    auto at = hostPart.rfind('@');
    if (at != std::string::npos)
    {
      hostPart.erase(0, at + 1);
    }

    bool hasPort = false;
    std::string portStr;
    if (!hostPart.empty() && hostPart.front() == '[')
    {
      auto close = hostPart.find(']');
      if (close == std::string::npos)
      {
        throw std::invalid_argument("Unterminated IPv6 literal in URL: " + url);
      }
      result.host = hostPart.substr(1, close - 1);
      if (close + 1 < hostPart.size())
      {
        if (hostPart[close + 1] != ':')
        {
          throw std::invalid_argument("Invalid host in URL: " + url);
        }
        hasPort = true;
        portStr = hostPart.substr(close + 2);
      }
    }
    else
    {
      auto portPos = hostPart.find(':');
      result.host = hostPart.substr(0, portPos);
      if (portPos != std::string::npos)
      {
        hasPort = true;
        portStr = hostPart.substr(portPos + 1);
      }
    }

    if (hasPort)
    {
      if (portStr.empty() || portStr.size() > 5 ||
          !std::all_of(portStr.begin(), portStr.end(),
                       [](unsigned char c) { return std::isdigit(c) != 0; }))
      {
        throw std::invalid_argument("Invalid port in URL: " + url);
      }
      unsigned long port = std::stoul(portStr);
      if (port == 0 || port > 65535)
      {
        throw std::invalid_argument("Port out of range in URL: " + url);
      }
      result.port = static_cast<std::uint16_t>(port);
    }

    if (result.host.empty())
    {
      throw std::invalid_argument("URL has no host: " + url);
    }

    return result;
  }

} // namespace network
} // namespace vesper
