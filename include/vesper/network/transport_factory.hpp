// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Vesper, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <algorithm>
#include <cctype>
#include <memory>
#include <string>

#include <vesper/core/client_config.hpp>
#include <vesper/network/plain_transport.hpp>
#include <vesper/network/tls_transport.hpp>

namespace vesper
{
namespace network
{

inline TransportConfig transportConfigFrom(const core::ClientConfig& config)
{
  TransportConfig result;
  result.userAgent = config.userAgent();
  result.tls.verifyPeer = config.verifyPeer();
  result.tls.caFile = config.caFile();
  return result;
}

inline bool isHttpsUri(const std::string& uri)
{
  std::string prefix = uri.substr(0, 8);
  std::transform(prefix.begin(), prefix.end(), prefix.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return prefix == "https://";
}

/// \brief TlsTransport for https:// URIs, PlainTransport for everything
/// else. An unparsable URI gets a PlainTransport, whose exchange reports it
/// as a Config failure.
inline std::shared_ptr<Transport> makeTransportFor(const std::string& uri,
                                                   const TransportConfig& config = {})
{
  if (isHttpsUri(uri))
  {
    return std::make_shared<TlsTransport>(config);
  }
  return std::make_shared<PlainTransport>(config);
}

inline std::shared_ptr<Transport> makeTransportFor(const std::string& uri,
                                                   const core::ClientConfig& config)
{
  return makeTransportFor(uri, transportConfigFrom(config));
}

} // namespace network
} // namespace vesper
