// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Vesper, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <chrono>
#include <string>

namespace vesper
{
namespace network
{

using MonoClock = std::chrono::steady_clock;
using MonoTime = std::chrono::time_point<MonoClock>;

/// \brief Longest wait a deadline can express; longer timeouts saturate to it.
constexpr std::chrono::hours MAX_WAIT{24 * 365 * 100};

/// \brief \p now plus \p seconds, saturated at MAX_WAIT.
inline MonoTime deadlineAfter(double seconds, MonoTime now = MonoClock::now())
{
  if (!(seconds > 0.0))
  {
    return now;
  }
  if (seconds >= std::chrono::duration<double>(MAX_WAIT).count())
  {
    return now + MAX_WAIT;
  }
  return now + std::chrono::duration_cast<MonoClock::duration>(
                 std::chrono::duration<double>(seconds));
}

/// \brief Why an exchange never produced a response.
enum class TransportError
{
  None = 0,
  Socket,
  Resolve,
  Connect,
  ConnectionRefused,
  TLSHandshake,
  TLSIO,
  PeerClosed,
  Config,
  Cancelled,
  Timeout,
  ResponseTooLarge,
  Unknown
};

inline const char* toString(TransportError error)
{
  switch (error)
  {
  case TransportError::None:
    return "None";
  case TransportError::Socket:
    return "Socket";
  case TransportError::Resolve:
    return "Resolve";
  case TransportError::Connect:
    return "Connect";
  case TransportError::ConnectionRefused:
    return "ConnectionRefused";
  case TransportError::TLSHandshake:
    return "TLSHandshake";
  case TransportError::TLSIO:
    return "TLSIO";
  case TransportError::PeerClosed:
    return "PeerClosed";
  case TransportError::Config:
    return "Config";
  case TransportError::Cancelled:
    return "Cancelled";
  case TransportError::Timeout:
    return "Timeout";
  case TransportError::ResponseTooLarge:
    return "ResponseTooLarge";
  case TransportError::Unknown:
    return "Unknown";
  }
  return "Unknown";
}

struct IoResult
{
  bool ok{true};
  TransportError code{TransportError::None};
  std::string message;
  int sysErrno{0};
  int tlsError{0};

  static IoResult success() { return {true, TransportError::None, "", 0, 0}; }

  static IoResult failure(TransportError c, const std::string& m, int se = 0, int te = 0)
  {
    return {false, c, m, se, te};
  }
};

/// \brief Outcome of one request/response exchange: the complete raw
/// response bytes when result.ok, otherwise the failure.
struct ExchangeResult
{
  IoResult result;
  std::string raw;

  static ExchangeResult received(std::string bytes)
  {
    return {IoResult::success(), std::move(bytes)};
  }

  static ExchangeResult failed(IoResult failure) { return {std::move(failure), {}}; }
};

} // namespace network
} // namespace vesper
