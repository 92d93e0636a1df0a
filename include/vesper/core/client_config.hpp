// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Vesper, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <cmath>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

#include <vesper/core/config_loader.hpp>
#include <vesper/core/logger.hpp>

namespace vesper
{
namespace core
{

/// \brief Client settings, laid out like the TOML file they are read from.
/// Unset fields fall back to the defaults returned by the accessors.
struct ClientConfig
{
  struct HttpConfig
  {
    std::optional<double> timeout;
    std::optional<std::string> userAgent;
    std::optional<std::int64_t> maxContinuations;
  } http;

  struct TlsConfig
  {
    std::optional<bool> verifyPeer;
    std::optional<std::string> caFile;
  } tls;

  struct RuntimeConfig
  {
    std::optional<std::int64_t> threads;
    std::optional<std::int64_t> queueSize;
  } runtime;

  struct LogConfig
  {
    std::optional<std::string> level;
    std::optional<std::string> file;
    std::optional<bool> async;
    std::optional<std::int64_t> retentionDays;
  } log;

  double timeoutSeconds() const { return http.timeout.value_or(300.0); }
  std::string userAgent() const { return http.userAgent.value_or("Vesper/1.0"); }
  std::size_t maxContinuations() const
  {
    return static_cast<std::size_t>(http.maxContinuations.value_or(8));
  }
  bool verifyPeer() const { return tls.verifyPeer.value_or(true); }
  std::string caFile() const { return tls.caFile.value_or(""); }
  std::size_t threads() const { return static_cast<std::size_t>(runtime.threads.value_or(4)); }
  std::size_t queueSize() const
  {
    return static_cast<std::size_t>(runtime.queueSize.value_or(1024));
  }

  /// \brief Read every known key from an already loaded file.
  /// \throws std::invalid_argument for out-of-range values.
  static ClientConfig fromLoader(const ConfigLoader& loader)
  {
    ClientConfig config;
    config.http.timeout = loader.getDouble("http.timeout");
    config.http.userAgent = loader.getString("http.user_agent");
    config.http.maxContinuations = loader.getInt("http.max_continuations");
    config.tls.verifyPeer = loader.getBool("tls.verify_peer");
    config.tls.caFile = loader.getString("tls.ca_file");
    config.runtime.threads = loader.getInt("runtime.threads");
    config.runtime.queueSize = loader.getInt("runtime.queue_size");
    config.log.level = loader.getString("log.level");
    config.log.file = loader.getString("log.file");
    config.log.async = loader.getBool("log.async");
    config.log.retentionDays = loader.getInt("log.retention_days");
    config.validate();
    return config;
  }

  /// \throws std::runtime_error if the file cannot be read or parsed.
  /// \throws std::invalid_argument for out-of-range values.
  static ClientConfig fromFile(const std::string& path)
  {
    ConfigLoader loader(path);
    loader.load();
    return fromLoader(loader);
  }

  void validate() const
  {
    if (http.timeout && (!(*http.timeout > 0.0) || std::isinf(*http.timeout)))
    {
      throw std::invalid_argument("http.timeout must be positive and finite");
    }
    if (http.maxContinuations && *http.maxContinuations < 0)
    {
      throw std::invalid_argument("http.max_continuations must not be negative");
    }
    if (runtime.threads && *runtime.threads < 1)
    {
      throw std::invalid_argument("runtime.threads must be at least 1");
    }
    if (runtime.queueSize && *runtime.queueSize < 1)
    {
      throw std::invalid_argument("runtime.queue_size must be at least 1");
    }
    if (log.retentionDays && *log.retentionDays < 0)
    {
      throw std::invalid_argument("log.retention_days must not be negative");
    }
  }

  /// \brief Initialize the Logger from the [log] table.
  void applyLogging() const
  {
    Logger::init(Logger::levelFromString(log.level.value_or("info")), log.file.value_or(""),
                 log.async.value_or(false), static_cast<int>(log.retentionDays.value_or(7)));
  }
};

} // namespace core
} // namespace vesper
