// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Vesper, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <vesper/core/logger.hpp>
#include <vesper/parsers/minimal_toml.hpp>

namespace vesper
{
namespace core
{
/// \brief Loads a TOML configuration file and exposes typed, dotted-key
/// lookups.
class ConfigLoader
{
public:
  /// \brief Remembers \p filename; call load() or reload() to read it.
  explicit ConfigLoader(std::string filename) : _filename(std::move(filename)) {}

  /// \brief Re-reads the file. On failure the table is cleared and the
  /// error is logged.
  bool reload()
  {
    try
    {
      _table = parsers::toml::parse_file(_filename);
      _loaded = true;
      return true;
    }
    catch (const std::runtime_error& e)
    {
      VESPER_LOG_WARN("ConfigLoader: " << e.what());
      _table = parsers::toml::table{};
      _loaded = false;
      return false;
    }
  }

  /// \brief Loads the file on first use.
  /// \throws std::runtime_error if the file cannot be read or parsed.
  const parsers::toml::table& load()
  {
    if (!_loaded && !reload())
    {
      throw std::runtime_error("Failed to load configuration file: " + _filename);
    }
    return _table;
  }

  bool isLoaded() const { return _loaded; }

  const std::string& filename() const { return _filename; }

  const parsers::toml::table& table() const { return _table; }

  /// \brief Gets a typed value.
  /// \tparam T int64_t, double, bool or std::string.
  template <typename T> std::optional<T> get(const std::string& dottedKey) const
  {
    auto node = _table.at_path(dottedKey);
    if (node.is_value())
    {
      return node.as<T>();
    }
    return std::nullopt;
  }

  std::optional<int64_t> getInt(const std::string& key) const { return get<int64_t>(key); }

  std::optional<double> getDouble(const std::string& key) const { return get<double>(key); }

  std::optional<bool> getBool(const std::string& key) const { return get<bool>(key); }

  std::optional<std::string> getString(const std::string& key) const
  {
    return get<std::string>(key);
  }

  /// \brief Gets an array of strings.
  /// \return std::nullopt if the key is missing or not an array.
  /// \throws std::runtime_error if any element is not a string.
  std::optional<std::vector<std::string>> getStringArray(const std::string& key) const
  {
    auto node = _table.at_path(key);
    const auto* arr = node.as_array();
    if (!arr)
    {
      return std::nullopt;
    }
    std::vector<std::string> result;
    for (const auto& elem : *arr)
    {
      auto* strVal = std::get_if<std::string>(&elem);
      if (!strVal)
      {
        throw std::runtime_error("ConfigLoader: Array element at '" + key + "' is not a string");
      }
      result.push_back(*strVal);
    }
    return result;
  }

private:
  std::string _filename;
  parsers::toml::table _table;
  bool _loaded{false};
};

} // namespace core
} // namespace vesper
