// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Vesper, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>
#include <vector>

namespace vesper
{
namespace parsers
{

  /// \brief One response header line. A line without ':' keeps the whole
  /// line as \c name and has no value.
  struct HeaderPair
  {
    std::string name;
    std::optional<std::string> value;

    bool operator==(const HeaderPair& other) const
    {
      return name == other.name && value == other.value;
    }
    bool operator!=(const HeaderPair& other) const { return !(*this == other); }
  };

  /// \brief Headers in wire order, duplicates preserved.
  using HeaderList = std::vector<HeaderPair>;

  /// \brief ASCII case-insensitive equality, used for header names.
  inline bool iequals(const std::string& a, const std::string& b)
  {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(),
                      [](char x, char y)
                      {
                        return std::tolower(static_cast<unsigned char>(x)) ==
                               std::tolower(static_cast<unsigned char>(y));
                      });
  }

  /// \brief Split a raw header block into name/value pairs.
  /// \details Lines end in "\n" with an optional preceding "\r". Each
  /// non-empty line is split on its first ':'; leading whitespace of the
  /// value is dropped. Malformed lines are kept, never rejected.
  inline HeaderList tokenizeHeaders(const std::string& block)
  {
    HeaderList headers;
    std::size_t start = 0;

    while (start < block.size())
    {
      auto eol = block.find('\n', start);
      std::size_t end = eol == std::string::npos ? block.size() : eol;
      std::size_t lineEnd = end;
      if (lineEnd > start && block[lineEnd - 1] == '\r')
      {
        --lineEnd;
      }

      std::string line = block.substr(start, lineEnd - start);
      start = eol == std::string::npos ? block.size() : eol + 1;

      if (line.empty())
      {
        continue;
      }

      auto colon = line.find(':');
      if (colon == std::string::npos)
      {
        headers.push_back({std::move(line), std::nullopt});
        continue;
      }

      auto valueStart = line.find_first_not_of(" \t\r\n\f\v", colon + 1);
      std::string value =
        valueStart == std::string::npos ? std::string{} : line.substr(valueStart);
      headers.push_back({line.substr(0, colon), std::move(value)});
    }

    return headers;
  }

  /// \brief First header named \p name (case-insensitive) that has a value.
  inline std::optional<std::string> findHeader(const HeaderList& headers, const std::string& name)
  {
    for (const auto& header : headers)
    {
      if (header.value && iequals(header.name, name))
      {
        return header.value;
      }
    }
    return std::nullopt;
  }

} // namespace parsers
} // namespace vesper
