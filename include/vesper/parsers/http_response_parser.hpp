// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Vesper, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once
/// \file http_response_parser.hpp
/// \brief Turns the complete raw bytes of one HTTP/1.x exchange into a
/// typed result.
///
/// The parser works on a fully received response (no incremental reads),
/// tolerates CRLF and bare LF line endings, unwraps any number of
/// "100 Continue" preambles up to a fixed cap, and never throws on input:
/// anything it cannot frame comes back as a MalformedResult holding the
/// original bytes.

#include <cctype>
#include <cstddef>
#include <optional>
#include <string>
#include <variant>

#include <vesper/core/logger.hpp>
#include <vesper/parsers/http_headers.hpp>

namespace vesper
{
namespace parsers
{

  /// \brief A well-framed response.
  struct HttpResult
  {
    int statusCode{0};
    std::string body;
    HeaderList headers;
  };

  /// \brief The response could not be framed; \c rawResponse is the input
  /// exactly as received.
  struct MalformedResult
  {
    std::string rawResponse;
  };

  using ParsedResponse = std::variant<HttpResult, MalformedResult>;

  class HttpResponseParser
  {
  public:
    static constexpr std::size_t DEFAULT_MAX_CONTINUATIONS = 8;

    /// \param maxContinuations Number of "100 Continue" blocks unwrapped
    /// before the response is declared malformed.
    explicit HttpResponseParser(std::size_t maxContinuations = DEFAULT_MAX_CONTINUATIONS)
      : _maxContinuations(maxContinuations)
    {
    }

    std::size_t maxContinuations() const { return _maxContinuations; }

    ParsedResponse parse(const std::string& rawResponse) const
    {
      std::string response = rawResponse;
      std::size_t continuations = 0;

      while (true)
      {
        std::string head;
        std::string body;
        if (!splitHeadAndBody(response, head, body))
        {
          VESPER_LOG_DEBUG("HttpResponseParser: no head/body separator in "
                           << rawResponse.size() << " byte response");
          return MalformedResult{rawResponse};
        }

        StatusLine status;
        if (!parseStatusLine(head, status))
        {
          VESPER_LOG_DEBUG("HttpResponseParser: malformed status line");
          return MalformedResult{rawResponse};
        }

        if (status.code == 100)
        {
          if (++continuations > _maxContinuations)
          {
            VESPER_LOG_WARN("HttpResponseParser: more than " << _maxContinuations
                                                             << " continuation blocks");
            return MalformedResult{rawResponse};
          }
          VESPER_LOG_TRACE("HttpResponseParser: skipping 100 Continue block");
          response = std::move(body);
          continue;
        }

        HttpResult result;
        result.statusCode = status.code;
        result.body = std::move(body);
        if (status.headerBlock)
        {
          result.headers = tokenizeHeaders(*status.headerBlock);
        }
        return result;
      }
    }

    /// \brief Split at the first blank line ("\r?\n\r?\n").
    /// \return false if there is no blank line.
    static bool splitHeadAndBody(const std::string& response, std::string& head,
                                 std::string& body)
    {
      for (std::size_t i = 0; i < response.size(); ++i)
      {
        std::size_t len = blankLineAt(response, i);
        if (len > 0)
        {
          head = response.substr(0, i);
          body = response.substr(i + len);
          return true;
        }
      }
      return false;
    }

  private:
    struct StatusLine
    {
      int code{0};
      std::string reason;
      std::optional<std::string> headerBlock;
    };

    std::size_t _maxContinuations;

    /// Length of the blank-line separator starting at \p pos, or 0.
    static std::size_t blankLineAt(const std::string& s, std::size_t pos)
    {
      std::size_t j = pos;
      for (int terminator = 0; terminator < 2; ++terminator)
      {
        if (j < s.size() && s[j] == '\r')
        {
          ++j;
        }
        if (j >= s.size() || s[j] != '\n')
        {
          return 0;
        }
        ++j;
      }
      return j - pos;
    }

    /// Matches "HTTP/<version> <3 digits> <reason>" optionally followed by a
    /// line break and a header block.
    static bool parseStatusLine(const std::string& head, StatusLine& out)
    {
      static const std::string prefix = "HTTP/";
      if (head.compare(0, prefix.size(), prefix) != 0)
      {
        return false;
      }

      std::size_t pos = prefix.size();
      std::size_t versionEnd = pos;
      while (versionEnd < head.size() && !std::isspace(static_cast<unsigned char>(head[versionEnd])))
      {
        ++versionEnd;
      }
      if (versionEnd == pos || versionEnd >= head.size() || head[versionEnd] != ' ')
      {
        return false;
      }

      pos = versionEnd + 1;
      if (pos + 4 > head.size())
      {
        return false;
      }
      int code = 0;
      for (std::size_t i = pos; i < pos + 3; ++i)
      {
        if (!std::isdigit(static_cast<unsigned char>(head[i])))
        {
          return false;
        }
        code = code * 10 + (head[i] - '0');
      }
      if (head[pos + 3] != ' ')
      {
        return false;
      }

      pos += 4;
      auto eol = head.find('\n', pos);
      if (eol == std::string::npos)
      {
        out.reason = head.substr(pos);
        out.headerBlock.reset();
      }
      else
      {
        std::size_t reasonEnd = eol;
        if (reasonEnd > pos && head[reasonEnd - 1] == '\r')
        {
          --reasonEnd;
        }
        out.reason = head.substr(pos, reasonEnd - pos);
        out.headerBlock = head.substr(eol + 1);
      }
      out.code = code;
      return true;
    }
  };

  /// \brief Parse with the default continuation cap.
  inline ParsedResponse parseRawResponse(const std::string& rawResponse)
  {
    return HttpResponseParser().parse(rawResponse);
  }

} // namespace parsers
} // namespace vesper
