// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Vesper, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

/// \file minimal_toml.hpp
/// \brief TOML subset used for client configuration files.
/// \details
///   Supported: comments, [table] and [dotted.table] headers, bare or quoted
///   keys, basic and literal strings, integers, floats, booleans and arrays
///   of those values (arrays may span lines). Not supported: inline tables,
///   arrays of tables, multi-line strings, dates.

#include <cctype>
#include <cstdint>
#include <fstream>
#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace vesper
{
namespace parsers
{
namespace toml
{

class table;
class array;

using value_type = std::variant<std::monostate, int64_t, double, bool, std::string,
                                std::shared_ptr<table>, std::shared_ptr<array>>;

/// \brief Thrown for syntax errors; carries the 1-based line number.
class parse_error : public std::runtime_error
{
public:
  parse_error(const std::string& what, std::size_t line)
    : std::runtime_error("TOML parse error at line " + std::to_string(line) + ": " + what),
      _line(line)
  {
  }

  std::size_t line() const { return _line; }

private:
  std::size_t _line;
};

class array
{
public:
  using container_type = std::vector<value_type>;
  using const_iterator = container_type::const_iterator;

  void push_back(value_type val) { _values.push_back(std::move(val)); }
  std::size_t size() const { return _values.size(); }
  bool empty() const { return _values.empty(); }
  const_iterator begin() const { return _values.begin(); }
  const_iterator end() const { return _values.end(); }
  const value_type& operator[](std::size_t idx) const { return _values[idx]; }

private:
  container_type _values;
};

/// \brief Read-only view of one value in a table.
class node
{
public:
  node() = default;
  node(value_type val) : _value(std::move(val)) {}

  explicit operator bool() const { return !std::holds_alternative<std::monostate>(_value); }

  bool is_value() const
  {
    return *this && !is_table() && !is_array();
  }
  bool is_string() const { return std::holds_alternative<std::string>(_value); }
  bool is_integer() const { return std::holds_alternative<int64_t>(_value); }
  bool is_floating_point() const { return std::holds_alternative<double>(_value); }
  bool is_boolean() const { return std::holds_alternative<bool>(_value); }
  bool is_array() const { return std::holds_alternative<std::shared_ptr<array>>(_value); }
  bool is_table() const { return std::holds_alternative<std::shared_ptr<table>>(_value); }

  /// \brief Typed access; integers widen to double, nothing else converts.
  template <typename T> std::optional<T> as() const
  {
    if constexpr (std::is_same_v<T, double>)
    {
      if (auto* val = std::get_if<double>(&_value))
      {
        return *val;
      }
      if (auto* val = std::get_if<int64_t>(&_value))
      {
        return static_cast<double>(*val);
      }
      return std::nullopt;
    }
    else
    {
      if (auto* val = std::get_if<T>(&_value))
      {
        return *val;
      }
      return std::nullopt;
    }
  }

  const array* as_array() const
  {
    auto* val = std::get_if<std::shared_ptr<array>>(&_value);
    return val ? val->get() : nullptr;
  }

  const table* as_table() const
  {
    auto* val = std::get_if<std::shared_ptr<table>>(&_value);
    return val ? val->get() : nullptr;
  }

private:
  value_type _value;
};

class table
{
public:
  using container_type = std::map<std::string, value_type>;
  using const_iterator = container_type::const_iterator;

  bool contains(const std::string& key) const { return _values.count(key) != 0; }
  bool empty() const { return _values.empty(); }
  std::size_t size() const { return _values.size(); }
  const_iterator begin() const { return _values.begin(); }
  const_iterator end() const { return _values.end(); }

  node operator[](const std::string& key) const
  {
    auto it = _values.find(key);
    return it == _values.end() ? node() : node(it->second);
  }

  /// \brief Look up "a.b.c"; returns an empty node if any segment is missing.
  node at_path(const std::string& dottedPath) const
  {
    const table* current = this;
    std::size_t start = 0;
    while (current)
    {
      auto dot = dottedPath.find('.', start);
      std::string part = dottedPath.substr(start, dot == std::string::npos ? dot : dot - start);
      auto it = current->_values.find(part);
      if (it == current->_values.end())
      {
        return node();
      }
      if (dot == std::string::npos)
      {
        return node(it->second);
      }
      auto* child = std::get_if<std::shared_ptr<table>>(&it->second);
      current = child ? child->get() : nullptr;
      start = dot + 1;
    }
    return node();
  }

  void insert(const std::string& key, value_type value) { _values[key] = std::move(value); }

  /// \brief Get or create a child table; fails if \p key holds a non-table.
  std::shared_ptr<table> child(const std::string& key)
  {
    auto it = _values.find(key);
    if (it == _values.end())
    {
      auto created = std::make_shared<table>();
      _values.emplace(key, created);
      return created;
    }
    auto* existing = std::get_if<std::shared_ptr<table>>(&it->second);
    return existing ? *existing : nullptr;
  }

private:
  container_type _values;
};

class parser
{
public:
  explicit parser(const std::string& input) : _input(input) {}

  table parse()
  {
    table root;
    table* current = &root;
    std::shared_ptr<table> currentHolder;

    while (true)
    {
      skipBlank();
      if (isEnd())
      {
        break;
      }

      if (peek() == '[')
      {
        advance();
        auto path = parseKeyPath(']');
        expect(']');
        currentHolder = resolveTable(root, path);
        current = currentHolder.get();
      }
      else
      {
        auto path = parseKeyPath('=');
        expect('=');
        skipInline();
        auto value = parseValue();
        std::string leaf = path.back();
        path.pop_back();
        table* target = current;
        std::shared_ptr<table> holder;
        if (!path.empty())
        {
          holder = resolveTable(*current, path);
          target = holder.get();
        }
        if (target->contains(leaf))
        {
          throw parse_error("duplicate key '" + leaf + "'", _line);
        }
        target->insert(leaf, std::move(value));
      }
      endOfLine();
    }
    return root;
  }

private:
  const std::string& _input;
  std::size_t _pos{0};
  std::size_t _line{1};

  bool isEnd() const { return _pos >= _input.size(); }
  char peek() const { return isEnd() ? '\0' : _input[_pos]; }

  char advance()
  {
    if (isEnd())
    {
      return '\0';
    }
    char c = _input[_pos++];
    if (c == '\n')
    {
      ++_line;
    }
    return c;
  }

  void expect(char c)
  {
    skipInline();
    if (peek() != c)
    {
      throw parse_error(std::string("expected '") + c + "'", _line);
    }
    advance();
  }

  void skipInline()
  {
    while (peek() == ' ' || peek() == '\t')
    {
      advance();
    }
  }

  void skipComment()
  {
    if (peek() == '#')
    {
      while (!isEnd() && peek() != '\n')
      {
        advance();
      }
    }
  }

  /// Whitespace, newlines and comments.
  void skipBlank()
  {
    while (!isEnd())
    {
      if (std::isspace(static_cast<unsigned char>(peek())))
      {
        advance();
      }
      else if (peek() == '#')
      {
        skipComment();
      }
      else
      {
        break;
      }
    }
  }

  void endOfLine()
  {
    skipInline();
    skipComment();
    if (peek() == '\r')
    {
      advance();
    }
    if (!isEnd() && peek() != '\n')
    {
      throw parse_error("unexpected trailing characters", _line);
    }
  }

  std::vector<std::string> parseKeyPath(char terminator)
  {
    std::vector<std::string> parts;
    while (true)
    {
      skipInline();
      std::string part;
      if (peek() == '"' || peek() == '\'')
      {
        part = parseString();
      }
      else
      {
        while (!isEnd() &&
               (std::isalnum(static_cast<unsigned char>(peek())) || peek() == '_' ||
                peek() == '-'))
        {
          part += advance();
        }
      }
      if (part.empty())
      {
        throw parse_error("empty key", _line);
      }
      parts.push_back(std::move(part));
      skipInline();
      if (peek() == '.')
      {
        advance();
        continue;
      }
      if (peek() != terminator)
      {
        throw parse_error(std::string("expected '") + terminator + "' after key", _line);
      }
      return parts;
    }
  }

  std::shared_ptr<table> resolveTable(table& root, const std::vector<std::string>& path)
  {
    table* current = &root;
    std::shared_ptr<table> holder;
    for (const auto& part : path)
    {
      holder = current->child(part);
      if (!holder)
      {
        throw parse_error("key '" + part + "' is not a table", _line);
      }
      current = holder.get();
    }
    return holder;
  }

  value_type parseValue()
  {
    char c = peek();
    if (c == '"' || c == '\'')
    {
      return parseString();
    }
    if (c == '[')
    {
      return parseArray();
    }
    if (_input.compare(_pos, 4, "true") == 0)
    {
      _pos += 4;
      return true;
    }
    if (_input.compare(_pos, 5, "false") == 0)
    {
      _pos += 5;
      return false;
    }
    return parseNumber();
  }

  std::string parseString()
  {
    char quote = advance();
    std::string out;
    while (true)
    {
      if (isEnd() || peek() == '\n')
      {
        throw parse_error("unterminated string", _line);
      }
      char c = advance();
      if (c == quote)
      {
        return out;
      }
      if (c == '\\' && quote == '"')
      {
        char esc = advance();
        switch (esc)
        {
        case 'n':
          out += '\n';
          break;
        case 't':
          out += '\t';
          break;
        case 'r':
          out += '\r';
          break;
        case '"':
          out += '"';
          break;
        case '\\':
          out += '\\';
          break;
        default:
          throw parse_error(std::string("unsupported escape '\\") + esc + "'", _line);
        }
        continue;
      }
      out += c;
    }
  }

  value_type parseArray()
  {
    advance(); // '['
    auto result = std::make_shared<array>();
    while (true)
    {
      skipBlank();
      if (peek() == ']')
      {
        advance();
        return result;
      }
      result->push_back(parseValue());
      skipBlank();
      if (peek() == ',')
      {
        advance();
        continue;
      }
      if (peek() != ']')
      {
        throw parse_error("expected ',' or ']' in array", _line);
      }
    }
  }

  value_type parseNumber()
  {
    std::string text;
    bool isFloat = false;
    while (!isEnd())
    {
      char c = peek();
      if (std::isdigit(static_cast<unsigned char>(c)) || c == '+' || c == '-' || c == '_')
      {
        if (c != '_')
        {
          text += c;
        }
        advance();
      }
      else if (c == '.' || c == 'e' || c == 'E')
      {
        isFloat = true;
        text += c;
        advance();
      }
      else
      {
        break;
      }
    }
    if (text.empty())
    {
      throw parse_error("invalid value", _line);
    }

    try
    {
      std::size_t used = 0;
      if (isFloat)
      {
        double d = std::stod(text, &used);
        if (used == text.size())
        {
          return d;
        }
      }
      else
      {
        long long i = std::stoll(text, &used, 10);
        if (used == text.size())
        {
          return static_cast<int64_t>(i);
        }
      }
    }
    catch (const std::logic_error&)
    {
      // invalid_argument or out_of_range, reported below
    }
    throw parse_error("invalid number '" + text + "'", _line);
  }
};

inline table parse(const std::string& input) { return parser(input).parse(); }

inline table parse_file(const std::string& path)
{
  std::ifstream in(path);
  if (!in)
  {
    throw std::runtime_error("Cannot open TOML file: " + path);
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  return parse(buffer.str());
}

} // namespace toml
} // namespace parsers
} // namespace vesper
