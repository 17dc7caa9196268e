// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Ftpcore, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <cctype>
#include <cstdint>
#include <fstream>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <variant>
#include <vector>

namespace ftpcore
{
namespace parsers
{
namespace toml
{

/// \brief Subset of TOML sufficient for server configuration files:
/// `[section.sub]` headers, `key = value` pairs (keys may be dotted), basic
/// and literal strings, integers, floats, booleans, arrays and `#` comments.
/// Inline tables, arrays of tables and date-times are not supported.

class table;
class array;

using value_type = std::variant<std::monostate, int64_t, double, bool, std::string,
                                std::shared_ptr<table>, std::shared_ptr<array>>;

/// \brief Thrown for malformed input; carries the 1-based line number.
class parse_error : public std::runtime_error
{
public:
  parse_error(const std::string &message, std::size_t line)
      : std::runtime_error("TOML parse error at line " + std::to_string(line) + ": " + message),
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

private:
  container_type _values;
};

class node
{
public:
  node() = default;
  node(value_type val) : _value(std::move(val)) {}

  bool is_value() const
  {
    return !std::holds_alternative<std::monostate>(_value) && !is_table() && !is_array();
  }
  bool is_array() const { return std::holds_alternative<std::shared_ptr<array>>(_value); }
  bool is_table() const { return std::holds_alternative<std::shared_ptr<table>>(_value); }

  /// \brief Typed access. Integers widen to double; nothing else converts.
  template <typename T> std::optional<T> as() const
  {
    if constexpr (std::is_same_v<T, double>)
    {
      if (auto *i = std::get_if<int64_t>(&_value))
      {
        return static_cast<double>(*i);
      }
    }
    if constexpr (std::is_same_v<T, int64_t> || std::is_same_v<T, double> ||
                  std::is_same_v<T, bool> || std::is_same_v<T, std::string>)
    {
      if (auto *v = std::get_if<T>(&_value))
      {
        return *v;
      }
    }
    return std::nullopt;
  }

  const array *as_array() const
  {
    auto *p = std::get_if<std::shared_ptr<array>>(&_value);
    return p ? p->get() : nullptr;
  }

  table *as_table() const
  {
    auto *p = std::get_if<std::shared_ptr<table>>(&_value);
    return p ? p->get() : nullptr;
  }

  explicit operator bool() const { return !std::holds_alternative<std::monostate>(_value); }

private:
  value_type _value;
};

namespace detail
{
  inline std::vector<std::string> splitDotted(const std::string &path)
  {
    std::vector<std::string> parts;
    std::string part;
    std::istringstream ss(path);
    while (std::getline(ss, part, '.'))
    {
      parts.push_back(part);
    }
    return parts;
  }
} // namespace detail

class table
{
public:
  using container_type = std::unordered_map<std::string, node>;
  using const_iterator = container_type::const_iterator;

  bool contains(const std::string &key) const { return _values.count(key) != 0; }
  bool empty() const { return _values.empty(); }
  std::size_t size() const { return _values.size(); }
  const_iterator begin() const { return _values.begin(); }
  const_iterator end() const { return _values.end(); }

  void insert(const std::string &key, node value) { _values[key] = std::move(value); }

  /// \brief Look up `a.b.c`; returns an empty node when any part is missing.
  node at_path(const std::string &dottedPath) const
  {
    auto parts = detail::splitDotted(dottedPath);
    const table *current = this;
    for (std::size_t i = 0; i < parts.size(); ++i)
    {
      auto it = current->_values.find(parts[i]);
      if (it == current->_values.end())
      {
        return node();
      }
      if (i + 1 == parts.size())
      {
        return it->second;
      }
      current = it->second.as_table();
      if (!current)
      {
        return node();
      }
    }
    return node();
  }

  /// \brief Return the sub-table \p key, creating it when absent.
  /// \return nullptr if \p key holds a non-table value
  table *child(const std::string &key)
  {
    auto it = _values.find(key);
    if (it == _values.end())
    {
      it = _values.emplace(key, node(std::make_shared<table>())).first;
    }
    return it->second.as_table();
  }

private:
  container_type _values;
};

class parser
{
public:
  explicit parser(std::string input) : _input(std::move(input)) {}

  table parse()
  {
    table root;
    table *current = &root;
    while (true)
    {
      skipBlank(true);
      if (atEnd())
      {
        break;
      }
      if (peek() == '[')
      {
        ++_pos;
        std::string path = readUntil(']');
        current = resolve(root, detail::splitDotted(trim(path)), path);
      }
      else
      {
        std::string key = readKey();
        skipBlank(false);
        if (peek() != '=')
        {
          fail("expected '=' after key '" + key + "'");
        }
        ++_pos;
        skipBlank(false);
        auto parts = detail::splitDotted(key);
        std::string leaf = parts.back();
        parts.pop_back();
        table *target = parts.empty() ? current : resolve(*current, parts, key);
        if (target->contains(leaf))
        {
          fail("duplicate key '" + key + "'");
        }
        target->insert(leaf, node(readValue()));
      }
      expectLineEnd();
    }
    return root;
  }

private:
  std::string _input;
  std::size_t _pos{0};
  std::size_t _line{1};

  bool atEnd() const { return _pos >= _input.size(); }
  char peek() const { return atEnd() ? '\0' : _input[_pos]; }

  [[noreturn]] void fail(const std::string &message) const { throw parse_error(message, _line); }

  static std::string trim(const std::string &s)
  {
    auto b = s.find_first_not_of(" \t");
    auto e = s.find_last_not_of(" \t");
    return b == std::string::npos ? std::string() : s.substr(b, e - b + 1);
  }

  void skipBlank(bool newlines)
  {
    while (!atEnd())
    {
      char c = peek();
      if (c == '#')
      {
        while (!atEnd() && peek() != '\n')
        {
          ++_pos;
        }
      }
      else if (c == '\n' && newlines)
      {
        ++_line;
        ++_pos;
      }
      else if (c == ' ' || c == '\t' || c == '\r')
      {
        ++_pos;
      }
      else
      {
        break;
      }
    }
  }

  void expectLineEnd()
  {
    skipBlank(false);
    if (!atEnd() && peek() != '\n')
    {
      fail(std::string("unexpected character '") + peek() + "'");
    }
  }

  std::string readUntil(char terminator)
  {
    std::string out;
    while (!atEnd() && peek() != terminator && peek() != '\n')
    {
      out += _input[_pos++];
    }
    if (peek() != terminator)
    {
      fail(std::string("missing '") + terminator + "'");
    }
    ++_pos;
    return out;
  }

  std::string readKey()
  {
    std::string key;
    while (!atEnd())
    {
      char c = peek();
      if (std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-' || c == '.')
      {
        key += c;
        ++_pos;
      }
      else
      {
        break;
      }
    }
    if (key.empty())
    {
      fail("expected key");
    }
    return key;
  }

  table *resolve(table &from, const std::vector<std::string> &parts, const std::string &path)
  {
    table *t = &from;
    for (const auto &p : parts)
    {
      if (p.empty())
      {
        fail("empty name in '" + path + "'");
      }
      t = t->child(p);
      if (!t)
      {
        fail("'" + path + "' is not a table");
      }
    }
    return t;
  }

  value_type readValue()
  {
    char c = peek();
    if (c == '"' || c == '\'')
    {
      return readString(c);
    }
    if (c == '[')
    {
      return readArray();
    }
    if (c == 't' || c == 'f')
    {
      return readBool();
    }
    if (c == '+' || c == '-' || std::isdigit(static_cast<unsigned char>(c)))
    {
      return readNumber();
    }
    fail("invalid value");
  }

  std::string readString(char quote)
  {
    ++_pos;
    std::string out;
    while (!atEnd() && peek() != quote && peek() != '\n')
    {
      char c = _input[_pos++];
      if (c == '\\' && quote == '"' && !atEnd())
      {
        char esc = _input[_pos++];
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
        default:
          out += esc;
        }
        continue;
      }
      out += c;
    }
    if (peek() != quote)
    {
      fail("unterminated string");
    }
    ++_pos;
    return out;
  }

  value_type readArray()
  {
    ++_pos;
    auto arr = std::make_shared<array>();
    skipBlank(true);
    while (!atEnd() && peek() != ']')
    {
      arr->push_back(readValue());
      skipBlank(true);
      if (peek() == ',')
      {
        ++_pos;
        skipBlank(true);
      }
      else if (peek() != ']')
      {
        fail("expected ',' or ']' in array");
      }
    }
    if (peek() != ']')
    {
      fail("unterminated array");
    }
    ++_pos;
    return arr;
  }

  bool readBool()
  {
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
    fail("invalid boolean");
  }

  value_type readNumber()
  {
    std::string num;
    bool isFloat = false;
    while (!atEnd())
    {
      char c = peek();
      if (c == '.' || c == 'e' || c == 'E')
      {
        isFloat = true;
      }
      else if (c == '_')
      {
        ++_pos;
        continue;
      }
      else if (!std::isdigit(static_cast<unsigned char>(c)) && c != '+' && c != '-')
      {
        break;
      }
      num += c;
      ++_pos;
    }
    try
    {
      if (isFloat)
      {
        return std::stod(num);
      }
      return static_cast<int64_t>(std::stoll(num));
    }
    catch (const std::exception &)
    {
      fail("invalid number '" + num + "'");
    }
  }
};

inline table parse(const std::string &text) { return parser(text).parse(); }

inline table parse_file(const std::string &filename)
{
  std::ifstream file(filename);
  if (!file.is_open())
  {
    throw std::runtime_error("Cannot open file: " + filename);
  }
  std::ostringstream buffer;
  buffer << file.rdbuf();
  return parse(buffer.str());
}

} // namespace toml
} // namespace parsers
} // namespace ftpcore
