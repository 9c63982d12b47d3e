// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Drtgw, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

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

namespace drtgw
{
namespace parsers
{
/// \brief Small TOML reader covering what client configuration files use:
/// [sections], dotted keys, strings, integers, floats, booleans, arrays and
/// inline tables. Dates and arrays of tables are not supported.
namespace toml
{

class table;
class array;

using value_type = std::variant<std::monostate, int64_t, double, bool, std::string,
                                std::shared_ptr<table>, std::shared_ptr<array>>;

/// \brief Error raised for malformed input; carries the 1-based line number.
class parse_error : public std::runtime_error
{
public:
  parse_error(std::size_t line, const std::string &what)
      : std::runtime_error("TOML line " + std::to_string(line) + ": " + what), _line(line)
  {
  }

  std::size_t line() const { return _line; }

private:
  std::size_t _line;
};

class node
{
public:
  node() = default;
  node(value_type val) : _value(std::move(val)) {}

  bool is_value() const { return !std::holds_alternative<std::monostate>(_value); }
  bool is_string() const { return std::holds_alternative<std::string>(_value); }
  bool is_integer() const { return std::holds_alternative<int64_t>(_value); }
  bool is_floating_point() const { return std::holds_alternative<double>(_value); }
  bool is_boolean() const { return std::holds_alternative<bool>(_value); }
  bool is_array() const { return std::holds_alternative<std::shared_ptr<array>>(_value); }
  bool is_table() const { return std::holds_alternative<std::shared_ptr<table>>(_value); }

  /// \brief Typed access. Integers widen to double; nothing else converts.
  template <typename T> std::optional<T> as() const
  {
    if constexpr (std::is_same_v<T, double>)
    {
      if (auto *d = std::get_if<double>(&_value))
        return *d;
      if (auto *i = std::get_if<int64_t>(&_value))
        return static_cast<double>(*i);
      return std::nullopt;
    }
    else
    {
      if (auto *v = std::get_if<T>(&_value))
        return *v;
      return std::nullopt;
    }
  }

  const array *as_array() const
  {
    auto *p = std::get_if<std::shared_ptr<array>>(&_value);
    return p ? p->get() : nullptr;
  }

  const table *as_table() const
  {
    auto *p = std::get_if<std::shared_ptr<table>>(&_value);
    return p ? p->get() : nullptr;
  }

  table *as_table()
  {
    auto *p = std::get_if<std::shared_ptr<table>>(&_value);
    return p ? p->get() : nullptr;
  }

  explicit operator bool() const { return is_value(); }

  const value_type &get_value() const { return _value; }

private:
  value_type _value;
};

class array
{
public:
  using container_type = std::vector<node>;
  using const_iterator = container_type::const_iterator;

  void push_back(node n) { _items.push_back(std::move(n)); }
  std::size_t size() const { return _items.size(); }
  bool empty() const { return _items.empty(); }
  const node &operator[](std::size_t idx) const { return _items[idx]; }
  const_iterator begin() const { return _items.begin(); }
  const_iterator end() const { return _items.end(); }

private:
  container_type _items;
};

class table
{
public:
  using container_type = std::map<std::string, node>;
  using const_iterator = container_type::const_iterator;

  bool contains(const std::string &key) const { return _entries.count(key) != 0; }
  bool empty() const { return _entries.empty(); }
  std::size_t size() const { return _entries.size(); }
  node &operator[](const std::string &key) { return _entries[key]; }
  const_iterator begin() const { return _entries.begin(); }
  const_iterator end() const { return _entries.end(); }

  /// \brief Look up "a.b.c"; returns an empty node when any segment is missing.
  node at_path(const std::string &dottedPath) const
  {
    const table *current = this;
    std::size_t start = 0;
    while (current)
    {
      std::size_t dot = dottedPath.find('.', start);
      std::string part = dottedPath.substr(start, dot == std::string::npos ? dot : dot - start);
      auto it = current->_entries.find(part);
      if (it == current->_entries.end())
      {
        return node();
      }
      if (dot == std::string::npos)
      {
        return it->second;
      }
      current = it->second.as_table();
      start = dot + 1;
    }
    return node();
  }

private:
  container_type _entries;
};

class parser
{
public:
  explicit parser(std::string input) : _input(std::move(input)) {}

  table parse()
  {
    table root;
    table *current = &root;
    for (;;)
    {
      skipBlank(true);
      if (atEnd())
      {
        break;
      }
      if (peek() == '[')
      {
        advance();
        if (peek() == '[')
        {
          fail("arrays of tables are not supported");
        }
        std::vector<std::string> path = parseKeyPath();
        skipBlank(false);
        expect(']');
        current = descend(root, path, path.size());
      }
      else
      {
        parseAssignment(*current);
      }
      endOfLine();
    }
    return root;
  }

private:
  std::string _input;
  std::size_t _pos = 0;
  std::size_t _line = 1;

  bool atEnd() const { return _pos >= _input.size(); }
  char peek() const { return atEnd() ? '\0' : _input[_pos]; }

  char advance()
  {
    if (atEnd())
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

  [[noreturn]] void fail(const std::string &what) const { throw parse_error(_line, what); }

  void expect(char c)
  {
    if (peek() != c)
    {
      fail(std::string("expected '") + c + "'");
    }
    advance();
  }

  /// Skips spaces and comments; newlines too when \p newlines is set.
  void skipBlank(bool newlines)
  {
    while (!atEnd())
    {
      char c = peek();
      if (c == '#')
      {
        while (!atEnd() && peek() != '\n')
          advance();
      }
      else if (c == ' ' || c == '\t' || c == '\r' || (newlines && c == '\n'))
      {
        advance();
      }
      else
      {
        break;
      }
    }
  }

  void endOfLine()
  {
    skipBlank(false);
    if (!atEnd() && peek() != '\n')
    {
      fail("unexpected trailing characters");
    }
  }

  static bool isBareKeyChar(char c)
  {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
  }

  std::vector<std::string> parseKeyPath()
  {
    std::vector<std::string> parts;
    for (;;)
    {
      skipBlank(false);
      std::string part;
      if (peek() == '"' || peek() == '\'')
      {
        part = parseString();
      }
      else
      {
        while (isBareKeyChar(peek()))
          part += advance();
        if (part.empty())
        {
          fail("expected a key");
        }
      }
      parts.push_back(part);
      skipBlank(false);
      if (peek() != '.')
      {
        return parts;
      }
      advance();
    }
  }

  table *descend(table &root, const std::vector<std::string> &path, std::size_t depth)
  {
    table *current = &root;
    for (std::size_t i = 0; i < depth; ++i)
    {
      node &slot = (*current)[path[i]];
      if (!slot.is_value())
      {
        slot = node(std::make_shared<table>());
      }
      current = slot.as_table();
      if (!current)
      {
        fail("key '" + path[i] + "' is not a table");
      }
    }
    return current;
  }

  void parseAssignment(table &target)
  {
    std::vector<std::string> path = parseKeyPath();
    skipBlank(false);
    expect('=');
    skipBlank(false);
    table *owner = descend(target, path, path.size() - 1);
    if (owner->contains(path.back()))
    {
      fail("duplicate key '" + path.back() + "'");
    }
    (*owner)[path.back()] = parseValue();
  }

  node parseValue()
  {
    char c = peek();
    if (c == '"' || c == '\'')
      return node(parseString());
    if (c == '[')
      return parseArray();
    if (c == '{')
      return parseInlineTable();
    if (c == 't' || c == 'f')
      return node(parseBool());
    if (c == '+' || c == '-' || std::isdigit(static_cast<unsigned char>(c)))
      return parseNumber();
    fail("invalid value");
  }

  std::string parseString()
  {
    char quote = advance();
    std::string out;
    while (!atEnd() && peek() != quote && peek() != '\n')
    {
      char c = advance();
      if (c != '\\' || quote == '\'')
      {
        out += c;
        continue;
      }
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
      case '\\':
        out += esc;
        break;
      default:
        fail(std::string("unknown escape \\") + esc);
      }
    }
    if (peek() != quote)
    {
      fail("unterminated string");
    }
    advance();
    return out;
  }

  node parseArray()
  {
    advance();
    auto arr = std::make_shared<array>();
    skipBlank(true);
    while (peek() != ']')
    {
      if (atEnd())
      {
        fail("unterminated array");
      }
      arr->push_back(parseValue());
      skipBlank(true);
      if (peek() == ',')
      {
        advance();
        skipBlank(true);
      }
      else if (peek() != ']')
      {
        fail("expected ',' or ']'");
      }
    }
    advance();
    return node(arr);
  }

  node parseInlineTable()
  {
    advance();
    auto tbl = std::make_shared<table>();
    skipBlank(false);
    while (peek() != '}')
    {
      parseAssignment(*tbl);
      skipBlank(false);
      if (peek() == ',')
      {
        advance();
        skipBlank(false);
      }
      else if (peek() != '}')
      {
        fail("expected ',' or '}'");
      }
    }
    advance();
    return node(tbl);
  }

  bool parseBool()
  {
    std::string word;
    while (std::isalpha(static_cast<unsigned char>(peek())))
      word += advance();
    if (word == "true")
      return true;
    if (word == "false")
      return false;
    fail("invalid boolean '" + word + "'");
  }

  node parseNumber()
  {
    std::string text;
    bool floating = false;
    if (peek() == '+' || peek() == '-')
    {
      text += advance();
    }
    while (!atEnd())
    {
      char c = peek();
      if (c == '_')
      {
        advance();
        continue;
      }
      if (c == '.' || c == 'e' || c == 'E')
      {
        floating = true;
      }
      else if (!std::isdigit(static_cast<unsigned char>(c)) &&
               !((c == '+' || c == '-') && (text.back() == 'e' || text.back() == 'E')))
      {
        break;
      }
      text += advance();
    }
    try
    {
      std::size_t used = 0;
      if (floating)
      {
        double d = std::stod(text, &used);
        if (used == text.size())
          return node(d);
      }
      else
      {
        long long i = std::stoll(text, &used);
        if (used == text.size())
          return node(static_cast<int64_t>(i));
      }
    }
    catch (const std::out_of_range &)
    {
      fail("number out of range '" + text + "'");
    }
    catch (const std::invalid_argument &)
    {
    }
    fail("invalid number '" + text + "'");
  }
};

inline table parse(const std::string &text) { return parser(text).parse(); }

inline table parse_file(const std::string &filename)
{
  std::ifstream in(filename);
  if (!in.is_open())
  {
    throw std::runtime_error("Cannot open file: " + filename);
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return parse(buffer.str());
}

} // namespace toml
} // namespace parsers
} // namespace drtgw
