// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Drtgw, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <drtgw/core/logger.hpp>
#include <drtgw/parsers/minimal_toml.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace drtgw
{
namespace core
{
/// \brief Loads a TOML configuration file and exposes typed lookups by
/// dotted key ("gateway.retry.max_attempts").
class ConfigLoader
{
public:
  /// \brief Loads \p filename; throws std::runtime_error when it cannot be
  /// read or parsed.
  explicit ConfigLoader(const std::string &filename) : _filename(filename) { load(); }

  /// \brief Builds a loader over an in-memory document (no backing file).
  static ConfigLoader fromString(const std::string &text)
  {
    ConfigLoader loader;
    loader._table = parsers::toml::parse(text);
    return loader;
  }

  /// \brief Re-reads the backing file. On failure the previous table is kept
  /// and lastError() describes the problem.
  bool reload()
  {
    if (_filename.empty())
    {
      _lastError = "no backing file";
      return false;
    }
    try
    {
      _table = parsers::toml::parse_file(_filename);
      _lastError.clear();
      return true;
    }
    catch (const std::exception &e)
    {
      _lastError = e.what();
      return false;
    }
  }

  const parsers::toml::table &load()
  {
    if (!reload())
    {
      throw std::runtime_error("Failed to load configuration file: " + _filename + " (" +
                               _lastError + ")");
    }
    return _table;
  }

  const parsers::toml::table &table() const { return _table; }

  const std::string &lastError() const { return _lastError; }

  bool contains(const std::string &dottedKey) const
  {
    return static_cast<bool>(_table.at_path(dottedKey));
  }

  /// \tparam T int64_t, double, bool or std::string
  template <typename T> std::optional<T> get(const std::string &dottedKey) const
  {
    auto node = _table.at_path(dottedKey);
    if (!node)
    {
      return std::nullopt;
    }
    return node.template as<T>();
  }

  std::optional<int64_t> getInt(const std::string &key) const { return get<int64_t>(key); }
  std::optional<double> getDouble(const std::string &key) const { return get<double>(key); }
  std::optional<bool> getBool(const std::string &key) const { return get<bool>(key); }

  std::optional<std::string> getString(const std::string &key) const
  {
    return get<std::string>(key);
  }

  /// \brief Gets an array of strings.
  /// \throws std::runtime_error if any element is not a string.
  std::optional<std::vector<std::string>> getStringArray(const std::string &key) const
  {
    auto node = _table.at_path(key);
    const parsers::toml::array *arr = node.as_array();
    if (!arr)
    {
      return std::nullopt;
    }
    std::vector<std::string> result;
    for (const auto &elem : *arr)
    {
      auto s = elem.as<std::string>();
      if (!s)
      {
        throw std::runtime_error("ConfigLoader: Array element at '" + key + "' is not a string");
      }
      result.push_back(*s);
    }
    return result;
  }

  /// \brief Gets a table whose values are all strings, e.g. a status mapping.
  /// \throws std::runtime_error if any value is not a string.
  std::optional<std::map<std::string, std::string>> getStringMap(const std::string &key) const
  {
    auto node = _table.at_path(key);
    const parsers::toml::table *tbl = node.as_table();
    if (!tbl)
    {
      return std::nullopt;
    }
    std::map<std::string, std::string> result;
    for (const auto &entry : *tbl)
    {
      auto s = entry.second.as<std::string>();
      if (!s)
      {
        throw std::runtime_error("ConfigLoader: Value '" + key + "." + entry.first +
                                 "' is not a string");
      }
      result.emplace(entry.first, *s);
    }
    return result;
  }

private:
  ConfigLoader() = default;

  std::string _filename;
  std::string _lastError;
  parsers::toml::table _table;
};

/// \brief Applies the [log] section (level, file, format, time_format) to the
/// process-wide Logger. Missing keys leave the current setting untouched.
/// \throws std::invalid_argument on an unknown level name.
inline void configureLogger(const ConfigLoader &config, const std::string &section = "log")
{
  Logger::Level level = Logger::level();
  if (auto name = config.getString(section + ".level"))
  {
    auto parsed = Logger::levelFromString(*name);
    if (!parsed)
    {
      throw std::invalid_argument("Unknown log level: " + *name);
    }
    level = *parsed;
  }
  auto file = config.getString(section + ".file");
  auto timeFormat = config.getString(section + ".time_format");
  if (file || timeFormat)
  {
    Logger::init(level, file.value_or(""), timeFormat.value_or("%Y-%m-%d %H:%M:%S"));
  }
  else
  {
    Logger::setLevel(level);
  }
  if (auto format = config.getString(section + ".format"))
  {
    Logger::setLogFormat(*format);
  }
}

} // namespace core
} // namespace drtgw
