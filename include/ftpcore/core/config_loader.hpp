// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Ftpcore, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include "ftpcore/parsers/minimal_toml.hpp"

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace ftpcore
{
namespace core
{
/// \brief Loads a TOML configuration file and exposes typed lookups by
/// dotted key.
class ConfigLoader
{
public:
  /// \throws std::runtime_error if the file cannot be read or parsed
  explicit ConfigLoader(const std::string &filename) : _filename(filename) { reload(); }

  /// \brief Build a loader over in-memory TOML text.
  static ConfigLoader fromString(const std::string &text)
  {
    ConfigLoader loader;
    loader._table = parsers::toml::parse(text);
    return loader;
  }

  /// \brief Re-read the file. On failure the previous table is kept.
  /// \throws std::runtime_error describing the failure
  void reload()
  {
    if (_filename.empty())
    {
      return;
    }
    try
    {
      _table = parsers::toml::parse_file(_filename);
    }
    catch (const std::exception &ex)
    {
      throw std::runtime_error("Failed to load configuration file " + _filename + ": " +
                               ex.what());
    }
  }

  const std::string &filename() const { return _filename; }

  const parsers::toml::table &table() const { return _table; }

  /// \tparam T int64_t, double, bool or std::string
  template <typename T> std::optional<T> get(const std::string &dottedKey) const
  {
    auto node = _table.at_path(dottedKey);
    if (node && node.is_value())
    {
      return node.as<T>();
    }
    return std::nullopt;
  }

  std::optional<int64_t> getInt(const std::string &key) const { return get<int64_t>(key); }

  std::optional<double> getDouble(const std::string &key) const { return get<double>(key); }

  std::optional<bool> getBool(const std::string &key) const { return get<bool>(key); }

  std::optional<std::string> getString(const std::string &key) const
  {
    return get<std::string>(key);
  }

  /// \throws std::runtime_error if the key is an array holding a non-string
  std::optional<std::vector<std::string>> getStringArray(const std::string &key) const
  {
    auto node = _table.at_path(key);
    const auto *arr = node.as_array();
    if (!arr)
    {
      return std::nullopt;
    }
    std::vector<std::string> result;
    for (const auto &elem : *arr)
    {
      if (auto *s = std::get_if<std::string>(&elem))
      {
        result.push_back(*s);
      }
      else
      {
        throw std::runtime_error("ConfigLoader: Array element at '" + key + "' is not a string");
      }
    }
    return result;
  }

private:
  ConfigLoader() = default;

  std::string _filename;
  parsers::toml::table _table;
};

} // namespace core
} // namespace ftpcore
