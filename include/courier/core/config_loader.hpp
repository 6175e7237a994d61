// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Courier, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#pragma once

#include "courier/core/json.hpp"

#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace courier
{
namespace core
{
/// \brief Loads and parses JSON configuration files for the client.
class ConfigLoader
{
public:
  /// \brief Constructs and loads a JSON configuration file.
  explicit ConfigLoader(const std::string& filename) : _filename(filename) { load(); }

  /// \brief Reloads the configuration from disk.
  bool reload()
  {
    std::ifstream in(_filename);
    if (!in)
    {
      _table = Json::object();
      return false;
    }
    Json parsed = Json::parse(in, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object())
    {
      _table = Json::object();
      return false;
    }
    _table = std::move(parsed);
    return true;
  }

  const Json& load()
  {
    if (_table.empty())
    {
      if (!reload())
      {
        throw std::runtime_error("Failed to load configuration file: " + _filename);
      }
    }
    return _table;
  }

  /// \brief Gets the full configuration table.
  const Json& table() const { return _table; }

  /// \brief Gets a typed value from the configuration.
  /// \tparam T Any type nlohmann::json converts to (int64_t, bool, std::string...)
  template <typename T> std::optional<T> get(const std::string& dottedKey) const
  {
    auto pointer = toPointer(dottedKey);
    if (!_table.contains(pointer))
    {
      return std::nullopt;
    }
    const Json& node = _table.at(pointer);
    if (node.is_null() || node.is_object() || node.is_array())
    {
      return std::nullopt;
    }
    try
    {
      return node.get<T>();
    }
    catch (const Json::type_error&)
    {
      return std::nullopt;
    }
  }

  std::optional<int64_t> getInt(const std::string& key) const { return get<int64_t>(key); }

  std::optional<bool> getBool(const std::string& key) const { return get<bool>(key); }

  std::optional<std::string> getString(const std::string& key) const
  {
    return get<std::string>(key);
  }

  /// \brief Gets an array of strings from the configuration.
  /// \throws std::runtime_error if the key is an array but any element is not a string.
  std::optional<std::vector<std::string>> getStringArray(const std::string& key) const
  {
    auto pointer = toPointer(key);
    if (!_table.contains(pointer) || !_table.at(pointer).is_array())
    {
      return std::nullopt;
    }
    std::vector<std::string> result;
    for (const auto& elem : _table.at(pointer))
    {
      if (!elem.is_string())
      {
        throw std::runtime_error("ConfigLoader: Array element at '" + key + "' is not a string");
      }
      result.push_back(elem.get<std::string>());
    }
    return result;
  }

  /// \brief Gets a sub-object (e.g. "defaults") or nullopt.
  std::optional<Json> getObject(const std::string& key) const
  {
    auto pointer = toPointer(key);
    if (!_table.contains(pointer) || !_table.at(pointer).is_object())
    {
      return std::nullopt;
    }
    return _table.at(pointer);
  }

private:
  std::string _filename;
  Json _table = Json::object();
};

} // namespace core
} // namespace courier
