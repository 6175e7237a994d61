// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Courier, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#pragma once

#include <nlohmann/json.hpp>

#include <string>

namespace courier
{
namespace core
{
  /// JSON type alias to avoid exposing third-party namespaces.
  using Json = nlohmann::json;

  /// \brief Convert a "a.b.c" or "a/b/c" key path into a JSON pointer.
  inline Json::json_pointer toPointer(const std::string& path)
  {
    std::string pointer = "/";
    for (char c : path)
    {
      if (c == '.' || c == '/')
      {
        pointer += '/';
      }
      else if (c == '~')
      {
        pointer += "~0";
      }
      else
      {
        pointer += c;
      }
    }
    return Json::json_pointer(pointer);
  }

  /// \brief Recursively overlay \p patch onto \p target. Objects merge, every
  /// other value in \p patch replaces the target value.
  inline void mergeRecursive(Json& target, const Json& patch)
  {
    if (!patch.is_object() || !target.is_object())
    {
      target = patch;
      return;
    }
    for (auto it = patch.begin(); it != patch.end(); ++it)
    {
      if (it.value().is_object() && target.contains(it.key()) && target[it.key()].is_object())
      {
        mergeRecursive(target[it.key()], it.value());
      }
      else
      {
        target[it.key()] = it.value();
      }
    }
  }
} // namespace core
} // namespace courier
