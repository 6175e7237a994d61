// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Courier, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#pragma once

#include <algorithm>
#include <cctype>
#include <map>
#include <string>

namespace courier
{
namespace message
{

  /// \brief Case-insensitive string comparison for headers
  struct CaseInsensitiveCompare
  {
    bool operator()(const std::string& a, const std::string& b) const
    {
      return std::lexicographical_compare(
          a.begin(), a.end(), b.begin(), b.end(),
          [](char x, char y)
          {
            return std::tolower(static_cast<unsigned char>(x)) <
                   std::tolower(static_cast<unsigned char>(y));
          });
    }

    static bool equals(const std::string& a, const std::string& b)
    {
      CaseInsensitiveCompare less;
      return !less(a, b) && !less(b, a);
    }
  };

  /// \brief HTTP headers with case-insensitive keys. Repeated headers are
  /// folded into one comma separated value.
  using HttpHeaders = std::map<std::string, std::string, CaseInsensitiveCompare>;

  inline std::string trim(const std::string& s)
  {
    auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos)
    {
      return {};
    }
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
  }

  /// \brief Parse a "Name: value" line into \p headers. Lines without a colon
  /// are ignored. Returns true if a header was added.
  inline bool parseHeaderLine(const std::string& line, HttpHeaders& headers)
  {
    auto colonPos = line.find(':');
    if (colonPos == std::string::npos)
    {
      return false;
    }
    std::string key = trim(line.substr(0, colonPos));
    std::string value = trim(line.substr(colonPos + 1));
    if (key.empty())
    {
      return false;
    }
    auto it = headers.find(key);
    if (it != headers.end())
    {
      it->second += ", " + value;
    }
    else
    {
      headers.emplace(key, value);
    }
    return true;
  }

  inline std::string toUpper(std::string s)
  {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
  }

  /// \brief POST, PUT and PATCH carry an entity body.
  inline bool isEntityEnclosing(const std::string& method)
  {
    auto upper = toUpper(method);
    return upper == "POST" || upper == "PUT" || upper == "PATCH";
  }

} // namespace message
} // namespace courier
