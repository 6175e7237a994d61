// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Courier, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace courier
{
namespace message
{

  /// \brief URL or relative reference split into its RFC 3986 components.
  /// Path and query are kept percent-encoded.
  class Url
  {
  public:
    Url() = default;

    /// \brief Parse an absolute URL or a relative reference. Characters that
    /// are not valid in a path or query (spaces...) are percent-encoded.
    static Url fromString(const std::string& url)
    {
      Url result;
      std::string remaining = url;

      auto fragmentPos = remaining.find('#');
      if (fragmentPos != std::string::npos)
      {
        result._fragment = remaining.substr(fragmentPos + 1);
        remaining = remaining.substr(0, fragmentPos);
      }

      auto queryPos = remaining.find('?');
      if (queryPos != std::string::npos)
      {
        result._query = encode(remaining.substr(queryPos + 1), true);
        remaining = remaining.substr(0, queryPos);
      }

      auto colonPos = remaining.find(':');
      if (colonPos != std::string::npos && colonPos > 0 && isScheme(remaining.substr(0, colonPos)))
      {
        result._scheme = remaining.substr(0, colonPos);
        std::transform(result._scheme.begin(), result._scheme.end(), result._scheme.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        remaining = remaining.substr(colonPos + 1);
      }

      if (remaining.compare(0, 2, "//") == 0)
      {
        remaining = remaining.substr(2);
        auto pathStart = remaining.find('/');
        std::string authority = remaining.substr(0, pathStart);
        remaining = pathStart == std::string::npos ? std::string{} : remaining.substr(pathStart);
        result.parseAuthority(authority);
      }

      result._path = encode(remaining, false);
      return result;
    }

    const std::string& getScheme() const { return _scheme; }
    const std::string& getHost() const { return _host; }
    const std::string& getUserInfo() const { return _userInfo; }
    std::optional<std::uint16_t> getPort() const { return _port; }
    const std::string& getPath() const { return _path; }
    const std::string& getQuery() const { return _query; }
    const std::string& getFragment() const { return _fragment; }

    /// \brief Port in effect, defaulting from the scheme.
    std::uint16_t getEffectivePort() const
    {
      if (_port)
      {
        return *_port;
      }
      return _scheme == "https" ? 443 : 80;
    }

    void setScheme(const std::string& scheme) { _scheme = scheme; }
    void setHost(const std::string& host) { _host = host; }
    void setPort(std::optional<std::uint16_t> port) { _port = port; }
    void setPath(const std::string& path) { _path = encode(path, false); }
    void setQuery(const std::string& query) { _query = encode(query, true); }
    void setFragment(const std::string& fragment) { _fragment = fragment; }

    /// \brief Scheme and host are both present.
    bool isAbsolute() const { return !_scheme.empty() && !_host.empty(); }

    /// \brief Path plus query string, as sent on the request line.
    std::string getResource() const
    {
      std::string resource = _path;
      if (!_host.empty() && (resource.empty() || resource[0] != '/'))
      {
        resource.insert(resource.begin(), '/');
      }
      if (!_query.empty())
      {
        resource += "?" + _query;
      }
      return resource;
    }

    /// \brief Resolve \p relative against this URL (RFC 3986 section 5.2).
    Url combine(const Url& relative) const
    {
      Url target;
      if (!relative._scheme.empty())
      {
        target = relative;
        target._path = removeDotSegments(relative._path);
        return target;
      }

      if (!relative._host.empty())
      {
        target._userInfo = relative._userInfo;
        target._host = relative._host;
        target._port = relative._port;
        target._path = removeDotSegments(relative._path);
        target._query = relative._query;
      }
      else
      {
        target._userInfo = _userInfo;
        target._host = _host;
        target._port = _port;
        if (relative._path.empty())
        {
          target._path = _path;
          target._query = relative._query.empty() ? _query : relative._query;
        }
        else
        {
          if (relative._path[0] == '/')
          {
            target._path = removeDotSegments(relative._path);
          }
          else
          {
            target._path = removeDotSegments(merge(relative._path));
          }
          target._query = relative._query;
        }
      }
      target._scheme = _scheme;
      target._fragment = relative._fragment;
      return target;
    }

    Url combine(const std::string& relative) const { return combine(fromString(relative)); }

    std::string toString() const
    {
      std::string result;
      if (!_scheme.empty())
      {
        result += _scheme + ":";
      }
      if (!_host.empty())
      {
        result += "//";
        if (!_userInfo.empty())
        {
          result += _userInfo + "@";
        }
        result += _host;
        if (_port && *_port != defaultPort(_scheme))
        {
          result += ":" + std::to_string(*_port);
        }
      }
      if (!_host.empty() && !_path.empty() && _path[0] != '/')
      {
        result += "/";
      }
      result += _path;
      if (!_query.empty())
      {
        result += "?" + _query;
      }
      if (!_fragment.empty())
      {
        result += "#" + _fragment;
      }
      return result;
    }

    bool operator==(const Url& other) const { return toString() == other.toString(); }

  private:
    std::string _scheme;
    std::string _userInfo;
    std::string _host;
    std::optional<std::uint16_t> _port;
    std::string _path;
    std::string _query;
    std::string _fragment;

    static std::uint16_t defaultPort(const std::string& scheme)
    {
      if (scheme == "http")
      {
        return 80;
      }
      if (scheme == "https")
      {
        return 443;
      }
      return 0;
    }

    static bool isScheme(const std::string& candidate)
    {
      if (candidate.empty() || !std::isalpha(static_cast<unsigned char>(candidate[0])))
      {
        return false;
      }
      return std::all_of(candidate.begin(), candidate.end(),
                         [](unsigned char c)
                         { return std::isalnum(c) || c == '+' || c == '-' || c == '.'; });
    }

    void parseAuthority(std::string authority)
    {
      auto at = authority.rfind('@');
      if (at != std::string::npos)
      {
        _userInfo = authority.substr(0, at);
        authority = authority.substr(at + 1);
      }

      std::string portPart;
      if (!authority.empty() && authority[0] == '[')
      {
        auto close = authority.find(']');
        if (close == std::string::npos)
        {
          throw std::invalid_argument("Invalid IPv6 host in URL: " + authority);
        }
        _host = authority.substr(0, close + 1);
        if (close + 1 < authority.size() && authority[close + 1] == ':')
        {
          portPart = authority.substr(close + 2);
        }
      }
      else
      {
        auto portPos = authority.find(':');
        _host = authority.substr(0, portPos);
        if (portPos != std::string::npos)
        {
          portPart = authority.substr(portPos + 1);
        }
      }
      std::transform(_host.begin(), _host.end(), _host.begin(),
                     [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

      if (!portPart.empty())
      {
        if (!std::all_of(portPart.begin(), portPart.end(),
                         [](unsigned char c) { return std::isdigit(c); }) ||
            portPart.size() > 5 || std::stoul(portPart) > 65535)
        {
          throw std::invalid_argument("Invalid port in URL: " + portPart);
        }
        _port = static_cast<std::uint16_t>(std::stoul(portPart));
      }
    }

    std::string merge(const std::string& relativePath) const
    {
      if (!_host.empty() && _path.empty())
      {
        return "/" + relativePath;
      }
      auto lastSlash = _path.rfind('/');
      if (lastSlash == std::string::npos)
      {
        return relativePath;
      }
      return _path.substr(0, lastSlash + 1) + relativePath;
    }

    static std::string removeDotSegments(const std::string& path)
    {
      if (path.find('.') == std::string::npos)
      {
        return path;
      }

      std::vector<std::string> output;
      std::size_t pos = 0;
      bool absolute = !path.empty() && path[0] == '/';
      if (absolute)
      {
        pos = 1;
      }
      bool trailingSlash = false;
      while (pos <= path.size())
      {
        auto next = path.find('/', pos);
        std::string segment =
            path.substr(pos, next == std::string::npos ? std::string::npos : next - pos);
        bool last = next == std::string::npos;
        if (segment == "..")
        {
          if (!output.empty())
          {
            output.pop_back();
          }
          trailingSlash = last;
        }
        else if (segment == ".")
        {
          trailingSlash = last;
        }
        else
        {
          output.push_back(segment);
          trailingSlash = false;
        }
        if (last)
        {
          break;
        }
        pos = next + 1;
      }

      std::string result = absolute ? "/" : "";
      for (std::size_t i = 0; i < output.size(); ++i)
      {
        if (i > 0)
        {
          result += "/";
        }
        result += output[i];
      }
      if (trailingSlash && (result.empty() || result.back() != '/'))
      {
        result += "/";
      }
      return result;
    }

    /// \brief Percent-encode characters outside the path (or query) grammar.
    /// Existing escapes are kept.
    static std::string encode(const std::string& value, bool query)
    {
      static const char* hex = "0123456789ABCDEF";
      std::string result;
      result.reserve(value.size());
      for (unsigned char c : value)
      {
        bool allowed = std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~' ||
                       c == '!' || c == '$' || c == '&' || c == '\'' || c == '(' || c == ')' ||
                       c == '*' || c == '+' || c == ',' || c == ';' || c == '=' || c == ':' ||
                       c == '@' || c == '/' || c == '%' || (query && c == '?');
        if (allowed)
        {
          result += static_cast<char>(c);
        }
        else
        {
          result += '%';
          result += hex[c >> 4];
          result += hex[c & 0x0F];
        }
      }
      return result;
    }
  };

} // namespace message
} // namespace courier
