// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Courier, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#pragma once
/// \file message_factory.hpp
/// \brief Builds requests from option objects and responses from parsed or
/// raw HTTP/1.x data

#include "courier/core/exceptions.hpp"
#include "courier/core/json.hpp"
#include "courier/message/headers.hpp"
#include "courier/message/request.hpp"
#include "courier/message/response.hpp"
#include "courier/message/stream.hpp"

#include <cstdint>
#include <limits>
#include <memory>
#include <sstream>
#include <string>

namespace courier
{
namespace message
{

  /// \brief Parsed "HTTP/x.y CODE Reason" line
  struct StatusLine
  {
    std::string version = "1.1";
    int statusCode = 0;
    std::string reasonPhrase;
  };

  /// \brief Parse a response status line. Returns false when \p line is not
  /// one.
  inline bool parseStatusLine(const std::string& line, StatusLine& status)
  {
    if (line.compare(0, 5, "HTTP/") != 0)
    {
      return false;
    }
    std::istringstream iss(line);
    std::string version;
    int code = 0;
    if (!(iss >> version >> code))
    {
      return false;
    }
    std::string remaining;
    std::getline(iss, remaining);
    status.version = version.substr(5);
    status.statusCode = code;
    status.reasonPhrase = trim(remaining);
    return true;
  }

  /// \brief Creates request and response messages
  class MessageFactory
  {
  public:
    static constexpr int DEFAULT_MAX_REDIRECTS = 5;

    virtual ~MessageFactory() = default;

    /// \brief Create a request and apply \p options to it.
    /// \details Recognized options:
    ///   - "headers": object of header name to string (or array of strings)
    ///   - "body": string
    ///   - "query": object of query parameters appended to the URL
    ///   - "allow_redirects": bool, "strict", or {"max": n, "strict": bool}
    ///   - "exceptions": bool
    ///   - "timeout", "connect_timeout": seconds
    ///   - "verify": bool or CA bundle path
    ///   - "config": object merged into the request config
    /// \throws InvalidArgumentError on an unknown option or a mistyped value
    virtual RequestPtr createRequest(const std::string& method, const std::string& url,
                                     const core::Json& options = core::Json::object())
    {
      auto request = std::make_shared<Request>(method, url);
      if (options.is_null())
      {
        return request;
      }
      if (!options.is_object())
      {
        throw InvalidArgumentError("Request options must be an object");
      }
      for (auto it = options.begin(); it != options.end(); ++it)
      {
        applyOption(*request, it.key(), it.value());
      }
      return request;
    }

    virtual ResponsePtr createResponse(int statusCode, HttpHeaders headers = {},
                                       StreamPtr body = nullptr, std::string reasonPhrase = "")
    {
      return std::make_shared<Response>(statusCode, std::move(headers), std::move(body),
                                        std::move(reasonPhrase));
    }

    /// \brief Parse a complete raw HTTP/1.x response message.
    /// \throws std::invalid_argument when the message is malformed
    ResponsePtr fromMessage(const std::string& raw)
    {
      auto headerEnd = raw.find("\r\n\r\n");
      std::size_t separator = 4;
      if (headerEnd == std::string::npos)
      {
        headerEnd = raw.find("\n\n");
        separator = 2;
      }
      std::string headerSection = raw.substr(0, headerEnd);
      std::string body =
          headerEnd == std::string::npos ? std::string{} : raw.substr(headerEnd + separator);

      std::istringstream headerStream(headerSection);
      std::string line;
      StatusLine status;
      HttpHeaders headers;
      bool firstLine = true;
      while (std::getline(headerStream, line))
      {
        if (!line.empty() && line.back() == '\r')
        {
          line.pop_back();
        }
        if (firstLine)
        {
          if (!parseStatusLine(line, status))
          {
            throw std::invalid_argument("Invalid HTTP response status line: " + line);
          }
          firstLine = false;
        }
        else if (!line.empty())
        {
          parseHeaderLine(line, headers);
        }
      }
      if (firstLine)
      {
        throw std::invalid_argument("Invalid HTTP response: empty message");
      }

      auto response = createResponse(status.statusCode, std::move(headers),
                                     body.empty() ? nullptr : makeStream(std::move(body)),
                                     status.reasonPhrase);
      response->setProtocolVersion(status.version);
      return response;
    }

  protected:
    virtual void applyOption(Request& request, const std::string& name, const core::Json& value)
    {
      auto& config = request.getConfig();
      if (name == "headers")
      {
        requireType(name, value.is_object(), "an object");
        for (auto it = value.begin(); it != value.end(); ++it)
        {
          request.setHeader(it.key(), headerValue(it.key(), it.value()));
        }
      }
      else if (name == "body")
      {
        if (value.is_null())
        {
          request.setBody(nullptr);
          return;
        }
        requireType(name, value.is_string(), "a string");
        request.setBody(makeStream(value.get<std::string>()));
      }
      else if (name == "query")
      {
        requireType(name, value.is_object(), "an object");
        applyQuery(request, value);
      }
      else if (name == "allow_redirects")
      {
        applyRedirects(request, value);
      }
      else if (name == "exceptions")
      {
        requireType(name, value.is_boolean(), "a boolean");
        config["exceptions"] = value;
      }
      else if (name == "timeout" || name == "connect_timeout")
      {
        requireType(name, value.is_number(), "a number");
        config[name] = value;
      }
      else if (name == "verify")
      {
        requireType(name, value.is_boolean() || value.is_string(), "a boolean or a path");
        config["verify"] = value;
      }
      else if (name == "config")
      {
        requireType(name, value.is_object(), "an object");
        core::mergeRecursive(config, value);
      }
      else
      {
        throw InvalidArgumentError("No method is configured to handle the " + name +
                                   " config key");
      }
    }

  private:
    static void requireType(const std::string& name, bool ok, const char* expected)
    {
      if (!ok)
      {
        throw InvalidArgumentError("The " + name + " option must be " + expected);
      }
    }

    static std::string headerValue(const std::string& name, const core::Json& value)
    {
      if (value.is_string())
      {
        return value.get<std::string>();
      }
      if (value.is_array())
      {
        std::string joined;
        for (const auto& item : value)
        {
          requireType("headers." + name, item.is_string(), "a string");
          if (!joined.empty())
          {
            joined += ", ";
          }
          joined += item.get<std::string>();
        }
        return joined;
      }
      if (value.is_number() || value.is_boolean())
      {
        return value.dump();
      }
      throw InvalidArgumentError("Invalid value for header " + name);
    }

    static void applyQuery(Request& request, const core::Json& params)
    {
      Url url = request.getUrlObject();
      std::string query = url.getQuery();
      for (auto it = params.begin(); it != params.end(); ++it)
      {
        if (!query.empty())
        {
          query += '&';
        }
        query += it.key();
        if (!it.value().is_null())
        {
          query += '=';
          query += it.value().is_string() ? it.value().get<std::string>() : it.value().dump();
        }
      }
      url.setQuery(query);
      request.setUrl(url);
    }

    static void applyRedirects(Request& request, const core::Json& value)
    {
      auto& config = request.getConfig();
      core::Json redirect = {{"max", DEFAULT_MAX_REDIRECTS}, {"strict", false}};
      if (value.is_boolean())
      {
        if (!value.get<bool>())
        {
          config.erase("redirect");
          return;
        }
      }
      else if (value.is_string() && value.get<std::string>() == "strict")
      {
        redirect["strict"] = true;
      }
      else if (value.is_object())
      {
        if (value.contains("max"))
        {
          requireType("allow_redirects.max",
                      value["max"].is_number_integer() &&
                          value["max"].get<std::int64_t>() >= 0 &&
                          value["max"].get<std::int64_t>() <= std::numeric_limits<int>::max(),
                      "a non-negative integer that fits in an int");
          redirect["max"] = value["max"];
        }
        if (value.contains("strict"))
        {
          requireType("allow_redirects.strict", value["strict"].is_boolean(), "a boolean");
          redirect["strict"] = value["strict"];
        }
      }
      else
      {
        throw InvalidArgumentError(
            "allow_redirects must be true, false, \"strict\", or an object");
      }
      config["redirect"] = redirect;
    }
  };

} // namespace message
} // namespace courier
