// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Courier, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#pragma once

#include "courier/message/headers.hpp"
#include "courier/message/stream.hpp"

#include <sstream>
#include <string>

namespace courier
{
namespace message
{

  /// \brief Standard reason phrase for \p statusCode, empty if unknown.
  inline std::string reasonPhraseFor(int statusCode)
  {
    switch (statusCode)
    {
    case 100:
      return "Continue";
    case 200:
      return "OK";
    case 201:
      return "Created";
    case 202:
      return "Accepted";
    case 204:
      return "No Content";
    case 206:
      return "Partial Content";
    case 301:
      return "Moved Permanently";
    case 302:
      return "Found";
    case 303:
      return "See Other";
    case 304:
      return "Not Modified";
    case 307:
      return "Temporary Redirect";
    case 308:
      return "Permanent Redirect";
    case 400:
      return "Bad Request";
    case 401:
      return "Unauthorized";
    case 403:
      return "Forbidden";
    case 404:
      return "Not Found";
    case 405:
      return "Method Not Allowed";
    case 409:
      return "Conflict";
    case 429:
      return "Too Many Requests";
    case 500:
      return "Internal Server Error";
    case 502:
      return "Bad Gateway";
    case 503:
      return "Service Unavailable";
    case 504:
      return "Gateway Timeout";
    default:
      return "";
    }
  }

  /// \brief HTTP response message
  class Response
  {
  public:
    explicit Response(int statusCode, HttpHeaders headers = {}, StreamPtr body = nullptr,
                      std::string reasonPhrase = "")
      : _statusCode(statusCode),
        _reasonPhrase(reasonPhrase.empty() ? reasonPhraseFor(statusCode)
                                           : std::move(reasonPhrase)),
        _headers(std::move(headers)),
        _body(std::move(body))
    {
    }

    int getStatusCode() const { return _statusCode; }
    const std::string& getReasonPhrase() const { return _reasonPhrase; }

    const std::string& getProtocolVersion() const { return _protocolVersion; }
    void setProtocolVersion(const std::string& version) { _protocolVersion = version; }

    bool isSuccess() const { return _statusCode >= 200 && _statusCode < 300; }
    bool isRedirection() const { return _statusCode >= 300 && _statusCode < 400; }
    bool isClientError() const { return _statusCode >= 400 && _statusCode < 500; }
    bool isServerError() const { return _statusCode >= 500 && _statusCode < 600; }

    const HttpHeaders& getHeaders() const { return _headers; }

    /// \brief Get header value (case-insensitive). Empty when absent.
    std::string getHeader(const std::string& name) const
    {
      auto it = _headers.find(name);
      return it != _headers.end() ? it->second : std::string{};
    }

    bool hasHeader(const std::string& name) const { return _headers.count(name) > 0; }

    void setHeader(const std::string& name, const std::string& value) { _headers[name] = value; }

    const StreamPtr& getBody() const { return _body; }
    void setBody(StreamPtr body) { _body = std::move(body); }

    /// \brief URL of the request that produced this response. After
    /// redirects this is the last hop.
    const std::string& getEffectiveUrl() const { return _effectiveUrl; }
    void setEffectiveUrl(const std::string& url) { _effectiveUrl = url; }

    /// \brief Convert to HTTP wire format
    std::string toString() const
    {
      std::ostringstream ss;
      ss << "HTTP/" << _protocolVersion << " " << _statusCode;
      if (!_reasonPhrase.empty())
      {
        ss << " " << _reasonPhrase;
      }
      ss << "\r\n";
      for (const auto& [key, value] : _headers)
      {
        ss << key << ": " << value << "\r\n";
      }
      ss << "\r\n";
      if (_body)
      {
        ss << _body->toString();
      }
      return ss.str();
    }

  private:
    int _statusCode;
    std::string _reasonPhrase;
    std::string _protocolVersion = "1.1";
    HttpHeaders _headers;
    StreamPtr _body;
    std::string _effectiveUrl;
  };

} // namespace message
} // namespace courier
