// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Courier, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#pragma once

#include "courier/core/json.hpp"
#include "courier/event/event_emitter.hpp"
#include "courier/message/headers.hpp"
#include "courier/message/stream.hpp"
#include "courier/message/url.hpp"

#include <memory>
#include <string>

namespace courier
{
namespace message
{

  /// \brief HTTP request message.
  /// \details Copying a request yields an independent request: headers,
  /// URL, config and the listener table are copied by value. The body stream
  /// is shared between the copies.
  class Request
  {
  public:
    Request(const std::string& method, const std::string& url, HttpHeaders headers = {},
            StreamPtr body = nullptr)
      : _method(toUpper(method)),
        _url(Url::fromString(url)),
        _headers(std::move(headers)),
        _config(core::Json::object())
    {
      setBody(std::move(body));
    }

    Request(const Request&) = default;
    Request& operator=(const Request&) = default;

    const std::string& getMethod() const { return _method; }
    void setMethod(const std::string& method) { _method = toUpper(method); }

    std::string getUrl() const { return _url.toString(); }
    const Url& getUrlObject() const { return _url; }
    void setUrl(const std::string& url) { _url = Url::fromString(url); }
    void setUrl(const Url& url) { _url = url; }

    const std::string& getScheme() const { return _url.getScheme(); }
    const std::string& getHost() const { return _url.getHost(); }
    const std::string& getPath() const { return _url.getPath(); }
    const std::string& getQuery() const { return _url.getQuery(); }
    std::string getResource() const { return _url.getResource(); }

    const HttpHeaders& getHeaders() const { return _headers; }

    /// \brief Get header value (case-insensitive). Empty when absent.
    std::string getHeader(const std::string& name) const
    {
      auto it = _headers.find(name);
      return it != _headers.end() ? it->second : std::string{};
    }

    bool hasHeader(const std::string& name) const { return _headers.count(name) > 0; }

    void setHeader(const std::string& name, const std::string& value) { _headers[name] = value; }

    void removeHeader(const std::string& name) { _headers.erase(name); }

    const StreamPtr& getBody() const { return _body; }

    /// \brief Replace the body. A null body drops Content-Length and
    /// Transfer-Encoding; a sized body sets Content-Length unless the request
    /// is chunked.
    void setBody(StreamPtr body)
    {
      _body = std::move(body);
      if (!_body)
      {
        _headers.erase("Content-Length");
        _headers.erase("Transfer-Encoding");
        return;
      }
      auto size = _body->getSize();
      if (size && !hasHeader("Transfer-Encoding"))
      {
        _headers["Content-Length"] = std::to_string(*size);
      }
    }

    event::EventEmitter& getEmitter() { return _emitter; }
    const event::EventEmitter& getEmitter() const { return _emitter; }
    void setEmitter(const event::EventEmitter& emitter) { _emitter = emitter; }

    /// \brief Per-request settings ("redirect", "exceptions", "timeout"...).
    core::Json& getConfig() { return _config; }
    const core::Json& getConfig() const { return _config; }

  private:
    std::string _method;
    Url _url;
    HttpHeaders _headers;
    StreamPtr _body;
    event::EventEmitter _emitter;
    core::Json _config;
  };

} // namespace message
} // namespace courier
