// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Courier, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#pragma once
/// \file curl_factory.hpp
/// \brief Translates a request into a configured libcurl easy handle and
/// collects the response it produces

#include "courier/adapter/transaction.hpp"
#include "courier/core/exceptions.hpp"
#include "courier/core/logger.hpp"
#include "courier/message/message_factory.hpp"
#include "courier/message/request.hpp"
#include "courier/message/response.hpp"
#include "courier/message/stream.hpp"

#include <curl/curl.h>

#include <cstdint>
#include <cstdio>
#include <cstring>
#include <memory>
#include <string>

namespace courier
{
namespace adapter
{
namespace curl
{

  /// \brief Text for a transport result code, tolerating codes libcurl does
  /// not define.
  inline std::string curlErrorString(int code)
  {
    if (code < 0 || code >= static_cast<int>(CURL_LAST))
    {
      return "Unknown error";
    }
    return curl_easy_strerror(static_cast<CURLcode>(code));
  }

  /// \brief Owns one easy handle plus everything libcurl references while the
  /// transfer runs (header list, URL, body source, response buffers).
  class CurlHandle
  {
  public:
    CurlHandle(CURL* easy, RequestPtr request) : _easy(easy), _request(std::move(request))
    {
      _errorBuffer[0] = '\0';
    }

    ~CurlHandle()
    {
      if (_headerList)
      {
        curl_slist_free_all(_headerList);
      }
      if (_easy)
      {
        curl_easy_cleanup(_easy);
      }
    }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;

    CURL* get() const { return _easy; }

    const RequestPtr& getRequest() const { return _request; }

    /// \brief True once a status line was received.
    bool hasStatus() const { return _status.statusCode != 0; }

    const message::StatusLine& getStatus() const { return _status; }

    const message::HttpHeaders& getResponseHeaders() const { return _responseHeaders; }

    const std::string& getResponseBody() const { return _responseBody; }

    /// \brief libcurl's detailed message for the last failure, may be empty.
    std::string getErrorDetail() const { return _errorBuffer; }

    /// \brief Build the response received by this handle.
    /// \return null when no status line was received
    ResponsePtr createResponse(message::MessageFactory& factory)
    {
      if (!hasStatus())
      {
        return nullptr;
      }
      auto response =
          factory.createResponse(_status.statusCode, _responseHeaders,
                                 message::makeStream(std::move(_responseBody)),
                                 _status.reasonPhrase);
      response->setProtocolVersion(_status.version);
      return response;
    }

  private:
    friend class CurlFactory;

    CURL* _easy;
    RequestPtr _request;
    message::StreamPtr _body;
    curl_slist* _headerList = nullptr;
    std::string _url;
    std::string _caInfo;
    std::string _method;
    char _errorBuffer[CURL_ERROR_SIZE];

    message::StatusLine _status;
    message::HttpHeaders _responseHeaders;
    std::string _responseBody;

    static size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userdata)
    {
      auto* self = static_cast<CurlHandle*>(userdata);
      const size_t total = size * nitems;
      std::string line(buffer, total);
      while (!line.empty() && (line.back() == '\n' || line.back() == '\r'))
      {
        line.pop_back();
      }
      message::StatusLine status;
      if (message::parseStatusLine(line, status))
      {
        // Interim (1xx) responses and each response of a sequence start over
        self->_status = status;
        self->_responseHeaders.clear();
      }
      else if (!line.empty())
      {
        message::parseHeaderLine(line, self->_responseHeaders);
      }
      return total;
    }

    static size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata)
    {
      auto* self = static_cast<CurlHandle*>(userdata);
      self->_responseBody.append(ptr, size * nmemb);
      return size * nmemb;
    }

    static size_t readCallback(char* buffer, size_t size, size_t nitems, void* userdata)
    {
      auto* self = static_cast<CurlHandle*>(userdata);
      try
      {
        std::string chunk = self->_body->read(size * nitems);
        std::memcpy(buffer, chunk.data(), chunk.size());
        return chunk.size();
      }
      catch (const std::exception& e)
      {
        COURIER_LOG_ERROR("Reading the body of " << self->_url << " failed: " << e.what());
        return CURL_READFUNC_ABORT;
      }
    }

    static int seekCallback(void* userdata, curl_off_t offset, int origin)
    {
      auto* self = static_cast<CurlHandle*>(userdata);
      if (origin != SEEK_SET || !self->_body->isSeekable())
      {
        return CURL_SEEKFUNC_CANTSEEK;
      }
      return self->_body->seek(static_cast<std::int64_t>(offset)) ? CURL_SEEKFUNC_OK
                                                                   : CURL_SEEKFUNC_FAIL;
    }
  };

  /// \brief Creates configured easy handles for transactions.
  /// \details Request config keys honored: "timeout" and "connect_timeout"
  /// (seconds), "verify" (false disables peer verification, a string names
  /// a CA bundle).
  class CurlFactory
  {
  public:
    virtual ~CurlFactory() = default;

    /// \brief Create an easy handle ready to be added to a multi handle.
    /// \throws RequestError when the request cannot be prepared
    virtual std::unique_ptr<CurlHandle> createHandle(Transaction& transaction)
    {
      const RequestPtr& request = transaction.getRequest();

      message::Url url = request->getUrlObject();
      url.setFragment("");
      if (!url.isAbsolute())
      {
        throw RequestError("Cannot send a request to a relative URL: " + url.toString(),
                           request);
      }

      CURL* easy = curl_easy_init();
      if (!easy)
      {
        throw RequestError("Unable to create a cURL easy handle", request);
      }
      auto handle = std::make_unique<CurlHandle>(easy, request);
      handle->_url = url.toString();
      handle->_method = request->getMethod();

      setopt(*handle, CURLOPT_URL, handle->_url.c_str());
      setopt(*handle, CURLOPT_NOSIGNAL, 1L);
      setopt(*handle, CURLOPT_FOLLOWLOCATION, 0L);
      setopt(*handle, CURLOPT_ERRORBUFFER, handle->_errorBuffer);
      setopt(*handle, CURLOPT_HEADERFUNCTION, &CurlHandle::headerCallback);
      setopt(*handle, CURLOPT_HEADERDATA, handle.get());
      setopt(*handle, CURLOPT_WRITEFUNCTION, &CurlHandle::writeCallback);
      setopt(*handle, CURLOPT_WRITEDATA, handle.get());

      applyMethod(*handle, *request);
      applyHeaders(*handle, *request);
      applyConfig(*handle, request->getConfig());

      COURIER_LOG_DEBUG("Created cURL handle for " << handle->_method << " " << handle->_url);
      return handle;
    }

  protected:
    template <typename T> static void setopt(CurlHandle& handle, CURLoption option, T value)
    {
      CURLcode rc = curl_easy_setopt(handle._easy, option, value);
      if (rc != CURLE_OK)
      {
        throw RequestError("Unable to set cURL option " +
                               std::to_string(static_cast<int>(option)) + ": " +
                               curl_easy_strerror(rc),
                           handle._request);
      }
    }

    static void applyMethod(CurlHandle& handle, const message::Request& request)
    {
      const std::string& method = handle._method;
      const auto& body = request.getBody();

      if (method == "HEAD")
      {
        setopt(handle, CURLOPT_NOBODY, 1L);
        return;
      }
      if (method == "GET" && !body)
      {
        setopt(handle, CURLOPT_HTTPGET, 1L);
        return;
      }

      setopt(handle, CURLOPT_CUSTOMREQUEST, method.c_str());
      if (body)
      {
        handle._body = body;
        setopt(handle, CURLOPT_UPLOAD, 1L);
        setopt(handle, CURLOPT_READFUNCTION, &CurlHandle::readCallback);
        setopt(handle, CURLOPT_READDATA, &handle);
        setopt(handle, CURLOPT_SEEKFUNCTION, &CurlHandle::seekCallback);
        setopt(handle, CURLOPT_SEEKDATA, &handle);
        if (auto size = body->getSize())
        {
          setopt(handle, CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(*size));
        }
      }
      else if (message::isEntityEnclosing(method))
      {
        setopt(handle, CURLOPT_POSTFIELDS, "");
        setopt(handle, CURLOPT_POSTFIELDSIZE, 0L);
      }
    }

    static void applyHeaders(CurlHandle& handle, const message::Request& request)
    {
      for (const auto& [name, value] : request.getHeaders())
      {
        appendHeader(handle, value.empty() ? name + ";" : name + ": " + value);
      }
      // Never wait for a 100-continue unless asked to
      if (!request.hasHeader("Expect"))
      {
        appendHeader(handle, "Expect:");
      }
      if (!request.hasHeader("Accept"))
      {
        appendHeader(handle, "Accept:");
      }
      if (handle._method == "POST" && !request.hasHeader("Content-Type"))
      {
        appendHeader(handle, "Content-Type:");
      }
      setopt(handle, CURLOPT_HTTPHEADER, handle._headerList);
    }

    static void appendHeader(CurlHandle& handle, const std::string& line)
    {
      curl_slist* list = curl_slist_append(handle._headerList, line.c_str());
      if (!list)
      {
        throw RequestError("Unable to allocate the cURL header list", handle._request);
      }
      handle._headerList = list;
    }

    static void applyConfig(CurlHandle& handle, const core::Json& config)
    {
      if (config.contains("timeout") && config["timeout"].is_number())
      {
        setopt(handle, CURLOPT_TIMEOUT_MS,
               static_cast<long>(config["timeout"].get<double>() * 1000));
      }
      if (config.contains("connect_timeout") && config["connect_timeout"].is_number())
      {
        setopt(handle, CURLOPT_CONNECTTIMEOUT_MS,
               static_cast<long>(config["connect_timeout"].get<double>() * 1000));
      }
      if (config.contains("verify"))
      {
        const auto& verify = config["verify"];
        if (verify.is_boolean() && !verify.get<bool>())
        {
          setopt(handle, CURLOPT_SSL_VERIFYPEER, 0L);
          setopt(handle, CURLOPT_SSL_VERIFYHOST, 0L);
        }
        else if (verify.is_string())
        {
          handle._caInfo = verify.get<std::string>();
          setopt(handle, CURLOPT_CAINFO, handle._caInfo.c_str());
          setopt(handle, CURLOPT_SSL_VERIFYPEER, 1L);
          setopt(handle, CURLOPT_SSL_VERIFYHOST, 2L);
        }
        else
        {
          setopt(handle, CURLOPT_SSL_VERIFYPEER, 1L);
          setopt(handle, CURLOPT_SSL_VERIFYHOST, 2L);
        }
      }
    }
  };

} // namespace curl
} // namespace adapter
} // namespace courier
