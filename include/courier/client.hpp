// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Courier, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#pragma once
/// \file client.hpp
/// \brief HTTP client built on pluggable transfer adapters and request
/// events

#include "courier/adapter/adapter_interface.hpp"
#include "courier/adapter/curl/curl_adapter.hpp"
#include "courier/adapter/fake_parallel_adapter.hpp"
#include "courier/adapter/transaction.hpp"
#include "courier/adapter/transaction_iterator.hpp"
#include "courier/client_interface.hpp"
#include "courier/core/exceptions.hpp"
#include "courier/core/json.hpp"
#include "courier/core/logger.hpp"
#include "courier/event/event_emitter.hpp"
#include "courier/message/message_factory.hpp"
#include "courier/message/request.hpp"
#include "courier/message/response.hpp"
#include "courier/message/url.hpp"
#include "courier/subscriber/http_error.hpp"
#include "courier/subscriber/redirect.hpp"

#include <curl/curl.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace courier
{

/// \brief HTTP client.
/// \details Every request the client creates starts from the client's
/// "defaults" options and a value copy of the client's listeners, so
/// subscribers added to the client apply to requests created afterwards.
/// Redirect following and HTTP error exceptions are registered by default
/// and governed per request by "allow_redirects" and "exceptions".
class Client : public ClientInterface
{
public:
  static constexpr const char* VERSION = "1.0.0";

  struct Config
  {
    /// Base URL relative request URLs are resolved against
    std::string baseUrl;
    /// Request options applied to every request (overridden per request)
    core::Json defaults;
    /// Single-send adapter; a CurlAdapter when unset
    std::shared_ptr<adapter::AdapterInterface> adapter;
    /// Batch adapter; the adapter itself when it supports batches, else a
    /// sequential wrapper around it
    std::shared_ptr<adapter::ParallelAdapterInterface> parallelAdapter;
    std::shared_ptr<message::MessageFactory> messageFactory;

    Config() : defaults(core::Json::object()) {}

    /// \brief Build from {"base_url": "...", "defaults": {...}}.
    /// \throws InvalidArgumentError on mistyped keys
    static Config fromJson(const core::Json& json)
    {
      Config config;
      if (json.contains("base_url"))
      {
        if (!json["base_url"].is_string())
        {
          throw InvalidArgumentError("base_url must be a string");
        }
        config.baseUrl = json["base_url"].get<std::string>();
      }
      if (json.contains("defaults"))
      {
        if (!json["defaults"].is_object())
        {
          throw InvalidArgumentError("defaults must be an object");
        }
        config.defaults = json["defaults"];
      }
      return config;
    }
  };

  explicit Client(Config config = Config())
    : _messageFactory(config.messageFactory ? std::move(config.messageFactory)
                                            : std::make_shared<message::MessageFactory>())
  {
    _adapter = config.adapter ? std::move(config.adapter)
                              : std::make_shared<adapter::curl::CurlAdapter>(_messageFactory);
    if (config.parallelAdapter)
    {
      _parallelAdapter = std::move(config.parallelAdapter);
    }
    else if (auto parallel =
                 std::dynamic_pointer_cast<adapter::ParallelAdapterInterface>(_adapter))
    {
      _parallelAdapter = std::move(parallel);
    }
    else
    {
      _parallelAdapter = std::make_shared<adapter::FakeParallelAdapter>(_adapter);
    }

    _config = core::Json::object();
    _config["base_url"] = config.baseUrl;
    _config["defaults"] = buildDefaults(config.defaults);

    _emitter.addSubscriber(std::make_shared<subscriber::Redirect>());
    _emitter.addSubscriber(std::make_shared<subscriber::HttpError>());
  }

  Client(const Client&) = delete;
  Client& operator=(const Client&) = delete;

  /// \brief "Courier/<version> curl/<libcurl version>"
  static std::string getDefaultUserAgent()
  {
    std::string agent = std::string("Courier/") + VERSION;
    if (const curl_version_info_data* info = curl_version_info(CURLVERSION_NOW))
    {
      agent += std::string(" curl/") + info->version;
    }
    return agent;
  }

  RequestPtr createRequest(const std::string& method, const std::string& url = "",
                           const core::Json& options = core::Json::object()) override
  {
    core::Json merged = _config["defaults"];
    if (!options.is_null())
    {
      if (!options.is_object())
      {
        throw InvalidArgumentError("Request options must be an object");
      }
      core::mergeRecursive(merged, options);
    }
    auto request = _messageFactory->createRequest(method, buildUrl(url), merged);
    request->setEmitter(_emitter);
    return request;
  }

  ResponsePtr get(const std::string& url = "", const core::Json& options = core::Json::object())
  {
    return send(createRequest("GET", url, options));
  }

  ResponsePtr head(const std::string& url = "", const core::Json& options = core::Json::object())
  {
    return send(createRequest("HEAD", url, options));
  }

  ResponsePtr del(const std::string& url = "", const core::Json& options = core::Json::object())
  {
    return send(createRequest("DELETE", url, options));
  }

  ResponsePtr put(const std::string& url = "", const core::Json& options = core::Json::object())
  {
    return send(createRequest("PUT", url, options));
  }

  ResponsePtr patch(const std::string& url = "", const core::Json& options = core::Json::object())
  {
    return send(createRequest("PATCH", url, options));
  }

  ResponsePtr post(const std::string& url = "", const core::Json& options = core::Json::object())
  {
    return send(createRequest("POST", url, options));
  }

  ResponsePtr options(const std::string& url = "",
                      const core::Json& options = core::Json::object())
  {
    return send(createRequest("OPTIONS", url, options));
  }

  ResponsePtr send(RequestPtr request) override
  {
    adapter::Transaction transaction(*this, request);
    try
    {
      if (auto response = _adapter->send(transaction))
      {
        return response;
      }
    }
    catch (const RequestError&)
    {
      throw;
    }
    catch (const TransferError& e)
    {
      throw RequestError(e.what(), request, nullptr, std::current_exception());
    }
    throw std::logic_error("No response was associated with the transaction");
  }

  void sendAll(std::vector<RequestPtr> requests,
               const adapter::SendAllOptions& options = {}) override
  {
    auto transactions =
        adapter::TransactionIterator::fromRequests(*this, std::move(requests), options);
    _parallelAdapter->sendAll(transactions, options.parallel, options.exceptions);
  }

  /// \brief Send requests produced lazily by \p next until it returns null.
  void sendAll(adapter::TransactionIterator::RequestGenerator next,
               const adapter::SendAllOptions& options = {})
  {
    auto transactions =
        adapter::TransactionIterator::fromRequestGenerator(*this, std::move(next), options);
    _parallelAdapter->sendAll(transactions, options.parallel, options.exceptions);
  }

  event::EventEmitter& getEmitter() override { return _emitter; }

  core::Json getConfig(const std::string& path = "") const override
  {
    if (path.empty())
    {
      return _config;
    }
    auto pointer = core::toPointer(path);
    return _config.contains(pointer) ? _config.at(pointer) : core::Json();
  }

  /// \brief Set a config value by path. "defaults" must stay an object.
  void setConfig(const std::string& path, const core::Json& value) override
  {
    if (path.empty())
    {
      throw InvalidArgumentError("A config path is required");
    }
    auto pointer = core::toPointer(path);
    if (pointer == core::Json::json_pointer("/defaults") && !value.is_object())
    {
      throw InvalidArgumentError("defaults must be an object");
    }
    if (pointer == core::Json::json_pointer("/base_url") && !value.is_string())
    {
      throw InvalidArgumentError("base_url must be a string");
    }
    _config[pointer] = value;
  }

  std::string getBaseUrl() const override { return _config["base_url"].get<std::string>(); }

  const std::shared_ptr<adapter::AdapterInterface>& getAdapter() const { return _adapter; }

  const std::shared_ptr<adapter::ParallelAdapterInterface>& getParallelAdapter() const
  {
    return _parallelAdapter;
  }

private:
  std::shared_ptr<message::MessageFactory> _messageFactory;
  std::shared_ptr<adapter::AdapterInterface> _adapter;
  std::shared_ptr<adapter::ParallelAdapterInterface> _parallelAdapter;
  event::EventEmitter _emitter;
  core::Json _config;

  static core::Json buildDefaults(const core::Json& overrides)
  {
    core::Json defaults = {{"allow_redirects", true}, {"exceptions", true}, {"verify", true}};
    core::mergeRecursive(defaults, overrides);

    bool hasUserAgent = false;
    if (defaults.contains("headers") && defaults["headers"].is_object())
    {
      for (auto it = defaults["headers"].begin(); it != defaults["headers"].end(); ++it)
      {
        if (message::CaseInsensitiveCompare::equals(it.key(), "User-Agent"))
        {
          hasUserAgent = true;
        }
      }
    }
    if (!hasUserAgent)
    {
      defaults["headers"]["User-Agent"] = getDefaultUserAgent();
    }
    return defaults;
  }

  /// \brief Absolute URLs are used as-is; anything else is resolved against
  /// the base URL.
  std::string buildUrl(const std::string& url) const
  {
    std::string base = getBaseUrl();
    if (url.empty())
    {
      return base;
    }
    if (url.compare(0, 4, "http") == 0 || base.empty())
    {
      return url;
    }
    return message::Url::fromString(base).combine(url).toString();
  }
};

} // namespace courier
