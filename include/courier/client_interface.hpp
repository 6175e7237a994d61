// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Courier, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#pragma once

#include "courier/adapter/transaction_iterator.hpp"
#include "courier/core/exceptions.hpp"
#include "courier/core/json.hpp"
#include "courier/event/event_emitter.hpp"

#include <string>
#include <vector>

namespace courier
{

/// \brief Client surface consumed by transactions and subscribers.
class ClientInterface
{
public:
  virtual ~ClientInterface() = default;

  /// \brief Create a request carrying the client's default options and a
  /// copy of its listeners.
  virtual RequestPtr createRequest(const std::string& method, const std::string& url = "",
                                   const core::Json& options = core::Json::object()) = 0;

  /// \brief Send a request and return its final response.
  /// \throws RequestError when the transfer fails and no listener recovers
  virtual ResponsePtr send(RequestPtr request) = 0;

  /// \brief Send requests concurrently. Outcomes are observed through the
  /// listeners in \p options or through the requests' own listeners.
  virtual void sendAll(std::vector<RequestPtr> requests,
                       const adapter::SendAllOptions& options = {}) = 0;

  virtual event::EventEmitter& getEmitter() = 0;

  /// \brief Read a config value by "a/b/c" path; the whole config for an
  /// empty path. Null when absent.
  virtual core::Json getConfig(const std::string& path = "") const = 0;

  virtual void setConfig(const std::string& path, const core::Json& value) = 0;

  virtual std::string getBaseUrl() const = 0;
};

} // namespace courier
