// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Courier, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#pragma once

#include "courier/core/exceptions.hpp"

#include <exception>
#include <memory>
#include <utility>

namespace courier
{
class ClientInterface;

namespace adapter
{

  /// \brief Lifecycle of one transfer attempt inside an adapter.
  enum class TransferState
  {
    Queued,
    Active,
    Completed,
    Failed,
    Retrying
  };

  inline const char* toString(TransferState state)
  {
    switch (state)
    {
    case TransferState::Queued:
      return "queued";
    case TransferState::Active:
      return "active";
    case TransferState::Completed:
      return "completed";
    case TransferState::Failed:
      return "failed";
    case TransferState::Retrying:
      return "retrying";
    default:
      return "unknown";
    }
  }

  /// \brief Pairs a request with the response or failure of transferring it.
  /// \details A retry reuses the same transaction: the adapter clears the
  /// outcome and runs the next attempt on it.
  class Transaction
  {
  public:
    Transaction(ClientInterface& client, RequestPtr request)
      : _client(client), _request(std::move(request))
    {
      if (!_request)
      {
        throw InvalidArgumentError("A transaction requires a request");
      }
    }

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    ClientInterface& getClient() const { return _client; }

    const RequestPtr& getRequest() const { return _request; }

    const ResponsePtr& getResponse() const { return _response; }
    void setResponse(ResponsePtr response) { _response = std::move(response); }

    /// \brief Failure of the current attempt, null when none occurred.
    std::exception_ptr getException() const { return _exception; }
    void setException(std::exception_ptr exception) { _exception = std::move(exception); }
    bool hasException() const { return _exception != nullptr; }

    TransferState getState() const { return _state; }
    void setState(TransferState state) { _state = state; }

    /// \brief Clear the outcome so the transaction can be attempted again.
    void reset()
    {
      _response.reset();
      _exception = nullptr;
      _state = TransferState::Retrying;
    }

  private:
    ClientInterface& _client;
    RequestPtr _request;
    ResponsePtr _response;
    std::exception_ptr _exception;
    TransferState _state = TransferState::Queued;
  };

  using TransactionPtr = std::shared_ptr<Transaction>;

} // namespace adapter
} // namespace courier
