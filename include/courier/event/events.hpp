// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Courier, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#pragma once

#include "courier/adapter/transaction.hpp"
#include "courier/core/exceptions.hpp"
#include "courier/event/event.hpp"

#include <exception>
#include <string>
#include <utility>

namespace courier
{
namespace event
{

  /// \brief Common state of the events dispatched for one transaction.
  class TransactionEvent : public Event
  {
  public:
    explicit TransactionEvent(adapter::Transaction& transaction) : _transaction(transaction) {}

    adapter::Transaction& getTransaction() const { return _transaction; }
    const RequestPtr& getRequest() const { return _transaction.getRequest(); }
    ClientInterface& getClient() const { return _transaction.getClient(); }

    /// \brief True once a listener supplied the final response.
    bool isIntercepted() const { return _intercepted; }

  protected:
    void setInterceptedResponse(ResponsePtr response)
    {
      if (!response)
      {
        throw InvalidArgumentError(std::string("Cannot intercept a ") + toString(type()) +
                                   " event with a null response");
      }
      _transaction.setResponse(std::move(response));
      _intercepted = true;
      stopPropagation();
    }

    adapter::Transaction& _transaction;

  private:
    bool _intercepted = false;
  };

  /// \brief Emitted before any I/O happens for a transaction.
  class BeforeSendEvent : public TransactionEvent
  {
  public:
    static constexpr EventType Type = EventType::BeforeSend;

    using TransactionEvent::TransactionEvent;

    EventType type() const override { return Type; }

    /// \brief Skip the transfer and complete the transaction with
    /// \p response. The adapter emits after-send for it.
    void intercept(ResponsePtr response) { setInterceptedResponse(std::move(response)); }
  };

  /// \brief Emitted when a transaction received a response.
  class AfterSendEvent : public TransactionEvent
  {
  public:
    static constexpr EventType Type = EventType::AfterSend;

    using TransactionEvent::TransactionEvent;

    EventType type() const override { return Type; }

    const ResponsePtr& getResponse() const { return _transaction.getResponse(); }

    /// \brief Replace the transaction's response with \p response.
    void intercept(ResponsePtr response) { setInterceptedResponse(std::move(response)); }
  };

  /// \brief Emitted when a transaction failed. The failure is always a
  /// RequestError.
  class ErrorEvent : public TransactionEvent
  {
  public:
    static constexpr EventType Type = EventType::Error;

    using TransactionEvent::TransactionEvent;

    EventType type() const override { return Type; }

    /// \brief Response received before the failure, if any (e.g. a 404
    /// rejected by the HTTP error policy).
    const ResponsePtr& getResponse() const { return _transaction.getResponse(); }

    std::exception_ptr getException() const { return _transaction.getException(); }

    /// \brief The failure as \p E, or null when it is of another type. The
    /// pointer stays valid while the transaction holds the failure.
    template <typename E> const E* exceptionAs() const
    {
      auto exception = _transaction.getException();
      if (!exception)
      {
        return nullptr;
      }
      try
      {
        std::rethrow_exception(exception);
      }
      catch (const E& e)
      {
        return &e;
      }
      catch (const std::exception&)
      {
        return nullptr;
      }
    }

    std::string getMessage() const
    {
      const auto* error = exceptionAs<RequestError>();
      return error ? error->what() : std::string{};
    }

    /// \brief Recover from the failure: \p response becomes the final
    /// response and the failure is discarded.
    void intercept(ResponsePtr response)
    {
      setInterceptedResponse(std::move(response));
      _transaction.setException(nullptr);
    }
  };

} // namespace event
} // namespace courier
