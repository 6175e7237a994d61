// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Courier, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#pragma once

#include "courier/adapter/transaction.hpp"
#include "courier/core/exceptions.hpp"
#include "courier/core/logger.hpp"
#include "courier/event/events.hpp"
#include "courier/message/request.hpp"
#include "courier/message/response.hpp"

#include <exception>
#include <utility>

namespace courier
{
namespace event
{

  /// \brief Helpers every adapter uses to emit the transaction lifecycle
  /// events with the same interception and error-wrapping rules.
  class RequestEvents
  {
  public:
    /// Run before every other listener
    static constexpr int EARLY = 10000;
    /// Run after every other listener
    static constexpr int LATE = -10000;
    static constexpr int REDIRECT_RESPONSE = 200;
    static constexpr int VERIFY_RESPONSE = 100;
    static constexpr int PREPARE_REQUEST = -100;

    /// \brief Emit before-send. When a listener intercepts, after-send is
    /// emitted for the supplied response. A failure thrown by a listener is
    /// offered to the error listeners; AdapterError is never offered.
    /// \throws RequestError when the failure is not intercepted.
    static void emitBeforeSend(adapter::Transaction& transaction)
    {
      bool intercepted = false;
      try
      {
        BeforeSendEvent event(transaction);
        transaction.getRequest()->getEmitter().emit(event);
        intercepted = event.isIntercepted();
      }
      catch (RequestError& e)
      {
        if (e.emittedError())
        {
          throw;
        }
        emitError(transaction, std::current_exception());
        return;
      }
      catch (const AdapterError&)
      {
        throw;
      }
      catch (const std::exception&)
      {
        emitError(transaction, std::current_exception());
        return;
      }

      if (intercepted)
      {
        COURIER_LOG_DEBUG("before-send intercepted for " << transaction.getRequest()->getUrl());
        emitAfterSend(transaction);
      }
    }

    /// \brief Emit after-send for the transaction's response. The response
    /// first receives the request URL as its effective URL.
    /// \throws RequestError when a listener failure is not intercepted.
    static void emitAfterSend(adapter::Transaction& transaction)
    {
      transaction.getResponse()->setEffectiveUrl(transaction.getRequest()->getUrl());
      transaction.setState(adapter::TransferState::Completed);
      try
      {
        AfterSendEvent event(transaction);
        transaction.getRequest()->getEmitter().emit(event);
      }
      catch (RequestError& e)
      {
        if (e.emittedError())
        {
          throw;
        }
        emitError(transaction, std::current_exception());
      }
      catch (const AdapterError&)
      {
        throw;
      }
      catch (const std::exception&)
      {
        emitError(transaction, std::current_exception());
      }
    }

    /// \brief Offer \p failure to the error listeners. Failures other than
    /// RequestError are wrapped in one carrying the transaction's request.
    /// \throws RequestError (the wrapped failure) unless a listener
    /// intercepted it.
    static void emitError(adapter::Transaction& transaction, std::exception_ptr failure)
    {
      std::exception_ptr error = wrap(transaction, failure);
      transaction.setException(error);
      transaction.setState(adapter::TransferState::Failed);

      ErrorEvent event(transaction);
      transaction.getRequest()->getEmitter().emit(event);
      if (event.isIntercepted())
      {
        COURIER_LOG_DEBUG("error intercepted for " << transaction.getRequest()->getUrl());
        transaction.getResponse()->setEffectiveUrl(transaction.getRequest()->getUrl());
        transaction.setState(adapter::TransferState::Completed);
        return;
      }
      std::rethrow_exception(error);
    }

  private:
    static std::exception_ptr wrap(adapter::Transaction& transaction, std::exception_ptr failure)
    {
      try
      {
        std::rethrow_exception(failure);
      }
      catch (RequestError& e)
      {
        e.setEmittedError(true);
        return failure;
      }
      catch (const std::exception& e)
      {
        RequestError wrapped(e.what(), transaction.getRequest(), transaction.getResponse(),
                             failure);
        wrapped.setEmittedError(true);
        return std::make_exception_ptr(wrapped);
      }
      return failure;
    }
  };

} // namespace event
} // namespace courier
