// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Courier, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#pragma once
/// \file curl_adapter.hpp
/// \brief Adapter driving single and batched transfers through a libcurl
/// multi handle
///
/// One thread runs the whole loop. Transfers overlap only in their I/O
/// waits; every event dispatch happens synchronously between two polls of the
/// multi handle.
///
/// Per transfer: QUEUED -> ACTIVE -> (COMPLETED | FAILED) -> [RETRYING ->
/// ACTIVE]. A transfer is retried at most once, and only for transport
/// results typical of a stale reused connection.

#include "courier/adapter/adapter_interface.hpp"
#include "courier/adapter/curl/batch_context.hpp"
#include "courier/adapter/curl/curl_factory.hpp"
#include "courier/adapter/curl/curl_multi.hpp"
#include "courier/adapter/transaction.hpp"
#include "courier/adapter/transaction_iterator.hpp"
#include "courier/core/exceptions.hpp"
#include "courier/core/logger.hpp"
#include "courier/event/request_events.hpp"
#include "courier/message/message_factory.hpp"

#include <curl/curl.h>

#include <cstddef>
#include <exception>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace courier
{
namespace adapter
{
namespace curl
{

  /// \brief HTTP adapter backed by the libcurl multi interface.
  class CurlAdapter : public AdapterInterface, public ParallelAdapterInterface
  {
  public:
    struct Options
    {
      /// Builds easy handles; replaceable to customize or fail preparation
      std::shared_ptr<CurlFactory> handleFactory;
      /// Idle multi handles kept for reuse
      std::size_t maxHandles = 3;
      /// Upper bound of one wait for transfer activity
      int selectTimeoutMs = 1000;
    };

    explicit CurlAdapter(std::shared_ptr<message::MessageFactory> messageFactory)
      : CurlAdapter(std::move(messageFactory), Options{})
    {
    }

    explicit CurlAdapter(std::shared_ptr<message::MessageFactory> messageFactory, Options options)
      : _messageFactory(std::move(messageFactory)),
        _handleFactory(options.handleFactory ? std::move(options.handleFactory)
                                             : std::make_shared<CurlFactory>()),
        _maxHandles(options.maxHandles),
        _selectTimeoutMs(options.selectTimeoutMs > 0 ? options.selectTimeoutMs : 1000)
    {
      if (!_messageFactory)
      {
        throw InvalidArgumentError("CurlAdapter requires a message factory");
      }
      ensureCurlGlobalInit();
    }

    /// \brief Transfer one transaction. Failures are raised immediately.
    ResponsePtr send(Transaction& transaction) override
    {
      MultiLease multi(*this);
      BatchContext context(multi.get(), true);
      addHandle(context, transaction, nullptr);
      perform(context, 1);
      return transaction.getResponse();
    }

    void sendAll(TransactionIterator& transactions, int parallel,
                 bool throwExceptions = false) override
    {
      checkParallel(parallel);
      MultiLease multi(*this);
      BatchContext context(multi.get(), throwExceptions, &transactions);
      COURIER_LOG_DEBUG("Starting batch with up to " << parallel << " transfers in flight");
      fill(context, parallel);
      perform(context, parallel);
      COURIER_LOG_DEBUG("Batch finished after " << transactions.produced() << " transactions");
    }

    /// \brief Classify the transport result of a finished transfer.
    /// \return false when \p result is success. Otherwise the failure is
    /// offered to the error listeners and true is returned; an unintercepted
    /// failure is raised, deferred, or left on the transaction as the
    /// context dictates.
    bool isCurlException(Transaction& transaction, int result, BatchContext& context)
    {
      if (result == CURLE_OK)
      {
        return false;
      }
      const RequestPtr& request = transaction.getRequest();
      std::string message = "[curl] (#" + std::to_string(result) + ") " +
                            curlErrorString(result) + " [url] " + request->getUrl();
      auto cause = std::make_exception_ptr(TransportError(result, message));
      try
      {
        event::RequestEvents::emitError(
            transaction, std::make_exception_ptr(RequestError(message, request, nullptr, cause)));
      }
      catch (const RequestError&)
      {
        throwException(context, transaction, std::current_exception());
      }
      return true;
    }

    /// \brief Validate a multi handle (control-plane) result.
    /// \throws AdapterError for any non-zero code
    static void checkCurlMultiResult(int code)
    {
      if (code == CURLM_OK || code == CURLM_CALL_MULTI_PERFORM)
      {
        return;
      }
      std::string text = code > CURLM_CALL_MULTI_PERFORM && code < CURLM_LAST
                             ? curl_multi_strerror(static_cast<CURLMcode>(code))
                             : "Unknown error";
      throw AdapterError("cURL error " + std::to_string(code) + ": " + text);
    }

  private:
    std::shared_ptr<message::MessageFactory> _messageFactory;
    std::shared_ptr<CurlFactory> _handleFactory;
    std::size_t _maxHandles;
    int _selectTimeoutMs;
    std::mutex _poolMutex;
    std::vector<std::unique_ptr<CurlMulti>> _idleHandles;

    /// \brief Borrows a multi handle for one send or batch. Nested sends
    /// (e.g. a redirect hop issued from a listener) borrow their own.
    class MultiLease
    {
    public:
      explicit MultiLease(CurlAdapter& adapter) : _adapter(adapter)
      {
        _multi = _adapter.checkoutMultiHandle();
      }

      ~MultiLease() { _adapter.releaseMultiHandle(std::move(_multi)); }

      MultiLease(const MultiLease&) = delete;
      MultiLease& operator=(const MultiLease&) = delete;

      CurlMulti& get() { return *_multi; }

    private:
      CurlAdapter& _adapter;
      std::unique_ptr<CurlMulti> _multi;
    };

    std::unique_ptr<CurlMulti> checkoutMultiHandle()
    {
      std::lock_guard<std::mutex> lock(_poolMutex);
      if (_idleHandles.empty())
      {
        return std::make_unique<CurlMulti>();
      }
      auto multi = std::move(_idleHandles.back());
      _idleHandles.pop_back();
      return multi;
    }

    void releaseMultiHandle(std::unique_ptr<CurlMulti> multi)
    {
      std::lock_guard<std::mutex> lock(_poolMutex);
      if (_idleHandles.size() < _maxHandles)
      {
        _idleHandles.push_back(std::move(multi));
      }
    }

    /// \brief Start transactions until \p parallel transfers are in flight
    /// or the batch is exhausted. Stops early once a failure is pending.
    void fill(BatchContext& context, int parallel)
    {
      while (!context.hasDeferredException() &&
             context.activeCount() < static_cast<std::size_t>(parallel))
      {
        TransactionPtr transaction = context.nextPending();
        if (!transaction)
        {
          break;
        }
        addHandle(context, *transaction, transaction);
      }
    }

    /// \brief Emit before-send and, unless a listener already produced the
    /// outcome, register a transfer for \p transaction.
    void addHandle(BatchContext& context, Transaction& transaction, TransactionPtr owner)
    {
      transaction.setState(TransferState::Queued);
      try
      {
        event::RequestEvents::emitBeforeSend(transaction);
      }
      catch (const RequestError&)
      {
        throwException(context, transaction, std::current_exception());
        return;
      }

      if (transaction.getResponse() || transaction.hasException())
      {
        return;
      }

      std::unique_ptr<CurlHandle> handle;
      try
      {
        handle = _handleFactory->createHandle(transaction);
      }
      catch (const RequestError&)
      {
        offerError(context, transaction, std::current_exception());
        return;
      }

      transaction.setState(TransferState::Active);
      checkCurlMultiResult(context.addTransaction(transaction, std::move(owner), std::move(handle)));
    }

    void perform(BatchContext& context, int parallel)
    {
      while (context.isActive())
      {
        int running = 0;
        int rc = CURLM_OK;
        do
        {
          rc = context.getMultiHandle().perform(running);
        } while (rc == CURLM_CALL_MULTI_PERFORM);
        checkCurlMultiResult(rc);

        bool progressed = processMessages(context, parallel);

        // Sibling results of this iteration are settled; surface the failure
        context.rethrowDeferred();

        if (!progressed && context.isActive())
        {
          checkCurlMultiResult(context.getMultiHandle().select(_selectTimeoutMs));
        }
      }
      context.rethrowDeferred();
    }

    /// \return true when at least one transfer finished
    bool processMessages(BatchContext& context, int parallel)
    {
      auto completions = context.getMultiHandle().readCompleted();
      for (const auto& done : completions)
      {
        BatchContext::Entry entry = context.removeTransaction(done.easy);
        if (!entry.transaction)
        {
          continue;
        }
        Transaction& transaction = *entry.transaction;
        COURIER_LOG_DEBUG("Transfer of " << transaction.getRequest()->getUrl() << " ("
                                         << toString(transaction.getState())
                                         << ") finished with result " << done.result);

        if (retryFailedTransfer(context, transaction, entry.owner, done.result))
        {
          continue;
        }

        if (!isCurlException(transaction, done.result, context))
        {
          complete(context, transaction, *entry.handle);
        }

        if (context.isBatch())
        {
          fill(context, parallel);
        }
      }
      return !completions.empty();
    }

    void complete(BatchContext& context, Transaction& transaction, CurlHandle& handle)
    {
      ResponsePtr response = handle.createResponse(*_messageFactory);
      if (!response)
      {
        offerError(context, transaction,
                   std::make_exception_ptr(RequestError(
                       "No response was received for " + transaction.getRequest()->getUrl(),
                       transaction.getRequest())));
        return;
      }
      transaction.setResponse(std::move(response));
      try
      {
        event::RequestEvents::emitAfterSend(transaction);
      }
      catch (const RequestError&)
      {
        throwException(context, transaction, std::current_exception());
      }
    }

    /// \brief Retry a transfer that failed the way a dropped keep-alive
    /// connection does, once, when its body can be replayed.
    bool retryFailedTransfer(BatchContext& context, Transaction& transaction,
                             TransactionPtr owner, int result)
    {
      if (result != CURLE_SEND_ERROR && result != CURLE_RECV_ERROR &&
          result != CURLE_GOT_NOTHING)
      {
        return false;
      }
      if (context.wasRetried(transaction))
      {
        return false;
      }
      const auto& body = transaction.getRequest()->getBody();
      if (body && body->tell() != 0 && !body->seek(0))
      {
        return false;
      }

      context.markRetried(transaction);
      COURIER_LOG_DEBUG("Retrying " << transaction.getRequest()->getUrl() << " after cURL error "
                                    << result);
      transaction.reset();

      std::unique_ptr<CurlHandle> handle;
      try
      {
        handle = _handleFactory->createHandle(transaction);
      }
      catch (const RequestError&)
      {
        offerError(context, transaction, std::current_exception());
        return true;
      }
      transaction.setState(TransferState::Active);
      checkCurlMultiResult(context.addTransaction(transaction, std::move(owner), std::move(handle)));
      return true;
    }

    /// \brief Emit error for \p error and apply the context's propagation
    /// policy when nothing intercepts.
    void offerError(BatchContext& context, Transaction& transaction, std::exception_ptr error)
    {
      try
      {
        event::RequestEvents::emitError(transaction, error);
      }
      catch (const RequestError&)
      {
        throwException(context, transaction, std::current_exception());
      }
    }

    /// \brief Apply the propagation policy to an unintercepted failure: a
    /// single send raises it now, a batch raises it once the current loop
    /// iteration settles, and a batch without exceptions leaves it on the
    /// transaction.
    void throwException(BatchContext& context, Transaction& transaction,
                        std::exception_ptr error)
    {
      transaction.setException(error);
      transaction.setState(TransferState::Failed);
      if (!context.throwsExceptions())
      {
        try
        {
          std::rethrow_exception(error);
        }
        catch (const std::exception& e)
        {
          COURIER_LOG_WARN("Transfer of " << transaction.getRequest()->getUrl()
                                          << " failed: " << e.what());
        }
        return;
      }
      if (context.isBatch())
      {
        COURIER_LOG_DEBUG("Deferring batch failure for " << transaction.getRequest()->getUrl());
        context.deferException(error);
        return;
      }
      std::rethrow_exception(error);
    }
  };

} // namespace curl
} // namespace adapter
} // namespace courier
