// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Courier, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#pragma once

#include "courier/adapter/curl/curl_factory.hpp"
#include "courier/adapter/curl/curl_multi.hpp"
#include "courier/adapter/transaction.hpp"
#include "courier/adapter/transaction_iterator.hpp"
#include "courier/core/exceptions.hpp"
#include "courier/core/logger.hpp"

#include <curl/curl.h>

#include <exception>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <utility>

namespace courier
{
namespace adapter
{
namespace curl
{

  /// \brief State shared by one send or batch run over a multi handle.
  /// \details Every easy handle registered with the multi handle maps to
  /// exactly one transaction until it completes. Owned by a single send or
  /// sendAll call; never shared between concurrent runs.
  class BatchContext
  {
  public:
    /// \brief A transfer removed from the context.
    struct Entry
    {
      Transaction* transaction = nullptr;
      TransactionPtr owner;
      std::unique_ptr<CurlHandle> handle;
    };

    /// \param throwsExceptions failures propagate to the caller instead of
    /// staying on their transaction
    /// \param pending transactions still to start, null for a single send
    BatchContext(CurlMulti& multi, bool throwsExceptions, TransactionIterator* pending = nullptr)
      : _multi(multi), _throwsExceptions(throwsExceptions), _pending(pending)
    {
    }

    ~BatchContext() { removeAll(); }

    BatchContext(const BatchContext&) = delete;
    BatchContext& operator=(const BatchContext&) = delete;

    CurlMulti& getMultiHandle() const { return _multi; }

    bool throwsExceptions() const { return _throwsExceptions; }

    /// \brief True for a sendAll run, false for a single send.
    bool isBatch() const { return _pending != nullptr; }

    /// \brief Next transaction of the batch, null when there is none left.
    TransactionPtr nextPending() { return _pending ? _pending->next() : nullptr; }

    /// \brief Register \p handle with the multi handle on behalf of
    /// \p transaction. \p owner keeps batch-created transactions alive.
    /// \return the CURLMcode of the registration
    int addTransaction(Transaction& transaction, TransactionPtr owner,
                       std::unique_ptr<CurlHandle> handle)
    {
      CURL* easy = handle->get();
      int rc = _multi.add(easy);
      if (rc == CURLM_OK)
      {
        Entry entry;
        entry.transaction = &transaction;
        entry.owner = std::move(owner);
        entry.handle = std::move(handle);
        _handles.emplace(easy, std::move(entry));
      }
      return rc;
    }

    bool hasTransaction(CURL* easy) const { return _handles.count(easy) > 0; }

    /// \brief Unregister the transfer of \p easy. The returned entry is empty
    /// when \p easy is unknown.
    Entry removeTransaction(CURL* easy)
    {
      auto it = _handles.find(easy);
      if (it == _handles.end())
      {
        return Entry{};
      }
      detach(easy);
      Entry entry = std::move(it->second);
      _handles.erase(it);
      return entry;
    }

    /// \brief Number of transfers registered with the multi handle.
    std::size_t activeCount() const { return _handles.size(); }

    bool isActive() const { return !_handles.empty(); }

    /// \brief Record that \p transaction is being retried. Returns false
    /// when it was already retried once.
    bool markRetried(const Transaction& transaction)
    {
      return _retried.insert(&transaction).second;
    }

    bool wasRetried(const Transaction& transaction) const
    {
      return _retried.count(&transaction) > 0;
    }

    /// \brief Keep the first batch failure until the loop iteration that
    /// produced it has settled.
    void deferException(std::exception_ptr error)
    {
      if (!_deferred)
      {
        _deferred = std::move(error);
      }
    }

    bool hasDeferredException() const { return _deferred != nullptr; }

    /// \brief Throw the deferred failure, if any.
    void rethrowDeferred()
    {
      if (_deferred)
      {
        std::exception_ptr error = _deferred;
        _deferred = nullptr;
        std::rethrow_exception(error);
      }
    }

    /// \brief Detach every remaining transfer from the multi handle.
    void removeAll()
    {
      for (const auto& item : _handles)
      {
        detach(item.first);
      }
      _handles.clear();
    }

  private:
    CurlMulti& _multi;
    bool _throwsExceptions;
    TransactionIterator* _pending;
    std::map<CURL*, Entry> _handles;
    std::set<const Transaction*> _retried;
    std::exception_ptr _deferred;

    void detach(CURL* easy)
    {
      int rc = _multi.remove(easy);
      if (rc != CURLM_OK)
      {
        COURIER_LOG_WARN("curl_multi_remove_handle failed: " << curl_multi_strerror(
                             static_cast<CURLMcode>(rc)));
      }
    }
  };

} // namespace curl
} // namespace adapter
} // namespace courier
