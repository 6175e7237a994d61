// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Courier, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#pragma once

#include "courier/adapter/transaction.hpp"
#include "courier/event/events.hpp"
#include "courier/event/request_events.hpp"
#include "courier/message/request.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <utility>
#include <vector>

namespace courier
{
namespace adapter
{

  /// \brief Options of a batch send.
  struct SendAllOptions
  {
    /// Maximum number of transfers in flight at once
    int parallel = 50;
    /// Raise the first unintercepted failure out of the batch call instead
    /// of leaving it on its transaction
    bool exceptions = false;
    /// Optional listeners attached to every request of the batch
    std::function<void(event::BeforeSendEvent&)> before;
    std::function<void(event::AfterSendEvent&)> after;
    std::function<void(event::ErrorEvent&)> error;
    int priority = 0;
  };

  /// \brief Lazy sequence of transactions consumed by a parallel adapter.
  /// \details Transactions are produced one at a time as the adapter asks for
  /// them, so a batch never materializes more than it has in flight.
  class TransactionIterator
  {
  public:
    using Generator = std::function<TransactionPtr()>;
    using RequestGenerator = std::function<RequestPtr()>;

    /// \param next returns the next transaction, or null when exhausted
    explicit TransactionIterator(Generator next) : _next(std::move(next)) {}

    static TransactionIterator fromTransactions(std::vector<TransactionPtr> transactions)
    {
      auto items = std::make_shared<std::vector<TransactionPtr>>(std::move(transactions));
      auto index = std::make_shared<std::size_t>(0);
      return TransactionIterator(
          [items, index]() -> TransactionPtr
          {
            if (*index >= items->size())
            {
              return nullptr;
            }
            return (*items)[(*index)++];
          });
    }

    static TransactionIterator fromRequests(ClientInterface& client,
                                            std::vector<RequestPtr> requests,
                                            const SendAllOptions& options = {})
    {
      auto items = std::make_shared<std::vector<RequestPtr>>(std::move(requests));
      auto index = std::make_shared<std::size_t>(0);
      return fromRequestGenerator(
          client,
          [items, index]() -> RequestPtr
          {
            if (*index >= items->size())
            {
              return nullptr;
            }
            return (*items)[(*index)++];
          },
          options);
    }

    /// \param next returns the next request, or null when exhausted
    static TransactionIterator fromRequestGenerator(ClientInterface& client,
                                                    RequestGenerator next,
                                                    const SendAllOptions& options = {})
    {
      SendAllOptions listeners = options;
      return TransactionIterator(
          [&client, next = std::move(next), listeners]() -> TransactionPtr
          {
            RequestPtr request = next();
            if (!request)
            {
              return nullptr;
            }
            attachListeners(*request, listeners);
            return std::make_shared<Transaction>(client, std::move(request));
          });
    }

    /// \brief Next transaction, or null when the sequence is exhausted.
    TransactionPtr next()
    {
      if (_exhausted)
      {
        return nullptr;
      }
      TransactionPtr transaction = _next();
      if (!transaction)
      {
        _exhausted = true;
        return nullptr;
      }
      ++_produced;
      return transaction;
    }

    bool exhausted() const { return _exhausted; }

    /// \brief Number of transactions handed out so far.
    std::size_t produced() const { return _produced; }

  private:
    Generator _next;
    bool _exhausted = false;
    std::size_t _produced = 0;

    static void attachListeners(message::Request& request, const SendAllOptions& options)
    {
      auto& emitter = request.getEmitter();
      if (options.before)
      {
        emitter.on<event::BeforeSendEvent>(options.before, options.priority);
      }
      if (options.after)
      {
        emitter.on<event::AfterSendEvent>(options.after, options.priority);
      }
      if (options.error)
      {
        emitter.on<event::ErrorEvent>(options.error, options.priority);
      }
    }
  };

} // namespace adapter
} // namespace courier
