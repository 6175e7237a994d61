// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Courier, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#pragma once

#include "courier/adapter/transaction.hpp"
#include "courier/adapter/transaction_iterator.hpp"
#include "courier/core/exceptions.hpp"

#include <string>

namespace courier
{
namespace adapter
{

  /// \brief Turns a transaction into a completed response.
  /// \details Implementations must emit before-send prior to any I/O and
  /// then exactly one of after-send or error per attempt, honoring any
  /// response a listener intercepts with.
  class AdapterInterface
  {
  public:
    virtual ~AdapterInterface() = default;

    /// \brief Transfer a single transaction.
    /// \return the final response (the adapter's own or an intercepted one)
    /// \throws RequestError when the transfer fails and no listener recovers
    virtual ResponsePtr send(Transaction& transaction) = 0;
  };

  /// \brief Adapter able to run many transactions concurrently.
  class ParallelAdapterInterface
  {
  public:
    virtual ~ParallelAdapterInterface() = default;

    /// \brief Transfer every transaction of \p transactions with at most
    /// \p parallel transfers in flight. Outcomes are left on the
    /// transactions.
    /// \param throwExceptions raise the first unintercepted failure once the
    /// batch loop iteration that produced it has settled
    /// \throws InvalidArgumentError when \p parallel is not positive
    /// \throws AdapterError when the multiplexer itself fails
    virtual void sendAll(TransactionIterator& transactions, int parallel,
                         bool throwExceptions = false) = 0;

  protected:
    static void checkParallel(int parallel)
    {
      if (parallel <= 0)
      {
        throw InvalidArgumentError("parallel must be a positive integer, got " +
                                   std::to_string(parallel));
      }
    }
  };

} // namespace adapter
} // namespace courier
