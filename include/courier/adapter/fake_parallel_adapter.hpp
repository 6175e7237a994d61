// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Courier, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#pragma once

#include "courier/adapter/adapter_interface.hpp"
#include "courier/core/exceptions.hpp"
#include "courier/core/logger.hpp"

#include <exception>
#include <memory>
#include <utility>

namespace courier
{
namespace adapter
{

  /// \brief Runs a batch one transaction at a time over any single-send
  /// adapter.
  class FakeParallelAdapter : public ParallelAdapterInterface
  {
  public:
    explicit FakeParallelAdapter(std::shared_ptr<AdapterInterface> adapter)
      : _adapter(std::move(adapter))
    {
      if (!_adapter)
      {
        throw InvalidArgumentError("FakeParallelAdapter requires an adapter");
      }
    }

    void sendAll(TransactionIterator& transactions, int parallel,
                 bool throwExceptions = false) override
    {
      checkParallel(parallel);
      while (auto transaction = transactions.next())
      {
        try
        {
          _adapter->send(*transaction);
        }
        catch (const RequestError& e)
        {
          if (throwExceptions)
          {
            throw;
          }
          COURIER_LOG_WARN("Batch transfer of " << transaction->getRequest()->getUrl()
                                                << " failed: " << e.what());
          transaction->setException(std::current_exception());
        }
      }
    }

  private:
    std::shared_ptr<AdapterInterface> _adapter;
  };

} // namespace adapter
} // namespace courier
