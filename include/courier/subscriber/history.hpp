// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Courier, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#pragma once

#include "courier/event/events.hpp"
#include "courier/event/request_events.hpp"
#include "courier/event/subscriber_interface.hpp"

#include <cstddef>
#include <deque>
#include <utility>
#include <vector>

namespace courier
{
namespace subscriber
{

  /// \brief Keeps the most recent exchanges seen by the emitters it is
  /// attached to. Failed exchanges are recorded with the response received
  /// before the failure, if any.
  class History : public event::SubscriberInterface
  {
  public:
    struct Entry
    {
      RequestPtr request;
      ResponsePtr response;
    };

    explicit History(std::size_t limit = 10) : _limit(limit) {}

    std::vector<event::Subscription> getEvents() override
    {
      return {event::subscribe<event::AfterSendEvent>(
                  [this](event::AfterSendEvent& e) { add(e.getRequest(), e.getResponse()); },
                  event::RequestEvents::EARLY),
              event::subscribe<event::ErrorEvent>(
                  [this](event::ErrorEvent& e) { add(e.getRequest(), e.getResponse()); },
                  event::RequestEvents::EARLY)};
    }

    /// \brief Requests in the order they completed.
    std::vector<RequestPtr> getRequests() const
    {
      std::vector<RequestPtr> requests;
      for (const auto& entry : _entries)
      {
        requests.push_back(entry.request);
      }
      return requests;
    }

    const std::deque<Entry>& getEntries() const { return _entries; }

    RequestPtr getLastRequest() const
    {
      return _entries.empty() ? nullptr : _entries.back().request;
    }

    ResponsePtr getLastResponse() const
    {
      return _entries.empty() ? nullptr : _entries.back().response;
    }

    std::size_t count() const { return _entries.size(); }

    void clear() { _entries.clear(); }

  private:
    std::size_t _limit;
    std::deque<Entry> _entries;

    void add(RequestPtr request, ResponsePtr response)
    {
      _entries.push_back({std::move(request), std::move(response)});
      while (_entries.size() > _limit)
      {
        _entries.pop_front();
      }
    }
  };

} // namespace subscriber
} // namespace courier
