// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Courier, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#pragma once

#include "courier/event/event.hpp"

#include <functional>
#include <utility>
#include <vector>

namespace courier
{
namespace event
{

  /// \brief One (event, listener, priority) triple declared by a subscriber.
  struct Subscription
  {
    EventType event;
    std::function<void(Event&)> listener;
    int priority = 0;
  };

  /// \brief Bundle of listeners registered and removed as a unit.
  class SubscriberInterface
  {
  public:
    virtual ~SubscriberInterface() = default;

    /// \brief Listeners this subscriber wants registered.
    virtual std::vector<Subscription> getEvents() = 0;
  };

  /// \brief Build a Subscription for a typed event \p E from a callable
  /// taking \c E&.
  template <typename E, typename F> Subscription subscribe(F&& listener, int priority = 0)
  {
    return Subscription{E::Type,
                        [fn = std::forward<F>(listener)](Event& e) mutable
                        { fn(static_cast<E&>(e)); },
                        priority};
  }

} // namespace event
} // namespace courier
