// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Courier, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#pragma once

#include "courier/core/exceptions.hpp"
#include "courier/event/event.hpp"
#include "courier/event/subscriber_interface.hpp"

#include <algorithm>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace courier
{
namespace event
{

  using ListenerId = std::uint64_t;

  /// \brief Whether a listener survives its first invocation.
  enum class ListenerKind
  {
    Persistent,
    Once
  };

  /// \brief Read-only view of a registered listener.
  struct ListenerInfo
  {
    ListenerId id;
    int priority;
    ListenerKind kind;
  };

  /// \brief Priority-ordered listener registry for the typed request events.
  /// \details
  ///   - Higher priority listeners run first; equal priorities run in
  ///     registration order.
  ///   - A Once listener is unregistered before it is invoked, so it is
  ///     gone even when it throws.
  ///   - Copying an emitter copies the listener table by value. The copy and
  ///     the original evolve independently afterwards.
  ///   - Listener exceptions are not caught here; they end the dispatch and
  ///     reach the caller of emit().
  class EventEmitter
  {
  public:
    using Listener = std::function<void(Event&)>;

    EventEmitter() = default;

    /// \brief Register a persistent listener for the typed event \p E.
    template <typename E, typename F> ListenerId on(F&& listener, int priority = 0)
    {
      return add(E::Type, wrap<E>(std::forward<F>(listener)), priority, ListenerKind::Persistent,
                 nullptr);
    }

    /// \brief Register a listener that is removed after its first invocation.
    template <typename E, typename F> ListenerId once(F&& listener, int priority = 0)
    {
      return add(E::Type, wrap<E>(std::forward<F>(listener)), priority, ListenerKind::Once,
                 nullptr);
    }

    ListenerId on(EventType type, Listener listener, int priority = 0)
    {
      return add(type, std::move(listener), priority, ListenerKind::Persistent, nullptr);
    }

    ListenerId once(EventType type, Listener listener, int priority = 0)
    {
      return add(type, std::move(listener), priority, ListenerKind::Once, nullptr);
    }

    /// \brief Remove a listener by the id returned at registration. Returns
    /// false when no such listener is registered.
    bool removeListener(EventType type, ListenerId id)
    {
      auto it = _listeners.find(type);
      if (it == _listeners.end())
      {
        return false;
      }
      auto& entries = it->second;
      auto pos = std::find_if(entries.begin(), entries.end(),
                              [id](const Entry& entry) { return entry.id == id; });
      if (pos == entries.end())
      {
        return false;
      }
      entries.erase(pos);
      if (entries.empty())
      {
        _listeners.erase(it);
      }
      return true;
    }

    /// \brief Listeners of one event in dispatch order.
    std::vector<ListenerInfo> listeners(EventType type) const
    {
      std::vector<ListenerInfo> result;
      auto it = _listeners.find(type);
      if (it != _listeners.end())
      {
        for (const auto& entry : it->second)
        {
          result.push_back({entry.id, entry.priority, entry.kind});
        }
      }
      return result;
    }

    /// \brief Every event that has listeners, each list in dispatch order.
    std::map<EventType, std::vector<ListenerInfo>> listeners() const
    {
      std::map<EventType, std::vector<ListenerInfo>> result;
      for (const auto& [type, entries] : _listeners)
      {
        result[type] = listeners(type);
      }
      return result;
    }

    bool hasListeners(EventType type) const { return _listeners.count(type) > 0; }

    /// \brief Dispatch \p event to the listeners of its type.
    /// \return the same event, possibly mutated by listeners.
    Event& emit(Event& event) { return dispatch(event.type(), event); }

    /// \brief Dispatch with an explicit event type. The type must match the
    /// event's own type.
    Event& emit(EventType type, Event& event)
    {
      if (type != event.type())
      {
        throw InvalidArgumentError(std::string("Cannot emit a ") + toString(event.type()) +
                                   " event as " + toString(type));
      }
      return dispatch(type, event);
    }

    template <typename E> E& emit(E& event)
    {
      dispatch(E::Type, event);
      return event;
    }

    /// \brief Register every listener \p subscriber declares. The emitter (and
    /// every copy of it) keeps the subscriber alive while its listeners are
    /// registered.
    void addSubscriber(std::shared_ptr<SubscriberInterface> subscriber)
    {
      if (!subscriber)
      {
        throw InvalidArgumentError("Cannot add a null subscriber");
      }
      auto& registered = _subscribers[subscriber.get()];
      for (auto& subscription : subscriber->getEvents())
      {
        auto id = add(subscription.event, std::move(subscription.listener),
                      subscription.priority, ListenerKind::Persistent, subscriber);
        registered.emplace_back(subscription.event, id);
      }
    }

    /// \brief Remove every listener previously registered for \p subscriber.
    void removeSubscriber(const SubscriberInterface& subscriber)
    {
      auto it = _subscribers.find(&subscriber);
      if (it == _subscribers.end())
      {
        return;
      }
      for (const auto& [type, id] : it->second)
      {
        removeListener(type, id);
      }
      _subscribers.erase(it);
    }

    bool hasSubscriber(const SubscriberInterface& subscriber) const
    {
      return _subscribers.count(&subscriber) > 0;
    }

  private:
    struct Entry
    {
      ListenerId id;
      int priority;
      ListenerKind kind;
      Listener listener;
      std::shared_ptr<SubscriberInterface> owner;
    };

    std::map<EventType, std::vector<Entry>> _listeners;
    std::map<const SubscriberInterface*, std::vector<std::pair<EventType, ListenerId>>>
        _subscribers;
    ListenerId _nextId = 1;

    template <typename E, typename F> static Listener wrap(F&& listener)
    {
      return [fn = std::forward<F>(listener)](Event& e) mutable { fn(static_cast<E&>(e)); };
    }

    ListenerId add(EventType type, Listener listener, int priority, ListenerKind kind,
                   std::shared_ptr<SubscriberInterface> owner)
    {
      if (!listener)
      {
        throw InvalidArgumentError(std::string("Cannot register an empty listener for ") +
                                   toString(type));
      }
      auto& entries = _listeners[type];
      // Insert after every entry with the same or higher priority
      auto pos = std::find_if(entries.begin(), entries.end(),
                              [priority](const Entry& entry) { return entry.priority < priority; });
      ListenerId id = _nextId++;
      entries.insert(pos, Entry{id, priority, kind, std::move(listener), std::move(owner)});
      return id;
    }

    bool isRegistered(EventType type, ListenerId id) const
    {
      auto it = _listeners.find(type);
      if (it == _listeners.end())
      {
        return false;
      }
      return std::any_of(it->second.begin(), it->second.end(),
                         [id](const Entry& entry) { return entry.id == id; });
    }

    Event& dispatch(EventType type, Event& event)
    {
      auto it = _listeners.find(type);
      if (it == _listeners.end())
      {
        return event;
      }

      // Listeners may register or remove listeners while running
      std::vector<Entry> snapshot = it->second;
      for (auto& entry : snapshot)
      {
        if (event.isPropagationStopped())
        {
          break;
        }
        if (!isRegistered(type, entry.id))
        {
          continue;
        }
        if (entry.kind == ListenerKind::Once)
        {
          removeListener(type, entry.id);
        }
        entry.listener(event);
      }
      return event;
    }
  };

} // namespace event
} // namespace courier
