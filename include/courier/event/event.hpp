// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Courier, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#pragma once

namespace courier
{
namespace event
{

  /// \brief Closed set of events a request emitter dispatches.
  enum class EventType
  {
    BeforeSend,
    AfterSend,
    Error
  };

  inline const char* toString(EventType type)
  {
    switch (type)
    {
    case EventType::BeforeSend:
      return "before-send";
    case EventType::AfterSend:
      return "after-send";
    case EventType::Error:
      return "error";
    default:
      return "unknown";
    }
  }

  /// \brief One occurrence of an event. Owned by the code that emits it;
  /// listeners may mutate it while it is being dispatched.
  class Event
  {
  public:
    virtual ~Event() = default;

    virtual EventType type() const = 0;

    /// \brief Skip the remaining listeners of the current dispatch.
    void stopPropagation() { _propagationStopped = true; }

    bool isPropagationStopped() const { return _propagationStopped; }

  private:
    bool _propagationStopped = false;
  };

} // namespace event
} // namespace courier
