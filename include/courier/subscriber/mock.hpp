// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Courier, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#pragma once

#include "courier/event/events.hpp"
#include "courier/event/request_events.hpp"
#include "courier/event/subscriber_interface.hpp"
#include "courier/message/message_factory.hpp"
#include "courier/message/request.hpp"
#include "courier/message/response.hpp"

#include <cstddef>
#include <deque>
#include <exception>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace courier
{
namespace subscriber
{

  /// \brief Answers requests from a queue instead of the network.
  /// \details Listens on before-send with the lowest priority so every
  /// other listener sees the request first. Each request consumes one queue
  /// item: a response intercepts the request, an exception is thrown from
  /// the listener.
  class Mock : public event::SubscriberInterface
  {
  public:
    using Item = std::variant<ResponsePtr, std::exception_ptr>;

    /// \param readBodies consume request bodies as a transfer would
    explicit Mock(std::vector<std::string> messages = {}, bool readBodies = true)
      : _readBodies(readBodies)
    {
      addMultiple(messages);
    }

    std::vector<event::Subscription> getEvents() override
    {
      return {event::subscribe<event::BeforeSendEvent>(
          [this](event::BeforeSendEvent& e) { onBeforeSend(e); }, event::RequestEvents::LATE)};
    }

    Mock& addResponse(ResponsePtr response)
    {
      _queue.emplace_back(std::move(response));
      return *this;
    }

    /// \brief Queue a raw HTTP response message.
    /// \throws std::invalid_argument when \p message cannot be parsed
    Mock& addResponse(const std::string& message)
    {
      return addResponse(_factory.fromMessage(message));
    }

    Mock& addMultiple(const std::vector<std::string>& messages)
    {
      for (const auto& message : messages)
      {
        addResponse(message);
      }
      return *this;
    }

    /// \brief Queue a failure thrown from the before-send listener.
    template <typename E> Mock& addException(E exception)
    {
      _queue.emplace_back(std::make_exception_ptr(std::move(exception)));
      return *this;
    }

    std::size_t count() const { return _queue.size(); }

    void clearQueue() { _queue.clear(); }

  private:
    std::deque<Item> _queue;
    bool _readBodies;
    message::MessageFactory _factory;

    void onBeforeSend(event::BeforeSendEvent& event)
    {
      if (_queue.empty())
      {
        throw std::out_of_range("Mock queue is empty");
      }
      Item item = std::move(_queue.front());
      _queue.pop_front();

      if (auto* error = std::get_if<std::exception_ptr>(&item))
      {
        std::rethrow_exception(*error);
      }

      const auto& body = event.getRequest()->getBody();
      if (_readBodies && body)
      {
        while (!body->eof())
        {
          if (body->read(8192).empty())
          {
            break;
          }
        }
      }
      event.intercept(std::get<ResponsePtr>(item));
    }
  };

} // namespace subscriber
} // namespace courier
