// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Courier, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#pragma once

#include "courier/core/exceptions.hpp"
#include "courier/event/events.hpp"
#include "courier/event/request_events.hpp"
#include "courier/event/subscriber_interface.hpp"
#include "courier/message/request.hpp"
#include "courier/message/response.hpp"

#include <string>
#include <vector>

namespace courier
{
namespace subscriber
{

  /// \brief Raises ClientError (4xx) or ServerError (5xx) for requests whose
  /// "exceptions" config is true.
  class HttpError : public event::SubscriberInterface
  {
  public:
    std::vector<event::Subscription> getEvents() override
    {
      return {event::subscribe<event::AfterSendEvent>([](event::AfterSendEvent& e) { check(e); },
                                                      event::RequestEvents::VERIFY_RESPONSE)};
    }

    static void check(event::AfterSendEvent& event)
    {
      const core::Json& config = event.getRequest()->getConfig();
      auto it = config.find("exceptions");
      if (it == config.end() || !it->is_boolean() || !it->get<bool>())
      {
        return;
      }

      const ResponsePtr& response = event.getResponse();
      const int status = response->getStatusCode();
      if (status < 400)
      {
        return;
      }
      std::string detail = " response [url] " + event.getRequest()->getUrl() +
                           " [status code] " + std::to_string(status) + " [reason phrase] " +
                           response->getReasonPhrase();
      if (status < 500)
      {
        throw ClientError("Client error" + detail, event.getRequest(), response);
      }
      throw ServerError("Server error" + detail, event.getRequest(), response);
    }
  };

} // namespace subscriber
} // namespace courier
