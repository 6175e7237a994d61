// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Courier, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#pragma once
/// \file redirect.hpp
/// \brief Follows 3xx responses by sending each hop through the client

#include "courier/client_interface.hpp"
#include "courier/core/exceptions.hpp"
#include "courier/core/logger.hpp"
#include "courier/event/events.hpp"
#include "courier/event/request_events.hpp"
#include "courier/event/subscriber_interface.hpp"
#include "courier/message/headers.hpp"
#include "courier/message/message_factory.hpp"
#include "courier/message/request.hpp"
#include "courier/message/response.hpp"
#include "courier/message/url.hpp"

#include <memory>
#include <string>
#include <vector>

namespace courier
{
namespace subscriber
{

  /// \brief Redirect-following subscriber.
  /// \details Active only for requests whose config carries a "redirect"
  /// object ({"max": n, "strict": bool}); the "allow_redirects" request
  /// option produces it. Each hop is a copy of the previous request sent
  /// through the same client, so every hop runs its own before-send and
  /// after-send cycle. The final response replaces the original one.
  ///
  /// Loose policy (default): POST, PUT and PATCH become a body-less GET
  /// except on 307 and 308. Strict policy: method and body are always kept.
  class Redirect : public event::SubscriberInterface
  {
  public:
    std::vector<event::Subscription> getEvents() override
    {
      return {event::subscribe<event::AfterSendEvent>(
          [this](event::AfterSendEvent& e) { onAfterSend(e); },
          event::RequestEvents::REDIRECT_RESPONSE)};
    }

    void onAfterSend(event::AfterSendEvent& event)
    {
      const ResponsePtr response = event.getResponse();
      if (!isRedirect(*response))
      {
        return;
      }

      const core::Json& config = event.getRequest()->getConfig();
      if (!config.contains("redirect") || !config["redirect"].is_object())
      {
        return;
      }
      const core::Json& redirect = config["redirect"];
      const int max = redirect.value("max", message::MessageFactory::DEFAULT_MAX_REDIRECTS);
      const bool strict = redirect.value("strict", false);

      int redirectCount = 0;
      RequestPtr redirectRequest = event.getRequest();
      ResponsePtr redirectResponse = response;
      std::vector<std::string> chain{redirectRequest->getUrl()};
      do
      {
        if (++redirectCount > max)
        {
          throw TooManyRedirectsError("Will not follow more than " + std::to_string(max) +
                                          " redirects",
                                      redirectRequest, redirectResponse, chain);
        }
        redirectRequest = createRedirectRequest(redirectRequest, *redirectResponse, strict);
        chain.push_back(redirectRequest->getUrl());
        COURIER_LOG_DEBUG("Redirect " << redirectCount << " to "
                                      << redirectRequest->getMethod() << " "
                                      << redirectRequest->getUrl());
        redirectResponse = event.getClient().send(redirectRequest);
      } while (isRedirect(*redirectResponse));

      if (redirectResponse != response)
      {
        event.intercept(redirectResponse);
      }
    }

  private:
    static bool isRedirect(const message::Response& response)
    {
      return response.isRedirection() && response.hasHeader("Location");
    }

    RequestPtr createRedirectRequest(const RequestPtr& request, const message::Response& response,
                                     bool strict) const
    {
      auto redirect = std::make_shared<message::Request>(*request);
      // Hops are driven by this loop, not by their own listener
      redirect->getEmitter().removeSubscriber(*this);

      const int status = response.getStatusCode();
      if (!strict && message::isEntityEnclosing(request->getMethod()) && status != 307 &&
          status != 308)
      {
        redirect->setMethod("GET");
        redirect->setBody(nullptr);
        redirect->removeHeader("Content-Type");
      }

      message::Url location =
          request->getUrlObject().combine(response.getHeader("Location"));
      location.setFragment("");
      redirect->setUrl(location);

      const auto& body = redirect->getBody();
      if (body && body->tell() != 0 && !body->seek(0))
      {
        throw CouldNotRewindStreamError(
            "Unable to rewind the non-seekable entity body of the request after redirecting",
            request);
      }
      return redirect;
    }
  };

} // namespace subscriber
} // namespace courier
