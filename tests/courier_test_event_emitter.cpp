// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Courier, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
#include "test_helpers.hpp"

using courier::event::Event;
using courier::event::EventEmitter;
using courier::event::EventType;

namespace
{
struct ProbeEvent : public Event
{
  static constexpr EventType Type = EventType::BeforeSend;
  EventType type() const override { return Type; }
  std::vector<std::string> calls;
};

class ProbeSubscriber : public courier::event::SubscriberInterface
{
public:
  std::vector<courier::event::Subscription> getEvents() override
  {
    return {courier::event::subscribe<ProbeEvent>([this](ProbeEvent& e)
                                                  {
                                                    ++hits;
                                                    e.calls.push_back("subscriber");
                                                  },
                                                  5)};
  }
  int hits = 0;
};
} // namespace

TEST_CASE("EventEmitter orders listeners by priority", "[event][priority]")
{
  EventEmitter emitter;
  emitter.on<ProbeEvent>([](ProbeEvent& e) { e.calls.push_back("low"); }, -10);
  emitter.on<ProbeEvent>([](ProbeEvent& e) { e.calls.push_back("first-zero"); });
  emitter.on<ProbeEvent>([](ProbeEvent& e) { e.calls.push_back("high"); }, 100);
  emitter.on<ProbeEvent>([](ProbeEvent& e) { e.calls.push_back("second-zero"); });

  ProbeEvent event;
  emitter.emit(event);
  REQUIRE(event.calls ==
          std::vector<std::string>{"high", "first-zero", "second-zero", "low"});
}

TEST_CASE("EventEmitter once listeners run a single time", "[event][once]")
{
  EventEmitter emitter;
  int count = 0;
  emitter.once<ProbeEvent>([&count](ProbeEvent&) { ++count; });

  ProbeEvent first;
  emitter.emit(first);
  ProbeEvent second;
  emitter.emit(second);
  REQUIRE(count == 1);
  REQUIRE_FALSE(emitter.hasListeners(EventType::BeforeSend));
}

TEST_CASE("EventEmitter once listener is removed even when it throws", "[event][once]")
{
  EventEmitter emitter;
  emitter.once<ProbeEvent>([](ProbeEvent&) { throw std::runtime_error("boom"); });
  ProbeEvent event;
  REQUIRE_THROWS_AS(emitter.emit(event), std::runtime_error);
  REQUIRE(emitter.listeners(EventType::BeforeSend).empty());
}

TEST_CASE("EventEmitter removeListener", "[event][remove]")
{
  EventEmitter emitter;
  int count = 0;
  auto id = emitter.on<ProbeEvent>([&count](ProbeEvent&) { ++count; });
  REQUIRE(emitter.removeListener(EventType::BeforeSend, id));
  REQUIRE_FALSE(emitter.removeListener(EventType::BeforeSend, id));

  ProbeEvent event;
  emitter.emit(event);
  REQUIRE(count == 0);
}

TEST_CASE("EventEmitter stops when propagation is stopped", "[event][propagation]")
{
  EventEmitter emitter;
  emitter.on<ProbeEvent>(
      [](ProbeEvent& e)
      {
        e.calls.push_back("stopper");
        e.stopPropagation();
      },
      10);
  emitter.on<ProbeEvent>([](ProbeEvent& e) { e.calls.push_back("skipped"); });

  ProbeEvent event;
  emitter.emit(event);
  REQUIRE(event.calls == std::vector<std::string>{"stopper"});
}

TEST_CASE("EventEmitter subscribers register and unregister as a unit", "[event][subscriber]")
{
  EventEmitter emitter;
  auto subscriber = std::make_shared<ProbeSubscriber>();
  emitter.addSubscriber(subscriber);
  REQUIRE(emitter.hasSubscriber(*subscriber));

  ProbeEvent event;
  emitter.emit(event);
  REQUIRE(subscriber->hits == 1);

  emitter.removeSubscriber(*subscriber);
  REQUIRE_FALSE(emitter.hasSubscriber(*subscriber));
  ProbeEvent again;
  emitter.emit(again);
  REQUIRE(subscriber->hits == 1);

  REQUIRE_THROWS_AS(emitter.addSubscriber(nullptr), courier::InvalidArgumentError);
}

TEST_CASE("EventEmitter copies are independent", "[event][copy]")
{
  EventEmitter original;
  int originalCalls = 0;
  original.on<ProbeEvent>([&originalCalls](ProbeEvent&) { ++originalCalls; });

  EventEmitter copy = original;
  int copyCalls = 0;
  copy.on<ProbeEvent>([&copyCalls](ProbeEvent&) { ++copyCalls; });

  ProbeEvent event;
  original.emit(event);
  REQUIRE(originalCalls == 1);
  REQUIRE(copyCalls == 0);

  ProbeEvent copied;
  copy.emit(copied);
  REQUIRE(originalCalls == 2);
  REQUIRE(copyCalls == 1);
  REQUIRE(original.listeners(EventType::BeforeSend).size() == 1);
  REQUIRE(copy.listeners(EventType::BeforeSend).size() == 2);
}

TEST_CASE("EventEmitter listener exceptions reach the caller", "[event][errors]")
{
  EventEmitter emitter;
  bool later = false;
  emitter.on<ProbeEvent>([](ProbeEvent&) { throw std::logic_error("listener failed"); }, 10);
  emitter.on<ProbeEvent>([&later](ProbeEvent&) { later = true; });

  ProbeEvent event;
  REQUIRE_THROWS_WITH(emitter.emit(event), "listener failed");
  REQUIRE_FALSE(later);
}

TEST_CASE("EventEmitter rejects an event of the wrong type", "[event][errors]")
{
  EventEmitter emitter;
  ProbeEvent event;
  REQUIRE_THROWS_AS(emitter.emit(EventType::Error, event), courier::InvalidArgumentError);
  REQUIRE_THROWS_AS(emitter.on(EventType::Error, EventEmitter::Listener{}),
                    courier::InvalidArgumentError);
}
