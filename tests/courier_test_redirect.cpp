// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Courier, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
#include "test_helpers.hpp"

using courier::test::rawResponse;

namespace
{
/// Non-rewindable body whose position is always past the start
class PositionedStream : public courier::message::Stream
{
public:
  explicit PositionedStream(bool canSeek) : _canSeek(canSeek) {}

  std::string read(std::size_t) override { return {}; }
  bool eof() const override { return true; }
  std::int64_t tell() const override { return 1; }
  bool seek(std::int64_t offset) override
  {
    ++seekCalls;
    lastOffset = offset;
    return _canSeek;
  }
  bool isSeekable() const override { return _canSeek; }
  std::optional<std::size_t> getSize() const override { return std::nullopt; }

  int seekCalls = 0;
  std::int64_t lastOffset = -1;

private:
  bool _canSeek;
};

struct MockedClient
{
  courier::Client client;
  std::shared_ptr<courier::subscriber::Mock> mock;
  std::shared_ptr<courier::subscriber::History> history;

  explicit MockedClient(const std::vector<std::string>& responses)
    : mock(std::make_shared<courier::subscriber::Mock>(responses)),
      history(std::make_shared<courier::subscriber::History>())
  {
    courier::test::initializeTestLogging();
    client.getEmitter().addSubscriber(history);
    client.getEmitter().addSubscriber(mock);
  }
};

std::string redirectTo(const std::string& location, int status = 301)
{
  return rawResponse(status, courier::message::reasonPhraseFor(status),
                     {"Location: " + location});
}
} // namespace

TEST_CASE("Redirect follows redirects", "[redirect]")
{
  MockedClient m({redirectTo("/redirect1"), redirectTo("/redirect2"), rawResponse(200, "OK")});

  auto response = m.client.get("http://test.com/foo");
  REQUIRE(response->getStatusCode() == 200);
  REQUIRE(response->getEffectiveUrl().find("/redirect2") != std::string::npos);

  auto requests = m.history->getRequests();
  REQUIRE(requests.size() == 3);
  REQUIRE(requests[0]->getUrl() == "http://test.com/foo");
  REQUIRE(requests[1]->getUrl() == "http://test.com/redirect1");
  REQUIRE(requests[2]->getUrl() == "http://test.com/redirect2");
}

TEST_CASE("Redirect limits the number of redirects", "[redirect][limit]")
{
  MockedClient m({redirectTo("/redirect1"), redirectTo("/redirect2"), redirectTo("/redirect3"),
                  rawResponse(200, "OK")});

  try
  {
    m.client.get("http://test.com/foo", {{"allow_redirects", {{"max", 2}}}});
    FAIL("Expected TooManyRedirectsError");
  }
  catch (const courier::TooManyRedirectsError& e)
  {
    REQUIRE(std::string(e.what()) == "Will not follow more than 2 redirects");
    REQUIRE(e.getRedirectChain() ==
            std::vector<std::string>{"http://test.com/foo", "http://test.com/redirect1",
                                     "http://test.com/redirect2"});
  }
  REQUIRE(m.mock->count() == 1);
}

TEST_CASE("Redirect stops at the default maximum", "[redirect][limit]")
{
  std::vector<std::string> responses;
  for (int i = 1; i <= 6; ++i)
  {
    responses.push_back(redirectTo("/redirect" + std::to_string(i)));
  }
  MockedClient m(responses);

  try
  {
    m.client.get("http://test.com/foo");
    FAIL("Expected TooManyRedirectsError");
  }
  catch (const courier::TooManyRedirectsError& e)
  {
    REQUIRE(std::string(e.what()) ==
            "Will not follow more than " +
                std::to_string(courier::message::MessageFactory::DEFAULT_MAX_REDIRECTS) +
                " redirects");
    REQUIRE(e.getRedirectChain().size() == 6);
    REQUIRE(e.getRedirectChain().back() == "http://test.com/redirect5");
  }
  REQUIRE(m.mock->count() == 0);

  // six exchanges, then the failure recorded against the first request
  auto requests = m.history->getRequests();
  REQUIRE(requests.size() == 7);
  REQUIRE(requests[5]->getUrl() == "http://test.com/redirect5");
  REQUIRE(requests[6] == requests[0]);
}

TEST_CASE("Redirect loose policy turns POST into GET", "[redirect][policy]")
{
  int status = GENERATE(301, 302);
  MockedClient m({redirectTo("/redirect", status), rawResponse(200, "OK")});

  m.client.post("http://test.com/foo",
                {{"headers", {{"X-Baz", "bar"}, {"Content-Type", "text/plain"}}},
                 {"body", "testing"}});

  auto last = m.history->getLastRequest();
  REQUIRE(last->getMethod() == "GET");
  REQUIRE(last->getHeader("X-Baz") == "bar");
  REQUIRE_FALSE(last->getBody());
  REQUIRE_FALSE(last->hasHeader("Content-Length"));
  REQUIRE_FALSE(last->hasHeader("Content-Type"));
}

TEST_CASE("Redirect loose policy keeps the method on 307 and 308", "[redirect][policy]")
{
  int status = GENERATE(307, 308);
  MockedClient m({redirectTo("/redirect", status), rawResponse(200, "OK")});

  m.client.post("http://test.com/foo", {{"body", "testing"}});

  auto last = m.history->getLastRequest();
  REQUIRE(last->getMethod() == "POST");
  REQUIRE(last->getBody()->toString() == "testing");
}

TEST_CASE("Redirect strict policy keeps the method and body", "[redirect][policy]")
{
  MockedClient m({redirectTo("/redirect", 302), rawResponse(200, "OK")});

  m.client.post("http://test.com/foo",
                {{"headers", {{"X-Baz", "bar"}}}, {"body", "testing"},
                 {"allow_redirects", "strict"}});

  auto last = m.history->getLastRequest();
  REQUIRE(last->getMethod() == "POST");
  REQUIRE(last->getHeader("X-Baz") == "bar");
  REQUIRE(last->getBody()->toString() == "testing");
  REQUIRE(last->getHeader("Content-Length") == "7");
}

TEST_CASE("Redirect rewinds the body when needed", "[redirect][rewind]")
{
  MockedClient m({redirectTo("/redirect", 302), rawResponse(200, "OK")});

  auto body = std::make_shared<PositionedStream>(true);
  auto request = m.client.createRequest("POST", "http://test.com/foo",
                                        {{"allow_redirects", "strict"}});
  request->setBody(body);

  auto response = m.client.send(request);
  REQUIRE(response->getStatusCode() == 200);
  REQUIRE(body->seekCalls == 1);
  REQUIRE(body->lastOffset == 0);
}

TEST_CASE("Redirect throws when the body cannot be rewound", "[redirect][rewind]")
{
  MockedClient m({redirectTo("/redirect", 302), rawResponse(200, "OK")});

  auto request = m.client.createRequest("POST", "http://test.com/foo",
                                        {{"allow_redirects", "strict"}});
  request->setBody(std::make_shared<PositionedStream>(false));

  try
  {
    m.client.send(request);
    FAIL("Expected CouldNotRewindStreamError");
  }
  catch (const courier::CouldNotRewindStreamError& e)
  {
    REQUIRE(e.getRequest() == request);
  }
  REQUIRE(m.mock->count() == 1);
  // the exchange and its failure, both for the first request only
  REQUIRE(m.history->count() == 2);
  for (const auto& recorded : m.history->getRequests())
  {
    REQUIRE(recorded == request);
  }
}

TEST_CASE("Redirect can be disabled per request", "[redirect]")
{
  MockedClient m({redirectTo("/redirect1"), rawResponse(200, "OK")});

  auto response = m.client.get("http://test.com/foo", {{"allow_redirects", false}});
  REQUIRE(response->getStatusCode() == 301);
  REQUIRE(m.history->count() == 1);
  REQUIRE(m.mock->count() == 1);
}

TEST_CASE("Redirect with no leading slash and a query", "[redirect][url]")
{
  MockedClient m({redirectTo("redirect?foo=bar"), rawResponse(200, "OK")});

  m.client.get("http://www.foo.com?foo=bar");

  auto requests = m.history->getRequests();
  REQUIRE(requests.size() == 2);
  REQUIRE(requests[0]->getUrl() == "http://www.foo.com?foo=bar");
  REQUIRE(requests[1]->getUrl() == "http://www.foo.com/redirect?foo=bar");
}

TEST_CASE("Redirect encodes spaces in the Location", "[redirect][url]")
{
  MockedClient m({redirectTo("/redirect 1", 302), rawResponse(200, "OK")});

  m.client.get("http://test.com/foo");

  REQUIRE(m.history->getLastRequest()->getUrl() == "http://test.com/redirect%201");
}

TEST_CASE("Redirect drops the fragment of the Location", "[redirect][url]")
{
  MockedClient m({redirectTo("/next#section"), rawResponse(200, "OK")});

  auto response = m.client.get("http://test.com/foo");
  REQUIRE(response->getEffectiveUrl() == "http://test.com/next");
}

TEST_CASE("Redirect to a fragment keeps the query", "[redirect][url]")
{
  MockedClient m({redirectTo("#section", 302), rawResponse(200, "OK")});

  auto response = m.client.get("http://test.com/page?q=1");
  REQUIRE(m.history->getLastRequest()->getUrl() == "http://test.com/page?q=1");
  REQUIRE(response->getEffectiveUrl() == "http://test.com/page?q=1");
}

TEST_CASE("Redirect without Location is returned as-is", "[redirect]")
{
  MockedClient m({rawResponse(302, "Found")});

  auto response = m.client.get("http://test.com/foo");
  REQUIRE(response->getStatusCode() == 302);
  REQUIRE(m.history->count() == 1);
}
