// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Courier, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
#include "test_helpers.hpp"

using courier::message::MessageFactory;
using courier::message::Request;

TEST_CASE("Headers are case-insensitive and fold repeats", "[message][headers]")
{
  courier::message::HttpHeaders headers;
  REQUIRE(courier::message::parseHeaderLine("Set-Cookie: a=1", headers));
  REQUIRE(courier::message::parseHeaderLine("set-cookie:  b=2 ", headers));
  REQUIRE_FALSE(courier::message::parseHeaderLine("no colon here", headers));
  REQUIRE(headers.size() == 1);
  REQUIRE(headers["SET-COOKIE"] == "a=1, b=2");
}

TEST_CASE("Request normalizes method and tracks body length", "[message][request]")
{
  Request request("post", "http://example.com/p");
  REQUIRE(request.getMethod() == "POST");
  REQUIRE(request.getHost() == "example.com");

  request.setBody(courier::message::makeStream("hello"));
  REQUIRE(request.getHeader("content-length") == "5");

  request.setBody(nullptr);
  REQUIRE_FALSE(request.hasHeader("Content-Length"));
}

TEST_CASE("Request chunked bodies do not get a Content-Length", "[message][request]")
{
  Request request("PUT", "http://example.com/p", {{"Transfer-Encoding", "chunked"}});
  request.setBody(courier::message::makeStream("abc"));
  REQUIRE_FALSE(request.hasHeader("Content-Length"));
}

TEST_CASE("Request copies are independent", "[message][request]")
{
  Request original("GET", "http://example.com/");
  original.setHeader("X-A", "1");
  original.getConfig()["exceptions"] = true;

  Request copy = original;
  copy.setHeader("X-A", "2");
  copy.getConfig()["exceptions"] = false;
  copy.setUrl("http://other.com/");

  REQUIRE(original.getHeader("X-A") == "1");
  REQUIRE(original.getConfig()["exceptions"] == true);
  REQUIRE(original.getHost() == "example.com");
}

TEST_CASE("MessageFactory applies request options", "[message][factory]")
{
  MessageFactory factory;
  auto request = factory.createRequest(
      "post", "http://example.com/path?a=1",
      {{"headers", {{"X-Foo", "bar"}, {"Accept", {"text/html", "application/json"}}}},
       {"body", "payload"},
       {"query", {{"b", "2"}}},
       {"exceptions", false},
       {"timeout", 2.5},
       {"config", {{"custom", {{"x", 1}}}}}});

  REQUIRE(request->getMethod() == "POST");
  REQUIRE(request->getHeader("x-foo") == "bar");
  REQUIRE(request->getHeader("Accept") == "text/html, application/json");
  REQUIRE(request->getBody()->toString() == "payload");
  REQUIRE(request->getQuery() == "a=1&b=2");
  REQUIRE(request->getConfig()["exceptions"] == false);
  REQUIRE(request->getConfig()["timeout"] == 2.5);
  REQUIRE(request->getConfig()["custom"]["x"] == 1);
}

TEST_CASE("MessageFactory redirect options", "[message][factory][redirect]")
{
  MessageFactory factory;

  auto loose = factory.createRequest("GET", "http://e.com/", {{"allow_redirects", true}});
  REQUIRE(loose->getConfig()["redirect"]["max"] == MessageFactory::DEFAULT_MAX_REDIRECTS);
  REQUIRE(loose->getConfig()["redirect"]["strict"] == false);

  auto strict = factory.createRequest("GET", "http://e.com/", {{"allow_redirects", "strict"}});
  REQUIRE(strict->getConfig()["redirect"]["strict"] == true);

  auto custom =
      factory.createRequest("GET", "http://e.com/", {{"allow_redirects", {{"max", 2}}}});
  REQUIRE(custom->getConfig()["redirect"]["max"] == 2);

  auto disabled = factory.createRequest("GET", "http://e.com/", {{"allow_redirects", false}});
  REQUIRE_FALSE(disabled->getConfig().contains("redirect"));

  REQUIRE_THROWS_AS(factory.createRequest("GET", "http://e.com/", {{"allow_redirects", 3}}),
                    courier::InvalidArgumentError);
  REQUIRE_THROWS_AS(factory.createRequest("GET", "http://e.com/",
                                          {{"allow_redirects", {{"max", -1}}}}),
                    courier::InvalidArgumentError);
  REQUIRE_THROWS_AS(factory.createRequest("GET", "http://e.com/",
                                          {{"allow_redirects", {{"max", 4294967296LL}}}}),
                    courier::InvalidArgumentError);
  REQUIRE_THROWS_AS(factory.createRequest("GET", "http://e.com/",
                                          {{"allow_redirects", {{"max", 1.5}}}}),
                    courier::InvalidArgumentError);
}

TEST_CASE("MessageFactory rejects unknown options", "[message][factory]")
{
  MessageFactory factory;
  REQUIRE_THROWS_WITH(factory.createRequest("GET", "http://e.com/", {{"bogus", 1}}),
                      "No method is configured to handle the bogus config key");
  REQUIRE_THROWS_AS(factory.createRequest("GET", "http://e.com/", {{"body", 12}}),
                    courier::InvalidArgumentError);
}

TEST_CASE("MessageFactory parses raw responses", "[message][factory][parse]")
{
  MessageFactory factory;
  auto response = factory.fromMessage(
      "HTTP/1.0 404 Not Found\r\nContent-Type: text/plain\r\nContent-Length: 4\r\n\r\nnope");
  REQUIRE(response->getStatusCode() == 404);
  REQUIRE(response->getReasonPhrase() == "Not Found");
  REQUIRE(response->getProtocolVersion() == "1.0");
  REQUIRE(response->getHeader("content-type") == "text/plain");
  REQUIRE(response->getBody()->toString() == "nope");
  REQUIRE(response->isClientError());

  auto bare = factory.fromMessage("HTTP/1.1 204\n\n");
  REQUIRE(bare->getStatusCode() == 204);
  REQUIRE(bare->getReasonPhrase() == "No Content");
  REQUIRE_FALSE(bare->getBody());

  REQUIRE_THROWS_AS(factory.fromMessage("garbage"), std::invalid_argument);
  REQUIRE_THROWS_AS(factory.fromMessage(""), std::invalid_argument);
}

TEST_CASE("Response renders the wire format", "[message][response]")
{
  courier::message::Response response(200, {{"X-Test", "1"}},
                                      courier::message::makeStream("body"));
  REQUIRE(response.toString() == "HTTP/1.1 200 OK\r\nX-Test: 1\r\n\r\nbody");
  REQUIRE(response.isSuccess());
}

TEST_CASE("StringStream reads and rewinds", "[message][stream]")
{
  courier::message::StringStream stream("abcdef");
  REQUIRE(stream.read(2) == "ab");
  REQUIRE(stream.tell() == 2);
  REQUIRE(stream.getContents() == "cdef");
  REQUIRE(stream.eof());
  REQUIRE(stream.seek(1));
  REQUIRE(stream.read(1) == "b");
  REQUIRE(stream.toString() == "abcdef");
  REQUIRE(stream.getSize() == std::optional<std::size_t>(6));
}

namespace
{
/// Claims to be seekable but refuses every seek
class StuckStream : public courier::message::StringStream
{
public:
  using StringStream::StringStream;
  bool seek(std::int64_t) override { return false; }
};
} // namespace

TEST_CASE("Stream toString fails when a rewind fails", "[message][stream]")
{
  StuckStream stream("abcdef");
  REQUIRE(stream.read(3) == "abc");
  REQUIRE_THROWS_AS(stream.toString(), std::runtime_error);
}
