// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Courier, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
#include "test_helpers.hpp"

using courier::core::ConfigLoader;

TEST_CASE("ConfigLoader reads typed values", "[config]")
{
  auto path = courier::test::writeTempFile("courier_config_test.json", R"({
    "base_url": "http://localhost:8080",
    "parallel": 8,
    "log": { "level": "debug", "file": "courier.log" },
    "defaults": { "exceptions": false, "headers": { "X-Test": "1" } },
    "hosts": ["a", "b"]
  })");
  courier::test::TempFileGuard guard(path);

  ConfigLoader loader(path);
  REQUIRE(loader.getString("base_url") == std::optional<std::string>("http://localhost:8080"));
  REQUIRE(loader.getInt("parallel") == std::optional<int64_t>(8));
  REQUIRE(loader.getString("log.level") == std::optional<std::string>("debug"));
  REQUIRE(loader.getBool("defaults.exceptions") == std::optional<bool>(false));
  REQUIRE_FALSE(loader.getString("missing.key").has_value());
  // Wrong type reads as absent
  REQUIRE_FALSE(loader.getInt("base_url").has_value());

  auto hosts = loader.getStringArray("hosts");
  REQUIRE(hosts.has_value());
  REQUIRE(hosts->size() == 2);

  auto defaults = loader.getObject("defaults");
  REQUIRE(defaults.has_value());
  REQUIRE((*defaults)["headers"]["X-Test"] == "1");
}

TEST_CASE("ConfigLoader rejects missing or malformed files", "[config][errors]")
{
  REQUIRE_THROWS_AS(ConfigLoader("/nonexistent/courier.json"), std::runtime_error);

  auto path = courier::test::writeTempFile("courier_config_bad.json", "{ not json");
  courier::test::TempFileGuard guard(path);
  REQUIRE_THROWS_AS(ConfigLoader(path), std::runtime_error);
}

TEST_CASE("ConfigLoader array elements must be strings", "[config][errors]")
{
  auto path = courier::test::writeTempFile("courier_config_array.json", R"({"hosts": ["a", 1]})");
  courier::test::TempFileGuard guard(path);
  ConfigLoader loader(path);
  REQUIRE_THROWS_AS(loader.getStringArray("hosts"), std::runtime_error);
}

TEST_CASE("Client::Config is built from a config table", "[config][client]")
{
  auto config = courier::Client::Config::fromJson(
      {{"base_url", "http://example.com/api/"}, {"defaults", {{"exceptions", false}}}});
  REQUIRE(config.baseUrl == "http://example.com/api/");
  REQUIRE(config.defaults["exceptions"] == false);

  REQUIRE_THROWS_AS(courier::Client::Config::fromJson({{"base_url", 5}}),
                    courier::InvalidArgumentError);
  REQUIRE_THROWS_AS(courier::Client::Config::fromJson({{"defaults", "nope"}}),
                    courier::InvalidArgumentError);
}
