// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Courier, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
#include "test_helpers.hpp"

#include <algorithm>
#include <iterator>

using courier::core::Logger;

TEST_CASE("Logger Basic Levels", "[logger][levels]")
{
  auto path = courier::test::writeTempFile("courier_testlog.log", "");
  courier::test::TempFileGuard guard(path);

  Logger::init(Logger::Level::Trace, path);
  COURIER_LOG_TRACE("Trace message");
  COURIER_LOG_DEBUG("Debug message");
  COURIER_LOG_INFO("Info message");
  COURIER_LOG_WARN("Warn message");
  COURIER_LOG_ERROR("Error message");
  COURIER_LOG_FATAL("Fatal message");
  Logger::init(Logger::Level::Info);

  std::ifstream in(path);
  REQUIRE(in.is_open());
  REQUIRE(std::count(std::istreambuf_iterator<char>(in), {}, '\n') == 6);
}

TEST_CASE("Logger filters below the minimum level", "[logger][levels]")
{
  std::vector<std::string> lines;
  Logger::init(Logger::Level::Warning);
  Logger::setExternalHandler([&lines](Logger::Level, const std::string&, const std::string& raw)
                             { lines.push_back(raw); });
  COURIER_LOG_INFO("hidden");
  COURIER_LOG_WARN("shown " << 42);
  Logger::clearExternalHandler();

  REQUIRE(lines == std::vector<std::string>{"shown 42"});
}

TEST_CASE("Logger custom format", "[logger][format]")
{
  std::string formatted;
  Logger::init(Logger::Level::Info);
  Logger::setLogFormat("%L|%m|%F|100%%");
  Logger::setExternalHandler([&formatted](Logger::Level, const std::string& line,
                                          const std::string&) { formatted = line; });
  COURIER_LOG_ERROR("boom");
  Logger::clearExternalHandler();
  Logger::setLogFormat("[%T] [%L] %m");

  REQUIRE(formatted == "ERROR|boom|courier_test_logger.cpp|100%\n");
}

TEST_CASE("Logger parses level names", "[logger][levels]")
{
  REQUIRE(Logger::levelFromString("TRACE") == Logger::Level::Trace);
  REQUIRE(Logger::levelFromString("warn") == Logger::Level::Warning);
  REQUIRE(Logger::levelFromString("warning") == Logger::Level::Warning);
  REQUIRE(Logger::levelFromString("fatal") == Logger::Level::Fatal);
  REQUIRE(Logger::levelFromString("nonsense") == Logger::Level::Info);
}
