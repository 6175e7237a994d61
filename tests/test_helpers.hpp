// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// Shared test helpers for Courier test suite
// This file contains common utilities used across multiple test files

#pragma once

#include "courier/courier.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

namespace courier::test
{

/// \brief Automatic logger initialization for tests
struct LoggerInit
{
  LoggerInit() { courier::core::Logger::setLevel(courier::core::Logger::Level::Warning); }
};

/// \brief Static logger initializer - call once per test executable
inline void initializeTestLogging()
{
  static LoggerInit init;
  (void)init;
}

/// \brief Write \p content to a file under the temp directory and return
/// its path.
inline std::string writeTempFile(const std::string& name, const std::string& content)
{
  auto path = std::filesystem::temp_directory_path() / name;
  std::ofstream out(path, std::ios::trunc);
  out << content;
  return path.string();
}

/// \brief Removes a file when going out of scope
struct TempFileGuard
{
  std::string path;
  explicit TempFileGuard(std::string p) : path(std::move(p)) {}
  ~TempFileGuard() { std::remove(path.c_str()); }
};

/// \brief Build a raw HTTP response message
inline std::string rawResponse(int status, const std::string& reason,
                               const std::vector<std::string>& headers = {},
                               const std::string& body = "")
{
  std::string message = "HTTP/1.1 " + std::to_string(status) + " " + reason + "\r\n";
  for (const auto& header : headers)
  {
    message += header + "\r\n";
  }
  message += "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n" + body;
  return message;
}

} // namespace courier::test
