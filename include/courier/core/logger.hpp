// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Courier, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#pragma once

#include <chrono>
#include <ctime>
#include <fstream>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace courier
{
namespace core
{

namespace detail
{
  /// \brief Extract filename from full path at compile-time
  constexpr const char* basename(const char* path)
  {
    const char* file = path;
    while (*path)
    {
      if (*path == '/' || *path == '\\')
      {
        file = path + 1;
      }
      ++path;
    }
    return file;
  }
} // namespace detail

/// \brief Process-wide, thread-safe logger. Writes to stdout unless a log
/// file or an external handler is configured.
class Logger
{
public:
  enum class Level
  {
    Trace,
    Debug,
    Info,
    Warning,
    Error,
    Fatal
  };

  /// \brief External log handler. Receives the level, the formatted line and
  /// the raw message.
  using ExternalHandler = std::function<void(Level level, const std::string& formattedMessage,
                                             const std::string& rawMessage)>;

  /// \brief Set the minimum level and, optionally, a file to append to.
  static void init(Level level = Level::Info, const std::string& filePath = "")
  {
    auto& data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    data.minLevel = level;
    data.fileStream.reset();
    if (!filePath.empty())
    {
      data.fileStream = std::make_unique<std::ofstream>(filePath, std::ios::app);
      if (!data.fileStream->is_open())
      {
        std::cerr << "[Logger] Failed to open log file: " << filePath << std::endl;
        data.fileStream.reset();
      }
    }
  }

  static void setLevel(Level level)
  {
    auto& data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    data.minLevel = level;
  }

  static Level getLevel()
  {
    auto& data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    return data.minLevel;
  }

  /// \brief Parse a level name ("trace", "debug", "warn", ...). Unknown names
  /// map to Info.
  static Level levelFromString(const std::string& name)
  {
    std::string v;
    v.reserve(name.size());
    for (char c : name)
    {
      v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    if (v == "trace")
    {
      return Level::Trace;
    }
    if (v == "debug")
    {
      return Level::Debug;
    }
    if (v == "warn" || v == "warning")
    {
      return Level::Warning;
    }
    if (v == "error")
    {
      return Level::Error;
    }
    if (v == "fatal")
    {
      return Level::Fatal;
    }
    return Level::Info;
  }

  /// \brief Route every log line to \p handler instead of file/stdout.
  static void setExternalHandler(ExternalHandler handler)
  {
    auto& data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    data.externalHandler = std::move(handler);
  }

  static void clearExternalHandler()
  {
    auto& data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    data.externalHandler = nullptr;
  }

  /// \brief Set the line format.
  /// Placeholders: %T timestamp, %t thread id, %L level, %m message,
  /// %F file, %l line, %f function, %% literal percent.
  /// Empty formats are ignored.
  static void setLogFormat(const std::string& format)
  {
    if (format.empty())
    {
      return;
    }
    auto& data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    data.format = format;
    compileFormat(format, data.segments);
  }

  static std::string getLogFormat()
  {
    auto& data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    return data.format;
  }

  static void trace(const std::string& message) { log(Level::Trace, message); }
  static void debug(const std::string& message) { log(Level::Debug, message); }
  static void info(const std::string& message) { log(Level::Info, message); }
  static void warning(const std::string& message) { log(Level::Warning, message); }
  static void error(const std::string& message) { log(Level::Error, message); }
  static void fatal(const std::string& message) { log(Level::Fatal, message); }

  static void log(Level level, const std::string& message)
  {
    log(level, message, nullptr, 0, nullptr);
  }

  /// \brief Log with source location (used by the COURIER_LOG_* macros).
  static void log(Level level, const std::string& message, const char* file, int line,
                  const char* function)
  {
    auto& data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    if (level < data.minLevel)
    {
      return;
    }
    if (data.segments.empty())
    {
      compileFormat(data.format, data.segments);
    }

    std::string output = formatLine(level, message, file, line, function, data.segments);
    if (data.externalHandler)
    {
      data.externalHandler(level, output, message);
    }
    else if (data.fileStream)
    {
      (*data.fileStream) << output;
      data.fileStream->flush();
    }
    else
    {
      std::cout << output;
    }
  }

  static const char* levelToString(Level level)
  {
    switch (level)
    {
    case Level::Trace:
      return "TRACE";
    case Level::Debug:
      return "DEBUG";
    case Level::Info:
      return "INFO";
    case Level::Warning:
      return "WARN";
    case Level::Error:
      return "ERROR";
    case Level::Fatal:
      return "FATAL";
    default:
      return "UNKNOWN";
    }
  }

private:
  enum class FormatToken
  {
    Literal,
    Timestamp,
    ThreadId,
    Level,
    Message,
    File,
    Line,
    Function
  };

  struct FormatSegment
  {
    FormatToken token;
    std::string literal; ///< Only used when token == Literal
  };

  struct LoggerData
  {
    std::mutex mutex;
    Level minLevel = Level::Info;
    std::unique_ptr<std::ofstream> fileStream;
    ExternalHandler externalHandler;
    std::string format = "[%T] [%L] %m";
    std::vector<FormatSegment> segments;
  };

  static LoggerData& getData()
  {
    static LoggerData data;
    return data;
  }

  static void compileFormat(const std::string& format, std::vector<FormatSegment>& segments)
  {
    segments.clear();
    std::string literal;
    auto flushLiteral = [&]()
    {
      if (!literal.empty())
      {
        segments.push_back({FormatToken::Literal, std::move(literal)});
        literal.clear();
      }
    };

    for (std::size_t i = 0; i < format.size(); ++i)
    {
      if (format[i] != '%' || i + 1 >= format.size())
      {
        literal += format[i];
        continue;
      }

      FormatToken token;
      switch (format[i + 1])
      {
      case 'T':
        token = FormatToken::Timestamp;
        break;
      case 't':
        token = FormatToken::ThreadId;
        break;
      case 'L':
        token = FormatToken::Level;
        break;
      case 'm':
        token = FormatToken::Message;
        break;
      case 'F':
        token = FormatToken::File;
        break;
      case 'l':
        token = FormatToken::Line;
        break;
      case 'f':
        token = FormatToken::Function;
        break;
      case '%':
        literal += '%';
        ++i;
        continue;
      default:
        // Unknown placeholder, keep the percent sign
        literal += format[i];
        continue;
      }
      flushLiteral();
      segments.push_back({token, ""});
      ++i;
    }
    flushLiteral();
  }

  static std::string timestamp()
  {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << ms.count();
    return oss.str();
  }

  static std::string formatLine(Level level, const std::string& message, const char* file,
                                int line, const char* function,
                                const std::vector<FormatSegment>& segments)
  {
    std::ostringstream oss;
    for (const auto& seg : segments)
    {
      switch (seg.token)
      {
      case FormatToken::Literal:
        oss << seg.literal;
        break;
      case FormatToken::Timestamp:
        oss << timestamp();
        break;
      case FormatToken::ThreadId:
        oss << std::hex << std::setfill('0') << std::setw(sizeof(std::size_t) * 2)
            << std::hash<std::thread::id>{}(std::this_thread::get_id()) << std::dec;
        break;
      case FormatToken::Level:
        oss << levelToString(level);
        break;
      case FormatToken::Message:
        oss << message;
        break;
      case FormatToken::File:
        if (file)
        {
          oss << detail::basename(file);
        }
        break;
      case FormatToken::Line:
        if (file)
        {
          oss << line;
        }
        break;
      case FormatToken::Function:
        if (function)
        {
          oss << function;
        }
        break;
      }
    }
    oss << '\n';
    return oss.str();
  }
};

/// \brief Stream-style logging macro with source location support
#define COURIER_LOG_WITH_LEVEL(level, msg)                                                         \
  do                                                                                               \
  {                                                                                                \
    std::ostringstream _oss;                                                                       \
    _oss << msg;                                                                                   \
    courier::core::Logger::log(courier::core::Logger::Level::level, _oss.str(), __FILE__,         \
                               __LINE__, __func__);                                                \
  } while (0)

#define COURIER_LOG_TRACE(msg) COURIER_LOG_WITH_LEVEL(Trace, msg)
#define COURIER_LOG_DEBUG(msg) COURIER_LOG_WITH_LEVEL(Debug, msg)
#define COURIER_LOG_INFO(msg) COURIER_LOG_WITH_LEVEL(Info, msg)
#define COURIER_LOG_WARN(msg) COURIER_LOG_WITH_LEVEL(Warning, msg)
#define COURIER_LOG_ERROR(msg) COURIER_LOG_WITH_LEVEL(Error, msg)
#define COURIER_LOG_FATAL(msg) COURIER_LOG_WITH_LEVEL(Fatal, msg)

} // namespace core
} // namespace courier
