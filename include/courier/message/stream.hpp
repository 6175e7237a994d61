// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Courier, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace courier
{
namespace message
{

  /// \brief Readable message body. Implementations decide whether they can
  /// be rewound; the engine only relies on tell/seek/eof/read.
  class Stream
  {
  public:
    virtual ~Stream() = default;

    /// \brief Read up to \p length bytes from the current position.
    virtual std::string read(std::size_t length) = 0;

    virtual bool eof() const = 0;

    /// \brief Current read position in bytes.
    virtual std::int64_t tell() const = 0;

    /// \brief Move the read position. Returns false if the stream cannot seek.
    virtual bool seek(std::int64_t offset) = 0;

    virtual bool isSeekable() const = 0;

    /// \brief Total size when known.
    virtual std::optional<std::size_t> getSize() const = 0;

    /// \brief Remaining content from the current position.
    std::string getContents()
    {
      std::string result;
      while (!eof())
      {
        auto chunk = read(8192);
        if (chunk.empty())
        {
          break;
        }
        result += chunk;
      }
      return result;
    }

    /// \brief Whole content when the stream can be rewound, otherwise what
    /// is left of it.
    /// \throws std::runtime_error when a seekable stream fails to rewind
    std::string toString()
    {
      if (isSeekable() && !seek(0))
      {
        throw std::runtime_error("Unable to rewind the stream to read its whole content");
      }
      return getContents();
    }
  };

  using StreamPtr = std::shared_ptr<Stream>;

  /// \brief In-memory seekable stream.
  class StringStream : public Stream
  {
  public:
    explicit StringStream(std::string data = {}) : _data(std::move(data)) {}

    std::string read(std::size_t length) override
    {
      if (_position >= _data.size())
      {
        return {};
      }
      auto chunk = _data.substr(_position, length);
      _position += chunk.size();
      return chunk;
    }

    bool eof() const override { return _position >= _data.size(); }

    std::int64_t tell() const override { return static_cast<std::int64_t>(_position); }

    bool seek(std::int64_t offset) override
    {
      if (offset < 0 || static_cast<std::size_t>(offset) > _data.size())
      {
        return false;
      }
      _position = static_cast<std::size_t>(offset);
      return true;
    }

    bool isSeekable() const override { return true; }

    std::optional<std::size_t> getSize() const override { return _data.size(); }

    void append(const char* data, std::size_t length) { _data.append(data, length); }

  private:
    std::string _data;
    std::size_t _position = 0;
  };

  inline StreamPtr makeStream(std::string data)
  {
    return std::make_shared<StringStream>(std::move(data));
  }

} // namespace message
} // namespace courier
