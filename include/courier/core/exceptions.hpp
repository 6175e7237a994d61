// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Courier, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#pragma once

#include <exception>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace courier
{
namespace message
{
  class Request;
  class Response;
} // namespace message

using RequestPtr = std::shared_ptr<message::Request>;
using ResponsePtr = std::shared_ptr<message::Response>;

/// \brief Base class of every failure raised while transferring.
class TransferError : public std::runtime_error
{
public:
  explicit TransferError(const std::string& message) : std::runtime_error(message) {}
};

/// \brief A specific request failed to prepare, transfer, or pass a response
/// policy. Always carries the offending request.
class RequestError : public TransferError
{
public:
  RequestError(const std::string& message, RequestPtr request, ResponsePtr response = nullptr,
               std::exception_ptr previous = nullptr)
    : TransferError(message),
      _request(std::move(request)),
      _response(std::move(response)),
      _previous(std::move(previous))
  {
  }

  const RequestPtr& getRequest() const { return _request; }
  const ResponsePtr& getResponse() const { return _response; }
  bool hasResponse() const { return _response != nullptr; }

  /// \brief The lower-level failure this error wraps, if any.
  std::exception_ptr getPrevious() const { return _previous; }

  /// \brief Whether this error has already been offered to the request's
  /// error listeners. An emitted error is rethrown as-is by outer
  /// dispatches instead of being emitted again.
  bool emittedError() const { return _emitted; }
  void setEmittedError(bool emitted) { _emitted = emitted; }

private:
  RequestPtr _request;
  ResponsePtr _response;
  std::exception_ptr _previous;
  bool _emitted = false;
};

/// \brief 4xx response while the request's "exceptions" option is enabled.
class ClientError : public RequestError
{
public:
  using RequestError::RequestError;
};

/// \brief 5xx response while the request's "exceptions" option is enabled.
class ServerError : public RequestError
{
public:
  using RequestError::RequestError;
};

/// \brief The redirect chain went past the configured maximum.
class TooManyRedirectsError : public RequestError
{
public:
  TooManyRedirectsError(const std::string& message, RequestPtr request, ResponsePtr response,
                        std::vector<std::string> chain = {})
    : RequestError(message, std::move(request), std::move(response)), _chain(std::move(chain))
  {
  }

  /// \brief URLs requested so far, the original request first.
  const std::vector<std::string>& getRedirectChain() const { return _chain; }

private:
  std::vector<std::string> _chain;
};

/// \brief A request body had to be replayed but could not be rewound.
class CouldNotRewindStreamError : public RequestError
{
public:
  using RequestError::RequestError;
};

/// \brief A transfer finished with a non-zero transport (curl) result.
class TransportError : public TransferError
{
public:
  TransportError(int code, const std::string& message) : TransferError(message), _code(code) {}

  int code() const { return _code; }

private:
  int _code;
};

/// \brief The multiplexer reported a control-plane failure. Fatal to the
/// whole batch.
class AdapterError : public TransferError
{
public:
  using TransferError::TransferError;
};

/// \brief A caller supplied an invalid argument (e.g. a non-positive
/// concurrency).
class InvalidArgumentError : public std::invalid_argument
{
public:
  using std::invalid_argument::invalid_argument;
};

} // namespace courier
