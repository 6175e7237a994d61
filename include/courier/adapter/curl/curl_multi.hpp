// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Courier, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#pragma once

#include "courier/core/exceptions.hpp"

#include <curl/curl.h>

#include <mutex>
#include <string>
#include <vector>

namespace courier
{
namespace adapter
{
namespace curl
{

  /// \brief Initialize libcurl once per process.
  inline void ensureCurlGlobalInit()
  {
    static std::once_flag flag;
    std::call_once(flag,
                   []()
                   {
                     CURLcode rc = curl_global_init(CURL_GLOBAL_ALL);
                     if (rc != CURLE_OK)
                     {
                       throw AdapterError(std::string("curl_global_init failed: ") +
                                          curl_easy_strerror(rc));
                     }
                   });
  }

  /// \brief A finished transfer reported by the multi handle.
  struct Completion
  {
    CURL* easy;
    int result;
  };

  /// \brief RAII owner of a libcurl multi handle.
  /// \details Methods return the raw CURLMcode so callers decide how a
  /// control-plane failure is reported.
  class CurlMulti
  {
  public:
    CurlMulti()
    {
      ensureCurlGlobalInit();
      _multi = curl_multi_init();
      if (!_multi)
      {
        throw AdapterError("Unable to create a cURL multi handle");
      }
    }

    ~CurlMulti() { curl_multi_cleanup(_multi); }

    CurlMulti(const CurlMulti&) = delete;
    CurlMulti& operator=(const CurlMulti&) = delete;

    CURLM* get() const { return _multi; }

    int add(CURL* easy) { return curl_multi_add_handle(_multi, easy); }

    int remove(CURL* easy) { return curl_multi_remove_handle(_multi, easy); }

    /// \brief Make progress on every transfer without blocking.
    int perform(int& running) { return curl_multi_perform(_multi, &running); }

    /// \brief Block until a transfer has activity or \p timeoutMs elapses.
    int select(int timeoutMs)
    {
      int numfds = 0;
      return curl_multi_poll(_multi, nullptr, 0, timeoutMs, &numfds);
    }

    /// \brief Drain the transfers that finished since the last call.
    std::vector<Completion> readCompleted()
    {
      std::vector<Completion> done;
      int remaining = 0;
      while (CURLMsg* msg = curl_multi_info_read(_multi, &remaining))
      {
        if (msg->msg == CURLMSG_DONE)
        {
          done.push_back({msg->easy_handle, static_cast<int>(msg->data.result)});
        }
      }
      return done;
    }

  private:
    CURLM* _multi = nullptr;
  };

} // namespace curl
} // namespace adapter
} // namespace courier
