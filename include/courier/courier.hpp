// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Courier, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#pragma once

#include "adapter/adapter_interface.hpp"
#include "adapter/curl/curl_adapter.hpp"
#include "adapter/fake_parallel_adapter.hpp"
#include "adapter/transaction.hpp"
#include "adapter/transaction_iterator.hpp"
#include "client.hpp"
#include "client_interface.hpp"
#include "core/config_loader.hpp"
#include "core/exceptions.hpp"
#include "core/json.hpp"
#include "core/logger.hpp"
#include "event/event_emitter.hpp"
#include "event/events.hpp"
#include "event/request_events.hpp"
#include "message/message_factory.hpp"
#include "message/request.hpp"
#include "message/response.hpp"
#include "message/stream.hpp"
#include "message/url.hpp"
#include "subscriber/history.hpp"
#include "subscriber/http_error.hpp"
#include "subscriber/mock.hpp"
#include "subscriber/redirect.hpp"

#define COURIER_DEFAULT_CONFIG_FILE_PATH "/etc/courier/courier.json"
