/*
 * Copyright 2025 Jinwoo Sung
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#pragma once

#include <string>

#include "streamhttp/base/error_codes.hpp"
#include "streamhttp/base/visibility.hpp"

// Builder API
#include "streamhttp/builder/ibuilder.hpp"
#include "streamhttp/builder/request_config_builder.hpp"
#include "streamhttp/builder/transport_builder.hpp"

// Request execution
#include "streamhttp/client/request_executor.hpp"
#include "streamhttp/concurrency/cancellation_signal.hpp"
#include "streamhttp/config/request_config.hpp"
#include "streamhttp/config/transport_config.hpp"
#include "streamhttp/http/message.hpp"
#include "streamhttp/http/url.hpp"
#include "streamhttp/transport/beast_transport.hpp"

// Streaming primitives
#include "streamhttp/stream/bounded_copy.hpp"
#include "streamhttp/stream/chunk_timeout_reader.hpp"
#include "streamhttp/stream/memory_stream.hpp"
#include "streamhttp/stream/watchdog_copy.hpp"
#include "streamhttp/timer/deadline_timer.hpp"

// Error handling and logging system includes
#include "streamhttp/common/error_handler.hpp"
#include "streamhttp/common/logger.hpp"

namespace streamhttp {

// === Convenience Functions ===

/**
 * @brief Start composing the options of one request
 */
inline builder::RequestConfigBuilder request_options() { return builder::RequestConfigBuilder(); }

/**
 * @brief Create a builder for the Beast transport
 */
inline builder::TransportBuilder http_transport() { return builder::TransportBuilder(); }

using client::do_request;
using client::ExecutionResult;
using client::RequestExecutor;
using stream::watchdog_copy;

}  // namespace streamhttp
