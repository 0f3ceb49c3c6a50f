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

#include <chrono>
#include <functional>

#include "streamhttp/common/constants.hpp"
#include "streamhttp/http/message.hpp"

namespace streamhttp {
namespace config {

/**
 * @brief Callback run on the constructed request before it is sent
 *
 * May change headers, query parameters, method or body length.
 */
using RequestModifier = std::function<void(http::Request&)>;

/**
 * @brief Per-call options of the request executor
 *
 * A zero timeout disables the chunk deadline entirely.
 */
struct RequestConfig {
  RequestModifier modifier;
  std::chrono::milliseconds timeout{common::constants::DEFAULT_REQUEST_TIMEOUT_MS};

  bool has_timeout() const { return timeout > std::chrono::milliseconds::zero(); }

  bool is_valid() const { return timeout >= std::chrono::milliseconds::zero(); }

  // Negative timeouts become zero; positive values have no upper bound
  void validate_and_clamp() {
    if (timeout < std::chrono::milliseconds::zero()) {
      timeout = std::chrono::milliseconds::zero();
    }
  }
};

}  // namespace config
}  // namespace streamhttp
