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

#include <cstdint>
#include <string>

#include "streamhttp/common/constants.hpp"

namespace streamhttp {
namespace config {

struct TransportConfig {
  std::string user_agent = common::constants::DEFAULT_USER_AGENT;
  unsigned connection_timeout_ms = common::constants::DEFAULT_CONNECTION_TIMEOUT_MS;
  uint32_t header_limit = common::constants::DEFAULT_HEADER_LIMIT;

  bool is_valid() const {
    return connection_timeout_ms >= common::constants::MIN_CONNECTION_TIMEOUT_MS &&
           connection_timeout_ms <= common::constants::MAX_CONNECTION_TIMEOUT_MS &&
           header_limit >= common::constants::MIN_HEADER_LIMIT && header_limit <= common::constants::MAX_HEADER_LIMIT;
  }

  // Apply validation and clamp values to valid ranges
  void validate_and_clamp() {
    if (connection_timeout_ms < common::constants::MIN_CONNECTION_TIMEOUT_MS) {
      connection_timeout_ms = common::constants::MIN_CONNECTION_TIMEOUT_MS;
    } else if (connection_timeout_ms > common::constants::MAX_CONNECTION_TIMEOUT_MS) {
      connection_timeout_ms = common::constants::MAX_CONNECTION_TIMEOUT_MS;
    }

    if (header_limit < common::constants::MIN_HEADER_LIMIT) {
      header_limit = common::constants::MIN_HEADER_LIMIT;
    } else if (header_limit > common::constants::MAX_HEADER_LIMIT) {
      header_limit = common::constants::MAX_HEADER_LIMIT;
    }
  }
};

}  // namespace config
}  // namespace streamhttp
