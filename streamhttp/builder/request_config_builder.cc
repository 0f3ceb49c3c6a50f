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

#include "streamhttp/builder/request_config_builder.hpp"

#include <string>

#include "streamhttp/common/logger.hpp"

namespace streamhttp {
namespace builder {

RequestConfigBuilder& RequestConfigBuilder::modifier(config::RequestModifier modifier) {
  config_.modifier = std::move(modifier);
  return *this;
}

RequestConfigBuilder& RequestConfigBuilder::timeout(std::chrono::milliseconds timeout) {
  config_.timeout = timeout;
  return *this;
}

config::RequestConfig RequestConfigBuilder::build() const {
  config::RequestConfig result = config_;
  if (!result.is_valid()) {
    STREAMHTTP_LOG_WARNING("request_config_builder", "build",
                           "Timeout " + std::to_string(result.timeout.count()) + "ms out of range, clamping");
    result.validate_and_clamp();
  }
  return result;
}

}  // namespace builder
}  // namespace streamhttp
