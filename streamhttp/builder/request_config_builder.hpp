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

#include "streamhttp/base/visibility.hpp"
#include "streamhttp/config/request_config.hpp"

namespace streamhttp {
namespace builder {

/**
 * @brief Composes the options of one executor call
 *
 * Options are applied in call order, a later option of the same kind
 * replacing an earlier one. The result is fixed before the call starts.
 */
class STREAMHTTP_API RequestConfigBuilder {
 public:
  RequestConfigBuilder() = default;

  /**
   * @brief Set the callback that adjusts the constructed request
   * @param modifier Runs after construction, before the transport is called
   */
  RequestConfigBuilder& modifier(config::RequestModifier modifier);

  /**
   * @brief Set the chunk inactivity timeout
   * @param timeout Maximum gap between chunks; zero disables it
   */
  RequestConfigBuilder& timeout(std::chrono::milliseconds timeout);

  /**
   * @brief Produce the config; out of range timeouts are clamped with a warning
   */
  config::RequestConfig build() const;

 private:
  config::RequestConfig config_;
};

}  // namespace builder
}  // namespace streamhttp
