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

#include "streamhttp/builder/transport_builder.hpp"

#include "streamhttp/common/logger.hpp"

namespace streamhttp {
namespace builder {

std::unique_ptr<transport::BeastTransport> TransportBuilder::build() {
  config::TransportConfig cfg = config_;
  if (!cfg.is_valid()) {
    STREAMHTTP_LOG_WARNING("transport_builder", "build", "Transport settings out of range, clamping");
    cfg.validate_and_clamp();
  }
  return std::make_unique<transport::BeastTransport>(cfg);
}

TransportBuilder& TransportBuilder::user_agent(const std::string& user_agent) {
  config_.user_agent = user_agent;
  return *this;
}

TransportBuilder& TransportBuilder::connection_timeout(unsigned timeout_ms) {
  config_.connection_timeout_ms = timeout_ms;
  return *this;
}

TransportBuilder& TransportBuilder::header_limit(uint32_t limit) {
  config_.header_limit = limit;
  return *this;
}

}  // namespace builder
}  // namespace streamhttp
