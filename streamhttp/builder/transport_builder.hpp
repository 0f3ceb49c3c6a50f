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
#include <memory>
#include <string>

#include "streamhttp/base/visibility.hpp"
#include "streamhttp/builder/ibuilder.hpp"
#include "streamhttp/config/transport_config.hpp"
#include "streamhttp/transport/beast_transport.hpp"

namespace streamhttp {
namespace builder {

/**
 * @brief Builder for BeastTransport
 */
class STREAMHTTP_API TransportBuilder : public BuilderInterface<transport::BeastTransport> {
 public:
  TransportBuilder() = default;

  std::unique_ptr<transport::BeastTransport> build() override;

  TransportBuilder& user_agent(const std::string& user_agent);

  /**
   * @brief Bound for resolve plus connect, clamped to the supported range
   */
  TransportBuilder& connection_timeout(unsigned timeout_ms);

  /**
   * @brief Maximum size of the response header block
   */
  TransportBuilder& header_limit(uint32_t limit);

 private:
  config::TransportConfig config_;
};

}  // namespace builder
}  // namespace streamhttp
