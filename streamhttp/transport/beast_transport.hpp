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

#include <boost/system/error_code.hpp>
#include <memory>
#include <optional>

#include "streamhttp/base/visibility.hpp"
#include "streamhttp/config/transport_config.hpp"
#include "streamhttp/interface/itransport.hpp"

namespace streamhttp {
namespace transport {

struct Connection;

/**
 * @brief HTTP/1.1 transport over plain TCP built on Boost.Beast
 *
 * Every perform() opens its own connection with a private io_context driven
 * by the calling thread. The connection is owned by the response body and
 * closed with it. No redirects are followed, no connections are pooled and
 * https URLs are rejected with ErrorCode::UnsupportedScheme.
 *
 * Cancellation of the request's signal, from any thread, aborts the pending
 * socket operation; the operation then reports ErrorCode::Canceled.
 */
class STREAMHTTP_API BeastTransport : public interface::TransportInterface {
 public:
  explicit BeastTransport(const config::TransportConfig& cfg = config::TransportConfig{});
  ~BeastTransport() override = default;

  std::optional<http::Response> perform(http::Request& request, boost::system::error_code& ec) override;

  const config::TransportConfig& config() const { return cfg_; }

 private:
  void connect(Connection& conn, const http::Url& url, boost::system::error_code& ec);
  void send_request(Connection& conn, http::Request& request, boost::system::error_code& ec);
  std::optional<http::Response> receive_header(const std::shared_ptr<Connection>& conn, const http::Request& request,
                                               boost::system::error_code& ec);

  config::TransportConfig cfg_;
};

}  // namespace transport
}  // namespace streamhttp
