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
#include <optional>

#include "streamhttp/http/message.hpp"

namespace streamhttp {
namespace interface {

/**
 * @brief The HTTP wire capability consumed by the request executor
 *
 * perform() sends the request (headers, then the body source if any) and
 * returns once the response headers are available. The response body is
 * left unread in Response::body. Implementations must observe the signal
 * attached to the request and fail with ErrorCode::Canceled once it fires.
 */
class TransportInterface {
 public:
  virtual ~TransportInterface() = default;

  virtual std::optional<http::Response> perform(http::Request& request, boost::system::error_code& ec) = 0;
};

}  // namespace interface
}  // namespace streamhttp
