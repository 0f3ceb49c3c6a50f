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

#include <boost/beast/http/verb.hpp>
#include <boost/system/error_code.hpp>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "streamhttp/base/visibility.hpp"
#include "streamhttp/common/thread_safe_state.hpp"
#include "streamhttp/concurrency/cancellation_signal.hpp"
#include "streamhttp/config/request_config.hpp"
#include "streamhttp/http/message.hpp"
#include "streamhttp/interface/ibyte_stream.hpp"
#include "streamhttp/interface/ideadline.hpp"
#include "streamhttp/interface/itransport.hpp"

namespace streamhttp {
namespace client {

/**
 * @brief Progress of one execute() call
 *
 * Idle -> Constructing -> AwaitingTransport -> CopyingResponse -> Validating -> Done.
 * TimeoutCanceled is entered from AwaitingTransport or CopyingResponse when
 * the chunk deadline fires. Done and TimeoutCanceled are terminal.
 */
enum class RequestState { Idle, Constructing, AwaitingTransport, CopyingResponse, Validating, Done, TimeoutCanceled };

STREAMHTTP_API std::string to_string(RequestState state);

struct ExecutionResult {
  // Empty when the request could not be built or the transport failed
  std::optional<http::Response> response;
  boost::system::error_code fault;
  std::uint64_t bytes_written = 0;

  bool ok() const { return !fault; }
};

/**
 * @brief Runs one request/response cycle with a per-chunk inactivity deadline
 *
 * With a positive timeout one deadline covers the whole call: it is armed
 * before the request is built, stopped around every chunk read from the
 * request body, stopped when the transport returns and re-armed around
 * every chunk read from the response body. When it fires it cancels the
 * call's signal, and the transport or body reader observing it fails with
 * ErrorCode::Canceled.
 *
 * The response body is always closed before execute() returns. Calls are
 * synchronous; last_state() reflects the most recent call.
 */
class STREAMHTTP_API RequestExecutor {
 public:
  using DeadlineFactory = std::function<std::shared_ptr<interface::DeadlineInterface>()>;
  using StateObserver = std::function<void(RequestState)>;

  /**
   * @throws common::ValidationException when transport is null
   */
  explicit RequestExecutor(std::shared_ptr<interface::TransportInterface> transport);
  RequestExecutor(std::shared_ptr<interface::TransportInterface> transport, DeadlineFactory deadline_factory);

  RequestExecutor(const RequestExecutor&) = delete;
  RequestExecutor& operator=(const RequestExecutor&) = delete;

  /**
   * @brief Execute one request
   * @param parent Caller's signal; cancelling it cancels the call (may be null)
   * @param method Request method
   * @param url Absolute http(s) URL
   * @param request_body Body to upload (may be null)
   * @param response_sink Receives the response body (may be null to discard it)
   * @param config Options composed with RequestConfigBuilder
   */
  ExecutionResult execute(const std::shared_ptr<concurrency::CancellationSignal>& parent,
                          boost::beast::http::verb method, const std::string& url,
                          std::shared_ptr<interface::ByteSourceInterface> request_body,
                          interface::ByteSinkInterface* response_sink,
                          const config::RequestConfig& config = config::RequestConfig{});

  RequestState last_state() const;

  /**
   * @brief Observe state changes; runs on the caller's or the timer's thread
   */
  void add_state_observer(StateObserver observer);

 private:
  using SharedState = common::ThreadSafeState<RequestState>;

  bool advance(RequestState from, RequestState to);
  void finish();
  boost::system::error_code validate_length(const http::Response& response, std::uint64_t bytes_written) const;

  std::shared_ptr<interface::TransportInterface> transport_;
  DeadlineFactory deadline_factory_;
  std::shared_ptr<SharedState> state_;
};

/**
 * @brief Parse a declared Content-Length
 *
 * Accepts decimal digits only, fitting in 64 bits.
 */
STREAMHTTP_API std::optional<std::uint64_t> parse_content_length(const std::string& value);

/**
 * @brief Execute one request through a temporary executor
 */
STREAMHTTP_API ExecutionResult do_request(std::shared_ptr<interface::TransportInterface> transport,
                                          const std::shared_ptr<concurrency::CancellationSignal>& parent,
                                          boost::beast::http::verb method, const std::string& url,
                                          std::shared_ptr<interface::ByteSourceInterface> request_body,
                                          interface::ByteSinkInterface* response_sink,
                                          const config::RequestConfig& config = config::RequestConfig{});

}  // namespace client
}  // namespace streamhttp
