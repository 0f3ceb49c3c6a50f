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

#include "streamhttp/client/request_executor.hpp"

#include <charconv>

#include "streamhttp/base/error_codes.hpp"
#include "streamhttp/common/error_handler.hpp"
#include "streamhttp/common/exceptions.hpp"
#include "streamhttp/common/logger.hpp"
#include "streamhttp/stream/bounded_copy.hpp"
#include "streamhttp/stream/chunk_timeout_reader.hpp"
#include "streamhttp/timer/deadline_timer.hpp"

namespace streamhttp {
namespace client {

namespace {

constexpr const char* kComponent = "executor";

// Cancels the call's signal on every exit path
class SignalGuard {
 public:
  explicit SignalGuard(std::shared_ptr<concurrency::CancellationSignal> signal) : signal_(std::move(signal)) {}
  ~SignalGuard() { signal_->cancel(); }

  SignalGuard(const SignalGuard&) = delete;
  SignalGuard& operator=(const SignalGuard&) = delete;

 private:
  std::shared_ptr<concurrency::CancellationSignal> signal_;
};

class DeadlineGuard {
 public:
  explicit DeadlineGuard(std::shared_ptr<interface::DeadlineInterface> deadline) : deadline_(std::move(deadline)) {}
  ~DeadlineGuard() {
    if (deadline_) {
      deadline_->stop();
    }
  }

  DeadlineGuard(const DeadlineGuard&) = delete;
  DeadlineGuard& operator=(const DeadlineGuard&) = delete;

 private:
  std::shared_ptr<interface::DeadlineInterface> deadline_;
};

// Closes the response body on every exit path
class BodyGuard {
 public:
  explicit BodyGuard(std::optional<http::Response>& response) : response_(response) {}
  ~BodyGuard() {
    if (response_) {
      response_->close_body();
    }
  }

  BodyGuard(const BodyGuard&) = delete;
  BodyGuard& operator=(const BodyGuard&) = delete;

 private:
  std::optional<http::Response>& response_;
};

}  // namespace

std::string to_string(RequestState state) {
  switch (state) {
    case RequestState::Idle:
      return "Idle";
    case RequestState::Constructing:
      return "Constructing";
    case RequestState::AwaitingTransport:
      return "AwaitingTransport";
    case RequestState::CopyingResponse:
      return "CopyingResponse";
    case RequestState::Validating:
      return "Validating";
    case RequestState::Done:
      return "Done";
    case RequestState::TimeoutCanceled:
      return "TimeoutCanceled";
  }
  return "Unknown";
}

std::optional<std::uint64_t> parse_content_length(const std::string& value) {
  if (value.empty()) {
    return std::nullopt;
  }
  std::uint64_t length = 0;
  const char* first = value.data();
  const char* last = value.data() + value.size();
  auto [ptr, ec] = std::from_chars(first, last, length);
  if (ec != std::errc() || ptr != last) {
    return std::nullopt;
  }
  return length;
}

RequestExecutor::RequestExecutor(std::shared_ptr<interface::TransportInterface> transport)
    : RequestExecutor(std::move(transport), []() -> std::shared_ptr<interface::DeadlineInterface> {
        return timer::DeadlineTimer::create();
      }) {}

RequestExecutor::RequestExecutor(std::shared_ptr<interface::TransportInterface> transport,
                                 DeadlineFactory deadline_factory)
    : transport_(std::move(transport)),
      deadline_factory_(std::move(deadline_factory)),
      state_(std::make_shared<SharedState>(RequestState::Idle)) {
  if (!transport_) {
    throw common::ValidationException("Transport must not be null", "transport");
  }
  if (!deadline_factory_) {
    throw common::ValidationException("Deadline factory must not be null", "deadline_factory");
  }
}

RequestState RequestExecutor::last_state() const { return state_->get_state(); }

void RequestExecutor::add_state_observer(StateObserver observer) {
  state_->add_state_change_callback(std::move(observer));
}

bool RequestExecutor::advance(RequestState from, RequestState to) {
  if (!state_->compare_and_set(from, to)) {
    return false;
  }
  STREAMHTTP_LOG_DEBUG(kComponent, "state", to_string(from) + " -> " + to_string(to));
  return true;
}

void RequestExecutor::finish() {
  for (;;) {
    RequestState current = state_->get_state();
    if (current == RequestState::Done || current == RequestState::TimeoutCanceled) {
      return;
    }
    if (advance(current, RequestState::Done)) {
      return;
    }
  }
}

boost::system::error_code RequestExecutor::validate_length(const http::Response& response,
                                                           std::uint64_t bytes_written) const {
  auto declared = response.content_length();
  if (!declared) {
    return {};
  }

  auto length = parse_content_length(*declared);
  if (!length) {
    auto fault = make_error_code(ErrorCode::LengthParse);
    common::error_reporting::report_validation_error(kComponent, "validate_length",
                                                     "Invalid Content-Length: '" + *declared + "'", fault);
    return fault;
  }
  if (*length != bytes_written) {
    auto fault = make_error_code(ErrorCode::LengthMismatch);
    common::error_reporting::report_validation_error(
        kComponent, "validate_length",
        "Declared " + std::to_string(*length) + " bytes, received " + std::to_string(bytes_written), fault);
    return fault;
  }
  return {};
}

ExecutionResult RequestExecutor::execute(const std::shared_ptr<concurrency::CancellationSignal>& parent,
                                         boost::beast::http::verb method, const std::string& url,
                                         std::shared_ptr<interface::ByteSourceInterface> request_body,
                                         interface::ByteSinkInterface* response_sink,
                                         const config::RequestConfig& config) {
  ExecutionResult result;

  config::RequestConfig cfg = config;
  if (!cfg.is_valid()) {
    STREAMHTTP_LOG_WARNING(kComponent, "configure", "Timeout out of range, clamping");
    cfg.validate_and_clamp();
  }

  state_->set_state(RequestState::Idle);
  advance(RequestState::Idle, RequestState::Constructing);

  auto signal = concurrency::CancellationSignal::derive(parent);
  SignalGuard signal_guard(signal);

  std::shared_ptr<interface::DeadlineInterface> deadline;
  if (cfg.has_timeout()) {
    deadline = deadline_factory_();
    std::weak_ptr<concurrency::CancellationSignal> weak_signal = signal;
    std::shared_ptr<SharedState> state = state_;
    auto timeout = cfg.timeout;
    deadline->arm(cfg.timeout, [weak_signal, state, timeout]() {
      bool in_flight = state->compare_and_set(RequestState::AwaitingTransport, RequestState::TimeoutCanceled) ||
                       state->compare_and_set(RequestState::CopyingResponse, RequestState::TimeoutCanceled);
      std::string message = "No chunk within " + std::to_string(timeout.count()) + "ms, canceling request";
      STREAMHTTP_LOG_WARNING(kComponent, "deadline", message);
      if (in_flight) {
        common::error_reporting::report_timeout(kComponent, "deadline", message,
                                                make_error_code(ErrorCode::Canceled));
      }
      if (auto s = weak_signal.lock()) {
        s->cancel();
      }
    });
  }
  DeadlineGuard deadline_guard(deadline);

  if (request_body && deadline) {
    request_body = std::make_shared<stream::ChunkTimeoutReader>(request_body, deadline, cfg.timeout, signal);
  }

  boost::system::error_code ec;
  http::Url target = http::Url::parse(url, ec);
  if (ec) {
    result.fault = ec;
    STREAMHTTP_LOG_ERROR(kComponent, "construct", "Cannot build request for '" + url + "': " + ec.message());
    common::error_reporting::report_configuration_error(kComponent, "construct", ec.message() + ": " + url);
    finish();
    return result;
  }

  http::Request request(method, std::move(target));
  request.set_body(request_body);
  request.set_signal(signal);
  if (cfg.modifier) {
    cfg.modifier(request);
  }

  advance(RequestState::Constructing, RequestState::AwaitingTransport);
  result.response = transport_->perform(request, ec);
  if (deadline) {
    deadline->stop();
  }
  BodyGuard body_guard(result.response);

  if (ec || !result.response) {
    result.response.reset();
    result.fault = ec ? ec : make_error_code(ErrorCode::InternalError);
    STREAMHTTP_LOG_ERROR(kComponent, "perform", request.method_string() + " " + url + ": " + result.fault.message());
    common::error_reporting::report_transport_error(kComponent, "perform", result.fault);
    finish();
    return result;
  }

  if (response_sink) {
    advance(RequestState::AwaitingTransport, RequestState::CopyingResponse);

    stream::TransferResult transfer;
    const auto& body = result.response->body();
    if (body) {
      transfer = deadline ? stream::bounded_copy(*response_sink, *body, *deadline, cfg.timeout,
                                                 stream::TransferSide::Read)
                          : stream::copy_stream(*response_sink, *body);
    }
    result.response->close_body();
    result.bytes_written = transfer.bytes_written;

    if (transfer.fault) {
      result.fault = transfer.fault;
      STREAMHTTP_LOG_ERROR(kComponent, "copy_response",
                           "Body copy failed after " + std::to_string(transfer.bytes_written) +
                               " bytes: " + transfer.fault.message());
      common::error_reporting::report_transfer_error(kComponent, "copy_response", transfer.fault);
      finish();
      return result;
    }

    advance(RequestState::CopyingResponse, RequestState::Validating);
    if (method != boost::beast::http::verb::head) {
      result.fault = validate_length(*result.response, result.bytes_written);
    }
  }

  result.response->close_body();
  finish();
  STREAMHTTP_LOG_DEBUG(kComponent, "execute",
                       request.method_string() + " " + url + " -> " +
                           std::to_string(result.response->status_code()) + ", " +
                           std::to_string(result.bytes_written) + " bytes");
  return result;
}

ExecutionResult do_request(std::shared_ptr<interface::TransportInterface> transport,
                           const std::shared_ptr<concurrency::CancellationSignal>& parent,
                           boost::beast::http::verb method, const std::string& url,
                           std::shared_ptr<interface::ByteSourceInterface> request_body,
                           interface::ByteSinkInterface* response_sink, const config::RequestConfig& config) {
  RequestExecutor executor(std::move(transport));
  return executor.execute(parent, method, url, std::move(request_body), response_sink, config);
}

}  // namespace client
}  // namespace streamhttp
