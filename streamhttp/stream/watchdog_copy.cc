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

#include "streamhttp/stream/watchdog_copy.hpp"

#include <condition_variable>
#include <exception>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "streamhttp/base/error_codes.hpp"
#include "streamhttp/common/error_handler.hpp"
#include "streamhttp/common/exceptions.hpp"
#include "streamhttp/common/logger.hpp"
#include "streamhttp/timer/deadline_timer.hpp"

namespace streamhttp {
namespace stream {

namespace {

// First outcome wins; later ones are discarded.
struct RaceState {
  std::mutex mutex;
  std::condition_variable cv;
  bool accepting_fire = false;
  bool timed_out = false;
  std::optional<TransferResult> result;
  std::exception_ptr error;

  bool decided() const { return timed_out || result.has_value() || error != nullptr; }
};

}  // namespace

TransferResult watchdog_copy(std::shared_ptr<interface::ByteSinkInterface> sink,
                             std::shared_ptr<interface::ByteSourceInterface> source, std::chrono::milliseconds timeout,
                             TransferSide side) {
  return watchdog_copy(std::move(sink), std::move(source), timer::DeadlineTimer::create(), timeout, side);
}

TransferResult watchdog_copy(std::shared_ptr<interface::ByteSinkInterface> sink,
                             std::shared_ptr<interface::ByteSourceInterface> source,
                             std::shared_ptr<interface::DeadlineInterface> deadline, std::chrono::milliseconds timeout,
                             TransferSide side) {
  if (!sink || !source) {
    throw common::ValidationException("Source and sink must not be null", "stream");
  }
  if (!deadline) {
    throw common::ValidationException("Deadline must not be null", "deadline");
  }
  if (timeout <= std::chrono::milliseconds::zero()) {
    throw common::ValidationException("Watchdog timeout must be positive", "timeout", "> 0ms");
  }

  auto race = std::make_shared<RaceState>();

  // Install the fire handler but leave the deadline disarmed; the copy loop
  // arms it around each call on the bounded side.
  deadline->arm(timeout, [race]() {
    {
      std::lock_guard<std::mutex> lock(race->mutex);
      if (!race->accepting_fire || race->decided()) {
        return;
      }
      race->timed_out = true;
    }
    race->cv.notify_all();
  });
  deadline->stop();
  {
    std::lock_guard<std::mutex> lock(race->mutex);
    race->accepting_fire = true;
  }

  std::thread worker([race, sink, source, deadline, timeout, side]() {
    bool discarded = false;
    try {
      TransferResult result = bounded_copy(*sink, *source, *deadline, timeout, side);
      std::lock_guard<std::mutex> lock(race->mutex);
      if (race->decided()) {
        discarded = true;
      } else {
        race->result = result;
      }
    } catch (...) {
      std::lock_guard<std::mutex> lock(race->mutex);
      if (race->decided()) {
        discarded = true;
      } else {
        race->error = std::current_exception();
      }
    }
    race->cv.notify_all();

    if (discarded) {
      STREAMHTTP_LOG_DEBUG("watchdog_copy", "worker", "Abandoned copy finished, outcome discarded");
    }
  });
  worker.detach();

  std::unique_lock<std::mutex> lock(race->mutex);
  race->cv.wait(lock, [&race] { return race->decided(); });

  if (race->timed_out) {
    lock.unlock();
    auto fault = make_error_code(ErrorCode::CopyTimeout);
    std::string message = "No " + to_string(side) + " chunk completed within " + std::to_string(timeout.count()) +
                          "ms, worker abandoned";
    STREAMHTTP_LOG_WARNING("watchdog_copy", "copy", message);
    common::error_reporting::report_timeout("watchdog_copy", "copy", message, fault);
    return TransferResult{0, fault};
  }

  std::exception_ptr error = race->error;
  TransferResult result = race->result.value_or(TransferResult{});
  lock.unlock();
  deadline->stop();

  if (error) {
    common::error_reporting::report_critical("watchdog_copy", "worker", "Copy worker raised an exception");
    std::rethrow_exception(error);
  }

  if (result.fault) {
    common::error_reporting::report_transfer_error("watchdog_copy", "copy", result.fault);
  }
  return result;
}

}  // namespace stream
}  // namespace streamhttp
