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

#include "streamhttp/timer/deadline_timer.hpp"

#include <boost/asio/post.hpp>
#include <string>

#include "streamhttp/common/error_handler.hpp"
#include "streamhttp/common/io_context_manager.hpp"
#include "streamhttp/common/logger.hpp"

namespace streamhttp {
namespace timer {

std::shared_ptr<DeadlineTimer> DeadlineTimer::create() {
  auto& manager = common::IoContextManager::instance();
  manager.start();
  return create(manager.get_context());
}

std::shared_ptr<DeadlineTimer> DeadlineTimer::create(net::io_context& ioc) {
  return std::shared_ptr<DeadlineTimer>(new DeadlineTimer(ioc));
}

DeadlineTimer::DeadlineTimer(net::io_context& ioc) : strand_(net::make_strand(ioc)), timer_(strand_) {}

void DeadlineTimer::arm(std::chrono::milliseconds duration, FireHandler on_fire) {
  std::uint64_t generation;
  auto expiry = Clock::now() + duration;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    on_fire_ = std::move(on_fire);
    generation = ++generation_;
    armed_ = true;
  }
  STREAMHTTP_LOG_DEBUG("deadline_timer", "arm", "Armed for " + std::to_string(duration.count()) + "ms");
  schedule(generation, expiry);
}

bool DeadlineTimer::stop() {
  bool was_armed;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    was_armed = armed_;
    armed_ = false;
    ++generation_;
  }

  if (was_armed) {
    auto self = shared_from_this();
    net::post(strand_, [self] { self->timer_.cancel(); });
  }
  return was_armed;
}

bool DeadlineTimer::reset(std::chrono::milliseconds duration) {
  bool was_armed;
  std::uint64_t generation;
  auto expiry = Clock::now() + duration;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    was_armed = armed_;
    generation = ++generation_;
    armed_ = true;
  }
  schedule(generation, expiry);
  return was_armed;
}

bool DeadlineTimer::is_armed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return armed_;
}

void DeadlineTimer::schedule(std::uint64_t generation, Clock::time_point expiry) {
  auto self = shared_from_this();
  net::post(strand_, [self, generation, expiry] {
    {
      std::lock_guard<std::mutex> lock(self->mutex_);
      if (generation != self->generation_) {
        return;  // superseded before it reached the strand
      }
    }
    self->timer_.expires_at(expiry);
    self->timer_.async_wait(
        [self, generation](const boost::system::error_code& ec) { self->on_expired(generation, ec); });
  });
}

void DeadlineTimer::on_expired(std::uint64_t generation, const boost::system::error_code& ec) {
  if (ec == net::error::operation_aborted) {
    return;
  }

  FireHandler handler;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!armed_ || generation != generation_) {
      return;
    }
    armed_ = false;
    handler = on_fire_;
  }

  fire_count_.fetch_add(1);
  STREAMHTTP_LOG_DEBUG("deadline_timer", "expire", "Deadline fired");
  if (!handler) {
    return;
  }
  try {
    handler();
  } catch (const std::exception& e) {
    STREAMHTTP_LOG_ERROR("deadline_timer", "expire", "Fire handler threw: " + std::string(e.what()));
    common::error_reporting::report_system_error("deadline_timer", "expire",
                                                 "Fire handler threw: " + std::string(e.what()));
  } catch (...) {
    // Keep the shared timer thread alive for other deadlines
    STREAMHTTP_LOG_ERROR("deadline_timer", "expire", "Fire handler threw a non-standard exception");
    common::error_reporting::report_system_error("deadline_timer", "expire",
                                                 "Fire handler threw a non-standard exception");
  }
}

}  // namespace timer
}  // namespace streamhttp
