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

#include <atomic>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>

#include "streamhttp/base/visibility.hpp"
#include "streamhttp/interface/ideadline.hpp"

namespace streamhttp {
namespace timer {

namespace net = boost::asio;

/**
 * @brief Chunk deadline backed by a Boost.Asio steady_timer
 *
 * The armed flag and a generation counter live under one mutex, so the
 * decision "fire or not" is made exactly once per arming: stop() and an
 * expiring wait race for the lock and only one of them wins. Every arm and
 * reset bumps the generation, so waits scheduled for an earlier arming never
 * fire. Timer operations themselves run on a strand of the io_context.
 *
 * The fire handler runs on the io_context thread and must not block.
 */
class STREAMHTTP_API DeadlineTimer : public interface::DeadlineInterface,
                                     public std::enable_shared_from_this<DeadlineTimer> {
 public:
  using Clock = std::chrono::steady_clock;

  /**
   * @brief Create a timer on the shared context of IoContextManager
   *
   * Starts the shared context thread when it is not running yet.
   */
  static std::shared_ptr<DeadlineTimer> create();

  /**
   * @brief Create a timer on a caller-driven io_context
   */
  static std::shared_ptr<DeadlineTimer> create(net::io_context& ioc);

  ~DeadlineTimer() override = default;

  DeadlineTimer(const DeadlineTimer&) = delete;
  DeadlineTimer& operator=(const DeadlineTimer&) = delete;

  void arm(std::chrono::milliseconds duration, FireHandler on_fire) override;
  bool stop() override;
  bool reset(std::chrono::milliseconds duration) override;

  bool is_armed() const;
  std::uint64_t fire_count() const { return fire_count_.load(); }

 private:
  explicit DeadlineTimer(net::io_context& ioc);

  void schedule(std::uint64_t generation, Clock::time_point expiry);
  void on_expired(std::uint64_t generation, const boost::system::error_code& ec);

  net::strand<net::io_context::executor_type> strand_;
  net::steady_timer timer_;

  mutable std::mutex mutex_;
  FireHandler on_fire_;
  std::uint64_t generation_ = 0;
  bool armed_ = false;
  std::atomic<std::uint64_t> fire_count_{0};
};

}  // namespace timer
}  // namespace streamhttp
