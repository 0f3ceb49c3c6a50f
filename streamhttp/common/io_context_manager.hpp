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
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <memory>
#include <mutex>
#include <thread>

#include "streamhttp/base/visibility.hpp"

namespace streamhttp {
namespace common {

/**
 * @brief Owner of the shared io_context that drives deadline timers
 *
 * Timer callbacks of every request run on the single background thread
 * started here. The context itself lives as long as the manager, so timers
 * created before a stop() stay valid and resume after the next start().
 */
class STREAMHTTP_API IoContextManager {
 public:
  using IoContext = boost::asio::io_context;
  using WorkGuard = boost::asio::executor_work_guard<IoContext::executor_type>;

  static IoContextManager& instance();

  IoContext& get_context();

  /**
   * @brief Start the background thread if it is not running yet
   */
  void start();

  /**
   * @brief Stop the context and join the background thread
   *
   * Pending handlers are not run. Must not be called from a timer callback.
   */
  void stop();

  bool is_running() const;

  /**
   * @brief Create an io_context unrelated to the shared one
   *
   * Used for per-connection contexts and for test isolation.
   */
  std::unique_ptr<IoContext> create_independent_context();

  ~IoContextManager();

 private:
  IoContextManager();
  IoContextManager(const IoContextManager&) = delete;
  IoContextManager& operator=(const IoContextManager&) = delete;

  std::unique_ptr<IoContext> ioc_;
  std::unique_ptr<WorkGuard> work_guard_;
  std::thread io_thread_;
  std::atomic<bool> running_{false};
  mutable std::mutex mutex_;
};

}  // namespace common
}  // namespace streamhttp
