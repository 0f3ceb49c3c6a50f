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

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

#include "streamhttp/base/visibility.hpp"

namespace streamhttp {
namespace concurrency {

/**
 * @brief Request-scoped cancellation token shared by pointer
 *
 * cancel() is idempotent and may be called from any thread, including a
 * timer callback. Handlers run once, on the thread that performed the
 * cancellation, after the state is visible to is_cancelled().
 */
class STREAMHTTP_API CancellationSignal {
 public:
  using Handler = std::function<void()>;
  using HandlerId = std::uint64_t;

  static std::shared_ptr<CancellationSignal> create();

  /**
   * @brief Create a child that is cancelled whenever the parent is
   *
   * Cancelling the child never affects the parent. A null parent yields a
   * fresh root signal.
   */
  static std::shared_ptr<CancellationSignal> derive(const std::shared_ptr<CancellationSignal>& parent);

  ~CancellationSignal();

  CancellationSignal(const CancellationSignal&) = delete;
  CancellationSignal& operator=(const CancellationSignal&) = delete;

  /**
   * @brief Cancel the signal
   * @return true if this call performed the cancellation
   */
  bool cancel();

  bool is_cancelled() const;

  /**
   * @brief Block until cancelled or the timeout passes
   * @return true when the signal is cancelled
   */
  bool wait_for(std::chrono::milliseconds timeout) const;

  /**
   * @brief Register a cancellation handler
   *
   * When the signal is already cancelled the handler runs immediately on
   * the calling thread and 0 is returned.
   */
  HandlerId add_handler(Handler handler);

  /**
   * @brief Unregister a handler
   *
   * A handler that is already running is not waited for.
   */
  void remove_handler(HandlerId id);

 private:
  CancellationSignal() = default;

  mutable std::mutex mutex_;
  mutable std::condition_variable cv_;
  bool cancelled_ = false;
  HandlerId next_id_ = 1;
  std::map<HandlerId, Handler> handlers_;

  std::weak_ptr<CancellationSignal> parent_;
  HandlerId parent_handler_id_ = 0;
};

}  // namespace concurrency
}  // namespace streamhttp
