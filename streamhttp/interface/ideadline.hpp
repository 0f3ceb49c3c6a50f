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
#include <functional>

namespace streamhttp {
namespace interface {

/**
 * @brief A resettable one-shot deadline
 *
 * Abstracts the chunk timer so copy loops can be tested with a mock.
 * stop() followed by reset() must never leave a stale fire pending.
 */
class DeadlineInterface {
 public:
  using FireHandler = std::function<void()>;

  virtual ~DeadlineInterface() = default;

  /**
   * @brief Arm the deadline with a new fire handler
   */
  virtual void arm(std::chrono::milliseconds duration, FireHandler on_fire) = 0;

  /**
   * @brief Disarm the deadline
   * @return true when a pending fire was prevented
   */
  virtual bool stop() = 0;

  /**
   * @brief Re-arm the deadline with the current fire handler
   * @return true when the deadline was still armed
   */
  virtual bool reset(std::chrono::milliseconds duration) = 0;
};

}  // namespace interface
}  // namespace streamhttp
