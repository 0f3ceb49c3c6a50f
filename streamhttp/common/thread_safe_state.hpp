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
#include <functional>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

#include "streamhttp/common/logger.hpp"

namespace streamhttp {
namespace common {

/**
 * @brief Thread-safe state management class
 *
 * Multiple readers can access the state simultaneously, only one writer can
 * modify it at a time. compare_and_set lets two threads race for a transition
 * with exactly one winner.
 */
template <typename StateType>
class ThreadSafeState {
 public:
  using State = StateType;
  using StateCallback = std::function<void(const State&)>;

  explicit ThreadSafeState(const State& initial_state = State{});
  ThreadSafeState(const ThreadSafeState&) = delete;
  ThreadSafeState& operator=(const ThreadSafeState&) = delete;
  ThreadSafeState(ThreadSafeState&&) = delete;
  ThreadSafeState& operator=(ThreadSafeState&&) = delete;

  State get_state() const;
  void set_state(const State& new_state);

  bool compare_and_set(const State& expected, const State& desired);
  State exchange(const State& new_state);

  /**
   * @brief Register a callback invoked after every state change
   *
   * Callbacks run on the thread that performed the change, without any lock
   * of this object held.
   */
  void add_state_change_callback(StateCallback callback);
  void clear_state_change_callbacks();

  /**
   * @brief Block until the state equals expected_state or the timeout passes
   * @return true when the expected state was observed
   */
  bool wait_for_state(const State& expected_state, std::chrono::milliseconds timeout = std::chrono::milliseconds(1000));

  bool is_state(const State& expected_state) const;

 private:
  mutable std::shared_mutex state_mutex_;
  State state_;

  std::vector<StateCallback> callbacks_;
  mutable std::mutex callbacks_mutex_;

  std::condition_variable_any state_cv_;

  void notify_callbacks(const State& new_state);
};

template <typename StateType>
ThreadSafeState<StateType>::ThreadSafeState(const State& initial_state) : state_(initial_state) {}

template <typename StateType>
StateType ThreadSafeState<StateType>::get_state() const {
  std::shared_lock<std::shared_mutex> lock(state_mutex_);
  return state_;
}

template <typename StateType>
void ThreadSafeState<StateType>::set_state(const State& new_state) {
  {
    std::unique_lock<std::shared_mutex> lock(state_mutex_);
    state_ = new_state;
  }
  notify_callbacks(new_state);
  state_cv_.notify_all();
}

template <typename StateType>
bool ThreadSafeState<StateType>::compare_and_set(const State& expected, const State& desired) {
  {
    std::unique_lock<std::shared_mutex> lock(state_mutex_);
    if (!(state_ == expected)) {
      return false;
    }
    state_ = desired;
  }
  notify_callbacks(desired);
  state_cv_.notify_all();
  return true;
}

template <typename StateType>
StateType ThreadSafeState<StateType>::exchange(const State& new_state) {
  State old_state;
  {
    std::unique_lock<std::shared_mutex> lock(state_mutex_);
    old_state = state_;
    state_ = new_state;
  }
  notify_callbacks(new_state);
  state_cv_.notify_all();
  return old_state;
}

template <typename StateType>
void ThreadSafeState<StateType>::add_state_change_callback(StateCallback callback) {
  std::lock_guard<std::mutex> lock(callbacks_mutex_);
  callbacks_.push_back(std::move(callback));
}

template <typename StateType>
void ThreadSafeState<StateType>::clear_state_change_callbacks() {
  std::lock_guard<std::mutex> lock(callbacks_mutex_);
  callbacks_.clear();
}

template <typename StateType>
bool ThreadSafeState<StateType>::wait_for_state(const State& expected_state, std::chrono::milliseconds timeout) {
  std::unique_lock<std::shared_mutex> lock(state_mutex_);
  return state_cv_.wait_for(lock, timeout, [this, &expected_state] { return state_ == expected_state; });
}

template <typename StateType>
bool ThreadSafeState<StateType>::is_state(const State& expected_state) const {
  std::shared_lock<std::shared_mutex> lock(state_mutex_);
  return state_ == expected_state;
}

template <typename StateType>
void ThreadSafeState<StateType>::notify_callbacks(const State& new_state) {
  std::vector<StateCallback> callbacks_copy;
  {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    callbacks_copy = callbacks_;
  }
  for (const auto& callback : callbacks_copy) {
    try {
      callback(new_state);
    } catch (const std::exception& e) {
      STREAMHTTP_LOG_ERROR("thread_safe_state", "callback", "State callback threw: " + std::string(e.what()));
    }
  }
}

}  // namespace common
}  // namespace streamhttp
