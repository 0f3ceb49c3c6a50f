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

#include "streamhttp/concurrency/cancellation_signal.hpp"

#include <string>
#include <vector>

#include "streamhttp/common/logger.hpp"

namespace streamhttp {
namespace concurrency {

std::shared_ptr<CancellationSignal> CancellationSignal::create() {
  return std::shared_ptr<CancellationSignal>(new CancellationSignal());
}

std::shared_ptr<CancellationSignal> CancellationSignal::derive(const std::shared_ptr<CancellationSignal>& parent) {
  auto child = create();
  if (!parent) {
    return child;
  }

  std::weak_ptr<CancellationSignal> weak_child = child;
  child->parent_ = parent;
  child->parent_handler_id_ = parent->add_handler([weak_child]() {
    if (auto c = weak_child.lock()) {
      c->cancel();
    }
  });
  return child;
}

CancellationSignal::~CancellationSignal() {
  if (parent_handler_id_ == 0) {
    return;
  }
  if (auto parent = parent_.lock()) {
    parent->remove_handler(parent_handler_id_);
  }
}

bool CancellationSignal::cancel() {
  std::map<HandlerId, Handler> handlers;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cancelled_) {
      return false;
    }
    cancelled_ = true;
    handlers.swap(handlers_);
  }
  cv_.notify_all();

  for (auto& entry : handlers) {
    try {
      entry.second();
    } catch (const std::exception& e) {
      STREAMHTTP_LOG_ERROR("cancellation_signal", "cancel", "Cancellation handler threw: " + std::string(e.what()));
    }
  }
  return true;
}

bool CancellationSignal::is_cancelled() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return cancelled_;
}

bool CancellationSignal::wait_for(std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lock(mutex_);
  return cv_.wait_for(lock, timeout, [this] { return cancelled_; });
}

CancellationSignal::HandlerId CancellationSignal::add_handler(Handler handler) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!cancelled_) {
      HandlerId id = next_id_++;
      handlers_.emplace(id, std::move(handler));
      return id;
    }
  }
  handler();
  return 0;
}

void CancellationSignal::remove_handler(HandlerId id) {
  std::lock_guard<std::mutex> lock(mutex_);
  handlers_.erase(id);
}

}  // namespace concurrency
}  // namespace streamhttp
