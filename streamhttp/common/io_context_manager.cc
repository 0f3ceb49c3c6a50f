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

#include "streamhttp/common/io_context_manager.hpp"

#include <iostream>

#include "streamhttp/common/logger.hpp"

namespace streamhttp {
namespace common {

IoContextManager::IoContextManager() : ioc_(std::make_unique<IoContext>()) {}

IoContextManager& IoContextManager::instance() {
  static IoContextManager instance;
  return instance;
}

boost::asio::io_context& IoContextManager::get_context() { return *ioc_; }

void IoContextManager::start() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (running_) {
    return;
  }

  // A previous thread may have exited on an escaped exception
  if (io_thread_.joinable()) {
    io_thread_.join();
  }
  if (ioc_->stopped()) {
    ioc_->restart();
  }
  work_guard_ = std::make_unique<WorkGuard>(ioc_->get_executor());

  running_.store(true);
  IoContext* context = ioc_.get();
  io_thread_ = std::thread([this, context]() {
    try {
      context->run();
    } catch (const std::exception& e) {
      STREAMHTTP_LOG_ERROR("io_context_manager", "run", "Thread error: " + std::string(e.what()));
      running_.store(false);
    } catch (...) {
      STREAMHTTP_LOG_ERROR("io_context_manager", "run", "Thread stopped by unknown exception");
      running_.store(false);
    }
  });
  STREAMHTTP_LOG_DEBUG("io_context_manager", "start", "Timer context thread started");
}

void IoContextManager::stop() {
  std::thread worker;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_ && !io_thread_.joinable()) {
      return;
    }

    work_guard_.reset();
    ioc_->stop();

    if (io_thread_.joinable()) {
      worker = std::move(io_thread_);
    }
    running_ = false;
  }

  if (worker.joinable()) {
    worker.join();
  }
}

bool IoContextManager::is_running() const { return running_.load(); }

std::unique_ptr<boost::asio::io_context> IoContextManager::create_independent_context() {
  return std::make_unique<IoContext>();
}

IoContextManager::~IoContextManager() {
  // The logger may already be destroyed at this point
  try {
    stop();
  } catch (const std::exception& e) {
    std::cerr << "io_context_manager: failed to stop timer thread: " << e.what() << std::endl;
  }
}

}  // namespace common
}  // namespace streamhttp
