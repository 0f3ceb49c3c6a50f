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

#include <gtest/gtest.h>

#include <chrono>
#include <functional>
#include <iostream>
#include <random>
#include <string>
#include <thread>

#include "streamhttp/common/error_handler.hpp"
#include "streamhttp/common/logger.hpp"

namespace streamhttp {
namespace test {

/**
 * @brief Common test utilities for streamhttp tests
 */
class TestUtils {
 public:
  static void waitFor(int ms) { std::this_thread::sleep_for(std::chrono::milliseconds(ms)); }

  /**
   * @brief Poll a condition until it holds or the timeout passes
   */
  static bool waitForCondition(const std::function<bool()>& condition, int timeout_ms = 1000) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (std::chrono::steady_clock::now() < deadline) {
      if (condition()) {
        return true;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return condition();
  }

  /**
   * @brief Deterministic printable payload of the given size
   */
  static std::string generateTestData(size_t size) {
    std::string data;
    data.reserve(size);
    for (size_t i = 0; i < size; ++i) {
      data += static_cast<char>('A' + (i % 26));
    }
    return data;
  }

  /**
   * @brief Random binary payload of the given size
   */
  static std::string generateRandomData(size_t size, unsigned seed = 42) {
    std::mt19937 rng(seed);
    std::uniform_int_distribution<int> dist(0, 255);
    std::string data(size, '\0');
    for (auto& c : data) {
      c = static_cast<char>(dist(rng));
    }
    return data;
  }

  template <typename F>
  static std::chrono::milliseconds measure(F&& fn) {
    auto start = std::chrono::steady_clock::now();
    fn();
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
  }
};

/**
 * @brief Base test class: quiet logger, clean error statistics
 */
class BaseTest : public ::testing::Test {
 protected:
  void SetUp() override {
    common::Logger::instance().set_level(common::LogLevel::WARNING);
    common::ErrorHandler::instance().reset_stats();
    test_start_time_ = std::chrono::steady_clock::now();
  }

  void TearDown() override {
    auto test_duration = std::chrono::steady_clock::now() - test_start_time_;
    auto duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(test_duration).count();

    // Log test duration if it's unusually long
    if (duration_ms > 5000) {
      std::cout << "Warning: Test took " << duration_ms << "ms to complete" << std::endl;
    }
  }

  std::chrono::steady_clock::time_point test_start_time_;
};

}  // namespace test
}  // namespace streamhttp
