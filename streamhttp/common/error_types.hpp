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

#include <algorithm>
#include <boost/system/error_code.hpp>
#include <chrono>
#include <cstddef>
#include <ctime>
#include <iomanip>
#include <iterator>
#include <sstream>
#include <string>

namespace streamhttp {
namespace common {

/**
 * @brief Error severity levels
 */
enum class ErrorLevel {
  INFO = 0,     // Informational message
  WARNING = 1,  // Warning (request still completed)
  ERROR = 2,    // Request failed
  CRITICAL = 3  // Unrecoverable fault (worker exception)
};

/**
 * @brief Error categories for classification
 */
enum class ErrorCategory {
  TRANSPORT = 0,      // Connect, send request, receive headers
  TRANSFER = 1,       // Body copy faults (short write, read/write error)
  TIMEOUT = 2,        // Chunk deadline fired
  VALIDATION = 3,     // Content-Length checks
  CONFIGURATION = 4,  // Invalid config values, malformed URLs
  SYSTEM = 5,         // OS level errors
  UNKNOWN = 6
};

constexpr std::size_t ERROR_LEVEL_COUNT = 4;
constexpr std::size_t ERROR_CATEGORY_COUNT = 7;

/**
 * @brief Error information reported to the ErrorHandler
 */
struct ErrorInfo {
  ErrorLevel level;
  ErrorCategory category;
  std::string component;                  // executor, watchdog_copy, beast_transport, ...
  std::string operation;                  // perform, copy_response, validate_length, ...
  std::string message;
  boost::system::error_code error_code;
  std::chrono::system_clock::time_point timestamp;
  std::string context;                    // Request target or other detail

  ErrorInfo(ErrorLevel l, ErrorCategory c, const std::string& comp, const std::string& op, const std::string& msg)
      : level(l),
        category(c),
        component(comp),
        operation(op),
        message(msg),
        timestamp(std::chrono::system_clock::now()) {}

  ErrorInfo(ErrorLevel l, ErrorCategory c, const std::string& comp, const std::string& op, const std::string& msg,
            const boost::system::error_code& ec)
      : level(l),
        category(c),
        component(comp),
        operation(op),
        message(msg),
        error_code(ec),
        timestamp(std::chrono::system_clock::now()) {}

  std::string get_timestamp_string() const {
    auto time_t = std::chrono::system_clock::to_time_t(timestamp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch()) % 1000;

    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &time_t);
#else
    localtime_r(&time_t, &tm);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
  }

  std::string get_level_string() const {
    switch (level) {
      case ErrorLevel::INFO:
        return "INFO";
      case ErrorLevel::WARNING:
        return "WARNING";
      case ErrorLevel::ERROR:
        return "ERROR";
      case ErrorLevel::CRITICAL:
        return "CRITICAL";
    }
    return "UNKNOWN";
  }

  std::string get_category_string() const {
    switch (category) {
      case ErrorCategory::TRANSPORT:
        return "TRANSPORT";
      case ErrorCategory::TRANSFER:
        return "TRANSFER";
      case ErrorCategory::TIMEOUT:
        return "TIMEOUT";
      case ErrorCategory::VALIDATION:
        return "VALIDATION";
      case ErrorCategory::CONFIGURATION:
        return "CONFIGURATION";
      case ErrorCategory::SYSTEM:
        return "SYSTEM";
      case ErrorCategory::UNKNOWN:
        return "UNKNOWN";
    }
    return "UNKNOWN";
  }

  /**
   * @brief One-line summary: level, component, operation, message and code
   */
  std::string get_summary() const {
    std::ostringstream oss;
    oss << "[" << get_level_string() << "] " << "[" << component << "] " << "[" << operation << "] " << message;

    if (error_code) {
      oss << " (" << error_code.category().name() << ": " << error_code.message() << ", code: " << error_code.value()
          << ")";
    }
    if (!context.empty()) {
      oss << " {" << context << "}";
    }
    return oss.str();
  }
};

/**
 * @brief Aggregated error statistics
 */
struct ErrorStats {
  size_t total_errors = 0;
  size_t errors_by_level[ERROR_LEVEL_COUNT] = {0, 0, 0, 0};
  size_t errors_by_category[ERROR_CATEGORY_COUNT] = {0, 0, 0, 0, 0, 0, 0};

  std::chrono::system_clock::time_point first_error;
  std::chrono::system_clock::time_point last_error;

  void reset() {
    total_errors = 0;
    std::fill(std::begin(errors_by_level), std::end(errors_by_level), 0);
    std::fill(std::begin(errors_by_category), std::end(errors_by_category), 0);
    first_error = std::chrono::system_clock::time_point{};
    last_error = std::chrono::system_clock::time_point{};
  }

  size_t count(ErrorCategory category) const { return errors_by_category[static_cast<size_t>(category)]; }
  size_t count(ErrorLevel level) const { return errors_by_level[static_cast<size_t>(level)]; }
};

}  // namespace common
}  // namespace streamhttp
