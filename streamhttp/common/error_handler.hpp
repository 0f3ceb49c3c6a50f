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
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "streamhttp/base/visibility.hpp"
#include "streamhttp/common/error_types.hpp"

namespace streamhttp {
namespace common {

/**
 * @brief Centralized error handling system
 *
 * Thread-safe error reporting, statistics collection and callback-based
 * notification. Faults seen by the executor, the watchdog copy and the
 * transport are funnelled here through the error_reporting helpers.
 */
class STREAMHTTP_API ErrorHandler {
 public:
  using ErrorCallback = std::function<void(const ErrorInfo&)>;

  /**
   * @brief Get singleton instance
   */
  static ErrorHandler& instance();

  /**
   * @brief Report an error
   * @param error Error information to report
   */
  void report_error(const ErrorInfo& error);

  /**
   * @brief Register error callback
   * @param callback Function to call when errors occur
   */
  void register_callback(ErrorCallback callback);

  void clear_callbacks();

  /**
   * @brief Set minimum error level to report
   * @param level Minimum level (errors below this level are ignored)
   */
  void set_min_error_level(ErrorLevel level);
  ErrorLevel get_min_error_level() const;

  void set_enabled(bool enabled);
  bool is_enabled() const;

  ErrorStats get_error_stats() const;

  /**
   * @brief Reset statistics and the recorded error history
   */
  void reset_stats();

  std::vector<ErrorInfo> get_errors_by_component(const std::string& component) const;

  /**
   * @brief Get recent errors
   * @param count Maximum number of recent errors to return
   */
  std::vector<ErrorInfo> get_recent_errors(size_t count = 10) const;

  bool has_errors(const std::string& component) const;

  size_t get_error_count(const std::string& component, ErrorLevel level) const;

 private:
  ErrorHandler();
  ~ErrorHandler();

  // Non-copyable, non-movable
  ErrorHandler(const ErrorHandler&) = delete;
  ErrorHandler& operator=(const ErrorHandler&) = delete;
  ErrorHandler(ErrorHandler&&) = delete;
  ErrorHandler& operator=(ErrorHandler&&) = delete;

  mutable std::mutex mutex_;
  std::vector<ErrorCallback> callbacks_;
  std::atomic<ErrorLevel> min_level_{ErrorLevel::INFO};
  std::atomic<bool> enabled_{true};

  // Statistics
  mutable std::mutex stats_mutex_;
  ErrorStats stats_;
  std::vector<ErrorInfo> recent_errors_;
  std::unordered_map<std::string, std::vector<ErrorInfo>> errors_by_component_;

  void update_stats(const ErrorInfo& error);
  void notify_callbacks(const std::vector<ErrorCallback>& callbacks, const ErrorInfo& error);
  void add_to_recent_errors(const ErrorInfo& error);
  void add_to_component_errors(const ErrorInfo& error);
};

/**
 * @brief Convenience functions for the fault classes of a request
 */
namespace error_reporting {

/**
 * @brief Report a transport fault (connect, send, receive headers)
 * @param component Component name (e.g., "beast_transport", "executor")
 * @param operation Operation that failed (e.g., "connect", "perform")
 * @param ec Error code reported by the transport
 */
STREAMHTTP_API void report_transport_error(const std::string& component, const std::string& operation,
                                           const boost::system::error_code& ec);

/**
 * @brief Report a body copy fault (short write, read or write error)
 */
STREAMHTTP_API void report_transfer_error(const std::string& component, const std::string& operation,
                                          const boost::system::error_code& ec);

/**
 * @brief Report a fired chunk deadline
 * @param message Human readable detail (duration, side)
 * @param ec Resulting fault (CopyTimeout or Canceled)
 */
STREAMHTTP_API void report_timeout(const std::string& component, const std::string& operation,
                                   const std::string& message, const boost::system::error_code& ec);

/**
 * @brief Report a declared-length validation fault
 */
STREAMHTTP_API void report_validation_error(const std::string& component, const std::string& operation,
                                            const std::string& message, const boost::system::error_code& ec);

STREAMHTTP_API void report_configuration_error(const std::string& component, const std::string& operation,
                                               const std::string& message);

/**
 * @brief Report an unrecoverable fault, such as an exception escaping a copy worker
 */
STREAMHTTP_API void report_critical(const std::string& component, const std::string& operation,
                                    const std::string& message);

STREAMHTTP_API void report_system_error(const std::string& component, const std::string& operation,
                                        const std::string& message,
                                        const boost::system::error_code& ec = boost::system::error_code{});

STREAMHTTP_API void report_warning(const std::string& component, const std::string& operation,
                                   const std::string& message);

STREAMHTTP_API void report_info(const std::string& component, const std::string& operation,
                                const std::string& message);

}  // namespace error_reporting

}  // namespace common
}  // namespace streamhttp
