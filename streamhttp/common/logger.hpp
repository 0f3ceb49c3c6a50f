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
#include <chrono>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

#include "streamhttp/base/visibility.hpp"

#ifdef DEBUG
#undef DEBUG
#endif
#ifdef INFO
#undef INFO
#endif
#ifdef WARNING
#undef WARNING
#endif
#ifdef ERROR
#undef ERROR
#endif
#ifdef CRITICAL
#undef CRITICAL
#endif
#ifdef CALLBACK
#undef CALLBACK
#endif

namespace streamhttp {
namespace common {

/**
 * @brief Log severity levels
 */
enum class LogLevel { DEBUG = 0, INFO = 1, WARNING = 2, ERROR = 3, CRITICAL = 4 };

/**
 * @brief Log output destinations
 */
enum class LogOutput { CONSOLE = 0x01, FILE = 0x02, CALLBACK = 0x04 };

/**
 * @brief Centralized logging system
 *
 * Thread-safe singleton with console, file and callback outputs. Timer
 * callbacks, watchdog workers and the calling thread all log through it.
 */
class STREAMHTTP_API Logger {
 public:
  using LogCallback = std::function<void(LogLevel level, const std::string& formatted_message)>;

  /**
   * @brief Get singleton instance
   */
  static Logger& instance();

  /**
   * @brief Set minimum log level
   * @param level Messages below this level will be ignored
   */
  void set_level(LogLevel level);

  /**
   * @brief Get current log level
   */
  LogLevel get_level() const;

  /**
   * @brief Enable/disable console output
   */
  void set_console_output(bool enable);

  /**
   * @brief Set file output
   * @param filename Log file path (empty string to disable file output)
   */
  void set_file_output(const std::string& filename);

  /**
   * @brief Set log callback
   * @param callback Function to call for each log message (empty to disable)
   */
  void set_callback(LogCallback callback);

  /**
   * @brief Set output destinations
   * @param outputs Bitwise OR of LogOutput flags
   */
  void set_outputs(int outputs);

  void set_enabled(bool enabled);
  bool is_enabled() const;

  /**
   * @brief Set log format
   * @param format Format string with placeholders: {timestamp}, {level}, {component}, {operation}, {message}
   */
  void set_format(const std::string& format);

  void flush();

  // Main logging functions
  void log(LogLevel level, std::string_view component, std::string_view operation, std::string_view message);

  void debug(std::string_view component, std::string_view operation, std::string_view message);
  void info(std::string_view component, std::string_view operation, std::string_view message);
  void warning(std::string_view component, std::string_view operation, std::string_view message);
  void error(std::string_view component, std::string_view operation, std::string_view message);
  void critical(std::string_view component, std::string_view operation, std::string_view message);

 private:
  Logger();
  ~Logger();

  // Non-copyable, non-movable
  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;
  Logger(Logger&&) = delete;
  Logger& operator=(Logger&&) = delete;

  mutable std::mutex mutex_;
  std::atomic<LogLevel> current_level_{LogLevel::INFO};
  std::atomic<bool> enabled_{true};
  std::atomic<int> outputs_{static_cast<int>(LogOutput::CONSOLE)};

  std::string format_string_{"{timestamp} [{level}] [{component}] [{operation}] {message}"};
  std::unique_ptr<std::ofstream> file_output_;
  LogCallback callback_;

  std::string format_message(LogLevel level, std::string_view component, std::string_view operation,
                             std::string_view message);
  static std::string level_to_string(LogLevel level);
  static std::string get_timestamp();
  void write_to_console(LogLevel level, const std::string& message);
  void write_to_file(const std::string& message);
  void call_callback(LogLevel level, const std::string& message);
};

}  // namespace common
}  // namespace streamhttp

/**
 * @brief Convenience macros for logging
 *
 * The message expression is only evaluated when the level is enabled.
 */
#define STREAMHTTP_LOG_DEBUG(component, operation, message)                                                     \
  do {                                                                                                          \
    if (streamhttp::common::Logger::instance().get_level() <= streamhttp::common::LogLevel::DEBUG) {           \
      streamhttp::common::Logger::instance().debug(component, operation, message);                              \
    }                                                                                                           \
  } while (0)

#define STREAMHTTP_LOG_INFO(component, operation, message)                                                      \
  do {                                                                                                          \
    if (streamhttp::common::Logger::instance().get_level() <= streamhttp::common::LogLevel::INFO) {            \
      streamhttp::common::Logger::instance().info(component, operation, message);                               \
    }                                                                                                           \
  } while (0)

#define STREAMHTTP_LOG_WARNING(component, operation, message)                                                   \
  do {                                                                                                          \
    if (streamhttp::common::Logger::instance().get_level() <= streamhttp::common::LogLevel::WARNING) {         \
      streamhttp::common::Logger::instance().warning(component, operation, message);                            \
    }                                                                                                           \
  } while (0)

#define STREAMHTTP_LOG_ERROR(component, operation, message)                                                     \
  do {                                                                                                          \
    if (streamhttp::common::Logger::instance().get_level() <= streamhttp::common::LogLevel::ERROR) {           \
      streamhttp::common::Logger::instance().error(component, operation, message);                              \
    }                                                                                                           \
  } while (0)

#define STREAMHTTP_LOG_CRITICAL(component, operation, message)                                                  \
  do {                                                                                                          \
    if (streamhttp::common::Logger::instance().get_level() <= streamhttp::common::LogLevel::CRITICAL) {        \
      streamhttp::common::Logger::instance().critical(component, operation, message);                           \
    }                                                                                                           \
  } while (0)
