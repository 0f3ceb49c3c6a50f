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

#include "streamhttp/common/logger.hpp"

#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace streamhttp {
namespace common {

namespace {

void replace_all(std::string& text, std::string_view placeholder, std::string_view value) {
  size_t pos = 0;
  while ((pos = text.find(placeholder, pos)) != std::string::npos) {
    text.replace(pos, placeholder.size(), value.data(), value.size());
    pos += value.size();
  }
}

}  // namespace

Logger::Logger() = default;

Logger::~Logger() { flush(); }

Logger& Logger::instance() {
  static Logger instance;
  return instance;
}

void Logger::set_level(LogLevel level) { current_level_.store(level); }

LogLevel Logger::get_level() const { return current_level_.load(); }

void Logger::set_console_output(bool enable) {
  if (enable) {
    outputs_.fetch_or(static_cast<int>(LogOutput::CONSOLE));
  } else {
    outputs_.fetch_and(~static_cast<int>(LogOutput::CONSOLE));
  }
}

void Logger::set_file_output(const std::string& filename) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (filename.empty()) {
    file_output_.reset();
    outputs_.fetch_and(~static_cast<int>(LogOutput::FILE));
    return;
  }

  file_output_ = std::make_unique<std::ofstream>(filename, std::ios::app);
  if (file_output_->is_open()) {
    outputs_.fetch_or(static_cast<int>(LogOutput::FILE));
  } else {
    file_output_.reset();
    outputs_.fetch_and(~static_cast<int>(LogOutput::FILE));
    std::cerr << "Failed to open log file: " << filename << std::endl;
  }
}

void Logger::set_callback(LogCallback callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  callback_ = std::move(callback);
  if (callback_) {
    outputs_.fetch_or(static_cast<int>(LogOutput::CALLBACK));
  } else {
    outputs_.fetch_and(~static_cast<int>(LogOutput::CALLBACK));
  }
}

void Logger::set_outputs(int outputs) { outputs_.store(outputs); }

void Logger::set_enabled(bool enabled) { enabled_.store(enabled); }

bool Logger::is_enabled() const { return enabled_.load(); }

void Logger::set_format(const std::string& format) {
  std::lock_guard<std::mutex> lock(mutex_);
  format_string_ = format;
}

void Logger::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (file_output_ && file_output_->is_open()) {
    file_output_->flush();
  }
  std::cout.flush();
  std::cerr.flush();
}

void Logger::log(LogLevel level, std::string_view component, std::string_view operation, std::string_view message) {
  if (!enabled_.load() || level < current_level_.load()) {
    return;
  }

  std::string formatted_message = format_message(level, component, operation, message);
  int current_outputs = outputs_.load();

  if (current_outputs & static_cast<int>(LogOutput::CONSOLE)) {
    write_to_console(level, formatted_message);
  }

  if (current_outputs & static_cast<int>(LogOutput::FILE)) {
    write_to_file(formatted_message);
  }

  if (current_outputs & static_cast<int>(LogOutput::CALLBACK)) {
    call_callback(level, formatted_message);
  }
}

void Logger::debug(std::string_view component, std::string_view operation, std::string_view message) {
  log(LogLevel::DEBUG, component, operation, message);
}

void Logger::info(std::string_view component, std::string_view operation, std::string_view message) {
  log(LogLevel::INFO, component, operation, message);
}

void Logger::warning(std::string_view component, std::string_view operation, std::string_view message) {
  log(LogLevel::WARNING, component, operation, message);
}

void Logger::error(std::string_view component, std::string_view operation, std::string_view message) {
  log(LogLevel::ERROR, component, operation, message);
}

void Logger::critical(std::string_view component, std::string_view operation, std::string_view message) {
  log(LogLevel::CRITICAL, component, operation, message);
}

std::string Logger::format_message(LogLevel level, std::string_view component, std::string_view operation,
                                   std::string_view message) {
  std::string result;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    result = format_string_;
  }

  replace_all(result, "{timestamp}", get_timestamp());
  replace_all(result, "{level}", level_to_string(level));
  replace_all(result, "{component}", component);
  replace_all(result, "{operation}", operation);
  replace_all(result, "{message}", message);
  return result;
}

std::string Logger::level_to_string(LogLevel level) {
  switch (level) {
    case LogLevel::DEBUG:
      return "DEBUG";
    case LogLevel::INFO:
      return "INFO";
    case LogLevel::WARNING:
      return "WARNING";
    case LogLevel::ERROR:
      return "ERROR";
    case LogLevel::CRITICAL:
      return "CRITICAL";
  }
  return "UNKNOWN";
}

std::string Logger::get_timestamp() {
  auto now = std::chrono::system_clock::now();
  auto time_t = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

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

void Logger::write_to_console(LogLevel level, const std::string& message) {
  // Use stderr for ERROR and CRITICAL levels
  if (level >= LogLevel::ERROR) {
    std::cerr << message << std::endl;
  } else {
    std::cout << message << std::endl;
  }
}

void Logger::write_to_file(const std::string& message) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (file_output_ && file_output_->is_open()) {
    *file_output_ << message << std::endl;
  }
}

void Logger::call_callback(LogLevel level, const std::string& message) {
  LogCallback callback;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    callback = callback_;
  }
  if (!callback) {
    return;
  }
  try {
    callback(level, message);
  } catch (const std::exception& e) {
    // Avoid infinite recursion - log to stderr instead
    std::cerr << "Error in log callback: " << e.what() << std::endl;
  }
}

}  // namespace common
}  // namespace streamhttp
