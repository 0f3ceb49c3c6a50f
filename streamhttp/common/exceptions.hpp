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

#include <stdexcept>
#include <string>

namespace streamhttp {
namespace common {

/**
 * @brief Base exception class for all streamhttp exceptions
 *
 * Thrown only for programming errors (null transport, null streams, invalid
 * builder input). Runtime faults of a request travel as error codes.
 */
class StreamHttpException : public std::runtime_error {
 public:
  explicit StreamHttpException(const std::string& message, const std::string& component = "",
                               const std::string& operation = "")
      : std::runtime_error(message), component_(component), operation_(operation) {}

  const std::string& get_component() const noexcept { return component_; }
  const std::string& get_operation() const noexcept { return operation_; }

  std::string get_full_message() const {
    std::string full_msg = what();
    if (!component_.empty()) {
      full_msg = "[" + component_ + "] " + full_msg;
    }
    if (!operation_.empty()) {
      full_msg += " (operation: " + operation_ + ")";
    }
    return full_msg;
  }

 private:
  std::string component_;
  std::string operation_;
};

/**
 * @brief Exception thrown by builders
 */
class BuilderException : public StreamHttpException {
 public:
  explicit BuilderException(const std::string& message, const std::string& builder_type = "",
                            const std::string& operation = "")
      : StreamHttpException(message, "builder", operation), builder_type_(builder_type) {}

  const std::string& get_builder_type() const noexcept { return builder_type_; }

 private:
  std::string builder_type_;
};

/**
 * @brief Exception thrown when an argument fails validation
 */
class ValidationException : public StreamHttpException {
 public:
  explicit ValidationException(const std::string& message, const std::string& parameter = "",
                               const std::string& expected = "")
      : StreamHttpException(message, "validation", "validate"), parameter_(parameter), expected_(expected) {}

  const std::string& get_parameter() const noexcept { return parameter_; }
  const std::string& get_expected() const noexcept { return expected_; }

  std::string get_full_message() const {
    std::string full_msg = StreamHttpException::get_full_message();
    if (!parameter_.empty()) {
      full_msg += " (parameter: " + parameter_ + ")";
    }
    if (!expected_.empty()) {
      full_msg += " (expected: " + expected_ + ")";
    }
    return full_msg;
  }

 private:
  std::string parameter_;
  std::string expected_;
};

/**
 * @brief Exception thrown for unusable configuration
 */
class ConfigurationException : public StreamHttpException {
 public:
  explicit ConfigurationException(const std::string& message, const std::string& config_section = "",
                                  const std::string& operation = "")
      : StreamHttpException(message, "configuration", operation), config_section_(config_section) {}

  const std::string& get_config_section() const noexcept { return config_section_; }

  std::string get_full_message() const {
    std::string full_msg = StreamHttpException::get_full_message();
    if (!config_section_.empty()) {
      full_msg += " (section: " + config_section_ + ")";
    }
    return full_msg;
  }

 private:
  std::string config_section_;
};

}  // namespace common
}  // namespace streamhttp
