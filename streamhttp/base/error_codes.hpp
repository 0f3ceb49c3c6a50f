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

#include <boost/system/error_code.hpp>
#include <string>
#include <type_traits>

#include "streamhttp/base/visibility.hpp"

namespace streamhttp {

/**
 * @brief Structured error codes for streamhttp
 *
 * Registered as a Boost.System error code enum, so values compare directly
 * against the boost::system::error_code carried by every transfer result.
 */
enum class ErrorCode {
  Success = 0,
  Unknown,
  InvalidConfiguration,
  InternalError,

  // Transfer related
  ShortWrite,
  CopyTimeout,
  Canceled,

  // Response validation
  LengthMismatch,
  LengthParse,

  // Request construction
  InvalidUrl,
  UnsupportedScheme
};

/**
 * @brief Convert ErrorCode to human-readable string
 */
inline std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::Success:
      return "Success";
    case ErrorCode::Unknown:
      return "Unknown Error";
    case ErrorCode::InvalidConfiguration:
      return "Invalid Configuration";
    case ErrorCode::InternalError:
      return "Internal Error";
    case ErrorCode::ShortWrite:
      return "Short Write";
    case ErrorCode::CopyTimeout:
      return "Copy Timeout";
    case ErrorCode::Canceled:
      return "Request Canceled";
    case ErrorCode::LengthMismatch:
      return "Body Length Does Not Match Content-Length";
    case ErrorCode::LengthParse:
      return "Invalid Content-Length Value";
    case ErrorCode::InvalidUrl:
      return "Invalid URL";
    case ErrorCode::UnsupportedScheme:
      return "Unsupported URL Scheme";
    default:
      return "Unknown Error Code";
  }
}

/**
 * @brief Category shared by every streamhttp error_code
 */
STREAMHTTP_API const boost::system::error_category& error_category() noexcept;

inline boost::system::error_code make_error_code(ErrorCode code) noexcept {
  return boost::system::error_code(static_cast<int>(code), error_category());
}

}  // namespace streamhttp

namespace boost {
namespace system {

template <>
struct is_error_code_enum<streamhttp::ErrorCode> : std::true_type {};

}  // namespace system
}  // namespace boost
