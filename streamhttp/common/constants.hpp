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

#include <cstddef>
#include <cstdint>

namespace streamhttp {
namespace common {

// Streaming and HTTP constants
namespace constants {

// Copy loop constants
constexpr size_t DEFAULT_CHUNK_SIZE = 1 << 16;  // 64 KiB per read/write call

// Request timeout constants
constexpr unsigned DEFAULT_REQUEST_TIMEOUT_MS = 0;  // 0 disables the chunk deadline

// Transport constants
constexpr unsigned DEFAULT_CONNECTION_TIMEOUT_MS = 5000;  // 5 seconds
constexpr unsigned MIN_CONNECTION_TIMEOUT_MS = 100;       // 100ms minimum
constexpr unsigned MAX_CONNECTION_TIMEOUT_MS = 300000;    // 5 minutes maximum
constexpr uint32_t DEFAULT_HEADER_LIMIT = 8192;           // 8 KiB, Beast default
constexpr uint32_t MIN_HEADER_LIMIT = 1024;               // 1 KiB minimum
constexpr uint32_t MAX_HEADER_LIMIT = 1 << 20;            // 1 MiB maximum
constexpr int HTTP_VERSION = 11;                          // HTTP/1.1
constexpr const char* DEFAULT_USER_AGENT = "streamhttp/1.0";

// URL constants
constexpr uint16_t DEFAULT_HTTP_PORT = 80;
constexpr uint16_t DEFAULT_HTTPS_PORT = 443;
constexpr size_t MAX_HOSTNAME_LENGTH = 253;  // Maximum hostname length (RFC 1123)

// Error handling constants
constexpr size_t DEFAULT_MAX_RECENT_ERRORS = 1000;  // Default max recent errors to track
constexpr size_t MAX_COMPONENT_ERRORS = 100;        // Per-component history limit

}  // namespace constants

}  // namespace common
}  // namespace streamhttp
