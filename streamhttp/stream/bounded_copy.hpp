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
#include <chrono>
#include <cstdint>
#include <string>

#include "streamhttp/base/visibility.hpp"
#include "streamhttp/interface/ibyte_stream.hpp"
#include "streamhttp/interface/ideadline.hpp"

namespace streamhttp {
namespace stream {

/**
 * @brief Which half of a copy the chunk deadline applies to
 */
enum class TransferSide { Read, Write };

inline std::string to_string(TransferSide side) { return side == TransferSide::Read ? "read" : "write"; }

/**
 * @brief Outcome of a copy
 *
 * bytes_written counts fully written chunks only; it is kept on faults too.
 */
struct TransferResult {
  std::uint64_t bytes_written = 0;
  boost::system::error_code fault;

  bool ok() const { return !fault; }
};

/**
 * @brief Copy source to sink in 64 KiB chunks, bounding one side per chunk
 *
 * Around every call on the bounded side the deadline is reset to timeout
 * before the call and stopped after it; the other side runs unbounded.
 * Bounding both sides at once is not supported.
 *
 * Terminates with:
 * - success and the total on boost::asio::error::eof (data returned with
 *   the eof is written first),
 * - ErrorCode::ShortWrite when the sink accepts fewer bytes than offered,
 * - the sink's or source's own error otherwise.
 *
 * A read returning zero bytes without error is retried.
 */
STREAMHTTP_API TransferResult bounded_copy(interface::ByteSinkInterface& sink, interface::ByteSourceInterface& source,
                                           interface::DeadlineInterface& deadline, std::chrono::milliseconds timeout,
                                           TransferSide side);

/**
 * @brief The same chunked copy without any deadline
 */
STREAMHTTP_API TransferResult copy_stream(interface::ByteSinkInterface& sink, interface::ByteSourceInterface& source);

}  // namespace stream
}  // namespace streamhttp
