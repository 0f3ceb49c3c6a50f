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

#include <chrono>
#include <memory>

#include "streamhttp/base/visibility.hpp"
#include "streamhttp/interface/ibyte_stream.hpp"
#include "streamhttp/interface/ideadline.hpp"
#include "streamhttp/stream/bounded_copy.hpp"

namespace streamhttp {
namespace stream {

/**
 * @brief Chunk-bounded copy with a hard backstop for non-cooperating streams
 *
 * Runs bounded_copy on a detached worker thread and waits for the first of:
 * - the worker's result, returned verbatim,
 * - the deadline firing, returned as {0, ErrorCode::CopyTimeout},
 * - an exception escaping the worker, rethrown on the calling thread.
 *
 * Exactly one outcome is delivered. After a timeout the worker is abandoned,
 * not stopped: its blocking call keeps running until the stream returns on
 * its own, and its eventual outcome is discarded. The streams are shared so
 * they outlive the call for as long as the worker needs them. Callers that
 * can close the underlying stream should do so after a timeout.
 *
 * @throws common::ValidationException for null streams or a non-positive timeout
 */
STREAMHTTP_API TransferResult watchdog_copy(std::shared_ptr<interface::ByteSinkInterface> sink,
                                            std::shared_ptr<interface::ByteSourceInterface> source,
                                            std::chrono::milliseconds timeout, TransferSide side);

/**
 * @brief As above, with a caller-supplied (disarmed) deadline
 */
STREAMHTTP_API TransferResult watchdog_copy(std::shared_ptr<interface::ByteSinkInterface> sink,
                                            std::shared_ptr<interface::ByteSourceInterface> source,
                                            std::shared_ptr<interface::DeadlineInterface> deadline,
                                            std::chrono::milliseconds timeout, TransferSide side);

}  // namespace stream
}  // namespace streamhttp
