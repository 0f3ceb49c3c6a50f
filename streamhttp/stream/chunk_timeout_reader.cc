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

#include "streamhttp/stream/chunk_timeout_reader.hpp"

#include "streamhttp/base/error_codes.hpp"
#include "streamhttp/common/exceptions.hpp"

namespace streamhttp {
namespace stream {

ChunkTimeoutReader::ChunkTimeoutReader(std::shared_ptr<interface::ByteSourceInterface> source,
                                       std::shared_ptr<interface::DeadlineInterface> deadline,
                                       std::chrono::milliseconds duration,
                                       std::shared_ptr<concurrency::CancellationSignal> signal)
    : source_(std::move(source)), deadline_(std::move(deadline)), duration_(duration), signal_(std::move(signal)) {
  if (!source_) {
    throw common::ValidationException("Byte source must not be null", "source");
  }
  if (!deadline_) {
    throw common::ValidationException("Deadline must not be null", "deadline");
  }
}

std::size_t ChunkTimeoutReader::read_some(boost::asio::mutable_buffer buffer, boost::system::error_code& ec) {
  if (signal_ && signal_->is_cancelled()) {
    ec = make_error_code(ErrorCode::Canceled);
    return 0;
  }

  deadline_->stop();
  std::size_t n = source_->read_some(buffer, ec);
  deadline_->reset(duration_);

  if (signal_ && signal_->is_cancelled()) {
    ec = make_error_code(ErrorCode::Canceled);
  }
  return n;
}

std::optional<std::uint64_t> ChunkTimeoutReader::size() const { return source_->size(); }

void ChunkTimeoutReader::close() { source_->close(); }

}  // namespace stream
}  // namespace streamhttp
