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
#include "streamhttp/concurrency/cancellation_signal.hpp"
#include "streamhttp/interface/ibyte_stream.hpp"
#include "streamhttp/interface/ideadline.hpp"

namespace streamhttp {
namespace stream {

/**
 * @brief Byte source decorator that measures time between reads
 *
 * Each read_some stops the deadline, delegates, then resets it to the full
 * duration regardless of the outcome. The deadline therefore bounds the
 * gap between two reads (the consumer's time spent on one chunk), never the
 * total transfer time. The owner supplies the fire handler and arms the
 * deadline before the first read.
 *
 * With a signal attached, a read issued or completed after cancellation
 * reports ErrorCode::Canceled.
 */
class STREAMHTTP_API ChunkTimeoutReader : public interface::ByteSourceInterface {
 public:
  ChunkTimeoutReader(std::shared_ptr<interface::ByteSourceInterface> source,
                     std::shared_ptr<interface::DeadlineInterface> deadline, std::chrono::milliseconds duration,
                     std::shared_ptr<concurrency::CancellationSignal> signal = nullptr);

  std::size_t read_some(boost::asio::mutable_buffer buffer, boost::system::error_code& ec) override;
  std::optional<std::uint64_t> size() const override;
  void close() override;

 private:
  std::shared_ptr<interface::ByteSourceInterface> source_;
  std::shared_ptr<interface::DeadlineInterface> deadline_;
  std::chrono::milliseconds duration_;
  std::shared_ptr<concurrency::CancellationSignal> signal_;
};

}  // namespace stream
}  // namespace streamhttp
