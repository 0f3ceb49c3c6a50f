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
#include <mutex>
#include <string>
#include <vector>

#include "streamhttp/base/visibility.hpp"
#include "streamhttp/interface/ibyte_stream.hpp"

namespace streamhttp {
namespace stream {

/**
 * @brief Byte source over an in-memory buffer
 *
 * Returns the remaining bytes in calls of at most the caller's buffer size,
 * then boost::asio::error::eof.
 */
class STREAMHTTP_API BufferSource : public interface::ByteSourceInterface {
 public:
  explicit BufferSource(std::string data);
  explicit BufferSource(const std::vector<uint8_t>& data);

  std::size_t read_some(boost::asio::mutable_buffer buffer, boost::system::error_code& ec) override;

  std::optional<std::uint64_t> size() const override;

  std::size_t remaining() const;

 private:
  mutable std::mutex mutex_;
  std::string data_;
  std::size_t offset_ = 0;
};

/**
 * @brief Byte sink that appends everything written to a string
 *
 * Optionally capped: once max_size bytes are held further writes accept
 * only what fits, which surfaces as a short write.
 */
class STREAMHTTP_API BufferSink : public interface::ByteSinkInterface {
 public:
  static constexpr std::size_t UNLIMITED = static_cast<std::size_t>(-1);

  explicit BufferSink(std::size_t max_size = UNLIMITED);

  std::size_t write_some(boost::asio::const_buffer buffer, boost::system::error_code& ec) override;

  std::string str() const;
  std::size_t size() const;
  void clear();

 private:
  mutable std::mutex mutex_;
  std::string data_;
  std::size_t max_size_;
};

}  // namespace stream
}  // namespace streamhttp
