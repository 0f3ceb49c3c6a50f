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

#include "streamhttp/stream/memory_stream.hpp"

#include <algorithm>
#include <boost/asio/error.hpp>
#include <cstring>

namespace streamhttp {
namespace stream {

BufferSource::BufferSource(std::string data) : data_(std::move(data)) {}

BufferSource::BufferSource(const std::vector<uint8_t>& data) : data_(data.begin(), data.end()) {}

std::size_t BufferSource::read_some(boost::asio::mutable_buffer buffer, boost::system::error_code& ec) {
  std::lock_guard<std::mutex> lock(mutex_);
  ec.clear();

  std::size_t n = std::min(buffer.size(), data_.size() - offset_);
  if (n > 0) {
    std::memcpy(buffer.data(), data_.data() + offset_, n);
    offset_ += n;
  }
  if (offset_ == data_.size()) {
    ec = boost::asio::error::eof;
  }
  return n;
}

std::optional<std::uint64_t> BufferSource::size() const { return remaining(); }

std::size_t BufferSource::remaining() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return data_.size() - offset_;
}

BufferSink::BufferSink(std::size_t max_size) : max_size_(max_size) {}

std::size_t BufferSink::write_some(boost::asio::const_buffer buffer, boost::system::error_code& ec) {
  std::lock_guard<std::mutex> lock(mutex_);
  ec.clear();

  std::size_t room = max_size_ == UNLIMITED ? buffer.size() : max_size_ - std::min(max_size_, data_.size());
  std::size_t n = std::min(buffer.size(), room);
  data_.append(static_cast<const char*>(buffer.data()), n);
  return n;
}

std::string BufferSink::str() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return data_;
}

std::size_t BufferSink::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return data_.size();
}

void BufferSink::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  data_.clear();
}

}  // namespace stream
}  // namespace streamhttp
