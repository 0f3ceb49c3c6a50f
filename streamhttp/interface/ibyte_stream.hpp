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

#include <boost/asio/buffer.hpp>
#include <boost/system/error_code.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>

namespace streamhttp {
namespace interface {

/**
 * @brief Blocking byte source
 *
 * read_some transfers at most buffer.size() bytes. End of data is reported
 * as boost::asio::error::eof, possibly together with a final non-zero count.
 * A zero count with no error is legal and means "no data yet".
 */
class ByteSourceInterface {
 public:
  virtual ~ByteSourceInterface() = default;

  virtual std::size_t read_some(boost::asio::mutable_buffer buffer, boost::system::error_code& ec) = 0;

  /**
   * @brief Bytes left to read, when known up front
   *
   * Lets a transport send a Content-Length instead of a chunked body.
   */
  virtual std::optional<std::uint64_t> size() const { return std::nullopt; }

  /**
   * @brief Release the source and whatever it holds open (e.g. a connection)
   */
  virtual void close() {}
};

/**
 * @brief Blocking byte sink
 *
 * write_some returns the number of bytes accepted; fewer than offered is
 * treated as a short write by the copy loops.
 */
class ByteSinkInterface {
 public:
  virtual ~ByteSinkInterface() = default;

  virtual std::size_t write_some(boost::asio::const_buffer buffer, boost::system::error_code& ec) = 0;
};

}  // namespace interface
}  // namespace streamhttp
