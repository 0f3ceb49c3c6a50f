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

#include "streamhttp/stream/bounded_copy.hpp"

#include <boost/asio/error.hpp>
#include <vector>

#include "streamhttp/base/error_codes.hpp"
#include "streamhttp/common/constants.hpp"

namespace streamhttp {
namespace stream {

namespace net = boost::asio;

namespace {

// Starts/stops the deadline around calls on one side; inert without a deadline.
class SideGuard {
 public:
  SideGuard(interface::DeadlineInterface* deadline, std::chrono::milliseconds timeout, bool bounded)
      : deadline_(bounded ? deadline : nullptr) {
    if (deadline_) {
      deadline_->reset(timeout);
    }
  }
  ~SideGuard() {
    if (deadline_) {
      deadline_->stop();
    }
  }

  SideGuard(const SideGuard&) = delete;
  SideGuard& operator=(const SideGuard&) = delete;

 private:
  interface::DeadlineInterface* deadline_;
};

TransferResult copy_impl(interface::ByteSinkInterface& sink, interface::ByteSourceInterface& source,
                         interface::DeadlineInterface* deadline, std::chrono::milliseconds timeout,
                         TransferSide side) {
  std::vector<char> chunk(common::constants::DEFAULT_CHUNK_SIZE);
  TransferResult result;

  for (;;) {
    boost::system::error_code read_ec;
    std::size_t nread;
    {
      SideGuard guard(deadline, timeout, side == TransferSide::Read);
      nread = source.read_some(net::buffer(chunk), read_ec);
    }

    if (nread > 0) {
      boost::system::error_code write_ec;
      std::size_t nwritten;
      {
        SideGuard guard(deadline, timeout, side == TransferSide::Write);
        nwritten = sink.write_some(net::buffer(chunk.data(), nread), write_ec);
      }

      if (write_ec) {
        result.fault = write_ec;
        return result;
      }
      if (nwritten != nread) {
        result.fault = make_error_code(ErrorCode::ShortWrite);
        return result;
      }
      result.bytes_written += nwritten;
    }

    if (read_ec) {
      if (read_ec != net::error::eof) {
        result.fault = read_ec;
      }
      return result;
    }
  }
}

}  // namespace

TransferResult bounded_copy(interface::ByteSinkInterface& sink, interface::ByteSourceInterface& source,
                            interface::DeadlineInterface& deadline, std::chrono::milliseconds timeout,
                            TransferSide side) {
  return copy_impl(sink, source, &deadline, timeout, side);
}

TransferResult copy_stream(interface::ByteSinkInterface& sink, interface::ByteSourceInterface& source) {
  return copy_impl(sink, source, nullptr, std::chrono::milliseconds::zero(), TransferSide::Read);
}

}  // namespace stream
}  // namespace streamhttp
