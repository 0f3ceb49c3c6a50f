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

#include <gmock/gmock.h>

#include <boost/asio/buffer.hpp>
#include <boost/system/error_code.hpp>
#include <chrono>
#include <optional>

#include "streamhttp/interface/ibyte_stream.hpp"
#include "streamhttp/interface/ideadline.hpp"
#include "streamhttp/interface/itransport.hpp"

namespace streamhttp {
namespace test {
namespace mocks {

/**
 * @brief Mock deadline for verifying stop/reset ordering without real timers
 */
class MockDeadline : public interface::DeadlineInterface {
 public:
  MOCK_METHOD(void, arm, (std::chrono::milliseconds, FireHandler), (override));
  MOCK_METHOD(bool, stop, (), (override));
  MOCK_METHOD(bool, reset, (std::chrono::milliseconds), (override));
};

class MockByteSource : public interface::ByteSourceInterface {
 public:
  MOCK_METHOD(std::size_t, read_some, (boost::asio::mutable_buffer, boost::system::error_code&), (override));
  MOCK_METHOD(std::optional<std::uint64_t>, size, (), (const, override));
  MOCK_METHOD(void, close, (), (override));
};

class MockByteSink : public interface::ByteSinkInterface {
 public:
  MOCK_METHOD(std::size_t, write_some, (boost::asio::const_buffer, boost::system::error_code&), (override));
};

class MockTransport : public interface::TransportInterface {
 public:
  MOCK_METHOD(std::optional<http::Response>, perform, (http::Request&, boost::system::error_code&), (override));
};

}  // namespace mocks
}  // namespace test
}  // namespace streamhttp
