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

#include <gtest/gtest.h>

#include <boost/asio/buffer.hpp>
#include <boost/asio/error.hpp>
#include <string>

#include "streamhttp/stream/memory_stream.hpp"
#include "test/utils/test_utils.hpp"

using namespace streamhttp;
using namespace streamhttp::test;

// ============================================================================
// MEMORY STREAMS
// ============================================================================

class MemoryStreamTest : public BaseTest {};

TEST_F(MemoryStreamTest, SourceReturnsEofWithLastData) {
  stream::BufferSource source(std::string("hello world"));
  char buf[6];
  boost::system::error_code ec;

  EXPECT_EQ(source.size().value(), 11u);
  EXPECT_EQ(source.read_some(boost::asio::buffer(buf), ec), 6u);
  EXPECT_FALSE(ec);
  EXPECT_EQ(source.read_some(boost::asio::buffer(buf), ec), 5u);
  EXPECT_EQ(ec, boost::asio::error::eof);
  EXPECT_EQ(source.remaining(), 0u);

  EXPECT_EQ(source.read_some(boost::asio::buffer(buf), ec), 0u);
  EXPECT_EQ(ec, boost::asio::error::eof);
}

TEST_F(MemoryStreamTest, EmptySourceIsImmediatelyAtEof) {
  stream::BufferSource source(std::string{});
  char buf[4];
  boost::system::error_code ec;

  EXPECT_EQ(source.read_some(boost::asio::buffer(buf), ec), 0u);
  EXPECT_EQ(ec, boost::asio::error::eof);
}

TEST_F(MemoryStreamTest, BoundedSinkAcceptsOnlyWhatFits) {
  stream::BufferSink sink(8);
  boost::system::error_code ec;

  EXPECT_EQ(sink.write_some(boost::asio::buffer(std::string("12345")), ec), 5u);
  EXPECT_EQ(sink.write_some(boost::asio::buffer(std::string("67890")), ec), 3u);
  EXPECT_FALSE(ec);
  EXPECT_EQ(sink.str(), "12345678");

  sink.clear();
  EXPECT_EQ(sink.size(), 0u);
}

