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

#include <string>

#include "streamhttp/builder/request_config_builder.hpp"
#include "streamhttp/builder/transport_builder.hpp"
#include "streamhttp/common/constants.hpp"
#include "streamhttp/config/request_config.hpp"
#include "streamhttp/config/transport_config.hpp"
#include "streamhttp/streamhttp.hpp"
#include "test/utils/test_utils.hpp"

using namespace streamhttp;
using namespace streamhttp::test;
using namespace std::chrono_literals;

class ConfigTest : public BaseTest {};

// ============================================================================
// REQUEST CONFIG
// ============================================================================

TEST_F(ConfigTest, RequestDefaultsDisableDeadline) {
  config::RequestConfig cfg;

  EXPECT_FALSE(cfg.has_timeout());
  EXPECT_TRUE(cfg.is_valid());
  EXPECT_FALSE(static_cast<bool>(cfg.modifier));
}

TEST_F(ConfigTest, RequestClampsNegativeTimeout) {
  config::RequestConfig negative;
  negative.timeout = -10ms;
  EXPECT_FALSE(negative.is_valid());
  negative.validate_and_clamp();
  EXPECT_EQ(negative.timeout, 0ms);
  EXPECT_FALSE(negative.has_timeout());

}

TEST_F(ConfigTest, RequestKeepsLongTimeout) {
  // Given a timeout of several days
  const auto week = std::chrono::milliseconds(std::chrono::hours(24 * 7));
  config::RequestConfig cfg;
  cfg.timeout = week;

  // When validated directly or through the builder
  EXPECT_TRUE(cfg.is_valid());
  cfg.validate_and_clamp();
  auto built = builder::RequestConfigBuilder().timeout(week).build();

  // Then the value is kept unchanged
  EXPECT_EQ(cfg.timeout, week);
  EXPECT_EQ(built.timeout, week);
  EXPECT_TRUE(built.has_timeout());
}

TEST_F(ConfigTest, RequestBuilderChains) {
  bool applied = false;
  auto cfg = builder::RequestConfigBuilder()
                 .timeout(500ms)
                 .modifier([&applied](http::Request&) { applied = true; })
                 .build();

  EXPECT_EQ(cfg.timeout, 500ms);
  ASSERT_TRUE(static_cast<bool>(cfg.modifier));

  boost::system::error_code ec;
  http::Request request(http::beast_http::verb::get, http::Url::parse("http://host/", ec));
  cfg.modifier(request);
  EXPECT_TRUE(applied);
}

TEST_F(ConfigTest, RequestBuilderClampsNegativeTimeout) {
  auto cfg = request_options().timeout(-1ms).build();

  EXPECT_EQ(cfg.timeout, 0ms);
}

// ============================================================================
// TRANSPORT CONFIG
// ============================================================================

TEST_F(ConfigTest, TransportDefaults) {
  config::TransportConfig cfg;

  EXPECT_TRUE(cfg.is_valid());
  EXPECT_EQ(cfg.user_agent, common::constants::DEFAULT_USER_AGENT);
  EXPECT_EQ(cfg.connection_timeout_ms, common::constants::DEFAULT_CONNECTION_TIMEOUT_MS);
}

TEST_F(ConfigTest, TransportBuilderClamps) {
  auto transport = http_transport().user_agent("tester/2.0").connection_timeout(1).header_limit(1u << 30).build();

  ASSERT_NE(transport, nullptr);
  EXPECT_EQ(transport->config().user_agent, "tester/2.0");
  EXPECT_EQ(transport->config().connection_timeout_ms, common::constants::MIN_CONNECTION_TIMEOUT_MS);
  EXPECT_EQ(transport->config().header_limit, common::constants::MAX_HEADER_LIMIT);
}
