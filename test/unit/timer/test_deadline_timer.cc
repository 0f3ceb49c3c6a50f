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

#include <atomic>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <thread>

#include "streamhttp/timer/deadline_timer.hpp"
#include "test/utils/test_utils.hpp"

using namespace streamhttp;
using namespace streamhttp::test;
using namespace std::chrono_literals;

using timer::DeadlineTimer;

/**
 * @brief DeadlineTimer tests on a private io_context thread
 */
class DeadlineTimerTest : public BaseTest {
 protected:
  void SetUp() override {
    BaseTest::SetUp();
    work_ = std::make_unique<WorkGuard>(ioc_.get_executor());
    thread_ = std::thread([this]() { ioc_.run(); });
  }

  void TearDown() override {
    work_.reset();
    ioc_.stop();
    if (thread_.joinable()) {
      thread_.join();
    }
    BaseTest::TearDown();
  }

  using WorkGuard = boost::asio::executor_work_guard<boost::asio::io_context::executor_type>;

  boost::asio::io_context ioc_;
  std::unique_ptr<WorkGuard> work_;
  std::thread thread_;
};

TEST_F(DeadlineTimerTest, FiresOnceAfterDuration) {
  auto deadline = DeadlineTimer::create(ioc_);
  std::atomic<int> fired{0};

  auto start = std::chrono::steady_clock::now();
  std::atomic<long long> fired_after{0};
  deadline->arm(50ms, [&]() {
    fired_after = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start)
                      .count();
    fired++;
  });

  ASSERT_TRUE(TestUtils::waitForCondition([&]() { return fired.load() == 1; }, 1000));
  TestUtils::waitFor(100);

  EXPECT_EQ(fired.load(), 1);
  EXPECT_GE(fired_after.load(), 45);
  EXPECT_FALSE(deadline->is_armed());
  EXPECT_EQ(deadline->fire_count(), 1u);
}

TEST_F(DeadlineTimerTest, StopPreventsFire) {
  auto deadline = DeadlineTimer::create(ioc_);
  std::atomic<int> fired{0};
  deadline->arm(30ms, [&]() { fired++; });

  EXPECT_TRUE(deadline->stop());
  EXPECT_FALSE(deadline->stop());
  TestUtils::waitFor(100);

  EXPECT_EQ(fired.load(), 0);
}

TEST_F(DeadlineTimerTest, ResetPushesExpiryBack) {
  auto deadline = DeadlineTimer::create(ioc_);
  std::atomic<int> fired{0};
  deadline->arm(60ms, [&]() { fired++; });

  // Keep resetting well inside the window for longer than the window itself
  for (int i = 0; i < 8; ++i) {
    TestUtils::waitFor(20);
    EXPECT_TRUE(deadline->reset(60ms));
  }
  EXPECT_EQ(fired.load(), 0);

  ASSERT_TRUE(TestUtils::waitForCondition([&]() { return fired.load() == 1; }, 1000));
}

TEST_F(DeadlineTimerTest, StopThenResetHasNoStaleFire) {
  auto deadline = DeadlineTimer::create(ioc_);
  std::atomic<int> fired{0};
  deadline->arm(20ms, [&]() { fired++; });

  deadline->stop();
  EXPECT_FALSE(deadline->reset(200ms));

  // The first 20ms expiry must not fire the re-armed deadline early
  TestUtils::waitFor(80);
  EXPECT_EQ(fired.load(), 0);
  EXPECT_TRUE(deadline->is_armed());

  deadline->stop();
}

TEST_F(DeadlineTimerTest, PerChunkStopResetNeverFires) {
  auto deadline = DeadlineTimer::create(ioc_);
  std::atomic<int> fired{0};
  deadline->arm(50ms, [&]() { fired++; });

  for (int chunk = 0; chunk < 20; ++chunk) {
    deadline->stop();
    TestUtils::waitFor(10);
    deadline->reset(50ms);
  }
  deadline->stop();
  TestUtils::waitFor(100);

  EXPECT_EQ(fired.load(), 0);
  EXPECT_EQ(deadline->fire_count(), 0u);
}

TEST_F(DeadlineTimerTest, RearmAfterFire) {
  auto deadline = DeadlineTimer::create(ioc_);
  std::atomic<int> fired{0};
  deadline->arm(10ms, [&]() { fired++; });
  ASSERT_TRUE(TestUtils::waitForCondition([&]() { return fired.load() == 1; }, 1000));

  EXPECT_FALSE(deadline->reset(10ms));
  ASSERT_TRUE(TestUtils::waitForCondition([&]() { return fired.load() == 2; }, 1000));
}

TEST_F(DeadlineTimerTest, ThrowingHandlerIsContained) {
  auto deadline = DeadlineTimer::create(ioc_);
  deadline->arm(5ms, []() { throw std::runtime_error("handler failure"); });

  ASSERT_TRUE(TestUtils::waitForCondition([&]() { return deadline->fire_count() == 1; }, 1000));
  EXPECT_FALSE(deadline->is_armed());
}

TEST_F(DeadlineTimerTest, SharedContextFactory) {
  auto deadline = DeadlineTimer::create();
  std::atomic<int> fired{0};
  deadline->arm(10ms, [&]() { fired++; });

  ASSERT_TRUE(TestUtils::waitForCondition([&]() { return fired.load() == 1; }, 1000));
}

TEST_F(DeadlineTimerTest, NonStandardThrowFromHandlerKeepsContextRunning) {
  auto deadline = DeadlineTimer::create(ioc_);

  // Given a fire handler that throws something outside std::exception
  deadline->arm(10ms, []() { throw 42; });
  ASSERT_TRUE(TestUtils::waitForCondition([&]() { return deadline->fire_count() == 1u; }, 1000));

  // When the same timer is armed again
  std::atomic<int> fired{0};
  deadline->arm(10ms, [&]() { fired++; });

  // Then the io_context thread is still alive and delivers the second fire
  ASSERT_TRUE(TestUtils::waitForCondition([&]() { return fired.load() == 1; }, 1000));
  EXPECT_EQ(deadline->fire_count(), 2u);
  EXPECT_FALSE(ioc_.stopped());
}
