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
#include <boost/asio/post.hpp>
#include <future>
#include <thread>
#include <vector>

#include "streamhttp/common/io_context_manager.hpp"
#include "streamhttp/common/thread_safe_state.hpp"
#include "test/utils/test_utils.hpp"

using namespace streamhttp;
using namespace streamhttp::test;
using namespace std::chrono_literals;

namespace {

enum class Phase { Idle, Running, Finished };

}  // namespace

class ThreadSafeStateTest : public BaseTest {};

TEST_F(ThreadSafeStateTest, CompareAndSetOnlyFromExpected) {
  common::ThreadSafeState<Phase> state(Phase::Idle);

  EXPECT_TRUE(state.compare_and_set(Phase::Idle, Phase::Running));
  EXPECT_FALSE(state.compare_and_set(Phase::Idle, Phase::Finished));
  EXPECT_TRUE(state.is_state(Phase::Running));
  EXPECT_EQ(state.exchange(Phase::Finished), Phase::Running);
  EXPECT_EQ(state.get_state(), Phase::Finished);
}

TEST_F(ThreadSafeStateTest, CallbacksSeeEveryTransition) {
  common::ThreadSafeState<Phase> state(Phase::Idle);
  std::vector<Phase> seen;
  state.add_state_change_callback([&seen](const Phase& p) { seen.push_back(p); });

  state.set_state(Phase::Running);
  state.compare_and_set(Phase::Idle, Phase::Finished);  // rejected, no callback
  state.compare_and_set(Phase::Running, Phase::Finished);

  ASSERT_EQ(seen.size(), 2u);
  EXPECT_EQ(seen[0], Phase::Running);
  EXPECT_EQ(seen[1], Phase::Finished);

  state.clear_state_change_callbacks();
  state.set_state(Phase::Idle);
  EXPECT_EQ(seen.size(), 2u);
}

TEST_F(ThreadSafeStateTest, ThrowingCallbackIsLogged) {
  common::ThreadSafeState<Phase> state(Phase::Idle);
  state.add_state_change_callback([](const Phase&) { throw std::runtime_error("observer failure"); });

  EXPECT_NO_THROW(state.set_state(Phase::Running));
  EXPECT_EQ(state.get_state(), Phase::Running);
}

TEST_F(ThreadSafeStateTest, WaitForStateAcrossThreads) {
  common::ThreadSafeState<Phase> state(Phase::Idle);

  std::thread setter([&state]() {
    std::this_thread::sleep_for(20ms);
    state.set_state(Phase::Finished);
  });

  EXPECT_TRUE(state.wait_for_state(Phase::Finished, 1000ms));
  setter.join();
  EXPECT_FALSE(state.wait_for_state(Phase::Running, 10ms));
}

TEST_F(ThreadSafeStateTest, ConcurrentCompareAndSetHasSingleWinner) {
  common::ThreadSafeState<Phase> state(Phase::Running);
  std::atomic<int> winners{0};

  std::vector<std::thread> threads;
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&]() {
      if (state.compare_and_set(Phase::Running, Phase::Finished)) {
        winners++;
      }
    });
  }
  for (auto& t : threads) {
    t.join();
  }

  EXPECT_EQ(winners.load(), 1);
}

class IoContextManagerTest : public BaseTest {};

TEST_F(IoContextManagerTest, RunsPostedWork) {
  auto& manager = common::IoContextManager::instance();
  manager.start();
  ASSERT_TRUE(manager.is_running());

  std::promise<std::thread::id> ran;
  auto future = ran.get_future();
  boost::asio::post(manager.get_context(), [&ran]() { ran.set_value(std::this_thread::get_id()); });

  ASSERT_EQ(future.wait_for(1s), std::future_status::ready);
  EXPECT_NE(future.get(), std::this_thread::get_id());
}

TEST_F(IoContextManagerTest, StartIsIdempotent) {
  auto& manager = common::IoContextManager::instance();
  manager.start();
  manager.start();

  EXPECT_TRUE(manager.is_running());
}

TEST_F(IoContextManagerTest, RecoversAfterEscapedException) {
  auto& manager = common::IoContextManager::instance();
  manager.start();

  // Given work that escapes run() with a non-standard exception
  boost::asio::post(manager.get_context(), []() { throw 7; });

  // Then the manager reports the thread as stopped
  ASSERT_TRUE(TestUtils::waitForCondition([&manager]() { return !manager.is_running(); }, 1000));

  // And a later start brings up a working thread again
  manager.start();
  ASSERT_TRUE(manager.is_running());
  std::promise<void> ran;
  auto future = ran.get_future();
  boost::asio::post(manager.get_context(), [&ran]() { ran.set_value(); });
  EXPECT_EQ(future.wait_for(1s), std::future_status::ready);
}

TEST_F(IoContextManagerTest, IndependentContextIsSeparate) {
  auto& manager = common::IoContextManager::instance();
  auto independent = manager.create_independent_context();

  ASSERT_NE(independent, nullptr);
  EXPECT_NE(independent.get(), &manager.get_context());

  bool ran = false;
  boost::asio::post(*independent, [&ran]() { ran = true; });
  independent->run();
  EXPECT_TRUE(ran);
}
