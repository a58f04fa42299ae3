// Licensed to the Apache Software Foundation (ASF) under one
// or more contributor license agreements.  See the NOTICE file
// distributed with this work for additional information
// regarding copyright ownership.  The ASF licenses this file
// to you under the Apache License, Version 2.0 (the
// "License"); you may not use this file except in compliance
// with the License.  You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include <stout/duration.hpp>
#include <stout/foreach.hpp>
#include <stout/os.hpp>

#include <aplus/callbacks.hpp>
#include <aplus/context.hpp>
#include <aplus/errors.hpp>
#include <aplus/promise.hpp>

#include "tests/utils.hpp"

using aplus::Context;
using aplus::NotSettledError;
using aplus::Promise;
using aplus::Rejecter;
using aplus::Resolver;

using aplus::internal::tests::Deferred;

using std::vector;


TEST(BlockingTest, Get)
{
  EXPECT_EQ(1, Promise<int>::resolve(1).get());

  Promise<int> rejected = Promise<int>::reject(std::logic_error("rejected"));
  EXPECT_THROW(rejected.get(), std::logic_error);
}


TEST(BlockingTest, GetWithoutWaiting)
{
  Deferred<int> deferred;

  EXPECT_THROW(deferred.promise.get(false), NotSettledError);

  deferred.resolve(2);

  EXPECT_EQ(2, deferred.promise.get(false));
}


// Timing out leaves the promise untouched, so it can still be waited
// on afterwards.
TEST(BlockingTest, GetTimeout)
{
  Deferred<int> deferred;

  EXPECT_THROW(
      deferred.promise.get(true, Milliseconds(10)),
      NotSettledError);

  EXPECT_TRUE(deferred.promise.isPending());
  EXPECT_FALSE(deferred.promise.isWaiting());

  EXPECT_FALSE(deferred.promise.wait(Milliseconds(10)));

  deferred.resolve(3);

  EXPECT_TRUE(deferred.promise.wait(Milliseconds(10)));
  EXPECT_EQ(3, deferred.promise.get());
}


TEST(BlockingTest, SettledFromAnotherThread)
{
  Deferred<int> deferred;

  std::thread thread([deferred]() {
    os::sleep(Milliseconds(10));
    deferred.resolve(4);
  });

  EXPECT_EQ(4, deferred.promise.get());

  thread.join();
}


TEST(BlockingTest, ConcurrentWaits)
{
  Deferred<int> deferred;

  const size_t count = 4;
  std::atomic<size_t> settled(0);

  vector<std::thread> waiters;
  for (size_t i = 0; i < count; i++) {
    waiters.emplace_back([deferred, &settled]() {
      if (deferred.promise.wait()) {
        EXPECT_EQ(5, deferred.promise.get(false));
        settled++;
      }
    });
  }

  deferred.resolve(5);

  foreach (std::thread& waiter, waiters) {
    waiter.join();
  }

  EXPECT_EQ(count, settled.load());
}


TEST(BlockingTest, Follower)
{
  Deferred<int> deferred;

  Promise<int> follower(
      [deferred](const Resolver<int>& resolve, const Rejecter&) {
        resolve(deferred.promise);
      });

  std::thread thread([deferred]() {
    os::sleep(Milliseconds(10));
    deferred.resolve(6);
  });

  EXPECT_EQ(6, follower.get());

  thread.join();
}


// Waiting from within a context first runs what the thread deferred,
// otherwise it would wait on itself.
TEST(BlockingTest, WaitInsideContext)
{
  Context::Scope scope;

  Promise<int> promise = Promise<int>::resolve(1)
    .then([](int value) { return value + 1; });

  EXPECT_TRUE(promise.isPending());

  EXPECT_EQ(2, promise.get(true, Seconds(5)));
}


// Polling a pending promise with a short timeout reuses one subscriber
// rather than adding one per poll.
TEST(BlockingTest, PollingKeepsSubscribers)
{
  Deferred<int> deferred;

  bool called = false;
  Promise<int> dependent = deferred.promise.then([&called](int value) {
    called = true;
    return value;
  });

  for (size_t i = 0; i <= aplus::internal::MAX_SUBSCRIBERS; i++) {
    ASSERT_FALSE(deferred.promise.wait(Milliseconds(0)));
  }

  EXPECT_THROW(deferred.promise.get(true, Milliseconds(0)), NotSettledError);

  deferred.resolve(7);

  AWAIT_EXPECT_EQ(7, dependent);
  EXPECT_TRUE(called);
  EXPECT_EQ(7, deferred.promise.get());
}
