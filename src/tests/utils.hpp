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

#ifndef __APLUS_TESTS_UTILS_HPP__
#define __APLUS_TESTS_UTILS_HPP__

#include <exception>
#include <memory>
#include <string>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <process/future.hpp>

#include <stout/duration.hpp>
#include <stout/lambda.hpp>
#include <stout/stringify.hpp>

#include <aplus/errors.hpp>
#include <aplus/promise.hpp>
#include <aplus/scheduler.hpp>

#include "tests/flags.hpp"

namespace aplus {
namespace internal {
namespace tests {

template <typename T>
::testing::AssertionResult AwaitAssertFulfilled(
    const char* expr,
    const char*, // Unused string representation of 'duration'.
    const Promise<T>& actual,
    const Duration& duration)
{
  if (!actual.wait(duration)) {
    return ::testing::AssertionFailure()
      << "Failed to wait " << duration << " for " << expr;
  } else if (actual.isRejected()) {
    return ::testing::AssertionFailure()
      << expr << " is REJECTED: " << describe(actual.reason());
  }

  return ::testing::AssertionSuccess();
}


template <typename T>
::testing::AssertionResult AwaitAssertFulfilled(
    const char* expr,
    const char*, // Unused string representation of 'duration'.
    const process::Future<T>& actual,
    const Duration& duration)
{
  if (!actual.await(duration)) {
    return ::testing::AssertionFailure()
      << "Failed to wait " << duration << " for " << expr;
  } else if (actual.isDiscarded()) {
    return ::testing::AssertionFailure()
      << expr << " is DISCARDED";
  } else if (actual.isFailed()) {
    return ::testing::AssertionFailure()
      << expr << " is FAILED: " << actual.failure();
  }

  return ::testing::AssertionSuccess();
}


template <typename T>
::testing::AssertionResult AwaitAssertRejected(
    const char* expr,
    const char*, // Unused string representation of 'duration'.
    const Promise<T>& actual,
    const Duration& duration)
{
  if (!actual.wait(duration)) {
    return ::testing::AssertionFailure()
      << "Failed to wait " << duration << " for " << expr;
  } else if (actual.isFulfilled()) {
    return ::testing::AssertionFailure()
      << expr << " is FULFILLED";
  }

  return ::testing::AssertionSuccess();
}


template <typename T>
::testing::AssertionResult AwaitAssertFailed(
    const char* expr,
    const char*, // Unused string representation of 'duration'.
    const process::Future<T>& actual,
    const Duration& duration)
{
  if (!actual.await(duration)) {
    return ::testing::AssertionFailure()
      << "Failed to wait " << duration << " for " << expr;
  } else if (actual.isReady()) {
    return ::testing::AssertionFailure()
      << expr << " is READY (" << ::testing::PrintToString(actual.get()) << ")";
  } else if (actual.isDiscarded()) {
    return ::testing::AssertionFailure()
      << expr << " is DISCARDED";
  }

  return ::testing::AssertionSuccess();
}


// Checks that 'actual' was rejected with an 'E' (or a subclass).
template <typename E, typename T>
::testing::AssertionResult AwaitAssertRejectedWith(
    const char* expr,
    const char*, // Unused string representation of 'duration'.
    const Promise<T>& actual,
    const Duration& duration)
{
  const ::testing::AssertionResult result =
    AwaitAssertRejected(expr, nullptr, actual, duration);

  if (!result) {
    return result;
  }

  try {
    std::rethrow_exception(actual.reason());
  } catch (const E&) {
    return ::testing::AssertionSuccess();
  } catch (...) {
    return ::testing::AssertionFailure()
      << expr << " is REJECTED with an unexpected reason: "
      << describe(actual.reason());
  }
}


template <typename T1, typename T2>
::testing::AssertionResult AwaitAssertEq(
    const char* expectedExpr,
    const char* actualExpr,
    const char* durationExpr,
    const T1& expected,
    const T2& actual, // Either a promise or a future.
    const Duration& duration)
{
  const ::testing::AssertionResult result =
    AwaitAssertFulfilled(actualExpr, durationExpr, actual, duration);

  if (result) {
    if (expected == actual.get()) {
      return ::testing::AssertionSuccess();
    } else {
      return ::testing::AssertionFailure()
        << "Value of: (" << actualExpr << ").get()\n"
        << "  Actual: " << ::testing::PrintToString(actual.get()) << "\n"
        << "Expected: " << expectedExpr << "\n"
        << "Which is: " << ::testing::PrintToString(expected);
    }
  }

  return result;
}


// A scheduler that records its interactions and, unless told
// otherwise, hands every task to a real trampoline.
class MockScheduler : public Scheduler
{
public:
  MockScheduler()
  {
    using ::testing::_;
    using ::testing::Invoke;

    ON_CALL(*this, invoke(_))
      .WillByDefault(Invoke(&trampoline, &Trampoline::invoke));

    ON_CALL(*this, settlePromises(_))
      .WillByDefault(Invoke(&trampoline, &Trampoline::settlePromises));
  }

  MOCK_METHOD1(invoke, void(const lambda::function<void()>&));

  MOCK_METHOD1(
      settlePromises,
      void(const std::shared_ptr<internal::Settleable>&));

  MOCK_METHOD1(fatalError, void(const std::exception_ptr&));

private:
  Trampoline trampoline;
};


// Installs a scheduler for the lifetime of the object and then puts
// back the one that was installed before.
class SchedulerInstaller
{
public:
  explicit SchedulerInstaller(Scheduler* installed)
    : previous(scheduler())
  {
    setScheduler(installed);
  }

  ~SchedulerInstaller()
  {
    setScheduler(previous);
  }

private:
  Scheduler* previous;
};


// A pending promise together with the functions that settle it.
template <typename T>
struct Deferred
{
  Deferred()
    : promise([this](const Resolver<T>& resolver, const Rejecter& rejecter) {
        resolve = resolver;
        reject = rejecter;
      }) {}

  lambda::function<void(const T&)> resolve;
  lambda::function<void(const std::exception_ptr&)> reject;
  Promise<T> promise;
};

} // namespace tests {
} // namespace internal {
} // namespace aplus {


#define AWAIT_ASSERT_FULFILLED_FOR(actual, duration)                    \
  ASSERT_PRED_FORMAT2(                                                  \
      aplus::internal::tests::AwaitAssertFulfilled, actual, duration)


#define AWAIT_ASSERT_FULFILLED(actual)                                  \
  AWAIT_ASSERT_FULFILLED_FOR(                                           \
      actual, aplus::internal::tests::flags.await_timeout)


#define AWAIT_EXPECT_FULFILLED_FOR(actual, duration)                    \
  EXPECT_PRED_FORMAT2(                                                  \
      aplus::internal::tests::AwaitAssertFulfilled, actual, duration)


#define AWAIT_EXPECT_FULFILLED(actual)                                  \
  AWAIT_EXPECT_FULFILLED_FOR(                                           \
      actual, aplus::internal::tests::flags.await_timeout)


#define AWAIT_FULFILLED(actual) AWAIT_ASSERT_FULFILLED(actual)


#define AWAIT_ASSERT_REJECTED_FOR(actual, duration)                     \
  ASSERT_PRED_FORMAT2(                                                  \
      aplus::internal::tests::AwaitAssertRejected, actual, duration)


#define AWAIT_ASSERT_REJECTED(actual)                                   \
  AWAIT_ASSERT_REJECTED_FOR(                                            \
      actual, aplus::internal::tests::flags.await_timeout)


#define AWAIT_EXPECT_REJECTED_FOR(actual, duration)                     \
  EXPECT_PRED_FORMAT2(                                                  \
      aplus::internal::tests::AwaitAssertRejected, actual, duration)


#define AWAIT_EXPECT_REJECTED(actual)                                   \
  AWAIT_EXPECT_REJECTED_FOR(                                            \
      actual, aplus::internal::tests::flags.await_timeout)


#define AWAIT_REJECTED(actual) AWAIT_ASSERT_REJECTED(actual)


#define AWAIT_EXPECT_REJECTED_WITH(E, actual)                           \
  EXPECT_PRED_FORMAT2(                                                  \
      aplus::internal::tests::AwaitAssertRejectedWith<E>,               \
      actual,                                                           \
      aplus::internal::tests::flags.await_timeout)


#define AWAIT_EXPECT_FAILED(actual)                                     \
  EXPECT_PRED_FORMAT2(                                                  \
      aplus::internal::tests::AwaitAssertFailed,                        \
      actual,                                                           \
      aplus::internal::tests::flags.await_timeout)


#define AWAIT_ASSERT_EQ_FOR(expected, actual, duration)                 \
  ASSERT_PRED_FORMAT3(                                                  \
      aplus::internal::tests::AwaitAssertEq, expected, actual, duration)


#define AWAIT_ASSERT_EQ(expected, actual)                               \
  AWAIT_ASSERT_EQ_FOR(                                                  \
      expected, actual, aplus::internal::tests::flags.await_timeout)


#define AWAIT_EXPECT_EQ_FOR(expected, actual, duration)                 \
  EXPECT_PRED_FORMAT3(                                                  \
      aplus::internal::tests::AwaitAssertEq, expected, actual, duration)


#define AWAIT_EXPECT_EQ(expected, actual)                               \
  AWAIT_EXPECT_EQ_FOR(                                                  \
      expected, actual, aplus::internal::tests::flags.await_timeout)

#endif // __APLUS_TESTS_UTILS_HPP__
