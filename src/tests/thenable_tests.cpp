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

#include <exception>
#include <stdexcept>
#include <string>
#include <type_traits>

#include <gtest/gtest.h>

#include <process/future.hpp>

#include <stout/lambda.hpp>
#include <stout/none.hpp>
#include <stout/option.hpp>

#include <aplus/promise.hpp>
#include <aplus/thenable.hpp>

#include "tests/utils.hpp"

using aplus::Promise;
using aplus::Suspended;

using aplus::internal::Shape;
using aplus::internal::shape;
using aplus::internal::unwrap;

using aplus::internal::tests::Deferred;

using std::string;


namespace {

typedef lambda::function<void(const int&)> Fulfilled;
typedef lambda::function<void(const std::exception_ptr&)> Rejected;


// Reports its outcome through 'done'.
class Done
{
public:
  typedef int value_type;

  explicit Done(int _value) : value(_value) {}

  void done(const Fulfilled& fulfilled, const Rejected&) const
  {
    fulfilled(value);
  }

private:
  int value;
};


// Reports its outcome through 'then'.
class Then
{
public:
  typedef int value_type;

  explicit Then(const Option<string>& _failure = None())
    : failure(_failure) {}

  void then(const Fulfilled& fulfilled, const Rejected& rejected) const
  {
    if (failure.isSome()) {
      rejected(std::make_exception_ptr(std::runtime_error(failure.get())));
    } else {
      fulfilled(11);
      fulfilled(12);
    }
  }

private:
  Option<string> failure;
};


// Has both, 'done' takes precedence.
class Both
{
public:
  typedef int value_type;

  void done(const Fulfilled& fulfilled, const Rejected&) const
  {
    fulfilled(1);
  }

  void then(const Fulfilled& fulfilled, const Rejected&) const
  {
    fulfilled(2);
  }
};


// Throws instead of reporting an outcome.
class Throwing
{
public:
  typedef int value_type;

  void then(const Fulfilled&, const Rejected&) const
  {
    throw std::logic_error("thenable threw");
  }
};


// Looks like a thenable but its 'then' does not take callbacks.
struct NotThenable
{
  int then() const { return 0; }
};

} // namespace {


static_assert(
    shape<int, int>::value == Shape::VALUE,
    "A plain value is not thenable");

static_assert(
    shape<int, Promise<int>>::value == Shape::PROMISE,
    "A promise of the same type is adopted as is");

static_assert(
    shape<int, process::Future<int>>::value == Shape::FUTURE,
    "A future is wrapped");

static_assert(
    shape<int, Done>::value == Shape::DONE,
    "An object with 'done' is a thenable");

static_assert(
    shape<int, Then>::value == Shape::THEN,
    "An object with 'then' is a thenable");

static_assert(
    shape<int, Both>::value == Shape::DONE,
    "'done' is probed before 'then'");

static_assert(
    shape<int, Suspended<int>>::value == Shape::COROUTINE,
    "A suspended computation is run");

static_assert(
    shape<NotThenable, NotThenable>::value == Shape::VALUE,
    "A 'then' that takes no callbacks does not make a thenable");

static_assert(
    std::is_same<unwrap<Promise<string>>::type, string>::value,
    "A promise unwraps to its value");

static_assert(
    std::is_same<unwrap<process::Future<int>>::type, int>::value,
    "A future unwraps to its value");

static_assert(
    std::is_same<unwrap<Then>::type, int>::value,
    "A thenable unwraps to the value it advertises");

static_assert(
    std::is_same<unwrap<string>::type, string>::value,
    "A plain value unwraps to itself");


TEST(ThenableTest, Done)
{
  AWAIT_EXPECT_EQ(5, Promise<int>::resolve(Done(5)));
}


TEST(ThenableTest, Then)
{
  // Only the first outcome counts.
  AWAIT_EXPECT_EQ(11, Promise<int>::resolve(Then()));

  Promise<int> rejected = Promise<int>::resolve(Then(string("failed")));

  AWAIT_EXPECT_REJECTED_WITH(std::runtime_error, rejected);
  EXPECT_EQ("failed", aplus::describe(rejected.reason()));
}


TEST(ThenableTest, DoneBeforeThen)
{
  AWAIT_EXPECT_EQ(1, Promise<int>::resolve(Both()));
}


TEST(ThenableTest, Throws)
{
  AWAIT_EXPECT_REJECTED_WITH(
      std::logic_error,
      Promise<int>::resolve(Throwing()));
}


TEST(ThenableTest, PlainValue)
{
  Promise<NotThenable> promise = Promise<NotThenable>::resolve(NotThenable());

  EXPECT_TRUE(promise.isFulfilled());
}


TEST(ThenableTest, HandlerReturnsThenable)
{
  Deferred<int> deferred;

  Promise<int> promise = deferred.promise.then([](int value) {
    return Done(value * 2);
  });

  deferred.resolve(21);

  AWAIT_EXPECT_EQ(42, promise);
}
