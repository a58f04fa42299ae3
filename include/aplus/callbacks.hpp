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

#ifndef __APLUS_CALLBACKS_HPP__
#define __APLUS_CALLBACKS_HPP__

#include <stddef.h>

#include <exception>
#include <memory>
#include <utility>

#include <glog/logging.h>

#include <stout/hashmap.hpp>
#include <stout/lambda.hpp>

namespace aplus {
namespace internal {

// Maximum number of subscribers a promise holds at once. Registering
// one more wraps the store around to its inline slot.
constexpr size_t MAX_SUBSCRIBERS = 0xFFFF;


// A promise that depends on the outcome of another one. The store
// only uses it when a subscriber has no handler for the outcome, in
// which case the outcome passes through to the dependent unchanged.
template <typename T>
class Dependent
{
public:
  virtual ~Dependent() {}

  virtual void fulfill(const T& value) = 0;
  virtual void reject(const std::exception_ptr& reason) = 0;

  // Tells the dependent that it is being settled from within the
  // scheduler, so it need not schedule its own subscribers again.
  virtual void guaranteeAsync() = 0;
};


// A subscriber: what to run on fulfillment, what to run on rejection,
// and the promise that depends on either. Any of them may be absent.
template <typename T>
struct Callback
{
  lambda::function<void(const T&)> fulfilled;
  lambda::function<void(const std::exception_ptr&)> rejected;
  std::shared_ptr<Dependent<T>> promise;
};


// The subscribers of a pending promise, in registration order. Most
// promises have a single subscriber, so index 0 lives inline and only
// indices 1..N-1 go into the overflow map.
template <typename T>
class Callbacks
{
public:
  Callbacks() : length(0) {}

  Callbacks(Callbacks&& that)
    : callback0(std::move(that.callback0)),
      overflow(std::move(that.overflow)),
      length(that.length)
  {
    that.callback0 = Callback<T>();
    that.overflow.clear();
    that.length = 0;
  }

  Callbacks& operator=(Callbacks&& that)
  {
    if (this != &that) {
      callback0 = std::move(that.callback0);
      overflow = std::move(that.overflow);
      length = that.length;

      that.callback0 = Callback<T>();
      that.overflow.clear();
      that.length = 0;
    }

    return *this;
  }

  // Appends a subscriber and returns its index.
  size_t add(Callback<T>&& callback)
  {
    size_t index = length;

    if (index >= MAX_SUBSCRIBERS) {
      LOG(WARNING) << "Promise reached " << MAX_SUBSCRIBERS
                   << " subscribers; releasing them and starting over";
      clear();
      index = 0;
    }

    if (index == 0) {
      CHECK(!callback0.promise && !callback0.fulfilled && !callback0.rejected)
        << "Inline subscriber slot is still in use";

      callback0 = std::move(callback);
    } else {
      CHECK(!overflow.contains(index))
        << "Subscriber slot " << index << " is still in use";

      overflow.put(index, std::move(callback));
    }

    length = index + 1;
    return index;
  }

  // Removes the subscriber at 'index' and returns it, releasing its
  // handlers and its dependent together.
  Callback<T> take(size_t index)
  {
    CHECK_LT(index, length);

    Callback<T> callback;

    if (index == 0) {
      callback = std::move(callback0);
      callback0 = Callback<T>();
    } else {
      auto it = overflow.find(index);
      if (it != overflow.end()) {
        callback = std::move(it->second);
        overflow.erase(it);
      }
    }

    return callback;
  }

  // Releases every subscriber.
  void clear()
  {
    callback0 = Callback<T>();
    overflow.clear();
    length = 0;
  }

  size_t size() const { return length; }

  bool empty() const { return length == 0; }

private:
  Callbacks(const Callbacks&) = delete;
  Callbacks& operator=(const Callbacks&) = delete;

  Callback<T> callback0;
  hashmap<size_t, Callback<T>> overflow;
  size_t length;
};


// Drops 'garbage' on the calling thread. Anything retired while that
// happens (e.g., by the destructors it runs) is dropped afterwards by
// the same outermost call, so releasing a chain of promises never
// recurses once per promise.
void retire(std::shared_ptr<void> garbage);

} // namespace internal {
} // namespace aplus {

#endif // __APLUS_CALLBACKS_HPP__
