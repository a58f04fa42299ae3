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

#ifndef __APLUS_PROMISE_HPP__
#define __APLUS_PROMISE_HPP__

#include <atomic>
#include <exception>
#include <memory>
#include <type_traits>
#include <utility>
#include <vector>

#include <glog/logging.h>

#include <process/async.hpp>
#include <process/future.hpp>
#include <process/latch.hpp>

#include <stout/duration.hpp>
#include <stout/foreach.hpp>
#include <stout/lambda.hpp>
#include <stout/none.hpp>
#include <stout/nothing.hpp>
#include <stout/option.hpp>
#include <stout/synchronized.hpp>
#include <stout/try.hpp>
#include <stout/unreachable.hpp>

#include <aplus/callbacks.hpp>
#include <aplus/context.hpp>
#include <aplus/errors.hpp>
#include <aplus/scheduler.hpp>
#include <aplus/thenable.hpp>

namespace aplus {

// Forward declarations.
template <typename T>
class Promise;

template <typename T>
class Resolver;

namespace internal {

template <typename T, typename R>
class Link;

} // namespace internal {


// Rejects the promise under construction with the reason it is
// called with. Handed to executors (see 'Promise::Executor').
class Rejecter
{
public:
  void operator()(const std::exception_ptr& reason) const
  {
    reject(reason);
  }

  // Only exceptions can be rejection reasons.
  template <typename E>
  void operator()(const E& error) const
  {
    static_assert(
        std::is_base_of<std::exception, E>::value,
        "A promise can only be rejected with an exception");

    reject(std::make_exception_ptr(error));
  }

private:
  template <typename T>
  friend class Promise;

  explicit Rejecter(const lambda::function<void(const std::exception_ptr&)>& f)
    : reject(f) {}

  lambda::function<void(const std::exception_ptr&)> reject;
};


// A pair of handlers for 'Promise::thenAll' and 'Promise::doneAll'.
// Either may be empty, in which case the outcome passes through. A
// value can only pass through when 'R' is 'T', so 'fulfilled' must be
// set whenever they differ; leaving it empty then aborts the program
// when the handlers are registered.
template <typename T, typename R = T>
struct Handlers
{
  lambda::function<R(const T&)> fulfilled;
  lambda::function<R(const std::exception_ptr&)> rejected;
};


namespace internal {

template <typename F, typename A>
typename result<F, A>::type call(F& f, const A& argument, std::false_type)
{
  return f(argument);
}


template <typename F, typename A>
Nothing call(F& f, const A& argument, std::true_type)
{
  f(argument);
  return Nothing();
}


// Runs a handler inside a new context and captures whatever it throws
// so that it can never escape into the code that settles promises.
template <typename F, typename A>
Try<typename result<F, A>::type, Raised> attempt(F& f, const A& argument)
{
  Context::Scope scope;

  try {
    return call(f, argument, std::is_void<typename result<F, A>::returned>());
  } catch (...) {
    return Raised(std::current_exception());
  }
}

} // namespace internal {


// A Promises/A+ promise: a handle onto a value of type 'T' that may
// not be available yet. Copies of a promise share its state.
//
// A promise is either pending, fulfilled with a value, or rejected
// with a reason (an exception). It leaves the pending state at most
// once. Handlers registered through 'then' and friends run after the
// promise settles, in registration order, through the installed
// 'Scheduler', and never on the stack of the code that settled it.
template <typename T>
class Promise
{
public:
  typedef T value_type;

  typedef lambda::function<void(const Resolver<T>&, const Rejecter&)>
    Executor;

  // The promise returned when chaining a handler 'F' onto this one.
  template <typename F>
  using Chained = Promise<
    typename internal::unwrap<typename internal::result<F, T>::type>::type>;

  // Creates a pending promise that is only ever settled by resolving
  // promises that adopt it (e.g., through 'Resolver').
  Promise();

  // Creates a promise and runs 'executor' right away, inside a new
  // context, with the functions that settle it. If the executor throws
  // the promise is rejected with what it threw, unless it had already
  // been resolved.
  explicit Promise(const Executor& executor);

  // Returns a promise resolved with 'value', which may be a plain
  // value or anything thenable (see 'aplus/thenable.hpp'). A promise
  // of the same type is returned as is.
  static Promise<T> resolve(const Promise<T>& promise);

  template <typename U>
  static Promise<T> resolve(const U& value);

  static Promise<T> reject(const std::exception_ptr& reason);

  template <typename E>
  static Promise<T> reject(const E& error);

  // Registers 'f' to run with the value of this promise, and 'g' to
  // run with its reason. The returned promise is resolved with what
  // the handler returns (thenables are adopted), or rejected with what
  // it throws. A missing handler passes the outcome through.
  template <typename F>
  Chained<F> then(const F& f) const;

  template <typename F, typename G>
  Chained<F> then(const F& f, const G& g) const;

  // Registers 'g' to run with the reason of this promise; the value of
  // a fulfilled promise passes through.
  template <typename G>
  Promise<T> repair(const G& g) const;

  // Like 'then' but terminal: a rejection that reaches the end of the
  // chain without being handled is reported through
  // 'Scheduler::fatalError'.
  void done() const;

  template <typename F>
  void done(const F& f) const;

  template <typename F, typename G>
  void done(const F& f, const G& g) const;

  // Registers every pair of handlers, in order.
  template <typename R>
  std::vector<Chained<lambda::function<R(const T&)>>> thenAll(
      const std::vector<Handlers<T, R>>& handlers) const;

  template <typename R>
  void doneAll(const std::vector<Handlers<T, R>>& handlers) const;

  // Returns the value of this promise, waiting for it to settle first
  // when 'block' is true (see 'wait'). Rethrows the reason of a
  // rejected promise and throws 'NotSettledError' if it is pending.
  const T& get(
      bool block = true,
      const Option<Duration>& timeout = None()) const;

  // Blocks the calling thread until this promise settles or 'timeout'
  // elapses. Returns true if the promise has settled.
  //
  // Before blocking, the tasks deferred on the calling thread are run
  // so that a thread never waits for work only it can do.
  bool wait(const Option<Duration>& timeout = None()) const;

  bool isPending() const;
  bool isFulfilled() const;
  bool isRejected() const;

  // Whether a thread is blocked in 'wait' on this promise.
  bool isWaiting() const;

  // Returns the reason of a rejected promise, nullptr otherwise.
  std::exception_ptr reason() const;

  // Returns a libprocess future that completes with this promise. The
  // future is created on first use and then reused.
  process::Future<T> future() const;

  bool operator==(const Promise<T>& that) const { return data == that.data; }
  bool operator!=(const Promise<T>& that) const { return data != that.data; }

private:
  template <typename U>
  friend class Promise;

  friend class Resolver<T>;

  template <typename X, typename R>
  friend class internal::Link;

  enum State
  {
    PENDING,
    FULFILLED,
    REJECTED,
  };

  struct Data : public internal::Settleable
  {
    Data();

    ~Data() override;

    // Notifies every subscriber, in registration order.
    void settlePromises() override;

    // Notifies a single subscriber; 'async' tells whether this already
    // runs within the scheduler.
    void settlePromise(
        const internal::Callback<T>& callback,
        bool async) const;

    std::atomic_flag lock = ATOMIC_FLAG_INIT;

    State state;

    // Set on the dependents created by 'done'.
    bool final;

    bool asyncGuaranteed;

    // Number of threads blocked in 'wait'.
    size_t waiters;

    // Triggered once this promise settles. Created, and subscribed, by
    // the first 'wait' and shared by every later one.
    std::shared_ptr<process::Latch> latch;

    Option<T> value;
    std::exception_ptr reason;

    // The promise this one adopted while it is still pending. Its
    // subscribers were moved over to that promise.
    std::shared_ptr<Data> followee;

    internal::Callbacks<T> callbacks;

    Option<process::Future<T>> future;

    // The context this promise was created in, if any.
    std::shared_ptr<Context> trace;
  };

  // Walks the chain of adopted promises, starting at this one.
  std::shared_ptr<Data> target() const;

  State state() const;

  void _fulfill(const T& value) const;
  void _reject(const std::exception_ptr& reason) const;
  void _guaranteeAsync() const;

  // Resolves this promise with 'value' following the Promises/A+
  // resolution procedure.
  template <typename U>
  void _resolve(const U& value) const;

  template <typename U>
  void _resolve(const U& value, internal::Shaped<internal::Shape::VALUE>)
    const;

  template <typename U, internal::Shape S>
  void _resolve(const U& value, internal::Shaped<S>) const;

  template <typename Y>
  void _resolve(
      const process::Future<Y>& future,
      internal::Shaped<internal::Shape::FUTURE>) const;

  // Settles this promise with the outcome of a handler.
  template <typename X>
  void _settle(const Try<X, internal::Raised>& outcome) const;

  // Makes this promise follow 'that' one.
  void adopt(const Promise<T>& that) const;

  void notify(bool synchronous) const;

  // The subscriber behind 'wait': once the end of the chain settles it
  // copies the outcome into 'data' and triggers 'latch'.
  static internal::Callback<T> bridge(
      const std::shared_ptr<Data>& data,
      const std::shared_ptr<process::Latch>& latch);

  // Adds 'callback' to the promise at the end of the chain starting at
  // 'data', or schedules it right away if that promise has settled.
  static void subscribe(
      std::shared_ptr<Data> data,
      internal::Callback<T>&& callback);

  template <typename R, typename F, typename G>
  Promise<R> chain(const F& f, const G& g, bool final) const;

  template <typename A, typename R, typename F>
  static lambda::function<void(const A&)> handle(
      const F& f,
      const Promise<R>& dependent);

  template <typename A, typename R>
  static lambda::function<void(const A&)> handle(
      const internal::Absent&,
      const Promise<R>&);

  // Conversions of the thenable shapes into a promise of 'T'.
  static Promise<T> convert(
      const Promise<T>& promise,
      internal::Shaped<internal::Shape::PROMISE>);

  template <typename Y>
  static Promise<T> convert(
      const process::Future<Y>& future,
      internal::Shaped<internal::Shape::FUTURE>);

  template <typename U>
  static Promise<T> convert(
      const U& thenable,
      internal::Shaped<internal::Shape::DONE>);

  template <typename U>
  static Promise<T> convert(
      const U& thenable,
      internal::Shaped<internal::Shape::THEN>);

  template <typename Y>
  static Promise<T> convert(
      const Suspended<Y>& suspended,
      internal::Shaped<internal::Shape::COROUTINE>);

  void cache(const process::Future<T>& future, std::true_type) const;

  template <typename Y>
  void cache(const process::Future<Y>&, std::false_type) const {}

  std::shared_ptr<Data> data;
};


// Resolves the promise under construction with the value it is called
// with. Handed to executors (see 'Promise::Executor').
template <typename T>
class Resolver
{
public:
  template <typename U>
  void operator()(const U& value) const
  {
    promise._resolve(value);
  }

private:
  friend class Promise<T>;

  explicit Resolver(const Promise<T>& _promise) : promise(_promise) {}

  Promise<T> promise;
};


namespace internal {

// The dependent half of a subscriber: passes the outcome of a promise
// of 'T' through to a promise of 'R'. A value only ever passes
// through when both types agree.
template <typename T, typename R>
class Link : public Dependent<T>
{
public:
  explicit Link(const Promise<R>& _promise) : promise(_promise) {}

  ~Link() override {}

  void fulfill(const T& value) override
  {
    forward(value, std::is_same<T, R>());
  }

  void reject(const std::exception_ptr& reason) override
  {
    promise._reject(reason);
  }

  void guaranteeAsync() override
  {
    promise._guaranteeAsync();
  }

private:
  void forward(const T& value, std::true_type)
  {
    promise._fulfill(value);
  }

  void forward(const T&, std::false_type)
  {
    UNREACHABLE();
  }

  Promise<R> promise;
};

} // namespace internal {


template <typename T>
Promise<T>::Data::Data()
  : state(PENDING),
    final(false),
    asyncGuaranteed(false),
    waiters(0),
    trace(Context::current()) {}


template <typename T>
Promise<T>::Data::~Data()
{
  // Dependents and followees can form chains of any length.
  if (!callbacks.empty()) {
    internal::retire(
        std::make_shared<internal::Callbacks<T>>(std::move(callbacks)));
  }

  if (followee) {
    internal::retire(std::move(followee));
  }
}


template <typename T>
void Promise<T>::Data::settlePromises()
{
  internal::Callbacks<T> subscribers;

  synchronized (lock) {
    asyncGuaranteed = true;
    subscribers = std::move(callbacks);
  }

  // The state is fixed from here on so it can be read without the lock.
  for (size_t i = 0; i < subscribers.size(); i++) {
    settlePromise(subscribers.take(i), true);
  }
}


template <typename T>
void Promise<T>::Data::settlePromise(
    const internal::Callback<T>& callback,
    bool async) const
{
  if (state == FULFILLED) {
    if (callback.fulfilled) {
      callback.fulfilled(value.get());
    } else if (callback.promise) {
      if (async) {
        callback.promise->guaranteeAsync();
      }
      callback.promise->fulfill(value.get());
    }
    return;
  }

  CHECK(state == REJECTED);

  if (callback.rejected) {
    callback.rejected(reason);
  } else if (callback.promise) {
    if (async) {
      callback.promise->guaranteeAsync();
    }
    callback.promise->reject(reason);
  }
}


template <typename T>
Promise<T>::Promise() : data(new Data()) {}


template <typename T>
Promise<T>::Promise(const Executor& executor) : Promise()
{
  Promise<T> self = *this;

  Context::Scope scope;

  try {
    executor(
        Resolver<T>(self),
        Rejecter([self](const std::exception_ptr& reason) {
          self._reject(reason);
        }));
  } catch (...) {
    _reject(std::current_exception());
  }
}


template <typename T>
Promise<T> Promise<T>::resolve(const Promise<T>& promise)
{
  return promise;
}


template <typename T>
template <typename U>
Promise<T> Promise<T>::resolve(const U& value)
{
  Promise<T> promise;
  promise._resolve(value);
  return promise;
}


template <typename T>
Promise<T> Promise<T>::reject(const std::exception_ptr& reason)
{
  Promise<T> promise;
  promise._reject(reason);
  return promise;
}


template <typename T>
template <typename E>
Promise<T> Promise<T>::reject(const E& error)
{
  static_assert(
      std::is_base_of<std::exception, E>::value,
      "A promise can only be rejected with an exception");

  return reject(std::make_exception_ptr(error));
}


template <typename T>
template <typename F>
typename Promise<T>::template Chained<F> Promise<T>::then(const F& f) const
{
  typedef typename Chained<F>::value_type R;
  return chain<R>(f, internal::Absent(), false);
}


template <typename T>
template <typename F, typename G>
typename Promise<T>::template Chained<F> Promise<T>::then(
    const F& f,
    const G& g) const
{
  typedef typename Chained<F>::value_type R;
  return chain<R>(f, g, false);
}


template <typename T>
template <typename G>
Promise<T> Promise<T>::repair(const G& g) const
{
  return chain<T>(internal::Absent(), g, false);
}


template <typename T>
void Promise<T>::done() const
{
  chain<T>(internal::Absent(), internal::Absent(), true);
}


template <typename T>
template <typename F>
void Promise<T>::done(const F& f) const
{
  typedef typename Chained<F>::value_type R;
  chain<R>(f, internal::Absent(), true);
}


template <typename T>
template <typename F, typename G>
void Promise<T>::done(const F& f, const G& g) const
{
  typedef typename Chained<F>::value_type R;
  chain<R>(f, g, true);
}


template <typename T>
template <typename R>
std::vector<typename Promise<T>::template Chained<
    lambda::function<R(const T&)>>>
Promise<T>::thenAll(const std::vector<Handlers<T, R>>& handlers) const
{
  typedef typename Chained<lambda::function<R(const T&)>>::value_type X;
  typedef Handlers<T, R> Handler;

  std::vector<Promise<X>> promises;
  promises.reserve(handlers.size());

  foreach (const Handler& handler, handlers) {
    promises.push_back(chain<X>(handler.fulfilled, handler.rejected, false));
  }

  return promises;
}


template <typename T>
template <typename R>
void Promise<T>::doneAll(const std::vector<Handlers<T, R>>& handlers) const
{
  typedef typename Chained<lambda::function<R(const T&)>>::value_type X;
  typedef Handlers<T, R> Handler;

  foreach (const Handler& handler, handlers) {
    chain<X>(handler.fulfilled, handler.rejected, true);
  }
}


template <typename T>
const T& Promise<T>::get(bool block, const Option<Duration>& timeout) const
{
  if (block) {
    wait(timeout);
  }

  std::shared_ptr<Data> target = this->target();

  State state;
  synchronized (target->lock) {
    state = target->state;
  }

  if (state == PENDING) {
    throw NotSettledError();
  }

  // Copy the outcome in so that what is returned lives as long as this
  // promise does, even once it stops following 'target'.
  if (target != data) {
    synchronized (data->lock) {
      if (data->state == PENDING) {
        data->state = state;
        data->value = target->value;
        data->reason = target->reason;
        data->followee.reset();
      }
    }
  }

  if (data->state == REJECTED) {
    std::rethrow_exception(data->reason);
  }

  return data->value.get();
}


template <typename T>
bool Promise<T>::wait(const Option<Duration>& timeout) const
{
  std::shared_ptr<Data> target = this->target();

  synchronized (target->lock) {
    if (target->state != PENDING) {
      return true;
    }
  }

  std::shared_ptr<process::Latch> latch;
  bool subscribing = false;

  synchronized (data->lock) {
    if (!data->latch) {
      data->latch.reset(new process::Latch());
      subscribing = true;
    }
    latch = data->latch;
  }

  if (subscribing) {
    subscribe(data, bridge(data, latch));
  }

  // The notification may be sitting in the queue of this very thread
  // (e.g., when waiting from within a handler).
  if (data->trace) {
    data->trace->drainQueue();
  } else if (Context::depth() > 0 || Trampoline::draining()) {
    Trampoline::drain();
  }

  synchronized (data->lock) {
    data->waiters++;
  }

  const bool settled =
    latch->await(timeout.isSome() ? timeout.get() : Seconds(-1));

  synchronized (data->lock) {
    data->waiters--;
  }

  if (!settled) {
    VLOG(2) << "Timed out waiting for promise to settle";
  }

  return settled;
}


template <typename T>
internal::Callback<T> Promise<T>::bridge(
    const std::shared_ptr<Data>& data,
    const std::shared_ptr<process::Latch>& latch)
{
  std::weak_ptr<Data> weak = data;

  // Once the end of the chain settles its outcome is copied into this
  // promise, which then no longer needs to follow anything.
  internal::Callback<T> callback;

  callback.fulfilled = [weak, latch](const T& value) {
    std::shared_ptr<Data> self = weak.lock();
    if (self) {
      synchronized (self->lock) {
        if (self->state == PENDING) {
          self->value = value;
          self->state = FULFILLED;
          self->followee.reset();
        }
      }
    }
    latch->trigger();
  };

  callback.rejected = [weak, latch](const std::exception_ptr& reason) {
    std::shared_ptr<Data> self = weak.lock();
    if (self) {
      synchronized (self->lock) {
        if (self->state == PENDING) {
          self->reason = reason;
          self->state = REJECTED;
          self->followee.reset();
        }
      }
    }
    latch->trigger();
  };

  return callback;
}


template <typename T>
bool Promise<T>::isPending() const
{
  return state() == PENDING;
}


template <typename T>
bool Promise<T>::isFulfilled() const
{
  return state() == FULFILLED;
}


template <typename T>
bool Promise<T>::isRejected() const
{
  return state() == REJECTED;
}


template <typename T>
bool Promise<T>::isWaiting() const
{
  synchronized (data->lock) {
    return data->waiters > 0;
  }

  UNREACHABLE();
}


template <typename T>
std::exception_ptr Promise<T>::reason() const
{
  std::shared_ptr<Data> target = this->target();

  synchronized (target->lock) {
    return target->reason;
  }

  UNREACHABLE();
}


template <typename T>
process::Future<T> Promise<T>::future() const
{
  std::shared_ptr<process::Promise<T>> promise(new process::Promise<T>());

  synchronized (data->lock) {
    if (data->future.isSome()) {
      return data->future.get();
    }
    data->future = promise->future();
  }

  internal::Callback<T> callback;

  callback.fulfilled = [promise](const T& value) {
    promise->set(value);
  };

  callback.rejected = [promise](const std::exception_ptr& reason) {
    promise->fail(describe(reason));
  };

  subscribe(data, std::move(callback));

  return promise->future();
}


template <typename T>
std::shared_ptr<typename Promise<T>::Data> Promise<T>::target() const
{
  std::shared_ptr<Data> target = data;

  while (true) {
    std::shared_ptr<Data> next;

    synchronized (target->lock) {
      next = target->followee;
    }

    if (!next) {
      return target;
    }

    target = next;
  }
}


template <typename T>
typename Promise<T>::State Promise<T>::state() const
{
  std::shared_ptr<Data> target = this->target();

  synchronized (target->lock) {
    return target->state;
  }

  UNREACHABLE();
}


template <typename T>
void Promise<T>::_fulfill(const T& value) const
{
  bool settled = false;
  bool subscribed = false;
  bool synchronous = false;

  synchronized (data->lock) {
    if (data->state == PENDING && !data->followee) {
      data->value = value;
      data->state = FULFILLED;
      settled = true;
      subscribed = !data->callbacks.empty();
      synchronous = data->asyncGuaranteed;
    }
  }

  if (!settled) {
    VLOG(2) << "Ignoring fulfillment of a promise that is already resolved";
    return;
  }

  if (subscribed) {
    notify(synchronous);
  }
}


template <typename T>
void Promise<T>::_reject(const std::exception_ptr& reason) const
{
  CHECK(reason) << "A promise can not be rejected without a reason";

  bool settled = false;
  bool subscribed = false;
  bool synchronous = false;
  bool unhandled = false;

  synchronized (data->lock) {
    if (data->state == PENDING && !data->followee) {
      data->reason = reason;
      data->state = REJECTED;
      settled = true;
      subscribed = !data->callbacks.empty();
      synchronous = data->asyncGuaranteed;
      unhandled = data->final && !subscribed;
    }
  }

  if (!settled) {
    VLOG(2) << "Ignoring rejection of a promise that is already resolved: "
            << describe(reason);
    return;
  }

  if (unhandled) {
    scheduler()->fatalError(reason);
  } else if (subscribed) {
    notify(synchronous);
  }
}


template <typename T>
void Promise<T>::_guaranteeAsync() const
{
  synchronized (data->lock) {
    data->asyncGuaranteed = true;
  }
}


template <typename T>
template <typename U>
void Promise<T>::_resolve(const U& value) const
{
  _resolve(value, internal::Shaped<internal::shape<T, U>::value>());
}


template <typename T>
template <typename U>
void Promise<T>::_resolve(
    const U& value,
    internal::Shaped<internal::Shape::VALUE>) const
{
  _fulfill(T(value));
}


template <typename T>
template <typename U, internal::Shape S>
void Promise<T>::_resolve(const U& value, internal::Shaped<S> shape) const
{
  adopt(convert(value, shape));
}


template <typename T>
template <typename Y>
void Promise<T>::_resolve(
    const process::Future<Y>& future,
    internal::Shaped<internal::Shape::FUTURE> shape) const
{
  cache(future, std::is_same<T, Y>());
  adopt(convert(future, shape));
}


template <typename T>
template <typename X>
void Promise<T>::_settle(const Try<X, internal::Raised>& outcome) const
{
  if (outcome.isError()) {
    _reject(outcome.error().reason);
    return;
  }

  _resolve(outcome.get());
}


template <typename T>
void Promise<T>::adopt(const Promise<T>& that) const
{
  if (that.data == data) {
    _reject(std::make_exception_ptr(SelfResolutionError()));
    return;
  }

  std::shared_ptr<Data> target = that.target();

  if (target == data) {
    _reject(std::make_exception_ptr(SelfResolutionError()));
    return;
  }

  // A settled promise never changes again, so its outcome can be read
  // once the lock has been released.
  State state;
  synchronized (target->lock) {
    state = target->state;
  }

  if (state == FULFILLED) {
    _fulfill(target->value.get());
    return;
  } else if (state == REJECTED) {
    _reject(target->reason);
    return;
  }

  bool adopted = false;
  internal::Callbacks<T> migrated;

  synchronized (data->lock) {
    if (data->state == PENDING && !data->followee) {
      migrated = std::move(data->callbacks);
      data->followee = target;
      adopted = true;
    }
  }

  if (!adopted) {
    VLOG(2) << "Ignoring resolution of a promise that is already resolved";
    return;
  }

  // The target may settle or start following another promise while
  // the subscribers move over; 'subscribe' deals with either.
  for (size_t i = 0; i < migrated.size(); i++) {
    subscribe(target, migrated.take(i));
  }
}


template <typename T>
void Promise<T>::notify(bool synchronous) const
{
  if (synchronous) {
    internal::settleInline(data);
  } else {
    scheduler()->settlePromises(data);
  }
}


template <typename T>
void Promise<T>::subscribe(
    std::shared_ptr<Data> data,
    internal::Callback<T>&& callback)
{
  while (true) {
    bool added = false;
    bool async = false;
    std::shared_ptr<Data> next;

    synchronized (data->lock) {
      if (data->followee) {
        next = data->followee;
      } else if (data->state == PENDING) {
        data->callbacks.add(std::move(callback));
        added = true;
      } else {
        async = data->asyncGuaranteed;
      }
    }

    if (added) {
      return;
    }

    if (next) {
      data = next;
      continue;
    }

    internal::Callback<T> subscriber = std::move(callback);
    scheduler()->invoke([data, subscriber, async]() {
      data->settlePromise(subscriber, async);
    });
    return;
  }
}


template <typename T>
template <typename R, typename F, typename G>
Promise<R> Promise<T>::chain(const F& f, const G& g, bool final) const
{
  CHECK((internal::present(f) || std::is_same<T, R>::value))
    << "A value can only pass through to a promise of the same type";

  Promise<R> dependent;

  if (final) {
    synchronized (dependent.data->lock) {
      dependent.data->final = true;
    }
  }

  internal::Callback<T> callback;
  callback.fulfilled = handle<T>(f, dependent);
  callback.rejected = handle<std::exception_ptr>(g, dependent);
  callback.promise.reset(new internal::Link<T, R>(dependent));

  subscribe(data, std::move(callback));

  return dependent;
}


template <typename T>
template <typename A, typename R, typename F>
lambda::function<void(const A&)> Promise<T>::handle(
    const F& f,
    const Promise<R>& dependent)
{
  if (!internal::present(f)) {
    return lambda::function<void(const A&)>();
  }

  return [f, dependent](const A& argument) mutable {
    dependent._settle(internal::attempt(f, argument));
  };
}


template <typename T>
template <typename A, typename R>
lambda::function<void(const A&)> Promise<T>::handle(
    const internal::Absent&,
    const Promise<R>&)
{
  return lambda::function<void(const A&)>();
}


template <typename T>
Promise<T> Promise<T>::convert(
    const Promise<T>& promise,
    internal::Shaped<internal::Shape::PROMISE>)
{
  return promise;
}


template <typename T>
template <typename Y>
Promise<T> Promise<T>::convert(
    const process::Future<Y>& future,
    internal::Shaped<internal::Shape::FUTURE>)
{
  Promise<T> promise;
  promise.cache(future, std::is_same<T, Y>());

  future.onAny([promise](const process::Future<Y>& future) {
    if (future.isReady()) {
      promise._resolve(future.get());
    } else if (future.isFailed()) {
      promise._reject(
          std::make_exception_ptr(FutureFailedError(future.failure())));
    } else {
      promise._reject(std::make_exception_ptr(FutureDiscardedError()));
    }
  });

  return promise;
}


template <typename T>
template <typename U>
Promise<T> Promise<T>::convert(
    const U& thenable,
    internal::Shaped<internal::Shape::DONE>)
{
  U copy = thenable;

  return Promise<T>(
      [copy](const Resolver<T>& resolve, const Rejecter& reject) mutable {
        copy.done(
            lambda::function<void(const T&)>(resolve),
            lambda::function<void(const std::exception_ptr&)>(reject));
      });
}


template <typename T>
template <typename U>
Promise<T> Promise<T>::convert(
    const U& thenable,
    internal::Shaped<internal::Shape::THEN>)
{
  U copy = thenable;

  return Promise<T>(
      [copy](const Resolver<T>& resolve, const Rejecter& reject) mutable {
        copy.then(
            lambda::function<void(const T&)>(resolve),
            lambda::function<void(const std::exception_ptr&)>(reject));
      });
}


template <typename T>
template <typename Y>
Promise<T> Promise<T>::convert(
    const Suspended<Y>& suspended,
    internal::Shaped<internal::Shape::COROUTINE>)
{
  lambda::function<Y()> computation = suspended.computation;

  // What the computation throws must not reach libprocess.
  process::Future<Try<Y, internal::Raised>> future = process::async(
      [computation]() -> Try<Y, internal::Raised> {
        try {
          return computation();
        } catch (...) {
          return internal::Raised(std::current_exception());
        }
      });

  Promise<T> promise;

  future.onAny([promise](
      const process::Future<Try<Y, internal::Raised>>& future) {
    if (future.isReady()) {
      promise._settle(future.get());
    } else if (future.isFailed()) {
      promise._reject(
          std::make_exception_ptr(FutureFailedError(future.failure())));
    } else {
      promise._reject(std::make_exception_ptr(FutureDiscardedError()));
    }
  });

  return promise;
}


template <typename T>
void Promise<T>::cache(const process::Future<T>& future, std::true_type) const
{
  synchronized (data->lock) {
    if (data->state == PENDING && !data->followee && data->future.isNone()) {
      data->future = future;
    }
  }
}

} // namespace aplus {

#endif // __APLUS_PROMISE_HPP__
