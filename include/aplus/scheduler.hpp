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

#ifndef __APLUS_SCHEDULER_HPP__
#define __APLUS_SCHEDULER_HPP__

#include <exception>
#include <memory>

#include <stout/lambda.hpp>

namespace aplus {

namespace internal {

// The part of a promise the scheduler needs: a way to notify its
// subscribers once it has settled.
class Settleable
{
public:
  virtual ~Settleable() {}

  virtual void settlePromises() = 0;
};

} // namespace internal {


// Decouples settling a promise from notifying its subscribers. Every
// notification goes through a scheduler so that chains of promises
// never recurse through the stack of the thread that settled them.
class Scheduler
{
public:
  virtual ~Scheduler() {}

  // Schedules a task for deferred execution.
  virtual void invoke(const lambda::function<void()>& task) = 0;

  // Schedules the notification of the subscribers of a promise that
  // has just settled.
  virtual void settlePromises(
      const std::shared_ptr<internal::Settleable>& promise) = 0;

  // Reports a rejection that reached a terminal promise (see
  // 'Promise::done') which has no way of handling it.
  virtual void fatalError(const std::exception_ptr& reason) = 0;
};


// The default scheduler. Tasks are queued on the thread that
// schedules them and run in FIFO order by the outermost frame of that
// thread: either right away, or, while a task is already running or a
// 'Context' is active, once that task finishes or the outermost
// context exits.
class Trampoline : public Scheduler
{
public:
  explicit Trampoline(
      bool enabled = true,
      bool abortOnUnhandledRejection = true);

  ~Trampoline() override {}

  void invoke(const lambda::function<void()>& task) override;

  void settlePromises(
      const std::shared_ptr<internal::Settleable>& promise) override;

  void fatalError(const std::exception_ptr& reason) override;

  // Runs every task queued on the calling thread, including the ones
  // queued while draining. Safe to call while already draining.
  static void drain();

  // Runs the queued tasks of the calling thread unless it is already
  // draining them further up the stack.
  static void flush();

  // Returns true if the calling thread is running queued tasks.
  static bool draining();

  // Number of tasks queued on the calling thread.
  static size_t pending();

private:
  // When disabled every task runs inline as soon as it is invoked.
  const bool enabled;
  const bool abortOnUnhandledRejection;
};


// Returns the scheduler used by all promises; never null.
Scheduler* scheduler();


// Replaces the scheduler used by all promises. Passing nullptr
// restores the default 'Trampoline'. The scheduler is not owned and
// must outlive its use.
void setScheduler(Scheduler* scheduler);


namespace internal {

// Notifies the subscribers of 'promise' on the calling thread, for a
// promise that is already being settled from within the scheduler.
// Notifications started while one is running are queued and run by
// the outermost call, one after the other.
void settleInline(const std::shared_ptr<Settleable>& promise);

} // namespace internal {

} // namespace aplus {

#endif // __APLUS_SCHEDULER_HPP__
