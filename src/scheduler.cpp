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
#include <deque>
#include <memory>

#include <glog/logging.h>

#include <stout/lambda.hpp>

#include <aplus/context.hpp>
#include <aplus/errors.hpp>
#include <aplus/scheduler.hpp>

using std::deque;
using std::shared_ptr;

namespace aplus {

namespace {

// Tasks deferred on a thread. Only ever touched by its own thread.
struct Queue
{
  deque<lambda::function<void()>> tasks;
  bool draining = false;
};


Queue& queue()
{
  thread_local Queue queue;
  return queue;
}


// Promises being notified inline on a thread, see
// 'internal::settleInline'.
struct Inline
{
  deque<shared_ptr<internal::Settleable>> promises;
  bool settling = false;
};


Inline& inlined()
{
  thread_local Inline inlined;
  return inlined;
}


// Sets a flag for as long as it is in scope and then puts back the
// value it had, also when a task throws.
class Raise
{
public:
  explicit Raise(bool* _flag) : flag(_flag), previous(*_flag)
  {
    *flag = true;
  }

  ~Raise()
  {
    *flag = previous;
  }

private:
  bool* flag;
  const bool previous;
};


std::atomic<Scheduler*> installed(nullptr);


Scheduler* trampoline()
{
  static Scheduler* trampoline = new Trampoline();
  return trampoline;
}

} // namespace {


Trampoline::Trampoline(bool _enabled, bool _abortOnUnhandledRejection)
  : enabled(_enabled),
    abortOnUnhandledRejection(_abortOnUnhandledRejection) {}


void Trampoline::invoke(const lambda::function<void()>& task)
{
  if (!enabled) {
    task();
    return;
  }

  Queue& local = queue();
  local.tasks.push_back(task);

  // Anything further up the stack (a running task, or the exit of the
  // outermost context) will get to this task; otherwise run it now.
  if (!local.draining && Context::depth() == 0) {
    drain();
  }
}


void Trampoline::settlePromises(
    const shared_ptr<internal::Settleable>& promise)
{
  invoke([promise]() { promise->settlePromises(); });
}


void Trampoline::fatalError(const std::exception_ptr& reason)
{
  if (abortOnUnhandledRejection) {
    LOG(FATAL) << "Unhandled rejection: " << describe(reason);
  } else {
    LOG(ERROR) << "Unhandled rejection: " << describe(reason);
  }
}


void Trampoline::drain()
{
  Queue& local = queue();

  Raise draining(&local.draining);

  VLOG(3) << "Draining " << local.tasks.size() << " queued task(s)";

  // A task that throws leaves the rest of the queue for the next drain.
  while (!local.tasks.empty()) {
    lambda::function<void()> task = std::move(local.tasks.front());
    local.tasks.pop_front();
    task();
  }
}


void Trampoline::flush()
{
  if (!queue().draining) {
    drain();
  }
}


bool Trampoline::draining()
{
  return queue().draining;
}


size_t Trampoline::pending()
{
  return queue().tasks.size();
}


Scheduler* scheduler()
{
  Scheduler* scheduler = installed.load();
  return scheduler != nullptr ? scheduler : trampoline();
}


void setScheduler(Scheduler* scheduler)
{
  installed.store(scheduler);
}


namespace internal {

void settleInline(const shared_ptr<Settleable>& promise)
{
  Inline& local = inlined();
  local.promises.push_back(promise);

  if (local.settling) {
    return;
  }

  Raise settling(&local.settling);

  while (!local.promises.empty()) {
    shared_ptr<Settleable> next = std::move(local.promises.front());
    local.promises.pop_front();
    next->settlePromises();
  }
}

} // namespace internal {

} // namespace aplus {
