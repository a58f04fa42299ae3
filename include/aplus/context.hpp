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

#ifndef __APLUS_CONTEXT_HPP__
#define __APLUS_CONTEXT_HPP__

#include <stddef.h>
#include <stdint.h>

#include <atomic>
#include <memory>
#include <utility>

namespace aplus {

// A diagnostic frame on a thread local stack. A context is entered
// around running an executor and around every handler invocation. As
// long as any context is active on a thread, the tasks scheduled on
// that thread are deferred until the outermost context exits.
//
// Promises remember the context they were created in so that a thread
// about to block on one of them can first run whatever work it has
// deferred (see 'Promise::wait').
class Context
{
public:
  // Enters a new context on the calling thread and exits it, on every
  // path, when it goes out of scope.
  class Scope
  {
  public:
    Scope();
    ~Scope();

    const std::shared_ptr<Context>& context() const { return context_; }

  private:
    Scope(const Scope&) = delete;
    Scope& operator=(const Scope&) = delete;

    std::shared_ptr<Context> context_;
  };

  // Returns the innermost active context of the calling thread, or
  // nullptr if there is none.
  static std::shared_ptr<Context> current();

  // Returns the number of active contexts on the calling thread.
  static size_t depth();

  // Runs the tasks that were deferred on the calling thread.
  void drainQueue();

  uint64_t id() const { return id_; }

  // Depth of this context on its thread, starting at 1.
  size_t level() const { return level_; }

  bool exited() const { return exited_.load(); }

private:
  Context(uint64_t id, size_t level);

  const uint64_t id_;
  const size_t level_;
  std::atomic<bool> exited_;
};


namespace internal {

template <typename F>
class Safe
{
public:
  explicit Safe(const F& _f) : f(_f) {}

  template <typename... Args>
  auto operator()(Args&&... args) const
    -> decltype(std::declval<const F&>()(std::forward<Args>(args)...))
  {
    Context::Scope scope;
    return f(std::forward<Args>(args)...);
  }

private:
  F f;
};

} // namespace internal {


// Wraps 'f' so that every call to it runs inside a new context. The
// subscribers of promises settled during a call are notified once the
// call has returned, not from within it.
template <typename F>
internal::Safe<F> safe(const F& f)
{
  return internal::Safe<F>(f);
}

} // namespace aplus {

#endif // __APLUS_CONTEXT_HPP__
