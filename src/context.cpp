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
#include <memory>
#include <vector>

#include <glog/logging.h>

#include <aplus/context.hpp>
#include <aplus/scheduler.hpp>

using std::shared_ptr;
using std::vector;

namespace aplus {

namespace {

vector<shared_ptr<Context>>& stack()
{
  thread_local vector<shared_ptr<Context>> stack;
  return stack;
}


std::atomic<uint64_t> ids(1);

} // namespace {


Context::Context(uint64_t id, size_t level)
  : id_(id), level_(level), exited_(false) {}


Context::Scope::Scope()
{
  vector<shared_ptr<Context>>& contexts = stack();

  context_.reset(new Context(ids.fetch_add(1), contexts.size() + 1));
  contexts.push_back(context_);

  VLOG(3) << "Entered context " << context_->id()
          << " at depth " << context_->level();
}


Context::Scope::~Scope()
{
  vector<shared_ptr<Context>>& contexts = stack();

  CHECK(!contexts.empty());
  CHECK_EQ(contexts.back(), context_)
    << "Contexts must exit in the reverse order they were entered";

  contexts.pop_back();
  context_->exited_.store(true);

  VLOG(3) << "Exited context " << context_->id()
          << " at depth " << context_->level();

  // The outermost context hands what it deferred to the trampoline.
  if (contexts.empty()) {
    Trampoline::flush();
  }
}


shared_ptr<Context> Context::current()
{
  const vector<shared_ptr<Context>>& contexts = stack();

  if (contexts.empty()) {
    return nullptr;
  }

  return contexts.back();
}


size_t Context::depth()
{
  return stack().size();
}


void Context::drainQueue()
{
  VLOG(3) << "Draining deferred tasks for context " << id_;

  Trampoline::drain();
}

} // namespace aplus {
