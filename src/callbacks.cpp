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

#include <memory>
#include <utility>
#include <vector>

#include <aplus/callbacks.hpp>

using std::shared_ptr;
using std::vector;

namespace aplus {
namespace internal {

namespace {

// What the outermost 'retire' on a thread still has to drop. Points
// into that call's frame, and is null outside of it.
thread_local vector<shared_ptr<void>>* retired = nullptr;


class Retiring
{
public:
  explicit Retiring(vector<shared_ptr<void>>* pending)
  {
    retired = pending;
  }

  ~Retiring()
  {
    retired = nullptr;
  }
};

} // namespace {


void retire(shared_ptr<void> garbage)
{
  if (retired != nullptr) {
    retired->push_back(std::move(garbage));
    return;
  }

  vector<shared_ptr<void>> pending;
  pending.push_back(std::move(garbage));

  Retiring retiring(&pending);

  while (!pending.empty()) {
    shared_ptr<void> next = std::move(pending.back());
    pending.pop_back();
    next.reset();
  }
}

} // namespace internal {
} // namespace aplus {
