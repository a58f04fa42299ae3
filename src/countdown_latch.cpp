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

#include <glog/logging.h>

#include <stout/synchronized.hpp>
#include <stout/unreachable.hpp>

#include <aplus/countdown_latch.hpp>

namespace aplus {

CountdownLatch::CountdownLatch(size_t count) : remaining(count) {}


size_t CountdownLatch::decrement()
{
  synchronized (mutex) {
    CHECK_GT(remaining, 0u) << "Countdown latch decremented past zero";

    // Return while still holding the lock, otherwise another thread
    // could decrement again before we read the count.
    return --remaining;
  }

  UNREACHABLE();
}


size_t CountdownLatch::count() const
{
  synchronized (mutex) {
    return remaining;
  }

  UNREACHABLE();
}

} // namespace aplus {
