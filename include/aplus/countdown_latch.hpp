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

#ifndef __APLUS_COUNTDOWN_LATCH_HPP__
#define __APLUS_COUNTDOWN_LATCH_HPP__

#include <stddef.h>

#include <mutex>

namespace aplus {

// A counter that can only go down. Each call to 'decrement' returns
// the count it left behind, so exactly one caller observes zero even
// when many threads race to decrement.
class CountdownLatch
{
public:
  explicit CountdownLatch(size_t count);

  // Returns the remaining count after decrementing. It is a fatal
  // error to decrement a latch that has already reached zero.
  size_t decrement();

  size_t count() const;

private:
  CountdownLatch(const CountdownLatch&) = delete;
  CountdownLatch& operator=(const CountdownLatch&) = delete;

  mutable std::mutex mutex;
  size_t remaining;
};

} // namespace aplus {

#endif // __APLUS_COUNTDOWN_LATCH_HPP__
