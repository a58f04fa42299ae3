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

#include <stout/duration.hpp>

#include "tests/flags.hpp"

namespace aplus {
namespace internal {
namespace tests {

// Storage for the flags.
Flags flags;


Flags::Flags()
{
  // We log to stderr by default, but when running tests we'd prefer
  // less junk to fly by, so force one to specify the verbosity.
  add(&Flags::verbose,
      "verbose",
      "Log all severity levels to stderr",
      false);

  add(&Flags::await_timeout,
      "await_timeout",
      "The default timeout for awaiting a promise or a future\n"
      "in an AWAIT_* assertion",
      Seconds(15));
}

} // namespace tests {
} // namespace internal {
} // namespace aplus {
