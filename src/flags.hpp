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

#ifndef __APLUS_FLAGS_HPP__
#define __APLUS_FLAGS_HPP__

#include <stout/flags.hpp>

namespace aplus {
namespace internal {

// Library configuration, loaded from the environment with the prefix
// "APLUS_" (e.g., APLUS_TRAMPOLINE=false).
class Flags : public virtual flags::FlagsBase
{
public:
  Flags();

  bool trampoline;
  bool abort_on_unhandled_rejection;
};

} // namespace internal {
} // namespace aplus {

#endif // __APLUS_FLAGS_HPP__
