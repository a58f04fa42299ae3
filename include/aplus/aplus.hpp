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

#ifndef __APLUS_APLUS_HPP__
#define __APLUS_APLUS_HPP__

#include <aplus/collect.hpp>
#include <aplus/context.hpp>
#include <aplus/errors.hpp>
#include <aplus/interop.hpp>
#include <aplus/promise.hpp>
#include <aplus/scheduler.hpp>
#include <aplus/thenable.hpp>

namespace aplus {

// Configures the library from the environment (see 'APLUS_*' flags)
// and installs the default scheduler. Only the first call has any
// effect; later calls return right away.
void initialize();

} // namespace aplus {

#endif // __APLUS_APLUS_HPP__
