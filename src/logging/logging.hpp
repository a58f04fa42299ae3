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

#ifndef __APLUS_LOGGING_LOGGING_HPP__
#define __APLUS_LOGGING_LOGGING_HPP__

#include <string>

#include <glog/logging.h> // Includes LOG(*), PLOG(*), CHECK, etc.

#include <stout/nothing.hpp>
#include <stout/try.hpp>

#include "logging/flags.hpp"

namespace aplus {
namespace internal {
namespace logging {

// Sets up glog for the program 'argv0' as described by 'flags'. Only
// the first call with valid flags has an effect.
Try<Nothing> initialize(
    const std::string& argv0,
    const Flags& flags,
    bool installFailureSignalHandler = false);


// Parses one of `INFO`, `WARNING` or `ERROR`.
Try<google::LogSeverity> parseSeverity(const std::string& level);

} // namespace logging {
} // namespace internal {
} // namespace aplus {

#endif // __APLUS_LOGGING_LOGGING_HPP__
