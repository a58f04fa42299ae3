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

#ifndef __APLUS_ERRORS_HPP__
#define __APLUS_ERRORS_HPP__

#include <exception>
#include <stdexcept>
#include <string>

#include <stout/error.hpp>

namespace aplus {

// Reason of a promise that was resolved with itself, either directly
// or through a chain of promises that leads back to it.
class SelfResolutionError : public std::logic_error
{
public:
  SelfResolutionError() : std::logic_error("Promise is self") {}
};


// Thrown by 'Promise::get' when the promise has not settled (e.g.,
// because waiting for it timed out).
class NotSettledError : public std::runtime_error
{
public:
  NotSettledError() : std::runtime_error("Promise is not settled yet") {}
};


// Reason of a promise adopted from a 'process::Future' that failed.
class FutureFailedError : public std::runtime_error
{
public:
  explicit FutureFailedError(const std::string& failure)
    : std::runtime_error(failure) {}
};


// Reason of a promise adopted from a 'process::Future' that was
// discarded before it completed.
class FutureDiscardedError : public std::runtime_error
{
public:
  FutureDiscardedError() : std::runtime_error("Future was discarded") {}
};


// Returns a human readable description of a rejection reason.
std::string describe(const std::exception_ptr& reason);


namespace internal {

// The failure half of the outcome of running a handler: carries
// whatever the handler threw.
class Raised : public Error
{
public:
  explicit Raised(const std::exception_ptr& _reason)
    : Error(describe(_reason)), reason(_reason) {}

  std::exception_ptr reason;
};

} // namespace internal {
} // namespace aplus {

#endif // __APLUS_ERRORS_HPP__
