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

#ifndef __APLUS_INTEROP_HPP__
#define __APLUS_INTEROP_HPP__

#include <type_traits>

#include <process/future.hpp>

#include <aplus/promise.hpp>
#include <aplus/thenable.hpp>

namespace aplus {

// Returns a promise that settles with 'future': fulfilled with its
// value, or rejected with 'FutureFailedError' or
// 'FutureDiscardedError'.
template <typename T>
Promise<T> wrap(const process::Future<T>& future)
{
  return Promise<T>::resolve(future);
}


// Defers 'f' until a promise is resolved with the result; 'f' then
// runs asynchronously on libprocess.
//
//   Promise<int> answer = Promise<int>::resolve(suspend([]() {
//     return 42;
//   }));
template <typename F>
Suspended<typename std::decay<typename std::result_of<F()>::type>::type>
suspend(const F& f)
{
  typedef typename std::decay<typename std::result_of<F()>::type>::type T;

  Suspended<T> suspended;
  suspended.computation = f;
  return suspended;
}


// Returns a libprocess future for 'promise' so that it can be used
// wherever libprocess expects one (e.g., 'process::await').
template <typename T>
process::Future<T> await(const Promise<T>& promise)
{
  return promise.future();
}

} // namespace aplus {

#endif // __APLUS_INTEROP_HPP__
