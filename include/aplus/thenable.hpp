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

#ifndef __APLUS_THENABLE_HPP__
#define __APLUS_THENABLE_HPP__

#include <exception>
#include <type_traits>
#include <utility>

#include <process/future.hpp>

#include <stout/lambda.hpp>
#include <stout/nothing.hpp>

namespace aplus {

template <typename T>
class Promise;


// A computation that has not started yet. Resolving a promise with
// one runs it on libprocess (see 'aplus::suspend').
template <typename T>
struct Suspended
{
  typedef T value_type;

  lambda::function<T()> computation;
};


namespace internal {

// The closed set of things a promise can be resolved with, in the
// order they are probed.
enum class Shape
{
  PROMISE,   // A 'Promise<T>', adopted as is.
  FUTURE,    // A 'process::Future', wrapped through 'onAny'.
  DONE,      // Anything with 'done(resolve, reject)'.
  THEN,      // Anything with 'then(resolve, reject)'.
  COROUTINE, // A 'Suspended' computation, run and then wrapped.
  VALUE,     // Anything else.
};


template <typename...>
struct voider
{
  typedef void type;
};


template <typename T>
struct is_promise : std::false_type {};

template <typename T>
struct is_promise<Promise<T>> : std::true_type {};


template <typename T>
struct is_future : std::false_type {};

template <typename T>
struct is_future<process::Future<T>> : std::true_type {};


template <typename T>
struct is_suspended : std::false_type {};

template <typename T>
struct is_suspended<Suspended<T>> : std::true_type {};


// Whether 'U' can report an outcome of type 'T' through a
// 'done(resolve, reject)' member.
template <typename T, typename U, typename = void>
struct has_done : std::false_type {};

template <typename T, typename U>
struct has_done<T, U, typename voider<decltype(
    std::declval<U&>().done(
        std::declval<lambda::function<void(const T&)>>(),
        std::declval<lambda::function<void(const std::exception_ptr&)>>()))>
  ::type> : std::true_type {};


// Same as above for a 'then(resolve, reject)' member.
template <typename T, typename U, typename = void>
struct has_then : std::false_type {};

template <typename T, typename U>
struct has_then<T, U, typename voider<decltype(
    std::declval<U&>().then(
        std::declval<lambda::function<void(const T&)>>(),
        std::declval<lambda::function<void(const std::exception_ptr&)>>()))>
  ::type> : std::true_type {};


// Picks the shape of 'U' when resolving a 'Promise<T>' with it. The
// first match wins.
template <typename T, typename U>
struct shape : std::integral_constant<Shape,
  std::is_same<U, Promise<T>>::value ? Shape::PROMISE :
  is_future<U>::value ? Shape::FUTURE :
  has_done<T, U>::value ? Shape::DONE :
  has_then<T, U>::value ? Shape::THEN :
  is_suspended<U>::value ? Shape::COROUTINE :
  Shape::VALUE> {};


template <Shape S>
using Shaped = std::integral_constant<Shape, S>;


// Thenables that advertise the type of value they produce.
template <typename X, typename = void>
struct advertises_done : std::false_type {};

template <typename X>
struct advertises_done<X, typename voider<typename X::value_type>::type>
  : has_done<typename X::value_type, X> {};


template <typename X, typename = void>
struct advertises_then : std::false_type {};

template <typename X>
struct advertises_then<X, typename voider<typename X::value_type>::type>
  : has_then<typename X::value_type, X> {};


template <typename X>
struct own_shape : std::integral_constant<Shape,
  is_promise<X>::value ? Shape::PROMISE :
  is_future<X>::value ? Shape::FUTURE :
  advertises_done<X>::value ? Shape::DONE :
  advertises_then<X>::value ? Shape::THEN :
  is_suspended<X>::value ? Shape::COROUTINE :
  Shape::VALUE> {};


template <typename X>
struct future_value;

template <typename X>
struct future_value<process::Future<X>>
{
  typedef X type;
};


// The type of value a promise ends up with when it is resolved with
// an 'X', e.g., 'int' for both 'int' and 'Promise<int>'.
template <typename X, Shape S = own_shape<X>::value>
struct unwrap
{
  typedef typename X::value_type type;
};

template <typename X>
struct unwrap<X, Shape::FUTURE>
{
  typedef typename future_value<X>::type type;
};

template <typename X>
struct unwrap<X, Shape::VALUE>
{
  typedef X type;
};


// What a handler 'F' returns when called with an 'A', with 'void'
// replaced by 'Nothing'.
template <typename F, typename A>
struct result
{
  typedef typename std::decay<
    typename std::result_of<typename std::decay<F>::type(const A&)>::type>
  ::type returned;

  typedef typename std::conditional<
    std::is_void<returned>::value,
    Nothing,
    returned>::type type;
};


// Placeholder for a handler that was not given.
struct Absent {};


template <typename F>
bool present(const F&)
{
  return true;
}


template <typename R, typename... Args>
bool present(const lambda::function<R(Args...)>& f)
{
  return static_cast<bool>(f);
}


inline bool present(const Absent&)
{
  return false;
}

} // namespace internal {


// Whether a promise of 'T' can adopt the outcome of a 'U' rather than
// being fulfilled with it.
template <typename T, typename U>
struct is_thenable : std::integral_constant<bool,
  internal::shape<T, typename std::decay<U>::type>::value !=
    internal::Shape::VALUE> {};

} // namespace aplus {

#endif // __APLUS_THENABLE_HPP__
