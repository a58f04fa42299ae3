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

#ifndef __APLUS_COLLECT_HPP__
#define __APLUS_COLLECT_HPP__

#include <exception>
#include <map>
#include <memory>
#include <vector>

#include <stout/foreach.hpp>
#include <stout/hashmap.hpp>
#include <stout/option.hpp>

#include <aplus/countdown_latch.hpp>
#include <aplus/promise.hpp>
#include <aplus/thenable.hpp>

namespace aplus {

// Waits on each input and returns a promise that is fulfilled with
// the values of all of them, in input order, or rejected with the
// reason of the first one to be rejected. Inputs may be promises,
// futures, other thenables or plain values.
template <typename U>
Promise<std::vector<typename internal::unwrap<U>::type>> all(
    const std::vector<U>& inputs)
{
  typedef typename internal::unwrap<U>::type T;

  if (inputs.empty()) {
    return Promise<std::vector<T>>::resolve(std::vector<T>());
  }

  return Promise<std::vector<T>>(
      [inputs](
          const Resolver<std::vector<T>>& resolve,
          const Rejecter& reject) {
        std::shared_ptr<CountdownLatch> latch(
            new CountdownLatch(inputs.size()));

        std::shared_ptr<std::vector<Option<T>>> values(
            new std::vector<Option<T>>(inputs.size()));

        for (size_t i = 0; i < inputs.size(); i++) {
          Promise<T>::resolve(inputs[i]).done(
              [=](const T& value) {
                (*values)[i] = value;

                if (latch->decrement() == 0) {
                  std::vector<T> result;
                  result.reserve(values->size());

                  foreach (const Option<T>& slot, *values) {
                    result.push_back(slot.get());
                  }

                  resolve(result);
                }
              },
              [=](const std::exception_ptr& reason) {
                reject(reason);
              });
        }
      });
}


// Like 'all' but keyed: returns a promise that is fulfilled with a map
// from each key to the value of its input.
template <typename K, typename U>
Promise<std::map<K, typename internal::unwrap<U>::type>> forDict(
    const std::map<K, U>& inputs)
{
  typedef typename internal::unwrap<U>::type T;

  if (inputs.empty()) {
    return Promise<std::map<K, T>>::resolve(std::map<K, T>());
  }

  std::vector<K> keys;
  std::vector<U> values;

  foreachpair (const K& key, const U& value, inputs) {
    keys.push_back(key);
    values.push_back(value);
  }

  return all(values).then([keys](const std::vector<T>& collected) {
    std::map<K, T> result;
    for (size_t i = 0; i < keys.size(); i++) {
      result.emplace(keys[i], collected[i]);
    }
    return result;
  });
}


template <typename K, typename U>
Promise<hashmap<K, typename internal::unwrap<U>::type>> forDict(
    const hashmap<K, U>& inputs)
{
  typedef typename internal::unwrap<U>::type T;

  if (inputs.empty()) {
    return Promise<hashmap<K, T>>::resolve(hashmap<K, T>());
  }

  std::vector<K> keys;
  std::vector<U> values;

  foreachpair (const K& key, const U& value, inputs) {
    keys.push_back(key);
    values.push_back(value);
  }

  return all(values).then([keys](const std::vector<T>& collected) {
    hashmap<K, T> result;
    for (size_t i = 0; i < keys.size(); i++) {
      result.put(keys[i], collected[i]);
    }
    return result;
  });
}

} // namespace aplus {

#endif // __APLUS_COLLECT_HPP__
