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

#include <cstdlib>
#include <iostream>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

#include <glog/logging.h>

#include <process/process.hpp>

#include <stout/flags.hpp>
#include <stout/foreach.hpp>
#include <stout/nothing.hpp>
#include <stout/option.hpp>
#include <stout/stringify.hpp>
#include <stout/try.hpp>

#include <aplus/aplus.hpp>

#include "logging/flags.hpp"
#include "logging/logging.hpp"

using aplus::Promise;

using std::cerr;
using std::cout;
using std::endl;
using std::map;
using std::string;
using std::vector;


class Flags : public virtual aplus::internal::logging::Flags
{
public:
  Flags()
  {
    add(&Flags::count,
        "count",
        "Number of computations to fan out.",
        8);

    add(&Flags::fail,
        "fail",
        "Index of a computation that should fail, if any.");
  }

  int count;
  Option<int> fail;
};


// Squares 'n' on libprocess, failing for 'fail'.
static aplus::Suspended<int> square(int n, const Option<int>& fail)
{
  return aplus::suspend([n, fail]() {
    if (fail.isSome() && fail.get() == n) {
      throw std::runtime_error("Computation " + stringify(n) + " failed");
    }
    return n * n;
  });
}


int main(int argc, char** argv)
{
  Flags flags;
  Try<flags::Warnings> load = flags.load("APLUS_EXAMPLE_", argc, argv);

  if (load.isError()) {
    cerr << flags.usage(load.error()) << endl;
    return EXIT_FAILURE;
  }

  if (flags.help) {
    cout << flags.usage() << endl;
    return EXIT_SUCCESS;
  }

  if (flags.count <= 0) {
    cerr << flags.usage("Expected a positive --count") << endl;
    return EXIT_FAILURE;
  }

  Try<Nothing> initialize = aplus::internal::logging::initialize(
      argv[0], flags);

  if (initialize.isError()) {
    cerr << flags.usage(initialize.error()) << endl;
    return EXIT_FAILURE;
  }

  // Log any flag warnings (after logging is initialized).
  foreach (const flags::Warning& warning, load->warnings) {
    LOG(WARNING) << warning.message;
  }

  process::initialize();
  aplus::initialize();

  vector<Promise<int>> squares;
  map<string, Promise<int>> named;

  for (int i = 0; i < flags.count; i++) {
    squares.push_back(Promise<int>::resolve(square(i, flags.fail)));
    named.emplace("square-" + stringify(i), squares.back());
  }

  Promise<int> sum = aplus::all(squares)
    .then([](const vector<int>& values) {
      int total = 0;
      foreach (int value, values) {
        total += value;
      }
      return total;
    });

  Promise<map<string, int>> table = aplus::forDict(named);

  int status = EXIT_SUCCESS;

  try {
    foreachpair (const string& name, int value, table.get()) {
      cout << name << " = " << value << endl;
    }

    cout << "sum = " << sum.get() << endl;
  } catch (const std::exception& e) {
    LOG(ERROR) << "Pipeline failed: " << e.what();
    status = EXIT_FAILURE;
  }

  process::finalize();

  return status;
}
