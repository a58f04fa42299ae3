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

#include <glog/logging.h>

#include <process/once.hpp>

#include <stout/exit.hpp>
#include <stout/flags.hpp>
#include <stout/foreach.hpp>
#include <stout/try.hpp>

#include <aplus/aplus.hpp>
#include <aplus/scheduler.hpp>

#include "flags.hpp"

using process::Once;

namespace aplus {

void initialize()
{
  static Once* initialized = new Once();

  if (initialized->once()) {
    return;
  }

  internal::Flags flags;

  // Fetch and parse the aplus environment variables.
  Try<flags::Warnings> load = flags.load("APLUS_");

  if (load.isError()) {
    EXIT(EXIT_FAILURE) << flags.usage(load.error());
  }

  foreach (const flags::Warning& warning, load->warnings) {
    LOG(WARNING) << warning.message;
  }

  // The scheduler is never uninstalled, so it is never deleted.
  setScheduler(
      new Trampoline(flags.trampoline, flags.abort_on_unhandled_rejection));

  VLOG(1) << "Initialized aplus with"
          << " trampoline=" << flags.trampoline
          << " abort_on_unhandled_rejection="
          << flags.abort_on_unhandled_rejection;

  initialized->done();
}

} // namespace aplus {
