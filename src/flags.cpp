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

#include "flags.hpp"


aplus::internal::Flags::Flags()
{
  add(&Flags::trampoline,
      "trampoline",
      "Whether promise notifications are queued and run one after\n"
      "another by the outermost frame of the thread that scheduled them.\n"
      "When disabled they run inline, which nests the stack once per\n"
      "promise in a chain.",
      true);

  add(&Flags::abort_on_unhandled_rejection,
      "abort_on_unhandled_rejection",
      "Whether a rejection that reaches the end of a `done` chain\n"
      "without being handled aborts the program. When disabled the\n"
      "rejection is only logged.",
      true);
}
