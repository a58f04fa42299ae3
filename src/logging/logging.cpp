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

#include <string>

#include <glog/logging.h>

#include <process/once.hpp>

#include <stout/error.hpp>
#include <stout/nothing.hpp>
#include <stout/os.hpp>
#include <stout/try.hpp>

#include "logging/logging.hpp"

using process::Once;

using std::string;

namespace aplus {
namespace internal {
namespace logging {

namespace {

// glog keeps the pointer it is initialized with.
string* program = nullptr;

} // namespace {


Try<google::LogSeverity> parseSeverity(const string& level)
{
  if (level == "INFO") {
    return google::INFO;
  } else if (level == "WARNING") {
    return google::WARNING;
  } else if (level == "ERROR") {
    return google::ERROR;
  }

  return Error(
      "'" + level + "' is not a valid logging level;"
      " expected one of 'INFO', 'WARNING' or 'ERROR'");
}


Try<Nothing> initialize(
    const string& argv0,
    const Flags& flags,
    bool installFailureSignalHandler)
{
  Try<google::LogSeverity> severity = parseSeverity(flags.logging_level);
  if (severity.isError()) {
    return Error(severity.error());
  }

  if (flags.log_dir.isSome()) {
    Try<Nothing> mkdir = os::mkdir(flags.log_dir.get());
    if (mkdir.isError()) {
      return Error(
          "Failed to create log directory '" + flags.log_dir.get() +
          "': " + mkdir.error());
    }
  }

  static Once* initialized = new Once();

  if (initialized->once()) {
    return Nothing();
  }

  if (flags.log_dir.isSome()) {
    FLAGS_log_dir = flags.log_dir.get();
  }

  FLAGS_logtostderr = flags.log_dir.isNone();
  FLAGS_logbufsecs = 0;
  FLAGS_v = flags.verbosity;

  // Quiet keeps only fatal messages (e.g., an unhandled rejection) on
  // stderr; log files still get everything from 'severity' up.
  FLAGS_minloglevel = severity.get();
  FLAGS_stderrthreshold = flags.quiet ? google::FATAL : severity.get();

  if (flags.quiet && FLAGS_logtostderr) {
    FLAGS_minloglevel = google::FATAL;
  }

  program = new string(argv0);
  google::InitGoogleLogging(program->c_str());

  if (installFailureSignalHandler) {
    google::InstallFailureSignalHandler();
  }

  VLOG(1) << "Logging to "
          << (flags.log_dir.isSome() ? flags.log_dir.get() : "stderr")
          << " with promise tracing at verbosity " << flags.verbosity;

  initialized->done();

  return Nothing();
}

} // namespace logging {
} // namespace internal {
} // namespace aplus {
