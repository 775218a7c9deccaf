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

#include <signal.h> // For sigaction(), sigemptyset().

#include <glog/logging.h>
#include <glog/raw_logging.h>

#include <iostream>
#include <string>

#include <process/once.hpp>

#include <stout/error.hpp>
#include <stout/foreach.hpp>
#include <stout/os.hpp>
#include <stout/try.hpp>

#include <stout/os/signals.hpp>

#include "logging/logging.hpp"

using process::Once;

using std::cerr;
using std::endl;
using std::string;

namespace volbroker {
namespace internal {
namespace logging {

// glog keeps the pointer passed to `InitGoogleLogging`.
static string programName;


struct Level
{
  const char* name;
  google::LogSeverity severity;
};


static const Level LEVELS[] = {
  {"INFO", google::INFO},
  {"WARNING", google::WARNING},
  {"ERROR", google::ERROR},
};


// Stopping the daemon is not a crash, so SIGTERM bypasses glog's
// failure handler. Only async-signal-safe RAW_LOG is used here.
static void terminate(int signal, siginfo_t* siginfo, void* context)
{
  if (signal != SIGTERM) {
    RAW_LOG(FATAL, "Unexpected signal %d in the SIGTERM handler", signal);
  }

  if (siginfo->si_code == SI_USER || siginfo->si_code <= 0) {
    RAW_LOG(WARNING, "Stopping volbroker on SIGTERM sent by process %d",
            siginfo->si_pid);
  } else {
    RAW_LOG(WARNING, "Stopping volbroker on SIGTERM");
  }

  os::signals::reset(signal);
  raise(signal);
}


Try<google::LogSeverity> getLogSeverity(const string& logging_level)
{
  foreach (const Level& level, LEVELS) {
    if (logging_level == level.name) {
      return level.severity;
    }
  }

  return Error(
      "Unknown logging level '" + logging_level + "'; `--logging_level` "
      "must be one of 'INFO', 'WARNING' or 'ERROR'");
}


void initialize(
    const string& argv0,
    const Flags& flags,
    bool installFailureSignalHandler)
{
  static Once* initialized = new Once();

  if (initialized->once()) {
    return;
  }

  Try<google::LogSeverity> severity = getLogSeverity(flags.logging_level);
  if (severity.isError()) {
    cerr << severity.error() << endl;
    exit(EXIT_FAILURE);
  }

  if (flags.verbosity < 0) {
    cerr << "`--verbosity` must not be negative" << endl;
    exit(EXIT_FAILURE);
  }

  FLAGS_minloglevel = severity.get();
  FLAGS_v = flags.verbosity;
  FLAGS_logbufsecs = flags.logbufsecs;

  FLAGS_logtostderr = flags.log_dir.isNone();

  if (flags.log_dir.isSome()) {
    Try<Nothing> mkdir = os::mkdir(flags.log_dir.get());
    if (mkdir.isError()) {
      cerr << "Failed to create log directory '" << flags.log_dir.get()
           << "': " << mkdir.error() << endl;
      exit(EXIT_FAILURE);
    }

    FLAGS_log_dir = flags.log_dir.get();
  }

  if (!flags.quiet) {
    FLAGS_stderrthreshold = FLAGS_minloglevel;
  } else if (FLAGS_logtostderr) {
    // With stderr as the only sink the threshold has no effect.
    FLAGS_minloglevel = google::FATAL;
  } else {
    FLAGS_stderrthreshold = google::FATAL;
  }

  programName = argv0;
  google::InitGoogleLogging(programName.c_str());

  // Log files are created on the first message.
  if (flags.log_dir.isSome()) {
    LOG_AT_LEVEL(FLAGS_minloglevel)
      << "Logging at " << google::GetLogSeverityName(FLAGS_minloglevel)
      << " with verbosity " << FLAGS_v << " to " << flags.log_dir.get();
  }

  if (installFailureSignalHandler) {
    google::InstallFailureSignalHandler();

    struct sigaction action;
    action.sa_sigaction = terminate;
    sigemptyset(&action.sa_mask);
    action.sa_flags = SA_SIGINFO;

    if (sigaction(SIGTERM, &action, nullptr) < 0) {
      PLOG(FATAL) << "Failed to install the SIGTERM handler";
    }
  }

  initialized->done();
}

} // namespace logging {
} // namespace internal {
} // namespace volbroker {
