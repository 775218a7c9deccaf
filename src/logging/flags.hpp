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

#ifndef __LOGGING_FLAGS_HPP__
#define __LOGGING_FLAGS_HPP__

#include <string>

#include <stout/flags.hpp>
#include <stout/option.hpp>

namespace volbroker {
namespace internal {
namespace logging {

class Flags : public virtual flags::FlagsBase
{
public:
  Flags()
  {
    add(&Flags::quiet,
        "quiet",
        "Do not log to stderr. Log files under `--log_dir` are still\n"
        "written.",
        false);

    add(&Flags::logging_level,
        "logging_level",
        "Log message at or above this level. Possible values:\n"
        "`INFO`, `WARNING`, `ERROR`. If `--quiet` is set this only\n"
        "affects the logs written to `--log_dir`.",
        "INFO");

    add(&Flags::log_dir,
        "log_dir",
        "Directory to write log files to. Nothing is written to disk\n"
        "unless this is set. Does not affect logging to stderr.");

    add(&Flags::verbosity,
        "verbosity",
        "Verbose logging level. At 1 every recorded event and every\n"
        "skipped bind pass or reclaim sweep is logged.",
        0);

    add(&Flags::logbufsecs,
        "logbufsecs",
        "Maximum number of seconds log messages are buffered for.",
        0);
  }

  bool quiet;
  std::string logging_level;
  Option<std::string> log_dir;
  int verbosity;
  int logbufsecs;
};

} // namespace logging {
} // namespace internal {
} // namespace volbroker {

#endif // __LOGGING_FLAGS_HPP__
