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

#ifndef __BROKER_FLAGS_HPP__
#define __BROKER_FLAGS_HPP__

#include <stdint.h>

#include <string>

#include <stout/bytes.hpp>
#include <stout/duration.hpp>
#include <stout/option.hpp>
#include <stout/path.hpp>

#include "logging/flags.hpp"

namespace volbroker {
namespace internal {
namespace broker {

class Flags : public virtual logging::Flags
{
public:
  Flags();

  Option<std::string> ip;
  uint16_t port;

  Option<std::string> work_dir;
  Option<Path> catalog;

  size_t binder_workers;
  Duration provision_backoff;
  double provision_backoff_multiplier;
  Duration provision_backoff_max;
  double provision_backoff_jitter;
  unsigned int max_provision_attempts;

  Duration bind_interval;
  Duration reclaim_interval;

  Bytes block_capacity;
  Bytes filesystem_capacity;
  Bytes object_capacity;
  Bytes ephemeral_capacity;

  size_t max_events;
  size_t max_attempts_per_claim;
};

} // namespace broker {
} // namespace internal {
} // namespace volbroker {

#endif // __BROKER_FLAGS_HPP__
