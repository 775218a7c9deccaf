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

#ifndef __BINDER_BACKOFF_HPP__
#define __BINDER_BACKOFF_HPP__

#include <stout/duration.hpp>
#include <stout/error.hpp>
#include <stout/option.hpp>

#include "common/constants.hpp"

namespace volbroker {
namespace internal {

struct BackoffPolicy
{
  BackoffPolicy()
    : base(DEFAULT_PROVISION_BACKOFF),
      multiplier(DEFAULT_PROVISION_BACKOFF_MULTIPLIER),
      max(DEFAULT_PROVISION_BACKOFF_MAX),
      jitter(DEFAULT_PROVISION_BACKOFF_JITTER),
      maxAttempts(DEFAULT_MAX_PROVISION_ATTEMPTS) {}

  Duration base;
  double multiplier;
  Duration max;

  // Fraction in [0, 1) of each delay that is randomly subtracted.
  double jitter;

  unsigned int maxAttempts;
};


Option<Error> validate(const BackoffPolicy& policy);


// Returns the delay before the `retry`-th retry (starting at 1). The
// delay is never less than `previous`, so successive delays of a single
// claim do not decrease even with jitter, and never more than
// `policy.max`.
Duration backoff(
    const BackoffPolicy& policy,
    unsigned int retry,
    const Option<Duration>& previous = None());

} // namespace internal {
} // namespace volbroker {

#endif // __BINDER_BACKOFF_HPP__
