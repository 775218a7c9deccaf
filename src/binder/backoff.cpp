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

#include "binder/backoff.hpp"

#include <stdlib.h>

#include <algorithm>
#include <cmath>

#include <glog/logging.h>

#include <stout/os.hpp>

namespace volbroker {
namespace internal {

Option<Error> validate(const BackoffPolicy& policy)
{
  if (policy.base <= Duration::zero()) {
    return Error("The provisioning backoff must be positive");
  }

  if (policy.multiplier < 1.0) {
    return Error("The provisioning backoff multiplier must be at least 1");
  }

  if (policy.max < policy.base) {
    return Error(
        "The maximum provisioning backoff must not be less than the "
        "provisioning backoff");
  }

  if (policy.jitter < 0.0 || policy.jitter >= 1.0) {
    return Error("The provisioning backoff jitter must be in [0, 1)");
  }

  if (policy.maxAttempts == 0) {
    return Error("At least one provisioning attempt must be allowed");
  }

  return None();
}


Duration backoff(
    const BackoffPolicy& policy,
    unsigned int retry,
    const Option<Duration>& previous)
{
  CHECK_GT(retry, 0u);

  // Compute in seconds to avoid overflowing the nanosecond
  // representation for large exponents.
  const double exponential =
    policy.base.secs() * std::pow(policy.multiplier, retry - 1);

  const double random = static_cast<double>(os::random()) / RAND_MAX;

  double secs = std::min(exponential, policy.max.secs());
  secs -= secs * policy.jitter * random;

  Duration delay = Nanoseconds(static_cast<int64_t>(secs * 1e9));

  if (previous.isSome()) {
    delay = std::max(delay, std::min(previous.get(), policy.max));
  }

  return std::min(delay, policy.max);
}

} // namespace internal {
} // namespace volbroker {
