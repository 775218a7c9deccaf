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

#include "common/metrics.hpp"

#include <process/metrics/metrics.hpp>

using std::string;

namespace volbroker {
namespace internal {

Metrics::Metrics(const string& prefix)
  : claims_bound(prefix + "claims/bound"),
    claims_lost(prefix + "claims/lost"),
    claims_released(prefix + "claims/released"),
    bind_conflicts(prefix + "binder/conflicts"),
    provisioning_attempts(prefix + "provisioning/attempts"),
    provisioning_failures(prefix + "provisioning/failures"),
    provisioning_retries(prefix + "provisioning/retries"),
    volumes_reclaimed(prefix + "volumes/reclaimed"),
    volumes_retained(prefix + "volumes/retained"),
    volumes_failed(prefix + "volumes/failed")
{
  process::metrics::add(claims_bound);
  process::metrics::add(claims_lost);
  process::metrics::add(claims_released);
  process::metrics::add(bind_conflicts);
  process::metrics::add(provisioning_attempts);
  process::metrics::add(provisioning_failures);
  process::metrics::add(provisioning_retries);
  process::metrics::add(volumes_reclaimed);
  process::metrics::add(volumes_retained);
  process::metrics::add(volumes_failed);
}


Metrics::~Metrics()
{
  process::metrics::remove(claims_bound);
  process::metrics::remove(claims_lost);
  process::metrics::remove(claims_released);
  process::metrics::remove(bind_conflicts);
  process::metrics::remove(provisioning_attempts);
  process::metrics::remove(provisioning_failures);
  process::metrics::remove(provisioning_retries);
  process::metrics::remove(volumes_reclaimed);
  process::metrics::remove(volumes_retained);
  process::metrics::remove(volumes_failed);
}

} // namespace internal {
} // namespace volbroker {
