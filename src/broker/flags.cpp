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

#include "broker/flags.hpp"

#include <stout/error.hpp>
#include <stout/stringify.hpp>

#include "common/constants.hpp"

namespace volbroker {
namespace internal {
namespace broker {

Flags::Flags()
{
  add(&Flags::ip,
      "ip",
      "IP address to listen on. This cannot be used in conjunction\n"
      "with `LIBPROCESS_IP`.");

  add(&Flags::port,
      "port",
      "Port to listen on.",
      DEFAULT_PORT);

  add(&Flags::work_dir,
      "work_dir",
      "Directory where the claim store is checkpointed. Claims and volumes\n"
      "are recovered from it on restart. If not set, nothing is persisted.\n"
      "(Example: `/var/lib/volbroker`)");

  add(&Flags::catalog,
      "catalog",
      "Path of a JSON file with the storage classes to register on\n"
      "startup, e.g.\n"
      "{\n"
      "  \"classes\": [\n"
      "    {\n"
      "      \"name\": \"fast-block\",\n"
      "      \"kind\": \"BLOCK\",\n"
      "      \"reclaimPolicy\": \"DELETE\",\n"
      "      \"bindingMode\": \"IMMEDIATE\",\n"
      "      \"parameters\": { \"granularity\": \"12GB\" }\n"
      "    }\n"
      "  ]\n"
      "}");

  add(&Flags::binder_workers,
      "binder_workers",
      "Number of actors binding claims in parallel. Operations on a\n"
      "single claim are always serialized.",
      DEFAULT_BINDER_WORKERS,
      [](size_t value) -> Option<Error> {
        if (value == 0) {
          return Error("Expected `--binder_workers` to be positive");
        }
        return None();
      });

  add(&Flags::provision_backoff,
      "provision_backoff",
      "Delay before the first retry of a provisioning call that failed\n"
      "because the backend was unavailable. Later retries back off\n"
      "exponentially, see `--provision_backoff_multiplier`.",
      DEFAULT_PROVISION_BACKOFF);

  add(&Flags::provision_backoff_multiplier,
      "provision_backoff_multiplier",
      "Factor by which the provisioning retry delay grows per retry.",
      DEFAULT_PROVISION_BACKOFF_MULTIPLIER);

  add(&Flags::provision_backoff_max,
      "provision_backoff_max",
      "Upper bound of the provisioning retry delay.",
      DEFAULT_PROVISION_BACKOFF_MAX);

  add(&Flags::provision_backoff_jitter,
      "provision_backoff_jitter",
      "Fraction in [0, 1) of each provisioning retry delay that is\n"
      "randomly subtracted from it.",
      DEFAULT_PROVISION_BACKOFF_JITTER);

  add(&Flags::max_provision_attempts,
      "max_provision_attempts",
      "Number of failed provisioning attempts after which a claim\n"
      "is marked lost.",
      DEFAULT_MAX_PROVISION_ATTEMPTS);

  add(&Flags::bind_interval,
      "bind_interval",
      "Interval at which every pending claim is retried, e.g. after\n"
      "capacity was freed. A zero interval disables the periodic pass.",
      DEFAULT_BIND_INTERVAL);

  add(&Flags::reclaim_interval,
      "reclaim_interval",
      "Interval at which released volumes are reclaimed according to the\n"
      "reclaim policy of their storage class. A zero interval disables\n"
      "the periodic sweep.",
      DEFAULT_RECLAIM_INTERVAL);

  add(&Flags::block_capacity,
      "block_capacity",
      "Capacity of the built-in block storage pool. Zero disables it.",
      DEFAULT_BLOCK_CAPACITY);

  add(&Flags::filesystem_capacity,
      "filesystem_capacity",
      "Capacity of the built-in filesystem storage pool. Zero disables it.",
      DEFAULT_FILESYSTEM_CAPACITY);

  add(&Flags::object_capacity,
      "object_capacity",
      "Capacity of the built-in object storage pool. Zero disables it.",
      DEFAULT_OBJECT_CAPACITY);

  add(&Flags::ephemeral_capacity,
      "ephemeral_capacity",
      "Capacity of the built-in ephemeral storage pool. Zero disables it.",
      DEFAULT_EPHEMERAL_CAPACITY);

  add(&Flags::max_events,
      "max_events",
      "Maximum number of binding events kept for the `/events` endpoint.",
      DEFAULT_MAX_EVENTS);

  add(&Flags::max_attempts_per_claim,
      "max_attempts_per_claim",
      "Maximum number of failed provisioning attempts kept in the history\n"
      "of a claim. Older attempts are dropped first.",
      DEFAULT_MAX_ATTEMPTS_PER_CLAIM);
}

} // namespace broker {
} // namespace internal {
} // namespace volbroker {
