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

#include "tests/volbroker.hpp"

#include <stout/check.hpp>
#include <stout/duration.hpp>
#include <stout/foreach.hpp>
#include <stout/path.hpp>

#include "common/access_modes.hpp"

using std::string;
using std::vector;

using process::Owned;

namespace volbroker {
namespace internal {
namespace tests {

broker::Flags VolbrokerTest::CreateBrokerFlags()
{
  broker::Flags flags;

  CHECK_SOME(sandbox);
  flags.work_dir = path::join(sandbox.get(), "work_dir");

  flags.binder_workers = 4;

  flags.provision_backoff = Milliseconds(10);
  flags.provision_backoff_max = Milliseconds(100);
  flags.provision_backoff_multiplier = 2.0;
  flags.provision_backoff_jitter = 0.0;
  flags.max_provision_attempts = 3;

  flags.bind_interval = Duration::zero();
  flags.reclaim_interval = Duration::zero();

  return flags;
}


Try<Owned<Broker>> VolbrokerTest::StartBroker(
    const Option<broker::Flags>& flags)
{
  return Broker::create(flags.isNone() ? CreateBrokerFlags() : flags.get());
}


Try<Owned<Broker>> VolbrokerTest::StartBroker(
    const Owned<Backends>& backends,
    const Option<broker::Flags>& flags)
{
  return Broker::create(
      flags.isNone() ? CreateBrokerFlags() : flags.get(),
      backends);
}


StorageClass createStorageClass(
    const string& name,
    StorageClass::Kind kind,
    StorageClass::ReclaimPolicy reclaimPolicy,
    StorageClass::BindingMode bindingMode)
{
  StorageClass storageClass;
  storageClass.set_name(name);
  storageClass.set_kind(kind);
  storageClass.set_reclaim_policy(reclaimPolicy);
  storageClass.set_binding_mode(bindingMode);

  return storageClass;
}


Volume createVolume(
    const string& id,
    const string& storageClass,
    const Bytes& capacity,
    const AccessModes& accessModes)
{
  Volume volume;
  volume.set_id(id);
  volume.set_storage_class(storageClass);
  volume.set_capacity_bytes(capacity.bytes());
  volume.set_state(Volume::AVAILABLE);
  setAccessModes(accessModes, volume.mutable_access_modes());

  return volume;
}


Claim createClaim(
    const string& id,
    const Bytes& capacity,
    const AccessModes& accessModes,
    const Option<string>& storageClass)
{
  Claim claim;
  claim.set_id(id);
  claim.set_capacity_bytes(capacity.bytes());
  claim.set_state(Claim::PENDING);
  setAccessModes(accessModes, claim.mutable_access_modes());

  if (storageClass.isSome()) {
    claim.set_storage_class(storageClass.get());
  }

  return claim;
}


ClaimRequest createClaimRequest(
    const Bytes& capacity,
    const AccessModes& accessModes,
    const Option<string>& storageClass,
    const Option<string>& consumer)
{
  ClaimRequest request;
  request.capacity = capacity;
  request.accessModes = accessModes;
  request.storageClass = storageClass;
  request.consumer = consumer;

  return request;
}


vector<Event::Type> types(const vector<Event>& events)
{
  vector<Event::Type> result;
  foreach (const Event& event, events) {
    result.push_back(event.type());
  }

  return result;
}

} // namespace tests {
} // namespace internal {
} // namespace volbroker {
