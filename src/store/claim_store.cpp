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

#include "store/claim_store.hpp"

#include <atomic>

#include <glog/logging.h>

#include <process/clock.hpp>

#include <stout/check.hpp>
#include <stout/foreach.hpp>
#include <stout/path.hpp>
#include <stout/protobuf.hpp>
#include <stout/stringify.hpp>
#include <stout/synchronized.hpp>
#include <stout/unreachable.hpp>

#include <stout/os/exists.hpp>
#include <stout/os/mkdir.hpp>
#include <stout/os/mktemp.hpp>
#include <stout/os/rename.hpp>
#include <stout/os/rm.hpp>

#include "common/access_modes.hpp"

#include "store/paths.hpp"

using std::shared_ptr;
using std::string;
using std::vector;

using process::Clock;

namespace volbroker {
namespace internal {

// Writes the message to a temporary file first and then renames it to
// `path`, so a checkpoint is either entirely present or absent.
static Try<Nothing> checkpoint(const string& path, const State& state)
{
  string base = Path(path).dirname();

  Try<Nothing> mkdir = os::mkdir(base);
  if (mkdir.isError()) {
    return Error("Failed to create directory '" + base + "': " + mkdir.error());
  }

  // NOTE: We create the temporary file at 'base/XXXXXX' to make sure
  // rename below does not cross devices.
  Try<string> temp = os::mktemp(path::join(base, "XXXXXX"));
  if (temp.isError()) {
    return Error("Failed to create temporary file: " + temp.error());
  }

  Try<Nothing> write = ::protobuf::write(temp.get(), state);
  if (write.isError()) {
    // Try removing the temporary file on error.
    os::rm(temp.get());

    return Error(
        "Failed to write temporary file '" + temp.get() + "': " +
        write.error());
  }

  Try<Nothing> rename = os::rename(temp.get(), path);
  if (rename.isError()) {
    // Try removing the temporary file on error.
    os::rm(temp.get());

    return Error(
        "Failed to rename '" + temp.get() + "' to '" + path + "': " +
        rename.error());
  }

  return Nothing();
}


static BrokerError claimNotFound(const string& claimId)
{
  return BrokerError(
      BrokerError::CLAIM_NOT_FOUND,
      "Unknown claim '" + claimId + "'");
}


static BrokerError volumeNotFound(const string& volumeId)
{
  return BrokerError(
      BrokerError::VOLUME_NOT_FOUND,
      "Unknown volume '" + volumeId + "'");
}


static BrokerError conflict(const string& entity, const string& id)
{
  return BrokerError(
      BrokerError::CONCURRENT_BIND_CONFLICT,
      entity + " '" + id + "' was modified concurrently");
}


static BrokerError invalidState(const Claim& claim, const string& operation)
{
  return BrokerError(
      BrokerError::INVALID_STATE,
      "Cannot " + operation + " claim '" + claim.id() + "' in " +
      stringify(claim.state()) + " state");
}


static BrokerError invalidState(const Volume& volume, const string& operation)
{
  return BrokerError(
      BrokerError::INVALID_STATE,
      "Cannot " + operation + " volume '" + volume.id() + "' in " +
      stringify(volume.state()) + " state");
}


static void detach(Volume* volume, const string& claimId)
{
  google::protobuf::RepeatedPtrField<string> claims;
  foreach (const string& id, volume->claims()) {
    if (id != claimId) {
      claims.Add()->assign(id);
    }
  }

  volume->mutable_claims()->Swap(&claims);
}


ClaimStore::ClaimStore(
    const Option<string>& _workDir,
    size_t _maxEvents,
    size_t _maxAttempts)
  : workDir(_workDir),
    maxEvents(_maxEvents),
    maxAttempts(_maxAttempts),
    current(new Snapshot(_maxEvents))
{
  CHECK_GT(maxAttempts, 0u);
}


Try<Nothing> ClaimStore::recover()
{
  if (workDir.isNone()) {
    return Nothing();
  }

  const string path = paths::getStatePath(workDir.get());

  if (!os::exists(path)) {
    LOG(INFO) << "No checkpointed state found at '" << path << "'";
    return Nothing();
  }

  Result<State> state = ::protobuf::read<State>(path);
  if (state.isError()) {
    return Error(
        "Failed to read checkpointed state from '" + path + "': " +
        state.error());
  }

  shared_ptr<Snapshot> recovered(new Snapshot(maxEvents));

  if (state.isSome()) {
    foreach (const Volume& volume, state->volumes()) {
      recovered->volumes.put(volume.id(), volume);
    }

    foreach (const Claim& claim, state->claims()) {
      if (claim.has_volume_id()) {
        Option<Volume> volume = recovered->volumes.get(claim.volume_id());
        if (volume.isNone()) {
          return Error(
              "Claim '" + claim.id() + "' references unknown volume '" +
              claim.volume_id() + "'");
        }

        bool found = false;
        foreach (const string& id, volume->claims()) {
          found = found || id == claim.id();
        }

        if (!found) {
          return Error(
              "Volume '" + volume->id() + "' does not reference claim '" +
              claim.id() + "'");
        }
      }

      recovered->claims.put(claim.id(), claim);
    }

    recovered->nextSequence = state->next_sequence();
  }

  LOG(INFO) << "Recovered " << recovered->claims.size() << " claims and "
            << recovered->volumes.size() << " volumes from '" << path << "'";

  synchronized (mutex) {
    std::atomic_store(&current, shared_ptr<const Snapshot>(recovered));
  }

  return Nothing();
}


shared_ptr<const ClaimStore::Snapshot> ClaimStore::snapshot() const
{
  return std::atomic_load(&current);
}


Outcome<Claim> ClaimStore::getClaim(const string& claimId) const
{
  shared_ptr<const Snapshot> snapshot = this->snapshot();

  Option<Claim> claim = snapshot->claims.get(claimId);
  if (claim.isNone()) {
    return claimNotFound(claimId);
  }

  return claim.get();
}


Outcome<Volume> ClaimStore::getVolume(const string& volumeId) const
{
  shared_ptr<const Snapshot> snapshot = this->snapshot();

  Option<Volume> volume = snapshot->volumes.get(volumeId);
  if (volume.isNone()) {
    return volumeNotFound(volumeId);
  }

  return volume.get();
}


Option<Error> ClaimStore::bindable(
    const Snapshot& snapshot,
    const Claim& claim,
    const Volume& volume)
{
  const AccessModes requested = accessModes(claim.access_modes());

  switch (volume.state()) {
    case Volume::AVAILABLE: {
      break;
    }
    case Volume::BOUND: {
      if (!isShareable(requested)) {
        return Error("Volume is bound and the claim requests exclusive access");
      }

      foreach (const string& holderId, volume.claims()) {
        Option<Claim> holder = snapshot.claims.get(holderId);
        if (holder.isSome() &&
            !isShareable(accessModes(holder->access_modes()))) {
          return Error(
              "Volume is held by claim '" + holderId + "' with exclusive "
              "access");
        }
      }

      break;
    }
    case Volume::RELEASED:
    case Volume::FAILED:
    case Volume::UNKNOWN: {
      return Error("Volume is " + stringify(volume.state()));
    }
  }

  if (volume.orphaned()) {
    return Error("Volume is orphaned");
  }

  if (claim.has_storage_class() &&
      claim.storage_class() != volume.storage_class()) {
    return Error(
        "Volume is of storage class '" + volume.storage_class() + "'");
  }

  if (volume.capacity_bytes() < claim.capacity_bytes()) {
    return Error(
        "Volume capacity " + stringify(Bytes(volume.capacity_bytes())) +
        " is less than requested " + stringify(Bytes(claim.capacity_bytes())));
  }

  const AccessModes provided = accessModes(volume.access_modes());
  if (!satisfies(provided, requested)) {
    return Error(
        "Volume access modes " + stringify(provided) + " do not cover " +
        stringify(requested));
  }

  if (volume.has_workload() &&
      (!claim.has_consumer() || claim.consumer() != volume.workload())) {
    return Error(
        "Volume belongs to workload '" + volume.workload() + "'");
  }

  return None();
}


Outcome<Claim> ClaimStore::addClaim(const Claim& claim)
{
  if (claim.id().empty()) {
    return BrokerError(BrokerError::INVALID_REQUEST, "Claim id is empty");
  }

  if (claim.capacity_bytes() == 0) {
    return BrokerError(
        BrokerError::INVALID_REQUEST,
        "Claim '" + claim.id() + "' requests no capacity");
  }

  if (accessModes(claim.access_modes()).empty()) {
    return BrokerError(
        BrokerError::INVALID_REQUEST,
        "Claim '" + claim.id() + "' requests no access mode");
  }

  return mutate<Claim>([=](Snapshot* snapshot, bool*) -> Outcome<Claim> {
    if (snapshot->claims.contains(claim.id())) {
      return BrokerError(
          BrokerError::INVALID_REQUEST,
          "Claim '" + claim.id() + "' already exists");
    }

    Claim added = claim;
    added.set_state(Claim::PENDING);
    added.set_version(1);
    added.set_retries_used(0);
    added.clear_volume_id();
    added.clear_attempts();
    added.clear_reason();

    snapshot->claims.put(added.id(), added);

    record(
        snapshot,
        Event::CLAIM_PENDING,
        added.id(),
        None(),
        "Requested " + stringify(Bytes(added.capacity_bytes())) + " with " +
        stringify(accessModes(added.access_modes())));

    return added;
  });
}


Outcome<Volume> ClaimStore::addVolume(const Volume& volume)
{
  if (volume.id().empty() || volume.storage_class().empty()) {
    return BrokerError(
        BrokerError::INVALID_REQUEST,
        "A volume needs an id and a storage class");
  }

  if (volume.capacity_bytes() == 0 ||
      accessModes(volume.access_modes()).empty()) {
    return BrokerError(
        BrokerError::INVALID_REQUEST,
        "Volume '" + volume.id() + "' has no capacity or no access mode");
  }

  return mutate<Volume>([=](Snapshot* snapshot, bool*) -> Outcome<Volume> {
    if (snapshot->volumes.contains(volume.id())) {
      return BrokerError(
          BrokerError::INVALID_REQUEST,
          "Volume '" + volume.id() + "' already exists");
    }

    Volume added = volume;
    added.set_state(Volume::AVAILABLE);
    added.set_version(1);
    added.set_sequence(snapshot->nextSequence++);
    added.set_orphaned(false);
    added.clear_claims();
    added.clear_failure();

    snapshot->volumes.put(added.id(), added);

    record(
        snapshot,
        Event::VOLUME_PROVISIONED,
        None(),
        added.id(),
        "Registered " + stringify(Bytes(added.capacity_bytes())) +
        " volume of storage class '" + added.storage_class() + "'");

    return added;
  });
}


Outcome<Claim> ClaimStore::updateClaim(
    const string& claimId,
    uint64_t version,
    const Bytes& capacity,
    const AccessModes& modes,
    const Option<string>& storageClass)
{
  if (capacity == Bytes(0) || modes.empty()) {
    return BrokerError(
        BrokerError::INVALID_REQUEST,
        "Claim '" + claimId + "' must request capacity and an access mode");
  }

  return mutate<Claim>([=](Snapshot* snapshot, bool*) -> Outcome<Claim> {
    if (!snapshot->claims.contains(claimId)) {
      return claimNotFound(claimId);
    }

    Claim& claim = snapshot->claims.at(claimId);

    if (claim.version() != version) {
      return conflict("Claim", claimId);
    }

    if (claim.state() != Claim::PENDING) {
      return invalidState(claim, "update");
    }

    claim.set_capacity_bytes(capacity.bytes());
    setAccessModes(modes, claim.mutable_access_modes());

    if (storageClass.isSome()) {
      claim.set_storage_class(storageClass.get());
    } else {
      claim.clear_storage_class();
    }

    claim.set_retries_used(0);
    claim.clear_reason();
    claim.set_version(claim.version() + 1);

    record(
        snapshot,
        Event::CLAIM_PENDING,
        claimId,
        None(),
        "Updated to request " + stringify(capacity) + " with " +
        stringify(modes));

    return claim;
  });
}


Outcome<Claim> ClaimStore::setConsumer(
    const string& claimId,
    const string& consumer)
{
  return mutate<Claim>([=](Snapshot* snapshot, bool*) -> Outcome<Claim> {
    if (!snapshot->claims.contains(claimId)) {
      return claimNotFound(claimId);
    }

    Claim& claim = snapshot->claims.at(claimId);

    if (claim.state() != Claim::PENDING && claim.state() != Claim::BOUND) {
      return invalidState(claim, "attach");
    }

    if (claim.has_consumer() && claim.consumer() == consumer) {
      return claim;
    }

    if (claim.state() == Claim::BOUND && claim.has_consumer()) {
      return BrokerError(
          BrokerError::INVALID_STATE,
          "Claim '" + claimId + "' is already bound for consumer '" +
          claim.consumer() + "'");
    }

    claim.set_consumer(consumer);
    claim.set_version(claim.version() + 1);

    return claim;
  });
}


Outcome<Claim> ClaimStore::setReason(
    const string& claimId,
    const string& reason)
{
  return mutate<Claim>([=](Snapshot* snapshot, bool*) -> Outcome<Claim> {
    if (!snapshot->claims.contains(claimId)) {
      return claimNotFound(claimId);
    }

    Claim& claim = snapshot->claims.at(claimId);

    if (claim.state() != Claim::PENDING) {
      return invalidState(claim, "annotate");
    }

    if (claim.reason() != reason) {
      claim.set_reason(reason);
      record(snapshot, Event::CLAIM_PENDING, claimId, None(), reason);
    }

    return claim;
  });
}


Outcome<Claim> ClaimStore::recordAttempt(
    const string& claimId,
    const Attempt& attempt,
    bool retry)
{
  return mutate<Claim>([=](Snapshot* snapshot, bool*) -> Outcome<Claim> {
    if (!snapshot->claims.contains(claimId)) {
      return claimNotFound(claimId);
    }

    Claim& claim = snapshot->claims.at(claimId);

    if (claim.state() != Claim::PENDING) {
      return invalidState(claim, "record an attempt for");
    }

    claim.add_attempts()->CopyFrom(attempt);

    const size_t attempts = claim.attempts_size();
    if (attempts > maxAttempts) {
      claim.mutable_attempts()->DeleteSubrange(
          0, static_cast<int>(attempts - maxAttempts));
    }

    claim.set_reason(attempt.error() + ": " + attempt.message());

    if (retry) {
      claim.set_retries_used(claim.retries_used() + 1);
    }

    record(
        snapshot,
        Event::PROVISIONING_FAILED,
        claimId,
        None(),
        claim.reason());

    return claim;
  });
}


Outcome<Claim> ClaimStore::markLost(
    const string& claimId,
    const string& reason)
{
  return mutate<Claim>([=](Snapshot* snapshot, bool*) -> Outcome<Claim> {
    if (!snapshot->claims.contains(claimId)) {
      return claimNotFound(claimId);
    }

    Claim& claim = snapshot->claims.at(claimId);

    if (claim.state() != Claim::PENDING) {
      return invalidState(claim, "lose");
    }

    claim.set_state(Claim::LOST);
    claim.set_reason(reason);
    claim.set_version(claim.version() + 1);

    record(snapshot, Event::CLAIM_LOST, claimId, None(), reason);

    return claim;
  });
}


Outcome<Claim> ClaimStore::bind(
    const string& claimId,
    uint64_t claimVersion,
    const string& volumeId,
    uint64_t volumeVersion)
{
  return mutate<Claim>([=](Snapshot* snapshot, bool*) -> Outcome<Claim> {
    if (!snapshot->claims.contains(claimId)) {
      return claimNotFound(claimId);
    }

    if (!snapshot->volumes.contains(volumeId)) {
      return volumeNotFound(volumeId);
    }

    Claim& claim = snapshot->claims.at(claimId);
    Volume& volume = snapshot->volumes.at(volumeId);

    if (claim.version() != claimVersion) {
      return conflict("Claim", claimId);
    }

    if (volume.version() != volumeVersion) {
      return conflict("Volume", volumeId);
    }

    if (claim.state() != Claim::PENDING) {
      return invalidState(claim, "bind");
    }

    Option<Error> error = bindable(*snapshot, claim, volume);
    if (error.isSome()) {
      return BrokerError(
          BrokerError::INVALID_STATE,
          "Cannot bind claim '" + claimId + "' to volume '" + volumeId +
          "': " + error->message);
    }

    volume.add_claims(claimId);
    volume.set_state(Volume::BOUND);
    volume.set_version(volume.version() + 1);

    claim.set_state(Claim::BOUND);
    claim.set_volume_id(volumeId);
    claim.clear_reason();
    claim.set_version(claim.version() + 1);

    record(
        snapshot,
        Event::CLAIM_BOUND,
        claimId,
        volumeId,
        "Bound to " + stringify(Bytes(volume.capacity_bytes())) + " volume");

    return claim;
  });
}


Outcome<Claim> ClaimStore::adopt(
    const Volume& volume,
    const string& claimId,
    uint64_t claimVersion)
{
  return mutate<Claim>([=](Snapshot* snapshot, bool* keep) -> Outcome<Claim> {
    if (volume.id().empty() || snapshot->volumes.contains(volume.id())) {
      return BrokerError(
          BrokerError::INVALID_REQUEST,
          "Provisioned volume id '" + volume.id() + "' is empty or in use");
    }

    // From here on the volume exists and must be recorded no matter
    // whether it can be bound.
    *keep = true;

    Volume adopted = volume;
    adopted.set_state(Volume::AVAILABLE);
    adopted.set_version(1);
    adopted.set_sequence(snapshot->nextSequence++);
    adopted.set_orphaned(false);
    adopted.clear_claims();
    adopted.clear_failure();

    record(
        snapshot,
        Event::VOLUME_PROVISIONED,
        claimId,
        adopted.id(),
        "Provisioned " + stringify(Bytes(adopted.capacity_bytes())) +
        " volume of storage class '" + adopted.storage_class() + "'");

    Option<Claim> claim = snapshot->claims.get(claimId);

    if (claim.isNone() || claim->state() != Claim::PENDING) {
      adopted.set_state(Volume::RELEASED);
      adopted.set_orphaned(true);
      snapshot->volumes.put(adopted.id(), adopted);

      record(
          snapshot,
          Event::VOLUME_RELEASED,
          claimId,
          adopted.id(),
          "Orphaned: claim is no longer pending");

      return BrokerError(
          BrokerError::INVALID_STATE,
          "Claim '" + claimId + "' is no longer pending");
    }

    if (claim->version() != claimVersion) {
      snapshot->volumes.put(adopted.id(), adopted);
      return conflict("Claim", claimId);
    }

    Option<Error> error = bindable(*snapshot, claim.get(), adopted);
    if (error.isSome()) {
      snapshot->volumes.put(adopted.id(), adopted);

      return BrokerError(
          BrokerError::INVALID_STATE,
          "Provisioned volume '" + adopted.id() + "' does not satisfy "
          "claim '" + claimId + "': " + error->message);
    }

    adopted.set_state(Volume::BOUND);
    adopted.add_claims(claimId);
    snapshot->volumes.put(adopted.id(), adopted);

    Claim& bound = snapshot->claims.at(claimId);
    bound.set_state(Claim::BOUND);
    bound.set_volume_id(adopted.id());
    bound.clear_reason();
    bound.set_version(bound.version() + 1);

    record(
        snapshot,
        Event::CLAIM_BOUND,
        claimId,
        adopted.id(),
        "Bound to newly provisioned volume");

    return bound;
  });
}


Outcome<Claim> ClaimStore::release(
    const string& claimId,
    const string& reason)
{
  return mutate<Claim>([=](Snapshot* snapshot, bool*) -> Outcome<Claim> {
    if (!snapshot->claims.contains(claimId)) {
      return claimNotFound(claimId);
    }

    Claim& claim = snapshot->claims.at(claimId);

    switch (claim.state()) {
      case Claim::PENDING: {
        claim.set_state(Claim::LOST);
        claim.set_reason(reason);
        claim.set_version(claim.version() + 1);

        record(snapshot, Event::CLAIM_LOST, claimId, None(), reason);

        return claim;
      }
      case Claim::BOUND: {
        CHECK(claim.has_volume_id());

        const string volumeId = claim.volume_id();

        if (snapshot->volumes.contains(volumeId)) {
          Volume& volume = snapshot->volumes.at(volumeId);

          detach(&volume, claimId);
          volume.set_version(volume.version() + 1);

          if (volume.claims().empty() && volume.state() == Volume::BOUND) {
            volume.set_state(Volume::RELEASED);

            record(
                snapshot,
                Event::VOLUME_RELEASED,
                claimId,
                volumeId,
                "Last claim released");
          }
        }

        claim.set_state(Claim::RELEASED);
        claim.clear_volume_id();
        claim.set_reason(reason);
        claim.set_version(claim.version() + 1);

        record(snapshot, Event::CLAIM_RELEASED, claimId, volumeId, reason);

        return claim;
      }
      case Claim::LOST:
      case Claim::RELEASED:
      case Claim::UNKNOWN: {
        return invalidState(claim, "release");
      }
    }

    UNREACHABLE();
  });
}


Outcome<Volume> ClaimStore::markFailed(
    const string& volumeId,
    const string& message)
{
  return mutate<Volume>([=](Snapshot* snapshot, bool*) -> Outcome<Volume> {
    if (!snapshot->volumes.contains(volumeId)) {
      return volumeNotFound(volumeId);
    }

    Volume& volume = snapshot->volumes.at(volumeId);

    volume.set_state(Volume::FAILED);
    volume.set_failure(message);
    volume.set_version(volume.version() + 1);

    record(snapshot, Event::VOLUME_FAILED, None(), volumeId, message);

    return volume;
  });
}


Outcome<Volume> ClaimStore::retain(const string& volumeId)
{
  return mutate<Volume>([=](Snapshot* snapshot, bool*) -> Outcome<Volume> {
    if (!snapshot->volumes.contains(volumeId)) {
      return volumeNotFound(volumeId);
    }

    const Volume& volume = snapshot->volumes.at(volumeId);

    if (volume.state() != Volume::RELEASED) {
      return invalidState(volume, "retain");
    }

    record(
        snapshot,
        Event::VOLUME_RETAINED,
        None(),
        volumeId,
        "Kept by the reclaim policy of storage class '" +
        volume.storage_class() + "'");

    return volume;
  });
}


Outcome<Volume> ClaimStore::makeAvailable(
    const string& volumeId,
    uint64_t version)
{
  return mutate<Volume>([=](Snapshot* snapshot, bool*) -> Outcome<Volume> {
    if (!snapshot->volumes.contains(volumeId)) {
      return volumeNotFound(volumeId);
    }

    Volume& volume = snapshot->volumes.at(volumeId);

    if (volume.version() != version) {
      return conflict("Volume", volumeId);
    }

    if (volume.state() != Volume::RELEASED || volume.orphaned()) {
      return invalidState(volume, "recycle");
    }

    CHECK(volume.claims().empty());

    volume.set_state(Volume::AVAILABLE);
    volume.set_version(volume.version() + 1);

    record(
        snapshot,
        Event::VOLUME_RECYCLED,
        None(),
        volumeId,
        "Made available for binding");

    return volume;
  });
}


Outcome<Volume> ClaimStore::resize(
    const string& volumeId,
    uint64_t version,
    const Bytes& capacity)
{
  return mutate<Volume>([=](Snapshot* snapshot, bool*) -> Outcome<Volume> {
    if (!snapshot->volumes.contains(volumeId)) {
      return volumeNotFound(volumeId);
    }

    Volume& volume = snapshot->volumes.at(volumeId);

    if (volume.version() != version) {
      return conflict("Volume", volumeId);
    }

    if (volume.state() != Volume::BOUND &&
        volume.state() != Volume::AVAILABLE) {
      return invalidState(volume, "resize");
    }

    if (capacity < Bytes(volume.capacity_bytes())) {
      return BrokerError(
          BrokerError::INVALID_REQUEST,
          "Volume '" + volumeId + "' can not shrink from " +
          stringify(Bytes(volume.capacity_bytes())) + " to " +
          stringify(capacity));
    }

    const Bytes previous(volume.capacity_bytes());

    volume.set_capacity_bytes(capacity.bytes());
    volume.set_version(volume.version() + 1);

    record(
        snapshot,
        Event::VOLUME_RESIZED,
        None(),
        volumeId,
        "Resized from " + stringify(previous) + " to " + stringify(capacity));

    return volume;
  });
}


Outcome<Nothing> ClaimStore::removeVolume(
    const string& volumeId,
    uint64_t version)
{
  return mutate<Nothing>([=](Snapshot* snapshot, bool*) -> Outcome<Nothing> {
    if (!snapshot->volumes.contains(volumeId)) {
      return volumeNotFound(volumeId);
    }

    const Volume& volume = snapshot->volumes.at(volumeId);

    if (volume.version() != version) {
      return conflict("Volume", volumeId);
    }

    if (volume.state() == Volume::BOUND) {
      return invalidState(volume, "remove");
    }

    snapshot->volumes.erase(volumeId);

    record(snapshot, Event::VOLUME_DELETED, None(), volumeId, "Deleted");

    return Nothing();
  });
}


Outcome<vector<string>> ClaimStore::forget(const string& volumeId)
{
  return mutate<vector<string>>(
      [=](Snapshot* snapshot, bool*) -> Outcome<vector<string>> {
    if (!snapshot->volumes.contains(volumeId)) {
      return volumeNotFound(volumeId);
    }

    vector<string> released;

    foreach (const string& claimId, snapshot->volumes.at(volumeId).claims()) {
      if (!snapshot->claims.contains(claimId)) {
        continue;
      }

      Claim& claim = snapshot->claims.at(claimId);
      if (claim.state() != Claim::BOUND) {
        continue;
      }

      claim.set_state(Claim::RELEASED);
      claim.clear_volume_id();
      claim.set_reason("Workload was torn down");
      claim.set_version(claim.version() + 1);

      record(
          snapshot,
          Event::CLAIM_RELEASED,
          claimId,
          volumeId,
          claim.reason());

      released.push_back(claimId);
    }

    snapshot->volumes.erase(volumeId);

    record(
        snapshot,
        Event::VOLUME_DELETED,
        None(),
        volumeId,
        "Deleted with its workload");

    return released;
  });
}


template <typename T>
Outcome<T> ClaimStore::mutate(
    const lambda::function<Outcome<T>(Snapshot*, bool*)>& f)
{
  synchronized (mutex) {
    shared_ptr<Snapshot> next(new Snapshot(*std::atomic_load(&current)));

    bool keep = false;
    Outcome<T> result = f(next.get(), &keep);

    if (result.isError() && !keep) {
      return result;
    }

    if (workDir.isSome()) {
      State state;
      state.set_next_sequence(next->nextSequence);

      foreachvalue (const Volume& volume, next->volumes) {
        state.add_volumes()->CopyFrom(volume);
      }

      foreachvalue (const Claim& claim, next->claims) {
        state.add_claims()->CopyFrom(claim);
      }

      const string path = paths::getStatePath(workDir.get());

      // A store that can not persist its decisions must not make any
      // more of them.
      CHECK_SOME(checkpoint(path, state))
        << "Failed to checkpoint the claim store to '" << path << "'";
    }

    std::atomic_store(&current, shared_ptr<const Snapshot>(next));

    return result;
  }

  UNREACHABLE();
}


void ClaimStore::record(
    Snapshot* snapshot,
    Event::Type type,
    const Option<string>& claimId,
    const Option<string>& volumeId,
    const string& message) const
{
  Event event;
  event.set_sequence(snapshot->nextEvent++);
  event.set_timestamp(Clock::now().secs());
  event.set_type(type);
  event.set_message(message);

  if (claimId.isSome()) {
    event.set_claim_id(claimId.get());
  }

  if (volumeId.isSome()) {
    event.set_volume_id(volumeId.get());
  }

  VLOG(1) << type << " (claim '" << claimId.getOrElse("") << "', volume '"
          << volumeId.getOrElse("") << "'): " << message;

  // Overwrites the oldest event once full.
  snapshot->events.push_back(event);
}

} // namespace internal {
} // namespace volbroker {
