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

#include "binder/binder.hpp"

#include <functional>
#include <memory>

#include <glog/logging.h>

#include <process/after.hpp>
#include <process/clock.hpp>
#include <process/collect.hpp>
#include <process/defer.hpp>
#include <process/dispatch.hpp>
#include <process/loop.hpp>

#include <stout/check.hpp>
#include <stout/foreach.hpp>
#include <stout/stringify.hpp>

#include "binder/binder_process.hpp"
#include "binder/matching.hpp"

#include "common/access_modes.hpp"

using std::shared_ptr;
using std::string;
using std::vector;

using process::Break;
using process::Clock;
using process::Continue;
using process::ControlFlow;
using process::Future;

namespace volbroker {
namespace internal {

// Turns the failure of a follow-up step into a restart of the binding
// loop, which then reports the current state of the claim.
static Outcome<Claim> restart(const BrokerError& error)
{
  return BrokerError(BrokerError::CONCURRENT_BIND_CONFLICT, error.message);
}


Future<Outcome<Claim>> BinderProcess::bind(const string& claimId)
{
  return process::loop(
      self(),
      [=]() {
        return _bind(claimId);
      },
      [=](const Outcome<Claim>& result) -> ControlFlow<Outcome<Claim>> {
        if (result.isError() &&
            result.error().code == BrokerError::CONCURRENT_BIND_CONFLICT) {
          ++metrics->bind_conflicts;

          VLOG(1) << "Retrying to bind claim '" << claimId << "': "
                  << result.error().message;

          return Continue();
        }

        return Break(result);
      });
}


Future<Outcome<Claim>> BinderProcess::_bind(const string& claimId)
{
  shared_ptr<const ClaimStore::Snapshot> snapshot = store->snapshot();

  Option<Claim> claim = snapshot->claims.get(claimId);
  if (claim.isNone()) {
    return Outcome<Claim>(BrokerError(
        BrokerError::CLAIM_NOT_FOUND,
        "Unknown claim '" + claimId + "'"));
  }

  if (claim->state() != Claim::PENDING) {
    return Outcome<Claim>(claim.get());
  }

  if (provisioning.contains(claimId)) {
    VLOG(1) << "Claim '" << claimId << "' has a provisioning call in flight";
    return Outcome<Claim>(claim.get());
  }

  Option<Volume> volume = findVolume(*snapshot, claim.get());

  if (volume.isSome()) {
    Outcome<Claim> bound = store->bind(
        claimId, claim->version(), volume->id(), volume->version());

    if (bound.isSome()) {
      ++metrics->claims_bound;

      LOG(INFO) << "Bound claim '" << claimId << "' to "
                << (volume->state() == Volume::BOUND ? "shared " : "")
                << "volume '" << volume->id() << "' of "
                << Bytes(volume->capacity_bytes());
    }

    return bound;
  }

  Outcome<StorageClass> storageClass = resolve(claim.get());
  if (storageClass.isError()) {
    return pending(claimId, storageClass.error().message);
  }

  // A consumer hint is only an input here; no placement is inferred.
  if (!claim->has_consumer()) {
    if (storageClass->binding_mode() ==
          StorageClass::WAIT_FOR_FIRST_CONSUMER) {
      return pending(claimId, "Waiting for the first consumer");
    }

    if (storageClass->kind() == StorageClass::EPHEMERAL) {
      return pending(claimId, "Waiting for a workload to own the volume");
    }
  }

  return provision(claim.get(), storageClass.get());
}


Outcome<Claim> BinderProcess::pending(
    const string& claimId,
    const string& reason)
{
  Outcome<Claim> claim = store->setReason(claimId, reason);
  if (claim.isError()) {
    return restart(claim.error());
  }

  VLOG(1) << "Claim '" << claimId << "' stays pending: " << reason;

  return claim;
}


Outcome<StorageClass> BinderProcess::resolve(const Claim& claim) const
{
  if (claim.has_storage_class()) {
    return catalog->lookup(claim.storage_class());
  }

  Option<StorageClass> storageClass = catalog->defaultClass();
  if (storageClass.isNone()) {
    return BrokerError(
        BrokerError::CLASS_NOT_FOUND,
        "No volume matches and no default storage class is defined");
  }

  return storageClass.get();
}


Future<Outcome<Claim>> BinderProcess::provision(
    const Claim& claim,
    const StorageClass& storageClass)
{
  LOG(INFO) << "Provisioning " << Bytes(claim.capacity_bytes()) << " with "
            << accessModes(claim.access_modes()) << " for claim '"
            << claim.id() << "' from storage class '" << storageClass.name()
            << "'";

  provisioning.insert(claim.id());

  return process::loop(
      self(),
      [=]() {
        return _provision(claim, storageClass);
      },
      [=](const Outcome<Volume>& volume) {
        return __provision(claim, volume);
      });
}


Future<Outcome<Volume>> BinderProcess::_provision(
    const Claim& claim,
    const StorageClass& storageClass)
{
  // The claim may have been removed or changed while waiting to retry.
  Outcome<Claim> current = store->getClaim(claim.id());
  if (current.isError() ||
      current->state() != Claim::PENDING ||
      current->version() != claim.version()) {
    return Outcome<Volume>(BrokerError(
        BrokerError::CONCURRENT_BIND_CONFLICT,
        "Claim '" + claim.id() + "' changed while provisioning"));
  }

  Outcome<Backend*> backend = backends->get(storageClass.kind());
  if (backend.isError()) {
    return Outcome<Volume>(backend.error());
  }

  ++metrics->provisioning_attempts;

  Option<string> workload;
  if (claim.has_consumer()) {
    workload = claim.consumer();
  }

  return backend.get()->createVolume(
      storageClass,
      Bytes(claim.capacity_bytes()),
      accessModes(claim.access_modes()),
      workload)
    .recover([](const Future<Outcome<Volume>>& future)
                 -> Future<Outcome<Volume>> {
      return Outcome<Volume>(BrokerError(
          BrokerError::BACKEND_UNAVAILABLE,
          future.isFailed() ? future.failure() : "Call was discarded"));
    });
}


Future<ControlFlow<Outcome<Claim>>> BinderProcess::__provision(
    const Claim& claim,
    const Outcome<Volume>& volume)
{
  const string& claimId = claim.id();

  Attempt attempt;
  attempt.set_timestamp(Clock::now().secs());

  if (volume.isSome()) {
    provisioning.erase(claimId);

    Outcome<Claim> adopted =
      store->adopt(volume.get(), claimId, claim.version());

    if (adopted.isSome()) {
      ++metrics->claims_bound;

      LOG(INFO) << "Bound claim '" << claimId << "' to new volume '"
                << volume->id() << "' of " << Bytes(volume->capacity_bytes());

      return Break(adopted);
    }

    Outcome<Volume> stored = store->getVolume(volume->id());
    if (stored.isSome() && stored->orphaned()) {
      LOG(WARNING) << "Claim '" << claimId << "' went away while volume '"
                   << volume->id() << "' was provisioned for it; reclaiming "
                   << "the volume";

      reclaim(volume->id());

      return Break(restart(adopted.error()));
    }

    if (adopted.error().code == BrokerError::CONCURRENT_BIND_CONFLICT) {
      return Break(adopted);
    }

    LOG(ERROR) << "Failed to bind claim '" << claimId << "' to new volume '"
               << volume->id() << "': " << adopted.error();

    attempt.set_error(BrokerError::name(adopted.error().code));
    attempt.set_message(adopted.error().message);

    Outcome<Claim> recorded = store->recordAttempt(claimId, attempt, false);

    return Break(recorded.isError() ? restart(recorded.error()) : recorded);
  }

  const BrokerError& error = volume.error();

  if (error.code == BrokerError::CONCURRENT_BIND_CONFLICT) {
    provisioning.erase(claimId);
    return Break(Outcome<Claim>(error));
  }

  ++metrics->provisioning_failures;

  attempt.set_error(BrokerError::name(error.code));
  attempt.set_message(error.message);

  if (!error.retryable()) {
    provisioning.erase(claimId);

    LOG(WARNING) << "Claim '" << claimId << "' stays pending: " << error;

    Outcome<Claim> recorded = store->recordAttempt(claimId, attempt, false);

    return Break(recorded.isError() ? restart(recorded.error()) : recorded);
  }

  Outcome<Claim> current = store->getClaim(claimId);
  if (current.isError() ||
      current->state() != Claim::PENDING ||
      current->version() != claim.version()) {
    provisioning.erase(claimId);

    return Break(Outcome<Claim>(BrokerError(
        BrokerError::CONCURRENT_BIND_CONFLICT,
        "Claim '" + claimId + "' changed while provisioning")));
  }

  const unsigned int retry = current->retries_used() + 1;

  if (retry >= policy.maxAttempts) {
    provisioning.erase(claimId);

    Outcome<Claim> recorded = store->recordAttempt(claimId, attempt, true);
    if (recorded.isError()) {
      return Break(restart(recorded.error()));
    }

    const string reason =
      "Gave up after " + stringify(retry) + " failed provisioning attempts: " +
      error.message;

    Outcome<Claim> lost = store->markLost(claimId, reason);
    if (lost.isError()) {
      return Break(restart(lost.error()));
    }

    ++metrics->claims_lost;

    LOG(ERROR) << "Claim '" << claimId << "' is lost: " << reason;

    return Break(Outcome<Claim>(
        BrokerError(BrokerError::PROVISIONING_EXHAUSTED, reason)));
  }

  // Successive delays of a claim never decrease, even with jitter.
  Option<Duration> previous;
  if (current->retries_used() > 0 && current->attempts_size() > 0) {
    const Attempt& last =
      current->attempts(current->attempts_size() - 1);

    if (last.has_backoff_secs()) {
      Try<Duration> duration = Duration::create(last.backoff_secs());
      if (duration.isSome()) {
        previous = duration.get();
      }
    }
  }

  const Duration delay = backoff(policy, retry, previous);
  attempt.set_backoff_secs(delay.secs());

  Outcome<Claim> recorded = store->recordAttempt(claimId, attempt, true);
  if (recorded.isError()) {
    provisioning.erase(claimId);
    return Break(restart(recorded.error()));
  }

  ++metrics->provisioning_retries;

  LOG(WARNING) << "Failed to provision a volume for claim '" << claimId
               << "' (attempt " << retry << " of " << policy.maxAttempts
               << "): " << error << ". Retrying in " << delay;

  return process::after(delay)
    .then([]() -> Future<ControlFlow<Outcome<Claim>>> {
      return Continue();
    });
}


Future<Outcome<Claim>> BinderProcess::attach(
    const string& claimId,
    const string& consumer)
{
  Outcome<Claim> claim = store->setConsumer(claimId, consumer);
  if (claim.isError()) {
    return claim;
  }

  LOG(INFO) << "Attached consumer '" << consumer << "' to claim '" << claimId
            << "'";

  if (claim->state() != Claim::PENDING) {
    return claim;
  }

  return bind(claimId);
}


Future<Outcome<Claim>> BinderProcess::release(
    const string& claimId,
    const string& reason)
{
  Outcome<Claim> before = store->getClaim(claimId);
  if (before.isError()) {
    return before;
  }

  Outcome<Claim> released = store->release(claimId, reason);
  if (released.isError()) {
    return released;
  }

  if (released->state() == Claim::LOST) {
    ++metrics->claims_lost;

    LOG(INFO) << "Claim '" << claimId << "' is lost before binding: "
              << reason;

    return released;
  }

  ++metrics->claims_released;

  LOG(INFO) << "Released claim '" << claimId << "' from volume '"
            << before->volume_id() << "': " << reason;

  Outcome<Volume> volume = store->getVolume(before->volume_id());
  if (volume.isSome() && volume->state() == Volume::RELEASED) {
    reclaim(volume->id());
  }

  return released;
}


Future<Outcome<Claim>> BinderProcess::update(
    const string& claimId,
    const Bytes& capacity,
    const AccessModes& accessModes,
    const Option<string>& storageClass)
{
  for (;;) {
    Outcome<Claim> claim = store->getClaim(claimId);
    if (claim.isError()) {
      return claim;
    }

    Outcome<Claim> updated = store->updateClaim(
        claimId, claim->version(), capacity, accessModes, storageClass);

    if (updated.isSome()) {
      break;
    }

    if (updated.error().code != BrokerError::CONCURRENT_BIND_CONFLICT) {
      return updated;
    }
  }

  LOG(INFO) << "Updated claim '" << claimId << "' to request " << capacity
            << " with " << accessModes;

  return bind(claimId);
}


Future<Outcome<Volume>> BinderProcess::resize(
    const string& claimId,
    const Bytes& capacity)
{
  Outcome<Claim> claim = store->getClaim(claimId);
  if (claim.isError()) {
    return Outcome<Volume>(claim.error());
  }

  if (claim->state() != Claim::BOUND) {
    return Outcome<Volume>(BrokerError(
        BrokerError::INVALID_STATE,
        "Claim '" + claimId + "' is " + stringify(claim->state()) +
        ", not " + stringify(Claim::BOUND)));
  }

  Outcome<Volume> volume = store->getVolume(claim->volume_id());
  if (volume.isError()) {
    return volume;
  }

  Outcome<StorageClass> storageClass =
    catalog->lookup(volume->storage_class());

  if (storageClass.isError()) {
    return Outcome<Volume>(storageClass.error());
  }

  if (!storageClass->allow_volume_expansion()) {
    return Outcome<Volume>(BrokerError(
        BrokerError::RESIZE_NOT_SUPPORTED,
        "Storage class '" + storageClass->name() + "' does not allow "
        "volume expansion"));
  }

  if (capacity <= Bytes(volume->capacity_bytes())) {
    return volume;
  }

  Outcome<Backend*> backend = backends->get(storageClass->kind());
  if (backend.isError()) {
    return Outcome<Volume>(backend.error());
  }

  LOG(INFO) << "Resizing volume '" << volume->id() << "' of claim '"
            << claimId << "' from " << Bytes(volume->capacity_bytes())
            << " to " << capacity;

  const string volumeId = volume->id();
  Backend* _backend = backend.get();

  unsigned int retry = 0;
  Option<Duration> previous;

  return process::loop(
      self(),
      [=]() {
        return _backend->resizeVolume(volumeId, capacity)
          .recover([](const Future<Outcome<Bytes>>& future)
                       -> Future<Outcome<Bytes>> {
            return Outcome<Bytes>(BrokerError(
                BrokerError::BACKEND_UNAVAILABLE,
                future.isFailed() ? future.failure() : "Call was discarded"));
          });
      },
      [=](const Outcome<Bytes>& result) mutable
          -> Future<ControlFlow<Outcome<Bytes>>> {
        if (result.isSome() ||
            result.error().code != BrokerError::BACKEND_UNAVAILABLE) {
          return Break(result);
        }

        if (++retry >= policy.maxAttempts) {
          LOG(ERROR) << "Giving up resizing volume '" << volumeId << "' after "
                     << retry << " attempts: " << result.error();

          return Break(result);
        }

        const Duration delay = backoff(policy, retry, previous);
        previous = delay;

        LOG(WARNING) << "Failed to resize volume '" << volumeId << "': "
                     << result.error() << ". Retrying in " << delay;

        return process::after(delay)
          .then([]() -> Future<ControlFlow<Outcome<Bytes>>> {
            return Continue();
          });
      })
    .then(process::defer(self(), [=](const Outcome<Bytes>& size) {
      if (size.isError()) {
        return Outcome<Volume>(size.error());
      }

      return _resize(volumeId, size.get());
    }));
}


Outcome<Volume> BinderProcess::_resize(
    const string& volumeId,
    const Bytes& size)
{
  for (;;) {
    Outcome<Volume> volume = store->getVolume(volumeId);
    if (volume.isError()) {
      return volume;
    }

    Outcome<Volume> resized = store->resize(volumeId, volume->version(), size);
    if (resized.isError() &&
        resized.error().code == BrokerError::CONCURRENT_BIND_CONFLICT) {
      continue;
    }

    return resized;
  }
}


Future<Outcome<vector<string>>> BinderProcess::teardown(
    const string& workload)
{
  vector<Future<Outcome<vector<string>>>> futures;
  foreach (Backend* backend, backends->all()) {
    futures.push_back(backend->teardown(workload));
  }

  return process::collect(futures)
    .then(process::defer(
        self(),
        [=](const vector<Outcome<vector<string>>>& results)
            -> Outcome<vector<string>> {
      Option<BrokerError> error;
      vector<string> deleted;

      foreach (const Outcome<vector<string>>& result, results) {
        if (result.isError()) {
          LOG(ERROR) << "Failed to tear down workload '" << workload << "': "
                     << result.error();

          if (error.isNone()) {
            error = result.error();
          }

          continue;
        }

        foreach (const string& volumeId, result.get()) {
          Outcome<vector<string>> released = store->forget(volumeId);
          if (released.isError()) {
            // The store never recorded volumes whose provisioning
            // result was dropped.
            if (released.error().code != BrokerError::VOLUME_NOT_FOUND) {
              LOG(ERROR) << "Failed to forget volume '" << volumeId << "': "
                         << released.error();
            }

            continue;
          }

          metrics->claims_released += released->size();
          deleted.push_back(volumeId);
        }
      }

      if (error.isSome()) {
        return error.get();
      }

      LOG(INFO) << "Deleted " << deleted.size() << " volumes of workload '"
                << workload << "'";

      return deleted;
    }));
}


void BinderProcess::reclaim(const string& volumeId)
{
  reclaimer->reclaim(volumeId);
}


Binder::Binder(
    ClaimStore* _store,
    Catalog* catalog,
    Backends* backends,
    Reclaimer* reclaimer,
    Metrics* metrics,
    const BackoffPolicy& policy,
    size_t workers)
  : store(_store)
{
  CHECK_GT(workers, 0u);

  for (size_t i = 0; i < workers; i++) {
    BinderProcess* process = new BinderProcess(
        store, catalog, backends, reclaimer, metrics, policy);

    spawn(process);
    processes.push_back(process);
  }
}


Binder::~Binder()
{
  foreach (BinderProcess* process, processes) {
    terminate(process);
  }

  foreach (BinderProcess* process, processes) {
    wait(process);
    delete process;
  }
}


Future<Outcome<Claim>> Binder::bind(const string& claimId)
{
  return dispatch(worker(claimId), &BinderProcess::bind, claimId);
}


Future<Nothing> Binder::bindAll()
{
  shared_ptr<const ClaimStore::Snapshot> snapshot = store->snapshot();

  vector<Future<Outcome<Claim>>> futures;
  foreachvalue (const Claim& claim, snapshot->claims) {
    if (claim.state() == Claim::PENDING) {
      futures.push_back(bind(claim.id()));
    }
  }

  return process::collect(futures)
    .then([]() { return Nothing(); });
}


Future<Outcome<Claim>> Binder::attach(
    const string& claimId,
    const string& consumer)
{
  return dispatch(worker(claimId), &BinderProcess::attach, claimId, consumer);
}


Future<Outcome<Claim>> Binder::release(const string& claimId)
{
  return dispatch(
      worker(claimId),
      &BinderProcess::release,
      claimId,
      "Released by its consumer");
}


Future<Outcome<Claim>> Binder::remove(const string& claimId)
{
  return dispatch(
      worker(claimId),
      &BinderProcess::release,
      claimId,
      "Claim was deleted");
}


Future<Outcome<Claim>> Binder::update(
    const string& claimId,
    const Bytes& capacity,
    const AccessModes& accessModes,
    const Option<string>& storageClass)
{
  return dispatch(
      worker(claimId),
      &BinderProcess::update,
      claimId,
      capacity,
      accessModes,
      storageClass);
}


Future<Outcome<Volume>> Binder::resize(
    const string& claimId,
    const Bytes& capacity)
{
  return dispatch(worker(claimId), &BinderProcess::resize, claimId, capacity);
}


Future<Outcome<vector<string>>> Binder::teardown(const string& workload)
{
  return dispatch(worker(workload), &BinderProcess::teardown, workload);
}


BinderProcess* Binder::worker(const string& claimId) const
{
  return processes[std::hash<string>()(claimId) % processes.size()];
}

} // namespace internal {
} // namespace volbroker {
