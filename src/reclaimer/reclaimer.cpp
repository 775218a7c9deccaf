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

#include "reclaimer/reclaimer.hpp"

#include <vector>

#include <glog/logging.h>

#include <process/clock.hpp>
#include <process/collect.hpp>
#include <process/defer.hpp>
#include <process/delay.hpp>
#include <process/dispatch.hpp>

#include <stout/foreach.hpp>
#include <stout/lambda.hpp>
#include <stout/stringify.hpp>

#include "reclaimer/reclaimer_process.hpp"

using std::shared_ptr;
using std::string;
using std::vector;

using process::Clock;
using process::Future;

namespace volbroker {
namespace internal {

void ReclaimerProcess::initialize()
{
  if (interval > Duration::zero()) {
    timer = process::delay(interval, self(), &Self::tick);
  }
}


void ReclaimerProcess::finalize()
{
  if (timer.isSome()) {
    Clock::cancel(timer.get());
  }
}


void ReclaimerProcess::tick()
{
  if (paused) {
    VLOG(1) << "Skipping the reclaim sweep as the reclaimer is paused";
  } else {
    sweep();
  }

  timer = process::delay(interval, self(), &Self::tick);
}


Future<Nothing> ReclaimerProcess::sweep()
{
  shared_ptr<const ClaimStore::Snapshot> snapshot = store->snapshot();

  vector<Future<Outcome<Nothing>>> futures;

  foreachvalue (const Volume& volume, snapshot->volumes) {
    if (volume.state() == Volume::RELEASED) {
      futures.push_back(reclaim(volume.id()));
    }
  }

  VLOG(1) << "Sweeping " << futures.size() << " released volumes";

  return process::collect(futures)
    .then([]() { return Nothing(); });
}


Future<Outcome<Nothing>> ReclaimerProcess::reclaim(const string& volumeId)
{
  Outcome<Volume> volume = store->getVolume(volumeId);
  if (volume.isError()) {
    return Outcome<Nothing>(volume.error());
  }

  if (volume->state() != Volume::RELEASED) {
    return Outcome<Nothing>(BrokerError(
        BrokerError::INVALID_STATE,
        "Volume '" + volumeId + "' is " + stringify(volume->state()) +
        ", not " + stringify(Volume::RELEASED)));
  }

  if (deleting.contains(volumeId)) {
    return Outcome<Nothing>(Nothing());
  }

  Outcome<StorageClass> storageClass =
    catalog->lookup(volume->storage_class());

  if (storageClass.isError()) {
    // Without its class the backend of the volume is unknown, so the
    // volume is kept until the class is registered again.
    LOG(WARNING) << "Keeping released volume '" << volumeId << "': "
                 << storageClass.error();

    return Outcome<Nothing>(storageClass.error());
  }

  if (!volume->orphaned() &&
      storageClass->reclaim_policy() == StorageClass::RETAIN) {
    if (!retained.contains(volumeId)) {
      Outcome<Volume> retain = store->retain(volumeId);
      if (retain.isError()) {
        return Outcome<Nothing>(retain.error());
      }

      retained.insert(volumeId);
      ++metrics->volumes_retained;

      LOG(INFO) << "Retaining released volume '" << volumeId
                << "' of storage class '" << storageClass->name() << "'";
    }

    return Outcome<Nothing>(Nothing());
  }

  Outcome<Backend*> backend = backends->get(storageClass->kind());
  if (backend.isError()) {
    LOG(WARNING) << "Deferring the deletion of volume '" << volumeId
                 << "': " << backend.error();

    return Outcome<Nothing>(backend.error());
  }

  LOG(INFO) << "Deleting released " << (volume->orphaned() ? "orphaned " : "")
            << "volume '" << volumeId << "' of storage class '"
            << storageClass->name() << "'";

  deleting.insert(volumeId);

  const uint64_t version = volume->version();

  return backend.get()->deleteVolume(volumeId)
    .recover([](const Future<Outcome<Nothing>>& future)
                 -> Future<Outcome<Nothing>> {
      return Outcome<Nothing>(BrokerError(
          BrokerError::BACKEND_UNAVAILABLE,
          future.isFailed() ? future.failure() : "Deletion was discarded"));
    })
    .then(process::defer(
        self(), &Self::_reclaim, volumeId, version, lambda::_1));
}


Outcome<Nothing> ReclaimerProcess::_reclaim(
    const string& volumeId,
    uint64_t version,
    const Outcome<Nothing>& result)
{
  deleting.erase(volumeId);

  if (result.isError()) {
    if (result.error().code == BrokerError::BACKEND_UNAVAILABLE) {
      LOG(WARNING) << "Failed to delete volume '" << volumeId << "', "
                   << "retrying in the next sweep: " << result.error();

      return result;
    }

    LOG(ERROR) << "Failed to delete volume '" << volumeId << "': "
               << result.error();

    Outcome<Volume> failed =
      store->markFailed(volumeId, stringify(result.error()));

    if (failed.isSome()) {
      ++metrics->volumes_failed;
    }

    return result;
  }

  Outcome<Nothing> removed = store->removeVolume(volumeId, version);
  if (removed.isError()) {
    // The storage is gone already; a later sweep retries the removal
    // with the current version, and deleting again is a no-op.
    LOG(WARNING) << "Failed to remove the record of deleted volume '"
                 << volumeId << "': " << removed.error();

    return removed;
  }

  retained.erase(volumeId);
  ++metrics->volumes_reclaimed;

  LOG(INFO) << "Reclaimed volume '" << volumeId << "'";

  return Nothing();
}


Future<Outcome<Volume>> ReclaimerProcess::recycle(const string& volumeId)
{
  Outcome<Volume> volume = store->getVolume(volumeId);
  if (volume.isError()) {
    return volume;
  }

  if (volume->state() != Volume::RELEASED || volume->orphaned()) {
    return Outcome<Volume>(BrokerError(
        BrokerError::INVALID_STATE,
        "Only released, not orphaned volumes can be recycled; volume '" +
        volumeId + "' is " + stringify(volume->state())));
  }

  Outcome<StorageClass> storageClass =
    catalog->lookup(volume->storage_class());

  if (storageClass.isError()) {
    return Outcome<Volume>(storageClass.error());
  }

  if (storageClass->reclaim_policy() != StorageClass::RETAIN) {
    return Outcome<Volume>(BrokerError(
        BrokerError::INVALID_STATE,
        "Volume '" + volumeId + "' is of storage class '" +
        storageClass->name() + "' which does not retain volumes"));
  }

  if (deleting.contains(volumeId)) {
    return Outcome<Volume>(BrokerError(
        BrokerError::INVALID_STATE,
        "Volume '" + volumeId + "' is being deleted"));
  }

  Outcome<Volume> recycled = store->makeAvailable(volumeId, volume->version());
  if (recycled.isSome()) {
    retained.erase(volumeId);

    LOG(INFO) << "Recycled volume '" << volumeId << "'";
  }

  return recycled;
}


void ReclaimerProcess::pause()
{
  LOG(INFO) << "Pausing periodic reclaim sweeps";
  paused = true;
}


void ReclaimerProcess::resume()
{
  LOG(INFO) << "Resuming periodic reclaim sweeps";
  paused = false;
}


Reclaimer::Reclaimer(
    ClaimStore* store,
    Catalog* catalog,
    Backends* backends,
    Metrics* metrics,
    const Duration& interval)
{
  process = new ReclaimerProcess(store, catalog, backends, metrics, interval);
  spawn(process);
}


Reclaimer::~Reclaimer()
{
  terminate(process);
  wait(process);
  delete process;
}


Future<Nothing> Reclaimer::sweep()
{
  return dispatch(process, &ReclaimerProcess::sweep);
}


Future<Outcome<Nothing>> Reclaimer::reclaim(const string& volumeId)
{
  return dispatch(process, &ReclaimerProcess::reclaim, volumeId);
}


Future<Outcome<Volume>> Reclaimer::recycle(const string& volumeId)
{
  return dispatch(process, &ReclaimerProcess::recycle, volumeId);
}


void Reclaimer::pause()
{
  dispatch(process, &ReclaimerProcess::pause);
}


void Reclaimer::resume()
{
  dispatch(process, &ReclaimerProcess::resume);
}

} // namespace internal {
} // namespace volbroker {
