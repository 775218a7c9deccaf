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

#include "broker/broker.hpp"

#include <memory>

#include <glog/logging.h>

#include <process/clock.hpp>
#include <process/delay.hpp>
#include <process/id.hpp>
#include <process/process.hpp>
#include <process/timer.hpp>

#include <stout/duration.hpp>
#include <stout/foreach.hpp>
#include <stout/hashmap.hpp>
#include <stout/stringify.hpp>
#include <stout/synchronized.hpp>
#include <stout/unreachable.hpp>
#include <stout/uuid.hpp>

#include "binder/backoff.hpp"

#include "catalog/utils.hpp"

#include "common/access_modes.hpp"

using std::shared_ptr;
using std::string;
using std::vector;

using process::Clock;
using process::Future;
using process::Owned;
using process::PID;
using process::Process;
using process::Timer;

namespace volbroker {
namespace internal {

// Periodically retries every Pending claim, e.g. to pick up capacity
// freed by the reclaimer.
class BindLoopProcess : public Process<BindLoopProcess>
{
public:
  BindLoopProcess(Binder* _binder, const Duration& _interval)
    : ProcessBase(process::ID::generate("bind-loop")),
      binder(_binder),
      interval(_interval) {}

protected:
  void initialize() override
  {
    if (interval > Duration::zero()) {
      timer = process::delay(interval, self(), &Self::tick);
    }
  }

  void finalize() override
  {
    if (timer.isSome()) {
      Clock::cancel(timer.get());
    }
  }

private:
  void tick()
  {
    // A pass may outlast the interval while provisioning calls back
    // off. Never run two passes at once.
    if (pass.isSome() && pass->isPending()) {
      VLOG(1) << "Skipping the bind pass as the previous one is still "
              << "in progress";
    } else {
      pass = binder->bindAll();
    }

    timer = process::delay(interval, self(), &Self::tick);
  }

  Binder* binder;
  const Duration interval;

  Option<Timer> timer;
  Option<Future<Nothing>> pass;
};


static BackoffPolicy backoffPolicy(const broker::Flags& flags)
{
  BackoffPolicy policy;
  policy.base = flags.provision_backoff;
  policy.multiplier = flags.provision_backoff_multiplier;
  policy.max = flags.provision_backoff_max;
  policy.jitter = flags.provision_backoff_jitter;
  policy.maxAttempts = flags.max_provision_attempts;

  return policy;
}


Try<Owned<Broker>> Broker::create(const broker::Flags& flags)
{
  hashmap<StorageClass::Kind, Bytes> capacities;

  if (flags.block_capacity > Bytes(0)) {
    capacities[StorageClass::BLOCK] = flags.block_capacity;
  }

  if (flags.filesystem_capacity > Bytes(0)) {
    capacities[StorageClass::FILESYSTEM] = flags.filesystem_capacity;
  }

  if (flags.object_capacity > Bytes(0)) {
    capacities[StorageClass::OBJECT] = flags.object_capacity;
  }

  if (flags.ephemeral_capacity > Bytes(0)) {
    capacities[StorageClass::EPHEMERAL] = flags.ephemeral_capacity;
  }

  Try<Owned<Backends>> backends = Backends::create(capacities);
  if (backends.isError()) {
    return Error(backends.error());
  }

  return create(flags, backends.get());
}


Try<Owned<Broker>> Broker::create(
    const broker::Flags& flags,
    const Owned<Backends>& backends)
{
  Option<Error> error = validate(backoffPolicy(flags));
  if (error.isSome()) {
    return Error("Invalid provisioning backoff: " + error->message);
  }

  if (flags.binder_workers == 0) {
    return Error("At least one binder worker is required");
  }

  if (flags.max_attempts_per_claim == 0) {
    return Error("'--max_attempts_per_claim' must be positive");
  }

  Owned<Broker> broker(new Broker(flags, backends));

  Try<Nothing> initialize = broker->initialize();
  if (initialize.isError()) {
    return Error(initialize.error());
  }

  return broker;
}


Broker::Broker(
    const broker::Flags& _flags,
    const Owned<Backends>& _backends)
  : flags(_flags),
    store(_flags.work_dir, _flags.max_events, _flags.max_attempts_per_claim),
    backends(_backends),
    metrics("volbroker/"),
    _observer(&store, &catalog) {}


Try<Nothing> Broker::initialize()
{
  Try<Nothing> recover = store.recover();
  if (recover.isError()) {
    return Error("Failed to recover the claim store: " + recover.error());
  }

  reclaimer.reset(new Reclaimer(
      &store,
      &catalog,
      backends.get(),
      &metrics,
      flags.reclaim_interval));

  binder.reset(new Binder(
      &store,
      &catalog,
      backends.get(),
      reclaimer.get(),
      &metrics,
      backoffPolicy(flags),
      flags.binder_workers));

  observerProcess.reset(new ObserverProcess("volbroker", _observer));
  process::spawn(observerProcess.get());

  bindLoop.reset(new BindLoopProcess(binder.get(), flags.bind_interval));
  process::spawn(bindLoop.get());

  shared_ptr<const ClaimStore::Snapshot> snapshot = store.snapshot();
  if (!snapshot->claims.empty() || !snapshot->volumes.empty()) {
    LOG(INFO) << "Recovered " << snapshot->claims.size() << " claims and "
              << snapshot->volumes.size() << " volumes";

    // Resume whatever was interrupted: bind the claims that were still
    // Pending and reclaim the volumes that were Released.
    binder->bindAll();
    reclaimer->sweep();
  }

  return Nothing();
}


Broker::~Broker()
{
  if (bindLoop.get() != nullptr) {
    process::terminate(bindLoop.get());
    process::wait(bindLoop.get());
  }

  if (observerProcess.get() != nullptr) {
    process::terminate(observerProcess.get());
    process::wait(observerProcess.get());
  }

  // The binder hands volumes to the reclaimer.
  binder.reset();
  reclaimer.reset();
}


Outcome<Nothing> Broker::addClass(const StorageClass& storageClass)
{
  Outcome<Nothing> add = catalog.add(storageClass);
  if (add.isError()) {
    return add;
  }

  LOG(INFO) << "Registered " << storageClass.kind() << " storage class '"
            << storageClass.name() << "'";

  // Claims may have been waiting for this class.
  binder->bindAll();

  return Nothing();
}


Outcome<Nothing> Broker::removeClass(const string& name)
{
  synchronized (mutex) {
    shared_ptr<const ClaimStore::Snapshot> snapshot = store.snapshot();

    foreachvalue (const Claim& claim, snapshot->claims) {
      if ((claim.state() == Claim::PENDING ||
           claim.state() == Claim::BOUND) &&
          claim.has_storage_class() &&
          claim.storage_class() == name) {
        return BrokerError(
            BrokerError::CLASS_IN_USE,
            "Storage class '" + name + "' is requested by claim '" +
            claim.id() + "'");
      }
    }

    foreachvalue (const Volume& volume, snapshot->volumes) {
      if (volume.state() == Volume::BOUND && volume.storage_class() == name) {
        return BrokerError(
            BrokerError::CLASS_IN_USE,
            "Storage class '" + name + "' is used by bound volume '" +
            volume.id() + "'");
      }
    }

    Outcome<Nothing> remove = catalog.remove(name);
    if (remove.isSome()) {
      LOG(INFO) << "Removed storage class '" << name << "'";
    }

    return remove;
  }

  UNREACHABLE();
}


Outcome<Nothing> Broker::loadCatalog(const string& json)
{
  Try<CatalogInfo> info = parseCatalog(json);
  if (info.isError()) {
    return BrokerError(
        BrokerError::INVALID_REQUEST,
        "Failed to parse catalog: " + info.error());
  }

  foreach (const StorageClass& storageClass, info->classes()) {
    Outcome<Nothing> add = addClass(storageClass);
    if (add.isError()) {
      return add;
    }
  }

  return Nothing();
}


Outcome<Volume> Broker::addVolume(const Volume& volume)
{
  Outcome<Volume> add = store.addVolume(volume);
  if (add.isError()) {
    return add;
  }

  LOG(INFO) << "Registered volume " << add->id() << " of "
            << Bytes(add->capacity_bytes()) << " in storage class '"
            << add->storage_class() << "'";

  binder->bindAll();

  return add;
}


Future<Outcome<Claim>> Broker::submit(const ClaimRequest& request)
{
  if (request.id.isSome() && request.id->empty()) {
    return Outcome<Claim>(BrokerError(
        BrokerError::INVALID_REQUEST,
        "The claim id must not be empty"));
  }

  if (request.capacity == Bytes(0)) {
    return Outcome<Claim>(BrokerError(
        BrokerError::INVALID_REQUEST,
        "A claim must request a positive capacity"));
  }

  if (request.accessModes.empty()) {
    return Outcome<Claim>(BrokerError(
        BrokerError::INVALID_REQUEST,
        "A claim must request at least one access mode"));
  }

  Claim claim;
  claim.set_id(
      request.id.isSome() ? request.id.get() : id::UUID::random().toString());
  claim.set_capacity_bytes(request.capacity.bytes());
  setAccessModes(request.accessModes, claim.mutable_access_modes());
  claim.set_state(Claim::PENDING);

  if (request.storageClass.isSome()) {
    claim.set_storage_class(request.storageClass.get());
  }

  if (request.consumer.isSome()) {
    claim.set_consumer(request.consumer.get());
  }

  synchronized (mutex) {
    Outcome<Claim> add = store.addClaim(claim);
    if (add.isError()) {
      return add;
    }
  }

  LOG(INFO) << "Received claim " << claim.id() << " for "
            << request.capacity << " with access modes "
            << request.accessModes
            << (request.storageClass.isSome()
                  ? " in storage class '" + request.storageClass.get() + "'"
                  : "");

  return binder->bind(claim.id());
}


Future<Outcome<Claim>> Broker::attach(
    const string& claimId,
    const string& consumer)
{
  return binder->attach(claimId, consumer);
}


Future<Outcome<Claim>> Broker::update(
    const string& claimId,
    const Bytes& capacity,
    const AccessModes& accessModes,
    const Option<string>& storageClass)
{
  if (capacity == Bytes(0) || accessModes.empty()) {
    return Outcome<Claim>(BrokerError(
        BrokerError::INVALID_REQUEST,
        "A claim must request a positive capacity and at least one "
        "access mode"));
  }

  return binder->update(claimId, capacity, accessModes, storageClass);
}


Future<Outcome<Claim>> Broker::release(const string& claimId)
{
  return binder->release(claimId);
}


Future<Outcome<Claim>> Broker::remove(const string& claimId)
{
  return binder->remove(claimId);
}


Future<Outcome<Volume>> Broker::resize(
    const string& claimId,
    const Bytes& capacity)
{
  return binder->resize(claimId, capacity);
}


Future<Outcome<vector<string>>> Broker::teardown(const string& workload)
{
  return binder->teardown(workload);
}


Future<Outcome<Volume>> Broker::recycle(const string& volumeId)
{
  Binder* binder = this->binder.get();

  return reclaimer->recycle(volumeId)
    .onReady([binder](const Outcome<Volume>& volume) {
      if (volume.isSome()) {
        binder->bindAll();
      }
    });
}


Future<Nothing> Broker::bindAll()
{
  return binder->bindAll();
}


Future<Nothing> Broker::sweep()
{
  return reclaimer->sweep();
}


void Broker::pauseReclaimer()
{
  reclaimer->pause();
}


void Broker::resumeReclaimer()
{
  reclaimer->resume();
}


PID<ObserverProcess> Broker::endpoints() const
{
  return observerProcess->self();
}

} // namespace internal {
} // namespace volbroker {
