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

#ifndef __BROKER_BROKER_HPP__
#define __BROKER_BROKER_HPP__

#include <mutex>
#include <string>
#include <vector>

#include <volbroker/errors.hpp>
#include <volbroker/volbroker.hpp>

#include <process/future.hpp>
#include <process/owned.hpp>
#include <process/pid.hpp>

#include <stout/bytes.hpp>
#include <stout/nothing.hpp>
#include <stout/option.hpp>
#include <stout/try.hpp>

#include "backend/backends.hpp"

#include "binder/binder.hpp"

#include "broker/flags.hpp"

#include "catalog/catalog.hpp"

#include "common/metrics.hpp"

#include "observer/observer.hpp"

#include "reclaimer/reclaimer.hpp"

#include "store/claim_store.hpp"

namespace volbroker {
namespace internal {

// Forward declarations.
class BindLoopProcess;


// A request for storage submitted by a workload.
struct ClaimRequest
{
  // Generated if not set.
  Option<std::string> id;

  Bytes capacity;
  AccessModes accessModes;

  Option<std::string> storageClass;
  Option<std::string> consumer;
};


// Wires the catalog, the claim store, the backends, the binder, the
// reclaimer and the observer together and exposes them to the host
// process.
class Broker
{
public:
  // Creates a broker with the built-in backends sized by `flags`, and
  // recovers the claim store if `--work_dir` is set.
  static Try<process::Owned<Broker>> create(const broker::Flags& flags);

  // Same as above but provisions through `backends`.
  static Try<process::Owned<Broker>> create(
      const broker::Flags& flags,
      const process::Owned<Backends>& backends);

  ~Broker();

  // Storage classes.
  Outcome<Nothing> addClass(const StorageClass& storageClass);

  // Fails with `CLASS_IN_USE` while a Pending or Bound claim names
  // the class.
  Outcome<Nothing> removeClass(const std::string& name);

  // Registers every class of a JSON catalog document. Classes that
  // precede an invalid one remain registered.
  Outcome<Nothing> loadCatalog(const std::string& json);

  // Registers a pre-provisioned volume as Available.
  Outcome<Volume> addVolume(const Volume& volume);

  // Claims.
  process::Future<Outcome<Claim>> submit(const ClaimRequest& request);

  process::Future<Outcome<Claim>> attach(
      const std::string& claimId,
      const std::string& consumer);

  process::Future<Outcome<Claim>> update(
      const std::string& claimId,
      const Bytes& capacity,
      const AccessModes& accessModes,
      const Option<std::string>& storageClass);

  process::Future<Outcome<Claim>> release(const std::string& claimId);
  process::Future<Outcome<Claim>> remove(const std::string& claimId);

  process::Future<Outcome<Volume>> resize(
      const std::string& claimId,
      const Bytes& capacity);

  // Volumes.
  process::Future<Outcome<std::vector<std::string>>> teardown(
      const std::string& workload);

  process::Future<Outcome<Volume>> recycle(const std::string& volumeId);

  process::Future<Nothing> bindAll();
  process::Future<Nothing> sweep();

  void pauseReclaimer();
  void resumeReclaimer();

  const Observer& observer() const { return _observer; }

  // The process serving the HTTP endpoints of the observer.
  process::PID<ObserverProcess> endpoints() const;

private:
  Broker(
      const broker::Flags& flags,
      const process::Owned<Backends>& backends);

  Broker(const Broker&) = delete;
  Broker& operator=(const Broker&) = delete;

  Try<Nothing> initialize();

  const broker::Flags flags;

  Catalog catalog;
  ClaimStore store;
  process::Owned<Backends> backends;
  Metrics metrics;

  process::Owned<Reclaimer> reclaimer;
  process::Owned<Binder> binder;

  const Observer _observer;
  process::Owned<ObserverProcess> observerProcess;
  process::Owned<BindLoopProcess> bindLoop;

  // Serializes claim intake against class removal, so that no claim
  // naming a class can be admitted while the class is being removed.
  std::mutex mutex;
};

} // namespace internal {
} // namespace volbroker {

#endif // __BROKER_BROKER_HPP__
