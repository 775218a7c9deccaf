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

#ifndef __BINDER_BINDER_PROCESS_HPP__
#define __BINDER_BINDER_PROCESS_HPP__

#include <string>
#include <vector>

#include <volbroker/backend.hpp>
#include <volbroker/errors.hpp>
#include <volbroker/volbroker.hpp>

#include <process/future.hpp>
#include <process/id.hpp>
#include <process/loop.hpp>
#include <process/process.hpp>

#include <stout/bytes.hpp>
#include <stout/duration.hpp>
#include <stout/hashset.hpp>
#include <stout/nothing.hpp>
#include <stout/option.hpp>

#include "backend/backends.hpp"

#include "binder/backoff.hpp"

#include "catalog/catalog.hpp"

#include "common/metrics.hpp"

#include "reclaimer/reclaimer.hpp"

#include "store/claim_store.hpp"

namespace volbroker {
namespace internal {

class BinderProcess : public process::Process<BinderProcess>
{
public:
  BinderProcess(
      ClaimStore* _store,
      Catalog* _catalog,
      Backends* _backends,
      Reclaimer* _reclaimer,
      Metrics* _metrics,
      const BackoffPolicy& _policy)
    : ProcessBase(process::ID::generate("volume-binder")),
      store(_store),
      catalog(_catalog),
      backends(_backends),
      reclaimer(_reclaimer),
      metrics(_metrics),
      policy(_policy) {}

  process::Future<Outcome<Claim>> bind(const std::string& claimId);

  process::Future<Outcome<Claim>> attach(
      const std::string& claimId,
      const std::string& consumer);

  process::Future<Outcome<Claim>> release(
      const std::string& claimId,
      const std::string& reason);

  process::Future<Outcome<Claim>> update(
      const std::string& claimId,
      const Bytes& capacity,
      const AccessModes& accessModes,
      const Option<std::string>& storageClass);

  process::Future<Outcome<Volume>> resize(
      const std::string& claimId,
      const Bytes& capacity);

  process::Future<Outcome<std::vector<std::string>>> teardown(
      const std::string& workload);

private:
  // A single pass of the binding algorithm against the current
  // snapshot. Fails with `CONCURRENT_BIND_CONFLICT` if the snapshot
  // went stale, in which case `bind` starts over.
  process::Future<Outcome<Claim>> _bind(const std::string& claimId);

  // Leaves a claim Pending for `reason`.
  Outcome<Claim> pending(
      const std::string& claimId,
      const std::string& reason);

  Outcome<StorageClass> resolve(const Claim& claim) const;

  process::Future<Outcome<Claim>> provision(
      const Claim& claim,
      const StorageClass& storageClass);

  process::Future<Outcome<Volume>> _provision(
      const Claim& claim,
      const StorageClass& storageClass);

  process::Future<process::ControlFlow<Outcome<Claim>>> __provision(
      const Claim& claim,
      const Outcome<Volume>& volume);

  Outcome<Volume> _resize(const std::string& volumeId, const Bytes& size);

  // Hands a Released volume to the reclaimer.
  void reclaim(const std::string& volumeId);

  ClaimStore* store;
  Catalog* catalog;
  Backends* backends;
  Reclaimer* reclaimer;
  Metrics* metrics;

  const BackoffPolicy policy;

  // Claims with a provisioning call in flight.
  hashset<std::string> provisioning;
};

} // namespace internal {
} // namespace volbroker {

#endif // __BINDER_BINDER_PROCESS_HPP__
