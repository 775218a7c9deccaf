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

#ifndef __BINDER_BINDER_HPP__
#define __BINDER_BINDER_HPP__

#include <string>
#include <vector>

#include <volbroker/errors.hpp>
#include <volbroker/volbroker.hpp>

#include <process/future.hpp>

#include <stout/bytes.hpp>
#include <stout/nothing.hpp>
#include <stout/option.hpp>

#include "binder/backoff.hpp"

namespace volbroker {
namespace internal {

// Forward declarations.
class Backends;
class BinderProcess;
class Catalog;
class ClaimStore;
class Reclaimer;
struct Metrics;


// Binds Pending claims to volumes, provisioning new volumes through the
// backends when no existing volume fits.
//
// Work is spread over `workers` actors. All operations on one claim are
// handled by the same actor, so they are serialized, while distinct
// claims are bound in parallel. Races between actors over the same
// volume are resolved by the compare-and-swap operations of the store:
// the loser retries from scratch.
class Binder
{
public:
  Binder(
      ClaimStore* store,
      Catalog* catalog,
      Backends* backends,
      Reclaimer* reclaimer,
      Metrics* metrics,
      const BackoffPolicy& policy,
      size_t workers);

  virtual ~Binder();

  // Tries to bind a claim. The returned claim is Bound if binding
  // succeeded, Pending (with a reason) if it has to wait for capacity,
  // a consumer or a storage class, and Lost once the provisioning
  // budget is exhausted, in which case `PROVISIONING_EXHAUSTED` is
  // returned instead.
  process::Future<Outcome<Claim>> bind(const std::string& claimId);

  // Tries to bind every Pending claim.
  process::Future<Nothing> bindAll();

  // Supplies the consumer of a claim and resumes binding it.
  process::Future<Outcome<Claim>> attach(
      const std::string& claimId,
      const std::string& consumer);

  // Detaches a Bound claim from its volume, handing the volume to the
  // reclaimer once no claim holds it. A Pending claim is lost.
  process::Future<Outcome<Claim>> release(const std::string& claimId);

  // Deletes a claim. A Pending claim is lost immediately, even while a
  // provisioning call is in flight; a volume provisioned by such a call
  // is orphaned and reclaimed.
  process::Future<Outcome<Claim>> remove(const std::string& claimId);

  // Changes the request of a Pending claim, resets its provisioning
  // budget and tries to bind it.
  process::Future<Outcome<Claim>> update(
      const std::string& claimId,
      const Bytes& capacity,
      const AccessModes& accessModes,
      const Option<std::string>& storageClass);

  // Expands the volume bound to a claim, if its storage class allows.
  process::Future<Outcome<Volume>> resize(
      const std::string& claimId,
      const Bytes& capacity);

  // Drops the volumes a workload owned once it is gone, releasing the
  // claims that held them. Returns the ids of the deleted volumes.
  process::Future<Outcome<std::vector<std::string>>> teardown(
      const std::string& workload);

private:
  BinderProcess* worker(const std::string& claimId) const;

  ClaimStore* store;
  std::vector<BinderProcess*> processes;
};

} // namespace internal {
} // namespace volbroker {

#endif // __BINDER_BINDER_HPP__
