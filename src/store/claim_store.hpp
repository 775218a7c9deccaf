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

#ifndef __STORE_CLAIM_STORE_HPP__
#define __STORE_CLAIM_STORE_HPP__

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <volbroker/errors.hpp>
#include <volbroker/volbroker.hpp>

#include <boost/circular_buffer.hpp>

#include <stout/bytes.hpp>
#include <stout/error.hpp>
#include <stout/hashmap.hpp>
#include <stout/lambda.hpp>
#include <stout/nothing.hpp>
#include <stout/option.hpp>
#include <stout/try.hpp>

#include "common/constants.hpp"

namespace volbroker {
namespace internal {

// The source of truth for claims, volumes and their binding state.
//
// Every mutation runs under a single writer mutex, builds a new
// immutable `Snapshot`, checkpoints it (if a work directory is set) and
// then publishes it. Readers take the current snapshot without locking
// and thus never block on, or observe a partial, mutation.
//
// Claims and volumes carry a `version` that is bumped whenever their
// binding state changes. Mutations that act on a decision made from an
// earlier snapshot pass the versions they observed and fail with
// `CONCURRENT_BIND_CONFLICT` if either entity changed in the meantime.
//
// NOTE: No backend call is ever made while holding the writer mutex.
class ClaimStore
{
public:
  struct Snapshot
  {
    explicit Snapshot(size_t maxEvents = DEFAULT_MAX_EVENTS)
      : events(maxEvents), nextSequence(1), nextEvent(1) {}

    hashmap<std::string, Claim> claims;
    hashmap<std::string, Volume> volumes;

    // The most recent `maxEvents` events, oldest first.
    boost::circular_buffer<Event> events;

    uint64_t nextSequence;
    uint64_t nextEvent;
  };

  // If `workDir` is set every mutation is checkpointed below it. Each
  // claim keeps at most `maxAttempts` entries of attempt history.
  explicit ClaimStore(
      const Option<std::string>& workDir = None(),
      size_t maxEvents = DEFAULT_MAX_EVENTS,
      size_t maxAttempts = DEFAULT_MAX_ATTEMPTS_PER_CLAIM);

  // Loads the last checkpoint, if any. Must be called before any
  // mutation. Events are not checkpointed.
  Try<Nothing> recover();

  std::shared_ptr<const Snapshot> snapshot() const;

  Outcome<Claim> getClaim(const std::string& claimId) const;
  Outcome<Volume> getVolume(const std::string& volumeId) const;

  // Checks whether `claim` may be bound to `volume` in `snapshot`:
  // the volume is Available, or Bound and shared by claims that all
  // request shareable modes only; the class matches if the claim names
  // one; capacity and access modes suffice; and an ephemeral volume
  // belongs to the claim's consumer.
  static Option<Error> bindable(
      const Snapshot& snapshot,
      const Claim& claim,
      const Volume& volume);

  // Inserts a new Pending claim. Fails with `INVALID_REQUEST` if a claim
  // with the same id exists.
  Outcome<Claim> addClaim(const Claim& claim);

  // Inserts a pre-provisioned volume in Available state.
  Outcome<Volume> addVolume(const Volume& volume);

  // Replaces the request of a Pending claim and resets its retry budget.
  Outcome<Claim> updateClaim(
      const std::string& claimId,
      uint64_t version,
      const Bytes& capacity,
      const AccessModes& accessModes,
      const Option<std::string>& storageClass);

  Outcome<Claim> setConsumer(
      const std::string& claimId,
      const std::string& consumer);

  // Records why a claim is still Pending. Does not bump the version.
  Outcome<Claim> setReason(
      const std::string& claimId,
      const std::string& reason);

  // Appends a failed attempt to the history of a Pending claim, counting
  // it against the retry budget if `retry` is set. The oldest attempts
  // are dropped once the history exceeds `maxAttempts`. Does not bump
  // the version.
  Outcome<Claim> recordAttempt(
      const std::string& claimId,
      const Attempt& attempt,
      bool retry);

  // Pending -> Lost.
  Outcome<Claim> markLost(
      const std::string& claimId,
      const std::string& reason);

  // Binds an existing volume to a Pending claim.
  Outcome<Claim> bind(
      const std::string& claimId,
      uint64_t claimVersion,
      const std::string& volumeId,
      uint64_t volumeVersion);

  // Inserts a freshly provisioned volume and binds it to the claim in
  // one step. If the claim changed since `claimVersion` the volume is
  // inserted Available and `CONCURRENT_BIND_CONFLICT` is returned. If
  // the claim is gone or no longer Pending the volume is inserted
  // Released and orphaned, and `INVALID_STATE` is returned.
  Outcome<Claim> adopt(
      const Volume& volume,
      const std::string& claimId,
      uint64_t claimVersion);

  // Bound -> Released, and the volume becomes Released when its last
  // claim leaves. Pending -> Lost.
  Outcome<Claim> release(
      const std::string& claimId,
      const std::string& reason);

  // Any state -> Failed.
  Outcome<Volume> markFailed(
      const std::string& volumeId,
      const std::string& message);

  // Records that a Released volume is kept because of its reclaim
  // policy.
  Outcome<Volume> retain(const std::string& volumeId);

  // Released -> Available. Orphaned volumes can not be made available.
  Outcome<Volume> makeAvailable(
      const std::string& volumeId,
      uint64_t version);

  Outcome<Volume> resize(
      const std::string& volumeId,
      uint64_t version,
      const Bytes& capacity);

  // Drops the record of a volume that is not Bound.
  Outcome<Nothing> removeVolume(
      const std::string& volumeId,
      uint64_t version);

  // Drops the record of a volume whose storage disappeared with its
  // workload. Claims holding it become Released; their ids are returned.
  Outcome<std::vector<std::string>> forget(const std::string& volumeId);

private:
  ClaimStore(const ClaimStore&) = delete;
  ClaimStore& operator=(const ClaimStore&) = delete;

  // Applies `f` to a copy of the current snapshot and publishes the copy
  // if `f` succeeds, or if `f` fails after setting its second argument.
  template <typename T>
  Outcome<T> mutate(const lambda::function<Outcome<T>(Snapshot*, bool*)>& f);

  void record(
      Snapshot* snapshot,
      Event::Type type,
      const Option<std::string>& claimId,
      const Option<std::string>& volumeId,
      const std::string& message) const;

  const Option<std::string> workDir;
  const size_t maxEvents;
  const size_t maxAttempts;

  std::mutex mutex;
  std::shared_ptr<const Snapshot> current;
};

} // namespace internal {
} // namespace volbroker {

#endif // __STORE_CLAIM_STORE_HPP__
