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

#ifndef __RECLAIMER_RECLAIMER_PROCESS_HPP__
#define __RECLAIMER_RECLAIMER_PROCESS_HPP__

#include <string>

#include <volbroker/errors.hpp>
#include <volbroker/volbroker.hpp>

#include <process/future.hpp>
#include <process/id.hpp>
#include <process/process.hpp>
#include <process/timer.hpp>

#include <stout/duration.hpp>
#include <stout/hashset.hpp>
#include <stout/nothing.hpp>
#include <stout/option.hpp>

#include "backend/backends.hpp"

#include "catalog/catalog.hpp"

#include "common/metrics.hpp"

#include "store/claim_store.hpp"

namespace volbroker {
namespace internal {

class ReclaimerProcess : public process::Process<ReclaimerProcess>
{
public:
  ReclaimerProcess(
      ClaimStore* _store,
      Catalog* _catalog,
      Backends* _backends,
      Metrics* _metrics,
      const Duration& _interval)
    : ProcessBase(process::ID::generate("volume-reclaimer")),
      store(_store),
      catalog(_catalog),
      backends(_backends),
      metrics(_metrics),
      interval(_interval),
      paused(false) {}

  process::Future<Nothing> sweep();

  process::Future<Outcome<Nothing>> reclaim(const std::string& volumeId);

  process::Future<Outcome<Volume>> recycle(const std::string& volumeId);

  void pause();
  void resume();

protected:
  void initialize() override;
  void finalize() override;

private:
  void tick();

  Outcome<Nothing> _reclaim(
      const std::string& volumeId,
      uint64_t version,
      const Outcome<Nothing>& result);

  ClaimStore* store;
  Catalog* catalog;
  Backends* backends;
  Metrics* metrics;

  const Duration interval;

  bool paused;
  Option<process::Timer> timer;

  // Volumes with a deletion call in flight.
  hashset<std::string> deleting;

  // Volumes for which retention has been recorded.
  hashset<std::string> retained;
};

} // namespace internal {
} // namespace volbroker {

#endif // __RECLAIMER_RECLAIMER_PROCESS_HPP__
