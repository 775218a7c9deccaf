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

#ifndef __RECLAIMER_RECLAIMER_HPP__
#define __RECLAIMER_RECLAIMER_HPP__

#include <string>

#include <volbroker/errors.hpp>
#include <volbroker/volbroker.hpp>

#include <process/future.hpp>

#include <stout/duration.hpp>
#include <stout/nothing.hpp>

namespace volbroker {
namespace internal {

// Forward declarations.
class Backends;
class Catalog;
class ClaimStore;
class ReclaimerProcess;
struct Metrics;


// Applies the reclaim policy of their storage class to Released
// volumes. Volumes of a `DELETE` class, and orphaned volumes, are
// deleted through their backend and then dropped from the store.
// Volumes of a `RETAIN` class stay Released until an administrator
// recycles them.
//
// Every `interval` all Released volumes are swept. A transient backend
// failure leaves the volume for the next sweep; any other failure marks
// the volume Failed.
class Reclaimer
{
public:
  // A zero `interval` disables periodic sweeps.
  Reclaimer(
      ClaimStore* store,
      Catalog* catalog,
      Backends* backends,
      Metrics* metrics,
      const Duration& interval);

  virtual ~Reclaimer();

  // Reclaims every Released volume. The future is ready once all of
  // them have been processed.
  process::Future<Nothing> sweep();

  // Reclaims a single Released volume right away.
  process::Future<Outcome<Nothing>> reclaim(const std::string& volumeId);

  // Makes a Released volume of a `RETAIN` class Available again. Fails
  // with `INVALID_STATE` for any other volume.
  process::Future<Outcome<Volume>> recycle(const std::string& volumeId);

  // Skips periodic sweeps until `resume` is called. Explicit calls to
  // `sweep` and `reclaim` are unaffected.
  void pause();
  void resume();

private:
  ReclaimerProcess* process;
};

} // namespace internal {
} // namespace volbroker {

#endif // __RECLAIMER_RECLAIMER_HPP__
