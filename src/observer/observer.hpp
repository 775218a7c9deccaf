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

#ifndef __OBSERVER_OBSERVER_HPP__
#define __OBSERVER_OBSERVER_HPP__

#include <string>
#include <vector>

#include <volbroker/errors.hpp>
#include <volbroker/volbroker.hpp>

#include <process/future.hpp>
#include <process/http.hpp>
#include <process/process.hpp>

#include <stout/option.hpp>

namespace volbroker {
namespace internal {

// Forward declarations.
class Catalog;
class ClaimStore;


// Read-only projection of the claim store and the catalog. Every query
// reads one snapshot, so its result is consistent, and never waits for
// a mutation.
class Observer
{
public:
  Observer(const ClaimStore* store, const Catalog* catalog);

  Outcome<Claim> claim(const std::string& claimId) const;
  Outcome<Volume> volume(const std::string& volumeId) const;

  // Sorted by id.
  std::vector<Claim> claims(
      const Option<Claim::State>& state = None()) const;

  // Sorted by creation order.
  std::vector<Volume> volumes(
      const Option<Volume::State>& state = None()) const;

  // Sorted by name.
  std::vector<StorageClass> classes() const;

  // Events with a sequence number greater than `after`, oldest first.
  std::vector<Event> events(const Option<uint64_t>& after = None()) const;

private:
  const ClaimStore* store;
  const Catalog* catalog;
};


// Serves the observer queries over HTTP:
//
//   /<id>/claims    [?id=<claim>] [&state=<PENDING|BOUND|LOST|RELEASED>]
//   /<id>/volumes   [?id=<volume>] [&state=<AVAILABLE|BOUND|...>]
//   /<id>/classes   [?id=<name>]
//   /<id>/events    [?after=<sequence>]
class ObserverProcess : public process::Process<ObserverProcess>
{
public:
  ObserverProcess(const std::string& id, const Observer& observer);

protected:
  void initialize() override;

private:
  process::Future<process::http::Response> claims(
      const process::http::Request& request);

  process::Future<process::http::Response> volumes(
      const process::http::Request& request);

  process::Future<process::http::Response> classes(
      const process::http::Request& request);

  process::Future<process::http::Response> events(
      const process::http::Request& request);

  const Observer observer;
};

} // namespace internal {
} // namespace volbroker {

#endif // __OBSERVER_OBSERVER_HPP__
