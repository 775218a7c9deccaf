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

#include "observer/observer.hpp"

#include <algorithm>
#include <memory>

#include <stout/foreach.hpp>
#include <stout/json.hpp>
#include <stout/lambda.hpp>
#include <stout/numify.hpp>
#include <stout/protobuf.hpp>
#include <stout/strings.hpp>

#include "catalog/catalog.hpp"

#include "store/claim_store.hpp"

namespace http = process::http;

using std::shared_ptr;
using std::string;
using std::vector;

using process::Future;

using process::http::BadRequest;
using process::http::NotFound;
using process::http::OK;
using process::http::Request;
using process::http::Response;

namespace volbroker {
namespace internal {

Observer::Observer(const ClaimStore* _store, const Catalog* _catalog)
  : store(_store),
    catalog(_catalog) {}


Outcome<Claim> Observer::claim(const string& claimId) const
{
  return store->getClaim(claimId);
}


Outcome<Volume> Observer::volume(const string& volumeId) const
{
  return store->getVolume(volumeId);
}


vector<Claim> Observer::claims(const Option<Claim::State>& state) const
{
  shared_ptr<const ClaimStore::Snapshot> snapshot = store->snapshot();

  vector<Claim> result;
  foreachvalue (const Claim& claim, snapshot->claims) {
    if (state.isNone() || claim.state() == state.get()) {
      result.push_back(claim);
    }
  }

  std::sort(
      result.begin(),
      result.end(),
      [](const Claim& left, const Claim& right) {
        return left.id() < right.id();
      });

  return result;
}


vector<Volume> Observer::volumes(const Option<Volume::State>& state) const
{
  shared_ptr<const ClaimStore::Snapshot> snapshot = store->snapshot();

  vector<Volume> result;
  foreachvalue (const Volume& volume, snapshot->volumes) {
    if (state.isNone() || volume.state() == state.get()) {
      result.push_back(volume);
    }
  }

  std::sort(
      result.begin(),
      result.end(),
      [](const Volume& left, const Volume& right) {
        return left.sequence() < right.sequence();
      });

  return result;
}


vector<StorageClass> Observer::classes() const
{
  vector<StorageClass> result;
  foreachvalue (const StorageClass& storageClass, catalog->list()) {
    result.push_back(storageClass);
  }

  std::sort(
      result.begin(),
      result.end(),
      [](const StorageClass& left, const StorageClass& right) {
        return left.name() < right.name();
      });

  return result;
}


vector<Event> Observer::events(const Option<uint64_t>& after) const
{
  shared_ptr<const ClaimStore::Snapshot> snapshot = store->snapshot();

  vector<Event> result;
  foreach (const Event& event, snapshot->events) {
    if (after.isNone() || event.sequence() > after.get()) {
      result.push_back(event);
    }
  }

  return result;
}


template <typename T>
static JSON::Array jsonify(const vector<T>& messages)
{
  JSON::Array array;
  foreach (const T& message, messages) {
    array.values.push_back(JSON::protobuf(message));
  }

  return array;
}


// Parses the `state` query parameter as a value of the protobuf enum
// `State`, e.g. `Claim::State`.
template <typename State>
static Try<Option<State>> parseState(
    const Request& request,
    const lambda::function<bool(const string&, State*)>& parse)
{
  Option<string> value = request.url.query.get("state");
  if (value.isNone()) {
    return None();
  }

  State state;
  if (!parse(strings::upper(value.get()), &state)) {
    return Error("Unknown state '" + value.get() + "'");
  }

  return Some(state);
}


ObserverProcess::ObserverProcess(const string& id, const Observer& _observer)
  : ProcessBase(id),
    observer(_observer) {}


void ObserverProcess::initialize()
{
  route("/claims",
        "Lists claims, optionally filtered by `id` or `state`.",
        &ObserverProcess::claims);

  route("/volumes",
        "Lists volumes, optionally filtered by `id` or `state`.",
        &ObserverProcess::volumes);

  route("/classes",
        "Lists storage classes, optionally filtered by `id` (the name).",
        &ObserverProcess::classes);

  route("/events",
        "Lists recent binding events, optionally those `after` a sequence "
        "number.",
        &ObserverProcess::events);
}


Future<Response> ObserverProcess::claims(const Request& request)
{
  Option<string> jsonp = request.url.query.get("jsonp");
  Option<string> id = request.url.query.get("id");

  if (id.isSome()) {
    Outcome<Claim> claim = observer.claim(id.get());
    if (claim.isError()) {
      return NotFound(claim.error().message);
    }

    return OK(JSON::protobuf(claim.get()), jsonp);
  }

  Try<Option<Claim::State>> state = parseState<Claim::State>(
      request,
      [](const string& value, Claim::State* parsed) {
        return Claim::State_Parse(value, parsed);
      });

  if (state.isError()) {
    return BadRequest(state.error());
  }

  return OK(jsonify(observer.claims(state.get())), jsonp);
}


Future<Response> ObserverProcess::volumes(const Request& request)
{
  Option<string> jsonp = request.url.query.get("jsonp");
  Option<string> id = request.url.query.get("id");

  if (id.isSome()) {
    Outcome<Volume> volume = observer.volume(id.get());
    if (volume.isError()) {
      return NotFound(volume.error().message);
    }

    return OK(JSON::protobuf(volume.get()), jsonp);
  }

  Try<Option<Volume::State>> state = parseState<Volume::State>(
      request,
      [](const string& value, Volume::State* parsed) {
        return Volume::State_Parse(value, parsed);
      });

  if (state.isError()) {
    return BadRequest(state.error());
  }

  return OK(jsonify(observer.volumes(state.get())), jsonp);
}


Future<Response> ObserverProcess::classes(const Request& request)
{
  Option<string> jsonp = request.url.query.get("jsonp");
  Option<string> id = request.url.query.get("id");

  vector<StorageClass> classes;
  foreach (const StorageClass& storageClass, observer.classes()) {
    if (id.isNone() || storageClass.name() == id.get()) {
      classes.push_back(storageClass);
    }
  }

  if (id.isSome()) {
    if (classes.empty()) {
      return NotFound("Unknown storage class '" + id.get() + "'");
    }

    return OK(JSON::protobuf(classes.front()), jsonp);
  }

  return OK(jsonify(classes), jsonp);
}


Future<Response> ObserverProcess::events(const Request& request)
{
  Option<string> jsonp = request.url.query.get("jsonp");

  Option<uint64_t> after;
  Option<string> value = request.url.query.get("after");
  if (value.isSome()) {
    Try<uint64_t> sequence = numify<uint64_t>(value.get());
    if (sequence.isError()) {
      return BadRequest(
          "Invalid 'after' parameter '" + value.get() + "': " +
          sequence.error());
    }

    after = sequence.get();
  }

  return OK(jsonify(observer.events(after)), jsonp);
}

} // namespace internal {
} // namespace volbroker {
