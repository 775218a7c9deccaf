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

#include "backend/backends.hpp"

#include <glog/logging.h>

#include <stout/foreach.hpp>
#include <stout/stringify.hpp>

using std::vector;

using process::Owned;

namespace volbroker {
namespace internal {

Try<Owned<Backends>> Backends::create(
    const hashmap<StorageClass::Kind, Bytes>& capacities)
{
  Owned<Backends> backends(new Backends());

  foreachpair (StorageClass::Kind kind, const Bytes& capacity, capacities) {
    Try<Backend*> backend = Backend::create(kind, capacity);
    if (backend.isError()) {
      return Error(
          "Failed to create " + stringify(kind) + " backend: " +
          backend.error());
    }

    LOG(INFO) << "Created " << kind << " backend with a capacity of "
              << capacity;

    backends->put(kind, Owned<Backend>(backend.get()));
  }

  return backends;
}


void Backends::put(StorageClass::Kind kind, Owned<Backend> backend)
{
  backends[kind] = backend;
}


Outcome<Backend*> Backends::get(StorageClass::Kind kind) const
{
  if (!backends.contains(kind)) {
    return BrokerError(
        BrokerError::BACKEND_UNAVAILABLE,
        "No backend serves " + stringify(kind) + " storage");
  }

  return backends.at(kind).get();
}


vector<Backend*> Backends::all() const
{
  vector<Backend*> result;
  foreachvalue (const Owned<Backend>& backend, backends) {
    result.push_back(backend.get());
  }

  return result;
}

} // namespace internal {
} // namespace volbroker {
