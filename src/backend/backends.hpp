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

#ifndef __BACKEND_BACKENDS_HPP__
#define __BACKEND_BACKENDS_HPP__

#include <vector>

#include <volbroker/backend.hpp>
#include <volbroker/errors.hpp>
#include <volbroker/volbroker.hpp>

#include <process/owned.hpp>

#include <stout/bytes.hpp>
#include <stout/hashmap.hpp>
#include <stout/try.hpp>

namespace volbroker {
namespace internal {

// Dispatches backend calls by the kind of a storage class. The registry
// is populated before any binder starts and is read-only afterwards.
class Backends
{
public:
  // Creates the built-in backend of every kind with the pool capacity
  // given in `capacities`. Kinds without a capacity get no backend.
  static Try<process::Owned<Backends>> create(
      const hashmap<StorageClass::Kind, Bytes>& capacities);

  Backends() {}

  // Replaces any backend registered for `kind`.
  void put(StorageClass::Kind kind, process::Owned<Backend> backend);

  // Fails with `BACKEND_UNAVAILABLE` if no backend serves `kind`.
  Outcome<Backend*> get(StorageClass::Kind kind) const;

  std::vector<Backend*> all() const;

private:
  hashmap<StorageClass::Kind, process::Owned<Backend>> backends;
};

} // namespace internal {
} // namespace volbroker {

#endif // __BACKEND_BACKENDS_HPP__
