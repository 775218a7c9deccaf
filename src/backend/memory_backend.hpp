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

#ifndef __BACKEND_MEMORY_BACKEND_HPP__
#define __BACKEND_MEMORY_BACKEND_HPP__

#include <mutex>
#include <string>
#include <vector>

#include <volbroker/backend.hpp>
#include <volbroker/volbroker.hpp>

#include <process/future.hpp>

#include <stout/bytes.hpp>
#include <stout/hashmap.hpp>
#include <stout/nothing.hpp>
#include <stout/option.hpp>
#include <stout/try.hpp>

namespace volbroker {
namespace internal {

// A backend modeling a fixed-size capacity pool. Volumes are records in
// memory; creating one reserves capacity from the pool (rounded up to
// the allocation granularity) and deleting it returns the capacity.
class MemoryBackend : public Backend
{
public:
  struct Capabilities
  {
    AccessModes accessModes;

    // Allocations are rounded up to a multiple of this. A storage class
    // may override it with its `granularity` parameter.
    Option<Bytes> granularity;

    bool resizable;
  };

  // Returns the capabilities of the built-in backend for `kind`.
  static Capabilities capabilities(StorageClass::Kind kind);

  MemoryBackend(
      StorageClass::Kind kind,
      const Capabilities& capabilities,
      const Bytes& capacity);

  ~MemoryBackend() override {}

  process::Future<Outcome<Volume>> createVolume(
      const StorageClass& storageClass,
      const Bytes& capacity,
      const AccessModes& accessModes,
      const Option<std::string>& workload) override;

  process::Future<Outcome<Nothing>> deleteVolume(
      const std::string& volumeId) override;

  process::Future<Outcome<Bytes>> resizeVolume(
      const std::string& volumeId,
      const Bytes& capacity) override;

  Bytes capacity() const;
  Bytes allocated() const;
  bool contains(const std::string& volumeId) const;

protected:
  struct Allocation
  {
    Bytes size;
    Option<Bytes> granularity;
    Option<std::string> workload;
  };

  // Reserves capacity for a new volume. Must be called with `mutex` held.
  Outcome<Volume> allocate(
      const StorageClass& storageClass,
      const Bytes& capacity,
      const AccessModes& accessModes,
      const Option<std::string>& workload);

  // Returns the capacity of a volume to the pool. Must be called with
  // `mutex` held.
  void deallocate(const std::string& volumeId);

  const StorageClass::Kind kind;
  const Capabilities caps;
  const Bytes total;

  mutable std::mutex mutex;
  hashmap<std::string, Allocation> allocations;
  Bytes used;
};


// Volumes local to a workload. Creation requires a workload context
// and `teardown` deletes every volume of a workload at once.
class EphemeralBackend : public MemoryBackend
{
public:
  explicit EphemeralBackend(const Bytes& capacity);

  process::Future<Outcome<Volume>> createVolume(
      const StorageClass& storageClass,
      const Bytes& capacity,
      const AccessModes& accessModes,
      const Option<std::string>& workload) override;

  process::Future<Outcome<std::vector<std::string>>> teardown(
      const std::string& workload) override;
};


// Rounds `capacity` up to a multiple of `granularity`. Fails if the
// result does not fit in 64 bits.
Try<Bytes> roundUp(const Bytes& capacity, const Bytes& granularity);

} // namespace internal {
} // namespace volbroker {

#endif // __BACKEND_MEMORY_BACKEND_HPP__
