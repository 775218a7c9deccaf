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

#include "backend/memory_backend.hpp"

#include <limits>

#include <glog/logging.h>

#include <stout/foreach.hpp>
#include <stout/stringify.hpp>
#include <stout/strings.hpp>
#include <stout/synchronized.hpp>
#include <stout/try.hpp>
#include <stout/unreachable.hpp>
#include <stout/uuid.hpp>

#include "catalog/utils.hpp"

#include "common/access_modes.hpp"

using std::string;
using std::vector;

using process::Future;

namespace volbroker {
namespace internal {

Try<Bytes> roundUp(const Bytes& capacity, const Bytes& granularity)
{
  CHECK_GT(granularity.bytes(), 0u);

  const uint64_t remainder = capacity.bytes() % granularity.bytes();
  if (remainder == 0) {
    return capacity;
  }

  const uint64_t padding = granularity.bytes() - remainder;
  if (capacity.bytes() > std::numeric_limits<uint64_t>::max() - padding) {
    return Error(
        "Rounding " + stringify(capacity) + " up to a multiple of " +
        stringify(granularity) + " overflows");
  }

  return Bytes(capacity.bytes() + padding);
}


MemoryBackend::Capabilities MemoryBackend::capabilities(
    StorageClass::Kind kind)
{
  switch (kind) {
    case StorageClass::BLOCK:
      return Capabilities{
          {READ_WRITE_ONCE, READ_ONLY_MANY, READ_WRITE_ONCE_POD},
          Gigabytes(1),
          true};
    case StorageClass::FILESYSTEM:
      return Capabilities{
          {READ_WRITE_ONCE, READ_ONLY_MANY, READ_WRITE_MANY,
           READ_WRITE_ONCE_POD},
          Megabytes(1),
          true};
    case StorageClass::OBJECT:
      return Capabilities{
          {READ_ONLY_MANY, READ_WRITE_MANY},
          None(),
          false};
    case StorageClass::EPHEMERAL:
      return Capabilities{
          {READ_WRITE_ONCE, READ_WRITE_ONCE_POD},
          None(),
          false};
    case StorageClass::UNKNOWN_KIND:
      break;
  }

  UNREACHABLE();
}


MemoryBackend::MemoryBackend(
    StorageClass::Kind _kind,
    const Capabilities& _caps,
    const Bytes& _total)
  : kind(_kind),
    caps(_caps),
    total(_total),
    used(0) {}


Future<Outcome<Volume>> MemoryBackend::createVolume(
    const StorageClass& storageClass,
    const Bytes& capacity,
    const AccessModes& accessModes,
    const Option<string>& /* workload */)
{
  // Volumes of this backend outlive their consumers, so they are not
  // associated with the workload.
  synchronized (mutex) {
    return allocate(storageClass, capacity, accessModes, None());
  }

  UNREACHABLE();
}


Future<Outcome<Nothing>> MemoryBackend::deleteVolume(const string& volumeId)
{
  synchronized (mutex) {
    if (!allocations.contains(volumeId)) {
      VLOG(1) << "Ignoring deletion of unknown " << kind << " volume '"
              << volumeId << "'";

      return Outcome<Nothing>(Nothing());
    }

    deallocate(volumeId);
  }

  return Outcome<Nothing>(Nothing());
}


Future<Outcome<Bytes>> MemoryBackend::resizeVolume(
    const string& volumeId,
    const Bytes& capacity)
{
  if (!caps.resizable) {
    return Outcome<Bytes>(BrokerError(
        BrokerError::RESIZE_NOT_SUPPORTED,
        stringify(kind) + " volumes can not be resized"));
  }

  synchronized (mutex) {
    if (!allocations.contains(volumeId)) {
      return Outcome<Bytes>(BrokerError(
          BrokerError::VOLUME_NOT_FOUND,
          "Unknown " + stringify(kind) + " volume '" + volumeId + "'"));
    }

    Allocation& allocation = allocations.at(volumeId);

    Try<Bytes> rounded = allocation.granularity.isSome()
      ? roundUp(capacity, allocation.granularity.get())
      : Try<Bytes>(capacity);

    if (rounded.isError()) {
      return Outcome<Bytes>(BrokerError(
          BrokerError::INSUFFICIENT_CAPACITY,
          "Can not grow volume '" + volumeId + "': " + rounded.error()));
    }

    const Bytes size = rounded.get();

    if (size <= allocation.size) {
      return Outcome<Bytes>(allocation.size);
    }

    // `used` never exceeds `total`, so the free capacity does not wrap.
    const Bytes growth = size - allocation.size;
    if (growth > total - used) {
      return Outcome<Bytes>(BrokerError(
          BrokerError::INSUFFICIENT_CAPACITY,
          "Growing volume '" + volumeId + "' by " + stringify(growth) +
          " exceeds the free capacity of " + stringify(total - used)));
    }

    used += growth;
    allocation.size = size;

    LOG(INFO) << "Resized " << kind << " volume '" << volumeId << "' to "
              << size;

    return Outcome<Bytes>(size);
  }

  UNREACHABLE();
}


Bytes MemoryBackend::capacity() const
{
  return total;
}


Bytes MemoryBackend::allocated() const
{
  synchronized (mutex) {
    return used;
  }

  UNREACHABLE();
}


bool MemoryBackend::contains(const string& volumeId) const
{
  synchronized (mutex) {
    return allocations.contains(volumeId);
  }

  UNREACHABLE();
}


Outcome<Volume> MemoryBackend::allocate(
    const StorageClass& storageClass,
    const Bytes& capacity,
    const AccessModes& accessModes,
    const Option<string>& workload)
{
  if (storageClass.kind() != kind) {
    return BrokerError(
        BrokerError::INVALID_REQUEST,
        "Storage class '" + storageClass.name() + "' is of kind " +
        stringify(storageClass.kind()) + ", not " + stringify(kind));
  }

  if (accessModes.empty() || !satisfies(caps.accessModes, accessModes)) {
    return BrokerError(
        BrokerError::INCOMPATIBLE_ACCESS_MODE,
        stringify(kind) + " volumes support " + stringify(caps.accessModes) +
        ", not " + stringify(accessModes));
  }

  Option<Bytes> granularity = caps.granularity;

  Result<Bytes> parameter = internal::granularity(storageClass);
  if (parameter.isError()) {
    return BrokerError(BrokerError::INVALID_REQUEST, parameter.error());
  } else if (parameter.isSome()) {
    granularity = parameter.get();
  }

  Try<Bytes> rounded = granularity.isSome()
    ? roundUp(capacity, granularity.get())
    : Try<Bytes>(capacity);

  if (rounded.isError()) {
    return BrokerError(BrokerError::INSUFFICIENT_CAPACITY, rounded.error());
  }

  const Bytes size = rounded.get();

  if (size > total - used) {
    return BrokerError(
        BrokerError::INSUFFICIENT_CAPACITY,
        "Allocating " + stringify(size) + " exceeds the free " +
        stringify(kind) + " capacity of " + stringify(total - used));
  }

  Volume volume;
  volume.set_id(
      strings::lower(stringify(kind)) + "-" + id::UUID::random().toString());
  volume.set_storage_class(storageClass.name());
  volume.set_capacity_bytes(size.bytes());
  volume.set_state(Volume::AVAILABLE);
  setAccessModes(accessModes, volume.mutable_access_modes());

  if (workload.isSome()) {
    volume.set_workload(workload.get());
  }

  (*volume.mutable_context())["backend"] = "memory";
  (*volume.mutable_context())["kind"] = stringify(kind);

  foreach (const auto& entry, storageClass.parameters()) {
    (*volume.mutable_context())["parameter." + entry.first] = entry.second;
  }

  allocations.put(volume.id(), Allocation{size, granularity, workload});
  used += size;

  LOG(INFO) << "Allocated " << kind << " volume '" << volume.id() << "' of "
            << size << " for storage class '" << storageClass.name() << "' ("
            << used << " of " << total << " in use)";

  return volume;
}


void MemoryBackend::deallocate(const string& volumeId)
{
  CHECK(allocations.contains(volumeId));

  used -= allocations.at(volumeId).size;
  allocations.erase(volumeId);

  LOG(INFO) << "Deleted " << kind << " volume '" << volumeId << "' ("
            << used << " of " << total << " in use)";
}


EphemeralBackend::EphemeralBackend(const Bytes& capacity)
  : MemoryBackend(
        StorageClass::EPHEMERAL,
        MemoryBackend::capabilities(StorageClass::EPHEMERAL),
        capacity) {}


Future<Outcome<Volume>> EphemeralBackend::createVolume(
    const StorageClass& storageClass,
    const Bytes& capacity,
    const AccessModes& accessModes,
    const Option<string>& workload)
{
  if (workload.isNone() || workload->empty()) {
    return Outcome<Volume>(BrokerError(
        BrokerError::INVALID_REQUEST,
        "Ephemeral volumes require a workload context"));
  }

  synchronized (mutex) {
    return allocate(storageClass, capacity, accessModes, workload);
  }

  UNREACHABLE();
}


Future<Outcome<vector<string>>> EphemeralBackend::teardown(
    const string& workload)
{
  vector<string> deleted;

  synchronized (mutex) {
    foreachpair (const string& volumeId,
                 const Allocation& allocation,
                 allocations) {
      if (allocation.workload == workload) {
        deleted.push_back(volumeId);
      }
    }

    foreach (const string& volumeId, deleted) {
      deallocate(volumeId);
    }
  }

  LOG(INFO) << "Tore down " << deleted.size() << " ephemeral volumes of "
            << "workload '" << workload << "'";

  return Outcome<vector<string>>(deleted);
}

} // namespace internal {
} // namespace volbroker {
