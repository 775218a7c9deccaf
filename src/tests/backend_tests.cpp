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

#include <limits>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include <volbroker/backend.hpp>
#include <volbroker/volbroker.hpp>

#include <process/future.hpp>
#include <process/gtest.hpp>
#include <process/owned.hpp>

#include <stout/bytes.hpp>
#include <stout/gtest.hpp>
#include <stout/hashmap.hpp>

#include "backend/backends.hpp"
#include "backend/memory_backend.hpp"

#include "catalog/utils.hpp"

#include "common/access_modes.hpp"

#include "tests/volbroker.hpp"

using std::string;
using std::vector;

using process::Future;
using process::Owned;

namespace volbroker {
namespace internal {
namespace tests {

TEST(BackendTest, RoundUp)
{
  EXPECT_SOME_EQ(Gigabytes(12), roundUp(Gigabytes(10), Gigabytes(12)));
  EXPECT_SOME_EQ(Gigabytes(12), roundUp(Gigabytes(12), Gigabytes(12)));
  EXPECT_SOME_EQ(
      Gigabytes(24),
      roundUp(Gigabytes(12) + Bytes(1), Gigabytes(12)));
  EXPECT_SOME_EQ(Megabytes(1), roundUp(Bytes(1), Megabytes(1)));

  const uint64_t max = std::numeric_limits<uint64_t>::max();

  // The largest multiple of 1MB still fits, anything above it does not.
  const Bytes largest(max - max % Megabytes(1).bytes());

  EXPECT_SOME_EQ(largest, roundUp(largest, Megabytes(1)));
  EXPECT_ERROR(roundUp(largest + Bytes(1), Megabytes(1)));
  EXPECT_ERROR(roundUp(Bytes(max - 100), Gigabytes(1)));
}


// The granularity of a storage class overrides the one of its backend.
TEST(BackendTest, ClassGranularity)
{
  Try<Backend*> create = Backend::create(StorageClass::BLOCK, Gigabytes(100));
  ASSERT_SOME(create);

  Owned<Backend> backend(create.get());

  StorageClass storageClass =
    createStorageClass("fast-block", StorageClass::BLOCK);
  (*storageClass.mutable_parameters())[GRANULARITY_PARAMETER] = "12GB";
  (*storageClass.mutable_parameters())["iops"] = "3000";

  Future<Outcome<Volume>> volume = backend->createVolume(
      storageClass, Gigabytes(10), {READ_WRITE_ONCE}, None());

  AWAIT_READY(volume);
  ASSERT_SOME(volume.get());

  EXPECT_EQ(Gigabytes(12).bytes(), volume->get().capacity_bytes());
  EXPECT_EQ("fast-block", volume->get().storage_class());
  EXPECT_EQ(AccessModes({READ_WRITE_ONCE}),
            accessModes(volume->get().access_modes()));
  EXPECT_EQ("3000", volume->get().context().at("parameter.iops"));
  EXPECT_FALSE(volume->get().has_workload());

  // Without a class granularity block volumes come in whole gigabytes.
  volume = backend->createVolume(
      createStorageClass("block", StorageClass::BLOCK),
      Megabytes(1500),
      {READ_WRITE_ONCE},
      None());

  AWAIT_READY(volume);
  ASSERT_SOME(volume.get());
  EXPECT_EQ(Gigabytes(2).bytes(), volume->get().capacity_bytes());

  // Object storage is allocated exactly.
  create = Backend::create(StorageClass::OBJECT, Gigabytes(100));
  ASSERT_SOME(create);

  backend.reset(create.get());

  volume = backend->createVolume(
      createStorageClass("bucket", StorageClass::OBJECT),
      Megabytes(1500),
      {READ_WRITE_MANY},
      None());

  AWAIT_READY(volume);
  ASSERT_SOME(volume.get());
  EXPECT_EQ(Megabytes(1500).bytes(), volume->get().capacity_bytes());
}


TEST(BackendTest, InsufficientCapacity)
{
  MemoryBackend backend(
      StorageClass::BLOCK,
      MemoryBackend::capabilities(StorageClass::BLOCK),
      Gigabytes(10));

  const StorageClass storageClass =
    createStorageClass("block", StorageClass::BLOCK);

  Future<Outcome<Volume>> first =
    backend.createVolume(storageClass, Gigabytes(6), {READ_WRITE_ONCE}, None());

  AWAIT_READY(first);
  ASSERT_SOME(first.get());
  EXPECT_EQ(Gigabytes(6), backend.allocated());

  Future<Outcome<Volume>> second =
    backend.createVolume(storageClass, Gigabytes(6), {READ_WRITE_ONCE}, None());

  AWAIT_READY(second);
  ASSERT_ERROR(second.get());
  EXPECT_EQ(BrokerError::INSUFFICIENT_CAPACITY, second->error().code);
  EXPECT_EQ(Gigabytes(6), backend.allocated());

  // Deleting returns the capacity to the pool.
  AWAIT_READY(backend.deleteVolume(first->get().id()));
  EXPECT_EQ(Bytes(0), backend.allocated());
  EXPECT_FALSE(backend.contains(first->get().id()));

  second =
    backend.createVolume(storageClass, Gigabytes(6), {READ_WRITE_ONCE}, None());

  AWAIT_READY(second);
  ASSERT_SOME(second.get());
}


// Requests close to the 64-bit limit are rejected instead of wrapping
// around the free capacity.
TEST(BackendTest, HugeRequests)
{
  const uint64_t max = std::numeric_limits<uint64_t>::max();

  MemoryBackend objects(
      StorageClass::OBJECT,
      MemoryBackend::capabilities(StorageClass::OBJECT),
      Gigabytes(10));

  const StorageClass bucket =
    createStorageClass("bucket", StorageClass::OBJECT);

  Future<Outcome<Volume>> volume =
    objects.createVolume(bucket, Gigabytes(1), {READ_WRITE_MANY}, None());

  AWAIT_READY(volume);
  ASSERT_SOME(volume.get());

  volume = objects.createVolume(
      bucket, Bytes(max - Megabytes(512).bytes()), {READ_WRITE_MANY}, None());

  AWAIT_READY(volume);
  ASSERT_ERROR(volume.get());
  EXPECT_EQ(BrokerError::INSUFFICIENT_CAPACITY, volume->error().code);
  EXPECT_EQ(Gigabytes(1), objects.allocated());

  MemoryBackend blocks(
      StorageClass::BLOCK,
      MemoryBackend::capabilities(StorageClass::BLOCK),
      Gigabytes(10));

  const StorageClass block = createStorageClass("block", StorageClass::BLOCK);

  volume = blocks.createVolume(
      block, Bytes(max - 100), {READ_WRITE_ONCE}, None());

  AWAIT_READY(volume);
  ASSERT_ERROR(volume.get());
  EXPECT_EQ(BrokerError::INSUFFICIENT_CAPACITY, volume->error().code);
  EXPECT_EQ(Bytes(0), blocks.allocated());

  volume = blocks.createVolume(block, Gigabytes(2), {READ_WRITE_ONCE}, None());

  AWAIT_READY(volume);
  ASSERT_SOME(volume.get());

  Future<Outcome<Bytes>> resize =
    blocks.resizeVolume(volume->get().id(), Bytes(max - 100));

  AWAIT_READY(resize);
  ASSERT_ERROR(resize.get());
  EXPECT_EQ(BrokerError::INSUFFICIENT_CAPACITY, resize->error().code);
  EXPECT_EQ(Gigabytes(2), blocks.allocated());
}


TEST(BackendTest, IncompatibleAccessMode)
{
  Try<Backend*> create = Backend::create(StorageClass::BLOCK, Gigabytes(10));
  ASSERT_SOME(create);

  Owned<Backend> backend(create.get());

  Future<Outcome<Volume>> volume = backend->createVolume(
      createStorageClass("block", StorageClass::BLOCK),
      Gigabytes(1),
      {READ_WRITE_MANY},
      None());

  AWAIT_READY(volume);
  ASSERT_ERROR(volume.get());
  EXPECT_EQ(BrokerError::INCOMPATIBLE_ACCESS_MODE, volume->error().code);

  // A storage class of another kind is a caller error.
  volume = backend->createVolume(
      createStorageClass("bucket", StorageClass::OBJECT),
      Gigabytes(1),
      {READ_ONLY_MANY},
      None());

  AWAIT_READY(volume);
  ASSERT_ERROR(volume.get());
  EXPECT_EQ(BrokerError::INVALID_REQUEST, volume->error().code);
}


TEST(BackendTest, DeleteIsIdempotent)
{
  Try<Backend*> create =
    Backend::create(StorageClass::FILESYSTEM, Gigabytes(10));
  ASSERT_SOME(create);

  Owned<Backend> backend(create.get());

  Future<Outcome<Volume>> volume = backend->createVolume(
      createStorageClass("shared", StorageClass::FILESYSTEM),
      Gigabytes(1),
      {READ_WRITE_MANY},
      None());

  AWAIT_READY(volume);
  ASSERT_SOME(volume.get());

  Future<Outcome<Nothing>> deleted = backend->deleteVolume(volume->get().id());
  AWAIT_READY(deleted);
  EXPECT_SOME(deleted.get());

  deleted = backend->deleteVolume(volume->get().id());
  AWAIT_READY(deleted);
  EXPECT_SOME(deleted.get());

  deleted = backend->deleteVolume("never-existed");
  AWAIT_READY(deleted);
  EXPECT_SOME(deleted.get());
}


TEST(BackendTest, Resize)
{
  MemoryBackend backend(
      StorageClass::BLOCK,
      MemoryBackend::capabilities(StorageClass::BLOCK),
      Gigabytes(10));

  Future<Outcome<Volume>> volume = backend.createVolume(
      createStorageClass("block", StorageClass::BLOCK),
      Gigabytes(2),
      {READ_WRITE_ONCE},
      None());

  AWAIT_READY(volume);
  ASSERT_SOME(volume.get());

  const string volumeId = volume->get().id();

  Future<Outcome<Bytes>> resize =
    backend.resizeVolume(volumeId, Megabytes(4500));

  AWAIT_READY(resize);
  EXPECT_SOME_EQ(Gigabytes(5), resize.get());
  EXPECT_EQ(Gigabytes(5), backend.allocated());

  // Shrinking keeps the current size.
  resize = backend.resizeVolume(volumeId, Gigabytes(1));
  AWAIT_READY(resize);
  EXPECT_SOME_EQ(Gigabytes(5), resize.get());

  resize = backend.resizeVolume(volumeId, Gigabytes(11));
  AWAIT_READY(resize);
  ASSERT_ERROR(resize.get());
  EXPECT_EQ(BrokerError::INSUFFICIENT_CAPACITY, resize->error().code);

  resize = backend.resizeVolume("unknown", Gigabytes(3));
  AWAIT_READY(resize);
  ASSERT_ERROR(resize.get());
  EXPECT_EQ(BrokerError::VOLUME_NOT_FOUND, resize->error().code);

  MemoryBackend objects(
      StorageClass::OBJECT,
      MemoryBackend::capabilities(StorageClass::OBJECT),
      Gigabytes(10));

  resize = objects.resizeVolume("bucket", Gigabytes(3));
  AWAIT_READY(resize);
  ASSERT_ERROR(resize.get());
  EXPECT_EQ(BrokerError::RESIZE_NOT_SUPPORTED, resize->error().code);
}


TEST(BackendTest, EphemeralTeardown)
{
  EphemeralBackend backend(Gigabytes(10));

  const StorageClass storageClass =
    createStorageClass("scratch", StorageClass::EPHEMERAL);

  Future<Outcome<Volume>> orphan = backend.createVolume(
      storageClass, Gigabytes(1), {READ_WRITE_ONCE}, None());

  AWAIT_READY(orphan);
  ASSERT_ERROR(orphan.get());
  EXPECT_EQ(BrokerError::INVALID_REQUEST, orphan->error().code);

  Future<Outcome<Volume>> first = backend.createVolume(
      storageClass, Gigabytes(1), {READ_WRITE_ONCE}, string("pod-1"));

  Future<Outcome<Volume>> second = backend.createVolume(
      storageClass, Gigabytes(2), {READ_WRITE_ONCE_POD}, string("pod-1"));

  Future<Outcome<Volume>> other = backend.createVolume(
      storageClass, Gigabytes(1), {READ_WRITE_ONCE}, string("pod-2"));

  AWAIT_READY(first);
  AWAIT_READY(second);
  AWAIT_READY(other);

  ASSERT_SOME(first.get());
  ASSERT_SOME(second.get());
  ASSERT_SOME(other.get());

  EXPECT_EQ("pod-1", first->get().workload());

  Future<Outcome<vector<string>>> teardown = backend.teardown("pod-1");
  AWAIT_READY(teardown);
  ASSERT_SOME(teardown.get());
  EXPECT_EQ(2u, teardown->get().size());

  EXPECT_FALSE(backend.contains(first->get().id()));
  EXPECT_FALSE(backend.contains(second->get().id()));
  EXPECT_TRUE(backend.contains(other->get().id()));
  EXPECT_EQ(Gigabytes(1), backend.allocated());

  // Persistent backends have nothing to tear down.
  Try<Backend*> create = Backend::create(StorageClass::BLOCK, Gigabytes(10));
  ASSERT_SOME(create);

  Owned<Backend> block(create.get());

  teardown = block->teardown("pod-2");
  AWAIT_READY(teardown);
  ASSERT_SOME(teardown.get());
  EXPECT_TRUE(teardown->get().empty());
}


TEST(BackendTest, Backends)
{
  hashmap<StorageClass::Kind, Bytes> capacities;
  capacities[StorageClass::BLOCK] = Gigabytes(10);
  capacities[StorageClass::OBJECT] = Gigabytes(10);

  Try<Owned<Backends>> backends = Backends::create(capacities);
  ASSERT_SOME(backends);

  EXPECT_SOME(backends.get()->get(StorageClass::BLOCK));
  EXPECT_SOME(backends.get()->get(StorageClass::OBJECT));
  EXPECT_EQ(2u, backends.get()->all().size());

  Outcome<Backend*> backend = backends.get()->get(StorageClass::EPHEMERAL);
  ASSERT_ERROR(backend);
  EXPECT_EQ(BrokerError::BACKEND_UNAVAILABLE, backend.error().code);

  capacities[StorageClass::UNKNOWN_KIND] = Gigabytes(1);
  EXPECT_ERROR(Backends::create(capacities));
}

} // namespace tests {
} // namespace internal {
} // namespace volbroker {
