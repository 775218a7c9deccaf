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

#ifndef __VOLBROKER_BACKEND_HPP__
#define __VOLBROKER_BACKEND_HPP__

#include <string>
#include <vector>

#include <volbroker/errors.hpp>
#include <volbroker/volbroker.hpp>

#include <process/future.hpp>

#include <stout/bytes.hpp>
#include <stout/nothing.hpp>
#include <stout/option.hpp>
#include <stout/try.hpp>

namespace volbroker {

// The contract between the broker and a storage vendor. One backend
// serves every storage class of a given kind; the broker never depends
// on anything beyond these three calls.
//
// Every call may suspend on I/O. The broker holds no store lock while a
// call is outstanding, and re-validates its view of the store after the
// returned future completes.
//
// Errors are returned in-band as a `BrokerError` so the caller can tell
// transient failures (`BACKEND_UNAVAILABLE`) from permanent ones. A
// failed future is treated like `BACKEND_UNAVAILABLE`.
class Backend
{
public:
  // Creates one of the built-in in-memory backends for `kind`, backed
  // by a capacity pool of `capacity` bytes.
  static Try<Backend*> create(StorageClass::Kind kind, const Bytes& capacity);

  virtual ~Backend() {}

  // Provisions a volume of at least `capacity` bytes supporting every
  // mode in `accessModes`. The returned volume may be larger than
  // requested. `workload` is the consumer context the volume belongs to
  // and is required by backends whose volumes do not outlive their
  // consumer.
  //
  // Fails with `INSUFFICIENT_CAPACITY`, `INCOMPATIBLE_ACCESS_MODE` or
  // `BACKEND_UNAVAILABLE`.
  virtual process::Future<Outcome<Volume>> createVolume(
      const StorageClass& storageClass,
      const Bytes& capacity,
      const AccessModes& accessModes,
      const Option<std::string>& workload) = 0;

  // Deprovisions a volume. Deleting a volume the backend does not know
  // about succeeds. Fails with `BACKEND_UNAVAILABLE`.
  virtual process::Future<Outcome<Nothing>> deleteVolume(
      const std::string& volumeId) = 0;

  // Grows a volume and returns its new capacity. Fails with
  // `RESIZE_NOT_SUPPORTED`, `VOLUME_NOT_FOUND`, `INSUFFICIENT_CAPACITY`
  // or `BACKEND_UNAVAILABLE`.
  virtual process::Future<Outcome<Bytes>> resizeVolume(
      const std::string& volumeId,
      const Bytes& capacity) = 0;

  // Deletes every volume created for `workload` and returns their ids.
  // Backends whose volumes outlive their consumers delete nothing.
  virtual process::Future<Outcome<std::vector<std::string>>> teardown(
      const std::string& workload)
  {
    return Outcome<std::vector<std::string>>(std::vector<std::string>());
  }

protected:
  Backend() {}
};

} // namespace volbroker {

#endif // __VOLBROKER_BACKEND_HPP__
