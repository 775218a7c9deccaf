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

#include "tests/mock_backend.hpp"

#include <stout/check.hpp>
#include <stout/try.hpp>

using testing::_;
using testing::DoDefault;
using testing::Invoke;

namespace volbroker {
namespace internal {
namespace tests {

MockBackend::MockBackend(StorageClass::Kind kind, const Bytes& capacity)
{
  Try<Backend*> backend = Backend::create(kind, capacity);
  CHECK_SOME(backend);

  _real.reset(backend.get());

  ON_CALL(*this, createVolume(_, _, _, _))
    .WillByDefault(Invoke(_real.get(), &Backend::createVolume));

  ON_CALL(*this, deleteVolume(_))
    .WillByDefault(Invoke(_real.get(), &Backend::deleteVolume));

  ON_CALL(*this, resizeVolume(_, _))
    .WillByDefault(Invoke(_real.get(), &Backend::resizeVolume));

  ON_CALL(*this, teardown(_))
    .WillByDefault(Invoke(_real.get(), &Backend::teardown));

  // NOTE: We use 'EXPECT_CALL' and 'WillRepeatedly' here in addition
  // to 'ON_CALL' so that calls a test does not care about are not
  // reported as uninteresting.
  EXPECT_CALL(*this, createVolume(_, _, _, _))
    .WillRepeatedly(DoDefault());

  EXPECT_CALL(*this, deleteVolume(_))
    .WillRepeatedly(DoDefault());

  EXPECT_CALL(*this, resizeVolume(_, _))
    .WillRepeatedly(DoDefault());

  EXPECT_CALL(*this, teardown(_))
    .WillRepeatedly(DoDefault());
}


MockBackend::~MockBackend() {}

} // namespace tests {
} // namespace internal {
} // namespace volbroker {
