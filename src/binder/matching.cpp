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

#include "binder/matching.hpp"

#include <stout/foreach.hpp>

namespace volbroker {
namespace internal {

Option<Volume> findVolume(
    const ClaimStore::Snapshot& snapshot,
    const Claim& claim)
{
  Option<Volume> best;

  foreachvalue (const Volume& volume, snapshot.volumes) {
    if (ClaimStore::bindable(snapshot, claim, volume).isSome()) {
      continue;
    }

    if (best.isNone() || preferred(volume, best.get())) {
      best = volume;
    }
  }

  return best;
}


bool preferred(const Volume& left, const Volume& right)
{
  if (left.capacity_bytes() != right.capacity_bytes()) {
    return left.capacity_bytes() < right.capacity_bytes();
  }

  if (left.sequence() != right.sequence()) {
    return left.sequence() < right.sequence();
  }

  return left.id() < right.id();
}

} // namespace internal {
} // namespace volbroker {
