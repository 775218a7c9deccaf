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

#ifndef __BINDER_MATCHING_HPP__
#define __BINDER_MATCHING_HPP__

#include <volbroker/volbroker.hpp>

#include <stout/option.hpp>

#include "store/claim_store.hpp"

namespace volbroker {
namespace internal {

// Returns the volume in `snapshot` that `claim` is best bound to: the
// smallest sufficient capacity, and among equally sized volumes the
// oldest one.
Option<Volume> findVolume(
    const ClaimStore::Snapshot& snapshot,
    const Claim& claim);


// Strict weak ordering of binding candidates.
bool preferred(const Volume& left, const Volume& right);

} // namespace internal {
} // namespace volbroker {

#endif // __BINDER_MATCHING_HPP__
