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

#ifndef __COMMON_ACCESS_MODES_HPP__
#define __COMMON_ACCESS_MODES_HPP__

#include <ostream>
#include <string>

#include <google/protobuf/repeated_field.h>

#include <volbroker/volbroker.hpp>

namespace volbroker {
namespace internal {

// Converts a repeated protobuf enum field into a set. Unknown values are
// dropped.
AccessModes accessModes(const google::protobuf::RepeatedField<int>& modes);


void setAccessModes(
    const AccessModes& modes,
    google::protobuf::RepeatedField<int>* field);


// Returns true if every mode in `requested` is in `provided`.
bool satisfies(const AccessModes& provided, const AccessModes& requested);


// Returns true if `modes` is non-empty and only contains modes that
// allow several claims to hold the same volume (ROX, RWX).
bool isShareable(const AccessModes& modes);


// Short form used in logs, e.g. "RWO".
std::string abbreviate(AccessMode mode);

} // namespace internal {


std::ostream& operator<<(std::ostream& stream, const AccessModes& modes);

} // namespace volbroker {

#endif // __COMMON_ACCESS_MODES_HPP__
