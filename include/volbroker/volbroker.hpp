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

#ifndef __VOLBROKER_VOLBROKER_HPP__
#define __VOLBROKER_VOLBROKER_HPP__

#include <ostream>
#include <set>

// ONLY USEFUL AFTER RUNNING PROTOC.
#include <volbroker/volbroker.pb.h>

namespace volbroker {

typedef std::set<AccessMode> AccessModes;


inline std::ostream& operator<<(std::ostream& stream, const AccessMode& mode)
{
  return stream << AccessMode_Name(mode);
}


inline std::ostream& operator<<(
    std::ostream& stream,
    const StorageClass::Kind& kind)
{
  return stream << StorageClass::Kind_Name(kind);
}


inline std::ostream& operator<<(
    std::ostream& stream,
    const StorageClass::ReclaimPolicy& policy)
{
  return stream << StorageClass::ReclaimPolicy_Name(policy);
}


inline std::ostream& operator<<(
    std::ostream& stream,
    const StorageClass::BindingMode& mode)
{
  return stream << StorageClass::BindingMode_Name(mode);
}


inline std::ostream& operator<<(
    std::ostream& stream,
    const Volume::State& state)
{
  return stream << Volume::State_Name(state);
}


inline std::ostream& operator<<(
    std::ostream& stream,
    const Claim::State& state)
{
  return stream << Claim::State_Name(state);
}


inline std::ostream& operator<<(
    std::ostream& stream,
    const Event::Type& type)
{
  return stream << Event::Type_Name(type);
}

} // namespace volbroker {

#endif // __VOLBROKER_VOLBROKER_HPP__
