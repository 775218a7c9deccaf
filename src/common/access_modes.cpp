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

#include "common/access_modes.hpp"

#include <stout/foreach.hpp>
#include <stout/unreachable.hpp>

using std::string;

using google::protobuf::RepeatedField;

namespace volbroker {
namespace internal {

AccessModes accessModes(const RepeatedField<int>& modes)
{
  AccessModes result;
  foreach (int mode, modes) {
    if (AccessMode_IsValid(mode) && mode != UNKNOWN_ACCESS_MODE) {
      result.insert(static_cast<AccessMode>(mode));
    }
  }

  return result;
}


void setAccessModes(const AccessModes& modes, RepeatedField<int>* field)
{
  field->Clear();
  foreach (AccessMode mode, modes) {
    field->Add(mode);
  }
}


bool satisfies(const AccessModes& provided, const AccessModes& requested)
{
  foreach (AccessMode mode, requested) {
    if (provided.count(mode) == 0) {
      return false;
    }
  }

  return true;
}


bool isShareable(const AccessModes& modes)
{
  if (modes.empty()) {
    return false;
  }

  foreach (AccessMode mode, modes) {
    if (mode != READ_ONLY_MANY && mode != READ_WRITE_MANY) {
      return false;
    }
  }

  return true;
}


string abbreviate(AccessMode mode)
{
  switch (mode) {
    case READ_WRITE_ONCE: return "RWO";
    case READ_ONLY_MANY: return "ROX";
    case READ_WRITE_MANY: return "RWX";
    case READ_WRITE_ONCE_POD: return "RWOP";
    case UNKNOWN_ACCESS_MODE: return "UNKNOWN";
  }

  UNREACHABLE();
}


} // namespace internal {


std::ostream& operator<<(std::ostream& stream, const AccessModes& modes)
{
  stream << "{";

  bool first = true;
  foreach (AccessMode mode, modes) {
    if (!first) {
      stream << ",";
    }

    stream << internal::abbreviate(mode);
    first = false;
  }

  return stream << "}";
}

} // namespace volbroker {
