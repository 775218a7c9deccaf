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

#include <volbroker/errors.hpp>

#include <stout/unreachable.hpp>

namespace volbroker {

const char* BrokerError::name(Code code)
{
  switch (code) {
    case CLASS_NOT_FOUND: return "CLASS_NOT_FOUND";
    case DUPLICATE_CLASS: return "DUPLICATE_CLASS";
    case CLASS_IN_USE: return "CLASS_IN_USE";
    case INSUFFICIENT_CAPACITY: return "INSUFFICIENT_CAPACITY";
    case INCOMPATIBLE_ACCESS_MODE: return "INCOMPATIBLE_ACCESS_MODE";
    case BACKEND_UNAVAILABLE: return "BACKEND_UNAVAILABLE";
    case CONCURRENT_BIND_CONFLICT: return "CONCURRENT_BIND_CONFLICT";
    case RESIZE_NOT_SUPPORTED: return "RESIZE_NOT_SUPPORTED";
    case VOLUME_NOT_FOUND: return "VOLUME_NOT_FOUND";
    case CLAIM_NOT_FOUND: return "CLAIM_NOT_FOUND";
    case INVALID_STATE: return "INVALID_STATE";
    case INVALID_REQUEST: return "INVALID_REQUEST";
    case PROVISIONING_EXHAUSTED: return "PROVISIONING_EXHAUSTED";
  }

  UNREACHABLE();
}

} // namespace volbroker {
