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

#ifndef __VOLBROKER_ERRORS_HPP__
#define __VOLBROKER_ERRORS_HPP__

#include <ostream>
#include <string>

#include <stout/error.hpp>
#include <stout/try.hpp>

namespace volbroker {

// An error carrying a code from the broker's error taxonomy. Callers
// classify errors by code; the message is for humans.
class BrokerError : public Error
{
public:
  enum Code
  {
    // Catalog errors, caller-correctable.
    CLASS_NOT_FOUND,
    DUPLICATE_CLASS,
    CLASS_IN_USE,

    // Policy mismatches. A claim hitting these stays pending.
    INSUFFICIENT_CAPACITY,
    INCOMPATIBLE_ACCESS_MODE,

    // Transient, retried with backoff.
    BACKEND_UNAVAILABLE,

    // Lost a compare-and-swap race. Retried immediately, never surfaced.
    CONCURRENT_BIND_CONFLICT,

    // Permanent.
    RESIZE_NOT_SUPPORTED,

    VOLUME_NOT_FOUND,
    CLAIM_NOT_FOUND,
    INVALID_STATE,
    INVALID_REQUEST,

    // A claim ran out of provisioning attempts.
    PROVISIONING_EXHAUSTED,
  };

  BrokerError(Code _code, const std::string& message)
    : Error(message), code(_code) {}

  // Returns true if the operation that failed with this error may
  // succeed when repeated unchanged.
  bool retryable() const
  {
    return code == BACKEND_UNAVAILABLE || code == CONCURRENT_BIND_CONFLICT;
  }

  static const char* name(Code code);

  Code code;
};


template <typename T>
using Outcome = Try<T, BrokerError>;


inline std::ostream& operator<<(
    std::ostream& stream,
    const BrokerError::Code& code)
{
  return stream << BrokerError::name(code);
}


inline std::ostream& operator<<(
    std::ostream& stream,
    const BrokerError& error)
{
  return stream << error.code << ": " << error.message;
}

} // namespace volbroker {

#endif // __VOLBROKER_ERRORS_HPP__
