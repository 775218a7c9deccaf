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

#ifndef __COMMON_CONSTANTS_HPP__
#define __COMMON_CONSTANTS_HPP__

#include <stddef.h>
#include <stdint.h>

#include <stout/bytes.hpp>
#include <stout/duration.hpp>

namespace volbroker {
namespace internal {

// A failed provisioning call is retried after `b * m^(n-1)` for the
// n-th retry, where `b = DEFAULT_PROVISION_BACKOFF` and
// `m = DEFAULT_PROVISION_BACKOFF_MULTIPLIER`, reduced by up to
// `DEFAULT_PROVISION_BACKOFF_JITTER` of itself at random and capped at
// `DEFAULT_PROVISION_BACKOFF_MAX`.
constexpr Duration DEFAULT_PROVISION_BACKOFF = Seconds(1);
constexpr double DEFAULT_PROVISION_BACKOFF_MULTIPLIER = 2.0;
constexpr Duration DEFAULT_PROVISION_BACKOFF_MAX = Minutes(1);
constexpr double DEFAULT_PROVISION_BACKOFF_JITTER = 0.2;

// Failed attempts allowed per claim before it is declared lost.
constexpr unsigned int DEFAULT_MAX_PROVISION_ATTEMPTS = 5;

constexpr size_t DEFAULT_BINDER_WORKERS = 4;

constexpr Duration DEFAULT_RECLAIM_INTERVAL = Seconds(30);
constexpr Duration DEFAULT_BIND_INTERVAL = Seconds(10);

constexpr size_t DEFAULT_MAX_EVENTS = 1000;

// Most recent failed attempts kept in the history of a claim.
constexpr size_t DEFAULT_MAX_ATTEMPTS_PER_CLAIM = 10;

constexpr uint16_t DEFAULT_PORT = 5080;

// Pool sizes of the built-in backends.
constexpr Bytes DEFAULT_BLOCK_CAPACITY = Terabytes(1);
constexpr Bytes DEFAULT_FILESYSTEM_CAPACITY = Terabytes(1);
constexpr Bytes DEFAULT_OBJECT_CAPACITY = Terabytes(10);
constexpr Bytes DEFAULT_EPHEMERAL_CAPACITY = Gigabytes(100);

} // namespace internal {
} // namespace volbroker {

#endif // __COMMON_CONSTANTS_HPP__
