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

#ifndef __STORE_PATHS_HPP__
#define __STORE_PATHS_HPP__

#include <string>

namespace volbroker {
namespace internal {
namespace paths {

// The broker keeps its durable state under the work directory:
//
//   root ('--work_dir' flag)
//   |-- store
//       |-- state  (checkpointed `volbroker::State`)

std::string getStoreDir(const std::string& rootDir);


std::string getStatePath(const std::string& rootDir);

} // namespace paths {
} // namespace internal {
} // namespace volbroker {

#endif // __STORE_PATHS_HPP__
