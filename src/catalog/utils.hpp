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

#ifndef __CATALOG_UTILS_HPP__
#define __CATALOG_UTILS_HPP__

#include <string>

#include <volbroker/volbroker.hpp>

#include <stout/bytes.hpp>
#include <stout/error.hpp>
#include <stout/option.hpp>
#include <stout/result.hpp>
#include <stout/try.hpp>

namespace volbroker {
namespace internal {

// Class parameter overriding the allocation granularity of a backend.
constexpr char GRANULARITY_PARAMETER[] = "granularity";


// Helper for parsing a JSON document of the form
// `{"classes": [{"name": ..., "kind": ...}, ...]}`. Unknown fields are
// ignored. Every class is validated and the document may name at most
// one default class.
Try<CatalogInfo> parseCatalog(const std::string& data);


// Checks the fields inside a `StorageClass` according to the comments
// above the protobuf.
Option<Error> validate(const StorageClass& storageClass);


// Returns the `granularity` parameter of the class if one is set.
Result<Bytes> granularity(const StorageClass& storageClass);

} // namespace internal {
} // namespace volbroker {

#endif // __CATALOG_UTILS_HPP__
