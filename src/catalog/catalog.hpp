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

#ifndef __CATALOG_CATALOG_HPP__
#define __CATALOG_CATALOG_HPP__

#include <memory>
#include <mutex>
#include <string>

#include <volbroker/errors.hpp>
#include <volbroker/volbroker.hpp>

#include <stout/hashmap.hpp>
#include <stout/nothing.hpp>
#include <stout/option.hpp>

namespace volbroker {
namespace internal {

// Registry of storage classes. Registration and removal are serialized
// by a writer mutex and publish a new immutable snapshot; readers load
// the current snapshot and never wait on writers.
class Catalog
{
public:
  typedef hashmap<std::string, StorageClass> Classes;

  // A restartable view over the classes registered at the time `list()`
  // was called. Iteration yields `(name, class)` pairs.
  class View
  {
  public:
    typedef Classes::const_iterator const_iterator;

    const_iterator begin() const { return classes->begin(); }
    const_iterator end() const { return classes->end(); }

    size_t size() const { return classes->size(); }
    bool empty() const { return classes->empty(); }

  private:
    friend class Catalog;

    explicit View(const std::shared_ptr<const Classes>& _classes)
      : classes(_classes) {}

    std::shared_ptr<const Classes> classes;
  };

  Catalog();

  // Fails with `DUPLICATE_CLASS` if a class with the same name exists
  // and with `INVALID_REQUEST` if the class does not validate or would
  // be a second default class.
  Outcome<Nothing> add(const StorageClass& storageClass);

  Outcome<StorageClass> lookup(const std::string& name) const;

  View list() const;

  // NOTE: The caller is responsible for checking that no live claim
  // references the class.
  Outcome<Nothing> remove(const std::string& name);

  Option<StorageClass> defaultClass() const;

private:
  Catalog(const Catalog&) = delete;
  Catalog& operator=(const Catalog&) = delete;

  std::shared_ptr<const Classes> load() const;

  std::mutex mutex;
  std::shared_ptr<const Classes> classes;
};

} // namespace internal {
} // namespace volbroker {

#endif // __CATALOG_CATALOG_HPP__
