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

#include "catalog/catalog.hpp"

#include <atomic>

#include <glog/logging.h>

#include <stout/foreach.hpp>
#include <stout/synchronized.hpp>

#include "catalog/utils.hpp"

using std::shared_ptr;
using std::string;

namespace volbroker {
namespace internal {

Catalog::Catalog()
  : classes(new Classes()) {}


Outcome<Nothing> Catalog::add(const StorageClass& storageClass)
{
  Option<Error> error = validate(storageClass);
  if (error.isSome()) {
    return BrokerError(
        BrokerError::INVALID_REQUEST,
        "Invalid storage class '" + storageClass.name() + "': " +
        error->message);
  }

  synchronized (mutex) {
    shared_ptr<const Classes> current = load();

    if (current->contains(storageClass.name())) {
      return BrokerError(
          BrokerError::DUPLICATE_CLASS,
          "Storage class '" + storageClass.name() + "' already exists");
    }

    if (storageClass.default_class()) {
      foreachvalue (const StorageClass& existing, *current) {
        if (existing.default_class()) {
          return BrokerError(
              BrokerError::INVALID_REQUEST,
              "Storage class '" + existing.name() +
              "' is already the default class");
        }
      }
    }

    shared_ptr<Classes> updated(new Classes(*current));
    updated->put(storageClass.name(), storageClass);

    std::atomic_store(&classes, shared_ptr<const Classes>(updated));
  }

  LOG(INFO) << "Added " << storageClass.kind() << " storage class '"
            << storageClass.name() << "' with reclaim policy "
            << storageClass.reclaim_policy() << " and binding mode "
            << storageClass.binding_mode();

  return Nothing();
}


Outcome<StorageClass> Catalog::lookup(const string& name) const
{
  shared_ptr<const Classes> current = load();

  Option<StorageClass> storageClass = current->get(name);
  if (storageClass.isNone()) {
    return BrokerError(
        BrokerError::CLASS_NOT_FOUND,
        "Unknown storage class '" + name + "'");
  }

  return storageClass.get();
}


Catalog::View Catalog::list() const
{
  return View(load());
}


Outcome<Nothing> Catalog::remove(const string& name)
{
  synchronized (mutex) {
    shared_ptr<const Classes> current = load();

    if (!current->contains(name)) {
      return BrokerError(
          BrokerError::CLASS_NOT_FOUND,
          "Unknown storage class '" + name + "'");
    }

    shared_ptr<Classes> updated(new Classes(*current));
    updated->erase(name);

    std::atomic_store(&classes, shared_ptr<const Classes>(updated));
  }

  LOG(INFO) << "Removed storage class '" << name << "'";

  return Nothing();
}


Option<StorageClass> Catalog::defaultClass() const
{
  shared_ptr<const Classes> current = load();

  foreachvalue (const StorageClass& storageClass, *current) {
    if (storageClass.default_class()) {
      return storageClass;
    }
  }

  return None();
}


shared_ptr<const Catalog::Classes> Catalog::load() const
{
  return std::atomic_load(&classes);
}

} // namespace internal {
} // namespace volbroker {
