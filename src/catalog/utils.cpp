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

#include "catalog/utils.hpp"

#include <google/protobuf/util/json_util.h>

#include <stout/foreach.hpp>
#include <stout/hashset.hpp>
#include <stout/strings.hpp>

using std::string;

namespace volbroker {
namespace internal {

Try<CatalogInfo> parseCatalog(const string& data)
{
  // Use Google's JSON utility function to parse the JSON string.
  CatalogInfo output;
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  auto status =
    google::protobuf::util::JsonStringToMessage(data, &output, options);

  if (!status.ok()) {
    return Error("Failed to parse CatalogInfo message: " + status.ToString());
  }

  hashset<string> names;
  Option<string> defaultClass;

  foreach (const StorageClass& storageClass, output.classes()) {
    Option<Error> error = validate(storageClass);
    if (error.isSome()) {
      return Error(
          "Storage class '" + storageClass.name() + "' failed validation: " +
          error->message);
    }

    if (names.contains(storageClass.name())) {
      return Error(
          "Storage class '" + storageClass.name() + "' is defined twice");
    }

    names.insert(storageClass.name());

    if (storageClass.default_class()) {
      if (defaultClass.isSome()) {
        return Error(
            "Both '" + defaultClass.get() + "' and '" + storageClass.name() +
            "' are marked as the default class");
      }

      defaultClass = storageClass.name();
    }
  }

  return output;
}


Option<Error> validate(const StorageClass& storageClass)
{
  if (strings::trim(storageClass.name()).empty()) {
    return Error("'name' is a required field");
  }

  if (storageClass.name() != strings::trim(storageClass.name())) {
    return Error("'name' may not have leading or trailing whitespace");
  }

  if (storageClass.kind() == StorageClass::UNKNOWN_KIND) {
    return Error("'kind' is a required field");
  }

  if (storageClass.reclaim_policy() == StorageClass::UNKNOWN_POLICY) {
    return Error("Unknown 'reclaim_policy'");
  }

  if (storageClass.binding_mode() == StorageClass::UNKNOWN_BINDING_MODE) {
    return Error("Unknown 'binding_mode'");
  }

  Result<Bytes> bytes = granularity(storageClass);
  if (bytes.isError()) {
    return Error(bytes.error());
  }

  // NOTE: All other `parameters` are opaque to the broker and are passed
  // through to the backend unvalidated.

  return None();
}


Result<Bytes> granularity(const StorageClass& storageClass)
{
  if (!storageClass.parameters().count(GRANULARITY_PARAMETER)) {
    return None();
  }

  const string& value = storageClass.parameters().at(GRANULARITY_PARAMETER);

  Try<Bytes> bytes = Bytes::parse(value);
  if (bytes.isError()) {
    return Error(
        "Invalid '" + string(GRANULARITY_PARAMETER) + "' parameter '" +
        value + "': " + bytes.error());
  }

  if (bytes.get() == Bytes(0)) {
    return Error(
        "The '" + string(GRANULARITY_PARAMETER) + "' parameter must be "
        "positive");
  }

  return bytes.get();
}

} // namespace internal {
} // namespace volbroker {
