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

#include <string>

#include <gtest/gtest.h>

#include <volbroker/volbroker.hpp>

#include <stout/bytes.hpp>
#include <stout/foreach.hpp>
#include <stout/gtest.hpp>
#include <stout/hashset.hpp>

#include "catalog/catalog.hpp"
#include "catalog/utils.hpp"

#include "tests/volbroker.hpp"

using std::string;

namespace volbroker {
namespace internal {
namespace tests {

TEST(CatalogTest, AddAndLookup)
{
  Catalog catalog;

  StorageClass fast = createStorageClass("fast-block", StorageClass::BLOCK);
  (*fast.mutable_parameters())["iops"] = "3000";

  ASSERT_SOME(catalog.add(fast));

  Outcome<StorageClass> lookup = catalog.lookup("fast-block");
  ASSERT_SOME(lookup);
  EXPECT_EQ(StorageClass::BLOCK, lookup->kind());
  EXPECT_EQ(StorageClass::DELETE, lookup->reclaim_policy());
  EXPECT_EQ("3000", lookup->parameters().at("iops"));

  lookup = catalog.lookup("slow-block");
  ASSERT_ERROR(lookup);
  EXPECT_EQ(BrokerError::CLASS_NOT_FOUND, lookup.error().code);
}


TEST(CatalogTest, DuplicateClass)
{
  Catalog catalog;

  ASSERT_SOME(catalog.add(createStorageClass("shared", StorageClass::OBJECT)));

  // A class is immutable once registered, even if the definition is
  // different.
  Outcome<Nothing> add =
    catalog.add(createStorageClass("shared", StorageClass::FILESYSTEM));

  ASSERT_ERROR(add);
  EXPECT_EQ(BrokerError::DUPLICATE_CLASS, add.error().code);

  Outcome<StorageClass> lookup = catalog.lookup("shared");
  ASSERT_SOME(lookup);
  EXPECT_EQ(StorageClass::OBJECT, lookup->kind());
}


TEST(CatalogTest, InvalidClass)
{
  Catalog catalog;

  Outcome<Nothing> add =
    catalog.add(createStorageClass("  ", StorageClass::BLOCK));

  ASSERT_ERROR(add);
  EXPECT_EQ(BrokerError::INVALID_REQUEST, add.error().code);

  add = catalog.add(createStorageClass("nokind", StorageClass::UNKNOWN_KIND));
  ASSERT_ERROR(add);
  EXPECT_EQ(BrokerError::INVALID_REQUEST, add.error().code);

  StorageClass storageClass = createStorageClass("tiny", StorageClass::BLOCK);
  (*storageClass.mutable_parameters())[GRANULARITY_PARAMETER] = "0B";

  add = catalog.add(storageClass);
  ASSERT_ERROR(add);
  EXPECT_EQ(BrokerError::INVALID_REQUEST, add.error().code);

  EXPECT_TRUE(catalog.list().empty());
}


TEST(CatalogTest, DefaultClass)
{
  Catalog catalog;

  EXPECT_NONE(catalog.defaultClass());

  StorageClass standard =
    createStorageClass("standard", StorageClass::FILESYSTEM);
  standard.set_default_class(true);

  ASSERT_SOME(catalog.add(standard));
  ASSERT_SOME(catalog.add(createStorageClass("fast", StorageClass::BLOCK)));

  Option<StorageClass> defaultClass = catalog.defaultClass();
  ASSERT_SOME(defaultClass);
  EXPECT_EQ("standard", defaultClass->name());

  StorageClass other = createStorageClass("other", StorageClass::BLOCK);
  other.set_default_class(true);

  Outcome<Nothing> add = catalog.add(other);
  ASSERT_ERROR(add);
  EXPECT_EQ(BrokerError::INVALID_REQUEST, add.error().code);

  // Once the default class is gone another class may take its place.
  ASSERT_SOME(catalog.remove("standard"));
  EXPECT_NONE(catalog.defaultClass());

  ASSERT_SOME(catalog.add(other));

  defaultClass = catalog.defaultClass();
  ASSERT_SOME(defaultClass);
  EXPECT_EQ("other", defaultClass->name());
}


TEST(CatalogTest, Remove)
{
  Catalog catalog;

  Outcome<Nothing> remove = catalog.remove("missing");
  ASSERT_ERROR(remove);
  EXPECT_EQ(BrokerError::CLASS_NOT_FOUND, remove.error().code);

  ASSERT_SOME(
      catalog.add(createStorageClass("scratch", StorageClass::EPHEMERAL)));
  ASSERT_SOME(catalog.remove("scratch"));

  Outcome<StorageClass> lookup = catalog.lookup("scratch");
  ASSERT_ERROR(lookup);
  EXPECT_EQ(BrokerError::CLASS_NOT_FOUND, lookup.error().code);
}


// A view lists the classes registered when it was taken, no matter
// what happens to the catalog afterwards.
TEST(CatalogTest, ListIsAStableView)
{
  Catalog catalog;

  ASSERT_SOME(catalog.add(createStorageClass("a", StorageClass::BLOCK)));
  ASSERT_SOME(catalog.add(createStorageClass("b", StorageClass::OBJECT)));

  Catalog::View view = catalog.list();

  ASSERT_SOME(catalog.remove("a"));
  ASSERT_SOME(catalog.add(createStorageClass("c", StorageClass::FILESYSTEM)));

  hashset<string> names;
  foreachkey (const string& name, view) {
    names.insert(name);
  }

  EXPECT_EQ(hashset<string>({"a", "b"}), names);

  // Iterating again yields the same classes.
  EXPECT_EQ(2u, view.size());

  names.clear();
  foreachkey (const string& name, catalog.list()) {
    names.insert(name);
  }

  EXPECT_EQ(hashset<string>({"b", "c"}), names);
}


TEST(CatalogTest, ParseCatalog)
{
  const string json =
    "{\n"
    "  \"classes\": [\n"
    "    {\n"
    "      \"name\": \"fast-block\",\n"
    "      \"kind\": \"BLOCK\",\n"
    "      \"reclaimPolicy\": \"RETAIN\",\n"
    "      \"bindingMode\": \"WAIT_FOR_FIRST_CONSUMER\",\n"
    "      \"allowVolumeExpansion\": true,\n"
    "      \"parameters\": { \"granularity\": \"12GB\", \"iops\": \"3000\" },\n"
    "      \"comment\": \"Unknown fields are ignored\"\n"
    "    },\n"
    "    {\n"
    "      \"name\": \"standard\",\n"
    "      \"kind\": \"FILESYSTEM\",\n"
    "      \"defaultClass\": true\n"
    "    }\n"
    "  ]\n"
    "}";

  Try<CatalogInfo> info = parseCatalog(json);
  ASSERT_SOME(info);
  ASSERT_EQ(2, info->classes_size());

  const StorageClass& fast = info->classes(0);
  EXPECT_EQ("fast-block", fast.name());
  EXPECT_EQ(StorageClass::BLOCK, fast.kind());
  EXPECT_EQ(StorageClass::RETAIN, fast.reclaim_policy());
  EXPECT_EQ(StorageClass::WAIT_FOR_FIRST_CONSUMER, fast.binding_mode());
  EXPECT_TRUE(fast.allow_volume_expansion());
  EXPECT_FALSE(fast.default_class());
  EXPECT_SOME_EQ(Gigabytes(12), granularity(fast));

  const StorageClass& standard = info->classes(1);
  EXPECT_EQ(StorageClass::DELETE, standard.reclaim_policy());
  EXPECT_EQ(StorageClass::IMMEDIATE, standard.binding_mode());
  EXPECT_TRUE(standard.default_class());
  EXPECT_NONE(granularity(standard));
}


TEST(CatalogTest, ParseInvalidCatalog)
{
  // Not JSON.
  EXPECT_ERROR(parseCatalog("classes: []"));

  // Unknown kind.
  EXPECT_ERROR(parseCatalog(
      "{\"classes\": [{\"name\": \"a\", \"kind\": \"TAPE\"}]}"));

  // Missing kind.
  EXPECT_ERROR(parseCatalog("{\"classes\": [{\"name\": \"a\"}]}"));

  // Duplicate names.
  EXPECT_ERROR(parseCatalog(
      "{\"classes\": ["
      "  {\"name\": \"a\", \"kind\": \"BLOCK\"},"
      "  {\"name\": \"a\", \"kind\": \"OBJECT\"}"
      "]}"));

  // Two default classes.
  EXPECT_ERROR(parseCatalog(
      "{\"classes\": ["
      "  {\"name\": \"a\", \"kind\": \"BLOCK\", \"defaultClass\": true},"
      "  {\"name\": \"b\", \"kind\": \"OBJECT\", \"defaultClass\": true}"
      "]}"));

  // Malformed granularity.
  EXPECT_ERROR(parseCatalog(
      "{\"classes\": [{\"name\": \"a\", \"kind\": \"BLOCK\","
      "  \"parameters\": {\"granularity\": \"lots\"}}]}"));

  EXPECT_SOME(parseCatalog("{}"));
}

} // namespace tests {
} // namespace internal {
} // namespace volbroker {
