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
#include <vector>

#include <gtest/gtest.h>

#include <volbroker/volbroker.hpp>

#include <stout/bytes.hpp>
#include <stout/duration.hpp>
#include <stout/gtest.hpp>

#include "binder/backoff.hpp"
#include "binder/matching.hpp"

#include "store/claim_store.hpp"

#include "tests/volbroker.hpp"

using std::string;
using std::vector;

namespace volbroker {
namespace internal {
namespace tests {

TEST(BackoffTest, Exponential)
{
  BackoffPolicy policy;
  policy.base = Seconds(1);
  policy.multiplier = 2.0;
  policy.max = Seconds(10);
  policy.jitter = 0.0;

  EXPECT_EQ(Seconds(1), backoff(policy, 1));
  EXPECT_EQ(Seconds(2), backoff(policy, 2));
  EXPECT_EQ(Seconds(4), backoff(policy, 3));
  EXPECT_EQ(Seconds(8), backoff(policy, 4));
  EXPECT_EQ(Seconds(10), backoff(policy, 5));
  EXPECT_EQ(Seconds(10), backoff(policy, 64));
}


// With jitter every delay is at most the exponential delay, and a
// sequence of delays never decreases.
TEST(BackoffTest, JitterNeverDecreases)
{
  BackoffPolicy policy;
  policy.base = Milliseconds(100);
  policy.multiplier = 1.5;
  policy.max = Seconds(5);
  policy.jitter = 0.9;

  for (int run = 0; run < 20; run++) {
    Option<Duration> previous;

    for (unsigned int retry = 1; retry <= 20; retry++) {
      const Duration delay = backoff(policy, retry, previous);

      EXPECT_LE(delay, policy.max);
      EXPECT_GT(delay, Duration::zero());

      if (previous.isSome()) {
        EXPECT_GE(delay, previous.get());
      }

      previous = delay;
    }
  }
}


TEST(BackoffTest, Validate)
{
  BackoffPolicy policy;
  EXPECT_NONE(validate(policy));

  policy.jitter = 1.0;
  EXPECT_SOME(validate(policy));

  policy = BackoffPolicy();
  policy.max = policy.base / 2;
  EXPECT_SOME(validate(policy));

  policy = BackoffPolicy();
  policy.multiplier = 0.5;
  EXPECT_SOME(validate(policy));

  policy = BackoffPolicy();
  policy.maxAttempts = 0;
  EXPECT_SOME(validate(policy));
}


// The smallest sufficient volume wins, and among equally sized volumes
// the oldest one.
TEST(MatchingTest, SmallestThenOldest)
{
  ClaimStore store;

  ASSERT_SOME(store.addVolume(
      createVolume("large", "standard", Gigabytes(20), {READ_WRITE_ONCE})));

  ASSERT_SOME(store.addVolume(
      createVolume("small", "standard", Gigabytes(1), {READ_WRITE_ONCE})));

  ASSERT_SOME(store.addVolume(
      createVolume("older", "standard", Gigabytes(10), {READ_WRITE_ONCE})));

  ASSERT_SOME(store.addVolume(
      createVolume("newer", "standard", Gigabytes(10), {READ_WRITE_ONCE})));

  ASSERT_SOME(store.addVolume(
      createVolume("other", "premium", Gigabytes(5), {READ_WRITE_ONCE})));

  ASSERT_SOME(store.addVolume(
      createVolume("shared", "standard", Gigabytes(5), {READ_WRITE_MANY})));

  Option<Volume> volume = findVolume(
      *store.snapshot(),
      createClaim(
          "claim", Gigabytes(5), {READ_WRITE_ONCE}, string("standard")));

  ASSERT_SOME(volume);
  EXPECT_EQ("older", volume->id());

  // Without a class any class matches.
  volume = findVolume(
      *store.snapshot(),
      createClaim("claim", Gigabytes(5), {READ_WRITE_ONCE}));

  ASSERT_SOME(volume);
  EXPECT_EQ("other", volume->id());

  volume = findVolume(
      *store.snapshot(),
      createClaim("claim", Gigabytes(2), {READ_WRITE_MANY}));

  ASSERT_SOME(volume);
  EXPECT_EQ("shared", volume->id());

  EXPECT_NONE(findVolume(
      *store.snapshot(),
      createClaim("claim", Gigabytes(21), {READ_WRITE_ONCE})));
}


TEST(MatchingTest, SkipsUnbindableVolumes)
{
  ClaimStore store;

  ASSERT_SOME(store.addVolume(
      createVolume("bound", "standard", Gigabytes(1), {READ_WRITE_ONCE})));

  ASSERT_SOME(store.addVolume(
      createVolume("released", "standard", Gigabytes(2), {READ_WRITE_ONCE})));

  Volume ephemeral =
    createVolume("ephemeral", "scratch", Gigabytes(3), {READ_WRITE_ONCE});
  ephemeral.set_workload("pod-1");

  ASSERT_SOME(store.addVolume(ephemeral));

  ASSERT_SOME(store.addClaim(
      createClaim("a", Gigabytes(1), {READ_WRITE_ONCE})));
  ASSERT_SOME(store.addClaim(
      createClaim("b", Gigabytes(1), {READ_WRITE_ONCE})));

  ASSERT_SOME(store.bind("a", 1, "bound", 1));
  ASSERT_SOME(store.bind("b", 1, "released", 1));
  ASSERT_SOME(store.release("b", "done"));

  Claim claim = createClaim("claim", Gigabytes(1), {READ_WRITE_ONCE});

  // Only the consumer owning the ephemeral volume may have it.
  EXPECT_NONE(findVolume(*store.snapshot(), claim));

  claim.set_consumer("pod-2");
  EXPECT_NONE(findVolume(*store.snapshot(), claim));

  claim.set_consumer("pod-1");

  Option<Volume> volume = findVolume(*store.snapshot(), claim);
  ASSERT_SOME(volume);
  EXPECT_EQ("ephemeral", volume->id());
}

} // namespace tests {
} // namespace internal {
} // namespace volbroker {
