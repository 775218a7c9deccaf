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

#include "tests/utils.hpp"

#include <gtest/gtest.h>

#include <process/future.hpp>
#include <process/gtest.hpp>
#include <process/http.hpp>
#include <process/pid.hpp>
#include <process/process.hpp>

#include <stout/gtest.hpp>
#include <stout/os.hpp>
#include <stout/path.hpp>
#include <stout/try.hpp>

#include "logging/logging.hpp"

#include "tests/flags.hpp"

namespace http = process::http;

using std::string;

using process::Future;
using process::UPID;

namespace volbroker {
namespace internal {
namespace tests {

void TemporaryDirectoryTest::SetUp()
{
  cwd = os::getcwd();

  Try<string> directory =
    os::mkdtemp(path::join(os::temp(), "volbroker_XXXXXX"));
  ASSERT_SOME(directory) << "Failed to create the test sandbox";

  sandbox = directory.get();

  // Relative paths of a test resolve inside its sandbox.
  ASSERT_SOME(os::chdir(sandbox.get()))
    << "Failed to chdir into '" << sandbox.get() << "'";
}


void TemporaryDirectoryTest::TearDown()
{
  ASSERT_SOME(os::chdir(cwd));

  if (sandbox.isNone()) {
    return;
  }

  if (flags.keep_sandbox) {
    const ::testing::TestInfo* test =
      ::testing::UnitTest::GetInstance()->current_test_info();

    LOG(INFO) << "Keeping the sandbox of " << test->test_case_name() << "."
              << test->name() << " at '" << sandbox.get() << "'";
  } else {
    ASSERT_SOME(os::rmdir(sandbox.get()));
  }

  sandbox = None();
}


JSON::Object Metrics()
{
  UPID upid("metrics", process::address());

  Future<http::Response> response = http::get(upid, "snapshot");

  AWAIT_EXPECT_RESPONSE_STATUS_EQ(http::OK().status, response);

  Try<JSON::Object> parse = JSON::parse<JSON::Object>(response->body);
  CHECK_SOME(parse);

  return parse.get();
}

} // namespace tests {
} // namespace internal {
} // namespace volbroker {
