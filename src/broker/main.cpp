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

#include <stdlib.h>

#include <iostream>
#include <string>

#include <glog/logging.h>

#include <google/protobuf/stubs/common.h>

#include <process/owned.hpp>
#include <process/process.hpp>

#include <stout/exit.hpp>
#include <stout/flags.hpp>
#include <stout/foreach.hpp>
#include <stout/os.hpp>
#include <stout/stringify.hpp>
#include <stout/try.hpp>

#include "broker/broker.hpp"
#include "broker/flags.hpp"

#include "logging/logging.hpp"

using namespace volbroker::internal;

using volbroker::Outcome;

using std::cerr;
using std::cout;
using std::endl;
using std::string;

using process::Owned;


int main(int argc, char** argv)
{
  // The order of initialization is as follows:
  // * Validate flags.
  // * Logging.
  // * Libprocess.
  // * Broker, which recovers the claim store.
  // * Catalog.

  GOOGLE_PROTOBUF_VERIFY_VERSION;

  broker::Flags flags;

  Try<flags::Warnings> load = flags.load("VOLBROKER_", argc, argv);

  if (flags.help) {
    cout << flags.usage() << endl;
    return EXIT_SUCCESS;
  }

  if (load.isError()) {
    cerr << load.error() << "\n\n"
         << "See `volbroker --help` for a list of supported flags." << endl;
    return EXIT_FAILURE;
  }

  logging::initialize(argv[0], flags, true); // Catch signals.

  // Log any flag warnings (after logging is initialized).
  foreach (const flags::Warning& warning, load->warnings) {
    LOG(WARNING) << warning.message;
  }

  if (flags.ip.isSome()) {
    os::setenv("LIBPROCESS_IP", flags.ip.get());
  }

  os::setenv("LIBPROCESS_PORT", stringify(flags.port));

  if (!process::initialize("volbroker")) {
    EXIT(EXIT_FAILURE) << "The call to `process::initialize()` in "
                       << "`main()` was not the function's first invocation";
  }

  if (flags.work_dir.isSome()) {
    Try<Nothing> mkdir = os::mkdir(flags.work_dir.get());
    if (mkdir.isError()) {
      EXIT(EXIT_FAILURE)
        << "Failed to create work directory '" << flags.work_dir.get()
        << "': " << mkdir.error();
    }
  } else {
    LOG(WARNING) << "No `--work_dir` given; claims and volumes will not "
                 << "survive a restart";
  }

  Try<Owned<Broker>> broker = Broker::create(flags);
  if (broker.isError()) {
    EXIT(EXIT_FAILURE) << "Failed to create broker: " << broker.error();
  }

  if (flags.catalog.isSome()) {
    Try<string> read = os::read(flags.catalog->string());
    if (read.isError()) {
      EXIT(EXIT_FAILURE)
        << "Failed to read catalog '" << flags.catalog.get() << "': "
        << read.error();
    }

    Outcome<Nothing> loaded = broker.get()->loadCatalog(read.get());
    if (loaded.isError()) {
      EXIT(EXIT_FAILURE)
        << "Failed to load catalog '" << flags.catalog.get() << "': "
        << loaded.error();
    }
  }

  LOG(INFO) << "Serving claims, volumes and storage classes at "
            << broker.get()->endpoints();

  process::wait(broker.get()->endpoints());

  return EXIT_SUCCESS;
}
