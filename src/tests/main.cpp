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

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <google/protobuf/stubs/common.h>

#include <process/gtest.hpp>
#include <process/process.hpp>

#include <stout/exit.hpp>
#include <stout/flags.hpp>
#include <stout/foreach.hpp>
#include <stout/os.hpp>
#include <stout/try.hpp>

#include "logging/logging.hpp"

#include "tests/flags.hpp"

namespace logging = cdiplugin::internal::logging;

using std::cerr;
using std::cout;
using std::endl;


int main(int argc, char** argv)
{
  GOOGLE_PROTOBUF_VERIFY_VERSION;

  // Block scope, so that `flags::` below still names the stout namespace.
  using cdiplugin::internal::tests::flags;

  // gtest parses its own flags later, so unknown ones are tolerated here.
  Try<flags::Warnings> load = flags.load("CDI_PLUGIN_", argc, argv, true);

  if (flags.help) {
    cout << flags.usage() << endl;
    testing::InitGoogleMock(&argc, argv);
    return EXIT_SUCCESS;
  }

  if (load.isError()) {
    cerr << flags.usage(load.error()) << endl;
    return EXIT_FAILURE;
  }

  flags.quiet = flags.quiet || !flags.verbose;

  // gtest reports crashes itself.
  logging::initialize(argv[0], flags, false);

  foreach (const flags::Warning& warning, load->warnings) {
    LOG(WARNING) << warning.message;
  }

  process::TEST_AWAIT_TIMEOUT = flags.test_await_timeout;

  // The metrics tests take several snapshots in quick succession.
  os::setenv("LIBPROCESS_METRICS_SNAPSHOT_ENDPOINT_RATE_LIMIT", "", false);

  if (!process::initialize()) {
    EXIT(EXIT_FAILURE) << "libprocess was initialized before the tests ran";
  }

  testing::InitGoogleMock(&argc, argv);
  testing::FLAGS_gtest_death_test_style = "threadsafe";

  const int result = RUN_ALL_TESTS();

  process::finalize();

  return result;
}
