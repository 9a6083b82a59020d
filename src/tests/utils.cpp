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

#include <stout/check.hpp>
#include <stout/os.hpp>
#include <stout/path.hpp>
#include <stout/stringify.hpp>

namespace http = process::http;

using std::string;

using process::Future;
using process::UPID;

namespace cdiplugin {
namespace internal {
namespace tests {

JSON::Object Metrics()
{
  UPID upid("metrics", process::address());

  Future<http::Response> response = http::get(upid, "snapshot");

  AWAIT_EXPECT_RESPONSE_STATUS_EQ(http::OK().status, response);
  AWAIT_EXPECT_RESPONSE_HEADER_EQ(
      "application/json", "Content-Type", response);

  Try<JSON::Object> parse = JSON::parse<JSON::Object>(response->body);
  CHECK_SOME(parse);

  return parse.get();
}


device::DeviceSet createDevices(const string& dir, size_t count)
{
  CHECK_SOME(os::mkdir(dir));

  device::DeviceSet devices;
  devices.version = 1;

  for (size_t i = 0; i < count; i++) {
    device::Device device;
    device.id = stringify(i);
    device.path = path::join(dir, "nvidia" + stringify(i));
    device.major = 0;
    device.minor = i;
    device.health = device::Device::HEALTHY;

    CHECK_SOME(os::touch(device.path));

    devices.devices.push_back(device);
  }

  return devices;
}

} // namespace tests {
} // namespace internal {
} // namespace cdiplugin {
