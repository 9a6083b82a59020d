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

#ifndef __TESTS_UTILS_HPP__
#define __TESTS_UTILS_HPP__

#include <stddef.h>

#include <string>

#include <stout/json.hpp>

#include "device/device.hpp"

namespace cdiplugin {
namespace internal {
namespace tests {

// Get the metrics snapshot.
JSON::Object Metrics();


// Creates `count` regular files `<dir>/nvidia<N>` standing in for device
// nodes and returns the corresponding healthy device set (version 1).
device::DeviceSet createDevices(const std::string& dir, size_t count);

} // namespace tests {
} // namespace internal {
} // namespace cdiplugin {

#endif // __TESTS_UTILS_HPP__
