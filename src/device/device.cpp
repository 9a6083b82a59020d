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

#include "device/device.hpp"

#include <stout/foreach.hpp>
#include <stout/none.hpp>
#include <stout/unreachable.hpp>

using std::ostream;
using std::string;

namespace cdiplugin {
namespace device {

Option<Device> DeviceSet::find(const string& id) const
{
  foreach (const Device& device, devices) {
    if (device.id == id) {
      return device;
    }
  }

  return None();
}


size_t DeviceSet::healthy() const
{
  size_t count = 0;
  foreach (const Device& device, devices) {
    if (device.health == Device::HEALTHY) {
      ++count;
    }
  }

  return count;
}


ostream& operator<<(ostream& stream, const Device::Health& health)
{
  switch (health) {
    case Device::HEALTHY:
      return stream << "Healthy";
    case Device::UNHEALTHY:
      return stream << "Unhealthy";
  }

  UNREACHABLE();
}


ostream& operator<<(ostream& stream, const Device& device)
{
  return stream
    << "'" << device.id << "' (" << device.path << ", "
    << device.major << ":" << device.minor << ")";
}

} // namespace device {
} // namespace cdiplugin {
