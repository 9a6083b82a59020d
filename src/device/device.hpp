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

#ifndef __DEVICE_DEVICE_HPP__
#define __DEVICE_DEVICE_HPP__

#include <stdint.h>

#include <memory>
#include <ostream>
#include <string>
#include <vector>

#include <stout/option.hpp>

namespace cdiplugin {
namespace device {

struct Device
{
  enum Health
  {
    HEALTHY,
    UNHEALTHY
  };

  // Stable identifier advertised to the kubelet, i.e., the numeric
  // suffix of the device node (`0` for `/dev/nvidia0`).
  std::string id;

  // Host path of the device node.
  std::string path;

  unsigned int major;
  unsigned int minor;

  Option<int> numaNode;

  Health health;

  bool operator==(const Device& that) const
  {
    return id == that.id &&
      path == that.path &&
      major == that.major &&
      minor == that.minor &&
      numaNode == that.numaNode &&
      health == that.health;
  }

  bool operator!=(const Device& that) const
  {
    return !(*this == that);
  }
};


// An immutable, versioned snapshot of all devices of a node, ordered by
// minor number. Each change of any device produces a new `DeviceSet`
// with a higher version.
struct DeviceSet
{
  DeviceSet() : version(0) {}

  Option<Device> find(const std::string& id) const;

  size_t healthy() const;

  uint64_t version;
  std::vector<Device> devices;
};


// Device sets are shared between actors and gRPC threads by reference.
typedef std::shared_ptr<const DeviceSet> Snapshot;


std::ostream& operator<<(std::ostream& stream, const Device::Health& health);


std::ostream& operator<<(std::ostream& stream, const Device& device);

} // namespace device {
} // namespace cdiplugin {

#endif // __DEVICE_DEVICE_HPP__
