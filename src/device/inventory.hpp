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

#ifndef __DEVICE_INVENTORY_HPP__
#define __DEVICE_INVENTORY_HPP__

#include <string>

#include <stout/result.hpp>
#include <stout/try.hpp>

#include "device/device.hpp"

namespace cdiplugin {
namespace device {

// Source of the devices of a node and of their health. Implementations
// must be safe to call from any actor.
class Inventory
{
public:
  virtual ~Inventory() {}

  // Enumerates the devices once. All devices start healthy.
  virtual Try<DeviceSet> discover() = 0;

  // Evaluates the current health of a previously discovered device.
  virtual Device::Health health(const Device& device) = 0;
};


// Discovers the device nodes the driver exposes in the device filesystem,
// i.e., `<dev_dir>/<prefix><N>` for a decimal `N`.
class DevfsInventory : public Inventory
{
public:
  DevfsInventory(
      const std::string& devDir,
      const std::string& sysfsDir,
      const std::string& prefix);

  Try<DeviceSet> discover() override;

  // A device is healthy as long as its node exists and is not a directory.
  Device::Health health(const Device& device) override;

private:
  const std::string devDir;
  const std::string sysfsDir;
  const std::string prefix;
};


// Returns the NUMA node of a character device as reported by sysfs, i.e.,
// `<sysfs_dir>/dev/char/<major>:<minor>/device/numa_node`. Returns none if
// the file does not exist or the kernel reports no affinity (`-1`).
Result<int> getNumaNode(
    const std::string& sysfsDir,
    unsigned int major,
    unsigned int minor);

} // namespace device {
} // namespace cdiplugin {

#endif // __DEVICE_INVENTORY_HPP__
