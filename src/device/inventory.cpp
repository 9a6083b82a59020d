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

#include "device/inventory.hpp"

#include <sys/stat.h>
#include <sys/sysmacros.h> // For major(), minor().

#include <algorithm>
#include <list>
#include <string>

#include <glog/logging.h>

#include <stout/error.hpp>
#include <stout/foreach.hpp>
#include <stout/none.hpp>
#include <stout/numify.hpp>
#include <stout/os.hpp>
#include <stout/path.hpp>
#include <stout/stringify.hpp>
#include <stout/strings.hpp>

#include <stout/os/stat.hpp>

using std::list;
using std::string;

namespace cdiplugin {
namespace device {

DevfsInventory::DevfsInventory(
    const string& _devDir,
    const string& _sysfsDir,
    const string& _prefix)
  : devDir(_devDir),
    sysfsDir(_sysfsDir),
    prefix(_prefix) {}


Try<DeviceSet> DevfsInventory::discover()
{
  Try<list<string>> entries = os::ls(devDir);
  if (entries.isError()) {
    return Error(
        "Failed to list device directory '" + devDir + "': " +
        entries.error());
  }

  DeviceSet devices;
  devices.version = 1;

  foreach (const string& entry, entries.get()) {
    if (!strings::startsWith(entry, prefix) || entry.size() == prefix.size()) {
      continue;
    }

    // Only `<prefix><N>` denotes a device; control nodes such as
    // `nvidiactl` or `nvidia-uvm` are shared by all devices.
    const string suffix = entry.substr(prefix.size());
    if (!std::all_of(suffix.begin(), suffix.end(), [](char c) {
          return c >= '0' && c <= '9';
        })) {
      continue;
    }

    Try<unsigned int> index = numify<unsigned int>(suffix);
    if (index.isError()) {
      VLOG(1) << "Skipping '" << entry << "': " << index.error();
      continue;
    }

    Device device;
    device.id = suffix;
    device.path = path::join(devDir, entry);
    device.major = 0;
    device.minor = index.get();
    device.health = Device::HEALTHY;

    if (os::stat::isdir(device.path)) {
      VLOG(1) << "Skipping directory '" << device.path << "'";
      continue;
    }

    Try<mode_t> mode = os::stat::mode(device.path);
    if (mode.isError()) {
      return Error(
          "Failed to get the mode of '" + device.path + "': " + mode.error());
    }

    if (S_ISCHR(mode.get())) {
      Try<dev_t> rdev = os::stat::rdev(device.path);
      if (rdev.isError()) {
        return Error(
            "Failed to get the device number of '" + device.path + "': " +
            rdev.error());
      }

      device.major = major(rdev.get());
      device.minor = minor(rdev.get());

      Result<int> numaNode =
        getNumaNode(sysfsDir, device.major, device.minor);

      if (numaNode.isError()) {
        LOG(WARNING) << "Failed to get the NUMA node of device " << device
                     << ": " << numaNode.error();
      } else if (numaNode.isSome()) {
        device.numaNode = numaNode.get();
      }
    }

    LOG(INFO) << "Discovered device " << device;

    devices.devices.push_back(device);
  }

  std::sort(
      devices.devices.begin(),
      devices.devices.end(),
      [](const Device& left, const Device& right) {
        return left.minor != right.minor
          ? left.minor < right.minor
          : left.id < right.id;
      });

  return devices;
}


Device::Health DevfsInventory::health(const Device& device)
{
  if (!os::exists(device.path) || os::stat::isdir(device.path)) {
    return Device::UNHEALTHY;
  }

  return Device::HEALTHY;
}


Result<int> getNumaNode(
    const string& sysfsDir,
    unsigned int major,
    unsigned int minor)
{
  const string path = path::join(
      sysfsDir,
      "dev",
      "char",
      stringify(major) + ":" + stringify(minor),
      "device",
      "numa_node");

  if (!os::exists(path)) {
    return None();
  }

  Try<string> read = os::read(path);
  if (read.isError()) {
    return Error("Failed to read '" + path + "': " + read.error());
  }

  Try<int> node = numify<int>(strings::trim(read.get()));
  if (node.isError()) {
    return Error(
        "Failed to parse the NUMA node in '" + path + "': " + node.error());
  }

  // The kernel reports `-1` for devices without NUMA affinity.
  if (node.get() < 0) {
    return None();
  }

  return node.get();
}

} // namespace device {
} // namespace cdiplugin {
