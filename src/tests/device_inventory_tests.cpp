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

#include <stout/foreach.hpp>
#include <stout/gtest.hpp>
#include <stout/os.hpp>
#include <stout/path.hpp>
#include <stout/result.hpp>
#include <stout/try.hpp>

#include <stout/tests/utils.hpp>

#include "device/device.hpp"
#include "device/inventory.hpp"

using std::string;
using std::vector;

using cdiplugin::device::DevfsInventory;
using cdiplugin::device::Device;
using cdiplugin::device::DeviceSet;

namespace cdiplugin {
namespace internal {
namespace tests {

class DeviceInventoryTest : public TemporaryDirectoryTest
{
protected:
  void SetUp() override
  {
    TemporaryDirectoryTest::SetUp();

    devDir = path::join(sandbox.get(), "dev");
    sysfsDir = path::join(sandbox.get(), "sys");

    ASSERT_SOME(os::mkdir(devDir));
    ASSERT_SOME(os::mkdir(sysfsDir));
  }

  string devDir;
  string sysfsDir;
};


// Only `nvidia<N>` entries are devices; control nodes and directories
// with the same prefix are skipped, and devices are ordered by number.
TEST_F(DeviceInventoryTest, Discover)
{
  foreach (const string& name, vector<string>({
      "nvidia10", "nvidia2", "nvidia0", "nvidia1",
      "nvidiactl", "nvidia-uvm", "nvidia-modeset", "nvidia", "null"})) {
    ASSERT_SOME(os::touch(path::join(devDir, name)));
  }

  ASSERT_SOME(os::mkdir(path::join(devDir, "nvidia-caps")));
  ASSERT_SOME(os::mkdir(path::join(devDir, "nvidia3")));

  DevfsInventory inventory(devDir, sysfsDir, "nvidia");

  Try<DeviceSet> devices = inventory.discover();
  ASSERT_SOME(devices);

  EXPECT_EQ(1u, devices->version);
  ASSERT_EQ(4u, devices->devices.size());

  const vector<string> ids = {"0", "1", "2", "10"};

  for (size_t i = 0; i < ids.size(); i++) {
    const Device& device = devices->devices[i];

    EXPECT_EQ(ids[i], device.id);
    EXPECT_EQ(path::join(devDir, "nvidia" + ids[i]), device.path);
    EXPECT_EQ(Device::HEALTHY, device.health);
    EXPECT_NONE(device.numaNode);
  }

  EXPECT_EQ(4u, devices->healthy());
  EXPECT_SOME(devices->find("10"));
  EXPECT_NONE(devices->find("3"));
}


TEST_F(DeviceInventoryTest, DiscoverCustomPrefix)
{
  ASSERT_SOME(os::touch(path::join(devDir, "accel0")));
  ASSERT_SOME(os::touch(path::join(devDir, "nvidia0")));

  DevfsInventory inventory(devDir, sysfsDir, "accel");

  Try<DeviceSet> devices = inventory.discover();
  ASSERT_SOME(devices);
  ASSERT_EQ(1u, devices->devices.size());
  EXPECT_EQ("0", devices->devices[0].id);
  EXPECT_EQ(path::join(devDir, "accel0"), devices->devices[0].path);
}


TEST_F(DeviceInventoryTest, DiscoverNoDevices)
{
  DevfsInventory inventory(devDir, sysfsDir, "nvidia");

  Try<DeviceSet> devices = inventory.discover();
  ASSERT_SOME(devices);
  EXPECT_TRUE(devices->devices.empty());
  EXPECT_EQ(0u, devices->healthy());
}


TEST_F(DeviceInventoryTest, DiscoverMissingDirectory)
{
  DevfsInventory inventory(
      path::join(sandbox.get(), "missing"), sysfsDir, "nvidia");

  EXPECT_ERROR(inventory.discover());
}


TEST_F(DeviceInventoryTest, Health)
{
  ASSERT_SOME(os::touch(path::join(devDir, "nvidia0")));

  DevfsInventory inventory(devDir, sysfsDir, "nvidia");

  Try<DeviceSet> devices = inventory.discover();
  ASSERT_SOME(devices);
  ASSERT_EQ(1u, devices->devices.size());

  const Device device = devices->devices[0];

  EXPECT_EQ(Device::HEALTHY, inventory.health(device));

  ASSERT_SOME(os::rm(device.path));
  EXPECT_EQ(Device::UNHEALTHY, inventory.health(device));

  ASSERT_SOME(os::mkdir(device.path));
  EXPECT_EQ(Device::UNHEALTHY, inventory.health(device));

  ASSERT_SOME(os::rmdir(device.path));
  ASSERT_SOME(os::touch(device.path));
  EXPECT_EQ(Device::HEALTHY, inventory.health(device));
}


TEST_F(DeviceInventoryTest, NumaNode)
{
  const string directory =
    path::join(sysfsDir, "dev", "char", "195:1", "device");

  ASSERT_SOME(os::mkdir(directory));

  const string numaNode = path::join(directory, "numa_node");

  // No affinity information at all.
  EXPECT_TRUE(device::getNumaNode(sysfsDir, 195, 0).isNone());

  ASSERT_SOME(os::write(numaNode, "1\n"));
  Result<int> node = device::getNumaNode(sysfsDir, 195, 1);
  ASSERT_SOME(node);
  EXPECT_EQ(1, node.get());

  // The kernel reports `-1` for devices without NUMA affinity.
  ASSERT_SOME(os::write(numaNode, "-1\n"));
  EXPECT_TRUE(device::getNumaNode(sysfsDir, 195, 1).isNone());

  ASSERT_SOME(os::write(numaNode, "node1\n"));
  EXPECT_TRUE(device::getNumaNode(sysfsDir, 195, 1).isError());
}

} // namespace tests {
} // namespace internal {
} // namespace cdiplugin {
