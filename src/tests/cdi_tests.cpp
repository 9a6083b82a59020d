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

#include <sys/stat.h>

#include <list>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include <process/owned.hpp>

#include <stout/check.hpp>
#include <stout/gtest.hpp>
#include <stout/os.hpp>
#include <stout/path.hpp>
#include <stout/strings.hpp>
#include <stout/try.hpp>

#include <stout/os/stat.hpp>

#include <stout/tests/utils.hpp>

#include "cdi/paths.hpp"
#include "cdi/spec.hpp"
#include "cdi/synchronizer.hpp"

#include "device/device.hpp"

#include "tests/utils.hpp"

using std::list;
using std::string;
using std::vector;

using process::Owned;

using cdiplugin::cdi::SpecSynchronizer;

using cdiplugin::device::Device;
using cdiplugin::device::DeviceSet;

namespace cdiplugin {
namespace internal {
namespace tests {

TEST(CDISpecTest, ValidateKind)
{
  EXPECT_SOME(cdi::validateKind("nvidia.com/gpu"));
  EXPECT_SOME(cdi::validateKind("example.com/class_1"));
  EXPECT_SOME(cdi::validateKind("vendor-x/gpu-a"));

  EXPECT_ERROR(cdi::validateKind("gpu"));
  EXPECT_ERROR(cdi::validateKind("nvidia.com/"));
  EXPECT_ERROR(cdi::validateKind("/gpu"));
  EXPECT_ERROR(cdi::validateKind("nvidia.com/gpu/0"));
  EXPECT_ERROR(cdi::validateKind("nvidia.com/gpu!"));
  EXPECT_ERROR(cdi::validateKind("1nvidia.com/gpu"));
  EXPECT_ERROR(cdi::validateKind("nvidia.com./gpu"));
  EXPECT_ERROR(cdi::validateKind("nvidia.com/g.pu"));
}


TEST(CDISpecTest, QualifiedName)
{
  EXPECT_EQ("nvidia.com/gpu=0", cdi::qualifiedName("nvidia.com/gpu", "0"));
}


TEST(CDISpecTest, ParseMounts)
{
  Try<vector<cdi::Mount>> mounts = cdi::parseMounts(
      "/usr/lib/libcuda.so.1, /opt/bin/nvidia-smi:/usr/bin/nvidia-smi");

  ASSERT_SOME(mounts);
  ASSERT_EQ(2u, mounts->size());

  EXPECT_EQ("/usr/lib/libcuda.so.1", mounts->at(0).host_path());
  EXPECT_EQ("/usr/lib/libcuda.so.1", mounts->at(0).container_path());

  EXPECT_EQ("/opt/bin/nvidia-smi", mounts->at(1).host_path());
  EXPECT_EQ("/usr/bin/nvidia-smi", mounts->at(1).container_path());

  ASSERT_EQ(4, mounts->at(1).options_size());
  EXPECT_EQ("ro", mounts->at(1).options(0));
  EXPECT_EQ("bind", mounts->at(1).options(3));

  mounts = cdi::parseMounts("");
  ASSERT_SOME(mounts);
  EXPECT_TRUE(mounts->empty());

  EXPECT_ERROR(cdi::parseMounts("usr/lib/libcuda.so.1"));
  EXPECT_ERROR(cdi::parseMounts("/a:b"));
  EXPECT_ERROR(cdi::parseMounts("/a:/b:/c"));
}


// Only healthy devices are part of the specification, and the device
// nodes keep their name inside the container.
TEST(CDISpecTest, CreateSpec)
{
  DeviceSet devices;
  devices.version = 2;

  Device device;
  device.major = 195;
  device.health = Device::HEALTHY;

  device.id = "0";
  device.path = "/dev/nvidia0";
  device.minor = 0;
  devices.devices.push_back(device);

  device.id = "1";
  device.path = "/host/dev/nvidia1";
  device.minor = 1;
  devices.devices.push_back(device);

  device.id = "2";
  device.path = "/dev/nvidia2";
  device.minor = 2;
  device.health = Device::UNHEALTHY;
  devices.devices.push_back(device);

  cdi::ContainerEdits edits;
  edits.add_env("NVIDIA_VISIBLE_DEVICES=void");

  const cdi::Spec spec = cdi::createSpec("nvidia.com/gpu", devices, edits);

  EXPECT_EQ(cdi::CDI_VERSION, spec.cdi_version());
  EXPECT_EQ("nvidia.com/gpu", spec.kind());
  EXPECT_EQ(1, spec.container_edits().env_size());

  ASSERT_EQ(2, spec.devices_size());

  EXPECT_EQ("0", spec.devices(0).name());
  ASSERT_EQ(1, spec.devices(0).container_edits().device_nodes_size());
  EXPECT_EQ(
      "/dev/nvidia0",
      spec.devices(0).container_edits().device_nodes(0).path());
  EXPECT_EQ(
      "",
      spec.devices(0).container_edits().device_nodes(0).host_path());

  EXPECT_EQ("1", spec.devices(1).name());
  ASSERT_EQ(1, spec.devices(1).container_edits().device_nodes_size());
  EXPECT_EQ(
      "/dev/nvidia1",
      spec.devices(1).container_edits().device_nodes(0).path());
  EXPECT_EQ(
      "/host/dev/nvidia1",
      spec.devices(1).container_edits().device_nodes(0).host_path());

  EXPECT_SOME(cdi::findDevice(spec, "1"));
  EXPECT_NONE(cdi::findDevice(spec, "2"));
}


TEST(CDISpecTest, Serialize)
{
  DeviceSet devices;
  devices.version = 1;

  Device device;
  device.id = "0";
  device.path = "/dev/nvidia0";
  device.major = 195;
  device.minor = 0;
  device.health = Device::HEALTHY;
  devices.devices.push_back(device);

  const cdi::Spec spec =
    cdi::createSpec("nvidia.com/gpu", devices, cdi::ContainerEdits());

  Try<string> json = cdi::serialize(spec);
  ASSERT_SOME(json);

  EXPECT_TRUE(strings::contains(json.get(), "\"cdiVersion\""));
  EXPECT_TRUE(strings::contains(json.get(), "\"containerEdits\""));
  EXPECT_TRUE(strings::contains(json.get(), "\"deviceNodes\""));
  EXPECT_FALSE(strings::contains(json.get(), "cdi_version"));

  Try<cdi::Spec> parse = cdi::parse(json.get());
  ASSERT_SOME(parse);
  EXPECT_EQ("nvidia.com/gpu", parse->kind());
  EXPECT_SOME(cdi::findDevice(parse.get(), "0"));

  // Fields this plugin does not model are ignored.
  parse = cdi::parse(
      "{\"cdiVersion\": \"0.6.0\", \"kind\": \"nvidia.com/gpu\","
      " \"annotations\": {\"a\": \"b\"}, \"devices\": []}");

  ASSERT_SOME(parse);
  EXPECT_EQ(0, parse->devices_size());

  EXPECT_ERROR(cdi::parse("{\"devices\": "));
}


TEST(CDIPathsTest, SpecPath)
{
  EXPECT_EQ(
      "/var/run/cdi/nvidia.com-gpu.json",
      cdi::paths::getSpecPath("/var/run/cdi", "nvidia.com/gpu"));
}


class SpecSynchronizerTest : public TemporaryDirectoryTest
{
protected:
  void SetUp() override
  {
    TemporaryDirectoryTest::SetUp();

    devDir = path::join(sandbox.get(), "dev");
    cdiDir = path::join(sandbox.get(), "cdi");
  }

  Owned<SpecSynchronizer> createSynchronizer(
      const vector<string>& controlDevices = vector<string>(),
      const vector<cdi::Mount>& mounts = vector<cdi::Mount>())
  {
    Try<Owned<SpecSynchronizer>> synchronizer = SpecSynchronizer::create(
        "nvidia.com/gpu", cdiDir, devDir, controlDevices, mounts);

    CHECK_SOME(synchronizer);

    return synchronizer.get();
  }

  string devDir;
  string cdiDir;
};


TEST_F(SpecSynchronizerTest, InvalidKind)
{
  EXPECT_ERROR(SpecSynchronizer::create(
      "gpu", cdiDir, devDir, vector<string>(), vector<cdi::Mount>()));
}


// The specification is written atomically: no temporary file is left
// behind and the file is world readable for the container runtime.
TEST_F(SpecSynchronizerTest, Sync)
{
  DeviceSet devices = createDevices(devDir, 2);

  Owned<SpecSynchronizer> synchronizer = createSynchronizer();

  EXPECT_EQ(path::join(cdiDir, "nvidia.com-gpu.json"), synchronizer->path());

  ASSERT_SOME(synchronizer->sync(devices));

  Try<list<string>> entries = os::ls(cdiDir);
  ASSERT_SOME(entries);
  EXPECT_EQ(list<string>({"nvidia.com-gpu.json"}), entries.get());

  Try<mode_t> mode = os::stat::mode(synchronizer->path());
  ASSERT_SOME(mode);
  EXPECT_EQ(0644u, mode.get() & 0777u);

  Try<cdi::Spec> spec = synchronizer->read();
  ASSERT_SOME(spec);

  EXPECT_EQ("nvidia.com/gpu", spec->kind());
  ASSERT_EQ(2, spec->devices_size());
  EXPECT_EQ("0", spec->devices(0).name());
  EXPECT_EQ("1", spec->devices(1).name());

  // A device that turns unhealthy disappears from the specification.
  devices.version++;
  devices.devices[0].health = Device::UNHEALTHY;

  ASSERT_SOME(synchronizer->sync(devices));

  spec = synchronizer->read();
  ASSERT_SOME(spec);
  ASSERT_EQ(1, spec->devices_size());
  EXPECT_EQ("1", spec->devices(0).name());

  entries = os::ls(cdiDir);
  ASSERT_SOME(entries);
  EXPECT_EQ(1u, entries->size());
}


// A specification without any device is still written so that the
// container runtime sees no stale entries.
TEST_F(SpecSynchronizerTest, SyncNoHealthyDevices)
{
  DeviceSet devices = createDevices(devDir, 1);
  devices.devices[0].health = Device::UNHEALTHY;

  Owned<SpecSynchronizer> synchronizer = createSynchronizer();

  ASSERT_SOME(synchronizer->sync(devices));

  Try<string> content = os::read(synchronizer->path());
  ASSERT_SOME(content);
  EXPECT_TRUE(strings::contains(content.get(), "\"devices\""));

  Try<cdi::Spec> spec = synchronizer->read();
  ASSERT_SOME(spec);
  EXPECT_EQ(0, spec->devices_size());
}


TEST_F(SpecSynchronizerTest, ContainerEdits)
{
  DeviceSet devices = createDevices(devDir, 1);

  ASSERT_SOME(os::touch(path::join(devDir, "nvidiactl")));

  Try<vector<cdi::Mount>> mounts = cdi::parseMounts("/usr/lib/libcuda.so.1");
  ASSERT_SOME(mounts);

  Owned<SpecSynchronizer> synchronizer =
    createSynchronizer({"nvidiactl", "nvidia-uvm"}, mounts.get());

  ASSERT_SOME(synchronizer->sync(devices));

  Try<cdi::Spec> spec = synchronizer->read();
  ASSERT_SOME(spec);

  // `nvidia-uvm` does not exist and is left out.
  ASSERT_EQ(1, spec->container_edits().device_nodes_size());
  EXPECT_EQ("/dev/nvidiactl", spec->container_edits().device_nodes(0).path());
  EXPECT_EQ(
      path::join(devDir, "nvidiactl"),
      spec->container_edits().device_nodes(0).host_path());

  ASSERT_EQ(1, spec->container_edits().mounts_size());
  EXPECT_EQ(
      "/usr/lib/libcuda.so.1",
      spec->container_edits().mounts(0).container_path());
}


TEST_F(SpecSynchronizerTest, SyncFailure)
{
  DeviceSet devices = createDevices(devDir, 1);

  // The specification directory cannot be created over a regular file.
  ASSERT_SOME(os::touch(cdiDir));

  Owned<SpecSynchronizer> synchronizer = createSynchronizer();

  EXPECT_ERROR(synchronizer->sync(devices));
  EXPECT_ERROR(synchronizer->read());
}

} // namespace tests {
} // namespace internal {
} // namespace cdiplugin {
