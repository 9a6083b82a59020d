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

#ifndef __CDI_SYNCHRONIZER_HPP__
#define __CDI_SYNCHRONIZER_HPP__

#include <string>
#include <vector>

#include <process/owned.hpp>

#include <stout/nothing.hpp>
#include <stout/try.hpp>

#include "cdi/spec.hpp"

#include "device/device.hpp"

namespace cdiplugin {
namespace cdi {

// Keeps the CDI specification file of one kind consistent with the device
// set. Not thread-safe; callers serialize access (see `DevicePluginProcess`).
class SpecSynchronizer
{
public:
  // `controlDevices` are device node names relative to `devDir` that every
  // container using any device needs (e.g., `nvidiactl`). Those that do not
  // exist at the time of a sync are left out of the specification.
  static Try<process::Owned<SpecSynchronizer>> create(
      const std::string& kind,
      const std::string& cdiDir,
      const std::string& devDir,
      const std::vector<std::string>& controlDevices,
      const std::vector<Mount>& mounts);

  // Regenerates the specification for the healthy devices of `devices` and
  // atomically replaces the file on disk.
  Try<Nothing> sync(const device::DeviceSet& devices);

  // Parses the specification file currently on disk.
  Try<Spec> read() const;

  const std::string& kind() const { return kind_; }
  const std::string& path() const { return path_; }

private:
  SpecSynchronizer(
      const std::string& kind,
      const std::string& path,
      const std::string& devDir,
      const std::vector<std::string>& controlDevices,
      const std::vector<Mount>& mounts);

  ContainerEdits containerEdits() const;

  const std::string kind_;
  const std::string path_;
  const std::string devDir;
  const std::vector<std::string> controlDevices;
  const std::vector<Mount> mounts;
};

} // namespace cdi {
} // namespace cdiplugin {

#endif // __CDI_SYNCHRONIZER_HPP__
