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

#ifndef __DEVICE_HEALTH_MONITOR_HPP__
#define __DEVICE_HEALTH_MONITOR_HPP__

#include <process/future.hpp>
#include <process/owned.hpp>

#include <stout/duration.hpp>
#include <stout/lambda.hpp>
#include <stout/nothing.hpp>

#include "device/device.hpp"
#include "device/inventory.hpp"

namespace cdiplugin {
namespace device {

// Forward declaration.
class HealthMonitorProcess;


// Periodically re-evaluates the health of every device and hands each
// changed `DeviceSet` to `update`. The next sweep is only scheduled once
// the update has completed. A failed update keeps the previous device set
// as the baseline so the change is detected again on the next sweep.
class HealthMonitor
{
public:
  HealthMonitor(
      Inventory* inventory,
      const DeviceSet& devices,
      const Duration& interval,
      const lambda::function<
          process::Future<Nothing>(const DeviceSet&)>& update);

  ~HealthMonitor();

  // Performs a sweep now, outside of the periodic schedule. If a sweep is
  // already in progress, returns the future of that sweep instead.
  process::Future<Nothing> check();

private:
  HealthMonitor(const HealthMonitor&) = delete;
  HealthMonitor& operator=(const HealthMonitor&) = delete;

  process::Owned<HealthMonitorProcess> process;
};

} // namespace device {
} // namespace cdiplugin {

#endif // __DEVICE_HEALTH_MONITOR_HPP__
