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

#include "device/health_monitor.hpp"

#include <string>

#include <glog/logging.h>

#include <process/defer.hpp>
#include <process/delay.hpp>
#include <process/dispatch.hpp>
#include <process/id.hpp>
#include <process/process.hpp>

#include <stout/foreach.hpp>
#include <stout/option.hpp>

using std::string;

using process::Future;
using process::Owned;
using process::Process;
using process::ProcessBase;

using process::defer;
using process::delay;
using process::dispatch;
using process::spawn;
using process::terminate;
using process::wait;

namespace cdiplugin {
namespace device {

class HealthMonitorProcess : public Process<HealthMonitorProcess>
{
public:
  HealthMonitorProcess(
      Inventory* _inventory,
      const DeviceSet& _devices,
      const Duration& _interval,
      const lambda::function<Future<Nothing>(const DeviceSet&)>& _update)
    : ProcessBase(process::ID::generate("health-monitor")),
      inventory(_inventory),
      devices(_devices),
      interval(_interval),
      update(_update) {}

  Future<Nothing> check();

protected:
  void initialize() override;

private:
  void performCheck();
  void scheduleNext(const Duration& duration);

  Inventory* inventory;

  // The last device set that was successfully applied.
  DeviceSet devices;

  const Duration interval;
  const lambda::function<Future<Nothing>(const DeviceSet&)> update;

  Option<Future<Nothing>> pending;
};


void HealthMonitorProcess::initialize()
{
  scheduleNext(interval);
}


void HealthMonitorProcess::performCheck()
{
  check()
    .onAny(defer(self(), [this](const Future<Nothing>&) {
      scheduleNext(interval);
    }));
}


void HealthMonitorProcess::scheduleNext(const Duration& duration)
{
  VLOG(2) << "Scheduling device health check in " << duration;

  delay(duration, self(), &Self::performCheck);
}


Future<Nothing> HealthMonitorProcess::check()
{
  if (pending.isSome() && pending->isPending()) {
    return pending.get();
  }

  DeviceSet next = devices;
  next.version = devices.version + 1;

  bool changed = false;
  foreach (Device& device, next.devices) {
    const Device::Health health = inventory->health(device);
    if (health != device.health) {
      LOG(WARNING) << "Device " << device << " transitioned from "
                   << device.health << " to " << health;

      device.health = health;
      changed = true;
    }
  }

  if (!changed) {
    return Nothing();
  }

  pending = update(next)
    .then(defer(self(), [=]() {
      devices = next;
      return Nothing();
    }))
    .onFailed([](const string& failure) {
      LOG(ERROR) << "Failed to apply the device health change: " << failure
                 << "; retrying on the next check";
    });

  return pending.get();
}


HealthMonitor::HealthMonitor(
    Inventory* inventory,
    const DeviceSet& devices,
    const Duration& interval,
    const lambda::function<Future<Nothing>(const DeviceSet&)>& update)
  : process(new HealthMonitorProcess(inventory, devices, interval, update))
{
  spawn(CHECK_NOTNULL(process.get()));
}


HealthMonitor::~HealthMonitor()
{
  terminate(process.get());
  wait(process.get());
}


Future<Nothing> HealthMonitor::check()
{
  return dispatch(process.get(), &HealthMonitorProcess::check);
}

} // namespace device {
} // namespace cdiplugin {
