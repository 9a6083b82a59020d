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

#include "device_plugin/metrics.hpp"

#include <process/metrics/metrics.hpp>

using std::string;

namespace cdiplugin {
namespace internal {

Metrics::Metrics(const string& prefix)
  : devices_healthy(prefix + "device_plugin/devices/healthy"),
    devices_unhealthy(prefix + "device_plugin/devices/unhealthy"),
    device_health_transitions(
        prefix + "device_plugin/devices/health_transitions"),
    cdi_spec_syncs(prefix + "device_plugin/cdi_spec/syncs"),
    cdi_spec_sync_errors(prefix + "device_plugin/cdi_spec/sync_errors"),
    list_and_watch_streams(prefix + "device_plugin/list_and_watch/streams"),
    allocations_successes(prefix + "device_plugin/allocations/successes"),
    allocations_errors(prefix + "device_plugin/allocations/errors"),
    registrations(prefix + "device_plugin/registrations"),
    registration_errors(prefix + "device_plugin/registration_errors")
{
  process::metrics::add(devices_healthy);
  process::metrics::add(devices_unhealthy);
  process::metrics::add(device_health_transitions);
  process::metrics::add(cdi_spec_syncs);
  process::metrics::add(cdi_spec_sync_errors);
  process::metrics::add(list_and_watch_streams);
  process::metrics::add(allocations_successes);
  process::metrics::add(allocations_errors);
  process::metrics::add(registrations);
  process::metrics::add(registration_errors);
}


Metrics::~Metrics()
{
  process::metrics::remove(devices_healthy);
  process::metrics::remove(devices_unhealthy);
  process::metrics::remove(device_health_transitions);
  process::metrics::remove(cdi_spec_syncs);
  process::metrics::remove(cdi_spec_sync_errors);
  process::metrics::remove(list_and_watch_streams);
  process::metrics::remove(allocations_successes);
  process::metrics::remove(allocations_errors);
  process::metrics::remove(registrations);
  process::metrics::remove(registration_errors);
}

} // namespace internal {
} // namespace cdiplugin {
