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

#include <stdlib.h>

#include <iostream>
#include <string>
#include <vector>

#include <cdiplugin/v1beta1.hpp>
#include <cdiplugin/version.hpp>

#include <glog/logging.h>

#include <process/async.hpp>
#include <process/future.hpp>
#include <process/owned.hpp>
#include <process/process.hpp>

#include <stout/check.hpp>
#include <stout/exit.hpp>
#include <stout/flags.hpp>
#include <stout/foreach.hpp>
#include <stout/nothing.hpp>
#include <stout/option.hpp>
#include <stout/strings.hpp>
#include <stout/try.hpp>

#include "cdi/spec.hpp"
#include "cdi/synchronizer.hpp"

#include "device/health_monitor.hpp"
#include "device/inventory.hpp"

#include "device_plugin/constants.hpp"
#include "device_plugin/device_plugin.hpp"
#include "device_plugin/flags.hpp"
#include "device_plugin/metrics.hpp"
#include "device_plugin/paths.hpp"
#include "device_plugin/registrar.hpp"

#include "logging/logging.hpp"

using namespace cdiplugin::internal;

namespace cdi = cdiplugin::cdi;
namespace device = cdiplugin::device;

using std::cerr;
using std::cout;
using std::endl;
using std::string;
using std::vector;

using process::Failure;
using process::Future;
using process::Owned;

using cdiplugin::cdi::SpecSynchronizer;

using cdiplugin::device::DevfsInventory;
using cdiplugin::device::DeviceSet;
using cdiplugin::device::HealthMonitor;


int main(int argc, char** argv)
{
  GOOGLE_PROTOBUF_VERIFY_VERSION;

  Flags flags;

  Try<flags::Warnings> load = flags.load("CDI_PLUGIN_", argc, argv);

  if (flags.help) {
    cout << flags.usage() << endl;
    return EXIT_SUCCESS;
  }

  if (flags.version) {
    cout << "cdi-device-plugin" << " " << CDIPLUGIN_VERSION << endl;
    return EXIT_SUCCESS;
  }

  if (load.isError()) {
    cerr << load.error() << "\n\n"
         << "See `cdi-device-plugin --help` for a list of supported flags."
         << endl;
    return EXIT_FAILURE;
  }

  logging::initialize(argv[0], flags);

  // Log any flag warnings (after logging is initialized).
  foreach (const flags::Warning& warning, load->warnings) {
    LOG(WARNING) << warning.message;
  }

  LOG(INFO) << "Starting cdi-device-plugin " << CDIPLUGIN_VERSION;
  LOG(INFO) << "Flags at startup: " << flags;

  process::initialize();

  DevfsInventory inventory(
      flags.dev_dir, flags.sysfs_dir, flags.device_prefix);

  Try<DeviceSet> devices = inventory.discover();
  if (devices.isError()) {
    EXIT(EXIT_FAILURE)
      << "Failed to discover devices in '" << flags.dev_dir << "': "
      << devices.error();
  }

  if (devices->devices.empty() && flags.require_devices) {
    EXIT(EXIT_FAILURE)
      << "No devices named '" << flags.device_prefix << "<N>' found in '"
      << flags.dev_dir << "'";
  }

  LOG(INFO) << "Discovered " << devices->devices.size() << " device(s) in '"
            << flags.dev_dir << "'";

  foreach (const device::Device& device, devices->devices) {
    LOG(INFO) << device;
  }

  vector<cdi::Mount> mounts;
  if (flags.cdi_mounts.isSome()) {
    // Already validated when the flags were loaded.
    mounts = CHECK_NOTERROR(cdi::parseMounts(flags.cdi_mounts.get()));
  }

  const vector<string> controlDevices =
    strings::tokenize(flags.control_devices, ",");

  Try<Owned<SpecSynchronizer>> synchronizer = SpecSynchronizer::create(
      flags.resource_name,
      flags.cdi_dir,
      flags.dev_dir,
      controlDevices,
      mounts);

  if (synchronizer.isError()) {
    EXIT(EXIT_FAILURE)
      << "Failed to create the CDI specification synchronizer: "
      << synchronizer.error();
  }

  Metrics metrics("");

  cdiplugin::v1beta1::DevicePluginOptions options;
  options.set_pre_start_required(false);
  options.set_get_preferred_allocation_available(flags.preferred_allocation);

  Try<Owned<DevicePlugin>> plugin = DevicePlugin::create(
      devices.get(), synchronizer->get(), options, &metrics);

  if (plugin.isError()) {
    EXIT(EXIT_FAILURE)
      << "Failed to synchronize '" << synchronizer.get()->path() << "': "
      << plugin.error();
  }

  const string socketPath =
    paths::getPluginSocketPath(flags.kubelet_dir, flags.socket_name);

  Try<Nothing> startup = plugin.get()->startup(socketPath);
  if (startup.isError()) {
    EXIT(EXIT_FAILURE)
      << "Failed to serve the device plugin on '" << socketPath << "': "
      << startup.error();
  }

  Future<Nothing> socket = waitSocket(socketPath, PLUGIN_SOCKET_TIMEOUT);
  socket.await();

  if (!socket.isReady()) {
    EXIT(EXIT_FAILURE)
      << "Failed to wait for '" << socketPath << "': "
      << (socket.isFailed() ? socket.failure() : "discarded");
  }

  HealthMonitor monitor(
      &inventory,
      devices.get(),
      flags.health_check_interval,
      [&plugin](const DeviceSet& next) {
        return plugin.get()->update(next);
      });

  cdiplugin::v1beta1::RegisterRequest request;
  request.set_version(cdiplugin::v1beta1::API_VERSION);
  request.set_endpoint(flags.socket_name);
  request.set_resource_name(flags.resource_name);
  request.mutable_options()->CopyFrom(options);

  // When the kubelet restarts, it wipes the device plugin directory and
  // forgets about the plugin. The server is restarted on a new socket if
  // needed and the allocations are dropped in favor of the kubelet's own
  // checkpoint.
  Registrar registrar(
      flags,
      request,
      [&plugin]() -> Future<Nothing> {
        DevicePlugin* devicePlugin = plugin->get();

        return process::async([devicePlugin]() {
            return devicePlugin->rebind();
          })
          .then([devicePlugin](
              const Try<Nothing>& rebind) -> Future<Nothing> {
            if (rebind.isError()) {
              return Failure(
                  "Failed to restart the device plugin server: " +
                  rebind.error());
            }

            return devicePlugin->reset();
          });
      },
      &metrics);

  Future<Nothing> terminated = registrar.wait();
  terminated.await();

  plugin.get()->shutdown();

  EXIT(EXIT_FAILURE)
    << (terminated.isFailed() ? terminated.failure() : "Registrar terminated");
}
