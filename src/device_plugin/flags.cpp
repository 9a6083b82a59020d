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

#include "device_plugin/flags.hpp"

#include <vector>

#include <stout/error.hpp>
#include <stout/none.hpp>
#include <stout/nothing.hpp>
#include <stout/stringify.hpp>
#include <stout/strings.hpp>
#include <stout/try.hpp>

#include "cdi/spec.hpp"

#include "device_plugin/constants.hpp"

using std::string;
using std::vector;

namespace {

Option<Error> validatePositive(const string& name, const Duration& value)
{
  if (value <= Duration::zero()) {
    return Error(
        "Expected `--" + name + "` to be positive but got " +
        stringify(value));
  }

  return None();
}

} // namespace {


cdiplugin::internal::Flags::Flags()
{
  add(&Flags::version,
      "version",
      "Show version and exit.",
      false);

  add(&Flags::resource_name,
      "resource_name",
      "Extended resource name advertised to the kubelet, which is also the\n"
      "kind of the generated CDI specification. Must be fully qualified,\n"
      "i.e., of the form `<vendor>/<class>`.",
      DEFAULT_RESOURCE_NAME,
      [](const string& value) -> Option<Error> {
        Try<Nothing> validate = cdi::validateKind(value);
        if (validate.isError()) {
          return Error(validate.error());
        }

        return None();
      });

  add(&Flags::kubelet_dir,
      "kubelet_dir",
      "Directory of the kubelet's device plugin sockets. The kubelet's\n"
      "registration socket `kubelet.sock` is expected in this directory,\n"
      "and the plugin's own socket is created there.",
      DEFAULT_KUBELET_DIR);

  add(&Flags::socket_name,
      "socket_name",
      "Name of the unix socket the plugin serves on, relative to\n"
      "`--kubelet_dir`.",
      DEFAULT_SOCKET_NAME,
      [](const string& value) -> Option<Error> {
        if (value.empty() || strings::contains(value, "/")) {
          return Error(
              "Expected `--socket_name` to be a plain file name but got '" +
              value + "'");
        }

        return None();
      });

  add(&Flags::cdi_dir,
      "cdi_dir",
      "Directory where the CDI specification file is written.",
      DEFAULT_CDI_DIR);

  add(&Flags::dev_dir,
      "dev_dir",
      "Directory scanned for device nodes.",
      DEFAULT_DEV_DIR);

  add(&Flags::sysfs_dir,
      "sysfs_dir",
      "Mount point of sysfs, used to look up the NUMA node of each device.",
      DEFAULT_SYSFS_DIR);

  add(&Flags::device_prefix,
      "device_prefix",
      "Name prefix of the device nodes in `--dev_dir`. A device node is\n"
      "named after this prefix followed by a decimal number, which is\n"
      "used as the device ID (e.g., `nvidia0` has the ID `0`).",
      DEFAULT_DEVICE_PREFIX,
      [](const string& value) -> Option<Error> {
        if (value.empty()) {
          return Error("Expected `--device_prefix` to be non-empty");
        }

        return None();
      });

  add(&Flags::control_devices,
      "control_devices",
      "Comma-separated list of device nodes in `--dev_dir` that every\n"
      "container using a device needs. Those that exist are added to the\n"
      "CDI specification for all devices.",
      DEFAULT_CONTROL_DEVICES);

  add(&Flags::cdi_mounts,
      "cdi_mounts",
      "Comma-separated list of `<host_path>[:<container_path>]` that are\n"
      "bind mounted read-only into every container using a device\n"
      "(e.g., driver libraries).",
      [](const Option<string>& value) -> Option<Error> {
        if (value.isSome()) {
          Try<vector<cdi::Mount>> mounts = cdi::parseMounts(value.get());
          if (mounts.isError()) {
            return Error("Invalid `--cdi_mounts`: " + mounts.error());
          }
        }

        return None();
      });

  add(&Flags::require_devices,
      "require_devices",
      "Whether to fail at startup if no device is discovered.",
      true);

  add(&Flags::preferred_allocation,
      "preferred_allocation",
      "Whether to advertise `GetPreferredAllocation` to the kubelet.",
      true);

  add(&Flags::health_check_interval,
      "health_check_interval",
      "Interval between two device health checks.",
      DEFAULT_HEALTH_CHECK_INTERVAL,
      [](const Duration& value) -> Option<Error> {
        return validatePositive("health_check_interval", value);
      });

  add(&Flags::registration_backoff_factor,
      "registration_backoff_factor",
      "The plugin picks a random amount of time between `[0, b]`, where\n"
      "`b = registration_backoff_factor`, to retry registering with the\n"
      "kubelet. Subsequent retries are exponentially backed off based on\n"
      "this interval (e.g., 2nd retry uses a random value between\n"
      "`[0, b * 2^1]`, 3rd retry between `[0, b * 2^2]`, etc) up to a\n"
      "maximum of `--registration_retry_interval_max`.",
      DEFAULT_REGISTRATION_BACKOFF_FACTOR,
      [](const Duration& value) -> Option<Error> {
        return validatePositive("registration_backoff_factor", value);
      });

  add(&Flags::registration_retry_interval_max,
      "registration_retry_interval_max",
      "Maximum interval between two registration attempts.",
      DEFAULT_REGISTRATION_RETRY_INTERVAL_MAX,
      [](const Duration& value) -> Option<Error> {
        return validatePositive("registration_retry_interval_max", value);
      });

  add(&Flags::registration_max_attempts,
      "registration_max_attempts",
      "Number of consecutive failed registration attempts after which the\n"
      "plugin gives up and exits.",
      DEFAULT_REGISTRATION_MAX_ATTEMPTS,
      [](const size_t& value) -> Option<Error> {
        if (value == 0) {
          return Error(
              "Expected `--registration_max_attempts` to be at least 1");
        }

        return None();
      });

  add(&Flags::kubelet_watch_interval,
      "kubelet_watch_interval",
      "Interval between two checks of the kubelet's registration socket.\n"
      "If the socket is removed or replaced (i.e., the kubelet restarted),\n"
      "the plugin registers again.",
      DEFAULT_KUBELET_WATCH_INTERVAL,
      [](const Duration& value) -> Option<Error> {
        return validatePositive("kubelet_watch_interval", value);
      });
}
