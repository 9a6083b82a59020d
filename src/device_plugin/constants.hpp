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

#ifndef __DEVICE_PLUGIN_CONSTANTS_HPP__
#define __DEVICE_PLUGIN_CONSTANTS_HPP__

#include <stddef.h>

#include <stout/duration.hpp>

namespace cdiplugin {
namespace internal {

constexpr char DEFAULT_RESOURCE_NAME[] = "nvidia.com/gpu";
constexpr char DEFAULT_KUBELET_DIR[] = "/var/lib/kubelet/device-plugins";
constexpr char DEFAULT_SOCKET_NAME[] = "nvidia-cdi-device-plugin.sock";
constexpr char DEFAULT_CDI_DIR[] = "/var/run/cdi";
constexpr char DEFAULT_DEV_DIR[] = "/dev";
constexpr char DEFAULT_SYSFS_DIR[] = "/sys";
constexpr char DEFAULT_DEVICE_PREFIX[] = "nvidia";
constexpr char DEFAULT_CONTROL_DEVICES[] =
  "nvidiactl,nvidia-uvm,nvidia-uvm-tools,nvidia-modeset";

constexpr Duration DEFAULT_HEALTH_CHECK_INTERVAL = Seconds(10);

// The registrar initially picks a random amount of time between `[0, b]`,
// where `b = DEFAULT_REGISTRATION_BACKOFF_FACTOR`, to retry registering with
// the kubelet. Subsequent retries are exponentially backed off based on this
// interval (e.g., 2nd retry uses a random value between `[0, b * 2^1]`, 3rd
// retry between `[0, b * 2^2]`, etc) up to a maximum of
// `DEFAULT_REGISTRATION_RETRY_INTERVAL_MAX`.
constexpr Duration DEFAULT_REGISTRATION_BACKOFF_FACTOR = Seconds(1);
constexpr Duration DEFAULT_REGISTRATION_RETRY_INTERVAL_MAX = Seconds(30);
constexpr size_t DEFAULT_REGISTRATION_MAX_ATTEMPTS = 30;

constexpr Duration DEFAULT_KUBELET_WATCH_INTERVAL = Seconds(1);

// How long the plugin waits for its own socket to appear after starting
// the gRPC server.
constexpr Duration PLUGIN_SOCKET_TIMEOUT = Seconds(5);

// How often a `ListAndWatch` stream wakes up to notice cancellation.
constexpr Duration LIST_AND_WATCH_POLL_INTERVAL = Milliseconds(100);

// Deadline for in-flight RPCs when the gRPC server is shut down.
constexpr Duration SERVER_SHUTDOWN_TIMEOUT = Seconds(1);

} // namespace internal {
} // namespace cdiplugin {

#endif // __DEVICE_PLUGIN_CONSTANTS_HPP__
