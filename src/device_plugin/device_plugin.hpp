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

#ifndef __DEVICE_PLUGIN_DEVICE_PLUGIN_HPP__
#define __DEVICE_PLUGIN_DEVICE_PLUGIN_HPP__

#include <memory>
#include <mutex>
#include <string>

#include <grpcpp/server.h>

#include <cdiplugin/v1beta1.hpp>

#include <process/future.hpp>
#include <process/owned.hpp>

#include <stout/duration.hpp>
#include <stout/nothing.hpp>
#include <stout/option.hpp>
#include <stout/try.hpp>

#include "cdi/synchronizer.hpp"

#include "device/device.hpp"

#include "device_plugin/metrics.hpp"

namespace cdiplugin {
namespace internal {

// Forward declarations.
class DevicePluginProcess;
class DevicePluginService;


// Serves the kubelet's `v1beta1.DevicePlugin` API on a unix socket.
//
// The current device set, the allocation table and the `ListAndWatch`
// subscriptions are owned by a single actor (`DevicePluginProcess`), so
// allocations are serialized and each device set is written to the CDI
// specification before it is published to any stream. The gRPC handlers run
// on the threads of a synchronous gRPC server and wait for the actor.
class DevicePlugin
{
public:
  // Synchronizes the CDI specification with `devices` before anything is
  // advertised. The synchronizer and metrics must outlive the plugin.
  static Try<process::Owned<DevicePlugin>> create(
      const device::DeviceSet& devices,
      cdi::SpecSynchronizer* synchronizer,
      const v1beta1::DevicePluginOptions& options,
      Metrics* metrics);

  ~DevicePlugin();

  // Starts serving on `socketPath`. A stale socket file is replaced.
  Try<Nothing> startup(const std::string& socketPath);

  // Closes all `ListAndWatch` streams and stops serving. Does nothing if the
  // server is not running.
  void shutdown();

  // Restarts the server on the socket it was last started on if the socket
  // file has been removed (e.g., the kubelet wipes its device plugin
  // directory when it restarts). Blocks while the server restarts.
  Try<Nothing> rebind();

  // Applies a newer device set: the CDI specification is synchronized first
  // and the device set is then published to all `ListAndWatch` streams. If
  // the synchronization fails, the current device set is kept.
  process::Future<Nothing> update(const device::DeviceSet& devices);

  // Forgets all allocations. The kubelet's own checkpoint is authoritative
  // after it restarts.
  process::Future<Nothing> reset();

  process::Future<device::Snapshot> snapshot();

  const v1beta1::DevicePluginOptions& options() const { return options_; }

private:
  DevicePlugin(
      const v1beta1::DevicePluginOptions& options,
      process::Owned<DevicePluginProcess> process);

  DevicePlugin(const DevicePlugin&) = delete;
  DevicePlugin& operator=(const DevicePlugin&) = delete;

  const v1beta1::DevicePluginOptions options_;

  process::Owned<DevicePluginProcess> process;

  // Guards the server state below.
  std::mutex mutex;
  std::unique_ptr<DevicePluginService> service;
  std::unique_ptr<grpc::Server> server;
  Option<std::string> socketPath;
};


// Returns the wire representation of a device set as sent on
// `ListAndWatch` streams.
v1beta1::ListAndWatchResponse createListAndWatchResponse(
    const device::DeviceSet& devices);


// Waits for the socket at `path` to appear.
process::Future<Nothing> waitSocket(
    const std::string& path,
    const Duration& timeout);

} // namespace internal {
} // namespace cdiplugin {

#endif // __DEVICE_PLUGIN_DEVICE_PLUGIN_HPP__
