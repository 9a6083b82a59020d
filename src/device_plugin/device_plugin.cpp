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

#include "device_plugin/device_plugin.hpp"

#include <algorithm>
#include <chrono>
#include <list>
#include <vector>

#include <glog/logging.h>

#include <grpcpp/security/server_credentials.h>
#include <grpcpp/server_builder.h>
#include <grpcpp/server_context.h>

#include <process/after.hpp>
#include <process/defer.hpp>
#include <process/dispatch.hpp>
#include <process/grpc.hpp>
#include <process/id.hpp>
#include <process/loop.hpp>
#include <process/process.hpp>
#include <process/timeout.hpp>

#include <stout/error.hpp>
#include <stout/foreach.hpp>
#include <stout/hashset.hpp>
#include <stout/os.hpp>
#include <stout/path.hpp>
#include <stout/stringify.hpp>
#include <stout/synchronized.hpp>

#include "cdi/spec.hpp"

#include "device_plugin/constants.hpp"
#include "device_plugin/paths.hpp"
#include "device_plugin/watcher.hpp"

using std::list;
using std::shared_ptr;
using std::string;
using std::vector;

using grpc::InsecureServerCredentials;
using grpc::ServerBuilder;
using grpc::ServerContext;
using grpc::ServerWriter;
using grpc::Status;
using grpc::StatusCode;

using process::Break;
using process::Continue;
using process::ControlFlow;
using process::Failure;
using process::Future;
using process::Owned;
using process::Process;
using process::ProcessBase;
using process::Timeout;

using process::spawn;
using process::terminate;
using process::wait;

using process::grpc::StatusError;

using cdiplugin::device::Device;
using cdiplugin::device::DeviceSet;
using cdiplugin::device::Snapshot;

namespace cdiplugin {
namespace internal {

class DevicePluginProcess : public Process<DevicePluginProcess>
{
public:
  DevicePluginProcess(
      const DeviceSet& devices,
      cdi::SpecSynchronizer* _synchronizer,
      Metrics* _metrics)
    : ProcessBase(process::ID::generate("device-plugin")),
      current(std::make_shared<const DeviceSet>(devices)),
      synchronizer(_synchronizer),
      metrics(_metrics) {}

  Future<Nothing> update(const DeviceSet& devices);

  Snapshot snapshot() { return current; }

  shared_ptr<Watcher> watch();
  void unwatch(const shared_ptr<Watcher>& watcher);
  void closeWatchers();

  Try<v1beta1::AllocateResponse, StatusError> allocate(
      const v1beta1::AllocateRequest& request);

  v1beta1::PreferredAllocationResponse getPreferredAllocation(
      const v1beta1::PreferredAllocationRequest& request);

  void reset();

protected:
  void initialize() override;
  void finalize() override;

private:
  // Whether the device can be handed out, i.e., it is healthy and not
  // allocated yet.
  bool available(const Device& device) const;

  void updateGauges();

  Snapshot current;

  cdi::SpecSynchronizer* synchronizer;
  Metrics* metrics;

  // IDs of the devices handed out by `Allocate`.
  hashset<string> allocated;

  list<shared_ptr<Watcher>> watchers;
};


void DevicePluginProcess::initialize()
{
  updateGauges();
}


void DevicePluginProcess::finalize()
{
  closeWatchers();
}


Future<Nothing> DevicePluginProcess::update(const DeviceSet& devices)
{
  if (devices.version <= current->version) {
    return Failure(
        "Ignoring device set version " + stringify(devices.version) +
        " which is not newer than the current version " +
        stringify(current->version));
  }

  // The CDI specification must be on disk before the device set is
  // advertised, since `Allocate` resolves devices through it.
  Try<Nothing> sync = synchronizer->sync(devices);
  if (sync.isError()) {
    ++metrics->cdi_spec_sync_errors;
    return Failure(
        "Failed to synchronize the CDI specification: " + sync.error());
  }

  ++metrics->cdi_spec_syncs;

  foreach (const Device& device, devices.devices) {
    Option<Device> previous = current->find(device.id);
    if (previous.isSome() && previous->health != device.health) {
      ++metrics->device_health_transitions;
    }
  }

  current = std::make_shared<const DeviceSet>(devices);

  updateGauges();

  foreach (const shared_ptr<Watcher>& watcher, watchers) {
    watcher->put(current);
  }

  LOG(INFO) << "Published device set version " << current->version << " ("
            << current->healthy() << " of " << current->devices.size()
            << " devices healthy) to " << watchers.size() << " stream(s)";

  return Nothing();
}


shared_ptr<Watcher> DevicePluginProcess::watch()
{
  shared_ptr<Watcher> watcher(new Watcher());

  // A new stream starts with the current device set.
  watcher->put(current);

  watchers.push_back(watcher);
  ++metrics->list_and_watch_streams;

  return watcher;
}


void DevicePluginProcess::unwatch(const shared_ptr<Watcher>& watcher)
{
  const size_t size = watchers.size();

  watcher->close();
  watchers.remove(watcher);

  if (watchers.size() < size) {
    --metrics->list_and_watch_streams;
  }
}


void DevicePluginProcess::closeWatchers()
{
  foreach (const shared_ptr<Watcher>& watcher, watchers) {
    watcher->close();
  }
}


Try<v1beta1::AllocateResponse, StatusError> DevicePluginProcess::allocate(
    const v1beta1::AllocateRequest& request)
{
  // The kubelet records the devices it names as bound to the container,
  // so exactly those are handed out or the call fails. Nothing is added to
  // the allocation table unless every container request can be satisfied.
  hashset<string> reserved;

  foreach (const v1beta1::ContainerAllocateRequest& container,
           request.container_requests()) {
    foreach (const string& id, container.devices_ids()) {
      Option<Device> device = current->find(id);
      if (device.isNone()) {
        ++metrics->allocations_errors;
        return StatusError(Status(
            StatusCode::INVALID_ARGUMENT, "Unknown device '" + id + "'"));
      }

      if (device->health != Device::HEALTHY) {
        ++metrics->allocations_errors;
        return StatusError(Status(
            StatusCode::FAILED_PRECONDITION,
            "Device '" + id + "' is unhealthy"));
      }

      if (allocated.contains(id) || reserved.contains(id)) {
        ++metrics->allocations_errors;
        return StatusError(Status(
            StatusCode::RESOURCE_EXHAUSTED,
            "Device '" + id + "' is already allocated"));
      }

      reserved.insert(id);
    }
  }

  Try<cdi::Spec> spec = synchronizer->read();
  if (spec.isError()) {
    LOG(ERROR) << "Failed to resolve allocated devices: " << spec.error();

    ++metrics->allocations_errors;
    return StatusError(Status(StatusCode::INTERNAL, spec.error()));
  }

  v1beta1::AllocateResponse response;

  foreach (const v1beta1::ContainerAllocateRequest& requested,
           request.container_requests()) {
    v1beta1::ContainerAllocateResponse* container =
      response.add_container_responses();

    foreach (const string& id, requested.devices_ids()) {
      if (cdi::findDevice(spec.get(), id).isNone()) {
        const string message =
          "CDI specification '" + synchronizer->path() +
          "' has no entry for healthy device '" + id + "'";

        LOG(ERROR) << "Inconsistent device state: " << message;

        ++metrics->allocations_errors;
        return StatusError(Status(StatusCode::INTERNAL, message));
      }

      container->add_cdi_devices()->set_name(
          cdi::qualifiedName(spec->kind(), id));
    }
  }

  foreach (const string& id, reserved) {
    allocated.insert(id);
  }

  ++metrics->allocations_successes;

  return response;
}


v1beta1::PreferredAllocationResponse
DevicePluginProcess::getPreferredAllocation(
    const v1beta1::PreferredAllocationRequest& request)
{
  v1beta1::PreferredAllocationResponse response;

  // The kubelet only offers devices that no container holds, so an offered
  // device that is still in the allocation table has been released.
  foreach (const v1beta1::ContainerPreferredAllocationRequest& container,
           request.container_requests()) {
    foreach (const string& id, container.available_deviceids()) {
      if (allocated.contains(id)) {
        VLOG(1) << "Releasing device '" << id << "' offered by the kubelet";
        allocated.erase(id);
      }
    }
  }

  foreach (const v1beta1::ContainerPreferredAllocationRequest& container,
           request.container_requests()) {
    const size_t size = std::max(container.allocation_size(), 0);

    vector<string> preferred;
    hashset<string> chosen;

    auto choose = [&](const string& id) {
      if (!chosen.contains(id)) {
        chosen.insert(id);
        preferred.push_back(id);
      }
    };

    foreach (const string& id, container.must_include_deviceids()) {
      choose(id);
    }

    const size_t required = preferred.size();

    // Healthy devices come first.
    foreach (const string& id, container.available_deviceids()) {
      Option<Device> device = current->find(id);
      if (device.isSome() && available(device.get())) {
        choose(id);
      }
    }

    foreach (const string& id, container.available_deviceids()) {
      choose(id);
    }

    preferred.resize(std::min(preferred.size(), std::max(size, required)));

    v1beta1::ContainerPreferredAllocationResponse* result =
      response.add_container_responses();

    foreach (const string& id, preferred) {
      result->add_deviceids(id);
    }
  }

  return response;
}


void DevicePluginProcess::reset()
{
  LOG(INFO) << "Forgetting " << allocated.size() << " allocated device(s)";

  allocated.clear();
}


bool DevicePluginProcess::available(const Device& device) const
{
  return device.health == Device::HEALTHY && !allocated.contains(device.id);
}


void DevicePluginProcess::updateGauges()
{
  const size_t healthy = current->healthy();

  metrics->devices_healthy = healthy;
  metrics->devices_unhealthy = current->devices.size() - healthy;
}


// Implements the gRPC service on top of `DevicePluginProcess`. A new
// instance is created each time the server starts, since a synchronous
// service cannot be registered with more than one server.
class DevicePluginService : public v1beta1::DevicePlugin::Service
{
public:
  DevicePluginService(
      DevicePluginProcess* _process,
      const v1beta1::DevicePluginOptions& _options)
    : process(_process), options(_options) {}

  Status GetDevicePluginOptions(
      ServerContext* context,
      const v1beta1::Empty* request,
      v1beta1::DevicePluginOptions* response) override;

  Status ListAndWatch(
      ServerContext* context,
      const v1beta1::Empty* request,
      ServerWriter<v1beta1::ListAndWatchResponse>* writer) override;

  Status GetPreferredAllocation(
      ServerContext* context,
      const v1beta1::PreferredAllocationRequest* request,
      v1beta1::PreferredAllocationResponse* response) override;

  Status Allocate(
      ServerContext* context,
      const v1beta1::AllocateRequest* request,
      v1beta1::AllocateResponse* response) override;

  Status PreStartContainer(
      ServerContext* context,
      const v1beta1::PreStartContainerRequest* request,
      v1beta1::PreStartContainerResponse* response) override;

private:
  DevicePluginProcess* process;
  const v1beta1::DevicePluginOptions options;
};


Status DevicePluginService::GetDevicePluginOptions(
    ServerContext* context,
    const v1beta1::Empty* request,
    v1beta1::DevicePluginOptions* response)
{
  LOG(INFO) << request->GetDescriptor()->name() << " '" << *request << "'";

  *response = options;

  return Status::OK;
}


Status DevicePluginService::ListAndWatch(
    ServerContext* context,
    const v1beta1::Empty* request,
    ServerWriter<v1beta1::ListAndWatchResponse>* writer)
{
  Future<shared_ptr<Watcher>> watcher =
    process::dispatch(process, &DevicePluginProcess::watch);

  watcher.await();

  if (!watcher.isReady()) {
    return Status(StatusCode::UNAVAILABLE, "The device plugin is terminating");
  }

  LOG(INFO) << "Opened ListAndWatch stream from " << context->peer();

  while (!context->IsCancelled()) {
    Option<Snapshot> snapshot =
      watcher.get()->get(LIST_AND_WATCH_POLL_INTERVAL);

    if (watcher.get()->isClosed()) {
      break;
    }

    if (snapshot.isNone()) {
      continue;
    }

    if (!writer->Write(createListAndWatchResponse(*snapshot.get()))) {
      LOG(WARNING) << "Failed to send device set version "
                   << snapshot.get()->version << " to " << context->peer();
      break;
    }

    VLOG(1) << "Sent device set version " << snapshot.get()->version
            << " to " << context->peer();
  }

  process::dispatch(process, &DevicePluginProcess::unwatch, watcher.get());

  LOG(INFO) << "Closed ListAndWatch stream from " << context->peer();

  return Status::OK;
}


Status DevicePluginService::GetPreferredAllocation(
    ServerContext* context,
    const v1beta1::PreferredAllocationRequest* request,
    v1beta1::PreferredAllocationResponse* response)
{
  LOG(INFO) << request->GetDescriptor()->name() << " '" << *request << "'";

  Future<v1beta1::PreferredAllocationResponse> result = process::dispatch(
      process,
      &DevicePluginProcess::getPreferredAllocation,
      *request);

  result.await();

  if (!result.isReady()) {
    return Status(StatusCode::UNAVAILABLE, "The device plugin is terminating");
  }

  *response = result.get();

  return Status::OK;
}


Status DevicePluginService::Allocate(
    ServerContext* context,
    const v1beta1::AllocateRequest* request,
    v1beta1::AllocateResponse* response)
{
  LOG(INFO) << request->GetDescriptor()->name() << " '" << *request << "'";

  Future<Try<v1beta1::AllocateResponse, StatusError>> result =
    process::dispatch(process, &DevicePluginProcess::allocate, *request);

  result.await();

  if (!result.isReady()) {
    return Status(StatusCode::UNAVAILABLE, "The device plugin is terminating");
  }

  if (result->isError()) {
    LOG(WARNING) << "Rejected allocation: "
                 << result->error().status.error_message();
    return result->error().status;
  }

  *response = result->get();

  LOG(INFO) << response->GetDescriptor()->name() << " '" << *response << "'";

  return Status::OK;
}


Status DevicePluginService::PreStartContainer(
    ServerContext* context,
    const v1beta1::PreStartContainerRequest* request,
    v1beta1::PreStartContainerResponse* response)
{
  LOG(INFO) << request->GetDescriptor()->name() << " '" << *request << "'";

  return Status::OK;
}


Try<Owned<DevicePlugin>> DevicePlugin::create(
    const DeviceSet& devices,
    cdi::SpecSynchronizer* synchronizer,
    const v1beta1::DevicePluginOptions& options,
    Metrics* metrics)
{
  Try<Nothing> sync = synchronizer->sync(devices);
  if (sync.isError()) {
    ++metrics->cdi_spec_sync_errors;
    return Error(
        "Failed to synchronize the CDI specification: " + sync.error());
  }

  ++metrics->cdi_spec_syncs;

  return Owned<DevicePlugin>(new DevicePlugin(
      options,
      Owned<DevicePluginProcess>(
          new DevicePluginProcess(devices, synchronizer, metrics))));
}


DevicePlugin::DevicePlugin(
    const v1beta1::DevicePluginOptions& _options,
    Owned<DevicePluginProcess> _process)
  : options_(_options),
    process(_process)
{
  spawn(CHECK_NOTNULL(process.get()));
}


DevicePlugin::~DevicePlugin()
{
  shutdown();

  terminate(process.get());
  wait(process.get());
}


Try<Nothing> DevicePlugin::startup(const string& _socketPath)
{
  synchronized (mutex) {
    if (server) {
      return Error("Already serving on '" + socketPath.get() + "'");
    }

    const string directory = Path(_socketPath).dirname();

    Try<Nothing> mkdir = os::mkdir(directory);
    if (mkdir.isError()) {
      return Error(
          "Failed to create directory '" + directory + "': " + mkdir.error());
    }

    // Remove the socket of a previous instance, if any.
    if (os::exists(_socketPath)) {
      Try<Nothing> rm = os::rm(_socketPath);
      if (rm.isError()) {
        return Error(
            "Failed to remove stale socket '" + _socketPath + "': " +
            rm.error());
      }
    }

    service.reset(new DevicePluginService(process.get(), options_));

    ServerBuilder builder;
    builder.AddListeningPort(
        paths::getSocketEndpoint(_socketPath),
        InsecureServerCredentials());
    builder.RegisterService(service.get());

    server = builder.BuildAndStart();
    if (!server) {
      service.reset();
      return Error("Failed to start serving on '" + _socketPath + "'");
    }

    socketPath = _socketPath;

    LOG(INFO) << "Serving the " << v1beta1::API_VERSION
              << " device plugin API on '" << _socketPath << "'";
  }

  return Nothing();
}


void DevicePlugin::shutdown()
{
  synchronized (mutex) {
    if (!server) {
      return;
    }

    // Streams only wake up periodically, so close them before waiting for
    // the in-flight RPCs to finish.
    process::dispatch(process.get(), &DevicePluginProcess::closeWatchers)
      .await();

    server->Shutdown(
        std::chrono::system_clock::now() +
        std::chrono::nanoseconds(SERVER_SHUTDOWN_TIMEOUT.ns()));
    server->Wait();

    server.reset();
    service.reset();

    LOG(INFO) << "Stopped serving on '" << socketPath.get() << "'";
  }
}


Try<Nothing> DevicePlugin::rebind()
{
  Option<string> path;
  bool serving = false;

  synchronized (mutex) {
    path = socketPath;
    serving = server != nullptr;
  }

  if (path.isNone()) {
    return Error("The device plugin has not been started");
  }

  if (serving && os::exists(path.get())) {
    return Nothing();
  }

  LOG(WARNING) << "Socket '" << path.get() << "' is gone; restarting the"
               << " device plugin server";

  shutdown();

  return startup(path.get());
}


Future<Nothing> DevicePlugin::update(const DeviceSet& devices)
{
  return process::dispatch(
      process.get(), &DevicePluginProcess::update, devices);
}


Future<Nothing> DevicePlugin::reset()
{
  return process::dispatch(process.get(), &DevicePluginProcess::reset);
}


Future<Snapshot> DevicePlugin::snapshot()
{
  return process::dispatch(process.get(), &DevicePluginProcess::snapshot);
}


v1beta1::ListAndWatchResponse createListAndWatchResponse(
    const DeviceSet& devices)
{
  v1beta1::ListAndWatchResponse response;

  foreach (const Device& device, devices.devices) {
    v1beta1::Device* entry = response.add_devices();
    entry->set_id(device.id);
    entry->set_health(
        device.health == Device::HEALTHY
          ? v1beta1::HEALTHY
          : v1beta1::UNHEALTHY);

    if (device.numaNode.isSome()) {
      entry->mutable_topology()->add_nodes()->set_id(device.numaNode.get());
    }
  }

  return response;
}


Future<Nothing> waitSocket(const string& path, const Duration& timeout)
{
  if (os::exists(path)) {
    return Nothing();
  }

  Timeout deadline = Timeout::in(timeout);

  return process::loop(
      [=]() -> Future<Nothing> {
        if (deadline.expired()) {
          return Failure("Timed out waiting for socket '" + path + "'");
        }

        return process::after(Milliseconds(10));
      },
      [=](const Nothing&) -> ControlFlow<Nothing> {
        if (os::exists(path)) {
          return Break();
        }

        return Continue();
      });
}

} // namespace internal {
} // namespace cdiplugin {
