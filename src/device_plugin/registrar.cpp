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

#include "device_plugin/registrar.hpp"

#include <stdlib.h>

#include <sys/types.h>

#include <algorithm>
#include <string>

#include <glog/logging.h>

#include <process/defer.hpp>
#include <process/delay.hpp>
#include <process/dispatch.hpp>
#include <process/grpc.hpp>
#include <process/id.hpp>
#include <process/process.hpp>

#include <stout/duration.hpp>
#include <stout/lambda.hpp>
#include <stout/option.hpp>
#include <stout/os.hpp>
#include <stout/stringify.hpp>

#include <stout/os/stat.hpp>

#include "device_plugin/paths.hpp"
#include "device_plugin/v1beta1_client.hpp"

using std::string;

using process::Failure;
using process::Future;
using process::Owned;
using process::Process;
using process::ProcessBase;
using process::Promise;

using process::defer;
using process::spawn;

using process::grpc::client::Connection;
using process::grpc::client::Runtime;

namespace cdiplugin {
namespace internal {

class RegistrarProcess : public Process<RegistrarProcess>
{
public:
  RegistrarProcess(
      const Flags& _flags,
      const v1beta1::RegisterRequest& _request,
      const std::function<Future<Nothing>()>& _reconnectHook,
      Metrics* _metrics)
    : ProcessBase(process::ID::generate("device-plugin-registrar")),
      flags(_flags),
      request(_request),
      reconnectHook(_reconnectHook),
      metrics(_metrics),
      kubeletSocket(paths::getKubeletSocketPath(flags.kubelet_dir)),
      pluginSocket(
          paths::getPluginSocketPath(flags.kubelet_dir, flags.socket_name)),
      state(UNREGISTERED),
      registering(false),
      reconnecting(false),
      attempts(0),
      registration(new Promise<Nothing>()) {}

  Future<Nothing> registered();
  Future<Nothing> wait();

protected:
  void initialize() override;
  void finalize() override;

private:
  enum State
  {
    UNREGISTERED,
    REGISTERED
  };

  Future<Nothing> reconnect();
  Future<Nothing> _register();

  void doReliableRegistration(Duration maxBackoff);
  void _doReliableRegistration(
      const Duration& maxBackoff,
      const Future<Nothing>& future);

  void watchKubelet();

  const Flags flags;
  const v1beta1::RegisterRequest request;
  const std::function<Future<Nothing>()> reconnectHook;
  Metrics* metrics;

  const string kubeletSocket;
  const string pluginSocket;

  Runtime runtime;

  State state;

  // Whether a registration attempt is in flight.
  bool registering;

  // Whether the reconnect hook has to run before the next attempt.
  bool reconnecting;

  // Number of consecutive failed attempts.
  size_t attempts;

  // Inode of the kubelet socket at the time of the last registration.
  Option<ino_t> kubeletInode;

  Owned<Promise<Nothing>> registration;
  Promise<Nothing> terminated;
};


void RegistrarProcess::initialize()
{
  doReliableRegistration(flags.registration_backoff_factor);

  process::delay(
      flags.kubelet_watch_interval, self(), &Self::watchKubelet);
}


void RegistrarProcess::finalize()
{
  runtime.terminate();
}


Future<Nothing> RegistrarProcess::registered()
{
  return registration->future();
}


Future<Nothing> RegistrarProcess::wait()
{
  return terminated.future();
}


Future<Nothing> RegistrarProcess::reconnect()
{
  if (!reconnecting) {
    return Nothing();
  }

  LOG(INFO) << "Invoking reconnect hook before registering again";

  return reconnectHook()
    .then(defer(self(), [this]() {
      reconnecting = false;
      return Nothing();
    }));
}


Future<Nothing> RegistrarProcess::_register()
{
  v1beta1::Client client(
      Connection(paths::getSocketEndpoint(kubeletSocket)), runtime);

  return client.registerPlugin(request)
    .then([](const v1beta1::RPCResult<v1beta1::Empty>& result)
        -> Future<Nothing> {
      if (result.isError()) {
        return Failure(result.error());
      }

      return Nothing();
    });
}


void RegistrarProcess::doReliableRegistration(Duration maxBackoff)
{
  if (state == REGISTERED || registering || !terminated.future().isPending()) {
    return;
  }

  registering = true;

  reconnect()
    .then(defer(self(), &Self::_register))
    .onAny(defer(
        self(), &Self::_doReliableRegistration, maxBackoff, lambda::_1));
}


void RegistrarProcess::_doReliableRegistration(
    const Duration& maxBackoff,
    const Future<Nothing>& future)
{
  registering = false;

  if (future.isReady()) {
    Try<ino_t> inode = os::stat::inode(kubeletSocket);
    if (inode.isError()) {
      LOG(WARNING) << "Failed to get the inode of '" << kubeletSocket
                   << "': " << inode.error();

      kubeletInode = None();
    } else {
      kubeletInode = inode.get();
    }

    state = REGISTERED;
    attempts = 0;
    ++metrics->registrations;

    LOG(INFO) << "Registered resource '" << request.resource_name()
              << "' served on '" << request.endpoint()
              << "' with the kubelet at '" << kubeletSocket << "'";

    registration->set(Nothing());
    return;
  }

  const string error =
    future.isFailed() ? future.failure() : "future discarded";

  ++attempts;
  ++metrics->registration_errors;

  LOG(WARNING) << "Failed to register with the kubelet at '" << kubeletSocket
               << "' (attempt " << attempts << " of "
               << flags.registration_max_attempts << "): " << error;

  if (attempts >= flags.registration_max_attempts) {
    const string message =
      "Gave up registering with the kubelet after " + stringify(attempts) +
      " consecutive failed attempts: " + error;

    LOG(ERROR) << message;

    registration->fail(message);
    terminated.fail(message);
    return;
  }

  // Backoff duration is randomized in `[0, maxBackoff]`, where `maxBackoff`
  // doubles with every failed attempt up to the configured maximum.
  const Duration backoff = std::min(
      maxBackoff, flags.registration_retry_interval_max);

  const Duration delay = backoff * ((double) os::random() / RAND_MAX);

  VLOG(1) << "Retrying registration in " << delay;

  process::delay(
      delay, self(), &Self::doReliableRegistration, backoff * 2);
}


void RegistrarProcess::watchKubelet()
{
  if (!terminated.future().isPending()) {
    return;
  }

  if (state == REGISTERED) {
    Option<string> reason;

    if (!os::exists(kubeletSocket)) {
      reason = "'" + kubeletSocket + "' was removed";
    } else {
      Try<ino_t> inode = os::stat::inode(kubeletSocket);
      if (inode.isError()) {
        VLOG(1) << "Failed to get the inode of '" << kubeletSocket << "': "
                << inode.error();
      } else if (kubeletInode.isNone()) {
        // The inode could not be read when registering.
        kubeletInode = inode.get();
      } else if (inode.get() != kubeletInode.get()) {
        reason = "'" + kubeletSocket + "' was replaced";
      }
    }

    if (reason.isNone() && !os::exists(pluginSocket)) {
      reason = "'" + pluginSocket + "' was removed";
    }

    if (reason.isSome()) {
      LOG(WARNING) << "Lost registration with the kubelet: " << reason.get();

      state = UNREGISTERED;
      reconnecting = true;
      attempts = 0;
      registration.reset(new Promise<Nothing>());

      doReliableRegistration(flags.registration_backoff_factor);
    }
  }

  process::delay(
      flags.kubelet_watch_interval, self(), &Self::watchKubelet);
}


Registrar::Registrar(
    const Flags& flags,
    const v1beta1::RegisterRequest& request,
    const std::function<Future<Nothing>()>& reconnectHook,
    Metrics* metrics)
  : process(new RegistrarProcess(flags, request, reconnectHook, metrics))
{
  spawn(CHECK_NOTNULL(process.get()));
}


Registrar::~Registrar()
{
  process::terminate(process.get());
  process::wait(process.get());
}


Future<Nothing> Registrar::registered()
{
  return process::dispatch(process.get(), &RegistrarProcess::registered);
}


Future<Nothing> Registrar::wait()
{
  return process::dispatch(process.get(), &RegistrarProcess::wait);
}

} // namespace internal {
} // namespace cdiplugin {
