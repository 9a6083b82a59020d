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

#ifndef __DEVICE_PLUGIN_REGISTRAR_HPP__
#define __DEVICE_PLUGIN_REGISTRAR_HPP__

#include <functional>

#include <cdiplugin/v1beta1.hpp>

#include <process/future.hpp>
#include <process/owned.hpp>

#include <stout/nothing.hpp>

#include "device_plugin/flags.hpp"
#include "device_plugin/metrics.hpp"

namespace cdiplugin {
namespace internal {

// Forward declaration.
class RegistrarProcess;


// Registers the device plugin with the kubelet and keeps it registered.
//
// Registration is retried with a randomized exponential backoff. Once
// registered, the kubelet's registration socket is watched: if it is removed
// or replaced (i.e., the kubelet restarted), or the plugin's own socket is
// removed, the `reconnectHook` is invoked and the plugin registers again
// with the same request. A failed hook counts as a failed attempt.
class Registrar
{
public:
  Registrar(
      const Flags& flags,
      const v1beta1::RegisterRequest& request,
      const std::function<process::Future<Nothing>()>& reconnectHook,
      Metrics* metrics);

  ~Registrar();

  // Returns a future that is satisfied once the plugin is registered. If the
  // plugin is currently not registered, it refers to the next registration.
  process::Future<Nothing> registered();

  // Returns a future that only reaches a terminal state when the plugin
  // gives up after `--registration_max_attempts` consecutive failures.
  process::Future<Nothing> wait();

private:
  Registrar(const Registrar&) = delete;
  Registrar& operator=(const Registrar&) = delete;

  process::Owned<RegistrarProcess> process;
};

} // namespace internal {
} // namespace cdiplugin {

#endif // __DEVICE_PLUGIN_REGISTRAR_HPP__
