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

#include "device_plugin/v1beta1_client.hpp"

#include <utility>

using process::Future;

using process::grpc::client::CallOptions;

namespace cdiplugin {
namespace v1beta1 {

Future<RPCResult<Empty>> Client::registerPlugin(RegisterRequest request)
{
  return runtime.call(
      connection,
      GRPC_CLIENT_METHOD(Registration, Register),
      std::move(request),
      CallOptions());
}


Future<RPCResult<DevicePluginOptions>>
Client::getDevicePluginOptions(Empty request)
{
  return runtime.call(
      connection,
      GRPC_CLIENT_METHOD(DevicePlugin, GetDevicePluginOptions),
      std::move(request),
      CallOptions());
}


Future<RPCResult<PreferredAllocationResponse>>
Client::getPreferredAllocation(PreferredAllocationRequest request)
{
  return runtime.call(
      connection,
      GRPC_CLIENT_METHOD(DevicePlugin, GetPreferredAllocation),
      std::move(request),
      CallOptions());
}


Future<RPCResult<AllocateResponse>> Client::allocate(AllocateRequest request)
{
  return runtime.call(
      connection,
      GRPC_CLIENT_METHOD(DevicePlugin, Allocate),
      std::move(request),
      CallOptions());
}


Future<RPCResult<PreStartContainerResponse>>
Client::preStartContainer(PreStartContainerRequest request)
{
  return runtime.call(
      connection,
      GRPC_CLIENT_METHOD(DevicePlugin, PreStartContainer),
      std::move(request),
      CallOptions());
}

} // namespace v1beta1 {
} // namespace cdiplugin {
