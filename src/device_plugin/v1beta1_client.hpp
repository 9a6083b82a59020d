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

#ifndef __DEVICE_PLUGIN_V1BETA1_CLIENT_HPP__
#define __DEVICE_PLUGIN_V1BETA1_CLIENT_HPP__

#include <cdiplugin/v1beta1.hpp>

#include <process/future.hpp>
#include <process/grpc.hpp>

#include <stout/try.hpp>

namespace cdiplugin {
namespace v1beta1 {

template <typename Response>
using RPCResult = Try<Response, process::grpc::StatusError>;


// Unary RPCs of the device plugin API. `ListAndWatch` is a server stream
// and is not supported by the libprocess gRPC runtime.
class Client
{
public:
  Client(const process::grpc::client::Connection& _connection,
         const process::grpc::client::Runtime& _runtime)
    : connection(_connection), runtime(_runtime) {}

  // Registration service of the kubelet.

  process::Future<RPCResult<Empty>> registerPlugin(RegisterRequest request);

  // DevicePlugin service of a device plugin.

  process::Future<RPCResult<DevicePluginOptions>>
  getDevicePluginOptions(Empty request);

  process::Future<RPCResult<PreferredAllocationResponse>>
  getPreferredAllocation(PreferredAllocationRequest request);

  process::Future<RPCResult<AllocateResponse>>
  allocate(AllocateRequest request);

  process::Future<RPCResult<PreStartContainerResponse>>
  preStartContainer(PreStartContainerRequest request);

private:
  process::grpc::client::Connection connection;
  process::grpc::client::Runtime runtime;
};

} // namespace v1beta1 {
} // namespace cdiplugin {

#endif // __DEVICE_PLUGIN_V1BETA1_CLIENT_HPP__
