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

#ifndef __DEVICE_PLUGIN_PATHS_HPP__
#define __DEVICE_PLUGIN_PATHS_HPP__

#include <string>

namespace cdiplugin {
namespace internal {
namespace paths {

// The kubelet's device plugin directory looks like:
//
// <kubelet_dir> (e.g., /var/lib/kubelet/device-plugins)
// |-- kubelet.sock
// |-- <socket_name> (e.g., nvidia-cdi-device-plugin.sock)
// |-- kubelet_internal_checkpoint
//
// The kubelet removes the whole content of the directory when it restarts.

std::string getKubeletSocketPath(const std::string& kubeletDir);


std::string getPluginSocketPath(
    const std::string& kubeletDir,
    const std::string& socketName);


// Returns the gRPC target for a unix socket path, i.e., `unix://<path>`.
std::string getSocketEndpoint(const std::string& socketPath);

} // namespace paths {
} // namespace internal {
} // namespace cdiplugin {

#endif // __DEVICE_PLUGIN_PATHS_HPP__
