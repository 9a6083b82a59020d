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

#ifndef __CDI_SPEC_HPP__
#define __CDI_SPEC_HPP__

#include <string>
#include <vector>

#include <stout/nothing.hpp>
#include <stout/option.hpp>
#include <stout/try.hpp>

// ONLY USEFUL AFTER RUNNING PROTOC.
#include "cdi/spec.pb.h"

#include "device/device.hpp"

namespace cdiplugin {
namespace cdi {

constexpr char CDI_VERSION[] = "0.6.0";


// Validates a CDI kind of the form `<vendor>/<class>`, e.g.,
// `nvidia.com/gpu`. Since the kind is also the extended resource name
// advertised to the kubelet, it must be fully qualified.
Try<Nothing> validateKind(const std::string& kind);


// Returns the fully qualified CDI device name `<kind>=<name>`.
std::string qualifiedName(const std::string& kind, const std::string& name);


// Parses a comma-separated list of `<host_path>[:<container_path>]` into
// read-only bind mounts.
Try<std::vector<Mount>> parseMounts(const std::string& mounts);


// Returns the specification for the healthy devices in `devices`, each
// named after its device ID. Unhealthy devices are omitted.
Spec createSpec(
    const std::string& kind,
    const device::DeviceSet& devices,
    const ContainerEdits& containerEdits);


Option<Device> findDevice(const Spec& spec, const std::string& name);


Try<std::string> serialize(const Spec& spec);


Try<Spec> parse(const std::string& json);

} // namespace cdi {
} // namespace cdiplugin {

#endif // __CDI_SPEC_HPP__
