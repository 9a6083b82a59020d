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

#include "cdi/spec.hpp"

#include <ctype.h>

#include <google/protobuf/util/json_util.h>

#include <stout/error.hpp>
#include <stout/foreach.hpp>
#include <stout/none.hpp>
#include <stout/path.hpp>
#include <stout/strings.hpp>

namespace util = google::protobuf::util;

using std::string;
using std::vector;

namespace cdiplugin {
namespace cdi {

namespace {

// A vendor or class name must start with a letter, end with a letter or a
// digit, and otherwise only contain alphanumerics and the given symbols.
Try<Nothing> validateName(
    const string& name,
    const string& what,
    const string& symbols)
{
  if (name.empty()) {
    return Error("The " + what + " is empty");
  }

  if (!isalpha(static_cast<unsigned char>(name.front()))) {
    return Error(
        "The " + what + " '" + name + "' does not start with a letter");
  }

  if (!isalnum(static_cast<unsigned char>(name.back()))) {
    return Error(
        "The " + what + " '" + name + "' does not end with a letter or digit");
  }

  foreach (char c, name) {
    if (!isalnum(static_cast<unsigned char>(c)) &&
        symbols.find(c) == string::npos) {
      return Error(
          "The " + what + " '" + name + "' contains invalid character '" +
          string(1, c) + "'");
    }
  }

  return Nothing();
}

} // namespace {


Try<Nothing> validateKind(const string& kind)
{
  const vector<string> parts = strings::split(kind, "/");
  if (parts.size() != 2) {
    return Error("Expected '<vendor>/<class>' but got '" + kind + "'");
  }

  Try<Nothing> vendor = validateName(parts[0], "vendor", "._-");
  if (vendor.isError()) {
    return Error("Invalid kind '" + kind + "': " + vendor.error());
  }

  Try<Nothing> class_ = validateName(parts[1], "class", "_-");
  if (class_.isError()) {
    return Error("Invalid kind '" + kind + "': " + class_.error());
  }

  return Nothing();
}


string qualifiedName(const string& kind, const string& name)
{
  return kind + "=" + name;
}


Try<vector<Mount>> parseMounts(const string& mounts)
{
  vector<Mount> result;

  foreach (const string& token, strings::tokenize(mounts, ",")) {
    const string entry = strings::trim(token);
    if (entry.empty()) {
      continue;
    }

    const vector<string> paths = strings::split(entry, ":");
    if (paths.size() > 2) {
      return Error("Invalid mount '" + entry + "'");
    }

    const string& hostPath = paths[0];
    const string& containerPath =
      paths.size() == 2 && !paths[1].empty() ? paths[1] : paths[0];

    if (!strings::startsWith(hostPath, "/") ||
        !strings::startsWith(containerPath, "/")) {
      return Error("Mount '" + entry + "' does not use absolute paths");
    }

    Mount mount;
    mount.set_host_path(hostPath);
    mount.set_container_path(containerPath);
    mount.add_options("ro");
    mount.add_options("nosuid");
    mount.add_options("nodev");
    mount.add_options("bind");

    result.push_back(mount);
  }

  return result;
}


Spec createSpec(
    const string& kind,
    const device::DeviceSet& devices,
    const ContainerEdits& containerEdits)
{
  Spec spec;
  spec.set_cdi_version(CDI_VERSION);
  spec.set_kind(kind);
  spec.mutable_container_edits()->CopyFrom(containerEdits);

  foreach (const device::Device& device, devices.devices) {
    if (device.health != device::Device::HEALTHY) {
      continue;
    }

    // The device node keeps its name inside the container even if the host
    // exposes it elsewhere (e.g., a non-default `--dev_dir`).
    const string containerPath =
      path::join("/dev", Path(device.path).basename());

    Device* entry = spec.add_devices();
    entry->set_name(device.id);

    DeviceNode* node = entry->mutable_container_edits()->add_device_nodes();
    node->set_path(containerPath);
    if (device.path != containerPath) {
      node->set_host_path(device.path);
    }
  }

  return spec;
}


Option<Device> findDevice(const Spec& spec, const string& name)
{
  foreach (const Device& device, spec.devices()) {
    if (device.name() == name) {
      return device;
    }
  }

  return None();
}


Try<string> serialize(const Spec& spec)
{
  // NOTE: Primitive fields are always printed so that an empty `devices`
  // list still appears in the file. CDI treats empty strings as unset.
  util::JsonPrintOptions options;
  options.add_whitespace = true;
  options.always_print_primitive_fields = true;

  string output;
  util::Status status = util::MessageToJsonString(spec, &output, options);
  if (!status.ok()) {
    return Error(
        "Failed to serialize the CDI specification: " + status.ToString());
  }

  return output;
}


Try<Spec> parse(const string& json)
{
  util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  Spec spec;
  util::Status status = util::JsonStringToMessage(json, &spec, options);
  if (!status.ok()) {
    return Error("Failed to parse the CDI specification: " + status.ToString());
  }

  return spec;
}

} // namespace cdi {
} // namespace cdiplugin {
