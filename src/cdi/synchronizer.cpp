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

#include "cdi/synchronizer.hpp"

#include <glog/logging.h>

#include <stout/error.hpp>
#include <stout/foreach.hpp>
#include <stout/os.hpp>
#include <stout/path.hpp>

#include <stout/os/exists.hpp>
#include <stout/os/mkdir.hpp>
#include <stout/os/read.hpp>
#include <stout/os/rename.hpp>
#include <stout/os/rm.hpp>
#include <stout/os/write.hpp>

#include "cdi/paths.hpp"

using std::string;
using std::vector;

using process::Owned;

namespace cdiplugin {
namespace cdi {

namespace {

// Removes a temporary file when it goes out of scope unless it has been
// committed, i.e., renamed into place.
class TemporaryFile
{
public:
  explicit TemporaryFile(const string& _path)
    : path(_path), committed(false) {}

  ~TemporaryFile()
  {
    if (!committed) {
      Try<Nothing> rm = os::rm(path);
      if (rm.isError()) {
        LOG(WARNING) << "Failed to remove temporary file '" << path << "': "
                     << rm.error();
      }
    }
  }

  void commit() { committed = true; }

  const string path;

private:
  bool committed;
};


// Replaces `path` with `content` in one rename, so the container runtime
// sees either the previous spec or the new one.
Try<Nothing> checkpoint(const string& path, const string& content)
{
  const string base = Path(path).dirname();

  Try<Nothing> mkdir = os::mkdir(base);
  if (mkdir.isError()) {
    return Error("Failed to create directory '" + base + "': " + mkdir.error());
  }

  // Same directory, so the rename stays on one filesystem. The leading
  // dot and missing `.json` extension keep runtimes from loading it.
  Try<string> temp = os::mktemp(path::join(base, ".XXXXXX"));
  if (temp.isError()) {
    return Error("Failed to create temporary file: " + temp.error());
  }

  TemporaryFile file(temp.get());

  Try<Nothing> write = os::write(file.path, content);
  if (write.isError()) {
    return Error(
        "Failed to write temporary file '" + file.path + "': " +
        write.error());
  }

  // `os::mktemp` creates the file readable by its owner only.
  Try<Nothing> chmod = os::chmod(file.path, 0644);
  if (chmod.isError()) {
    return Error(
        "Failed to change the mode of '" + file.path + "': " + chmod.error());
  }

  Try<Nothing> rename = os::rename(file.path, path);
  if (rename.isError()) {
    return Error(
        "Failed to rename '" + file.path + "' to '" + path + "': " +
        rename.error());
  }

  file.commit();

  return Nothing();
}

} // namespace {


Try<Owned<SpecSynchronizer>> SpecSynchronizer::create(
    const string& kind,
    const string& cdiDir,
    const string& devDir,
    const vector<string>& controlDevices,
    const vector<Mount>& mounts)
{
  Try<Nothing> validate = validateKind(kind);
  if (validate.isError()) {
    return Error(validate.error());
  }

  return Owned<SpecSynchronizer>(new SpecSynchronizer(
      kind,
      paths::getSpecPath(cdiDir, kind),
      devDir,
      controlDevices,
      mounts));
}


SpecSynchronizer::SpecSynchronizer(
    const string& _kind,
    const string& _path,
    const string& _devDir,
    const vector<string>& _controlDevices,
    const vector<Mount>& _mounts)
  : kind_(_kind),
    path_(_path),
    devDir(_devDir),
    controlDevices(_controlDevices),
    mounts(_mounts) {}


Try<Nothing> SpecSynchronizer::sync(const device::DeviceSet& devices)
{
  const Spec spec = createSpec(kind_, devices, containerEdits());

  Try<string> content = serialize(spec);
  if (content.isError()) {
    return Error(content.error());
  }

  Try<Nothing> write = checkpoint(path_, content.get());
  if (write.isError()) {
    return Error(
        "Failed to write the CDI specification '" + path_ + "': " +
        write.error());
  }

  LOG(INFO) << "Synchronized CDI specification '" << path_ << "' with "
            << spec.devices_size() << " of " << devices.devices.size()
            << " devices (version " << devices.version << ")";

  return Nothing();
}


Try<Spec> SpecSynchronizer::read() const
{
  Try<string> content = os::read(path_);
  if (content.isError()) {
    return Error(
        "Failed to read the CDI specification '" + path_ + "': " +
        content.error());
  }

  return parse(content.get());
}


ContainerEdits SpecSynchronizer::containerEdits() const
{
  ContainerEdits edits;

  foreach (const string& name, controlDevices) {
    const string hostPath = path::join(devDir, name);
    if (!os::exists(hostPath)) {
      VLOG(1) << "Skipping missing control device '" << hostPath << "'";
      continue;
    }

    const string containerPath = path::join("/dev", name);

    DeviceNode* node = edits.add_device_nodes();
    node->set_path(containerPath);
    if (hostPath != containerPath) {
      node->set_host_path(hostPath);
    }
  }

  foreach (const Mount& mount, mounts) {
    edits.add_mounts()->CopyFrom(mount);
  }

  return edits;
}

} // namespace cdi {
} // namespace cdiplugin {
