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

#ifndef __DEVICE_PLUGIN_WATCHER_HPP__
#define __DEVICE_PLUGIN_WATCHER_HPP__

#include <condition_variable>
#include <mutex>

#include <stout/duration.hpp>
#include <stout/option.hpp>

#include "device/device.hpp"

namespace cdiplugin {
namespace internal {

// A single-slot mailbox connecting the device plugin process to one
// `ListAndWatch` stream. Publishing never blocks: a snapshot that has not
// been taken yet is replaced by the newer one, so a slow stream skips
// superseded snapshots but always ends up with the latest one.
class Watcher
{
public:
  Watcher() : closed(false) {}

  void put(const device::Snapshot& snapshot);

  // Waits up to `timeout` for a snapshot. Returns none on timeout or if
  // the watcher has been closed.
  Option<device::Snapshot> get(const Duration& timeout);

  // Wakes up the reader and makes all subsequent `get` calls return none.
  void close();

  bool isClosed() const;

private:
  mutable std::mutex mutex;
  std::condition_variable changed;
  Option<device::Snapshot> pending;
  bool closed;
};

} // namespace internal {
} // namespace cdiplugin {

#endif // __DEVICE_PLUGIN_WATCHER_HPP__
