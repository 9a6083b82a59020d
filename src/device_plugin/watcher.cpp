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

#include "device_plugin/watcher.hpp"

#include <chrono>

#include <stout/none.hpp>
#include <stout/synchronized.hpp>

using cdiplugin::device::Snapshot;

namespace cdiplugin {
namespace internal {

void Watcher::put(const Snapshot& snapshot)
{
  synchronized (mutex) {
    if (closed) {
      return;
    }

    pending = snapshot;
  }

  changed.notify_all();
}


Option<Snapshot> Watcher::get(const Duration& timeout)
{
  std::unique_lock<std::mutex> lock(mutex);

  changed.wait_for(
      lock,
      std::chrono::nanoseconds(timeout.ns()),
      [this]() { return closed || pending.isSome(); });

  if (closed || pending.isNone()) {
    return None();
  }

  Snapshot snapshot = pending.get();
  pending = None();

  return snapshot;
}


void Watcher::close()
{
  synchronized (mutex) {
    closed = true;
    pending = None();
  }

  changed.notify_all();
}


bool Watcher::isClosed() const
{
  std::lock_guard<std::mutex> lock(mutex);
  return closed;
}

} // namespace internal {
} // namespace cdiplugin {
