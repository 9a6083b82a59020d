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

#ifndef __DEVICE_PLUGIN_FLAGS_HPP__
#define __DEVICE_PLUGIN_FLAGS_HPP__

#include <stddef.h>

#include <string>

#include <stout/duration.hpp>
#include <stout/flags.hpp>
#include <stout/option.hpp>

#include "logging/flags.hpp"

namespace cdiplugin {
namespace internal {

class Flags : public virtual logging::Flags
{
public:
  Flags();

  bool version;
  std::string resource_name;
  std::string kubelet_dir;
  std::string socket_name;
  std::string cdi_dir;
  std::string dev_dir;
  std::string sysfs_dir;
  std::string device_prefix;
  std::string control_devices;
  Option<std::string> cdi_mounts;
  bool require_devices;
  bool preferred_allocation;
  Duration health_check_interval;
  Duration registration_backoff_factor;
  Duration registration_retry_interval_max;
  size_t registration_max_attempts;
  Duration kubelet_watch_interval;
};

} // namespace internal {
} // namespace cdiplugin {

#endif // __DEVICE_PLUGIN_FLAGS_HPP__
