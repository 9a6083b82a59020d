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

#include "logging/flags.hpp"

#include <string>

#include <stout/error.hpp>
#include <stout/none.hpp>

#include "logging/logging.hpp"

using std::string;

namespace cdiplugin {
namespace internal {
namespace logging {

Flags::Flags()
{
  add(&Flags::quiet,
      "quiet",
      "Suppress all non-fatal output on stderr. Log files written to\n"
      "`--log_dir` are not affected.",
      false);

  add(&Flags::logging_level,
      "logging_level",
      "Lowest severity that gets logged: `INFO`, `WARNING` or `ERROR`.",
      "INFO",
      [](const string& value) -> Option<Error> {
        Try<google::LogSeverity> severity = parseSeverity(value);
        if (severity.isError()) {
          return Error(severity.error());
        }

        return None();
      });

  add(&Flags::verbosity,
      "verbosity",
      "Emit `VLOG(n)` messages for every `n` up to this value. Level 1\n"
      "covers device plugin RPCs and registration attempts, level 2\n"
      "adds every health check.",
      0,
      [](int value) -> Option<Error> {
        if (value < 0) {
          return Error("Expected a non-negative verbosity");
        }

        return None();
      });

  add(&Flags::log_dir,
      "log_dir",
      "Directory for glog files. It is created if missing. Without it\n"
      "the plugin logs to stderr only, which suits a DaemonSet pod.");

  add(&Flags::logbufsecs,
      "logbufsecs",
      "Seconds glog may hold messages in memory before flushing them to\n"
      "`--log_dir`.",
      0);
}

} // namespace logging {
} // namespace internal {
} // namespace cdiplugin {
