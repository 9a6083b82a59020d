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

#include "logging/logging.hpp"

#include <signal.h>
#include <stdlib.h>

#include <glog/raw_logging.h>

#include <iostream>
#include <string>

#include <process/once.hpp>

#include <stout/error.hpp>
#include <stout/nothing.hpp>
#include <stout/os.hpp>

#include <stout/os/signals.hpp>

using process::Once;

using std::string;

namespace cdiplugin {
namespace internal {
namespace logging {

namespace {

// `InitGoogleLogging` keeps the pointer it is handed, so the program
// name must outlive every log call.
string* programName = nullptr;


// Only async-signal-safe calls are allowed here, hence RAW_LOG.
void terminated(int signal, siginfo_t* info, void*)
{
  // SI_USER and SI_QUEUE are both <= 0 and carry the sender's identity.
  if (info->si_code <= 0) {
    RAW_LOG(WARNING,
            "Terminated by process %d of user %d",
            info->si_pid,
            info->si_uid);
  } else {
    RAW_LOG(WARNING, "Terminated");
  }

  os::signals::reset(signal);
  raise(signal);
}


void catchTermination()
{
  google::InstallFailureSignalHandler();

  // Override glog's SIGTERM handler so a kubelet eviction does not
  // print a stack trace.
  struct sigaction action;
  action.sa_sigaction = terminated;
  action.sa_flags = SA_SIGINFO;
  sigemptyset(&action.sa_mask);

  if (sigaction(SIGTERM, &action, nullptr) < 0) {
    PLOG(FATAL) << "Failed to install the SIGTERM handler";
  }
}


Try<Nothing> configure(const Flags& flags)
{
  Try<google::LogSeverity> severity = parseSeverity(flags.logging_level);
  if (severity.isError()) {
    return Error(severity.error());
  }

  FLAGS_minloglevel = severity.get();
  FLAGS_v = flags.verbosity;
  FLAGS_logbufsecs = flags.logbufsecs;

  if (flags.log_dir.isNone()) {
    FLAGS_logtostderr = true;

    // glog ignores `stderrthreshold` while `logtostderr` is set, so
    // raising the minimum level is the only way to stay quiet.
    if (flags.quiet) {
      FLAGS_minloglevel = google::FATAL;
    }

    return Nothing();
  }

  Try<Nothing> mkdir = os::mkdir(flags.log_dir.get());
  if (mkdir.isError()) {
    return Error(
        "Failed to create log directory '" + flags.log_dir.get() + "': " +
        mkdir.error());
  }

  FLAGS_logtostderr = false;
  FLAGS_log_dir = flags.log_dir.get();
  FLAGS_stderrthreshold = flags.quiet ? google::FATAL : FLAGS_minloglevel;

  return Nothing();
}

} // namespace {


Try<google::LogSeverity> parseSeverity(const string& level)
{
  if (level == "INFO") {
    return google::INFO;
  } else if (level == "WARNING") {
    return google::WARNING;
  } else if (level == "ERROR") {
    return google::ERROR;
  }

  return Error(
      "Unknown logging level '" + level + "', expected one of"
      " 'INFO', 'WARNING' or 'ERROR'");
}


void initialize(const string& argv0, const Flags& flags, bool catchSignals)
{
  static Once* initialized = new Once();

  if (initialized->once()) {
    return;
  }

  Try<Nothing> configured = configure(flags);
  if (configured.isError()) {
    std::cerr << "Could not initialize logging: " << configured.error()
              << std::endl;
    exit(EXIT_FAILURE);
  }

  programName = new string(argv0);
  google::InitGoogleLogging(programName->c_str());

  // glog only opens a log file on the first message at its severity.
  if (flags.log_dir.isSome()) {
    LOG_AT_LEVEL(FLAGS_minloglevel)
      << "Writing " << google::GetLogSeverityName(FLAGS_minloglevel)
      << " logs to " << flags.log_dir.get();
  }

  if (catchSignals) {
    catchTermination();
  }

  initialized->done();
}

} // namespace logging {
} // namespace internal {
} // namespace cdiplugin {
