// Texbox - LaTeX Compilation Sandbox
// Copyright (c) 2026 Sandstorm Development Group, Inc. and contributors
// All rights reserved.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef TEXBOX_RUNNER_H_
#define TEXBOX_RUNNER_H_

#include <kj/async-io.h>
#include <kj/timer.h>
#include "util.h"

namespace texbox {

struct ProcessResult {
  bool success = false;
  // Exited with status 0 and did not time out.

  kj::String stdout;
  kj::String stderr;
  // Captured output, each capped at RunOptions::maxOutput bytes. If the process could not be
  // started at all, `stderr` holds the reason.

  kj::Maybe<int> exitCode;
  // Null if the process never reported an exit status: it could not be started, or it was
  // killed by a signal.

  kj::Maybe<int> signal;
  // The signal that terminated the process, if any.

  bool timedOut = false;
  bool truncated = false;
};

struct RunOptions {
  kj::String program;
  kj::Array<kj::String> args;
  kj::Maybe<kj::String> workingDirectory;

  kj::Maybe<kj::Array<kj::String>> environment;
  // 'NAME=VALUE' pairs. Null inherits ours.

  kj::Duration timeout = 60 * kj::SECONDS;
  kj::Duration gracePeriod = 5 * kj::SECONDS;
  // When `timeout` expires the process group gets SIGTERM; if it is still around after another
  // `gracePeriod`, SIGKILL.

  size_t maxOutput = 10u << 20;
};

class ProcessRunner {
  // Runs an external program in its own process group with a deadline and bounded output
  // capture. Knows nothing about what the program is.
  //
  // Dropping the promise returned by run() kills the whole process group with SIGKILL and reaps
  // the child before the promise's destructor returns.

public:
  ProcessRunner(kj::LowLevelAsyncIoProvider& lowLevel, kj::Timer& timer,
                SubprocessSet& subprocesses)
      : lowLevel(lowLevel), timer(timer), subprocesses(subprocesses) {}
  KJ_DISALLOW_COPY(ProcessRunner);

  kj::Promise<ProcessResult> run(RunOptions options);
  // Never rejects because of anything the child does. A failure to start it resolves with
  // exitCode = null.

private:
  kj::LowLevelAsyncIoProvider& lowLevel;
  kj::Timer& timer;
  SubprocessSet& subprocesses;

  class Run;
};

}  // namespace texbox

#endif // TEXBOX_RUNNER_H_
