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

#include "runner.h"
#include <kj/debug.h>
#include <kj/vector.h>
#include <signal.h>
#include <sys/wait.h>

namespace texbox {

namespace {

class BoundedOutput {
  // Collects a stream's content up to `limit` bytes. Keeps reading (and discarding) past the
  // limit so that the child never blocks on a full pipe.

public:
  BoundedOutput(kj::Own<kj::AsyncInputStream> stream, size_t limit)
      : stream(kj::mv(stream)), limit(limit) {}
  KJ_DISALLOW_COPY(BoundedOutput);

  kj::Promise<void> drain() {
    return stream->tryRead(buffer, 1, sizeof(buffer)).then([this](size_t n) -> kj::Promise<void> {
      if (n == 0) return kj::READY_NOW;

      size_t room = limit - content.size();
      if (n > room) {
        truncated = true;
        n = room;
      }
      content.addAll(buffer, buffer + n);
      return drain();
    });
  }

  kj::String finish() {
    content.add('\0');
    return kj::String(content.releaseAsArray());
  }

  bool truncated = false;

private:
  kj::Own<kj::AsyncInputStream> stream;
  size_t limit;
  kj::Vector<char> content;
  char buffer[8192];
};

}  // namespace

class ProcessRunner::Run {
public:
  Run(kj::String program, kj::Own<Subprocess> child,
      kj::Own<kj::AsyncInputStream> stdoutStream, kj::Own<kj::AsyncInputStream> stderrStream,
      size_t maxOutput)
      : program(kj::mv(program)), child(kj::mv(child)),
        out(kj::mv(stdoutStream), maxOutput), err(kj::mv(stderrStream), maxOutput) {}

  kj::String program;
  kj::Own<Subprocess> child;
  BoundedOutput out;
  BoundedOutput err;
  kj::Maybe<int> status;
  bool timedOut = false;

  ProcessResult finish() {
    ProcessResult result;
    result.timedOut = timedOut;
    result.truncated = out.truncated || err.truncated;
    result.stdout = out.finish();
    result.stderr = err.finish();

    KJ_IF_MAYBE(s, status) {
      if (WIFEXITED(*s)) {
        int code = WEXITSTATUS(*s);
        result.exitCode = code;
        result.success = code == 0 && !timedOut;
        KJ_LOG(INFO, "tool exited", program, code, timedOut);
      } else if (WIFSIGNALED(*s)) {
        result.signal = WTERMSIG(*s);
        KJ_LOG(INFO, "tool killed by signal", program, WTERMSIG(*s), timedOut);
      }
    } else {
      KJ_LOG(ERROR, "tool did not exit after SIGKILL", program);
    }

    return result;
  }
};

static kj::Promise<void> drainLogged(BoundedOutput& output, kj::StringPtr program) {
  return output.drain().catch_([program](kj::Exception&& exception) {
    KJ_LOG(WARNING, "error reading tool output", program, exception);
  });
}

kj::Promise<ProcessResult> ProcessRunner::run(RunOptions options) {
  KJ_LOG(INFO, "starting tool", options.program);

  auto stdoutPipe = Pipe::make();
  auto stderrPipe = Pipe::make();
  auto devNull = raiiOpen("/dev/null", O_RDONLY | O_CLOEXEC);

  auto argv = kj::heapArrayBuilder<const kj::StringPtr>(options.args.size() + 1);
  argv.add(options.program);
  for (auto& arg: options.args) {
    argv.add(arg);
  }

  Subprocess::Options subprocessOptions(argv.finish());
  subprocessOptions.stdin = devNull;
  subprocessOptions.stdout = stdoutPipe.writeEnd;
  subprocessOptions.stderr = stderrPipe.writeEnd;
  subprocessOptions.newProcessGroup = true;
  KJ_IF_MAYBE(dir, options.workingDirectory) {
    subprocessOptions.workingDirectory = kj::StringPtr(*dir);
  }

  kj::Array<const kj::StringPtr> environment;
  KJ_IF_MAYBE(env, options.environment) {
    auto builder = kj::heapArrayBuilder<const kj::StringPtr>(env->size());
    for (auto& var: *env) {
      builder.add(var);
    }
    environment = builder.finish();
    subprocessOptions.environment = environment.asPtr();
  }

  kj::Own<Subprocess> child;
  KJ_IF_MAYBE(exception, kj::runCatchingExceptions([&]() {
    child = kj::heap<Subprocess>(kj::mv(subprocessOptions));
  })) {
    KJ_LOG(WARNING, "failed to start tool", options.program, exception->getDescription());
    ProcessResult result;
    result.stdout = kj::str();
    result.stderr = kj::str(exception->getDescription());
    return kj::mv(result);
  }

  // The child has its own copies now. Our write ends must go or we'd never see EOF.
  stdoutPipe.writeEnd = nullptr;
  stderrPipe.writeEnd = nullptr;

  auto run = kj::heap<Run>(kj::mv(options.program), kj::mv(child),
      lowLevel.wrapInputFd(kj::mv(stdoutPipe.readEnd),
                           kj::LowLevelAsyncIoProvider::ALREADY_CLOEXEC),
      lowLevel.wrapInputFd(kj::mv(stderrPipe.readEnd),
                           kj::LowLevelAsyncIoProvider::ALREADY_CLOEXEC),
      options.maxOutput);
  Run& r = *run;

  auto exited = subprocesses.waitForExitOrSignal(*r.child).then([&r](int status) {
    r.status = status;
    // Anything the child left behind in its group would hold our pipes open.
    r.child->signalGroup(SIGKILL);
  });

  auto all = kj::heapArrayBuilder<kj::Promise<void>>(3);
  all.add(kj::mv(exited));
  all.add(drainLogged(r.out, r.program));
  all.add(drainLogged(r.err, r.program));

  // Two chained deadlines: SIGTERM when the timeout expires, SIGKILL one grace period later.
  // A third stops waiting for output that something outside the group still holds open.
  kj::Duration grace = options.gracePeriod;
  auto deadline = timer.afterDelay(options.timeout).then([this, &r, grace]() {
    r.timedOut = true;
    KJ_LOG(WARNING, "tool timed out; sending SIGTERM", r.program);
    r.child->signalGroup(SIGTERM);
    return timer.afterDelay(grace);
  }).then([this, &r, grace]() {
    KJ_LOG(WARNING, "tool still running after SIGTERM; sending SIGKILL", r.program);
    r.child->signalGroup(SIGKILL);
    return timer.afterDelay(grace);
  }).then([&r]() {
    KJ_LOG(ERROR, "tool output still open after SIGKILL; abandoning it", r.program);
  });

  return kj::joinPromises(all.finish())
      .exclusiveJoin(kj::mv(deadline))
      .then([&r]() { return r.finish(); })
      .attach(kj::mv(run));
}

}  // namespace texbox
