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
#include <kj/test.h>
#include <kj/debug.h>
#include <signal.h>
#include <stdlib.h>
#include <string.h>
#include <fcntl.h>
#include <unistd.h>

namespace texbox {
namespace {

kj::Array<kj::String> strings(std::initializer_list<kj::StringPtr> list) {
  auto builder = kj::heapArrayBuilder<kj::String>(list.size());
  for (auto s: list) {
    builder.add(kj::heapString(s));
  }
  return builder.finish();
}

RunOptions shell(kj::StringPtr script) {
  RunOptions options;
  options.program = kj::str("sh");
  options.args = strings({"-c", script});
  return options;
}

bool isAlive(pid_t pid) {
  // A zombie counts as dead.
  KJ_IF_MAYBE(fd, raiiOpenIfExists(kj::str("/proc/", pid, "/stat"), O_RDONLY | O_CLOEXEC)) {
    auto stat = readAll(*fd);
    KJ_IF_MAYBE(paren, stat.findLast(')')) {
      return stat.size() > *paren + 2 && stat[*paren + 2] != 'Z';
    }
    return true;
  }
  return false;
}

bool hasSubstring(kj::StringPtr haystack, kj::StringPtr needle) {
  return strstr(haystack.cStr(), needle.cStr()) != nullptr;
}

struct RunnerFixture {
  kj::AsyncIoContext io = kj::setupAsyncIo();
  SubprocessSet subprocesses { io.unixEventPort };
  ProcessRunner runner { *io.lowLevelProvider, io.provider->getTimer(), subprocesses };

  ProcessResult run(RunOptions options) {
    return runner.run(kj::mv(options)).wait(io.waitScope);
  }
};

KJ_TEST("ProcessRunner: captures output and exit status") {
  RunnerFixture f;

  auto result = f.run(shell("echo out; echo err >&2"));
  KJ_EXPECT(result.success);
  KJ_EXPECT(result.stdout == "out\n", result.stdout);
  KJ_EXPECT(result.stderr == "err\n", result.stderr);
  KJ_EXPECT(KJ_ASSERT_NONNULL(result.exitCode) == 0);
  KJ_EXPECT(result.signal == nullptr);
  KJ_EXPECT(!result.timedOut);
  KJ_EXPECT(!result.truncated);

  auto failed = f.run(shell("echo nope >&2; exit 3"));
  KJ_EXPECT(!failed.success);
  KJ_EXPECT(KJ_ASSERT_NONNULL(failed.exitCode) == 3);
  KJ_EXPECT(failed.stderr == "nope\n");
}

KJ_TEST("ProcessRunner: working directory and environment") {
  RunnerFixture f;

  auto options = shell("pwd; echo \"$TEXBOX_TEST_VALUE\"");
  options.workingDirectory = kj::str("/");
  options.environment = strings({"TEXBOX_TEST_VALUE=hello", "PATH=/usr/bin:/bin"});
  auto result = f.run(kj::mv(options));
  KJ_EXPECT(result.success);
  KJ_EXPECT(result.stdout == "/\nhello\n", result.stdout);

  // Without an explicit environment, ours is inherited.
  KJ_SYSCALL(setenv("TEXBOX_TEST_VALUE", "inherited", 1));
  auto inherited = f.run(shell("echo \"$TEXBOX_TEST_VALUE\""));
  KJ_SYSCALL(unsetenv("TEXBOX_TEST_VALUE"));
  KJ_EXPECT(inherited.stdout == "inherited\n", inherited.stdout);
}

KJ_TEST("ProcessRunner: stdin is empty") {
  RunnerFixture f;

  auto result = f.run(shell("cat; echo done"));
  KJ_EXPECT(result.success);
  KJ_EXPECT(result.stdout == "done\n");
}

KJ_TEST("ProcessRunner: output beyond the cap is discarded") {
  RunnerFixture f;

  auto options = shell("yes | head -c 1000000; echo tail >&2");
  options.maxOutput = 1000;
  auto result = f.run(kj::mv(options));

  // The child ran to completion even though we stopped keeping its output.
  KJ_EXPECT(result.success);
  KJ_EXPECT(result.truncated);
  KJ_EXPECT(result.stdout.size() == 1000);
  KJ_EXPECT(result.stdout.startsWith("y\ny\n"));
  KJ_EXPECT(result.stderr == "tail\n");
}

KJ_TEST("ProcessRunner: a program that can't be started") {
  RunnerFixture f;

  RunOptions options;
  options.program = kj::str("/nonexistent/texbox-no-such-tool");
  options.args = strings({});
  auto result = f.run(kj::mv(options));

  KJ_EXPECT(!result.success);
  KJ_EXPECT(result.exitCode == nullptr);
  KJ_EXPECT(result.signal == nullptr);
  KJ_EXPECT(!result.timedOut);
  KJ_EXPECT(hasSubstring(result.stderr, "failed to start child process"), result.stderr);
}

KJ_TEST("ProcessRunner: timeout sends SIGTERM") {
  RunnerFixture f;

  auto options = shell("sleep 30");
  options.timeout = 100 * kj::MILLISECONDS;
  options.gracePeriod = 5 * kj::SECONDS;
  auto result = f.run(kj::mv(options));

  KJ_EXPECT(result.timedOut);
  KJ_EXPECT(!result.success);
  KJ_EXPECT(result.exitCode == nullptr);
  KJ_EXPECT(KJ_ASSERT_NONNULL(result.signal) == SIGTERM);
}

KJ_TEST("ProcessRunner: SIGKILL follows when SIGTERM is ignored") {
  RunnerFixture f;

  auto options = shell("trap '' TERM; echo started; sleep 30");
  options.timeout = 100 * kj::MILLISECONDS;
  options.gracePeriod = 200 * kj::MILLISECONDS;
  auto result = f.run(kj::mv(options));

  KJ_EXPECT(result.timedOut);
  KJ_EXPECT(KJ_ASSERT_NONNULL(result.signal) == SIGKILL);
  KJ_EXPECT(result.stdout == "started\n");
}

KJ_TEST("ProcessRunner: a timeout counts as failure even if the exit status is zero") {
  RunnerFixture f;

  auto options = shell("trap 'exit 0' TERM; while true; do sleep 0.05; done");
  options.timeout = 100 * kj::MILLISECONDS;
  auto result = f.run(kj::mv(options));

  KJ_EXPECT(result.timedOut);
  KJ_EXPECT(!result.success);
}

KJ_TEST("ProcessRunner: leftover background processes don't keep the run alive") {
  RunnerFixture f;

  // The background sleep holds stdout open after the shell exits.
  auto options = shell("sleep 30 & echo $!");
  options.timeout = 10 * kj::SECONDS;
  auto result = f.run(kj::mv(options));

  KJ_EXPECT(result.success);
  KJ_EXPECT(!result.timedOut);
  auto pid = KJ_ASSERT_NONNULL(parseUInt(trim(result.stdout), 10));
  for (uint i = 0; i < 100 && isAlive(pid); i++) {
    usleep(10000);
  }
  KJ_EXPECT(!isAlive(pid));
}

KJ_TEST("ProcessRunner: dropping the promise kills the process group") {
  RunnerFixture f;

  char dirTemplate[] = "/tmp/texbox-runner-test.XXXXXX";
  KJ_ASSERT(mkdtemp(dirTemplate) != nullptr);
  auto dir = kj::heapString(dirTemplate);
  KJ_DEFER(recursivelyDelete(dir));
  auto pidFile = kj::str(dir, "/pid");

  auto options = shell(kj::str("sleep 30 & echo $! > ", pidFile, ".tmp; mv ", pidFile, ".tmp ",
                               pidFile, "; wait"));
  options.timeout = 60 * kj::SECONDS;

  pid_t grandchild;
  {
    auto promise = f.runner.run(kj::mv(options));
    auto& timer = f.io.provider->getTimer();
    for (uint i = 0; i < 500 && access(pidFile.cStr(), F_OK) != 0; i++) {
      timer.afterDelay(10 * kj::MILLISECONDS).wait(f.io.waitScope);
    }
    grandchild = KJ_ASSERT_NONNULL(parseUInt(trim(readAll(pidFile)), 10));
    KJ_EXPECT(isAlive(grandchild));
  }

  for (uint i = 0; i < 100 && isAlive(grandchild); i++) {
    usleep(10000);
  }
  KJ_EXPECT(!isAlive(grandchild));
}

}  // namespace
}  // namespace texbox
