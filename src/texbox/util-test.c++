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

#include "util.h"
#include <kj/test.h>
#include <kj/async-io.h>
#include <sys/wait.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <stdlib.h>
#include <unistd.h>

namespace texbox {
namespace {

bool hasSubstring(kj::StringPtr haystack, kj::StringPtr needle) {
  if (needle.size() <= haystack.size()) {
    for (size_t i = 0; i <= haystack.size() - needle.size(); i++) {
      if (haystack.slice(i).startsWith(needle)) {
        return true;
      }
    }
  }
  return false;
}

kj::String makeTempDir() {
  char tempdir[] = "/tmp/texbox-util-test.XXXXXX";
  KJ_REQUIRE(mkdtemp(tempdir) != nullptr);
  return kj::str(tempdir);
}

bool exists(kj::StringPtr path) {
  struct stat stats;
  return lstat(path.cStr(), &stats) == 0;
}

bool isAlive(pid_t pid) {
  KJ_IF_MAYBE(fd, raiiOpenIfExists(kj::str("/proc/", pid, "/stat"), O_RDONLY | O_CLOEXEC)) {
    auto stat = readAll(*fd);
    KJ_IF_MAYBE(paren, stat.findLast(')')) {
      return stat.size() > *paren + 2 && stat[*paren + 2] != 'Z';
    }
    return true;
  }
  return false;
}

int exitCodeOf(int status) {
  KJ_ASSERT(WIFEXITED(status), status);
  return WEXITSTATUS(status);
}

KJ_TEST("Subprocess") {
  {
    Subprocess child({"true"});
    KJ_EXPECT(exitCodeOf(child.waitForExitOrSignal()) == 0);
  }

  {
    Subprocess child({"false"});
    KJ_EXPECT(exitCodeOf(child.waitForExitOrSignal()) != 0);
  }

  {
    Subprocess child({"cat"});
    // Will be killed by destructor.
  }

  {
    Subprocess child({"cat"});
    child.signalGroup(SIGKILL);
    int status = child.waitForExitOrSignal();
    KJ_EXPECT(WIFSIGNALED(status));
    KJ_EXPECT(WTERMSIG(status) == SIGKILL);
  }

  {
    Pipe pipe = Pipe::make();
    Subprocess::Options options({"echo", "foo"});
    options.stdout = pipe.writeEnd;
    Subprocess child(kj::mv(options));
    pipe.writeEnd = nullptr;
    KJ_EXPECT(readAll(pipe.readEnd) == "foo\n");
    KJ_EXPECT(exitCodeOf(child.waitForExitOrSignal()) == 0);
  }

  {
    Pipe inPipe = Pipe::make();
    Pipe outPipe = Pipe::make();
    Subprocess::Options options({"cat"});
    options.stdin = inPipe.readEnd;
    options.stdout = outPipe.writeEnd;
    Subprocess child(kj::mv(options));
    inPipe.readEnd = nullptr;
    outPipe.writeEnd = nullptr;
    KJ_SYSCALL(write(inPipe.writeEnd, "foo", 3));
    inPipe.writeEnd = nullptr;
    KJ_EXPECT(readAll(outPipe.readEnd) == "foo");
    KJ_EXPECT(exitCodeOf(child.waitForExitOrSignal()) == 0);
  }

  {
    Pipe pipe = Pipe::make();
    Subprocess::Options options({"sh", "-c", "echo $UTIL_TEST_ENV"});
    auto env = kj::heapArray<const kj::StringPtr>({"PATH=/bin:/usr/bin", "UTIL_TEST_ENV=foo"});
    options.environment = env.asPtr();
    options.stdout = pipe.writeEnd;
    Subprocess child(kj::mv(options));
    pipe.writeEnd = nullptr;
    KJ_EXPECT(readAll(pipe.readEnd) == "foo\n");
    KJ_EXPECT(exitCodeOf(child.waitForExitOrSignal()) == 0);
  }
}

KJ_TEST("Subprocess reports start failures to the parent") {
  KJ_EXPECT_THROW_MESSAGE("failed to start child process",
      Subprocess({"no-such-file-eb8c433f35f3063e"}));

  Subprocess::Options options({"true"});
  options.workingDirectory = kj::StringPtr("/no/such/dir-6b2f1c");
  KJ_EXPECT_THROW_MESSAGE("failed to start child process", Subprocess(kj::mv(options)));
}

KJ_TEST("Subprocess working directory") {
  Pipe pipe = Pipe::make();
  Subprocess::Options options({"pwd"});
  options.workingDirectory = kj::StringPtr("/");
  options.stdout = pipe.writeEnd;
  Subprocess child(kj::mv(options));
  pipe.writeEnd = nullptr;
  KJ_EXPECT(readAll(pipe.readEnd) == "/\n");
  KJ_EXPECT(exitCodeOf(child.waitForExitOrSignal()) == 0);
}

KJ_TEST("Subprocess process group") {
  // The shell's own child (sleep) must die with the group.
  Pipe pipe = Pipe::make();
  Subprocess::Options options({"sh", "-c", "sleep 30 & echo $!; wait"});
  options.newProcessGroup = true;
  options.stdout = pipe.writeEnd;
  Subprocess child(kj::mv(options));
  pipe.writeEnd = nullptr;

  char buffer[32];
  ssize_t n;
  KJ_SYSCALL(n = read(pipe.readEnd, buffer, sizeof(buffer) - 1));
  buffer[n] = '\0';
  pid_t grandchild = KJ_ASSERT_NONNULL(parseUInt(trim(kj::arrayPtr(buffer, n)), 10));
  KJ_EXPECT(getpgid(grandchild) == child.getPid());

  child.signalGroup(SIGKILL);
  int status = child.waitForExitOrSignal();
  KJ_EXPECT(WIFSIGNALED(status));

  // The grandchild was reparented and may linger as a zombie if nobody reaps it.
  for (uint i = 0; i < 100 && isAlive(grandchild); i++) {
    usleep(10000);
  }
  KJ_EXPECT(!isAlive(grandchild));
}

KJ_TEST("SubprocessSet") {
  auto io = kj::setupAsyncIo();

  SubprocessSet set(io.unixEventPort);

  Subprocess::Options catOptions("cat");
  Pipe catPipe = Pipe::make();
  catOptions.stdin = catPipe.readEnd;
  Subprocess childCat(kj::mv(catOptions));
  catPipe.readEnd = nullptr;

  Subprocess childTrue({"true"});
  Subprocess childFalse({"false"});

  bool catDone = false;

  auto promiseCat = set.waitForExitOrSignal(childCat).then([&](int status) {
    KJ_EXPECT(exitCodeOf(status) == 0);
    catDone = true;
  });
  auto promiseTrue = set.waitForExitOrSignal(childTrue);
  auto promiseFalse = set.waitForExitOrSignal(childFalse);

  KJ_EXPECT(exitCodeOf(promiseTrue.wait(io.waitScope)) == 0);
  KJ_EXPECT(exitCodeOf(promiseFalse.wait(io.waitScope)) != 0);
  KJ_EXPECT(!catDone);

  catPipe.writeEnd = nullptr;
  promiseCat.wait(io.waitScope);
  KJ_EXPECT(catDone);
}

KJ_TEST("recursivelyDelete") {
  auto dir = makeTempDir();
  auto outside = makeTempDir();
  KJ_DEFER(recursivelyDelete(outside));

  writeFile(kj::str(outside, "/keep"), kj::StringPtr("keep").asBytes());

  recursivelyCreateParent(kj::str(dir, "/a/b/c/file"));
  writeFile(kj::str(dir, "/a/b/c/file"), kj::StringPtr("data").asBytes());
  KJ_SYSCALL(symlink(outside.cStr(), kj::str(dir, "/a/link").cStr()));

  // A directory we can't write or search into still gets removed.
  KJ_SYSCALL(chmod(kj::str(dir, "/a/b").cStr(), 0));

  recursivelyDelete(dir);
  KJ_EXPECT(!exists(dir));

  // The symlink was removed, not followed.
  KJ_EXPECT(exists(kj::str(outside, "/keep")));

  KJ_EXPECT_THROW_MESSAGE("trailing /", recursivelyDelete(kj::str(outside, "/")));
}

KJ_TEST("writeFile and realPath") {
  auto dir = makeTempDir();
  KJ_DEFER(recursivelyDelete(dir));

  auto path = kj::str(dir, "/file");
  writeFile(path, kj::StringPtr("hello").asBytes());
  KJ_EXPECT(readAll(path) == "hello");

  writeFile(path, kj::StringPtr("bye").asBytes());
  KJ_EXPECT(readAll(path) == "bye");

  struct stat stats;
  KJ_SYSCALL(stat(path.cStr(), &stats));
  KJ_EXPECT((stats.st_mode & 0777) == 0600);

  auto link = kj::str(dir, "/link");
  KJ_SYSCALL(symlink(path.cStr(), link.cStr()));
  KJ_EXPECT_THROW_MESSAGE("open", writeFile(link, kj::StringPtr("x").asBytes()));

  auto real = realPath(link);
  KJ_EXPECT(KJ_ASSERT_NONNULL(real).endsWith("/file"));
  KJ_EXPECT(realPath(kj::str(dir, "/missing")) == nullptr);
}

KJ_TEST("string helpers") {
  KJ_EXPECT(trim(kj::StringPtr("  foo bar \n")) == "foo bar");
  KJ_EXPECT(replaceAll("a/tmp/x/tmp/x", "/tmp/x", ".") == "a..");
  KJ_EXPECT(replaceAll("aaa", "aa", "b") == "ba");
  KJ_EXPECT(replaceAll("abc", "", "x") == "abc");

  auto parts = split(kj::StringPtr("a,b,,c"), ',');
  KJ_ASSERT(parts.size() == 4);
  KJ_EXPECT(kj::str(parts[2]) == "");
  KJ_EXPECT(kj::str(parts[3]) == "c");

  KJ_EXPECT(KJ_ASSERT_NONNULL(parseUInt("123", 10)) == 123);
  KJ_EXPECT(parseUInt("12x", 10) == nullptr);
  KJ_EXPECT(parseUInt("", 10) == nullptr);

  auto hex = randomHex(16);
  KJ_EXPECT(hex.size() == 32);
  KJ_EXPECT(hex != randomHex(16));
  for (char c: hex) {
    KJ_EXPECT((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'), hex);
  }
}

KJ_TEST("splitLines ignores comments and blank lines") {
  auto lines = splitLines("FOO=1\n\n# comment\nBAR = 2 # trailing\n  \nBAZ=3");
  KJ_ASSERT(lines.size() == 3);
  KJ_EXPECT(lines[0] == "FOO=1");
  KJ_EXPECT(lines[1] == "BAR = 2");
  KJ_EXPECT(lines[2] == "BAZ=3");
}

}  // namespace
}  // namespace texbox
