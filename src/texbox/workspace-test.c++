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

#include "workspace.h"
#include <kj/test.h>
#include <kj/debug.h>
#include <stdlib.h>
#include <unistd.h>

namespace texbox {
namespace {

kj::String makeTempDir() {
  char dirTemplate[] = "/tmp/texbox-workspace-test.XXXXXX";
  KJ_ASSERT(mkdtemp(dirTemplate) != nullptr);
  return kj::heapString(dirTemplate);
}

bool exists(kj::StringPtr path) {
  return access(path.cStr(), F_OK) == 0;
}

KJ_TEST("WorkspaceManager: acquire and release") {
  auto base = makeTempDir();
  KJ_DEFER(recursivelyDelete(base));
  WorkspaceManager manager(base);

  auto first = manager.acquire("compile");
  auto second = manager.acquire("compile");
  KJ_EXPECT(first != second);
  KJ_EXPECT(first.startsWith(kj::str(base, "/texbox-compile-")), first);
  KJ_EXPECT(isDirectory(first));
  KJ_EXPECT(manager.pendingCount() == 2);
  KJ_EXPECT(manager.isPending(first));

  struct stat stats;
  KJ_SYSCALL(stat(first.cStr(), &stats));
  KJ_EXPECT((stats.st_mode & 0777) == 0700);

  writeFile(kj::str(first, "/main.tex"), kj::StringPtr("x").asBytes());
  recursivelyCreateParent(kj::str(first, "/a/b/c"));

  KJ_EXPECT(manager.release(first));
  KJ_EXPECT(!exists(first));
  KJ_EXPECT(!manager.isPending(first));
  KJ_EXPECT(manager.pendingCount() == 1);

  // Releasing again, or releasing something we never handed out, is a no-op.
  KJ_EXPECT(manager.release(first));
  KJ_EXPECT(manager.release(kj::str(base, "/not-a-workspace")));
  KJ_EXPECT(manager.pendingCount() == 1);

  KJ_EXPECT(manager.release(second));
  KJ_EXPECT(manager.pendingCount() == 0);
}

KJ_TEST("WorkspaceManager: a removal failure still de-registers") {
  auto base = makeTempDir();
  KJ_DEFER(recursivelyDelete(base));
  WorkspaceManager manager(base);

  auto path = manager.acquire("git");
  KJ_SYSCALL(rmdir(path.cStr()));

  KJ_EXPECT_LOG(ERROR, "failed to remove workspace");
  KJ_EXPECT(!manager.release(path));
  KJ_EXPECT(!manager.isPending(path));
}

KJ_TEST("WorkspaceManager: base directory must be absolute") {
  KJ_EXPECT_THROW_MESSAGE("must be absolute", WorkspaceManager("relative/dir"));
  KJ_EXPECT_THROW_MESSAGE("must be absolute", WorkspaceManager("/tmp/"));
}

KJ_TEST("WorkspaceManager: withWorkspace releases on every outcome") {
  auto base = makeTempDir();
  KJ_DEFER(recursivelyDelete(base));
  WorkspaceManager manager(base);
  kj::EventLoop loop;
  kj::WaitScope waitScope(loop);

  // Success.
  kj::String seen;
  auto result = manager.withWorkspace("compile", [&](kj::StringPtr path) {
    seen = kj::str(path);
    KJ_EXPECT(isDirectory(path));
    KJ_EXPECT(manager.isPending(path));
    return kj::Promise<int>(123);
  }).wait(waitScope);
  KJ_EXPECT(result == 123);
  KJ_EXPECT(!exists(seen));
  KJ_EXPECT(manager.pendingCount() == 0);

  // The callback throws synchronously.
  KJ_EXPECT_THROW_MESSAGE("callback failed", manager.withWorkspace("compile",
      [&](kj::StringPtr path) -> kj::Promise<int> {
    seen = kj::str(path);
    KJ_FAIL_ASSERT("callback failed");
  }).wait(waitScope));
  KJ_EXPECT(!exists(seen));
  KJ_EXPECT(manager.pendingCount() == 0);

  // The promise rejects later.
  KJ_EXPECT_THROW_MESSAGE("promise failed", manager.withWorkspace("compile",
      [&](kj::StringPtr path) {
    seen = kj::str(path);
    return kj::evalLater([]() -> int { KJ_FAIL_ASSERT("promise failed"); });
  }).wait(waitScope));
  KJ_EXPECT(!exists(seen));
  KJ_EXPECT(manager.pendingCount() == 0);

  // The caller loses interest before the work finishes.
  auto paf = kj::newPromiseAndFulfiller<void>();
  {
    auto promise = manager.withWorkspace("compile", [&](kj::StringPtr path) {
      seen = kj::str(path);
      return kj::mv(paf.promise);
    });
    KJ_EXPECT(exists(seen));
    KJ_EXPECT(manager.pendingCount() == 1);
  }
  KJ_EXPECT(!exists(seen));
  KJ_EXPECT(manager.pendingCount() == 0);
}

KJ_TEST("WorkspaceManager: sweep") {
  auto base = makeTempDir();
  KJ_DEFER(recursivelyDelete(base));
  WorkspaceManager manager(base);

  auto a = manager.acquire("compile");
  auto b = manager.acquire("thumbnail");
  auto c = manager.acquire("git");
  writeFile(kj::str(b, "/input.pdf"), kj::StringPtr("%PDF").asBytes());
  KJ_SYSCALL(rmdir(c.cStr()));

  KJ_EXPECT_LOG(ERROR, "failed to remove workspace");
  auto result = manager.sweep();
  KJ_EXPECT(result.cleaned == 2);
  KJ_EXPECT(result.failed == 1);
  KJ_EXPECT(manager.pendingCount() == 0);
  KJ_EXPECT(!exists(a));
  KJ_EXPECT(!exists(b));

  // Nothing left to do the second time.
  auto again = manager.sweep();
  KJ_EXPECT(again.cleaned == 0);
  KJ_EXPECT(again.failed == 0);

  // Only workspaces are touched.
  KJ_EXPECT(listDirectory(base).size() == 0);
}

}  // namespace
}  // namespace texbox
