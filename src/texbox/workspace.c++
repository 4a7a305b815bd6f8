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
#include <kj/debug.h>
#include <errno.h>

namespace texbox {

WorkspaceManager::WorkspaceManager(kj::StringPtr baseDir)
    : baseDir(kj::heapString(baseDir)) {
  KJ_REQUIRE(baseDir.startsWith("/") && (baseDir == "/" || !baseDir.endsWith("/")),
             "workspace base directory must be absolute without a trailing slash", baseDir);
}

kj::String WorkspaceManager::acquire(kj::StringPtr kind) {
  auto path = kj::str(baseDir == "/" ? "" : baseDir.cStr(), "/texbox-", kind, '-', randomHex(16));
  KJ_SYSCALL(mkdir(path.cStr(), 0700), path);
  pending.lockExclusive()->insert(kj::str(path));
  KJ_LOG(INFO, "workspace acquired", path);
  return path;
}

bool WorkspaceManager::release(kj::StringPtr path) {
  {
    auto locked = pending.lockExclusive();
    auto iter = locked->find(kj::str(path));
    if (iter == locked->end()) return true;
    // De-register first: a directory we fail to delete stays on disk, but we don't retry.
    locked->erase(iter);
  }

  KJ_IF_MAYBE(exception, kj::runCatchingExceptions([&]() {
    recursivelyDelete(path);
  })) {
    KJ_LOG(ERROR, "failed to remove workspace", path, *exception);
    return false;
  }

  KJ_LOG(INFO, "workspace released", path);
  return true;
}

WorkspaceManager::SweepResult WorkspaceManager::sweep() {
  kj::Vector<kj::String> paths;
  {
    auto locked = pending.lockShared();
    for (auto& path: *locked) {
      paths.add(kj::str(path));
    }
  }

  SweepResult result = { 0, 0 };
  for (auto& path: paths) {
    if (release(path)) {
      ++result.cleaned;
    } else {
      ++result.failed;
    }
  }

  if (paths.size() > 0) {
    KJ_LOG(WARNING, "swept leftover workspaces", result.cleaned, result.failed);
  }
  return result;
}

size_t WorkspaceManager::pendingCount() const {
  return pending.lockShared()->size();
}

bool WorkspaceManager::isPending(kj::StringPtr path) const {
  auto locked = pending.lockShared();
  return locked->find(kj::str(path)) != locked->end();
}

}  // namespace texbox
