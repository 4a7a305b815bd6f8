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

#ifndef TEXBOX_WORKSPACE_H_
#define TEXBOX_WORKSPACE_H_

#include <kj/async.h>
#include <kj/mutex.h>
#include <set>
#include "util.h"

namespace texbox {

class WorkspaceManager {
  // Owns every ephemeral workspace directory the server creates. Each request acquires a fresh
  // directory, uses it for exactly one tool invocation, and releases it. The registry of live
  // workspaces lets sweep() remove whatever is left when the server shuts down.
  //
  // The registry holds path strings only and is mutex-guarded, so one manager can be shared by
  // several event loops.

public:
  explicit WorkspaceManager(kj::StringPtr baseDir);
  KJ_DISALLOW_COPY(WorkspaceManager);

  kj::String acquire(kj::StringPtr kind);
  // Create `<baseDir>/texbox-<kind>-<random>` with mode 0700, register it, and return its path.

  bool release(kj::StringPtr path);
  // Recursively remove the workspace and de-register it. Never throws: removal errors are logged
  // and the path is de-registered anyway. Returns false if removal failed. Releasing a path that
  // isn't registered (including one already released) does nothing and returns true.

  template <typename Func>
  kj::PromiseForResult<Func, kj::StringPtr> withWorkspace(kj::StringPtr kind, Func&& func);
  // Acquire a workspace, call `func(path)`, and release the workspace once the returned promise
  // has completed, failed, or been canceled, or if `func` throws. Anything `func`'s promise owns
  // (e.g. running subprocesses) is destroyed before the release happens.

  struct SweepResult {
    uint cleaned;
    uint failed;
  };

  SweepResult sweep();
  // Release every registered workspace.

  size_t pendingCount() const;
  bool isPending(kj::StringPtr path) const;

  kj::StringPtr getBaseDir() const { return baseDir; }

private:
  kj::String baseDir;
  kj::MutexGuarded<std::set<kj::String>> pending;
};

// =======================================================================================
// inline implementation details

template <typename Func>
kj::PromiseForResult<Func, kj::StringPtr> WorkspaceManager::withWorkspace(
    kj::StringPtr kind, Func&& func) {
  auto path = acquire(kind);
  kj::StringPtr pathPtr = path;
  auto cleanup = kj::defer([this, KJ_MVCAP(path)]() { release(path); });
  return kj::evalNow([&]() { return func(pathPtr); }).attach(kj::mv(cleanup));
}

}  // namespace texbox

#endif // TEXBOX_WORKSPACE_H_
