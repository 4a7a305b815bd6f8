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

#ifndef TEXBOX_ORCHESTRATOR_H_
#define TEXBOX_ORCHESTRATOR_H_

#include <texbox/api.capnp.h>
#include "errors.h"
#include "tools.h"
#include "validation.h"
#include "workspace.h"

namespace texbox {

struct CompileOutput {
  kj::Array<byte> pdf;

  kj::Maybe<kj::Array<kj::String>> dependencies;
  // Workspace-relative files the build read. Only in recorder mode.
};

struct ImageOutput {
  kj::Array<byte> data;
  kj::StringPtr contentType;
};

struct RepoFile {
  kj::String path;
  // Relative to the repository root.

  kj::String content;
  bool base64;
  // Binary files (by extension) are base64-encoded, anything else is passed through as text.
};

struct RepoEntry {
  kj::String name;
  kj::String path;
  bool isDirectory;
};

struct ArchiveOutput {
  kj::Array<RepoFile> files;
  kj::Array<kj::String> missingPaths;
};

struct CommitInfo {
  kj::String sha;
  kj::String defaultBranch;
  bool unchanged;

  kj::Maybe<kj::String> message;
  kj::Maybe<kj::String> date;
  kj::Maybe<kj::String> authorName;
  kj::Maybe<kj::String> authorEmail;
  // Null when `unchanged`. If the commit couldn't be fetched, message is "Latest commit" and
  // date is the current time.
};

struct FileHash {
  kj::String path;
  // As requested.

  kj::Maybe<kj::String> hash;
  // Null if the path is invalid or names no regular file in the repository.
};

struct FileHashOutput {
  kj::Array<FileHash> hashes;
  bool batch;
  // True if the request used filePaths.
};

struct RemoteRefs {
  kj::Maybe<kj::String> sha;
  kj::String defaultBranch;
};

RemoteRefs parseRemoteRefs(kj::StringPtr lsRemote, kj::StringPtr branch);
// Pick the commit `branch` points to from `git ls-remote` output. Without a branch, main or
// master (whichever is listed first) wins, then HEAD. defaultBranch is "master" unless the
// remote has main or master.

struct ArchiveFilter {
  kj::Array<kj::String> extensions;
  kj::Array<kj::String> paths;
  // A file is selected if its extension (case-insensitive, dot optional) is in `extensions` or
  // its path is in `paths`. Both empty selects everything.
};

struct OrchestratorSettings {
  Limits limits;
  kj::Duration gitCompileTimeout = 300 * kj::SECONDS;
  kj::Duration archiveCloneTimeout = 180 * kj::SECONDS;
  uint maxHashPaths = 500;
};

class Orchestrator {
  // Turns a request into exactly one tool invocation in a fresh workspace. Everything a client
  // sent is validated before the workspace exists; the workspace is released whatever happens.
  // Failures come back as values; an exception from here means a bug or a host problem.
  //
  // Request readers only need to stay valid until the call returns.

public:
  Orchestrator(WorkspaceManager& workspaces, ToolInvoker& tools, OrchestratorSettings settings)
      : workspaces(workspaces), tools(tools), settings(kj::mv(settings)) {}
  KJ_DISALLOW_COPY(Orchestrator);

  kj::Promise<Result<CompileOutput>> compile(CompileRequest::Reader request);
  kj::Promise<Result<CompileOutput>> compileFromGit(CompileFromGitRequest::Reader request);
  kj::Promise<Result<ImageOutput>> thumbnail(ThumbnailRequest::Reader request);
  kj::Promise<Result<ArchiveOutput>> archive(ArchiveRequest::Reader request);
  kj::Promise<Result<kj::Array<RepoEntry>>> tree(TreeRequest::Reader request);
  kj::Promise<Result<RepoFile>> file(FileRequest::Reader request);
  kj::Promise<Result<CommitInfo>> refs(RefsRequest::Reader request);
  kj::Promise<Result<FileHashOutput>> fileHash(FileHashRequest::Reader request);

private:
  WorkspaceManager& workspaces;
  ToolInvoker& tools;
  OrchestratorSettings settings;

  kj::Maybe<Failure> checkClone(kj::StringPtr workspace, ProcessResult&& result);
};

// ---------------------------------------------------------------------------------------
// What happens in a workspace once the tool has run.

Result<CompileOutput> collectCompileOutput(kj::StringPtr workspace, kj::StringPtr target,
                                           bool recorder, ProcessResult&& result,
                                           const Limits& limits, size_t maxLogBytes);
// Turn a finished latexmk run on `target` into the PDF (plus, for a recorder build, its
// dependencies) or a failure carrying the build log, read from the .log file if there is one and
// capped at `maxLogBytes`.

kj::Array<kj::String> collectDependencies(kj::StringPtr workspace, kj::StringPtr target);
// The workspace files a recorder build of `target` read, relative to the workspace: the .fls
// inputs plus the bibliographies named in the .aux (\bibdata) and the .bcf
// (<bcf:datasource>). Only files that exist are reported.

kj::Array<kj::String> parseBibData(kj::StringPtr aux);
kj::Array<kj::String> parseBcfDataSources(kj::StringPtr bcf);
// Bibliography names as written, in order.

Result<ArchiveOutput> collectArchive(kj::StringPtr workspace, kj::StringPtr path,
                                     ArchiveFilter filter, const Limits& limits);
// Files under `path` (normalized, "" for the root) of the clone in `workspace`, with paths
// relative to the workspace. Skips .git, anything nested deeper than limits.maxRepoDepth,
// files over limits.maxResourceBytes and symlinks that leave the workspace. Fails with 413 if
// the selected files exceed limits.maxRepoFiles or limits.maxRepoBytes.

kj::Array<kj::Maybe<kj::String>> hashablePaths(kj::StringPtr workspace,
                                               kj::ArrayPtr<const kj::String> requested);
// For each requested path, its normalized form if it names a regular file in the clone in
// `workspace` (outside .git), else null.

Result<kj::Array<RepoEntry>> listRepoDirectory(kj::StringPtr workspace, kj::StringPtr path);
Result<RepoFile> readRepoFile(kj::StringPtr workspace, kj::StringPtr filePath,
                              const Limits& limits);

kj::Array<kj::String> parseRecorderOutput(kj::StringPtr fls,
                                          kj::ArrayPtr<const kj::StringPtr> roots);
// Extract the files a latexmk -recorder build read from its .fls output, relative to whichever
// of `roots` contains them. Inputs outside all roots (the TeX distribution) and latexmk's own
// auxiliary files are dropped; duplicates are removed, preserving first-seen order. The first
// root is the fallback for a missing PWD line.

bool isBinaryExtension(kj::StringPtr path);

}  // namespace texbox

#endif // TEXBOX_ORCHESTRATOR_H_
