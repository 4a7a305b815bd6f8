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

#ifndef TEXBOX_TOOLS_H_
#define TEXBOX_TOOLS_H_
// Invocations of the external programs we drive: latexmk, pdftoppm and git. Argument vectors
// are built by pure functions so they can be tested without the tools installed.

#include "runner.h"
#include "validation.h"

namespace texbox {

kj::Array<kj::String> latexmkArgs(Compiler compiler, bool recorder, kj::StringPtr target);
// With `recorder`, latexmk writes a .fls file listing every file the build read. Otherwise
// latexmk runs bibtex/biber, makeindex and makeglossaries whenever the build produces the
// auxiliary files that call for them.

kj::Array<kj::String> pdftoppmArgs(ImageFormat format, uint width,
                                   kj::StringPtr pdf, kj::StringPtr outputPrefix);
// Renders only the first page, to `<outputPrefix>.<imageExtension(format)>`.

kj::StringPtr imageExtension(ImageFormat format);
kj::StringPtr imageContentType(ImageFormat format);

kj::Array<kj::String> gitCloneArgs(kj::StringPtr url, kj::Maybe<kj::StringPtr> branch,
                                   kj::StringPtr directory);
kj::Array<kj::String> gitLsRemoteArgs(kj::StringPtr url);
kj::Array<kj::String> gitFetchArgs(kj::StringPtr url, kj::StringPtr branch);
// Shallow fetch of one branch into a bare repository.
kj::Array<kj::String> gitLogArgs(kj::StringPtr sha);
// Prints committer date (ISO 8601), author name, author email and subject, one per line.
kj::Array<kj::String> gitHashObjectArgs(kj::ArrayPtr<const kj::String> paths);

struct GitCredentials {
  kj::String username;
  kj::String password;
};

struct CloneRequest {
  kj::String url;
  kj::Maybe<kj::String> branch;
  kj::Maybe<GitCredentials> credentials;
  // Overrides any user info embedded in `url`.
};

struct PreparedClone {
  // A clone request turned into something safe to hand to git: credentials are moved out of the
  // URL into an HTTP Authorization header passed through git's GIT_CONFIG_* environment, since
  // other users on the host can read our children's argument vectors.

  kj::String url;
  kj::Array<kj::String> environment;

  kj::Array<kj::String> secrets;
  // Strings that must not appear in anything we report or log.
};

PreparedClone prepareClone(const CloneRequest& request,
                           kj::ArrayPtr<const kj::StringPtr> inheritedEnvironment);
// `inheritedEnvironment` is the base environment ('NAME=VALUE'); inherited GIT_* variables are
// dropped.

kj::Vector<kj::String> gitEnvironment(kj::ArrayPtr<const kj::StringPtr> inheritedEnvironment);
// The environment every git invocation runs with: no inherited GIT_* variables, no prompts, and
// only the http and https transports.

kj::String redact(kj::StringPtr text, kj::ArrayPtr<const kj::String> secrets);
// Replace every occurrence of each secret with "***".

struct ToolSettings {
  kj::Duration compileTimeout = 180 * kj::SECONDS;
  kj::Duration thumbnailTimeout = 30 * kj::SECONDS;
  kj::Duration cloneTimeout = 60 * kj::SECONDS;
  kj::Duration refsTimeout = 30 * kj::SECONDS;
  kj::Duration hashTimeout = 10 * kj::SECONDS;
  kj::Duration checkTimeout = 5 * kj::SECONDS;
  kj::Duration gracePeriod = 5 * kj::SECONDS;
  size_t maxOutput = 10u << 20;
};

class ToolInvoker {
public:
  ToolInvoker(ProcessRunner& runner, ToolSettings settings)
      : runner(runner), settings(settings) {}
  KJ_DISALLOW_COPY(ToolInvoker);

  kj::Promise<ProcessResult> compile(kj::StringPtr workspace, kj::StringPtr target,
                                     Compiler compiler, bool recorder,
                                     kj::Maybe<kj::Duration> timeout = nullptr);
  // Run latexmk from `workspace` on `target` (relative to it). latexmk's -cd makes the build
  // itself run in the target's directory, so outputs land next to the target.

  kj::Promise<ProcessResult> rasterize(kj::StringPtr workspace, kj::StringPtr pdf,
                                       ThumbnailOptions options);
  // Render the first page of `workspace/pdf` to `workspace/thumb.<ext>`.

  kj::Promise<ProcessResult> clone(const CloneRequest& request, kj::StringPtr directory,
                                   kj::Maybe<kj::Duration> timeout = nullptr);
  // Shallow clone into `directory`, which must already exist and be empty. Credentials are
  // redacted from the returned output.

  kj::Promise<ProcessResult> listRemote(const CloneRequest& request);
  // `git ls-remote`: one "<sha>\t<ref>" line per ref. `request.branch` is ignored.

  kj::Promise<ProcessResult> fetchCommit(const CloneRequest& request, kj::StringPtr directory,
                                         kj::StringPtr branch, kj::StringPtr sha);
  // Fetch just the tip of `branch` into a bare repository created in `directory` and describe
  // commit `sha` (see gitLogArgs()). Resolves with the first step that fails, or the log step.

  kj::Promise<ProcessResult> hashObjects(kj::StringPtr workspace,
                                         kj::ArrayPtr<const kj::String> paths);
  // Git blob hashes of `paths` (relative to `workspace`), one line each, in order.

  struct ToolStatus {
    kj::StringPtr tool;
    bool ok;
    kj::String version;
    // First line of the tool's version output, or the failure reason.
  };

  kj::Promise<kj::Array<ToolStatus>> checkTools();
  // Check that every tool we need is installed and runs.

  inline const ToolSettings& getSettings() const { return settings; }

private:
  ProcessRunner& runner;
  ToolSettings settings;

  RunOptions options(kj::StringPtr program, kj::Array<kj::String> args, kj::Duration timeout);
  kj::Promise<ProcessResult> runGit(PreparedClone& prepared, kj::Array<kj::String> args,
                                    kj::Maybe<kj::StringPtr> workingDirectory,
                                    kj::Duration timeout);
};

}  // namespace texbox

#endif // TEXBOX_TOOLS_H_
