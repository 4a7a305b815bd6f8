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

#include "tools.h"
#include <kj/compat/url.h>
#include <kj/encoding.h>
#include <kj/debug.h>

extern char** environ;

namespace texbox {

kj::Array<kj::String> latexmkArgs(Compiler compiler, bool recorder, kj::StringPtr target) {
  kj::Vector<kj::String> args;

  switch (compiler) {
    case Compiler::PDFLATEX: args.add(kj::str("-pdf")); break;
    case Compiler::XELATEX: args.add(kj::str("-xelatex")); break;
    case Compiler::LUALATEX: args.add(kj::str("-lualatex")); break;
  }

  args.add(kj::str("-interaction=nonstopmode"));
  args.add(kj::str("-file-line-error"));
  args.add(kj::str("-cd"));

  if (recorder) {
    args.add(kj::str("-recorder"));
  } else {
    args.add(kj::str("-bibtex-cond1"));
    args.add(kj::str("-makeindex"));
    args.add(kj::str("-e"));
    args.add(kj::str(
        "add_cus_dep('glo', 'gls', 0, 'makeglossaries'); "
        "sub makeglossaries { system(\"makeglossaries $_[0]\"); }"));
  }

  args.add(kj::str(target));
  return args.releaseAsArray();
}

kj::StringPtr imageExtension(ImageFormat format) {
  switch (format) {
    case ImageFormat::PNG: return "png";
    case ImageFormat::JPEG: return "jpg";
  }
  KJ_UNREACHABLE;
}

kj::StringPtr imageContentType(ImageFormat format) {
  switch (format) {
    case ImageFormat::PNG: return "image/png";
    case ImageFormat::JPEG: return "image/jpeg";
  }
  KJ_UNREACHABLE;
}

kj::Array<kj::String> pdftoppmArgs(ImageFormat format, uint width,
                                   kj::StringPtr pdf, kj::StringPtr outputPrefix) {
  kj::Vector<kj::String> args;
  args.add(kj::str(format == ImageFormat::PNG ? "-png" : "-jpeg"));
  args.add(kj::str("-f"));
  args.add(kj::str("1"));
  args.add(kj::str("-l"));
  args.add(kj::str("1"));
  args.add(kj::str("-singlefile"));
  args.add(kj::str("-scale-to"));
  args.add(kj::str(width));
  args.add(kj::str(pdf));
  args.add(kj::str(outputPrefix));
  return args.releaseAsArray();
}

kj::Array<kj::String> gitCloneArgs(kj::StringPtr url, kj::Maybe<kj::StringPtr> branch,
                                   kj::StringPtr directory) {
  kj::Vector<kj::String> args;
  args.add(kj::str("clone"));
  args.add(kj::str("--depth"));
  args.add(kj::str("1"));
  KJ_IF_MAYBE(b, branch) {
    args.add(kj::str("--branch"));
    args.add(kj::str(*b));
  }
  // Nothing after "--" can be taken for an option, whatever the URL looks like.
  args.add(kj::str("--"));
  args.add(kj::str(url));
  args.add(kj::str(directory));
  return args.releaseAsArray();
}

kj::Array<kj::String> gitLsRemoteArgs(kj::StringPtr url) {
  kj::Vector<kj::String> args;
  args.add(kj::str("ls-remote"));
  args.add(kj::str("--"));
  args.add(kj::str(url));
  return args.releaseAsArray();
}

kj::Array<kj::String> gitFetchArgs(kj::StringPtr url, kj::StringPtr branch) {
  kj::Vector<kj::String> args;
  args.add(kj::str("fetch"));
  args.add(kj::str("--depth=1"));
  args.add(kj::str("--"));
  args.add(kj::str(url));
  args.add(kj::str("refs/heads/", branch, ":refs/heads/", branch));
  return args.releaseAsArray();
}

kj::Array<kj::String> gitLogArgs(kj::StringPtr sha) {
  kj::Vector<kj::String> args;
  args.add(kj::str("log"));
  args.add(kj::str("-1"));
  args.add(kj::str("--format=%cI%n%an%n%ae%n%s"));
  args.add(kj::str(sha));
  args.add(kj::str("--"));
  return args.releaseAsArray();
}

kj::Array<kj::String> gitHashObjectArgs(kj::ArrayPtr<const kj::String> paths) {
  kj::Vector<kj::String> args;
  args.add(kj::str("hash-object"));
  args.add(kj::str("--"));
  for (auto& path: paths) {
    args.add(kj::str(path));
  }
  return args.releaseAsArray();
}

kj::Vector<kj::String> gitEnvironment(kj::ArrayPtr<const kj::StringPtr> inheritedEnvironment) {
  kj::Vector<kj::String> environment;
  for (auto& var: inheritedEnvironment) {
    if (!var.startsWith("GIT_")) {
      environment.add(kj::str(var));
    }
  }
  environment.add(kj::str("GIT_TERMINAL_PROMPT=0"));
  environment.add(kj::str("GIT_ALLOW_PROTOCOL=http:https"));
  return environment;
}

PreparedClone prepareClone(const CloneRequest& request,
                           kj::ArrayPtr<const kj::StringPtr> inheritedEnvironment) {
  auto url = kj::Url::parse(request.url);

  kj::String username;
  kj::String password;
  KJ_IF_MAYBE(info, url.userInfo) {
    username = kj::mv(info->username);
    KJ_IF_MAYBE(p, info->password) {
      password = kj::mv(*p);
    }
  }
  url.userInfo = nullptr;

  KJ_IF_MAYBE(c, request.credentials) {
    username = kj::str(c->username);
    password = kj::str(c->password);
  }

  auto environment = gitEnvironment(inheritedEnvironment);

  kj::Vector<kj::String> secrets;
  if (username.size() > 0 || password.size() > 0) {
    auto token = kj::encodeBase64(kj::str(username, ':', password).asBytes(), false);
    environment.add(kj::str("GIT_CONFIG_COUNT=1"));
    environment.add(kj::str("GIT_CONFIG_KEY_0=http.extraHeader"));
    environment.add(kj::str("GIT_CONFIG_VALUE_0=Authorization: Basic ", token));

    secrets.add(kj::mv(token));
    if (password.size() > 0) secrets.add(kj::mv(password));
    // Very short usernames (e.g. "x" with a token as password) would mangle every message.
    if (username.size() >= 3) secrets.add(kj::mv(username));
  }

  return PreparedClone {
    url.toString(), environment.releaseAsArray(), secrets.releaseAsArray()
  };
}

kj::String redact(kj::StringPtr text, kj::ArrayPtr<const kj::String> secrets) {
  auto result = kj::str(text);
  for (auto& secret: secrets) {
    result = replaceAll(result, secret, "***");
  }
  return result;
}

static kj::Array<const kj::StringPtr> currentEnvironment() {
  size_t count = 0;
  while (environ[count] != nullptr) ++count;

  auto result = kj::heapArrayBuilder<const kj::StringPtr>(count);
  for (size_t i = 0; i < count; i++) {
    result.add(environ[i]);
  }
  return result.finish();
}

// =======================================================================================

RunOptions ToolInvoker::options(kj::StringPtr program, kj::Array<kj::String> args,
                                kj::Duration timeout) {
  RunOptions result;
  result.program = kj::str(program);
  result.args = kj::mv(args);
  result.timeout = timeout;
  result.gracePeriod = settings.gracePeriod;
  result.maxOutput = settings.maxOutput;
  return result;
}

kj::Promise<ProcessResult> ToolInvoker::compile(
    kj::StringPtr workspace, kj::StringPtr target, Compiler compiler, bool recorder,
    kj::Maybe<kj::Duration> timeout) {
  kj::Duration limit = settings.compileTimeout;
  KJ_IF_MAYBE(t, timeout) {
    limit = *t;
  }

  auto runOptions = options("latexmk", latexmkArgs(compiler, recorder, target), limit);
  runOptions.workingDirectory = kj::str(workspace);
  return runner.run(kj::mv(runOptions));
}

kj::Promise<ProcessResult> ToolInvoker::rasterize(
    kj::StringPtr workspace, kj::StringPtr pdf, ThumbnailOptions thumbnail) {
  auto runOptions = options("pdftoppm",
      pdftoppmArgs(thumbnail.format, thumbnail.width, pdf, "thumb"),
      settings.thumbnailTimeout);
  runOptions.workingDirectory = kj::str(workspace);
  return runner.run(kj::mv(runOptions));
}

kj::Promise<ProcessResult> ToolInvoker::runGit(
    PreparedClone& prepared, kj::Array<kj::String> args,
    kj::Maybe<kj::StringPtr> workingDirectory, kj::Duration timeout) {
  auto runOptions = options("git", kj::mv(args), timeout);
  runOptions.environment = KJ_MAP(var, prepared.environment) { return kj::str(var); };
  KJ_IF_MAYBE(dir, workingDirectory) {
    runOptions.workingDirectory = kj::str(*dir);
  }

  auto secrets = KJ_MAP(secret, prepared.secrets) { return kj::str(secret); };
  return runner.run(kj::mv(runOptions))
      .then([KJ_MVCAP(secrets)](ProcessResult&& result) {
    result.stdout = redact(result.stdout, secrets);
    result.stderr = redact(result.stderr, secrets);
    return kj::mv(result);
  });
}

kj::Promise<ProcessResult> ToolInvoker::clone(
    const CloneRequest& request, kj::StringPtr directory, kj::Maybe<kj::Duration> timeout) {
  auto prepared = prepareClone(request, currentEnvironment());

  kj::Maybe<kj::StringPtr> branch;
  KJ_IF_MAYBE(b, request.branch) {
    branch = kj::StringPtr(*b);
  }

  kj::Duration limit = settings.cloneTimeout;
  KJ_IF_MAYBE(t, timeout) {
    limit = *t;
  }

  return runGit(prepared, gitCloneArgs(prepared.url, branch, directory), nullptr, limit);
}

kj::Promise<ProcessResult> ToolInvoker::listRemote(const CloneRequest& request) {
  auto prepared = prepareClone(request, currentEnvironment());
  return runGit(prepared, gitLsRemoteArgs(prepared.url), nullptr, settings.refsTimeout);
}

kj::Promise<ProcessResult> ToolInvoker::fetchCommit(
    const CloneRequest& request, kj::StringPtr directory,
    kj::StringPtr branch, kj::StringPtr sha) {
  auto prepared = kj::heap(prepareClone(request, currentEnvironment()));
  kj::Vector<kj::String> init;
  init.add(kj::str("init"));
  init.add(kj::str("--bare"));
  init.add(kj::str("-q"));

  auto& ref = *prepared;
  return runGit(ref, init.releaseAsArray(), directory, settings.refsTimeout)
      .then([this, &ref, directory, branch = kj::str(branch), sha = kj::str(sha)]
            (ProcessResult&& result) mutable -> kj::Promise<ProcessResult> {
    if (!result.success) return kj::mv(result);
    return runGit(ref, gitFetchArgs(ref.url, branch), directory, settings.refsTimeout)
        .then([this, &ref, directory, KJ_MVCAP(sha)](ProcessResult&& result)
              -> kj::Promise<ProcessResult> {
      if (!result.success) return kj::mv(result);
      return runGit(ref, gitLogArgs(sha), directory, settings.refsTimeout);
    });
  }).attach(kj::mv(prepared));
}

kj::Promise<ProcessResult> ToolInvoker::hashObjects(
    kj::StringPtr workspace, kj::ArrayPtr<const kj::String> paths) {
  PreparedClone prepared { kj::str(), gitEnvironment(currentEnvironment()).releaseAsArray(),
                           nullptr };
  return runGit(prepared, gitHashObjectArgs(paths), workspace, settings.hashTimeout);
}

kj::Promise<kj::Array<ToolInvoker::ToolStatus>> ToolInvoker::checkTools() {
  struct VersionCheck {
    const char* tool;
    const char* flag;
  };
  static const VersionCheck CHECKS[] = {
    { "latexmk", "--version" },
    { "git", "--version" },
    { "pdftoppm", "-v" },
  };

  auto promises = kj::heapArrayBuilder<kj::Promise<ToolStatus>>(kj::size(CHECKS));
  for (auto& check: CHECKS) {
    kj::StringPtr tool = check.tool;
    auto args = kj::heapArrayBuilder<kj::String>(1);
    args.add(kj::str(check.flag));
    auto runOptions = options(tool, args.finish(), settings.checkTimeout);
    runOptions.maxOutput = 4096;
    promises.add(runner.run(kj::mv(runOptions)).then([tool](ProcessResult&& result) {
      // pdftoppm prints its version on stderr.
      kj::StringPtr output = result.stdout.size() > 0 ? result.stdout : result.stderr;
      auto firstLine = trim(split(output, '\n')[0]);
      return ToolStatus { tool, result.success, kj::mv(firstLine) };
    }));
  }

  return kj::joinPromises(promises.finish());
}

}  // namespace texbox
