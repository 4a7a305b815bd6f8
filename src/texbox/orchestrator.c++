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

#include "orchestrator.h"
#include <kj/debug.h>
#include <kj/encoding.h>
#include <kj/io.h>
#include <algorithm>
#include <set>
#include <sys/types.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <errno.h>
#include <string.h>
#include <time.h>

namespace texbox {

namespace {

template <typename T>
kj::Promise<Result<T>> fail(Failure&& failure) {
  return Result<T>(kj::mv(failure));
}

kj::Maybe<kj::AutoCloseFd> openRegularFile(kj::StringPtr path, bool followLinks = false) {
  // Returns null if nothing is there, or if what's there is not a regular file.

  int flags = O_RDONLY | O_CLOEXEC;
  if (!followLinks) flags |= O_NOFOLLOW;

  int fd = open(path.cStr(), flags);
  if (fd < 0) {
    int error = errno;
    if (error == ENOENT || error == ENOTDIR || error == ELOOP) {
      return nullptr;
    }
    KJ_FAIL_SYSCALL("open", error, path);
  }
  kj::AutoCloseFd result(fd);

  struct stat stats;
  KJ_SYSCALL(fstat(result, &stats), path);
  if (!S_ISREG(stats.st_mode)) {
    return nullptr;
  }
  return kj::mv(result);
}

size_t fileSize(int fd) {
  struct stat stats;
  KJ_SYSCALL(fstat(fd, &stats));
  return stats.st_size;
}

kj::String readPrefix(int fd, size_t limit) {
  kj::FdInputStream input(fd);
  auto buffer = kj::heapArray<char>(limit);
  size_t n = input.tryRead(buffer.begin(), limit, limit);
  return kj::heapString(buffer.begin(), n);
}

kj::String bytesToText(kj::ArrayPtr<const byte> bytes) {
  return kj::heapString(reinterpret_cast<const char*>(bytes.begin()), bytes.size());
}

kj::String scrubWorkspace(kj::StringPtr text, kj::StringPtr workspace) {
  // The tools may print either the path we gave them or its canonical form.
  auto result = scrubPath(text, workspace);
  KJ_IF_MAYBE(real, realPath(workspace)) {
    if (*real != workspace) {
      result = scrubPath(result, *real);
    }
  }
  return result;
}

kj::StringPtr extensionOf(kj::StringPtr path) {
  // Including the dot. Empty if the last component has none.
  KJ_IF_MAYBE(slash, path.findLast('/')) {
    path = path.slice(*slash + 1);
  }
  KJ_IF_MAYBE(dot, path.findLast('.')) {
    return path.slice(*dot);
  }
  return "";
}

kj::String lowercase(kj::StringPtr text) {
  auto result = kj::heapString(text);
  toLower(result);
  return result;
}

bool isAuxiliaryFile(kj::StringPtr path) {
  static const char* const AUXILIARY[] = {
    ".aux", ".log", ".fls", ".fdb_latexmk", ".out", ".toc", ".lof", ".lot",
    ".bbl", ".blg", ".bcf", ".run.xml",
  };
  for (auto suffix: AUXILIARY) {
    if (path.endsWith(suffix)) return true;
  }
  return false;
}

kj::Maybe<Failure> writeResources(kj::StringPtr workspace,
                                  kj::ArrayPtr<const DecodedResource> resources) {
  for (auto& resource: resources) {
    KJ_IF_MAYBE(path, resolveInsideOnDisk(workspace, resource.path)) {
      KJ_IF_MAYBE(exception, kj::runCatchingExceptions([&]() {
        recursivelyCreateParent(*path);
        writeFile(*path, resource.content);
      })) {
        // Usually a resource whose path runs through another resource's file.
        KJ_LOG(WARNING, "couldn't write resource", resource.path, exception->getDescription());
        return Failure::validation(kj::str("Could not write resource: ", resource.path));
      }
    } else {
      return Failure::validation(kj::str("Invalid resource path: ", resource.path));
    }
  }
  return nullptr;
}

bool fileExistsInside(kj::StringPtr workspace, kj::StringPtr relative) {
  KJ_IF_MAYBE(path, resolveInsideOnDisk(workspace, relative)) {
    return openRegularFile(*path, true) != nullptr;
  }
  return false;
}

CloneRequest makeCloneRequest(kj::StringPtr url, kj::StringPtr branch,
                              kj::Maybe<GitAuth::Reader> auth) {
  CloneRequest result { kj::str(url), nullptr, nullptr };
  if (branch.size() > 0) {
    result.branch = kj::str(branch);
  }
  KJ_IF_MAYBE(a, auth) {
    if (a->getUsername().size() > 0 || a->getPassword().size() > 0) {
      result.credentials = GitCredentials { kj::str(a->getUsername()), kj::str(a->getPassword()) };
    }
  }
  return result;
}

kj::Maybe<Failure> validateClone(kj::StringPtr gitUrl, kj::StringPtr branch) {
  KJ_IF_MAYBE(failure, validateGitUrl(gitUrl)) {
    return kj::mv(*failure);
  }
  if (branch.startsWith("-")) {
    return Failure::validation("Invalid branch");
  }
  for (unsigned char c: branch) {
    // Characters git never allows in a ref name; ':' would also split a fetch refspec.
    if (c <= ' ' || c == 0x7f || strchr("~^:?*[\\", c) != nullptr) {
      return Failure::validation("Invalid branch");
    }
  }
  return nullptr;
}

kj::Maybe<kj::String> normalizeListingPath(kj::StringPtr path) {
  // Empty means the repository root.
  if (path.size() == 0) return kj::str();
  return normalizeRelative(path);
}

kj::Array<kj::String> normalizeExtensions(kj::ArrayPtr<const kj::String> extensions) {
  // Lowercase, with a leading dot.
  return KJ_MAP(extension, extensions) {
    auto lower = lowercase(extension);
    return lower.startsWith(".") ? kj::mv(lower) : kj::str('.', lower);
  };
}

class ArchiveWalk {
  // Collects the files of a cloned repository for /git/archive, enforcing the repository size
  // limits on the files actually returned.

public:
  ArchiveWalk(const Limits& limits, kj::StringPtr workspace, ArchiveFilter filter)
      : limits(limits), workspace(workspace),
        extensions(normalizeExtensions(filter.extensions)), requested(kj::mv(filter.paths)) {
    for (auto& path: requested) {
      KJ_IF_MAYBE(normalized, normalizeRelative(path)) {
        wanted.insert(kj::mv(*normalized));
      }
    }
  }

  bool walk(kj::StringPtr dir, kj::StringPtr relative, uint depth) {
    // Returns false once a limit has been exceeded; `failure` then says which.

    auto names = listDirectory(dir);
    std::sort(names.begin(), names.end());

    for (auto& name: names) {
      if (name == ".git") continue;

      auto path = kj::str(dir, '/', name);
      auto rel = relative.size() == 0 ? kj::str(name) : kj::str(relative, '/', name);

      struct stat stats;
      KJ_SYSCALL(lstat(path.cStr(), &stats), path);

      if (S_ISDIR(stats.st_mode)) {
        if (depth < limits.maxRepoDepth) {
          if (!walk(path, rel, depth + 1)) return false;
        }
        continue;
      }

      if (S_ISLNK(stats.st_mode)) {
        // Links are followed only to regular files inside the clone.
        if (resolveInsideOnDisk(workspace, rel) == nullptr) continue;
        if (stat(path.cStr(), &stats) < 0) continue;
      }
      if (!S_ISREG(stats.st_mode) || !selects(rel)) continue;
      if (size_t(stats.st_size) > limits.maxResourceBytes) continue;

      if (files.size() >= limits.maxRepoFiles) {
        failure = Failure::tooLarge(kj::str(
            "Repository has too many files. Maximum is ", limits.maxRepoFiles));
        return false;
      }
      totalBytes += stats.st_size;
      if (totalBytes > limits.maxRepoBytes) {
        failure = Failure::tooLarge("Repository too large");
        return false;
      }

      KJ_IF_MAYBE(fd, openRegularFile(path, true)) {
        auto content = readAllBytes(*fd);
        bool binary = isBinaryExtension(rel);
        found.insert(kj::str(rel));
        files.add(RepoFile {
          kj::mv(rel),
          binary ? kj::encodeBase64(content) : bytesToText(content),
          binary
        });
      }
    }
    return true;
  }

  Result<ArchiveOutput> finish() {
    KJ_IF_MAYBE(f, failure) {
      return kj::mv(*f);
    }

    kj::Vector<kj::String> missing;
    for (auto& path: requested) {
      KJ_IF_MAYBE(normalized, normalizeRelative(path)) {
        if (found.count(*normalized) > 0) continue;
      }
      missing.add(kj::str(path));
    }
    return ArchiveOutput { files.releaseAsArray(), missing.releaseAsArray() };
  }

private:
  const Limits& limits;
  kj::StringPtr workspace;
  kj::Array<kj::String> extensions;
  kj::Array<kj::String> requested;
  std::set<kj::String> wanted;
  std::set<kj::String> found;

  kj::Vector<RepoFile> files;
  size_t totalBytes = 0;
  kj::Maybe<Failure> failure;

  bool selects(kj::StringPtr path) {
    if (extensions.size() == 0 && requested.size() == 0) return true;

    if (wanted.count(kj::str(path)) > 0) return true;
    auto extension = lowercase(extensionOf(path));
    for (auto& e: extensions) {
      if (e == extension) return true;
    }
    return false;
  }
};

kj::String currentTimestamp() {
  time_t now = time(nullptr);
  struct tm utc;
  gmtime_r(&now, &utc);
  char buffer[32];
  strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &utc);
  return kj::str(buffer);
}

CommitInfo describeCommit(kj::String sha, kj::String defaultBranch, ProcessResult&& result) {
  CommitInfo info { kj::mv(sha), kj::mv(defaultBranch), false,
                    nullptr, nullptr, nullptr, nullptr };

  if (result.success && trim(result.stdout).size() > 0) {
    auto lines = split(result.stdout, '\n');
    auto field = [&](size_t i) -> kj::Maybe<kj::String> {
      if (i >= lines.size()) return nullptr;
      auto value = trim(lines[i]);
      if (value.size() == 0) return nullptr;
      return kj::mv(value);
    };
    info.date = field(0);
    info.authorName = field(1);
    info.authorEmail = field(2);
    info.message = field(3);
  } else {
    KJ_LOG(WARNING, "couldn't fetch commit details; reporting the current time",
           info.sha, trim(result.stderr));
  }

  if (info.message == nullptr) info.message = kj::str("Latest commit");
  if (info.date == nullptr) info.date = currentTimestamp();
  return info;
}

kj::Array<kj::String> copyStrings(capnp::List<capnp::Text>::Reader list) {
  auto result = kj::heapArrayBuilder<kj::String>(list.size());
  for (auto item: list) {
    result.add(kj::str(item));
  }
  return result.finish();
}

}  // namespace

bool isBinaryExtension(kj::StringPtr path) {
  static const char* const BINARY[] = {
    ".pdf", ".png", ".jpg", ".jpeg", ".gif", ".bmp", ".tiff", ".tif", ".eps", ".ps", ".svg",
    ".ico", ".webp", ".zip", ".tar", ".gz",
  };
  auto extension = lowercase(extensionOf(path));
  for (auto candidate: BINARY) {
    if (extension == candidate) return true;
  }
  return false;
}

kj::Array<kj::String> parseRecorderOutput(kj::StringPtr fls,
                                          kj::ArrayPtr<const kj::StringPtr> roots) {
  KJ_REQUIRE(roots.size() > 0);

  kj::String pwdStorage;
  kj::StringPtr pwd = roots[0];
  std::set<kj::String> seen;
  kj::Vector<kj::String> results;

  for (auto piece: split(fls, '\n')) {
    auto line = trim(piece);
    if (line.startsWith("PWD ")) {
      pwdStorage = trim(line.slice(4));
      pwd = pwdStorage;
      continue;
    }
    if (!line.startsWith("INPUT ")) continue;

    auto name = trim(line.slice(6));
    auto absolute = name.startsWith("/") ? kj::mv(name) : kj::str(pwd, '/', name);

    for (auto root: roots) {
      if (absolute.size() <= root.size() || !isInside(root, absolute)) continue;
      KJ_IF_MAYBE(relative, normalizeRelative(absolute.slice(root.size() + 1))) {
        if (relative->size() > 0 && !isAuxiliaryFile(*relative) &&
            seen.insert(kj::str(*relative)).second) {
          results.add(kj::mv(*relative));
        }
      }
      break;
    }
  }

  return results.releaseAsArray();
}

kj::Array<kj::String> parseBibData(kj::StringPtr aux) {
  kj::Vector<kj::String> results;
  static const char COMMAND[] = "\\bibdata{";

  kj::StringPtr rest = aux;
  for (;;) {
    const char* start = strstr(rest.cStr(), COMMAND);
    if (start == nullptr) break;
    rest = rest.slice(start - rest.begin() + strlen(COMMAND));
    KJ_IF_MAYBE(close, rest.findFirst('}')) {
      for (auto name: split(rest.slice(0, *close), ',')) {
        auto trimmed = trim(name);
        if (trimmed.size() > 0) results.add(kj::mv(trimmed));
      }
      rest = rest.slice(*close + 1);
    } else {
      break;
    }
  }

  return results.releaseAsArray();
}

kj::Array<kj::String> parseBcfDataSources(kj::StringPtr bcf) {
  kj::Vector<kj::String> results;
  static const char OPEN[] = "<bcf:datasource";

  kj::StringPtr rest = bcf;
  for (;;) {
    const char* start = strstr(rest.cStr(), OPEN);
    if (start == nullptr) break;
    rest = rest.slice(start - rest.begin() + strlen(OPEN));

    // Attributes run to the first '>'; the file name is the text up to the closing tag.
    KJ_IF_MAYBE(gt, rest.findFirst('>')) {
      rest = rest.slice(*gt + 1);
    } else {
      break;
    }
    KJ_IF_MAYBE(lt, rest.findFirst('<')) {
      auto name = trim(rest.slice(0, *lt));
      if (name.size() > 0) results.add(kj::mv(name));
      rest = rest.slice(*lt);
    } else {
      break;
    }
  }

  return results.releaseAsArray();
}

kj::Array<kj::String> collectDependencies(kj::StringPtr workspace, kj::StringPtr target) {
  auto stem = kj::str(workspace, '/', target.slice(0, target.size() - strlen(".tex")));
  kj::String targetDir;
  KJ_IF_MAYBE(slash, target.findLast('/')) {
    targetDir = kj::heapString(target.slice(0, *slash));
  }

  kj::Vector<kj::StringPtr> roots;
  roots.add(workspace);
  auto real = realPath(workspace);
  KJ_IF_MAYBE(r, real) {
    if (*r != workspace) roots.add(*r);
  }

  std::set<kj::String> seen;
  kj::Vector<kj::String> results;
  auto addIfPresent = [&](kj::String relative) {
    if (fileExistsInside(workspace, relative) && seen.insert(kj::str(relative)).second) {
      results.add(kj::mv(relative));
    }
  };

  KJ_IF_MAYBE(fls, openRegularFile(kj::str(stem, ".fls"))) {
    for (auto& candidate: parseRecorderOutput(readAll(*fls), roots)) {
      addIfPresent(kj::mv(candidate));
    }
  } else {
    KJ_LOG(WARNING, "recorder mode produced no .fls file", target);
  }

  // bibtex and biber read their databases themselves, so the .fls never mentions them. bibtex
  // names them in the .aux, biber in the .bcf; either way relative to the workspace root or to
  // the target's directory.
  auto addBibliography = [&](kj::StringPtr name) {
    auto file = name.endsWith(".bib") ? kj::str(name) : kj::str(name, ".bib");
    if (file.startsWith("/")) {
      for (auto root: roots) {
        if (file.size() > root.size() && isInside(root, file)) {
          KJ_IF_MAYBE(relative, normalizeRelative(file.slice(root.size() + 1))) {
            addIfPresent(kj::mv(*relative));
          }
          return;
        }
      }
      return;
    }

    KJ_IF_MAYBE(relative, normalizeRelative(file)) {
      if (fileExistsInside(workspace, *relative)) {
        addIfPresent(kj::mv(*relative));
        return;
      }
    }
    if (targetDir.size() > 0) {
      KJ_IF_MAYBE(relative, normalizeRelative(kj::str(targetDir, '/', file))) {
        addIfPresent(kj::mv(*relative));
      }
    }
  };

  KJ_IF_MAYBE(aux, openRegularFile(kj::str(stem, ".aux"))) {
    for (auto& name: parseBibData(readAll(*aux))) {
      addBibliography(name);
    }
  }
  KJ_IF_MAYBE(bcf, openRegularFile(kj::str(stem, ".bcf"))) {
    for (auto& name: parseBcfDataSources(readAll(*bcf))) {
      addBibliography(name);
    }
  }

  return results.releaseAsArray();
}

Result<CompileOutput> collectCompileOutput(kj::StringPtr workspace, kj::StringPtr target,
                                           bool recorder, ProcessResult&& result,
                                           const Limits& limits, size_t maxLogBytes) {
  // latexmk's exit status is not a reliable signal: it fails on warnings it considers errors
  // while still producing a usable PDF. The PDF existing is what counts.

  auto stem = kj::str(workspace, '/', target.slice(0, target.size() - strlen(".tex")));

  auto buildLog = [&]() {
    kj::String log;
    KJ_IF_MAYBE(fd, openRegularFile(kj::str(stem, ".log"))) {
      log = readPrefix(*fd, maxLogBytes);
    } else {
      log = kj::str(result.stdout, result.stderr);
    }
    return scrubWorkspace(log, workspace);
  };

  if (result.timedOut) {
    return Failure { ErrorKind::TOOL_TIMEOUT, 400, kj::str("Compilation timed out"),
                     buildLog(), true, nullptr };
  }

  KJ_IF_MAYBE(fd, openRegularFile(kj::str(stem, ".pdf"))) {
    if (fileSize(*fd) > limits.maxArtifactBytes) {
      return Failure::tooLarge("Generated PDF too large");
    }
    if (!result.success) {
      KJ_LOG(INFO, "latexmk reported failure but produced a PDF", target);
    }

    CompileOutput output { readAllBytes(*fd), nullptr };
    if (recorder) {
      output.dependencies = collectDependencies(workspace, target);
    }
    return kj::mv(output);
  }

  return Failure { ErrorKind::TOOL_FAILURE, 400, kj::str("Compilation failed"),
                   buildLog(), false, nullptr };
}

Result<ArchiveOutput> collectArchive(kj::StringPtr workspace, kj::StringPtr path,
                                     ArchiveFilter filter, const Limits& limits) {
  kj::String root = kj::str(workspace);
  if (path.size() > 0) {
    KJ_IF_MAYBE(resolved, resolveInsideOnDisk(workspace, path)) {
      root = kj::mv(*resolved);
    } else {
      return Failure::validation("Invalid path");
    }
    if (!isDirectory(root)) {
      return Failure::notFound(kj::str("Path not found: ", path));
    }
  }

  ArchiveWalk walk(limits, workspace, kj::mv(filter));
  walk.walk(root, path, 0);
  return walk.finish();
}

RemoteRefs parseRemoteRefs(kj::StringPtr lsRemote, kj::StringPtr branch) {
  kj::Maybe<kj::String> headSha;
  kj::Maybe<kj::String> defaultSha;
  kj::Maybe<kj::String> branchSha;
  kj::String defaultBranch = kj::str("master");
  auto wanted = kj::str("refs/heads/", branch);

  for (auto piece: split(lsRemote, '\n')) {
    auto line = trim(piece);
    KJ_IF_MAYBE(tab, line.findFirst('\t')) {
      auto sha = kj::heapString(line.slice(0, *tab));
      kj::StringPtr ref = line.slice(*tab + 1);
      if (ref == "HEAD") {
        headSha = kj::mv(sha);
      } else if ((ref == "refs/heads/main" || ref == "refs/heads/master") &&
                 defaultSha == nullptr) {
        defaultBranch = kj::str(ref.slice(strlen("refs/heads/")));
        defaultSha = kj::str(sha);
        if (ref == wanted) branchSha = kj::mv(sha);
      } else if (branch.size() > 0 && ref == wanted) {
        branchSha = kj::mv(sha);
      }
    }
  }

  if (branch.size() > 0) {
    return RemoteRefs { kj::mv(branchSha), kj::mv(defaultBranch) };
  } else if (defaultSha != nullptr) {
    return RemoteRefs { kj::mv(defaultSha), kj::mv(defaultBranch) };
  } else {
    return RemoteRefs { kj::mv(headSha), kj::mv(defaultBranch) };
  }
}

kj::Array<kj::Maybe<kj::String>> hashablePaths(kj::StringPtr workspace,
                                               kj::ArrayPtr<const kj::String> requested) {
  return KJ_MAP(path, requested) -> kj::Maybe<kj::String> {
    KJ_IF_MAYBE(normalized, normalizeRelative(path)) {
      if (normalized->size() == 0 || *normalized == ".git" || normalized->startsWith(".git/")) {
        return nullptr;
      }
      if (fileExistsInside(workspace, *normalized)) {
        return kj::mv(*normalized);
      }
    }
    return nullptr;
  };
}

Result<kj::Array<RepoEntry>> listRepoDirectory(kj::StringPtr workspace, kj::StringPtr path) {
  kj::String dir = kj::str(workspace);
  if (path.size() > 0) {
    KJ_IF_MAYBE(resolved, resolveInsideOnDisk(workspace, path)) {
      dir = kj::mv(*resolved);
    } else {
      return Failure::validation("Invalid path");
    }
    if (!isDirectory(dir)) {
      return Failure::notFound(kj::str("Path not found: ", path));
    }
  }

  auto names = listDirectory(dir);
  std::sort(names.begin(), names.end());

  kj::Vector<RepoEntry> entries;
  for (auto& name: names) {
    if (name == ".git") continue;

    auto rel = path.size() == 0 ? kj::str(name) : kj::str(path, '/', name);
    auto full = kj::str(dir, '/', name);
    struct stat stats;
    KJ_SYSCALL(lstat(full.cStr(), &stats), full);
    if (S_ISLNK(stats.st_mode)) {
      if (resolveInsideOnDisk(workspace, rel) == nullptr) continue;
      if (stat(full.cStr(), &stats) < 0) continue;
    }
    if (!S_ISDIR(stats.st_mode) && !S_ISREG(stats.st_mode)) continue;

    bool isDir = S_ISDIR(stats.st_mode);
    entries.add(RepoEntry { kj::mv(name), kj::mv(rel), isDir });
  }
  return entries.releaseAsArray();
}

Result<RepoFile> readRepoFile(kj::StringPtr workspace, kj::StringPtr filePath,
                              const Limits& limits) {
  if (filePath == ".git" || filePath.startsWith(".git/")) {
    return Failure::notFound(kj::str("File not found: ", filePath));
  }

  KJ_IF_MAYBE(resolved, resolveInsideOnDisk(workspace, filePath)) {
    KJ_IF_MAYBE(fd, openRegularFile(*resolved, true)) {
      if (fileSize(*fd) > limits.maxResourceBytes) {
        return Failure::tooLarge("File too large");
      }
      auto content = readAllBytes(*fd);
      bool binary = isBinaryExtension(filePath);
      return RepoFile {
        kj::str(filePath),
        binary ? kj::encodeBase64(content) : bytesToText(content),
        binary
      };
    }
    return Failure::notFound(kj::str("File not found: ", filePath));
  }
  return Failure::validation("Invalid file path");
}

// =======================================================================================

kj::Promise<Result<CompileOutput>> Orchestrator::compile(CompileRequest::Reader request) {
  kj::StringPtr target = request.getTarget();
  KJ_IF_MAYBE(failure, validateTarget(target)) {
    return fail<CompileOutput>(kj::mv(*failure));
  }

  Compiler compiler = Compiler::PDFLATEX;
  KJ_IF_MAYBE(c, parseCompiler(request.getCompiler())) {
    compiler = *c;
  } else {
    return fail<CompileOutput>(
        Failure::validation("Invalid compiler. Use: pdflatex, xelatex, lualatex"));
  }

  if (!request.hasResources()) {
    return fail<CompileOutput>(Failure::validation("Missing resources"));
  }
  auto decoded = decodeResources(request.getResources(), settings.limits);
  if (decoded.is<Failure>()) {
    return fail<CompileOutput>(kj::mv(decoded.get<Failure>()));
  }
  auto resources = kj::mv(decoded.get<kj::Array<DecodedResource>>());
  auto normalized = normalizeRelative(target);
  auto targetPath = kj::mv(KJ_ASSERT_NONNULL(normalized));
  bool recorder = request.getRecorder();

  return workspaces.withWorkspace("compile",
      [this, KJ_MVCAP(resources), KJ_MVCAP(targetPath), compiler, recorder]
      (kj::StringPtr workspace) mutable -> kj::Promise<Result<CompileOutput>> {
    KJ_IF_MAYBE(failure, writeResources(workspace, resources)) {
      return fail<CompileOutput>(kj::mv(*failure));
    }
    if (!fileExistsInside(workspace, targetPath)) {
      return fail<CompileOutput>(
          Failure::notFound(kj::str("Target file not found: ", targetPath)));
    }

    return tools.compile(workspace, targetPath, compiler, recorder)
        .then([this, workspace, KJ_MVCAP(targetPath), recorder](ProcessResult&& result) {
      return collectCompileOutput(workspace, targetPath, recorder, kj::mv(result),
                                  settings.limits, tools.getSettings().maxOutput);
    });
  });
}

kj::Promise<Result<CompileOutput>> Orchestrator::compileFromGit(
    CompileFromGitRequest::Reader request) {
  KJ_IF_MAYBE(failure, validateClone(request.getGitUrl(), request.getBranch())) {
    return fail<CompileOutput>(kj::mv(*failure));
  }
  KJ_IF_MAYBE(failure, validateTarget(request.getTarget())) {
    return fail<CompileOutput>(kj::mv(*failure));
  }

  Compiler compiler = Compiler::PDFLATEX;
  KJ_IF_MAYBE(c, parseCompiler(request.getCompiler())) {
    compiler = *c;
  } else {
    return fail<CompileOutput>(
        Failure::validation("Invalid compiler. Use: pdflatex, xelatex, lualatex"));
  }

  auto normalized = normalizeRelative(request.getTarget());
  auto targetPath = kj::mv(KJ_ASSERT_NONNULL(normalized));
  auto clone = makeCloneRequest(request.getGitUrl(), request.getBranch(),
      request.hasAuth() ? kj::Maybe<GitAuth::Reader>(request.getAuth()) : nullptr);

  return workspaces.withWorkspace("git-compile",
      [this, KJ_MVCAP(clone), KJ_MVCAP(targetPath), compiler]
      (kj::StringPtr workspace) mutable -> kj::Promise<Result<CompileOutput>> {
    return tools.clone(clone, workspace)
        .then([this, workspace, KJ_MVCAP(targetPath), compiler](ProcessResult&& result) mutable
              -> kj::Promise<Result<CompileOutput>> {
      KJ_IF_MAYBE(failure, checkClone(workspace, kj::mv(result))) {
        return fail<CompileOutput>(kj::mv(*failure));
      }
      if (!fileExistsInside(workspace, targetPath)) {
        return fail<CompileOutput>(
            Failure::notFound(kj::str("Target file not found: ", targetPath)));
      }

      return tools.compile(workspace, targetPath, compiler, true, settings.gitCompileTimeout)
          .then([this, workspace, KJ_MVCAP(targetPath)](ProcessResult&& result) {
        return collectCompileOutput(workspace, targetPath, true, kj::mv(result),
                                    settings.limits, tools.getSettings().maxOutput);
      });
    });
  });
}

kj::Promise<Result<ImageOutput>> Orchestrator::thumbnail(ThumbnailRequest::Reader request) {
  if (!request.hasPdfBase64() || request.getPdfBase64().size() == 0) {
    return fail<ImageOutput>(Failure::validation("Missing pdfBase64"));
  }

  auto validated = validateThumbnailOptions(
      request.getWidth(), request.getFormat(), settings.limits);
  if (validated.is<Failure>()) {
    return fail<ImageOutput>(kj::mv(validated.get<Failure>()));
  }
  auto options = validated.get<ThumbnailOptions>();

  kj::Array<byte> pdf = kj::decodeBase64(request.getPdfBase64());
  if (pdf.size() == 0) {
    return fail<ImageOutput>(Failure::validation("Invalid pdfBase64"));
  }
  if (pdf.size() > settings.limits.maxTotalBytes) {
    return fail<ImageOutput>(Failure::tooLarge("PDF too large"));
  }

  return workspaces.withWorkspace("thumbnail",
      [this, KJ_MVCAP(pdf), options](kj::StringPtr workspace) mutable {
    writeFile(kj::str(workspace, "/input.pdf"), pdf);

    return tools.rasterize(workspace, "input.pdf", options)
        .then([this, workspace, options](ProcessResult&& result) -> Result<ImageOutput> {
      if (result.timedOut) {
        return Failure { ErrorKind::TOOL_TIMEOUT, 400, kj::str("Thumbnail generation timed out"),
                         scrubWorkspace(result.stderr, workspace), true, nullptr };
      }
      if (!result.success) {
        auto detail = trim(scrubWorkspace(result.stderr, workspace));
        return Failure { ErrorKind::TOOL_FAILURE, 400,
                         kj::str("Thumbnail generation failed: ", detail),
                         nullptr, false, nullptr };
      }

      KJ_IF_MAYBE(fd, openRegularFile(
          kj::str(workspace, "/thumb.", imageExtension(options.format)))) {
        if (fileSize(*fd) > settings.limits.maxArtifactBytes) {
          return Failure::tooLarge("Generated image too large");
        }
        return ImageOutput { readAllBytes(*fd), imageContentType(options.format) };
      }
      return Failure { ErrorKind::TOOL_FAILURE, 400,
                       kj::str("Thumbnail generation produced no image"),
                       nullptr, false, nullptr };
    });
  });
}

kj::Maybe<Failure> Orchestrator::checkClone(kj::StringPtr workspace, ProcessResult&& result) {
  if (result.success) {
    return nullptr;
  }

  auto log = trim(scrubWorkspace(result.stderr, workspace));
  if (result.timedOut) {
    return Failure { ErrorKind::TOOL_TIMEOUT, 400, kj::str("Clone timed out"),
                     kj::mv(log), true, nullptr };
  }
  KJ_LOG(INFO, "git clone failed", log);
  return Failure { ErrorKind::CLONE_FAILURE, 400, kj::str("Failed to clone repository"),
                   kj::mv(log), false, nullptr };
}

kj::Promise<Result<ArchiveOutput>> Orchestrator::archive(ArchiveRequest::Reader request) {
  KJ_IF_MAYBE(failure, validateClone(request.getGitUrl(), request.getBranch())) {
    return fail<ArchiveOutput>(kj::mv(*failure));
  }

  kj::String path;
  KJ_IF_MAYBE(p, normalizeListingPath(request.getPath())) {
    path = kj::mv(*p);
  } else {
    return fail<ArchiveOutput>(Failure::validation("Invalid path"));
  }

  ArchiveFilter filter { copyStrings(request.getExtensions()), copyStrings(request.getPaths()) };
  auto clone = makeCloneRequest(request.getGitUrl(), request.getBranch(),
      request.hasAuth() ? kj::Maybe<GitAuth::Reader>(request.getAuth()) : nullptr);

  return workspaces.withWorkspace("archive",
      [this, KJ_MVCAP(clone), KJ_MVCAP(path), KJ_MVCAP(filter)]
      (kj::StringPtr workspace) mutable {
    return tools.clone(clone, workspace, settings.archiveCloneTimeout)
        .then([this, workspace, KJ_MVCAP(path), KJ_MVCAP(filter)]
              (ProcessResult&& result) mutable -> Result<ArchiveOutput> {
      KJ_IF_MAYBE(failure, checkClone(workspace, kj::mv(result))) {
        return kj::mv(*failure);
      }
      return collectArchive(workspace, path, kj::mv(filter), settings.limits);
    });
  });
}

kj::Promise<Result<kj::Array<RepoEntry>>> Orchestrator::tree(TreeRequest::Reader request) {
  typedef kj::Array<RepoEntry> Listing;

  KJ_IF_MAYBE(failure, validateClone(request.getGitUrl(), request.getBranch())) {
    return fail<Listing>(kj::mv(*failure));
  }

  kj::String path;
  KJ_IF_MAYBE(p, normalizeListingPath(request.getPath())) {
    path = kj::mv(*p);
  } else {
    return fail<Listing>(Failure::validation("Invalid path"));
  }

  auto clone = makeCloneRequest(request.getGitUrl(), request.getBranch(),
      request.hasAuth() ? kj::Maybe<GitAuth::Reader>(request.getAuth()) : nullptr);

  return workspaces.withWorkspace("tree",
      [this, KJ_MVCAP(clone), KJ_MVCAP(path)](kj::StringPtr workspace) mutable {
    return tools.clone(clone, workspace)
        .then([this, workspace, KJ_MVCAP(path)](ProcessResult&& result) -> Result<Listing> {
      KJ_IF_MAYBE(failure, checkClone(workspace, kj::mv(result))) {
        return kj::mv(*failure);
      }

      return listRepoDirectory(workspace, path);
    });
  });
}

kj::Promise<Result<RepoFile>> Orchestrator::file(FileRequest::Reader request) {
  KJ_IF_MAYBE(failure, validateClone(request.getGitUrl(), request.getBranch())) {
    return fail<RepoFile>(kj::mv(*failure));
  }
  KJ_IF_MAYBE(failure, validateFilePath(request.getFilePath())) {
    return fail<RepoFile>(kj::mv(*failure));
  }

  auto normalized = normalizeRelative(request.getFilePath());
  auto filePath = kj::mv(KJ_ASSERT_NONNULL(normalized));
  auto clone = makeCloneRequest(request.getGitUrl(), request.getBranch(),
      request.hasAuth() ? kj::Maybe<GitAuth::Reader>(request.getAuth()) : nullptr);

  return workspaces.withWorkspace("file",
      [this, KJ_MVCAP(clone), KJ_MVCAP(filePath)](kj::StringPtr workspace) mutable {
    return tools.clone(clone, workspace)
        .then([this, workspace, KJ_MVCAP(filePath)](ProcessResult&& result)
              mutable -> Result<RepoFile> {
      KJ_IF_MAYBE(failure, checkClone(workspace, kj::mv(result))) {
        return kj::mv(*failure);
      }

      return readRepoFile(workspace, filePath, settings.limits);
    });
  });
}

kj::Promise<Result<CommitInfo>> Orchestrator::refs(RefsRequest::Reader request) {
  KJ_IF_MAYBE(failure, validateClone(request.getGitUrl(), request.getBranch())) {
    return fail<CommitInfo>(kj::mv(*failure));
  }

  auto branch = kj::str(request.getBranch());
  auto knownSha = kj::str(request.getKnownSha());
  auto clone = makeCloneRequest(request.getGitUrl(), nullptr,
      request.hasAuth() ? kj::Maybe<GitAuth::Reader>(request.getAuth()) : nullptr);

  auto listing = tools.listRemote(clone);
  return listing.then([this, KJ_MVCAP(clone), KJ_MVCAP(branch), KJ_MVCAP(knownSha)]
                      (ProcessResult&& result) mutable -> kj::Promise<Result<CommitInfo>> {
    if (!result.success) {
      auto log = trim(result.stderr);
      if (result.timedOut) {
        return fail<CommitInfo>(Failure { ErrorKind::TOOL_TIMEOUT, 400,
            kj::str("Listing refs timed out"), kj::mv(log), true, nullptr });
      }
      KJ_LOG(INFO, "git ls-remote failed", log);
      return fail<CommitInfo>(Failure { ErrorKind::CLONE_FAILURE, 400,
          kj::str("Failed to access repository"), kj::mv(log), false, nullptr });
    }

    auto remote = parseRemoteRefs(result.stdout, branch);
    kj::String sha;
    KJ_IF_MAYBE(s, remote.sha) {
      sha = kj::mv(*s);
    } else if (branch.size() > 0) {
      return fail<CommitInfo>(Failure::notFound(kj::str("Branch not found: ", branch)));
    } else {
      return fail<CommitInfo>(Failure::notFound("Repository has no commits"));
    }

    if (knownSha.size() > 0 && knownSha == sha) {
      return Result<CommitInfo>(CommitInfo { kj::mv(sha), kj::mv(remote.defaultBranch), true,
                                             nullptr, nullptr, nullptr, nullptr });
    }

    auto fetchBranch = branch.size() > 0 ? kj::mv(branch) : kj::str(remote.defaultBranch);
    return workspaces.withWorkspace("refs",
        [this, KJ_MVCAP(clone), KJ_MVCAP(fetchBranch), KJ_MVCAP(sha),
         defaultBranch = kj::mv(remote.defaultBranch)]
        (kj::StringPtr workspace) mutable {
      return tools.fetchCommit(clone, workspace, fetchBranch, sha)
          .then([KJ_MVCAP(sha), KJ_MVCAP(defaultBranch)](ProcessResult&& result) mutable {
        return Result<CommitInfo>(describeCommit(kj::mv(sha), kj::mv(defaultBranch),
                                                 kj::mv(result)));
      });
    });
  });
}

kj::Promise<Result<FileHashOutput>> Orchestrator::fileHash(FileHashRequest::Reader request) {
  KJ_IF_MAYBE(failure, validateClone(request.getGitUrl(), request.getBranch())) {
    return fail<FileHashOutput>(kj::mv(*failure));
  }

  bool batch = request.hasFilePaths() && request.getFilePaths().size() > 0;
  kj::Array<kj::String> paths;
  if (batch) {
    if (request.getFilePaths().size() > settings.maxHashPaths) {
      return fail<FileHashOutput>(Failure::validation(
          kj::str("Too many filePaths. Maximum is ", settings.maxHashPaths)));
    }
    paths = copyStrings(request.getFilePaths());
  } else if (request.getFilePath().size() > 0) {
    auto builder = kj::heapArrayBuilder<kj::String>(1);
    builder.add(kj::str(request.getFilePath()));
    paths = builder.finish();
  } else {
    return fail<FileHashOutput>(Failure::validation("Missing filePath or filePaths"));
  }

  auto clone = makeCloneRequest(request.getGitUrl(), request.getBranch(),
      request.hasAuth() ? kj::Maybe<GitAuth::Reader>(request.getAuth()) : nullptr);

  return workspaces.withWorkspace("file-hash",
      [this, KJ_MVCAP(clone), KJ_MVCAP(paths), batch](kj::StringPtr workspace) mutable {
    return tools.clone(clone, workspace)
        .then([this, workspace, KJ_MVCAP(paths), batch](ProcessResult&& result) mutable
              -> kj::Promise<Result<FileHashOutput>> {
      KJ_IF_MAYBE(failure, checkClone(workspace, kj::mv(result))) {
        return fail<FileHashOutput>(kj::mv(*failure));
      }

      auto candidates = hashablePaths(workspace, paths);
      kj::Vector<kj::String> present;
      for (auto& candidate: candidates) {
        KJ_IF_MAYBE(c, candidate) {
          present.add(kj::str(*c));
        }
      }

      auto finish = [KJ_MVCAP(paths), KJ_MVCAP(candidates), batch]
                    (kj::ArrayPtr<kj::String> hashes) mutable -> Result<FileHashOutput> {
        auto results = kj::heapArrayBuilder<FileHash>(paths.size());
        size_t next = 0;
        for (auto i: kj::indices(paths)) {
          kj::Maybe<kj::String> hash;
          if (candidates[i] != nullptr) {
            hash = kj::mv(hashes[next++]);
          }
          results.add(FileHash { kj::mv(paths[i]), kj::mv(hash) });
        }

        if (!batch && results[0].hash == nullptr) {
          return Failure::notFound(kj::str("File not found or invalid: ", results[0].path));
        }
        return FileHashOutput { results.finish(), batch };
      };

      if (present.size() == 0) {
        return finish(nullptr);
      }

      return tools.hashObjects(workspace, present)
          .then([workspace, count = present.size(), KJ_MVCAP(finish)]
                (ProcessResult&& result) mutable -> Result<FileHashOutput> {
        kj::Vector<kj::String> hashes;
        for (auto line: split(result.stdout, '\n')) {
          auto hash = trim(line);
          if (hash.size() > 0) hashes.add(kj::mv(hash));
        }
        if (!result.success || hashes.size() != count) {
          auto log = trim(scrubWorkspace(result.stderr, workspace));
          return Failure { result.timedOut ? ErrorKind::TOOL_TIMEOUT : ErrorKind::TOOL_FAILURE,
                           400, kj::str("Failed to hash files"), kj::mv(log),
                           result.timedOut, nullptr };
        }
        return finish(hashes);
      });
    });
  });
}

}  // namespace texbox
