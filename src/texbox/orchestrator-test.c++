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
#include <kj/test.h>
#include <kj/debug.h>
#include <kj/encoding.h>
#include <capnp/message.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>

namespace texbox {
namespace {

bool hasSubstring(kj::StringPtr haystack, kj::StringPtr needle) {
  return strstr(haystack.cStr(), needle.cStr()) != nullptr;
}

class OrchestratorFixture {
public:
  OrchestratorFixture()
      : io(kj::setupAsyncIo()),
        subprocesses(io.unixEventPort),
        runner(*io.lowLevelProvider, io.provider->getTimer(), subprocesses),
        tools(runner, toolSettings()),
        baseDir(makeBaseDir()),
        workspaces(baseDir),
        orchestrator(workspaces, tools, OrchestratorSettings()) {}

  ~OrchestratorFixture() noexcept(false) {
    recursivelyDelete(baseDir);
  }

  template <typename T>
  T wait(kj::Promise<T>&& promise) {
    return promise.wait(io.waitScope);
  }

  bool clean() {
    // No workspace is registered and nothing is left on disk.
    return workspaces.pendingCount() == 0 && listDirectory(baseDir).size() == 0;
  }

  kj::AsyncIoContext io;
  SubprocessSet subprocesses;
  ProcessRunner runner;
  ToolInvoker tools;
  kj::String baseDir;
  WorkspaceManager workspaces;
  Orchestrator orchestrator;

private:
  static ToolSettings toolSettings() {
    ToolSettings settings;
    settings.cloneTimeout = 30 * kj::SECONDS;
    return settings;
  }

  static kj::String makeBaseDir() {
    char dirTemplate[] = "/tmp/texbox-orchestrator-test.XXXXXX";
    KJ_ASSERT(mkdtemp(dirTemplate) != nullptr);
    return kj::heapString(dirTemplate);
  }
};

class TempDir {
  // A directory laid out the way a clone or a finished build would leave a workspace.

public:
  TempDir(): path(make()) {}
  ~TempDir() noexcept(false) {
    recursivelyDelete(path);
  }

  void write(kj::StringPtr relative, kj::ArrayPtr<const byte> content) {
    auto full = kj::str(path, '/', relative);
    recursivelyCreateParent(full);
    writeFile(full, content);
  }
  void write(kj::StringPtr relative, kj::StringPtr content) {
    write(relative, content.asBytes());
  }
  void link(kj::StringPtr relative, kj::StringPtr target) {
    auto full = kj::str(path, '/', relative);
    recursivelyCreateParent(full);
    KJ_SYSCALL(symlink(target.cStr(), full.cStr()), full);
  }

  kj::String path;

private:
  static kj::String make() {
    char dirTemplate[] = "/tmp/texbox-workspace-test.XXXXXX";
    KJ_ASSERT(mkdtemp(dirTemplate) != nullptr);
    return kj::heapString(dirTemplate);
  }
};

kj::String pathsOf(kj::ArrayPtr<const RepoFile> files) {
  return kj::strArray(KJ_MAP(file, files) { return kj::str(file.path); }, ",");
}

template <typename T>
const Failure& failureOf(const Result<T>& result) {
  KJ_ASSERT(result.template is<Failure>(), "expected a failure");
  return result.template get<Failure>();
}

KJ_TEST("parseRecorderOutput") {
  const kj::StringPtr roots[] = { "/tmp/ws", "/private/tmp/ws" };
  auto fls =
      "PWD /tmp/ws/chapters\n"
      "INPUT /usr/share/texmf/tex/latex/base/article.cls\n"
      "INPUT main.tex\n"
      "INPUT ./main.tex\n"
      "INPUT /tmp/ws/figs/plot.pdf\n"
      "INPUT /private/tmp/ws/refs.bib\n"
      "INPUT /tmp/ws/chapters/main.aux\n"
      "OUTPUT /tmp/ws/chapters/main.pdf\n"
      "INPUT /tmp/ws/../etc/passwd\n"
      "INPUT /tmp/wsx/other.tex\n"
      "INPUT /tmp/ws/figs/plot.pdf\n"
      "INPUT /tmp/ws/with space.tex\n";

  auto deps = parseRecorderOutput(fls, roots);
  KJ_ASSERT(deps.size() == 4, kj::strArray(deps, ", "));
  KJ_EXPECT(deps[0] == "chapters/main.tex");
  KJ_EXPECT(deps[1] == "figs/plot.pdf");
  KJ_EXPECT(deps[2] == "refs.bib");
  KJ_EXPECT(deps[3] == "with space.tex");

  // Relative names before any PWD line are taken relative to the first root.
  const kj::StringPtr oneRoot[] = { "/tmp/ws" };
  auto early = parseRecorderOutput("INPUT sub/a.tex\n", oneRoot);
  KJ_ASSERT(early.size() == 1);
  KJ_EXPECT(early[0] == "sub/a.tex");

  KJ_EXPECT(parseRecorderOutput("", oneRoot).size() == 0);
}

KJ_TEST("isBinaryExtension") {
  KJ_EXPECT(isBinaryExtension("figs/plot.pdf"));
  KJ_EXPECT(isBinaryExtension("LOGO.PNG"));
  KJ_EXPECT(isBinaryExtension("a/b/photo.jpeg"));
  KJ_EXPECT(isBinaryExtension("dist.tar.gz"));
  KJ_EXPECT(!isBinaryExtension("main.tex"));
  KJ_EXPECT(!isBinaryExtension("refs.bib"));
  KJ_EXPECT(!isBinaryExtension("Makefile"));
  KJ_EXPECT(!isBinaryExtension("png"));
}

KJ_TEST("Orchestrator: bad compile requests never create a workspace") {
  OrchestratorFixture f;
  capnp::MallocMessageBuilder message;
  auto request = message.initRoot<CompileRequest>();

  auto messageFor = [&]() -> kj::String {
    auto result = f.wait(f.orchestrator.compile(request.asReader()));
    auto& failure = failureOf(result);
    KJ_EXPECT(failure.kind == ErrorKind::VALIDATION);
    KJ_EXPECT(failure.status == 400);
    return kj::str(failure.message);
  };

  KJ_EXPECT(messageFor() == "Missing target file");

  request.setTarget("../outside.tex");
  KJ_EXPECT(messageFor() == "Invalid target path");

  request.setTarget("main.tex");
  request.setCompiler("tex");
  KJ_EXPECT(messageFor() == "Invalid compiler. Use: pdflatex, xelatex, lualatex");

  request.setCompiler("xelatex");
  KJ_EXPECT(messageFor() == "Missing resources");

  auto resources = request.initResources(2);
  resources[0].setPath("main.tex");
  resources[0].initContent().setText("x");
  resources[1].setPath("/etc/passwd");
  resources[1].initContent().setText("x");
  KJ_EXPECT(messageFor() == "Invalid resource path: /etc/passwd");

  KJ_EXPECT(f.clean());
}

KJ_TEST("Orchestrator: missing target file") {
  OrchestratorFixture f;
  capnp::MallocMessageBuilder message;
  auto request = message.initRoot<CompileRequest>();
  request.setTarget("other.tex");
  auto resources = request.initResources(1);
  resources[0].setPath("main.tex");
  resources[0].initContent().setText("\\documentclass{article}\\begin{document}x\\end{document}");

  auto result = f.wait(f.orchestrator.compile(request.asReader()));
  auto& failure = failureOf(result);
  KJ_EXPECT(failure.status == 404);
  KJ_EXPECT(failure.message == "Target file not found: other.tex", failure.message);
  KJ_EXPECT(f.clean());
}

KJ_TEST("Orchestrator: compile releases its workspace") {
  OrchestratorFixture f;
  capnp::MallocMessageBuilder message;
  auto request = message.initRoot<CompileRequest>();
  request.setTarget("main.tex");
  request.setCompiler("pdflatex");
  auto resources = request.initResources(1);
  resources[0].setPath("main.tex");
  resources[0].initContent().setText(kj::encodeBase64(kj::StringPtr(
      "\\documentclass{article}\n"
      "\\begin{document}\n"
      "Hello.\n"
      "\\end{document}\n").asBytes()));
  resources[0].setEncoding("base64");

  // Works whether or not a TeX installation is present on the test machine.
  auto result = f.wait(f.orchestrator.compile(request.asReader()));
  if (result.is<CompileOutput>()) {
    auto& output = result.get<CompileOutput>();
    KJ_EXPECT(output.pdf.size() > 4);
    KJ_EXPECT(kj::heapString(output.pdf.asPtr().slice(0, 4).asChars()) == "%PDF");
    KJ_EXPECT(output.dependencies == nullptr);
  } else {
    auto& failure = result.get<Failure>();
    KJ_EXPECT(failure.kind == ErrorKind::TOOL_FAILURE);
    KJ_EXPECT(failure.message == "Compilation failed");
    auto& log = KJ_ASSERT_NONNULL(failure.log);
    KJ_EXPECT(log.size() > 0);
    KJ_EXPECT(!hasSubstring(log, f.baseDir), log);
  }
  KJ_EXPECT(f.clean());
}

KJ_TEST("Orchestrator: thumbnail validation") {
  OrchestratorFixture f;
  capnp::MallocMessageBuilder message;
  auto request = message.initRoot<ThumbnailRequest>();

  auto messageFor = [&]() -> kj::String {
    auto result = f.wait(f.orchestrator.thumbnail(request.asReader()));
    return kj::str(failureOf(result).message);
  };

  KJ_EXPECT(messageFor() == "Missing pdfBase64");

  request.setPdfBase64("JVBERi0xLjQK");
  request.setFormat("gif");
  KJ_EXPECT(messageFor() == "Invalid format. Use: png, jpeg");

  request.setFormat("png");
  request.setWidth(0);
  KJ_EXPECT(messageFor() == "Width must be between 1 and 4000");

  request.setWidth(10.5);
  KJ_EXPECT(messageFor() == "Width must be an integer");

  request.setWidth(200);
  request.setPdfBase64("!!!");
  KJ_EXPECT(messageFor() == "Invalid pdfBase64");

  KJ_EXPECT(f.clean());
}

KJ_TEST("Orchestrator: thumbnail of something that isn't a PDF") {
  OrchestratorFixture f;
  capnp::MallocMessageBuilder message;
  auto request = message.initRoot<ThumbnailRequest>();
  request.setPdfBase64(kj::encodeBase64(kj::StringPtr("this is not a pdf").asBytes()));

  auto result = f.wait(f.orchestrator.thumbnail(request.asReader()));
  auto& failure = failureOf(result);
  KJ_EXPECT(failure.kind == ErrorKind::TOOL_FAILURE);
  KJ_EXPECT(failure.message.startsWith("Thumbnail generation failed"), failure.message);
  KJ_EXPECT(!hasSubstring(failure.message, f.baseDir), failure.message);
  KJ_EXPECT(f.clean());
}

KJ_TEST("Orchestrator: bad git requests never create a workspace") {
  OrchestratorFixture f;
  capnp::MallocMessageBuilder message;

  {
    auto request = message.initRoot<TreeRequest>();
    auto messageFor = [&]() -> kj::String {
      auto result = f.wait(f.orchestrator.tree(request.asReader()));
      return kj::str(failureOf(result).message);
    };

    KJ_EXPECT(messageFor() == "Missing gitUrl");
    request.setGitUrl("file:///etc");
    KJ_EXPECT(messageFor() == "gitUrl must use http or https");
    request.setGitUrl("https://example.com/repo.git");
    request.setBranch("--upload-pack=evil");
    KJ_EXPECT(messageFor() == "Invalid branch");
    request.setBranch("main");
    request.setPath("../..");
    KJ_EXPECT(messageFor() == "Invalid path");
  }

  {
    auto request = message.initRoot<FileRequest>();
    request.setGitUrl("https://example.com/repo.git");
    request.setFilePath("../secret");
    auto result = f.wait(f.orchestrator.file(request.asReader()));
    KJ_EXPECT(failureOf(result).kind == ErrorKind::VALIDATION);
  }

  {
    auto request = message.initRoot<ArchiveRequest>();
    request.setGitUrl("ssh://git@example.com/repo.git");
    auto result = f.wait(f.orchestrator.archive(request.asReader()));
    KJ_EXPECT(failureOf(result).kind == ErrorKind::VALIDATION);
  }

  {
    auto request = message.initRoot<CompileFromGitRequest>();
    request.setGitUrl("https://example.com/repo.git");
    request.setTarget("/abs/main.tex");
    auto result = f.wait(f.orchestrator.compileFromGit(request.asReader()));
    KJ_EXPECT(failureOf(result).kind == ErrorKind::VALIDATION);
  }

  KJ_EXPECT(f.clean());
}

KJ_TEST("Orchestrator: clone failure") {
  OrchestratorFixture f;
  capnp::MallocMessageBuilder message;
  auto request = message.initRoot<FileRequest>();
  // Nothing listens on port 1.
  request.setGitUrl("https://127.0.0.1:1/owner/repo.git");
  request.setFilePath("main.tex");
  auto auth = request.initAuth();
  auth.setUsername("alice");
  auth.setPassword("hunter22");

  auto result = f.wait(f.orchestrator.file(request.asReader()));
  auto& failure = failureOf(result);
  KJ_EXPECT(failure.kind == ErrorKind::CLONE_FAILURE);
  KJ_EXPECT(failure.message == "Failed to clone repository");
  KJ_IF_MAYBE(log, failure.log) {
    KJ_EXPECT(!hasSubstring(*log, "hunter22"), *log);
    KJ_EXPECT(!hasSubstring(*log, f.baseDir), *log);
  }
  KJ_EXPECT(f.clean());
}

KJ_TEST("parseBibData") {
  auto aux =
      "\\relax \n"
      "\\citation{knuth84}\n"
      "\\bibstyle{plain}\n"
      "\\bibdata{refs, more/extra ,}\n"
      "\\@writefile{toc}{\\contentsline {section}{\\numberline {1}Intro}{1}}\n"
      "\\bibdata{second}\n"
      "\\bibcite{knuth84}{1}\n";

  auto names = parseBibData(aux);
  KJ_ASSERT(names.size() == 3, kj::strArray(names, ", "));
  KJ_EXPECT(names[0] == "refs");
  KJ_EXPECT(names[1] == "more/extra");
  KJ_EXPECT(names[2] == "second");

  KJ_EXPECT(parseBibData("\\relax\n\\citation{x}\n").size() == 0);
  KJ_EXPECT(parseBibData("\\bibdata{unterminated").size() == 0);
}

KJ_TEST("parseBcfDataSources") {
  auto bcf =
      "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
      "<bcf:controlfile version=\"3.10\" xmlns:bcf=\"https://sourceforge.net/projects/biblatex\">\n"
      "  <bcf:options component=\"biber\" type=\"global\">\n"
      "    <bcf:option type=\"singlevalued\"><bcf:key>output_encoding</bcf:key></bcf:option>\n"
      "  </bcf:options>\n"
      "  <bcf:bibdata section=\"0\">\n"
      "    <bcf:datasource type=\"file\" datatype=\"bibtex\" glob=\"false\">"
      "refs.bib</bcf:datasource>\n"
      "    <bcf:datasource type=\"file\" datatype=\"bibtex\"> shared/lib.bib </bcf:datasource>\n"
      "  </bcf:bibdata>\n"
      "</bcf:controlfile>\n";

  auto names = parseBcfDataSources(bcf);
  KJ_ASSERT(names.size() == 2, kj::strArray(names, ", "));
  KJ_EXPECT(names[0] == "refs.bib");
  KJ_EXPECT(names[1] == "shared/lib.bib");

  KJ_EXPECT(parseBcfDataSources("<bcf:controlfile></bcf:controlfile>").size() == 0);
  KJ_EXPECT(parseBcfDataSources("<bcf:datasource type=\"file\"").size() == 0);
}

KJ_TEST("collectDependencies reads the recorder output and the bibliographies") {
  TempDir ws;
  ws.write("paper/main.tex", "\\input{intro}\\bibliography{refs,local,missing}");
  ws.write("paper/intro.tex", "Intro.");
  ws.write("paper/local.bib", "@book{b, title={B}}");
  ws.write("paper/abs.bib", "@book{c, title={C}}");
  ws.write("refs.bib", "@book{a, title={A}}");
  ws.write("unused.tex", "Never read.");

  ws.write("paper/main.fls", kj::str(
      "PWD ", ws.path, "/paper\n"
      "INPUT /usr/share/texmf-dist/tex/latex/base/article.cls\n"
      "INPUT ", ws.path, "/paper/main.tex\n"
      "INPUT intro.tex\n"
      "INPUT ", ws.path, "/paper/main.aux\n"
      "INPUT ", ws.path, "/paper/gone.tex\n"
      "OUTPUT ", ws.path, "/paper/main.pdf\n"));
  ws.write("paper/main.aux",
      "\\relax \n"
      "\\citation{a}\n"
      "\\bibstyle{plain}\n"
      "\\bibdata{refs,local,missing}\n");
  ws.write("paper/main.bcf", kj::str(
      "<bcf:bibdata section=\"0\">\n"
      "  <bcf:datasource type=\"file\" datatype=\"bibtex\">refs.bib</bcf:datasource>\n"
      "  <bcf:datasource type=\"file\" datatype=\"bibtex\">", ws.path, "/paper/abs.bib"
      "</bcf:datasource>\n"
      "  <bcf:datasource type=\"file\" datatype=\"bibtex\">/etc/passwd</bcf:datasource>\n"
      "</bcf:bibdata>\n"));

  auto deps = collectDependencies(ws.path, "paper/main.tex");
  KJ_EXPECT(kj::strArray(deps, ",") ==
      "paper/main.tex,paper/intro.tex,refs.bib,paper/local.bib,paper/abs.bib",
      kj::strArray(deps, ","));
}

KJ_TEST("collectDependencies without a recorder file") {
  TempDir ws;
  ws.write("main.tex", "x");
  ws.write("refs.bib", "@book{a, title={A}}");
  ws.write("main.aux", "\\bibdata{refs}\n");

  KJ_EXPECT_LOG(WARNING, "recorder mode produced no .fls file");
  auto deps = collectDependencies(ws.path, "main.tex");
  KJ_ASSERT(deps.size() == 1);
  KJ_EXPECT(deps[0] == "refs.bib");
}

KJ_TEST("collectCompileOutput") {
  TempDir ws;
  Limits limits;

  {
    ProcessResult result;
    result.stdout = kj::str("Latexmk: Errors, so I did not complete making targets\n");
    auto failed = collectCompileOutput(ws.path, "main.tex", true, kj::mv(result), limits, 1024);
    auto& failure = failureOf(failed);
    KJ_EXPECT(failure.kind == ErrorKind::TOOL_FAILURE);
    KJ_EXPECT(failure.message == "Compilation failed");
    KJ_EXPECT(KJ_ASSERT_NONNULL(failure.log).startsWith("Latexmk: Errors"));
  }

  ws.write("main.tex", "\\bibliography{refs}");
  ws.write("refs.bib", "@book{a, title={A}}");
  ws.write("main.log", kj::str("! Undefined control sequence in ", ws.path, "/main.tex\n"));
  ws.write("main.aux", "\\bibdata{refs}\n");
  ws.write("main.fls", kj::str("PWD ", ws.path, "\nINPUT ", ws.path, "/main.tex\n"));
  ws.write("main.pdf", "%PDF-1.5\n%%EOF\n");

  {
    // latexmk can exit non-zero and still leave a usable PDF.
    ProcessResult result;
    auto built = collectCompileOutput(ws.path, "main.tex", true, kj::mv(result), limits, 1024);
    KJ_ASSERT(built.is<CompileOutput>());
    auto& output = built.get<CompileOutput>();
    KJ_EXPECT(kj::heapString(output.pdf.asPtr().asChars()) == "%PDF-1.5\n%%EOF\n");
    auto& deps = KJ_ASSERT_NONNULL(output.dependencies);
    KJ_EXPECT(kj::strArray(deps, ",") == "main.tex,refs.bib", kj::strArray(deps, ","));
  }

  {
    ProcessResult result;
    result.success = true;
    auto built = collectCompileOutput(ws.path, "main.tex", false, kj::mv(result), limits, 1024);
    KJ_ASSERT(built.is<CompileOutput>());
    KJ_EXPECT(built.get<CompileOutput>().dependencies == nullptr);
  }

  {
    ProcessResult result;
    result.timedOut = true;
    auto built = collectCompileOutput(ws.path, "main.tex", true, kj::mv(result), limits, 1024);
    auto& failure = failureOf(built);
    KJ_EXPECT(failure.kind == ErrorKind::TOOL_TIMEOUT);
    KJ_EXPECT(failure.timedOut);
    auto& log = KJ_ASSERT_NONNULL(failure.log);
    KJ_EXPECT(log.startsWith("! Undefined control sequence"), log);
    KJ_EXPECT(!hasSubstring(log, ws.path), log);
  }

  {
    Limits small;
    small.maxArtifactBytes = 4;
    ProcessResult result;
    result.success = true;
    auto built = collectCompileOutput(ws.path, "main.tex", false, kj::mv(result), small, 1024);
    KJ_EXPECT(failureOf(built).status == 413);
  }
}

KJ_TEST("recorder build reports the files it read") {
  OrchestratorFixture f;
  TempDir ws;
  ws.write("main.tex",
      "\\documentclass{article}\n"
      "\\begin{document}\n"
      "\\input{chapters/intro}\n"
      "\\cite{knuth84}\n"
      "\\bibliographystyle{plain}\n"
      "\\bibliography{refs}\n"
      "\\end{document}\n");
  ws.write("chapters/intro.tex", "Hello.\n");
  ws.write("refs.bib",
      "@book{knuth84, author={Donald E. Knuth}, title={The {\\TeX}book},\n"
      "  publisher={Addison-Wesley}, year={1984}}\n");
  ws.write("unused.tex", "Never read.\n");

  auto result = f.wait(f.tools.compile(ws.path, "main.tex", Compiler::PDFLATEX, true));
  auto built = collectCompileOutput(ws.path, "main.tex", true, kj::mv(result),
                                    Limits(), 1u << 20);

  // Without a TeX installation there is no PDF, and nothing more to check.
  if (built.is<CompileOutput>()) {
    auto& deps = KJ_ASSERT_NONNULL(built.get<CompileOutput>().dependencies);
    auto all = kj::strArray(deps, ",");
    KJ_EXPECT(hasSubstring(all, "main.tex"), all);
    KJ_EXPECT(hasSubstring(all, "chapters/intro.tex"), all);
    KJ_EXPECT(hasSubstring(all, "refs.bib"), all);
    KJ_EXPECT(!hasSubstring(all, "unused.tex"), all);
    KJ_EXPECT(!hasSubstring(all, "main.aux"), all);
  } else {
    KJ_EXPECT(built.get<Failure>().message == "Compilation failed");
  }
}

void writeRepository(TempDir& ws) {
  ws.write("main.tex", "\\input{a}");
  ws.write("a.tex", "A");
  ws.write("README.md", "# Paper\n");
  const byte png[] = { 0x89, 'P', 'N', 'G', 0x0d, 0x0a, 0x1a, 0x0a, 0x00 };
  ws.write("figs/plot.png", kj::arrayPtr(png, sizeof(png)));
  ws.write("figs/deep/x/y.tex", "Y");
  ws.write(".git/config", "[core]\n");
  ws.write(".git/HEAD", "ref: refs/heads/main\n");
  ws.link("alias.tex", "main.tex");
  ws.link("leak.tex", "/etc/passwd");
  ws.link("up/outside.tex", "../../outside.tex");
}

KJ_TEST("collectArchive") {
  TempDir ws;
  writeRepository(ws);
  Limits limits;

  {
    auto result = collectArchive(ws.path, "", ArchiveFilter(), limits);
    KJ_ASSERT(result.is<ArchiveOutput>());
    auto& archive = result.get<ArchiveOutput>();
    KJ_EXPECT(pathsOf(archive.files) ==
        "README.md,a.tex,alias.tex,figs/deep/x/y.tex,figs/plot.png,main.tex",
        pathsOf(archive.files));
    KJ_EXPECT(archive.missingPaths.size() == 0);

    for (auto& file: archive.files) {
      if (file.path == "figs/plot.png") {
        KJ_EXPECT(file.base64);
        KJ_EXPECT(file.content == "iVBORw0KGgoA", file.content);
      } else if (file.path == "alias.tex") {
        KJ_EXPECT(!file.base64);
        KJ_EXPECT(file.content == "\\input{a}");
      }
    }
  }

  {
    ArchiveFilter filter;
    auto extensions = kj::heapArrayBuilder<kj::String>(1);
    extensions.add(kj::str("TEX"));
    filter.extensions = extensions.finish();
    auto paths = kj::heapArrayBuilder<kj::String>(3);
    paths.add(kj::str("./README.md"));
    paths.add(kj::str("nope.txt"));
    paths.add(kj::str("../x"));
    filter.paths = paths.finish();

    auto result = collectArchive(ws.path, "", kj::mv(filter), limits);
    KJ_ASSERT(result.is<ArchiveOutput>());
    auto& archive = result.get<ArchiveOutput>();
    KJ_EXPECT(pathsOf(archive.files) == "README.md,a.tex,alias.tex,figs/deep/x/y.tex,main.tex",
              pathsOf(archive.files));
    KJ_EXPECT(kj::strArray(archive.missingPaths, ",") == "nope.txt,../x");
  }

  {
    auto result = collectArchive(ws.path, "figs", ArchiveFilter(), limits);
    KJ_ASSERT(result.is<ArchiveOutput>());
    KJ_EXPECT(pathsOf(result.get<ArchiveOutput>().files) == "figs/deep/x/y.tex,figs/plot.png");
  }

  KJ_EXPECT(failureOf(collectArchive(ws.path, "nothere", ArchiveFilter(), limits)).status == 404);
  KJ_EXPECT(failureOf(collectArchive(ws.path, "main.tex", ArchiveFilter(), limits)).status == 404);
  KJ_EXPECT(failureOf(collectArchive(ws.path, "../..", ArchiveFilter(), limits)).message ==
            "Invalid path");
}

KJ_TEST("collectArchive limits") {
  TempDir ws;
  writeRepository(ws);

  {
    Limits shallow;
    shallow.maxRepoDepth = 1;
    auto result = collectArchive(ws.path, "", ArchiveFilter(), shallow);
    KJ_ASSERT(result.is<ArchiveOutput>());
    KJ_EXPECT(pathsOf(result.get<ArchiveOutput>().files) ==
        "README.md,a.tex,alias.tex,figs/plot.png,main.tex");

    shallow.maxRepoDepth = 0;
    result = collectArchive(ws.path, "", ArchiveFilter(), shallow);
    KJ_ASSERT(result.is<ArchiveOutput>());
    KJ_EXPECT(pathsOf(result.get<ArchiveOutput>().files) == "README.md,a.tex,alias.tex,main.tex");
  }

  {
    Limits few;
    few.maxRepoFiles = 2;
    auto result = collectArchive(ws.path, "", ArchiveFilter(), few);
    auto& failure = failureOf(result);
    KJ_EXPECT(failure.status == 413);
    KJ_EXPECT(failure.message == "Repository has too many files. Maximum is 2", failure.message);

    // Only the files actually selected count.
    ArchiveFilter filter;
    auto paths = kj::heapArrayBuilder<kj::String>(2);
    paths.add(kj::str("main.tex"));
    paths.add(kj::str("a.tex"));
    filter.paths = paths.finish();
    KJ_EXPECT(collectArchive(ws.path, "", kj::mv(filter), few).is<ArchiveOutput>());
  }

  {
    Limits small;
    small.maxRepoBytes = 10;
    auto result = collectArchive(ws.path, "", ArchiveFilter(), small);
    auto& failure = failureOf(result);
    KJ_EXPECT(failure.status == 413);
    KJ_EXPECT(failure.message == "Repository too large", failure.message);
  }

  {
    // Oversized files are left out rather than failing the archive.
    Limits perFile;
    perFile.maxResourceBytes = 2;
    auto result = collectArchive(ws.path, "", ArchiveFilter(), perFile);
    KJ_ASSERT(result.is<ArchiveOutput>());
    KJ_EXPECT(pathsOf(result.get<ArchiveOutput>().files) == "a.tex,figs/deep/x/y.tex");
  }
}

KJ_TEST("listRepoDirectory") {
  TempDir ws;
  writeRepository(ws);

  auto result = listRepoDirectory(ws.path, "");
  KJ_ASSERT(result.is<kj::Array<RepoEntry>>());
  auto names = KJ_MAP(entry, result.get<kj::Array<RepoEntry>>()) {
    return kj::str(entry.path, entry.isDirectory ? "/" : "");
  };
  KJ_EXPECT(kj::strArray(names, ",") == "README.md,a.tex,alias.tex,figs/,main.tex,up/",
            kj::strArray(names, ","));

  auto figs = listRepoDirectory(ws.path, "figs");
  KJ_ASSERT(figs.is<kj::Array<RepoEntry>>());
  auto& entries = figs.get<kj::Array<RepoEntry>>();
  KJ_ASSERT(entries.size() == 2);
  KJ_EXPECT(entries[0].name == "deep");
  KJ_EXPECT(entries[0].path == "figs/deep");
  KJ_EXPECT(entries[0].isDirectory);
  KJ_EXPECT(entries[1].path == "figs/plot.png");
  KJ_EXPECT(!entries[1].isDirectory);

  // The escaping link in up/ is hidden too.
  auto up = listRepoDirectory(ws.path, "up");
  KJ_ASSERT(up.is<kj::Array<RepoEntry>>());
  KJ_EXPECT(up.get<kj::Array<RepoEntry>>().size() == 0);

  KJ_EXPECT(failureOf(listRepoDirectory(ws.path, "missing")).status == 404);
  KJ_EXPECT(failureOf(listRepoDirectory(ws.path, "a.tex")).status == 404);
  KJ_EXPECT(failureOf(listRepoDirectory(ws.path, "../..")).kind == ErrorKind::VALIDATION);
}

KJ_TEST("readRepoFile") {
  TempDir ws;
  writeRepository(ws);
  Limits limits;

  {
    auto result = readRepoFile(ws.path, "main.tex", limits);
    KJ_ASSERT(result.is<RepoFile>());
    auto& file = result.get<RepoFile>();
    KJ_EXPECT(file.path == "main.tex");
    KJ_EXPECT(file.content == "\\input{a}");
    KJ_EXPECT(!file.base64);
  }

  {
    auto result = readRepoFile(ws.path, "figs/plot.png", limits);
    KJ_ASSERT(result.is<RepoFile>());
    KJ_EXPECT(result.get<RepoFile>().base64);
    KJ_EXPECT(result.get<RepoFile>().content == "iVBORw0KGgoA");
  }

  KJ_EXPECT(readRepoFile(ws.path, "alias.tex", limits).is<RepoFile>());
  KJ_EXPECT(failureOf(readRepoFile(ws.path, ".git/config", limits)).status == 404);
  KJ_EXPECT(failureOf(readRepoFile(ws.path, "figs", limits)).status == 404);
  KJ_EXPECT(failureOf(readRepoFile(ws.path, "nope.tex", limits)).message ==
            "File not found: nope.tex");
  KJ_EXPECT(failureOf(readRepoFile(ws.path, "leak.tex", limits)).message ==
            "Invalid file path");

  Limits small;
  small.maxResourceBytes = 3;
  auto tooLarge = readRepoFile(ws.path, "main.tex", small);
  KJ_EXPECT(failureOf(tooLarge).status == 413);
  KJ_EXPECT(failureOf(tooLarge).message == "File too large");
}

KJ_TEST("hashablePaths") {
  TempDir ws;
  writeRepository(ws);

  const kj::String requested[] = {
    kj::str("main.tex"), kj::str("./figs//plot.png"), kj::str(".git/config"), kj::str("figs"),
    kj::str("../x"), kj::str("leak.tex"), kj::str("none.tex"), kj::str("")
  };
  auto paths = hashablePaths(ws.path, requested);
  KJ_ASSERT(paths.size() == 8);
  KJ_EXPECT(KJ_ASSERT_NONNULL(paths[0]) == "main.tex");
  KJ_EXPECT(KJ_ASSERT_NONNULL(paths[1]) == "figs/plot.png");
  for (auto i: kj::range(2, 8)) {
    KJ_EXPECT(paths[i] == nullptr, requested[i]);
  }
}

KJ_TEST("parseRemoteRefs") {
  auto listing =
      "1111111111111111111111111111111111111111\tHEAD\n"
      "2222222222222222222222222222222222222222\trefs/heads/dev\n"
      "3333333333333333333333333333333333333333\trefs/heads/main\n"
      "4444444444444444444444444444444444444444\trefs/heads/master\n"
      "5555555555555555555555555555555555555555\trefs/tags/v1.0\n";

  auto def = parseRemoteRefs(listing, "");
  KJ_EXPECT(KJ_ASSERT_NONNULL(def.sha) == "3333333333333333333333333333333333333333");
  KJ_EXPECT(def.defaultBranch == "main");

  auto dev = parseRemoteRefs(listing, "dev");
  KJ_EXPECT(KJ_ASSERT_NONNULL(dev.sha) == "2222222222222222222222222222222222222222");
  KJ_EXPECT(dev.defaultBranch == "main");

  auto master = parseRemoteRefs(listing, "master");
  KJ_EXPECT(KJ_ASSERT_NONNULL(master.sha) == "4444444444444444444444444444444444444444");

  KJ_EXPECT(parseRemoteRefs(listing, "gone").sha == nullptr);
  KJ_EXPECT(parseRemoteRefs(listing, "v1.0").sha == nullptr);

  auto headOnly = parseRemoteRefs("abcdef\tHEAD\r\nfedcba\trefs/heads/trunk\n", "");
  KJ_EXPECT(KJ_ASSERT_NONNULL(headOnly.sha) == "abcdef");
  KJ_EXPECT(headOnly.defaultBranch == "master");

  auto empty = parseRemoteRefs("", "");
  KJ_EXPECT(empty.sha == nullptr);
  KJ_EXPECT(empty.defaultBranch == "master");
}

KJ_TEST("Orchestrator: refs and file hash validation") {
  OrchestratorFixture f;
  capnp::MallocMessageBuilder message;

  {
    auto request = message.initRoot<RefsRequest>();
    auto messageFor = [&]() -> kj::String {
      auto result = f.wait(f.orchestrator.refs(request.asReader()));
      return kj::str(failureOf(result).message);
    };

    KJ_EXPECT(messageFor() == "Missing gitUrl");
    request.setGitUrl("git://example.com/repo.git");
    KJ_EXPECT(messageFor() == "gitUrl must use http or https");
    request.setGitUrl("https://example.com/repo.git");
    request.setBranch("main:refs/heads/evil");
    KJ_EXPECT(messageFor() == "Invalid branch");
    request.setBranch("-q");
    KJ_EXPECT(messageFor() == "Invalid branch");
    request.setBranch("feature/a b");
    KJ_EXPECT(messageFor() == "Invalid branch");
  }

  {
    auto request = message.initRoot<FileHashRequest>();
    auto messageFor = [&]() -> kj::String {
      auto result = f.wait(f.orchestrator.fileHash(request.asReader()));
      return kj::str(failureOf(result).message);
    };

    request.setGitUrl("https://example.com/repo.git");
    KJ_EXPECT(messageFor() == "Missing filePath or filePaths");

    auto paths = request.initFilePaths(501);
    for (auto i: kj::indices(paths)) {
      paths.set(i, kj::str("file", i, ".tex"));
    }
    KJ_EXPECT(messageFor() == "Too many filePaths. Maximum is 500");
  }

  KJ_EXPECT(f.clean());
}

KJ_TEST("Orchestrator: refs of an unreachable repository") {
  OrchestratorFixture f;
  capnp::MallocMessageBuilder message;
  auto request = message.initRoot<RefsRequest>();
  request.setGitUrl("https://127.0.0.1:1/owner/repo.git");
  request.setKnownSha("3333333333333333333333333333333333333333");
  auto auth = request.initAuth();
  auth.setUsername("alice");
  auth.setPassword("hunter22");

  auto result = f.wait(f.orchestrator.refs(request.asReader()));
  auto& failure = failureOf(result);
  KJ_EXPECT(failure.kind == ErrorKind::CLONE_FAILURE);
  KJ_EXPECT(failure.message == "Failed to access repository");
  KJ_IF_MAYBE(log, failure.log) {
    KJ_EXPECT(!hasSubstring(*log, "hunter22"), *log);
  }
  KJ_EXPECT(f.clean());
}

KJ_TEST("Orchestrator: file hash of an unreachable repository") {
  OrchestratorFixture f;
  capnp::MallocMessageBuilder message;
  auto request = message.initRoot<FileHashRequest>();
  request.setGitUrl("https://127.0.0.1:1/owner/repo.git");
  auto paths = request.initFilePaths(2);
  paths.set(0, "main.tex");
  paths.set(1, "../escape.tex");

  auto result = f.wait(f.orchestrator.fileHash(request.asReader()));
  auto& failure = failureOf(result);
  KJ_EXPECT(failure.kind == ErrorKind::CLONE_FAILURE);
  KJ_EXPECT(failure.message == "Failed to clone repository");
  KJ_EXPECT(f.clean());
}

}  // namespace
}  // namespace texbox
