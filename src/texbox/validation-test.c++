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

#include "validation.h"
#include <kj/test.h>
#include <capnp/message.h>
#include <stdlib.h>
#include <unistd.h>

namespace texbox {
namespace {

kj::String normalized(kj::StringPtr path) {
  KJ_IF_MAYBE(n, normalizeRelative(path)) {
    return kj::mv(*n);
  }
  return kj::str("<rejected>");
}

kj::String resolved(kj::StringPtr root, kj::StringPtr path) {
  KJ_IF_MAYBE(r, resolveInside(root, path)) {
    return kj::mv(*r);
  }
  return kj::str("<rejected>");
}

kj::String resolvedOnDisk(kj::StringPtr root, kj::StringPtr path) {
  KJ_IF_MAYBE(r, resolveInsideOnDisk(root, path)) {
    return kj::mv(*r);
  }
  return kj::str("<rejected>");
}

kj::String messageOf(kj::Maybe<Failure> failure) {
  KJ_IF_MAYBE(f, failure) {
    return kj::mv(f->message);
  }
  return kj::str();
}

KJ_TEST("normalizeRelative") {
  KJ_EXPECT(normalized("main.tex") == "main.tex");
  KJ_EXPECT(normalized("./chapters//one.tex") == "chapters/one.tex");
  KJ_EXPECT(normalized("a/") == "a");
  KJ_EXPECT(normalized("a/./") == "a");
  KJ_EXPECT(normalized("a..b/c..") == "a..b/c..");

  KJ_EXPECT(normalized("") == "<rejected>");
  KJ_EXPECT(normalized("/etc/passwd") == "<rejected>");
  KJ_EXPECT(normalized("..") == "<rejected>");
  KJ_EXPECT(normalized("../x") == "<rejected>");
  KJ_EXPECT(normalized("a/../../x") == "<rejected>");
  KJ_EXPECT(normalized("../root/x") == "<rejected>");

  // Even when the result would stay inside.
  KJ_EXPECT(normalized("a/b/../c") == "<rejected>");
  KJ_EXPECT(normalized("a/..") == "<rejected>");
  KJ_EXPECT(normalized("a/b/..") == "<rejected>");
}

KJ_TEST("resolveInside") {
  KJ_EXPECT(resolved("/work/ws", "a/b.tex") == "/work/ws/a/b.tex");
  KJ_EXPECT(resolveInside("/work/ws", "a/../b.tex") == nullptr);
  KJ_EXPECT(resolved("/work/ws", ".") == "/work/ws");
  KJ_EXPECT(resolveInside("/work/ws", "../ws2/x") == nullptr);
  KJ_EXPECT(resolveInside("/work/ws", "/work/ws/x") == nullptr);

  KJ_EXPECT_THROW_MESSAGE("absolute", resolveInside("relative", "x"));
  KJ_EXPECT_THROW_MESSAGE("absolute", resolveInside("/work/ws/", "x"));

  KJ_EXPECT(isInside("/a/b", "/a/b"));
  KJ_EXPECT(isInside("/a/b", "/a/b/c"));
  KJ_EXPECT(!isInside("/a/b", "/a/bc"));
  KJ_EXPECT(!isInside("/a/b", "/a"));
}

KJ_TEST("resolveInsideOnDisk rejects symlink escapes") {
  char tempdir[] = "/tmp/texbox-validation-test.XXXXXX";
  KJ_ASSERT(mkdtemp(tempdir) != nullptr);
  kj::String root = kj::str(tempdir);
  KJ_DEFER(recursivelyDelete(root));

  KJ_SYSCALL(mkdir(kj::str(root, "/sub").cStr(), 0700));
  writeFile(kj::str(root, "/sub/file.tex"), kj::StringPtr("x").asBytes());
  KJ_SYSCALL(symlink("/etc/passwd", kj::str(root, "/escape").cStr()));
  KJ_SYSCALL(symlink("/etc", kj::str(root, "/escapedir").cStr()));
  KJ_SYSCALL(symlink("sub/file.tex", kj::str(root, "/inner").cStr()));
  KJ_SYSCALL(symlink("nowhere", kj::str(root, "/dangling").cStr()));

  // The static check can't see any of this.
  KJ_EXPECT(resolveInside(root, "escape") != nullptr);
  KJ_EXPECT(resolveInside(root, "escapedir/hosts") != nullptr);

  KJ_EXPECT(resolveInsideOnDisk(root, "escape") == nullptr);
  KJ_EXPECT(resolveInsideOnDisk(root, "escapedir/hosts") == nullptr);
  KJ_EXPECT(resolveInsideOnDisk(root, "escapedir/new-file") == nullptr);
  KJ_EXPECT(resolveInsideOnDisk(root, "dangling") == nullptr);

  KJ_EXPECT(resolvedOnDisk(root, "inner") == kj::str(root, "/inner"));
  KJ_EXPECT(resolvedOnDisk(root, "sub/file.tex") == kj::str(root, "/sub/file.tex"));
  KJ_EXPECT(resolvedOnDisk(root, "new/dir/file.tex") == kj::str(root, "/new/dir/file.tex"));
  KJ_EXPECT(resolveInsideOnDisk(root, "../x") == nullptr);
}

KJ_TEST("validateTarget") {
  KJ_EXPECT(validateTarget("main.tex") == nullptr);
  KJ_EXPECT(validateTarget("chapters/main.tex") == nullptr);
  KJ_EXPECT(messageOf(validateTarget("")) == "Missing target file");
  KJ_EXPECT(messageOf(validateTarget("main.pdf")) == "Target must be a .tex file");
  KJ_EXPECT(messageOf(validateTarget("../main.tex")) == "Invalid target path");
  KJ_EXPECT(messageOf(validateTarget("chapters/../main.tex")) == "Invalid target path");
  KJ_EXPECT(messageOf(validateTarget("/tmp/main.tex")) == "Invalid target path");
}

KJ_TEST("validateFilePath") {
  KJ_EXPECT(validateFilePath("figures/plot.png") == nullptr);
  KJ_EXPECT(messageOf(validateFilePath("")) == "Missing filePath");
  KJ_EXPECT(messageOf(validateFilePath("a/../../b")) == "Invalid file path");
  KJ_EXPECT(messageOf(validateFilePath("figures/../plot.png")) == "Invalid file path");
  KJ_EXPECT(messageOf(validateFilePath(".")) == "Invalid file path");
}

KJ_TEST("validateGitUrl") {
  KJ_EXPECT(validateGitUrl("https://github.com/example/paper.git") == nullptr);
  KJ_EXPECT(validateGitUrl("http://git.example.com:8080/repo") == nullptr);
  KJ_EXPECT(messageOf(validateGitUrl("")) == "Missing gitUrl");
  KJ_EXPECT(messageOf(validateGitUrl("not a url")) == "Invalid gitUrl format");
  KJ_EXPECT(messageOf(validateGitUrl("file:///etc")) == "gitUrl must use http or https");
  KJ_EXPECT(messageOf(validateGitUrl("ssh://git@example.com/repo")) ==
            "gitUrl must use http or https");
}

KJ_TEST("compiler and format names") {
  KJ_EXPECT(KJ_ASSERT_NONNULL(parseCompiler("xelatex")) == Compiler::XELATEX);
  KJ_EXPECT(parseCompiler("latex") == nullptr);
  KJ_EXPECT(parseCompiler("pdflatex; rm -rf /") == nullptr);
  KJ_EXPECT(compilerName(Compiler::LUALATEX) == "lualatex");

  KJ_EXPECT(KJ_ASSERT_NONNULL(parseImageFormat("jpeg")) == ImageFormat::JPEG);
  KJ_EXPECT(parseImageFormat("gif") == nullptr);
}

KJ_TEST("validateThumbnailOptions") {
  Limits limits;

  auto ok = validateThumbnailOptions(800, "png", limits);
  KJ_ASSERT(ok.is<ThumbnailOptions>());
  KJ_EXPECT(ok.get<ThumbnailOptions>().width == 800);
  KJ_EXPECT(ok.get<ThumbnailOptions>().format == ImageFormat::PNG);

  KJ_EXPECT(validateThumbnailOptions(4000, "jpeg", limits).is<ThumbnailOptions>());
  KJ_EXPECT(validateThumbnailOptions(1, "jpeg", limits).is<ThumbnailOptions>());

  auto fraction = validateThumbnailOptions(800.5, "png", limits);
  KJ_ASSERT(fraction.is<Failure>());
  KJ_EXPECT(fraction.get<Failure>().message == "Width must be an integer");

  auto tooWide = validateThumbnailOptions(4001, "png", limits);
  KJ_ASSERT(tooWide.is<Failure>());
  KJ_EXPECT(tooWide.get<Failure>().message == "Width must be between 1 and 4000");
  KJ_EXPECT(validateThumbnailOptions(0, "png", limits).is<Failure>());

  auto badFormat = validateThumbnailOptions(800, "gif", limits);
  KJ_ASSERT(badFormat.is<Failure>());
  KJ_EXPECT(badFormat.get<Failure>().message == "Invalid format. Use: png, jpeg");
  KJ_EXPECT(badFormat.get<Failure>().kind == ErrorKind::VALIDATION);
  KJ_EXPECT(badFormat.get<Failure>().status == 400);
}

KJ_TEST("decodeResources") {
  Limits limits;

  capnp::MallocMessageBuilder message;
  auto request = message.initRoot<CompileRequest>();
  auto resources = request.initResources(4);
  resources[0].setPath("main.tex");
  resources[0].initContent().setText("\\documentclass{article}");
  resources[1].setPath("./fig//data.txt");
  resources[1].initContent().setText("aGVsbG8=");
  resources[1].setEncoding("base64");
  resources[2].setPath("raw.bin");
  resources[2].setEncoding("bytes");
  auto data = resources[2].initContent().initBytes(3);
  data[0] = 1;
  data[1] = 2;
  data[2] = 3;
  resources[3].setPath("notes.txt");
  resources[3].initContent().setText("plain");
  resources[3].setEncoding("utf-8");

  auto result = decodeResources(resources.asReader(), limits);
  KJ_ASSERT(result.is<kj::Array<DecodedResource>>());
  auto& decoded = result.get<kj::Array<DecodedResource>>();
  KJ_ASSERT(decoded.size() == 4);
  KJ_EXPECT(decoded[0].path == "main.tex");
  KJ_EXPECT(decoded[1].path == "fig/data.txt");
  KJ_EXPECT(kj::heapString(decoded[1].content.asPtr().asChars()) == "hello");
  KJ_EXPECT(decoded[2].content.size() == 3);
  KJ_EXPECT(decoded[2].content[2] == 3);
  KJ_EXPECT(decoded[3].totalSize == 23 + 5 + 3 + 5);
}

KJ_TEST("resource content from JSON") {
  ResourceContentJsonHandler handler;
  capnp::JsonCodec json;
  json.addTypeHandler(handler);
  Limits limits;

  auto decodeJson = [&](kj::StringPtr text) -> kj::String {
    capnp::MallocMessageBuilder message;
    auto resource = message.initRoot<Resource>();
    json.decode(text, resource);
    auto result = decodeResource(resource.asReader(), 0, limits);
    if (result.is<Failure>()) return kj::str("error: ", result.get<Failure>().message);
    auto& content = result.get<DecodedResource>().content;
    return kj::strArray(KJ_MAP(b, content) { return kj::str(b); }, ",");
  };

  KJ_EXPECT(decodeJson(
      "{\"path\":\"fig.png\",\"content\":[137,80,78,71],\"encoding\":\"bytes\"}") ==
      "137,80,78,71");
  KJ_EXPECT(decodeJson("{\"path\":\"fig.png\",\"content\":[0,255]}") == "0,255");
  KJ_EXPECT(decodeJson("{\"path\":\"a.txt\",\"content\":\"AB\"}") == "65,66");

  // Declared encoding and payload shape must agree.
  KJ_EXPECT(decodeJson(
      "{\"path\":\"fig.png\",\"content\":\"iVBO\",\"encoding\":\"bytes\"}") ==
      "error: Resource content must be an array of bytes for encoding bytes: fig.png");
  KJ_EXPECT(decodeJson("{\"path\":\"fig.png\",\"encoding\":\"bytes\"}") ==
      "error: Resource content must be an array of bytes for encoding bytes: fig.png");
  KJ_EXPECT(decodeJson(
      "{\"path\":\"fig.png\",\"content\":[1,2],\"encoding\":\"base64\"}") ==
      "error: Resource content must be a string for encoding base64: fig.png");

  // Not bytes at all: the request body itself is malformed.
  capnp::MallocMessageBuilder message;
  auto resource = message.initRoot<Resource>();
  KJ_EXPECT_THROW_MESSAGE("out of range",
      json.decode("{\"path\":\"x\",\"content\":[256]}", resource));
  KJ_EXPECT_THROW_MESSAGE("must be numbers",
      json.decode("{\"path\":\"x\",\"content\":[\"a\"]}", resource));
  KJ_EXPECT_THROW_MESSAGE("string or an array",
      json.decode("{\"path\":\"x\",\"content\":{}}", resource));
}

KJ_TEST("decodeResource rejections") {
  Limits limits;
  capnp::MallocMessageBuilder message;
  auto resource = message.initRoot<Resource>();

  auto messageFor = [&](size_t totalSoFar = 0) -> kj::String {
    auto result = decodeResource(resource.asReader(), totalSoFar, limits);
    if (result.is<Failure>()) return kj::mv(result.get<Failure>().message);
    return kj::str("<accepted>");
  };

  KJ_EXPECT(messageFor() == "Invalid resource: missing path");

  resource.setPath("../escape.tex");
  KJ_EXPECT(messageFor() == "Invalid resource path: ../escape.tex");

  resource.setPath("a/..");
  KJ_EXPECT(messageFor() == "Invalid resource path: a/..");

  resource.setPath("fig/../ok.tex");
  KJ_EXPECT(messageFor() == "Invalid resource path: fig/../ok.tex");

  resource.setPath("ok.tex");
  resource.setEncoding("rot13");
  KJ_EXPECT(messageFor() == "Invalid resource encoding: rot13");

  resource.setEncoding("text");
  resource.initContent().setText("12345");
  limits.maxResourceBytes = 4;
  KJ_EXPECT(messageFor() == "Resource too large: ok.tex");

  limits.maxResourceBytes = 10;
  limits.maxTotalBytes = 8;
  KJ_EXPECT(messageFor(0) == "<accepted>");
  KJ_EXPECT(messageFor(4) == "Total resources size exceeds limit");
}

KJ_TEST("resources each under the cap can still exceed the total") {
  Limits limits;
  limits.maxResourceBytes = 10;
  limits.maxTotalBytes = 25;

  capnp::MallocMessageBuilder message;
  auto resources = message.initRoot<CompileRequest>().initResources(3);
  for (auto i: kj::indices(resources)) {
    resources[i].setPath(kj::str("part", i, ".tex"));
    resources[i].initContent().setText("0123456789");
  }

  auto result = decodeResources(resources.asReader(), limits);
  KJ_ASSERT(result.is<Failure>());
  KJ_EXPECT(result.get<Failure>().message == "Total resources size exceeds limit");
}

KJ_TEST("too many resources") {
  Limits limits;
  limits.maxResources = 2;

  capnp::MallocMessageBuilder message;
  auto resources = message.initRoot<CompileRequest>().initResources(3);
  for (auto i: kj::indices(resources)) {
    resources[i].setPath(kj::str("r", i));
  }

  auto result = decodeResources(resources.asReader(), limits);
  KJ_ASSERT(result.is<Failure>());
  KJ_EXPECT(result.get<Failure>().message == "Too many resources. Maximum is 2");
}

}  // namespace
}  // namespace texbox
