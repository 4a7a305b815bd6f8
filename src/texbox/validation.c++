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
#include <kj/compat/url.h>
#include <kj/debug.h>
#include <kj/encoding.h>
#include <kj/vector.h>
#include <math.h>
#include <string.h>
#include <errno.h>
#include <sys/stat.h>

namespace texbox {

kj::Maybe<kj::String> normalizeRelative(kj::StringPtr userPath) {
  if (userPath.size() == 0) return nullptr;
  if (memchr(userPath.begin(), '\0', userPath.size()) != nullptr) return nullptr;
  if (userPath.startsWith("/")) return nullptr;

  kj::Vector<kj::ArrayPtr<const char>> stack;
  for (auto segment: split(userPath, '/')) {
    if (segment.size() == 0 || (segment.size() == 1 && segment[0] == '.')) {
      continue;
    } else if (segment.size() == 2 && segment[0] == '.' && segment[1] == '.') {
      return nullptr;
    } else {
      stack.add(segment);
    }
  }

  return kj::strArray(KJ_MAP(s, stack) { return kj::str(s); }, "/");
}

bool isInside(kj::StringPtr root, kj::StringPtr path) {
  return path == root ||
      (path.startsWith(root) && path.size() > root.size() && path[root.size()] == '/');
}

kj::Maybe<kj::String> resolveInside(kj::StringPtr root, kj::StringPtr userPath) {
  KJ_REQUIRE(root.startsWith("/") && (root == "/" || !root.endsWith("/")),
             "sandbox root must be absolute without a trailing slash", root);

  KJ_IF_MAYBE(relative, normalizeRelative(userPath)) {
    auto resolved = relative->size() == 0 ? kj::str(root) : kj::str(root, '/', *relative);
    if (!isInside(root, resolved)) return nullptr;
    return kj::mv(resolved);
  } else {
    return nullptr;
  }
}

kj::Maybe<kj::String> resolveInsideOnDisk(kj::StringPtr root, kj::StringPtr userPath) {
  KJ_IF_MAYBE(resolved, resolveInside(root, userPath)) {
    kj::String realRoot;
    KJ_IF_MAYBE(r, realPath(root)) {
      realRoot = kj::mv(*r);
    } else {
      return nullptr;
    }

    if (*resolved == root) return kj::mv(*resolved);

    struct stat stats;
    if (lstat(resolved->cStr(), &stats) == 0) {
      if (S_ISLNK(stats.st_mode)) {
        KJ_IF_MAYBE(target, realPath(*resolved)) {
          if (!isInside(realRoot, *target)) return nullptr;
        } else {
          // Dangling link: we can't tell where a write would land.
          return nullptr;
        }
      }
    } else {
      int error = errno;
      if (error != ENOENT) {
        KJ_FAIL_SYSCALL("lstat", error, *resolved);
      }
    }

    // Find the nearest ancestor that exists and check where it really is.
    kj::String ancestor = kj::str(*resolved);
    for (;;) {
      KJ_IF_MAYBE(slash, ancestor.findLast('/')) {
        ancestor = kj::heapString(ancestor.slice(0, kj::max(*slash, size_t(1))));
      } else {
        return nullptr;
      }
      KJ_IF_MAYBE(real, realPath(ancestor)) {
        if (!isInside(realRoot, *real)) return nullptr;
        break;
      }
      if (ancestor == "/") return nullptr;
    }

    return kj::mv(*resolved);
  } else {
    return nullptr;
  }
}

kj::Maybe<Failure> validateTarget(kj::StringPtr target) {
  if (target.size() == 0) {
    return Failure::validation("Missing target file");
  }
  if (!target.endsWith(".tex")) {
    return Failure::validation("Target must be a .tex file");
  }
  KJ_IF_MAYBE(normalized, normalizeRelative(target)) {
    if (normalized->size() == 0) {
      return Failure::validation("Invalid target path");
    }
  } else {
    return Failure::validation("Invalid target path");
  }
  return nullptr;
}

kj::Maybe<Failure> validateFilePath(kj::StringPtr filePath) {
  if (filePath.size() == 0) {
    return Failure::validation("Missing filePath");
  }
  KJ_IF_MAYBE(normalized, normalizeRelative(filePath)) {
    if (normalized->size() == 0) {
      return Failure::validation("Invalid file path");
    }
  } else {
    return Failure::validation("Invalid file path");
  }
  return nullptr;
}

kj::Maybe<Failure> validateGitUrl(kj::StringPtr gitUrl) {
  if (gitUrl.size() == 0) {
    return Failure::validation("Missing gitUrl");
  }
  KJ_IF_MAYBE(url, kj::Url::tryParse(gitUrl)) {
    if (url->scheme != "http" && url->scheme != "https") {
      return Failure::validation("gitUrl must use http or https");
    }
    if (url->host.size() == 0) {
      return Failure::validation("Invalid gitUrl format");
    }
  } else {
    return Failure::validation("Invalid gitUrl format");
  }
  return nullptr;
}

kj::Maybe<Compiler> parseCompiler(kj::StringPtr name) {
  if (name == "pdflatex") {
    return Compiler::PDFLATEX;
  } else if (name == "xelatex") {
    return Compiler::XELATEX;
  } else if (name == "lualatex") {
    return Compiler::LUALATEX;
  } else {
    return nullptr;
  }
}

kj::StringPtr compilerName(Compiler compiler) {
  switch (compiler) {
    case Compiler::PDFLATEX: return "pdflatex";
    case Compiler::XELATEX: return "xelatex";
    case Compiler::LUALATEX: return "lualatex";
  }
  KJ_UNREACHABLE;
}

kj::Maybe<ImageFormat> parseImageFormat(kj::StringPtr name) {
  if (name == "png") {
    return ImageFormat::PNG;
  } else if (name == "jpeg") {
    return ImageFormat::JPEG;
  } else {
    return nullptr;
  }
}

Result<ThumbnailOptions> validateThumbnailOptions(
    double width, kj::StringPtr format, const Limits& limits) {
  if (!isfinite(width) || floor(width) != width) {
    return Failure::validation("Width must be an integer");
  }
  if (width < limits.minThumbnailWidth || width > limits.maxThumbnailWidth) {
    return Failure::validation(kj::str(
        "Width must be between ", limits.minThumbnailWidth, " and ", limits.maxThumbnailWidth));
  }

  KJ_IF_MAYBE(f, parseImageFormat(format)) {
    return ThumbnailOptions { *f, static_cast<uint>(width) };
  } else {
    return Failure::validation("Invalid format. Use: png, jpeg");
  }
}

kj::Maybe<Failure> validateResourceCount(
    capnp::List<Resource>::Reader resources, const Limits& limits) {
  if (resources.size() > limits.maxResources) {
    return Failure::validation(kj::str("Too many resources. Maximum is ", limits.maxResources));
  }
  return nullptr;
}

Result<DecodedResource> decodeResource(
    Resource::Reader resource, size_t totalSoFar, const Limits& limits) {
  kj::StringPtr path = resource.getPath();
  if (path.size() == 0) {
    return Failure::validation("Invalid resource: missing path");
  }

  kj::String normalized;
  KJ_IF_MAYBE(n, normalizeRelative(path)) {
    if (n->size() == 0) {
      return Failure::validation(kj::str("Invalid resource path: ", path));
    }
    normalized = kj::mv(*n);
  } else {
    return Failure::validation(kj::str("Invalid resource path: ", path));
  }

  kj::StringPtr encoding = resource.getEncoding();
  auto source = resource.getContent();
  kj::Array<byte> content;
  if (encoding == "bytes" || (encoding == "" && source.isBytes())) {
    if (!source.isBytes()) {
      return Failure::validation(kj::str(
          "Resource content must be an array of bytes for encoding bytes: ", path));
    }
    content = kj::heapArray<byte>(source.getBytes());
  } else if (encoding == "base64" || encoding == "" || encoding == "text" ||
             encoding == "utf-8") {
    if (!source.isText()) {
      kj::StringPtr name = encoding.size() == 0 ? kj::StringPtr("text") : encoding;
      return Failure::validation(kj::str(
          "Resource content must be a string for encoding ", name, ": ", path));
    }
    if (encoding == "base64") {
      // Like most decoders we skip characters outside the alphabet (e.g. line breaks) rather
      // than rejecting them.
      content = kj::decodeBase64(source.getText());
    } else {
      content = kj::heapArray<byte>(source.getText().asBytes());
    }
  } else {
    return Failure::validation(kj::str("Invalid resource encoding: ", encoding));
  }

  if (content.size() > limits.maxResourceBytes) {
    return Failure::validation(kj::str("Resource too large: ", path));
  }

  size_t total = totalSoFar + content.size();
  if (total > limits.maxTotalBytes) {
    return Failure::validation("Total resources size exceeds limit");
  }

  return DecodedResource { kj::mv(normalized), kj::mv(content), total };
}

Result<kj::Array<DecodedResource>> decodeResources(
    capnp::List<Resource>::Reader resources, const Limits& limits) {
  KJ_IF_MAYBE(failure, validateResourceCount(resources, limits)) {
    return kj::mv(*failure);
  }

  auto results = kj::heapArrayBuilder<DecodedResource>(resources.size());
  size_t total = 0;
  for (auto resource: resources) {
    auto decoded = decodeResource(resource, total, limits);
    if (decoded.is<Failure>()) {
      return kj::mv(decoded.get<Failure>());
    }
    auto& d = decoded.get<DecodedResource>();
    total = d.totalSize;
    results.add(kj::mv(d));
  }
  return results.finish();
}

// =======================================================================================

void ResourceContentJsonHandler::encode(
    const capnp::JsonCodec& codec, ResourceContent::Reader input,
    capnp::JsonValue::Builder output) const {
  switch (input.which()) {
    case ResourceContent::TEXT:
      output.setString(input.getText());
      return;
    case ResourceContent::BYTES: {
      auto bytes = input.getBytes();
      auto array = output.initArray(bytes.size());
      for (auto i: kj::indices(bytes)) {
        array[i].setNumber(bytes[i]);
      }
      return;
    }
  }
  KJ_UNREACHABLE;
}

void ResourceContentJsonHandler::decode(
    const capnp::JsonCodec& codec, capnp::JsonValue::Reader input,
    ResourceContent::Builder output) const {
  if (input.isNull()) {
    return;
  } else if (input.isString()) {
    output.setText(input.getString());
  } else if (input.isArray()) {
    auto elements = input.getArray();
    auto bytes = output.initBytes(elements.size());
    for (auto i: kj::indices(elements)) {
      auto element = elements[i];
      KJ_REQUIRE(element.isNumber(), "resource content bytes must be numbers");
      double value = element.getNumber();
      KJ_REQUIRE(value >= 0 && value <= 255 && floor(value) == value,
                 "resource content byte out of range", value);
      bytes[i] = static_cast<byte>(value);
    }
  } else {
    KJ_FAIL_REQUIRE("resource content must be a string or an array of bytes");
  }
}

}  // namespace texbox
