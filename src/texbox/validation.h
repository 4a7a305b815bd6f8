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

#ifndef TEXBOX_VALIDATION_H_
#define TEXBOX_VALIDATION_H_
// Input validation for everything a client can send us. All of it runs before a workspace is
// created or a process is started. Everything here is pure except resolveInsideOnDisk(), which
// looks at the filesystem to catch symlink escapes.

#include <kj/string.h>
#include <kj/array.h>
#include <texbox/api.capnp.h>
#include <capnp/compat/json.h>
#include "errors.h"

namespace texbox {

struct Limits {
  uint maxResources = 100;
  size_t maxResourceBytes = 10u << 20;
  size_t maxTotalBytes = 50u << 20;
  uint minThumbnailWidth = 1;
  uint maxThumbnailWidth = 4000;
  size_t maxRepoBytes = 50u << 20;
  uint maxRepoFiles = 500;
  uint maxRepoDepth = 20;
  size_t maxArtifactBytes = 100u << 20;
  // Largest PDF or image we will read back from a workspace.
};

enum class Compiler {
  PDFLATEX,
  XELATEX,
  LUALATEX
};

enum class ImageFormat {
  PNG,
  JPEG
};

kj::Maybe<kj::String> normalizeRelative(kj::StringPtr userPath);
// Fold "." segments and repeated separators out of a relative path. Returns null if the path is
// empty, contains a NUL byte, is absolute, or has a ".." segment anywhere, even one that would
// stay below the starting directory. The result is "" for paths naming the starting directory
// itself.

kj::Maybe<kj::String> resolveInside(kj::StringPtr root, kj::StringPtr userPath);
// Resolve `userPath` against `root` and return the absolute result, or null if the path is
// rejected by normalizeRelative() or does not land on `root` itself or strictly below it.
// `root` must be absolute and must not end in '/'.

kj::Maybe<kj::String> resolveInsideOnDisk(kj::StringPtr root, kj::StringPtr userPath);
// Like resolveInside(), but also consults the filesystem: if the path exists and is a symlink,
// the link's real target must be inside the real root; and the real path of the nearest existing
// ancestor directory must be inside the real root, so a symlinked directory component cannot
// redirect a write. A path that doesn't exist yet is accepted.

bool isInside(kj::StringPtr root, kj::StringPtr path);
// True if `path` equals `root` or starts with `root` + "/".

kj::Maybe<Failure> validateTarget(kj::StringPtr target);
kj::Maybe<Failure> validateFilePath(kj::StringPtr filePath);
kj::Maybe<Failure> validateGitUrl(kj::StringPtr gitUrl);

kj::Maybe<Compiler> parseCompiler(kj::StringPtr name);
kj::StringPtr compilerName(Compiler compiler);

kj::Maybe<ImageFormat> parseImageFormat(kj::StringPtr name);

struct ThumbnailOptions {
  ImageFormat format;
  uint width;
};

Result<ThumbnailOptions> validateThumbnailOptions(
    double width, kj::StringPtr format, const Limits& limits);

kj::Maybe<Failure> validateResourceCount(
    capnp::List<Resource>::Reader resources, const Limits& limits);

struct DecodedResource {
  kj::String path;
  // Normalized, relative to the workspace root.

  kj::Array<byte> content;

  size_t totalSize;
  // Running total of decoded bytes including this resource. Pass it back in as `totalSoFar`
  // for the next resource.
};

Result<DecodedResource> decodeResource(
    Resource::Reader resource, size_t totalSoFar, const Limits& limits);
// Decode the resource's content according to its declared encoding and check both the
// per-resource and the cumulative size cap. A byte array is only accepted with encoding "bytes"
// (or none), and "bytes" only with a byte array.

Result<kj::Array<DecodedResource>> decodeResources(
    capnp::List<Resource>::Reader resources, const Limits& limits);
// validateResourceCount() followed by decodeResource() over every element, threading the total.

class ResourceContentJsonHandler: public capnp::JsonCodec::Handler<ResourceContent> {
  // Resource.content arrives either as a JSON string or as a JSON array of byte values.

public:
  void encode(const capnp::JsonCodec& codec, ResourceContent::Reader input,
              capnp::JsonValue::Builder output) const override;
  void decode(const capnp::JsonCodec& codec, capnp::JsonValue::Reader input,
              ResourceContent::Builder output) const override;
};

}  // namespace texbox

#endif // TEXBOX_VALIDATION_H_
