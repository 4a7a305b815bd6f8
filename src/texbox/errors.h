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

#ifndef TEXBOX_ERRORS_H_
#define TEXBOX_ERRORS_H_

#include <kj/string.h>
#include <kj/time.h>
#include <kj/one-of.h>
#include "util.h"

namespace texbox {

enum class ErrorKind {
  VALIDATION,
  // Bad input. Always detected before any filesystem or process work.

  RESOURCE_EXCEEDED,
  // Rate limit hit, or a request / repository larger than we accept.

  TOOL_TIMEOUT,
  TOOL_FAILURE,
  CLONE_FAILURE,

  INTERNAL
  // Anything unexpected. The details go to the log, not the client.
};

kj::StringPtr errorKindName(ErrorKind kind);
// Name used for the `kind` field of JSON error responses, e.g. "toolTimeout".

struct Failure {
  // A request-level failure, reported to the client. Messages must never contain host paths;
  // see scrubPath().

  ErrorKind kind;
  uint status;
  kj::String message;
  kj::Maybe<kj::String> log;
  bool timedOut = false;
  kj::Maybe<kj::Duration> retryAfter;

  static Failure validation(kj::StringPtr message, uint status = 400);
  static Failure notFound(kj::StringPtr message);
  static Failure tooLarge(kj::StringPtr message);
  static Failure rateLimited(kj::Duration retryAfter);
  static Failure internal();
};

template <typename T>
using Result = kj::OneOf<T, Failure>;
// Either the artifact a request produced, or why it didn't.

kj::String scrubPath(kj::StringPtr text, kj::StringPtr path);
// Replace every occurrence of `path` in `text` with ".".

}  // namespace texbox

#endif // TEXBOX_ERRORS_H_
