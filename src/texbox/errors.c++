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

#include "errors.h"

namespace texbox {

kj::StringPtr errorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::VALIDATION: return "validation";
    case ErrorKind::RESOURCE_EXCEEDED: return "resourceExceeded";
    case ErrorKind::TOOL_TIMEOUT: return "toolTimeout";
    case ErrorKind::TOOL_FAILURE: return "toolFailure";
    case ErrorKind::CLONE_FAILURE: return "cloneFailure";
    case ErrorKind::INTERNAL: return "internal";
  }
  KJ_UNREACHABLE;
}

Failure Failure::validation(kj::StringPtr message, uint status) {
  return Failure { ErrorKind::VALIDATION, status, kj::str(message), nullptr, false, nullptr };
}

Failure Failure::notFound(kj::StringPtr message) {
  return validation(message, 404);
}

Failure Failure::tooLarge(kj::StringPtr message) {
  return Failure { ErrorKind::RESOURCE_EXCEEDED, 413, kj::str(message), nullptr, false, nullptr };
}

Failure Failure::rateLimited(kj::Duration retryAfter) {
  return Failure { ErrorKind::RESOURCE_EXCEEDED, 429,
                   kj::str("Too many requests. Please try again later."),
                   nullptr, false, retryAfter };
}

Failure Failure::internal() {
  return Failure { ErrorKind::INTERNAL, 500, kj::str("Internal server error"),
                   nullptr, false, nullptr };
}

kj::String scrubPath(kj::StringPtr text, kj::StringPtr path) {
  return replaceAll(text, path, ".");
}

}  // namespace texbox
