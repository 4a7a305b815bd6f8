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

#include "rate-limit.h"

namespace texbox {

RateLimiter::RateLimiter(kj::Timer& timer, Options options)
    : timer(timer), options(options), records(options.maxKeys, options.window) {
  KJ_REQUIRE(options.maxRequests > 0, "rate limit must allow at least one request");
}

RateLimiter::Decision RateLimiter::admit(kj::StringPtr key) {
  auto now = timer.now();
  auto locked = records.lockExclusive();

  KJ_IF_MAYBE(record, locked->find(key, now)) {
    if (now < record->windowResetAt) {
      if (record->count >= options.maxRequests) {
        return { false, 0, record->windowResetAt, record->windowResetAt - now };
      }
      ++record->count;
      return { true, options.maxRequests - record->count, record->windowResetAt,
               0 * kj::SECONDS };
    }
  }

  // No record, or its window is over: start a new window.
  auto& record = locked->insert(key, Record { 1, now + options.window }, now);
  return { true, options.maxRequests - 1, record.windowResetAt, 0 * kj::SECONDS };
}

size_t RateLimiter::trackedKeys() const {
  return records.lockShared()->size();
}

}  // namespace texbox
