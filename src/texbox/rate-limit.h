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

#ifndef TEXBOX_RATE_LIMIT_H_
#define TEXBOX_RATE_LIMIT_H_

#include <kj/timer.h>
#include <kj/mutex.h>
#include "expiring-cache.h"
#include "util.h"

namespace texbox {

class RateLimiter {
  // Fixed-window request counter per caller. Each key gets `maxRequests` admissions per window;
  // the window starts with the first request after the previous one ended. A burst straddling a
  // window boundary can therefore see up to 2 * maxRequests admissions in a short interval.
  //
  // Records live in an ExpiringLruCache whose TTL equals the window, so idle callers cost
  // nothing and memory is bounded by `maxKeys` no matter how many distinct callers show up.

public:
  struct Options {
    uint maxRequests = 30;
    kj::Duration window = 60 * kj::SECONDS;
    size_t maxKeys = 10000;
  };

  struct Decision {
    bool allowed;
    uint remaining;
    // Admissions left in the current window after this one.

    kj::TimePoint resetAt;
    kj::Duration retryAfter;
    // Zero when allowed.
  };

  RateLimiter(kj::Timer& timer, Options options);
  KJ_DISALLOW_COPY(RateLimiter);

  Decision admit(kj::StringPtr key);

  inline uint getMaxRequests() const { return options.maxRequests; }
  size_t trackedKeys() const;

private:
  struct Record {
    uint count;
    kj::TimePoint windowResetAt;
  };

  kj::Timer& timer;
  Options options;
  kj::MutexGuarded<ExpiringLruCache<Record>> records;
};

}  // namespace texbox

#endif // TEXBOX_RATE_LIMIT_H_
