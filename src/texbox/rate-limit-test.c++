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
#include <kj/test.h>

namespace texbox {
namespace {

KJ_TEST("RateLimiter: admits up to the limit, then rejects until the window ends") {
  kj::TimerImpl timer(kj::origin<kj::TimePoint>());
  RateLimiter::Options options;
  options.maxRequests = 3;
  options.window = 60 * kj::SECONDS;
  RateLimiter limiter(timer, options);

  auto first = limiter.admit("client");
  KJ_EXPECT(first.allowed);
  KJ_EXPECT(first.remaining == 2);
  KJ_EXPECT(first.resetAt == timer.now() + 60 * kj::SECONDS);

  timer.advanceTo(timer.now() + 10 * kj::SECONDS);
  KJ_EXPECT(limiter.admit("client").remaining == 1);
  KJ_EXPECT(limiter.admit("client").remaining == 0);

  auto fourth = limiter.admit("client");
  KJ_EXPECT(!fourth.allowed);
  KJ_EXPECT(fourth.remaining == 0);
  KJ_EXPECT(fourth.retryAfter == 50 * kj::SECONDS);

  // Other callers are counted separately.
  KJ_EXPECT(limiter.admit("someone-else").allowed);

  timer.advanceTo(timer.now() + 49 * kj::SECONDS);
  KJ_EXPECT(!limiter.admit("client").allowed);

  timer.advanceTo(timer.now() + 1 * kj::SECONDS);
  auto fresh = limiter.admit("client");
  KJ_EXPECT(fresh.allowed);
  KJ_EXPECT(fresh.remaining == 2);
  KJ_EXPECT(fresh.resetAt == timer.now() + 60 * kj::SECONDS);
}

KJ_TEST("RateLimiter: rejected requests don't extend the window") {
  kj::TimerImpl timer(kj::origin<kj::TimePoint>());
  RateLimiter::Options options;
  options.maxRequests = 1;
  options.window = 10 * kj::SECONDS;
  RateLimiter limiter(timer, options);

  KJ_EXPECT(limiter.admit("k").allowed);
  for (uint i = 0; i < 9; i++) {
    timer.advanceTo(timer.now() + 1 * kj::SECONDS);
    auto decision = limiter.admit("k");
    KJ_EXPECT(!decision.allowed);
    KJ_EXPECT(decision.retryAfter == (9 - i) * kj::SECONDS);
  }
  timer.advanceTo(timer.now() + 1 * kj::SECONDS);
  KJ_EXPECT(limiter.admit("k").allowed);
}

KJ_TEST("RateLimiter: key tracking is bounded") {
  kj::TimerImpl timer(kj::origin<kj::TimePoint>());
  RateLimiter::Options options;
  options.maxRequests = 1;
  options.maxKeys = 5;
  RateLimiter limiter(timer, options);

  for (uint i = 0; i < 50; i++) {
    KJ_EXPECT(limiter.admit(kj::str("ip:10.0.0.", i)).allowed);
  }
  KJ_EXPECT(limiter.trackedKeys() == 5);

  // The most recent callers are still limited; evicted ones start over.
  KJ_EXPECT(!limiter.admit("ip:10.0.0.49").allowed);
  KJ_EXPECT(limiter.admit("ip:10.0.0.0").allowed);
}

KJ_TEST("RateLimiter: refuses a zero limit") {
  kj::TimerImpl timer(kj::origin<kj::TimePoint>());
  RateLimiter::Options options;
  options.maxRequests = 0;
  KJ_EXPECT_THROW_MESSAGE("at least one request", kj::heap<RateLimiter>(timer, options));
}

}  // namespace
}  // namespace texbox
