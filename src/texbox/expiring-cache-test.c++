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

#include "expiring-cache.h"
#include <kj/test.h>

namespace texbox {
namespace {

const kj::TimePoint START = kj::origin<kj::TimePoint>() + 1000 * kj::SECONDS;

KJ_TEST("ExpiringLruCache: lookup and replace") {
  ExpiringLruCache<int> cache(4, 10 * kj::SECONDS);

  KJ_EXPECT(cache.find("a", START) == nullptr);
  cache.insert("a", 1, START);
  cache.insert("b", 2, START);
  KJ_EXPECT(KJ_ASSERT_NONNULL(cache.find("a", START)) == 1);
  KJ_EXPECT(KJ_ASSERT_NONNULL(cache.find("b", START)) == 2);

  cache.insert("a", 3, START);
  KJ_EXPECT(KJ_ASSERT_NONNULL(cache.find("a", START)) == 3);
  KJ_EXPECT(cache.size() == 2);

  // Values are modifiable in place.
  KJ_ASSERT_NONNULL(cache.find("b", START)) = 5;
  KJ_EXPECT(KJ_ASSERT_NONNULL(cache.find("b", START)) == 5);

  KJ_EXPECT(cache.erase("a"));
  KJ_EXPECT(!cache.erase("a"));
  KJ_EXPECT(cache.size() == 1);
}

KJ_TEST("ExpiringLruCache: capacity evicts least recently used") {
  ExpiringLruCache<int> cache(3, 60 * kj::SECONDS);

  cache.insert("a", 1, START);
  cache.insert("b", 2, START);
  cache.insert("c", 3, START);

  // Touch "a" so that "b" is now the oldest.
  KJ_EXPECT(cache.find("a", START) != nullptr);

  cache.insert("d", 4, START);
  KJ_EXPECT(cache.size() == 3);
  KJ_EXPECT(cache.find("b", START) == nullptr);
  KJ_EXPECT(cache.find("a", START) != nullptr);
  KJ_EXPECT(cache.find("c", START) != nullptr);
  KJ_EXPECT(cache.find("d", START) != nullptr);

  // Size never exceeds capacity no matter how many keys go by.
  for (uint i = 0; i < 100; i++) {
    cache.insert(kj::str("key", i), i, START);
    KJ_EXPECT(cache.size() <= 3);
  }
  KJ_EXPECT(cache.find("key99", START) != nullptr);
  KJ_EXPECT(cache.find("key96", START) == nullptr);
}

KJ_TEST("ExpiringLruCache: TTL") {
  ExpiringLruCache<int> cache(10, 10 * kj::SECONDS);

  cache.insert("a", 1, START);
  cache.insert("b", 2, START + 5 * kj::SECONDS);

  KJ_EXPECT(cache.find("a", START + 9 * kj::SECONDS) != nullptr);
  KJ_EXPECT(cache.find("a", START + 10 * kj::SECONDS) == nullptr);

  // Expired entries are dropped on lookup.
  KJ_EXPECT(cache.size() == 1);

  // Lookups don't extend the TTL, but replacing does.
  KJ_EXPECT(cache.find("b", START + 14 * kj::SECONDS) != nullptr);
  cache.insert("b", 3, START + 14 * kj::SECONDS);
  KJ_EXPECT(cache.find("b", START + 20 * kj::SECONDS) != nullptr);
  KJ_EXPECT(cache.find("b", START + 24 * kj::SECONDS) == nullptr);
}

KJ_TEST("ExpiringLruCache: a full cache purges expired entries before evicting") {
  ExpiringLruCache<int> cache(2, 10 * kj::SECONDS);

  cache.insert("old", 1, START);
  cache.insert("fresh", 2, START + 8 * kj::SECONDS);

  // "old" is both expired and least recently used; "fresh" must survive.
  KJ_EXPECT(cache.find("fresh", START + 8 * kj::SECONDS) != nullptr);
  cache.insert("new", 3, START + 12 * kj::SECONDS);
  KJ_EXPECT(cache.size() == 2);
  KJ_EXPECT(cache.find("fresh", START + 12 * kj::SECONDS) != nullptr);
  KJ_EXPECT(cache.find("new", START + 12 * kj::SECONDS) != nullptr);

  cache.purgeExpired(START + 30 * kj::SECONDS);
  KJ_EXPECT(cache.size() == 0);
}

}  // namespace
}  // namespace texbox
