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

#ifndef TEXBOX_EXPIRING_CACHE_H_
#define TEXBOX_EXPIRING_CACHE_H_

#include <kj/string.h>
#include <kj/time.h>
#include <kj/debug.h>
#include <list>
#include <map>

namespace texbox {

template <typename Value>
class ExpiringLruCache {
  // A map with a fixed capacity and a per-entry time-to-live. Once full, inserting a new key
  // first drops every expired entry and then, if still full, evicts the least recently used one.
  // Lookups never return an expired entry.
  //
  // Time is passed in by the caller so that tests can control it. Not thread-safe; wrap in
  // kj::MutexGuarded to share.

public:
  ExpiringLruCache(size_t capacity, kj::Duration ttl): capacity(capacity), ttl(ttl) {
    KJ_REQUIRE(capacity > 0, "cache capacity must be positive");
  }
  KJ_DISALLOW_COPY(ExpiringLruCache);

  kj::Maybe<Value&> find(kj::StringPtr key, kj::TimePoint now) {
    // Returns the entry and marks it most recently used. An expired entry is dropped instead.

    auto iter = index.find(key);
    if (iter == index.end()) return nullptr;

    auto entry = iter->second;
    if (entry->expires <= now) {
      index.erase(iter);
      entries.erase(entry);
      return nullptr;
    }

    entries.splice(entries.begin(), entries, entry);
    return entry->value;
  }

  Value& insert(kj::StringPtr key, Value value, kj::TimePoint now) {
    // Insert or replace. Either way the entry's TTL starts over.

    auto iter = index.find(key);
    if (iter != index.end()) {
      auto entry = iter->second;
      entry->value = kj::mv(value);
      entry->expires = now + ttl;
      entries.splice(entries.begin(), entries, entry);
      return entry->value;
    }

    if (entries.size() >= capacity) {
      purgeExpired(now);
    }
    while (entries.size() >= capacity) {
      auto& victim = entries.back();
      index.erase(victim.key);
      entries.pop_back();
    }

    entries.push_front(Entry { kj::str(key), kj::mv(value), now + ttl });
    auto& entry = entries.front();
    index.insert(std::make_pair(kj::StringPtr(entry.key), entries.begin()));
    return entry.value;
  }

  bool erase(kj::StringPtr key) {
    auto iter = index.find(key);
    if (iter == index.end()) return false;
    entries.erase(iter->second);
    index.erase(iter);
    return true;
  }

  void purgeExpired(kj::TimePoint now) {
    for (auto iter = entries.begin(); iter != entries.end();) {
      if (iter->expires <= now) {
        index.erase(iter->key);
        iter = entries.erase(iter);
      } else {
        ++iter;
      }
    }
  }

  size_t size() const { return entries.size(); }
  // Includes entries that have expired but haven't been noticed yet.

  void clear() {
    index.clear();
    entries.clear();
  }

private:
  struct Entry {
    kj::String key;
    Value value;
    kj::TimePoint expires;
  };

  size_t capacity;
  kj::Duration ttl;

  std::list<Entry> entries;
  // Most recently used first.

  std::map<kj::StringPtr, typename std::list<Entry>::iterator> index;
  // Keys point into `entries`, which never moves its elements.
};

}  // namespace texbox

#endif // TEXBOX_EXPIRING_CACHE_H_
