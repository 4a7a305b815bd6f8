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

#include "config.h"
#include <kj/debug.h>
#include <unistd.h>
#include <string.h>

namespace texbox {

static uint parseCount(kj::StringPtr key, kj::StringPtr value) {
  KJ_IF_MAYBE(n, parseUInt(value, 10)) {
    return *n;
  } else {
    KJ_FAIL_REQUIRE("invalid config value", key, value);
  }
}

static size_t parseBytes(kj::StringPtr key, kj::StringPtr value) {
  KJ_IF_MAYBE(n, parseUInt64(value, 10)) {
    return *n;
  } else {
    KJ_FAIL_REQUIRE("invalid config value", key, value);
  }
}

static kj::Duration parseSeconds(kj::StringPtr key, kj::StringPtr value) {
  uint seconds = parseCount(key, value);
  KJ_REQUIRE(seconds > 0, "invalid config value", key, value);
  return seconds * kj::SECONDS;
}

bool applyConfigOption(Config& config, kj::StringPtr key, kj::StringPtr value) {
  if (key == "PORT") {
    config.port = parseCount(key, value);
    KJ_REQUIRE(config.port > 0 && config.port < 65536, "invalid config value", key, value);
  } else if (key == "BIND_IP") {
    config.bindIp = kj::str(value);
  } else if (key == "WORK_DIR") {
    // Workspace paths are built by appending "/<name>", so drop trailing slashes.
    size_t length = value.size();
    while (length > 1 && value[length - 1] == '/') --length;
    KJ_REQUIRE(length > 0 && value.startsWith("/"), "invalid config value", key, value);
    config.workDir = kj::heapString(value.slice(0, length));
  } else if (key == "API_KEY") {
    if (value.size() == 0) {
      config.apiKey = nullptr;
    } else {
      config.apiKey = kj::str(value);
    }
  } else if (key == "COMPILE_TIMEOUT") {
    config.tools.compileTimeout = parseSeconds(key, value);
  } else if (key == "THUMBNAIL_TIMEOUT") {
    config.tools.thumbnailTimeout = parseSeconds(key, value);
  } else if (key == "CLONE_TIMEOUT") {
    config.tools.cloneTimeout = parseSeconds(key, value);
  } else if (key == "GIT_COMPILE_TIMEOUT") {
    config.orchestrator.gitCompileTimeout = parseSeconds(key, value);
  } else if (key == "ARCHIVE_CLONE_TIMEOUT") {
    config.orchestrator.archiveCloneTimeout = parseSeconds(key, value);
  } else if (key == "KILL_GRACE") {
    config.tools.gracePeriod = parseSeconds(key, value);
  } else if (key == "MAX_OUTPUT_BYTES") {
    config.tools.maxOutput = parseBytes(key, value);
  } else if (key == "MAX_RESOURCES") {
    config.orchestrator.limits.maxResources = parseCount(key, value);
  } else if (key == "MAX_RESOURCE_BYTES") {
    config.orchestrator.limits.maxResourceBytes = parseBytes(key, value);
  } else if (key == "MAX_TOTAL_BYTES") {
    config.orchestrator.limits.maxTotalBytes = parseBytes(key, value);
  } else if (key == "MAX_REPO_BYTES") {
    config.orchestrator.limits.maxRepoBytes = parseBytes(key, value);
  } else if (key == "MAX_REPO_FILES") {
    config.orchestrator.limits.maxRepoFiles = parseCount(key, value);
  } else if (key == "MAX_BODY_BYTES") {
    config.maxBodyBytes = parseBytes(key, value);
  } else if (key == "RATE_LIMIT_WINDOW") {
    config.rateLimit.window = parseSeconds(key, value);
  } else if (key == "RATE_LIMIT_MAX_REQUESTS") {
    config.rateLimit.maxRequests = parseCount(key, value);
  } else if (key == "RATE_LIMIT_MAX_KEYS") {
    config.rateLimit.maxKeys = parseCount(key, value);
    KJ_REQUIRE(config.rateLimit.maxKeys > 0, "invalid config value", key, value);
  } else if (key == "SHUTDOWN_DRAIN") {
    config.shutdownDrain = parseSeconds(key, value);
  } else if (key == "VERBOSE") {
    config.verbose = value == "true" || value == "yes" || value == "1";
  } else {
    return false;
  }
  return true;
}

Config readConfig(kj::Maybe<kj::StringPtr> path, kj::ArrayPtr<const kj::StringPtr> environment) {
  Config config;

  KJ_IF_MAYBE(p, path) {
    auto lines = splitLines(readAll(*p));
    for (auto& line: lines) {
      auto equalsPos = KJ_ASSERT_NONNULL(line.findFirst('='), "Invalid config line", line);
      auto key = trim(line.slice(0, equalsPos));
      auto value = trim(line.slice(equalsPos + 1));

      if (!applyConfigOption(config, key, value)) {
        KJ_LOG(WARNING, "Ignoring unrecognized config option", key);
      }
    }
  }

  // Environment overrides the file.
  for (auto entry: environment) {
    if (!entry.startsWith("TEXBOX_")) continue;
    KJ_IF_MAYBE(equalsPos, entry.findFirst('=')) {
      auto key = kj::heapString(entry.slice(strlen("TEXBOX_"), *equalsPos));
      if (!applyConfigOption(config, key, entry.slice(*equalsPos + 1))) {
        KJ_LOG(WARNING, "Ignoring unrecognized environment option", key);
      }
    }
  }

  return config;
}

Config readConfig(kj::Maybe<kj::StringPtr> path) {
  kj::Vector<kj::StringPtr> environment;
  for (char** entry = environ; *entry != nullptr; ++entry) {
    environment.add(*entry);
  }
  return readConfig(path, environment);
}

}  // namespace texbox
