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
#include <kj/test.h>
#include <kj/debug.h>
#include <stdlib.h>
#include <unistd.h>

namespace texbox {
namespace {

class TempConfig {
public:
  explicit TempConfig(kj::StringPtr content) {
    char pathTemplate[] = "/tmp/texbox-config-test.XXXXXX";
    int fd;
    KJ_SYSCALL(fd = mkstemp(pathTemplate));
    kj::AutoCloseFd closer(fd);
    path = kj::heapString(pathTemplate);
    writeFile(path, content.asBytes());
  }
  ~TempConfig() noexcept(false) {
    KJ_SYSCALL(unlink(path.cStr()));
  }
  KJ_DISALLOW_COPY(TempConfig);

  kj::StringPtr getPath() { return path; }

private:
  kj::String path;
};

KJ_TEST("readConfig defaults") {
  auto config = readConfig(nullptr, nullptr);

  KJ_EXPECT(config.port == 3001);
  KJ_EXPECT(config.bindIp == "0.0.0.0");
  KJ_EXPECT(config.workDir == "/tmp");
  KJ_EXPECT(config.apiKey == nullptr);
  KJ_EXPECT(config.tools.compileTimeout == 180 * kj::SECONDS);
  KJ_EXPECT(config.tools.cloneTimeout == 60 * kj::SECONDS);
  KJ_EXPECT(config.orchestrator.gitCompileTimeout == 300 * kj::SECONDS);
  KJ_EXPECT(config.orchestrator.limits.maxResources == 100);
  KJ_EXPECT(config.rateLimit.maxRequests == 30);
  KJ_EXPECT(config.rateLimit.window == 60 * kj::SECONDS);
  KJ_EXPECT(!config.verbose);
}

KJ_TEST("readConfig from file") {
  TempConfig file(
      "# texbox settings\n"
      "PORT=8080\n"
      "\n"
      "  BIND_IP = 127.0.0.1  \n"
      "WORK_DIR=/var/tmp/texbox//\n"
      "API_KEY=s3cret\n"
      "COMPILE_TIMEOUT=90\n"
      "MAX_RESOURCES=7\n"
      "MAX_TOTAL_BYTES=1048576\n"
      "RATE_LIMIT_WINDOW=10\n"
      "RATE_LIMIT_MAX_REQUESTS=5\n"
      "VERBOSE=yes\n");

  auto config = readConfig(file.getPath(), nullptr);

  KJ_EXPECT(config.port == 8080);
  KJ_EXPECT(config.bindIp == "127.0.0.1");
  KJ_EXPECT(config.workDir == "/var/tmp/texbox", config.workDir);
  KJ_EXPECT(KJ_ASSERT_NONNULL(config.apiKey) == "s3cret");
  KJ_EXPECT(config.tools.compileTimeout == 90 * kj::SECONDS);
  KJ_EXPECT(config.orchestrator.limits.maxResources == 7);
  KJ_EXPECT(config.orchestrator.limits.maxTotalBytes == 1048576);
  KJ_EXPECT(config.rateLimit.window == 10 * kj::SECONDS);
  KJ_EXPECT(config.rateLimit.maxRequests == 5);
  KJ_EXPECT(config.verbose);
}

KJ_TEST("readConfig: environment overrides the file") {
  TempConfig file("PORT=8080\nAPI_KEY=from-file\nCLONE_TIMEOUT=20\n");

  const kj::StringPtr environment[] = {
    "PATH=/usr/bin",
    "PORT=1",
    "TEXBOX_PORT=9090",
    "TEXBOX_API_KEY=",
    "TEXBOX_GIT_COMPILE_TIMEOUT=600",
  };
  auto config = readConfig(file.getPath(), environment);

  KJ_EXPECT(config.port == 9090);
  KJ_EXPECT(config.apiKey == nullptr);
  KJ_EXPECT(config.tools.cloneTimeout == 20 * kj::SECONDS);
  KJ_EXPECT(config.orchestrator.gitCompileTimeout == 600 * kj::SECONDS);
}

KJ_TEST("readConfig: unknown options are ignored") {
  TempConfig file("NOT_A_THING=1\nPORT=4000\n");
  const kj::StringPtr environment[] = { "TEXBOX_ALSO_NOT_A_THING=2" };

  KJ_EXPECT_LOG(WARNING, "unrecognized config option");
  KJ_EXPECT_LOG(WARNING, "unrecognized environment option");
  auto config = readConfig(file.getPath(), environment);
  KJ_EXPECT(config.port == 4000);
}

KJ_TEST("readConfig: bad values") {
  {
    TempConfig file("PORT\n");
    KJ_EXPECT_THROW_MESSAGE("Invalid config line", readConfig(file.getPath(), nullptr));
  }

  Config config;
  KJ_EXPECT_THROW_MESSAGE("invalid config value", applyConfigOption(config, "PORT", "70000"));
  KJ_EXPECT_THROW_MESSAGE("invalid config value", applyConfigOption(config, "PORT", "http"));
  KJ_EXPECT_THROW_MESSAGE("invalid config value",
      applyConfigOption(config, "COMPILE_TIMEOUT", "0"));
  KJ_EXPECT_THROW_MESSAGE("invalid config value",
      applyConfigOption(config, "MAX_TOTAL_BYTES", "-5"));
  KJ_EXPECT_THROW_MESSAGE("invalid config value",
      applyConfigOption(config, "WORK_DIR", "relative/path"));
  KJ_EXPECT_THROW_MESSAGE("invalid config value",
      applyConfigOption(config, "RATE_LIMIT_MAX_KEYS", "0"));

  KJ_EXPECT(applyConfigOption(config, "WORK_DIR", "/"));
  KJ_EXPECT(config.workDir == "/");
  KJ_EXPECT(!applyConfigOption(config, "port", "80"));
}

}  // namespace
}  // namespace texbox
