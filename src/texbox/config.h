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

#ifndef TEXBOX_CONFIG_H_
#define TEXBOX_CONFIG_H_

#include "orchestrator.h"
#include "rate-limit.h"

namespace texbox {

struct Config {
  uint port = 3001;
  kj::String bindIp = kj::str("0.0.0.0");
  kj::String workDir = kj::str("/tmp");
  kj::Maybe<kj::String> apiKey = nullptr;
  ToolSettings tools;
  OrchestratorSettings orchestrator;
  RateLimiter::Options rateLimit;
  size_t maxBodyBytes = 80u << 20;
  kj::Duration shutdownDrain = 25 * kj::SECONDS;
  bool verbose = false;
};

// Build the server configuration: defaults, overridden by the KEY=value file at `path` (if
// any), overridden by TEXBOX_KEY=value entries of `environment`. Invalid values throw.
Config readConfig(kj::Maybe<kj::StringPtr> path, kj::ArrayPtr<const kj::StringPtr> environment);

// Same, using our own process environment.
Config readConfig(kj::Maybe<kj::StringPtr> path);

// Apply a single option. Returns false if `key` isn't one we know.
bool applyConfigOption(Config& config, kj::StringPtr key, kj::StringPtr value);

}  // namespace texbox

#endif // TEXBOX_CONFIG_H_
