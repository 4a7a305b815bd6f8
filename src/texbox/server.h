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

#ifndef TEXBOX_SERVER_H_
#define TEXBOX_SERVER_H_

#include <kj/compat/http.h>
#include <capnp/compat/json.h>
#include "orchestrator.h"
#include "rate-limit.h"

namespace texbox {

class TexboxService: public kj::HttpService {
  // The HTTP API. Decodes JSON requests, applies authentication and rate limiting, hands the
  // request to the Orchestrator and turns its result into a response. Every failure a client can
  // see is an ErrorResponse.

public:
  class Tables {
    // Header IDs. Create at startup, before the header table is built.

  public:
    Tables(kj::HttpHeaderTable::Builder& headerTableBuilder);

    inline kj::HttpHeaderId getRealIpHeader() const { return hXRealIp; }

  private:
    friend class TexboxService;

    const kj::HttpHeaderTable& headerTable;

    kj::HttpHeaderId hXApiKey;
    kj::HttpHeaderId hXRequestId;
    kj::HttpHeaderId hXRealIp;
    kj::HttpHeaderId hXRateLimitLimit;
    kj::HttpHeaderId hXRateLimitRemaining;
    kj::HttpHeaderId hXRateLimitReset;
    kj::HttpHeaderId hRetryAfter;
    kj::HttpHeaderId hXDependencies;
  };

  struct Options {
    kj::Maybe<kj::String> apiKey;
    // If set, every route except /health requires it in X-API-Key.

    size_t maxBodyBytes = 80u << 20;
  };

  TexboxService(kj::Timer& timer, Orchestrator& orchestrator, ToolInvoker& tools,
                WorkspaceManager& workspaces, RateLimiter& rateLimiter, Tables& tables,
                Options options);
  KJ_DISALLOW_COPY(TexboxService);

  kj::Promise<void> request(
      kj::HttpMethod method, kj::StringPtr url, const kj::HttpHeaders& headers,
      kj::AsyncInputStream& requestBody, Response& response) override;

  void beginShutdown() { shuttingDown = true; }
  // From now on, answer every request except /health with 503.

private:
  kj::Timer& timer;
  Orchestrator& orchestrator;
  ToolInvoker& tools;
  WorkspaceManager& workspaces;
  RateLimiter& rateLimiter;
  Tables& tables;
  Options options;
  ResourceContentJsonHandler resourceContentHandler;
  capnp::JsonCodec json;
  bool shuttingDown = false;

  enum class Route {
    HEALTH,
    COMPILE,
    COMPILE_FROM_GIT,
    THUMBNAIL,
    GIT_ARCHIVE,
    GIT_TREE,
    GIT_FILE,
    GIT_REFS,
    GIT_FILE_HASH
  };

  class Exchange;

  kj::Promise<void> handle(Exchange& exchange, kj::HttpMethod method, kj::StringPtr url,
                           const kj::HttpHeaders& headers, kj::AsyncInputStream& requestBody);
  kj::Promise<void> dispatch(Exchange& exchange, Route route, kj::String body);
  kj::Promise<void> handleHealth(Exchange& exchange);

  bool checkApiKey(const kj::HttpHeaders& headers);
  kj::String rateLimitKey(const kj::HttpHeaders& headers);

  template <typename T>
  kj::Maybe<Failure> decodeBody(kj::StringPtr body, typename T::Builder root);

  kj::Promise<void> sendFailure(Exchange& exchange, Failure&& failure);
  kj::Promise<void> sendPdf(Exchange& exchange, Result<CompileOutput>&& result);
};

kj::Promise<kj::Maybe<kj::String>> readBody(kj::AsyncInputStream& body, size_t limit);
// Read the whole request body as text. Returns null, without reading further, as soon as the
// body is known to exceed `limit` bytes.

kj::StringPtr statusText(uint status);

}  // namespace texbox

#endif // TEXBOX_SERVER_H_
