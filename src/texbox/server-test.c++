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

#include "server.h"
#include <kj/test.h>
#include <kj/debug.h>
#include <stdlib.h>
#include <string.h>
#include <time.h>

namespace texbox {
namespace {

bool hasSubstring(kj::StringPtr haystack, kj::StringPtr needle) {
  return strstr(haystack.cStr(), needle.cStr()) != nullptr;
}

struct Reply {
  uint status;
  kj::String body;
  kj::HttpHeaders headers;
};

struct FixtureSettings {
  kj::Maybe<kj::StringPtr> apiKey;
  uint maxRequests = 1000;
  size_t maxBodyBytes = 1u << 20;
};

class ServerFixture {
  // A TexboxService behind a real kj::HttpServer, talked to over in-memory connections.

public:
  explicit ServerFixture(FixtureSettings settings = FixtureSettings())
      : io(kj::setupAsyncIo()),
        subprocesses(io.unixEventPort),
        runner(*io.lowLevelProvider, io.provider->getTimer(), subprocesses),
        tools(runner, ToolSettings()),
        baseDir(makeBaseDir()),
        workspaces(baseDir),
        orchestrator(workspaces, tools, OrchestratorSettings()),
        rateLimiter(io.provider->getTimer(), rateLimitOptions(settings.maxRequests)),
        tables(headerTableBuilder),
        hApiKey(headerTableBuilder.add("X-API-Key")),
        hRequestId(headerTableBuilder.add("X-Request-Id")),
        hRetryAfter(headerTableBuilder.add("Retry-After")),
        hRemaining(headerTableBuilder.add("X-RateLimit-Remaining")),
        hLimit(headerTableBuilder.add("X-RateLimit-Limit")),
        hReset(headerTableBuilder.add("X-RateLimit-Reset")),
        headerTable(headerTableBuilder.build()),
        service(io.provider->getTimer(), orchestrator, tools, workspaces, rateLimiter, tables,
                serviceOptions(settings)),
        server(io.provider->getTimer(), *headerTable, service) {}

  ~ServerFixture() noexcept(false) {
    recursivelyDelete(baseDir);
  }

  Reply request(kj::HttpMethod method, kj::StringPtr url, kj::StringPtr body = nullptr,
                kj::Maybe<kj::StringPtr> apiKey = nullptr,
                kj::Maybe<kj::StringPtr> requestId = nullptr) {
    auto pipe = kj::newTwoWayPipe();
    auto listenTask = server.listenHttp(kj::mv(pipe.ends[0]))
        .eagerlyEvaluate([](kj::Exception&& exception) {
      KJ_LOG(INFO, "test connection ended", exception);
    });
    auto client = kj::newHttpClient(*headerTable, *pipe.ends[1]);

    kj::HttpHeaders headers(*headerTable);
    KJ_IF_MAYBE(k, apiKey) {
      headers.set(hApiKey, *k);
    }
    KJ_IF_MAYBE(id, requestId) {
      headers.set(hRequestId, *id);
    }
    if (body.size() > 0) {
      headers.set(kj::HttpHeaderId::CONTENT_TYPE, "application/json");
    }

    auto req = client->request(method, url, headers, uint64_t(body.size()));

    // The server may answer without reading the body, so don't wait for the write.
    auto bodyStream = kj::mv(req.body);
    auto writeTask = bodyStream->write(body.begin(), body.size())
        .attach(kj::mv(bodyStream))
        .eagerlyEvaluate([](kj::Exception&& exception) {
      KJ_LOG(INFO, "request body not consumed", exception);
    });

    auto response = req.response.wait(io.waitScope);
    auto text = response.body->readAllText().wait(io.waitScope);
    return Reply { response.statusCode, kj::mv(text), response.headers->clone() };
  }

  kj::Maybe<kj::StringPtr> header(const Reply& reply, kj::HttpHeaderId id) {
    return reply.headers.get(id);
  }

  kj::AsyncIoContext io;
  SubprocessSet subprocesses;
  ProcessRunner runner;
  ToolInvoker tools;
  kj::String baseDir;
  WorkspaceManager workspaces;
  Orchestrator orchestrator;
  RateLimiter rateLimiter;
  kj::HttpHeaderTable::Builder headerTableBuilder;
  TexboxService::Tables tables;
  kj::HttpHeaderId hApiKey;
  kj::HttpHeaderId hRequestId;
  kj::HttpHeaderId hRetryAfter;
  kj::HttpHeaderId hRemaining;
  kj::HttpHeaderId hLimit;
  kj::HttpHeaderId hReset;
  kj::Own<kj::HttpHeaderTable> headerTable;
  TexboxService service;
  kj::HttpServer server;

private:
  static kj::String makeBaseDir() {
    char dirTemplate[] = "/tmp/texbox-server-test.XXXXXX";
    KJ_ASSERT(mkdtemp(dirTemplate) != nullptr);
    return kj::heapString(dirTemplate);
  }

  static RateLimiter::Options rateLimitOptions(uint maxRequests) {
    RateLimiter::Options options;
    options.maxRequests = maxRequests;
    return options;
  }

  static TexboxService::Options serviceOptions(const FixtureSettings& settings) {
    TexboxService::Options options;
    KJ_IF_MAYBE(k, settings.apiKey) {
      options.apiKey = kj::str(*k);
    }
    options.maxBodyBytes = settings.maxBodyBytes;
    return options;
  }
};

KJ_TEST("TexboxService: routing") {
  ServerFixture f;

  auto missing = f.request(kj::HttpMethod::POST, "/nope", "{}");
  KJ_EXPECT(missing.status == 404);
  KJ_EXPECT(hasSubstring(missing.body, "\"error\":\"Not found\""), missing.body);

  auto wrongMethod = f.request(kj::HttpMethod::GET, "/compile");
  KJ_EXPECT(wrongMethod.status == 405);
  KJ_EXPECT(hasSubstring(wrongMethod.body, "Method not allowed"), wrongMethod.body);

  // The query string plays no part in routing.
  auto withQuery = f.request(kj::HttpMethod::POST, "/compile?verbose=1", "{\"target\":\"\"}");
  KJ_EXPECT(withQuery.status == 400);
  KJ_EXPECT(hasSubstring(withQuery.body, "Missing target file"), withQuery.body);

  KJ_EXPECT(f.request(kj::HttpMethod::GET, "/git/refs").status == 405);
  KJ_EXPECT(f.request(kj::HttpMethod::GET, "/git/file-hash").status == 405);

  auto refs = f.request(kj::HttpMethod::POST, "/git/refs", "{}");
  KJ_EXPECT(refs.status == 400);
  KJ_EXPECT(hasSubstring(refs.body, "Missing gitUrl"), refs.body);

  auto fileHash = f.request(kj::HttpMethod::POST, "/git/file-hash",
      "{\"gitUrl\":\"https://example.com/r.git\",\"filePaths\":[]}");
  KJ_EXPECT(fileHash.status == 400);
  KJ_EXPECT(hasSubstring(fileHash.body, "Missing filePath or filePaths"), fileHash.body);

  auto branch = f.request(kj::HttpMethod::POST, "/git/refs",
      "{\"gitUrl\":\"https://example.com/r.git\",\"branch\":\"a..b:c\"}");
  KJ_EXPECT(branch.status == 400);
  KJ_EXPECT(hasSubstring(branch.body, "Invalid branch"), branch.body);
}

KJ_TEST("TexboxService: health") {
  ServerFixture f;

  // 200 or 503 depending on which tools this machine has.
  auto reply = f.request(kj::HttpMethod::GET, "/health");
  KJ_EXPECT(reply.status == 200 || reply.status == 503, reply.status);
  KJ_EXPECT(hasSubstring(reply.body, "\"checks\":["), reply.body);
  KJ_EXPECT(hasSubstring(reply.body, "\"tool\":\"latexmk\""), reply.body);
  KJ_EXPECT(hasSubstring(reply.body, "\"pendingWorkspaces\":0"), reply.body);
  KJ_EXPECT(hasSubstring(reply.body, "\"shuttingDown\":false"), reply.body);
  if (reply.status == 200) {
    KJ_EXPECT(hasSubstring(reply.body, "\"status\":\"ok\""));
  } else {
    KJ_EXPECT(hasSubstring(reply.body, "\"status\":\"degraded\""));
  }
}

KJ_TEST("TexboxService: request bodies") {
  FixtureSettings settings;
  settings.maxBodyBytes = 64;
  ServerFixture f(settings);

  auto malformed = f.request(kj::HttpMethod::POST, "/compile", "{\"target\": ");
  KJ_EXPECT(malformed.status == 400);
  KJ_EXPECT(hasSubstring(malformed.body, "Invalid JSON body"), malformed.body);
  KJ_EXPECT(hasSubstring(malformed.body, "\"kind\":\"validation\""), malformed.body);

  auto tooBig = f.request(kj::HttpMethod::POST, "/compile",
      "{\"target\":\"main.tex\",\"resources\":[{\"path\":\"main.tex\",\"content\":\"xxxxxxxx\"}]}");
  KJ_EXPECT(tooBig.status == 413);
  KJ_EXPECT(hasSubstring(tooBig.body, "Request body too large"), tooBig.body);
  KJ_EXPECT(hasSubstring(tooBig.body, "\"kind\":\"resourceExceeded\""), tooBig.body);

  auto badTarget = f.request(kj::HttpMethod::POST, "/compile",
      "{\"target\":\"../x.tex\",\"resources\":[]}");
  KJ_EXPECT(badTarget.status == 400);
  KJ_EXPECT(hasSubstring(badTarget.body, "Invalid target path"), badTarget.body);

  auto badWidth = f.request(kj::HttpMethod::POST, "/thumbnail",
      "{\"pdfBase64\":\"JVBERg==\",\"width\":0}");
  KJ_EXPECT(badWidth.status == 400);
  KJ_EXPECT(hasSubstring(badWidth.body, "Width must be between"), badWidth.body);

  KJ_EXPECT(f.workspaces.pendingCount() == 0);
}

KJ_TEST("TexboxService: resource content as bytes") {
  ServerFixture f;

  // Bytes are decoded and written; the target check runs after the workspace is populated.
  auto bytes = f.request(kj::HttpMethod::POST, "/compile",
      "{\"target\":\"other.tex\",\"resources\":"
      "[{\"path\":\"main.tex\",\"content\":[92,114,101,108,97,120],\"encoding\":\"bytes\"}]}");
  KJ_EXPECT(bytes.status == 404, bytes.body);
  KJ_EXPECT(hasSubstring(bytes.body, "Target file not found: other.tex"), bytes.body);

  auto mismatch = f.request(kj::HttpMethod::POST, "/compile",
      "{\"target\":\"main.tex\",\"resources\":"
      "[{\"path\":\"main.tex\",\"content\":\"XHJlbGF4\",\"encoding\":\"bytes\"}]}");
  KJ_EXPECT(mismatch.status == 400);
  KJ_EXPECT(hasSubstring(mismatch.body,
      "Resource content must be an array of bytes for encoding bytes: main.tex"), mismatch.body);
  KJ_EXPECT(hasSubstring(mismatch.body, "\"kind\":\"validation\""), mismatch.body);

  auto textAsBytes = f.request(kj::HttpMethod::POST, "/compile",
      "{\"target\":\"main.tex\",\"resources\":"
      "[{\"path\":\"main.tex\",\"content\":[120],\"encoding\":\"base64\"}]}");
  KJ_EXPECT(textAsBytes.status == 400);
  KJ_EXPECT(hasSubstring(textAsBytes.body,
      "Resource content must be a string for encoding base64: main.tex"), textAsBytes.body);

  auto outOfRange = f.request(kj::HttpMethod::POST, "/compile",
      "{\"target\":\"main.tex\",\"resources\":"
      "[{\"path\":\"main.tex\",\"content\":[256],\"encoding\":\"bytes\"}]}");
  KJ_EXPECT(outOfRange.status == 400);
  KJ_EXPECT(hasSubstring(outOfRange.body, "Invalid JSON body"), outOfRange.body);

  KJ_EXPECT(f.workspaces.pendingCount() == 0);
}

KJ_TEST("TexboxService: API key") {
  FixtureSettings settings;
  settings.apiKey = kj::StringPtr("correct horse");
  ServerFixture f(settings);

  auto none = f.request(kj::HttpMethod::POST, "/compile", "{}");
  KJ_EXPECT(none.status == 401);
  KJ_EXPECT(hasSubstring(none.body, "Unauthorized"), none.body);

  auto wrong = f.request(kj::HttpMethod::POST, "/compile", "{}", kj::StringPtr("battery staple"));
  KJ_EXPECT(wrong.status == 401);

  auto prefix = f.request(kj::HttpMethod::POST, "/compile", "{}", kj::StringPtr("correct"));
  KJ_EXPECT(prefix.status == 401);

  auto right = f.request(kj::HttpMethod::POST, "/compile", "{}", kj::StringPtr("correct horse"));
  KJ_EXPECT(right.status == 400);
  KJ_EXPECT(hasSubstring(right.body, "Missing target file"), right.body);

  // Health checks need no key.
  auto health = f.request(kj::HttpMethod::GET, "/health");
  KJ_EXPECT(health.status != 401);
}

KJ_TEST("TexboxService: rate limiting") {
  FixtureSettings settings;
  settings.maxRequests = 2;
  ServerFixture f(settings);

  auto first = f.request(kj::HttpMethod::POST, "/compile", "{}");
  KJ_EXPECT(first.status == 400);
  KJ_EXPECT(KJ_ASSERT_NONNULL(f.header(first, f.hLimit)) == "2");
  KJ_EXPECT(KJ_ASSERT_NONNULL(f.header(first, f.hRemaining)) == "1");

  // The reset header is a Unix time, not a delay.
  uint64_t now = time(nullptr);
  auto reset = KJ_ASSERT_NONNULL(parseUInt64(KJ_ASSERT_NONNULL(f.header(first, f.hReset)), 10));
  KJ_EXPECT(reset >= now && reset <= now + 61, reset, now);

  auto second = f.request(kj::HttpMethod::POST, "/compile", "{}");
  KJ_EXPECT(second.status == 400);
  KJ_EXPECT(KJ_ASSERT_NONNULL(f.header(second, f.hRemaining)) == "0");

  auto third = f.request(kj::HttpMethod::POST, "/compile", "{}");
  KJ_EXPECT(third.status == 429);
  KJ_EXPECT(hasSubstring(third.body, "Too many requests"), third.body);
  auto retryAfter = KJ_ASSERT_NONNULL(f.header(third, f.hRetryAfter));
  auto seconds = KJ_ASSERT_NONNULL(parseUInt(retryAfter, 10));
  KJ_EXPECT(seconds >= 1 && seconds <= 60, seconds);
  KJ_EXPECT(hasSubstring(third.body, kj::str("\"retryAfter\":", seconds)), third.body);

  // Health checks aren't counted.
  auto health = f.request(kj::HttpMethod::GET, "/health");
  KJ_EXPECT(health.status != 429);
}

KJ_TEST("TexboxService: request IDs") {
  ServerFixture f;

  auto echoed = f.request(kj::HttpMethod::POST, "/nope", "{}", nullptr,
                          kj::StringPtr("abc-123_x.y"));
  KJ_EXPECT(KJ_ASSERT_NONNULL(f.header(echoed, f.hRequestId)) == "abc-123_x.y");

  auto replaced = f.request(kj::HttpMethod::POST, "/nope", "{}", nullptr,
                            kj::StringPtr("has/slash"));
  auto id = KJ_ASSERT_NONNULL(f.header(replaced, f.hRequestId));
  KJ_EXPECT(id.size() == 16, id);
  KJ_EXPECT(id != "has/slash");

  auto generated = f.request(kj::HttpMethod::POST, "/nope", "{}");
  KJ_EXPECT(KJ_ASSERT_NONNULL(f.header(generated, f.hRequestId)).size() == 16);
}

KJ_TEST("TexboxService: shutting down") {
  ServerFixture f;
  f.service.beginShutdown();

  auto reply = f.request(kj::HttpMethod::POST, "/compile", "{}");
  KJ_EXPECT(reply.status == 503);
  KJ_EXPECT(hasSubstring(reply.body, "Server is shutting down"), reply.body);

  auto missing = f.request(kj::HttpMethod::POST, "/nope", "{}");
  KJ_EXPECT(missing.status == 503);

  // Health keeps answering so a load balancer can see the drain.
  auto health = f.request(kj::HttpMethod::GET, "/health");
  KJ_EXPECT(health.status == 200 || health.status == 503, health.status);
  KJ_EXPECT(hasSubstring(health.body, "\"shuttingDown\":true"), health.body);
  KJ_EXPECT(hasSubstring(health.body, "\"checks\":["), health.body);
  KJ_EXPECT(!hasSubstring(health.body, "Server is shutting down"), health.body);
}

}  // namespace
}  // namespace texbox
