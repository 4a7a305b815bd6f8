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
#include <kj/debug.h>
#include <capnp/message.h>
#include <sodium/utils.h>
#include <ctype.h>
#include <time.h>

namespace texbox {

TexboxService::Tables::Tables(kj::HttpHeaderTable::Builder& headerTableBuilder)
    : headerTable(headerTableBuilder.getFutureTable()),
      hXApiKey(headerTableBuilder.add("X-API-Key")),
      hXRequestId(headerTableBuilder.add("X-Request-Id")),
      hXRealIp(headerTableBuilder.add("X-Real-IP")),
      hXRateLimitLimit(headerTableBuilder.add("X-RateLimit-Limit")),
      hXRateLimitRemaining(headerTableBuilder.add("X-RateLimit-Remaining")),
      hXRateLimitReset(headerTableBuilder.add("X-RateLimit-Reset")),
      hRetryAfter(headerTableBuilder.add("Retry-After")),
      hXDependencies(headerTableBuilder.add("X-Dependencies")) {}

kj::StringPtr statusText(uint status) {
  switch (status) {
    case 200: return "OK";
    case 400: return "Bad Request";
    case 401: return "Unauthorized";
    case 404: return "Not Found";
    case 405: return "Method Not Allowed";
    case 413: return "Payload Too Large";
    case 429: return "Too Many Requests";
    case 500: return "Internal Server Error";
    case 503: return "Service Unavailable";
    default: return "Unknown";
  }
}

static uint ceilSeconds(kj::Duration duration) {
  if (duration <= 0 * kj::SECONDS) return 0;
  return (duration + kj::SECONDS - 1 * kj::NANOSECONDS) / kj::SECONDS;
}

static bool isAcceptableRequestId(kj::StringPtr id) {
  // Echoed into our logs and response headers, so keep it short and boring.
  if (id.size() == 0 || id.size() > 128) return false;
  for (char c: id) {
    if (!isalnum(c) && c != '-' && c != '_' && c != '.') return false;
  }
  return true;
}

namespace {

class BodyReader {
public:
  BodyReader(kj::AsyncInputStream& input, size_t limit): input(input), limit(limit) {}

  kj::Promise<kj::Maybe<kj::String>> read() {
    return input.tryRead(buffer, 1, sizeof(buffer))
        .then([this](size_t n) -> kj::Promise<kj::Maybe<kj::String>> {
      if (n == 0) {
        content.add('\0');
        return kj::Maybe<kj::String>(kj::String(content.releaseAsArray()));
      }
      if (content.size() + n > limit) {
        return kj::Maybe<kj::String>(nullptr);
      }
      content.addAll(buffer, buffer + n);
      return read();
    });
  }

private:
  kj::AsyncInputStream& input;
  size_t limit;
  kj::Vector<char> content;
  char buffer[8192];
};

}  // namespace

kj::Promise<kj::Maybe<kj::String>> readBody(kj::AsyncInputStream& body, size_t limit) {
  KJ_IF_MAYBE(length, body.tryGetLength()) {
    if (*length > limit) {
      return kj::Maybe<kj::String>(nullptr);
    }
  }

  auto reader = kj::heap<BodyReader>(body, limit);
  auto promise = reader->read();
  return promise.attach(kj::mv(reader));
}

// =======================================================================================

class TexboxService::Exchange {
  // One request/response pair. Accumulates response headers until the response is sent.

public:
  Exchange(Tables& tables, Response& response, kj::String requestId)
      : headers(tables.headerTable), response(response), requestId(kj::mv(requestId)) {
    headers.set(tables.hXRequestId, this->requestId);
  }

  kj::HttpHeaders headers;

  kj::StringPtr getRequestId() const { return requestId; }
  bool hasResponded() const { return status != 0; }
  uint getStatus() const { return status; }

  kj::Promise<void> send(uint statusCode, kj::StringPtr contentType, kj::Array<byte> body) {
    status = statusCode;
    headers.set(kj::HttpHeaderId::CONTENT_TYPE, contentType);
    auto stream = response.send(statusCode, statusText(statusCode), headers, body.size());
    auto promise = stream->write(body.begin(), body.size());
    return promise.attach(kj::mv(stream), kj::mv(body));
  }

  kj::Promise<void> sendJson(uint statusCode, kj::String text) {
    status = statusCode;
    headers.set(kj::HttpHeaderId::CONTENT_TYPE, "application/json; charset=UTF-8");
    auto stream = response.send(statusCode, statusText(statusCode), headers, text.size());
    auto promise = stream->write(text.begin(), text.size());
    return promise.attach(kj::mv(stream), kj::mv(text));
  }

private:
  Response& response;
  kj::String requestId;
  uint status = 0;
};

TexboxService::TexboxService(kj::Timer& timer, Orchestrator& orchestrator, ToolInvoker& tools,
                             WorkspaceManager& workspaces, RateLimiter& rateLimiter,
                             Tables& tables, Options options)
    : timer(timer), orchestrator(orchestrator), tools(tools), workspaces(workspaces),
      rateLimiter(rateLimiter), tables(tables), options(kj::mv(options)) {
  json.addTypeHandler(resourceContentHandler);
}

kj::Promise<void> TexboxService::request(
    kj::HttpMethod method, kj::StringPtr url, const kj::HttpHeaders& headers,
    kj::AsyncInputStream& requestBody, Response& response) {
  kj::String requestId;
  KJ_IF_MAYBE(id, headers.get(tables.hXRequestId)) {
    if (isAcceptableRequestId(*id)) {
      requestId = kj::str(*id);
    }
  }
  if (requestId.size() == 0) {
    requestId = randomHex(8);
  }

  auto exchange = kj::heap<Exchange>(tables, response, kj::mv(requestId));
  auto& ref = *exchange;
  auto start = timer.now();

  return kj::evalNow([&]() {
    return handle(ref, method, url, headers, requestBody);
  }).catch_([this, &ref](kj::Exception&& exception) -> kj::Promise<void> {
    if (ref.hasResponded() || exception.getType() == kj::Exception::Type::DISCONNECTED) {
      // Too late to tell the client anything; let the HTTP server drop the connection.
      kj::throwFatalException(kj::mv(exception));
    }
    KJ_LOG(ERROR, "request failed", ref.getRequestId(), exception);
    return sendFailure(ref, Failure::internal());
  }).then([this, &ref, start]() {
    KJ_LOG(INFO, "request completed", ref.getRequestId(), ref.getStatus(),
           (timer.now() - start) / kj::MILLISECONDS);
  }).attach(kj::mv(exchange));
}

kj::Promise<void> TexboxService::handle(
    Exchange& exchange, kj::HttpMethod method, kj::StringPtr url,
    const kj::HttpHeaders& headers, kj::AsyncInputStream& requestBody) {
  kj::StringPtr path = url;
  kj::String pathStorage;
  KJ_IF_MAYBE(q, url.findFirst('?')) {
    pathStorage = kj::heapString(url.slice(0, *q));
    path = pathStorage;
  }

  struct RouteInfo {
    const char* path;
    kj::HttpMethod method;
    Route route;
  };
  static const RouteInfo ROUTES[] = {
    { "/health", kj::HttpMethod::GET, Route::HEALTH },
    { "/compile", kj::HttpMethod::POST, Route::COMPILE },
    { "/compile-from-git", kj::HttpMethod::POST, Route::COMPILE_FROM_GIT },
    { "/thumbnail", kj::HttpMethod::POST, Route::THUMBNAIL },
    { "/git/archive", kj::HttpMethod::POST, Route::GIT_ARCHIVE },
    { "/git/tree", kj::HttpMethod::POST, Route::GIT_TREE },
    { "/git/file", kj::HttpMethod::POST, Route::GIT_FILE },
    { "/git/refs", kj::HttpMethod::POST, Route::GIT_REFS },
    { "/git/file-hash", kj::HttpMethod::POST, Route::GIT_FILE_HASH },
  };

  const RouteInfo* match = nullptr;
  for (auto& info: ROUTES) {
    if (path == info.path) {
      match = &info;
      break;
    }
  }

  KJ_LOG(INFO, "request", exchange.getRequestId(), method, path);

  if (shuttingDown && (match == nullptr || match->route != Route::HEALTH)) {
    return sendFailure(exchange, Failure { ErrorKind::INTERNAL, 503,
        kj::str("Server is shutting down"), nullptr, false, nullptr });
  }
  if (match == nullptr) {
    return sendFailure(exchange, Failure::notFound("Not found"));
  }
  if (match->method != method) {
    return sendFailure(exchange, Failure::validation("Method not allowed", 405));
  }
  if (match->route == Route::HEALTH) {
    return handleHealth(exchange);
  }

  if (!checkApiKey(headers)) {
    return sendFailure(exchange, Failure::validation("Unauthorized", 401));
  }

  auto decision = rateLimiter.admit(rateLimitKey(headers));
  exchange.headers.set(tables.hXRateLimitLimit, kj::str(rateLimiter.getMaxRequests()));
  exchange.headers.set(tables.hXRateLimitRemaining, kj::str(decision.remaining));
  exchange.headers.set(tables.hXRateLimitReset,
      kj::str(time(nullptr) + ceilSeconds(decision.resetAt - timer.now())));
  if (!decision.allowed) {
    return sendFailure(exchange, Failure::rateLimited(decision.retryAfter));
  }

  Route route = match->route;
  return readBody(requestBody, options.maxBodyBytes)
      .then([this, &exchange, route](kj::Maybe<kj::String> body) -> kj::Promise<void> {
    KJ_IF_MAYBE(b, body) {
      return dispatch(exchange, route, kj::mv(*b));
    } else {
      return sendFailure(exchange, Failure::tooLarge("Request body too large"));
    }
  });
}

template <typename T>
kj::Maybe<Failure> TexboxService::decodeBody(kj::StringPtr body, typename T::Builder root) {
  KJ_IF_MAYBE(exception, kj::runCatchingExceptions([&]() {
    json.decode(body, root);
  })) {
    KJ_LOG(INFO, "malformed request body", exception->getDescription());
    return Failure::validation("Invalid JSON body");
  }
  return nullptr;
}

kj::Promise<void> TexboxService::dispatch(Exchange& exchange, Route route, kj::String body) {
  auto message = kj::heap<capnp::MallocMessageBuilder>();

  switch (route) {
    case Route::HEALTH:
      return handleHealth(exchange);

    case Route::COMPILE: {
      auto root = message->initRoot<CompileRequest>();
      KJ_IF_MAYBE(failure, decodeBody<CompileRequest>(body, root)) {
        return sendFailure(exchange, kj::mv(*failure));
      }
      return orchestrator.compile(root.asReader())
          .then([this, &exchange](Result<CompileOutput>&& result) {
        return sendPdf(exchange, kj::mv(result));
      }).attach(kj::mv(message));
    }

    case Route::COMPILE_FROM_GIT: {
      auto root = message->initRoot<CompileFromGitRequest>();
      KJ_IF_MAYBE(failure, decodeBody<CompileFromGitRequest>(body, root)) {
        return sendFailure(exchange, kj::mv(*failure));
      }
      return orchestrator.compileFromGit(root.asReader())
          .then([this, &exchange](Result<CompileOutput>&& result) {
        return sendPdf(exchange, kj::mv(result));
      }).attach(kj::mv(message));
    }

    case Route::THUMBNAIL: {
      auto root = message->initRoot<ThumbnailRequest>();
      KJ_IF_MAYBE(failure, decodeBody<ThumbnailRequest>(body, root)) {
        return sendFailure(exchange, kj::mv(*failure));
      }
      return orchestrator.thumbnail(root.asReader())
          .then([this, &exchange](Result<ImageOutput>&& result) {
        if (result.is<Failure>()) {
          return sendFailure(exchange, kj::mv(result.get<Failure>()));
        }
        auto& image = result.get<ImageOutput>();
        return exchange.send(200, image.contentType, kj::mv(image.data));
      }).attach(kj::mv(message));
    }

    case Route::GIT_ARCHIVE: {
      auto root = message->initRoot<ArchiveRequest>();
      KJ_IF_MAYBE(failure, decodeBody<ArchiveRequest>(body, root)) {
        return sendFailure(exchange, kj::mv(*failure));
      }
      return orchestrator.archive(root.asReader())
          .then([this, &exchange](Result<ArchiveOutput>&& result) {
        if (result.is<Failure>()) {
          return sendFailure(exchange, kj::mv(result.get<Failure>()));
        }
        auto& archive = result.get<ArchiveOutput>();

        capnp::MallocMessageBuilder reply;
        auto response = reply.initRoot<ArchiveResponse>();
        auto files = response.initFiles(archive.files.size());
        for (auto i: kj::indices(archive.files)) {
          auto& file = archive.files[i];
          auto out = files[i];
          out.setPath(file.path);
          out.setContent(file.content);
          out.setEncoding(file.base64 ? "base64" : "utf-8");
        }
        auto missing = response.initMissingPaths(archive.missingPaths.size());
        for (auto i: kj::indices(archive.missingPaths)) {
          missing.set(i, archive.missingPaths[i]);
        }
        return exchange.sendJson(200, json.encode(response.asReader()));
      }).attach(kj::mv(message));
    }

    case Route::GIT_TREE: {
      auto root = message->initRoot<TreeRequest>();
      KJ_IF_MAYBE(failure, decodeBody<TreeRequest>(body, root)) {
        return sendFailure(exchange, kj::mv(*failure));
      }
      return orchestrator.tree(root.asReader())
          .then([this, &exchange](Result<kj::Array<RepoEntry>>&& result) {
        if (result.is<Failure>()) {
          return sendFailure(exchange, kj::mv(result.get<Failure>()));
        }
        auto& entries = result.get<kj::Array<RepoEntry>>();

        capnp::MallocMessageBuilder reply;
        auto response = reply.initRoot<TreeResponse>();
        auto files = response.initFiles(entries.size());
        for (auto i: kj::indices(entries)) {
          files[i].setName(entries[i].name);
          files[i].setPath(entries[i].path);
          files[i].setType(entries[i].isDirectory ? "dir" : "file");
        }
        return exchange.sendJson(200, json.encode(response.asReader()));
      }).attach(kj::mv(message));
    }

    case Route::GIT_FILE: {
      auto root = message->initRoot<FileRequest>();
      KJ_IF_MAYBE(failure, decodeBody<FileRequest>(body, root)) {
        return sendFailure(exchange, kj::mv(*failure));
      }
      return orchestrator.file(root.asReader())
          .then([this, &exchange](Result<RepoFile>&& result) {
        if (result.is<Failure>()) {
          return sendFailure(exchange, kj::mv(result.get<Failure>()));
        }
        auto& file = result.get<RepoFile>();

        capnp::MallocMessageBuilder reply;
        auto response = reply.initRoot<FileResponse>();
        response.setContent(file.content);
        response.setEncoding(file.base64 ? "base64" : "utf-8");
        return exchange.sendJson(200, json.encode(response.asReader()));
      }).attach(kj::mv(message));
    }

    case Route::GIT_REFS: {
      auto root = message->initRoot<RefsRequest>();
      KJ_IF_MAYBE(failure, decodeBody<RefsRequest>(body, root)) {
        return sendFailure(exchange, kj::mv(*failure));
      }
      return orchestrator.refs(root.asReader())
          .then([this, &exchange](Result<CommitInfo>&& result) {
        if (result.is<Failure>()) {
          return sendFailure(exchange, kj::mv(result.get<Failure>()));
        }
        auto& info = result.get<CommitInfo>();

        capnp::MallocMessageBuilder reply;
        auto response = reply.initRoot<RefsResponse>();
        response.setSha(info.sha);
        response.setDefaultBranch(info.defaultBranch);
        response.setUnchanged(info.unchanged);
        KJ_IF_MAYBE(m, info.message) response.setMessage(*m);
        KJ_IF_MAYBE(d, info.date) response.setDate(*d);
        KJ_IF_MAYBE(n, info.authorName) response.setAuthorName(*n);
        KJ_IF_MAYBE(e, info.authorEmail) response.setAuthorEmail(*e);
        return exchange.sendJson(200, json.encode(response.asReader()));
      }).attach(kj::mv(message));
    }

    case Route::GIT_FILE_HASH: {
      auto root = message->initRoot<FileHashRequest>();
      KJ_IF_MAYBE(failure, decodeBody<FileHashRequest>(body, root)) {
        return sendFailure(exchange, kj::mv(*failure));
      }
      return orchestrator.fileHash(root.asReader())
          .then([this, &exchange](Result<FileHashOutput>&& result) {
        if (result.is<Failure>()) {
          return sendFailure(exchange, kj::mv(result.get<Failure>()));
        }
        auto& output = result.get<FileHashOutput>();

        if (!output.batch) {
          capnp::MallocMessageBuilder reply;
          auto response = reply.initRoot<FileHashResponse>();
          response.setHash(KJ_ASSERT_NONNULL(output.hashes[0].hash));
          return exchange.sendJson(200, json.encode(response.asReader()));
        }

        // Keys are the requested paths, so this is built as a raw JSON object.
        capnp::MallocMessageBuilder reply;
        auto value = reply.initRoot<capnp::JsonValue>();
        auto field = value.initObject(1)[0];
        field.setName("hashes");
        auto hashes = field.initValue().initObject(output.hashes.size());
        for (auto i: kj::indices(output.hashes)) {
          hashes[i].setName(output.hashes[i].path);
          KJ_IF_MAYBE(hash, output.hashes[i].hash) {
            hashes[i].initValue().setString(*hash);
          } else {
            hashes[i].initValue().setNull();
          }
        }
        return exchange.sendJson(200, json.encodeRaw(value.asReader()));
      }).attach(kj::mv(message));
    }
  }

  KJ_UNREACHABLE;
}

kj::Promise<void> TexboxService::sendPdf(Exchange& exchange, Result<CompileOutput>&& result) {
  if (result.is<Failure>()) {
    return sendFailure(exchange, kj::mv(result.get<Failure>()));
  }
  auto& output = result.get<CompileOutput>();

  KJ_IF_MAYBE(dependencies, output.dependencies) {
    capnp::MallocMessageBuilder message;
    auto value = message.initRoot<capnp::JsonValue>();
    auto array = value.initArray(dependencies->size());
    for (auto i: kj::indices(*dependencies)) {
      array[i].setString((*dependencies)[i]);
    }
    exchange.headers.set(tables.hXDependencies, json.encodeRaw(value.asReader()));
  }

  return exchange.send(200, "application/pdf", kj::mv(output.pdf));
}

kj::Promise<void> TexboxService::handleHealth(Exchange& exchange) {
  return tools.checkTools().then([this, &exchange](kj::Array<ToolInvoker::ToolStatus> statuses) {
    capnp::MallocMessageBuilder message;
    auto root = message.initRoot<HealthResponse>();

    bool healthy = true;
    auto checks = root.initChecks(statuses.size());
    for (auto i: kj::indices(statuses)) {
      checks[i].setTool(statuses[i].tool);
      checks[i].setOk(statuses[i].ok);
      checks[i].setVersion(statuses[i].version);
      healthy = healthy && statuses[i].ok;
    }
    root.setStatus(healthy ? "ok" : "degraded");
    root.setPendingWorkspaces(workspaces.pendingCount());
    root.setShuttingDown(shuttingDown);

    if (!healthy) {
      KJ_LOG(WARNING, "health check found a missing tool", exchange.getRequestId());
    }
    return exchange.sendJson(healthy ? 200 : 503, json.encode(root.asReader()));
  });
}

kj::Promise<void> TexboxService::sendFailure(Exchange& exchange, Failure&& failure) {
  if (failure.kind == ErrorKind::INTERNAL && failure.status == 500) {
    KJ_LOG(ERROR, "responding with internal error", exchange.getRequestId());
  } else {
    KJ_LOG(INFO, "request rejected", exchange.getRequestId(), failure.status,
           errorKindName(failure.kind), failure.message);
  }

  capnp::MallocMessageBuilder message;
  auto root = message.initRoot<ErrorResponse>();
  root.setError(failure.message);
  root.setKind(errorKindName(failure.kind));
  KJ_IF_MAYBE(log, failure.log) {
    root.setLog(*log);
  }
  root.setTimedOut(failure.timedOut);
  KJ_IF_MAYBE(retryAfter, failure.retryAfter) {
    uint seconds = kj::max(ceilSeconds(*retryAfter), 1u);
    root.setRetryAfter(seconds);
    exchange.headers.set(tables.hRetryAfter, kj::str(seconds));
  }

  return exchange.sendJson(failure.status, json.encode(root.asReader()));
}

bool TexboxService::checkApiKey(const kj::HttpHeaders& headers) {
  KJ_IF_MAYBE(expected, options.apiKey) {
    KJ_IF_MAYBE(given, headers.get(tables.hXApiKey)) {
      return given->size() == expected->size() &&
          sodium_memcmp(given->begin(), expected->begin(), expected->size()) == 0;
    }
    return false;
  }
  return true;
}

kj::String TexboxService::rateLimitKey(const kj::HttpHeaders& headers) {
  // Only a verified API key identifies a caller; without one, anyone could pick fresh keys.
  if (options.apiKey != nullptr) {
    KJ_IF_MAYBE(key, headers.get(tables.hXApiKey)) {
      return kj::str("key:", *key);
    }
  }
  KJ_IF_MAYBE(ip, headers.get(tables.hXRealIp)) {
    return kj::str("ip:", *ip);
  }
  return kj::str("ip:unknown");
}

}  // namespace texbox
