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

#include <kj/main.h>
#include <kj/debug.h>
#include <kj/async-io.h>
#include <kj/async-unix.h>
#include <kj/compat/http.h>
#include <string.h>
#include <signal.h>
#include "config.h"
#include "real-ip.h"
#include "server.h"

namespace texbox {

class TexboxServerMain {
public:
  TexboxServerMain(kj::ProcessContext& context): context(context) {}

  kj::MainFunc getMain() {
    return kj::MainBuilder(context, "Texbox server, unknown version",
          "Serves the LaTeX compilation API over HTTP. Settings come from the config file, if "
          "given, and from TEXBOX_* environment variables, which take precedence.")
        .addOptionWithArg({'c', "config"}, KJ_BIND_METHOD(*this, setConfigPath), "<file>",
                          "Read settings from <file>, one KEY=value per line.")
        .addOption({'v', "verbose"}, KJ_BIND_METHOD(*this, setVerbose),
                   "Log every request.")
        .callAfterParsing(KJ_BIND_METHOD(*this, run))
        .build();
  }

private:
  kj::ProcessContext& context;
  kj::Maybe<kj::StringPtr> configPath;
  bool verbose = false;

  kj::MainBuilder::Validity setConfigPath(kj::StringPtr arg) {
    configPath = arg;
    return true;
  }

  kj::MainBuilder::Validity setVerbose() {
    verbose = true;
    return true;
  }

  kj::MainBuilder::Validity run() {
    auto config = readConfig(configPath);
    if (verbose || config.verbose) {
      kj::_::Debug::setLogLevel(kj::LogSeverity::INFO);
    }
    if (!isDirectory(config.workDir)) {
      return kj::str("WORK_DIR is not a directory: ", config.workDir);
    }

    kj::UnixEventPort::captureSignal(SIGINT);
    kj::UnixEventPort::captureSignal(SIGTERM);

    auto io = kj::setupAsyncIo();
    auto& timer = io.provider->getTimer();

    SubprocessSet subprocesses(io.unixEventPort);
    ProcessRunner runner(*io.lowLevelProvider, timer, subprocesses);
    ToolInvoker tools(runner, config.tools);
    WorkspaceManager workspaces(config.workDir);
    Orchestrator orchestrator(workspaces, tools, config.orchestrator);
    RateLimiter rateLimiter(timer, config.rateLimit);

    kj::HttpHeaderTable::Builder headerTableBuilder;
    TexboxService::Tables tables(headerTableBuilder);

    TexboxService::Options serviceOptions;
    KJ_IF_MAYBE(key, config.apiKey) {
      serviceOptions.apiKey = kj::str(*key);
    } else {
      KJ_LOG(WARNING, "API_KEY is not set; the API is open to anyone who can reach it");
    }
    serviceOptions.maxBodyBytes = config.maxBodyBytes;
    TexboxService service(timer, orchestrator, tools, workspaces, rateLimiter, tables,
                          kj::mv(serviceOptions));

    auto headerTable = headerTableBuilder.build();
    auto server = kj::heap<kj::HttpServer>(timer, *headerTable, [&](kj::AsyncIoStream& conn) {
      return kj::heap<RealIpService>(service, tables.getRealIpHeader(), conn);
    });

    auto address = io.provider->getNetwork()
        .parseAddress(config.bindIp, config.port).wait(io.waitScope);
    auto listener = address->listen();
    context.warning(kj::str("Listening on ", config.bindIp, ":", listener->getPort(),
                            ", workspaces in ", config.workDir));

    auto onSignal = io.unixEventPort.onSignal(SIGINT)
        .exclusiveJoin(io.unixEventPort.onSignal(SIGTERM))
        .then([this](siginfo_t&& sig) {
      context.warning(kj::str("Shutting down due to signal: ", strsignal(sig.si_signo)));
    });

    server->listenHttp(*listener).exclusiveJoin(kj::mv(onSignal)).wait(io.waitScope);
    listener = nullptr;

    // Let in-flight requests finish, but not forever. Whatever is still running when the
    // deadline passes is canceled when the server is destroyed, which kills its processes.
    service.beginShutdown();
    server->drain()
        .exclusiveJoin(timer.afterDelay(config.shutdownDrain).then([this]() {
          context.warning("Drain deadline passed; canceling in-flight requests.");
        }))
        .wait(io.waitScope);
    server = nullptr;

    auto swept = workspaces.sweep();
    if (swept.failed > 0) {
      return kj::str("Could not remove ", swept.failed, " workspace(s) under ", config.workDir);
    }
    return true;
  }
};

}  // namespace texbox

KJ_MAIN(texbox::TexboxServerMain)
