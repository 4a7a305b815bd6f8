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

#include "real-ip.h"
#include <kj/test.h>
#include <kj/debug.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <sys/un.h>
#include <string.h>

namespace texbox {
namespace {

PeerAddress classify4(kj::StringPtr text) {
  struct sockaddr_in addr;
  memset(&addr, 0, sizeof(addr));
  addr.sin_family = AF_INET;
  KJ_ASSERT(inet_pton(AF_INET, text.cStr(), &addr.sin_addr) == 1, text);
  return classifyPeer(reinterpret_cast<struct sockaddr*>(&addr));
}

PeerAddress classify6(kj::StringPtr text) {
  struct sockaddr_in6 addr;
  memset(&addr, 0, sizeof(addr));
  addr.sin6_family = AF_INET6;
  KJ_ASSERT(inet_pton(AF_INET6, text.cStr(), &addr.sin6_addr) == 1, text);
  return classifyPeer(reinterpret_cast<struct sockaddr*>(&addr));
}

kj::String addressOf(const PeerAddress& peer) {
  KJ_IF_MAYBE(a, peer.address) {
    return kj::str(*a);
  }
  return kj::str("<none>");
}

KJ_TEST("classifyPeer: IPv4") {
  KJ_EXPECT(classify4("127.0.0.1").trusted);
  KJ_EXPECT(classify4("10.1.2.3").trusted);
  KJ_EXPECT(classify4("192.168.0.10").trusted);
  KJ_EXPECT(classify4("169.254.1.1").trusted);
  KJ_EXPECT(classify4("172.16.0.1").trusted);
  KJ_EXPECT(classify4("172.31.255.255").trusted);

  KJ_EXPECT(!classify4("172.32.0.1").trusted);
  KJ_EXPECT(!classify4("172.15.0.1").trusted);
  KJ_EXPECT(!classify4("8.8.8.8").trusted);
  KJ_EXPECT(!classify4("192.169.0.1").trusted);

  KJ_EXPECT(addressOf(classify4("203.0.113.7")) == "203.0.113.7");
}

KJ_TEST("classifyPeer: IPv6") {
  KJ_EXPECT(classify6("::1").trusted);
  KJ_EXPECT(classify6("fd00::1").trusted);
  KJ_EXPECT(classify6("fc12:3456::1").trusted);
  KJ_EXPECT(classify6("fe80::1").trusted);

  KJ_EXPECT(!classify6("2001:db8::1").trusted);
  KJ_EXPECT(!classify6("fec0::1").trusted);
  KJ_EXPECT(!classify6("::2").trusted);

  KJ_EXPECT(addressOf(classify6("2001:db8::1")) == "2001:db8::1");

  // IPv4 clients of a dual-stack listener.
  KJ_EXPECT(classify6("::ffff:10.0.0.1").trusted);
  KJ_EXPECT(!classify6("::ffff:8.8.8.8").trusted);
  KJ_EXPECT(addressOf(classify6("::ffff:203.0.113.7")) == "203.0.113.7");
}

KJ_TEST("classifyPeer: unix sockets") {
  struct sockaddr_un addr;
  memset(&addr, 0, sizeof(addr));
  addr.sun_family = AF_UNIX;
  auto peer = classifyPeer(reinterpret_cast<struct sockaddr*>(&addr));
  KJ_EXPECT(peer.trusted);
  KJ_EXPECT(peer.address == nullptr);

  struct sockaddr other;
  memset(&other, 0, sizeof(other));
  other.sa_family = AF_UNSPEC;
  auto unknown = classifyPeer(&other);
  KJ_EXPECT(!unknown.trusted);
  KJ_EXPECT(unknown.address == nullptr);
}

class RecordingService final: public kj::HttpService {
public:
  explicit RecordingService(kj::HttpHeaderId hXRealIp): hXRealIp(hXRealIp) {}

  kj::Promise<void> request(
      kj::HttpMethod method, kj::StringPtr url, const kj::HttpHeaders& headers,
      kj::AsyncInputStream& requestBody, Response& response) override {
    KJ_IF_MAYBE(value, headers.get(hXRealIp)) {
      seen = kj::str(*value);
    } else {
      seen = kj::str("<none>");
    }
    return kj::READY_NOW;
  }

  kj::String seen;

private:
  kj::HttpHeaderId hXRealIp;
};

class UnusedResponse final: public kj::HttpService::Response {
public:
  kj::Own<kj::AsyncOutputStream> send(
      uint statusCode, kj::StringPtr statusText, const kj::HttpHeaders& headers,
      kj::Maybe<uint64_t> expectedBodySize) override {
    KJ_UNIMPLEMENTED("not used");
  }

  kj::Own<kj::WebSocket> acceptWebSocket(const kj::HttpHeaders& headers) override {
    KJ_UNIMPLEMENTED("not used");
  }
};

KJ_TEST("RealIpService") {
  auto io = kj::setupAsyncIo();
  auto& network = io.provider->getNetwork();

  kj::HttpHeaderTable::Builder builder;
  auto hXRealIp = builder.add("X-Real-IP");
  auto table = builder.build();

  auto listener = network.parseAddress("127.0.0.1").wait(io.waitScope)->listen();
  auto connecting = network.parseAddress("127.0.0.1", listener->getPort())
      .then([](kj::Own<kj::NetworkAddress> address) { return address->connect(); })
      .eagerlyEvaluate(nullptr);
  auto connection = listener->accept().wait(io.waitScope);
  auto client = connecting.wait(io.waitScope);

  RecordingService inner(hXRealIp);
  RealIpService service(inner, hXRealIp, *connection);
  UnusedResponse response;

  // Loopback is a trusted proxy: its header is believed...
  {
    kj::HttpHeaders headers(*table);
    headers.set(hXRealIp, "198.51.100.4");
    service.request(kj::HttpMethod::GET, "/health", headers, *connection, response)
        .wait(io.waitScope);
    KJ_EXPECT(inner.seen == "198.51.100.4", inner.seen);
  }

  // ...and without one, the peer address is filled in.
  {
    kj::HttpHeaders headers(*table);
    service.request(kj::HttpMethod::GET, "/health", headers, *connection, response)
        .wait(io.waitScope);
    KJ_EXPECT(inner.seen == "127.0.0.1", inner.seen);
  }
}

}  // namespace
}  // namespace texbox
