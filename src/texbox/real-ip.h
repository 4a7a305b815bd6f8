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

#ifndef TEXBOX_REAL_IP_H_
#define TEXBOX_REAL_IP_H_

#include <kj/compat/http.h>
#include <sys/socket.h>

namespace texbox {

struct PeerAddress {
  kj::Maybe<kj::String> address;
  // Textual IP address, or null for non-IP sockets.

  bool trusted;
  // Loopback, private-network, link-local and unix-socket peers are assumed to be reverse
  // proxies, so an X-Real-IP they send is believed.
};

PeerAddress classifyPeer(const struct sockaddr* addr);
// IPv4-mapped IPv6 addresses are classified and reported as the IPv4 address.

class RealIpService: public kj::HttpService {
  // Instantiated per connection. Sets X-Real-IP to the peer's address unless the peer is trusted
  // and already sent one. The rate limiter keys anonymous callers on that header.

public:
  RealIpService(kj::HttpService& inner, kj::HttpHeaderId hXRealIp, kj::AsyncIoStream& connection);

  kj::Promise<void> request(
      kj::HttpMethod method, kj::StringPtr url, const kj::HttpHeaders& headers,
      kj::AsyncInputStream& requestBody, Response& response) override;

private:
  kj::HttpService& inner;
  kj::HttpHeaderId hXRealIp;
  PeerAddress peer;
};

}  // namespace texbox

#endif // TEXBOX_REAL_IP_H_
