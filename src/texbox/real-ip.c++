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
#include <kj/debug.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <string.h>

namespace texbox {

namespace {

bool isPrivate4(uint32_t hostOrder) {
  struct Range {
    uint32_t prefix;
    uint32_t mask;
  };
  static const Range TRUSTED[] = {
    { 0x7f000000, 0xff000000 },  // 127.0.0.0/8
    { 0x0a000000, 0xff000000 },  // 10.0.0.0/8
    { 0xac100000, 0xfff00000 },  // 172.16.0.0/12
    { 0xc0a80000, 0xffff0000 },  // 192.168.0.0/16
    { 0xa9fe0000, 0xffff0000 },  // 169.254.0.0/16
  };
  for (auto& range: TRUSTED) {
    if ((hostOrder & range.mask) == range.prefix) return true;
  }
  return false;
}

kj::String formatAddress(int family, const void* addr) {
  char buffer[INET6_ADDRSTRLEN];
  KJ_ASSERT(inet_ntop(family, addr, buffer, sizeof(buffer)) != nullptr);
  return kj::str(buffer);
}

PeerAddress classify4(const struct in_addr& addr) {
  return PeerAddress { formatAddress(AF_INET, &addr), isPrivate4(ntohl(addr.s_addr)) };
}

}  // namespace

PeerAddress classifyPeer(const struct sockaddr* addr) {
  switch (addr->sa_family) {
    case AF_INET:
      return classify4(reinterpret_cast<const struct sockaddr_in*>(addr)->sin_addr);

    case AF_INET6: {
      auto& addr6 = reinterpret_cast<const struct sockaddr_in6*>(addr)->sin6_addr;
      if (IN6_IS_ADDR_V4MAPPED(&addr6)) {
        // A dual-stack listener reports IPv4 clients this way; key them like plain IPv4.
        struct in_addr addr4;
        memcpy(&addr4, addr6.s6_addr + 12, sizeof(addr4));
        return classify4(addr4);
      }
      bool uniqueLocal = (addr6.s6_addr[0] & 0xfe) == 0xfc;  // fc00::/7
      bool trusted = uniqueLocal || IN6_IS_ADDR_LOOPBACK(&addr6) || IN6_IS_ADDR_LINKLOCAL(&addr6);
      return PeerAddress { formatAddress(AF_INET6, &addr6), trusted };
    }

    case AF_UNIX:
      return PeerAddress { nullptr, true };

    default:
      return PeerAddress { nullptr, false };
  }
}

RealIpService::RealIpService(kj::HttpService& inner,
                             kj::HttpHeaderId hXRealIp,
                             kj::AsyncIoStream& connection)
    : inner(inner), hXRealIp(hXRealIp), peer(PeerAddress { nullptr, false }) {
  struct sockaddr_storage addr;
  memset(&addr, 0, sizeof(addr));
  uint len = sizeof(addr);
  connection.getpeername(reinterpret_cast<struct sockaddr*>(&addr), &len);
  peer = classifyPeer(reinterpret_cast<struct sockaddr*>(&addr));
}

kj::Promise<void> RealIpService::request(
    kj::HttpMethod method, kj::StringPtr url, const kj::HttpHeaders& headers,
    kj::AsyncInputStream& requestBody, Response& response) {
  if (peer.trusted && headers.get(hXRealIp) != nullptr) {
    return inner.request(method, url, headers, requestBody, response);
  }

  // Everyone else is keyed on the address we see them at, whatever they claim.
  auto rewritten = kj::heap<kj::HttpHeaders>(headers.clone());
  KJ_IF_MAYBE(a, peer.address) {
    rewritten->set(hXRealIp, *a);
  } else {
    rewritten->unset(hXRealIp);
  }
  return inner.request(method, url, *rewritten, requestBody, response).attach(kj::mv(rewritten));
}

}  // namespace texbox
