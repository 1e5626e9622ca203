// SPDX-License-Identifier: MIT

// lib/stream/dns_resolver.hpp
#pragma once

#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <expected>
#include <memory>
#include <string>
#include <string_view>

#include "lib/stream/error.hpp"

namespace llm_fanout {

// Resolve a backend host to one address with the port filled in. IPv4 is
// preferred when a name has both families (local backends usually bind
// 127.0.0.1 only); IPv6 is used otherwise. Blocking (getaddrinfo).
inline std::expected<sockaddr_storage, Error> ResolveAddress(std::string_view host,
                                                             uint16_t port) {
    std::string node(host);
    std::string service = std::to_string(port);

    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;
    hints.ai_flags = AI_NUMERICSERV;

    addrinfo* found = nullptr;
    int ret = ::getaddrinfo(node.c_str(), service.c_str(), &hints, &found);
    if (ret != 0) {
        std::string why = ret == EAI_SYSTEM ? std::strerror(errno) : ::gai_strerror(ret);
        return std::unexpected(Error{ErrorCode::DnsResolutionFailed,
            "cannot resolve host '" + node + "': " + why});
    }
    std::unique_ptr<addrinfo, decltype(&::freeaddrinfo)> list(found, &::freeaddrinfo);

    const addrinfo* chosen = nullptr;
    for (const addrinfo* ai = list.get(); ai != nullptr; ai = ai->ai_next) {
        if (ai->ai_family == AF_INET) {
            chosen = ai;
            break;
        }
        if (ai->ai_family == AF_INET6 && chosen == nullptr) chosen = ai;
    }
    if (chosen != nullptr) {
        sockaddr_storage addr{};
        std::memcpy(&addr, chosen->ai_addr, chosen->ai_addrlen);
        return addr;
    }
    return std::unexpected(Error{ErrorCode::DnsResolutionFailed,
        "no IPv4 or IPv6 address for host '" + node + "'"});
}

}  // namespace llm_fanout
