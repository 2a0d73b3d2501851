#include "ovscp/TunnelOverlayContext.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <utility>

// POSIX sockets
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace ovscp {

TunnelOverlayContext::TunnelOverlayContext(OverlayConfig config)
    : config_(std::move(config)) {}

bool TunnelOverlayContext::hasService(const std::string& name) const {
    return config_.findService(name) != nullptr;
}

int TunnelOverlayContext::tcpConnect(const std::string& host, std::uint16_t port,
                                     std::string& err) {
    struct addrinfo hints{};
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    char portStr[16];
    std::snprintf(portStr, sizeof(portStr), "%u", static_cast<unsigned>(port));

    struct addrinfo* res = nullptr;
    int gai = ::getaddrinfo(host.c_str(), portStr, &hints, &res);
    if (gai != 0) {
        err = "cannot resolve [" + host + "]: " + ::gai_strerror(gai);
        return -1;
    }

    int lastErrno = 0;
    for (auto rp = res; rp != nullptr; rp = rp->ai_next) {
        int s = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
        if (s == -1) {
            lastErrno = errno;
            continue;
        }
        // TCP keepalive so a dead tunnel is noticed during long transfers
        int opt = 1;
        ::setsockopt(s, SOL_SOCKET, SO_KEEPALIVE, &opt, sizeof(opt));
#ifdef __APPLE__
        int idle = 60;
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPALIVE, &idle, sizeof(idle));
#elif defined(__linux__)
        int idle = 60, intvl = 10, cnt = 3;
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPIDLE, &idle, sizeof(idle));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPINTVL, &intvl, sizeof(intvl));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPCNT, &cnt, sizeof(cnt));
#endif
        if (::connect(s, rp->ai_addr, rp->ai_addrlen) == 0) {
            ::freeaddrinfo(res);
            return s;
        }
        lastErrno = errno;
        ::close(s);
    }
    ::freeaddrinfo(res);
    err = "cannot connect to [" + host + ":" + portStr + "]";
    if (lastErrno != 0)
        err += std::string(": ") + std::strerror(lastErrno);
    return -1;
}

std::unique_ptr<OverlayStream> TunnelOverlayContext::dial(const std::string& service,
                                                          const std::string& identity,
                                                          std::string& err) {
    const OverlayServiceEntry* entry = config_.findService(service);
    if (!entry) {
        err = "service not found: " + service;
        return nullptr;
    }
    if (config_.require_bearer_token && token_.empty()) {
        err = "service [" + service + "] requires a bearer token";
        return nullptr;
    }
    const std::string host = expandInterceptAddress(entry->address, service, identity);
    std::string cErr;
    const int fd = tcpConnect(host, entry->port, cErr);
    if (fd < 0) {
        err = "error when dialing service name " + service + " for identity [" + identity +
              "]: " + cErr;
        return nullptr;
    }
    return std::make_unique<OverlayStream>(fd, service, identity);
}

} // namespace ovscp
