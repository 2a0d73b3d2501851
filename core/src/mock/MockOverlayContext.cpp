#include "ovscp/MockOverlayContext.hpp"

#include <cerrno>
#include <cstring>
#include <utility>

#include <sys/socket.h>
#include <unistd.h>

namespace ovscp {

MockOverlayContext::MockOverlayContext(std::set<std::string> services)
    : services_(std::move(services)) {}

MockOverlayContext::~MockOverlayContext() {
    for (int fd : peers_)
        ::close(fd);
}

bool MockOverlayContext::hasService(const std::string& name) const {
    return services_.count(name) != 0;
}

std::unique_ptr<OverlayStream> MockOverlayContext::dial(const std::string& service,
                                                        const std::string& identity,
                                                        std::string& err) {
    ++dialCount_;
    lastIdentity_ = identity;
    if (!hasService(service)) {
        err = "service not found: " + service;
        return nullptr;
    }
    if (requireToken_ && token_.empty()) {
        err = "service [" + service + "] requires a bearer token";
        return nullptr;
    }
    if (denied_.count(identity)) {
        err = "error when dialing service name " + service + " for identity [" + identity +
              "]: no terminator for identity";
        return nullptr;
    }
    int sv[2] = {-1, -1};
    if (::socketpair(AF_UNIX, SOCK_STREAM, 0, sv) != 0) {
        err = std::string("socketpair failed: ") + std::strerror(errno);
        return nullptr;
    }
    peers_.push_back(sv[1]);
    lastFd_ = sv[0];
    return std::make_unique<OverlayStream>(sv[0], service, identity);
}

} // namespace ovscp
