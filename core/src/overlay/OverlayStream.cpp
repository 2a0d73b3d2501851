#include "ovscp/Overlay.hpp"

#include <utility>

#include <sys/socket.h>
#include <unistd.h>

namespace ovscp {

OverlayStream::OverlayStream(int fd, std::string service, std::string identity)
    : fd_(fd), service_(std::move(service)), identity_(std::move(identity)) {}

OverlayStream::~OverlayStream() {
    close();
}

OverlayStream::OverlayStream(OverlayStream&& other) noexcept
    : fd_(other.fd_),
      service_(std::move(other.service_)),
      identity_(std::move(other.identity_)) {
    other.fd_ = -1;
}

OverlayStream& OverlayStream::operator=(OverlayStream&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = other.fd_;
        service_ = std::move(other.service_);
        identity_ = std::move(other.identity_);
        other.fd_ = -1;
    }
    return *this;
}

void OverlayStream::close() {
    if (fd_ < 0)
        return;
    ::shutdown(fd_, SHUT_RDWR);
    ::close(fd_);
    fd_ = -1;
}

const OverlayServiceEntry* OverlayConfig::findService(const std::string& name) const {
    for (const auto& s : services) {
        if (s.name == name)
            return &s;
    }
    return nullptr;
}

std::string expandInterceptAddress(const std::string& pattern,
                                   const std::string& service,
                                   const std::string& identity) {
    std::string out = pattern;
    auto replaceAll = [&out](const std::string& key, const std::string& value) {
        std::size_t pos = 0;
        while ((pos = out.find(key, pos)) != std::string::npos) {
            out.replace(pos, key.size(), value);
            pos += value.size();
        }
    };
    replaceAll("{identity}", identity);
    replaceAll("{service}", service);
    return out;
}

} // namespace ovscp
