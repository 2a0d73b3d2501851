// Overlay network seam: a context that knows which services the caller may
// reach and dials them by name, routing to a target identity.
#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace ovscp {

// Owns a dialed stream descriptor; closes it on destruction.
class OverlayStream {
public:
    OverlayStream() = default;
    OverlayStream(int fd, std::string service, std::string identity);
    ~OverlayStream();

    OverlayStream(const OverlayStream&) = delete;
    OverlayStream& operator=(const OverlayStream&) = delete;
    OverlayStream(OverlayStream&& other) noexcept;
    OverlayStream& operator=(OverlayStream&& other) noexcept;

    int fd() const { return fd_; }
    bool isOpen() const { return fd_ >= 0; }
    const std::string& service() const { return service_; }
    const std::string& identity() const { return identity_; }

    void close();

private:
    int fd_ = -1;
    std::string service_;
    std::string identity_;
};

struct OverlayServiceEntry {
    std::string name;
    // Intercept address; "{identity}" and "{service}" are substituted at dial time.
    std::string address;
    std::uint16_t port = 22;
};

// Parsed overlay configuration file.
struct OverlayConfig {
    std::string source_path;
    std::string controller; // "ztAPI", diagnostics only
    std::vector<OverlayServiceEntry> services;
    bool require_bearer_token = false;

    const OverlayServiceEntry* findService(const std::string& name) const;
};

class OverlayContext {
public:
    virtual ~OverlayContext() = default;

    // Token obtained from the identity provider, presented when dialing.
    virtual void attachBearerToken(const std::string& token) = 0;
    virtual bool hasService(const std::string& name) const = 0;
    // Returns nullptr and sets err when the service cannot be reached, the
    // identity is unknown or policy denies the dial.
    virtual std::unique_ptr<OverlayStream> dial(const std::string& service,
                                                const std::string& identity,
                                                std::string& err) = 0;
};

// Substitutes "{identity}" and "{service}" in an intercept address.
std::string expandInterceptAddress(const std::string& pattern,
                                   const std::string& service,
                                   const std::string& identity);

} // namespace ovscp
