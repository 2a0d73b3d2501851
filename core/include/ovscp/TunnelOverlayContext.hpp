#pragma once
#include "Overlay.hpp"

namespace ovscp {

// Binding for deployments where a local overlay tunneler intercepts service
// addresses: dialing resolves the intercept name and opens a TCP stream that
// the tunneler carries across the overlay.
class TunnelOverlayContext : public OverlayContext {
public:
    explicit TunnelOverlayContext(OverlayConfig config);

    void attachBearerToken(const std::string& token) override { token_ = token; }
    bool hasService(const std::string& name) const override;
    std::unique_ptr<OverlayStream> dial(const std::string& service,
                                        const std::string& identity,
                                        std::string& err) override;

    bool hasBearerToken() const { return !token_.empty(); }

private:
    OverlayConfig config_;
    std::string token_;

    static int tcpConnect(const std::string& host, std::uint16_t port, std::string& err);
};

} // namespace ovscp
