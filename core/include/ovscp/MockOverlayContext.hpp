#pragma once
#include "Overlay.hpp"
#include <set>

namespace ovscp {

// Overlay context for tests: streams are one end of a socketpair.
class MockOverlayContext : public OverlayContext {
public:
    explicit MockOverlayContext(std::set<std::string> services = {});
    ~MockOverlayContext() override;

    void attachBearerToken(const std::string& token) override { token_ = token; }
    bool hasService(const std::string& name) const override;
    std::unique_ptr<OverlayStream> dial(const std::string& service,
                                        const std::string& identity,
                                        std::string& err) override;

    void advertise(const std::string& service) { services_.insert(service); }
    // Identities that dial() refuses ("identity unknown / policy denied")
    void denyIdentity(const std::string& identity) { denied_.insert(identity); }
    void requireToken(bool on) { requireToken_ = on; }

    const std::string& bearerToken() const { return token_; }
    int dialCount() const { return dialCount_; }
    const std::string& lastDialedIdentity() const { return lastIdentity_; }
    // Descriptor of the most recent stream handed out (-1 if none)
    int lastStreamFd() const { return lastFd_; }

private:
    std::set<std::string> services_;
    std::set<std::string> denied_;
    std::string token_;
    bool requireToken_ = false;
    int dialCount_ = 0;
    std::string lastIdentity_;
    int lastFd_ = -1;
    std::vector<int> peers_;
};

} // namespace ovscp
