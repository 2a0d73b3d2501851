// Opens one authenticated SFTP session through the overlay: context, service
// check, dial, SSH negotiation, SFTP subsystem.
#pragma once
#include "ovscp/Overlay.hpp"
#include "ovscp/SftpClient.hpp"
#include <functional>
#include <memory>
#include <string>

class CredentialResolver;

struct SessionParams {
    std::string serviceName;
    std::string targetIdentity;
    std::string username;
    int timeoutMs = 20000;
};

// Owns everything a session holds and releases it in reverse order of
// acquisition: SFTP/SSH first, then the overlay stream, then the context.
class TransferSession {
public:
    TransferSession(std::unique_ptr<ovscp::OverlayContext> context,
                    std::unique_ptr<ovscp::OverlayStream> stream,
                    std::unique_ptr<ovscp::SftpClient> client);
    ~TransferSession();

    TransferSession(const TransferSession&) = delete;
    TransferSession& operator=(const TransferSession&) = delete;

    ovscp::SftpClient& sftp() { return *client_; }
    const ovscp::OverlayStream& stream() const { return *stream_; }
    bool isOpen() const;
    void close();

private:
    std::unique_ptr<ovscp::OverlayContext> context_;
    std::unique_ptr<ovscp::OverlayStream> stream_;
    std::unique_ptr<ovscp::SftpClient> client_;
};

class SessionEstablisher {
public:
    using ContextFactory =
        std::function<std::unique_ptr<ovscp::OverlayContext>(const ovscp::OverlayConfig&)>;
    using ClientFactory = std::function<std::unique_ptr<ovscp::SftpClient>()>;

    // Defaults: tunnel-intercept overlay binding and the libssh2 backend.
    SessionEstablisher();
    SessionEstablisher(ContextFactory contexts, ClientFactory clients);

    // Returns nullptr and sets err on any failure; nothing stays open then.
    // Credentials are resolved only once the stream is up.
    std::unique_ptr<TransferSession> establish(const ovscp::OverlayConfig& config,
                                               const SessionParams& params,
                                               CredentialResolver& credentials,
                                               std::string& err);

private:
    ContextFactory contexts_;
    ClientFactory clients_;
};
