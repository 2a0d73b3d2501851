#include "SessionEstablisher.hpp"
#include "CredentialResolver.hpp"
#include "ovscp/Libssh2SftpClient.hpp"
#include "ovscp/RuntimeLogging.hpp"
#include "ovscp/TunnelOverlayContext.hpp"
#include <QLoggingCategory>
#include <QString>
#include <memory>
#include <utility>
Q_LOGGING_CATEGORY(ovSession, "ovscp.session")

TransferSession::TransferSession(std::unique_ptr<ovscp::OverlayContext> context,
                                 std::unique_ptr<ovscp::OverlayStream> stream,
                                 std::unique_ptr<ovscp::SftpClient> client)
    : context_(std::move(context)), stream_(std::move(stream)), client_(std::move(client)) {}

TransferSession::~TransferSession() {
    close();
}

bool TransferSession::isOpen() const {
    return client_ && client_->isConnected() && stream_ && stream_->isOpen();
}

void TransferSession::close() {
    if (client_ && client_->isConnected()) {
        client_->disconnect();
        qCDebug(ovSession) << "SFTP session closed";
    }
    if (stream_ && stream_->isOpen()) {
        stream_->close();
        qCDebug(ovSession) << "overlay stream closed";
    }
}

SessionEstablisher::SessionEstablisher()
    : SessionEstablisher(
          [](const ovscp::OverlayConfig& cfg) {
              return std::unique_ptr<ovscp::OverlayContext>(std::make_unique<ovscp::TunnelOverlayContext>(cfg));
          },
          []() { return std::unique_ptr<ovscp::SftpClient>(std::make_unique<ovscp::Libssh2SftpClient>()); }) {}

SessionEstablisher::SessionEstablisher(ContextFactory contexts, ClientFactory clients)
    : contexts_(std::move(contexts)), clients_(std::move(clients)) {}

std::unique_ptr<TransferSession>
SessionEstablisher::establish(const ovscp::OverlayConfig& config,
                              const SessionParams& params,
                              CredentialResolver& credentials,
                              std::string& err) {
    const QString service = QString::fromStdString(params.serviceName);
    const QString identity = QString::fromStdString(params.targetIdentity);

    std::unique_ptr<ovscp::OverlayContext> context = contexts_(config);
    if (!context) {
        err = "error creating overlay context from [" + config.source_path + "]";
        return nullptr;
    }
    const std::string token = credentials.bearerToken();
    if (!token.empty()) {
        context->attachBearerToken(token);
        qCDebug(ovSession) << "bearer token attached:"
                           << QString::fromStdString(ovscp::redactSecret(token));
    }

    if (!context->hasService(params.serviceName)) {
        err = "service not found: " + params.serviceName;
        return nullptr;
    }

    std::unique_ptr<ovscp::OverlayStream> stream =
        context->dial(params.serviceName, params.targetIdentity, err);
    if (!stream || !stream->isOpen()) {
        if (err.empty())
            err = "error when dialing service name " + params.serviceName;
        return nullptr;
    }
    qCDebug(ovSession) << "dialed service" << service << "identity" << identity;

    ovscp::SessionOptions opt;
    opt.stream_fd = stream->fd();
    opt.username = params.username;
    opt.target_identity = params.targetIdentity;
    opt.auth_methods = credentials.resolve();
    opt.timeout_ms = params.timeoutMs;

    std::unique_ptr<ovscp::SftpClient> client = clients_();
    std::string cErr;
    if (!client || !client->connect(opt, cErr)) {
        err = "error dialing SSH Conn to [" + params.username + "@" + params.targetIdentity +
              "] via service " + params.serviceName + ": " + cErr;
        return nullptr; // stream closes with its owner
    }
    if (auto* lc = dynamic_cast<ovscp::Libssh2SftpClient*>(client.get())) {
        qCDebug(ovSession) << "host key" << QString::fromStdString(lc->hostKeyFingerprint())
                           << "accepted credential" << QString::fromStdString(lc->acceptedMethod());
    }
    qCInfo(ovSession) << "connected to" << identity << "as"
                      << QString::fromStdString(params.username);

    return std::make_unique<TransferSession>(std::move(context), std::move(stream),
                                             std::move(client));
}
