// Entry point: parses the command line, then runs one transfer. Every failure
// propagates here and ends the process with EXIT_FAILURE.
#include "CliOptions.hpp"
#include "CredentialResolver.hpp"
#include "OidcTokenProvider.hpp"
#include "OverlayConfigLoader.hpp"
#include "SessionEstablisher.hpp"
#include "TransferEngine.hpp"
#include "ovscp/Endpoint.hpp"
#include <QCoreApplication>
#include <QLoggingCategory>
#include <cstdio>
#include <cstdlib>
Q_LOGGING_CATEGORY(ovCli, "ovscp.cli")

namespace {

void configureLogging(bool debug) {
    qSetMessagePattern(QStringLiteral(
        "%{time hh:mm:ss.zzz} %{if-debug}DEBUG%{endif}%{if-info}INFO %{endif}"
        "%{if-warning}WARN %{endif}%{if-critical}ERROR%{endif}%{if-fatal}FATAL%{endif} "
        "[%{category}] %{message}"));
    QLoggingCategory::setFilterRules(debug ? QStringLiteral("ovscp.*.debug=true")
                                           : QStringLiteral("ovscp.*.debug=false"));
}

int fatal(const std::string& err) {
    qCCritical(ovCli).noquote() << QString::fromStdString(err);
    return EXIT_FAILURE;
}

int run(const InvocationConfig& inv) {
    qCDebug(ovCli) << "    key path set to:" << inv.keyPath;
    qCDebug(ovCli) << "  config path set to:" << inv.configPath;

    ovscp::TransferRequest req;
    ovscp::EndpointError code = ovscp::EndpointError::None;
    std::string err;
    if (!ovscp::parseTransferArguments(inv.source.toStdString(), inv.destination.toStdString(),
                                       ovscp::localUserName, req, code, err)) {
        return fatal(std::string(ovscp::endpointErrorName(code)) + ": " + err);
    }
    qCDebug(ovCli) << "       username set to:" << QString::fromStdString(req.remote.username);
    qCDebug(ovCli) << " targetIdentity set to:" << QString::fromStdString(req.remote.target_identity);
    qCDebug(ovCli) << "      direction set to:" << ovscp::transferDirectionName(req.direction);

    ovscp::OverlayConfig overlay;
    OidcConfig oidc;
    if (!loadOverlayConfig(inv.configPath, overlay, oidc, err))
        return fatal(err);
    applyOidcOverrides(inv, oidc);

    CredentialResolver credentials(inv.keyPath);

    if (inv.useOidc || overlay.require_bearer_token) {
        OidcTokenProvider provider(oidc);
        QString token;
        if (!provider.getToken(token, err))
            return fatal(std::string(oidcErrorName(provider.lastError())) + ": " + err);
        credentials.setBearerToken(token.toStdString(), oidc.issuer.toStdString());
    }

    SessionParams params;
    params.serviceName = inv.serviceName.toStdString();
    params.targetIdentity = req.remote.target_identity;
    params.username = req.remote.username;

    SessionEstablisher establisher;
    std::unique_ptr<TransferSession> session =
        establisher.establish(overlay, params, credentials, err);
    if (!session)
        return fatal(err);

    TransferOptions topt;
    topt.recursive = inv.recursive;
    TransferEngine engine(session->sftp(), topt);
    const bool ok = engine.run(req, err);
    const TransferStats& st = engine.stats();
    qCDebug(ovCli) << "files:" << st.files << "directories:" << st.directories
                   << "failed directories:" << st.directoryFailures << "bytes:" << st.bytes;
    session->close();
    if (!ok)
        return fatal(err);
    if (st.directoryFailures > 0)
        qCWarning(ovCli) << st.directoryFailures << "directories could not be created";
    return EXIT_SUCCESS;
}

} // namespace

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("ovscp"));
    QCoreApplication::setApplicationVersion(QStringLiteral(OVSCP_VERSION));

    InvocationConfig inv;
    QString message;
    switch (parseCommandLine(QCoreApplication::arguments(), inv, message)) {
    case CommandLineParseResult::Ok:
        break;
    case CommandLineParseResult::HelpRequested:
    case CommandLineParseResult::VersionRequested:
        std::fputs(qPrintable(message + QLatin1Char('\n')), stdout);
        return EXIT_SUCCESS;
    case CommandLineParseResult::Error:
        std::fputs(qPrintable(message + QLatin1Char('\n')), stderr);
        return EXIT_FAILURE;
    }

    configureLogging(inv.debug);
    return run(inv);
}
