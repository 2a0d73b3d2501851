#include "CliOptions.hpp"
#include "OidcTokenProvider.hpp"
#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDir>

const char* const kDefaultServiceName = "ovssh";

QString defaultConfigPath() {
    return QDir(QDir::homePath()).filePath(
        QStringLiteral(".ovnet/%1.json").arg(QLatin1String(kDefaultServiceName)));
}

QString defaultKeyPath() {
    return QDir(QDir::homePath()).filePath(QStringLiteral(".ssh/id_rsa"));
}

CommandLineParseResult parseCommandLine(const QStringList& arguments,
                                        InvocationConfig& out,
                                        QString& message) {
    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral(
        "Copy files to or from a host reachable through an overlay network service.\n"
        "Remote to local: ovscp [user@]<targetIdentity>:[remote path] <local path>\n"
        "Local to remote: ovscp <local path> [user@]<targetIdentity>:[remote path]"));
    const QCommandLineOption helpOpt = parser.addHelpOption();
    const QCommandLineOption versionOpt = parser.addVersionOption();

    const QCommandLineOption configOpt(
        {QStringLiteral("c"), QStringLiteral("config")},
        QStringLiteral("Path to the overlay config file. default: %1").arg(defaultConfigPath()),
        QStringLiteral("path"));
    const QCommandLineOption keyOpt(
        {QStringLiteral("i"), QStringLiteral("key")},
        QStringLiteral("Path to the ssh key. default: %1").arg(defaultKeyPath()),
        QStringLiteral("path"));
    const QCommandLineOption serviceOpt(
        {QStringLiteral("s"), QStringLiteral("service")},
        QStringLiteral("Overlay service to dial. default: %1").arg(QLatin1String(kDefaultServiceName)),
        QStringLiteral("name"));
    const QCommandLineOption debugOpt(
        {QStringLiteral("d"), QStringLiteral("debug")},
        QStringLiteral("Enable additional debug information."));
    const QCommandLineOption recursiveOpt(
        {QStringLiteral("r"), QStringLiteral("recursive")},
        QStringLiteral("Transfer directories recursively."));
    const QCommandLineOption oidcOpt(
        {QStringLiteral("o"), QStringLiteral("oidc")},
        QStringLiteral("Obtain a bearer token through the browser login flow."));
    const QCommandLineOption issuerOpt(
        QStringLiteral("oidc-issuer"), QStringLiteral("OIDC issuer URL."), QStringLiteral("url"));
    const QCommandLineOption clientIdOpt(
        QStringLiteral("client-id"), QStringLiteral("OIDC client id."), QStringLiteral("id"));
    const QCommandLineOption clientSecretOpt(
        QStringLiteral("client-secret"), QStringLiteral("OIDC client secret (PKCE is used without one)."),
        QStringLiteral("secret"));
    const QCommandLineOption callbackPortOpt(
        QStringLiteral("callback-port"), QStringLiteral("Local port for the OIDC redirect."),
        QStringLiteral("port"));

    parser.addOptions({configOpt, keyOpt, serviceOpt, debugOpt, recursiveOpt, oidcOpt,
                       issuerOpt, clientIdOpt, clientSecretOpt, callbackPortOpt});
    parser.addPositionalArgument(QStringLiteral("source"), QStringLiteral("Local path or [user@]identity:[path]."));
    parser.addPositionalArgument(QStringLiteral("destination"), QStringLiteral("Local path or [user@]identity:[path]."));

    if (!parser.parse(arguments)) {
        message = parser.errorText();
        return CommandLineParseResult::Error;
    }
    if (parser.isSet(helpOpt)) {
        message = parser.helpText();
        return CommandLineParseResult::HelpRequested;
    }
    if (parser.isSet(versionOpt)) {
        message = QCoreApplication::applicationName() + QLatin1Char(' ') +
                  QCoreApplication::applicationVersion();
        return CommandLineParseResult::VersionRequested;
    }

    const QStringList positional = parser.positionalArguments();
    if (positional.size() != 2) {
        message = QStringLiteral("expected exactly 2 arguments (source and destination), got %1")
                      .arg(positional.size());
        return CommandLineParseResult::Error;
    }

    InvocationConfig inv;
    inv.configPath = parser.isSet(configOpt) ? parser.value(configOpt) : defaultConfigPath();
    inv.keyPath = parser.isSet(keyOpt) ? parser.value(keyOpt) : defaultKeyPath();
    inv.serviceName = parser.isSet(serviceOpt) ? parser.value(serviceOpt)
                                               : QString::fromLatin1(kDefaultServiceName);
    inv.debug = parser.isSet(debugOpt);
    inv.recursive = parser.isSet(recursiveOpt);
    inv.useOidc = parser.isSet(oidcOpt);
    inv.oidcIssuer = parser.value(issuerOpt);
    inv.clientId = parser.value(clientIdOpt);
    inv.clientSecret = parser.value(clientSecretOpt);
    if (parser.isSet(callbackPortOpt)) {
        bool ok = false;
        const uint port = parser.value(callbackPortOpt).toUInt(&ok);
        if (!ok || port == 0 || port > 65535) {
            message = QStringLiteral("invalid --callback-port: %1").arg(parser.value(callbackPortOpt));
            return CommandLineParseResult::Error;
        }
        inv.callbackPort = static_cast<quint16>(port);
    }
    if (inv.serviceName.isEmpty()) {
        message = QStringLiteral("--service must not be empty");
        return CommandLineParseResult::Error;
    }
    inv.source = positional.at(0);
    inv.destination = positional.at(1);

    out = inv;
    return CommandLineParseResult::Ok;
}

void applyOidcOverrides(const InvocationConfig& inv, OidcConfig& oidc) {
    if (!inv.oidcIssuer.isEmpty())
        oidc.issuer = inv.oidcIssuer;
    if (!inv.clientId.isEmpty())
        oidc.clientId = inv.clientId;
    if (!inv.clientSecret.isEmpty())
        oidc.clientSecret = inv.clientSecret;
    if (inv.callbackPort != 0)
        oidc.callbackPort = inv.callbackPort;
}
