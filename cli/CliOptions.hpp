// Command-line surface: parsed once into an InvocationConfig that is passed
// explicitly to everything downstream.
#pragma once
#include <QString>
#include <QStringList>
#include <QtGlobal>

struct OidcConfig;

struct InvocationConfig {
    QString configPath;
    QString keyPath;
    QString serviceName;
    bool debug = false;
    bool recursive = false;
    bool useOidc = false;

    // Overrides for the config file's "oidc" block; empty/0 when not given
    QString oidcIssuer;
    QString clientId;
    QString clientSecret;
    quint16 callbackPort = 0;

    QString source;
    QString destination;
};

enum class CommandLineParseResult { Ok, Error, HelpRequested, VersionRequested };

// arguments[0] is the program name. On anything but Ok, message holds the text
// to print (help, version or the error).
CommandLineParseResult parseCommandLine(const QStringList& arguments,
                                        InvocationConfig& out,
                                        QString& message);

QString defaultConfigPath();
QString defaultKeyPath();
extern const char* const kDefaultServiceName;

// Command-line values win over the configuration file.
void applyOidcOverrides(const InvocationConfig& inv, OidcConfig& oidc);
