#include "OverlayConfigLoader.hpp"
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonValue>

namespace {

bool readString(const QJsonObject& o, const char* key, QString& out, std::string& err) {
    const QJsonValue v = o.value(QLatin1String(key));
    if (v.isUndefined())
        return true;
    if (!v.isString()) {
        err = std::string("oidc.") + key + " must be a string";
        return false;
    }
    out = v.toString();
    return true;
}

bool parseOidcBlock(const QJsonObject& o, OidcConfig& oidc, std::string& err) {
    QString scopes;
    if (!readString(o, "issuer", oidc.issuer, err) ||
        !readString(o, "clientId", oidc.clientId, err) ||
        !readString(o, "clientSecret", oidc.clientSecret, err) ||
        !readString(o, "callbackPath", oidc.callbackPath, err) ||
        !readString(o, "scopes", scopes, err))
        return false;
    if (o.contains(QStringLiteral("scopes")))
        oidc.scopes = scopes.split(QLatin1Char(' '), Qt::SkipEmptyParts);
    if (o.contains(QStringLiteral("callbackPort"))) {
        const int port = o.value(QStringLiteral("callbackPort")).toInt(-1);
        if (port < 1 || port > 65535) {
            err = "oidc.callbackPort must be 1..65535";
            return false;
        }
        oidc.callbackPort = static_cast<quint16>(port);
    }
    if (o.contains(QStringLiteral("timeoutSeconds"))) {
        const int t = o.value(QStringLiteral("timeoutSeconds")).toInt(-1);
        if (t <= 0) {
            err = "oidc.timeoutSeconds must be positive";
            return false;
        }
        oidc.timeoutSeconds = t;
    }
    return true;
}

} // namespace

bool loadOverlayConfig(const QString& path,
                       ovscp::OverlayConfig& cfg,
                       OidcConfig& oidc,
                       std::string& err) {
    const std::string where = "failed to load overlay configuration file [" + path.toStdString() + "]: ";
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly)) {
        err = where + f.errorString().toStdString();
        return false;
    }
    QJsonParseError pe{};
    const QJsonDocument doc = QJsonDocument::fromJson(f.readAll(), &pe);
    if (pe.error != QJsonParseError::NoError) {
        err = where + pe.errorString().toStdString() + " at offset " + std::to_string(pe.offset);
        return false;
    }
    if (!doc.isObject()) {
        err = where + "top-level value is not an object";
        return false;
    }
    const QJsonObject root = doc.object();

    ovscp::OverlayConfig out;
    out.source_path = path.toStdString();
    out.controller = root.value(QStringLiteral("ztAPI")).toString().toStdString();
    const QJsonValue requireToken = root.value(QStringLiteral("requireBearerToken"));
    if (!requireToken.isUndefined() && !requireToken.isBool()) {
        err = where + "\"requireBearerToken\" must be a boolean";
        return false;
    }
    out.require_bearer_token = requireToken.toBool(false);

    const QJsonValue services = root.value(QStringLiteral("services"));
    if (!services.isObject() || services.toObject().isEmpty()) {
        err = where + "\"services\" must be a non-empty object";
        return false;
    }
    const QJsonObject svcObj = services.toObject();
    for (auto it = svcObj.begin(); it != svcObj.end(); ++it) {
        const std::string name = it.key().toStdString();
        if (!it.value().isObject()) {
            err = where + "service \"" + name + "\" must be an object";
            return false;
        }
        const QJsonObject s = it.value().toObject();
        ovscp::OverlayServiceEntry e;
        e.name = name;
        const QJsonValue address = s.value(QStringLiteral("address"));
        if (!address.isUndefined() && !address.isString()) {
            err = where + "service \"" + name + "\" address must be a string";
            return false;
        }
        e.address = address.toString().toStdString();
        if (e.address.empty()) {
            err = where + "service \"" + name + "\" has no address";
            return false;
        }
        const QJsonValue portVal = s.value(QStringLiteral("port"));
        if (!portVal.isUndefined() && !portVal.isDouble()) {
            err = where + "service \"" + name + "\" port must be a number";
            return false;
        }
        const double portNum = portVal.toDouble(22);
        const int port = static_cast<int>(portNum);
        if (port != portNum || port < 1 || port > 65535) {
            err = where + "service \"" + name + "\" port must be 1..65535";
            return false;
        }
        e.port = static_cast<std::uint16_t>(port);
        out.services.push_back(std::move(e));
    }

    const QJsonValue oidcVal = root.value(QStringLiteral("oidc"));
    if (oidcVal.isObject()) {
        std::string oErr;
        OidcConfig parsed = oidc;
        if (!parseOidcBlock(oidcVal.toObject(), parsed, oErr)) {
            err = where + oErr;
            return false;
        }
        oidc = parsed;
    } else if (!oidcVal.isUndefined() && !oidcVal.isNull()) {
        err = where + "\"oidc\" must be an object";
        return false;
    }

    cfg = std::move(out);
    return true;
}
