// OIDC authorization-code flow with a loopback redirect listener.
#include "OidcTokenProvider.hpp"
#include "ovscp/RuntimeLogging.hpp"
#include <QCryptographicHash>
#include <QDateTime>
#include <QEventLoop>
#include <QHash>
#include <QHostAddress>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QLoggingCategory>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QProcess>
#include <QRandomGenerator>
#include <QTcpServer>
#include <QTcpSocket>
#include <QTimer>
#include <QUrlQuery>
#include <QUuid>
#include <memory>
#include <utility>
Q_LOGGING_CATEGORY(ovOidc, "ovscp.oidc")

namespace {

constexpr qint64 kClockSkewSecs = 5;

const QByteArray kCallbackPage =
    "<!DOCTYPE html><html><head><title>ovscp</title></head>"
    "<body><p>Authentication complete. You can close this window.</p></body></html>";

void writeHttpResponse(QTcpSocket* sock, int status, const QByteArray& reason,
                       const QByteArray& body) {
    QByteArray resp = "HTTP/1.1 " + QByteArray::number(status) + " " + reason + "\r\n";
    resp += "Content-Type: text/html; charset=utf-8\r\n";
    resp += "Content-Length: " + QByteArray::number(body.size()) + "\r\n";
    resp += "Connection: close\r\n\r\n";
    resp += body;
    sock->write(resp);
    sock->waitForBytesWritten(1000);
    sock->disconnectFromHost();
}

// Waits for a reply while the caller's clock runs; returns the body.
bool waitForReply(QNetworkReply* reply, QByteArray& body, std::string& err) {
    if (!reply->isFinished()) {
        QEventLoop loop;
        QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
        loop.exec();
    }
    body = reply->readAll();
    if (reply->error() != QNetworkReply::NoError) {
        const int status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
        err = reply->url().toString().toStdString() + ": " + reply->errorString().toStdString();
        if (status > 0)
            err += " (HTTP " + std::to_string(status) + ")";
        return false;
    }
    return true;
}

bool parseJsonObject(const QByteArray& body, QJsonObject& out, std::string& err) {
    QJsonParseError pe{};
    const QJsonDocument doc = QJsonDocument::fromJson(body, &pe);
    if (pe.error != QJsonParseError::NoError || !doc.isObject()) {
        err = "malformed JSON response: " + pe.errorString().toStdString();
        return false;
    }
    out = doc.object();
    return true;
}

QString trimmedIssuer(QString s) {
    while (s.endsWith(QLatin1Char('/')))
        s.chop(1);
    return s;
}

} // namespace

QString OidcConfig::redirectUri() const {
    return QStringLiteral("http://localhost:%1%2").arg(callbackPort).arg(callbackPath);
}

const char* oidcErrorName(OidcError e) {
    switch (e) {
    case OidcError::None: return "None";
    case OidcError::InvalidConfig: return "InvalidConfig";
    case OidcError::Discovery: return "Discovery";
    case OidcError::Listener: return "Listener";
    case OidcError::Timeout: return "Timeout";
    case OidcError::Denied: return "Denied";
    case OidcError::StateMismatch: return "StateMismatch";
    case OidcError::Exchange: return "Exchange";
    case OidcError::MissingToken: return "MissingToken";
    case OidcError::InvalidToken: return "InvalidToken";
    }
    return "Unknown";
}

OidcTokenProvider::OidcTokenProvider(OidcConfig cfg, BrowserOpener opener)
    : cfg_(std::move(cfg)), opener_(std::move(opener)) {}

bool OidcTokenProvider::fail(OidcError e, const std::string& msg, std::string& err) {
    lastError_ = e;
    err = msg;
    return false;
}

bool OidcTokenProvider::validate(const OidcConfig& cfg, std::string& err) {
    if (cfg.clientId.trimmed().isEmpty()) {
        err = "invalid config: ClientID must be set";
        return false;
    }
    const QUrl issuer(cfg.issuer);
    if (cfg.issuer.isEmpty() || !issuer.isValid() || issuer.scheme().isEmpty() ||
        issuer.host().isEmpty()) {
        err = "invalid config: issuer must be an absolute URL, got [" + cfg.issuer.toStdString() + "]";
        return false;
    }
    if (!cfg.callbackPath.startsWith(QLatin1Char('/'))) {
        err = "invalid config: callback path must start with '/'";
        return false;
    }
    if (cfg.callbackPort == 0) {
        err = "invalid config: callback port must be set";
        return false;
    }
    if (cfg.timeoutSeconds <= 0) {
        err = "invalid config: timeout must be positive";
        return false;
    }
    return true;
}

QString OidcTokenProvider::generateState() {
    return QUuid::createUuid().toString(QUuid::WithoutBraces);
}

QByteArray OidcTokenProvider::generateCodeVerifier() {
    QByteArray raw(32, Qt::Uninitialized);
    QRandomGenerator* rng = QRandomGenerator::system();
    for (int i = 0; i < raw.size(); ++i)
        raw[i] = static_cast<char>(rng->bounded(256));
    return raw.toBase64(QByteArray::Base64UrlEncoding | QByteArray::OmitTrailingEquals);
}

QByteArray OidcTokenProvider::codeChallengeFor(const QByteArray& verifier) {
    return QCryptographicHash::hash(verifier, QCryptographicHash::Sha256)
        .toBase64(QByteArray::Base64UrlEncoding | QByteArray::OmitTrailingEquals);
}

QUrl OidcTokenProvider::buildAuthorizationUrl(const QUrl& authorizationEndpoint,
                                              const OidcConfig& cfg,
                                              const QString& state,
                                              const QByteArray& codeChallenge) {
    QUrl url(authorizationEndpoint);
    QUrlQuery q(url);
    q.addQueryItem(QStringLiteral("response_type"), QStringLiteral("code"));
    q.addQueryItem(QStringLiteral("client_id"), QString::fromUtf8(QUrl::toPercentEncoding(cfg.clientId)));
    q.addQueryItem(QStringLiteral("redirect_uri"), QString::fromUtf8(QUrl::toPercentEncoding(cfg.redirectUri())));
    q.addQueryItem(QStringLiteral("scope"), QString::fromUtf8(QUrl::toPercentEncoding(cfg.scopes.join(QLatin1Char(' ')))));
    q.addQueryItem(QStringLiteral("state"), state);
    if (!codeChallenge.isEmpty()) {
        q.addQueryItem(QStringLiteral("code_challenge"), QString::fromLatin1(codeChallenge));
        q.addQueryItem(QStringLiteral("code_challenge_method"), QStringLiteral("S256"));
    }
    url.setQuery(q);
    return url;
}

OidcTokenProvider::CallbackResult
OidcTokenProvider::parseCallbackRequest(const QByteArray& requestHead,
                                        const QString& callbackPath) {
    CallbackResult r;
    const int eol = requestHead.indexOf("\r\n");
    const QByteArray line = eol >= 0 ? requestHead.left(eol) : requestHead;
    const QList<QByteArray> parts = line.split(' ');
    if (parts.size() < 2 || parts[0] != "GET")
        return r;
    const QUrl target = QUrl::fromEncoded(parts[1]);
    if (target.path() != callbackPath)
        return r;
    r.matched = true;
    const QUrlQuery q(target);
    r.code = q.queryItemValue(QStringLiteral("code"), QUrl::FullyDecoded);
    r.state = q.queryItemValue(QStringLiteral("state"), QUrl::FullyDecoded);
    r.error = q.queryItemValue(QStringLiteral("error"), QUrl::FullyDecoded);
    r.errorDescription = q.queryItemValue(QStringLiteral("error_description"), QUrl::FullyDecoded);
    return r;
}

bool OidcTokenProvider::validateIdTokenClaims(const QString& idToken,
                                              const QString& expectedIssuer,
                                              const QString& clientId,
                                              qint64 nowSecs,
                                              std::string& err) {
    const QStringList parts = idToken.split(QLatin1Char('.'));
    if (parts.size() != 3) {
        err = "ID token is not a JWT";
        return false;
    }
    const QByteArray payload = QByteArray::fromBase64(parts[1].toLatin1(),
                                                      QByteArray::Base64UrlEncoding);
    QJsonObject claims;
    if (!parseJsonObject(payload, claims, err)) {
        err = "ID token payload: " + err;
        return false;
    }
    const QString iss = claims.value(QStringLiteral("iss")).toString();
    if (trimmedIssuer(iss) != trimmedIssuer(expectedIssuer)) {
        err = "ID token issuer [" + iss.toStdString() + "] does not match [" +
              expectedIssuer.toStdString() + "]";
        return false;
    }
    const QJsonValue aud = claims.value(QStringLiteral("aud"));
    bool audOk = aud.isString() && aud.toString() == clientId;
    if (aud.isArray()) {
        for (const QJsonValue& v : aud.toArray())
            audOk = audOk || v.toString() == clientId;
    }
    if (!audOk) {
        err = "ID token audience does not include client [" + clientId.toStdString() + "]";
        return false;
    }
    const QJsonValue exp = claims.value(QStringLiteral("exp"));
    if (!exp.isDouble()) {
        err = "ID token has no exp claim";
        return false;
    }
    if (static_cast<qint64>(exp.toDouble()) + kClockSkewSecs < nowSecs) {
        err = "ID token expired";
        return false;
    }
    return true;
}

OidcTokenProvider::BrowserOpener OidcTokenProvider::systemBrowserOpener() {
    return [](const QUrl& url) {
#if defined(Q_OS_MACOS)
        const QString program = QStringLiteral("open");
#elif defined(Q_OS_WIN)
        const QString program = QStringLiteral("explorer");
#else
        const QString program = QStringLiteral("xdg-open");
#endif
        return QProcess::startDetached(program, {url.toString(QUrl::FullyEncoded)});
    };
}

bool OidcTokenProvider::getToken(QString& idToken, std::string& err) {
    lastError_ = OidcError::None;
    std::string vErr;
    if (!validate(cfg_, vErr))
        return fail(OidcError::InvalidConfig, vErr, err);

    const int timeoutMs = cfg_.timeoutSeconds * 1000;
    QNetworkAccessManager nam;

    // Discovery
    QUrl discoveryUrl(trimmedIssuer(cfg_.issuer) + QStringLiteral("/.well-known/openid-configuration"));
    QNetworkRequest discoveryReq(discoveryUrl);
    discoveryReq.setTransferTimeout(timeoutMs);
    std::unique_ptr<QNetworkReply> discoveryReply(nam.get(discoveryReq));
    QByteArray body;
    std::string nErr;
    QJsonObject discovery;
    if (!waitForReply(discoveryReply.get(), body, nErr) || !parseJsonObject(body, discovery, nErr))
        return fail(OidcError::Discovery, "OIDC discovery failed: " + nErr, err);
    const QUrl authEndpoint(discovery.value(QStringLiteral("authorization_endpoint")).toString());
    const QUrl tokenEndpoint(discovery.value(QStringLiteral("token_endpoint")).toString());
    const QString issuer = discovery.value(QStringLiteral("issuer")).toString(cfg_.issuer);
    if (!authEndpoint.isValid() || authEndpoint.isEmpty() || !tokenEndpoint.isValid() ||
        tokenEndpoint.isEmpty()) {
        return fail(OidcError::Discovery,
                    "OIDC discovery document lacks authorization/token endpoints", err);
    }

    // Loopback listener
    QTcpServer server;
    if (!server.listen(QHostAddress::LocalHost, cfg_.callbackPort)) {
        return fail(OidcError::Listener,
                    "cannot listen on localhost:" + std::to_string(cfg_.callbackPort) + ": " +
                        server.errorString().toStdString(),
                    err);
    }

    const QString state = generateState();
    const QByteArray verifier = cfg_.clientSecret.isEmpty() ? generateCodeVerifier() : QByteArray();
    const QUrl authUrl = buildAuthorizationUrl(
        authEndpoint, cfg_, state, verifier.isEmpty() ? QByteArray() : codeChallengeFor(verifier));

    qCInfo(ovOidc).noquote() << "Complete authentication in your browser:" << authUrl.toString();
    if (!opener_ || !opener_(authUrl))
        qCWarning(ovOidc) << "Could not launch a browser; open the URL above manually";

    // Wait for the redirect
    CallbackResult cb;
    bool received = false;
    QHash<QTcpSocket*, QByteArray> pending;
    QEventLoop loop;
    QTimer timer;
    timer.setSingleShot(true);
    QObject::connect(&timer, &QTimer::timeout, &loop, &QEventLoop::quit);
    QObject::connect(&server, &QTcpServer::newConnection, &loop, [&]() {
        while (QTcpSocket* sock = server.nextPendingConnection()) {
            QObject::connect(sock, &QTcpSocket::disconnected, sock, &QObject::deleteLater);
            QObject::connect(sock, &QTcpSocket::destroyed, &loop,
                             [&pending, sock]() { pending.remove(sock); });
            QObject::connect(sock, &QTcpSocket::readyRead, &loop, [&, sock]() {
                QByteArray& buf = pending[sock];
                buf += sock->readAll();
                if (!buf.contains("\r\n\r\n") || received)
                    return;
                const CallbackResult r = parseCallbackRequest(buf, cfg_.callbackPath);
                if (!r.matched) {
                    writeHttpResponse(sock, 404, "Not Found", QByteArray());
                    return;
                }
                writeHttpResponse(sock, 200, "OK", kCallbackPage);
                cb = r;
                received = true;
                loop.quit();
            });
        }
    });
    timer.start(timeoutMs);
    loop.exec();
    server.close();

    if (!received) {
        return fail(OidcError::Timeout,
                    "no browser callback within " + std::to_string(cfg_.timeoutSeconds) + " seconds",
                    err);
    }
    if (!cb.error.isEmpty()) {
        return fail(OidcError::Denied,
                    "identity provider returned " + cb.error.toStdString() +
                        (cb.errorDescription.isEmpty() ? std::string()
                                                       : ": " + cb.errorDescription.toStdString()),
                    err);
    }
    if (cb.state != state)
        return fail(OidcError::StateMismatch, "callback state does not match the request", err);
    if (cb.code.isEmpty())
        return fail(OidcError::Denied, "callback carried no authorization code", err);
    qCDebug(ovOidc) << "authorization code received:"
                    << QString::fromStdString(ovscp::redactSecret(cb.code.toStdString()));

    // Code exchange
    QUrlQuery form;
    form.addQueryItem(QStringLiteral("grant_type"), QStringLiteral("authorization_code"));
    form.addQueryItem(QStringLiteral("code"), QString::fromUtf8(QUrl::toPercentEncoding(cb.code)));
    form.addQueryItem(QStringLiteral("redirect_uri"), QString::fromUtf8(QUrl::toPercentEncoding(cfg_.redirectUri())));
    form.addQueryItem(QStringLiteral("client_id"), QString::fromUtf8(QUrl::toPercentEncoding(cfg_.clientId)));
    if (cfg_.clientSecret.isEmpty())
        form.addQueryItem(QStringLiteral("code_verifier"), QString::fromLatin1(verifier));
    else
        form.addQueryItem(QStringLiteral("client_secret"), QString::fromUtf8(QUrl::toPercentEncoding(cfg_.clientSecret)));

    QNetworkRequest tokenReq(tokenEndpoint);
    tokenReq.setHeader(QNetworkRequest::ContentTypeHeader,
                       QStringLiteral("application/x-www-form-urlencoded"));
    tokenReq.setRawHeader("Accept", "application/json");
    tokenReq.setTransferTimeout(timeoutMs);
    std::unique_ptr<QNetworkReply> tokenReply(
        nam.post(tokenReq, form.toString(QUrl::FullyEncoded).toUtf8()));
    QJsonObject tokens;
    if (!waitForReply(tokenReply.get(), body, nErr) || !parseJsonObject(body, tokens, nErr))
        return fail(OidcError::Exchange, "token exchange failed: " + nErr, err);
    if (tokens.contains(QStringLiteral("error"))) {
        return fail(OidcError::Exchange,
                    "token exchange failed: " +
                        tokens.value(QStringLiteral("error")).toString().toStdString(),
                    err);
    }
    const QString token = tokens.value(QStringLiteral("id_token")).toString();
    if (token.isEmpty())
        return fail(OidcError::MissingToken, "ID token is nil", err);

    std::string cErr;
    if (!validateIdTokenClaims(token, issuer, cfg_.clientId,
                               QDateTime::currentSecsSinceEpoch(), cErr))
        return fail(OidcError::InvalidToken, cErr, err);

    qCDebug(ovOidc) << "ID token obtained:"
                    << QString::fromStdString(ovscp::redactSecret(token.toStdString()));
    idToken = token;
    return true;
}
