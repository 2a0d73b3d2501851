// Browser-delegated OpenID Connect code flow that yields a bearer token for
// token-authenticated overlay deployments.
#pragma once
#include <QByteArray>
#include <QString>
#include <QStringList>
#include <QUrl>
#include <QtGlobal>
#include <functional>
#include <string>

struct OidcConfig {
    QString issuer;
    QString clientId;
    QString clientSecret; // empty: public client, PKCE is used
    quint16 callbackPort = 63275;
    QString callbackPath = QStringLiteral("/auth/callback");
    QStringList scopes = {QStringLiteral("openid"), QStringLiteral("profile")};
    int timeoutSeconds = 300;

    QString redirectUri() const;
};

enum class OidcError {
    None,
    InvalidConfig,
    Discovery,
    Listener,
    Timeout,
    Denied,
    StateMismatch,
    Exchange,
    MissingToken,
    InvalidToken
};

const char* oidcErrorName(OidcError e);

class OidcTokenProvider {
public:
    using BrowserOpener = std::function<bool(const QUrl&)>;

    explicit OidcTokenProvider(OidcConfig cfg, BrowserOpener opener = systemBrowserOpener());

    // Blocks until the user finishes the browser flow or the timeout expires.
    // Requires a running QCoreApplication.
    bool getToken(QString& idToken, std::string& err);
    OidcError lastError() const { return lastError_; }

    static bool validate(const OidcConfig& cfg, std::string& err);
    static QString generateState();
    static QByteArray generateCodeVerifier();
    static QByteArray codeChallengeFor(const QByteArray& verifier);
    static QUrl buildAuthorizationUrl(const QUrl& authorizationEndpoint,
                                      const OidcConfig& cfg,
                                      const QString& state,
                                      const QByteArray& codeChallenge);

    struct CallbackResult {
        bool matched = false; // request targeted the callback path
        QString code;
        QString state;
        QString error;
        QString errorDescription;
    };
    static CallbackResult parseCallbackRequest(const QByteArray& requestHead,
                                               const QString& callbackPath);

    // Checks iss, aud and exp of an ID token (signature is left to the
    // overlay controller that consumes the token).
    static bool validateIdTokenClaims(const QString& idToken,
                                      const QString& expectedIssuer,
                                      const QString& clientId,
                                      qint64 nowSecs,
                                      std::string& err);

    static BrowserOpener systemBrowserOpener();

private:
    OidcConfig cfg_;
    BrowserOpener opener_;
    OidcError lastError_ = OidcError::None;

    bool fail(OidcError e, const std::string& msg, std::string& err);
};
