// Resolves the credentials offered to the SSH server: a private key file,
// then the running key agent. Resolution happens once per resolver.
#pragma once
#include "ovscp/SftpTypes.hpp"
#include <QByteArray>
#include <QString>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

enum class KeyFileStatus {
    Loaded,
    Unreadable,
    NoKeyFound,
    PassphraseProtected // no passphrase prompt is implemented
};

const char* keyFileStatusName(KeyFileStatus s);

// Classifies private key file contents (PEM, PKCS#8, OpenSSH).
KeyFileStatus classifyPrivateKey(const QByteArray& content);

struct CredentialProbes {
    // Reads the key file; false + err when it cannot be read.
    std::function<bool(const QString& path, QByteArray& content, std::string& err)> readKeyFile;
    // Finds a running key agent; socket receives its address.
    std::function<bool(QString& socket)> findAgent;

    static CredentialProbes system();
};

class CredentialResolver {
public:
    explicit CredentialResolver(QString keyPath, CredentialProbes probes = CredentialProbes::system());

    // Ordered sequence: file key, agent key, bearer token (if set). Probes run
    // on the first call only; later calls return the cached sequence.
    std::vector<ovscp::AuthMethod> resolve();
    bool isResolved() const;

    void setBearerToken(const std::string& token, const std::string& issuer);
    std::string bearerToken() const;

    // One message per candidate that could not be used.
    std::vector<std::string> diagnostics() const;
    KeyFileStatus keyFileStatus() const;
    const QString& keyPath() const { return keyPath_; }

private:
    QString keyPath_;
    CredentialProbes probes_;

    mutable std::mutex mtx_;
    bool resolved_ = false;
    std::vector<ovscp::AuthMethod> methods_;
    std::vector<std::string> diagnostics_;
    KeyFileStatus keyStatus_ = KeyFileStatus::Unreadable;
    std::string token_;
    std::string tokenIssuer_;
};
