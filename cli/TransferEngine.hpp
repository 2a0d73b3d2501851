// Runs one transfer over an established SFTP session: single files in either
// direction, or a pre-order directory walk that mirrors the source tree.
#pragma once
#include "ovscp/Endpoint.hpp"
#include <QFileInfo>
#include <QString>
#include <QtGlobal>
#include <string>

namespace ovscp { class SftpClient; }

struct TransferOptions {
    bool recursive = false;
};

struct TransferStats {
    int files = 0;
    int directories = 0;
    int directoryFailures = 0; // best-effort creations that failed
    quint64 bytes = 0;
};

class TransferEngine {
public:
    TransferEngine(ovscp::SftpClient& client, TransferOptions opt);

    // Dispatches on direction and the recursive flag.
    bool run(const ovscp::TransferRequest& req, std::string& err);

    bool sendFile(const QString& localPath, const std::string& remotePath, std::string& err);
    bool retrieveFile(const std::string& remotePath, const QString& localPath, std::string& err);

    // Blank remote path or existing remote directory: append the local base name.
    std::string inferRemoteDestination(const std::string& remotePath, const QString& localPath);
    // Blank local path or existing local directory: append the remote base name.
    QString inferLocalDestination(const QString& localPath, const std::string& remotePath) const;

    // Directories are created best-effort; the first failed file aborts the walk.
    bool uploadTree(const QString& localRoot, const std::string& remoteRoot, std::string& err);
    bool downloadTree(const std::string& remoteRoot, const QString& localRoot, std::string& err);

    const TransferStats& stats() const { return stats_; }

private:
    ovscp::SftpClient& client_;
    TransferOptions opt_;
    TransferStats stats_;

    bool walkUpload(const QFileInfo& dir, const std::string& remoteDir, std::string& err);
    bool walkDownload(const std::string& remoteDir, const QString& localDir, std::string& err);
};
