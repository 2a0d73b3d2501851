// Transfer engine: file copies and recursive tree mirroring over SftpClient.
#include "TransferEngine.hpp"
#include "ovscp/RemotePath.hpp"
#include "ovscp/SftpClient.hpp"
#include <QDir>
#include <QFile>
#include <QLoggingCategory>
#include <algorithm>
#include <vector>
Q_LOGGING_CATEGORY(ovXfer, "ovscp.transfer")

namespace {

std::string localBytes(const QString& path) {
    return QFile::encodeName(path).toStdString();
}

// Base name of a local path, resolving "." and trailing separators.
QString localBaseName(const QString& path) {
    const QString abs = QDir::cleanPath(QFileInfo(path).absoluteFilePath());
    return QFileInfo(abs).fileName();
}

} // namespace

TransferEngine::TransferEngine(ovscp::SftpClient& client, TransferOptions opt)
    : client_(client), opt_(opt) {}

std::string TransferEngine::inferRemoteDestination(const std::string& remotePath,
                                                   const QString& localPath) {
    const std::string base = localBaseName(localPath).toStdString();
    if (remotePath.empty())
        return base;
    bool isDir = false;
    std::string err;
    if (client_.exists(remotePath, isDir, err) && isDir)
        return ovscp::joinRemotePath(remotePath, base);
    qCDebug(ovXfer) << "Remote file/directory" << QString::fromStdString(remotePath)
                    << "is not an existing directory"
                    << (err.empty() ? QString() : QString::fromStdString(err));
    return remotePath;
}

QString TransferEngine::inferLocalDestination(const QString& localPath,
                                              const std::string& remotePath) const {
    const QString base = QString::fromStdString(ovscp::remoteBaseName(remotePath));
    if (localPath.isEmpty())
        return base;
    if (QFileInfo(localPath).isDir())
        return QDir(localPath).filePath(base);
    return localPath;
}

bool TransferEngine::sendFile(const QString& localPath, const std::string& remotePath,
                              std::string& err) {
    std::string pErr;
    if (!client_.put(localBytes(localPath), remotePath, pErr)) {
        err = "upload " + localPath.toStdString() + " => " + remotePath + " failed: " + pErr;
        return false;
    }
    ++stats_.files;
    stats_.bytes += static_cast<quint64>(QFileInfo(localPath).size());
    qCDebug(ovXfer) << "sent file:" << localPath << "==>" << QString::fromStdString(remotePath);
    return true;
}

bool TransferEngine::retrieveFile(const std::string& remotePath, const QString& localPath,
                                  std::string& err) {
    std::string gErr;
    if (!client_.get(remotePath, localBytes(localPath), gErr)) {
        err = "download " + remotePath + " => " + localPath.toStdString() + " failed: " + gErr;
        return false;
    }
    ++stats_.files;
    stats_.bytes += static_cast<quint64>(QFileInfo(localPath).size());
    qCInfo(ovXfer).noquote() << QString::fromStdString(remotePath) << "=>" << localPath;
    return true;
}

bool TransferEngine::run(const ovscp::TransferRequest& req, std::string& err) {
    const QString local = QString::fromStdString(req.local_path);
    const std::string& remote = req.remote.path;

    if (req.direction == ovscp::TransferDirection::UploadToRemote) {
        const QFileInfo fi(local);
        if (!fi.exists()) {
            err = "unable to read local file " + req.local_path + ": no such file or directory";
            return false;
        }
        if (opt_.recursive)
            return uploadTree(local, remote, err);
        if (fi.isDir()) {
            err = req.local_path + " is a directory (use --recursive)";
            return false;
        }
        return sendFile(local, inferRemoteDestination(remote, local), err);
    }

    if (remote.empty()) {
        err = "remote path is empty; nothing to download";
        return false;
    }
    if (opt_.recursive)
        return downloadTree(remote, local, err);

    ovscp::FileInfo info;
    std::string sErr;
    if (client_.stat(remote, info, sErr) && info.is_dir) {
        err = remote + " is a remote directory (use --recursive)";
        return false;
    }
    return retrieveFile(remote, inferLocalDestination(local, remote), err);
}

bool TransferEngine::uploadTree(const QString& localRoot, const std::string& remoteRoot,
                                std::string& err) {
    const QFileInfo root(localRoot);
    if (!root.exists()) {
        err = "unable to read local file " + localRoot.toStdString() + ": no such file or directory";
        return false;
    }
    if (!root.isDir())
        return sendFile(localRoot, inferRemoteDestination(remoteRoot, localRoot), err);

    const QString base = localBaseName(localRoot);
    const std::string dest = base.isEmpty() ? remoteRoot
                                            : ovscp::joinRemotePath(remoteRoot, base.toStdString());
    if (dest.empty()) {
        err = "cannot derive a remote directory for " + localRoot.toStdString();
        return false;
    }
    return walkUpload(root, dest, err);
}

bool TransferEngine::walkUpload(const QFileInfo& dir, const std::string& remoteDir,
                                std::string& err) {
    std::string mErr;
    if (!client_.mkdir(remoteDir, mErr)) {
        ++stats_.directoryFailures;
        qCWarning(ovXfer).noquote() << QString::fromStdString(mErr);
    } else {
        ++stats_.directories;
        qCDebug(ovXfer) << "made directory:" << QString::fromStdString(remoteDir);
    }

    const QFileInfoList entries = QDir(dir.absoluteFilePath())
        .entryInfoList(QDir::AllEntries | QDir::NoDotAndDotDot | QDir::Hidden | QDir::System,
                       QDir::Name);
    for (const QFileInfo& e : entries) {
        const std::string dest = ovscp::joinRemotePath(remoteDir, e.fileName().toStdString());
        if (e.isSymLink() && e.isDir()) {
            qCWarning(ovXfer) << "skipping symbolic link to directory:" << e.filePath();
            continue;
        }
        if (!e.isDir() && !e.isFile()) {
            qCWarning(ovXfer) << "skipping special file:" << e.filePath();
            continue;
        }
        if (e.isDir()) {
            if (!walkUpload(e, dest, err))
                return false;
        } else if (!sendFile(e.filePath(), dest, err)) {
            return false;
        }
    }
    return true;
}

bool TransferEngine::downloadTree(const std::string& remoteRoot, const QString& localRoot,
                                  std::string& err) {
    ovscp::FileInfo info;
    std::string sErr;
    if (!client_.stat(remoteRoot, info, sErr)) {
        err = "error opening remote file [" + remoteRoot + "]: " +
              (sErr.empty() ? std::string("no such file") : sErr);
        return false;
    }
    if (!info.is_dir)
        return retrieveFile(remoteRoot, inferLocalDestination(localRoot, remoteRoot), err);

    const std::string base = ovscp::remoteBaseName(ovscp::cleanRemotePath(remoteRoot));
    QString dest = localRoot.isEmpty() ? QStringLiteral(".") : localRoot;
    if (!base.empty() && base != "." && base != "/" && base != "..")
        dest = QDir(dest).filePath(QString::fromStdString(base));
    return walkDownload(remoteRoot, dest, err);
}

bool TransferEngine::walkDownload(const std::string& remoteDir, const QString& localDir,
                                  std::string& err) {
    if (QFileInfo(localDir).isDir()) {
        qCDebug(ovXfer) << "directory exists:" << localDir;
    } else if (!QDir().mkdir(localDir)) {
        ++stats_.directoryFailures;
        qCWarning(ovXfer) << "cannot create local directory" << localDir;
    } else {
        ++stats_.directories;
        qCDebug(ovXfer) << "made directory:" << localDir;
    }

    std::vector<ovscp::FileInfo> entries;
    std::string lErr;
    if (!client_.list(remoteDir, entries, lErr)) {
        err = "cannot list remote directory " + remoteDir + ": " + lErr;
        return false;
    }
    std::sort(entries.begin(), entries.end(),
              [](const ovscp::FileInfo& a, const ovscp::FileInfo& b) { return a.name < b.name; });

    for (const auto& e : entries) {
        if (!ovscp::isPlainEntryName(e.name)) {
            qCWarning(ovXfer) << "skipping remote entry with unsafe name in"
                              << QString::fromStdString(remoteDir) << ":"
                              << QString::fromStdString(e.name);
            continue;
        }
        const std::string src = ovscp::joinRemotePath(remoteDir, e.name);
        const QString dest = QDir(localDir).filePath(QString::fromStdString(e.name));
        if (e.is_link) {
            ovscp::FileInfo target;
            std::string sErr;
            if (client_.stat(src, target, sErr) && target.is_dir) {
                qCWarning(ovXfer) << "skipping symbolic link to directory:"
                                  << QString::fromStdString(src);
                continue;
            }
        }
        if (e.is_dir) {
            if (!walkDownload(src, dest, err))
                return false;
        } else if (!retrieveFile(src, dest, err)) {
            return false;
        }
    }
    return true;
}
