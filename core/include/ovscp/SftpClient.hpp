// Abstract interface for SFTP operations. Concrete backends (libssh2, mock)
// implement this API so the transfer engine stays independent of the backend.
#pragma once
#include "SftpTypes.hpp"
#include <cstddef>
#include <functional>

namespace ovscp {

class SftpClient {
public:
    using ProgressCB = std::function<void(std::size_t /*done*/, std::size_t /*total*/)>;

    virtual ~SftpClient() = default;

    // Negotiate SSH over opt.stream_fd and start the SFTP subsystem.
    virtual bool connect(const SessionOptions& opt, std::string& err) = 0;
    virtual void disconnect() = 0;
    virtual bool isConnected() const = 0;

    // Directory listing without "." and "..".
    virtual bool list(const std::string& remote_path,
                      std::vector<FileInfo>& out,
                      std::string& err) = 0;

    // Download remote file to local path (create/truncate).
    virtual bool get(const std::string& remote,
                     const std::string& local,
                     std::string& err,
                     ProgressCB progress = {}) = 0;

    // Upload local file to remote path (create/truncate).
    virtual bool put(const std::string& local,
                     const std::string& remote,
                     std::string& err,
                     ProgressCB progress = {}) = 0;

    // Existence check (leaves err empty when the path simply does not exist)
    virtual bool exists(const std::string& remote_path,
                        bool& isDir,
                        std::string& err) = 0;

    // Detailed metadata. Returns true if the path exists.
    virtual bool stat(const std::string& remote_path,
                      FileInfo& info,
                      std::string& err) = 0;

    virtual bool mkdir(const std::string& remote_dir,
                       std::string& err,
                       unsigned int mode = 0755) = 0;
};

} // namespace ovscp
