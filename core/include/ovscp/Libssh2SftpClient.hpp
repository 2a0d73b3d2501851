#pragma once
#include "SftpClient.hpp"
#include <string>
#include <vector>

// Forward declarations of libssh2's internal (underscored) types
struct _LIBSSH2_SESSION;
struct _LIBSSH2_SFTP;

namespace ovscp {

class Libssh2SftpClient : public SftpClient {
public:
  Libssh2SftpClient();
  ~Libssh2SftpClient() override;

  Libssh2SftpClient(const Libssh2SftpClient&) = delete;
  Libssh2SftpClient& operator=(const Libssh2SftpClient&) = delete;

  bool connect(const SessionOptions& opt, std::string& err) override;
  void disconnect() override;
  bool isConnected() const override { return connected_; }

  bool list(const std::string& remote_path,
            std::vector<FileInfo>& out,
            std::string& err) override;

  bool get(const std::string& remote,
           const std::string& local,
           std::string& err,
           ProgressCB progress = {}) override;

  bool put(const std::string& local,
           const std::string& remote,
           std::string& err,
           ProgressCB progress = {}) override;

  bool exists(const std::string& remote_path,
              bool& isDir,
              std::string& err) override;

  bool stat(const std::string& remote_path,
            FileInfo& info,
            std::string& err) override;

  bool mkdir(const std::string& remote_dir,
             std::string& err,
             unsigned int mode = 0755) override;

  // Available after the handshake, e.g. "SHA256:AB:CD:..."
  const std::string& hostKeyFingerprint() const { return hostKeyFingerprint_; }
  // Credential kind the server accepted ("file-key" / "agent-key")
  const std::string& acceptedMethod() const { return acceptedMethod_; }

private:
  bool connected_ = false;
  _LIBSSH2_SESSION* session_ = nullptr;
  _LIBSSH2_SFTP*    sftp_    = nullptr;
  std::string hostKeyFingerprint_;
  std::string acceptedMethod_;

  bool sshHandshake(const SessionOptions& opt, std::string& err);
  bool authenticate(const SessionOptions& opt, std::string& err);
  bool authWithFileKey(const SessionOptions& opt, const AuthMethod& m, std::string& err);
  bool authWithAgent(const SessionOptions& opt, std::string& err);
  std::string lastSessionError() const;
  std::string lastSftpError(const std::string& what, const std::string& path) const;
};

} // namespace ovscp
