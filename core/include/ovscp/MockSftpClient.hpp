#pragma once
#include "SftpClient.hpp"
#include <map>
#include <set>
#include <string>
#include <vector>

namespace ovscp {

// In-memory SFTP server used by tests. Paths are absolute or relative to the
// virtual home "/home/<user>" once connected.
class MockSftpClient : public SftpClient {
public:
  MockSftpClient();

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

  // Seeding and inspection helpers
  void addDir(const std::string& path);
  void addFile(const std::string& path, const std::string& content);
  // Symbolic link; stat, get and list of the link follow it.
  void addSymlink(const std::string& path, const std::string& target);
  bool hasDir(const std::string& path) const;
  bool hasFile(const std::string& path) const;
  std::string fileContent(const std::string& path) const;
  // Make mkdir(path) fail with "permission denied"
  void failMkdirFor(const std::string& path) { mkdirFailures_.insert(normalize(path)); }

  // Mutating operations in call order, e.g. "mkdir /dest/a", "put /dest/a/x.txt"
  const std::vector<std::string>& journal() const { return journal_; }
  const SessionOptions& lastOptions() const { return lastOpt_; }
  int connectCount() const { return connectCount_; }

private:
  struct Node {
    bool is_dir = false;
    std::string content;
    std::string link_target; // non-empty: symbolic link
  };

  bool connected_ = false;
  int connectCount_ = 0;
  SessionOptions lastOpt_{};
  std::map<std::string, Node> fs_;
  std::set<std::string> mkdirFailures_;
  std::vector<std::string> journal_;

  std::string normalize(const std::string& path) const;
  std::string resolve(const std::string& path) const;
  static std::string parentOf(const std::string& path);
};

} // namespace ovscp
