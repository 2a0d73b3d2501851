#include "ovscp/MockSftpClient.hpp"
#include "ovscp/RemotePath.hpp"
#include <fstream>
#include <iterator>

namespace ovscp {

MockSftpClient::MockSftpClient() {
  fs_["/"] = Node{true, {}};
  addDir("/home");
  addDir("/tmp");
}

std::string MockSftpClient::normalize(const std::string& path) const {
  std::string p = path;
  if (p.empty() || p == ".")
    p = lastOpt_.username.empty() ? "/" : "/home/" + lastOpt_.username;
  else if (p.front() != '/')
    p = joinRemotePath(lastOpt_.username.empty() ? "/" : "/home/" + lastOpt_.username, p);
  return cleanRemotePath(p);
}

// Follows links on the last component, as the server side of stat would.
std::string MockSftpClient::resolve(const std::string& path) const {
  std::string p = normalize(path);
  for (int hops = 0; hops < 8; ++hops) {
    auto it = fs_.find(p);
    if (it == fs_.end() || it->second.link_target.empty())
      return p;
    const std::string& target = it->second.link_target;
    p = cleanRemotePath(target.front() == '/' ? target
                                              : joinRemotePath(parentOf(p), target));
  }
  return p;
}

std::string MockSftpClient::parentOf(const std::string& path) {
  return remoteDirName(path);
}

bool MockSftpClient::connect(const SessionOptions& opt, std::string& err) {
  if (opt.stream_fd < 0) {
    err = "no transport stream to negotiate SSH over";
    return false;
  }
  if (opt.username.empty()) {
    err = "username is required";
    return false;
  }
  bool anyKey = false;
  for (const auto& m : opt.auth_methods) {
    if (m.kind != AuthMethodKind::BearerToken)
      anyKey = true;
  }
  if (!anyKey) {
    err = "no accepted authentication method for user [" + opt.username + "]";
    return false;
  }
  connected_ = true;
  ++connectCount_;
  lastOpt_ = opt;
  addDir("/home/" + opt.username);
  return true;
}

void MockSftpClient::disconnect() {
  connected_ = false;
}

void MockSftpClient::addDir(const std::string& path) {
  const std::string p = cleanRemotePath(path);
  if (p != "/")
    addDir(parentOf(p));
  auto it = fs_.find(p);
  if (it == fs_.end())
    fs_[p] = Node{true, {}};
}

void MockSftpClient::addFile(const std::string& path, const std::string& content) {
  const std::string p = cleanRemotePath(path);
  addDir(parentOf(p));
  fs_[p] = Node{false, content};
}

void MockSftpClient::addSymlink(const std::string& path, const std::string& target) {
  const std::string p = cleanRemotePath(path);
  addDir(parentOf(p));
  Node n;
  n.link_target = target;
  fs_[p] = n;
}

bool MockSftpClient::hasDir(const std::string& path) const {
  auto it = fs_.find(normalize(path));
  return it != fs_.end() && it->second.is_dir;
}

bool MockSftpClient::hasFile(const std::string& path) const {
  auto it = fs_.find(normalize(path));
  return it != fs_.end() && !it->second.is_dir;
}

std::string MockSftpClient::fileContent(const std::string& path) const {
  auto it = fs_.find(normalize(path));
  return it == fs_.end() ? std::string() : it->second.content;
}

bool MockSftpClient::list(const std::string& remote_path,
                          std::vector<FileInfo>& out,
                          std::string& err) {
  if (!connected_) {
    err = "not connected";
    return false;
  }
  const std::string path = resolve(remote_path);
  auto it = fs_.find(path);
  if (it == fs_.end() || !it->second.is_dir) {
    err = "cannot open remote directory [" + path + "]: no such file";
    return false;
  }
  out.clear();
  for (const auto& kv : fs_) {
    if (kv.first == path || parentOf(kv.first) != path)
      continue;
    FileInfo fi;
    fi.name = remoteBaseName(kv.first);
    fi.is_dir = kv.second.is_dir;
    fi.is_link = !kv.second.link_target.empty();
    fi.size = kv.second.content.size();
    fi.mode = fi.is_link ? 0120777 : (kv.second.is_dir ? 040755 : 0100644);
    out.push_back(fi);
  }
  return true;
}

bool MockSftpClient::get(const std::string& remote,
                         const std::string& local,
                         std::string& err,
                         ProgressCB progress) {
  if (!connected_) {
    err = "not connected";
    return false;
  }
  const std::string path = resolve(remote);
  auto it = fs_.find(path);
  if (it == fs_.end() || it->second.is_dir || !it->second.link_target.empty()) {
    err = "error opening remote file [" + path + "]: no such file";
    return false;
  }
  std::ofstream lf(local, std::ios::binary | std::ios::trunc);
  if (!lf.is_open()) {
    err = "error opening local file [" + local + "]";
    return false;
  }
  lf.write(it->second.content.data(), static_cast<std::streamsize>(it->second.content.size()));
  if (!lf) {
    err = "error writing local file [" + local + "]";
    return false;
  }
  journal_.push_back("get " + path);
  if (progress) progress(it->second.content.size(), it->second.content.size());
  return true;
}

bool MockSftpClient::put(const std::string& local,
                         const std::string& remote,
                         std::string& err,
                         ProgressCB progress) {
  if (!connected_) {
    err = "not connected";
    return false;
  }
  std::ifstream lf(local, std::ios::binary);
  if (!lf.is_open()) {
    err = "unable to read local file [" + local + "]";
    return false;
  }
  std::string content((std::istreambuf_iterator<char>(lf)), std::istreambuf_iterator<char>());

  const std::string path = normalize(remote);
  auto parent = fs_.find(parentOf(path));
  if (parent == fs_.end() || !parent->second.is_dir) {
    err = "unable to open remote file [" + path + "]: no such file";
    return false;
  }
  auto existing = fs_.find(path);
  if (existing != fs_.end() && existing->second.is_dir) {
    err = "unable to open remote file [" + path + "]: failure";
    return false;
  }
  fs_[path] = Node{false, content};
  journal_.push_back("put " + path);
  if (progress) progress(content.size(), content.size());
  return true;
}

bool MockSftpClient::exists(const std::string& remote_path,
                            bool& isDir,
                            std::string& err) {
  isDir = false;
  FileInfo info;
  if (!stat(remote_path, info, err))
    return false;
  isDir = info.is_dir;
  return true;
}

bool MockSftpClient::stat(const std::string& remote_path,
                          FileInfo& info,
                          std::string& err) {
  if (!connected_) {
    err = "not connected";
    return false;
  }
  const std::string path = resolve(remote_path);
  auto it = fs_.find(path);
  if (it == fs_.end() || !it->second.link_target.empty()) {
    err.clear();
    return false;
  }
  info.name = remoteBaseName(path);
  info.is_dir = it->second.is_dir;
  info.size = it->second.content.size();
  info.mode = it->second.is_dir ? 040755 : 0100644;
  return true;
}

bool MockSftpClient::mkdir(const std::string& remote_dir,
                           std::string& err,
                           unsigned int /*mode*/) {
  if (!connected_) {
    err = "not connected";
    return false;
  }
  const std::string path = normalize(remote_dir);
  if (mkdirFailures_.count(path)) {
    err = "cannot create remote directory [" + path + "]: permission denied";
    return false;
  }
  if (fs_.count(path)) {
    err = "cannot create remote directory [" + path + "]: failure";
    return false;
  }
  auto parent = fs_.find(parentOf(path));
  if (parent == fs_.end() || !parent->second.is_dir) {
    err = "cannot create remote directory [" + path + "]: no such file";
    return false;
  }
  fs_[path] = Node{true, {}};
  journal_.push_back("mkdir " + path);
  return true;
}

} // namespace ovscp
