// libssh2 backend: negotiates the SSH session over an already dialed overlay
// stream and drives the SFTP channel. The stream descriptor belongs to the
// caller; this class never closes it.
#include "ovscp/Libssh2SftpClient.hpp"
#include "ovscp/RemotePath.hpp"
#include <libssh2.h>
#include <libssh2_sftp.h>

#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <sys/types.h>

namespace ovscp {

namespace {

// libssh2 global initialisation (once per process)
std::once_flag g_libssh2_once;
int g_libssh2_init_rc = 0;

bool ensureLibssh2(std::string& err) {
    std::call_once(g_libssh2_once, [] { g_libssh2_init_rc = libssh2_init(0); });
    if (g_libssh2_init_rc != 0) {
        err = "libssh2_init failed (rc=" + std::to_string(g_libssh2_init_rc) + ")";
        return false;
    }
    return true;
}

const char* sftpStatusText(unsigned long code) {
    switch (code) {
    case LIBSSH2_FX_OK: return "ok";
    case LIBSSH2_FX_EOF: return "end of file";
    case LIBSSH2_FX_NO_SUCH_FILE: return "no such file";
    case LIBSSH2_FX_PERMISSION_DENIED: return "permission denied";
    case LIBSSH2_FX_FAILURE: return "failure";
    case LIBSSH2_FX_BAD_MESSAGE: return "bad message";
    case LIBSSH2_FX_NO_CONNECTION: return "no connection";
    case LIBSSH2_FX_CONNECTION_LOST: return "connection lost";
    case LIBSSH2_FX_OP_UNSUPPORTED: return "operation unsupported";
    case LIBSSH2_FX_INVALID_HANDLE: return "invalid handle";
    case LIBSSH2_FX_NO_SUCH_PATH: return "no such path";
    case LIBSSH2_FX_FILE_ALREADY_EXISTS: return "file already exists";
    case LIBSSH2_FX_WRITE_PROTECT: return "write protected";
    case LIBSSH2_FX_NO_MEDIA: return "no media";
    case LIBSSH2_FX_NO_SPACE_ON_FILESYSTEM: return "no space on filesystem";
    case LIBSSH2_FX_QUOTA_EXCEEDED: return "quota exceeded";
    case LIBSSH2_FX_DIR_NOT_EMPTY: return "directory not empty";
    case LIBSSH2_FX_NOT_A_DIRECTORY: return "not a directory";
    case LIBSSH2_FX_INVALID_FILENAME: return "invalid filename";
    case LIBSSH2_FX_LINK_LOOP: return "link loop";
    default: return "unknown sftp status";
    }
}

std::string fingerprintOf(LIBSSH2_SESSION* session) {
#ifdef LIBSSH2_HOSTKEY_HASH_SHA256
    const int hashType = LIBSSH2_HOSTKEY_HASH_SHA256;
    const int hashLen = 32;
    const char* prefix = "SHA256:";
#else
    const int hashType = LIBSSH2_HOSTKEY_HASH_SHA1;
    const int hashLen = 20;
    const char* prefix = "SHA1:";
#endif
    const unsigned char* h =
        reinterpret_cast<const unsigned char*>(libssh2_hostkey_hash(session, hashType));
    if (!h)
        return {};
    std::ostringstream oss;
    oss << prefix;
    for (int i = 0; i < hashLen; ++i) {
        if (i)
            oss << ':';
        char b[4];
        std::snprintf(b, sizeof(b), "%02X", static_cast<unsigned>(h[i]));
        oss << b;
    }
    return oss.str();
}

} // namespace

Libssh2SftpClient::Libssh2SftpClient() = default;

Libssh2SftpClient::~Libssh2SftpClient() {
    disconnect();
}

std::string Libssh2SftpClient::lastSessionError() const {
    if (!session_)
        return {};
    char* msg = nullptr;
    int len = 0;
    const int rc = libssh2_session_last_error(session_, &msg, &len, 0);
    if (!msg || len <= 0)
        return {};
    return std::string(msg, static_cast<std::size_t>(len)) + " (rc=" + std::to_string(rc) + ")";
}

std::string Libssh2SftpClient::lastSftpError(const std::string& what,
                                             const std::string& path) const {
    const unsigned long code = sftp_ ? libssh2_sftp_last_error(sftp_) : 0;
    return what + " [" + path + "]: " + sftpStatusText(code);
}

bool Libssh2SftpClient::sshHandshake(const SessionOptions& opt, std::string& err) {
    session_ = libssh2_session_init();
    if (!session_) {
        err = "libssh2_session_init failed";
        return false;
    }

    libssh2_session_set_blocking(session_, 1);
    libssh2_session_set_timeout(session_, opt.timeout_ms);

    if (libssh2_session_handshake(session_, opt.stream_fd) != 0) {
        err = "SSH handshake with [" + opt.target_identity + "] failed: " + lastSessionError();
        return false;
    }

    if (opt.keepalive_seconds > 0)
        libssh2_keepalive_config(session_, 1, static_cast<unsigned>(opt.keepalive_seconds));

    // Host key is not checked against known_hosts; only its fingerprint is kept.
    hostKeyFingerprint_ = fingerprintOf(session_);
    return true;
}

bool Libssh2SftpClient::authWithFileKey(const SessionOptions& opt,
                                        const AuthMethod& m,
                                        std::string& err) {
    int rc = -1;
    for (;;) {
        rc = libssh2_userauth_publickey_frommemory(session_,
                                                   opt.username.c_str(),
                                                   opt.username.size(),
                                                   nullptr, 0, // public key derived from the private one
                                                   m.key_data.data(),
                                                   m.key_data.size(),
                                                   nullptr);
        if (rc != LIBSSH2_ERROR_EAGAIN)
            break;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    if (rc != 0) {
        err = "key [" + m.source + "] rejected: " + lastSessionError();
        return false;
    }
    return true;
}

bool Libssh2SftpClient::authWithAgent(const SessionOptions& opt, std::string& err) {
    LIBSSH2_AGENT* agent = libssh2_agent_init(session_);
    if (!agent) {
        err = "libssh2_agent_init failed";
        return false;
    }
    bool authed = false;
    int tries = 0;
    if (libssh2_agent_connect(agent) != 0) {
        err = "cannot connect to key agent";
    } else if (libssh2_agent_list_identities(agent) != 0) {
        err = "cannot list key agent identities";
    } else {
        struct libssh2_agent_publickey* identity = nullptr;
        struct libssh2_agent_publickey* prev = nullptr;
        while (libssh2_agent_get_identity(agent, &identity, prev) == 0) {
            prev = identity;
            ++tries;
            int arc = -1;
            for (;;) {
                arc = libssh2_agent_userauth(agent, opt.username.c_str(), identity);
                if (arc != LIBSSH2_ERROR_EAGAIN)
                    break;
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
            }
            if (arc == 0) {
                authed = true;
                break;
            }
        }
        if (!authed)
            err = "key agent offered " + std::to_string(tries) + " identities, none accepted";
    }
    libssh2_agent_disconnect(agent);
    libssh2_agent_free(agent);
    return authed;
}

// Offers every credential in preference order until one is accepted.
bool Libssh2SftpClient::authenticate(const SessionOptions& opt, std::string& err) {
    char* methods = libssh2_userauth_list(session_, opt.username.c_str(),
                                          static_cast<unsigned>(opt.username.size()));
    if (!methods && libssh2_userauth_authenticated(session_)) {
        acceptedMethod_ = "none";
        return true;
    }
    const std::string authlist = methods ? std::string(methods) : std::string();

    std::vector<std::string> failures;
    for (const AuthMethod& m : opt.auth_methods) {
        std::string mErr;
        bool ok = false;
        if (m.kind == AuthMethodKind::FileKey) {
            ok = authWithFileKey(opt, m, mErr);
        } else if (m.kind == AuthMethodKind::AgentKey) {
            ok = authWithAgent(opt, mErr);
        } else {
            continue;
        }
        if (ok) {
            acceptedMethod_ = authMethodName(m.kind);
            return true;
        }
        failures.push_back(std::string(authMethodName(m.kind)) + ": " + mErr);
    }

    err = "no accepted authentication method for user [" + opt.username + "]";
    if (!authlist.empty())
        err += " (server offers: " + authlist + ")";
    if (failures.empty()) {
        err += "; no credentials were available";
    } else {
        for (const auto& f : failures)
            err += "; " + f;
    }
    return false;
}

bool Libssh2SftpClient::connect(const SessionOptions& opt, std::string& err) {
    if (connected_) {
        err = "already connected";
        return false;
    }
    if (opt.stream_fd < 0) {
        err = "no transport stream to negotiate SSH over";
        return false;
    }
    if (opt.username.empty()) {
        err = "username is required";
        return false;
    }
    if (!ensureLibssh2(err))
        return false;

    if (!sshHandshake(opt, err) || !authenticate(opt, err)) {
        disconnect();
        return false;
    }

    sftp_ = libssh2_sftp_init(session_);
    if (!sftp_) {
        err = "cannot start SFTP subsystem: " + lastSessionError();
        disconnect();
        return false;
    }

    connected_ = true;
    return true;
}

void Libssh2SftpClient::disconnect() {
    if (sftp_) {
        libssh2_sftp_shutdown(sftp_);
        sftp_ = nullptr;
    }
    if (session_) {
        libssh2_session_disconnect(session_, "bye");
        libssh2_session_free(session_);
        session_ = nullptr;
    }
    connected_ = false;
}

bool Libssh2SftpClient::list(const std::string& remote_path,
                             std::vector<FileInfo>& out,
                             std::string& err) {
    if (!connected_ || !sftp_) {
        err = "not connected";
        return false;
    }

    const std::string path = remote_path.empty() ? "." : remote_path;

    LIBSSH2_SFTP_HANDLE* dir = libssh2_sftp_opendir(sftp_, path.c_str());
    if (!dir) {
        err = lastSftpError("cannot open remote directory", path);
        return false;
    }

    out.clear();
    out.reserve(64);

    char filename[512];
    char longentry[1024];
    LIBSSH2_SFTP_ATTRIBUTES attrs;

    while (true) {
        std::memset(&attrs, 0, sizeof(attrs));
        int rc = libssh2_sftp_readdir_ex(dir,
                                         filename, sizeof(filename),
                                         longentry, sizeof(longentry),
                                         &attrs);
        if (rc > 0) {
            FileInfo fi{};
            fi.name = std::string(filename, static_cast<std::size_t>(rc));
            if (fi.name == "." || fi.name == "..")
                continue;
            if (!isPlainEntryName(fi.name)) {
                err = "remote directory [" + path + "] returned an invalid entry name";
                libssh2_sftp_closedir(dir);
                return false;
            }
            if (attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) {
                const unsigned long type = attrs.permissions & LIBSSH2_SFTP_S_IFMT;
                fi.is_dir = type == LIBSSH2_SFTP_S_IFDIR;
                fi.is_link = type == LIBSSH2_SFTP_S_IFLNK;
            }
            if (attrs.flags & LIBSSH2_SFTP_ATTR_SIZE) fi.size = attrs.filesize;
            if (attrs.flags & LIBSSH2_SFTP_ATTR_ACMODTIME) fi.mtime = attrs.mtime;
            if (attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) fi.mode = static_cast<std::uint32_t>(attrs.permissions);
            out.push_back(std::move(fi));
        } else if (rc == 0) {
            break;
        } else {
            err = lastSftpError("cannot read remote directory", path);
            libssh2_sftp_closedir(dir);
            return false;
        }
    }

    libssh2_sftp_closedir(dir);
    return true;
}

// Streams the remote file into a local file (create/truncate).
bool Libssh2SftpClient::get(const std::string& remote,
                            const std::string& local,
                            std::string& err,
                            ProgressCB progress) {
    if (!connected_ || !sftp_) {
        err = "not connected";
        return false;
    }

    // Remote size, for progress only
    LIBSSH2_SFTP_ATTRIBUTES st{};
    std::size_t total = 0;
    if (libssh2_sftp_stat_ex(sftp_, remote.c_str(), static_cast<unsigned>(remote.size()),
                             LIBSSH2_SFTP_STAT, &st) == 0 &&
        (st.flags & LIBSSH2_SFTP_ATTR_SIZE)) {
        total = static_cast<std::size_t>(st.filesize);
    }

    LIBSSH2_SFTP_HANDLE* rh = libssh2_sftp_open_ex(
        sftp_, remote.c_str(), static_cast<unsigned>(remote.size()),
        LIBSSH2_FXF_READ, 0, LIBSSH2_SFTP_OPENFILE);
    if (!rh) {
        err = lastSftpError("error opening remote file", remote);
        return false;
    }

    FILE* lf = std::fopen(local.c_str(), "wb");
    if (!lf) {
        libssh2_sftp_close(rh);
        err = "error opening local file [" + local + "]: " + std::strerror(errno);
        return false;
    }

    const std::size_t CHUNK = 64 * 1024;
    std::vector<char> buf(CHUNK);
    std::size_t done = 0;

    while (true) {
        ssize_t n = libssh2_sftp_read(rh, buf.data(), buf.size());
        if (n > 0) {
            if (std::fwrite(buf.data(), 1, static_cast<std::size_t>(n), lf) != static_cast<std::size_t>(n)) {
                err = "error writing local file [" + local + "]";
                std::fclose(lf);
                libssh2_sftp_close(rh);
                return false;
            }
            done += static_cast<std::size_t>(n);
            if (progress) progress(done, total);
        } else if (n == 0) {
            break; // EOF
        } else {
            err = lastSftpError("error copying remote file to local", remote);
            std::fclose(lf);
            libssh2_sftp_close(rh);
            return false;
        }
    }

    const bool closedOk = (std::fclose(lf) == 0);
    libssh2_sftp_close(rh);
    if (!closedOk) {
        err = "error closing local file [" + local + "]";
        return false;
    }
    return true;
}

// Streams a local file to the remote path (create/truncate).
bool Libssh2SftpClient::put(const std::string& local,
                            const std::string& remote,
                            std::string& err,
                            ProgressCB progress) {
    if (!connected_ || !sftp_) {
        err = "not connected";
        return false;
    }

    FILE* lf = std::fopen(local.c_str(), "rb");
    if (!lf) {
        err = "unable to read local file [" + local + "]: " + std::strerror(errno);
        return false;
    }

    std::fseek(lf, 0, SEEK_END);
    long fsz = std::ftell(lf);
    std::fseek(lf, 0, SEEK_SET);
    std::size_t total = fsz > 0 ? static_cast<std::size_t>(fsz) : 0;

    LIBSSH2_SFTP_HANDLE* wh = libssh2_sftp_open_ex(
        sftp_, remote.c_str(), static_cast<unsigned>(remote.size()),
        LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT | LIBSSH2_FXF_TRUNC,
        0644, LIBSSH2_SFTP_OPENFILE);
    if (!wh) {
        std::fclose(lf);
        err = lastSftpError("unable to open remote file", remote);
        return false;
    }

    const std::size_t CHUNK = 64 * 1024;
    std::vector<char> buf(CHUNK);
    std::size_t done = 0;

    while (true) {
        std::size_t n = std::fread(buf.data(), 1, buf.size(), lf);
        if (n > 0) {
            char* p = buf.data();
            std::size_t remain = n;
            while (remain > 0) {
                ssize_t w = libssh2_sftp_write(wh, p, remain);
                if (w < 0) {
                    err = lastSftpError("error writing remote file", remote);
                    libssh2_sftp_close(wh);
                    std::fclose(lf);
                    return false;
                }
                remain -= static_cast<std::size_t>(w);
                p += w;
                done += static_cast<std::size_t>(w);
                if (progress) progress(done, total);
            }
        } else {
            if (std::ferror(lf)) {
                err = "error reading local file [" + local + "]";
                libssh2_sftp_close(wh);
                std::fclose(lf);
                return false;
            }
            break; // EOF
        }
    }

    std::fclose(lf);
    if (libssh2_sftp_close(wh) != 0) {
        err = lastSftpError("error closing remote file", remote);
        return false;
    }
    return true;
}

bool Libssh2SftpClient::exists(const std::string& remote_path,
                               bool& isDir,
                               std::string& err) {
    isDir = false;
    FileInfo info;
    if (!stat(remote_path, info, err))
        return false;
    isDir = info.is_dir;
    return true;
}

// Returns false with an empty err when the path does not exist.
bool Libssh2SftpClient::stat(const std::string& remote_path,
                             FileInfo& info,
                             std::string& err) {
    if (!connected_ || !sftp_) {
        err = "not connected";
        return false;
    }

    LIBSSH2_SFTP_ATTRIBUTES st{};
    int rc = libssh2_sftp_stat_ex(
        sftp_, remote_path.c_str(), static_cast<unsigned>(remote_path.size()),
        LIBSSH2_SFTP_STAT, &st);
    if (rc != 0) {
        unsigned long sftp_err = libssh2_sftp_last_error(sftp_);
        if (sftp_err == LIBSSH2_FX_NO_SUCH_FILE || sftp_err == LIBSSH2_FX_NO_SUCH_PATH) {
            err.clear();
            return false;
        }
        err = lastSftpError("cannot stat remote path", remote_path);
        return false;
    }
    const auto slash = remote_path.find_last_of('/');
    info.name = slash == std::string::npos ? remote_path : remote_path.substr(slash + 1);
    info.is_dir = (st.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS)
                      ? ((st.permissions & LIBSSH2_SFTP_S_IFMT) == LIBSSH2_SFTP_S_IFDIR)
                      : false;
    info.size = (st.flags & LIBSSH2_SFTP_ATTR_SIZE) ? static_cast<std::uint64_t>(st.filesize) : 0;
    info.mtime = (st.flags & LIBSSH2_SFTP_ATTR_ACMODTIME) ? static_cast<std::uint64_t>(st.mtime) : 0;
    info.mode = (st.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) ? static_cast<std::uint32_t>(st.permissions) : 0;
    return true;
}

bool Libssh2SftpClient::mkdir(const std::string& remote_dir,
                              std::string& err,
                              unsigned int mode) {
    if (!connected_ || !sftp_) {
        err = "not connected";
        return false;
    }
    int rc = libssh2_sftp_mkdir(sftp_, remote_dir.c_str(), static_cast<long>(mode));
    if (rc != 0) {
        err = lastSftpError("cannot create remote directory", remote_dir);
        return false;
    }
    return true;
}

} // namespace ovscp
