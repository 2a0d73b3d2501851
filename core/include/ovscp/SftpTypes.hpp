// Basic types shared between the CLI layer and the core: session options,
// credentials and remote file metadata.
#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace ovscp {

struct FileInfo {
    std::string   name;     // base name
    bool          is_dir = false;
    bool          is_link = false; // entry itself is a symbolic link (lstat)
    std::uint64_t size  = 0;  // bytes
    std::uint64_t mtime = 0;  // epoch seconds
    std::uint32_t mode  = 0;  // POSIX bits (permissions/type)
};

// Credential kinds, in preference order.
enum class AuthMethodKind {
    FileKey,     // private key loaded from a file
    AgentKey,    // every identity held by the running key agent
    BearerToken  // token presented to the overlay network, not to SSH
};

struct AuthMethod {
    AuthMethodKind kind = AuthMethodKind::FileKey;
    std::string source;    // key path, agent socket or token issuer
    std::string key_data;  // FileKey: private key contents
    std::string token;     // BearerToken: the token itself
};

inline const char *authMethodName(AuthMethodKind k) {
    switch (k) {
    case AuthMethodKind::FileKey:
        return "file-key";
    case AuthMethodKind::AgentKey:
        return "agent-key";
    case AuthMethodKind::BearerToken:
        return "bearer-token";
    }
    return "unknown";
}

struct SessionOptions {
    // Dialed overlay stream. Not owned by the SFTP client.
    int stream_fd = -1;
    std::string username;
    std::string target_identity; // diagnostics only

    // FileKey/AgentKey entries are tried in order; BearerToken entries are ignored.
    std::vector<AuthMethod> auth_methods;

    int timeout_ms = 20000;
    int keepalive_seconds = 30;
};

} // namespace ovscp
