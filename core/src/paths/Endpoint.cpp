#include "ovscp/Endpoint.hpp"

#include <cstdlib>
#include <vector>

#include <pwd.h>
#include <sys/types.h>
#include <unistd.h>

namespace ovscp {

const char* endpointErrorName(EndpointError e) {
    switch (e) {
    case EndpointError::None:
        return "None";
    case EndpointError::AmbiguousEndpoints:
        return "AmbiguousEndpoints";
    case EndpointError::BothRemote:
        return "BothRemote";
    case EndpointError::MissingTargetIdentity:
        return "MissingTargetIdentity";
    case EndpointError::MissingLocalPath:
        return "MissingLocalPath";
    case EndpointError::EmptyUserName:
        return "EmptyUserName";
    case EndpointError::UnknownLocalUser:
        return "UnknownLocalUser";
    }
    return "Unknown";
}

const char* transferDirectionName(TransferDirection d) {
    return d == TransferDirection::UploadToRemote ? "upload" : "download";
}

std::string stripDomainQualifier(const std::string& user) {
    const auto pos = user.find('\\');
    if (pos == std::string::npos)
        return user;
    return user.substr(pos + 1);
}

std::string localUserName() {
    const uid_t uid = ::geteuid();
    long bufLen = ::sysconf(_SC_GETPW_R_SIZE_MAX);
    if (bufLen <= 0)
        bufLen = 16384;
    std::vector<char> buf(static_cast<std::size_t>(bufLen));
    struct passwd pwd{};
    struct passwd* result = nullptr;
    if (::getpwuid_r(uid, &pwd, buf.data(), buf.size(), &result) == 0 && result &&
        result->pw_name && *result->pw_name) {
        return stripDomainQualifier(result->pw_name);
    }
    // Accounts without a passwd entry (containers, directory services)
    for (const char* var : {"USER", "LOGNAME", "USERNAME"}) {
        const char* v = std::getenv(var);
        if (v && *v)
            return stripDomainQualifier(v);
    }
    return {};
}

bool parseRemoteEndpoint(const std::string& arg,
                         const LocalUserFn& localUser,
                         RemoteEndpoint& out,
                         EndpointError& code,
                         std::string& err) {
    const auto colon = arg.find(':');
    if (colon == std::string::npos) {
        code = EndpointError::AmbiguousEndpoints;
        err = "cannot determine remote file path, use ':' for the remote path [" + arg + "]";
        return false;
    }
    const std::string prefix = arg.substr(0, colon);
    out.path = arg.substr(colon + 1);

    const auto at = prefix.find('@');
    if (at != std::string::npos) {
        out.username = prefix.substr(0, at);
        out.target_identity = prefix.substr(at + 1);
    } else {
        out.target_identity = prefix;
        out.username.clear();
    }
    if (out.target_identity.empty()) {
        code = EndpointError::MissingTargetIdentity;
        err = "no target identity before ':' in [" + arg + "]";
        return false;
    }
    if (at != std::string::npos && out.username.empty()) {
        code = EndpointError::EmptyUserName;
        err = "empty user name before '@' in [" + arg + "]";
        return false;
    }
    if (out.username.empty()) {
        out.username = localUser ? stripDomainQualifier(localUser()) : std::string();
        if (out.username.empty()) {
            code = EndpointError::UnknownLocalUser;
            err = "no user in [" + arg + "] and the local user name is unknown";
            return false;
        }
    }
    code = EndpointError::None;
    return true;
}

bool parseTransferArguments(const std::string& first,
                            const std::string& second,
                            const LocalUserFn& localUser,
                            TransferRequest& out,
                            EndpointError& code,
                            std::string& err) {
    const bool firstRemote = first.find(':') != std::string::npos;
    const bool secondRemote = second.find(':') != std::string::npos;

    if (firstRemote && secondRemote) {
        code = EndpointError::BothRemote;
        err = "both [" + first + "] and [" + second +
              "] look remote; remote-to-remote copies are not supported";
        return false;
    }
    if (!firstRemote && !secondRemote) {
        code = EndpointError::AmbiguousEndpoints;
        err = "cannot determine remote file path, use ':' for the remote path";
        return false;
    }

    const std::string& remoteArg = firstRemote ? first : second;
    const std::string& localArg = firstRemote ? second : first;
    if (localArg.empty()) {
        code = EndpointError::MissingLocalPath;
        err = "local path is empty";
        return false;
    }

    TransferRequest req;
    req.direction = firstRemote ? TransferDirection::DownloadFromRemote
                                : TransferDirection::UploadToRemote;
    req.local_path = localArg;
    if (!parseRemoteEndpoint(remoteArg, localUser, req.remote, code, err))
        return false;

    out = req;
    code = EndpointError::None;
    return true;
}

} // namespace ovscp
