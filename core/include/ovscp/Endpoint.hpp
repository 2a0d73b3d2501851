// Interprets the two positional command-line arguments into a transfer
// direction plus the remote (user, target identity, path) and the local path.
#pragma once
#include <functional>
#include <string>

namespace ovscp {

enum class TransferDirection {
    UploadToRemote,
    DownloadFromRemote
};

enum class EndpointError {
    None,
    AmbiguousEndpoints,    // neither argument contains ':'
    BothRemote,            // both arguments contain ':'
    MissingTargetIdentity, // ":path" or "user@:path"
    MissingLocalPath,
    EmptyUserName,         // "@identity:path"
    UnknownLocalUser       // no "user@" and the OS user cannot be determined
};

struct RemoteEndpoint {
    std::string username;
    std::string target_identity;
    std::string path; // may be empty: infer from the source base name
};

struct TransferRequest {
    TransferDirection direction = TransferDirection::DownloadFromRemote;
    RemoteEndpoint remote;
    std::string local_path;
};

using LocalUserFn = std::function<std::string()>;

// Splits "[user@]identity:[path]" at the first ':' and the first '@'. The
// local user is only queried when the argument carries no "user@" prefix.
bool parseRemoteEndpoint(const std::string& arg,
                         const LocalUserFn& localUser,
                         RemoteEndpoint& out,
                         EndpointError& code,
                         std::string& err);

bool parseTransferArguments(const std::string& first,
                            const std::string& second,
                            const LocalUserFn& localUser,
                            TransferRequest& out,
                            EndpointError& code,
                            std::string& err);

// "DOMAIN\\user" -> "user"; anything else unchanged.
std::string stripDomainQualifier(const std::string& user);

// Name of the effective local OS user, domain qualifier removed. Empty if it
// cannot be determined.
std::string localUserName();

const char* endpointErrorName(EndpointError e);
const char* transferDirectionName(TransferDirection d);

} // namespace ovscp
