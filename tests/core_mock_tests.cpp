// Core unit tests without external framework (run via CTest).
#include "ovscp/Endpoint.hpp"
#include "ovscp/MockOverlayContext.hpp"
#include "ovscp/MockSftpClient.hpp"
#include "ovscp/RemotePath.hpp"
#include "ovscp/RuntimeLogging.hpp"

#include <cstdlib>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <sys/socket.h>
#include <unistd.h>

namespace {

struct TestContext {
    int failures = 0;

    void check(bool cond, const std::string &msg) {
        if (!cond) {
            ++failures;
            std::cerr << "[FAIL] " << msg << "\n";
        }
    }

    void checkContains(const std::string &haystack, const std::string &needle,
                       const std::string &msg) {
        check(haystack.find(needle) != std::string::npos, msg);
    }
};

bool fdIsClosed(int fd) {
    return fd >= 0 && ::fcntl(fd, F_GETFD) == -1;
}

ovscp::SessionOptions validOptions(int fd) {
    ovscp::SessionOptions opt;
    opt.stream_fd = fd;
    opt.username = "alice";
    ovscp::AuthMethod agent;
    agent.kind = ovscp::AuthMethodKind::AgentKey;
    opt.auth_methods.push_back(agent);
    return opt;
}

std::string fixedUser() { return "localuser"; }
std::string noUser() { return {}; }

void test_remote_path_helpers(TestContext &t) {
    t.check(ovscp::joinRemotePath("/tmp", "a.txt") == "/tmp/a.txt",
            "join should insert one separator");
    t.check(ovscp::joinRemotePath("/tmp/", "/a.txt") == "/tmp/a.txt",
            "join should not double separators");
    t.check(ovscp::joinRemotePath("", "a.txt") == "a.txt",
            "join with empty base should keep a relative name");
    t.check(ovscp::cleanRemotePath("/a/./b//c/../d") == "/a/b/d",
            "clean should resolve dot segments");
    t.check(ovscp::cleanRemotePath("") == ".", "clean of empty path is '.'");
    t.check(ovscp::cleanRemotePath("/..") == "/", "clean should not climb above root");
    t.check(ovscp::remoteBaseName("/etc/motd") == "motd", "base name of a file");
    t.check(ovscp::remoteBaseName("/var/log/") == "log",
            "base name should ignore a trailing slash");
    t.check(ovscp::remoteBaseName("/") == "/", "base name of root is root");
    t.check(ovscp::remoteDirName("/etc/motd") == "/etc", "dir name of a file");
    t.check(ovscp::remoteDirName("/motd") == "/", "dir name of a top-level file");
    t.check(ovscp::remoteDirName("motd") == ".", "dir name of a relative name");

    t.check(ovscp::isPlainEntryName("notes.txt"), "plain name accepted");
    t.check(ovscp::isPlainEntryName("..hidden"), "dot-prefixed name accepted");
    t.check(!ovscp::isPlainEntryName(""), "empty name rejected");
    t.check(!ovscp::isPlainEntryName("."), "'.' rejected");
    t.check(!ovscp::isPlainEntryName(".."), "'..' rejected");
    t.check(!ovscp::isPlainEntryName("../escape.txt"), "parent traversal rejected");
    t.check(!ovscp::isPlainEntryName("/tmp/abs.txt"), "absolute name rejected");
    t.check(!ovscp::isPlainEntryName("a/b"), "nested name rejected");
}

void test_parse_remote_with_user(TestContext &t) {
    ovscp::TransferRequest req;
    ovscp::EndpointError code = ovscp::EndpointError::None;
    std::string err;
    t.check(ovscp::parseTransferArguments("alice@host1:/tmp/f.txt", "./f.txt",
                                          fixedUser, req, code, err),
            "remote source should parse: " + err);
    t.check(req.direction == ovscp::TransferDirection::DownloadFromRemote,
            "remote first argument means download");
    t.check(req.remote.username == "alice", "explicit user should be kept");
    t.check(req.remote.target_identity == "host1", "identity should be parsed");
    t.check(req.remote.path == "/tmp/f.txt", "remote path should be parsed");
    t.check(req.local_path == "./f.txt", "local path should be the other argument");
}

void test_parse_upload_without_user(TestContext &t) {
    ovscp::TransferRequest req;
    ovscp::EndpointError code = ovscp::EndpointError::None;
    std::string err;
    t.check(ovscp::parseTransferArguments("notes.txt", "host2:", fixedUser, req,
                                          code, err),
            "remote destination should parse: " + err);
    t.check(req.direction == ovscp::TransferDirection::UploadToRemote,
            "remote second argument means upload");
    t.check(req.remote.username == "localuser",
            "missing user should fall back to the local user");
    t.check(req.remote.target_identity == "host2", "identity should be parsed");
    t.check(req.remote.path.empty(), "empty remote path should stay empty");
}

void test_parse_rejections(TestContext &t) {
    ovscp::TransferRequest req;
    ovscp::EndpointError code = ovscp::EndpointError::None;
    std::string err;

    t.check(!ovscp::parseTransferArguments("a.txt", "b.txt", fixedUser, req,
                                           code, err),
            "two local paths should be rejected");
    t.check(code == ovscp::EndpointError::AmbiguousEndpoints,
            "two local paths report AmbiguousEndpoints");
    t.checkContains(err, "use ':'", "ambiguous error should mention ':'");

    err.clear();
    t.check(!ovscp::parseTransferArguments("h1:/a", "h2:/b", fixedUser, req,
                                           code, err),
            "two remote paths should be rejected");
    t.check(code == ovscp::EndpointError::BothRemote,
            "two remote paths report BothRemote");

    err.clear();
    t.check(!ovscp::parseTransferArguments("bob@:/etc/motd", "motd", fixedUser,
                                           req, code, err),
            "empty identity should be rejected");
    t.check(code == ovscp::EndpointError::MissingTargetIdentity,
            "empty identity reports MissingTargetIdentity");

    err.clear();
    t.check(!ovscp::parseTransferArguments(":/etc/motd", "motd", fixedUser, req,
                                           code, err),
            "':path' should be rejected");
    t.check(code == ovscp::EndpointError::MissingTargetIdentity,
            "':path' reports MissingTargetIdentity");

    err.clear();
    t.check(!ovscp::parseTransferArguments("host:/etc/motd", "", fixedUser, req,
                                           code, err),
            "empty local path should be rejected");
    t.check(code == ovscp::EndpointError::MissingLocalPath,
            "empty local path reports MissingLocalPath");

    err.clear();
    t.check(!ovscp::parseTransferArguments("@host:/etc/motd", "motd", fixedUser,
                                           req, code, err),
            "explicit empty user should be rejected");
    t.check(code == ovscp::EndpointError::EmptyUserName,
            "'@host:path' reports EmptyUserName");

    err.clear();
    t.check(!ovscp::parseTransferArguments("host:/etc/motd", "motd", noUser, req,
                                           code, err),
            "unknown local user should be rejected");
    t.check(code == ovscp::EndpointError::UnknownLocalUser,
            "unknown local user reports UnknownLocalUser");
}

void test_domain_qualified_user(TestContext &t) {
    t.check(ovscp::stripDomainQualifier("CORP\\dave") == "dave",
            "domain prefix should be stripped");
    t.check(ovscp::stripDomainQualifier("dave") == "dave",
            "plain user should be unchanged");

    ovscp::RemoteEndpoint ep;
    ovscp::EndpointError code = ovscp::EndpointError::None;
    std::string err;
    const auto domainUser = [] { return std::string("CORP\\dave"); };
    t.check(ovscp::parseRemoteEndpoint("box:/srv", domainUser, ep, code, err),
            "endpoint without user should parse");
    t.check(ep.username == "dave", "local fallback user should lose its domain");
}

void test_mock_connect_validation(TestContext &t) {
    int sv[2] = {-1, -1};
    t.check(::socketpair(AF_UNIX, SOCK_STREAM, 0, sv) == 0, "socketpair");
    ovscp::MockSftpClient c;
    std::string err;

    ovscp::SessionOptions noStream = validOptions(-1);
    t.check(!c.connect(noStream, err), "connect without stream should fail");

    ovscp::SessionOptions noUser = validOptions(sv[0]);
    noUser.username.clear();
    err.clear();
    t.check(!c.connect(noUser, err), "connect without user should fail");

    ovscp::SessionOptions tokenOnly = validOptions(sv[0]);
    tokenOnly.auth_methods.clear();
    ovscp::AuthMethod token;
    token.kind = ovscp::AuthMethodKind::BearerToken;
    token.token = "abc";
    tokenOnly.auth_methods.push_back(token);
    err.clear();
    t.check(!c.connect(tokenOnly, err),
            "a bearer token alone cannot authenticate to SSH");
    t.checkContains(err, "no accepted authentication method",
                    "token-only connect should name the auth failure");

    err.clear();
    t.check(c.connect(validOptions(sv[0]), err), "agent key should connect");
    t.check(c.isConnected(), "client should report connected");
    t.check(c.hasDir("/home/alice"), "home directory should exist after connect");
    c.disconnect();
    t.check(!c.isConnected(), "disconnect should flip isConnected");

    ::close(sv[0]);
    ::close(sv[1]);
}

void test_mock_filesystem(TestContext &t) {
    int sv[2] = {-1, -1};
    t.check(::socketpair(AF_UNIX, SOCK_STREAM, 0, sv) == 0, "socketpair");
    ovscp::MockSftpClient c;
    std::string err;
    t.check(c.connect(validOptions(sv[0]), err), "connect: " + err);

    c.addFile("/etc/motd", "hello\n");
    std::vector<ovscp::FileInfo> out;
    t.check(c.list("/etc", out, err), "list(/etc) should succeed");
    t.check(out.size() == 1 && out[0].name == "motd" && !out[0].is_dir,
            "list(/etc) should return motd");

    bool isDir = true;
    t.check(c.exists("/etc/motd", isDir, err) && !isDir,
            "exists should report a file");
    err = "stale";
    t.check(!c.exists("/nope", isDir, err), "missing path should not exist");
    t.check(err.empty(), "a missing path is not an error");

    t.check(c.mkdir("/tmp/new", err), "mkdir under /tmp should succeed");
    t.check(!c.mkdir("/tmp/new", err), "mkdir of an existing path should fail");
    err.clear();
    t.check(!c.mkdir("/tmp/a/b", err), "mkdir without a parent should fail");

    c.failMkdirFor("/tmp/locked");
    err.clear();
    t.check(!c.mkdir("/tmp/locked", err), "injected mkdir failure");
    t.checkContains(err, "permission denied", "injected failure message");

    c.addDir("/srv/releases/v2");
    c.addFile("/srv/releases/v2/app.bin", "v2");
    c.addSymlink("/srv/current", "releases/v2");
    c.addSymlink("/srv/app", "/srv/releases/v2/app.bin");
    out.clear();
    t.check(c.list("/srv", out, err), "list(/srv) should succeed");
    bool linkSeen = false;
    for (const auto &e : out) {
        if (e.name == "current")
            linkSeen = e.is_link && !e.is_dir;
    }
    t.check(linkSeen, "list reports the link itself, not its target");
    ovscp::FileInfo info;
    t.check(c.stat("/srv/current", info, err) && info.is_dir,
            "stat follows a link to a directory");
    t.check(c.stat("/srv/app", info, err) && !info.is_dir && info.size == 2,
            "stat follows a link to a file");

    t.check(c.hasDir("notes") == false, "relative paths resolve under home");
    t.check(c.mkdir("notes", err), "relative mkdir should succeed");
    t.check(c.hasDir("/home/alice/notes"), "relative mkdir lands under home");

    ::close(sv[0]);
    ::close(sv[1]);
}

void test_overlay_stream_raii(TestContext &t) {
    int sv[2] = {-1, -1};
    t.check(::socketpair(AF_UNIX, SOCK_STREAM, 0, sv) == 0, "socketpair");
    const int fd = sv[0];
    {
        ovscp::OverlayStream s(fd, "ovssh", "host1");
        t.check(s.isOpen(), "stream should be open");
        ovscp::OverlayStream moved(std::move(s));
        t.check(!s.isOpen(), "moved-from stream should be closed");
        t.check(moved.fd() == fd, "moved-to stream owns the descriptor");
        t.check(!fdIsClosed(fd), "descriptor stays open while owned");
    }
    t.check(fdIsClosed(fd), "descriptor should be closed on destruction");
    ::close(sv[1]);
}

void test_mock_overlay_dial(TestContext &t) {
    ovscp::MockOverlayContext ctx({"ovssh"});
    std::string err;

    t.check(ctx.hasService("ovssh"), "advertised service should be visible");
    t.check(!ctx.hasService("other"), "unknown service should not be visible");

    auto missing = ctx.dial("other", "host1", err);
    t.check(!missing, "dial of unknown service should fail");
    t.checkContains(err, "service not found: other", "service-not-found message");

    ctx.denyIdentity("ghost");
    err.clear();
    auto denied = ctx.dial("ovssh", "ghost", err);
    t.check(!denied, "dial of a denied identity should fail");
    t.checkContains(err, "error when dialing service name ovssh for identity [ghost]",
                    "dial failure names service and identity");

    ctx.requireToken(true);
    err.clear();
    t.check(!ctx.dial("ovssh", "host1", err), "token required but absent");
    ctx.attachBearerToken("tok");
    err.clear();
    auto stream = ctx.dial("ovssh", "host1", err);
    t.check(stream && stream->isOpen(), "dial with token should succeed: " + err);
    if (stream) {
        t.check(stream->identity() == "host1", "stream records the identity");
        t.check(stream->service() == "ovssh", "stream records the service");
    }
    t.check(ctx.dialCount() == 4, "every dial attempt should be counted");
}

void test_intercept_address(TestContext &t) {
    t.check(ovscp::expandInterceptAddress("{identity}.{service}.ov", "ovssh",
                                          "host1") == "host1.ovssh.ov",
            "placeholders should be expanded");
    t.check(ovscp::expandInterceptAddress("10.0.0.5", "ovssh", "host1") ==
                "10.0.0.5",
            "a fixed address stays unchanged");

    ovscp::OverlayConfig cfg;
    cfg.services.push_back({"ovssh", "{identity}.ovssh", 22});
    t.check(cfg.findService("ovssh") != nullptr, "findService should find entry");
    t.check(cfg.findService("nope") == nullptr, "findService should miss");
}

void test_redaction(TestContext &t) {
    if (ovscp::sensitiveLoggingEnabled())
        return;
    t.check(ovscp::redactSecret("short") == "<redacted>",
            "short secrets are fully redacted");
    const std::string r = ovscp::redactSecret("eyJhbGciOiJSUzI1NiJ9.payload");
    t.checkContains(r, "eyJh...", "long secrets keep a short prefix");
    t.check(r.find("payload") == std::string::npos, "secret body is hidden");
}

} // namespace

int main() {
    TestContext t;
    test_remote_path_helpers(t);
    test_parse_remote_with_user(t);
    test_parse_upload_without_user(t);
    test_parse_rejections(t);
    test_domain_qualified_user(t);
    test_mock_connect_validation(t);
    test_mock_filesystem(t);
    test_overlay_stream_raii(t);
    test_mock_overlay_dial(t);
    test_intercept_address(t);
    test_redaction(t);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] ovscp_core_tests\n";
    return EXIT_SUCCESS;
}
