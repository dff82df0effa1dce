// Core unit tests without external framework (run via CTest).
#include "logcollect/MockRemoteSession.hpp"
#include "logcollect/RuntimeLogging.hpp"

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

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

logcollect::HostDescriptor validHost() {
    logcollect::HostDescriptor h;
    h.name = "web-01";
    h.host = "example.test";
    h.username = "alice";
    h.password = "secret";
    return h;
}

std::string readAll(logcollect::RemoteReadStream &s, logcollect::SessionError &err) {
    std::string data;
    char buf[100];
    long n = 0;
    while ((n = s.read(buf, sizeof(buf), err)) > 0)
        data.append(buf, (std::size_t)n);
    return data;
}

void test_descriptor_defaults(TestContext &t) {
    logcollect::HostDescriptor h;
    t.check(h.port == 22, "default port should be 22");
    t.check(h.timeout_sec == 30, "default timeout should be 30 seconds");
    t.check(h.known_hosts_policy == logcollect::KnownHostsPolicy::AcceptNew,
            "default known_hosts_policy should be AcceptNew");
    t.check(!h.password.has_value(), "password should be empty by default");
    t.check(!h.private_key_path.has_value(),
            "private_key_path should be empty by default");
    t.check(!h.usesKeyAuth(), "no key path means password auth");
}

void test_session_error_record(TestContext &t) {
    logcollect::SessionError e;
    t.check(!e, "fresh error should be empty");
    e.set(logcollect::ErrorKind::Timeout, "no answer");
    t.check(static_cast<bool>(e), "set error should convert to true");
    t.check(std::string(logcollect::errorKindName(e.kind)) == "Timeout",
            "errorKindName should name the kind");
    e.clear();
    t.check(!e && e.message.empty(), "clear should reset kind and message");
}

void test_connect_validation(TestContext &t) {
    logcollect::MockRemoteSession c;
    logcollect::SessionError err;
    auto h = validHost();
    h.host = "";
    t.check(!c.connect(h, err), "connect should fail when host is empty");
    t.check(err.kind == logcollect::ErrorKind::Connection,
            "empty host should be a connection error");

    err.clear();
    h.host = "example.test";
    h.username.clear();
    t.check(!c.connect(h, err), "connect should fail when username is empty");

    err.clear();
    h.username = "alice";
    t.check(c.connect(h, err), "connect should succeed with host+username");
    t.check(c.isConnected(),
            "session should report connected after successful connect");
    t.check(c.state() == logcollect::SessionState::Connected,
            "state should be Connected");
}

void test_credentials(TestContext &t) {
    auto host = std::make_shared<logcollect::MockRemoteHost>();
    host->setAcceptedPassword("right");
    logcollect::MockRemoteSession c(host);
    logcollect::SessionError err;
    auto h = validHost();
    h.password = "wrong";
    t.check(!c.connect(h, err), "wrong password should be rejected");
    t.check(err.kind == logcollect::ErrorKind::Authentication,
            "wrong password should be an authentication error");
    t.check(c.state() == logcollect::SessionState::Disconnected,
            "failed connect should leave the session disconnected");

    err.clear();
    h.password = "right";
    t.check(c.connect(h, err), "right password should be accepted");

    logcollect::MockRemoteSession k(host);
    host->setAcceptedKeyFile("/keys/id_ed25519");
    auto kh = validHost();
    kh.password.reset();
    kh.private_key_path = "/keys/other";
    err.clear();
    t.check(!k.connect(kh, err), "wrong key should be rejected");
    kh.private_key_path = "/keys/id_ed25519";
    err.clear();
    t.check(k.connect(kh, err), "configured key should be accepted");
}

void test_disconnect_and_close(TestContext &t) {
    logcollect::MockRemoteSession c;
    logcollect::SessionError err;
    t.check(c.connect(validHost(), err),
            "connect should succeed before disconnect test");
    c.disconnect();
    t.check(!c.isConnected(), "disconnect should flip isConnected to false");
    c.disconnect();
    t.check(c.state() == logcollect::SessionState::Disconnected,
            "second disconnect should be a no-op");

    std::vector<logcollect::FileInfo> out;
    err.clear();
    t.check(!c.list("/", out, err), "list should fail after disconnect");
    t.check(err.kind == logcollect::ErrorKind::Connection,
            "list on a disconnected session should be a connection error");

    c.close();
    err.clear();
    t.check(!c.connect(validHost(), err), "closed session should refuse connect");
    t.check(c.state() == logcollect::SessionState::Closed, "close should be terminal");
}

void test_reconnect_reuses_descriptor(TestContext &t) {
    auto host = logcollect::MockRemoteHost::withSampleTree();
    logcollect::MockRemoteSession c(host);
    logcollect::SessionError err;
    t.check(!c.reconnect(err), "reconnect before any connect should fail");

    err.clear();
    t.check(c.connect(validHost(), err), "connect should succeed");
    t.check(c.reconnect(err), "reconnect should succeed with the stored descriptor");
    t.check(c.isConnected(), "session should be connected after reconnect");
    t.check(c.descriptor().name == "web-01", "descriptor should be kept");
    t.check(host->connectCount() == 2, "reconnect should perform a full connect");
}

void test_injected_connect_failures(TestContext &t) {
    auto host = logcollect::MockRemoteHost::withSampleTree();
    host->failConnects(2, logcollect::ErrorKind::Timeout);
    logcollect::MockRemoteSession c(host);
    logcollect::SessionError err;
    t.check(!c.connect(validHost(), err), "first connect should fail");
    t.check(err.kind == logcollect::ErrorKind::Timeout, "failure kind should be injected");
    err.clear();
    t.check(!c.connect(validHost(), err), "second connect should fail");
    err.clear();
    t.check(c.connect(validHost(), err), "third connect should succeed");
    t.check(host->connectCount() == 3, "every attempt should be counted");
}

void test_list_sorting_and_known_path(TestContext &t) {
    logcollect::MockRemoteSession c;
    logcollect::SessionError err;
    t.check(c.connect(validHost(), err), "connect should succeed before list test");

    std::vector<logcollect::FileInfo> out;
    t.check(c.list("/var/log", out, err),
            "list('/var/log') should succeed in mock FS");
    t.check(out.size() == 4, "list('/var/log') should return 4 entries");
    if (out.size() == 4) {
        t.check(out[0].is_dir && out[0].name == "nginx",
                "first entry should be dir 'nginx'");
        t.check(out[1].is_dir && out[1].name == "private",
                "second entry should be dir 'private'");
        t.check(!out[2].is_dir && out[2].name == "auth.log",
                "third entry should be file 'auth.log'");
        t.check(!out[3].is_dir && out[3].name == "syslog" && out[3].size == 1280,
                "fourth entry should be file 'syslog'");
    }
}

void test_list_root_and_empty_path(TestContext &t) {
    logcollect::MockRemoteSession c;
    logcollect::SessionError err;
    t.check(c.connect(validHost(), err),
            "connect should succeed before root listing test");

    std::vector<logcollect::FileInfo> root;
    t.check(c.list("/", root, err), "list('/') should succeed");
    t.check(root.size() == 2, "list('/') should return the two top directories");
    if (root.size() == 2) {
        t.check(root[0].is_dir && root[0].name == "home",
                "root[0] should be 'home' directory");
        t.check(root[1].is_dir && root[1].name == "var",
                "root[1] should be 'var' directory");
    }

    std::vector<logcollect::FileInfo> emptyPath;
    err.clear();
    t.check(c.list("", emptyPath, err), "list('') should be treated as '/'");
    t.check(emptyPath.size() == root.size(),
            "list('') should match root entry count");
}

void test_list_faults(TestContext &t) {
    auto host = logcollect::MockRemoteHost::withSampleTree();
    host->denyListing("/var/log/private");
    logcollect::MockRemoteSession c(host);
    logcollect::SessionError err;
    t.check(c.connect(validHost(), err), "connect should succeed");

    std::vector<logcollect::FileInfo> out;
    t.check(!c.list("/var/log/private", out, err), "denied listing should fail");
    t.check(err.kind == logcollect::ErrorKind::PermissionDenied,
            "denied listing should be PermissionDenied");

    err.clear();
    t.check(!c.list("/does-not-exist", out, err), "list on missing path should fail");
    t.check(err.kind == logcollect::ErrorKind::NotFound,
            "missing path should be NotFound");
    t.checkContains(err.message, "/does-not-exist", "error should name the path");
}

void test_stat(TestContext &t) {
    logcollect::MockRemoteSession c;
    logcollect::SessionError err;
    t.check(c.connect(validHost(), err), "connect should succeed");

    logcollect::FileInfo info;
    t.check(c.stat("/var/log/nginx/access.log", info, err), "stat of a file should succeed");
    t.check(info.name == "access.log", "stat should fill the base name");
    t.check(info.size == 4096 && info.mtime == 1700000200,
            "stat should report size and mtime");
    t.check(!info.is_dir, "stat should report a regular file");

    err.clear();
    t.check(!c.stat("/var/log/missing.log", info, err), "stat of a missing file should fail");
    t.check(err.kind == logcollect::ErrorKind::NotFound, "missing file should be NotFound");
}

void test_open_read_at_offset(TestContext &t) {
    auto host = std::make_shared<logcollect::MockRemoteHost>();
    host->addFile("/logs/app.log", std::string("0123456789abcdef"), 100);
    logcollect::MockRemoteSession c(host);
    logcollect::SessionError err;
    t.check(c.connect(validHost(), err), "connect should succeed");

    auto s = c.openRead("/logs/app.log", 10, err);
    t.check(static_cast<bool>(s), "openRead should succeed");
    if (s)
        t.check(readAll(*s, err) == "abcdef", "stream should start at the offset");
    t.check(!err, "reading to the end should not set an error");

    auto missing = c.openRead("/logs/none.log", 0, err);
    t.check(!missing && err.kind == logcollect::ErrorKind::NotFound,
            "openRead of a missing file should be NotFound");

    const auto offsets = host->openOffsets("/logs/app.log");
    t.check(offsets.size() == 1 && offsets[0] == 10, "opens should be recorded with offsets");
}

void test_stream_fault_injection(TestContext &t) {
    auto host = std::make_shared<logcollect::MockRemoteHost>();
    host->addFile("/logs/app.log", std::uint64_t(1000), 100);
    host->injectStreamFailure("/logs/app.log", 300);
    logcollect::MockRemoteSession c(host);
    logcollect::SessionError err;
    t.check(c.connect(validHost(), err), "connect should succeed");

    auto s = c.openRead("/logs/app.log", 0, err);
    std::vector<char> buf(256);
    long total = 0;
    long n = 0;
    while ((n = s->read(buf.data(), buf.size(), err)) > 0)
        total += n;
    t.check(n == -1, "read should fail at the injected offset");
    t.check(total == 300, "bytes before the fault should be delivered");
    t.check(err.kind == logcollect::ErrorKind::Stream, "fault should be a stream error");
    t.check(c.isConnected(), "a stream fault should not drop the session");

    err.clear();
    auto again = c.openRead("/logs/app.log", 300, err);
    t.check(again && readAll(*again, err).size() == 700,
            "a one-shot fault should not fire again");
    t.check(host->content("/logs/app.log").size() == 1000, "generated payload size");
}

void test_connection_drop(TestContext &t) {
    auto host = std::make_shared<logcollect::MockRemoteHost>();
    host->addFile("/logs/app.log", std::uint64_t(500), 100);
    host->dropConnectionAt("/logs/app.log", 200);
    logcollect::MockRemoteSession c(host);
    logcollect::SessionError err;
    t.check(c.connect(validHost(), err), "connect should succeed");

    auto s = c.openRead("/logs/app.log", 0, err);
    readAll(*s, err);
    t.check(err.kind == logcollect::ErrorKind::Connection, "drop should be a connection error");
    t.check(!c.isConnected(), "drop should disconnect the session");
}

void test_sensitive_logging_policy(TestContext &t) {
    ::unsetenv("LOGCOLLECT_ENV");
    ::setenv("LOGCOLLECT_LOG_SENSITIVE", "1", 1);
    t.check(!logcollect::sensitiveLoggingEnabled(),
            "sensitive logging requires a dev environment");
    ::setenv("LOGCOLLECT_ENV", " Dev ", 1);
    t.check(logcollect::sensitiveLoggingEnabled(),
            "dev environment plus flag should enable sensitive logging");
    ::setenv("LOGCOLLECT_LOG_SENSITIVE", "no", 1);
    t.check(!logcollect::sensitiveLoggingEnabled(), "flag must be truthy");

    logcollect::HostDescriptor h = validHost();
    h.name = "web";
    h.host = "10.0.0.5";
    h.username = "ops";
    h.password = "hunter2";
    t.check(logcollect::hostLogLabel(h) == "web", "labels hide account details by default");
    ::setenv("LOGCOLLECT_LOG_SENSITIVE", "yes", 1);
    const std::string label = logcollect::hostLogLabel(h);
    t.check(label == "web (ops@10.0.0.5:22, password)",
            "dev labels show account and auth method");
    t.check(label.find("hunter2") == std::string::npos, "labels never carry the password");
    h.private_key_path = "/keys/id";
    t.check(std::string(logcollect::authMethodName(h)) == "key", "a key path wins");
    ::unsetenv("LOGCOLLECT_ENV");
    ::unsetenv("LOGCOLLECT_LOG_SENSITIVE");
}

} // namespace

int main() {
    TestContext t;
    test_descriptor_defaults(t);
    test_session_error_record(t);
    test_connect_validation(t);
    test_credentials(t);
    test_disconnect_and_close(t);
    test_reconnect_reuses_descriptor(t);
    test_injected_connect_failures(t);
    test_list_sorting_and_known_path(t);
    test_list_root_and_empty_path(t);
    test_list_faults(t);
    test_stat(t);
    test_open_read_at_offset(t);
    test_stream_fault_injection(t);
    test_connection_drop(t);
    test_sensitive_logging_policy(t);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] logcollect_core_tests\n";
    return EXIT_SUCCESS;
}
