#pragma once
#include "RemoteSession.hpp"
#include <map>
#include <mutex>
#include <utility>

namespace logcollect {

// Simulated remote host. Every MockRemoteSession built on the same host sees
// the same tree and fault plan, the way several workers would share one server.
class MockRemoteHost {
public:
    void addDirectory(const std::string& path, std::uint64_t mtime = 0);
    // Parent directories are created implicitly.
    void addFile(const std::string& path, std::string content, std::uint64_t mtime);
    // Deterministic generated payload of the given size.
    void addFile(const std::string& path, std::uint64_t size, std::uint64_t mtime);
    void setContent(const std::string& path, std::string content);
    std::string content(const std::string& path) const;

    // Credentials the host accepts. Unset means "any non-empty credential".
    void setAcceptedPassword(std::string password);
    void setAcceptedKeyFile(std::string keyPath);

    // Fault plan.
    void denyListing(const std::string& path);
    void failListing(const std::string& path, ErrorKind kind);
    // The next `times` reads reaching `offset` fail with a Stream error.
    void injectStreamFailure(const std::string& path, std::uint64_t offset, int times = 1);
    // The next `times` reads reaching `offset` drop the whole session.
    void dropConnectionAt(const std::string& path, std::uint64_t offset, int times = 1);
    // The next `times` connect() calls fail with `kind`.
    void failConnects(int times, ErrorKind kind);

    // Observations for tests.
    int connectCount() const;
    std::vector<std::uint64_t> openOffsets(const std::string& path) const;

    // Small /var/log style tree used by the session tests.
    static std::shared_ptr<MockRemoteHost> withSampleTree();

private:
    friend class MockRemoteSession;
    friend class MockReadStream;

    struct Node {
        bool          is_dir = false;
        std::string   data;
        std::uint64_t mtime = 0;
    };
    struct ReadFault {
        std::uint64_t offset = 0;
        int           remaining = 0;
        ErrorKind     kind = ErrorKind::Stream;
    };

    mutable std::mutex mtx_;
    std::map<std::string, Node> nodes_;
    std::map<std::string, ErrorKind> listFaults_;
    std::multimap<std::string, ReadFault> readFaults_;
    std::optional<std::string> password_;
    std::optional<std::string> keyFile_;
    int failConnects_ = 0;
    ErrorKind failConnectKind_ = ErrorKind::Connection;
    int connects_ = 0;
    std::map<std::string, std::vector<std::uint64_t>> opens_;

    void ensureParentsLocked(const std::string& path);
};

class MockRemoteSession : public RemoteSession {
public:
    MockRemoteSession();
    explicit MockRemoteSession(std::shared_ptr<MockRemoteHost> host);

    bool connect(const HostDescriptor& host, SessionError& err) override;
    void disconnect() override;
    bool isConnected() const override { return state_ == SessionState::Connected; }
    SessionState state() const override { return state_; }
    void close() override;
    const HostDescriptor& descriptor() const override { return lastHost_; }

    bool list(const std::string& remote_path,
              std::vector<FileInfo>& out,
              SessionError& err) override;

    bool stat(const std::string& remote_path,
              FileInfo& info,
              SessionError& err) override;

    std::unique_ptr<RemoteReadStream> openRead(const std::string& remote_path,
                                               std::uint64_t offset,
                                               SessionError& err) override;

    // Used by read streams when a fault drops the connection.
    void markDropped() { state_ = SessionState::Disconnected; }

private:
    std::shared_ptr<MockRemoteHost> host_;
    SessionState state_ = SessionState::Disconnected;
    HostDescriptor lastHost_{};
};

} // namespace logcollect
