#pragma once
#include "RemoteSession.hpp"
#include <string>
#include <vector>

// Forward declarations of libssh2's internal types
struct _LIBSSH2_SESSION;
struct _LIBSSH2_SFTP;
struct _LIBSSH2_SFTP_HANDLE;

namespace logcollect {

class Libssh2RemoteSession : public RemoteSession {
public:
    Libssh2RemoteSession();
    ~Libssh2RemoteSession() override;

    Libssh2RemoteSession(const Libssh2RemoteSession&) = delete;
    Libssh2RemoteSession& operator=(const Libssh2RemoteSession&) = delete;

    bool connect(const HostDescriptor& host, SessionError& err) override;
    void disconnect() override;
    bool isConnected() const override { return state_ == SessionState::Connected; }
    SessionState state() const override { return state_; }
    void close() override;
    const HostDescriptor& descriptor() const override { return host_; }

    bool list(const std::string& remote_path,
              std::vector<FileInfo>& out,
              SessionError& err) override;

    bool stat(const std::string& remote_path,
              FileInfo& info,
              SessionError& err) override;

    std::unique_ptr<RemoteReadStream> openRead(const std::string& remote_path,
                                               std::uint64_t offset,
                                               SessionError& err) override;

private:
    SessionState state_ = SessionState::Disconnected;
    HostDescriptor host_;
    int sock_ = -1;
    _LIBSSH2_SESSION* session_ = nullptr;
    _LIBSSH2_SFTP*    sftp_    = nullptr;

    bool tcpConnect(const std::string& host, std::uint16_t port, int timeoutSec,
                    SessionError& err);
    bool verifyHostKey(const HostDescriptor& host, SessionError& err);
    bool authenticate(const HostDescriptor& host, SessionError& err);
    bool sshHandshakeAuth(const HostDescriptor& host, SessionError& err);

    // Classify the last libssh2/SFTP failure of this session.
    ErrorKind lastErrorKind() const;
    std::string lastErrorText() const;
    void fail(SessionError& err, const std::string& what) const;
};

} // namespace logcollect
