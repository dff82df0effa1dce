// Abstract interface for one authenticated remote-file session. Concrete
// backends (libssh2, mock) must respect this API so the transfer engine stays
// decoupled from the protocol implementation.
#pragma once
#include "SessionTypes.hpp"
#include <cstddef>
#include <memory>

namespace logcollect {

// Sequential reader over one remote file, positioned at the offset given to
// RemoteSession::openRead. Must not outlive the session that opened it.
class RemoteReadStream {
public:
    virtual ~RemoteReadStream() = default;

    // Returns bytes read (>0), 0 at end of file, or -1 with err filled.
    virtual long read(char* buf, std::size_t len, SessionError& err) = 0;
};

class RemoteSession {
public:
    virtual ~RemoteSession() = default;

    // Connect and authenticate with the method the descriptor carries.
    virtual bool connect(const HostDescriptor& host, SessionError& err) = 0;
    // Release all protocol resources. No-op when already disconnected.
    virtual void disconnect() = 0;
    virtual bool isConnected() const = 0;
    virtual SessionState state() const = 0;

    // Terminal shutdown: disconnects and refuses any further connect().
    virtual void close() = 0;

    // Descriptor of the last connect() attempt (empty before the first one).
    virtual const HostDescriptor& descriptor() const = 0;

    // Immediate children of remote_path ("." and ".." excluded).
    virtual bool list(const std::string& remote_path,
                      std::vector<FileInfo>& out,
                      SessionError& err) = 0;

    // Detailed metadata. Fails with ErrorKind::NotFound if the path is missing.
    virtual bool stat(const std::string& remote_path,
                      FileInfo& info,
                      SessionError& err) = 0;

    // Open remote_path for reading starting at offset. Returns nullptr on failure.
    virtual std::unique_ptr<RemoteReadStream> openRead(const std::string& remote_path,
                                                       std::uint64_t offset,
                                                       SessionError& err) = 0;

    // disconnect() then connect() with the last descriptor.
    bool reconnect(SessionError& err);
};

} // namespace logcollect
