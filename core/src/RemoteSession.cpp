#include "logcollect/RemoteSession.hpp"

namespace logcollect {

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::None:
        return "None";
    case ErrorKind::Authentication:
        return "Authentication";
    case ErrorKind::Connection:
        return "Connection";
    case ErrorKind::Timeout:
        return "Timeout";
    case ErrorKind::Protocol:
        return "Protocol";
    case ErrorKind::NotFound:
        return "NotFound";
    case ErrorKind::PermissionDenied:
        return "PermissionDenied";
    case ErrorKind::Stream:
        return "Stream";
    case ErrorKind::LocalFilesystem:
        return "LocalFilesystem";
    }
    return "Unknown";
}

bool RemoteSession::reconnect(SessionError& err) {
    // Copy first: connect() may overwrite the stored descriptor.
    const HostDescriptor host = descriptor();
    disconnect();
    if (host.host.empty()) {
        err.set(ErrorKind::Connection, "reconnect without a previous connect");
        return false;
    }
    return connect(host, err);
}

} // namespace logcollect
