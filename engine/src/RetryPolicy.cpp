#include "logcollect/RetryPolicy.hpp"
#include <thread>

namespace logcollect {

const char* retryTierName(RetryTier tier) {
    switch (tier) {
    case RetryTier::None:
        return "none";
    case RetryTier::Stream:
        return "stream";
    case RetryTier::Connection:
        return "connection";
    }
    return "unknown";
}

RetryTier streamTierFor(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::Stream:
        return RetryTier::Stream;
    case ErrorKind::Connection:
    case ErrorKind::Timeout:
    case ErrorKind::Protocol:
        return RetryTier::Connection;
    case ErrorKind::None:
    case ErrorKind::Authentication:
    case ErrorKind::NotFound:
    case ErrorKind::PermissionDenied:
    case ErrorKind::LocalFilesystem:
        break;
    }
    return RetryTier::None;
}

bool isConnectionRetryable(ErrorKind kind) {
    return streamTierFor(kind) != RetryTier::None;
}

Sleeper defaultSleeper() {
    return [](std::chrono::milliseconds d) {
        if (d.count() > 0)
            std::this_thread::sleep_for(d);
    };
}

} // namespace logcollect
