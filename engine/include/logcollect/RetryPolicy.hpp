// Two-tier retry policy: the stream tier reopens a read stream on the same
// session, the connection tier rebuilds the whole session.
#pragma once
#include "logcollect/SessionTypes.hpp"
#include <chrono>
#include <functional>

namespace logcollect {

enum class RetryTier { None, Stream, Connection };

const char* retryTierName(RetryTier tier);

// Tier that recovers a failure of `kind` reported in the middle of a copy.
RetryTier streamTierFor(ErrorKind kind);

// Whether a failed copy() may be retried after a full reconnect. Stream is
// included: it only reaches this tier once the stream budget is spent.
bool isConnectionRetryable(ErrorKind kind);

using Sleeper = std::function<void(std::chrono::milliseconds)>;

// std::this_thread::sleep_for
Sleeper defaultSleeper();

// Bounded error budget with linear backoff (n-th failure waits n * unit).
class RetryBudget {
public:
    RetryBudget(int limit, std::chrono::milliseconds unit) : limit_(limit), unit_(unit) {}

    // Records one failure. Returns true while the budget still allows a retry.
    bool consume() {
        ++used_;
        return used_ <= limit_;
    }
    std::chrono::milliseconds backoff() const { return unit_ * used_; }
    int used() const { return used_; }
    int limit() const { return limit_; }
    bool exhausted() const { return used_ > limit_; }

private:
    int limit_;
    std::chrono::milliseconds unit_;
    int used_ = 0;
};

} // namespace logcollect
