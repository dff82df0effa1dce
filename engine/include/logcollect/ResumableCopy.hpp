// Chunked, resumable download of one remote file through a ".partial"
// checkpoint that is renamed into place only once it is complete.
#pragma once
#include "logcollect/RemoteSession.hpp"
#include "logcollect/RetryPolicy.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace logcollect {

extern const char* const kPartialSuffix;

std::string partialPathFor(const std::string& localPath);

struct CopyOptions {
    std::size_t   chunkSize = 32 * 1024;
    int           maxInnerErrors = 5;
    std::uint64_t syncInterval = 4ull * 1024 * 1024;
    std::chrono::milliseconds innerBackoffUnit{1000};
    Sleeper       sleeper; // empty: defaultSleeper()
};

struct CopyOutcome {
    bool          ok = false;
    SessionError  error;
    std::uint64_t resumedFrom = 0;   // partial length found on entry
    std::uint64_t bytesWritten = 0;  // partial (or final) length on exit
    std::uint64_t totalSize = 0;     // remote size at stat time
    int           streamRetries = 0;
    bool          alreadyComplete = false; // partial was full-size on entry
};

using CopyProgress = std::function<void(std::uint64_t done, std::uint64_t total)>;

// Copies remotePath to localPath over an already connected session.
// Stream errors (and premature end of file) are retried in place up to
// options.maxInnerErrors times, reopening at the durable offset. Any other
// failure returns immediately; the partial file is never removed.
CopyOutcome copyResumable(RemoteSession& session,
                          const std::string& remotePath,
                          const std::string& localPath,
                          const CopyProgress& progress,
                          const CopyOptions& options = CopyOptions());

} // namespace logcollect
