// Bounded worker pool executing a registry's tasks, one session per task.
#pragma once
#include "logcollect/ResumableCopy.hpp"
#include "logcollect/TransferRegistry.hpp"
#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace logcollect {

// Produces a fresh, unconnected session for the given host.
using SessionFactory = std::function<std::unique_ptr<RemoteSession>(const HostDescriptor&)>;

// Starts a thread running the given job; throws std::system_error when the
// system cannot create one.
using ThreadLauncher = std::function<std::thread(std::function<void()>)>;

// Runs body(0) .. body(n - 1), each on its own thread while threads can be
// started; bodies left without a thread run on the calling thread. Returns
// once every body has finished, with the number of threads started.
std::size_t runOnThreads(std::size_t n, const std::function<void(std::size_t)>& body,
                         const ThreadLauncher& launch = ThreadLauncher());

struct SchedulerOptions {
    int  maxConcurrent = 5;
    int  maxOuterRetries = 3;
    std::chrono::milliseconds outerBackoffUnit{2000};
    bool preflight = true;   // probe every host once before dispatch
    CopyOptions copy;
    Sleeper sleeper;         // outer-tier backoff; empty: defaultSleeper()
    ThreadLauncher launcher; // empty: std::thread
};

struct BatchResult {
    std::size_t   completed = 0;
    std::size_t   failed = 0;
    std::size_t   notStarted = 0;       // left pending by requestStop()
    std::size_t   totalFiles = 0;
    std::uint64_t totalSize = 0;        // registered (expected) bytes
    std::uint64_t transferredBytes = 0; // committed sizes of completed files
    qint64        elapsedMs = 0;
    std::vector<std::string> errors;    // "<host>: <message>", in failure order
    std::vector<TransferTask> tasks;    // terminal snapshot
    bool          success = false;      // failed == 0
};

class TransferScheduler {
public:
    TransferScheduler(std::vector<HostDescriptor> hosts,
                      SessionFactory factory,
                      SchedulerOptions options = SchedulerOptions());

    TransferScheduler(const TransferScheduler&) = delete;
    TransferScheduler& operator=(const TransferScheduler&) = delete;

    // Runs every pending task of `registry` and blocks until the pool drains.
    // Progress can be polled from another thread through the registry.
    BatchResult execute(TransferRegistry& registry);

    // Stop dispatching; running tasks finish, the rest stay pending.
    void requestStop() { stop_.store(true); }
    bool stopRequested() const { return stop_.load(); }

    bool hostAuthFailed(const std::string& hostName) const;

private:
    std::unordered_map<std::string, HostDescriptor> hosts_;
    SessionFactory factory_;
    SchedulerOptions opt_;
    std::atomic<bool> stop_{false};

    mutable std::mutex mtx_; // guards queue_ and authFailed_
    std::deque<std::string> queue_;
    std::unordered_set<std::string> authFailed_;

    void preflight(TransferRegistry& registry, const std::vector<TransferTask>& pending);
    SessionError probeHost(const HostDescriptor& host) const;
    void failHostTasks(TransferRegistry& registry, const std::string& hostName,
                       const std::string& message);
    bool nextTask(std::string& id);
    void workerLoop(TransferRegistry& registry);
    void runTask(TransferRegistry& registry, const TransferTask& task);
    void markHostAuthFailed(const std::string& hostName);
};

} // namespace logcollect
