// Worker pool: each task owns one session from start to end; failures are
// converted into task status at the task boundary.
#include "logcollect/TransferScheduler.hpp"
#include "logcollect/LogCategories.hpp"
#include "logcollect/RuntimeLogging.hpp"

#include <QDateTime>
#include <QString>
#include <algorithm>
#include <exception>
#include <system_error>
#include <thread>

namespace logcollect {

namespace {

std::string describe(const SessionError& err) {
    return err.message + " (" + errorKindName(err.kind) + ")";
}

QString qs(const std::string& s) {
    return QString::fromStdString(s);
}

// Joins whatever was started, also when a later start or body throws.
struct ThreadJoiner {
    std::vector<std::thread>& threads;
    ~ThreadJoiner() {
        for (auto& th : threads) {
            if (th.joinable())
                th.join();
        }
    }
};

} // namespace

std::size_t runOnThreads(std::size_t n, const std::function<void(std::size_t)>& body,
                         const ThreadLauncher& launch) {
    std::vector<std::thread> threads;
    ThreadJoiner joiner{threads};
    threads.reserve(n);
    std::size_t i = 0;
    for (; i < n; ++i) {
        std::function<void()> job = [&body, i]() { body(i); };
        try {
            threads.push_back(launch ? launch(std::move(job)) : std::thread(std::move(job)));
        } catch (const std::system_error& e) {
            qCCritical(lcXfer) << "Could not start thread" << (qulonglong)(i + 1) << "of"
                               << (qulonglong)n << ":" << e.what()
                               << "- running the rest on the calling thread";
            break;
        }
    }
    const std::size_t started = threads.size();
    for (; i < n; ++i)
        body(i);
    return started;
}

TransferScheduler::TransferScheduler(std::vector<HostDescriptor> hosts,
                                     SessionFactory factory,
                                     SchedulerOptions options)
    : factory_(std::move(factory)), opt_(std::move(options)) {
    for (auto& h : hosts) {
        const std::string key = h.name;
        hosts_[key] = std::move(h);
    }
}

bool TransferScheduler::hostAuthFailed(const std::string& hostName) const {
    std::lock_guard<std::mutex> lk(mtx_);
    return authFailed_.count(hostName) > 0;
}

void TransferScheduler::markHostAuthFailed(const std::string& hostName) {
    bool inserted = false;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        inserted = authFailed_.insert(hostName).second;
    }
    if (inserted)
        qCWarning(lcXfer) << "Host" << qs(hostName)
                          << "failed authentication; its remaining tasks will not start";
}

void TransferScheduler::failHostTasks(TransferRegistry& registry,
                                      const std::string& hostName,
                                      const std::string& message) {
    int n = 0;
    for (const auto& t : registry.snapshot()) {
        if (t.hostName == hostName && t.status == TaskStatus::Pending &&
            registry.markFailed(t.id, message))
            ++n;
    }
    qCWarning(lcXfer) << "Failed" << n << "tasks of" << qs(hostName) << "without starting";
}

SessionError TransferScheduler::probeHost(const HostDescriptor& host) const {
    SessionError err;
    std::unique_ptr<RemoteSession> probe;
    try {
        probe = factory_(host);
    } catch (const std::exception& e) {
        qCWarning(lcXfer) << "Preflight for" << qs(host.name) << "could not create a session:"
                          << e.what();
        return err;
    }
    if (!probe)
        return err;
    try {
        if (probe->connect(host, err)) {
            qCInfo(lcXfer) << "Preflight ok:" << qs(hostLogLabel(host));
        } else if (err.kind != ErrorKind::Authentication) {
            qCWarning(lcXfer) << "Preflight for" << qs(host.name) << "failed:" << qs(describe(err))
                              << "- tasks will retry on their own connections";
        }
        probe->disconnect();
    } catch (const std::exception& e) {
        qCWarning(lcXfer) << "Preflight for" << qs(host.name) << "raised:" << e.what()
                          << "- tasks will retry on their own connections";
        err.set(ErrorKind::Connection, std::string("preflight raised: ") + e.what());
    }
    return err;
}

void TransferScheduler::preflight(TransferRegistry& registry,
                                  const std::vector<TransferTask>& pending) {
    std::vector<std::string> order;
    std::unordered_set<std::string> seen;
    for (const auto& t : pending) {
        if (seen.insert(t.hostName).second)
            order.push_back(t.hostName);
    }

    std::vector<const HostDescriptor*> targets;
    for (const auto& name : order) {
        auto it = hosts_.find(name);
        if (it == hosts_.end()) {
            failHostTasks(registry, name, "no connection settings for host " + name);
            continue;
        }
        if (opt_.preflight && factory_)
            targets.push_back(&it->second);
    }
    if (targets.empty())
        return;

    // One probe per host in parallel; verdicts are applied in host order.
    std::vector<SessionError> verdicts(targets.size());
    runOnThreads(
        targets.size(),
        [this, &targets, &verdicts](std::size_t i) { verdicts[i] = probeHost(*targets[i]); },
        opt_.launcher);

    for (std::size_t i = 0; i < targets.size(); ++i) {
        if (verdicts[i].kind != ErrorKind::Authentication)
            continue;
        markHostAuthFailed(targets[i]->name);
        failHostTasks(registry, targets[i]->name,
                      "authentication failed: " + verdicts[i].message);
    }
}

bool TransferScheduler::nextTask(std::string& id) {
    if (stop_.load())
        return false;
    std::lock_guard<std::mutex> lk(mtx_);
    if (queue_.empty())
        return false;
    id = std::move(queue_.front());
    queue_.pop_front();
    return true;
}

void TransferScheduler::workerLoop(TransferRegistry& registry) {
    std::string id;
    while (nextTask(id)) {
        const std::optional<TransferTask> task = registry.task(id);
        if (!task || task->status != TaskStatus::Pending)
            continue;
        if (hostAuthFailed(task->hostName)) {
            registry.markFailed(id, "not started: authentication failed for " + task->hostName);
            continue;
        }
        try {
            runTask(registry, *task);
        } catch (const std::exception& e) {
            qCCritical(lcXfer) << "Task" << qs(id) << "raised:" << e.what();
            registry.markFailed(id, task->remotePath + ": internal error: " + e.what());
        }
    }
}

void TransferScheduler::runTask(TransferRegistry& registry, const TransferTask& task) {
    const std::string& id = task.id;
    auto hit = hosts_.find(task.hostName);
    if (hit == hosts_.end()) {
        registry.markFailed(id, "no connection settings for host " + task.hostName);
        return;
    }
    const HostDescriptor& host = hit->second;
    if (!registry.markDownloading(id))
        return;

    std::unique_ptr<RemoteSession> session = factory_ ? factory_(host) : nullptr;
    if (!session) {
        registry.markFailed(id, task.remotePath + ": no session backend available");
        return;
    }
    qCInfo(lcXfer) << "Start" << qs(id) << qs(host.name) << qs(task.remotePath) << "->"
                   << qs(task.localPath);

    const Sleeper sleep = opt_.sleeper ? opt_.sleeper : defaultSleeper();
    RetryBudget outer(opt_.maxOuterRetries, opt_.outerBackoffUnit);
    auto progress = [&registry, &id](std::uint64_t done, std::uint64_t) {
        registry.updateProgress(id, done);
    };

    SessionError err;
    bool connected = session->connect(host, err);
    while (true) {
        if (connected) {
            registry.noteAttempt(id);
            const CopyOutcome res =
                copyResumable(*session, task.remotePath, task.localPath, progress, opt_.copy);
            if (res.ok) {
                registry.markCompleted(id, res.bytesWritten);
                qCInfo(lcXfer) << "Done" << qs(id) << (qulonglong)res.bytesWritten << "bytes"
                               << "resumedFrom=" << (qulonglong)res.resumedFrom
                               << "streamRetries=" << res.streamRetries
                               << "reconnects=" << outer.used();
                break;
            }
            err = res.error;
        }
        if (err.kind == ErrorKind::Authentication)
            markHostAuthFailed(host.name);
        if (!isConnectionRetryable(err.kind)) {
            registry.markFailed(id, task.remotePath + ": " + describe(err));
            break;
        }
        if (!outer.consume()) {
            registry.markFailed(id, task.remotePath + ": gave up after " +
                                        std::to_string(outer.limit()) +
                                        " reconnects: " + describe(err));
            break;
        }
        qCWarning(lcXfer) << "Reconnecting" << qs(host.name) << "for" << qs(id) << "("
                          << outer.used() << "/" << outer.limit() << ") after"
                          << qs(describe(err));
        session->disconnect();
        sleep(outer.backoff());
        err.clear();
        connected = session->reconnect(err);
    }
    session->disconnect();
}

BatchResult TransferScheduler::execute(TransferRegistry& registry) {
    const qint64 startedAtMs = QDateTime::currentMSecsSinceEpoch();

    std::vector<TransferTask> pending;
    for (auto& t : registry.snapshot()) {
        if (t.status == TaskStatus::Pending)
            pending.push_back(std::move(t));
    }
    preflight(registry, pending);

    {
        std::lock_guard<std::mutex> lk(mtx_);
        queue_.clear();
        for (const auto& t : registry.snapshot()) {
            if (t.status == TaskStatus::Pending)
                queue_.push_back(t.id);
        }
    }

    std::size_t queued = 0;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        queued = queue_.size();
    }
    const std::size_t poolSize =
        std::min<std::size_t>((std::size_t)std::max(opt_.maxConcurrent, 1), queued);
    qCInfo(lcXfer) << "Dispatching" << (qulonglong)queued << "tasks on" << (qulonglong)poolSize
                   << "workers";

    const std::size_t started = runOnThreads(
        poolSize, [this, &registry](std::size_t) { workerLoop(registry); }, opt_.launcher);
    if (started < poolSize)
        qCWarning(lcXfer) << "Worker pool short:" << (qulonglong)started << "of"
                          << (qulonglong)poolSize << "threads started";

    BatchResult r;
    r.tasks = registry.snapshot();
    for (const auto& t : r.tasks) {
        switch (t.status) {
        case TaskStatus::Completed:
            ++r.completed;
            break;
        case TaskStatus::Failed:
            ++r.failed;
            break;
        case TaskStatus::Pending:
        case TaskStatus::Downloading:
            ++r.notStarted;
            break;
        }
    }
    r.totalFiles = r.tasks.size();
    r.totalSize = registry.totalSize();
    r.transferredBytes = registry.transferredBytes();
    r.errors = registry.errors();
    r.success = r.failed == 0;
    r.elapsedMs = QDateTime::currentMSecsSinceEpoch() - startedAtMs;
    qCInfo(lcXfer) << "Batch finished: completed" << (qulonglong)r.completed << "failed"
                   << (qulonglong)r.failed << "not started" << (qulonglong)r.notStarted << "in"
                   << r.elapsedMs << "ms";
    return r;
}

} // namespace logcollect
