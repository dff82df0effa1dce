// Batch of transfer tasks and the single lock-guarded aggregate of their state.
#pragma once
#include "logcollect/FileEnumerator.hpp"
#include <QtGlobal>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace logcollect {

// Lifecycle of one task:
//  - Pending:     registered, not dispatched yet
//  - Downloading: a worker owns it
//  - Completed:   final file committed
//  - Failed:      terminal failure (possibly without ever starting)
enum class TaskStatus { Pending, Downloading, Completed, Failed };

const char* taskStatusName(TaskStatus st);

struct TransferTask {
    std::string   id;          // "task_<n>"
    std::string   hostName;
    std::string   remotePath;
    std::string   localPath;   // final path, unique within the batch
    std::uint64_t expectedSize = 0;
    std::int64_t  remoteMtime = 0;
    TaskStatus    status = TaskStatus::Pending;
    std::uint64_t progressBytes = 0;
    int           attempts = 0;
    std::string   error;
    qint64        startedAtMs = 0;
    qint64        finishedAtMs = 0;
};

// Replaces characters that are invalid in file names, drops control
// characters, trims dots and spaces and caps the result at 200 bytes while
// keeping the extension. Never returns an empty string.
std::string sanitizeFileName(const std::string& name);

// Inserts "_<n>" before the extension: ("a.log", 2) -> "a_2.log".
std::string suffixedFileName(const std::string& name, int n);

class TransferRegistry {
public:
    struct Counts {
        std::size_t pending = 0;
        std::size_t downloading = 0;
        std::size_t completed = 0;
        std::size_t failed = 0;
    };

    // Registers a copy of `entry` into `localBasePath/<host>/<name>`, resolving
    // name collisions against the disk and against earlier tasks of this batch.
    std::string addTask(const std::string& hostName,
                        const std::string& remotePath,
                        const std::string& localBasePath,
                        const FileEntry& entry);

    std::size_t size() const;
    std::uint64_t totalSize() const;
    std::vector<std::string> taskIds() const;
    std::optional<TransferTask> task(const std::string& id) const;
    std::vector<TransferTask> snapshot() const;
    std::vector<std::string> errors() const;
    Counts counts() const;

    // Full size of completed tasks plus current progress of running ones.
    std::uint64_t transferredBytes() const;

    // Transitions are monotonic; an illegal transition returns false and
    // leaves the task untouched.
    bool markDownloading(const std::string& id);
    void noteAttempt(const std::string& id);
    void updateProgress(const std::string& id, std::uint64_t bytes);
    bool markCompleted(const std::string& id, std::uint64_t finalSize);
    // Also appends "<host>: <message>" to the batch error list.
    bool markFailed(const std::string& id, const std::string& message);

private:
    mutable std::mutex mtx_;
    std::vector<TransferTask> tasks_;
    std::unordered_map<std::string, std::size_t> index_;
    std::unordered_set<std::string> claimedPaths_;
    std::vector<std::string> errors_;
    std::uint64_t totalSize_ = 0;
    int nextId_ = 1;

    TransferTask* findLocked(const std::string& id);
};

} // namespace logcollect
