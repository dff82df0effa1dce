#include "logcollect/TransferRegistry.hpp"
#include "logcollect/LogCategories.hpp"
#include "logcollect/ResumableCopy.hpp"

#include <QDateTime>
#include <QDir>
#include <QFileInfo>
#include <cstring>

namespace logcollect {

namespace {

constexpr std::size_t kMaxNameBytes = 200;

// Extension as os.path.splitext sees it: last dot, not at position 0.
std::size_t extensionPos(const std::string& name) {
    const auto dot = name.find_last_of('.');
    if (dot == std::string::npos || dot == 0)
        return std::string::npos;
    return dot;
}

// Largest prefix length <= max that does not cut a UTF-8 sequence.
std::size_t utf8Prefix(const std::string& s, std::size_t max) {
    if (s.size() <= max)
        return s.size();
    std::size_t n = max;
    while (n > 0 && (static_cast<unsigned char>(s[n]) & 0xC0) == 0x80)
        --n;
    return n;
}

} // namespace

const char* taskStatusName(TaskStatus st) {
    switch (st) {
    case TaskStatus::Pending:
        return "pending";
    case TaskStatus::Downloading:
        return "downloading";
    case TaskStatus::Completed:
        return "completed";
    case TaskStatus::Failed:
        return "failed";
    }
    return "unknown";
}

std::string sanitizeFileName(const std::string& name) {
    static const char* kInvalid = "<>:\"/\\|?*";
    std::string out;
    out.reserve(name.size());
    for (char c : name) {
        const auto uc = static_cast<unsigned char>(c);
        if (uc < 0x20 || uc == 0x7F)
            continue;
        out.push_back(std::strchr(kInvalid, c) ? '_' : c);
    }

    std::size_t b = 0;
    std::size_t e = out.size();
    while (b < e && (out[b] == ' ' || out[b] == '.'))
        ++b;
    while (e > b && (out[e - 1] == ' ' || out[e - 1] == '.'))
        --e;
    out = out.substr(b, e - b);
    if (out.empty())
        return "file";

    if (out.size() > kMaxNameBytes) {
        const std::size_t dot = extensionPos(out);
        std::string ext = dot == std::string::npos ? std::string() : out.substr(dot);
        if (ext.size() >= kMaxNameBytes)
            ext.clear();
        const std::string stem = dot == std::string::npos || ext.empty() ? out : out.substr(0, dot);
        out = stem.substr(0, utf8Prefix(stem, kMaxNameBytes - ext.size())) + ext;
    }
    return out;
}

std::string suffixedFileName(const std::string& name, int n) {
    const std::size_t dot = extensionPos(name);
    if (dot == std::string::npos)
        return name + "_" + std::to_string(n);
    return name.substr(0, dot) + "_" + std::to_string(n) + name.substr(dot);
}

std::string TransferRegistry::addTask(const std::string& hostName,
                                      const std::string& remotePath,
                                      const std::string& localBasePath,
                                      const FileEntry& entry) {
    const QDir hostDir(QDir(QString::fromStdString(localBasePath))
                           .filePath(QString::fromStdString(sanitizeFileName(hostName))));
    std::string base = entry.name;
    if (base.empty()) {
        const auto slash = remotePath.find_last_of('/');
        base = slash == std::string::npos ? remotePath : remotePath.substr(slash + 1);
    }
    std::string fileName = sanitizeFileName(base);
    // The partial suffix belongs to in-flight downloads; a remote "x.log.partial"
    // lands as "x.log_partial" so it never shares a path with x.log's partial.
    const std::size_t suffixLen = std::strlen(kPartialSuffix);
    if (fileName.size() > suffixLen &&
        fileName.compare(fileName.size() - suffixLen, suffixLen, kPartialSuffix) == 0)
        fileName[fileName.size() - suffixLen] = '_';

    std::lock_guard<std::mutex> lk(mtx_);
    std::string candidate = QDir::cleanPath(hostDir.filePath(QString::fromStdString(fileName))).toStdString();
    for (int n = 1; claimedPaths_.count(candidate) > 0 ||
                    QFileInfo::exists(QString::fromStdString(candidate));
         ++n) {
        candidate = QDir::cleanPath(hostDir.filePath(
                                        QString::fromStdString(suffixedFileName(fileName, n))))
                        .toStdString();
    }
    claimedPaths_.insert(candidate);

    TransferTask t;
    t.id = "task_" + std::to_string(nextId_++);
    t.hostName = hostName;
    t.remotePath = remotePath;
    t.localPath = candidate;
    t.expectedSize = entry.size;
    t.remoteMtime = entry.mtime;
    index_[t.id] = tasks_.size();
    totalSize_ += entry.size;
    qCDebug(lcRegistry) << "Registered" << QString::fromStdString(t.id)
                        << QString::fromStdString(hostName) << QString::fromStdString(remotePath)
                        << "->" << QString::fromStdString(candidate);
    tasks_.push_back(std::move(t));
    return tasks_.back().id;
}

std::size_t TransferRegistry::size() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return tasks_.size();
}

std::uint64_t TransferRegistry::totalSize() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return totalSize_;
}

std::vector<std::string> TransferRegistry::taskIds() const {
    std::lock_guard<std::mutex> lk(mtx_);
    std::vector<std::string> ids;
    ids.reserve(tasks_.size());
    for (const auto& t : tasks_)
        ids.push_back(t.id);
    return ids;
}

std::optional<TransferTask> TransferRegistry::task(const std::string& id) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = index_.find(id);
    if (it == index_.end())
        return std::nullopt;
    return tasks_[it->second];
}

std::vector<TransferTask> TransferRegistry::snapshot() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return tasks_;
}

std::vector<std::string> TransferRegistry::errors() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return errors_;
}

TransferRegistry::Counts TransferRegistry::counts() const {
    std::lock_guard<std::mutex> lk(mtx_);
    Counts c;
    for (const auto& t : tasks_) {
        switch (t.status) {
        case TaskStatus::Pending:
            ++c.pending;
            break;
        case TaskStatus::Downloading:
            ++c.downloading;
            break;
        case TaskStatus::Completed:
            ++c.completed;
            break;
        case TaskStatus::Failed:
            ++c.failed;
            break;
        }
    }
    return c;
}

std::uint64_t TransferRegistry::transferredBytes() const {
    std::lock_guard<std::mutex> lk(mtx_);
    std::uint64_t sum = 0;
    for (const auto& t : tasks_) {
        // Completed tasks hold their full size in progressBytes.
        if (t.status == TaskStatus::Completed || t.status == TaskStatus::Downloading)
            sum += t.progressBytes;
    }
    return sum;
}

TransferTask* TransferRegistry::findLocked(const std::string& id) {
    auto it = index_.find(id);
    return it == index_.end() ? nullptr : &tasks_[it->second];
}

bool TransferRegistry::markDownloading(const std::string& id) {
    std::lock_guard<std::mutex> lk(mtx_);
    TransferTask* t = findLocked(id);
    if (!t || t->status != TaskStatus::Pending)
        return false;
    t->status = TaskStatus::Downloading;
    t->startedAtMs = QDateTime::currentMSecsSinceEpoch();
    return true;
}

void TransferRegistry::noteAttempt(const std::string& id) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (TransferTask* t = findLocked(id))
        t->attempts += 1;
}

void TransferRegistry::updateProgress(const std::string& id, std::uint64_t bytes) {
    std::lock_guard<std::mutex> lk(mtx_);
    TransferTask* t = findLocked(id);
    if (t && t->status == TaskStatus::Downloading)
        t->progressBytes = bytes;
}

bool TransferRegistry::markCompleted(const std::string& id, std::uint64_t finalSize) {
    std::lock_guard<std::mutex> lk(mtx_);
    TransferTask* t = findLocked(id);
    if (!t || t->status != TaskStatus::Downloading)
        return false;
    t->status = TaskStatus::Completed;
    t->progressBytes = finalSize;
    t->error.clear();
    t->finishedAtMs = QDateTime::currentMSecsSinceEpoch();
    return true;
}

bool TransferRegistry::markFailed(const std::string& id, const std::string& message) {
    std::lock_guard<std::mutex> lk(mtx_);
    TransferTask* t = findLocked(id);
    if (!t || t->status == TaskStatus::Completed || t->status == TaskStatus::Failed)
        return false;
    t->status = TaskStatus::Failed;
    t->error = message;
    t->finishedAtMs = QDateTime::currentMSecsSinceEpoch();
    errors_.push_back(t->hostName + ": " + message);
    return true;
}

} // namespace logcollect
