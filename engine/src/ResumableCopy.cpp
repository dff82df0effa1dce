#include "logcollect/ResumableCopy.hpp"
#include "logcollect/LogCategories.hpp"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileDevice>
#include <QFileInfo>
#include <QTimeZone>
#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <unistd.h>
#include <vector>

namespace logcollect {

const char* const kPartialSuffix = ".partial";

std::string partialPathFor(const std::string& localPath) {
    return localPath + kPartialSuffix;
}

namespace {

bool syncFile(QFile& f) {
    if (!f.flush())
        return false;
    return ::fsync(f.handle()) == 0;
}

// Single commit point: rename(2) replaces the final path atomically.
bool commitPartial(const std::string& partial, const std::string& localPath, SessionError& err) {
    if (::rename(partial.c_str(), localPath.c_str()) != 0) {
        err.set(ErrorKind::LocalFilesystem,
                "rename " + partial + " -> " + localPath + " failed: " + std::strerror(errno));
        return false;
    }
    return true;
}

void applyRemoteMtime(QFile& f, std::uint64_t mtime) {
    if (mtime == 0)
        return;
    const QDateTime ts = QDateTime::fromSecsSinceEpoch((qint64)mtime, QTimeZone::utc());
    if (!f.setFileTime(ts, QFileDevice::FileModificationTime))
        qCWarning(lcCopy) << "Failed to set mtime for" << f.fileName() << "to" << ts;
}

} // namespace

CopyOutcome copyResumable(RemoteSession& session,
                          const std::string& remotePath,
                          const std::string& localPath,
                          const CopyProgress& progress,
                          const CopyOptions& options) {
    CopyOutcome out;
    const Sleeper sleep = options.sleeper ? options.sleeper : defaultSleeper();
    const std::size_t chunk = std::max<std::size_t>(options.chunkSize, 1);
    const std::string partial = partialPathFor(localPath);
    const QString qPartial = QString::fromStdString(partial);

    auto fail = [&out](ErrorKind kind, const std::string& msg) {
        out.ok = false;
        out.error.set(kind, msg);
        return out;
    };

    if (!QDir().mkpath(QFileInfo(QString::fromStdString(localPath)).absolutePath()))
        return fail(ErrorKind::LocalFilesystem, "cannot create directory for " + localPath);

    const QFileInfo pinfo(qPartial);
    const bool partialExisted = pinfo.exists();
    std::uint64_t offset = partialExisted ? (std::uint64_t)pinfo.size() : 0;
    out.resumedFrom = offset;

    FileInfo remote;
    SessionError statErr;
    if (!session.stat(remotePath, remote, statErr)) {
        out.error = statErr;
        return out;
    }
    if (remote.is_dir)
        return fail(ErrorKind::NotFound, remotePath + " is a directory");
    const std::uint64_t total = remote.size;
    out.totalSize = total;

    bool truncate = false;
    if (partialExisted && offset == total) {
        out.alreadyComplete = true;
        SessionError cerr;
        if (!commitPartial(partial, localPath, cerr)) {
            out.error = cerr;
            return out;
        }
        out.bytesWritten = total;
        out.ok = true;
        if (progress)
            progress(total, total);
        qCInfo(lcCopy) << "Partial already complete, committed"
                       << QString::fromStdString(localPath);
        return out;
    }
    if (offset > total) {
        qCWarning(lcCopy) << "Remote" << QString::fromStdString(remotePath) << "shrank to"
                          << (qulonglong)total << "bytes; discarding" << (qulonglong)offset
                          << "byte partial";
        truncate = true;
        offset = 0;
        out.resumedFrom = 0;
    }

    QFile f(qPartial);
    const QIODevice::OpenMode mode =
        QIODevice::WriteOnly | (truncate ? QIODevice::Truncate : QIODevice::Append);
    if (!f.open(mode))
        return fail(ErrorKind::LocalFilesystem,
                    "cannot open " + partial + ": " + f.errorString().toStdString());

    if (offset > 0)
        qCInfo(lcCopy) << "Resuming" << QString::fromStdString(remotePath) << "at"
                       << (qulonglong)offset << "of" << (qulonglong)total;
    if (progress)
        progress(offset, total);

    std::uint64_t written = offset;
    std::uint64_t sinceSync = 0;
    std::vector<char> buf(chunk);
    std::unique_ptr<RemoteReadStream> stream;
    RetryBudget budget(options.maxInnerErrors, options.innerBackoffUnit);

    while (written < total) {
        SessionError cause;
        if (!stream) {
            stream = session.openRead(remotePath, written, cause);
            if (stream)
                continue;
        } else {
            const std::size_t want = (std::size_t)std::min<std::uint64_t>(chunk, total - written);
            const long n = stream->read(buf.data(), want, cause);
            if (n > 0) {
                if (f.write(buf.data(), n) != n) {
                    out.bytesWritten = written;
                    return fail(ErrorKind::LocalFilesystem,
                                "write to " + partial + " failed: " + f.errorString().toStdString());
                }
                written += (std::uint64_t)n;
                sinceSync += (std::uint64_t)n;
                if (progress)
                    progress(written, total);
                if (sinceSync >= options.syncInterval) {
                    if (!syncFile(f)) {
                        out.bytesWritten = written;
                        return fail(ErrorKind::LocalFilesystem,
                                    "sync of " + partial + " failed: " + f.errorString().toStdString());
                    }
                    sinceSync = 0;
                }
                continue;
            }
            if (n == 0)
                cause.set(ErrorKind::Stream, "unexpected end of file at " + std::to_string(written) +
                                                 " of " + std::to_string(total));
        }

        // Read or open failure.
        stream.reset();
        if (streamTierFor(cause.kind) != RetryTier::Stream) {
            (void)syncFile(f);
            out.bytesWritten = written;
            out.error = cause;
            qCWarning(lcCopy) << "Copy of" << QString::fromStdString(remotePath) << "stopped at"
                              << (qulonglong)written << ":" << errorKindName(cause.kind)
                              << QString::fromStdString(cause.message);
            return out;
        }
        if (!syncFile(f)) {
            out.bytesWritten = written;
            return fail(ErrorKind::LocalFilesystem,
                        "sync of " + partial + " failed: " + f.errorString().toStdString());
        }
        sinceSync = 0;
        if (!budget.consume()) {
            out.bytesWritten = written;
            qCWarning(lcCopy) << "Stream error budget exhausted for"
                              << QString::fromStdString(remotePath) << "at" << (qulonglong)written;
            return fail(ErrorKind::Stream, "gave up after " + std::to_string(budget.used()) +
                                               " stream errors: " + cause.message);
        }
        ++out.streamRetries;
        qCWarning(lcCopy) << "Stream error on" << QString::fromStdString(remotePath) << "at"
                          << (qulonglong)written << "(" << budget.used() << "/"
                          << budget.limit() << "):" << QString::fromStdString(cause.message);
        sleep(budget.backoff());
    }

    stream.reset();
    if (!syncFile(f)) {
        out.bytesWritten = written;
        return fail(ErrorKind::LocalFilesystem,
                    "sync of " + partial + " failed: " + f.errorString().toStdString());
    }
    applyRemoteMtime(f, remote.mtime);
    f.close();

    SessionError cerr;
    if (!commitPartial(partial, localPath, cerr)) {
        out.bytesWritten = written;
        out.error = cerr;
        return out;
    }
    out.bytesWritten = written;
    out.ok = true;
    qCInfo(lcCopy) << "Committed" << QString::fromStdString(localPath) << (qulonglong)written
                   << "bytes, stream retries:" << out.streamRetries;
    return out;
}

} // namespace logcollect
