#include "logcollect/FileEnumerator.hpp"
#include "logcollect/LogCategories.hpp"

#include <QRegularExpression>
#include <QString>
#include <algorithm>

namespace logcollect {

namespace {

bool isRecoverable(ErrorKind kind) {
    return kind == ErrorKind::PermissionDenied || kind == ErrorKind::NotFound;
}

class Walker {
public:
    Walker(RemoteSession& session, const DirectorySpec& dir, const TimeRange& range,
           std::vector<FileEntry>& out, EnumerationStats& stats)
        : session_(session), dir_(dir), range_(range), out_(out), stats_(stats),
          pattern_(QRegularExpression::fromWildcard(
              QString::fromStdString(dir.filePattern.empty() ? std::string("*") : dir.filePattern),
              Qt::CaseSensitive)) {}

    bool walk(const std::string& path, SessionError& err) {
        std::vector<FileInfo> children;
        SessionError listErr;
        if (!session_.list(path, children, listErr)) {
            if (isRecoverable(listErr.kind)) {
                ++stats_.directoriesSkipped;
                qCWarning(lcEnum) << "Skipping" << QString::fromStdString(path) << "-"
                                  << QString::fromStdString(listErr.message);
                return true;
            }
            err = listErr;
            return false;
        }
        ++stats_.directoriesListed;
        std::sort(children.begin(), children.end(),
                  [](const FileInfo& a, const FileInfo& b) { return a.name < b.name; });

        for (const auto& child : children) {
            const std::string childPath = joinRemotePath(path, child.name);
            if (child.is_dir) {
                if (dir_.recursive && !walk(childPath, err))
                    return false;
                continue;
            }
            ++stats_.filesSeen;
            if (!pattern_.match(QString::fromStdString(child.name)).hasMatch())
                continue;
            if (!range_.contains((std::int64_t)child.mtime))
                continue;
            FileEntry e;
            e.remotePath = childPath;
            e.name = child.name;
            e.size = child.size;
            e.mtime = (std::int64_t)child.mtime;
            e.is_dir = false;
            e.mode = child.mode;
            out_.push_back(std::move(e));
        }
        return true;
    }

private:
    RemoteSession& session_;
    const DirectorySpec& dir_;
    const TimeRange& range_;
    std::vector<FileEntry>& out_;
    EnumerationStats& stats_;
    QRegularExpression pattern_;
};

} // namespace

bool matchesPattern(const std::string& pattern, const std::string& name) {
    const QRegularExpression re = QRegularExpression::fromWildcard(
        QString::fromStdString(pattern), Qt::CaseSensitive);
    return re.match(QString::fromStdString(name)).hasMatch();
}

std::string joinRemotePath(const std::string& dir, const std::string& name) {
    if (dir.empty())
        return std::string("/") + name;
    if (dir.back() == '/')
        return dir + name;
    return dir + "/" + name;
}

bool enumerateFiles(RemoteSession& session,
                    const DirectorySpec& dir,
                    const TimeRange& range,
                    std::vector<FileEntry>& out,
                    SessionError& err,
                    EnumerationStats* stats) {
    EnumerationStats local;
    EnumerationStats& st = stats ? *stats : local;
    const std::size_t before = out.size();

    Walker walker(session, dir, range, out, st);
    const std::string root = dir.path.empty() ? std::string("/") : dir.path;
    if (!walker.walk(root, err)) {
        out.erase(out.begin() + (std::ptrdiff_t)before, out.end());
        qCCritical(lcEnum) << "Enumeration of" << QString::fromStdString(root) << "on"
                           << QString::fromStdString(dir.hostName) << "aborted:"
                           << errorKindName(err.kind) << QString::fromStdString(err.message);
        return false;
    }
    qCInfo(lcEnum) << "Enumerated" << QString::fromStdString(dir.hostName)
                   << QString::fromStdString(root) << "pattern"
                   << QString::fromStdString(dir.filePattern) << "matched"
                   << (qulonglong)(out.size() - before) << "of" << st.filesSeen
                   << "files; skipped dirs" << st.directoriesSkipped;
    return true;
}

} // namespace logcollect
