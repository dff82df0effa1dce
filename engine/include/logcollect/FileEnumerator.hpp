// Recursive, filtered discovery of remote files.
#pragma once
#include "logcollect/RemoteSession.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace logcollect {

// One configured remote directory to collect from.
struct DirectorySpec {
    std::string name;
    std::string path;
    std::string filePattern = "*"; // shell glob, matched against the basename
    bool        recursive = false;
    std::string hostName;
};

// Inclusive bounds in epoch seconds; an unset bound is open.
struct TimeRange {
    std::optional<std::int64_t> start;
    std::optional<std::int64_t> end;

    bool contains(std::int64_t mtime) const {
        if (start && mtime < *start)
            return false;
        if (end && mtime > *end)
            return false;
        return true;
    }
    bool isOpen() const { return !start && !end; }
};

struct FileEntry {
    std::string   remotePath;
    std::string   name;
    std::uint64_t size = 0;
    std::int64_t  mtime = 0;
    bool          is_dir = false;
    std::uint32_t mode = 0;
};

struct EnumerationStats {
    int directoriesListed = 0;
    int directoriesSkipped = 0; // permission denied or vanished
    int filesSeen = 0;
};

// Shell-glob match of `name` against `pattern` (*, ?, [...]).
bool matchesPattern(const std::string& pattern, const std::string& name);

// Joins a remote directory and a child name with exactly one '/'.
std::string joinRemotePath(const std::string& dir, const std::string& name);

// Walks `dir.path` depth-first, children in name order, appending every regular
// file whose basename matches the pattern and whose mtime lies in `range`.
// Unreadable subtrees are skipped with a warning. Returns false only when the
// session itself fails (Connection, Timeout, Protocol, Authentication).
bool enumerateFiles(RemoteSession& session,
                    const DirectorySpec& dir,
                    const TimeRange& range,
                    std::vector<FileEntry>& out,
                    SessionError& err,
                    EnumerationStats* stats = nullptr);

} // namespace logcollect
