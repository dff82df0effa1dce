#include "logcollect/MockRemoteSession.hpp"
#include <algorithm>

namespace logcollect {

namespace {

std::string normalizePath(const std::string& in) {
    std::string out;
    out.reserve(in.size() + 1);
    if (in.empty() || in.front() != '/')
        out.push_back('/');
    for (char c : in) {
        if (c == '/' && !out.empty() && out.back() == '/')
            continue;
        out.push_back(c);
    }
    if (out.size() > 1 && out.back() == '/')
        out.pop_back();
    return out;
}

std::string parentOf(const std::string& path) {
    const auto slash = path.find_last_of('/');
    if (slash == std::string::npos || slash == 0)
        return "/";
    return path.substr(0, slash);
}

std::string baseName(const std::string& path) {
    const auto slash = path.find_last_of('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

} // namespace

// Reads straight from the shared host under its mutex, applying armed faults.
class MockReadStream : public RemoteReadStream {
public:
    MockReadStream(std::shared_ptr<MockRemoteHost> host, MockRemoteSession* session,
                   std::string path, std::uint64_t offset)
        : host_(std::move(host)), session_(session), path_(std::move(path)), pos_(offset) {}

    long read(char* buf, std::size_t len, SessionError& err) override {
        if (!session_->isConnected()) {
            err.set(ErrorKind::Connection, "mock: session dropped");
            return -1;
        }
        std::lock_guard<std::mutex> lk(host_->mtx_);
        auto it = host_->nodes_.find(path_);
        if (it == host_->nodes_.end()) {
            err.set(ErrorKind::Stream, "mock: file vanished: " + path_);
            return -1;
        }
        const std::string& data = it->second.data;
        if (pos_ >= data.size())
            return 0;

        std::size_t n = std::min<std::size_t>(len, data.size() - pos_);
        auto range = host_->readFaults_.equal_range(path_);
        for (auto f = range.first; f != range.second; ++f) {
            MockRemoteHost::ReadFault& fault = f->second;
            if (fault.remaining <= 0)
                continue;
            if (fault.offset == pos_) {
                --fault.remaining;
                if (fault.kind == ErrorKind::Connection) {
                    session_->markDropped();
                    err.set(ErrorKind::Connection, "mock: connection lost");
                } else {
                    err.set(fault.kind, "mock: injected stream failure");
                }
                return -1;
            }
            // Stop right before an armed fault so it fires on the next read.
            if (fault.offset > pos_ && fault.offset < pos_ + n)
                n = (std::size_t)(fault.offset - pos_);
        }
        std::copy(data.data() + pos_, data.data() + pos_ + n, buf);
        pos_ += n;
        return (long)n;
    }

private:
    std::shared_ptr<MockRemoteHost> host_;
    MockRemoteSession* session_;
    std::string path_;
    std::uint64_t pos_;
};

void MockRemoteHost::ensureParentsLocked(const std::string& path) {
    std::string parent = parentOf(path);
    while (true) {
        auto& node = nodes_[parent];
        node.is_dir = true;
        if (parent == "/")
            break;
        parent = parentOf(parent);
    }
}

void MockRemoteHost::addDirectory(const std::string& path, std::uint64_t mtime) {
    const std::string p = normalizePath(path);
    std::lock_guard<std::mutex> lk(mtx_);
    ensureParentsLocked(p);
    Node& n = nodes_[p];
    n.is_dir = true;
    n.mtime = mtime;
}

void MockRemoteHost::addFile(const std::string& path, std::string content, std::uint64_t mtime) {
    const std::string p = normalizePath(path);
    std::lock_guard<std::mutex> lk(mtx_);
    ensureParentsLocked(p);
    Node& n = nodes_[p];
    n.is_dir = false;
    n.data = std::move(content);
    n.mtime = mtime;
}

void MockRemoteHost::addFile(const std::string& path, std::uint64_t size, std::uint64_t mtime) {
    std::string data;
    data.resize((std::size_t)size);
    // Position-dependent bytes so misplaced chunks show up as mismatches.
    for (std::size_t i = 0; i < data.size(); ++i)
        data[i] = static_cast<char>((i * 31 + (i >> 12)) & 0xff);
    addFile(path, std::move(data), mtime);
}

void MockRemoteHost::setContent(const std::string& path, std::string content) {
    const std::string p = normalizePath(path);
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = nodes_.find(p);
    if (it != nodes_.end())
        it->second.data = std::move(content);
}

std::string MockRemoteHost::content(const std::string& path) const {
    const std::string p = normalizePath(path);
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = nodes_.find(p);
    return it == nodes_.end() ? std::string() : it->second.data;
}

void MockRemoteHost::setAcceptedPassword(std::string password) {
    std::lock_guard<std::mutex> lk(mtx_);
    password_ = std::move(password);
}

void MockRemoteHost::setAcceptedKeyFile(std::string keyPath) {
    std::lock_guard<std::mutex> lk(mtx_);
    keyFile_ = std::move(keyPath);
}

void MockRemoteHost::denyListing(const std::string& path) {
    failListing(path, ErrorKind::PermissionDenied);
}

void MockRemoteHost::failListing(const std::string& path, ErrorKind kind) {
    std::lock_guard<std::mutex> lk(mtx_);
    listFaults_[normalizePath(path)] = kind;
}

void MockRemoteHost::injectStreamFailure(const std::string& path, std::uint64_t offset, int times) {
    std::lock_guard<std::mutex> lk(mtx_);
    readFaults_.emplace(normalizePath(path), ReadFault{offset, times, ErrorKind::Stream});
}

void MockRemoteHost::dropConnectionAt(const std::string& path, std::uint64_t offset, int times) {
    std::lock_guard<std::mutex> lk(mtx_);
    readFaults_.emplace(normalizePath(path), ReadFault{offset, times, ErrorKind::Connection});
}

void MockRemoteHost::failConnects(int times, ErrorKind kind) {
    std::lock_guard<std::mutex> lk(mtx_);
    failConnects_ = times;
    failConnectKind_ = kind;
}

int MockRemoteHost::connectCount() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return connects_;
}

std::vector<std::uint64_t> MockRemoteHost::openOffsets(const std::string& path) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = opens_.find(normalizePath(path));
    return it == opens_.end() ? std::vector<std::uint64_t>() : it->second;
}

std::shared_ptr<MockRemoteHost> MockRemoteHost::withSampleTree() {
    auto h = std::make_shared<MockRemoteHost>();
    h->addFile("/var/log/syslog", std::string(1280, 's'), 1700000000);
    h->addFile("/var/log/auth.log", std::string(2048, 'a'), 1700000100);
    h->addFile("/var/log/nginx/access.log", std::string(4096, 'n'), 1700000200);
    h->addFile("/var/log/nginx/error.log", std::string(512, 'e'), 1700000300);
    h->addDirectory("/var/log/private", 1700000000);
    h->addFile("/home/readme.txt", std::string(64, 'r'), 1600000000);
    return h;
}

MockRemoteSession::MockRemoteSession() : host_(MockRemoteHost::withSampleTree()) {}

MockRemoteSession::MockRemoteSession(std::shared_ptr<MockRemoteHost> host)
    : host_(std::move(host)) {}

bool MockRemoteSession::connect(const HostDescriptor& opt, SessionError& err) {
    if (state_ == SessionState::Closed) {
        err.set(ErrorKind::Connection, "session is closed");
        return false;
    }
    lastHost_ = opt;
    state_ = SessionState::Connecting;
    if (opt.host.empty() || opt.username.empty()) {
        state_ = SessionState::Disconnected;
        err.set(ErrorKind::Connection, "host and username are required");
        return false;
    }
    std::lock_guard<std::mutex> lk(host_->mtx_);
    ++host_->connects_;
    if (host_->failConnects_ > 0) {
        --host_->failConnects_;
        state_ = SessionState::Disconnected;
        err.set(host_->failConnectKind_, "mock: injected connect failure");
        return false;
    }
    bool authed = false;
    if (opt.private_key_path.has_value())
        authed = !host_->keyFile_ || *host_->keyFile_ == *opt.private_key_path;
    else if (opt.password.has_value())
        authed = !host_->password_ || *host_->password_ == *opt.password;
    if (!authed) {
        state_ = SessionState::Disconnected;
        err.set(ErrorKind::Authentication, "mock: authentication failed for " + opt.username);
        return false;
    }
    state_ = SessionState::Connected;
    return true;
}

void MockRemoteSession::disconnect() {
    if (state_ != SessionState::Closed)
        state_ = SessionState::Disconnected;
}

void MockRemoteSession::close() {
    state_ = SessionState::Closed;
}

bool MockRemoteSession::list(const std::string& remote_path,
                             std::vector<FileInfo>& out,
                             SessionError& err) {
    if (!isConnected()) {
        err.set(ErrorKind::Connection, "not connected");
        return false;
    }
    const std::string path = normalizePath(remote_path.empty() ? "/" : remote_path);

    std::lock_guard<std::mutex> lk(host_->mtx_);
    auto fault = host_->listFaults_.find(path);
    if (fault != host_->listFaults_.end()) {
        err.set(fault->second, std::string("mock: listing ") + path + " failed (" +
                                   errorKindName(fault->second) + ")");
        return false;
    }
    auto self = host_->nodes_.find(path);
    if (self == host_->nodes_.end() || !self->second.is_dir) {
        err.set(ErrorKind::NotFound, "mock: no such directory: " + path);
        return false;
    }
    out.clear();
    for (const auto& kv : host_->nodes_) {
        if (kv.first == "/" || parentOf(kv.first) != path)
            continue;
        FileInfo fi;
        fi.name = baseName(kv.first);
        fi.is_dir = kv.second.is_dir;
        fi.size = kv.second.is_dir ? 0 : kv.second.data.size();
        fi.mtime = kv.second.mtime;
        fi.mode = kv.second.is_dir ? 0040755 : 0100644;
        out.push_back(std::move(fi));
    }
    std::sort(out.begin(), out.end(), [](const FileInfo& a, const FileInfo& b) {
        if (a.is_dir != b.is_dir)
            return a.is_dir > b.is_dir; // directories first
        return a.name < b.name;
    });
    return true;
}

bool MockRemoteSession::stat(const std::string& remote_path,
                             FileInfo& info,
                             SessionError& err) {
    if (!isConnected()) {
        err.set(ErrorKind::Connection, "not connected");
        return false;
    }
    const std::string path = normalizePath(remote_path);
    std::lock_guard<std::mutex> lk(host_->mtx_);
    auto it = host_->nodes_.find(path);
    if (it == host_->nodes_.end()) {
        err.set(ErrorKind::NotFound, "mock: no such file: " + path);
        return false;
    }
    info.name = baseName(path);
    info.is_dir = it->second.is_dir;
    info.size = it->second.is_dir ? 0 : it->second.data.size();
    info.mtime = it->second.mtime;
    info.mode = it->second.is_dir ? 0040755 : 0100644;
    return true;
}

std::unique_ptr<RemoteReadStream>
MockRemoteSession::openRead(const std::string& remote_path,
                            std::uint64_t offset,
                            SessionError& err) {
    if (!isConnected()) {
        err.set(ErrorKind::Connection, "not connected");
        return nullptr;
    }
    const std::string path = normalizePath(remote_path);
    {
        std::lock_guard<std::mutex> lk(host_->mtx_);
        auto it = host_->nodes_.find(path);
        if (it == host_->nodes_.end() || it->second.is_dir) {
            err.set(ErrorKind::NotFound, "mock: no such file: " + path);
            return nullptr;
        }
        host_->opens_[path].push_back(offset);
    }
    return std::make_unique<MockReadStream>(host_, this, path, offset);
}

} // namespace logcollect
