// libssh2 backend: owns the TCP socket, the SSH session and the SFTP channel.
// Includes keepalive, known_hosts validation and seeked read streams.
#include "logcollect/Libssh2RemoteSession.hpp"
#include <libssh2.h>
#include <libssh2_sftp.h>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <string>
#include <vector>

// POSIX sockets
#include <cerrno>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace logcollect {

namespace {

// libssh2_init is not thread-safe; sessions are created from worker threads.
std::once_flag g_libssh2_once;

// Context for keyboard-interactive: answers username or password per prompt.
struct KbdIntCtx {
    const char* user;
    const char* pass;
};

void kbint_password_callback(const char* name, int name_len,
                             const char* instruction, int instruction_len,
                             int num_prompts,
                             const LIBSSH2_USERAUTH_KBDINT_PROMPT* prompts,
                             LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses,
                             void** abstract) {
    (void)name;
    (void)name_len;
    (void)instruction;
    (void)instruction_len;
    if (!abstract || !*abstract)
        return;
    const KbdIntCtx* ctx = static_cast<const KbdIntCtx*>(*abstract);
    for (int i = 0; i < num_prompts; ++i) {
        std::string prompt;
        if (prompts && prompts[i].text)
            prompt.assign(reinterpret_cast<const char*>(prompts[i].text),
                          prompts[i].length);
        std::transform(prompt.begin(), prompt.end(), prompt.begin(),
                       [](unsigned char c) { return (char)std::tolower(c); });
        // Prompts mentioning "user" or "name" get the username, anything else the password.
        const bool wantUser = prompt.find("user") != std::string::npos ||
                              prompt.find("name") != std::string::npos;
        const char* ans = wantUser ? ctx->user : ctx->pass;
        const std::size_t alen = ans ? std::strlen(ans) : 0;
        responses[i].text = nullptr;
        responses[i].length = 0;
        if (alen == 0)
            continue;
        // libssh2 frees responses with its own allocator (malloc by default).
        char* buf = static_cast<char*>(std::malloc(alen + 1));
        if (!buf)
            continue;
        std::memcpy(buf, ans, alen);
        buf[alen] = '\0';
        responses[i].text = buf;
        responses[i].length = (unsigned int)alen;
    }
}

ErrorKind kindForSftpStatus(unsigned long st) {
    switch (st) {
    case LIBSSH2_FX_NO_SUCH_FILE:
    case LIBSSH2_FX_NO_SUCH_PATH:
        return ErrorKind::NotFound;
    case LIBSSH2_FX_PERMISSION_DENIED:
        return ErrorKind::PermissionDenied;
    case LIBSSH2_FX_NO_CONNECTION:
    case LIBSSH2_FX_CONNECTION_LOST:
        return ErrorKind::Connection;
    default:
        return ErrorKind::Protocol;
    }
}

ErrorKind kindForSessionErrno(LIBSSH2_SESSION* s, LIBSSH2_SFTP* sftp) {
    if (!s)
        return ErrorKind::Connection;
    const int rc = libssh2_session_last_errno(s);
    switch (rc) {
    case LIBSSH2_ERROR_TIMEOUT:
    case LIBSSH2_ERROR_SOCKET_TIMEOUT:
        return ErrorKind::Timeout;
    case LIBSSH2_ERROR_SOCKET_NONE:
    case LIBSSH2_ERROR_SOCKET_SEND:
    case LIBSSH2_ERROR_SOCKET_DISCONNECT:
    case LIBSSH2_ERROR_BANNER_RECV:
    case LIBSSH2_ERROR_BANNER_SEND:
#ifdef LIBSSH2_ERROR_SOCKET_RECV
    case LIBSSH2_ERROR_SOCKET_RECV:
#endif
        return ErrorKind::Connection;
    case LIBSSH2_ERROR_AUTHENTICATION_FAILED:
    case LIBSSH2_ERROR_PUBLICKEY_UNVERIFIED:
    case LIBSSH2_ERROR_PASSWORD_EXPIRED:
    case LIBSSH2_ERROR_FILE:
#ifdef LIBSSH2_ERROR_KEYFILE_AUTH_FAILED
    case LIBSSH2_ERROR_KEYFILE_AUTH_FAILED:
#endif
        return ErrorKind::Authentication;
    case LIBSSH2_ERROR_SFTP_PROTOCOL:
        return sftp ? kindForSftpStatus(libssh2_sftp_last_error(sftp))
                    : ErrorKind::Protocol;
    default:
        return ErrorKind::Protocol;
    }
}

std::string sessionErrorText(LIBSSH2_SESSION* s) {
    if (!s)
        return {};
    char* msg = nullptr;
    int len = 0;
    (void)libssh2_session_last_error(s, &msg, &len, 0);
    return (msg && len > 0) ? std::string(msg, (std::size_t)len) : std::string();
}

FileInfo fromAttributes(const LIBSSH2_SFTP_ATTRIBUTES& attrs) {
    FileInfo fi{};
    if (attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) {
        fi.mode = attrs.permissions;
        fi.is_dir = (attrs.permissions & LIBSSH2_SFTP_S_IFMT) == LIBSSH2_SFTP_S_IFDIR;
    }
    if (attrs.flags & LIBSSH2_SFTP_ATTR_SIZE)
        fi.size = attrs.filesize;
    if (attrs.flags & LIBSSH2_SFTP_ATTR_ACMODTIME)
        fi.mtime = attrs.mtime;
    return fi;
}

class Libssh2ReadStream : public RemoteReadStream {
public:
    Libssh2ReadStream(LIBSSH2_SESSION* s, LIBSSH2_SFTP* sftp, LIBSSH2_SFTP_HANDLE* h)
        : session_(s), sftp_(sftp), handle_(h) {}
    ~Libssh2ReadStream() override {
        if (handle_)
            libssh2_sftp_close(handle_);
    }

    long read(char* buf, std::size_t len, SessionError& err) override {
        ssize_t n = libssh2_sftp_read(handle_, buf, len);
        if (n >= 0)
            return (long)n;
        ErrorKind k = kindForSessionErrno(session_, sftp_);
        // Anything that is not a lost transport is treated as stream corruption.
        if (k != ErrorKind::Connection && k != ErrorKind::Timeout)
            k = ErrorKind::Stream;
        err.set(k, "sftp_read failed: " + sessionErrorText(session_));
        return -1;
    }

private:
    LIBSSH2_SESSION*     session_;
    LIBSSH2_SFTP*        sftp_;
    LIBSSH2_SFTP_HANDLE* handle_;
};

} // namespace

Libssh2RemoteSession::Libssh2RemoteSession() {
    std::call_once(g_libssh2_once, []() { (void)libssh2_init(0); });
}

Libssh2RemoteSession::~Libssh2RemoteSession() {
    disconnect();
}

ErrorKind Libssh2RemoteSession::lastErrorKind() const {
    return kindForSessionErrno(session_, sftp_);
}

std::string Libssh2RemoteSession::lastErrorText() const {
    return sessionErrorText(session_);
}

void Libssh2RemoteSession::fail(SessionError& err, const std::string& what) const {
    const std::string detail = lastErrorText();
    err.set(lastErrorKind(), detail.empty() ? what : what + ": " + detail);
}

bool Libssh2RemoteSession::tcpConnect(const std::string& host, std::uint16_t port,
                                      int timeoutSec, SessionError& err) {
    struct addrinfo hints{};
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    char portStr[16];
    std::snprintf(portStr, sizeof(portStr), "%u", static_cast<unsigned>(port));

    struct addrinfo* res = nullptr;
    int gai = getaddrinfo(host.c_str(), portStr, &hints, &res);
    if (gai != 0) {
        err.set(ErrorKind::Connection, std::string("getaddrinfo: ") + gai_strerror(gai));
        return false;
    }

    bool timedOut = false;
    for (auto rp = res; rp != nullptr; rp = rp->ai_next) {
        int s = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
        if (s == -1)
            continue;
        int opt = 1;
        ::setsockopt(s, SOL_SOCKET, SO_KEEPALIVE, &opt, sizeof(opt));
#if defined(__linux__)
        int idle = 60, intvl = 10, cnt = 3;
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPIDLE, &idle, sizeof(idle));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPINTVL, &intvl, sizeof(intvl));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPCNT, &cnt, sizeof(cnt));
#endif
        // Non-blocking connect bounded by the host timeout, then back to
        // blocking mode for libssh2.
        const int flags = ::fcntl(s, F_GETFL, 0);
        ::fcntl(s, F_SETFL, flags | O_NONBLOCK);
        int rc = ::connect(s, rp->ai_addr, rp->ai_addrlen);
        if (rc != 0 && errno == EINPROGRESS) {
            struct pollfd pfd{};
            pfd.fd = s;
            pfd.events = POLLOUT;
            rc = ::poll(&pfd, 1, timeoutSec * 1000);
            if (rc == 0) {
                timedOut = true;
                rc = -1;
            } else if (rc > 0) {
                int soErr = 0;
                socklen_t len = sizeof(soErr);
                ::getsockopt(s, SOL_SOCKET, SO_ERROR, &soErr, &len);
                rc = (soErr == 0) ? 0 : -1;
            } else {
                rc = -1;
            }
        }
        if (rc == 0) {
            ::fcntl(s, F_SETFL, flags);
            sock_ = s;
            freeaddrinfo(res);
            return true;
        }
        ::close(s);
    }
    freeaddrinfo(res);
    if (timedOut)
        err.set(ErrorKind::Timeout, "TCP connect to " + host + " timed out");
    else
        err.set(ErrorKind::Connection, "could not connect to " + host + ":" + portStr);
    return false;
}

bool Libssh2RemoteSession::verifyHostKey(const HostDescriptor& host, SessionError& err) {
    if (host.known_hosts_policy == KnownHostsPolicy::Off)
        return true;

    LIBSSH2_KNOWNHOSTS* nh = libssh2_knownhost_init(session_);
    if (!nh) {
        err.set(ErrorKind::Protocol, "could not initialize known_hosts");
        return false;
    }

    std::string khPath;
    if (host.known_hosts_path.has_value()) {
        khPath = *host.known_hosts_path;
    } else {
        const char* home = std::getenv("HOME");
        if (home)
            khPath = std::string(home) + "/.ssh/known_hosts";
    }

    bool khLoaded = false;
    if (!khPath.empty())
        khLoaded = (libssh2_knownhost_readfile(nh, khPath.c_str(),
                                               LIBSSH2_KNOWNHOST_FILE_OPENSSH) >= 0);
    if (!khLoaded && host.known_hosts_policy == KnownHostsPolicy::Strict) {
        libssh2_knownhost_free(nh);
        err.set(ErrorKind::Authentication, "known_hosts unavailable (strict policy)");
        return false;
    }

    size_t keylen = 0;
    int keytype = 0;
    const char* hostkey = libssh2_session_hostkey(session_, &keylen, &keytype);
    if (!hostkey || keylen == 0) {
        libssh2_knownhost_free(nh);
        err.set(ErrorKind::Protocol, "could not obtain host key");
        return false;
    }

    int alg = 0;
    switch (keytype) {
    case LIBSSH2_HOSTKEY_TYPE_RSA:
        alg = LIBSSH2_KNOWNHOST_KEY_SSHRSA;
        break;
    case LIBSSH2_HOSTKEY_TYPE_DSS:
        alg = LIBSSH2_KNOWNHOST_KEY_SSHDSS;
        break;
#ifdef LIBSSH2_KNOWNHOST_KEY_ECDSA_256
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_256:
        alg = LIBSSH2_KNOWNHOST_KEY_ECDSA_256;
        break;
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_384:
        alg = LIBSSH2_KNOWNHOST_KEY_ECDSA_384;
        break;
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_521:
        alg = LIBSSH2_KNOWNHOST_KEY_ECDSA_521;
        break;
#endif
#ifdef LIBSSH2_KNOWNHOST_KEY_ED25519
    case LIBSSH2_HOSTKEY_TYPE_ED25519:
        alg = LIBSSH2_KNOWNHOST_KEY_ED25519;
        break;
#endif
    default:
        alg = 0;
        break;
    }

    const int typemask_plain = LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg;
    const int typemask_hash = LIBSSH2_KNOWNHOST_TYPE_SHA1 | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg;

    struct libssh2_knownhost* entry = nullptr;
    int check = libssh2_knownhost_checkp(nh, host.host.c_str(), host.port,
                                         hostkey, keylen, typemask_plain, &entry);
    if (check != LIBSSH2_KNOWNHOST_CHECK_MATCH)
        check = libssh2_knownhost_checkp(nh, host.host.c_str(), host.port,
                                         hostkey, keylen, typemask_hash, &entry);

    if (check == LIBSSH2_KNOWNHOST_CHECK_MATCH) {
        libssh2_knownhost_free(nh);
        return true;
    }

    if (check == LIBSSH2_KNOWNHOST_CHECK_NOTFOUND &&
        host.known_hosts_policy == KnownHostsPolicy::AcceptNew) {
        // Unattended TOFU: record the new key; a later mismatch is rejected.
        if (!khPath.empty()) {
            const int addMask = LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg;
            const int addrc = libssh2_knownhost_addc(nh, host.host.c_str(), nullptr,
                                                     hostkey, keylen,
                                                     nullptr, 0, addMask, nullptr);
            if (addrc == 0)
                (void)libssh2_knownhost_writefile(nh, khPath.c_str(),
                                                  LIBSSH2_KNOWNHOST_FILE_OPENSSH);
        }
        libssh2_knownhost_free(nh);
        return true;
    }

    libssh2_knownhost_free(nh);
    err.set(ErrorKind::Authentication,
            check == LIBSSH2_KNOWNHOST_CHECK_MISMATCH
                ? "host key does not match known_hosts"
                : "host unknown in known_hosts");
    return false;
}

bool Libssh2RemoteSession::authenticate(const HostDescriptor& host, SessionError& err) {
    // Exactly the method the descriptor carries: key file, else password.
    if (host.private_key_path.has_value()) {
        const char* passphrase =
            host.private_key_passphrase ? host.private_key_passphrase->c_str() : nullptr;
        int rc = libssh2_userauth_publickey_fromfile(session_,
                                                     host.username.c_str(),
                                                     nullptr, // derived from the private key
                                                     host.private_key_path->c_str(),
                                                     passphrase);
        if (rc != 0) {
            ErrorKind k = lastErrorKind();
            if (k == ErrorKind::Protocol)
                k = ErrorKind::Authentication;
            err.set(k, "public key authentication failed: " + lastErrorText());
            return false;
        }
        return true;
    }

    if (!host.password.has_value()) {
        err.set(ErrorKind::Authentication, "no authentication method configured");
        return false;
    }

    int rc_pw = libssh2_userauth_password(session_, host.username.c_str(),
                                          host.password->c_str());
    if (rc_pw == 0)
        return true;

    // The server hung up after the password attempt: nothing else will work.
    if (rc_pw == LIBSSH2_ERROR_SOCKET_DISCONNECT || rc_pw == LIBSSH2_ERROR_SOCKET_SEND) {
        err.set(ErrorKind::Connection, "server closed the connection after password attempt");
        return false;
    }

    // Some servers only offer password logins through keyboard-interactive.
    char* methods = libssh2_userauth_list(session_, host.username.c_str(),
                                          (unsigned)host.username.size());
    const std::string authlist = methods ? std::string(methods) : std::string();
    int rc_kbd = -1;
    if (authlist.find("keyboard-interactive") != std::string::npos) {
        KbdIntCtx ctx{host.username.c_str(), host.password->c_str()};
        void** abs = libssh2_session_abstract(session_);
        if (abs)
            *abs = &ctx;
        rc_kbd = libssh2_userauth_keyboard_interactive(session_, host.username.c_str(),
                                                       kbint_password_callback);
        if (abs)
            *abs = nullptr;
    }
    if (rc_kbd == 0)
        return true;

    err.set(ErrorKind::Authentication,
            std::string("password authentication failed") +
                (authlist.empty() ? std::string() : " (methods: " + authlist + ")") +
                " [rc_pw=" + std::to_string(rc_pw) + ", rc_kbd=" + std::to_string(rc_kbd) + "]");
    return false;
}

bool Libssh2RemoteSession::sshHandshakeAuth(const HostDescriptor& host, SessionError& err) {
    session_ = libssh2_session_init();
    if (!session_) {
        err.set(ErrorKind::Protocol, "libssh2_session_init failed");
        return false;
    }

    libssh2_session_set_blocking(session_, 1);
    libssh2_session_set_timeout(session_, (long)host.timeout_sec * 1000L);

    if (libssh2_session_handshake(session_, sock_) != 0) {
        ErrorKind k = lastErrorKind();
        if (k != ErrorKind::Timeout && k != ErrorKind::Connection)
            k = ErrorKind::Protocol;
        err.set(k, "SSH handshake failed: " + lastErrorText());
        return false;
    }

    // SSH keepalive every 30s if the peer allows it
    libssh2_keepalive_config(session_, 1, 30);

    if (!verifyHostKey(host, err))
        return false;
    if (!authenticate(host, err))
        return false;

    sftp_ = libssh2_sftp_init(session_);
    if (!sftp_) {
        ErrorKind k = lastErrorKind();
        if (k != ErrorKind::Timeout && k != ErrorKind::Connection)
            k = ErrorKind::Protocol;
        err.set(k, "could not initialize SFTP: " + lastErrorText());
        return false;
    }
    return true;
}

bool Libssh2RemoteSession::connect(const HostDescriptor& host, SessionError& err) {
    if (state_ == SessionState::Closed) {
        err.set(ErrorKind::Connection, "session is closed");
        return false;
    }
    if (state_ == SessionState::Connected)
        disconnect();
    host_ = host;
    state_ = SessionState::Connecting;
    if (!tcpConnect(host.host, host.port, host.timeout_sec, err) ||
        !sshHandshakeAuth(host, err)) {
        disconnect();
        return false;
    }
    state_ = SessionState::Connected;
    return true;
}

void Libssh2RemoteSession::disconnect() {
    if (sftp_) {
        libssh2_sftp_shutdown(sftp_);
        sftp_ = nullptr;
    }
    if (session_) {
        libssh2_session_disconnect(session_, "bye");
        libssh2_session_free(session_);
        session_ = nullptr;
    }
    if (sock_ != -1) {
        ::close(sock_);
        sock_ = -1;
    }
    if (state_ != SessionState::Closed)
        state_ = SessionState::Disconnected;
}

void Libssh2RemoteSession::close() {
    disconnect();
    state_ = SessionState::Closed;
}

bool Libssh2RemoteSession::list(const std::string& remote_path,
                                std::vector<FileInfo>& out,
                                SessionError& err) {
    if (!isConnected() || !sftp_) {
        err.set(ErrorKind::Connection, "not connected");
        return false;
    }

    const std::string path = remote_path.empty() ? "/" : remote_path;
    LIBSSH2_SFTP_HANDLE* dir = libssh2_sftp_opendir(sftp_, path.c_str());
    if (!dir) {
        fail(err, "sftp_opendir failed for " + path);
        return false;
    }

    out.clear();
    out.reserve(64);

    char filename[512];
    char longentry[1024];
    LIBSSH2_SFTP_ATTRIBUTES attrs;

    while (true) {
        std::memset(&attrs, 0, sizeof(attrs));
        int rc = libssh2_sftp_readdir_ex(dir,
                                         filename, sizeof(filename),
                                         longentry, sizeof(longentry),
                                         &attrs);
        if (rc > 0) {
            FileInfo fi = fromAttributes(attrs);
            fi.name = std::string(filename, rc);
            if (fi.name == "." || fi.name == "..")
                continue;
            out.push_back(std::move(fi));
        } else if (rc == 0) {
            break;
        } else {
            fail(err, "sftp_readdir failed for " + path);
            libssh2_sftp_closedir(dir);
            return false;
        }
    }

    libssh2_sftp_closedir(dir);
    return true;
}

bool Libssh2RemoteSession::stat(const std::string& remote_path,
                                FileInfo& info,
                                SessionError& err) {
    if (!isConnected() || !sftp_) {
        err.set(ErrorKind::Connection, "not connected");
        return false;
    }

    LIBSSH2_SFTP_ATTRIBUTES st{};
    int rc = libssh2_sftp_stat_ex(sftp_, remote_path.c_str(), (unsigned)remote_path.size(),
                                  LIBSSH2_SFTP_STAT, &st);
    if (rc != 0) {
        fail(err, "sftp_stat failed for " + remote_path);
        return false;
    }
    info = fromAttributes(st);
    const auto slash = remote_path.find_last_of('/');
    info.name = (slash == std::string::npos) ? remote_path : remote_path.substr(slash + 1);
    return true;
}

std::unique_ptr<RemoteReadStream>
Libssh2RemoteSession::openRead(const std::string& remote_path,
                               std::uint64_t offset,
                               SessionError& err) {
    if (!isConnected() || !sftp_) {
        err.set(ErrorKind::Connection, "not connected");
        return nullptr;
    }
    LIBSSH2_SFTP_HANDLE* rh = libssh2_sftp_open_ex(
        sftp_, remote_path.c_str(), (unsigned)remote_path.size(),
        LIBSSH2_FXF_READ, 0, LIBSSH2_SFTP_OPENFILE);
    if (!rh) {
        fail(err, "could not open " + remote_path + " for reading");
        return nullptr;
    }
    if (offset > 0)
        libssh2_sftp_seek64(rh, (libssh2_uint64_t)offset);
    return std::make_unique<Libssh2ReadStream>(session_, sftp_, rh);
}

} // namespace logcollect
