// Basic types shared between the core and the transfer engine: host
// descriptors, remote metadata and the error record every operation fills.
// Keeping these structures plain makes them easy to copy across threads.
#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace logcollect {

// known_hosts validation policy for the server host key.
enum class KnownHostsPolicy {
    Strict,     // Requires exact match with known_hosts.
    AcceptNew,  // TOFU: accept and save new hosts; reject key changes.
    Off         // No verification (not recommended).
};

// Failure classes reported by sessions and by the copy engine. The retry
// policy decides per kind which tier (if any) recovers it.
enum class ErrorKind {
    None,
    Authentication,   // bad credentials or rejected host key
    Connection,       // resolve/TCP failure or session lost
    Timeout,          // no answer within the host timeout
    Protocol,         // handshake, negotiation or SFTP init failure
    NotFound,
    PermissionDenied,
    Stream,           // transport-level corruption while reading a file
    LocalFilesystem   // writing the local copy failed
};

const char* errorKindName(ErrorKind kind);

struct SessionError {
    ErrorKind   kind = ErrorKind::None;
    std::string message;

    explicit operator bool() const { return kind != ErrorKind::None; }

    void set(ErrorKind k, std::string msg) {
        kind = k;
        message = std::move(msg);
    }
    void clear() {
        kind = ErrorKind::None;
        message.clear();
    }
};

struct FileInfo {
    std::string   name;     // base name
    bool          is_dir = false;
    std::uint64_t size  = 0;  // bytes (if applicable)
    std::uint64_t mtime = 0;  // epoch (seconds)
    std::uint32_t mode  = 0;  // POSIX bits (permissions/type)
};

// One remote host as configured. Exactly one auth method is expected:
// either password, or private_key_path (+ optional passphrase).
struct HostDescriptor {
    std::string name;       // logical name, used for local directories
    std::string host;
    std::uint16_t port = 22;
    std::string username;

    std::optional<std::string> password;
    std::optional<std::string> private_key_path;
    std::optional<std::string> private_key_passphrase;

    int timeout_sec = 30;

    // SSH security
    std::optional<std::string> known_hosts_path; // default: ~/.ssh/known_hosts
    KnownHostsPolicy known_hosts_policy = KnownHostsPolicy::AcceptNew;

    bool usesKeyAuth() const { return private_key_path.has_value(); }
};

enum class SessionState { Disconnected, Connecting, Connected, Closed };

} // namespace logcollect
