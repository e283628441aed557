// Basic types shared between the offload layer and SFTP backends.
// Keep these structures plain so they can be copied across threads freely.
#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace twinpane {

// known_hosts validation policy for the server key.
enum class KnownHostsPolicy {
    Strict,    // Requires an exact match in known_hosts.
    AcceptNew, // TOFU: accepts and stores new hosts; rejects key changes.
    Off        // No verification (not recommended).
};

struct FileInfo {
    std::string name; // base name
    bool is_dir = false;
    bool is_symlink = false; // only reported by lstat() and list()
    std::uint64_t size = 0;  // bytes
    std::uint64_t mtime = 0; // epoch seconds
    std::uint32_t mode = 0;  // POSIX type/permission bits
    std::uint32_t uid = 0;
    std::uint32_t gid = 0;
    // Number of children for directories, when requested and readable.
    std::optional<std::uint32_t> item_count;
};

// Error taxonomy reported by every backend call.
enum class ErrorKind {
    None,
    Transport, // connection lost, auth failure, interrupted session
    Remote,    // no such file, permission denied, remote-side failure
    LocalIO,   // local file could not be opened/read/written
    Cancelled, // the call observed shouldCancel() and stopped
    Internal
};

const char *errorKindName(ErrorKind kind);

// SFTP status codes (draft-ietf-secsh-filexfer) carried in SftpError::code
// for ErrorKind::Remote.
namespace sftp_status {
constexpr long kEof = 1;
constexpr long kNoSuchFile = 2;
constexpr long kPermissionDenied = 3;
constexpr long kFailure = 4;
constexpr long kFileAlreadyExists = 11;
constexpr long kDirNotEmpty = 18;
constexpr long kNotADirectory = 19;
} // namespace sftp_status

struct SftpError {
    ErrorKind kind = ErrorKind::None;
    std::string message;
    long code = 0; // backend specific (SFTP status, libssh2 errno, errno)

    bool isSet() const { return kind != ErrorKind::None; }
    void clear() {
        kind = ErrorKind::None;
        message.clear();
        code = 0;
    }
    void set(ErrorKind k, std::string msg, long c = 0) {
        kind = k;
        message = std::move(msg);
        code = c;
    }
};

// Callback for keyboard-interactive prompts. Must return true and fill one
// response per prompt; on false the backend answers user/password itself.
using KbdIntPromptsCB = std::function<bool(
    const std::string &name, const std::string &instruction,
    const std::vector<std::string> &prompts,
    std::vector<std::string> &responses)>;

struct SessionOptions {
    std::string host;
    std::uint16_t port = 22;
    std::string username;

    std::optional<std::string> password;
    std::optional<std::string> private_key_path;
    std::optional<std::string> private_key_passphrase;

    std::optional<std::string> known_hosts_path; // default: ~/.ssh/known_hosts
    KnownHostsPolicy known_hosts_policy = KnownHostsPolicy::Strict;

    // Fingerprint confirmation (TOFU) when known_hosts has no entry.
    // Invoked on the thread running connect().
    std::function<bool(const std::string &host, std::uint16_t port,
                       const std::string &algorithm,
                       const std::string &fingerprint)>
        hostkey_confirm_cb;

    KbdIntPromptsCB keyboard_interactive_cb;
};

} // namespace twinpane
