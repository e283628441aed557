// libssh2 backend: owns the TCP socket, the SSH session and the SFTP channel.
// Handles keepalive, known_hosts validation and chunked transfers with
// cooperative cancellation.
#include "twinpane/Libssh2SftpClient.hpp"
#include "twinpane/RemotePath.hpp"
#include <libssh2.h>
#include <libssh2_sftp.h>

#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

// POSIX sockets
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace twinpane {

namespace {

std::once_flag g_libssh2InitOnce;

// Context handed to the keyboard-interactive callback through the session
// abstract pointer.
struct KbdIntCtx {
    const char *user;
    const char *pass;
    const KbdIntPromptsCB *cb;
};

char *dupResponse(const std::string &s) {
    if (s.empty())
        return nullptr;
    char *buf = static_cast<char *>(std::malloc(s.size() + 1));
    if (!buf)
        return nullptr;
    std::memcpy(buf, s.data(), s.size());
    buf[s.size()] = '\0';
    return buf;
}

bool promptAsksForUser(const std::string &prompt) {
    std::string lower(prompt);
    for (char &c : lower)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return lower.find("user") != std::string::npos ||
           lower.find("name") != std::string::npos;
}

void kbdintCallback(const char *name, int name_len, const char *instruction,
                    int instruction_len, int num_prompts,
                    const LIBSSH2_USERAUTH_KBDINT_PROMPT *prompts,
                    LIBSSH2_USERAUTH_KBDINT_RESPONSE *responses,
                    void **abstract) {
    if (!abstract || !*abstract)
        return;
    const auto *ctx = static_cast<const KbdIntCtx *>(*abstract);

    std::vector<std::string> texts;
    texts.reserve(static_cast<std::size_t>(num_prompts));
    for (int i = 0; i < num_prompts; ++i) {
        const char *pt = (prompts && prompts[i].text)
                             ? reinterpret_cast<const char *>(prompts[i].text)
                             : "";
        texts.emplace_back(pt);
    }

    std::vector<std::string> answers;
    bool answered = false;
    if (ctx->cb && *(ctx->cb) && num_prompts > 0) {
        const std::string nm = (name && name_len > 0)
                                   ? std::string(name, std::size_t(name_len))
                                   : std::string();
        const std::string ins =
            (instruction && instruction_len > 0)
                ? std::string(instruction, std::size_t(instruction_len))
                : std::string();
        answered = (*(ctx->cb))(nm, ins, texts, answers) &&
                   answers.size() >= texts.size();
    }
    if (!answered) {
        answers.clear();
        for (const auto &t : texts) {
            const char *a = promptAsksForUser(t) ? ctx->user : ctx->pass;
            answers.emplace_back(a ? a : "");
        }
    }
    for (int i = 0; i < num_prompts; ++i) {
        const std::string &a = answers[std::size_t(i)];
        responses[i].text = dupResponse(a);
        responses[i].length =
            responses[i].text ? static_cast<unsigned int>(a.size()) : 0;
    }
}

std::string sftpStatusText(unsigned long code) {
    switch (code) {
    case LIBSSH2_FX_NO_SUCH_FILE:
    case LIBSSH2_FX_NO_SUCH_PATH:
        return "no such file or directory";
    case LIBSSH2_FX_PERMISSION_DENIED:
        return "permission denied";
    case LIBSSH2_FX_FILE_ALREADY_EXISTS:
        return "file already exists";
    case LIBSSH2_FX_DIR_NOT_EMPTY:
        return "directory not empty";
    case LIBSSH2_FX_NOT_A_DIRECTORY:
        return "not a directory";
    case LIBSSH2_FX_NO_SPACE_ON_FILESYSTEM:
    case LIBSSH2_FX_QUOTA_EXCEEDED:
        return "no space left on remote filesystem";
    case LIBSSH2_FX_WRITE_PROTECT:
        return "remote filesystem is read-only";
    case LIBSSH2_FX_FAILURE:
        return "remote failure";
    default:
        return "SFTP status " + std::to_string(code);
    }
}

std::string hostKeyAlgorithmName(int keytype) {
    switch (keytype) {
    case LIBSSH2_HOSTKEY_TYPE_RSA:
        return "RSA";
    case LIBSSH2_HOSTKEY_TYPE_DSS:
        return "DSA";
#ifdef LIBSSH2_HOSTKEY_TYPE_ECDSA_256
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_256:
        return "ECDSA-256";
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_384:
        return "ECDSA-384";
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_521:
        return "ECDSA-521";
#endif
#ifdef LIBSSH2_HOSTKEY_TYPE_ED25519
    case LIBSSH2_HOSTKEY_TYPE_ED25519:
        return "ED25519";
#endif
    default:
        return "UNKNOWN";
    }
}

int knownHostKeyMask(int keytype) {
    switch (keytype) {
    case LIBSSH2_HOSTKEY_TYPE_RSA:
        return LIBSSH2_KNOWNHOST_KEY_SSHRSA;
    case LIBSSH2_HOSTKEY_TYPE_DSS:
        return LIBSSH2_KNOWNHOST_KEY_SSHDSS;
#ifdef LIBSSH2_KNOWNHOST_KEY_ECDSA_256
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_256:
        return LIBSSH2_KNOWNHOST_KEY_ECDSA_256;
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_384:
        return LIBSSH2_KNOWNHOST_KEY_ECDSA_384;
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_521:
        return LIBSSH2_KNOWNHOST_KEY_ECDSA_521;
#endif
#ifdef LIBSSH2_KNOWNHOST_KEY_ED25519
    case LIBSSH2_HOSTKEY_TYPE_ED25519:
        return LIBSSH2_KNOWNHOST_KEY_ED25519;
#endif
    default:
        return 0;
    }
}

void fillInfo(const LIBSSH2_SFTP_ATTRIBUTES &attrs, FileInfo &fi) {
    if (attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) {
        fi.mode = static_cast<std::uint32_t>(attrs.permissions);
        fi.is_dir = (attrs.permissions & LIBSSH2_SFTP_S_IFMT) ==
                    LIBSSH2_SFTP_S_IFDIR;
        fi.is_symlink = (attrs.permissions & LIBSSH2_SFTP_S_IFMT) ==
                        LIBSSH2_SFTP_S_IFLNK;
    }
    if (attrs.flags & LIBSSH2_SFTP_ATTR_SIZE)
        fi.size = attrs.filesize;
    if (attrs.flags & LIBSSH2_SFTP_ATTR_ACMODTIME)
        fi.mtime = attrs.mtime;
    if (attrs.flags & LIBSSH2_SFTP_ATTR_UIDGID) {
        fi.uid = static_cast<std::uint32_t>(attrs.uid);
        fi.gid = static_cast<std::uint32_t>(attrs.gid);
    }
}

void setLocalError(SftpError &err, const std::string &what) {
    const int e = errno;
    err.set(ErrorKind::LocalIO, what + ": " + std::strerror(e), e);
}

} // namespace

Libssh2SftpClient::Libssh2SftpClient() {
    std::call_once(g_libssh2InitOnce, []() { (void)libssh2_init(0); });
}

Libssh2SftpClient::~Libssh2SftpClient() { disconnect(); }

bool Libssh2SftpClient::tcpConnect(const std::string &host, std::uint16_t port,
                                   SftpError &err) {
    struct addrinfo hints {};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    const std::string portStr = std::to_string(port);
    struct addrinfo *res = nullptr;
    const int gai = getaddrinfo(host.c_str(), portStr.c_str(), &hints, &res);
    if (gai != 0) {
        err.set(ErrorKind::Transport,
                std::string("getaddrinfo: ") + gai_strerror(gai), gai);
        return false;
    }

    for (auto rp = res; rp != nullptr; rp = rp->ai_next) {
        const int s = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
        if (s == -1)
            continue;
        int on = 1;
        ::setsockopt(s, SOL_SOCKET, SO_KEEPALIVE, &on, sizeof(on));
#ifdef __APPLE__
        int idle = 60;
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPALIVE, &idle, sizeof(idle));
#elif defined(__linux__)
        int idle = 60, intvl = 10, cnt = 3;
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPIDLE, &idle, sizeof(idle));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPINTVL, &intvl, sizeof(intvl));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPCNT, &cnt, sizeof(cnt));
#endif
        if (::connect(s, rp->ai_addr, rp->ai_addrlen) == 0) {
            sock_.store(s);
            freeaddrinfo(res);
            return true;
        }
        ::close(s);
    }
    freeaddrinfo(res);
    err.set(ErrorKind::Transport, "Could not connect to host/port", errno);
    return false;
}

std::string Libssh2SftpClient::lastSessionMessage() const {
    if (!session_)
        return {};
    char *msg = nullptr;
    int len = 0;
    (void)libssh2_session_last_error(session_, &msg, &len, 0);
    return (msg && len > 0) ? std::string(msg, std::size_t(len))
                            : std::string();
}

void Libssh2SftpClient::setSessionError(SftpError &err,
                                        const std::string &what) const {
    const int rc = session_ ? libssh2_session_last_errno(session_) : 0;
    if (rc == LIBSSH2_ERROR_SFTP_PROTOCOL && sftp_) {
        const unsigned long fx = libssh2_sftp_last_error(sftp_);
        err.set(ErrorKind::Remote, what + ": " + sftpStatusText(fx),
                static_cast<long>(fx));
        return;
    }
    const std::string detail = lastSessionMessage();
    err.set(ErrorKind::Transport,
            detail.empty() ? what : what + ": " + detail, rc);
}

bool Libssh2SftpClient::verifyHostKey(const SessionOptions &opt,
                                      SftpError &err) {
    if (opt.known_hosts_policy == KnownHostsPolicy::Off)
        return true;

    LIBSSH2_KNOWNHOSTS *nh = libssh2_knownhost_init(session_);
    if (!nh) {
        err.set(ErrorKind::Transport, "Could not initialize known_hosts");
        return false;
    }

    std::string khPath;
    if (opt.known_hosts_path.has_value()) {
        khPath = *opt.known_hosts_path;
    } else if (const char *home = std::getenv("HOME")) {
        khPath = std::string(home) + "/.ssh/known_hosts";
    }
    const bool khLoaded =
        !khPath.empty() &&
        libssh2_knownhost_readfile(nh, khPath.c_str(),
                                   LIBSSH2_KNOWNHOST_FILE_OPENSSH) >= 0;
    if (!khLoaded && opt.known_hosts_policy == KnownHostsPolicy::Strict) {
        libssh2_knownhost_free(nh);
        err.set(ErrorKind::Transport,
                "known_hosts missing or unreadable (strict policy)");
        return false;
    }

    std::size_t keylen = 0;
    int keytype = 0;
    const char *hostkey = libssh2_session_hostkey(session_, &keylen, &keytype);
    if (!hostkey || keylen == 0) {
        libssh2_knownhost_free(nh);
        err.set(ErrorKind::Transport, "Could not obtain host key");
        return false;
    }

    const int alg = knownHostKeyMask(keytype);
    struct libssh2_knownhost *host = nullptr;
    int check = libssh2_knownhost_checkp(
        nh, opt.host.c_str(), opt.port, hostkey, keylen,
        LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg,
        &host);
    if (check != LIBSSH2_KNOWNHOST_CHECK_MATCH) {
        check = libssh2_knownhost_checkp(
            nh, opt.host.c_str(), opt.port, hostkey, keylen,
            LIBSSH2_KNOWNHOST_TYPE_SHA1 | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg,
            &host);
    }

    if (check == LIBSSH2_KNOWNHOST_CHECK_MATCH) {
        libssh2_knownhost_free(nh);
        return true;
    }

    if (opt.known_hosts_policy == KnownHostsPolicy::AcceptNew &&
        check == LIBSSH2_KNOWNHOST_CHECK_NOTFOUND) {
        std::string fingerprint;
        const auto *h = reinterpret_cast<const unsigned char *>(
            libssh2_hostkey_hash(session_, LIBSSH2_HOSTKEY_HASH_SHA256));
        if (h) {
            std::ostringstream oss;
            oss << "SHA256:";
            for (int i = 0; i < 32; ++i) {
                char b[4];
                std::snprintf(b, sizeof(b), "%02X", unsigned(h[i]));
                oss << (i ? ":" : "") << b;
            }
            fingerprint = oss.str();
        }
        const bool confirmed =
            opt.hostkey_confirm_cb &&
            opt.hostkey_confirm_cb(opt.host, opt.port,
                                   hostKeyAlgorithmName(keytype), fingerprint);
        if (!confirmed) {
            libssh2_knownhost_free(nh);
            err.set(ErrorKind::Transport,
                    "Unknown host: fingerprint not confirmed");
            return false;
        }
        if (khPath.empty() ||
            libssh2_knownhost_addc(nh, opt.host.c_str(), nullptr, hostkey,
                                   keylen, nullptr, 0,
                                   LIBSSH2_KNOWNHOST_TYPE_PLAIN |
                                       LIBSSH2_KNOWNHOST_KEYENC_RAW | alg,
                                   nullptr) != 0 ||
            libssh2_knownhost_writefile(nh, khPath.c_str(),
                                        LIBSSH2_KNOWNHOST_FILE_OPENSSH) != 0) {
            libssh2_knownhost_free(nh);
            err.set(ErrorKind::Transport,
                    "Could not record host in known_hosts");
            return false;
        }
        libssh2_knownhost_free(nh);
        return true;
    }

    libssh2_knownhost_free(nh);
    if (opt.known_hosts_policy == KnownHostsPolicy::Strict ||
        check == LIBSSH2_KNOWNHOST_CHECK_MISMATCH) {
        err.set(ErrorKind::Transport,
                check == LIBSSH2_KNOWNHOST_CHECK_MISMATCH
                    ? "Host key does not match known_hosts"
                    : "Host not found in known_hosts");
        return false;
    }
    return true;
}

bool Libssh2SftpClient::authWithAgent(const std::string &user) {
    bool authed = false;
    LIBSSH2_AGENT *agent = libssh2_agent_init(session_);
    if (agent && libssh2_agent_connect(agent) == 0 &&
        libssh2_agent_list_identities(agent) == 0) {
        struct libssh2_agent_publickey *identity = nullptr;
        struct libssh2_agent_publickey *prev = nullptr;
        int tries = 0;
        const int kMaxAgentTries = 3;
        while (!authed && tries < kMaxAgentTries &&
               libssh2_agent_get_identity(agent, &identity, prev) == 0) {
            prev = identity;
            ++tries;
            authed = libssh2_agent_userauth(agent, user.c_str(), identity) == 0;
        }
    }
    if (agent) {
        libssh2_agent_disconnect(agent);
        libssh2_agent_free(agent);
    }
    return authed;
}

bool Libssh2SftpClient::authenticate(const SessionOptions &opt,
                                     SftpError &err) {
    // Explicit key first, then password (falling back to keyboard-interactive
    // when offered), then ssh-agent.
    if (opt.private_key_path.has_value()) {
        const char *passphrase = opt.private_key_passphrase
                                     ? opt.private_key_passphrase->c_str()
                                     : nullptr;
        if (libssh2_userauth_publickey_fromfile(
                session_, opt.username.c_str(), nullptr,
                opt.private_key_path->c_str(), passphrase) != 0) {
            setSessionError(err, "Public key authentication failed");
            return false;
        }
        return true;
    }

    std::string authlist;
    auto methods = [&]() -> const std::string & {
        if (authlist.empty()) {
            const char *m = libssh2_userauth_list(
                session_, opt.username.c_str(),
                static_cast<unsigned>(opt.username.size()));
            authlist = m ? std::string(m) : std::string();
        }
        return authlist;
    };

    if (opt.password.has_value()) {
        const int rcPw = libssh2_userauth_password(
            session_, opt.username.c_str(), opt.password->c_str());
        if (rcPw == 0)
            return true;
        if (rcPw == LIBSSH2_ERROR_SOCKET_DISCONNECT ||
            rcPw == LIBSSH2_ERROR_SOCKET_SEND ||
            rcPw == LIBSSH2_ERROR_SOCKET_RECV) {
            err.set(ErrorKind::Transport,
                    "Server closed the connection after password attempt",
                    rcPw);
            return false;
        }
        if (methods().find("keyboard-interactive") != std::string::npos) {
            KbdIntCtx ctx{opt.username.c_str(), opt.password->c_str(),
                          &opt.keyboard_interactive_cb};
            void **abs = libssh2_session_abstract(session_);
            if (abs)
                *abs = &ctx;
            const int rcKbd = libssh2_userauth_keyboard_interactive(
                session_, opt.username.c_str(), kbdintCallback);
            if (abs)
                *abs = nullptr;
            if (rcKbd == 0)
                return true;
        }
    }

    if (methods().find("publickey") != std::string::npos &&
        authWithAgent(opt.username))
        return true;

    const std::string detail = lastSessionMessage();
    err.set(ErrorKind::Transport,
            std::string("Authentication failed") +
                (authlist.empty() ? std::string()
                                  : " (methods: " + authlist + ")") +
                (detail.empty() ? std::string() : ": " + detail));
    return false;
}

bool Libssh2SftpClient::connect(const SessionOptions &opt, SftpError &err) {
    if (connected_) {
        err.set(ErrorKind::Transport, "Already connected");
        return false;
    }
    if (!tcpConnect(opt.host, opt.port, err))
        return false;

    session_ = libssh2_session_init();
    if (!session_) {
        err.set(ErrorKind::Transport, "libssh2_session_init failed");
        disconnect();
        return false;
    }
    libssh2_session_set_blocking(session_, 1);
    libssh2_session_set_timeout(session_, 20000);
    if (libssh2_session_handshake(session_, sock_.load()) != 0) {
        setSessionError(err, "SSH handshake failed");
        disconnect();
        return false;
    }
    libssh2_keepalive_config(session_, 1, 30);

    if (!verifyHostKey(opt, err) || !authenticate(opt, err)) {
        disconnect();
        return false;
    }

    sftp_ = libssh2_sftp_init(session_);
    if (!sftp_) {
        setSessionError(err, "Could not initialize SFTP");
        disconnect();
        return false;
    }
    connected_ = true;
    return true;
}

void Libssh2SftpClient::disconnect() {
    if (sftp_) {
        libssh2_sftp_shutdown(sftp_);
        sftp_ = nullptr;
    }
    if (session_) {
        libssh2_session_disconnect(session_, "bye");
        libssh2_session_free(session_);
        session_ = nullptr;
    }
    const int s = sock_.exchange(-1);
    if (s != -1)
        ::close(s);
    connected_ = false;
}

void Libssh2SftpClient::interrupt() {
    // Shutting the socket down unblocks any pending libssh2 read/write; the
    // descriptor itself is released by disconnect().
    const int s = sock_.load();
    if (s != -1)
        ::shutdown(s, SHUT_RDWR);
}

bool Libssh2SftpClient::requireSftp(SftpError &err) const {
    if (!connected_ || !sftp_) {
        err.set(ErrorKind::Transport, "Not connected");
        return false;
    }
    return true;
}

bool Libssh2SftpClient::list(const std::string &remote_path,
                             std::vector<FileInfo> &out, SftpError &err) {
    if (!requireSftp(err))
        return false;
    const std::string path = remote_path.empty() ? "/" : remote_path;
    LIBSSH2_SFTP_HANDLE *dir = libssh2_sftp_opendir(sftp_, path.c_str());
    if (!dir) {
        setSessionError(err, "opendir " + path);
        return false;
    }

    out.clear();
    char filename[512];
    char longentry[1024];
    while (true) {
        LIBSSH2_SFTP_ATTRIBUTES attrs{};
        const int rc =
            libssh2_sftp_readdir_ex(dir, filename, sizeof(filename), longentry,
                                    sizeof(longentry), &attrs);
        if (rc == 0)
            break;
        if (rc < 0) {
            setSessionError(err, "readdir " + path);
            libssh2_sftp_closedir(dir);
            return false;
        }
        FileInfo fi;
        fi.name.assign(filename, std::size_t(rc));
        if (fi.name == "." || fi.name == "..")
            continue;
        fillInfo(attrs, fi);
        out.push_back(std::move(fi));
    }
    libssh2_sftp_closedir(dir);
    return true;
}

bool Libssh2SftpClient::statWith(const std::string &remote_path,
                                 FileInfo &info, SftpError &err,
                                 bool followLinks) {
    if (!requireSftp(err))
        return false;
    LIBSSH2_SFTP_ATTRIBUTES st{};
    if (libssh2_sftp_stat_ex(sftp_, remote_path.c_str(),
                             static_cast<unsigned>(remote_path.size()),
                             followLinks ? LIBSSH2_SFTP_STAT
                                         : LIBSSH2_SFTP_LSTAT,
                             &st) != 0) {
        setSessionError(err, (followLinks ? "stat " : "lstat ") + remote_path);
        return false;
    }
    info = FileInfo{};
    info.name = remoteBaseName(remote_path);
    fillInfo(st, info);
    return true;
}

bool Libssh2SftpClient::stat(const std::string &remote_path, FileInfo &info,
                             SftpError &err) {
    return statWith(remote_path, info, err, true);
}

bool Libssh2SftpClient::lstat(const std::string &remote_path, FileInfo &info,
                              SftpError &err) {
    return statWith(remote_path, info, err, false);
}

bool Libssh2SftpClient::realpath(const std::string &remote_path,
                                 std::string &out, SftpError &err) {
    if (!requireSftp(err))
        return false;
    const std::string path = remote_path.empty() ? "." : remote_path;
    char buf[4096];
    const int rc = libssh2_sftp_symlink_ex(
        sftp_, path.c_str(), static_cast<unsigned>(path.size()), buf,
        sizeof(buf), LIBSSH2_SFTP_REALPATH);
    if (rc < 0) {
        setSessionError(err, "realpath " + path);
        return false;
    }
    out.assign(buf, std::size_t(rc));
    return true;
}

bool Libssh2SftpClient::get(const std::string &remote,
                            const std::string &local, SftpError &err,
                            ProgressCB progress, CancelCB shouldCancel) {
    if (!requireSftp(err))
        return false;

    LIBSSH2_SFTP_ATTRIBUTES st{};
    if (libssh2_sftp_stat_ex(sftp_, remote.c_str(),
                             static_cast<unsigned>(remote.size()),
                             LIBSSH2_SFTP_STAT, &st) != 0) {
        setSessionError(err, "stat " + remote);
        return false;
    }
    const std::uint64_t total =
        (st.flags & LIBSSH2_SFTP_ATTR_SIZE) ? st.filesize : 0;

    LIBSSH2_SFTP_HANDLE *rh = libssh2_sftp_open_ex(
        sftp_, remote.c_str(), static_cast<unsigned>(remote.size()),
        LIBSSH2_FXF_READ, 0, LIBSSH2_SFTP_OPENFILE);
    if (!rh) {
        setSessionError(err, "open " + remote);
        return false;
    }
    FILE *lf = std::fopen(local.c_str(), "wb");
    if (!lf) {
        setLocalError(err, "Could not open local file for writing");
        libssh2_sftp_close(rh);
        return false;
    }

    std::vector<char> buf(transferChunkSize());
    std::uint64_t done = 0;
    bool ok = true;
    if (progress)
        progress(0, total);
    while (true) {
        if (shouldCancel && shouldCancel()) {
            err.set(ErrorKind::Cancelled, "Cancelled by user");
            ok = false;
            break;
        }
        const ssize_t n = libssh2_sftp_read(rh, buf.data(), buf.size());
        if (n == 0)
            break;
        if (n < 0) {
            setSessionError(err, "read " + remote);
            ok = false;
            break;
        }
        if (std::fwrite(buf.data(), 1, std::size_t(n), lf) != std::size_t(n)) {
            setLocalError(err, "Local write failed");
            ok = false;
            break;
        }
        done += std::uint64_t(n);
        if (progress)
            progress(done, total);
    }
    if (std::fclose(lf) != 0 && ok) {
        setLocalError(err, "Local write failed");
        ok = false;
    }
    libssh2_sftp_close(rh);
    return ok;
}

bool Libssh2SftpClient::put(const std::string &local,
                            const std::string &remote, SftpError &err,
                            ProgressCB progress, CancelCB shouldCancel) {
    if (!requireSftp(err))
        return false;

    FILE *lf = std::fopen(local.c_str(), "rb");
    if (!lf) {
        setLocalError(err, "Could not open local file for reading");
        return false;
    }
    std::fseek(lf, 0, SEEK_END);
    const long fsz = std::ftell(lf);
    std::fseek(lf, 0, SEEK_SET);
    const std::uint64_t total = fsz > 0 ? std::uint64_t(fsz) : 0;

    LIBSSH2_SFTP_HANDLE *wh = libssh2_sftp_open_ex(
        sftp_, remote.c_str(), static_cast<unsigned>(remote.size()),
        LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT | LIBSSH2_FXF_TRUNC, 0644,
        LIBSSH2_SFTP_OPENFILE);
    if (!wh) {
        setSessionError(err, "open " + remote);
        std::fclose(lf);
        return false;
    }

    std::vector<char> buf(transferChunkSize());
    std::uint64_t done = 0;
    bool ok = true;
    if (progress)
        progress(0, total);
    while (ok) {
        if (shouldCancel && shouldCancel()) {
            err.set(ErrorKind::Cancelled, "Cancelled by user");
            ok = false;
            break;
        }
        const std::size_t n = std::fread(buf.data(), 1, buf.size(), lf);
        if (n == 0) {
            if (std::ferror(lf)) {
                setLocalError(err, "Local read failed");
                ok = false;
            }
            break;
        }
        const char *p = buf.data();
        std::size_t remain = n;
        while (remain > 0) {
            const ssize_t w = libssh2_sftp_write(wh, p, remain);
            if (w < 0) {
                setSessionError(err, "write " + remote);
                ok = false;
                break;
            }
            remain -= std::size_t(w);
            p += w;
            done += std::uint64_t(w);
        }
        if (ok && progress)
            progress(done, total);
    }

    libssh2_sftp_close(wh);
    std::fclose(lf);
    return ok;
}

bool Libssh2SftpClient::mkdir(const std::string &remote_dir, SftpError &err,
                              unsigned int mode) {
    if (!requireSftp(err))
        return false;
    if (libssh2_sftp_mkdir(sftp_, remote_dir.c_str(), long(mode)) != 0) {
        setSessionError(err, "mkdir " + remote_dir);
        return false;
    }
    return true;
}

bool Libssh2SftpClient::removeFile(const std::string &remote_path,
                                   SftpError &err) {
    if (!requireSftp(err))
        return false;
    if (libssh2_sftp_unlink(sftp_, remote_path.c_str()) != 0) {
        setSessionError(err, "unlink " + remote_path);
        return false;
    }
    return true;
}

bool Libssh2SftpClient::removeDir(const std::string &remote_dir,
                                  SftpError &err) {
    if (!requireSftp(err))
        return false;
    if (libssh2_sftp_rmdir(sftp_, remote_dir.c_str()) != 0) {
        setSessionError(err, "rmdir " + remote_dir);
        return false;
    }
    return true;
}

bool Libssh2SftpClient::rename(const std::string &from, const std::string &to,
                               SftpError &err, bool overwrite) {
    if (!requireSftp(err))
        return false;
    long flags = LIBSSH2_SFTP_RENAME_ATOMIC | LIBSSH2_SFTP_RENAME_NATIVE;
    if (overwrite)
        flags |= LIBSSH2_SFTP_RENAME_OVERWRITE;
    if (libssh2_sftp_rename_ex(sftp_, from.c_str(),
                               static_cast<unsigned>(from.size()), to.c_str(),
                               static_cast<unsigned>(to.size()), flags) != 0) {
        setSessionError(err, "rename " + from);
        return false;
    }
    return true;
}

} // namespace twinpane
