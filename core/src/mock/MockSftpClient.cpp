#include "twinpane/MockSftpClient.hpp"
#include "twinpane/RemotePath.hpp"
#include <algorithm>
#include <fstream>
#include <iterator>
#include <thread>

namespace twinpane {

namespace {

constexpr int kMaxLinkHops = 8;

std::string filler(std::size_t n) {
    std::string s(n, '\0');
    for (std::size_t i = 0; i < n; ++i)
        s[i] = static_cast<char>('a' + (i % 26));
    return s;
}

} // namespace

// Tracks overlapping calls so tests can prove the session is serialized.
class MockSftpClient::CallScope {
public:
    explicit CallScope(MockSftpClient &c) : c_(c) {
        const int now = c_.inFlight_.fetch_add(1) + 1;
        int prev = c_.maxInFlight_.load();
        while (now > prev && !c_.maxInFlight_.compare_exchange_weak(prev, now)) {
        }
        c_.calls_.fetch_add(1);
        if (c_.delay_.count() > 0)
            std::this_thread::sleep_for(c_.delay_);
    }
    ~CallScope() { c_.inFlight_.fetch_sub(1); }

private:
    MockSftpClient &c_;
};

MockSftpClient::MockSftpClient() {
    addDirectory("/");
    addDirectory("/home");
    addDirectory("/var");
    addFile("/readme.txt", filler(1280));
    addDirectory("/home/alice");
    addDirectory("/home/guest");
    addFile("/home/notes.md", filler(2048));
    addDirectory("/home/alice/projects");
    addFile("/home/alice/photo.jpg", filler(34567));
    addDirectory("/var/log");
}

bool MockSftpClient::connect(const SessionOptions &opt, SftpError &err) {
    if (opt.host.empty() || opt.username.empty()) {
        err.set(ErrorKind::Transport, "Host and user are required");
        return false;
    }
    lastOpt_ = opt;
    interrupted_.store(false);
    connected_.store(true);
    return true;
}

void MockSftpClient::disconnect() { connected_.store(false); }

bool MockSftpClient::checkInterrupted(SftpError &err) {
    if (!interrupted_.exchange(false))
        return false;
    connected_.store(false);
    err.set(ErrorKind::Transport, "Session interrupted");
    return true;
}

bool MockSftpClient::beginCall(SftpError &err) {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (scripted_) {
            err = *scripted_;
            scripted_.reset();
            return false;
        }
    }
    if (checkInterrupted(err))
        return false;
    if (!connected_.load()) {
        err.set(ErrorKind::Transport, "Not connected");
        return false;
    }
    return true;
}

FileInfo MockSftpClient::toInfo(const std::string &name, const Node &n) {
    FileInfo fi;
    fi.name = name;
    fi.is_dir = n.is_dir;
    fi.is_symlink = !n.link.empty();
    fi.size = n.is_dir ? 0 : (fi.is_symlink ? n.link.size() : n.data.size());
    fi.mtime = n.mtime;
    fi.mode = n.mode;
    return fi;
}

std::string MockSftpClient::resolveLocked(const std::string &path,
                                          bool followLast) const {
    const std::string norm = normalizeRemotePath(path);
    if (norm.front() != '/' || norm == "/")
        return norm;
    std::vector<std::string> parts;
    std::size_t start = 1;
    while (start <= norm.size()) {
        const std::size_t slash = norm.find('/', start);
        const std::size_t end = slash == std::string::npos ? norm.size() : slash;
        if (end > start)
            parts.push_back(norm.substr(start, end - start));
        start = end + 1;
    }
    std::string cur = "/";
    int hops = 0;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        std::string next = joinRemotePath(cur, parts[i]);
        const bool follow = followLast || i + 1 < parts.size();
        auto it = fs_.find(next);
        while (follow && it != fs_.end() && !it->second.link.empty() &&
               hops++ < kMaxLinkHops) {
            const std::string &target = it->second.link;
            next = normalizeRemotePath(
                target.front() == '/'
                    ? target
                    : joinRemotePath(remoteParentPath(next), target));
            it = fs_.find(next);
        }
        cur = next;
    }
    return cur;
}

bool MockSftpClient::list(const std::string &remote_path,
                          std::vector<FileInfo> &out, SftpError &err) {
    CallScope scope(*this);
    if (!beginCall(err))
        return false;
    std::lock_guard<std::mutex> lk(mtx_);
    const std::string path = resolveLocked(remote_path, true);
    auto it = fs_.find(path);
    if (it == fs_.end()) {
        err.set(ErrorKind::Remote, "No such file: " + path,
                sftp_status::kNoSuchFile);
        return false;
    }
    if (!it->second.is_dir) {
        err.set(ErrorKind::Remote, "Not a directory: " + path,
                sftp_status::kNotADirectory);
        return false;
    }
    out.clear();
    for (const auto &kv : fs_) {
        if (kv.first == path || remoteParentPath(kv.first) != path)
            continue;
        out.push_back(toInfo(remoteBaseName(kv.first), kv.second));
    }
    std::sort(out.begin(), out.end(), [](const FileInfo &a, const FileInfo &b) {
        if (a.is_dir != b.is_dir)
            return a.is_dir > b.is_dir; // directories first
        return a.name < b.name;
    });
    return true;
}

bool MockSftpClient::stat(const std::string &remote_path, FileInfo &info,
                          SftpError &err) {
    return statImpl(remote_path, info, err, true);
}

bool MockSftpClient::lstat(const std::string &remote_path, FileInfo &info,
                           SftpError &err) {
    return statImpl(remote_path, info, err, false);
}

bool MockSftpClient::statImpl(const std::string &remote_path, FileInfo &info,
                              SftpError &err, bool followLast) {
    CallScope scope(*this);
    if (!beginCall(err))
        return false;
    std::lock_guard<std::mutex> lk(mtx_);
    const std::string path = resolveLocked(remote_path, followLast);
    auto it = fs_.find(path);
    if (it == fs_.end()) {
        err.set(ErrorKind::Remote, "No such file: " + path,
                sftp_status::kNoSuchFile);
        return false;
    }
    // Too many levels of links.
    if (followLast && !it->second.link.empty()) {
        err.set(ErrorKind::Remote, "No such file: " + it->second.link,
                sftp_status::kNoSuchFile);
        return false;
    }
    info = toInfo(remoteBaseName(remote_path), it->second);
    return true;
}

bool MockSftpClient::realpath(const std::string &remote_path, std::string &out,
                              SftpError &err) {
    CallScope scope(*this);
    if (!beginCall(err))
        return false;
    std::string path = remote_path;
    if (path.empty() || path == ".")
        path = homeDir_;
    else if (path.front() != '/')
        path = joinRemotePath(homeDir_, path);
    std::lock_guard<std::mutex> lk(mtx_);
    path = resolveLocked(path, true);
    if (fs_.find(path) == fs_.end()) {
        err.set(ErrorKind::Remote, "No such file: " + path,
                sftp_status::kNoSuchFile);
        return false;
    }
    out = path;
    return true;
}

std::vector<std::uint64_t>
MockSftpClient::checkpointsFor(std::uint64_t total) const {
    std::vector<std::uint64_t> cps;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        for (std::uint64_t cp : plan_) {
            if (cp <= total && (cps.empty() || cp > cps.back()))
                cps.push_back(cp);
        }
    }
    if (cps.empty()) {
        cps.push_back(0);
        const std::uint64_t chunk = transferChunkSize();
        for (std::uint64_t off = chunk; off < total; off += chunk)
            cps.push_back(off);
    }
    if (cps.back() != total)
        cps.push_back(total);
    return cps;
}

bool MockSftpClient::get(const std::string &remote, const std::string &local,
                         SftpError &err, ProgressCB progress,
                         CancelCB shouldCancel) {
    CallScope scope(*this);
    if (!beginCall(err))
        return false;
    const std::string path = normalizeRemotePath(remote);
    std::string content;
    CheckpointHook hook;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        auto it = fs_.find(resolveLocked(path, true));
        if (it == fs_.end()) {
            err.set(ErrorKind::Remote, "No such file: " + path,
                    sftp_status::kNoSuchFile);
            return false;
        }
        if (it->second.is_dir || !it->second.link.empty()) {
            err.set(ErrorKind::Remote, "Is a directory: " + path,
                    sftp_status::kFailure);
            return false;
        }
        content = it->second.data;
        hook = hook_;
    }

    std::ofstream out(local, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        err.set(ErrorKind::LocalIO, "Could not open local file for writing");
        return false;
    }

    const std::uint64_t total = content.size();
    std::uint64_t written = 0;
    for (std::uint64_t cp : checkpointsFor(total)) {
        if (cp > written) {
            if (shouldCancel && shouldCancel()) {
                err.set(ErrorKind::Cancelled, "Cancelled by user");
                return false;
            }
            if (checkInterrupted(err))
                return false;
            out.write(content.data() + written,
                      static_cast<std::streamsize>(cp - written));
            out.flush();
            if (!out) {
                err.set(ErrorKind::LocalIO, "Local write failed");
                return false;
            }
            written = cp;
        }
        if (progress)
            progress(written, total);
        if (hook)
            hook(path, written);
    }
    return true;
}

bool MockSftpClient::put(const std::string &local, const std::string &remote,
                         SftpError &err, ProgressCB progress,
                         CancelCB shouldCancel) {
    CallScope scope(*this);
    if (!beginCall(err))
        return false;
    std::ifstream in(local, std::ios::binary);
    if (!in.is_open()) {
        err.set(ErrorKind::LocalIO, "Could not open local file for reading");
        return false;
    }
    const std::string content((std::istreambuf_iterator<char>(in)),
                              std::istreambuf_iterator<char>());
    if (in.bad()) {
        err.set(ErrorKind::LocalIO, "Local read failed");
        return false;
    }

    std::string path;
    CheckpointHook hook;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        path = resolveLocked(remote, true);
        auto parent = fs_.find(remoteParentPath(path));
        if (parent == fs_.end() || !parent->second.is_dir) {
            err.set(ErrorKind::Remote,
                    "No such directory: " + remoteParentPath(path),
                    sftp_status::kNoSuchFile);
            return false;
        }
        auto existing = fs_.find(path);
        if (existing != fs_.end() && existing->second.is_dir) {
            err.set(ErrorKind::Remote, "Is a directory: " + path,
                    sftp_status::kFailure);
            return false;
        }
        Node n;
        n.mode = 0100644;
        fs_[path] = n;
        hook = hook_;
    }

    const std::uint64_t total = content.size();
    std::uint64_t written = 0;
    for (std::uint64_t cp : checkpointsFor(total)) {
        if (cp > written) {
            if (shouldCancel && shouldCancel()) {
                err.set(ErrorKind::Cancelled, "Cancelled by user");
                return false;
            }
            if (checkInterrupted(err))
                return false;
            {
                std::lock_guard<std::mutex> lk(mtx_);
                fs_[path].data.append(content, written, cp - written);
            }
            written = cp;
        }
        if (progress)
            progress(written, total);
        if (hook)
            hook(path, written);
    }
    return true;
}

bool MockSftpClient::mkdir(const std::string &remote_dir, SftpError &err,
                           unsigned int mode) {
    CallScope scope(*this);
    if (!beginCall(err))
        return false;
    std::lock_guard<std::mutex> lk(mtx_);
    const std::string path = resolveLocked(remote_dir, false);
    if (fs_.count(path)) {
        err.set(ErrorKind::Remote, "File exists: " + path,
                sftp_status::kFileAlreadyExists);
        return false;
    }
    auto parent = fs_.find(remoteParentPath(path));
    if (parent == fs_.end() || !parent->second.is_dir) {
        err.set(ErrorKind::Remote, "No such directory: " + remoteParentPath(path),
                sftp_status::kNoSuchFile);
        return false;
    }
    Node n;
    n.is_dir = true;
    n.mode = 040000 | (mode & 07777);
    fs_[path] = n;
    return true;
}

bool MockSftpClient::removeFile(const std::string &remote_path,
                                SftpError &err) {
    CallScope scope(*this);
    if (!beginCall(err))
        return false;
    std::lock_guard<std::mutex> lk(mtx_);
    const std::string path = resolveLocked(remote_path, false);
    auto it = fs_.find(path);
    if (it == fs_.end()) {
        err.set(ErrorKind::Remote, "No such file: " + path,
                sftp_status::kNoSuchFile);
        return false;
    }
    if (it->second.is_dir) {
        err.set(ErrorKind::Remote, "Is a directory: " + path,
                sftp_status::kFailure);
        return false;
    }
    fs_.erase(it);
    return true;
}

bool MockSftpClient::removeDir(const std::string &remote_dir, SftpError &err) {
    CallScope scope(*this);
    if (!beginCall(err))
        return false;
    std::lock_guard<std::mutex> lk(mtx_);
    const std::string path = resolveLocked(remote_dir, false);
    auto it = fs_.find(path);
    if (it == fs_.end() || !it->second.is_dir) {
        err.set(ErrorKind::Remote, "No such directory: " + path,
                sftp_status::kNoSuchFile);
        return false;
    }
    for (const auto &kv : fs_) {
        if (kv.first != path && remoteParentPath(kv.first) == path) {
            err.set(ErrorKind::Remote, "Directory not empty: " + path,
                    sftp_status::kDirNotEmpty);
            return false;
        }
    }
    fs_.erase(it);
    return true;
}

bool MockSftpClient::rename(const std::string &from, const std::string &to,
                            SftpError &err, bool overwrite) {
    CallScope scope(*this);
    if (!beginCall(err))
        return false;
    std::lock_guard<std::mutex> lk(mtx_);
    const std::string src = resolveLocked(from, false);
    const std::string dst = resolveLocked(to, false);
    if (!fs_.count(src)) {
        err.set(ErrorKind::Remote, "No such file: " + src,
                sftp_status::kNoSuchFile);
        return false;
    }
    auto parent = fs_.find(remoteParentPath(dst));
    if (parent == fs_.end() || !parent->second.is_dir) {
        err.set(ErrorKind::Remote, "No such directory: " + remoteParentPath(dst),
                sftp_status::kNoSuchFile);
        return false;
    }
    if (fs_.count(dst) && !overwrite) {
        err.set(ErrorKind::Remote, "File exists: " + dst,
                sftp_status::kFileAlreadyExists);
        return false;
    }
    std::map<std::string, Node> moved;
    const std::string prefix = src + "/";
    for (auto it = fs_.begin(); it != fs_.end();) {
        if (it->first == src) {
            moved[dst] = it->second;
            it = fs_.erase(it);
        } else if (it->first.rfind(prefix, 0) == 0) {
            moved[dst + it->first.substr(src.size())] = it->second;
            it = fs_.erase(it);
        } else {
            ++it;
        }
    }
    for (auto &kv : moved)
        fs_[kv.first] = std::move(kv.second);
    return true;
}

void MockSftpClient::addDirectory(const std::string &path, std::uint32_t mode) {
    Node n;
    n.is_dir = true;
    n.mode = mode;
    std::lock_guard<std::mutex> lk(mtx_);
    fs_[normalizeRemotePath(path)] = n;
}

void MockSftpClient::addFile(const std::string &path,
                             const std::string &content, std::uint64_t mtime) {
    Node n;
    n.data = content;
    n.mode = 0100644;
    n.mtime = mtime;
    std::lock_guard<std::mutex> lk(mtx_);
    fs_[normalizeRemotePath(path)] = n;
}

void MockSftpClient::addSymlink(const std::string &path,
                                const std::string &target) {
    Node n;
    n.mode = 0120777;
    n.link = target;
    std::lock_guard<std::mutex> lk(mtx_);
    fs_[normalizeRemotePath(path)] = n;
}

bool MockSftpClient::hasPath(const std::string &path) const {
    std::lock_guard<std::mutex> lk(mtx_);
    return fs_.count(normalizeRemotePath(path)) > 0;
}

std::string MockSftpClient::fileContent(const std::string &path) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = fs_.find(normalizeRemotePath(path));
    return it == fs_.end() ? std::string() : it->second.data;
}

void MockSftpClient::setCheckpointPlan(std::vector<std::uint64_t> plan) {
    std::lock_guard<std::mutex> lk(mtx_);
    plan_ = std::move(plan);
}

void MockSftpClient::setCheckpointHook(CheckpointHook hook) {
    std::lock_guard<std::mutex> lk(mtx_);
    hook_ = std::move(hook);
}

void MockSftpClient::failNext(ErrorKind kind, const std::string &message,
                              long code) {
    SftpError e;
    e.set(kind, message, code);
    std::lock_guard<std::mutex> lk(mtx_);
    scripted_ = e;
}

} // namespace twinpane
