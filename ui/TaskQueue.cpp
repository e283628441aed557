#include "TaskQueue.hpp"
#include "ProgressBridge.hpp"
#include "twinpane/RemotePath.hpp"
#include "twinpane/RuntimeLogging.hpp"
#include "twinpane/SftpClient.hpp"
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QLoggingCategory>
#include <algorithm>
#include <chrono>
#include <exception>
#include <stdexcept>
#include <utility>
Q_LOGGING_CATEGORY(tpQueue, "twinpane.queue")

namespace {

constexpr std::chrono::milliseconds kSessionLockPoll{20};

OperationOutcome succeeded(OperationPayload payload = {}) {
    OperationOutcome o;
    o.state = OperationState::Succeeded;
    o.payload = std::move(payload);
    return o;
}

OperationOutcome failed(twinpane::SftpError err) {
    OperationOutcome o;
    o.state = OperationState::Failed;
    if (!err.isSet())
        err.set(twinpane::ErrorKind::Internal, "Operation failed");
    o.error = std::move(err);
    return o;
}

OperationOutcome cancelled() {
    OperationOutcome o;
    o.state = OperationState::Cancelled;
    return o;
}

OperationOutcome fromError(twinpane::SftpError err) {
    if (err.kind == twinpane::ErrorKind::Cancelled)
        return cancelled();
    return failed(std::move(err));
}

// One file of a directory transfer.
struct TreeFile {
    std::string remote;
    QString local;
    std::uint64_t size = 0;
    std::uint64_t mtime = 0; // remote mtime, downloads only
};

// Runs one request against the session. Invoked on a worker with the
// session lock held.
class RequestRunner {
public:
    RequestRunner(twinpane::SftpClient &session, const OperationHandle &handle,
                  twinpane::SftpClient::ProgressCB progress, bool expandHome,
                  std::string &sessionUser)
        : session_(session), handle_(handle), progress_(std::move(progress)),
          expandHome_(expandHome), sessionUser_(sessionUser) {
        shouldCancel_ = [this] { return handle_.cancelRequested(); };
    }

    OperationOutcome operator()(const ListRequest &r) {
        twinpane::SftpError err;
        DirectoryListing listing;
        if (!resolve(r.path, listing.path, err))
            return failed(err);
        if (!session_.list(listing.path, listing.entries, err))
            return failed(err);
        if (r.countItems) {
            for (auto &e : listing.entries) {
                if (!e.is_dir)
                    continue;
                if (handle_.cancelRequested())
                    return cancelled();
                std::vector<twinpane::FileInfo> children;
                twinpane::SftpError childErr;
                if (session_.list(twinpane::joinRemotePath(listing.path, e.name),
                                  children, childErr)) {
                    e.item_count = static_cast<std::uint32_t>(children.size());
                } else if (childErr.kind == twinpane::ErrorKind::Transport) {
                    return failed(childErr);
                }
                // Unreadable subdirectory: leave the count empty.
            }
        }
        return succeeded(std::move(listing));
    }

    OperationOutcome operator()(const StatRequest &r) {
        twinpane::SftpError err;
        std::string path;
        if (!resolve(r.path, path, err))
            return failed(err);
        twinpane::FileInfo info;
        if (!session_.stat(path, info, err))
            return failed(err);
        return succeeded(info);
    }

    OperationOutcome operator()(const DownloadRequest &r) {
        if (r.recursive)
            return downloadTree(r);
        twinpane::SftpError err;
        const QString local = QString::fromStdString(r.local);
        const QString parent = QFileInfo(local).absolutePath();
        if (!QDir().mkpath(parent)) {
            err.set(twinpane::ErrorKind::LocalIO,
                    "Could not create local directory");
            return failed(err);
        }
        if (!session_.get(r.remote, r.local, err, progress_, shouldCancel_))
            return fromError(err);
        applyRemoteMtime(r.remote, local);
        return succeeded(r.local);
    }

    OperationOutcome operator()(const UploadRequest &r) {
        if (r.recursive)
            return uploadTree(r);
        twinpane::SftpError err;
        if (!session_.put(r.local, r.remote, err, progress_, shouldCancel_))
            return fromError(err);
        return succeeded(r.remote);
    }

    OperationOutcome operator()(const DeleteRequest &r) {
        twinpane::SftpError err;
        twinpane::FileInfo info;
        // lstat: a link is removed itself, never the tree it points to.
        if (!session_.lstat(r.path, info, err))
            return failed(err);
        bool ok = false;
        if (!info.is_dir || info.is_symlink)
            ok = session_.removeFile(r.path, err);
        else if (r.recursive)
            ok = removeTree(r.path, err);
        else
            ok = session_.removeDir(r.path, err);
        if (!ok)
            return fromError(err);
        return succeeded();
    }

    OperationOutcome operator()(const RenameRequest &r) {
        twinpane::SftpError err;
        if (!session_.rename(r.from, r.to, err, r.overwrite))
            return failed(err);
        return succeeded(r.to);
    }

    OperationOutcome operator()(const MkdirRequest &r) {
        twinpane::SftpError err;
        if (!session_.mkdir(r.path, err, r.mode))
            return failed(err);
        return succeeded(r.path);
    }

    OperationOutcome operator()(const ConnectRequest &r) {
        twinpane::SftpError err;
        if (!session_.connect(r.options, err))
            return failed(err);
        sessionUser_ = r.options.username;
        return succeeded();
    }

private:
    // "~" and "~/x" become absolute using the session's login directory,
    // or the usual home locations of the user when the server cannot tell.
    bool resolve(const std::string &path, std::string &out,
                 twinpane::SftpError &err) {
        if (!expandHome_ || !twinpane::isHomeRelative(path)) {
            out = path;
            return true;
        }
        std::string home;
        twinpane::SftpError rpErr;
        if (!session_.realpath(".", home, rpErr)) {
            if (rpErr.kind == twinpane::ErrorKind::Transport) {
                err = rpErr;
                return false;
            }
            if (sessionUser_.empty()) {
                err.set(twinpane::ErrorKind::Remote,
                        "Could not resolve the home directory",
                        twinpane::sftp_status::kNoSuchFile);
                return false;
            }
            if (!findHomeDirectory(home, err))
                return false;
        }
        out = twinpane::expandHomePath(path, home);
        return true;
    }

    // Linux, macOS and Solaris layouts; /home/<user> when none exists.
    bool findHomeDirectory(std::string &home, twinpane::SftpError &err) {
        static const char *const kHomePrefixes[] = {"/home/", "/Users/",
                                                     "/export/home/"};
        for (const char *prefix : kHomePrefixes) {
            const std::string candidate = prefix + sessionUser_;
            twinpane::FileInfo st;
            twinpane::SftpError stErr;
            if (session_.stat(candidate, st, stErr) && st.is_dir) {
                home = candidate;
                return true;
            }
            if (stErr.kind == twinpane::ErrorKind::Transport) {
                err = stErr;
                return false;
            }
        }
        home = "/home/" + sessionUser_;
        return true;
    }

    // Depth first; cancellation is observed before each entry.
    bool removeTree(const std::string &dir, twinpane::SftpError &err) {
        std::vector<twinpane::FileInfo> entries;
        if (!session_.list(dir, entries, err))
            return false;
        for (const auto &e : entries) {
            if (handle_.cancelRequested()) {
                err.set(twinpane::ErrorKind::Cancelled, "Cancelled by user");
                return false;
            }
            const std::string child = twinpane::joinRemotePath(dir, e.name);
            const bool ok = e.is_dir && !e.is_symlink
                                ? removeTree(child, err)
                                : session_.removeFile(child, err);
            if (!ok)
                return false;
        }
        if (handle_.cancelRequested()) {
            err.set(twinpane::ErrorKind::Cancelled, "Cancelled by user");
            return false;
        }
        return session_.removeDir(dir, err);
    }

    bool cancelledBetweenEntries(twinpane::SftpError &err) const {
        if (!handle_.cancelRequested())
            return false;
        err.set(twinpane::ErrorKind::Cancelled, "Cancelled by user");
        return true;
    }

    // Files of a directory come before its subdirectories. Symlinks are
    // skipped so a link cannot pull an unrelated tree into the transfer.
    bool collectRemoteTree(const std::string &remoteDir, const QString &localDir,
                           std::vector<TreeFile> &files,
                           twinpane::SftpError &err) {
        if (!QDir().mkpath(localDir)) {
            err.set(twinpane::ErrorKind::LocalIO,
                    "Could not create local directory");
            return false;
        }
        std::vector<twinpane::FileInfo> entries;
        if (!session_.list(remoteDir, entries, err))
            return false;
        std::vector<std::pair<std::string, QString>> subdirs;
        for (const auto &e : entries) {
            if (cancelledBetweenEntries(err))
                return false;
            const std::string child = twinpane::joinRemotePath(remoteDir, e.name);
            const QString localChild =
                QDir(localDir).filePath(QString::fromStdString(e.name));
            if (e.is_symlink) {
                qCDebug(tpQueue) << "skipping symlink"
                                 << QString::fromStdString(
                                        twinpane::loggablePath(child));
                continue;
            }
            if (e.is_dir)
                subdirs.emplace_back(child, localChild);
            else
                files.push_back({child, localChild, e.size, e.mtime});
        }
        for (const auto &sub : subdirs) {
            if (!collectRemoteTree(sub.first, sub.second, files, err))
                return false;
        }
        return true;
    }

    bool collectLocalTree(const QString &localDir, const std::string &remoteDir,
                          std::vector<TreeFile> &files,
                          twinpane::SftpError &err) {
        if (!ensureRemoteDir(remoteDir, err))
            return false;
        const QFileInfoList entries = QDir(localDir).entryInfoList(
            QDir::AllEntries | QDir::NoDotAndDotDot | QDir::Hidden |
                QDir::System,
            QDir::Name);
        std::vector<std::pair<QString, std::string>> subdirs;
        for (const QFileInfo &fi : entries) {
            if (cancelledBetweenEntries(err))
                return false;
            const std::string child =
                twinpane::joinRemotePath(remoteDir, fi.fileName().toStdString());
            if (fi.isSymLink()) {
                qCDebug(tpQueue) << "skipping symlink"
                                 << QString::fromStdString(twinpane::loggablePath(
                                        fi.absoluteFilePath().toStdString()));
                continue;
            }
            if (fi.isDir())
                subdirs.emplace_back(fi.absoluteFilePath(), child);
            else
                files.push_back({child, fi.absoluteFilePath(),
                                 static_cast<std::uint64_t>(fi.size()), 0});
        }
        for (const auto &sub : subdirs) {
            if (!collectLocalTree(sub.first, sub.second, files, err))
                return false;
        }
        return true;
    }

    // An existing directory is fine; anything else at that path is not.
    bool ensureRemoteDir(const std::string &dir, twinpane::SftpError &err) {
        if (session_.mkdir(dir, err))
            return true;
        if (err.kind != twinpane::ErrorKind::Remote)
            return false;
        twinpane::FileInfo st;
        twinpane::SftpError stErr;
        if (session_.stat(dir, st, stErr) && st.is_dir) {
            err.clear();
            return true;
        }
        return false;
    }

    // Reports bytes across the whole tree rather than per file.
    twinpane::SftpClient::ProgressCB treeProgress(std::uint64_t base,
                                                  std::uint64_t total,
                                                  std::uint64_t &fileDone) {
        return [this, base, total, &fileDone](std::uint64_t done,
                                              std::uint64_t) {
            fileDone = done;
            const std::uint64_t sum = base + done;
            progress_(sum, std::max(total, sum));
        };
    }

    static std::uint64_t treeSize(const std::vector<TreeFile> &files) {
        std::uint64_t total = 0;
        for (const auto &f : files)
            total += f.size;
        return total;
    }

    OperationOutcome downloadTree(const DownloadRequest &r) {
        twinpane::SftpError err;
        std::vector<TreeFile> files;
        if (!collectRemoteTree(r.remote, QString::fromStdString(r.local), files,
                               err))
            return fromError(err);
        const std::uint64_t total = treeSize(files);
        std::uint64_t base = 0;
        for (const auto &f : files) {
            if (cancelledBetweenEntries(err))
                return cancelled();
            std::uint64_t fileDone = 0;
            if (!session_.get(f.remote, f.local.toStdString(), err,
                              treeProgress(base, total, fileDone),
                              shouldCancel_))
                return fromError(err);
            setLocalMtime(f.local, f.mtime);
            base += fileDone;
        }
        qCDebug(tpQueue) << "downloaded tree" << "files=" << files.size()
                         << "bytes=" << base;
        return succeeded(r.local);
    }

    OperationOutcome uploadTree(const UploadRequest &r) {
        twinpane::SftpError err;
        const QString root = QString::fromStdString(r.local);
        if (!QFileInfo(root).isDir()) {
            err.set(twinpane::ErrorKind::LocalIO, "Not a local directory");
            return failed(err);
        }
        std::vector<TreeFile> files;
        if (!collectLocalTree(root, r.remote, files, err))
            return fromError(err);
        const std::uint64_t total = treeSize(files);
        std::uint64_t base = 0;
        for (const auto &f : files) {
            if (cancelledBetweenEntries(err))
                return cancelled();
            std::uint64_t fileDone = 0;
            if (!session_.put(f.local.toStdString(), f.remote, err,
                              treeProgress(base, total, fileDone),
                              shouldCancel_))
                return fromError(err);
            base += fileDone;
        }
        qCDebug(tpQueue) << "uploaded tree" << "files=" << files.size()
                         << "bytes=" << base;
        return succeeded(r.remote);
    }

    void applyRemoteMtime(const std::string &remote, const QString &local) {
        twinpane::FileInfo st;
        twinpane::SftpError err;
        if (session_.stat(remote, st, err))
            setLocalMtime(local, st.mtime);
    }

    void setLocalMtime(const QString &local, std::uint64_t mtime) {
        if (mtime == 0)
            return;
        QFile f(local);
        const QDateTime ts =
            QDateTime::fromSecsSinceEpoch(static_cast<qint64>(mtime));
        if (!f.open(QIODevice::ReadWrite) ||
            !f.setFileTime(ts, QFileDevice::FileModificationTime)) {
            qCWarning(tpQueue) << "could not set local mtime"
                               << QString::fromStdString(
                                      twinpane::loggablePath(local.toStdString()));
        }
    }

    twinpane::SftpClient &session_;
    const OperationHandle &handle_;
    twinpane::SftpClient::ProgressCB progress_;
    twinpane::SftpClient::CancelCB shouldCancel_;
    bool expandHome_;
    std::string &sessionUser_;
};

} // namespace

TaskQueue::TaskQueue(std::unique_ptr<twinpane::SftpClient> session,
                     ProgressBridge &bridge, TaskQueueOptions options)
    : session_(std::move(session)), bridge_(bridge),
      options_(std::move(options)) {
    if (!session_)
        throw std::invalid_argument("TaskQueue requires a session");
    if (options_.workerThreads < 1)
        options_.workerThreads = 1;
    sessionUser_ = options_.homeUser;
    workers_.reserve(static_cast<std::size_t>(options_.workerThreads));
    for (int i = 0; i < options_.workerThreads; ++i)
        workers_.emplace_back([this] { workerLoop(); });
    qCInfo(tpQueue) << "started" << "workers=" << options_.workerThreads;
}

TaskQueue::~TaskQueue() { shutdown(); }

OperationHandlePtr TaskQueue::submit(OperationRequest request) {
    OperationHandlePtr h;
    bool rejected = false;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        h = std::make_shared<OperationHandle>(nextId_++, std::move(request));
        rejected = stopping_;
        if (!rejected)
            queue_.push_back(h);
    }
    qCInfo(tpQueue) << "submit" << "id=" << h->id()
                    << QString::fromStdString(describeRequest(h->request()));
    if (rejected) {
        qCWarning(tpQueue) << "queue stopped; cancelling" << "id=" << h->id();
        finishAndPost(h, cancelled());
        return h;
    }
    cv_.notify_one();
    return h;
}

bool TaskQueue::isStopping() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return stopping_;
}

std::size_t TaskQueue::queuedCount() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return queue_.size();
}

void TaskQueue::workerLoop() {
    for (;;) {
        OperationHandlePtr h;
        {
            std::unique_lock<std::mutex> lk(mtx_);
            cv_.wait(lk, [this] { return stopping_ || !queue_.empty(); });
            if (stopping_)
                return;
            h = queue_.front();
            queue_.pop_front();
            active_.insert(h);
        }
        execute(h);
        std::lock_guard<std::mutex> lk(mtx_);
        active_.erase(h);
    }
}

void TaskQueue::skipCancelled(const OperationHandlePtr &h) {
    qCInfo(tpQueue) << "skipping cancelled operation" << "id=" << h->id();
    finishAndPost(h, cancelled());
}

void TaskQueue::execute(const OperationHandlePtr &h) {
    if (h->cancelRequested()) {
        skipCancelled(h);
        return;
    }
    // Another worker may hold the session for a long transfer; a cancel
    // arriving meanwhile is honoured without waiting for it.
    std::unique_lock<std::timed_mutex> sessionLock(sessionMutex_,
                                                   std::defer_lock);
    while (!sessionLock.try_lock_for(kSessionLockPoll)) {
        if (h->cancelRequested()) {
            skipCancelled(h);
            return;
        }
    }
    if (h->cancelRequested()) {
        sessionLock.unlock();
        skipCancelled(h);
        return;
    }
    if (!h->claim()) {
        qFatal("TaskQueue: operation %llu claimed twice",
               static_cast<unsigned long long>(h->id()));
    }
    qCInfo(tpQueue) << "running" << "id=" << h->id()
                    << "kind=" << operationKindName(h->kind());

    std::uint64_t lastPosted = 0;
    RequestRunner runner(
        *session_, *h,
        [this, h, &lastPosted](std::uint64_t done, std::uint64_t total) {
            postProgress(h, done, total, lastPosted);
        },
        options_.expandHome, sessionUser_);

    OperationOutcome outcome;
    try {
        outcome = std::visit(runner, h->request());
    } catch (const std::exception &ex) {
        twinpane::SftpError err;
        err.set(twinpane::ErrorKind::Internal, ex.what());
        outcome = failed(err);
    }
    sessionLock.unlock();

    // Once the flag is raised the only permitted transition is Cancelled,
    // even when the call itself got to the end.
    if (h->cancelRequested() && outcome.state != OperationState::Cancelled)
        outcome = cancelled();
    if (outcome.state == OperationState::Cancelled && isTransferKind(h->kind())) {
        PartialTransfer partial;
        partial.bytesWritten = h->progress().bytesDone;
        // The last progress the UI sees must match the partial byte count,
        // including a final checkpoint that was held back.
        if (partial.bytesWritten > lastPosted)
            postProgressEvent(h);
        partial.path = transferDestination(h->request());
        outcome.partial = partial;
    }
    finishAndPost(h, std::move(outcome));
}

void TaskQueue::postProgress(const OperationHandlePtr &h, std::uint64_t done,
                             std::uint64_t total, std::uint64_t &lastPosted) {
    h->recordProgress(done, total);
    // The starting and final checkpoints are not reported on their own: the
    // final one travels with the terminal event. Repeats are dropped.
    if (done <= lastPosted || (total > 0 && done >= total))
        return;
    lastPosted = done;
    postProgressEvent(h);
}

void TaskQueue::postProgressEvent(const OperationHandlePtr &h) {
    ProgressEvent ev;
    ev.id = h->id();
    ev.sequence = h->nextSequence();
    ev.type = ProgressEvent::Type::Progress;
    ev.progress = h->progress();
    bridge_.post(std::move(ev));
}

void TaskQueue::finishAndPost(const OperationHandlePtr &h,
                              OperationOutcome outcome) {
    h->finish(std::move(outcome));
    const OperationOutcome &result = *h->outcome();
    if (result.state == OperationState::Failed) {
        qCWarning(tpQueue) << "failed" << "id=" << h->id()
                           << "kind=" << twinpane::errorKindName(result.error.kind)
                           << QString::fromStdString(result.error.message);
    } else {
        qCInfo(tpQueue) << "finished" << "id=" << h->id()
                        << "state=" << operationStateName(result.state);
    }
    ProgressEvent ev;
    ev.id = h->id();
    ev.sequence = h->nextSequence();
    ev.type = ProgressEvent::Type::Finished;
    ev.progress = h->progress();
    ev.outcome = result;
    bridge_.post(std::move(ev));
}

void TaskQueue::shutdown(bool cancelRunning) {
    std::vector<OperationHandlePtr> running;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (joined_)
            return;
        stopping_ = true;
        running.assign(active_.begin(), active_.end());
    }
    cv_.notify_all();
    qCInfo(tpQueue) << "shutdown requested" << "active=" << running.size()
                    << "cancelRunning=" << cancelRunning;

    if (cancelRunning && !running.empty()) {
        for (const auto &h : running)
            h->requestCancel();
        session_->interrupt();
    }
    for (auto &t : workers_) {
        if (t.joinable())
            t.join();
    }

    std::deque<OperationHandlePtr> leftovers;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        leftovers.swap(queue_);
        joined_ = true;
    }
    for (const auto &h : leftovers)
        finishAndPost(h, cancelled());
    qCInfo(tpQueue) << "shutdown finished" << "cancelledQueued="
                    << leftovers.size();
}
