#pragma once
#include "SftpClient.hpp"
#include <atomic>
#include <chrono>
#include <map>
#include <mutex>

namespace twinpane {

// In-memory SFTP session. Thread-safe for a single caller at a time (the
// same contract as a real session) while its inspection helpers may be used
// from any thread.
class MockSftpClient : public SftpClient {
public:
    // Invoked on the calling thread after each transfer checkpoint has been
    // reported through the progress callback.
    using CheckpointHook =
        std::function<void(const std::string &path, std::uint64_t done)>;

    MockSftpClient();

    bool connect(const SessionOptions &opt, SftpError &err) override;
    void disconnect() override;
    bool isConnected() const override { return connected_.load(); }

    bool list(const std::string &remote_path, std::vector<FileInfo> &out,
              SftpError &err) override;
    bool stat(const std::string &remote_path, FileInfo &info,
              SftpError &err) override;
    bool lstat(const std::string &remote_path, FileInfo &info,
               SftpError &err) override;
    bool realpath(const std::string &remote_path, std::string &out,
                  SftpError &err) override;
    bool get(const std::string &remote, const std::string &local,
             SftpError &err, ProgressCB progress = {},
             CancelCB shouldCancel = {}) override;
    bool put(const std::string &local, const std::string &remote,
             SftpError &err, ProgressCB progress = {},
             CancelCB shouldCancel = {}) override;
    bool mkdir(const std::string &remote_dir, SftpError &err,
               unsigned int mode = 0755) override;
    bool removeFile(const std::string &remote_path, SftpError &err) override;
    bool removeDir(const std::string &remote_dir, SftpError &err) override;
    bool rename(const std::string &from, const std::string &to,
                SftpError &err, bool overwrite = false) override;
    void interrupt() override { interrupted_.store(true); }

    // Remote tree setup/inspection.
    void addDirectory(const std::string &path, std::uint32_t mode = 040755);
    void addFile(const std::string &path, const std::string &content,
                 std::uint64_t mtime = 0);
    // target is absolute or relative to the link's directory.
    void addSymlink(const std::string &path, const std::string &target);
    bool hasPath(const std::string &path) const;
    std::string fileContent(const std::string &path) const;
    void setHomeDirectory(const std::string &path) { homeDir_ = path; }

    // Explicit checkpoint offsets for transfers, e.g. {0, 250, 600, 1000}.
    // Empty restores chunk-size multiples.
    void setCheckpointPlan(std::vector<std::uint64_t> plan);
    void setCheckpointHook(CheckpointHook hook);
    void setCallDelay(std::chrono::milliseconds delay) { delay_ = delay; }
    // The next call (of any kind) fails with this error.
    void failNext(ErrorKind kind, const std::string &message, long code = 0);

    int maxConcurrentCalls() const { return maxInFlight_.load(); }
    int callCount() const { return calls_.load(); }

private:
    struct Node {
        bool is_dir = false;
        std::string data;
        std::uint32_t mode = 0;
        std::uint64_t mtime = 0;
        std::string link; // non-empty for symlinks
    };
    class CallScope;

    bool beginCall(SftpError &err);
    bool checkInterrupted(SftpError &err);
    // Follows symlinks in every component, and in the last one only when
    // followLast is set. Caller holds mtx_.
    std::string resolveLocked(const std::string &path, bool followLast) const;
    bool statImpl(const std::string &remote_path, FileInfo &info,
                  SftpError &err, bool followLast);
    std::vector<std::uint64_t> checkpointsFor(std::uint64_t total) const;
    static FileInfo toInfo(const std::string &name, const Node &n);

    std::atomic<bool> connected_{false};
    std::atomic<bool> interrupted_{false};
    std::atomic<int> inFlight_{0};
    std::atomic<int> maxInFlight_{0};
    std::atomic<int> calls_{0};
    std::chrono::milliseconds delay_{0};
    SessionOptions lastOpt_{};
    std::string homeDir_ = "/home/alice";

    mutable std::mutex mtx_; // protects fs_, plan_, hook_, scripted_
    std::map<std::string, Node> fs_;
    std::vector<std::uint64_t> plan_;
    CheckpointHook hook_;
    std::optional<SftpError> scripted_;
};

} // namespace twinpane
