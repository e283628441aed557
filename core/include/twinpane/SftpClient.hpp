// Abstract blocking SFTP session. The offload layer only talks to this
// interface, so tests can inject MockSftpClient instead of libssh2.
#pragma once
#include "SftpTypes.hpp"
#include <cstddef>
#include <functional>

namespace twinpane {

class SftpClient {
public:
    // done/total in bytes; total == 0 when unknown.
    using ProgressCB =
        std::function<void(std::uint64_t /*done*/, std::uint64_t /*total*/)>;
    // Polled before every chunk; returning true stops the transfer.
    using CancelCB = std::function<bool()>;

    static constexpr std::size_t kDefaultChunkSize = 64 * 1024;

    virtual ~SftpClient() = default;

    virtual bool connect(const SessionOptions &opt, SftpError &err) = 0;
    virtual void disconnect() = 0;
    virtual bool isConnected() const = 0;

    virtual bool list(const std::string &remote_path,
                      std::vector<FileInfo> &out, SftpError &err) = 0;

    virtual bool stat(const std::string &remote_path, FileInfo &info,
                      SftpError &err) = 0;

    // Like stat() but does not follow a final symlink.
    virtual bool lstat(const std::string &remote_path, FileInfo &info,
                       SftpError &err) = 0;

    // Canonical absolute form of a remote path ("." yields the login dir).
    virtual bool realpath(const std::string &remote_path, std::string &out,
                          SftpError &err) = 0;

    // Download remote -> local (create/truncate). On cancellation returns
    // false with ErrorKind::Cancelled and leaves the partial file in place.
    virtual bool get(const std::string &remote, const std::string &local,
                     SftpError &err, ProgressCB progress = {},
                     CancelCB shouldCancel = {}) = 0;

    // Upload local -> remote (create/truncate). Same cancellation contract.
    virtual bool put(const std::string &local, const std::string &remote,
                     SftpError &err, ProgressCB progress = {},
                     CancelCB shouldCancel = {}) = 0;

    virtual bool mkdir(const std::string &remote_dir, SftpError &err,
                       unsigned int mode = 0755) = 0;

    virtual bool removeFile(const std::string &remote_path,
                            SftpError &err) = 0;

    virtual bool removeDir(const std::string &remote_dir, SftpError &err) = 0;

    virtual bool rename(const std::string &from, const std::string &to,
                        SftpError &err, bool overwrite = false) = 0;

    // Abort the call currently blocked in this session. Safe from any
    // thread. The aborted call fails with ErrorKind::Transport.
    virtual void interrupt() = 0;

    // Transfer checkpoint granularity.
    void setTransferChunkSize(std::size_t bytes) {
        chunkSize_ = bytes > 0 ? bytes : kDefaultChunkSize;
    }
    std::size_t transferChunkSize() const { return chunkSize_; }

private:
    std::size_t chunkSize_ = kDefaultChunkSize;
};

} // namespace twinpane
