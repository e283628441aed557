#pragma once
#include "SftpClient.hpp"
#include <atomic>
#include <string>
#include <vector>

// Forward declarations of libssh2's internal (underscored) types.
struct _LIBSSH2_SESSION;
struct _LIBSSH2_SFTP;

namespace twinpane {

class Libssh2SftpClient : public SftpClient {
public:
    Libssh2SftpClient();
    ~Libssh2SftpClient() override;

    bool connect(const SessionOptions &opt, SftpError &err) override;
    void disconnect() override;
    bool isConnected() const override { return connected_; }

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
    void interrupt() override;

private:
    bool connected_ = false;
    std::atomic<int> sock_{-1};
    _LIBSSH2_SESSION *session_ = nullptr;
    _LIBSSH2_SFTP *sftp_ = nullptr;

    bool tcpConnect(const std::string &host, std::uint16_t port,
                    SftpError &err);
    bool verifyHostKey(const SessionOptions &opt, SftpError &err);
    bool authenticate(const SessionOptions &opt, SftpError &err);
    bool authWithAgent(const std::string &user);
    bool requireSftp(SftpError &err) const;
    bool statWith(const std::string &remote_path, FileInfo &info,
                  SftpError &err, bool followLinks);
    // Classifies the last libssh2 failure as Remote (SFTP status) or
    // Transport (session/socket) and prefixes it with `what`.
    void setSessionError(SftpError &err, const std::string &what) const;
    std::string lastSessionMessage() const;
};

} // namespace twinpane
