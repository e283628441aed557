// Integration tests for Libssh2SftpClient driven through the operation
// layer against a test SFTP server. The test is skipped (exit code 77)
// unless required TWINPANE_IT_* env vars exist.
#include "OperationCoordinator.hpp"
#include "TestSupport.hpp"
#include "twinpane/Libssh2SftpClient.hpp"
#include "twinpane/RemotePath.hpp"

#include <QCoreApplication>
#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

using testsupport::TestContext;
using testsupport::waitUntil;

namespace {

constexpr int kSkipExitCode = 77;
constexpr int kOperationTimeoutMs = 30000;

std::optional<std::string> envValue(const char *key) {
    const char *raw = std::getenv(key);
    if (!raw || !*raw)
        return std::nullopt;
    return std::string(raw);
}

std::string uniqueToken() {
    const auto now =
        std::chrono::steady_clock::now().time_since_epoch().count();
    return std::to_string(static_cast<long long>(now));
}

bool readFile(const fs::path &p, std::string &out) {
    std::ifstream in(p, std::ios::binary);
    if (!in.is_open())
        return false;
    out.assign(std::istreambuf_iterator<char>(in),
               std::istreambuf_iterator<char>());
    return true;
}

bool parsePort(const std::optional<std::string> &raw, std::uint16_t &out) {
    if (!raw.has_value()) {
        out = 22;
        return true;
    }
    try {
        const int n = std::stoi(*raw);
        if (n < 1 || n > 65535)
            return false;
        out = static_cast<std::uint16_t>(n);
        return true;
    } catch (const std::exception &) {
        return false;
    }
}

// Runs one request and spins the loop until its done callback fires.
OperationOutcome runAndWait(OperationCoordinator &coord, OperationRequest req,
                            std::vector<TransferProgress> *progress = nullptr) {
    std::optional<OperationOutcome> result;
    auto h = coord.run(
        std::move(req),
        [progress](const TransferProgress &p) {
            if (progress)
                progress->push_back(p);
        },
        [&result](const OperationOutcome &o) { result = o; });
    if (!waitUntil([&] { return result.has_value(); }, kOperationTimeoutMs)) {
        coord.forget(h);
        OperationOutcome timeout;
        timeout.state = OperationState::Failed;
        timeout.error.set(twinpane::ErrorKind::Internal, "timed out");
        return timeout;
    }
    coord.forget(h);
    return *result;
}

std::string describe(const OperationOutcome &o) {
    return std::string(operationStateName(o.state)) + " " +
           twinpane::errorKindName(o.error.kind) + ": " + o.error.message;
}

bool listContainsName(const OperationOutcome &o, const std::string &name) {
    const auto *listing = std::get_if<DirectoryListing>(&o.payload);
    if (!listing)
        return false;
    return std::any_of(listing->entries.begin(), listing->entries.end(),
                       [&name](const twinpane::FileInfo &e) {
                           return e.name == name;
                       });
}

} // namespace

int main(int argc, char **argv) {
    const auto host = envValue("TWINPANE_IT_SFTP_HOST");
    const auto user = envValue("TWINPANE_IT_SFTP_USER");
    const auto pass = envValue("TWINPANE_IT_SFTP_PASS");
    const auto keyPath = envValue("TWINPANE_IT_SFTP_KEY");
    const auto keyPassphrase = envValue("TWINPANE_IT_SFTP_KEY_PASSPHRASE");
    const std::string remoteBase =
        envValue("TWINPANE_IT_REMOTE_BASE").value_or("/tmp");

    if (!host.has_value() || !user.has_value() ||
        (!pass.has_value() && !keyPath.has_value())) {
        std::cout << "[SKIP] twinpane_sftp_integration_tests requires env vars: "
                  << "TWINPANE_IT_SFTP_HOST, TWINPANE_IT_SFTP_USER and one "
                     "auth method "
                  << "(TWINPANE_IT_SFTP_PASS or TWINPANE_IT_SFTP_KEY)\n";
        return kSkipExitCode;
    }
    if (keyPath.has_value() && !fs::exists(*keyPath)) {
        std::cerr << "[FAIL] TWINPANE_IT_SFTP_KEY does not exist: " << *keyPath
                  << "\n";
        return EXIT_FAILURE;
    }

    std::uint16_t port = 22;
    if (!parsePort(envValue("TWINPANE_IT_SFTP_PORT"), port)) {
        std::cerr << "[FAIL] TWINPANE_IT_SFTP_PORT is invalid\n";
        return EXIT_FAILURE;
    }

    QCoreApplication app(argc, argv);
    TestContext t;
    twinpane::SessionOptions opt;
    opt.host = *host;
    opt.port = port;
    opt.username = *user;
    if (pass.has_value())
        opt.password = *pass;
    if (keyPath.has_value()) {
        opt.private_key_path = *keyPath;
        if (keyPassphrase.has_value())
            opt.private_key_passphrase = *keyPassphrase;
    }
    opt.known_hosts_policy = twinpane::KnownHostsPolicy::Off;

    const std::string token = uniqueToken();
    const std::string remoteSuiteDir =
        twinpane::joinRemotePath(remoteBase, "twinpane-it-" + token);
    const std::string remoteSrc =
        twinpane::joinRemotePath(remoteSuiteDir, "payload.txt");
    const std::string remoteMoved =
        twinpane::joinRemotePath(remoteSuiteDir, "payload-moved.txt");

    const fs::path localTmpRoot =
        fs::temp_directory_path() / ("twinpane-it-" + token);
    std::error_code ec;
    fs::create_directories(localTmpRoot, ec);
    if (ec) {
        std::cerr << "[FAIL] could not create temp dir: " << ec.message()
                  << "\n";
        return EXIT_FAILURE;
    }

    const fs::path localSrc = localTmpRoot / "payload.txt";
    const fs::path localDst = localTmpRoot / "down" / "payload-downloaded.txt";
    std::string payload = "TwinPane integration payload\n";
    payload.append(256 * 1024, 'z');
    {
        std::ofstream out(localSrc, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            std::cerr << "[FAIL] could not create source file\n";
            fs::remove_all(localTmpRoot, ec);
            return EXIT_FAILURE;
        }
        out << payload;
    }

    OperationSettings settings;
    settings.transferChunkKiB = 32;
    OperationCoordinator coord(std::make_unique<twinpane::Libssh2SftpClient>(),
                               settings);

    OperationOutcome o = runAndWait(coord, ConnectRequest{opt});
    t.check(o.state == OperationState::Succeeded,
            "connect should succeed: " + describe(o));
    if (t.failures == 0) {
        o = runAndWait(coord, MkdirRequest{remoteSuiteDir, 0755});
        t.check(o.state == OperationState::Succeeded,
                "mkdir remoteSuiteDir should succeed: " + describe(o));
    }
    if (t.failures == 0) {
        std::vector<TransferProgress> progress;
        o = runAndWait(coord,
                       UploadRequest{localSrc.string(), remoteSrc,
                                     std::uint64_t(payload.size())},
                       &progress);
        t.check(o.state == OperationState::Succeeded,
                "upload should succeed: " + describe(o));
        t.check(!progress.empty(), "upload should report progress");
    }
    if (t.failures == 0) {
        o = runAndWait(coord, StatRequest{remoteSrc});
        const auto *st = std::get_if<twinpane::FileInfo>(&o.payload);
        t.check(st != nullptr, "stat(remoteSrc) should succeed: " + describe(o));
        t.check(st && !st->is_dir && st->size == payload.size(),
                "remote file size should match payload size");
    }
    if (t.failures == 0) {
        o = runAndWait(coord, ListRequest{remoteSuiteDir, false});
        t.check(listContainsName(o, "payload.txt"),
                "list should include payload.txt: " + describe(o));
    }
    if (t.failures == 0) {
        o = runAndWait(coord, ListRequest{"~", false});
        const auto *listing = std::get_if<DirectoryListing>(&o.payload);
        t.check(listing && !listing->path.empty() && listing->path[0] == '/',
                "~ should resolve to an absolute directory: " + describe(o));
    }
    if (t.failures == 0) {
        o = runAndWait(coord, DownloadRequest{remoteSrc, localDst.string(),
                                              std::nullopt});
        t.check(o.state == OperationState::Succeeded,
                "download should succeed: " + describe(o));
        std::string downloaded;
        t.check(readFile(localDst, downloaded),
                "downloaded file should be readable");
        t.check(downloaded == payload,
                "downloaded content should match uploaded payload");
    }
    if (t.failures == 0) {
        o = runAndWait(coord, RenameRequest{remoteSrc, remoteMoved, false});
        t.check(o.state == OperationState::Succeeded,
                "rename should succeed: " + describe(o));
        o = runAndWait(coord, StatRequest{remoteSrc});
        t.check(o.state == OperationState::Failed &&
                    o.error.kind == twinpane::ErrorKind::Remote &&
                    o.error.code == twinpane::sftp_status::kNoSuchFile,
                "old path should not exist after rename");
    }
    if (t.failures == 0) {
        o = runAndWait(coord, DeleteRequest{remoteSuiteDir, true});
        t.check(o.state == OperationState::Succeeded,
                "recursive delete should succeed: " + describe(o));
    }

    // Best-effort cleanup regardless of test result.
    runAndWait(coord, DeleteRequest{remoteSuiteDir, true});
    coord.shutdown();
    fs::remove_all(localTmpRoot, ec);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] twinpane_sftp_integration_tests\n";
    return EXIT_SUCCESS;
}
