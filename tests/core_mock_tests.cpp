// Core unit tests without external framework (run via CTest).
#include "twinpane/MockSftpClient.hpp"
#include "twinpane/RemotePath.hpp"
#include "twinpane/RuntimeLogging.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

struct TestContext {
    int failures = 0;

    void check(bool cond, const std::string &msg) {
        if (!cond) {
            ++failures;
            std::cerr << "[FAIL] " << msg << "\n";
        }
    }

    void checkContains(const std::string &haystack, const std::string &needle,
                       const std::string &msg) {
        check(haystack.find(needle) != std::string::npos, msg);
    }
};

twinpane::SessionOptions validOptions() {
    twinpane::SessionOptions opt;
    opt.host = "example.test";
    opt.username = "alice";
    return opt;
}

fs::path makeTempDir(const std::string &tag) {
    const auto now =
        std::chrono::steady_clock::now().time_since_epoch().count();
    const fs::path p = fs::temp_directory_path() /
                       ("twinpane-core-" + tag + "-" + std::to_string(now));
    fs::create_directories(p);
    return p;
}

std::string readFile(const fs::path &p) {
    std::ifstream in(p, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)),
                       std::istreambuf_iterator<char>());
}

void test_session_defaults(TestContext &t) {
    twinpane::SessionOptions o;
    t.check(o.port == 22, "default port should be 22");
    t.check(o.known_hosts_policy == twinpane::KnownHostsPolicy::Strict,
            "default known_hosts_policy should be Strict");
    t.check(!o.password.has_value(), "password should be empty by default");
    t.check(!o.private_key_path.has_value(),
            "private_key_path should be empty by default");

    twinpane::SftpError e;
    t.check(!e.isSet(), "a fresh SftpError should not be set");
    e.set(twinpane::ErrorKind::Remote, "boom", twinpane::sftp_status::kFailure);
    t.check(e.isSet() && e.code == twinpane::sftp_status::kFailure,
            "set() should store kind and code");
    e.clear();
    t.check(!e.isSet() && e.message.empty() && e.code == 0,
            "clear() should reset every field");
    t.check(std::string(twinpane::errorKindName(twinpane::ErrorKind::LocalIO)) ==
                "LocalIO",
            "errorKindName should name LocalIO");
}

void test_connect_validation(TestContext &t) {
    twinpane::MockSftpClient c;
    twinpane::SftpError err;
    twinpane::SessionOptions opt;
    opt.host = "";
    opt.username = "user";
    t.check(!c.connect(opt, err), "connect should fail when host is empty");
    t.check(err.kind == twinpane::ErrorKind::Transport,
            "connect validation failure should be a Transport error");

    err.clear();
    opt.host = "example.test";
    opt.username.clear();
    t.check(!c.connect(opt, err), "connect should fail when username is empty");

    err.clear();
    opt.username = "alice";
    t.check(c.connect(opt, err), "connect should succeed with host+username");
    t.check(c.isConnected(),
            "client should report connected after successful connect");
}

void test_list_requires_connection(TestContext &t) {
    twinpane::MockSftpClient c;
    std::vector<twinpane::FileInfo> out;
    twinpane::SftpError err;
    t.check(!c.list("/", out, err), "list should fail when disconnected");
    t.check(err.kind == twinpane::ErrorKind::Transport,
            "list while disconnected should be a Transport error");

    t.check(c.connect(validOptions(), err), "connect should succeed");
    c.disconnect();
    err.clear();
    t.check(!c.list("/", out, err), "list should fail after disconnect");
}

void test_list_sorting_and_known_path(TestContext &t) {
    twinpane::MockSftpClient c;
    twinpane::SftpError err;
    t.check(c.connect(validOptions(), err),
            "connect should succeed before list test");

    std::vector<twinpane::FileInfo> out;
    t.check(c.list("/home", out, err),
            "list('/home') should succeed in mock FS");
    t.check(out.size() == 3, "list('/home') should return 3 entries");
    if (out.size() == 3) {
        t.check(out[0].is_dir && out[0].name == "alice",
                "first entry should be dir 'alice'");
        t.check(out[1].is_dir && out[1].name == "guest",
                "second entry should be dir 'guest'");
        t.check(!out[2].is_dir && out[2].name == "notes.md" &&
                    out[2].size == 2048,
                "third entry should be file 'notes.md' of 2048 bytes");
    }

    std::vector<twinpane::FileInfo> root;
    t.check(c.list("/", root, err), "list('/') should succeed");
    t.check(root.size() == 3, "list('/') should return expected mock entries");
    std::vector<twinpane::FileInfo> emptyPath;
    t.check(c.list("", emptyPath, err), "list('') should be treated as '/'");
    t.check(emptyPath.size() == root.size(),
            "list('') should match root entry count");
}

void test_remote_errors_carry_status(TestContext &t) {
    twinpane::MockSftpClient c;
    twinpane::SftpError err;
    t.check(c.connect(validOptions(), err), "connect should succeed");

    std::vector<twinpane::FileInfo> out;
    t.check(!c.list("/does-not-exist", out, err),
            "list on missing path should fail");
    t.check(err.kind == twinpane::ErrorKind::Remote &&
                err.code == twinpane::sftp_status::kNoSuchFile,
            "missing path should be Remote/no-such-file");

    err.clear();
    t.check(!c.list("/readme.txt", out, err), "list on a file should fail");
    t.check(err.code == twinpane::sftp_status::kNotADirectory,
            "listing a file should report not-a-directory");

    err.clear();
    t.check(!c.mkdir("/home", err), "mkdir on existing path should fail");
    t.check(err.code == twinpane::sftp_status::kFileAlreadyExists,
            "mkdir on existing path should report file-already-exists");

    err.clear();
    t.check(!c.removeDir("/home", err), "removeDir on non-empty dir should fail");
    t.check(err.code == twinpane::sftp_status::kDirNotEmpty,
            "removeDir on non-empty dir should report dir-not-empty");

    err.clear();
    t.check(!c.rename("/readme.txt", "/home/notes.md", err, false),
            "rename onto existing file without overwrite should fail");
    t.check(c.rename("/readme.txt", "/home/notes.md", err, true),
            "rename with overwrite should succeed");
    t.check(!c.hasPath("/readme.txt") && c.fileContent("/home/notes.md").size() == 1280,
            "overwrite rename should replace the destination");
}

void test_stat_and_realpath(TestContext &t) {
    twinpane::MockSftpClient c;
    twinpane::SftpError err;
    t.check(c.connect(validOptions(), err), "connect should succeed");

    twinpane::FileInfo info;
    t.check(c.stat("/home/alice/photo.jpg", info, err), "stat should succeed");
    t.check(!info.is_dir && info.size == 34567 && info.name == "photo.jpg",
            "stat should report name and size");

    std::string home;
    t.check(c.realpath(".", home, err), "realpath('.') should succeed");
    t.check(home == "/home/alice", "realpath('.') should be the home dir");
    std::string rel;
    t.check(c.realpath("projects", rel, err),
            "realpath of a relative path should succeed");
    t.check(rel == "/home/alice/projects",
            "relative paths should resolve against home");
}

void test_get_reports_checkpoints(TestContext &t) {
    twinpane::MockSftpClient c;
    twinpane::SftpError err;
    t.check(c.connect(validOptions(), err), "connect should succeed");
    c.addFile("/data.bin", std::string(1000, 'x'), 1700000000);
    c.setCheckpointPlan({0, 250, 600, 1000});

    const fs::path dir = makeTempDir("get");
    const fs::path local = dir / "data.bin";
    std::vector<std::uint64_t> seen;
    const bool ok = c.get(
        "/data.bin", local.string(), err,
        [&](std::uint64_t done, std::uint64_t total) {
            t.check(total == 1000, "progress total should be the file size");
            seen.push_back(done);
        });
    t.check(ok, "get should succeed: " + err.message);
    t.check(seen == std::vector<std::uint64_t>({0, 250, 600, 1000}),
            "get should report the planned checkpoints");
    t.check(readFile(local) == std::string(1000, 'x'),
            "downloaded content should match");
    std::error_code ec;
    fs::remove_all(dir, ec);
}

void test_get_cancel_leaves_partial_file(TestContext &t) {
    twinpane::MockSftpClient c;
    twinpane::SftpError err;
    t.check(c.connect(validOptions(), err), "connect should succeed");
    c.addFile("/data.bin", std::string(1000, 'y'));
    c.setCheckpointPlan({0, 250, 600, 1000});

    const fs::path dir = makeTempDir("cancel");
    const fs::path local = dir / "data.bin";
    std::uint64_t last = 0;
    const bool ok = c.get(
        "/data.bin", local.string(), err,
        [&](std::uint64_t done, std::uint64_t) { last = done; },
        [&] { return last >= 250; });
    t.check(!ok, "get should stop when shouldCancel returns true");
    t.check(err.kind == twinpane::ErrorKind::Cancelled,
            "stopped get should report Cancelled");
    t.check(last == 250, "no checkpoint should be reported after the stop");
    t.check(fs::exists(local) && fs::file_size(local) == 250,
            "the partial file should be left with the bytes written");
    std::error_code ec;
    fs::remove_all(dir, ec);
}

void test_put_and_local_errors(TestContext &t) {
    twinpane::MockSftpClient c;
    twinpane::SftpError err;
    t.check(c.connect(validOptions(), err), "connect should succeed");
    c.setTransferChunkSize(4);

    const fs::path dir = makeTempDir("put");
    const fs::path local = dir / "up.txt";
    {
        std::ofstream out(local, std::ios::binary);
        out << "0123456789";
    }
    int calls = 0;
    t.check(c.put(local.string(), "/home/alice/up.txt", err,
                  [&](std::uint64_t, std::uint64_t) { ++calls; }),
            "put should succeed: " + err.message);
    t.check(c.fileContent("/home/alice/up.txt") == "0123456789",
            "uploaded content should match");
    // 0, 4, 8, 10
    t.check(calls == 4, "chunk size should drive the checkpoint count");

    err.clear();
    t.check(!c.put((dir / "missing.txt").string(), "/home/alice/x", err),
            "put of a missing local file should fail");
    t.check(err.kind == twinpane::ErrorKind::LocalIO,
            "missing local source should be a LocalIO error");

    err.clear();
    t.check(!c.get("/readme.txt", (dir / "no-dir" / "x").string(), err),
            "get into a missing local directory should fail");
    t.check(err.kind == twinpane::ErrorKind::LocalIO,
            "unwritable local destination should be a LocalIO error");
    std::error_code ec;
    fs::remove_all(dir, ec);
}

void test_fail_next_and_interrupt(TestContext &t) {
    twinpane::MockSftpClient c;
    twinpane::SftpError err;
    t.check(c.connect(validOptions(), err), "connect should succeed");

    c.failNext(twinpane::ErrorKind::Remote, "Permission denied",
               twinpane::sftp_status::kPermissionDenied);
    twinpane::FileInfo info;
    t.check(!c.stat("/readme.txt", info, err), "scripted failure should fire");
    t.checkContains(err.message, "Permission denied",
                    "scripted failure should carry its message");
    err.clear();
    t.check(c.stat("/readme.txt", info, err),
            "scripted failure should only affect one call");

    c.interrupt();
    err.clear();
    t.check(!c.stat("/readme.txt", info, err), "interrupted call should fail");
    t.check(err.kind == twinpane::ErrorKind::Transport,
            "interrupt should surface as a Transport error");
    t.check(!c.isConnected(), "interrupt should drop the session");
}

void test_mkdir_remove_roundtrip(TestContext &t) {
    twinpane::MockSftpClient c;
    twinpane::SftpError err;
    t.check(c.connect(validOptions(), err), "connect should succeed");
    t.check(c.mkdir("/var/cache", err, 0700), "mkdir should succeed");
    twinpane::FileInfo info;
    t.check(c.stat("/var/cache", info, err) && info.is_dir &&
                (info.mode & 0777) == 0700,
            "mkdir should create a directory with the requested mode");
    t.check(c.removeDir("/var/cache", err), "removeDir should succeed");
    t.check(!c.hasPath("/var/cache"), "directory should be gone");
    t.check(!c.removeFile("/var", err), "removeFile on a directory should fail");
}

void test_symlinks_stat_versus_lstat(TestContext &t) {
    twinpane::MockSftpClient c;
    twinpane::SftpError err;
    t.check(c.connect(validOptions(), err), "connect should succeed");
    c.addSymlink("/home/link", "/home/alice");
    c.addSymlink("/dangling", "/nowhere");

    twinpane::FileInfo info;
    t.check(c.stat("/home/link", info, err) && info.is_dir && !info.is_symlink,
            "stat should follow the link");
    t.check(c.lstat("/home/link", info, err) && !info.is_dir &&
                info.is_symlink && info.name == "link",
            "lstat should describe the link itself");
    std::vector<twinpane::FileInfo> entries;
    t.check(c.list("/home/link", entries, err) && entries.size() == 2,
            "listing through a link should show the target");
    t.check(c.list("/home", entries, err) && entries.size() == 4 &&
                entries.back().name == "notes.md",
            "a link should be listed as a non-directory entry");
    t.check(!c.removeDir("/home/link", err),
            "removeDir should refuse a link to a directory");
    t.check(c.removeFile("/home/link", err), "removeFile should unlink");
    t.check(!c.hasPath("/home/link") && c.hasPath("/home/alice/photo.jpg"),
            "unlinking should leave the target alone");

    err.clear();
    t.check(!c.stat("/dangling", info, err) &&
                err.code == twinpane::sftp_status::kNoSuchFile,
            "stat of a dangling link should fail");
    t.check(c.lstat("/dangling", info, err) && info.is_symlink,
            "lstat of a dangling link should succeed");
}

void test_remote_path_helpers(TestContext &t) {
    t.check(twinpane::joinRemotePath("/", "a") == "/a", "join with root");
    t.check(twinpane::joinRemotePath("/x", "a") == "/x/a", "join adds a slash");
    t.check(twinpane::joinRemotePath("", "a") == "/a", "empty base is root");
    t.check(twinpane::remoteParentPath("/a/b") == "/a", "parent of nested");
    t.check(twinpane::remoteParentPath("/a") == "/", "parent of top level");
    t.check(twinpane::remoteBaseName("/a/b/") == "b",
            "base name ignores trailing slash");
    t.check(twinpane::normalizeRemotePath("/a//") == "/a",
            "normalize strips trailing slashes");
    t.check(twinpane::isHomeRelative("~") && twinpane::isHomeRelative("~/x") &&
                !twinpane::isHomeRelative("~x") &&
                !twinpane::isHomeRelative("/x"),
            "home relative detection");
    t.check(twinpane::expandHomePath("~", "/home/bob") == "/home/bob",
            "bare ~ expands to home");
    t.check(twinpane::expandHomePath("~/src", "/home/bob") == "/home/bob/src",
            "~/ prefix expands to home");
    t.check(twinpane::expandHomePath("/etc", "/home/bob") == "/etc",
            "absolute paths are unchanged");
}

void test_loggable_path_redacts_by_default(TestContext &t) {
    if (twinpane::sensitiveLoggingEnabled()) {
        t.check(twinpane::loggablePath("/secret") == "/secret",
                "sensitive logging should keep paths");
        return;
    }
    t.check(twinpane::loggablePath("/secret") == "<redacted>",
            "paths should be redacted by default");
    t.check(twinpane::loggablePath("").empty(), "empty path stays empty");
}

} // namespace

int main() {
    TestContext t;
    test_session_defaults(t);
    test_connect_validation(t);
    test_list_requires_connection(t);
    test_list_sorting_and_known_path(t);
    test_remote_errors_carry_status(t);
    test_stat_and_realpath(t);
    test_get_reports_checkpoints(t);
    test_get_cancel_leaves_partial_file(t);
    test_put_and_local_errors(t);
    test_fail_next_and_interrupt(t);
    test_mkdir_remove_roundtrip(t);
    test_symlinks_stat_versus_lstat(t);
    test_remote_path_helpers(t);
    test_loggable_path_redacts_by_default(t);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] twinpane_core_tests\n";
    return EXIT_SUCCESS;
}
