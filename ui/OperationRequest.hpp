// Immutable descriptors of the remote operations the worker can run.
// Closed set: the worker dispatches over it with std::visit.
#pragma once
#include "twinpane/SftpTypes.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

struct ListRequest {
    std::string path; // "~" and "~/..." are resolved on the worker
    bool countItems = false;
};

struct StatRequest {
    std::string path;
};

// With recursive set, remote and local name directories: the whole tree is
// copied and progress counts bytes across all of its files.
struct DownloadRequest {
    std::string remote;
    std::string local;
    std::optional<std::uint64_t> sizeHint;
    bool recursive = false;
};

struct UploadRequest {
    std::string local;
    std::string remote;
    std::optional<std::uint64_t> sizeHint;
    bool recursive = false;
};

struct DeleteRequest {
    std::string path;
    bool recursive = false; // directories only
};

struct RenameRequest {
    std::string from;
    std::string to;
    bool overwrite = false;
};

struct MkdirRequest {
    std::string path;
    unsigned int mode = 0755;
};

struct ConnectRequest {
    twinpane::SessionOptions options;
};

using OperationRequest =
    std::variant<ListRequest, StatRequest, DownloadRequest, UploadRequest,
                 DeleteRequest, RenameRequest, MkdirRequest, ConnectRequest>;

enum class OperationKind {
    List,
    Stat,
    Download,
    Upload,
    Delete,
    Rename,
    Mkdir,
    Connect
};

OperationKind operationKind(const OperationRequest &request);
const char *operationKindName(OperationKind kind);

inline bool isTransferKind(OperationKind kind) {
    return kind == OperationKind::Download || kind == OperationKind::Upload;
}

// Size hint of a transfer request, if the caller supplied one.
std::optional<std::uint64_t> requestSizeHint(const OperationRequest &request);

// Where a transfer leaves its (possibly partial) artifact: the local file
// or directory for downloads, the remote one for uploads. Empty for other
// kinds.
std::string transferDestination(const OperationRequest &request);

// One-line description for logs; paths go through loggablePath().
std::string describeRequest(const OperationRequest &request);
