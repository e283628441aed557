#include "OperationRequest.hpp"
#include "twinpane/RuntimeLogging.hpp"

using twinpane::loggablePath;

namespace {

struct KindOf {
    OperationKind operator()(const ListRequest &) const {
        return OperationKind::List;
    }
    OperationKind operator()(const StatRequest &) const {
        return OperationKind::Stat;
    }
    OperationKind operator()(const DownloadRequest &) const {
        return OperationKind::Download;
    }
    OperationKind operator()(const UploadRequest &) const {
        return OperationKind::Upload;
    }
    OperationKind operator()(const DeleteRequest &) const {
        return OperationKind::Delete;
    }
    OperationKind operator()(const RenameRequest &) const {
        return OperationKind::Rename;
    }
    OperationKind operator()(const MkdirRequest &) const {
        return OperationKind::Mkdir;
    }
    OperationKind operator()(const ConnectRequest &) const {
        return OperationKind::Connect;
    }
};

struct Describe {
    std::string operator()(const ListRequest &r) const {
        return "list " + loggablePath(r.path);
    }
    std::string operator()(const StatRequest &r) const {
        return "stat " + loggablePath(r.path);
    }
    std::string operator()(const DownloadRequest &r) const {
        return std::string(r.recursive ? "download -r " : "download ") +
               loggablePath(r.remote) + " -> " +
               loggablePath(r.local);
    }
    std::string operator()(const UploadRequest &r) const {
        return std::string(r.recursive ? "upload -r " : "upload ") +
               loggablePath(r.local) + " -> " +
               loggablePath(r.remote);
    }
    std::string operator()(const DeleteRequest &r) const {
        return std::string(r.recursive ? "delete -r " : "delete ") +
               loggablePath(r.path);
    }
    std::string operator()(const RenameRequest &r) const {
        return "rename " + loggablePath(r.from) + " -> " +
               loggablePath(r.to);
    }
    std::string operator()(const MkdirRequest &r) const {
        return "mkdir " + loggablePath(r.path);
    }
    std::string operator()(const ConnectRequest &r) const {
        return "connect " + loggablePath(r.options.host);
    }
};

} // namespace

OperationKind operationKind(const OperationRequest &request) {
    return std::visit(KindOf{}, request);
}

const char *operationKindName(OperationKind kind) {
    switch (kind) {
    case OperationKind::List:
        return "List";
    case OperationKind::Stat:
        return "Stat";
    case OperationKind::Download:
        return "Download";
    case OperationKind::Upload:
        return "Upload";
    case OperationKind::Delete:
        return "Delete";
    case OperationKind::Rename:
        return "Rename";
    case OperationKind::Mkdir:
        return "Mkdir";
    case OperationKind::Connect:
        return "Connect";
    }
    return "Unknown";
}

std::optional<std::uint64_t> requestSizeHint(const OperationRequest &request) {
    if (const auto *d = std::get_if<DownloadRequest>(&request))
        return d->sizeHint;
    if (const auto *u = std::get_if<UploadRequest>(&request))
        return u->sizeHint;
    return std::nullopt;
}

std::string transferDestination(const OperationRequest &request) {
    if (const auto *d = std::get_if<DownloadRequest>(&request))
        return d->local;
    if (const auto *u = std::get_if<UploadRequest>(&request))
        return u->remote;
    return {};
}

std::string describeRequest(const OperationRequest &request) {
    return std::visit(Describe{}, request);
}
