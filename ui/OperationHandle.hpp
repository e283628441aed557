// Per-request token shared between the UI thread and the worker that runs it.
//
// Field ownership follows a single-writer rule:
//  - the cancellation flag is written by the UI thread and read by the worker;
//  - state, progress counters and the outcome are written by the worker.
// Readers never take a lock; the outcome is published with a release store
// of the terminal state and is immutable afterwards.
#pragma once
#include "OperationRequest.hpp"
#include "twinpane/SftpTypes.hpp"
#include <QMetaType>
#include <QtGlobal>
#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

enum class OperationState { Queued, Running, Succeeded, Failed, Cancelled };
Q_DECLARE_METATYPE(OperationState)

const char *operationStateName(OperationState state);

inline bool isTerminalState(OperationState s) {
    return s == OperationState::Succeeded || s == OperationState::Failed ||
           s == OperationState::Cancelled;
}

struct DirectoryListing {
    std::string path; // resolved (home expanded) path that was listed
    std::vector<twinpane::FileInfo> entries;
};

// Success payload: a listing (List), a stat record (Stat), the destination
// path (Download/Upload/Rename/Mkdir) or nothing (Delete/Connect).
using OperationPayload = std::variant<std::monostate, DirectoryListing,
                                      twinpane::FileInfo, std::string>;

// Marker for a transfer cancelled after it started writing. The artifact is
// left in place; removing it is up to the caller.
struct PartialTransfer {
    std::uint64_t bytesWritten = 0;
    std::string path;
};

struct OperationOutcome {
    OperationState state = OperationState::Queued;
    OperationPayload payload;
    twinpane::SftpError error; // set when state == Failed
    std::optional<PartialTransfer> partial;
};

struct TransferProgress {
    std::uint64_t bytesDone = 0;
    std::optional<std::uint64_t> bytesTotal; // unknown for list/stat
};

class OperationHandle {
public:
    OperationHandle(quint64 id, OperationRequest request);
    OperationHandle(const OperationHandle &) = delete;
    OperationHandle &operator=(const OperationHandle &) = delete;

    quint64 id() const { return id_; }
    const OperationRequest &request() const { return request_; }
    OperationKind kind() const { return kind_; }

    OperationState state() const { return state_.load(std::memory_order_acquire); }
    bool isTerminal() const { return isTerminalState(state()); }
    bool cancelRequested() const {
        return cancelRequested_.load(std::memory_order_acquire);
    }
    TransferProgress progress() const;

    // Null until the handle reaches a terminal state.
    const OperationOutcome *outcome() const;

private:
    friend class TaskQueue;
    friend class OperationCoordinator;

    // UI side. Returns true when the flag was newly raised on a live handle.
    bool requestCancel();

    // Worker side.
    bool claim();
    void recordProgress(std::uint64_t done, std::uint64_t total);
    void finish(OperationOutcome outcome);
    quint64 nextSequence() { return ++sequence_; }

    const quint64 id_;
    const OperationRequest request_;
    const OperationKind kind_;

    std::atomic<OperationState> state_{OperationState::Queued};
    std::atomic<bool> cancelRequested_{false};
    std::atomic<std::uint64_t> bytesDone_{0};
    std::atomic<std::uint64_t> bytesTotal_{0};
    std::atomic<bool> totalKnown_{false};
    quint64 sequence_ = 0; // events posted for this handle
    OperationOutcome outcome_;
};

using OperationHandlePtr = std::shared_ptr<OperationHandle>;
