#include "OperationHandle.hpp"
#include <QtGlobal>

const char *operationStateName(OperationState state) {
    switch (state) {
    case OperationState::Queued:
        return "Queued";
    case OperationState::Running:
        return "Running";
    case OperationState::Succeeded:
        return "Succeeded";
    case OperationState::Failed:
        return "Failed";
    case OperationState::Cancelled:
        return "Cancelled";
    }
    return "Unknown";
}

OperationHandle::OperationHandle(quint64 id, OperationRequest request)
    : id_(id), request_(std::move(request)), kind_(operationKind(request_)) {
    if (const auto hint = requestSizeHint(request_)) {
        bytesTotal_.store(*hint);
        totalKnown_.store(true);
    }
}

TransferProgress OperationHandle::progress() const {
    TransferProgress p;
    p.bytesDone = bytesDone_.load(std::memory_order_acquire);
    if (totalKnown_.load(std::memory_order_acquire))
        p.bytesTotal = bytesTotal_.load(std::memory_order_acquire);
    return p;
}

const OperationOutcome *OperationHandle::outcome() const {
    return isTerminal() ? &outcome_ : nullptr;
}

bool OperationHandle::requestCancel() {
    if (isTerminal())
        return false;
    return !cancelRequested_.exchange(true, std::memory_order_acq_rel);
}

bool OperationHandle::claim() {
    OperationState expected = OperationState::Queued;
    return state_.compare_exchange_strong(expected, OperationState::Running,
                                          std::memory_order_acq_rel);
}

void OperationHandle::recordProgress(std::uint64_t done, std::uint64_t total) {
    if (total > 0) {
        bytesTotal_.store(total, std::memory_order_release);
        totalKnown_.store(true, std::memory_order_release);
    }
    bytesDone_.store(done, std::memory_order_release);
}

void OperationHandle::finish(OperationOutcome outcome) {
    if (isTerminal() || !isTerminalState(outcome.state)) {
        qFatal("OperationHandle %llu: invalid terminal transition %s -> %s",
               static_cast<unsigned long long>(id_),
               operationStateName(state()),
               operationStateName(outcome.state));
    }
    outcome_ = std::move(outcome);
    state_.store(outcome_.state, std::memory_order_release);
}
