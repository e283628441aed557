#include "OperationCoordinator.hpp"
#include "TaskQueue.hpp"
#include "twinpane/SftpClient.hpp"
#include <QLoggingCategory>
#include <QPointer>
#include <vector>
Q_LOGGING_CATEGORY(tpCoord, "twinpane.coordinator")

OperationCoordinator::OperationCoordinator(
    std::unique_ptr<twinpane::SftpClient> session,
    const OperationSettings &settings, QObject *parent)
    : QObject(parent), settings_(settings.clamped()) {
    if (session)
        session->setTransferChunkSize(settings_.transferChunkBytes());
    TaskQueueOptions opts;
    opts.workerThreads = settings_.workerThreads;
    opts.expandHome = settings_.expandHome;
    queue_ = std::make_unique<TaskQueue>(std::move(session), bridge_, opts);
}

OperationCoordinator::~OperationCoordinator() {
    shutdown();
    // Anything still queued in the bridge dies with it.
    queue_.reset();
}

OperationHandlePtr OperationCoordinator::run(OperationRequest request,
                                             ProgressCallback onProgress,
                                             DoneCallback onDone) {
    OperationHandlePtr h = queue_->submit(std::move(request));
    const quint64 id = h->id();
    handles_.emplace(id, h);

    // The bridge cannot dispatch anything for this id before we return to
    // the event loop, so registering after submit loses nothing.
    QPointer<OperationCoordinator> self(this);
    bridge_.registerHandler(
        id, std::move(onProgress),
        [self, id, done = std::move(onDone)](const OperationOutcome &outcome) {
            if (done)
                done(outcome);
            if (self)
                emit self->operationFinished(id, outcome.state);
        });
    return h;
}

void OperationCoordinator::cancel(const OperationHandlePtr &handle) {
    if (!handle)
        return;
    if (handle->requestCancel())
        qCInfo(tpCoord) << "cancel requested" << "id=" << handle->id();
}

void OperationCoordinator::cancelAll() {
    for (const auto &kv : handles_)
        cancel(kv.second);
}

void OperationCoordinator::forget(const OperationHandlePtr &handle) {
    if (!handle)
        return;
    bridge_.unregisterHandler(handle->id());
    handles_.erase(handle->id());
}

void OperationCoordinator::forgetFinished() {
    std::vector<quint64> ids;
    for (const auto &kv : handles_) {
        if (kv.second->isTerminal() && !bridge_.hasHandler(kv.first))
            ids.push_back(kv.first);
    }
    for (quint64 id : ids)
        handles_.erase(id);
}

OperationHandlePtr OperationCoordinator::handle(quint64 id) const {
    auto it = handles_.find(id);
    return it == handles_.end() ? nullptr : it->second;
}

void OperationCoordinator::shutdown() {
    if (shutDown_)
        return;
    shutDown_ = true;
    qCInfo(tpCoord) << "shutdown" << "tracked=" << handles_.size();
    queue_->shutdown(true);
}
