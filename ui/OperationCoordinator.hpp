// Facade used by the presentation layer: submits requests, keeps the handles
// alive until the UI dismisses them, and routes worker events to UI-thread
// callbacks. Every member function is UI-thread only.
#pragma once
#include "OperationHandle.hpp"
#include "OperationRequest.hpp"
#include "OperationSettings.hpp"
#include "ProgressBridge.hpp"
#include <QObject>
#include <memory>
#include <string>
#include <unordered_map>

namespace twinpane { class SftpClient; }
class TaskQueue;

class OperationCoordinator : public QObject {
    Q_OBJECT
public:
    using ProgressCallback = ProgressBridge::ProgressCallback;
    using DoneCallback = ProgressBridge::DoneCallback;

    // Takes ownership of the session; the chunk size from settings is
    // applied to it before the workers start.
    OperationCoordinator(std::unique_ptr<twinpane::SftpClient> session,
                         const OperationSettings &settings = {},
                         QObject *parent = nullptr);
    ~OperationCoordinator() override;

    // onProgress runs zero or more times, onDone exactly once and always
    // last. Either may be empty.
    OperationHandlePtr run(OperationRequest request,
                           ProgressCallback onProgress = {},
                           DoneCallback onDone = {});

    // No-op for terminal or already cancelled handles.
    void cancel(const OperationHandlePtr &handle);
    void cancelAll();

    // Drops the callbacks and the coordinator's reference. Safe while the
    // operation is still running; its late events are discarded.
    void forget(const OperationHandlePtr &handle);
    // Forgets every terminal handle whose done callback already ran.
    void forgetFinished();

    OperationHandlePtr handle(quint64 id) const;
    std::size_t trackedCount() const { return handles_.size(); }
    const OperationSettings &settings() const { return settings_; }

    // Stops the queue: running work is cancelled, queued work finishes as
    // Cancelled. Done callbacks fire when the UI loop next drains.
    void shutdown();
    bool isShutDown() const { return shutDown_; }

    // For tests and diagnostics.
    ProgressBridge &bridge() { return bridge_; }

signals:
    // Emitted right after the done callback of a tracked operation.
    void operationFinished(quint64 id, OperationState state);

private:
    OperationSettings settings_;
    ProgressBridge bridge_;
    std::unique_ptr<TaskQueue> queue_; // after bridge_: workers post into it
    std::unordered_map<quint64, OperationHandlePtr> handles_;
    bool shutDown_ = false;
};
