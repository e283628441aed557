// The only thread-crossing surface of the operation layer. Workers post
// events from any thread; the UI thread drains them in FIFO order and runs
// the callbacks registered for each handle.
#pragma once
#include "OperationHandle.hpp"
#include <QObject>
#include <atomic>
#include <deque>
#include <functional>
#include <mutex>
#include <unordered_map>

struct ProgressEvent {
    enum class Type { Progress, Finished };

    quint64 id = 0;
    quint64 sequence = 0; // strictly increasing per handle
    Type type = Type::Progress;
    TransferProgress progress;
    OperationOutcome outcome; // Finished only
};

class ProgressBridge : public QObject {
    Q_OBJECT
public:
    using ProgressCallback = std::function<void(const TransferProgress &)>;
    using DoneCallback = std::function<void(const OperationOutcome &)>;

    explicit ProgressBridge(QObject *parent = nullptr);

    // Any thread. Never blocks on the UI; wake-ups are coalesced so a burst
    // of posts results in a single queued drain.
    void post(ProgressEvent event);

    // UI thread only. The done callback fires once, after which the
    // registration is dropped automatically.
    void registerHandler(quint64 id, ProgressCallback onProgress,
                         DoneCallback onDone);
    void unregisterHandler(quint64 id);
    bool hasHandler(quint64 id) const { return handlers_.count(id) > 0; }

    std::size_t pendingCount() const;
    quint64 droppedCount() const { return dropped_; }
    quint64 wakeCount() const { return wakes_.load(); }

public slots:
    // UI thread. Dispatches the events queued when the drain started; a
    // no-op when nothing is pending.
    void drainAndDispatch();

private:
    struct Registration {
        ProgressCallback onProgress;
        DoneCallback onDone;
        quint64 lastSequence = 0;
    };

    void dispatch(ProgressEvent &event);

    mutable std::mutex mtx_; // protects pending_
    std::deque<ProgressEvent> pending_;
    std::atomic<bool> wakeScheduled_{false};
    std::atomic<quint64> wakes_{0};

    // UI thread only.
    std::unordered_map<quint64, Registration> handlers_;
    quint64 dropped_ = 0;
};
