#include "ProgressBridge.hpp"
#include <QLoggingCategory>
#include <QMetaObject>
Q_LOGGING_CATEGORY(tpBridge, "twinpane.bridge")

ProgressBridge::ProgressBridge(QObject *parent) : QObject(parent) {}

void ProgressBridge::post(ProgressEvent event) {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        pending_.push_back(std::move(event));
    }
    if (!wakeScheduled_.exchange(true)) {
        wakes_.fetch_add(1);
        QMetaObject::invokeMethod(this, "drainAndDispatch",
                                  Qt::QueuedConnection);
    }
}

void ProgressBridge::registerHandler(quint64 id, ProgressCallback onProgress,
                                     DoneCallback onDone) {
    Registration r;
    r.onProgress = std::move(onProgress);
    r.onDone = std::move(onDone);
    handlers_[id] = std::move(r);
}

void ProgressBridge::unregisterHandler(quint64 id) { handlers_.erase(id); }

std::size_t ProgressBridge::pendingCount() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return pending_.size();
}

void ProgressBridge::drainAndDispatch() {
    // Clear the flag before looking at the queue so a post racing with this
    // drain always schedules a follow-up wake.
    wakeScheduled_.store(false);
    std::size_t budget = 0;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        budget = pending_.size();
    }
    // Events are popped one at a time: a callback that spins a nested event
    // loop re-enters here and keeps consuming from the front, so global FIFO
    // order holds across nesting levels.
    while (budget-- > 0) {
        ProgressEvent event;
        {
            std::lock_guard<std::mutex> lk(mtx_);
            if (pending_.empty())
                break;
            event = std::move(pending_.front());
            pending_.pop_front();
        }
        dispatch(event);
    }
}

void ProgressBridge::dispatch(ProgressEvent &event) {
    auto it = handlers_.find(event.id);
    if (it == handlers_.end()) {
        // Forgotten (or never registered) handle: late events are dropped.
        ++dropped_;
        return;
    }
    if (event.sequence <= it->second.lastSequence) {
        qFatal("ProgressBridge: out-of-order event for operation %llu "
               "(sequence %llu after %llu)",
               static_cast<unsigned long long>(event.id),
               static_cast<unsigned long long>(event.sequence),
               static_cast<unsigned long long>(it->second.lastSequence));
    }
    it->second.lastSequence = event.sequence;

    if (event.type == ProgressEvent::Type::Progress) {
        // Copy: the callback may unregister this handle.
        ProgressCallback cb = it->second.onProgress;
        if (cb)
            cb(event.progress);
        return;
    }

    DoneCallback done = std::move(it->second.onDone);
    handlers_.erase(it);
    qCDebug(tpBridge) << "dispatching terminal event"
                      << "id=" << event.id
                      << "state=" << operationStateName(event.outcome.state);
    if (done)
        done(event.outcome);
}
