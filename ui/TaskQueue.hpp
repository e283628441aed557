// Ordered queue of operation requests plus the worker threads that execute
// them against a single SftpClient. The session is owned here for the whole
// lifetime of the queue and is never touched by the UI thread.
#pragma once
#include "OperationHandle.hpp"
#include "OperationRequest.hpp"
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

namespace twinpane { class SftpClient; }
class ProgressBridge;

struct TaskQueueOptions {
    int workerThreads = 1;
    // Resolve "~" paths of List/Stat requests on the worker.
    bool expandHome = true;
    // User whose home is looked up when realpath(".") is unavailable.
    std::string homeUser;
};

class TaskQueue {
public:
    TaskQueue(std::unique_ptr<twinpane::SftpClient> session,
              ProgressBridge &bridge, TaskQueueOptions options = {});
    ~TaskQueue();
    TaskQueue(const TaskQueue &) = delete;
    TaskQueue &operator=(const TaskQueue &) = delete;

    // Never blocks on the session. After shutdown() the handle is finished
    // as Cancelled right away.
    OperationHandlePtr submit(OperationRequest request);

    // Stops dequeuing, optionally cancels and interrupts the running
    // operations, joins the workers and finishes whatever is still queued as
    // Cancelled. Idempotent. Must not be called from a worker thread.
    void shutdown(bool cancelRunning = true);

    bool isStopping() const;
    std::size_t queuedCount() const;
    int workerCount() const { return static_cast<int>(workers_.size()); }

private:
    void workerLoop();
    void execute(const OperationHandlePtr &h);
    void skipCancelled(const OperationHandlePtr &h);
    void finishAndPost(const OperationHandlePtr &h, OperationOutcome outcome);
    void postProgress(const OperationHandlePtr &h, std::uint64_t done,
                      std::uint64_t total, std::uint64_t &lastPosted);
    void postProgressEvent(const OperationHandlePtr &h);

    std::unique_ptr<twinpane::SftpClient> session_;
    ProgressBridge &bridge_;
    TaskQueueOptions options_;

    mutable std::mutex mtx_; // protects queue_, active_, stopping_, nextId_
    std::condition_variable cv_;
    std::deque<OperationHandlePtr> queue_;
    // Handles taken off the queue by a worker and not yet finished.
    std::unordered_set<OperationHandlePtr> active_;
    bool stopping_ = false;
    bool joined_ = false;
    quint64 nextId_ = 1;

    // Serializes every session call, whatever the number of workers.
    std::timed_mutex sessionMutex_;
    std::string sessionUser_; // guarded by sessionMutex_

    std::vector<std::thread> workers_;
};
