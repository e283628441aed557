// Tunables of the operation layer, persisted under "Operations/*".
#pragma once
#include <cstddef>

class QSettings;

struct OperationSettings {
    int workerThreads = 1;      // 1..8; the session itself is still serialized
    int transferChunkKiB = 64;  // 4..4096; checkpoint granularity of transfers
    bool expandHome = true;     // resolve "~" on the worker
    bool countDirectoryItems = false; // default for list views

    static constexpr int kMinWorkers = 1;
    static constexpr int kMaxWorkers = 8;
    static constexpr int kMinChunkKiB = 4;
    static constexpr int kMaxChunkKiB = 4096;

    static OperationSettings load(QSettings &s);
    // QSettings("TwinPane", "TwinPane").
    static OperationSettings loadDefault();
    void save(QSettings &s) const;

    OperationSettings clamped() const;
    std::size_t transferChunkBytes() const {
        return static_cast<std::size_t>(clamped().transferChunkKiB) * 1024;
    }
};
