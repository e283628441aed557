#include "OperationSettings.hpp"
#include <QSettings>
#include <QtGlobal>

OperationSettings OperationSettings::load(QSettings &s) {
    OperationSettings o;
    o.workerThreads = s.value("Operations/workerThreads", o.workerThreads).toInt();
    o.transferChunkKiB =
        s.value("Operations/transferChunkKiB", o.transferChunkKiB).toInt();
    o.expandHome = s.value("Operations/expandHome", o.expandHome).toBool();
    o.countDirectoryItems =
        s.value("Operations/countDirectoryItems", o.countDirectoryItems).toBool();
    return o.clamped();
}

OperationSettings OperationSettings::loadDefault() {
    QSettings s("TwinPane", "TwinPane");
    return load(s);
}

void OperationSettings::save(QSettings &s) const {
    const OperationSettings o = clamped();
    s.setValue("Operations/workerThreads", o.workerThreads);
    s.setValue("Operations/transferChunkKiB", o.transferChunkKiB);
    s.setValue("Operations/expandHome", o.expandHome);
    s.setValue("Operations/countDirectoryItems", o.countDirectoryItems);
    s.sync();
}

OperationSettings OperationSettings::clamped() const {
    OperationSettings o = *this;
    o.workerThreads = qBound(kMinWorkers, workerThreads, kMaxWorkers);
    o.transferChunkKiB = qBound(kMinChunkKiB, transferChunkKiB, kMaxChunkKiB);
    return o;
}
