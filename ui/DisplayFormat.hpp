// Small display helpers shared across views/dialogs.
#pragma once
#include "OperationHandle.hpp"
#include <QDateTime>
#include <QLocale>
#include <QString>

namespace twinpaneui {

// Epoch seconds in LOCAL time (short format), following the system locale.
inline QString localShortTime(quint64 secs) {
    if (secs == 0) return QStringLiteral("—");
    const QDateTime dt = QDateTime::fromSecsSinceEpoch((qint64)secs);
    if (!dt.isValid()) return QStringLiteral("—");
    return QLocale::system().toString(dt, QLocale::ShortFormat);
}

inline QString localShortTime(const QDateTime& dt) {
    if (!dt.isValid()) return QStringLiteral("—");
    return QLocale::system().toString(dt, QLocale::ShortFormat);
}

inline QString formatBytes(quint64 bytes) {
    static const char *units[] = {"B", "KB", "MB", "GB", "TB"};
    double value = static_cast<double>(bytes);
    int unit = 0;
    while (value >= 1024.0 && unit < 4) {
        value /= 1024.0;
        ++unit;
    }
    const int precision = (value < 10.0 && unit > 0) ? 1 : 0;
    return QString::number(value, 'f', precision) + " " + units[unit];
}

// "drwxr-xr-x" style rendering of POSIX mode bits.
inline QString modeString(quint32 mode, bool isDir) {
    QString s(10, QChar('-'));
    if (isDir || (mode & 0170000) == 0040000) s[0] = QChar('d');
    else if ((mode & 0170000) == 0120000) s[0] = QChar('l');
    static const char rwx[] = {'r', 'w', 'x'};
    for (int i = 0; i < 9; ++i) {
        if (mode & (0400u >> i)) s[1 + i] = QChar(rwx[i % 3]);
    }
    return s;
}

inline QString stateText(OperationState state) {
    switch (state) {
    case OperationState::Queued: return QStringLiteral("Queued");
    case OperationState::Running: return QStringLiteral("Running");
    case OperationState::Succeeded: return QStringLiteral("Done");
    case OperationState::Failed: return QStringLiteral("Error");
    case OperationState::Cancelled: return QStringLiteral("Canceled");
    }
    return {};
}

} // namespace twinpaneui
