// Small UI time helpers for stack and item timestamps.
#pragma once
#include "dropshelf/ShelfTypes.hpp"
#include <QDateTime>
#include <QLocale>
#include <QObject>
#include <QString>
#include <chrono>

namespace dropshelfui {

// Local time, short system-locale format; "—" for unset timestamps.
inline QString localShortTime(dropshelf::Clock::time_point tp) {
    if (tp == dropshelf::Clock::time_point{})
        return QStringLiteral("—");
    const qint64 ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                          tp.time_since_epoch())
                          .count();
    const QDateTime dt = QDateTime::fromMSecsSinceEpoch(ms);
    if (!dt.isValid())
        return QStringLiteral("—");
    return QLocale::system().toString(dt, QLocale::ShortFormat);
}

// "just now", "5 min ago", or the short time for anything older than a day.
inline QString relativeTime(dropshelf::Clock::time_point tp,
                            dropshelf::Clock::time_point now =
                                dropshelf::Clock::now()) {
    if (tp == dropshelf::Clock::time_point{})
        return QStringLiteral("—");
    const auto secs =
        std::chrono::duration_cast<std::chrono::seconds>(now - tp).count();
    if (secs < 60)
        return QObject::tr("just now");
    if (secs < 3600)
        return QObject::tr("%1 min ago").arg(secs / 60);
    if (secs < 86400)
        return QObject::tr("%1 h ago").arg(secs / 3600);
    return localShortTime(tp);
}

} // namespace dropshelfui
