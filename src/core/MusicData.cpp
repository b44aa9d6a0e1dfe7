#include "MusicData.h"

#include <QFileInfo>

// ═════════════════════════════════════════════════════════════════════
//  Utility Functions
// ═════════════════════════════════════════════════════════════════════

QString formatDuration(int seconds)
{
    if (seconds < 0) seconds = 0;
    int m = seconds / 60;
    int s = seconds % 60;
    return QString("%1:%2").arg(m).arg(s, 2, 10, QChar('0'));
}

QString formatFromPath(const QString& filePath)
{
    return QFileInfo(filePath).suffix().toUpper();
}

QString sourceKindLabel(TrackSource::Kind kind)
{
    switch (kind) {
    case TrackSource::Single:   return QStringLiteral("Single");
    case TrackSource::Playlist: return QStringLiteral("Playlist");
    case TrackSource::Album:    return QStringLiteral("Album");
    case TrackSource::Artist:   return QStringLiteral("Artist");
    }
    return QStringLiteral("Unknown");
}
