#ifndef MUSICDATA_H
#define MUSICDATA_H

#include <QMetaType>
#include <QString>
#include <QVector>

// ── Data Structs ────────────────────────────────────────────────────
// Library record as handed over by the data-loading layer.  Optional tags
// use an empty string / 0 for "absent".
struct Track {
    QString id;
    QString title;
    QString artist;
    QString album;
    int     duration = 0;      // seconds
    int     trackNumber = 0;
    QString format;            // codec name as tagged, e.g. "FLAC", "mp3", "DSD128"
    int     bitrate = 0;       // kbps
    int     sampleRate = 0;    // Hz
    int     channels = 0;
    QString filePath;          // empty when the track has no playable location
};

// Which playlist/album/artist a queue entry was produced from.
struct TrackSource {
    enum Kind { Single, Playlist, Album, Artist };

    Kind    kind = Single;
    QString id;
    QString name;

    bool operator==(const TrackSource& o) const
    {
        return kind == o.kind && id == o.id && name == o.name;
    }
    bool operator!=(const TrackSource& o) const { return !(*this == o); }
};

// ── Playback-ready projection of a Track ────────────────────────────
// Flat fields only.  A default-constructed QueueTrack (empty id) means
// "no track".
struct QueueTrack {
    QString     id;
    QString     filePath;
    QString     title;
    QString     artist;
    QString     album;
    int         duration = 0;   // seconds
    int         trackNumber = 0;
    TrackSource source;

    bool isNull() const { return id.isEmpty(); }

    bool operator==(const QueueTrack& o) const
    {
        return id == o.id && filePath == o.filePath && title == o.title
            && artist == o.artist && album == o.album
            && duration == o.duration && trackNumber == o.trackNumber
            && source == o.source;
    }
    bool operator!=(const QueueTrack& o) const { return !(*this == o); }
};

Q_DECLARE_METATYPE(Track)
Q_DECLARE_METATYPE(QueueTrack)

// ── Utility Functions ───────────────────────────────────────────────
QString formatDuration(int seconds);
QString formatFromPath(const QString& filePath);   // "song.flac" → "FLAC"
QString sourceKindLabel(TrackSource::Kind kind);

#endif // MUSICDATA_H
