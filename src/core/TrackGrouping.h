#pragma once

#include <QHash>
#include <QString>
#include <QVector>
#include "MusicData.h"

// Coarse quality tier of a codec, best last so tiers compare with <.
enum class FormatClass {
    Unknown,
    StandardLossy,     // OGG, MP3, WMA
    HighQualityLossy,  // OPUS, AAC, M4A
    Lossless,          // FLAC, ALAC, WAV, AIFF, APE, WV
    Dsd                // DSD*, DSF, DFF
};

// Every encoding of one song (same normalized artist + title).
struct TrackGroup {
    QString        groupKey;
    QVector<Track> versions;   // best quality first, never empty

    const Track& bestVersion() const { return versions.first(); }
    bool containsVersion(const QString& trackId) const;
};

// Explicit per-song version choices made by the user.  Owned by the
// caller; the grouping functions never consult it.
class VersionSelection {
public:
    void select(const QString& groupKey, const QString& trackId);
    void clear(const QString& groupKey);
    void clearAll() { m_selected.clear(); }

    bool hasSelection(const QString& groupKey) const { return m_selected.contains(groupKey); }
    QString selectedId(const QString& groupKey) const { return m_selected.value(groupKey); }

    // The selected version if it still belongs to the group, else the best one.
    Track activeVersion(const TrackGroup& group) const;

private:
    QHash<QString, QString> m_selected;   // groupKey → track id
};

class TrackGrouping {
public:
    static QString normalize(const QString& str);
    static QString groupKey(const Track& track);

    static FormatClass formatClass(const QString& format);
    static int baseScore(const QString& format);
    static double qualityScore(const Track& track);

    // Groups in order of first appearance; versions sorted by qualityScore
    // descending, ties in input order.
    static QVector<TrackGroup> group(const QVector<Track>& tracks);

    // Best version of every group, for building queues.
    static QVector<Track> deduplicated(const QVector<Track>& tracks);
};
