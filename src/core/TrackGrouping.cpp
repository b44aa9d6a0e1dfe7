#include "TrackGrouping.h"

#include <QDebug>
#include <QRegularExpression>
#include <QStringList>
#include <algorithm>

// ── TrackGroup ──────────────────────────────────────────────────────
bool TrackGroup::containsVersion(const QString& trackId) const
{
    for (const Track& t : versions) {
        if (t.id == trackId)
            return true;
    }
    return false;
}

// ── VersionSelection ────────────────────────────────────────────────
void VersionSelection::select(const QString& groupKey, const QString& trackId)
{
    m_selected.insert(groupKey, trackId);
}

void VersionSelection::clear(const QString& groupKey)
{
    m_selected.remove(groupKey);
}

Track VersionSelection::activeVersion(const TrackGroup& group) const
{
    auto it = m_selected.constFind(group.groupKey);
    if (it != m_selected.constEnd()) {
        for (const Track& t : group.versions) {
            if (t.id == it.value())
                return t;
        }
        // Stale choice: the version was removed from the library
        qDebug() << "[Grouping] Selected version" << it.value()
                 << "no longer in group" << group.groupKey;
    }
    return group.bestVersion();
}

// ═════════════════════════════════════════════════════════════════════
//  Identity
// ═════════════════════════════════════════════════════════════════════

QString TrackGrouping::normalize(const QString& str)
{
    // Unicode-aware \w so titles in non-Latin scripts keep their letters
    static const QRegularExpression punctuation(
        QStringLiteral("[^\\w\\s]"),
        QRegularExpression::UseUnicodePropertiesOption);
    static const QRegularExpression whitespace(
        QStringLiteral("\\s+"),
        QRegularExpression::UseUnicodePropertiesOption);

    QString s = str.toLower().trimmed();
    s.remove(punctuation);
    s.replace(whitespace, QStringLiteral(" "));
    return s;
}

QString TrackGrouping::groupKey(const Track& track)
{
    return normalize(track.artist) + QStringLiteral("::") + normalize(track.title);
}

// ═════════════════════════════════════════════════════════════════════
//  Quality
// ═════════════════════════════════════════════════════════════════════

FormatClass TrackGrouping::formatClass(const QString& format)
{
    const QString f = format.trimmed().toUpper();

    if (f.startsWith(QStringLiteral("DSD"))
        || f == QStringLiteral("DSF") || f == QStringLiteral("DFF"))
        return FormatClass::Dsd;

    static const QStringList lossless = {
        QStringLiteral("FLAC"), QStringLiteral("ALAC"), QStringLiteral("WAV"),
        QStringLiteral("AIFF"), QStringLiteral("APE"),  QStringLiteral("WV")
    };
    if (lossless.contains(f))
        return FormatClass::Lossless;

    if (f == QStringLiteral("OPUS") || f == QStringLiteral("AAC") || f == QStringLiteral("M4A"))
        return FormatClass::HighQualityLossy;

    if (f == QStringLiteral("OGG") || f == QStringLiteral("MP3") || f == QStringLiteral("WMA"))
        return FormatClass::StandardLossy;

    return FormatClass::Unknown;
}

int TrackGrouping::baseScore(const QString& format)
{
    const QString f = format.trimmed().toUpper();

    switch (formatClass(f)) {
    case FormatClass::Dsd:      return 1000;
    case FormatClass::Lossless: return 800;
    case FormatClass::HighQualityLossy:
        return f == QStringLiteral("OPUS") ? 400 : 350;
    case FormatClass::StandardLossy:
        if (f == QStringLiteral("OGG")) return 300;
        if (f == QStringLiteral("MP3")) return 250;
        return 200;  // WMA
    case FormatClass::Unknown:
        break;
    }
    return 100;
}

double TrackGrouping::qualityScore(const Track& track)
{
    const int base = baseScore(track.format);
    const double sampleRate = track.sampleRate > 0 ? track.sampleRate : 44100.0;
    const double bitrate = track.bitrate > 0 ? track.bitrate : 0.0;

    const double sampleRateBonus = std::min(sampleRate / 192000.0 * 100.0, 100.0);
    // Bitrate only distinguishes lossy encodes
    const double bitrateBonus = base < 800 ? std::min(bitrate / 320.0 * 50.0, 50.0) : 0.0;

    return base + sampleRateBonus + bitrateBonus;
}

// ═════════════════════════════════════════════════════════════════════
//  Grouping
// ═════════════════════════════════════════════════════════════════════

QVector<TrackGroup> TrackGrouping::group(const QVector<Track>& tracks)
{
    QHash<QString, int> indexByKey;   // groupKey → position in result
    QVector<TrackGroup> result;

    for (const Track& track : tracks) {
        const QString key = groupKey(track);
        auto it = indexByKey.constFind(key);
        if (it == indexByKey.constEnd()) {
            indexByKey.insert(key, result.size());
            result.append(TrackGroup{key, {track}});
        } else {
            result[it.value()].versions.append(track);
        }
    }

    for (TrackGroup& g : result) {
        if (g.versions.size() < 2) continue;
        std::stable_sort(g.versions.begin(), g.versions.end(),
                         [](const Track& a, const Track& b) {
            return qualityScore(a) > qualityScore(b);
        });
    }

    if (result.size() != tracks.size()) {
        qDebug() << "[Grouping]" << tracks.size() << "tracks →"
                 << result.size() << "groups";
    }
    return result;
}

QVector<Track> TrackGrouping::deduplicated(const QVector<Track>& tracks)
{
    QVector<Track> out;
    const QVector<TrackGroup> groups = group(tracks);
    out.reserve(groups.size());
    for (const TrackGroup& g : groups)
        out.append(g.bestVersion());
    return out;
}
