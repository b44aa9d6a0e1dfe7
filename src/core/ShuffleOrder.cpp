#include "ShuffleOrder.h"

#include <QHash>
#include <QRandomGenerator>
#include <QStringList>
#include <algorithm>

namespace {

template <typename T>
void fisherYates(QVector<T>& items, QRandomGenerator* rng)
{
    for (int i = items.size() - 1; i > 0; --i) {
        int j = static_cast<int>(rng->bounded(i + 1));
        std::swap(items[i], items[j]);
    }
}

} // namespace

QVector<QueueTrack> ShuffleOrder::apply(const QVector<QueueTrack>& tracks,
                                        IQueueEngine::ShuffleMode mode,
                                        QRandomGenerator* rng)
{
    QVector<QueueTrack> out = tracks;
    switch (mode) {
    case IQueueEngine::ShuffleMode::Off:
        break;
    case IQueueEngine::ShuffleMode::Random:
        shuffleRandom(out, rng);
        break;
    case IQueueEngine::ShuffleMode::Smart:
        shuffleSmart(out, rng);
        break;
    }
    return out;
}

void ShuffleOrder::shuffleRandom(QVector<QueueTrack>& tracks, QRandomGenerator* rng)
{
    fisherYates(tracks, rng ? rng : QRandomGenerator::global());
}

void ShuffleOrder::shuffleSmart(QVector<QueueTrack>& tracks, QRandomGenerator* rng)
{
    if (tracks.size() <= 2) {
        shuffleRandom(tracks, rng);
        return;
    }
    if (!rng) rng = QRandomGenerator::global();

    // Buckets in order of first appearance so a seeded run is reproducible
    QStringList artists;
    QHash<QString, QVector<QueueTrack>> byArtist;
    for (const QueueTrack& t : tracks) {
        if (!byArtist.contains(t.artist))
            artists.append(t.artist);
        byArtist[t.artist].append(t);
    }

    for (const QString& artist : artists)
        fisherYates(byArtist[artist], rng);
    fisherYates(artists, rng);

    QVector<QueueTrack> result;
    result.reserve(tracks.size());
    for (int round = 0; result.size() < tracks.size(); ++round) {
        for (const QString& artist : artists) {
            const QVector<QueueTrack>& bucket = byArtist[artist];
            if (round < bucket.size())
                result.append(bucket.at(round));
        }
    }

    tracks = result;
}
