#pragma once

#include <QVector>
#include "IQueueEngine.h"
#include "MusicData.h"

class QRandomGenerator;

// Orderings applied to the source tier of a QueueEngine.  Pass a seeded
// generator for reproducible output; nullptr uses QRandomGenerator::global().
class ShuffleOrder {
public:
    static QVector<QueueTrack> apply(const QVector<QueueTrack>& tracks,
                                     IQueueEngine::ShuffleMode mode,
                                     QRandomGenerator* rng = nullptr);

    // Fisher-Yates over the whole list
    static void shuffleRandom(QVector<QueueTrack>& tracks, QRandomGenerator* rng = nullptr);

    // Tracks bucketed by artist, each bucket and the artist order shuffled,
    // then dealt round-robin so the same artist rarely plays twice in a row.
    // Lists of two or fewer tracks fall back to shuffleRandom().
    static void shuffleSmart(QVector<QueueTrack>& tracks, QRandomGenerator* rng = nullptr);
};
