#pragma once

#include <QString>
#include <QVector>
#include "MusicData.h"

// Builds the linear play queue handed to a PlaybackSession when the user
// starts playback somewhere inside a track list.
class QueueBuilder {
public:
    static QueueTrack toQueueTrack(const Track& track, const TrackSource& source = {});

    // Caller-boundary check.  Empty lists accept any index (they build to
    // an empty queue); otherwise the index must lie in [0, size).
    static bool isValidStartIndex(const QVector<Track>& tracks, int startIndex);

    // tracks[startIndex:] ++ tracks[:startIndex], unplayable entries dropped,
    // consecutive repeats of the same id collapsed.  Returns an empty queue
    // for an invalid startIndex.
    static QVector<QueueTrack> buildQueue(const QVector<Track>& tracks, int startIndex,
                                          const TrackSource& source = {});

    // Same, starting at the playable track with the given id.  Empty when the
    // id is unknown or the track has no playable location.
    static QVector<QueueTrack> buildQueueFrom(const QVector<Track>& tracks,
                                              const QString& trackId,
                                              const TrackSource& source = {});

    static QVector<QueueTrack> removeConsecutiveDuplicates(const QVector<QueueTrack>& queue);
};
