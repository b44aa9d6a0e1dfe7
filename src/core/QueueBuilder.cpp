#include "QueueBuilder.h"

#include <QDebug>

QueueTrack QueueBuilder::toQueueTrack(const Track& track, const TrackSource& source)
{
    QueueTrack q;
    q.id = track.id;
    q.filePath = track.filePath;
    q.title = track.title;
    q.artist = track.artist;
    q.album = track.album;
    q.duration = track.duration;
    q.trackNumber = track.trackNumber;
    q.source = source;
    return q;
}

bool QueueBuilder::isValidStartIndex(const QVector<Track>& tracks, int startIndex)
{
    if (tracks.isEmpty()) return true;
    return startIndex >= 0 && startIndex < tracks.size();
}

QVector<QueueTrack> QueueBuilder::buildQueue(const QVector<Track>& tracks, int startIndex,
                                             const TrackSource& source)
{
    if (tracks.isEmpty()) return {};

    if (!isValidStartIndex(tracks, startIndex)) {
        qWarning() << "[QueueBuilder] Start index" << startIndex
                   << "out of range for" << tracks.size() << "tracks";
        return {};
    }

    QVector<QueueTrack> queue;
    queue.reserve(tracks.size());

    const int n = tracks.size();
    for (int i = 0; i < n; ++i) {
        const Track& t = tracks.at((startIndex + i) % n);
        if (t.filePath.isEmpty()) continue;

        // Collapse back-to-back repeats; later recurrences are kept
        if (!queue.isEmpty() && queue.last().id == t.id) continue;

        queue.append(toQueueTrack(t, source));
    }

    if (queue.size() != n) {
        qDebug() << "[QueueBuilder] Built" << queue.size() << "of" << n
                 << "tracks (start" << startIndex << ")";
    }
    return queue;
}

QVector<QueueTrack> QueueBuilder::buildQueueFrom(const QVector<Track>& tracks,
                                                 const QString& trackId,
                                                 const TrackSource& source)
{
    QVector<Track> playable;
    playable.reserve(tracks.size());
    int start = -1;
    for (const Track& t : tracks) {
        if (t.filePath.isEmpty()) continue;
        if (start < 0 && t.id == trackId)
            start = playable.size();
        playable.append(t);
    }

    if (start < 0) {
        qDebug() << "[QueueBuilder] Track" << trackId << "not playable in list";
        return {};
    }
    return buildQueue(playable, start, source);
}

QVector<QueueTrack> QueueBuilder::removeConsecutiveDuplicates(const QVector<QueueTrack>& queue)
{
    QVector<QueueTrack> out;
    out.reserve(queue.size());
    for (const QueueTrack& t : queue) {
        if (!out.isEmpty() && out.last().id == t.id) continue;
        out.append(t);
    }
    return out;
}
