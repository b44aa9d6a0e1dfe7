#pragma once

// Scriptable engines for PlaybackSession tests.  They only emit the base
// class signals, so no moc is needed.

#include <QStringList>
#include <QVector>
#include "IQueueEngine.h"
#include "audio/IOutputEngine.h"

inline QueueTrack makeQueueTrack(const QString& id, const QString& artist = QStringLiteral("Artist"))
{
    QueueTrack t;
    t.id = id;
    t.title = QStringLiteral("Title ") + id;
    t.artist = artist;
    t.filePath = QStringLiteral("/music/") + id + QStringLiteral(".flac");
    t.duration = 180;
    return t;
}

inline QVector<QueueTrack> makeQueueTracks(const QStringList& ids)
{
    QVector<QueueTrack> v;
    for (const QString& id : ids)
        v.append(makeQueueTrack(id));
    return v;
}

// ── FakeQueueEngine ─────────────────────────────────────────────────
class FakeQueueEngine : public IQueueEngine {
public:
    enum class TrackChangeMode {
        Immediate,   // trackChanged emitted from inside the command
        Deferred,    // state goes Loading; deliverTrackChange() emits later
        Never        // state goes Loading; nothing is ever emitted
    };

    TrackChangeMode mode = TrackChangeMode::Immediate;
    State st = State::Stopped;
    QVector<QueueTrack> upcoming;
    QVector<QueueTrack> hist;
    QueueTrack current;
    ShuffleMode shuffleMode = ShuffleMode::Off;
    RepeatMode repeatMode = RepeatMode::Off;
    int vol = 80;
    bool muted = false;

    int playCalls = 0;
    int pauseCalls = 0;
    int stopCalls = 0;
    int nextCalls = 0;
    int previousCalls = 0;

    void deliverTrackChange() { emit trackChanged(current); }
    void forceState(State s) { setState(s); }

    void play() override
    {
        ++playCalls;
        if (st == State::Paused) { setState(State::Playing); return; }
        if (st == State::Playing) return;
        advance(!current.isNull());
    }
    void pause() override
    {
        ++pauseCalls;
        if (st == State::Playing) setState(State::Paused);
    }
    void stop() override
    {
        ++stopCalls;
        setState(State::Stopped);
    }
    void next() override
    {
        ++nextCalls;
        const bool had = !current.isNull();
        if (had) {
            hist.append(current);
            current = QueueTrack();
        }
        advance(had);
    }
    void previous() override
    {
        ++previousCalls;
        if (hist.isEmpty()) return;
        if (!current.isNull()) upcoming.prepend(current);
        current = hist.takeLast();
        setState(State::Loading);
        emit trackChanged(current);
    }
    State state() const override { return st; }

    void loadPlaylist(const QVector<QueueTrack>& tracks) override
    {
        upcoming = tracks;
        hist.clear();
        emit queueChanged();
    }
    void appendToQueue(const QVector<QueueTrack>& tracks) override
    {
        upcoming += tracks;
        emit queueChanged();
    }
    void addToQueueNext(const QueueTrack& track) override
    {
        upcoming.prepend(track);
        emit queueChanged();
    }
    void addToQueueEnd(const QueueTrack& track) override
    {
        upcoming.append(track);
        emit queueChanged();
    }
    bool removeFromQueue(int index) override
    {
        if (index < 0 || index >= upcoming.size()) return false;
        upcoming.removeAt(index);
        emit queueChanged();
        return true;
    }
    void clearQueue() override
    {
        upcoming.clear();
        emit queueChanged();
    }
    bool skipToQueueIndex(int index) override
    {
        if (index < 0 || index >= upcoming.size()) return false;
        upcoming.remove(0, index);
        next();
        return true;
    }

    QVector<QueueTrack> queue() const override { return upcoming; }
    QVector<QueueTrack> history() const override { return hist; }
    int queueLength() const override { return upcoming.size(); }
    bool hasNext() const override { return !upcoming.isEmpty() || repeatMode == RepeatMode::One; }
    bool hasPrevious() const override { return !hist.isEmpty(); }

    void setShuffle(ShuffleMode mode) override { shuffleMode = mode; }
    ShuffleMode shuffle() const override { return shuffleMode; }
    void setRepeat(RepeatMode mode) override { repeatMode = mode; }
    RepeatMode repeat() const override { return repeatMode; }

    void setVolume(int level) override { vol = level; }
    int volume() const override { return vol; }
    void mute() override { muted = true; }
    void unmute() override { muted = false; }
    void toggleMute() override { muted = !muted; }
    bool isMuted() const override { return muted; }

private:
    void setState(State s)
    {
        if (st == s) return;
        st = s;
        emit stateChanged(st);
    }

    void advance(bool hadTrack)
    {
        if (mode == TrackChangeMode::Never) {
            setState(State::Loading);
            return;
        }
        if (upcoming.isEmpty()) {
            if (!current.isNull()) {
                hist.append(current);
                current = QueueTrack();
                hadTrack = true;
            }
            setState(State::Stopped);
            if (hadTrack) emit trackChanged(QueueTrack());
            return;
        }
        if (!current.isNull()) hist.append(current);
        current = upcoming.takeFirst();
        setState(State::Loading);
        if (mode == TrackChangeMode::Immediate)
            emit trackChanged(current);
    }
};

// ── FakeOutputEngine ────────────────────────────────────────────────
class FakeOutputEngine : public IOutputEngine {
public:
    bool completeLoadsImmediately = true;
    QStringList failPaths;

    QStringList loadRequests;
    QVector<quint64> loadIds;     // requestId per entry of loadRequests
    int playCalls = 0;
    int pauseCalls = 0;
    int stopCalls = 0;
    QVector<double> seeks;
    QVector<int> volumes;
    bool playing = false;
    bool destroyed = false;
    double pos = 0.0;
    double dur = 0.0;

    // Completes the most recent request for path, started with
    // completeLoadsImmediately == false
    void finishLoad(const QString& path, bool ok)
    {
        finishRequest(loadRequests.lastIndexOf(path), ok);
    }
    // Completes the index-th request ever made
    void finishRequest(int index, bool ok)
    {
        emit loadFinished(loadIds.at(index), loadRequests.at(index), ok,
                          ok ? QString() : QStringLiteral("cannot open"));
    }
    void finishEnded()
    {
        playing = false;
        emit ended();
    }

    void loadTrack(const QString& filePath, quint64 requestId) override
    {
        loadRequests << filePath;
        loadIds << requestId;
        playing = false;
        pos = 0.0;
        emit loadStarted(requestId, filePath);
        if (completeLoadsImmediately)
            finishRequest(loadRequests.size() - 1, !failPaths.contains(filePath));
    }
    void play() override
    {
        ++playCalls;
        if (playing) return;
        playing = true;
        emit played();
    }
    void pause() override
    {
        ++pauseCalls;
        if (!playing) return;
        playing = false;
        emit paused();
    }
    void stop() override
    {
        ++stopCalls;
        playing = false;
        pos = 0.0;
    }
    void seek(double secs) override
    {
        seeks << secs;
        pos = secs;
        emit timeUpdate(secs);
    }
    void setVolume(int level) override { volumes << level; }

    double position() const override { return pos; }
    double duration() const override { return dur; }

    void destroy() override { destroyed = true; }
};
