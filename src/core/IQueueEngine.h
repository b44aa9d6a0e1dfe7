#pragma once

#include <QObject>
#include <QString>
#include <QVector>
#include "MusicData.h"

// Contract of the engine that owns ordering, shuffle/repeat policy, history
// and "which track is current".  It knows nothing about audio rendering:
// its state only says what it last decided, not what is audible.
//
// trackChanged() fires whenever the engine moves to another track (next,
// previous, skip, play from stopped, end of queue).  A null QueueTrack means
// the queue is exhausted.  Implementations may emit it synchronously from
// inside the command that caused it.
class IQueueEngine : public QObject {
    Q_OBJECT

public:
    enum class State { Stopped, Playing, Paused, Loading };
    Q_ENUM(State)

    enum class ShuffleMode { Off, Random, Smart };
    Q_ENUM(ShuffleMode)

    enum class RepeatMode { Off, All, One };
    Q_ENUM(RepeatMode)

    explicit IQueueEngine(QObject* parent = nullptr) : QObject(parent) {}
    ~IQueueEngine() override = default;

    // ── Transport ────────────────────────────────────────────────────
    // play(): Paused → Playing; Stopped/Loading → advance to the next
    // queued track; Playing → nothing.
    virtual void play() = 0;
    virtual void pause() = 0;
    virtual void stop() = 0;
    virtual void next() = 0;
    virtual void previous() = 0;
    virtual State state() const = 0;

    // ── Queue ────────────────────────────────────────────────────────
    virtual void loadPlaylist(const QVector<QueueTrack>& tracks) = 0;
    virtual void appendToQueue(const QVector<QueueTrack>& tracks) = 0;
    virtual void addToQueueNext(const QueueTrack& track) = 0;
    virtual void addToQueueEnd(const QueueTrack& track) = 0;
    virtual bool removeFromQueue(int index) = 0;
    virtual void clearQueue() = 0;
    virtual bool skipToQueueIndex(int index) = 0;

    virtual QVector<QueueTrack> queue() const = 0;     // upcoming tracks
    virtual QVector<QueueTrack> history() const = 0;   // oldest first
    virtual int queueLength() const = 0;
    virtual bool hasNext() const = 0;
    virtual bool hasPrevious() const = 0;

    // ── Policy ───────────────────────────────────────────────────────
    virtual void setShuffle(ShuffleMode mode) = 0;
    virtual ShuffleMode shuffle() const = 0;
    virtual void setRepeat(RepeatMode mode) = 0;
    virtual RepeatMode repeat() const = 0;

    // ── Volume (0-100) ───────────────────────────────────────────────
    virtual void setVolume(int level) = 0;
    virtual int volume() const = 0;
    virtual void mute() = 0;
    virtual void unmute() = 0;
    virtual void toggleMute() = 0;
    virtual bool isMuted() const = 0;

    // ── Names used in config files and logs ──────────────────────────
    static QString stateName(State state);
    static QString shuffleModeName(ShuffleMode mode);
    static QString repeatModeName(RepeatMode mode);
    static ShuffleMode shuffleModeFromName(const QString& name, bool* ok = nullptr);
    static RepeatMode repeatModeFromName(const QString& name, bool* ok = nullptr);

signals:
    void stateChanged(IQueueEngine::State state);
    void trackChanged(const QueueTrack& track);
    void queueChanged();
    void errorOccurred(const QString& message);
};
