#pragma once

#include <QMetaObject>
#include <QObject>
#include <QTimer>
#include <QVector>
#include <functional>
#include <optional>

#include "IQueueEngine.h"
#include "MusicData.h"
#include "SessionConfig.h"

class IOutputEngine;

// Reconciles a queue engine (what should play) and an output engine (what
// is audible) into one observable session.
//
// Both engines are borrowed and must outlive the session.  Every command
// returns an Error; asynchronous failures arrive through errorOccurred().
// trackChanged() for a track is always emitted before the
// stateChanged(Playing) it leads to, and stateChanged() never repeats the
// previous value.
class PlaybackSession : public QObject {
    Q_OBJECT

public:
    enum class State { Stopped, Loading, Playing, Paused };
    Q_ENUM(State)

    enum class Error {
        None,
        NotInitialized,    // command issued before initialize() or after destroy()
        TrackLoadFailed,   // output engine rejected the track
        EngineDesync,      // queue engine did not produce the expected track change
        InvalidArgument,   // bad index or null track, nothing was changed
        EngineError        // error reported by one of the engines
    };
    Q_ENUM(Error)

    PlaybackSession(IQueueEngine* queueEngine, IOutputEngine* outputEngine,
                    const SessionConfig& config = SessionConfig(),
                    QObject* parent = nullptr);
    ~PlaybackSession() override;

    // ── Lifecycle ────────────────────────────────────────────────────
    bool initialize();
    void destroy();
    bool isInitialized() const { return m_initialized; }

    // ── Transport ────────────────────────────────────────────────────
    Error play();
    Error pause();
    Error stop();
    Error next();
    Error previous();
    Error seek(double secs);
    Error seekPercent(double percent);   // 0-100 of the current duration

    // ── Queue ────────────────────────────────────────────────────────
    Error addToQueueNext(const QueueTrack& track);
    Error addToQueueEnd(const QueueTrack& track);
    Error loadPlaylist(const QVector<QueueTrack>& tracks);
    Error appendToQueue(const QVector<QueueTrack>& tracks);
    Error removeFromQueue(int index);
    Error skipToQueueIndex(int index);
    Error clearQueue();

    QVector<QueueTrack> queue() const;
    QVector<QueueTrack> history() const;
    int queueLength() const;
    bool hasNext() const;
    bool hasPrevious() const;

    // ── Shuffle / repeat / volume ────────────────────────────────────
    Error setShuffle(IQueueEngine::ShuffleMode mode);
    IQueueEngine::ShuffleMode shuffle() const;
    Error setRepeat(IQueueEngine::RepeatMode mode);
    IQueueEngine::RepeatMode repeat() const;
    Error setVolume(int level);
    int volume() const;
    Error mute();
    Error unmute();
    Error toggleMute();
    bool isMuted() const;

    // ── State ────────────────────────────────────────────────────────
    State state() const;
    QueueTrack currentTrack() const { return m_currentTrack; }
    double position() const;
    double duration() const;
    const SessionConfig& config() const { return m_config; }

    static QString stateName(State state);
    static QString errorName(Error error);

signals:
    void stateChanged(PlaybackSession::State state);
    void trackChanged(const QueueTrack& track);
    void positionChanged(double secs);
    void volumeChanged(int level);
    void shuffleChanged(IQueueEngine::ShuffleMode mode);
    void repeatChanged(IQueueEngine::RepeatMode mode);
    void muteChanged(bool muted);
    void queueChanged();
    void errorOccurred(PlaybackSession::Error error, const QString& message);
    void playFailed(PlaybackSession::Error error);

private:
    State derivedState() const;
    void setAudioState(State state);
    void publishState();
    void fail(Error error, const QString& message);

    void awaitTrackChange();
    void cancelTrackChangeWait();
    void onTrackChangeTimeout();
    void navigate(const std::function<void()>& command);

    void onQueueTrackChanged(const QueueTrack& track);
    void onQueueStateChanged(IQueueEngine::State state);
    void onQueueError(const QString& message);
    void onLoadFinished(quint64 requestId, const QString& filePath, bool ok,
                        const QString& message);
    void onOutputEnded();
    void onOutputError(const QString& message);
    void onOutputPlayed();
    void onOutputPaused();

    IQueueEngine* m_queue = nullptr;
    IOutputEngine* m_output = nullptr;
    SessionConfig m_config;

    bool m_initialized = false;
    QVector<QMetaObject::Connection> m_connections;

    // Output-side view of playback; authoritative once the session has
    // driven the output engine, before that the queue engine's state is used
    State m_audioState = State::Stopped;
    bool m_audioAuthoritative = false;
    State m_lastEmittedState = State::Stopped;

    QueueTrack m_currentTrack;
    quint64 m_trackSerial = 0;    // bumped on every track change received

    // Bounded wait for the track change a play() should cause
    QTimer* m_trackChangeTimer = nullptr;
    QMetaObject::Connection m_trackChangeWait;
    bool m_awaitingTrackChange = false;

    struct PendingLoad { QString filePath; quint64 generation; };
    std::optional<PendingLoad> m_pendingLoad;
    quint64 m_loadGeneration = 0;
};
