#include "PlaybackSession.h"
#include "audio/IOutputEngine.h"

#include <QDebug>

namespace {

PlaybackSession::State fromQueueState(IQueueEngine::State state)
{
    switch (state) {
    case IQueueEngine::State::Stopped: return PlaybackSession::State::Stopped;
    case IQueueEngine::State::Playing: return PlaybackSession::State::Playing;
    case IQueueEngine::State::Paused:  return PlaybackSession::State::Paused;
    case IQueueEngine::State::Loading: return PlaybackSession::State::Loading;
    }
    return PlaybackSession::State::Stopped;
}

} // namespace

PlaybackSession::PlaybackSession(IQueueEngine* queueEngine, IOutputEngine* outputEngine,
                                 const SessionConfig& config, QObject* parent)
    : QObject(parent)
    , m_queue(queueEngine)
    , m_output(outputEngine)
    , m_config(config)
{
    m_trackChangeTimer = new QTimer(this);
    m_trackChangeTimer->setSingleShot(true);
    connect(m_trackChangeTimer, &QTimer::timeout,
            this, &PlaybackSession::onTrackChangeTimeout);
}

PlaybackSession::~PlaybackSession()
{
    // Engines are borrowed: only drop our connections to them
    for (const auto& c : m_connections)
        disconnect(c);
    if (m_trackChangeWait)
        disconnect(m_trackChangeWait);
}

// ═════════════════════════════════════════════════════════════════════
//  Lifecycle
// ═════════════════════════════════════════════════════════════════════

bool PlaybackSession::initialize()
{
    if (m_initialized) return true;
    if (!m_queue || !m_output) {
        qWarning() << "[Session] initialize() without both engines";
        return false;
    }

    m_connections << connect(m_queue, &IQueueEngine::trackChanged,
                             this, &PlaybackSession::onQueueTrackChanged);
    m_connections << connect(m_queue, &IQueueEngine::stateChanged,
                             this, &PlaybackSession::onQueueStateChanged);
    m_connections << connect(m_queue, &IQueueEngine::queueChanged,
                             this, &PlaybackSession::queueChanged);
    m_connections << connect(m_queue, &IQueueEngine::errorOccurred,
                             this, &PlaybackSession::onQueueError);

    m_connections << connect(m_output, &IOutputEngine::loadFinished,
                             this, &PlaybackSession::onLoadFinished);
    m_connections << connect(m_output, &IOutputEngine::ended,
                             this, &PlaybackSession::onOutputEnded);
    m_connections << connect(m_output, &IOutputEngine::errorOccurred,
                             this, &PlaybackSession::onOutputError);
    m_connections << connect(m_output, &IOutputEngine::played,
                             this, &PlaybackSession::onOutputPlayed);
    m_connections << connect(m_output, &IOutputEngine::paused,
                             this, &PlaybackSession::onOutputPaused);
    m_connections << connect(m_output, &IOutputEngine::timeUpdate,
                             this, &PlaybackSession::positionChanged);

    m_output->setVolume(m_queue->isMuted() ? 0 : m_queue->volume());

    m_audioState = State::Stopped;
    m_audioAuthoritative = false;
    m_lastEmittedState = derivedState();
    m_initialized = true;

    qDebug() << "[Session] Initialized — volume:" << m_queue->volume()
             << "muted:" << m_queue->isMuted()
             << "state:" << stateName(m_lastEmittedState);
    return true;
}

void PlaybackSession::destroy()
{
    if (!m_initialized) return;

    cancelTrackChangeWait();
    m_pendingLoad.reset();
    m_queue->stop();
    m_output->stop();
    setAudioState(State::Stopped);
    m_output->destroy();

    for (const auto& c : m_connections)
        disconnect(c);
    m_connections.clear();
    m_initialized = false;

    qDebug() << "[Session] Destroyed";
}

// ═════════════════════════════════════════════════════════════════════
//  Transport
// ═════════════════════════════════════════════════════════════════════

// ── play ────────────────────────────────────────────────────────────
PlaybackSession::Error PlaybackSession::play()
{
    if (!m_initialized) return Error::NotInitialized;

    switch (m_audioState) {
    case State::Playing:
        return Error::None;

    case State::Paused:
        // A queue engine that reports Loading would advance on play()
        if (m_queue->state() == IQueueEngine::State::Paused)
            m_queue->play();
        if (m_awaitingTrackChange) {
            // Paused before the track change arrived; resume the bounded wait
            setAudioState(State::Loading);
            m_trackChangeTimer->start(m_config.trackChangeTimeoutMs);
            return Error::None;
        }
        if (m_pendingLoad) {
            // Paused before the load finished; start when it does
            setAudioState(State::Loading);
            return Error::None;
        }
        m_output->play();
        setAudioState(State::Playing);
        return Error::None;

    case State::Loading:
        if (m_pendingLoad || m_awaitingTrackChange) {
            qDebug() << "[Session] play() — already starting";
            return Error::None;
        }
        break;

    case State::Stopped:
        break;
    }

    awaitTrackChange();
    m_queue->play();

    // Track change delivered synchronously: the load is already under way
    if (!m_awaitingTrackChange)
        return Error::None;

    const IQueueEngine::State qs = m_queue->state();
    if (qs == IQueueEngine::State::Loading) {
        setAudioState(State::Loading);
        m_trackChangeTimer->start(m_config.trackChangeTimeoutMs);
        return Error::None;
    }

    cancelTrackChangeWait();

    if (qs == IQueueEngine::State::Playing) {
        m_output->play();
        setAudioState(State::Playing);
        return Error::None;
    }

    qWarning() << "[Session] play(): queue engine stayed"
               << IQueueEngine::stateName(qs) << "with no track change";
    setAudioState(State::Stopped);
    fail(Error::EngineDesync, QStringLiteral("Queue engine did not start a track"));
    emit playFailed(Error::EngineDesync);
    return Error::EngineDesync;
}

// ── pause ───────────────────────────────────────────────────────────
PlaybackSession::Error PlaybackSession::pause()
{
    if (!m_initialized) return Error::NotInitialized;
    if (derivedState() == State::Stopped) return Error::None;

    // A pending track change stays connected but may no longer time out;
    // play() rearms the timer
    m_trackChangeTimer->stop();

    m_queue->pause();
    m_output->pause();
    setAudioState(State::Paused);
    return Error::None;
}

// ── stop ────────────────────────────────────────────────────────────
PlaybackSession::Error PlaybackSession::stop()
{
    if (!m_initialized) return Error::NotInitialized;

    cancelTrackChangeWait();
    m_pendingLoad.reset();
    m_queue->stop();
    m_output->stop();
    setAudioState(State::Stopped);
    return Error::None;
}

PlaybackSession::Error PlaybackSession::next()
{
    if (!m_initialized) return Error::NotInitialized;

    navigate([this]() { m_queue->next(); });
    return Error::None;
}

// ── previous ────────────────────────────────────────────────────────
PlaybackSession::Error PlaybackSession::previous()
{
    if (!m_initialized) return Error::NotInitialized;

    // More than a few seconds in: restart the current track instead
    if (!m_currentTrack.isNull() && m_output->position() > m_config.restartThresholdSecs) {
        m_output->seek(0.0);
        return Error::None;
    }

    navigate([this]() { m_queue->previous(); });
    return Error::None;
}

PlaybackSession::Error PlaybackSession::seek(double secs)
{
    if (!m_initialized) return Error::NotInitialized;

    m_output->seek(qMax(0.0, secs));
    return Error::None;
}

PlaybackSession::Error PlaybackSession::seekPercent(double percent)
{
    if (!m_initialized) return Error::NotInitialized;

    const double p = qBound(0.0, percent, 100.0);
    m_output->seek(p / 100.0 * duration());
    return Error::None;
}

// ── navigate ────────────────────────────────────────────────────────
// Loading is assumed up front; the track change the command produces
// settles the real state.  A command that changed nothing reverts it.
void PlaybackSession::navigate(const std::function<void()>& command)
{
    cancelTrackChangeWait();

    const State before = m_audioState;
    const bool wasAuthoritative = m_audioAuthoritative;
    const quint64 serial = m_trackSerial;

    m_audioState = State::Loading;
    m_audioAuthoritative = true;

    command();

    if (m_trackSerial == serial) {
        if (m_queue->state() == IQueueEngine::State::Loading) {
            // Engine is switching asynchronously; bound the wait
            awaitTrackChange();
            m_trackChangeTimer->start(m_config.trackChangeTimeoutMs);
        } else {
            m_audioState = before;
            m_audioAuthoritative = wasAuthoritative;
        }
    }
    publishState();
}

// ═════════════════════════════════════════════════════════════════════
//  Queue
// ═════════════════════════════════════════════════════════════════════

PlaybackSession::Error PlaybackSession::addToQueueNext(const QueueTrack& track)
{
    if (!m_initialized) return Error::NotInitialized;
    if (track.isNull()) return Error::InvalidArgument;

    m_queue->addToQueueNext(track);
    return Error::None;
}

PlaybackSession::Error PlaybackSession::addToQueueEnd(const QueueTrack& track)
{
    if (!m_initialized) return Error::NotInitialized;
    if (track.isNull()) return Error::InvalidArgument;

    m_queue->addToQueueEnd(track);
    return Error::None;
}

PlaybackSession::Error PlaybackSession::loadPlaylist(const QVector<QueueTrack>& tracks)
{
    if (!m_initialized) return Error::NotInitialized;

    m_queue->loadPlaylist(tracks);
    return Error::None;
}

PlaybackSession::Error PlaybackSession::appendToQueue(const QVector<QueueTrack>& tracks)
{
    if (!m_initialized) return Error::NotInitialized;

    m_queue->appendToQueue(tracks);
    return Error::None;
}

PlaybackSession::Error PlaybackSession::removeFromQueue(int index)
{
    if (!m_initialized) return Error::NotInitialized;
    if (index < 0 || index >= m_queue->queueLength()) {
        qWarning() << "[Session] removeFromQueue: index" << index << "out of range";
        return Error::InvalidArgument;
    }

    if (!m_queue->removeFromQueue(index))
        return Error::InvalidArgument;
    return Error::None;
}

PlaybackSession::Error PlaybackSession::skipToQueueIndex(int index)
{
    if (!m_initialized) return Error::NotInitialized;
    if (index < 0 || index >= m_queue->queueLength()) {
        qWarning() << "[Session] skipToQueueIndex: index" << index << "out of range";
        return Error::InvalidArgument;
    }

    bool accepted = true;
    navigate([this, index, &accepted]() { accepted = m_queue->skipToQueueIndex(index); });
    return accepted ? Error::None : Error::InvalidArgument;
}

PlaybackSession::Error PlaybackSession::clearQueue()
{
    if (!m_initialized) return Error::NotInitialized;

    m_queue->clearQueue();
    return Error::None;
}

QVector<QueueTrack> PlaybackSession::queue() const
{
    return m_initialized ? m_queue->queue() : QVector<QueueTrack>();
}

QVector<QueueTrack> PlaybackSession::history() const
{
    return m_initialized ? m_queue->history() : QVector<QueueTrack>();
}

int PlaybackSession::queueLength() const
{
    return m_initialized ? m_queue->queueLength() : 0;
}

bool PlaybackSession::hasNext() const
{
    return m_initialized && m_queue->hasNext();
}

bool PlaybackSession::hasPrevious() const
{
    return m_initialized && m_queue->hasPrevious();
}

// ═════════════════════════════════════════════════════════════════════
//  Shuffle / repeat / volume
// ═════════════════════════════════════════════════════════════════════

PlaybackSession::Error PlaybackSession::setShuffle(IQueueEngine::ShuffleMode mode)
{
    if (!m_initialized) return Error::NotInitialized;
    if (m_queue->shuffle() == mode) return Error::None;

    m_queue->setShuffle(mode);
    emit shuffleChanged(mode);
    return Error::None;
}

IQueueEngine::ShuffleMode PlaybackSession::shuffle() const
{
    return m_initialized ? m_queue->shuffle() : IQueueEngine::ShuffleMode::Off;
}

PlaybackSession::Error PlaybackSession::setRepeat(IQueueEngine::RepeatMode mode)
{
    if (!m_initialized) return Error::NotInitialized;
    if (m_queue->repeat() == mode) return Error::None;

    m_queue->setRepeat(mode);
    emit repeatChanged(mode);
    return Error::None;
}

IQueueEngine::RepeatMode PlaybackSession::repeat() const
{
    return m_initialized ? m_queue->repeat() : IQueueEngine::RepeatMode::Off;
}

// ── setVolume ───────────────────────────────────────────────────────
PlaybackSession::Error PlaybackSession::setVolume(int level)
{
    if (!m_initialized) return Error::NotInitialized;

    const int clamped = qBound(0, level, 100);
    if (clamped == m_queue->volume()) return Error::None;

    m_queue->setVolume(clamped);
    if (!m_queue->isMuted())
        m_output->setVolume(clamped);
    emit volumeChanged(clamped);
    return Error::None;
}

int PlaybackSession::volume() const
{
    return m_initialized ? m_queue->volume() : 0;
}

PlaybackSession::Error PlaybackSession::mute()
{
    if (!m_initialized) return Error::NotInitialized;
    if (m_queue->isMuted()) return Error::None;

    m_queue->mute();
    m_output->setVolume(0);
    emit muteChanged(true);
    return Error::None;
}

PlaybackSession::Error PlaybackSession::unmute()
{
    if (!m_initialized) return Error::NotInitialized;
    if (!m_queue->isMuted()) return Error::None;

    m_queue->unmute();
    m_output->setVolume(m_queue->volume());
    emit muteChanged(false);
    return Error::None;
}

PlaybackSession::Error PlaybackSession::toggleMute()
{
    if (!m_initialized) return Error::NotInitialized;
    return m_queue->isMuted() ? unmute() : mute();
}

bool PlaybackSession::isMuted() const
{
    return m_initialized && m_queue->isMuted();
}

// ═════════════════════════════════════════════════════════════════════
//  State
// ═════════════════════════════════════════════════════════════════════

PlaybackSession::State PlaybackSession::state() const
{
    return m_initialized ? derivedState() : m_lastEmittedState;
}

double PlaybackSession::position() const
{
    return m_output ? m_output->position() : 0.0;
}

double PlaybackSession::duration() const
{
    const double d = m_output ? m_output->duration() : 0.0;
    return d > 0.0 ? d : static_cast<double>(m_currentTrack.duration);
}

QString PlaybackSession::stateName(State state)
{
    switch (state) {
    case State::Stopped: return QStringLiteral("stopped");
    case State::Loading: return QStringLiteral("loading");
    case State::Playing: return QStringLiteral("playing");
    case State::Paused:  return QStringLiteral("paused");
    }
    return QStringLiteral("stopped");
}

QString PlaybackSession::errorName(Error error)
{
    switch (error) {
    case Error::None:            return QStringLiteral("none");
    case Error::NotInitialized:  return QStringLiteral("not initialized");
    case Error::TrackLoadFailed: return QStringLiteral("track load failed");
    case Error::EngineDesync:    return QStringLiteral("engine desync");
    case Error::InvalidArgument: return QStringLiteral("invalid argument");
    case Error::EngineError:     return QStringLiteral("engine error");
    }
    return QStringLiteral("unknown");
}

PlaybackSession::State PlaybackSession::derivedState() const
{
    if (!m_audioAuthoritative)
        return fromQueueState(m_queue->state());
    return m_audioState;
}

void PlaybackSession::setAudioState(State state)
{
    m_audioState = state;
    m_audioAuthoritative = true;
    publishState();
}

void PlaybackSession::publishState()
{
    const State s = derivedState();
    if (s == m_lastEmittedState) return;
    m_lastEmittedState = s;
    emit stateChanged(s);
}

void PlaybackSession::fail(Error error, const QString& message)
{
    qWarning() << "[Session] Error:" << errorName(error) << "—" << message;
    emit errorOccurred(error, message);
}

// ═════════════════════════════════════════════════════════════════════
//  Track-change wait
// ═════════════════════════════════════════════════════════════════════

void PlaybackSession::awaitTrackChange()
{
    cancelTrackChangeWait();
    m_awaitingTrackChange = true;
    m_trackChangeWait = connect(m_queue, &IQueueEngine::trackChanged, this,
                                [this](const QueueTrack&) {
        m_awaitingTrackChange = false;
        m_trackChangeTimer->stop();
    }, Qt::SingleShotConnection);
}

void PlaybackSession::cancelTrackChangeWait()
{
    if (m_trackChangeWait)
        disconnect(m_trackChangeWait);
    m_trackChangeWait = QMetaObject::Connection();
    m_awaitingTrackChange = false;
    m_trackChangeTimer->stop();
}

void PlaybackSession::onTrackChangeTimeout()
{
    if (!m_awaitingTrackChange) return;

    cancelTrackChangeWait();
    qWarning() << "[Session] No track change within" << m_config.trackChangeTimeoutMs << "ms";
    setAudioState(State::Stopped);
    fail(Error::EngineDesync, QStringLiteral("Timed out waiting for the queue engine"));
    emit playFailed(Error::EngineDesync);
}

// ═════════════════════════════════════════════════════════════════════
//  Engine signals
// ═════════════════════════════════════════════════════════════════════

// ── onQueueTrackChanged ─────────────────────────────────────────────
void PlaybackSession::onQueueTrackChanged(const QueueTrack& track)
{
    ++m_trackSerial;
    m_currentTrack = track;
    emit trackChanged(track);

    if (track.isNull()) {
        qDebug() << "[Session] Queue exhausted";
        m_pendingLoad.reset();
        m_output->stop();
        setAudioState(State::Stopped);
        return;
    }

    if (track.filePath.isEmpty()) {
        m_pendingLoad.reset();
        m_output->stop();
        setAudioState(State::Stopped);
        fail(Error::TrackLoadFailed,
             QStringLiteral("Track %1 has no playable location").arg(track.id));
        emit playFailed(Error::TrackLoadFailed);
        return;
    }

    m_pendingLoad = PendingLoad{track.filePath, ++m_loadGeneration};
    qDebug() << "[Session] Loading" << track.title << "#" << m_loadGeneration;
    // A user pause holds the new track once it has loaded
    if (m_audioState != State::Paused)
        setAudioState(State::Loading);
    m_output->loadTrack(track.filePath, m_loadGeneration);
}

void PlaybackSession::onQueueStateChanged(IQueueEngine::State state)
{
    Q_UNUSED(state)
    if (!m_audioAuthoritative)
        publishState();
}

void PlaybackSession::onQueueError(const QString& message)
{
    fail(Error::EngineError, message);
}

// ── onLoadFinished ──────────────────────────────────────────────────
void PlaybackSession::onLoadFinished(quint64 requestId, const QString& filePath,
                                     bool ok, const QString& message)
{
    if (!m_pendingLoad || m_pendingLoad->generation != requestId) {
        qDebug() << "[Session] Ignoring stale load completion #" << requestId << filePath;
        return;
    }
    const quint64 generation = m_pendingLoad->generation;
    m_pendingLoad.reset();

    if (!ok) {
        setAudioState(State::Stopped);
        fail(Error::TrackLoadFailed, message.isEmpty()
             ? QStringLiteral("Could not load %1").arg(filePath) : message);
        emit playFailed(Error::TrackLoadFailed);
        return;
    }

    if (m_audioState == State::Paused) {
        qDebug() << "[Session] Load #" << generation << "done while paused — holding";
        return;
    }

    m_output->play();
    setAudioState(State::Playing);
}

// ── onOutputEnded ───────────────────────────────────────────────────
void PlaybackSession::onOutputEnded()
{
    if (m_queue->repeat() == IQueueEngine::RepeatMode::One && !m_currentTrack.isNull()) {
        qDebug() << "[Session] Repeat One — restarting" << m_currentTrack.title;
        m_output->seek(0.0);
        m_output->play();
        return;
    }
    next();
}

void PlaybackSession::onOutputError(const QString& message)
{
    if (!m_pendingLoad) {
        cancelTrackChangeWait();
        m_output->stop();
        setAudioState(State::Stopped);
    }
    fail(Error::EngineError, message);
}

void PlaybackSession::onOutputPlayed()
{
    if (m_pendingLoad) return;
    setAudioState(State::Playing);
}

void PlaybackSession::onOutputPaused()
{
    if (m_pendingLoad) return;
    if (m_audioState == State::Playing)
        setAudioState(State::Paused);
}
