#include "QueueEngine.h"
#include "QueueBuilder.h"
#include "ShuffleOrder.h"

#include <QDebug>

QueueEngine::QueueEngine(QObject* parent)
    : IQueueEngine(parent)
{
}

// ═════════════════════════════════════════════════════════════════════
//  Transport
// ═════════════════════════════════════════════════════════════════════

void QueueEngine::play()
{
    switch (m_state) {
    case State::Paused:
        setState(State::Playing);
        break;
    case State::Stopped:
    case State::Loading:
        // Loading counts as "not started yet": this advances to another track
        playNextInQueue();
        break;
    case State::Playing:
        break;
    }
}

void QueueEngine::pause()
{
    if (m_state == State::Playing)
        setState(State::Paused);
}

void QueueEngine::stop()
{
    setState(State::Stopped);
}

void QueueEngine::next()
{
    // Manual skip: Repeat One does not hold the current track
    if (!m_current.isNull()) {
        pushHistory(m_current);
        m_current = QueueTrack();
        playNextInQueue(true);
        return;
    }
    playNextInQueue();
}

void QueueEngine::previous()
{
    if (m_history.isEmpty()) {
        if (m_current.isNull()) return;
        qDebug() << "[QueueEngine] No history — restarting" << m_current.title;
        setState(State::Loading);
        emit trackChanged(m_current);
        return;
    }

    QueueTrack prev = m_history.takeLast();

    // Un-consume the current track so it plays again after prev
    if (!m_current.isNull()) {
        if (m_sourceIndex > 0 && m_source.at(m_sourceIndex - 1).id == m_current.id)
            m_sourceIndex--;
        else
            m_explicit.prepend(m_current);
    }

    m_current = prev;
    setState(State::Loading);
    emit queueChanged();
    emit trackChanged(m_current);
}

// ── playNextInQueue ─────────────────────────────────────────────────
// hadTrack: a track was current before the caller cleared it, so running
// dry has to be announced with a null trackChanged.
void QueueEngine::playNextInQueue(bool hadTrack)
{
    if (m_repeat == RepeatMode::One && !m_current.isNull()) {
        qDebug() << "[QueueEngine] Repeat One —" << m_current.title;
        setState(State::Loading);
        emit trackChanged(m_current);
        return;
    }

    QueueTrack nextTrack;
    if (!takeNext(nextTrack)) {
        if (!m_current.isNull()) {
            pushHistory(m_current);
            m_current = QueueTrack();
            hadTrack = true;
        }
        setState(State::Stopped);
        if (hadTrack) {
            qDebug() << "[QueueEngine] End of queue";
            emit trackChanged(QueueTrack());
        } else {
            qDebug() << "[QueueEngine] Nothing to play";
        }
        return;
    }

    if (!m_current.isNull())
        pushHistory(m_current);
    m_current = nextTrack;

    setState(State::Loading);
    emit queueChanged();
    emit trackChanged(m_current);
}

bool QueueEngine::takeNext(QueueTrack& out)
{
    if (!m_explicit.isEmpty()) {
        out = m_explicit.takeFirst();
        return true;
    }

    if (m_sourceIndex >= m_source.size()) {
        if (m_repeat != RepeatMode::All || m_originalSource.isEmpty())
            return false;
        reloadSource();
        if (m_source.isEmpty())
            return false;
    }

    out = m_source.at(m_sourceIndex++);
    return true;
}

void QueueEngine::reloadSource()
{
    m_source = ShuffleOrder::apply(m_originalSource, m_shuffle, m_rng);
    m_sourceShuffled = (m_shuffle != ShuffleMode::Off);
    m_sourceIndex = 0;
    dedupeSource();
    qDebug() << "[QueueEngine] Repeat All — reloaded" << m_source.size() << "tracks";
}

void QueueEngine::pushHistory(const QueueTrack& track)
{
    m_history.append(track);
    while (m_history.size() > m_historySize)
        m_history.removeFirst();
}

void QueueEngine::setState(State state)
{
    if (m_state == state) return;
    m_state = state;
    emit stateChanged(m_state);
}

// Collapses back-to-back repeats in the source tier, keeping the cursor on
// the same unplayed track.
void QueueEngine::dedupeSource()
{
    QVector<QueueTrack> out;
    out.reserve(m_source.size());
    int newIndex = 0;
    for (int i = 0; i < m_source.size(); ++i) {
        const QueueTrack& t = m_source.at(i);
        if (!out.isEmpty() && out.last().id == t.id) continue;
        out.append(t);
        if (i < m_sourceIndex)
            newIndex = out.size();
    }
    m_source = out;
    m_sourceIndex = newIndex;
}

// ═════════════════════════════════════════════════════════════════════
//  Queue
// ═════════════════════════════════════════════════════════════════════

void QueueEngine::loadPlaylist(const QVector<QueueTrack>& tracks)
{
    m_originalSource = QueueBuilder::removeConsecutiveDuplicates(tracks);
    m_source = QueueBuilder::removeConsecutiveDuplicates(
        ShuffleOrder::apply(m_originalSource, m_shuffle, m_rng));
    m_sourceShuffled = (m_shuffle != ShuffleMode::Off);
    m_sourceIndex = 0;
    m_history.clear();

    qDebug() << "[QueueEngine] Loaded" << m_source.size() << "tracks"
             << "shuffle:" << shuffleModeName(m_shuffle);
    emit queueChanged();
}

void QueueEngine::appendToQueue(const QVector<QueueTrack>& tracks)
{
    if (tracks.isEmpty()) return;

    m_originalSource.append(tracks);
    m_source.append(ShuffleOrder::apply(tracks, m_shuffle, m_rng));
    dedupeSource();

    qDebug() << "[QueueEngine] Appended" << tracks.size() << "tracks";
    emit queueChanged();
}

void QueueEngine::addToQueueNext(const QueueTrack& track)
{
    m_explicit.prepend(track);
    qDebug() << "[QueueEngine] Play next:" << track.title;
    emit queueChanged();
}

void QueueEngine::addToQueueEnd(const QueueTrack& track)
{
    m_explicit.append(track);
    qDebug() << "[QueueEngine] Queued:" << track.title
             << "(" << m_explicit.size() << "pending)";
    emit queueChanged();
}

bool QueueEngine::removeFromQueue(int index)
{
    if (index < 0 || index >= queueLength()) return false;

    if (index < m_explicit.size()) {
        m_explicit.removeAt(index);
    } else {
        const QueueTrack removed = m_source.takeAt(m_sourceIndex + index - m_explicit.size());
        for (int i = 0; i < m_originalSource.size(); ++i) {
            if (m_originalSource.at(i).id == removed.id) {
                m_originalSource.removeAt(i);
                break;
            }
        }
    }

    emit queueChanged();
    return true;
}

bool QueueEngine::moveInQueue(int fromIndex, int toIndex)
{
    const int len = queueLength();
    if (fromIndex < 0 || fromIndex >= len) return false;
    if (toIndex < 0 || toIndex >= len) return false;
    if (fromIndex == toIndex) return true;

    const int explicitLen = m_explicit.size();
    if (fromIndex < explicitLen && toIndex < explicitLen) {
        m_explicit.move(fromIndex, toIndex);
    } else if (fromIndex >= explicitLen && toIndex >= explicitLen) {
        m_source.move(m_sourceIndex + fromIndex - explicitLen,
                      m_sourceIndex + toIndex - explicitLen);
    } else {
        qDebug() << "[QueueEngine] Refusing move across queue tiers" << fromIndex << "→" << toIndex;
        return false;
    }

    emit queueChanged();
    return true;
}

void QueueEngine::clearQueue()
{
    m_explicit.clear();
    m_source.clear();
    m_originalSource.clear();
    m_sourceIndex = 0;
    m_sourceShuffled = false;
    emit queueChanged();
}

bool QueueEngine::skipToQueueIndex(int index)
{
    if (index < 0 || index >= queueLength()) return false;

    // Skipped-over tracks were never played, so only the current one is kept
    const bool hadTrack = !m_current.isNull();
    if (hadTrack) {
        pushHistory(m_current);
        m_current = QueueTrack();
    }

    const int explicitLen = m_explicit.size();
    if (index < explicitLen) {
        m_explicit.remove(0, index);
    } else {
        m_explicit.clear();
        m_sourceIndex += index - explicitLen;
    }

    playNextInQueue(hadTrack);
    return true;
}

QVector<QueueTrack> QueueEngine::queue() const
{
    QVector<QueueTrack> result = m_explicit;
    if (m_sourceIndex < m_source.size())
        result.append(m_source.mid(m_sourceIndex));
    return result;
}

int QueueEngine::queueLength() const
{
    return m_explicit.size() + qMax(0, m_source.size() - m_sourceIndex);
}

bool QueueEngine::hasNext() const
{
    if (m_repeat == RepeatMode::One) return true;
    if (queueLength() > 0) return true;
    return m_repeat == RepeatMode::All && !m_originalSource.isEmpty();
}

bool QueueEngine::hasPrevious() const
{
    return !m_history.isEmpty() || m_repeat == RepeatMode::One;
}

QueueTrack QueueEngine::peekNext() const
{
    if (m_repeat == RepeatMode::One && !m_current.isNull()) return m_current;
    if (!m_explicit.isEmpty()) return m_explicit.first();
    if (m_sourceIndex < m_source.size()) return m_source.at(m_sourceIndex);
    // A shuffled Repeat All cycle is only decided when it is reloaded
    if (m_repeat == RepeatMode::All && m_shuffle == ShuffleMode::Off && !m_originalSource.isEmpty())
        return m_originalSource.first();
    return QueueTrack();
}

// ═════════════════════════════════════════════════════════════════════
//  Policy
// ═════════════════════════════════════════════════════════════════════

void QueueEngine::setShuffle(ShuffleMode mode)
{
    if (m_shuffle == mode) return;
    m_shuffle = mode;

    if (mode == ShuffleMode::Off) {
        if (!m_sourceShuffled) return;

        // Back to original order, continuing after the current track
        m_source = m_originalSource;
        m_sourceIndex = 0;
        for (int i = 0; i < m_source.size(); ++i) {
            if (m_source.at(i).id == m_current.id) {
                m_sourceIndex = i + 1;
                break;
            }
        }
        m_sourceShuffled = false;
    } else {
        // Only the unplayed part is reordered
        QVector<QueueTrack> reordered = m_source.mid(0, m_sourceIndex);
        reordered.append(ShuffleOrder::apply(m_source.mid(m_sourceIndex), mode, m_rng));
        m_source = reordered;
        m_sourceShuffled = true;
    }
    dedupeSource();

    qDebug() << "[QueueEngine] Shuffle:" << shuffleModeName(mode);
    emit queueChanged();
}

void QueueEngine::setRepeat(RepeatMode mode)
{
    if (m_repeat == mode) return;
    m_repeat = mode;
    qDebug() << "[QueueEngine] Repeat:" << repeatModeName(mode);
}

void QueueEngine::setHistorySize(int size)
{
    m_historySize = qMax(1, size);
    while (m_history.size() > m_historySize)
        m_history.removeFirst();
}

void QueueEngine::setVolume(int level)
{
    m_volume = qBound(0, level, 100);
}
