#pragma once

#include <QVector>
#include "IQueueEngine.h"
#include "MusicData.h"

class QRandomGenerator;

// Reference queue engine.
//
// Two tiers: an explicit "play next" tier consumed destructively, and a
// source tier (the loaded playlist/album) walked by a cursor so previous()
// can step back without reordering anything.  queue() is the explicit tier
// followed by the unplayed part of the source tier; removeFromQueue() and
// skipToQueueIndex() take indices into that view.
class QueueEngine : public IQueueEngine {
    Q_OBJECT

public:
    static constexpr int kDefaultHistorySize = 50;

    explicit QueueEngine(QObject* parent = nullptr);

    // ── Transport ────────────────────────────────────────────────────
    void play() override;
    void pause() override;
    void stop() override;
    void next() override;
    void previous() override;
    State state() const override { return m_state; }
    QueueTrack currentTrack() const { return m_current; }

    // ── Queue ────────────────────────────────────────────────────────
    void loadPlaylist(const QVector<QueueTrack>& tracks) override;
    void appendToQueue(const QVector<QueueTrack>& tracks) override;
    void addToQueueNext(const QueueTrack& track) override;
    void addToQueueEnd(const QueueTrack& track) override;
    bool removeFromQueue(int index) override;
    bool moveInQueue(int fromIndex, int toIndex);
    void clearQueue() override;
    bool skipToQueueIndex(int index) override;

    QVector<QueueTrack> queue() const override;
    QVector<QueueTrack> history() const override { return m_history; }
    int queueLength() const override;
    bool hasNext() const override;
    bool hasPrevious() const override;
    QueueTrack peekNext() const;

    int sourcePosition() const { return m_sourceIndex; }
    int sourceTotal() const { return m_source.size(); }

    // ── Policy ───────────────────────────────────────────────────────
    void setShuffle(ShuffleMode mode) override;
    ShuffleMode shuffle() const override { return m_shuffle; }
    void setRepeat(RepeatMode mode) override;
    RepeatMode repeat() const override { return m_repeat; }

    void setHistorySize(int size);
    int historySize() const { return m_historySize; }

    // Tests pass a seeded generator; nullptr restores the global one
    void setRandomGenerator(QRandomGenerator* rng) { m_rng = rng; }

    // ── Volume ───────────────────────────────────────────────────────
    void setVolume(int level) override;
    int volume() const override { return m_volume; }
    void mute() override { m_muted = true; }
    void unmute() override { m_muted = false; }
    void toggleMute() override { m_muted = !m_muted; }
    bool isMuted() const override { return m_muted; }

private:
    void playNextInQueue(bool hadTrack = false);
    bool takeNext(QueueTrack& out);
    void reloadSource();
    void pushHistory(const QueueTrack& track);
    void setState(State state);
    void dedupeSource();

    QVector<QueueTrack> m_explicit;        // consumed from the front
    QVector<QueueTrack> m_source;          // walked by m_sourceIndex
    QVector<QueueTrack> m_originalSource;  // unshuffled copy of m_source
    int m_sourceIndex = 0;
    bool m_sourceShuffled = false;

    QVector<QueueTrack> m_history;         // oldest first
    int m_historySize = kDefaultHistorySize;

    QueueTrack m_current;
    State m_state = State::Stopped;
    ShuffleMode m_shuffle = ShuffleMode::Off;
    RepeatMode m_repeat = RepeatMode::Off;
    int m_volume = 80;
    bool m_muted = false;

    QRandomGenerator* m_rng = nullptr;
};
