#pragma once

#include <QElapsedTimer>
#include <QString>
#include <QTimer>
#include <functional>

#include "IOutputEngine.h"

// Output engine that renders nothing.  A loaded file is "played" against a
// wall clock so position, end-of-track and volume behave like a real device.
class SimulatedOutputEngine : public IOutputEngine {
    Q_OBJECT

public:
    using DurationResolver = std::function<double(const QString& filePath)>;

    explicit SimulatedOutputEngine(QObject* parent = nullptr);

    void loadTrack(const QString& filePath, quint64 requestId) override;
    void play() override;
    void pause() override;
    void stop() override;
    void seek(double secs) override;
    void setVolume(int level) override;

    double position() const override;
    double duration() const override { return m_duration; }

    void destroy() override;

    // Track length per file; without one every track plays forever
    void setDurationResolver(DurationResolver resolver) { m_durationResolver = std::move(resolver); }

    // Clock multiplier, e.g. 10.0 plays ten seconds per wall-clock second
    void setRate(double rate);
    double rate() const { return m_rate; }

    void setPositionInterval(int ms);

    bool isPlaying() const { return m_playing; }
    QString loadedPath() const { return m_loadedPath; }
    int volume() const { return m_volume; }
    double gain() const { return volumeToGain(m_volume); }

private:
    void onPositionTimer();
    void finishLoad(const QString& filePath, quint64 requestId, quint64 serial);

    QTimer* m_positionTimer = nullptr;
    QElapsedTimer m_clock;

    DurationResolver m_durationResolver;
    QString m_loadedPath;
    double m_duration = 0.0;
    double m_offset = 0.0;     // position when the clock was last (re)started
    double m_rate = 1.0;
    int m_volume = 100;
    bool m_playing = false;
    bool m_destroyed = false;
    quint64 m_loadSerial = 0;  // bumped per request; stale completions are dropped
};
