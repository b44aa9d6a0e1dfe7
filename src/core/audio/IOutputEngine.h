#pragma once

#include <QObject>
#include <QString>

// Renders one loaded track at a time.  Loading is asynchronous: loadTrack()
// returns immediately and completion is reported through loadFinished(),
// tagged with the caller's requestId so repeated loads of one path stay
// distinguishable.  A superseded request may complete or be dropped.
class IOutputEngine : public QObject {
    Q_OBJECT

public:
    explicit IOutputEngine(QObject* parent = nullptr) : QObject(parent) {}
    ~IOutputEngine() override = default;

    virtual void loadTrack(const QString& filePath, quint64 requestId) = 0;
    virtual void play() = 0;
    virtual void pause() = 0;
    virtual void stop() = 0;
    virtual void seek(double secs) = 0;
    virtual void setVolume(int level) = 0;   // 0-100

    virtual double position() const = 0;     // seconds
    virtual double duration() const = 0;     // seconds, 0 when unknown

    // Releases the output; the engine ignores commands afterwards
    virtual void destroy() = 0;

    // Perceptual volume curve: 0-100 slider level → linear gain
    static double volumeToGain(int level);

signals:
    void loadStarted(quint64 requestId, const QString& filePath);
    void loadFinished(quint64 requestId, const QString& filePath, bool ok,
                      const QString& message);
    void timeUpdate(double secs);
    void ended();
    void errorOccurred(const QString& message);
    void played();
    void paused();
};
