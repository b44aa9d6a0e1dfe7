#include "SimulatedOutputEngine.h"

#include <QDebug>
#include <QFileInfo>

SimulatedOutputEngine::SimulatedOutputEngine(QObject* parent)
    : IOutputEngine(parent)
{
    m_positionTimer = new QTimer(this);
    m_positionTimer->setInterval(50);
    connect(m_positionTimer, &QTimer::timeout, this, &SimulatedOutputEngine::onPositionTimer);
}

// ── loadTrack ───────────────────────────────────────────────────────
void SimulatedOutputEngine::loadTrack(const QString& filePath, quint64 requestId)
{
    if (m_destroyed) {
        qWarning() << "[Output] loadTrack after destroy ignored:" << filePath;
        return;
    }

    // A new load replaces whatever was playing
    m_playing = false;
    m_positionTimer->stop();
    m_loadedPath.clear();
    m_duration = 0.0;
    m_offset = 0.0;

    const quint64 serial = ++m_loadSerial;
    emit loadStarted(requestId, filePath);

    // Completes on the next event loop pass, like a real decoder open
    QTimer::singleShot(0, this, [this, filePath, requestId, serial]() {
        finishLoad(filePath, requestId, serial);
    });
}

void SimulatedOutputEngine::finishLoad(const QString& filePath, quint64 requestId, quint64 serial)
{
    if (serial != m_loadSerial || m_destroyed) {
        qDebug() << "[Output] Dropping superseded load:" << filePath;
        return;
    }

    QFileInfo fi(filePath);
    if (filePath.isEmpty() || !fi.exists() || !fi.isFile()) {
        qWarning() << "[Output] Cannot open" << filePath;
        emit loadFinished(requestId, filePath, false, QStringLiteral("File not found: %1").arg(filePath));
        return;
    }
    if (!fi.isReadable()) {
        qWarning() << "[Output] Not readable:" << filePath;
        emit loadFinished(requestId, filePath, false, QStringLiteral("Permission denied: %1").arg(filePath));
        return;
    }

    m_loadedPath = filePath;
    m_duration = m_durationResolver ? qMax(0.0, m_durationResolver(filePath)) : 0.0;
    qDebug() << "[Output] Loaded" << fi.fileName() << "duration:" << m_duration << "s";
    emit loadFinished(requestId, filePath, true, QString());
}

// ── play ────────────────────────────────────────────────────────────
void SimulatedOutputEngine::play()
{
    if (m_destroyed) return;
    if (m_playing) return;

    if (m_loadedPath.isEmpty()) {
        qWarning() << "[Output] play() - nothing loaded";
        emit errorOccurred(QStringLiteral("No track loaded"));
        return;
    }

    m_clock.start();
    m_playing = true;
    m_positionTimer->start();
    emit played();
}

// ── pause ───────────────────────────────────────────────────────────
void SimulatedOutputEngine::pause()
{
    if (!m_playing) return;

    m_offset = position();
    m_playing = false;
    m_positionTimer->stop();
    emit paused();
}

// ── stop ────────────────────────────────────────────────────────────
void SimulatedOutputEngine::stop()
{
    m_playing = false;
    m_positionTimer->stop();
    m_loadedPath.clear();
    m_duration = 0.0;
    m_offset = 0.0;
}

// ── seek ────────────────────────────────────────────────────────────
void SimulatedOutputEngine::seek(double secs)
{
    if (m_loadedPath.isEmpty()) return;

    double target = qMax(0.0, secs);
    if (m_duration > 0.0)
        target = qMin(target, m_duration);

    m_offset = target;
    if (m_playing)
        m_clock.restart();
    emit timeUpdate(target);
}

// ── setVolume ───────────────────────────────────────────────────────
void SimulatedOutputEngine::setVolume(int level)
{
    m_volume = qBound(0, level, 100);
    qDebug() << "[Output] Volume" << m_volume << "gain:" << gain();
}

// ── position ────────────────────────────────────────────────────────
double SimulatedOutputEngine::position() const
{
    double pos = m_offset;
    if (m_playing)
        pos += m_clock.elapsed() / 1000.0 * m_rate;
    if (m_duration > 0.0)
        pos = qMin(pos, m_duration);
    return pos;
}

void SimulatedOutputEngine::destroy()
{
    stop();
    ++m_loadSerial;
    m_destroyed = true;
    qDebug() << "[Output] Destroyed";
}

void SimulatedOutputEngine::setRate(double rate)
{
    if (rate <= 0.0) return;
    // Fold elapsed time in at the old rate before switching
    if (m_playing) {
        m_offset = position();
        m_clock.restart();
    }
    m_rate = rate;
}

void SimulatedOutputEngine::setPositionInterval(int ms)
{
    m_positionTimer->setInterval(qMax(10, ms));
}

// ── onPositionTimer ─────────────────────────────────────────────────
void SimulatedOutputEngine::onPositionTimer()
{
    const double pos = position();
    if (m_duration > 0.0 && pos >= m_duration) {
        m_positionTimer->stop();
        m_playing = false;
        m_offset = m_duration;
        emit timeUpdate(m_duration);
        emit ended();
        return;
    }
    emit timeUpdate(pos);
}
