#include "SessionConfig.h"

#include <QDebug>
#include <QDir>
#include <QSettings>
#include <QStandardPaths>

namespace {

int readClamped(QSettings& s, const QString& key, int def, int lo, int hi)
{
    if (!s.contains(key)) return def;

    bool ok = false;
    const int v = s.value(key).toInt(&ok);
    if (!ok) {
        qWarning() << "[Config]" << key << "is not a number:" << s.value(key).toString()
                   << "— using" << def;
        return def;
    }
    const int clamped = qBound(lo, v, hi);
    if (clamped != v)
        qWarning() << "[Config]" << key << "=" << v << "out of range, clamped to" << clamped;
    return clamped;
}

} // namespace

// ── Config INI path ─────────────────────────────────────────────────
// <GenericConfigLocation>/Tonearm/tonearm.ini
QString SessionConfig::defaultPath()
{
    QDir dir(QStandardPaths::writableLocation(QStandardPaths::GenericConfigLocation)
             + QStringLiteral("/Tonearm"));
    if (!dir.exists()) dir.mkpath(QStringLiteral("."));
    return dir.filePath(QStringLiteral("tonearm.ini"));
}

SessionConfig SessionConfig::load(QSettings& settings)
{
    SessionConfig c;

    settings.beginGroup(QStringLiteral("playback"));
    c.trackChangeTimeoutMs = readClamped(settings, QStringLiteral("trackChangeTimeoutMs"),
                                         c.trackChangeTimeoutMs, 10, 10000);
    c.historySize = readClamped(settings, QStringLiteral("historySize"), c.historySize, 1, 1000);
    c.volume = readClamped(settings, QStringLiteral("volume"), c.volume, 0, 100);
    c.positionIntervalMs = readClamped(settings, QStringLiteral("positionIntervalMs"),
                                       c.positionIntervalMs, 10, 5000);
    c.restartThresholdSecs = readClamped(settings, QStringLiteral("restartThresholdSecs"),
                                         c.restartThresholdSecs, 0, 60);

    if (settings.contains(QStringLiteral("shuffle"))) {
        const QString name = settings.value(QStringLiteral("shuffle")).toString();
        bool ok = false;
        const auto mode = IQueueEngine::shuffleModeFromName(name, &ok);
        if (ok)
            c.shuffle = mode;
        else
            qWarning() << "[Config] Unknown shuffle mode" << name << "— using off";
    }
    if (settings.contains(QStringLiteral("repeat"))) {
        const QString name = settings.value(QStringLiteral("repeat")).toString();
        bool ok = false;
        const auto mode = IQueueEngine::repeatModeFromName(name, &ok);
        if (ok)
            c.repeat = mode;
        else
            qWarning() << "[Config] Unknown repeat mode" << name << "— using off";
    }
    settings.endGroup();

    return c;
}

SessionConfig SessionConfig::loadFile(const QString& iniPath)
{
    QSettings settings(iniPath, QSettings::IniFormat);
    if (settings.status() != QSettings::NoError)
        qWarning() << "[Config] Could not read" << iniPath << "— using defaults";
    else
        qDebug() << "[Config] INI path:" << settings.fileName();
    return load(settings);
}

void SessionConfig::save(QSettings& settings) const
{
    settings.beginGroup(QStringLiteral("playback"));
    settings.setValue(QStringLiteral("trackChangeTimeoutMs"), trackChangeTimeoutMs);
    settings.setValue(QStringLiteral("historySize"), historySize);
    settings.setValue(QStringLiteral("volume"), volume);
    settings.setValue(QStringLiteral("shuffle"), IQueueEngine::shuffleModeName(shuffle));
    settings.setValue(QStringLiteral("repeat"), IQueueEngine::repeatModeName(repeat));
    settings.setValue(QStringLiteral("positionIntervalMs"), positionIntervalMs);
    settings.setValue(QStringLiteral("restartThresholdSecs"), restartThresholdSecs);
    settings.endGroup();
}
