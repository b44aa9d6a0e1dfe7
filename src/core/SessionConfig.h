#pragma once

#include <QString>
#include "IQueueEngine.h"

class QSettings;

// Tunables for a PlaybackSession and the engines it drives.  Stored under
// the "playback/" group of an INI file.
struct SessionConfig {
    int trackChangeTimeoutMs = 100;   // bounded wait for a track change after play()
    int historySize = 50;
    int volume = 80;                  // 0-100
    IQueueEngine::ShuffleMode shuffle = IQueueEngine::ShuffleMode::Off;
    IQueueEngine::RepeatMode repeat = IQueueEngine::RepeatMode::Off;
    int positionIntervalMs = 250;
    int restartThresholdSecs = 3;     // previous() restarts the track past this point

    // Missing keys keep their defaults; out-of-range values are clamped
    static SessionConfig load(QSettings& settings);
    static SessionConfig loadFile(const QString& iniPath);
    void save(QSettings& settings) const;

    static QString defaultPath();
};
