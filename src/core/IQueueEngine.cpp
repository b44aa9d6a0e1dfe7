#include "IQueueEngine.h"

QString IQueueEngine::stateName(State state)
{
    switch (state) {
    case State::Stopped: return QStringLiteral("stopped");
    case State::Playing: return QStringLiteral("playing");
    case State::Paused:  return QStringLiteral("paused");
    case State::Loading: return QStringLiteral("loading");
    }
    return QStringLiteral("stopped");
}

QString IQueueEngine::shuffleModeName(ShuffleMode mode)
{
    switch (mode) {
    case ShuffleMode::Off:    return QStringLiteral("off");
    case ShuffleMode::Random: return QStringLiteral("random");
    case ShuffleMode::Smart:  return QStringLiteral("smart");
    }
    return QStringLiteral("off");
}

QString IQueueEngine::repeatModeName(RepeatMode mode)
{
    switch (mode) {
    case RepeatMode::Off: return QStringLiteral("off");
    case RepeatMode::All: return QStringLiteral("all");
    case RepeatMode::One: return QStringLiteral("one");
    }
    return QStringLiteral("off");
}

IQueueEngine::ShuffleMode IQueueEngine::shuffleModeFromName(const QString& name, bool* ok)
{
    const QString n = name.trimmed().toLower();
    if (ok) *ok = true;
    if (n == QStringLiteral("off"))    return ShuffleMode::Off;
    if (n == QStringLiteral("random")) return ShuffleMode::Random;
    if (n == QStringLiteral("smart"))  return ShuffleMode::Smart;
    if (ok) *ok = false;
    return ShuffleMode::Off;
}

IQueueEngine::RepeatMode IQueueEngine::repeatModeFromName(const QString& name, bool* ok)
{
    const QString n = name.trimmed().toLower();
    if (ok) *ok = true;
    if (n == QStringLiteral("off")) return RepeatMode::Off;
    if (n == QStringLiteral("all")) return RepeatMode::All;
    if (n == QStringLiteral("one")) return RepeatMode::One;
    if (ok) *ok = false;
    return RepeatMode::Off;
}
