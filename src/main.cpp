#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDateTime>
#include <QDebug>
#include <QDir>
#include <QDirIterator>
#include <QFile>
#include <QFileInfo>
#include <QHash>
#include <QMutex>
#include <QSettings>
#include <QTimer>
#include <cstdio>
#include <iostream>

#include "core/MusicData.h"
#include "core/PlaybackSession.h"
#include "core/QueueBuilder.h"
#include "core/QueueEngine.h"
#include "core/SessionConfig.h"
#include "core/TrackGrouping.h"
#include "core/audio/SimulatedOutputEngine.h"

static const QStringList s_supportedExtensions = {
    QStringLiteral("flac"), QStringLiteral("mp3"), QStringLiteral("wav"),
    QStringLiteral("aac"),  QStringLiteral("m4a"), QStringLiteral("ogg"),
    QStringLiteral("opus"), QStringLiteral("alac"), QStringLiteral("aiff"),
    QStringLiteral("aif"),  QStringLiteral("ape"), QStringLiteral("wv"),
    QStringLiteral("wma"),  QStringLiteral("dsf"), QStringLiteral("dff")
};

// ── Scanning ────────────────────────────────────────────────────────
static QStringList collectFiles(const QStringList& paths)
{
    QStringList files;
    for (const QString& path : paths) {
        QFileInfo fi(path);
        if (fi.isFile()) {
            files.append(fi.absoluteFilePath());
            continue;
        }
        if (!fi.isDir()) {
            qWarning() << "[SCAN] Skipping missing path:" << path;
            continue;
        }

        QStringList found;
        QDirIterator it(fi.absoluteFilePath(), QDir::Files, QDirIterator::Subdirectories);
        while (it.hasNext()) {
            it.next();
            if (s_supportedExtensions.contains(it.fileInfo().suffix().toLower()))
                found.append(it.filePath());
        }
        found.sort();
        qDebug() << "[SCAN] Walked" << path << ":" << found.size() << "files";
        files.append(found);
    }
    return files;
}

// "Artist - Title.ext", otherwise the parent folder names the artist
static Track trackFromFile(const QString& filePath, int defaultLength)
{
    QFileInfo fi(filePath);
    Track t;
    t.id = fi.absoluteFilePath();
    t.filePath = fi.absoluteFilePath();
    t.format = formatFromPath(filePath);
    t.duration = defaultLength;
    t.album = fi.dir().dirName();

    const QString base = fi.completeBaseName();
    const int sep = base.indexOf(QStringLiteral(" - "));
    if (sep > 0) {
        t.artist = base.left(sep).trimmed();
        t.title = base.mid(sep + 3).trimmed();
    } else {
        t.artist = fi.dir().dirName();
        t.title = base;
    }
    return t;
}

static void printLine(const QString& line)
{
    std::cout << line.toStdString() << std::endl;
}

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setOrganizationName(QStringLiteral("Tonearm"));
    app.setApplicationName(QStringLiteral("tonearm"));
    app.setApplicationVersion(QStringLiteral(APP_VERSION));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral(
        "Groups audio files by song, builds a play queue and plays it "
        "through a simulated output."));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(QStringLiteral("paths"),
        QStringLiteral("Audio files or folders to play."), QStringLiteral("[paths...]"));

    QCommandLineOption configOpt(QStringLiteral("config"),
        QStringLiteral("Read settings from <ini> instead of the default location."),
        QStringLiteral("ini"));
    QCommandLineOption saveConfigOpt(QStringLiteral("save-config"),
        QStringLiteral("Write the effective settings back to the config file."));
    QCommandLineOption shuffleOpt(QStringLiteral("shuffle"),
        QStringLiteral("Shuffle mode: off, random or smart."), QStringLiteral("mode"));
    QCommandLineOption repeatOpt(QStringLiteral("repeat"),
        QStringLiteral("Repeat mode: off, all or one."), QStringLiteral("mode"));
    QCommandLineOption volumeOpt(QStringLiteral("volume"),
        QStringLiteral("Volume 0-100."), QStringLiteral("level"));
    QCommandLineOption speedOpt(QStringLiteral("speed"),
        QStringLiteral("Simulated clock multiplier (default 1)."), QStringLiteral("rate"),
        QStringLiteral("1"));
    QCommandLineOption lengthOpt(QStringLiteral("track-length"),
        QStringLiteral("Assumed track length in seconds (default 30)."), QStringLiteral("secs"),
        QStringLiteral("30"));
    QCommandLineOption startOpt(QStringLiteral("start"),
        QStringLiteral("Start at the n-th song (1-based) of the grouped list."),
        QStringLiteral("n"), QStringLiteral("1"));
    QCommandLineOption listOpt(QStringLiteral("list"),
        QStringLiteral("Print the grouped songs and their versions, then exit."));
    QCommandLineOption logOpt(QStringLiteral("log"),
        QStringLiteral("Also write diagnostics to <file>."), QStringLiteral("file"));

    parser.addOptions({configOpt, saveConfigOpt, shuffleOpt, repeatOpt, volumeOpt,
                       speedOpt, lengthOpt, startOpt, listOpt, logOpt});
    parser.process(app);

    // ── File logging ────────────────────────────────────────────────
    static QFile s_logFile;
    if (parser.isSet(logOpt)) {
        s_logFile.setFileName(parser.value(logOpt));
        if (s_logFile.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
            qInstallMessageHandler([](QtMsgType, const QMessageLogContext&, const QString& msg) {
                static QMutex mtx;
                QMutexLocker lock(&mtx);
                QString line = QStringLiteral("[%1] %2\n")
                    .arg(QDateTime::currentDateTime().toString(QStringLiteral("HH:mm:ss.zzz")), msg);
                QByteArray utf8 = line.toUtf8();
                s_logFile.write(utf8);
                s_logFile.flush();
                fprintf(stderr, "%s", utf8.constData());
            });
        } else {
            qWarning() << "[App] Cannot open log file" << parser.value(logOpt);
        }
    }

    // ── Configuration ───────────────────────────────────────────────
    const QString configPath = parser.isSet(configOpt) ? parser.value(configOpt)
                                                       : SessionConfig::defaultPath();
    SessionConfig config = SessionConfig::loadFile(configPath);

    if (parser.isSet(shuffleOpt)) {
        bool ok = false;
        config.shuffle = IQueueEngine::shuffleModeFromName(parser.value(shuffleOpt), &ok);
        if (!ok) {
            std::cerr << "Unknown shuffle mode: " << parser.value(shuffleOpt).toStdString() << std::endl;
            return 2;
        }
    }
    if (parser.isSet(repeatOpt)) {
        bool ok = false;
        config.repeat = IQueueEngine::repeatModeFromName(parser.value(repeatOpt), &ok);
        if (!ok) {
            std::cerr << "Unknown repeat mode: " << parser.value(repeatOpt).toStdString() << std::endl;
            return 2;
        }
    }
    if (parser.isSet(volumeOpt)) {
        bool ok = false;
        const int v = parser.value(volumeOpt).toInt(&ok);
        if (!ok) {
            std::cerr << "Volume must be a number" << std::endl;
            return 2;
        }
        config.volume = qBound(0, v, 100);
    }

    if (parser.isSet(saveConfigOpt)) {
        QSettings settings(configPath, QSettings::IniFormat);
        config.save(settings);
        settings.sync();
        printLine(QStringLiteral("Saved settings to %1").arg(configPath));
    }

    bool speedOk = false;
    const double speed = parser.value(speedOpt).toDouble(&speedOk);
    bool lengthOk = false;
    const int trackLength = parser.value(lengthOpt).toInt(&lengthOk);
    bool startOk = false;
    const int start = parser.value(startOpt).toInt(&startOk);
    if (!speedOk || speed <= 0.0 || !lengthOk || trackLength <= 0 || !startOk) {
        std::cerr << "--speed, --track-length and --start take positive numbers" << std::endl;
        return 2;
    }

    // ── Library ─────────────────────────────────────────────────────
    const QStringList files = collectFiles(parser.positionalArguments());
    if (files.isEmpty()) {
        if (parser.isSet(saveConfigOpt)) return 0;
        parser.showHelp(1);
    }

    QVector<Track> tracks;
    tracks.reserve(files.size());
    for (const QString& f : files)
        tracks.append(trackFromFile(f, trackLength));

    const QVector<TrackGroup> groups = TrackGrouping::group(tracks);

    if (parser.isSet(listOpt)) {
        int n = 0;
        for (const TrackGroup& g : groups) {
            const Track& best = g.bestVersion();
            printLine(QStringLiteral("%1. %2 — %3  %4").arg(++n)
                      .arg(best.artist, best.title, formatDuration(best.duration)));
            for (const Track& v : g.versions) {
                printLine(QStringLiteral("     %1 %2  (score %3)")
                          .arg(v.id == best.id ? QStringLiteral("*") : QStringLiteral(" "),
                               v.format.isEmpty() ? QStringLiteral("?") : v.format)
                          .arg(TrackGrouping::qualityScore(v), 0, 'f', 1));
            }
        }
        return 0;
    }

    QVector<Track> songs;
    songs.reserve(groups.size());
    for (const TrackGroup& g : groups)
        songs.append(g.bestVersion());

    if (!QueueBuilder::isValidStartIndex(songs, start - 1)) {
        std::cerr << "--start must be between 1 and " << songs.size() << std::endl;
        return 2;
    }

    TrackSource source;
    source.kind = TrackSource::Playlist;
    source.id = QStringLiteral("cli");
    source.name = QStringLiteral("Command line");
    const QVector<QueueTrack> queue = QueueBuilder::buildQueue(songs, start - 1, source);

    // ── Engines ─────────────────────────────────────────────────────
    QueueEngine queueEngine;
    queueEngine.setHistorySize(config.historySize);
    queueEngine.setVolume(config.volume);
    queueEngine.setShuffle(config.shuffle);
    queueEngine.setRepeat(config.repeat);

    QHash<QString, double> lengths;
    for (const QueueTrack& q : queue)
        lengths.insert(q.filePath, q.duration);

    SimulatedOutputEngine output;
    output.setRate(speed);
    output.setPositionInterval(config.positionIntervalMs);
    output.setDurationResolver([lengths](const QString& path) {
        return lengths.value(path, 0.0);
    });

    PlaybackSession session(&queueEngine, &output, config);

    QObject::connect(&session, &PlaybackSession::trackChanged, [&](const QueueTrack& t) {
        if (t.isNull()) {
            printLine(QStringLiteral("■ End of queue"));
            QTimer::singleShot(0, &app, &QCoreApplication::quit);
            return;
        }
        printLine(QStringLiteral("▶ %1 — %2  [%3 %4]  (%5 left)")
                  .arg(t.artist, t.title, formatFromPath(t.filePath), formatDuration(t.duration))
                  .arg(session.queueLength()));
    });
    QObject::connect(&session, &PlaybackSession::stateChanged, [](PlaybackSession::State s) {
        qDebug() << "[App] State:" << PlaybackSession::stateName(s);
    });
    QObject::connect(&session, &PlaybackSession::errorOccurred,
                     [&](PlaybackSession::Error e, const QString& message) {
        std::cerr << "error: " << PlaybackSession::errorName(e).toStdString()
                  << ": " << message.toStdString() << std::endl;
        if (e == PlaybackSession::Error::TrackLoadFailed) {
            // Skip the unplayable file and keep going
            QTimer::singleShot(0, &session, [&session]() {
                const PlaybackSession::Error err = session.next();
                if (err != PlaybackSession::Error::None)
                    qWarning() << "[App] Skip failed:" << PlaybackSession::errorName(err);
            });
        } else if (e == PlaybackSession::Error::EngineDesync) {
            QCoreApplication::exit(1);
        }
    });

    if (!session.initialize()) {
        std::cerr << "Could not start playback session" << std::endl;
        return 1;
    }

    printLine(QStringLiteral("%1 \"%2\": %3 files, %4 songs, shuffle %5, repeat %6, volume %7")
              .arg(sourceKindLabel(source.kind), source.name)
              .arg(files.size()).arg(groups.size())
              .arg(IQueueEngine::shuffleModeName(config.shuffle),
                   IQueueEngine::repeatModeName(config.repeat))
              .arg(config.volume));

    const PlaybackSession::Error loadErr = session.loadPlaylist(queue);
    if (loadErr != PlaybackSession::Error::None) {
        std::cerr << "Could not load queue: " << PlaybackSession::errorName(loadErr).toStdString()
                  << std::endl;
        return 1;
    }

    QTimer::singleShot(0, &session, [&session]() {
        const PlaybackSession::Error err = session.play();
        if (err != PlaybackSession::Error::None)
            QCoreApplication::exit(1);
    });

    const int rc = app.exec();
    session.destroy();
    return rc;
}
