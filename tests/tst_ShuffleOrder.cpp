#include <QtTest/QtTest>
#include <QRandomGenerator>
#include <algorithm>
#include "ShuffleOrder.h"

static QueueTrack makeTrack(const QString& id, const QString& artist)
{
    QueueTrack t;
    t.id = id;
    t.artist = artist;
    return t;
}

static QStringList sortedIds(const QVector<QueueTrack>& tracks)
{
    QStringList out;
    for (const QueueTrack& t : tracks)
        out << t.id;
    std::sort(out.begin(), out.end());
    return out;
}

// Three artists with three tracks each
static QVector<QueueTrack> balancedTracks()
{
    QVector<QueueTrack> v;
    for (const QString& artist : {QStringLiteral("A"), QStringLiteral("B"), QStringLiteral("C")}) {
        for (int i = 1; i <= 3; ++i)
            v.append(makeTrack(artist + QString::number(i), artist));
    }
    return v;
}

class tst_ShuffleOrder : public QObject {
    Q_OBJECT

private slots:
    void off_keepsOrder()
    {
        const QVector<QueueTrack> tracks = balancedTracks();
        QCOMPARE(ShuffleOrder::apply(tracks, IQueueEngine::ShuffleMode::Off), tracks);
    }

    void random_isPermutation()
    {
        QRandomGenerator gen(99);
        const QVector<QueueTrack> tracks = balancedTracks();
        const QVector<QueueTrack> shuffled =
            ShuffleOrder::apply(tracks, IQueueEngine::ShuffleMode::Random, &gen);
        QCOMPARE(shuffled.size(), tracks.size());
        QCOMPARE(sortedIds(shuffled), sortedIds(tracks));
    }

    void smart_separatesArtistsWhenBalanced()
    {
        for (quint32 seed = 1; seed <= 20; ++seed) {
            QRandomGenerator gen(seed);
            const QVector<QueueTrack> shuffled =
                ShuffleOrder::apply(balancedTracks(), IQueueEngine::ShuffleMode::Smart, &gen);

            QCOMPARE(sortedIds(shuffled), sortedIds(balancedTracks()));
            for (int i = 1; i < shuffled.size(); ++i)
                QVERIFY2(shuffled.at(i).artist != shuffled.at(i - 1).artist,
                         qPrintable(QStringLiteral("seed %1, position %2").arg(seed).arg(i)));
        }
    }

    void smart_smallListsStillShuffle()
    {
        QRandomGenerator gen(3);
        QVector<QueueTrack> two = {makeTrack("1", "A"), makeTrack("2", "A")};
        ShuffleOrder::shuffleSmart(two, &gen);
        QCOMPARE(two.size(), 2);
        QCOMPARE(sortedIds(two), QStringList({"1", "2"}));

        QVector<QueueTrack> none;
        ShuffleOrder::shuffleSmart(none, &gen);
        QVERIFY(none.isEmpty());
    }
};

QTEST_MAIN(tst_ShuffleOrder)
#include "tst_ShuffleOrder.moc"
