#include "progress.h"

#include <QtTest>

class TestProgress : public QObject {
    Q_OBJECT

private slots:
    void phaseNames();
    void dryRunSequence();
    void realWriteSequence();
    void rejectsSkippedOrRepeatedPhases_data();
    void rejectsSkippedOrRepeatedPhases();
    void completeIsTerminal();
};

void TestProgress::phaseNames()
{
    QCOMPARE(phaseName(Phase::Validate), QStringLiteral("validate"));
    QCOMPARE(phaseName(Phase::Stage), QStringLiteral("payload"));
    QCOMPARE(phaseName(Phase::PayloadCopy), QStringLiteral("payload"));
    QCOMPARE(phaseName(Phase::PayloadDone), QStringLiteral("payload"));
    QCOMPARE(phaseName(Phase::Complete), QStringLiteral("complete"));

    ProgressEvent e;
    QVERIFY(!e.hasPercent());
    e.phase = Phase::Format;
    e.percent = 60;
    QVERIFY(e.hasPercent());
    QCOMPARE(e.phaseName(), QStringLiteral("format"));
}

void TestProgress::dryRunSequence()
{
    PhaseTracker tracker;
    for (Phase p : {Phase::Validate, Phase::Prepare, Phase::Stage, Phase::Write,
                    Phase::Finalize, Phase::Complete})
        QVERIFY(tracker.advance(p));
    QCOMPARE(tracker.current(), Phase::Complete);
}

void TestProgress::realWriteSequence()
{
    PhaseTracker tracker;
    for (Phase p : {Phase::Validate, Phase::Prepare, Phase::Stage, Phase::Write, Phase::Finalize,
                    Phase::Partition, Phase::Format, Phase::PayloadCopy, Phase::PayloadDone,
                    Phase::Complete})
        QVERIFY(tracker.advance(p));
}

void TestProgress::rejectsSkippedOrRepeatedPhases_data()
{
    QTest::addColumn<int>("from");
    QTest::addColumn<int>("to");

    QTest::newRow("start mid-way") << int(Phase::Idle) << int(Phase::Prepare);
    QTest::newRow("repeat validate") << int(Phase::Validate) << int(Phase::Validate);
    QTest::newRow("back to prepare") << int(Phase::Write) << int(Phase::Prepare);
    QTest::newRow("format before partition") << int(Phase::Finalize) << int(Phase::Format);
    QTest::newRow("copy twice") << int(Phase::PayloadCopy) << int(Phase::PayloadCopy);
    QTest::newRow("complete before copy") << int(Phase::Format) << int(Phase::Complete);
    QTest::newRow("stage to copy") << int(Phase::Stage) << int(Phase::PayloadDone);
}

void TestProgress::rejectsSkippedOrRepeatedPhases()
{
    QFETCH(int, from);
    QFETCH(int, to);
    QVERIFY(!PhaseTracker::canAdvance(static_cast<Phase>(from), static_cast<Phase>(to)));
}

void TestProgress::completeIsTerminal()
{
    for (int p = int(Phase::Idle); p <= int(Phase::Complete); ++p)
        QVERIFY(!PhaseTracker::canAdvance(Phase::Complete, static_cast<Phase>(p)));
}

QTEST_GUILESS_MAIN(TestProgress)
#include "tst_progress.moc"
