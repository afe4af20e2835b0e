#include "../common/test_base.h"
#include "../../src/core/api/cut_session.h"
#include "../../src/core/resolve/project_archive.h"
#include "../../src/core/resolve/sequence_document.h"

#include <QCryptographicHash>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonObject>
#include <QTest>

Q_LOGGING_CATEGORY(jlcTests, "jlc.tests")

using namespace JLC;

namespace {

QString clip(const char* tag, const QString& name, const QString& media, int start, int duration, int in)
{
    return QStringLiteral("<Element><%1><Name>%2</Name><MediaRef>%3</MediaRef>"
                          "<Start>%4</Start><Duration>%5</Duration><In>%6</In></%1></Element>")
        .arg(QLatin1String(tag), name, media,
             QString::number(start), QString::number(duration), QString::number(in));
}

QString trackVector(const char* vectorTag, const QString& items)
{
    return QStringLiteral("<%1><Element><Sm2TiTrack><Items>%2</Items></Sm2TiTrack></Element></%1>")
        .arg(QLatin1String(vectorTag), items);
}

/**
 * Two shots cut at 100. `audioGap` opens silence at the cut,
 * `incomingIn` sets the head handle available to the second shot.
 */
QByteArray sequenceXml(int audioGap = 0, int incomingIn = 200, bool withAudio = true)
{
    const QString video = clip("Sm2TiVideoClip", "Wide", "reel-a", 0, 100, 0)
                        + clip("Sm2TiVideoClip", "Close", "reel-b", 100, 100, incomingIn);
    const QString audio = clip("Sm2TiAudioClip", "Wide", "reel-a", 0, 100, 0)
                        + clip("Sm2TiAudioClip", "Close", "reel-b", 100 + audioGap, 100 - audioGap, incomingIn);

    QString xml = QStringLiteral("<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n<Sm2SequenceContainer>");
    xml += trackVector("VideoTrackVec", video);
    if (withAudio) {
        xml += trackVector("AudioTrackVec", audio);
    }
    xml += QStringLiteral("</Sm2SequenceContainer>\n");
    return xml.toUtf8();
}

QByteArray fileDigest(const QString& path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return QByteArray();
    }
    return QCryptographicHash::hash(file.readAll(), QCryptographicHash::Sha256);
}

RunConfig config(CutMode mode, qint64 offset, bool dryRun = false)
{
    RunConfig result;
    result.mode = mode;
    result.offsetFrames = offset;
    result.dryRun = dryRun;
    return result;
}

} // namespace

/**
 * Integration Test: CutSession
 *
 * Requirements:
 * - Sequence files and project archives run end to end
 * - Output goes to a sibling file named after the cut mode; input is untouched
 * - Output is withheld for dry runs, runs with nothing eligible or applied, and suspect runs
 * - Edits are journaled only when their output file is written
 * - L-cuts short of tail handle are flagged so the front end can suggest an assumed handle
 */
class TestCutSession : public TestBase
{
    Q_OBJECT

private slots:
    void testSequenceFileJCut();
    void testDryRunWritesNothing();
    void testNothingEligible();
    void testNothingFeasible();
    void testLCutsNeedAssumedTailHandle();
    void testMissingAudioTrackIsFatal();
    void testUnsupportedInput();
    void testOutputDirectoryAndJournal();
    void testArchiveRoundTrip();
    void testArchiveWithoutSequences();
};

void TestCutSession::testSequenceFileJCut()
{
    const QString input = writeTestFile("jcut/Interview.xml", sequenceXml());
    const QByteArray inputDigest = fileDigest(input);

    Result<SessionReport> result = CutSession(config(CutMode::J, 8)).process(input);
    QVERIFY2(result.is_ok(), qPrintable(result.is_error() ? result.error().describe() : QString()));

    const SessionReport& report = result.value();
    QVERIFY(report.outputWritten);
    QCOMPARE(QFileInfo(report.outputPath).fileName(), QString("Interview (J cuts added).xml"));
    QCOMPARE(QFileInfo(report.outputPath).absolutePath(), QFileInfo(input).absolutePath());
    QCOMPARE(report.appliedCount(), 1);
    QCOMPARE(report.sequences.size(), 1);
    QCOMPARE(report.sequences.first().rewrittenClips, 2);
    QCOMPARE(fileDigest(input), inputDigest);

    Result<SequenceDocument> output = SequenceDocument::load(report.outputPath);
    QVERIFY(output.is_ok());
    const Timeline& timeline = output.value().timeline();
    const Clip* close = timeline.clip(timeline.audioTrack()->clips()[1]);
    QCOMPARE(close->timelineStart(), qint64(92));
    QCOMPARE(close->sourceIn(), qint64(192));
    QCOMPARE(timeline.clip(timeline.videoTrack()->clips()[1])->timelineStart(), qint64(100));
}

void TestCutSession::testDryRunWritesNothing()
{
    const QString input = writeTestFile("dry/Interview.xml", sequenceXml());
    RunConfig settings = config(CutMode::J, 8, true);
    settings.journalPath = m_testDataDir->filePath("dry/edits.jsonl");

    Result<SessionReport> result = CutSession(settings).process(input);
    QVERIFY(result.is_ok());
    QVERIFY(!result.value().outputWritten);
    QCOMPARE(result.value().notWrittenReason, QString("dry run"));
    QCOMPARE(result.value().appliedCount(), 1);
    QVERIFY(!QFile::exists(QDir(QFileInfo(input).absolutePath()).filePath("Interview (J cuts added).xml")));

    // Planned edits that never reached a file are not journaled
    QVERIFY(!QFile::exists(settings.journalPath));
    QVERIFY(!result.value().toJson().contains("journal_checksum"));
}

void TestCutSession::testNothingEligible()
{
    const QString input = writeTestFile("gap/Interview.xml", sequenceXml(3));

    Result<SessionReport> result = CutSession(config(CutMode::L, 8)).process(input);
    QVERIFY(result.is_ok());
    QVERIFY(!result.value().outputWritten);
    QVERIFY(result.value().notWrittenReason.contains("no eligible boundaries"));
    QCOMPARE(result.value().eligibleCount(), 0);
}

void TestCutSession::testNothingFeasible()
{
    const QString input = writeTestFile("tight/Interview.xml", sequenceXml(0, 2));
    RunConfig settings = config(CutMode::J, 8);
    settings.journalPath = m_testDataDir->filePath("tight/edits.jsonl");

    Result<SessionReport> result = CutSession(settings).process(input);
    QVERIFY(result.is_ok());
    QVERIFY(!result.value().outputWritten);
    QVERIFY(result.value().notWrittenReason.contains("no boundaries could be applied"));
    QCOMPARE(result.value().eligibleCount(), 1);
    QCOMPARE(result.value().appliedCount(), 0);
    QVERIFY(result.value().isHandleLimited());
    QVERIFY(!QFile::exists(settings.journalPath));
}

void TestCutSession::testLCutsNeedAssumedTailHandle()
{
    const QString input = writeTestFile("tail/Interview.xml", sequenceXml());

    Result<SessionReport> bare = CutSession(config(CutMode::L, 4)).process(input);
    QVERIFY(bare.is_ok());
    QCOMPARE(bare.value().appliedCount(), 0);
    QCOMPARE(bare.value().handleLimitedCount(), 1);
    QVERIFY(bare.value().isHandleLimited());
    QCOMPARE(bare.value().toJson()["totals"].toObject()["short_of_handle"].toInt(), 1);

    RunConfig padded = config(CutMode::L, 4, true);
    padded.assumedTailHandle = 4;
    Result<SessionReport> assumed = CutSession(padded).process(input);
    QVERIFY(assumed.is_ok());
    QCOMPARE(assumed.value().appliedCount(), 1);
    QVERIFY(!assumed.value().isHandleLimited());
}

void TestCutSession::testMissingAudioTrackIsFatal()
{
    const QString input = writeTestFile("silent/Interview.xml", sequenceXml(0, 200, false));

    Result<SessionReport> result = CutSession(config(CutMode::J, 8)).process(input);
    QVERIFY(result.is_error());
    QCOMPARE(result.error().code, ErrorCode::MissingAudioTrack);
}

void TestCutSession::testUnsupportedInput()
{
    const QString input = writeTestFile("other/notes.txt", "hello");
    Result<SessionReport> unsupported = CutSession(config(CutMode::J, 8)).process(input);
    QVERIFY(unsupported.is_error());
    QCOMPARE(unsupported.error().code, ErrorCode::InvalidArg);

    Result<SessionReport> missing = CutSession(config(CutMode::J, 8)).process(m_testDataDir->filePath("none.drp"));
    QVERIFY(missing.is_error());
    QCOMPARE(missing.error().code, ErrorCode::FileNotFound);

    Result<SessionReport> badOffset = CutSession(config(CutMode::J, 500)).processSequenceFile(
        writeTestFile("other/Interview.xml", sequenceXml()));
    QVERIFY(badOffset.is_error());
    QCOMPARE(badOffset.error().code, ErrorCode::InvalidArg);
}

void TestCutSession::testOutputDirectoryAndJournal()
{
    const QString input = writeTestFile("journal/Interview.xml", sequenceXml());
    RunConfig settings = config(CutMode::L, 4);
    settings.assumedTailHandle = 10;
    settings.outputDirectory = m_testDataDir->filePath("journal/out");
    settings.journalPath = m_testDataDir->filePath("journal/edits.jsonl");
    QVERIFY(QDir().mkpath(settings.outputDirectory));

    Result<SessionReport> result = CutSession(settings).process(input);
    QVERIFY(result.is_ok());
    const SessionReport& report = result.value();
    QVERIFY(report.outputWritten);
    QCOMPARE(QFileInfo(report.outputPath).absolutePath(), QFileInfo(settings.outputDirectory).absoluteFilePath());

    const std::vector<jlc::journal::EditEvent> events = jlc::journal::readJournal(settings.journalPath.toStdString());
    QCOMPARE(int(events.size()), 2);
    QCOMPARE(QString::fromStdString(events[0].sequence), QString("Interview"));
    QCOMPARE(QString::fromStdString(events[0].edge), QString("tail"));
    QCOMPARE(qint64(events[0].durationAfter), qint64(104));
    QCOMPARE(QString::fromStdString(jlc::journal::computeJournalChecksum(events)), report.journalChecksum());

    const QJsonObject json = report.toJson();
    QCOMPARE(json["mode"].toString(), QString("L"));
    QCOMPARE(json["output_written"].toBool(), true);
    QCOMPARE(json["totals"].toObject()["applied"].toInt(), 1);
    QCOMPARE(json["sequences"].toArray().size(), 1);
    QCOMPARE(json["journal_checksum"].toString(), report.journalChecksum());
}

void TestCutSession::testArchiveRoundTrip()
{
    if (!ProjectArchive::missingTool().isEmpty()) {
        QSKIP(qPrintable(QString("%1 is not installed").arg(ProjectArchive::missingTool())));
    }

    writeTestFile("project/project.xml", "<?xml version=\"1.0\"?><SyncProject/>");
    writeTestFile("project/SeqContainer/Main.xml", sequenceXml());
    writeTestFile("project/SeqContainer/Broll.xml", sequenceXml(0, 200, false));
    const QString archivePath = m_testDataDir->filePath("Documentary.drp");
    QVERIFY(ProjectArchive().pack(m_testDataDir->filePath("project"), archivePath).is_ok());
    const QByteArray inputDigest = fileDigest(archivePath);

    Result<SessionReport> result = CutSession(config(CutMode::J, 8)).process(archivePath);
    QVERIFY2(result.is_ok(), qPrintable(result.is_error() ? result.error().describe() : QString()));
    const SessionReport& report = result.value();
    QVERIFY(report.outputWritten);
    QCOMPARE(QFileInfo(report.outputPath).fileName(), QString("Documentary (J cuts added).drp"));
    QCOMPARE(fileDigest(archivePath), inputDigest);

    // Broll has no audio track and is reported, not fatal
    QCOMPARE(report.sequences.size(), 2);
    int refused = 0;
    for (const SequenceOutcome& sequence : report.sequences) {
        refused += sequence.isRefused() ? 1 : 0;
    }
    QCOMPARE(refused, 1);
    QCOMPARE(report.appliedCount(), 1);

    const QString unpacked = m_testDataDir->filePath("unpacked");
    QVERIFY(ProjectArchive().extract(report.outputPath, unpacked).is_ok());
    Result<SequenceDocument> main = SequenceDocument::load(QDir(unpacked).filePath("SeqContainer/Main.xml"));
    QVERIFY(main.is_ok());
    const Timeline& timeline = main.value().timeline();
    QCOMPARE(timeline.clip(timeline.audioTrack()->clips()[0])->duration(), qint64(92));
}

void TestCutSession::testArchiveWithoutSequences()
{
    if (!ProjectArchive::missingTool().isEmpty()) {
        QSKIP(qPrintable(QString("%1 is not installed").arg(ProjectArchive::missingTool())));
    }

    writeTestFile("empty/project.xml", "<?xml version=\"1.0\"?><SyncProject/>");
    writeTestFile("empty/SeqContainer/readme.xml", "<?xml version=\"1.0\"?><Notes/>");
    const QString archivePath = m_testDataDir->filePath("Empty.drp");
    QVERIFY(ProjectArchive().pack(m_testDataDir->filePath("empty"), archivePath).is_ok());

    Result<SessionReport> result = CutSession(config(CutMode::J, 8)).process(archivePath);
    QVERIFY(result.is_error());
    QVERIFY(result.error().message.contains("No timelines found"));
}

QTEST_MAIN(TestCutSession)
#include "test_cut_session.moc"
