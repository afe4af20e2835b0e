#include "../common/test_base.h"
#include "jlc/journal/EditJournal.hpp"

#include <QTest>

#include <fstream>
#include <stdexcept>

Q_LOGGING_CATEGORY(jlcTests, "jlc.tests")

using namespace jlc::journal;

namespace {

EditEvent sampleEvent(const std::string& edge, std::int64_t delta)
{
    EditEvent event;
    event.sequence = "Interview";
    event.boundary = 3;
    event.frame = 480;
    event.mode = "J";
    event.clip = "Close";
    event.handle = 7;
    event.edge = edge;
    event.delta = delta;
    event.startBefore = 480;
    event.durationBefore = 120;
    event.sourceInBefore = 960;
    event.startAfter = 472;
    event.durationAfter = 128;
    event.sourceInAfter = 952;
    return event;
}

} // namespace

/**
 * Unit Test: JSONL edit journal
 *
 * Requirements:
 * - One compact JSON object per applied clip edit
 * - Lines parse back into identical events
 * - Unknown edges and malformed lines are rejected with the line number
 * - The checksum depends only on event content
 */
class TestEditJournal : public TestBase
{
    Q_OBJECT

private slots:
    void testLineIsCompactJson();
    void testParseLine();
    void testParseRejectsUnknownEdge();
    void testWriteAndReadJournal();
    void testReadReportsBadLine();
    void testWriteFailsForMissingDirectory();
    void testChecksum();
};

void TestEditJournal::testLineIsCompactJson()
{
    const std::string line = toJsonLine(sampleEvent("head", -8));
    QVERIFY(line.find('\n') == std::string::npos);
    QVERIFY(line.find("\"edge\":\"head\"") != std::string::npos);
    QVERIFY(line.find("\"src_in\":952") != std::string::npos);
    QVERIFY(line.find("\"schema\":1") != std::string::npos);
}

void TestEditJournal::testParseLine()
{
    const EditEvent event = sampleEvent("tail", 8);
    QVERIFY(parseEditJsonLine(toJsonLine(event)) == event);

    const EditEvent minimal = parseEditJsonLine(
        R"({"boundary":1,"frame":100,"mode":"L","edge":"tail","delta":4,)"
        R"("before":{"start":0,"duration":100,"src_in":0},"after":{"start":0,"duration":104,"src_in":0}})");
    QCOMPARE(minimal.handle, -1);
    QVERIFY(minimal.sequence.empty());
    QCOMPARE(minimal.durationAfter, std::int64_t(104));
}

void TestEditJournal::testParseRejectsUnknownEdge()
{
    std::string line = toJsonLine(sampleEvent("head", -8));
    line.replace(line.find("\"head\""), 6, "\"middle\"");
    QVERIFY_EXCEPTION_THROWN(parseEditJsonLine(line), std::runtime_error);
}

void TestEditJournal::testWriteAndReadJournal()
{
    const std::vector<EditEvent> events = {sampleEvent("tail", -8), sampleEvent("head", -8)};
    const std::string path = m_testDataDir->filePath("edits.jsonl").toStdString();

    writeJournal(path, events);
    const std::vector<EditEvent> read = readJournal(path);
    QCOMPARE(read.size(), events.size());
    QVERIFY(read == events);
}

void TestEditJournal::testReadReportsBadLine()
{
    const std::string path = m_testDataDir->filePath("broken.jsonl").toStdString();
    {
        std::ofstream out(path);
        out << toJsonLine(sampleEvent("tail", 2)) << "\n\n{\"boundary\":\n";
    }

    try {
        readJournal(path);
        QFAIL("readJournal accepted a truncated line");
    } catch (const std::runtime_error& e) {
        QVERIFY(std::string(e.what()).find(":3:") != std::string::npos);
    }
}

void TestEditJournal::testWriteFailsForMissingDirectory()
{
    const std::string path = m_testDataDir->filePath("missing/dir/edits.jsonl").toStdString();
    QVERIFY_EXCEPTION_THROWN(writeJournal(path, {sampleEvent("tail", 1)}), std::runtime_error);
}

void TestEditJournal::testChecksum()
{
    QCOMPARE(QString::fromStdString(sha256Hex("")),
             QString("e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855"));

    const std::vector<EditEvent> events = {sampleEvent("tail", -8), sampleEvent("head", -8)};
    QVERIFY(computeJournalChecksum(events) == computeJournalChecksum(events));
    QVERIFY(computeJournalChecksum(events) != computeJournalChecksum({events[1], events[0]}));
    QCOMPARE(computeJournalChecksum({}).size(), size_t(64));
}

QTEST_MAIN(TestEditJournal)
#include "test_edit_journal.moc"
