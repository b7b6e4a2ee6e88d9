#include <QtTest/QtTest>

#include <QTemporaryDir>

#include <memory>

#include "common/json_utils.hpp"
#include "engine/attribution_report.hpp"
#include "engine/capture_pipeline.hpp"
#include "engine/commit_note_writer.hpp"
#include "engine/redactor.hpp"
#include "engine/staging_store.hpp"
#include "memory_backends.hpp"

class AttributionReportTests : public QObject
{
    Q_OBJECT
private slots:
    void testPathMatches();
    void testCapturedEditAttributesBlamedLines();
    void testLatestCaptureWinsOverlap();
    void testOrphanedChangesIgnored();
    void testSummaryCountsCarriedReceiptOnce();
    void testCollectReceiptsFilters();

private:
    static promptrail::Receipt receipt(const std::string &id, int64_t capturedAt,
                                       const std::string &path, promptrail::LineRange range);
    static std::vector<promptrail::BlameEntry> blameLines(const std::string &commitId, int count);
};

promptrail::Receipt AttributionReportTests::receipt(const std::string &id, int64_t capturedAt,
                                                    const std::string &path,
                                                    promptrail::LineRange range)
{
    promptrail::Receipt r;
    r.id = id;
    r.model = "model-" + id;
    r.sessionId = "s-" + id;
    r.capturedAt = promptrail::fromEpochSeconds(capturedAt);
    r.startedAt = r.capturedAt;
    r.endedAt = r.capturedAt + std::chrono::seconds(60);
    promptrail::FileChange change;
    change.path = path;
    change.lineRange = range;
    r.filesChanged.push_back(change);
    return r;
}

std::vector<promptrail::BlameEntry> AttributionReportTests::blameLines(const std::string &commitId,
                                                                       int count)
{
    std::vector<promptrail::BlameEntry> entries;
    for (int line = 1; line <= count; ++line) {
        promptrail::BlameEntry entry;
        entry.commitId = commitId;
        entry.originalLine = line;
        entry.finalLine = line;
        entries.push_back(entry);
    }
    return entries;
}

void AttributionReportTests::testPathMatches()
{
    QVERIFY(promptrail::pathMatches("src/auth.rs", "src/auth.rs"));
    QVERIFY(promptrail::pathMatches("/home/dev/project/src/auth.rs", "src/auth.rs"));
    QVERIFY(promptrail::pathMatches("src/auth.rs", "project/src/auth.rs"));
    QVERIFY(!promptrail::pathMatches("src/oauth.rs", "auth.rs"));
    QVERIFY(!promptrail::pathMatches("src/auth.rs", "src/db.rs"));
    QVERIFY(!promptrail::pathMatches("", "src/auth.rs"));
}

void AttributionReportTests::testCapturedEditAttributesBlamedLines()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    promptrail::StagingStore staging(dir.path());
    promptrail::RedactionConfig redaction;
    promptrail::Redactor redactor(redaction, "salt");
    promptrail::CapturePipeline pipeline(promptrail::CaptureConfig{}, redactor, staging, dir.path());

    promptrail::PromptEvent prompt;
    prompt.sessionId = "s1";
    prompt.timestamp = promptrail::fromEpochSeconds(1700000000);
    prompt.promptText = "harden the login check";
    prompt.model = "model-a";
    prompt.provider = "anthropic";
    QVERIFY(pipeline.process(prompt));

    promptrail::ToolEvent edit;
    edit.sessionId = "s1";
    edit.timestamp = promptrail::fromEpochSeconds(1700000010);
    edit.toolName = "Edit";
    edit.filePath = "src/auth.rs";
    edit.diff = "--- a/src/auth.rs\n+++ b/src/auth.rs\n@@ -3,2 +4,5 @@\n ctx\n-old\n+a\n+b\n+c\n+d\n";
    QVERIFY(pipeline.process(edit));

    MemoryRecordStore records;
    MemoryBlobSource blobs;
    blobs.addFile("c1", "src/auth.rs", "1\n2\n3\n4\n5\n6\n7\n8\n9\n10\n");
    promptrail::CommitNoteWriter writer(staging, records, blobs);
    QCOMPARE(writer.attach("c1", {"src/auth.rs"}), 1);

    const auto report = promptrail::attributeBlame("src/auth.rs", blameLines("c1", 10), records);
    QCOMPARE(report.totalLines, 10);
    QCOMPARE(report.aiLines, 5);
    QCOMPARE(report.aiPercent(), 50.0);
    QVERIFY(report.lines.at(2).receiptId.empty());
    QVERIFY(!report.lines.at(3).receiptId.empty());
    QCOMPARE(QString::fromStdString(report.lines.at(7).model), QStringLiteral("model-a"));
    QVERIFY(report.lines.at(8).receiptId.empty());

    const nlohmann::json json = promptrail::blameToJson(report);
    QCOMPARE(json.at("aiLines").get<int>(), 5);
    QVERIFY(json.at("lines").at(0).at("receiptId").is_null());
    QCOMPARE(QString::fromStdString(json.at("lines").at(4).at("sessionId").get<std::string>()),
             QStringLiteral("s1"));
}

void AttributionReportTests::testLatestCaptureWinsOverlap()
{
    MemoryRecordStore records;
    promptrail::CommitRecord record{"c1"};
    record.receipts.push_back(receipt("early", 1000, "a.txt", {1, 6}));
    record.receipts.push_back(receipt("late", 2000, "a.txt", {4, 8}));
    records.write(record);

    const auto report = promptrail::attributeBlame("a.txt", blameLines("c1", 10), records);
    QCOMPARE(report.aiLines, 8);
    QCOMPARE(QString::fromStdString(report.lines.at(2).receiptId), QStringLiteral("early"));
    QCOMPARE(QString::fromStdString(report.lines.at(4).receiptId), QStringLiteral("late"));

    // Uncommitted lines carry no commit and are never attributed.
    auto entries = blameLines("", 3);
    QCOMPARE(promptrail::attributeBlame("a.txt", entries, records).aiLines, 0);
}

void AttributionReportTests::testOrphanedChangesIgnored()
{
    MemoryRecordStore records;
    promptrail::CommitRecord record{"c1"};
    auto orphan = receipt("gone", 1000, "a.txt", {1, 4});
    orphan.filesChanged.front().status = promptrail::FileChangeStatus::Orphaned;
    orphan.orphaned = true;
    record.receipts.push_back(orphan);
    records.write(record);

    const auto report = promptrail::attributeBlame("a.txt", blameLines("c1", 4), records);
    QCOMPARE(report.aiLines, 0);
    QCOMPARE(report.aiPercent(), 0.0);
}

void AttributionReportTests::testSummaryCountsCarriedReceiptOnce()
{
    auto carried = receipt("r1", 1000, "a.txt", {1, 4});
    carried.costUsd = 0.5;
    carried.tokens.input = 100;
    auto clipped = receipt("r2", 1000, "b.txt", {2, 3});
    clipped.costUsd = 0.25;
    clipped.filesChanged.front().status = promptrail::FileChangeStatus::Clipped;
    clipped.filesChanged.front().originalRange = promptrail::LineRange{2, 6};

    std::vector<promptrail::CachedReceipt> rows{
        {"old", carried},
        {"new", carried},
        {"new", clipped}
    };
    const auto summary = promptrail::summarize(rows);
    QCOMPARE(summary.receipts, 3);
    QCOMPARE(summary.clippedChanges, 1);
    QCOMPARE(summary.attributedLines, 10);
    QCOMPARE(summary.costUsd, 0.75);
    QCOMPARE(summary.tokens.input, int64_t(100));
    QCOMPARE(summary.receiptsByModel.at("model-r1"), 1);
    QCOMPARE(summary.sessions.uniqueSessions, 2);

    const nlohmann::json json = promptrail::summaryToJson(summary);
    QCOMPARE(json.at("receipts").get<int>(), 3);
    QCOMPARE(json.at("sessions").at("unique").get<int>(), 2);
    QVERIFY(json.at("sessions").contains("earliestStart"));

    const auto empty = promptrail::summarize({});
    QCOMPARE(empty.receipts, 0);
    QVERIFY(!promptrail::summaryToJson(empty).at("sessions").contains("latestEnd"));
}

void AttributionReportTests::testCollectReceiptsFilters()
{
    MemoryRecordStore records;
    promptrail::CommitRecord first{"c1"};
    auto alice = receipt("r1", 1000, "a.txt", {1, 2});
    alice.author = "alice";
    first.receipts.push_back(alice);
    records.write(first);
    promptrail::CommitRecord second{"c2"};
    auto bob = receipt("r2", 3000, "b.txt", {1, 2});
    bob.author = "bob";
    second.receipts.push_back(bob);
    records.write(second);

    QCOMPARE(promptrail::collectReceipts(records, {}).size(), static_cast<size_t>(2));

    promptrail::ReceiptQuery byAuthor;
    byAuthor.author = "bob";
    const auto bobRows = promptrail::collectReceipts(records, byAuthor);
    QCOMPARE(bobRows.size(), static_cast<size_t>(1));
    QCOMPARE(QString::fromStdString(bobRows.front().commitId), QStringLiteral("c2"));

    promptrail::ReceiptQuery window;
    window.to = promptrail::fromEpochSeconds(2000);
    window.file = "a.txt";
    QCOMPARE(promptrail::collectReceipts(records, window).size(), static_cast<size_t>(1));

    window.file = "b.txt";
    QVERIFY(promptrail::collectReceipts(records, window).empty());
}

QTEST_MAIN(AttributionReportTests)
#include "test_attribution_report.moc"
