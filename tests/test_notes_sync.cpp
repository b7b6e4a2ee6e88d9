#include <QtTest/QtTest>

#include <QTemporaryDir>

#include <memory>

#include "common/json_utils.hpp"
#include "engine/notes_sync.hpp"
#include "engine/record_merge.hpp"
#include "engine/sync_audit_log.hpp"
#include "memory_backends.hpp"

class NotesSyncTests : public QObject
{
    Q_OBJECT
private slots:
    void init();
    void testPullUnionsRemoteRecords();
    void testPullIsIdempotent();
    void testFetchFailureLeavesLocalUnchanged();
    void testApplyFailureIsAllOrNothing();
    void testConflictGoesToAuditLog();
    void testPushPublishesUnion();
    void testPushRetriesAfterRejection();
    void testPushFailureRollsBack();
    void testPushFailureKeepsConcurrentAttach();
    void testPushRollbackAfterRetryCoversBothMerges();

private:
    std::unique_ptr<QTemporaryDir> m_tempDir;
    std::unique_ptr<MemoryRecordStore> m_local;
    std::unique_ptr<MemoryRecordStore> m_remote;
    std::unique_ptr<MemoryNotesTransport> m_transport;
    std::unique_ptr<promptrail::SyncAuditLog> m_audit;

    static promptrail::Receipt receipt(const std::string &id, int64_t capturedAt,
                                       const std::string &summary = "summary");
    static void put(MemoryRecordStore &store, const std::string &commit,
                    const promptrail::Receipt &receipt);
};

void NotesSyncTests::init()
{
    m_tempDir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_tempDir->isValid());
    m_local = std::make_unique<MemoryRecordStore>();
    m_remote = std::make_unique<MemoryRecordStore>();
    m_transport = std::make_unique<MemoryNotesTransport>(*m_local, *m_remote);
    m_audit = std::make_unique<promptrail::SyncAuditLog>(
        m_tempDir->filePath(QStringLiteral("state/sync-audit.jsonl")));
}

promptrail::Receipt NotesSyncTests::receipt(const std::string &id, int64_t capturedAt,
                                            const std::string &summary)
{
    promptrail::Receipt r;
    r.id = id;
    r.sessionId = "s1";
    r.capturedAt = promptrail::fromEpochSeconds(capturedAt);
    r.promptSummary = summary;
    return r;
}

void NotesSyncTests::put(MemoryRecordStore &store, const std::string &commit,
                         const promptrail::Receipt &receipt)
{
    auto record = store.read(commit).value_or(promptrail::CommitRecord{commit});
    record.receipts.push_back(receipt);
    store.write(record);
}

void NotesSyncTests::testPullUnionsRemoteRecords()
{
    put(*m_local, "c1", receipt("a", 100));
    put(*m_remote, "c1", receipt("b", 200));
    put(*m_remote, "c2", receipt("c", 300));

    promptrail::NotesSyncManager sync(*m_local, *m_transport, *m_audit);
    const auto result = sync.pull();
    QVERIFY(result.ok);
    QCOMPARE(result.updatedRecords, 2);
    QCOMPARE(result.addedReceipts, 2);
    QCOMPARE(result.conflicts, 0);

    QCOMPARE(m_local->read("c1")->receipts.size(), static_cast<size_t>(2));
    QCOMPARE(m_local->read("c2")->receipts.size(), static_cast<size_t>(1));
    QCOMPARE(QString::fromStdString(m_local->lastMergedRevision),
             QStringLiteral("remote-") + QString::fromStdString(m_remote->revision()));
}

void NotesSyncTests::testPullIsIdempotent()
{
    put(*m_local, "c1", receipt("a", 100));
    put(*m_remote, "c1", receipt("b", 200));

    promptrail::NotesSyncManager sync(*m_local, *m_transport, *m_audit);
    QVERIFY(sync.pull().ok);
    const std::string merged = promptrail::canonicalRecord(*m_local->read("c1"));

    const auto again = sync.pull();
    QVERIFY(again.ok);
    QCOMPARE(again.updatedRecords, 0);
    QCOMPARE(again.addedReceipts, 0);
    QCOMPARE(promptrail::canonicalRecord(*m_local->read("c1")), merged);
}

void NotesSyncTests::testFetchFailureLeavesLocalUnchanged()
{
    put(*m_local, "c1", receipt("a", 100));
    put(*m_remote, "c2", receipt("c", 300));
    const std::string before = m_local->revision();
    m_transport->failFetch = true;

    promptrail::NotesSyncManager sync(*m_local, *m_transport, *m_audit);
    const auto result = sync.pull();
    QVERIFY(!result.ok);
    QCOMPARE(QString::fromStdString(result.error), QStringLiteral("remote unreachable"));
    QCOMPARE(m_local->revision(), before);
    QVERIFY(!m_local->read("c2").has_value());
}

void NotesSyncTests::testApplyFailureIsAllOrNothing()
{
    put(*m_local, "c1", receipt("a", 100));
    put(*m_remote, "c1", receipt("b", 200));
    put(*m_remote, "c2", receipt("c", 300));
    const std::string before = promptrail::canonicalRecord(*m_local->read("c1"));
    m_local->failWrites = true;

    promptrail::NotesSyncManager sync(*m_local, *m_transport, *m_audit);
    const auto result = sync.pull();
    QVERIFY(!result.ok);
    QVERIFY(!result.error.empty());
    QCOMPARE(promptrail::canonicalRecord(*m_local->read("c1")), before);
    QVERIFY(!m_local->read("c2").has_value());
    QVERIFY(m_audit->entries().empty());
}

void NotesSyncTests::testConflictGoesToAuditLog()
{
    put(*m_local, "c1", receipt("a", 100, "local version"));
    put(*m_remote, "c1", receipt("a", 400, "remote version"));

    promptrail::NotesSyncManager sync(*m_local, *m_transport, *m_audit);
    const auto result = sync.pull();
    QVERIFY(result.ok);
    QCOMPARE(result.conflicts, 1);
    QCOMPARE(QString::fromStdString(m_local->read("c1")->receipts.front().promptSummary),
             QStringLiteral("remote version"));

    const auto audit = m_audit->entries();
    QCOMPARE(audit.size(), static_cast<size_t>(1));
    QCOMPARE(QString::fromStdString(audit.front().commitId), QStringLiteral("c1"));
    QCOMPARE(QString::fromStdString(audit.front().winnerSource), QStringLiteral("remote"));
    QCOMPARE(QString::fromStdString(audit.front().superseded.promptSummary),
             QStringLiteral("local version"));
}

void NotesSyncTests::testPushPublishesUnion()
{
    put(*m_local, "c1", receipt("a", 100));
    put(*m_remote, "c1", receipt("b", 200));

    promptrail::NotesSyncManager sync(*m_local, *m_transport, *m_audit);
    const auto result = sync.push();
    QVERIFY(result.ok);
    QCOMPARE(m_transport->publishCount, 1);
    QCOMPARE(m_remote->read("c1")->receipts.size(), static_cast<size_t>(2));
}

void NotesSyncTests::testPushRetriesAfterRejection()
{
    put(*m_local, "c1", receipt("a", 100));
    m_transport->publishResults.push_back(promptrail::NotesTransport::PublishResult::Rejected);

    promptrail::NotesSyncManager sync(*m_local, *m_transport, *m_audit);
    const auto result = sync.push();
    QVERIFY(result.ok);
    QCOMPARE(m_transport->fetchCount, 2);
    QCOMPARE(m_transport->publishCount, 2);
    QVERIFY(m_remote->read("c1").has_value());
}

void NotesSyncTests::testPushFailureRollsBack()
{
    put(*m_local, "c1", receipt("a", 100));
    put(*m_remote, "c2", receipt("c", 300));
    const std::string before = promptrail::canonicalRecord(*m_local->read("c1"));
    m_transport->publishResults.push_back(promptrail::NotesTransport::PublishResult::Failed);

    promptrail::NotesSyncManager sync(*m_local, *m_transport, *m_audit);
    const auto result = sync.push();
    QVERIFY(!result.ok);
    QCOMPARE(QString::fromStdString(result.error), QStringLiteral("connection reset"));
    QCOMPARE(m_transport->publishCount, 1);

    QVERIFY(!m_local->read("c2").has_value());
    QCOMPARE(promptrail::canonicalRecord(*m_local->read("c1")), before);
    QVERIFY(!m_remote->read("c1").has_value());
}

void NotesSyncTests::testPushFailureKeepsConcurrentAttach()
{
    put(*m_local, "c1", receipt("a", 100));
    put(*m_remote, "c2", receipt("c", 300));
    m_transport->publishResults.push_back(promptrail::NotesTransport::PublishResult::Failed);
    // A post-commit attach lands after the merge but before the push fails.
    m_transport->beforePublish = [this]() {
        put(*m_local, "c3", receipt("late", 500));
    };

    promptrail::NotesSyncManager sync(*m_local, *m_transport, *m_audit);
    const auto result = sync.push();
    QVERIFY(!result.ok);

    QVERIFY(m_local->read("c3").has_value());
    QCOMPARE(QString::fromStdString(m_local->read("c3")->receipts.front().id),
             QStringLiteral("late"));
    QVERIFY(m_local->read("c2").has_value());
    QVERIFY(!m_remote->read("c3").has_value());
}

void NotesSyncTests::testPushRollbackAfterRetryCoversBothMerges()
{
    put(*m_local, "c1", receipt("a", 100));
    put(*m_remote, "c2", receipt("c", 300));
    m_transport->publishResults.push_back(promptrail::NotesTransport::PublishResult::Rejected);
    m_transport->publishResults.push_back(promptrail::NotesTransport::PublishResult::Failed);
    int publishes = 0;
    m_transport->beforePublish = [this, &publishes]() {
        if (++publishes == 1) {
            put(*m_remote, "c4", receipt("d", 400));
        }
    };

    promptrail::NotesSyncManager sync(*m_local, *m_transport, *m_audit);
    const auto result = sync.push();
    QVERIFY(!result.ok);
    QCOMPARE(m_transport->publishCount, 2);
    QVERIFY(!m_local->read("c2").has_value());
    QVERIFY(!m_local->read("c4").has_value());
    QCOMPARE(m_local->read("c1")->receipts.size(), static_cast<size_t>(1));
}

QTEST_MAIN(NotesSyncTests)
#include "test_notes_sync.moc"
