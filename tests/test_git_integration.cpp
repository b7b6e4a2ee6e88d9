#include <QtTest/QtTest>

#include <QDir>
#include <QTemporaryDir>

#include <algorithm>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "engine/git_notes_store.hpp"
#include "engine/git_repository.hpp"
#include "engine/notes_sync.hpp"
#include "engine/sync_audit_log.hpp"
#include "git_fixture.hpp"

class GitIntegrationTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();

    void testParseBlamePorcelain();
    void testRepositoryQueries();
    void testNotesStoreReadWrite();
    void testNotesStoreBatchAndRollback();
    void testRollbackRefusesMovedRef();
    void testNotesStoreOnSha256Repository();
    void testSyncBetweenClones();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;
    QString m_repoDir;
    std::string m_first;
    std::string m_second;

    static promptrail::CommitRecord record(const std::string &commitId, const std::string &receiptId,
                                           int64_t capturedAt);
};

void GitIntegrationTests::initTestCase()
{
    if (!promptrail::isProgramAvailable(QStringLiteral("git"))) {
        QSKIP("git is not installed");
    }
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
    gitfixture::setIdentity();

    m_repoDir = m_tempDir.filePath(QStringLiteral("work"));
    QVERIFY(gitfixture::initRepo(m_repoDir));
    m_first = gitfixture::commitFile(m_repoDir, QStringLiteral("src/old.rs"),
                                     gitfixture::numberedLines(1, 3), QStringLiteral("first"));
    QVERIFY(!m_first.empty());
    QVERIFY(gitfixture::git(m_repoDir, {QStringLiteral("mv"), QStringLiteral("src/old.rs"),
                                        QStringLiteral("src/new.rs")}).ok());
    m_second = gitfixture::commitFile(m_repoDir, QStringLiteral("src/new.rs"),
                                      gitfixture::numberedLines(1, 5), QStringLiteral("second"));
    QVERIFY(!m_second.empty());
}

void GitIntegrationTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

promptrail::CommitRecord GitIntegrationTests::record(const std::string &commitId,
                                                     const std::string &receiptId,
                                                     int64_t capturedAt)
{
    promptrail::CommitRecord result;
    result.commitId = commitId;
    promptrail::Receipt receipt;
    receipt.id = receiptId;
    receipt.model = "model-a";
    receipt.capturedAt = promptrail::fromEpochSeconds(capturedAt);
    promptrail::FileChange change;
    change.path = "src/new.rs";
    change.lineRange = {4, 5};
    receipt.filesChanged.push_back(change);
    result.receipts.push_back(receipt);
    return result;
}

void GitIntegrationTests::testParseBlamePorcelain()
{
    const QString sha(40, QLatin1Char('a'));
    const QString null(40, QLatin1Char('0'));
    const QString output = sha + QStringLiteral(" 3 1 2\n"
                                                "author Dev\n"
                                                "filename src/old.rs\n"
                                                "\tfirst\n")
        + sha + QStringLiteral(" 4 2\n"
                               "\tsecond\n")
        + null + QStringLiteral(" 3 3 1\n"
                                "author Not Committed Yet\n"
                                "filename src/new.rs\n"
                                "\tthird\n");

    const auto entries = promptrail::parseBlamePorcelain(output);
    QCOMPARE(entries.size(), static_cast<size_t>(3));
    QCOMPARE(QString::fromStdString(entries.at(0).commitId), sha);
    QCOMPARE(entries.at(0).originalLine, 3);
    QCOMPARE(entries.at(0).finalLine, 1);
    QCOMPARE(QString::fromStdString(entries.at(1).originalPath), QStringLiteral("src/old.rs"));
    QCOMPARE(entries.at(1).originalLine, 4);
    QVERIFY(entries.at(2).commitId.empty());
}

void GitIntegrationTests::testRepositoryQueries()
{
    QVERIFY(!promptrail::GitRepository::discover(m_tempDir.path()).has_value());

    auto repo = promptrail::GitRepository::discover(m_repoDir + QStringLiteral("/src"));
    QVERIFY(repo.has_value());
    QCOMPARE(QDir(repo->topLevel()).canonicalPath(), QDir(m_repoDir).canonicalPath());
    QVERIFY(repo->stateDir().endsWith(QStringLiteral("promptrail")));

    QCOMPARE(repo->resolveCommit("HEAD").value_or(std::string()), m_second);
    QVERIFY(!repo->resolveCommit("no-such-branch").has_value());

    const auto changed = repo->changedFiles(m_second);
    QVERIFY(std::find(changed.begin(), changed.end(), "src/new.rs") != changed.end());
    QVERIFY(repo->parents(m_second) == std::vector<std::string>{m_first});
    QVERIFY(repo->parents(m_first).empty());

    const auto blob = repo->blobId(m_second, "src/new.rs");
    QVERIFY(blob.has_value());
    QCOMPARE(QByteArray::fromStdString(repo->blobContent(*blob).value_or(std::string())),
             gitfixture::numberedLines(1, 5));
    QVERIFY(!repo->blobId(m_second, "src/old.rs").has_value());

    const auto renames = repo->renames(m_first, m_second);
    QCOMPARE(renames.size(), static_cast<size_t>(1));
    QCOMPARE(QString::fromStdString(renames.front().first), QStringLiteral("src/old.rs"));
    QCOMPARE(QString::fromStdString(renames.front().second), QStringLiteral("src/new.rs"));

    const auto blame = repo->blame("src/new.rs", "HEAD");
    QCOMPARE(blame.size(), static_cast<size_t>(5));
    QCOMPARE(blame.at(0).commitId, m_first);
    QCOMPARE(QString::fromStdString(blame.at(0).originalPath), QStringLiteral("src/old.rs"));
    QCOMPARE(blame.at(4).commitId, m_second);
    QCOMPARE(blame.at(4).finalLine, 5);

    bool threw = false;
    try {
        repo->changedFiles("not-a-commit");
    } catch (const promptrail::GitError &) {
        threw = true;
    }
    QVERIFY(threw);
}

void GitIntegrationTests::testNotesStoreReadWrite()
{
    promptrail::GitRepository repo(m_repoDir);
    promptrail::GitNotesStore store(repo, QStringLiteral("refs/notes/promptrail-rw"));
    QVERIFY(store.revision().empty());
    QVERIFY(!store.read(m_first).has_value());

    store.write(record(m_first, "r1", 1000));
    const std::string afterWrite = store.revision();
    QVERIFY(!afterWrite.empty());

    const auto read = store.read(m_first);
    QVERIFY(read.has_value());
    QCOMPARE(read->receipts.size(), static_cast<size_t>(1));
    QCOMPARE(QString::fromStdString(read->receipts.front().id), QStringLiteral("r1"));
    QCOMPARE(read->receipts.front().filesChanged.front().lineRange, (promptrail::LineRange{4, 5}));
    QVERIFY(store.listCommits() == std::vector<std::string>{m_first});

    // The record lives in git notes, not in the working tree.
    QVERIFY(gitfixture::gitOutput(m_repoDir, {QStringLiteral("status"),
                                              QStringLiteral("--porcelain")}).empty());
}

void GitIntegrationTests::testNotesStoreBatchAndRollback()
{
    promptrail::GitRepository repo(m_repoDir);
    promptrail::GitNotesStore store(repo, QStringLiteral("refs/notes/promptrail-batch"));

    store.write(record(m_first, "r1", 1000));
    const std::string before = store.revision();

    const std::string written = store.writeAll(
        {record(m_first, "r2", 2000), record(m_second, "r3", 3000)}, std::string());
    QVERIFY(written != before);
    QCOMPARE(store.revision(), written);
    QCOMPARE(store.listCommits().size(), static_cast<size_t>(2));
    QCOMPARE(QString::fromStdString(store.read(m_first)->receipts.front().id), QStringLiteral("r2"));
    QVERIFY(store.writeAll({}, std::string()).empty());

    QVERIFY(store.rollbackTo(before, written));
    QCOMPARE(store.revision(), before);
    QCOMPARE(store.listCommits().size(), static_cast<size_t>(1));
    QCOMPARE(QString::fromStdString(store.read(m_first)->receipts.front().id), QStringLiteral("r1"));

    QVERIFY(store.rollbackTo(std::string(), before));
    QVERIFY(store.revision().empty());
    QVERIFY(store.listCommits().empty());
}

void GitIntegrationTests::testRollbackRefusesMovedRef()
{
    promptrail::GitRepository repo(m_repoDir);
    promptrail::GitNotesStore store(repo, QStringLiteral("refs/notes/promptrail-cas"));

    const std::string written = store.writeAll({record(m_first, "r1", 1000)}, std::string());
    QVERIFY(!written.empty());
    store.write(record(m_second, "late", 2000));
    const std::string moved = store.revision();
    QVERIFY(moved != written);

    QVERIFY(!store.rollbackTo(std::string(), written));
    QCOMPARE(store.revision(), moved);
    QCOMPARE(store.listCommits().size(), static_cast<size_t>(2));
}

void GitIntegrationTests::testNotesStoreOnSha256Repository()
{
    const QString dir = m_tempDir.filePath(QStringLiteral("sha256"));
    QDir().mkpath(dir);
    if (!gitfixture::git(dir, {QStringLiteral("init"), QStringLiteral("-q"),
                               QStringLiteral("--object-format=sha256")}).ok()) {
        QSKIP("git cannot create sha256 repositories");
    }
    const std::string commit = gitfixture::commitFile(dir, QStringLiteral("a.txt"),
                                                      gitfixture::numberedLines(1, 3),
                                                      QStringLiteral("base"));
    QCOMPARE(commit.size(), static_cast<size_t>(64));

    promptrail::GitRepository repo(dir);
    promptrail::GitNotesStore store(repo);
    const std::string first = store.writeAll({record(commit, "r1", 1000)}, std::string());
    QVERIFY(!first.empty());
    QCOMPARE(store.revision(), first);
    const std::string second = store.writeAll({record(commit, "r2", 2000)}, std::string());
    QVERIFY(!second.empty());
    QCOMPARE(QString::fromStdString(store.read(commit)->receipts.front().id), QStringLiteral("r2"));

    QVERIFY(store.rollbackTo(std::string(), second));
    QVERIFY(store.revision().empty());
}

void GitIntegrationTests::testSyncBetweenClones()
{
    const QString bareDir = m_tempDir.filePath(QStringLiteral("remote.git"));
    QVERIFY(gitfixture::git(m_tempDir.path(), {QStringLiteral("init"), QStringLiteral("-q"),
                                               QStringLiteral("--bare"), bareDir}).ok());
    QVERIFY(gitfixture::git(m_repoDir, {QStringLiteral("remote"), QStringLiteral("add"),
                                        QStringLiteral("origin"), bareDir}).ok());
    QVERIFY(gitfixture::git(m_repoDir, {QStringLiteral("push"), QStringLiteral("-q"),
                                        QStringLiteral("origin"),
                                        QStringLiteral("HEAD:refs/heads/trunk")}).ok());
    const QString otherDir = m_tempDir.filePath(QStringLiteral("other"));
    QVERIFY(gitfixture::git(m_tempDir.path(), {QStringLiteral("clone"), QStringLiteral("-q"),
                                               bareDir, otherDir}).ok());

    promptrail::GitRepository repoA(m_repoDir);
    promptrail::GitRepository repoB(otherDir);
    promptrail::GitNotesStore notesA(repoA);
    promptrail::GitNotesStore notesB(repoB);
    promptrail::SyncAuditLog auditA(m_tempDir.filePath(QStringLiteral("audit-a.jsonl")));
    promptrail::SyncAuditLog auditB(m_tempDir.filePath(QStringLiteral("audit-b.jsonl")));
    const QString remote = QStringLiteral("origin");
    const QString ref = QString::fromLatin1(promptrail::kDefaultNotesRef);
    promptrail::GitNotesTransport transportA(repoA, remote, ref);
    promptrail::GitNotesTransport transportB(repoB, remote, ref);
    promptrail::NotesSyncManager syncA(notesA, transportA, auditA);
    promptrail::NotesSyncManager syncB(notesB, transportB, auditB);

    // Pulling before anyone pushed succeeds with nothing to merge.
    auto pulled = syncB.pull();
    QVERIFY2(pulled.ok, pulled.error.c_str());
    QCOMPARE(pulled.updatedRecords, 0);

    notesA.write(record(m_second, "from-a", 1000));
    auto pushed = syncA.push();
    QVERIFY2(pushed.ok, pushed.error.c_str());

    // B has its own receipt on the same commit and a newer copy of A's.
    promptrail::CommitRecord local = record(m_second, "from-b", 2000);
    local.receipts.push_back(record(m_second, "from-a", 5000).receipts.front());
    local.receipts.back().model = "model-b";
    notesB.write(local);

    pushed = syncB.push();
    QVERIFY2(pushed.ok, pushed.error.c_str());
    QCOMPARE(pushed.conflicts, 1);
    QCOMPARE(auditB.entries().size(), static_cast<size_t>(1));
    QCOMPARE(QString::fromStdString(auditB.entries().front().superseded.model),
             QStringLiteral("model-a"));

    pulled = syncA.pull();
    QVERIFY2(pulled.ok, pulled.error.c_str());
    const auto merged = notesA.read(m_second);
    QVERIFY(merged.has_value());
    QCOMPARE(merged->receipts.size(), static_cast<size_t>(2));
    QCOMPARE(QString::fromStdString(merged->receipts.at(0).id), QStringLiteral("from-b"));
    QCOMPARE(QString::fromStdString(merged->receipts.at(1).id), QStringLiteral("from-a"));
    QCOMPARE(QString::fromStdString(merged->receipts.at(1).model), QStringLiteral("model-b"));

    // A second pull with nothing new changes nothing.
    const std::string settled = notesA.revision();
    pulled = syncA.pull();
    QVERIFY(pulled.ok);
    QCOMPARE(pulled.updatedRecords, 0);
    QCOMPARE(notesA.revision(), settled);

    promptrail::GitNotesTransport missing(repoA, QStringLiteral("nowhere"), ref);
    promptrail::NotesSyncManager failing(notesA, missing, auditA);
    const auto failed = failing.pull();
    QVERIFY(!failed.ok);
    QVERIFY(!failed.error.empty());
    QCOMPARE(notesA.revision(), settled);
}

QTEST_MAIN(GitIntegrationTests)
#include "test_git_integration.moc"
