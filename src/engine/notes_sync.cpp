#include "engine/notes_sync.hpp"

#include "common/logging.hpp"
#include "engine/git_notes_store.hpp"
#include "engine/git_repository.hpp"
#include "engine/record_merge.hpp"
#include "engine/record_store.hpp"
#include "engine/sync_audit_log.hpp"

namespace promptrail {

GitNotesTransport::GitNotesTransport(const GitRepository &repo, const QString &remote,
                                     const QString &ref)
    : m_repo(repo)
    , m_remote(remote)
    , m_ref(ref)
{
}

QString GitNotesTransport::trackingRef() const
{
    return m_ref + QStringLiteral("-remote-") + m_remote;
}

RemoteSnapshot GitNotesTransport::fetch()
{
    RemoteSnapshot snapshot;
    std::string error;
    const auto result = m_repo.fetchRef(m_remote, m_ref, trackingRef(), &error);
    if (result == GitRepository::FetchResult::Failed) {
        snapshot.error = error.empty() ? "fetch failed" : error;
        return snapshot;
    }
    if (result == GitRepository::FetchResult::MissingRemoteRef) {
        snapshot.ok = true;
        return snapshot;
    }

    try {
        GitNotesStore remoteStore(m_repo, trackingRef());
        snapshot.revision = remoteStore.revision();
        for (const auto &commit : remoteStore.listCommits()) {
            if (auto record = remoteStore.read(commit)) {
                snapshot.records.push_back(*record);
            }
        }
        snapshot.ok = true;
    } catch (const StorageError &ex) {
        snapshot.error = ex.what();
        snapshot.records.clear();
    }
    return snapshot;
}

NotesTransport::PublishResult GitNotesTransport::publish(std::string *error)
{
    switch (m_repo.pushRef(m_remote, m_ref, error)) {
    case GitRepository::PushResult::Pushed:
        return PublishResult::Published;
    case GitRepository::PushResult::Rejected:
        return PublishResult::Rejected;
    case GitRepository::PushResult::Failed:
        return PublishResult::Failed;
    }
    return PublishResult::Failed;
}

NotesSyncManager::NotesSyncManager(RecordStore &local, NotesTransport &transport,
                                   const SyncAuditLog &audit)
    : m_local(local)
    , m_transport(transport)
    , m_audit(audit)
{
}

SyncResult NotesSyncManager::pull()
{
    SyncResult result;
    const RemoteSnapshot snapshot = m_transport.fetch();
    if (!snapshot.ok) {
        result.error = snapshot.error;
        PRLOG_WARN(QStringLiteral("NotesSyncManager"),
                   QStringLiteral("pull"),
                   QStringLiteral("fetch_failed"),
                   QStringLiteral("transport_error"),
                   QStringLiteral("local_unchanged"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"error", result.error}}));
        return result;
    }

    MergeReport report;
    std::vector<CommitRecord> changed;
    try {
        for (const auto &remote : snapshot.records) {
            const auto local = m_local.read(remote.commitId);
            const CommitRecord merged = local
                ? mergeCommitRecords(*local, remote, &report, "remote")
                : remote;
            if (!local) {
                report.added += static_cast<int>(remote.receipts.size());
            }
            if (!local || canonicalRecord(merged) != canonicalRecord(*local)) {
                changed.push_back(merged);
            }
        }

        result.revision = m_local.writeAll(changed, snapshot.revision);
    } catch (const StorageError &ex) {
        result.error = ex.what();
        PRLOG_ERROR(QStringLiteral("NotesSyncManager"),
                    QStringLiteral("pull"),
                    QStringLiteral("merge_apply_failed"),
                    QStringLiteral("storage_error"),
                    QStringLiteral("local_unchanged"),
                    logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"error", result.error}}));
        return result;
    }

    try {
        m_audit.append(report.superseded);
    } catch (const StorageError &ex) {
        PRLOG_WARN(QStringLiteral("NotesSyncManager"),
                   QStringLiteral("pull"),
                   QStringLiteral("audit_append_failed"),
                   QStringLiteral("storage_error"),
                   QStringLiteral("continue"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"error", ex.what()}, {"entries", report.superseded.size()}}));
    }

    result.ok = true;
    result.updatedRecords = static_cast<int>(changed.size());
    result.addedReceipts = report.added;
    result.conflicts = static_cast<int>(report.superseded.size());
    PRLOG_INFO(QStringLiteral("NotesSyncManager"),
               QStringLiteral("pull"),
               QStringLiteral("notes_merged"),
               QStringLiteral("sync"),
               QStringLiteral("union_merge"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"remoteRecords", snapshot.records.size()},
                               {"updated", result.updatedRecords},
                               {"added", result.addedReceipts},
                               {"conflicts", result.conflicts}}));
    return result;
}

SyncResult NotesSyncManager::push()
{
    const std::string before = m_local.revision();

    // written is the last revision this push produced. Another writer moving
    // the store between our merges makes the rollback unsafe.
    std::string written;
    bool interleaved = false;
    SyncResult result;
    for (int attempt = 0; attempt < 2; ++attempt) {
        if (m_local.revision() != (written.empty() ? before : written)) {
            interleaved = true;
        }
        result = pull();
        if (!result.revision.empty()) {
            written = result.revision;
        }
        if (!result.ok) {
            break;
        }
        std::string error;
        const auto published = m_transport.publish(&error);
        if (published == NotesTransport::PublishResult::Published) {
            return result;
        }
        result.ok = false;
        result.error = error.empty() ? "push failed" : error;
        if (published == NotesTransport::PublishResult::Failed) {
            break;
        }
        // Rejected: the remote moved since our fetch; merge again and retry.
    }

    // Only the state this push wrote is undone; a note attached meanwhile
    // keeps the merged state in place.
    bool rolledBack = true;
    if (!written.empty()) {
        try {
            rolledBack = !interleaved && m_local.rollbackTo(before, written);
        } catch (const StorageError &ex) {
            rolledBack = false;
            result.error += std::string("; rollback failed: ") + ex.what();
        }
    }
    if (!rolledBack) {
        PRLOG_WARN(QStringLiteral("NotesSyncManager"),
                   QStringLiteral("push"),
                   QStringLiteral("rollback_skipped"),
                   QStringLiteral("store_moved_concurrently"),
                   QStringLiteral("keep_merged_state"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"before", before},
                                   {"written", written},
                                   {"current", m_local.revision()}}));
    }
    PRLOG_WARN(QStringLiteral("NotesSyncManager"),
               QStringLiteral("push"),
               QStringLiteral("push_failed"),
               QStringLiteral("transport_error"),
               rolledBack ? QStringLiteral("rolled_back") : QStringLiteral("left_merged"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"error", result.error}}));
    return result;
}

} // namespace promptrail
