#pragma once

#include <string>
#include <vector>

#include <QString>

#include "common/models.hpp"

namespace promptrail {

class GitRepository;
class RecordStore;
class SyncAuditLog;

struct RemoteSnapshot {
    bool ok = false;
    std::string error;
    // Revision of the remote namespace; empty when the remote has none yet.
    std::string revision;
    std::vector<CommitRecord> records;
};

// Moves the attribution namespace to and from a remote.
class NotesTransport {
public:
    enum class PublishResult {
        Published,
        Rejected,
        Failed
    };

    virtual ~NotesTransport() = default;

    virtual RemoteSnapshot fetch() = 0;
    virtual PublishResult publish(std::string *error) = 0;
};

// Transport over `git fetch`/`git push` of a notes ref. Fetches land in a
// private tracking ref so the local namespace is untouched until merged.
class GitNotesTransport : public NotesTransport {
public:
    GitNotesTransport(const GitRepository &repo, const QString &remote, const QString &ref);

    RemoteSnapshot fetch() override;
    PublishResult publish(std::string *error) override;

    QString trackingRef() const;

private:
    const GitRepository &m_repo;
    QString m_remote;
    QString m_ref;
};

struct SyncResult {
    bool ok = false;
    std::string error;
    int updatedRecords = 0;
    int addedReceipts = 0;
    int conflicts = 0;
    // Local revision the merge produced; empty when nothing was written.
    std::string revision;
};

// NotesSyncManager reconciles local CommitRecords with a remote by set union.
// A conflicting receipt keeps its later-captured version; the other version
// goes to the audit log. Failed operations leave local state unchanged.
class NotesSyncManager {
public:
    NotesSyncManager(RecordStore &local, NotesTransport &transport, const SyncAuditLog &audit);

    SyncResult pull();
    SyncResult push();

private:
    RecordStore &m_local;
    NotesTransport &m_transport;
    const SyncAuditLog &m_audit;
};

} // namespace promptrail
