#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <string>
#include <vector>

#include <QString>

#include "common/errors.hpp"
#include "common/models.hpp"

namespace promptrail {

// Per-session capture progress; survives the drain of the session's entries
// so prompt numbering and receipt chains continue across commits.
struct SessionCursor {
    int lastPromptNumber = 0;
    std::string lastReceiptId;
};

struct StagingState {
    std::vector<StagingEntry> entries;
    std::map<std::string, SessionCursor> sessions;
};

// StagingStore holds receipts captured before a commit exists. It lives in
// <worktree>/.promptrail/ and never touches tracked files. Every
// read-modify-write runs under a cross-process lock and replaces the file
// atomically. Storage failures throw StorageError.
class StagingStore {
public:
    explicit StagingStore(const QString &worktreeRoot, int lockTimeoutMs = 10000);

    QString stagingDir() const;
    QString stagingFilePath() const;

    void append(const StagingEntry &entry);

    // Applies mutator to the entry holding receiptId, creating it when absent.
    void upsert(const std::string &receiptId,
                const std::function<void(StagingEntry &)> &mutator);

    // Locked read-modify-write over all entries.
    void update(const std::function<void(std::vector<StagingEntry> &)> &mutator);
    void transact(const std::function<void(StagingState &)> &mutator);

    // Removes and returns every entry accepted by predicate, in staging order.
    std::vector<StagingEntry> drain(
        const std::function<bool(const StagingEntry &)> &predicate);

    // Puts back entries a failed attach drained; existing ids are kept.
    void restore(const std::vector<StagingEntry> &entries);

    std::vector<StagingEntry> entries() const;
    std::map<std::string, SessionCursor> sessions() const;
    std::size_t count() const;

private:
    void ensureDirectory() const;
    StagingState readUnlocked() const;
    StagingState readLocked() const;
    void writeUnlocked(const StagingState &state) const;
    void quarantineCorruptFile(const std::string &reason) const;

    QString m_root;
    int m_lockTimeoutMs;
};

} // namespace promptrail
