#pragma once

#include <QString>

#include "engine/record_store.hpp"

namespace promptrail {

class GitRepository;

constexpr const char *kDefaultNotesRef = "refs/notes/promptrail";

// RecordStore backed by a git notes ref: one JSON CommitRecord per
// annotated commit. Batches are built on a scratch ref and published with a
// single compare-and-swap ref update.
class GitNotesStore : public RecordStore {
public:
    explicit GitNotesStore(const GitRepository &repo,
                           const QString &ref = QString::fromLatin1(kDefaultNotesRef));

    QString ref() const
    {
        return m_ref;
    }

    std::vector<std::string> listCommits() const override;
    std::optional<CommitRecord> read(const std::string &commitId) const override;
    void write(const CommitRecord &record) override;
    std::string writeAll(const std::vector<CommitRecord> &records,
                         const std::string &mergedRevision) override;
    std::string revision() const override;
    bool rollbackTo(const std::string &revision, const std::string &expected) override;

private:
    QString scratchRef() const;

    const GitRepository &m_repo;
    QString m_ref;
};

} // namespace promptrail
