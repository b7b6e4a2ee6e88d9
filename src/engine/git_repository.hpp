#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <QByteArray>
#include <QString>
#include <QStringList>

#include "common/process_utils.hpp"
#include "engine/record_store.hpp"

namespace promptrail {

struct BlameEntry {
    std::string commitId;
    int originalLine = 0;
    int finalLine = 0;
    std::string originalPath;
};

// GitRepository drives the git binary for one working copy. Queries that
// can legitimately miss return nullopt/empty; unexpected failures throw
// GitError.
class GitRepository : public BlobSource {
public:
    enum class FetchResult {
        Fetched,
        MissingRemoteRef,
        Failed
    };

    enum class PushResult {
        Pushed,
        Rejected,
        Failed
    };

    explicit GitRepository(const QString &workingDir);

    // Returns nullopt when path is not inside a git working copy.
    static std::optional<GitRepository> discover(const QString &path);

    QString topLevel() const;
    QString gitDir() const;
    // <gitdir>/promptrail, for state that must never be versioned.
    QString stateDir() const;

    std::optional<std::string> resolveCommit(const std::string &rev) const;
    std::vector<std::string> changedFiles(const std::string &commitId) const;
    std::vector<std::pair<std::string, std::string>> renames(const std::string &fromCommit,
                                                             const std::string &toCommit) const;
    std::vector<BlameEntry> blame(const std::string &path, const std::string &rev) const;
    std::string userIdentity() const;

    // BlobSource
    std::optional<std::string> blobId(const std::string &commitId,
                                      const std::string &path) const override;
    std::optional<std::string> blobContent(const std::string &blobId) const override;
    std::vector<std::string> parents(const std::string &commitId) const override;

    // Notes under an explicit ref, e.g. refs/notes/promptrail.
    std::optional<std::string> readNote(const QString &ref, const std::string &commitId) const;
    void writeNote(const QString &ref, const std::string &commitId, const std::string &content) const;
    std::vector<std::string> listNotes(const QString &ref) const;

    std::optional<std::string> refTip(const QString &ref) const;
    void updateRef(const QString &ref, const std::string &newValue,
                   const std::optional<std::string> &expectedOld) const;
    // expectedOld, when set, must be the ref's current value.
    void deleteRef(const QString &ref,
                   const std::optional<std::string> &expectedOld = std::nullopt) const;
    std::string treeOf(const std::string &commitId) const;
    std::string commitTree(const std::string &tree, const std::vector<std::string> &parents,
                           const std::string &message) const;
    bool isAncestor(const std::string &ancestor, const std::string &descendant) const;

    FetchResult fetchRef(const QString &remote, const QString &source, const QString &destination,
                         std::string *error = nullptr) const;
    PushResult pushRef(const QString &remote, const QString &ref, std::string *error = nullptr) const;

    ProcessResult run(const QStringList &args, const QByteArray &stdinData = QByteArray()) const;

private:
    QString runOrThrow(const QStringList &args, const QByteArray &stdinData = QByteArray()) const;

    QString m_workingDir;
    mutable QString m_gitDir;
    mutable QString m_topLevel;
};

// Parses `git blame --porcelain` output.
std::vector<BlameEntry> parseBlamePorcelain(const QString &output);

} // namespace promptrail
