#include "engine/git_notes_store.hpp"

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "engine/git_repository.hpp"

namespace promptrail {

namespace {

std::string serializeRecord(const CommitRecord &record)
{
    return nlohmann::json(record).dump(2) + "\n";
}

} // namespace

GitNotesStore::GitNotesStore(const GitRepository &repo, const QString &ref)
    : m_repo(repo)
    , m_ref(ref)
{
}

QString GitNotesStore::scratchRef() const
{
    return m_ref + QStringLiteral("-scratch");
}

std::vector<std::string> GitNotesStore::listCommits() const
{
    try {
        return m_repo.listNotes(m_ref);
    } catch (const GitError &ex) {
        throw StorageError(ex.what());
    }
}

std::optional<CommitRecord> GitNotesStore::read(const std::string &commitId) const
{
    const auto content = m_repo.readNote(m_ref, commitId);
    if (!content) {
        return std::nullopt;
    }
    try {
        CommitRecord record = nlohmann::json::parse(*content).get<CommitRecord>();
        if (record.commitId.empty()) {
            record.commitId = commitId;
        }
        return record;
    } catch (const nlohmann::json::exception &ex) {
        PRLOG_ERROR(QStringLiteral("GitNotesStore"),
                    QStringLiteral("read"),
                    QStringLiteral("note_unparseable"),
                    QStringLiteral("malformed_json"),
                    QStringLiteral("treated_as_missing"),
                    logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"commit", commitId},
                                    {"ref", m_ref.toStdString()},
                                    {"error", ex.what()}}));
        return std::nullopt;
    }
}

void GitNotesStore::write(const CommitRecord &record)
{
    try {
        m_repo.writeNote(m_ref, record.commitId, serializeRecord(record));
    } catch (const GitError &ex) {
        throw StorageError(ex.what());
    }
}

std::string GitNotesStore::writeAll(const std::vector<CommitRecord> &records,
                                    const std::string &mergedRevision)
{
    const std::string before = revision();
    const bool foldRemote = !mergedRevision.empty()
        && (before.empty() || !m_repo.isAncestor(mergedRevision, before));
    if (records.empty() && !foldRemote) {
        return std::string();
    }

    const QString scratch = scratchRef();
    try {
        m_repo.deleteRef(scratch);
        if (!before.empty()) {
            m_repo.updateRef(scratch, before, std::nullopt);
        }
        for (const auto &record : records) {
            m_repo.writeNote(scratch, record.commitId, serializeRecord(record));
        }

        std::string result;
        const auto scratchTip = m_repo.refTip(scratch);
        if (!foldRemote) {
            result = scratchTip.value_or(std::string());
        } else if (!scratchTip) {
            // Nothing local and nothing new: adopt the remote history as is.
            result = mergedRevision;
        } else {
            std::vector<std::string> parents{*scratchTip, mergedRevision};
            result = m_repo.commitTree(m_repo.treeOf(*scratchTip), parents,
                                       "Notes merged by promptrail");
        }

        if (!result.empty() && result != before) {
            m_repo.updateRef(m_ref, result, before);
        }
        m_repo.deleteRef(scratch);
        return result == before ? std::string() : result;
    } catch (const GitError &ex) {
        try {
            m_repo.deleteRef(scratch);
        } catch (const GitError &cleanupError) {
            PRLOG_WARN(QStringLiteral("GitNotesStore"),
                       QStringLiteral("writeAll"),
                       QStringLiteral("scratch_cleanup_failed"),
                       QStringLiteral("git_error"),
                       QStringLiteral("update_ref_delete"),
                       logging::defaultWho(),
                       QString(),
                       (nlohmann::json{{"error", cleanupError.what()}}));
        }
        throw StorageError(std::string("batch write failed: ") + ex.what());
    }
}

std::string GitNotesStore::revision() const
{
    return m_repo.refTip(m_ref).value_or(std::string());
}

bool GitNotesStore::rollbackTo(const std::string &revision, const std::string &expected)
{
    try {
        if (this->revision() != expected) {
            return false;
        }
        if (revision == expected) {
            return true;
        }
        if (revision.empty()) {
            m_repo.deleteRef(m_ref, expected);
        } else {
            m_repo.updateRef(m_ref, revision, expected);
        }
        return true;
    } catch (const GitError &ex) {
        throw StorageError(ex.what());
    }
}

} // namespace promptrail
