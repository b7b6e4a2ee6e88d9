#include "engine/commit_note_writer.hpp"

#include <algorithm>
#include <map>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/promptrail_version.hpp"
#include "engine/line_diff.hpp"
#include "engine/record_merge.hpp"
#include "engine/record_store.hpp"
#include "engine/staging_store.hpp"

namespace promptrail {

namespace {

bool touchesAny(const Receipt &receipt, const std::set<std::string> &changedFiles)
{
    return std::any_of(receipt.filesChanged.begin(), receipt.filesChanged.end(),
                       [&changedFiles](const FileChange &change) {
                           return changedFiles.count(change.path) > 0;
                       });
}

// Bounds a captured range by the committed file; a range starting past its
// end cannot be placed and is cleared.
void clampToFile(FileChange &change, int lineCount)
{
    if (change.lineRange.length() == 0 || change.lineRange.end <= lineCount) {
        return;
    }
    const LineRange captured = change.lineRange;
    if (captured.start > lineCount) {
        change.lineRange = LineRange{};
    } else {
        change.lineRange.end = lineCount;
    }
    PRLOG_WARN(QStringLiteral("CommitNoteWriter"),
               QStringLiteral("clampToFile"),
               QStringLiteral("line_range_clamped"),
               QStringLiteral("range_past_end_of_file"),
               QStringLiteral("clamp_to_blob"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"path", change.path},
                               {"captured", captured},
                               {"lines", lineCount}}));
}

} // namespace

CommitNoteWriter::CommitNoteWriter(StagingStore &staging, RecordStore &records,
                                   const BlobSource &blobs)
    : m_staging(staging)
    , m_records(records)
    , m_blobs(blobs)
{
}

int CommitNoteWriter::attach(const std::string &commitId, const std::set<std::string> &changedFiles)
{
    logging::CorrelationScope scope(QString::fromStdString("attach-" + commitId.substr(0, 12)));

    std::vector<StagingEntry> drained;
    try {
        std::set<std::string> matchedSessions;
        for (const auto &entry : m_staging.entries()) {
            if (touchesAny(entry.receipt, changedFiles)) {
                matchedSessions.insert(entry.receipt.sessionId);
            }
        }
        // Prompt-only receipts travel with a session that produced this commit.
        drained = m_staging.drain([&](const StagingEntry &entry) {
            if (touchesAny(entry.receipt, changedFiles)) {
                return true;
            }
            return entry.receipt.filesChanged.empty()
                && matchedSessions.count(entry.receipt.sessionId) > 0;
        });
    } catch (const StorageError &ex) {
        PRLOG_ERROR(QStringLiteral("CommitNoteWriter"),
                    QStringLiteral("attach"),
                    QStringLiteral("staging_drain_failed"),
                    QStringLiteral("storage_error"),
                    QStringLiteral("skip_attach"),
                    logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"commit", commitId}, {"error", ex.what()}}));
        return 0;
    }

    if (drained.empty()) {
        return 0;
    }

    CommitRecord incoming;
    incoming.commitId = commitId;
    incoming.formatVersion = kRecordFormatVersion;
    std::map<std::string, int> lineCounts;
    for (auto &entry : drained) {
        Receipt receipt = entry.receipt;
        for (auto &change : receipt.filesChanged) {
            if (changedFiles.count(change.path) == 0) {
                continue;
            }
            change.blobId = m_blobs.blobId(commitId, change.path).value_or(std::string());
            if (change.blobId.empty() || change.lineRange.length() == 0) {
                continue;
            }
            auto counted = lineCounts.find(change.blobId);
            if (counted == lineCounts.end()) {
                const auto content = m_blobs.blobContent(change.blobId);
                const int lines = content ? static_cast<int>(splitLines(*content).size()) : -1;
                counted = lineCounts.emplace(change.blobId, lines).first;
            }
            if (counted->second >= 0) {
                clampToFile(change, counted->second);
            }
        }
        incoming.receipts.push_back(std::move(receipt));
    }

    try {
        const CommitRecord existing = m_records.read(commitId).value_or(CommitRecord{commitId});
        MergeReport report;
        CommitRecord merged = mergeCommitRecords(existing, incoming, &report, "capture");
        if (canonicalRecord(merged) != canonicalRecord(existing)) {
            m_records.write(merged);
        }

        PRLOG_INFO(QStringLiteral("CommitNoteWriter"),
                   QStringLiteral("attach"),
                   QStringLiteral("receipts_attached"),
                   QStringLiteral("post_commit"),
                   QStringLiteral("notes_union"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"commit", commitId},
                                   {"attached", report.added},
                                   {"drained", drained.size()},
                                   {"receipts", merged.receipts.size()}}));
        return report.added;
    } catch (const StorageError &ex) {
        PRLOG_ERROR(QStringLiteral("CommitNoteWriter"),
                    QStringLiteral("attach"),
                    QStringLiteral("record_write_failed"),
                    QStringLiteral("storage_error"),
                    QStringLiteral("restore_staging"),
                    logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"commit", commitId}, {"error", ex.what()}}));
    }

    try {
        m_staging.restore(drained);
    } catch (const StorageError &ex) {
        PRLOG_ERROR(QStringLiteral("CommitNoteWriter"),
                    QStringLiteral("attach"),
                    QStringLiteral("staging_restore_failed"),
                    QStringLiteral("storage_error"),
                    QStringLiteral("entries_lost"),
                    logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"commit", commitId},
                                    {"lost", drained.size()},
                                    {"error", ex.what()}}));
    }
    return 0;
}

} // namespace promptrail
