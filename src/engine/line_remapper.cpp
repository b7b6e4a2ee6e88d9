#include "engine/line_remapper.hpp"

#include <algorithm>
#include <set>

#include <QtConcurrent/QtConcurrent>

#include "common/logging.hpp"
#include "engine/record_merge.hpp"
#include "engine/record_store.hpp"

namespace promptrail {

namespace {

struct Run {
    int firstOldLine = 0;
    int newStart = 0;
    int newEnd = 0;
    int length = 0;
};

struct BlobPair {
    std::string oldBlob;
    std::string newBlob;
};

struct AlignmentJob {
    const std::string *oldContent = nullptr;
    const std::string *newContent = nullptr;
};

void markOrphaned(FileChange &change)
{
    if (!change.originalRange) {
        change.originalRange = change.lineRange;
        change.originalLines = change.lineRange.length();
    }
    change.status = FileChangeStatus::Orphaned;
}

bool hasLiveChange(const Receipt &receipt)
{
    return std::any_of(receipt.filesChanged.begin(), receipt.filesChanged.end(),
                       [](const FileChange &change) {
                           return change.status != FileChangeStatus::Orphaned
                               && change.lineRange.length() > 0;
                       });
}

void updateReceiptOrphanFlag(Receipt &receipt)
{
    const bool anyRanged = std::any_of(receipt.filesChanged.begin(), receipt.filesChanged.end(),
                                       [](const FileChange &change) {
                                           return change.lineRange.length() > 0;
                                       });
    if (anyRanged && !hasLiveChange(receipt) && !receipt.orphaned) {
        receipt.orphaned = true;
        receipt.orphanReason = "content removed";
    }
}

std::string renamedPath(const RenameMap &renames, const std::string &path)
{
    auto it = renames.find(path);
    return it == renames.end() ? path : it->second;
}

} // namespace

FileChange remapFileChange(const FileChange &change, const LineAlignment &alignment)
{
    FileChange result = change;
    if (change.status == FileChangeStatus::Orphaned || change.lineRange.length() == 0) {
        return result;
    }

    // Recorded lines past the end of the old blob never existed there.
    const LineRange scanned{change.lineRange.start,
                            std::min(change.lineRange.end,
                                     static_cast<int>(alignment.oldToNew.size()))};

    std::vector<Run> runs;
    int previousNew = 0;
    for (int line = scanned.start; line <= scanned.end; ++line) {
        const int mapped = alignment.mapLine(line);
        if (mapped == 0) {
            previousNew = 0;
            continue;
        }
        if (previousNew != 0 && mapped == previousNew + 1) {
            runs.back().newEnd = mapped;
            ++runs.back().length;
        } else {
            runs.push_back(Run{line, mapped, mapped, 1});
        }
        previousNew = mapped;
    }

    if (runs.empty()) {
        markOrphaned(result);
        return result;
    }

    const Run &kept = runs.front();
    const bool complete = runs.size() == 1 && kept.length == change.lineRange.length();
    if (!complete) {
        if (!result.originalRange) {
            result.originalRange = scanned;
            result.originalLines = scanned.length();
        }
        result.status = FileChangeStatus::Clipped;
    }
    result.lineRange = LineRange{kept.newStart, kept.newEnd};
    return result;
}

LineRangeRemapper::LineRangeRemapper(RecordStore &records, const BlobSource &blobs,
                                     int ancestorSearchDepth)
    : m_records(records)
    , m_blobs(blobs)
    , m_ancestorSearchDepth(ancestorSearchDepth)
{
}

CommitRecord LineRangeRemapper::remapRecord(const CommitRecord &record,
                                            const std::string &targetCommit,
                                            const RenameMap &renames) const
{
    CommitRecord result;
    result.commitId = targetCommit;
    result.formatVersion = record.formatVersion;
    result.supersedes = record.supersedes;
    if (record.commitId != targetCommit) {
        result.supersedes.insert(record.commitId);
    }
    result.receipts = record.receipts;

    // Resolve the new blob of every live change; collect distinct blob pairs.
    struct Slot {
        std::size_t receipt;
        std::size_t change;
        std::size_t pair;
    };
    std::vector<Slot> slots;
    std::vector<BlobPair> pairs;
    std::map<std::pair<std::string, std::string>, std::size_t> pairIndex;
    std::map<std::string, std::optional<std::string>> newBlobByPath;

    for (std::size_t r = 0; r < result.receipts.size(); ++r) {
        auto &changes = result.receipts[r].filesChanged;
        for (std::size_t c = 0; c < changes.size(); ++c) {
            FileChange &change = changes[c];
            if (change.status == FileChangeStatus::Orphaned || change.blobId.empty()) {
                continue;
            }
            const std::string newPath = renamedPath(renames, change.path);
            auto cached = newBlobByPath.find(newPath);
            if (cached == newBlobByPath.end()) {
                cached = newBlobByPath.emplace(newPath, m_blobs.blobId(targetCommit, newPath)).first;
            }
            const std::optional<std::string> &newBlob = cached->second;
            if (!newBlob) {
                markOrphaned(change);
                continue;
            }
            if (*newBlob == change.blobId) {
                change.path = newPath;
                continue;
            }
            const auto key = std::make_pair(change.blobId, *newBlob);
            auto found = pairIndex.find(key);
            if (found == pairIndex.end()) {
                found = pairIndex.emplace(key, pairs.size()).first;
                pairs.push_back(BlobPair{change.blobId, *newBlob});
            }
            slots.push_back(Slot{r, c, found->second});
        }
    }

    if (!slots.empty()) {
        std::map<std::string, std::optional<std::string>> contents;
        for (const auto &pair : pairs) {
            for (const std::string *blob : {&pair.oldBlob, &pair.newBlob}) {
                if (contents.find(*blob) == contents.end()) {
                    contents.emplace(*blob, m_blobs.blobContent(*blob));
                }
            }
        }

        std::vector<AlignmentJob> jobs;
        std::vector<std::size_t> jobForPair(pairs.size(), static_cast<std::size_t>(-1));
        for (std::size_t p = 0; p < pairs.size(); ++p) {
            const auto &oldContent = contents.at(pairs[p].oldBlob);
            const auto &newContent = contents.at(pairs[p].newBlob);
            if (!oldContent || !newContent) {
                continue;
            }
            jobForPair[p] = jobs.size();
            jobs.push_back(AlignmentJob{&*oldContent, &*newContent});
        }

        const QList<LineAlignment> alignments = QtConcurrent::blockingMapped<QList<LineAlignment>>(
            jobs, [](const AlignmentJob &job) {
                return alignContents(*job.oldContent, *job.newContent);
            });

        for (const auto &slot : slots) {
            FileChange &change = result.receipts[slot.receipt].filesChanged[slot.change];
            const std::size_t job = jobForPair[slot.pair];
            if (job == static_cast<std::size_t>(-1)) {
                // Blob contents unavailable: the range can no longer be placed.
                markOrphaned(change);
                continue;
            }
            FileChange remapped = remapFileChange(change, alignments.at(static_cast<int>(job)));
            if (remapped.status != FileChangeStatus::Orphaned) {
                remapped.blobId = pairs[slot.pair].newBlob;
                remapped.path = renamedPath(renames, change.path);
            }
            change = remapped;
        }
    }

    for (auto &receipt : result.receipts) {
        updateReceiptOrphanFlag(receipt);
    }
    return result;
}

std::string LineRangeRemapper::custodian(const RewriteNotification &notification,
                                         std::size_t index) const
{
    for (std::size_t i = index + 1; i < notification.entries.size(); ++i) {
        if (!notification.entries[i].newCommit.empty()) {
            return notification.entries[i].newCommit;
        }
    }
    for (std::size_t i = index; i-- > 0;) {
        if (!notification.entries[i].newCommit.empty()) {
            return notification.entries[i].newCommit;
        }
    }
    return {};
}

void LineRangeRemapper::handleDropped(const CommitRecord &record,
                                      const RewriteNotification &notification,
                                      std::size_t index,
                                      const RenameMap &renames,
                                      std::map<std::string, CommitRecord> &pending,
                                      RemapStats &stats) const
{
    std::map<std::string, std::string> rewritten;
    for (const auto &entry : notification.entries) {
        rewritten[entry.oldCommit] = entry.newCommit;
    }

    // Candidate targets: ancestors of the dropped commit as they exist after
    // the rewrite, nearest first.
    std::vector<std::string> candidates;
    std::set<std::string> seen;
    std::vector<std::string> frontier = m_blobs.parents(record.commitId);
    for (int depth = 0; depth < m_ancestorSearchDepth && !frontier.empty(); ++depth) {
        const std::string ancestor = frontier.front();
        frontier = m_blobs.parents(ancestor);
        auto it = rewritten.find(ancestor);
        const std::string target = it == rewritten.end() ? ancestor : it->second;
        if (!target.empty() && seen.insert(target).second) {
            candidates.push_back(target);
        }
    }

    std::vector<bool> placed(record.receipts.size(), false);
    for (const auto &target : candidates) {
        const CommitRecord remapped = remapRecord(record, target, renames);
        CommitRecord rescued;
        rescued.commitId = target;
        rescued.formatVersion = remapped.formatVersion;
        rescued.supersedes = remapped.supersedes;
        for (std::size_t i = 0; i < remapped.receipts.size(); ++i) {
            if (placed[i] || !hasLiveChange(remapped.receipts[i])) {
                continue;
            }
            placed[i] = true;
            rescued.receipts.push_back(remapped.receipts[i]);
            ++stats.rescued;
        }
        if (!rescued.receipts.empty()) {
            auto slot = pending.find(target);
            if (slot == pending.end()) {
                pending.emplace(target, rescued);
            } else {
                slot->second = mergeCommitRecords(slot->second, rescued);
            }
        }
        if (std::all_of(placed.begin(), placed.end(), [](bool value) { return value; })) {
            return;
        }
    }

    const std::string successor = custodian(notification, index);
    if (successor.empty()) {
        PRLOG_WARN(QStringLiteral("LineRangeRemapper"),
                   QStringLiteral("handleDropped"),
                   QStringLiteral("no_custodian"),
                   QStringLiteral("all_commits_dropped"),
                   QStringLiteral("left_on_old_commit"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"commit", record.commitId}}));
        return;
    }

    CommitRecord custody;
    custody.commitId = successor;
    custody.formatVersion = record.formatVersion;
    custody.supersedes = record.supersedes;
    custody.supersedes.insert(record.commitId);
    for (std::size_t i = 0; i < record.receipts.size(); ++i) {
        if (placed[i]) {
            continue;
        }
        Receipt receipt = record.receipts[i];
        for (auto &change : receipt.filesChanged) {
            markOrphaned(change);
        }
        receipt.orphaned = true;
        receipt.orphanReason = "unresolvable";
        receipt.custodyOf = record.commitId;
        custody.receipts.push_back(receipt);
        ++stats.custody;
    }
    auto slot = pending.find(successor);
    if (slot == pending.end()) {
        pending.emplace(successor, custody);
    } else {
        slot->second = mergeCommitRecords(slot->second, custody);
    }
}

RemapStats LineRangeRemapper::apply(const RewriteNotification &notification)
{
    RemapStats stats;
    RenameMap renames(notification.renames.begin(), notification.renames.end());
    std::map<std::string, CommitRecord> pending;

    for (std::size_t i = 0; i < notification.entries.size(); ++i) {
        const auto &entry = notification.entries[i];
        const auto record = m_records.read(entry.oldCommit);
        if (!record || record->receipts.empty()) {
            continue;
        }
        ++stats.records;
        stats.receipts += static_cast<int>(record->receipts.size());

        if (entry.newCommit.empty()) {
            handleDropped(*record, notification, i, renames, pending, stats);
            continue;
        }
        if (entry.newCommit == entry.oldCommit) {
            continue;
        }

        const CommitRecord remapped = remapRecord(*record, entry.newCommit, renames);
        for (const auto &receipt : remapped.receipts) {
            for (const auto &change : receipt.filesChanged) {
                if (change.status == FileChangeStatus::Clipped) {
                    ++stats.clipped;
                } else if (change.status == FileChangeStatus::Orphaned) {
                    ++stats.orphaned;
                }
            }
        }
        auto slot = pending.find(entry.newCommit);
        if (slot == pending.end()) {
            pending.emplace(entry.newCommit, remapped);
        } else {
            slot->second = mergeCommitRecords(slot->second, remapped);
        }
    }

    for (const auto &item : pending) {
        try {
            const auto existing = m_records.read(item.first);
            const CommitRecord base = existing.value_or(CommitRecord{item.first});
            const CommitRecord merged = mergeCommitRecords(base, item.second);
            if (canonicalRecord(merged) == canonicalRecord(base)) {
                continue;
            }
            m_records.write(merged);
            ++stats.written;
        } catch (const StorageError &ex) {
            PRLOG_ERROR(QStringLiteral("LineRangeRemapper"),
                        QStringLiteral("apply"),
                        QStringLiteral("remapped_record_write_failed"),
                        QStringLiteral("storage_error"),
                        QStringLiteral("skip_commit"),
                        logging::defaultWho(),
                        QString(),
                        (nlohmann::json{{"commit", item.first}, {"error", ex.what()}}));
        }
    }

    PRLOG_INFO(QStringLiteral("LineRangeRemapper"),
               QStringLiteral("apply"),
               QStringLiteral("rewrite_remapped"),
               QStringLiteral("post_rewrite"),
               QStringLiteral("myers_alignment"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"records", stats.records},
                               {"receipts", stats.receipts},
                               {"clipped", stats.clipped},
                               {"orphaned", stats.orphaned},
                               {"rescued", stats.rescued},
                               {"custody", stats.custody},
                               {"written", stats.written}}));
    return stats;
}

} // namespace promptrail
