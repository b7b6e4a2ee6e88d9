#include "engine/attribution_report.hpp"

#include <set>

#include "common/json_utils.hpp"
#include "engine/record_store.hpp"

namespace promptrail {

namespace {

bool endsWithComponent(const std::string &longer, const std::string &shorter)
{
    if (shorter.empty() || longer.size() <= shorter.size()) {
        return false;
    }
    const std::size_t offset = longer.size() - shorter.size();
    return longer.compare(offset, shorter.size(), shorter) == 0 && longer[offset - 1] == '/';
}

bool matchesFilter(const Receipt &receipt, const std::string &commitId, const ReceiptQuery &filter)
{
    if (filter.from && receipt.capturedAt < *filter.from) {
        return false;
    }
    if (filter.to && receipt.capturedAt > *filter.to) {
        return false;
    }
    if (!filter.author.empty() && receipt.author != filter.author) {
        return false;
    }
    if (!filter.commitId.empty() && commitId != filter.commitId) {
        return false;
    }
    if (!filter.file.empty()) {
        bool touched = false;
        for (const auto &change : receipt.filesChanged) {
            if (change.path == filter.file) {
                touched = true;
                break;
            }
        }
        if (!touched) {
            return false;
        }
    }
    return true;
}

} // namespace

bool pathMatches(const std::string &recorded, const std::string &path)
{
    return recorded == path || endsWithComponent(recorded, path) || endsWithComponent(path, recorded);
}

BlameReport attributeBlame(const std::string &path,
                           const std::vector<BlameEntry> &entries,
                           const RecordStore &records)
{
    BlameReport report;
    report.path = path;
    report.totalLines = static_cast<int>(entries.size());

    std::map<std::string, std::optional<CommitRecord>> recordCache;
    for (const auto &entry : entries) {
        BlameLine line;
        line.line = entry.finalLine;
        line.commitId = entry.commitId;
        line.originalLine = entry.originalLine;
        line.originalPath = entry.originalPath.empty() ? path : entry.originalPath;

        if (!entry.commitId.empty()) {
            auto cached = recordCache.find(entry.commitId);
            if (cached == recordCache.end()) {
                cached = recordCache.emplace(entry.commitId, records.read(entry.commitId)).first;
            }
            const Receipt *best = nullptr;
            if (cached->second) {
                for (const auto &receipt : cached->second->receipts) {
                    for (const auto &change : receipt.filesChanged) {
                        if (change.status == FileChangeStatus::Orphaned
                            || !pathMatches(change.path, line.originalPath)
                            || !change.lineRange.contains(entry.originalLine)) {
                            continue;
                        }
                        if (!best || best->capturedAt <= receipt.capturedAt) {
                            best = &receipt;
                        }
                    }
                }
            }
            if (best) {
                line.receiptId = best->id;
                line.model = best->model;
                line.sessionId = best->sessionId;
                ++report.aiLines;
            }
        }
        report.lines.push_back(line);
    }
    return report;
}

std::vector<CachedReceipt> collectReceipts(const RecordStore &records, const ReceiptQuery &filter)
{
    std::vector<CachedReceipt> result;
    for (const auto &commit : records.listCommits()) {
        const auto record = records.read(commit);
        if (!record) {
            continue;
        }
        for (const auto &receipt : record->receipts) {
            if (matchesFilter(receipt, record->commitId, filter)) {
                result.push_back(CachedReceipt{record->commitId, receipt});
            }
        }
    }
    return result;
}

AttributionSummary summarize(const std::vector<CachedReceipt> &receipts)
{
    AttributionSummary summary;
    std::vector<Receipt> distinct;
    std::set<std::string> seen;
    for (const auto &row : receipts) {
        const Receipt &receipt = row.receipt;
        ++summary.receipts;
        if (receipt.orphaned) {
            ++summary.orphanedReceipts;
        }
        summary.attributedLines += receipt.attributedLines();
        for (const auto &change : receipt.filesChanged) {
            if (change.status == FileChangeStatus::Clipped) {
                ++summary.clippedChanges;
            }
        }
        // A receipt carried across a rewrite appears under both commits;
        // its cost and tokens count once.
        if (seen.insert(receipt.id).second) {
            summary.costUsd += receipt.costUsd;
            summary.tokens.input += receipt.tokens.input;
            summary.tokens.output += receipt.tokens.output;
            summary.tokens.cacheRead += receipt.tokens.cacheRead;
            summary.tokens.cacheWrite += receipt.tokens.cacheWrite;
            ++summary.receiptsByModel[receipt.model.empty() ? "unknown" : receipt.model];
            distinct.push_back(receipt);
        }
    }
    summary.sessions = calculateSessionStats(distinct);
    return summary;
}

nlohmann::json blameToJson(const BlameReport &report)
{
    return nlohmann::json{
        {"path", report.path},
        {"totalLines", report.totalLines},
        {"aiLines", report.aiLines},
        {"aiPercent", report.aiPercent()},
        {"lines", report.lines}
    };
}

nlohmann::json summaryToJson(const AttributionSummary &summary)
{
    nlohmann::json sessions{
        {"unique", summary.sessions.uniqueSessions},
        {"rawSeconds", summary.sessions.rawTotal.count()},
        {"wallClockSeconds", summary.sessions.wallClock.count()},
        {"wallClock", formatDuration(summary.sessions.wallClock)},
        {"average", formatDuration(summary.sessions.average)}
    };
    if (summary.sessions.earliestStart) {
        sessions["earliestStart"] = toIso8601Utc(*summary.sessions.earliestStart);
    }
    if (summary.sessions.latestEnd) {
        sessions["latestEnd"] = toIso8601Utc(*summary.sessions.latestEnd);
    }
    return nlohmann::json{
        {"receipts", summary.receipts},
        {"orphanedReceipts", summary.orphanedReceipts},
        {"attributedLines", summary.attributedLines},
        {"clippedChanges", summary.clippedChanges},
        {"costUsd", summary.costUsd},
        {"tokens", summary.tokens},
        {"receiptsByModel", summary.receiptsByModel},
        {"sessions", sessions}
    };
}

} // namespace promptrail
