#pragma once

#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/models.hpp"
#include "engine/attribution_cache.hpp"
#include "engine/git_repository.hpp"
#include "engine/session_merger.hpp"

namespace promptrail {

class RecordStore;

struct BlameReport {
    std::string path;
    std::vector<BlameLine> lines;
    int aiLines = 0;
    int totalLines = 0;

    double aiPercent() const
    {
        return totalLines == 0 ? 0.0 : 100.0 * aiLines / totalLines;
    }
};

// Recorded paths match by equality or as a '/'-aligned suffix of each other.
bool pathMatches(const std::string &recorded, const std::string &path);

// Resolves each blamed line to the receipt whose live range covers the
// line's original coordinates in its originating commit.
BlameReport attributeBlame(const std::string &path,
                           const std::vector<BlameEntry> &entries,
                           const RecordStore &records);

// Read-only iteration over every record, filtered like a cache query.
std::vector<CachedReceipt> collectReceipts(const RecordStore &records, const ReceiptQuery &filter);

struct AttributionSummary {
    int receipts = 0;
    int orphanedReceipts = 0;
    int attributedLines = 0;
    int clippedChanges = 0;
    double costUsd = 0.0;
    TokenUsage tokens;
    std::map<std::string, int> receiptsByModel;
    SessionStats sessions;
};

AttributionSummary summarize(const std::vector<CachedReceipt> &receipts);

nlohmann::json blameToJson(const BlameReport &report);
nlohmann::json summaryToJson(const AttributionSummary &summary);

} // namespace promptrail
