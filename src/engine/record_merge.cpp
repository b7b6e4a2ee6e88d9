#include "engine/record_merge.hpp"

#include <algorithm>
#include <map>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"

namespace promptrail {

std::string canonicalReceipt(const Receipt &receipt)
{
    return nlohmann::json(receipt).dump();
}

std::string canonicalRecord(const CommitRecord &record)
{
    return nlohmann::json(record).dump();
}

bool receiptSupersedes(const Receipt &candidate, const Receipt &current)
{
    const int64_t candidateTime = toEpochSeconds(candidate.capturedAt);
    const int64_t currentTime = toEpochSeconds(current.capturedAt);
    if (candidateTime != currentTime) {
        return candidateTime > currentTime;
    }
    return canonicalReceipt(candidate) > canonicalReceipt(current);
}

void sortReceipts(std::vector<Receipt> &receipts)
{
    std::sort(receipts.begin(), receipts.end(), [](const Receipt &a, const Receipt &b) {
        const int64_t aTime = toEpochSeconds(a.capturedAt);
        const int64_t bTime = toEpochSeconds(b.capturedAt);
        if (aTime != bTime) {
            return aTime < bTime;
        }
        return a.id < b.id;
    });
}

CommitRecord mergeCommitRecords(const CommitRecord &local,
                                const CommitRecord &incoming,
                                MergeReport *report,
                                const std::string &incomingSource)
{
    CommitRecord merged;
    merged.commitId = local.commitId.empty() ? incoming.commitId : local.commitId;
    merged.formatVersion = std::max(local.formatVersion, incoming.formatVersion);
    merged.supersedes = local.supersedes;
    merged.supersedes.insert(incoming.supersedes.begin(), incoming.supersedes.end());

    std::map<std::string, Receipt> byId;
    for (const auto &receipt : local.receipts) {
        auto it = byId.find(receipt.id);
        if (it == byId.end() || receiptSupersedes(receipt, it->second)) {
            byId[receipt.id] = receipt;
        }
    }

    for (const auto &receipt : incoming.receipts) {
        auto it = byId.find(receipt.id);
        if (it == byId.end()) {
            byId.emplace(receipt.id, receipt);
            if (report) {
                ++report->added;
            }
            continue;
        }
        if (canonicalReceipt(it->second) == canonicalReceipt(receipt)) {
            continue;
        }

        const bool incomingWins = receiptSupersedes(receipt, it->second);
        if (report) {
            SupersededReceipt entry;
            entry.commitId = merged.commitId;
            entry.winnerSource = incomingWins ? incomingSource : "local";
            entry.recordedAt = std::chrono::system_clock::now();
            entry.superseded = incomingWins ? it->second : receipt;
            report->superseded.push_back(entry);
        }
        if (incomingWins) {
            it->second = receipt;
        }
    }

    for (auto &entry : byId) {
        merged.receipts.push_back(std::move(entry.second));
    }
    sortReceipts(merged.receipts);
    return merged;
}

} // namespace promptrail
