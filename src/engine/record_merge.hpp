#pragma once

#include <string>
#include <vector>

#include "common/models.hpp"

namespace promptrail {

struct MergeReport {
    std::vector<SupersededReceipt> superseded;
    int added = 0;
};

// Canonical serialized form; equal strings mean equal receipts.
std::string canonicalReceipt(const Receipt &receipt);
std::string canonicalRecord(const CommitRecord &record);

// Total order deciding which of two versions of one receipt is kept: the
// later capturedAt, then the greater canonical form.
bool receiptSupersedes(const Receipt &candidate, const Receipt &current);

void sortReceipts(std::vector<Receipt> &receipts);

// Set union by receipt id. The result does not depend on argument order;
// only the report's winnerSource labels do.
CommitRecord mergeCommitRecords(const CommitRecord &local,
                                const CommitRecord &incoming,
                                MergeReport *report = nullptr,
                                const std::string &incomingSource = "remote");

} // namespace promptrail
