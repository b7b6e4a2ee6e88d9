#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "common/models.hpp"

namespace promptrail {

class RecordStore;

struct ReceiptQuery {
    std::optional<Timestamp> from;
    std::optional<Timestamp> to;
    std::string author;
    std::string file;
    std::string commitId;
};

struct CachedReceipt {
    std::string commitId;
    Receipt receipt;
};

// AttributionCache is a SQLite index over the notes namespace for fast
// lookups by receipt, commit and file. It is derived data: rebuild() recreates
// it from the records at any time.
class AttributionCache {
public:
    explicit AttributionCache(const std::string &dbPath);
    ~AttributionCache();

    // Returns the number of receipts indexed.
    int rebuild(const RecordStore &records);
    void upsertRecord(const CommitRecord &record);

    std::vector<CachedReceipt> receiptsById(const std::string &receiptId) const;
    std::vector<CachedReceipt> receiptsForCommit(const std::string &commitId) const;
    std::vector<CachedReceipt> query(const ReceiptQuery &filter) const;
    int receiptCount() const;

    std::optional<std::string> getMeta(const std::string &key) const;
    void setMeta(const std::string &key, const std::string &value);

private:
    struct Impl;
    std::unique_ptr<Impl> impl;
};

} // namespace promptrail
