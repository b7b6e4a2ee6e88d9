#pragma once

#include <map>
#include <string>
#include <utility>
#include <vector>

#include "common/models.hpp"
#include "engine/line_diff.hpp"

namespace promptrail {

class BlobSource;
class RecordStore;

using RenameMap = std::map<std::string, std::string>;

// Translates one FileChange through an alignment of its blob against a new
// version. The caller sets the new blob id and path on surviving changes.
FileChange remapFileChange(const FileChange &change, const LineAlignment &alignment);

struct RemapStats {
    int records = 0;
    int receipts = 0;
    int clipped = 0;
    int orphaned = 0;
    int rescued = 0;
    int custody = 0;
    int written = 0;
};

// LineRangeRemapper keeps FileChange coordinates valid across history
// rewrites. Remapping is a pure function of the old record and the blobs,
// and results are merged into the target record by union, so replaying a
// notification changes nothing.
class LineRangeRemapper {
public:
    LineRangeRemapper(RecordStore &records, const BlobSource &blobs, int ancestorSearchDepth = 16);

    RemapStats apply(const RewriteNotification &notification);

    // Rewrites record's ranges into targetCommit's blobs.
    CommitRecord remapRecord(const CommitRecord &record,
                             const std::string &targetCommit,
                             const RenameMap &renames) const;

private:
    void handleDropped(const CommitRecord &record,
                       const RewriteNotification &notification,
                       std::size_t index,
                       const RenameMap &renames,
                       std::map<std::string, CommitRecord> &pending,
                       RemapStats &stats) const;
    std::string custodian(const RewriteNotification &notification, std::size_t index) const;

    RecordStore &m_records;
    const BlobSource &m_blobs;
    int m_ancestorSearchDepth;
};

} // namespace promptrail
