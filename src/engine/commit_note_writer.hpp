#pragma once

#include <set>
#include <string>

namespace promptrail {

class BlobSource;
class RecordStore;
class StagingStore;

// Moves staged receipts into the CommitRecord of a new commit.
class CommitNoteWriter {
public:
    CommitNoteWriter(StagingStore &staging, RecordStore &records, const BlobSource &blobs);

    // Returns the number of receipts newly attached. Failures are logged and
    // leave the staged entries in place; they never fail the commit.
    int attach(const std::string &commitId, const std::set<std::string> &changedFiles);

private:
    StagingStore &m_staging;
    RecordStore &m_records;
    const BlobSource &m_blobs;
};

} // namespace promptrail
