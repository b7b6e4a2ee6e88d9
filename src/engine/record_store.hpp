#pragma once

#include <optional>
#include <string>
#include <vector>

#include "common/errors.hpp"
#include "common/models.hpp"

namespace promptrail {

// Persistent CommitRecords keyed by commit id. Writers throw StorageError.
class RecordStore {
public:
    virtual ~RecordStore() = default;

    virtual std::vector<std::string> listCommits() const = 0;
    virtual std::optional<CommitRecord> read(const std::string &commitId) const = 0;
    virtual void write(const CommitRecord &record) = 0;

    // Applies every record or none. mergedRevision, when set, is a remote
    // revision the resulting history must include. Returns the revision the
    // batch produced, or an empty string when there was nothing to write.
    virtual std::string writeAll(const std::vector<CommitRecord> &records,
                                 const std::string &mergedRevision) = 0;

    // Opaque marker of the current state, usable with rollbackTo().
    virtual std::string revision() const = 0;

    // Resets to revision only while the store is still at expected; returns
    // false and changes nothing once another writer has moved it.
    virtual bool rollbackTo(const std::string &revision, const std::string &expected) = 0;
};

// Read access to file contents as they exist in commits.
class BlobSource {
public:
    virtual ~BlobSource() = default;

    virtual std::optional<std::string> blobId(const std::string &commitId,
                                              const std::string &path) const = 0;
    virtual std::optional<std::string> blobContent(const std::string &blobId) const = 0;
    virtual std::vector<std::string> parents(const std::string &commitId) const = 0;
};

} // namespace promptrail
