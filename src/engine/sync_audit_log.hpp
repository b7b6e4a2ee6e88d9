#pragma once

#include <vector>

#include <QString>

#include "common/models.hpp"

namespace promptrail {

// Append-only JSON-lines log of receipt versions that lost a merge.
class SyncAuditLog {
public:
    explicit SyncAuditLog(const QString &path);

    QString path() const
    {
        return m_path;
    }

    // Throws StorageError when the log cannot be written.
    void append(const std::vector<SupersededReceipt> &entries) const;
    std::vector<SupersededReceipt> entries() const;

private:
    QString m_path;
};

} // namespace promptrail
