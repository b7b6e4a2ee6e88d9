#include "engine/sync_audit_log.hpp"

#include <QFile>
#include <QFileInfo>
#include <QDir>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/json_utils.hpp"

namespace promptrail {

SyncAuditLog::SyncAuditLog(const QString &path)
    : m_path(path)
{
}

void SyncAuditLog::append(const std::vector<SupersededReceipt> &entries) const
{
    if (entries.empty()) {
        return;
    }
    QDir().mkpath(QFileInfo(m_path).absolutePath());
    QFile file(m_path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        throw StorageError("could not open audit log " + m_path.toStdString());
    }
    for (const auto &entry : entries) {
        const QByteArray line = QByteArray::fromStdString(nlohmann::json(entry).dump()) + '\n';
        if (file.write(line) != line.size()) {
            throw StorageError("short write to audit log " + m_path.toStdString());
        }
    }
}

std::vector<SupersededReceipt> SyncAuditLog::entries() const
{
    std::vector<SupersededReceipt> result;
    QFile file(m_path);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        return result;
    }
    while (!file.atEnd()) {
        const QByteArray line = file.readLine().trimmed();
        if (line.isEmpty()) {
            continue;
        }
        try {
            result.push_back(nlohmann::json::parse(line.toStdString()).get<SupersededReceipt>());
        } catch (const nlohmann::json::exception &) {
            // A torn final line from an interrupted append.
            continue;
        }
    }
    return result;
}

} // namespace promptrail
