#include "engine/staging_store.hpp"

#include <algorithm>
#include <set>

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QLockFile>
#include <QSaveFile>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace promptrail {

namespace {

constexpr const char *kStagingDirName = ".promptrail";
constexpr const char *kStagingFileName = "staging.json";
constexpr const char *kLockFileName = "staging.lock";
constexpr int kStagingFormatVersion = 1;
constexpr int kStaleLockMs = 30000;

class StagingLock {
public:
    StagingLock(const QString &path, int timeoutMs)
        : m_lock(path)
    {
        m_lock.setStaleLockTime(kStaleLockMs);
        if (!m_lock.tryLock(timeoutMs)) {
            throw StorageError("could not acquire staging lock: " + path.toStdString());
        }
    }

private:
    QLockFile m_lock;
};

} // namespace

StagingStore::StagingStore(const QString &worktreeRoot, int lockTimeoutMs)
    : m_root(worktreeRoot)
    , m_lockTimeoutMs(lockTimeoutMs)
{
}

QString StagingStore::stagingDir() const
{
    return QDir(m_root).filePath(QLatin1String(kStagingDirName));
}

QString StagingStore::stagingFilePath() const
{
    return QDir(stagingDir()).filePath(QLatin1String(kStagingFileName));
}

void StagingStore::ensureDirectory() const
{
    const QString dir = stagingDir();
    if (!QDir().mkpath(dir)) {
        throw StorageError("could not create staging directory: " + dir.toStdString());
    }

    // Self-ignoring directory: keeps the working tree clean without editing
    // any tracked .gitignore.
    const QString ignorePath = QDir(dir).filePath(QStringLiteral(".gitignore"));
    if (!QFile::exists(ignorePath)) {
        QSaveFile ignoreFile(ignorePath);
        if (!ignoreFile.open(QIODevice::WriteOnly) || ignoreFile.write("*\n") != 2
            || !ignoreFile.commit()) {
            throw StorageError("could not write " + ignorePath.toStdString());
        }
    }
}

void StagingStore::append(const StagingEntry &entry)
{
    update([&entry](std::vector<StagingEntry> &entries) {
        entries.push_back(entry);
    });
}

void StagingStore::upsert(const std::string &receiptId,
                          const std::function<void(StagingEntry &)> &mutator)
{
    update([&](std::vector<StagingEntry> &entries) {
        auto it = std::find_if(entries.begin(), entries.end(),
                               [&receiptId](const StagingEntry &entry) {
                                   return entry.receipt.id == receiptId;
                               });
        if (it == entries.end()) {
            StagingEntry created;
            created.receipt.id = receiptId;
            created.stagedAt = std::chrono::system_clock::now();
            entries.push_back(created);
            it = entries.end() - 1;
        }
        mutator(*it);
    });
}

void StagingStore::update(const std::function<void(std::vector<StagingEntry> &)> &mutator)
{
    transact([&mutator](StagingState &state) {
        mutator(state.entries);
    });
}

void StagingStore::transact(const std::function<void(StagingState &)> &mutator)
{
    ensureDirectory();
    StagingLock lock(QDir(stagingDir()).filePath(QLatin1String(kLockFileName)), m_lockTimeoutMs);

    StagingState state = readUnlocked();
    mutator(state);
    writeUnlocked(state);
}

std::vector<StagingEntry> StagingStore::drain(
    const std::function<bool(const StagingEntry &)> &predicate)
{
    std::vector<StagingEntry> drained;
    update([&](std::vector<StagingEntry> &entries) {
        std::vector<StagingEntry> kept;
        for (auto &entry : entries) {
            if (predicate(entry)) {
                drained.push_back(std::move(entry));
            } else {
                kept.push_back(std::move(entry));
            }
        }
        entries = std::move(kept);
    });
    return drained;
}

void StagingStore::restore(const std::vector<StagingEntry> &restored)
{
    if (restored.empty()) {
        return;
    }
    update([&restored](std::vector<StagingEntry> &entries) {
        std::set<std::string> present;
        for (const auto &entry : entries) {
            present.insert(entry.receipt.id);
        }
        std::vector<StagingEntry> merged;
        for (const auto &entry : restored) {
            if (present.insert(entry.receipt.id).second) {
                merged.push_back(entry);
            }
        }
        merged.insert(merged.end(), entries.begin(), entries.end());
        entries = std::move(merged);
    });
}

std::vector<StagingEntry> StagingStore::entries() const
{
    return readLocked().entries;
}

std::map<std::string, SessionCursor> StagingStore::sessions() const
{
    return readLocked().sessions;
}

StagingState StagingStore::readLocked() const
{
    if (!QFile::exists(stagingFilePath())) {
        return {};
    }
    ensureDirectory();
    StagingLock lock(QDir(stagingDir()).filePath(QLatin1String(kLockFileName)), m_lockTimeoutMs);
    return readUnlocked();
}

std::size_t StagingStore::count() const
{
    return entries().size();
}

StagingState StagingStore::readUnlocked() const
{
    QFile file(stagingFilePath());
    if (!file.exists()) {
        return {};
    }
    if (!file.open(QIODevice::ReadOnly)) {
        throw StorageError("could not read " + stagingFilePath().toStdString());
    }
    const QByteArray data = file.readAll();
    file.close();
    if (data.trimmed().isEmpty()) {
        return {};
    }

    try {
        const auto payload = nlohmann::json::parse(data.toStdString());
        if (!payload.is_object() || !payload.contains("entries")
            || !payload.at("entries").is_array()) {
            quarantineCorruptFile("missing entries array");
            return {};
        }
        StagingState state;
        state.entries = payload.at("entries").get<std::vector<StagingEntry>>();
        if (payload.contains("sessions") && payload.at("sessions").is_object()) {
            for (const auto &item : payload.at("sessions").items()) {
                SessionCursor cursor;
                cursor.lastPromptNumber = item.value().value("lastPromptNumber", 0);
                cursor.lastReceiptId = item.value().value("lastReceiptId", "");
                state.sessions[item.key()] = cursor;
            }
        }
        return state;
    } catch (const nlohmann::json::exception &ex) {
        quarantineCorruptFile(ex.what());
        return {};
    }
}

void StagingStore::writeUnlocked(const StagingState &state) const
{
    nlohmann::json sessions = nlohmann::json::object();
    for (const auto &entry : state.sessions) {
        sessions[entry.first] = nlohmann::json{
            {"lastPromptNumber", entry.second.lastPromptNumber},
            {"lastReceiptId", entry.second.lastReceiptId}
        };
    }
    const nlohmann::json payload{
        {"version", kStagingFormatVersion},
        {"entries", state.entries},
        {"sessions", sessions}
    };
    const QByteArray data = QByteArray::fromStdString(payload.dump(2));

    QSaveFile file(stagingFilePath());
    if (!file.open(QIODevice::WriteOnly)) {
        throw StorageError("could not open " + stagingFilePath().toStdString());
    }
    if (file.write(data) != data.size()) {
        file.cancelWriting();
        throw StorageError("short write to " + stagingFilePath().toStdString());
    }
    if (!file.commit()) {
        throw StorageError("could not replace " + stagingFilePath().toStdString());
    }
}

void StagingStore::quarantineCorruptFile(const std::string &reason) const
{
    const QString target = stagingFilePath() + QStringLiteral(".corrupt-")
        + QString::number(QDateTime::currentSecsSinceEpoch());
    const bool moved = QFile::rename(stagingFilePath(), target);
    PRLOG_ERROR(QStringLiteral("StagingStore"),
                QStringLiteral("readUnlocked"),
                QStringLiteral("staging_corrupt"),
                QStringLiteral("parse_failed"),
                moved ? QStringLiteral("quarantined") : QStringLiteral("quarantine_failed"),
                logging::defaultWho(),
                QString(),
                (nlohmann::json{{"reason", reason},
                                {"quarantine", target.toStdString()}}));
    if (!moved) {
        throw StorageError("corrupt staging file could not be quarantined");
    }
}

} // namespace promptrail
