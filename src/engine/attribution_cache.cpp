#include "engine/attribution_cache.hpp"

#include <filesystem>

#include <sqlite3.h>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "engine/record_store.hpp"

namespace promptrail {

namespace {

constexpr const char *kCreateReceiptsTable =
    "CREATE TABLE IF NOT EXISTS receipts ("
    "    id TEXT NOT NULL,"
    "    commit_id TEXT NOT NULL,"
    "    provider TEXT,"
    "    model TEXT,"
    "    author TEXT,"
    "    session_id TEXT,"
    "    captured_at INTEGER NOT NULL,"
    "    started_at INTEGER,"
    "    ended_at INTEGER,"
    "    cost_usd REAL,"
    "    orphaned INTEGER NOT NULL DEFAULT 0,"
    "    payload TEXT NOT NULL,"
    "    PRIMARY KEY (id, commit_id)"
    ");";

constexpr const char *kCreateFileChangesTable =
    "CREATE TABLE IF NOT EXISTS file_changes ("
    "    receipt_id TEXT NOT NULL,"
    "    commit_id TEXT NOT NULL,"
    "    path TEXT NOT NULL,"
    "    line_start INTEGER,"
    "    line_end INTEGER,"
    "    status TEXT"
    ");";

constexpr const char *kCreateMetaTable =
    "CREATE TABLE IF NOT EXISTS meta ("
    "    key TEXT PRIMARY KEY,"
    "    value TEXT NOT NULL"
    ");";

constexpr const char *kCreateIndexes =
    "CREATE INDEX IF NOT EXISTS idx_receipts_commit ON receipts(commit_id);"
    "CREATE INDEX IF NOT EXISTS idx_receipts_author ON receipts(author);"
    "CREATE INDEX IF NOT EXISTS idx_receipts_captured ON receipts(captured_at);"
    "CREATE INDEX IF NOT EXISTS idx_file_changes_path ON file_changes(path);"
    "CREATE INDEX IF NOT EXISTS idx_file_changes_receipt ON file_changes(receipt_id, commit_id);";

class Statement {
public:
    Statement(sqlite3 *db, const char *sql)
    {
        if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            throw StorageError(std::string("sqlite prepare failed: ") + sqlite3_errmsg(db));
        }
    }

    ~Statement()
    {
        if (stmt) {
            sqlite3_finalize(stmt);
        }
    }

    Statement(const Statement &) = delete;
    Statement &operator=(const Statement &) = delete;

    sqlite3_stmt *get() const
    {
        return stmt;
    }

private:
    sqlite3_stmt *stmt = nullptr;
};

void execOrThrow(sqlite3 *db, const char *sql)
{
    char *error = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &error) != SQLITE_OK) {
        std::string message = error ? error : "sqlite exec failed";
        sqlite3_free(error);
        throw StorageError(message);
    }
}

void bindText(sqlite3_stmt *stmt, int index, const std::string &value)
{
    sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
}

std::string columnText(sqlite3_stmt *stmt, int index)
{
    const unsigned char *text = sqlite3_column_text(stmt, index);
    if (!text) {
        return {};
    }
    return reinterpret_cast<const char *>(text);
}

std::vector<CachedReceipt> collectRows(sqlite3_stmt *stmt)
{
    std::vector<CachedReceipt> rows;
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        CachedReceipt row;
        row.commitId = columnText(stmt, 0);
        try {
            row.receipt = nlohmann::json::parse(columnText(stmt, 1)).get<Receipt>();
        } catch (const nlohmann::json::exception &) {
            continue;
        }
        rows.push_back(std::move(row));
    }
    return rows;
}

class Transaction {
public:
    explicit Transaction(sqlite3 *db)
        : m_db(db)
    {
        execOrThrow(m_db, "BEGIN IMMEDIATE;");
    }

    ~Transaction()
    {
        if (!m_committed) {
            sqlite3_exec(m_db, "ROLLBACK;", nullptr, nullptr, nullptr);
        }
    }

    void commit()
    {
        execOrThrow(m_db, "COMMIT;");
        m_committed = true;
    }

private:
    sqlite3 *m_db;
    bool m_committed = false;
};

} // namespace

struct AttributionCache::Impl {
    sqlite3 *db = nullptr;

    void insertRecord(const CommitRecord &record)
    {
        Statement removeReceipts(db, "DELETE FROM receipts WHERE commit_id = ?;");
        bindText(removeReceipts.get(), 1, record.commitId);
        if (sqlite3_step(removeReceipts.get()) != SQLITE_DONE) {
            throw StorageError("failed to clear cached receipts");
        }
        Statement removeChanges(db, "DELETE FROM file_changes WHERE commit_id = ?;");
        bindText(removeChanges.get(), 1, record.commitId);
        if (sqlite3_step(removeChanges.get()) != SQLITE_DONE) {
            throw StorageError("failed to clear cached file changes");
        }

        for (const auto &receipt : record.receipts) {
            Statement stmt(db,
                           "INSERT OR REPLACE INTO receipts (id, commit_id, provider, model, "
                           "author, session_id, captured_at, started_at, ended_at, cost_usd, "
                           "orphaned, payload) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);");
            bindText(stmt.get(), 1, receipt.id);
            bindText(stmt.get(), 2, record.commitId);
            bindText(stmt.get(), 3, receipt.provider);
            bindText(stmt.get(), 4, receipt.model);
            bindText(stmt.get(), 5, receipt.author);
            bindText(stmt.get(), 6, receipt.sessionId);
            sqlite3_bind_int64(stmt.get(), 7, toEpochSeconds(receipt.capturedAt));
            sqlite3_bind_int64(stmt.get(), 8, toEpochSeconds(receipt.startedAt));
            sqlite3_bind_int64(stmt.get(), 9, toEpochSeconds(receipt.endedAt));
            sqlite3_bind_double(stmt.get(), 10, receipt.costUsd);
            sqlite3_bind_int(stmt.get(), 11, receipt.orphaned ? 1 : 0);
            bindText(stmt.get(), 12, nlohmann::json(receipt).dump());
            if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
                throw StorageError("failed to cache receipt");
            }

            for (const auto &change : receipt.filesChanged) {
                Statement changeStmt(db,
                                     "INSERT INTO file_changes (receipt_id, commit_id, path, "
                                     "line_start, line_end, status) VALUES (?, ?, ?, ?, ?, ?);");
                bindText(changeStmt.get(), 1, receipt.id);
                bindText(changeStmt.get(), 2, record.commitId);
                bindText(changeStmt.get(), 3, change.path);
                sqlite3_bind_int(changeStmt.get(), 4, change.lineRange.start);
                sqlite3_bind_int(changeStmt.get(), 5, change.lineRange.end);
                bindText(changeStmt.get(), 6, toStatusString(change.status));
                if (sqlite3_step(changeStmt.get()) != SQLITE_DONE) {
                    throw StorageError("failed to cache file change");
                }
            }
        }
    }
};

AttributionCache::AttributionCache(const std::string &dbPath)
    : impl(std::make_unique<Impl>())
{
    const std::filesystem::path path(dbPath);
    if (path.has_parent_path()) {
        std::error_code error;
        std::filesystem::create_directories(path.parent_path(), error);
    }

    if (sqlite3_open(dbPath.c_str(), &impl->db) != SQLITE_OK) {
        const std::string message = impl->db ? sqlite3_errmsg(impl->db) : "out of memory";
        sqlite3_close(impl->db);
        impl->db = nullptr;
        throw StorageError("failed to open attribution cache: " + message);
    }

    execOrThrow(impl->db, kCreateReceiptsTable);
    execOrThrow(impl->db, kCreateFileChangesTable);
    execOrThrow(impl->db, kCreateMetaTable);
    execOrThrow(impl->db, kCreateIndexes);
}

AttributionCache::~AttributionCache()
{
    if (impl && impl->db) {
        sqlite3_close(impl->db);
        impl->db = nullptr;
    }
}

int AttributionCache::rebuild(const RecordStore &records)
{
    Transaction transaction(impl->db);
    execOrThrow(impl->db, "DELETE FROM receipts;");
    execOrThrow(impl->db, "DELETE FROM file_changes;");

    int indexed = 0;
    for (const auto &commit : records.listCommits()) {
        const auto record = records.read(commit);
        if (!record) {
            continue;
        }
        impl->insertRecord(*record);
        indexed += static_cast<int>(record->receipts.size());
    }
    transaction.commit();
    return indexed;
}

void AttributionCache::upsertRecord(const CommitRecord &record)
{
    Transaction transaction(impl->db);
    impl->insertRecord(record);
    transaction.commit();
}

std::vector<CachedReceipt> AttributionCache::receiptsById(const std::string &receiptId) const
{
    Statement stmt(impl->db,
                   "SELECT commit_id, payload FROM receipts WHERE id = ? "
                   "ORDER BY captured_at ASC, commit_id ASC;");
    bindText(stmt.get(), 1, receiptId);
    return collectRows(stmt.get());
}

std::vector<CachedReceipt> AttributionCache::receiptsForCommit(const std::string &commitId) const
{
    Statement stmt(impl->db,
                   "SELECT commit_id, payload FROM receipts WHERE commit_id = ? "
                   "ORDER BY captured_at ASC, id ASC;");
    bindText(stmt.get(), 1, commitId);
    return collectRows(stmt.get());
}

std::vector<CachedReceipt> AttributionCache::query(const ReceiptQuery &filter) const
{
    std::string sql = "SELECT r.commit_id, r.payload FROM receipts r WHERE 1 = 1";
    if (filter.from) {
        sql += " AND r.captured_at >= ?";
    }
    if (filter.to) {
        sql += " AND r.captured_at <= ?";
    }
    if (!filter.author.empty()) {
        sql += " AND r.author = ?";
    }
    if (!filter.commitId.empty()) {
        sql += " AND r.commit_id = ?";
    }
    if (!filter.file.empty()) {
        sql += " AND EXISTS (SELECT 1 FROM file_changes f WHERE f.receipt_id = r.id "
               "AND f.commit_id = r.commit_id AND f.path = ?)";
    }
    sql += " ORDER BY r.captured_at ASC, r.id ASC, r.commit_id ASC;";

    Statement stmt(impl->db, sql.c_str());
    int bindIndex = 1;
    if (filter.from) {
        sqlite3_bind_int64(stmt.get(), bindIndex++, toEpochSeconds(*filter.from));
    }
    if (filter.to) {
        sqlite3_bind_int64(stmt.get(), bindIndex++, toEpochSeconds(*filter.to));
    }
    if (!filter.author.empty()) {
        bindText(stmt.get(), bindIndex++, filter.author);
    }
    if (!filter.commitId.empty()) {
        bindText(stmt.get(), bindIndex++, filter.commitId);
    }
    if (!filter.file.empty()) {
        bindText(stmt.get(), bindIndex++, filter.file);
    }
    return collectRows(stmt.get());
}

int AttributionCache::receiptCount() const
{
    Statement stmt(impl->db, "SELECT COUNT(*) FROM receipts;");
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        return 0;
    }
    return sqlite3_column_int(stmt.get(), 0);
}

std::optional<std::string> AttributionCache::getMeta(const std::string &key) const
{
    Statement stmt(impl->db, "SELECT value FROM meta WHERE key = ?;");
    bindText(stmt.get(), 1, key);
    if (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        return columnText(stmt.get(), 0);
    }
    return std::nullopt;
}

void AttributionCache::setMeta(const std::string &key, const std::string &value)
{
    Statement stmt(impl->db, "INSERT OR REPLACE INTO meta (key, value) VALUES (?, ?);");
    bindText(stmt.get(), 1, key);
    bindText(stmt.get(), 2, value);
    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        throw StorageError("failed to set meta value");
    }
}

} // namespace promptrail
