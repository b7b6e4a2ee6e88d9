#include "cli/PromptrailCli.hpp"

#include <iostream>
#include <set>
#include <string>

#include <QDateTime>
#include <QDir>

#include "common/config.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/promptrail_version.hpp"
#include "engine/attribution_cache.hpp"
#include "engine/attribution_report.hpp"
#include "engine/capture_pipeline.hpp"
#include "engine/commit_note_writer.hpp"
#include "engine/git_notes_store.hpp"
#include "engine/git_repository.hpp"
#include "engine/line_remapper.hpp"
#include "engine/notes_sync.hpp"
#include "engine/redactor.hpp"
#include "engine/staging_store.hpp"
#include "engine/sync_audit_log.hpp"

namespace promptrail {

namespace {

QString usageText()
{
    return QStringLiteral(
        "Usage:\n"
        "  promptrail capture                       (events as JSON lines on stdin)\n"
        "  promptrail attach [--commit SHA]\n"
        "  promptrail rewrite [amend|rebase]        (\"old new\" pairs on stdin)\n"
        "  promptrail pull [--remote NAME]\n"
        "  promptrail push [--remote NAME]\n"
        "  promptrail blame FILE [--rev REV]\n"
        "  promptrail report [--from ISO] [--to ISO] [--author A] [--file F]\n"
        "  promptrail cache rebuild\n"
        "  promptrail staging-count\n"
        "  promptrail version\n");
}

QString getArgValue(const QStringList &args, const QString &key)
{
    const int idx = args.indexOf(key);
    if (idx < 0 || idx + 1 >= args.size()) {
        return {};
    }
    return args.at(idx + 1);
}

std::optional<GitRepository> openRepository()
{
    auto repo = GitRepository::discover(QDir::currentPath());
    if (!repo) {
        std::cerr << "promptrail: not inside a git working copy" << std::endl;
        return repo;
    }
    logging::setProcessField(QStringLiteral("repo"), repo->topLevel());
    return repo;
}

std::string cachePath(const GitRepository &repo)
{
    return QDir(repo.stateDir()).filePath(QStringLiteral("cache.db")).toStdString();
}

// The cache is derived data; failing to refresh it never fails the command.
void refreshCache(const GitRepository &repo, const RecordStore &records)
{
    try {
        AttributionCache cache(cachePath(repo));
        cache.rebuild(records);
        cache.setMeta("notes_revision", records.revision());
    } catch (const StorageError &ex) {
        PRLOG_WARN(QStringLiteral("PromptrailCli"),
                   QStringLiteral("refreshCache"),
                   QStringLiteral("cache_refresh_failed"),
                   QStringLiteral("storage_error"),
                   QStringLiteral("skip"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"error", ex.what()}}));
    }
}

void reportFailure(const char *command, const std::exception &ex)
{
    PRLOG_ERROR(QStringLiteral("PromptrailCli"),
                QString::fromLatin1(command),
                QStringLiteral("command_failed"),
                QStringLiteral("exception"),
                QStringLiteral("abort_command"),
                logging::defaultWho(),
                QString(),
                (nlohmann::json{{"error", ex.what()}}));
    std::cerr << "promptrail " << command << ": " << ex.what() << std::endl;
}

nlohmann::json syncResultToJson(const SyncResult &result)
{
    nlohmann::json payload{
        {"ok", result.ok},
        {"updatedRecords", result.updatedRecords},
        {"addedReceipts", result.addedReceipts},
        {"conflicts", result.conflicts}
    };
    if (!result.error.empty()) {
        payload["error"] = result.error;
    }
    return payload;
}

} // namespace

PromptrailCli::PromptrailCli(std::istream &input)
    : m_input(input)
{
}

int PromptrailCli::run(int argc, char *argv[])
{
    QStringList args;
    args.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        args.push_back(QString::fromLocal8Bit(argv[i]));
    }

    if (args.size() < 2) {
        std::cerr << usageText().toStdString();
        return 1;
    }

    const QString command = args.at(1);
    logging::setProcessField(QStringLiteral("command"), command);
    PRLOG_INFO(QStringLiteral("PromptrailCli"),
               QStringLiteral("run"),
               QStringLiteral("cli_command"),
               QStringLiteral("user_invocation"),
               QStringLiteral("cli"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"command", command.toStdString()}}));

    try {
        return dispatch(command, args);
    } catch (const GitError &ex) {
        reportFailure("run", ex);
    } catch (const StorageError &ex) {
        reportFailure("run", ex);
    }
    const bool hook = command == QStringLiteral("capture") || command == QStringLiteral("attach")
        || command == QStringLiteral("rewrite");
    return hook ? 0 : 1;
}

int PromptrailCli::dispatch(const QString &command, const QStringList &args)
{
    if (command == QStringLiteral("capture")) {
        return runCapture(args);
    }
    if (command == QStringLiteral("attach")) {
        return runAttach(args);
    }
    if (command == QStringLiteral("rewrite")) {
        return runRewrite(args);
    }
    if (command == QStringLiteral("pull")) {
        return runPull(args);
    }
    if (command == QStringLiteral("push")) {
        return runPush(args);
    }
    if (command == QStringLiteral("blame")) {
        return runBlame(args);
    }
    if (command == QStringLiteral("report")) {
        return runReport(args);
    }
    if (command == QStringLiteral("cache")) {
        return runCache(args);
    }
    if (command == QStringLiteral("staging-count")) {
        return runStagingCount(args);
    }
    if (command == QStringLiteral("version")) {
        std::cout << PROMPTRAIL_VERSION << std::endl;
        return 0;
    }

    std::cerr << usageText().toStdString();
    return 1;
}

int PromptrailCli::runCapture(const QStringList &)
{
    auto repo = openRepository();
    if (!repo) {
        return 0;
    }

    try {
        const QString root = repo->topLevel();
        const PromptrailConfig config = loadConfig(root);
        const Redactor redactor(config.redaction, loadOrCreateSalt(repo->stateDir()));
        StagingStore staging(root);
        CapturePipeline pipeline(config.capture, redactor, staging, root);

        std::string author;
        CaptureQueue queue;
        int dropped = 0;
        std::string line;
        while (std::getline(m_input, line)) {
            if (line.find_first_not_of(" \t\r") == std::string::npos) {
                continue;
            }
            std::optional<CaptureEvent> event;
            try {
                event = parseCaptureEvent(nlohmann::json::parse(line));
            } catch (const nlohmann::json::exception &ex) {
                PRLOG_WARN(QStringLiteral("PromptrailCli"),
                           QStringLiteral("runCapture"),
                           QStringLiteral("capture_line_dropped"),
                           QStringLiteral("malformed_json"),
                           QStringLiteral("skip_line"),
                           logging::defaultWho(),
                           QString(),
                           (nlohmann::json{{"error", ex.what()}}));
                event.reset();
            }
            if (!event) {
                ++dropped;
                continue;
            }
            if (auto *prompt = std::get_if<PromptEvent>(&*event); prompt && prompt->author.empty()) {
                if (author.empty()) {
                    author = repo->userIdentity();
                }
                prompt->author = author;
            }
            queue.push(std::move(*event));
        }

        const int queued = static_cast<int>(queue.size());
        const int staged = pipeline.drain(queue);
        std::cout << nlohmann::json{{"staged", staged},
                                    {"dropped", dropped + queued - staged}}.dump()
                  << std::endl;
    } catch (const StorageError &ex) {
        reportFailure("capture", ex);
    } catch (const GitError &ex) {
        reportFailure("capture", ex);
    }
    return 0;
}

int PromptrailCli::runAttach(const QStringList &args)
{
    auto repo = openRepository();
    if (!repo) {
        return 0;
    }

    try {
        QString rev = getArgValue(args, QStringLiteral("--commit"));
        if (rev.isEmpty()) {
            rev = QStringLiteral("HEAD");
        }
        const auto commit = repo->resolveCommit(rev.toStdString());
        if (!commit) {
            std::cerr << "promptrail attach: cannot resolve " << rev.toStdString() << std::endl;
            return 0;
        }

        const auto files = repo->changedFiles(*commit);
        const std::set<std::string> changed(files.begin(), files.end());
        StagingStore staging(repo->topLevel());
        GitNotesStore notes(*repo);
        CommitNoteWriter writer(staging, notes, *repo);
        const int attached = writer.attach(*commit, changed);
        if (attached > 0) {
            refreshCache(*repo, notes);
        }
        std::cout << nlohmann::json{{"commit", *commit}, {"attached", attached}}.dump() << std::endl;
    } catch (const StorageError &ex) {
        reportFailure("attach", ex);
    } catch (const GitError &ex) {
        reportFailure("attach", ex);
    }
    return 0;
}

int PromptrailCli::runRewrite(const QStringList &)
{
    auto repo = openRepository();
    if (!repo) {
        return 0;
    }

    try {
        RewriteNotification notification;
        std::set<std::pair<std::string, std::string>> renames;
        std::string line;
        while (std::getline(m_input, line)) {
            const QStringList parts = QString::fromStdString(line).split(QLatin1Char(' '),
                                                                         Qt::SkipEmptyParts);
            if (parts.isEmpty()) {
                continue;
            }
            RewriteNotification::Entry entry;
            entry.oldCommit = parts.at(0).toStdString();
            if (parts.size() > 1 && parts.at(1) != QStringLiteral("-")) {
                entry.newCommit = parts.at(1).toStdString();
                for (const auto &rename : repo->renames(entry.oldCommit, entry.newCommit)) {
                    renames.insert(rename);
                }
            }
            notification.entries.push_back(entry);
        }
        notification.renames.assign(renames.begin(), renames.end());

        GitNotesStore notes(*repo);
        LineRangeRemapper remapper(notes, *repo);
        const RemapStats stats = remapper.apply(notification);
        if (stats.written > 0) {
            refreshCache(*repo, notes);
        }
        std::cout << nlohmann::json{{"records", stats.records},
                                    {"receipts", stats.receipts},
                                    {"clipped", stats.clipped},
                                    {"orphaned", stats.orphaned},
                                    {"rescued", stats.rescued},
                                    {"custody", stats.custody},
                                    {"written", stats.written}}.dump()
                  << std::endl;
    } catch (const StorageError &ex) {
        reportFailure("rewrite", ex);
    } catch (const GitError &ex) {
        reportFailure("rewrite", ex);
    }
    return 0;
}

int PromptrailCli::runPull(const QStringList &args)
{
    auto repo = openRepository();
    if (!repo) {
        return 1;
    }
    try {
        const PromptrailConfig config = loadConfig(repo->topLevel());
        QString remote = getArgValue(args, QStringLiteral("--remote"));
        if (remote.isEmpty()) {
            remote = QString::fromStdString(config.sync.remote);
        }
        GitNotesStore notes(*repo);
        GitNotesTransport transport(*repo, remote, notes.ref());
        SyncAuditLog audit(QDir(repo->stateDir()).filePath(QStringLiteral("sync-audit.jsonl")));
        NotesSyncManager sync(notes, transport, audit);

        const SyncResult result = sync.pull();
        if (result.ok) {
            refreshCache(*repo, notes);
        }
        std::cout << syncResultToJson(result).dump(2) << std::endl;
        return result.ok ? 0 : 1;
    } catch (const GitError &ex) {
        std::cerr << "promptrail pull: " << ex.what() << std::endl;
        return 1;
    }
}

int PromptrailCli::runPush(const QStringList &args)
{
    auto repo = openRepository();
    if (!repo) {
        return 1;
    }
    try {
        const PromptrailConfig config = loadConfig(repo->topLevel());
        QString remote = getArgValue(args, QStringLiteral("--remote"));
        if (remote.isEmpty()) {
            remote = QString::fromStdString(config.sync.remote);
        }
        GitNotesStore notes(*repo);
        GitNotesTransport transport(*repo, remote, notes.ref());
        SyncAuditLog audit(QDir(repo->stateDir()).filePath(QStringLiteral("sync-audit.jsonl")));
        NotesSyncManager sync(notes, transport, audit);

        const SyncResult result = sync.push();
        std::cout << syncResultToJson(result).dump(2) << std::endl;
        return result.ok ? 0 : 1;
    } catch (const GitError &ex) {
        std::cerr << "promptrail push: " << ex.what() << std::endl;
        return 1;
    }
}

int PromptrailCli::runBlame(const QStringList &args)
{
    if (args.size() < 3 || args.at(2).startsWith(QStringLiteral("--"))) {
        std::cerr << usageText().toStdString();
        return 1;
    }
    auto repo = openRepository();
    if (!repo) {
        return 1;
    }
    try {
        const std::string path = args.at(2).toStdString();
        const std::string rev = getArgValue(args, QStringLiteral("--rev")).toStdString();
        GitNotesStore notes(*repo);
        const BlameReport report = attributeBlame(path, repo->blame(path, rev), notes);
        std::cout << blameToJson(report).dump(2) << std::endl;
        return 0;
    } catch (const GitError &ex) {
        std::cerr << "promptrail blame: " << ex.what() << std::endl;
        return 1;
    } catch (const StorageError &ex) {
        std::cerr << "promptrail blame: " << ex.what() << std::endl;
        return 1;
    }
}

int PromptrailCli::runReport(const QStringList &args)
{
    ReceiptQuery filter;
    const QString fromValue = getArgValue(args, QStringLiteral("--from"));
    const QString toValue = getArgValue(args, QStringLiteral("--to"));
    if (!fromValue.isEmpty()) {
        filter.from = parseIso8601(fromValue);
        if (!filter.from) {
            std::cerr << "Invalid ISO8601 timestamp." << std::endl;
            return 1;
        }
    }
    if (!toValue.isEmpty()) {
        filter.to = parseIso8601(toValue);
        if (!filter.to) {
            std::cerr << "Invalid ISO8601 timestamp." << std::endl;
            return 1;
        }
    }
    filter.author = getArgValue(args, QStringLiteral("--author")).toStdString();
    filter.file = getArgValue(args, QStringLiteral("--file")).toStdString();

    auto repo = openRepository();
    if (!repo) {
        return 1;
    }

    GitNotesStore notes(*repo);
    std::vector<CachedReceipt> receipts;
    try {
        AttributionCache cache(cachePath(*repo));
        const std::string revision = notes.revision();
        if (cache.getMeta("notes_revision").value_or(std::string()) != revision) {
            cache.rebuild(notes);
            cache.setMeta("notes_revision", revision);
        }
        receipts = cache.query(filter);
    } catch (const StorageError &ex) {
        PRLOG_WARN(QStringLiteral("PromptrailCli"),
                   QStringLiteral("runReport"),
                   QStringLiteral("cache_unavailable"),
                   QStringLiteral("storage_error"),
                   QStringLiteral("scan_notes"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"error", ex.what()}}));
        try {
            receipts = collectReceipts(notes, filter);
        } catch (const StorageError &scanError) {
            std::cerr << "promptrail report: " << scanError.what() << std::endl;
            return 1;
        }
    }

    nlohmann::json rows = nlohmann::json::array();
    for (const auto &row : receipts) {
        rows.push_back(nlohmann::json{{"commitId", row.commitId}, {"receipt", row.receipt}});
    }
    nlohmann::json payload{
        {"summary", summaryToJson(summarize(receipts))},
        {"receipts", rows}
    };
    std::cout << payload.dump(2) << std::endl;
    return 0;
}

int PromptrailCli::runCache(const QStringList &args)
{
    if (args.size() < 3 || args.at(2) != QStringLiteral("rebuild")) {
        std::cerr << usageText().toStdString();
        return 1;
    }
    auto repo = openRepository();
    if (!repo) {
        return 1;
    }
    try {
        GitNotesStore notes(*repo);
        AttributionCache cache(cachePath(*repo));
        const int indexed = cache.rebuild(notes);
        cache.setMeta("notes_revision", notes.revision());
        std::cout << nlohmann::json{{"indexed", indexed}}.dump() << std::endl;
        return 0;
    } catch (const StorageError &ex) {
        std::cerr << "promptrail cache: " << ex.what() << std::endl;
        return 1;
    }
}

int PromptrailCli::runStagingCount(const QStringList &)
{
    auto repo = openRepository();
    if (!repo) {
        return 1;
    }
    try {
        StagingStore staging(repo->topLevel());
        std::cout << staging.count() << std::endl;
        return 0;
    } catch (const StorageError &ex) {
        std::cerr << "promptrail staging-count: " << ex.what() << std::endl;
        return 1;
    }
}

std::optional<std::chrono::system_clock::time_point> PromptrailCli::parseIso8601(
    const QString &value) const
{
    QDateTime dt = QDateTime::fromString(value, Qt::ISODate);
    if (!dt.isValid()) {
        return std::nullopt;
    }
    return std::chrono::system_clock::time_point{
        std::chrono::milliseconds{dt.toMSecsSinceEpoch()}};
}

} // namespace promptrail
