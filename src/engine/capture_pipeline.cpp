#include "engine/capture_pipeline.hpp"

#include <algorithm>

#include <QCryptographicHash>
#include <QDir>
#include <QFileInfo>
#include <QRegularExpression>
#include <QString>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "engine/redactor.hpp"
#include "engine/staging_store.hpp"

namespace promptrail {

namespace {

void logFieldDropped(const char *key, const nlohmann::json &value,
                     const char *why = "wrong_type")
{
    PRLOG_WARN(QStringLiteral("CapturePipeline"),
               QStringLiteral("parseCaptureEvent"),
               QStringLiteral("capture_field_dropped"),
               QString::fromLatin1(why),
               QStringLiteral("use_default"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"field", key}, {"type", value.type_name()}}));
}

// Field readers for hook input: a missing or null field yields the
// fallback, a wrongly typed one is logged and yields it too.
std::string stringField(const nlohmann::json &j, const char *key)
{
    const auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return std::string();
    }
    if (!it->is_string()) {
        logFieldDropped(key, *it);
        return std::string();
    }
    return it->get<std::string>();
}

int64_t integerField(const nlohmann::json &j, const char *key)
{
    const auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return 0;
    }
    if (!it->is_number_integer()) {
        logFieldDropped(key, *it);
        return 0;
    }
    return it->get<int64_t>();
}

double numberField(const nlohmann::json &j, const char *key)
{
    const auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return 0.0;
    }
    if (!it->is_number()) {
        logFieldDropped(key, *it);
        return 0.0;
    }
    return it->get<double>();
}

Timestamp parseEventTime(const nlohmann::json &j)
{
    const std::string value = stringField(j, "timestamp");
    if (value.empty()) {
        return std::chrono::system_clock::now();
    }
    const Timestamp parsed = fromIso8601Utc(value);
    if (parsed == Timestamp{}) {
        return std::chrono::system_clock::now();
    }
    return parsed;
}

TokenUsage parseTokenUsage(const nlohmann::json &j)
{
    TokenUsage tokens;
    const auto it = j.find("token_usage");
    if (it == j.end() || it->is_null()) {
        return tokens;
    }
    if (!it->is_object()) {
        logFieldDropped("token_usage", *it);
        return tokens;
    }
    tokens.input = integerField(*it, "input");
    tokens.output = integerField(*it, "output");
    tokens.cacheRead = integerField(*it, "cache_read");
    tokens.cacheWrite = integerField(*it, "cache_write");
    return tokens;
}

void addTokens(TokenUsage &target, const TokenUsage &extra)
{
    target.input += extra.input;
    target.output += extra.output;
    target.cacheRead += extra.cacheRead;
    target.cacheWrite += extra.cacheWrite;
}

void countDiffLines(const std::string &diff, int &additions, int &deletions)
{
    std::size_t pos = 0;
    while (pos < diff.size()) {
        std::size_t next = diff.find('\n', pos);
        if (next == std::string::npos) {
            next = diff.size();
        }
        const std::string line = diff.substr(pos, next - pos);
        if (line.rfind("+++", 0) == 0 || line.rfind("---", 0) == 0) {
            // File headers.
        } else if (!line.empty() && line[0] == '+') {
            ++additions;
        } else if (!line.empty() && line[0] == '-') {
            ++deletions;
        }
        pos = next + 1;
    }
}

// "mcp__<server>__<tool>" names the auxiliary service the tool talks to.
std::optional<std::string> serviceFromToolName(const std::string &toolName)
{
    const std::string prefix = "mcp__";
    if (toolName.rfind(prefix, 0) != 0) {
        return std::nullopt;
    }
    const std::size_t end = toolName.find("__", prefix.size());
    if (end == std::string::npos || end == prefix.size()) {
        return std::nullopt;
    }
    return toolName.substr(prefix.size(), end - prefix.size());
}

void mergeFileChange(Receipt &receipt, const FileChange &change)
{
    auto it = std::find_if(receipt.filesChanged.begin(), receipt.filesChanged.end(),
                           [&change](const FileChange &existing) {
                               return existing.path == change.path;
                           });
    if (it == receipt.filesChanged.end()) {
        receipt.filesChanged.push_back(change);
        return;
    }

    if (change.lineRange.length() > 0) {
        if (it->lineRange.length() == 0) {
            it->lineRange = change.lineRange;
        } else {
            it->lineRange.start = std::min(it->lineRange.start, change.lineRange.start);
            it->lineRange.end = std::max(it->lineRange.end, change.lineRange.end);
        }
    }
    it->additions += change.additions;
    it->deletions += change.deletions;
}

StagingEntry *latestEntryForSession(std::vector<StagingEntry> &entries, const std::string &sessionId)
{
    StagingEntry *latest = nullptr;
    for (auto &entry : entries) {
        if (entry.receipt.sessionId != sessionId) {
            continue;
        }
        if (!latest || entry.receipt.promptNumber >= latest->receipt.promptNumber) {
            latest = &entry;
        }
    }
    return latest;
}

void logDropped(const char *where, const char *why, const nlohmann::json &context)
{
    PRLOG_WARN(QStringLiteral("CapturePipeline"),
               QString::fromLatin1(where),
               QStringLiteral("capture_event_dropped"),
               QString::fromLatin1(why),
               QStringLiteral("skip_event"),
               logging::defaultWho(),
               QString(),
               context);
}

} // namespace

std::optional<CaptureEvent> parseCaptureEvent(const nlohmann::json &j)
{
    if (!j.is_object()) {
        return std::nullopt;
    }
    const std::string type = stringField(j, "type");
    const std::string sessionId = stringField(j, "session_id");
    if (sessionId.empty()) {
        logDropped("parseCaptureEvent", "missing_session_id", nlohmann::json{{"type", type}});
        return std::nullopt;
    }

    if (type == "prompt") {
        PromptEvent event;
        event.sessionId = sessionId;
        event.timestamp = parseEventTime(j);
        event.promptText = stringField(j, "prompt_text");
        event.model = stringField(j, "model");
        event.provider = stringField(j, "provider");
        event.author = stringField(j, "author");
        event.tokens = parseTokenUsage(j);
        return CaptureEvent{event};
    }
    if (type == "tool") {
        ToolEvent event;
        event.sessionId = sessionId;
        event.timestamp = parseEventTime(j);
        event.toolName = stringField(j, "tool_name");
        event.filePath = stringField(j, "file_path");
        if (j.contains("line_range")) {
            const LineRange range = j.at("line_range").get<LineRange>();
            if (range.length() > 0) {
                event.lineRange = range;
            } else {
                logFieldDropped("line_range", j.at("line_range"), "invalid_range");
            }
        }
        event.diff = stringField(j, "diff");
        return CaptureEvent{event};
    }
    if (type == "response") {
        ResponseEvent event;
        event.sessionId = sessionId;
        event.timestamp = parseEventTime(j);
        event.responseText = stringField(j, "response_text");
        event.costUsd = numberField(j, "cost_usd");
        event.tokens = parseTokenUsage(j);
        return CaptureEvent{event};
    }
    if (type == "session") {
        SessionEvent event;
        event.sessionId = sessionId;
        event.timestamp = parseEventTime(j);
        event.kind = stringField(j, "kind") == "spawn" ? SessionEvent::Kind::Spawn
                                                       : SessionEvent::Kind::End;
        event.childSessionId = stringField(j, "child_session_id");
        return CaptureEvent{event};
    }

    logDropped("parseCaptureEvent", "unknown_event_type", nlohmann::json{{"type", type}});
    return std::nullopt;
}

std::optional<LineRange> lineRangeFromDiff(const std::string &diff)
{
    static const QRegularExpression hunkHeader(
        QStringLiteral("^@@ -\\d+(?:,\\d+)? \\+(\\d+)(?:,(\\d+))? @@"),
        QRegularExpression::MultilineOption);

    std::optional<LineRange> span;
    auto it = hunkHeader.globalMatch(QString::fromStdString(diff));
    while (it.hasNext()) {
        const QRegularExpressionMatch match = it.next();
        const int start = match.captured(1).toInt();
        const int count = match.captured(2).isEmpty() ? 1 : match.captured(2).toInt();
        if (count <= 0 || start <= 0) {
            continue;
        }
        const LineRange hunk{start, start + count - 1};
        if (!span) {
            span = hunk;
        } else {
            span->start = std::min(span->start, hunk.start);
            span->end = std::max(span->end, hunk.end);
        }
    }
    return span;
}

void CaptureQueue::push(CaptureEvent event)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_events.push_back(std::move(event));
}

std::optional<CaptureEvent> CaptureQueue::pop()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_events.empty()) {
        return std::nullopt;
    }
    CaptureEvent event = std::move(m_events.front());
    m_events.pop_front();
    return event;
}

std::size_t CaptureQueue::size() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_events.size();
}

CapturePipeline::CapturePipeline(const CaptureConfig &config,
                                 const Redactor &redactor,
                                 StagingStore &staging,
                                 const QString &worktreeRoot)
    : m_config(config)
    , m_redactor(redactor)
    , m_staging(staging)
    , m_worktreeRoot(worktreeRoot)
{
}

bool CapturePipeline::process(const CaptureEvent &event)
{
    try {
        if (const auto *prompt = std::get_if<PromptEvent>(&event)) {
            return processPrompt(*prompt);
        }
        if (const auto *tool = std::get_if<ToolEvent>(&event)) {
            return processTool(*tool);
        }
        if (const auto *response = std::get_if<ResponseEvent>(&event)) {
            return processResponse(*response);
        }
        if (const auto *session = std::get_if<SessionEvent>(&event)) {
            return processSession(*session);
        }
    } catch (const StorageError &ex) {
        PRLOG_ERROR(QStringLiteral("CapturePipeline"),
                    QStringLiteral("process"),
                    QStringLiteral("staging_write_failed"),
                    QStringLiteral("storage_error"),
                    QStringLiteral("event_lost"),
                    logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"error", ex.what()}}));
    }
    return false;
}

int CapturePipeline::drain(CaptureQueue &queue)
{
    int staged = 0;
    while (auto event = queue.pop()) {
        if (process(*event)) {
            ++staged;
        }
    }
    return staged;
}

std::string CapturePipeline::deriveReceiptId(const std::string &provider,
                                             const std::string &sessionId,
                                             int promptNumber,
                                             const std::string &promptHash,
                                             Timestamp timestamp)
{
    QCryptographicHash hash(QCryptographicHash::Sha256);
    const std::string material = provider + '\n' + sessionId + '\n'
        + std::to_string(promptNumber) + '\n' + promptHash + '\n'
        + std::to_string(toEpochSeconds(timestamp));
    hash.addData(QByteArray::fromStdString(material));
    return hash.result().toHex().left(32).toStdString();
}

std::string CapturePipeline::hashPrompt(const std::string &text)
{
    return "sha256:"
        + QCryptographicHash::hash(QByteArray::fromStdString(text), QCryptographicHash::Sha256)
              .toHex()
              .toStdString();
}

std::string CapturePipeline::truncate(const std::string &text, const char *field) const
{
    const QString value = QString::fromStdString(text);
    if (value.size() <= m_config.maxPromptLength) {
        return text;
    }
    PRLOG_WARN(QStringLiteral("CapturePipeline"),
               QStringLiteral("truncate"),
               QStringLiteral("capture_text_truncated"),
               QStringLiteral("oversized"),
               QStringLiteral("truncate"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"field", field},
                               {"length", value.size()},
                               {"limit", m_config.maxPromptLength}}));
    return value.left(m_config.maxPromptLength).toStdString();
}

std::string CapturePipeline::scrub(const std::string &text) const
{
    const RedactionResult result = m_redactor.redact(text);
    if (result.total() > 0) {
        PRLOG_INFO(QStringLiteral("CapturePipeline"),
                   QStringLiteral("scrub"),
                   QStringLiteral("secrets_redacted"),
                   QStringLiteral("pattern_match"),
                   QStringLiteral("redactor"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"counts", result.counts}}));
    }
    return result.text;
}

std::string CapturePipeline::normalizePath(const std::string &path) const
{
    const QString value = QString::fromStdString(path);
    if (m_worktreeRoot.isEmpty() || !QFileInfo(value).isAbsolute()) {
        return QDir::cleanPath(value).toStdString();
    }
    const QString relative = QDir(m_worktreeRoot).relativeFilePath(value);
    if (relative.startsWith(QLatin1String(".."))) {
        return QDir::cleanPath(value).toStdString();
    }
    return relative.toStdString();
}

bool CapturePipeline::processPrompt(const PromptEvent &event)
{
    const std::string promptHash = hashPrompt(event.promptText);
    const std::string summary = scrub(truncate(event.promptText, "prompt_text"));
    const std::string provider = event.provider.empty() ? "unknown" : event.provider;

    bool staged = false;
    m_staging.transact([&](StagingState &state) {
        // A hook retry delivers the same prompt again.
        const bool replay = std::any_of(
            state.entries.begin(), state.entries.end(), [&](const StagingEntry &existing) {
                return existing.receipt.sessionId == event.sessionId
                    && existing.receipt.promptHash == promptHash
                    && toEpochSeconds(existing.receipt.startedAt) == toEpochSeconds(event.timestamp);
            });
        if (replay) {
            return;
        }

        SessionCursor &cursor = state.sessions[event.sessionId];
        for (const auto &entry : state.entries) {
            if (entry.receipt.sessionId == event.sessionId) {
                cursor.lastPromptNumber = std::max(cursor.lastPromptNumber, entry.receipt.promptNumber);
            }
        }

        StagingEntry entry;
        entry.stagedAt = std::chrono::system_clock::now();
        Receipt &receipt = entry.receipt;
        receipt.promptNumber = cursor.lastPromptNumber + 1;
        receipt.id = deriveReceiptId(provider, event.sessionId, receipt.promptNumber,
                                     promptHash, event.timestamp);
        receipt.provider = provider;
        receipt.model = event.model;
        receipt.author = event.author;
        receipt.sessionId = event.sessionId;
        if (!cursor.lastReceiptId.empty()) {
            receipt.parentReceiptId = cursor.lastReceiptId;
        }
        receipt.startedAt = event.timestamp;
        receipt.endedAt = event.timestamp;
        receipt.capturedAt = event.timestamp;
        receipt.promptHash = promptHash;
        receipt.promptSummary = summary;
        receipt.messageCount = 1;
        receipt.tokens = event.tokens;
        if (m_config.storeFullConversation) {
            receipt.conversation.push_back(ConversationTurn{"user", summary});
        }

        cursor.lastPromptNumber = receipt.promptNumber;
        cursor.lastReceiptId = receipt.id;
        state.entries.push_back(entry);
        staged = true;
    });
    return staged;
}

bool CapturePipeline::processTool(const ToolEvent &event)
{
    FileChange change;
    if (!event.filePath.empty()) {
        change.path = normalizePath(event.filePath);
        if (event.lineRange && event.lineRange->length() > 0) {
            change.lineRange = *event.lineRange;
        } else if (auto fromDiff = lineRangeFromDiff(event.diff)) {
            change.lineRange = *fromDiff;
        } else {
            PRLOG_DEBUG(QStringLiteral("CapturePipeline"),
                        QStringLiteral("processTool"),
                        QStringLiteral("line_range_unknown"),
                        QStringLiteral("no_range_no_hunks"),
                        QStringLiteral("empty_range"),
                        logging::defaultWho(),
                        QString(),
                        (nlohmann::json{{"file", event.filePath}}));
        }
        countDiffLines(event.diff, change.additions, change.deletions);
        if (event.diff.empty()) {
            change.additions = change.lineRange.length();
        }
    }

    m_staging.transact([&](StagingState &state) {
        StagingEntry *entry = latestEntryForSession(state.entries, event.sessionId);
        if (!entry) {
            // Tool activity without a staged prompt, e.g. after the prompt's
            // receipt was already committed.
            SessionCursor &cursor = state.sessions[event.sessionId];
            StagingEntry created;
            created.stagedAt = std::chrono::system_clock::now();
            created.receipt.promptNumber = cursor.lastPromptNumber + 1;
            created.receipt.id = deriveReceiptId("unknown", event.sessionId,
                                                 created.receipt.promptNumber,
                                                 hashPrompt(""), event.timestamp);
            created.receipt.provider = "unknown";
            created.receipt.sessionId = event.sessionId;
            if (!cursor.lastReceiptId.empty()) {
                created.receipt.parentReceiptId = cursor.lastReceiptId;
            }
            created.receipt.startedAt = event.timestamp;
            created.receipt.endedAt = event.timestamp;
            created.receipt.capturedAt = event.timestamp;
            created.receipt.promptHash = hashPrompt("");
            cursor.lastPromptNumber = created.receipt.promptNumber;
            cursor.lastReceiptId = created.receipt.id;
            state.entries.push_back(created);
            entry = &state.entries.back();
        }

        Receipt &receipt = entry->receipt;
        if (!event.toolName.empty()) {
            receipt.toolsUsed.insert(event.toolName);
            if (auto service = serviceFromToolName(event.toolName)) {
                receipt.servicesContacted.insert(*service);
            }
        }
        if (!change.path.empty()) {
            mergeFileChange(receipt, change);
        }
        receipt.endedAt = std::max(receipt.endedAt, event.timestamp);
        receipt.capturedAt = std::max(receipt.capturedAt, event.timestamp);
    });
    return true;
}

bool CapturePipeline::processResponse(const ResponseEvent &event)
{
    const std::string summary = scrub(truncate(event.responseText, "response_text"));
    bool attached = false;
    m_staging.update([&](std::vector<StagingEntry> &entries) {
        StagingEntry *entry = latestEntryForSession(entries, event.sessionId);
        if (!entry) {
            return;
        }
        Receipt &receipt = entry->receipt;
        if (!summary.empty()) {
            receipt.responseSummary = summary;
            if (m_config.storeFullConversation) {
                receipt.conversation.push_back(ConversationTurn{"assistant", summary});
            }
        }
        receipt.costUsd += event.costUsd;
        addTokens(receipt.tokens, event.tokens);
        ++receipt.messageCount;
        receipt.endedAt = std::max(receipt.endedAt, event.timestamp);
        receipt.capturedAt = std::max(receipt.capturedAt, event.timestamp);
        attached = true;
    });
    if (!attached) {
        logDropped("processResponse", "no_open_receipt",
                   nlohmann::json{{"session", event.sessionId}});
    }
    return attached;
}

bool CapturePipeline::processSession(const SessionEvent &event)
{
    bool attached = false;
    m_staging.update([&](std::vector<StagingEntry> &entries) {
        StagingEntry *entry = latestEntryForSession(entries, event.sessionId);
        if (!entry) {
            return;
        }
        Receipt &receipt = entry->receipt;
        if (event.kind == SessionEvent::Kind::Spawn) {
            if (!event.childSessionId.empty()
                && std::find(receipt.subSessions.begin(), receipt.subSessions.end(),
                             event.childSessionId) == receipt.subSessions.end()) {
                receipt.subSessions.push_back(event.childSessionId);
            }
        } else {
            receipt.endedAt = std::max(receipt.endedAt, event.timestamp);
        }
        receipt.capturedAt = std::max(receipt.capturedAt, event.timestamp);
        attached = true;
    });
    if (!attached) {
        logDropped("processSession", "no_open_receipt",
                   nlohmann::json{{"session", event.sessionId}});
    }
    return attached;
}

} // namespace promptrail
