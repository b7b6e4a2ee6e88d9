#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace promptrail {

inline std::string toIso8601Utc(std::chrono::system_clock::time_point timestamp)
{
    std::time_t time = std::chrono::system_clock::to_time_t(timestamp);
    std::tm tm{};
    gmtime_r(&time, &tm);
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

inline std::chrono::system_clock::time_point fromIso8601Utc(const std::string &value)
{
    std::tm tm{};
    std::istringstream in(value);
    in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (in.fail()) {
        return std::chrono::system_clock::time_point{};
    }
    std::time_t time = timegm(&tm);
    if (time == static_cast<std::time_t>(-1)) {
        return std::chrono::system_clock::time_point{};
    }
    return std::chrono::system_clock::from_time_t(time);
}

inline int64_t toEpochSeconds(std::chrono::system_clock::time_point timestamp)
{
    return std::chrono::duration_cast<std::chrono::seconds>(
               timestamp.time_since_epoch())
        .count();
}

inline std::chrono::system_clock::time_point fromEpochSeconds(int64_t value)
{
    return std::chrono::system_clock::time_point{std::chrono::seconds{value}};
}

inline std::string toStatusString(FileChangeStatus status)
{
    switch (status) {
    case FileChangeStatus::Attributed:
        return "attributed";
    case FileChangeStatus::Clipped:
        return "clipped";
    case FileChangeStatus::Orphaned:
        return "orphaned";
    }
    return "attributed";
}

inline FileChangeStatus parseStatusString(const std::string &value)
{
    if (value == "clipped") {
        return FileChangeStatus::Clipped;
    }
    if (value == "orphaned") {
        return FileChangeStatus::Orphaned;
    }
    return FileChangeStatus::Attributed;
}

inline void to_json(nlohmann::json &j, const FileChangeStatus &status)
{
    j = toStatusString(status);
}

inline void from_json(const nlohmann::json &j, FileChangeStatus &status)
{
    if (j.is_string()) {
        status = parseStatusString(j.get<std::string>());
    } else {
        status = FileChangeStatus::Attributed;
    }
}

inline void to_json(nlohmann::json &j, const LineRange &range)
{
    j = nlohmann::json::array({range.start, range.end});
}

inline void from_json(const nlohmann::json &j, LineRange &range)
{
    if (j.is_array() && j.size() == 2 && j.at(0).is_number_integer()
        && j.at(1).is_number_integer()) {
        range.start = j.at(0).get<int>();
        range.end = j.at(1).get<int>();
    } else {
        range = LineRange{};
    }
}

inline void to_json(nlohmann::json &j, const TokenUsage &tokens)
{
    j = nlohmann::json{
        {"input", tokens.input},
        {"output", tokens.output},
        {"cacheRead", tokens.cacheRead},
        {"cacheWrite", tokens.cacheWrite}
    };
}

inline void from_json(const nlohmann::json &j, TokenUsage &tokens)
{
    if (!j.is_object()) {
        tokens = TokenUsage{};
        return;
    }
    tokens.input = j.value("input", int64_t{0});
    tokens.output = j.value("output", int64_t{0});
    tokens.cacheRead = j.value("cacheRead", int64_t{0});
    tokens.cacheWrite = j.value("cacheWrite", int64_t{0});
}

inline void to_json(nlohmann::json &j, const FileChange &change)
{
    j = nlohmann::json{
        {"path", change.path},
        {"blobId", change.blobId},
        {"lineRange", change.lineRange},
        {"additions", change.additions},
        {"deletions", change.deletions},
        {"status", change.status}
    };
    if (change.originalRange.has_value()) {
        j["originalRange"] = *change.originalRange;
        j["originalLines"] = change.originalLines;
    }
}

inline void from_json(const nlohmann::json &j, FileChange &change)
{
    change.path = j.value("path", "");
    change.blobId = j.value("blobId", "");
    if (j.contains("lineRange")) {
        change.lineRange = j.at("lineRange").get<LineRange>();
    } else {
        change.lineRange = LineRange{};
    }
    change.additions = j.value("additions", 0);
    change.deletions = j.value("deletions", 0);
    if (j.contains("status")) {
        change.status = j.at("status").get<FileChangeStatus>();
    } else {
        change.status = FileChangeStatus::Attributed;
    }
    if (j.contains("originalRange")) {
        change.originalRange = j.at("originalRange").get<LineRange>();
        change.originalLines = j.value("originalLines", change.originalRange->length());
    } else {
        change.originalRange.reset();
        change.originalLines = 0;
    }
}

inline void to_json(nlohmann::json &j, const ConversationTurn &turn)
{
    j = nlohmann::json{{"role", turn.role}, {"text", turn.text}};
}

inline void from_json(const nlohmann::json &j, ConversationTurn &turn)
{
    turn.role = j.value("role", "");
    turn.text = j.value("text", "");
}

inline void to_json(nlohmann::json &j, const Receipt &receipt)
{
    j = nlohmann::json{
        {"id", receipt.id},
        {"provider", receipt.provider},
        {"model", receipt.model},
        {"author", receipt.author},
        {"sessionId", receipt.sessionId},
        {"promptNumber", receipt.promptNumber},
        {"parentReceiptId", receipt.parentReceiptId.has_value()
             ? nlohmann::json(*receipt.parentReceiptId)
             : nlohmann::json(nullptr)},
        {"startedAt", toIso8601Utc(receipt.startedAt)},
        {"endedAt", toIso8601Utc(receipt.endedAt)},
        {"capturedAt", toIso8601Utc(receipt.capturedAt)},
        {"promptHash", receipt.promptHash},
        {"promptSummary", receipt.promptSummary},
        {"responseSummary", receipt.responseSummary},
        {"messageCount", receipt.messageCount},
        {"costUsd", receipt.costUsd},
        {"tokens", receipt.tokens},
        {"toolsUsed", receipt.toolsUsed},
        {"servicesContacted", receipt.servicesContacted},
        {"subSessions", receipt.subSessions},
        {"filesChanged", receipt.filesChanged}
    };
    if (!receipt.conversation.empty()) {
        j["conversation"] = receipt.conversation;
    }
    if (receipt.orphaned) {
        j["orphaned"] = true;
        j["orphanReason"] = receipt.orphanReason;
    }
    if (!receipt.custodyOf.empty()) {
        j["custodyOf"] = receipt.custodyOf;
    }
}

inline void from_json(const nlohmann::json &j, Receipt &receipt)
{
    receipt.id = j.value("id", "");
    receipt.provider = j.value("provider", "");
    receipt.model = j.value("model", "");
    receipt.author = j.value("author", "");
    receipt.sessionId = j.value("sessionId", "");
    receipt.promptNumber = j.value("promptNumber", 0);
    if (j.contains("parentReceiptId") && j.at("parentReceiptId").is_string()) {
        receipt.parentReceiptId = j.at("parentReceiptId").get<std::string>();
    } else {
        receipt.parentReceiptId.reset();
    }
    receipt.startedAt = fromIso8601Utc(j.value("startedAt", ""));
    receipt.endedAt = fromIso8601Utc(j.value("endedAt", ""));
    receipt.capturedAt = fromIso8601Utc(j.value("capturedAt", ""));
    receipt.promptHash = j.value("promptHash", "");
    receipt.promptSummary = j.value("promptSummary", "");
    receipt.responseSummary = j.value("responseSummary", "");
    receipt.messageCount = j.value("messageCount", 0);
    receipt.costUsd = j.value("costUsd", 0.0);
    if (j.contains("tokens")) {
        receipt.tokens = j.at("tokens").get<TokenUsage>();
    } else {
        receipt.tokens = TokenUsage{};
    }
    if (j.contains("toolsUsed") && j.at("toolsUsed").is_array()) {
        receipt.toolsUsed = j.at("toolsUsed").get<std::set<std::string>>();
    } else {
        receipt.toolsUsed.clear();
    }
    if (j.contains("servicesContacted") && j.at("servicesContacted").is_array()) {
        receipt.servicesContacted = j.at("servicesContacted").get<std::set<std::string>>();
    } else {
        receipt.servicesContacted.clear();
    }
    if (j.contains("subSessions") && j.at("subSessions").is_array()) {
        receipt.subSessions = j.at("subSessions").get<std::vector<std::string>>();
    } else {
        receipt.subSessions.clear();
    }
    if (j.contains("filesChanged") && j.at("filesChanged").is_array()) {
        receipt.filesChanged = j.at("filesChanged").get<std::vector<FileChange>>();
    } else {
        receipt.filesChanged.clear();
    }
    if (j.contains("conversation") && j.at("conversation").is_array()) {
        receipt.conversation = j.at("conversation").get<std::vector<ConversationTurn>>();
    } else {
        receipt.conversation.clear();
    }
    receipt.orphaned = j.value("orphaned", false);
    receipt.orphanReason = j.value("orphanReason", "");
    receipt.custodyOf = j.value("custodyOf", "");
}

inline void to_json(nlohmann::json &j, const StagingEntry &entry)
{
    j = nlohmann::json{
        {"stagedAt", toIso8601Utc(entry.stagedAt)},
        {"receipt", entry.receipt}
    };
}

inline void from_json(const nlohmann::json &j, StagingEntry &entry)
{
    entry.stagedAt = fromIso8601Utc(j.value("stagedAt", ""));
    if (j.contains("receipt") && j.at("receipt").is_object()) {
        entry.receipt = j.at("receipt").get<Receipt>();
    } else {
        entry.receipt = Receipt{};
    }
}

inline void to_json(nlohmann::json &j, const CommitRecord &record)
{
    j = nlohmann::json{
        {"commitId", record.commitId},
        {"formatVersion", record.formatVersion},
        {"receipts", record.receipts},
        {"supersedes", record.supersedes}
    };
}

inline void from_json(const nlohmann::json &j, CommitRecord &record)
{
    record.commitId = j.value("commitId", "");
    record.formatVersion = j.value("formatVersion", 1);
    if (j.contains("receipts") && j.at("receipts").is_array()) {
        record.receipts = j.at("receipts").get<std::vector<Receipt>>();
    } else {
        record.receipts.clear();
    }
    if (j.contains("supersedes") && j.at("supersedes").is_array()) {
        record.supersedes = j.at("supersedes").get<std::set<std::string>>();
    } else {
        record.supersedes.clear();
    }
}

inline void to_json(nlohmann::json &j, const SupersededReceipt &entry)
{
    j = nlohmann::json{
        {"commitId", entry.commitId},
        {"winnerSource", entry.winnerSource},
        {"recordedAt", toIso8601Utc(entry.recordedAt)},
        {"superseded", entry.superseded}
    };
}

inline void from_json(const nlohmann::json &j, SupersededReceipt &entry)
{
    entry.commitId = j.value("commitId", "");
    entry.winnerSource = j.value("winnerSource", "");
    entry.recordedAt = fromIso8601Utc(j.value("recordedAt", ""));
    if (j.contains("superseded") && j.at("superseded").is_object()) {
        entry.superseded = j.at("superseded").get<Receipt>();
    } else {
        entry.superseded = Receipt{};
    }
}

inline void to_json(nlohmann::json &j, const BlameLine &line)
{
    j = nlohmann::json{
        {"line", line.line},
        {"commitId", line.commitId},
        {"originalLine", line.originalLine},
        {"originalPath", line.originalPath},
        {"receiptId", line.receiptId.empty() ? nlohmann::json(nullptr)
                                             : nlohmann::json(line.receiptId)},
        {"model", line.model},
        {"sessionId", line.sessionId}
    };
}

} // namespace promptrail
