#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "common/enums.hpp"

namespace promptrail {

using Timestamp = std::chrono::system_clock::time_point;

// 1-based, inclusive on both ends.
struct LineRange {
    int start = 0;
    int end = 0;

    int length() const
    {
        return end >= start && start > 0 ? end - start + 1 : 0;
    }

    bool contains(int line) const
    {
        return line >= start && line <= end;
    }

    bool operator==(const LineRange &other) const
    {
        return start == other.start && end == other.end;
    }
    bool operator!=(const LineRange &other) const
    {
        return !(*this == other);
    }
};

struct TokenUsage {
    int64_t input = 0;
    int64_t output = 0;
    int64_t cacheRead = 0;
    int64_t cacheWrite = 0;

    int64_t total() const
    {
        return input + output + cacheRead + cacheWrite;
    }
};

struct FileChange {
    std::string path;
    // Blob the range refers to. Empty until the change is attached to a commit.
    std::string blobId;
    LineRange lineRange;
    int additions = 0;
    int deletions = 0;
    FileChangeStatus status = FileChangeStatus::Attributed;
    // Range as captured; kept once the change has been clipped or orphaned.
    std::optional<LineRange> originalRange;
    int originalLines = 0;

    int attributedLines() const
    {
        return status == FileChangeStatus::Orphaned ? 0 : lineRange.length();
    }
};

struct ConversationTurn {
    std::string role;
    std::string text;
};

struct Receipt {
    std::string id;
    std::string provider;
    std::string model;
    std::string author;
    std::string sessionId;
    int promptNumber = 0;
    std::optional<std::string> parentReceiptId;

    Timestamp startedAt;
    Timestamp endedAt;
    Timestamp capturedAt;

    std::string promptHash;
    std::string promptSummary;
    std::string responseSummary;
    int messageCount = 0;

    double costUsd = 0.0;
    TokenUsage tokens;

    std::set<std::string> toolsUsed;
    std::set<std::string> servicesContacted;
    std::vector<std::string> subSessions;
    std::vector<FileChange> filesChanged;
    std::vector<ConversationTurn> conversation;

    bool orphaned = false;
    std::string orphanReason;
    // Dropped commit this receipt was rescued from when held in custody.
    std::string custodyOf;

    int attributedLines() const
    {
        int total = 0;
        for (const auto &change : filesChanged) {
            total += change.attributedLines();
        }
        return total;
    }
};

struct Session {
    std::string id;
    std::optional<std::string> parentId;
    Timestamp start;
    std::optional<Timestamp> end;
    Timestamp lastActivity;
};

struct StagingEntry {
    Receipt receipt;
    Timestamp stagedAt;
};

struct CommitRecord {
    std::string commitId;
    int formatVersion = 1;
    // Ordered by capturedAt then id; unique by id.
    std::vector<Receipt> receipts;
    // Commit ids whose records were rewritten into this one.
    std::set<std::string> supersedes;
};

struct PromptEvent {
    std::string sessionId;
    Timestamp timestamp;
    std::string promptText;
    std::string model;
    std::string provider;
    std::string author;
    TokenUsage tokens;
};

struct ToolEvent {
    std::string sessionId;
    Timestamp timestamp;
    std::string toolName;
    std::string filePath;
    std::optional<LineRange> lineRange;
    std::string diff;
};

struct ResponseEvent {
    std::string sessionId;
    Timestamp timestamp;
    std::string responseText;
    double costUsd = 0.0;
    TokenUsage tokens;
};

struct SessionEvent {
    enum class Kind {
        Spawn,
        End
    };

    std::string sessionId;
    Timestamp timestamp;
    Kind kind = Kind::End;
    std::string childSessionId;
};

struct RewriteNotification {
    struct Entry {
        std::string oldCommit;
        // Empty when the commit was dropped.
        std::string newCommit;
    };

    // Order follows the rewritten history, oldest first.
    std::vector<Entry> entries;
    // Old path -> new path, applies to every entry.
    std::vector<std::pair<std::string, std::string>> renames;
};

struct SupersededReceipt {
    std::string commitId;
    std::string winnerSource;
    Timestamp recordedAt;
    Receipt superseded;
};

struct BlameLine {
    int line = 0;
    std::string commitId;
    int originalLine = 0;
    std::string originalPath;
    std::string receiptId;
    std::string model;
    std::string sessionId;
};

} // namespace promptrail
