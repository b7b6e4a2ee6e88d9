#pragma once

#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <variant>

#include <QString>

#include <nlohmann/json.hpp>

#include "common/config.hpp"
#include "common/models.hpp"

namespace promptrail {

class Redactor;
class StagingStore;

using CaptureEvent = std::variant<PromptEvent, ToolEvent, ResponseEvent, SessionEvent>;

// Parses one normalized event object (see the "type" discriminator).
// Returns nullopt for unknown types or events without a session id.
std::optional<CaptureEvent> parseCaptureEvent(const nlohmann::json &j);

// Extracts the new-side line span covered by the hunks of a unified diff.
std::optional<LineRange> lineRangeFromDiff(const std::string &diff);

// FIFO of capture events for one working copy. Producers may push from any
// thread; a single consumer drains it.
class CaptureQueue {
public:
    void push(CaptureEvent event);
    std::optional<CaptureEvent> pop();
    std::size_t size() const;

private:
    mutable std::mutex m_mutex;
    std::deque<CaptureEvent> m_events;
};

// CapturePipeline turns normalized events into staged receipts. Text is
// truncated and redacted before it reaches the staging store.
class CapturePipeline {
public:
    // Absolute tool paths under worktreeRoot are stored relative to it.
    CapturePipeline(const CaptureConfig &config, const Redactor &redactor, StagingStore &staging,
                    const QString &worktreeRoot = QString());

    // Returns false when the event was dropped or could not be staged.
    bool process(const CaptureEvent &event);

    // Processes queued events in order; returns how many were staged.
    int drain(CaptureQueue &queue);

    static std::string deriveReceiptId(const std::string &provider,
                                       const std::string &sessionId,
                                       int promptNumber,
                                       const std::string &promptHash,
                                       Timestamp timestamp);
    static std::string hashPrompt(const std::string &text);

private:
    bool processPrompt(const PromptEvent &event);
    bool processTool(const ToolEvent &event);
    bool processResponse(const ResponseEvent &event);
    bool processSession(const SessionEvent &event);

    std::string truncate(const std::string &text, const char *field) const;
    std::string scrub(const std::string &text) const;
    std::string normalizePath(const std::string &path) const;

    CaptureConfig m_config;
    const Redactor &m_redactor;
    StagingStore &m_staging;
    QString m_worktreeRoot;
};

} // namespace promptrail
