#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "common/models.hpp"

namespace promptrail {

struct SessionInterval {
    Timestamp start;
    // nullopt when no termination was observed.
    std::optional<Timestamp> end;
};

struct IntervalMergeResult {
    std::chrono::seconds total{0};
    std::vector<std::pair<Timestamp, Timestamp>> merged;
    // Set when an open interval had to be clipped to the last activity.
    bool incomplete = false;
};

// Union length of possibly overlapping intervals: sort by start, sweep,
// sum the disjoint spans.
IntervalMergeResult mergeIntervals(std::vector<SessionInterval> intervals,
                                   Timestamp lastObservedActivity);

// Parent/child lookup over sessions; children reference their parent by id.
class SessionIndex {
public:
    void add(const Session &session);

    std::optional<Session> find(const std::string &id) const;
    std::vector<std::string> children(const std::string &id) const;
    // The session and every transitive child.
    std::vector<Session> tree(const std::string &rootId) const;

    IntervalMergeResult wallClock(const std::string &rootId) const;

private:
    std::map<std::string, Session> m_sessions;
    std::multimap<std::string, std::string> m_children;
};

struct SessionStats {
    int uniqueSessions = 0;
    std::chrono::seconds rawTotal{0};
    std::chrono::seconds wallClock{0};
    std::chrono::seconds average{0};
    std::optional<Timestamp> earliestStart;
    std::optional<Timestamp> latestEnd;
};

// Sessions are deduplicated by id keeping the widest span seen in any receipt.
SessionStats calculateSessionStats(const std::vector<Receipt> &receipts);

std::string formatDuration(std::chrono::seconds duration);

} // namespace promptrail
