#include "engine/session_merger.hpp"

#include <algorithm>
#include <set>

namespace promptrail {

IntervalMergeResult mergeIntervals(std::vector<SessionInterval> intervals,
                                   Timestamp lastObservedActivity)
{
    IntervalMergeResult result;

    std::vector<std::pair<Timestamp, Timestamp>> closed;
    closed.reserve(intervals.size());
    for (const auto &interval : intervals) {
        Timestamp end;
        if (interval.end.has_value()) {
            end = *interval.end;
        } else {
            end = std::max(interval.start, lastObservedActivity);
            result.incomplete = true;
        }
        if (end < interval.start) {
            end = interval.start;
        }
        closed.emplace_back(interval.start, end);
    }
    if (closed.empty()) {
        return result;
    }

    std::sort(closed.begin(), closed.end());

    auto current = closed.front();
    for (std::size_t i = 1; i < closed.size(); ++i) {
        if (closed[i].first <= current.second) {
            current.second = std::max(current.second, closed[i].second);
        } else {
            result.merged.push_back(current);
            current = closed[i];
        }
    }
    result.merged.push_back(current);

    for (const auto &span : result.merged) {
        result.total += std::chrono::duration_cast<std::chrono::seconds>(span.second - span.first);
    }
    return result;
}

void SessionIndex::add(const Session &session)
{
    auto existing = m_sessions.find(session.id);
    if (existing != m_sessions.end() && existing->second.parentId) {
        auto range = m_children.equal_range(*existing->second.parentId);
        for (auto it = range.first; it != range.second; ++it) {
            if (it->second == session.id) {
                m_children.erase(it);
                break;
            }
        }
    }
    m_sessions[session.id] = session;
    if (session.parentId) {
        m_children.emplace(*session.parentId, session.id);
    }
}

std::optional<Session> SessionIndex::find(const std::string &id) const
{
    auto it = m_sessions.find(id);
    if (it == m_sessions.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::string> SessionIndex::children(const std::string &id) const
{
    std::vector<std::string> result;
    auto range = m_children.equal_range(id);
    for (auto it = range.first; it != range.second; ++it) {
        result.push_back(it->second);
    }
    std::sort(result.begin(), result.end());
    return result;
}

std::vector<Session> SessionIndex::tree(const std::string &rootId) const
{
    std::vector<Session> result;
    std::set<std::string> visited;
    std::vector<std::string> pending{rootId};
    while (!pending.empty()) {
        const std::string id = pending.back();
        pending.pop_back();
        if (!visited.insert(id).second) {
            continue;
        }
        if (auto session = find(id)) {
            result.push_back(*session);
        }
        for (const auto &child : children(id)) {
            pending.push_back(child);
        }
    }
    return result;
}

IntervalMergeResult SessionIndex::wallClock(const std::string &rootId) const
{
    std::vector<SessionInterval> intervals;
    Timestamp lastActivity{};
    for (const auto &session : tree(rootId)) {
        intervals.push_back(SessionInterval{session.start, session.end});
        lastActivity = std::max(lastActivity, session.lastActivity);
        if (session.end) {
            lastActivity = std::max(lastActivity, *session.end);
        }
    }
    return mergeIntervals(std::move(intervals), lastActivity);
}

SessionStats calculateSessionStats(const std::vector<Receipt> &receipts)
{
    SessionStats stats;

    std::map<std::string, std::pair<Timestamp, Timestamp>> spans;
    for (const auto &receipt : receipts) {
        const std::string key = receipt.sessionId.empty() ? receipt.id : receipt.sessionId;
        const Timestamp end = std::max(receipt.startedAt, receipt.endedAt);
        auto it = spans.find(key);
        if (it == spans.end()) {
            spans.emplace(key, std::make_pair(receipt.startedAt, end));
        } else {
            it->second.first = std::min(it->second.first, receipt.startedAt);
            it->second.second = std::max(it->second.second, end);
        }
    }

    std::vector<SessionInterval> intervals;
    for (const auto &entry : spans) {
        const auto &span = entry.second;
        stats.rawTotal += std::chrono::duration_cast<std::chrono::seconds>(span.second - span.first);
        intervals.push_back(SessionInterval{span.first, span.second});
        if (!stats.earliestStart || span.first < *stats.earliestStart) {
            stats.earliestStart = span.first;
        }
        if (!stats.latestEnd || span.second > *stats.latestEnd) {
            stats.latestEnd = span.second;
        }
    }

    stats.uniqueSessions = static_cast<int>(spans.size());
    stats.wallClock = mergeIntervals(std::move(intervals), Timestamp{}).total;
    if (stats.uniqueSessions > 0) {
        stats.average = stats.rawTotal / stats.uniqueSessions;
    }
    return stats;
}

std::string formatDuration(std::chrono::seconds duration)
{
    const long long secs = std::max<long long>(0, duration.count());
    if (secs >= 3600) {
        return std::to_string(secs / 3600) + "h " + std::to_string((secs % 3600) / 60) + "m";
    }
    return std::to_string(secs / 60) + "m " + std::to_string(secs % 60) + "s";
}

} // namespace promptrail
