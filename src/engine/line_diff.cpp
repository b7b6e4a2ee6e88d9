#include "engine/line_diff.hpp"

#include <algorithm>
#include <optional>
#include <unordered_map>
#include <utility>

namespace promptrail {

namespace {

// Interns lines so the edit search compares integers.
std::vector<int> internLines(const std::vector<std::string> &lines,
                             std::unordered_map<std::string, int> &ids)
{
    std::vector<int> result;
    result.reserve(lines.size());
    for (const auto &line : lines) {
        auto it = ids.find(line);
        if (it == ids.end()) {
            it = ids.emplace(line, static_cast<int>(ids.size())).first;
        }
        result.push_back(it->second);
    }
    return result;
}

// Edit rounds a single split may take before the region is left unmatched.
// Bounds the search at O(kMaxSplitRounds * (n + m)) whatever the file size.
constexpr int kMaxSplitRounds = 2048;

// Runs the forward and reverse shortest-edit searches until they overlap and
// returns the point where the forward path meets the middle snake. Needs
// only O(n + m) memory. Returns nullopt when the inputs share nothing or the
// round limit is reached.
std::optional<std::pair<int, int>> findSplit(const int *a, int n, const int *b, int m)
{
    const int maxD = (n + m + 1) / 2;
    const int offset = maxD;
    const int length = 2 * maxD + 2;
    std::vector<int> forward(length, -1);
    std::vector<int> reverse(length, -1);
    forward[offset + 1] = 0;
    reverse[offset + 1] = 0;

    const int delta = n - m;
    const bool oddDelta = (delta % 2) != 0;
    // Diagonals that ran off the edit graph are skipped in later rounds.
    int forwardStart = 0;
    int forwardEnd = 0;
    int reverseStart = 0;
    int reverseEnd = 0;

    const int rounds = std::min(maxD, kMaxSplitRounds);
    for (int d = 0; d < rounds; ++d) {
        for (int k = -d + forwardStart; k <= d - forwardEnd; k += 2) {
            const int index = offset + k;
            int x;
            if (k == -d || (k != d && forward[index - 1] < forward[index + 1])) {
                x = forward[index + 1];
            } else {
                x = forward[index - 1] + 1;
            }
            int y = x - k;
            while (x < n && y < m && a[x] == b[y]) {
                ++x;
                ++y;
            }
            forward[index] = x;
            if (x > n) {
                forwardEnd += 2;
            } else if (y > m) {
                forwardStart += 2;
            } else if (oddDelta) {
                const int other = offset + delta - k;
                if (other >= 0 && other < length && reverse[other] != -1
                    && x >= n - reverse[other]) {
                    return std::make_pair(x, y);
                }
            }
        }

        for (int k = -d + reverseStart; k <= d - reverseEnd; k += 2) {
            const int index = offset + k;
            int x;
            if (k == -d || (k != d && reverse[index - 1] < reverse[index + 1])) {
                x = reverse[index + 1];
            } else {
                x = reverse[index - 1] + 1;
            }
            int y = x - k;
            while (x < n && y < m && a[n - x - 1] == b[m - y - 1]) {
                ++x;
                ++y;
            }
            reverse[index] = x;
            if (x > n) {
                reverseEnd += 2;
            } else if (y > m) {
                reverseStart += 2;
            } else if (!oddDelta) {
                const int other = offset + delta - k;
                if (other >= 0 && other < length && forward[other] != -1) {
                    const int forwardX = forward[other];
                    const int forwardY = forwardX - (other - offset);
                    if (forwardX >= n - x) {
                        return std::make_pair(forwardX, forwardY);
                    }
                }
            }
        }
    }
    return std::nullopt;
}

// Appends matched (oldIndex, newIndex) pairs, 0-based and ascending, for
// a[0, n) against b[0, m); aBase and bBase offset the reported indices.
void collectMatches(const int *a, int n, const int *b, int m, int aBase, int bBase,
                    std::vector<std::pair<int, int>> &matches)
{
    int prefix = 0;
    while (prefix < n && prefix < m && a[prefix] == b[prefix]) {
        matches.emplace_back(aBase + prefix, bBase + prefix);
        ++prefix;
    }
    int suffix = 0;
    while (suffix < n - prefix && suffix < m - prefix
           && a[n - 1 - suffix] == b[m - 1 - suffix]) {
        ++suffix;
    }

    const int innerN = n - prefix - suffix;
    const int innerM = m - prefix - suffix;
    if (innerN > 0 && innerM > 0) {
        const auto split = findSplit(a + prefix, innerN, b + prefix, innerM);
        // A split at either corner would not shrink the problem.
        if (split && !(split->first == 0 && split->second == 0)
            && !(split->first == innerN && split->second == innerM)) {
            collectMatches(a + prefix, split->first, b + prefix, split->second,
                           aBase + prefix, bBase + prefix, matches);
            collectMatches(a + prefix + split->first, innerN - split->first,
                           b + prefix + split->second, innerM - split->second,
                           aBase + prefix + split->first, bBase + prefix + split->second,
                           matches);
        }
    }

    for (int i = suffix; i > 0; --i) {
        matches.emplace_back(aBase + n - i, bBase + m - i);
    }
}

} // namespace

std::vector<std::string> splitLines(const std::string &content)
{
    std::vector<std::string> lines;
    std::size_t pos = 0;
    while (pos < content.size()) {
        std::size_t next = content.find('\n', pos);
        if (next == std::string::npos) {
            lines.push_back(content.substr(pos));
            break;
        }
        lines.push_back(content.substr(pos, next - pos));
        pos = next + 1;
    }
    return lines;
}

LineAlignment alignLines(const std::vector<std::string> &oldLines,
                         const std::vector<std::string> &newLines)
{
    LineAlignment alignment;
    alignment.oldToNew.assign(oldLines.size(), 0);
    alignment.newLineCount = static_cast<int>(newLines.size());

    const int n = static_cast<int>(oldLines.size());
    const int m = static_cast<int>(newLines.size());

    int prefix = 0;
    while (prefix < n && prefix < m && oldLines[prefix] == newLines[prefix]) {
        alignment.oldToNew[prefix] = prefix + 1;
        ++prefix;
    }
    int suffix = 0;
    while (suffix < n - prefix && suffix < m - prefix
           && oldLines[n - 1 - suffix] == newLines[m - 1 - suffix]) {
        alignment.oldToNew[n - 1 - suffix] = m - suffix;
        ++suffix;
    }

    const std::vector<std::string> oldMiddle(oldLines.begin() + prefix, oldLines.end() - suffix);
    const std::vector<std::string> newMiddle(newLines.begin() + prefix, newLines.end() - suffix);
    if (oldMiddle.empty() || newMiddle.empty()) {
        return alignment;
    }

    std::unordered_map<std::string, int> ids;
    const std::vector<int> a = internLines(oldMiddle, ids);
    const std::vector<int> b = internLines(newMiddle, ids);
    std::vector<std::pair<int, int>> matches;
    collectMatches(a.data(), static_cast<int>(a.size()), b.data(), static_cast<int>(b.size()),
                   0, 0, matches);
    for (const auto &match : matches) {
        alignment.oldToNew[prefix + match.first] = prefix + match.second + 1;
    }
    return alignment;
}

LineAlignment alignContents(const std::string &oldContent, const std::string &newContent)
{
    return alignLines(splitLines(oldContent), splitLines(newContent));
}

} // namespace promptrail
