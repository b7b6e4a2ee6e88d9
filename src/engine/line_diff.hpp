#pragma once

#include <string>
#include <vector>

namespace promptrail {

// Line correspondence between two versions of a file.
struct LineAlignment {
    // oldToNew[i] is the 1-based new line matching old line i + 1, or 0 when
    // that line did not survive.
    std::vector<int> oldToNew;
    int newLineCount = 0;

    int mapLine(int oldLine) const
    {
        if (oldLine < 1 || oldLine > static_cast<int>(oldToNew.size())) {
            return 0;
        }
        return oldToNew[oldLine - 1];
    }
};

std::vector<std::string> splitLines(const std::string &content);

// Longest-common-subsequence alignment using Myers' O(ND) shortest edit
// script after trimming the common prefix and suffix.
LineAlignment alignLines(const std::vector<std::string> &oldLines,
                         const std::vector<std::string> &newLines);

LineAlignment alignContents(const std::string &oldContent, const std::string &newContent);

} // namespace promptrail
