#pragma once

#define PROMPTRAIL_VERSION "0.4.0"

namespace promptrail {

// Bumped when the CommitRecord layout changes incompatibly.
constexpr int kRecordFormatVersion = 1;

} // namespace promptrail
