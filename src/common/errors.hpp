#pragma once

#include <stdexcept>

namespace promptrail {

// Raised by the persistence layers (staging file, notes namespace, cache).
class StorageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Raised when a git invocation fails in a way the caller did not expect.
class GitError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace promptrail
