#pragma once

#include <string>
#include <vector>

#include <QString>

#include <nlohmann/json.hpp>

#include "common/enums.hpp"

namespace promptrail {

struct CustomPattern {
    std::string pattern;
    std::string replacement;
};

struct RedactionConfig {
    RedactionMode mode = RedactionMode::Replace;
    std::vector<CustomPattern> customPatterns;
    // Built-in categories to skip, e.g. "HOME_PATH".
    std::vector<std::string> disabledCategories;
    bool entropyCheck = true;
    double entropyThreshold = 4.5;
};

struct CaptureConfig {
    int maxPromptLength = 2000;
    bool storeFullConversation = false;
};

struct SyncConfig {
    std::string remote = "origin";
};

struct PromptrailConfig {
    RedactionConfig redaction;
    CaptureConfig capture;
    SyncConfig sync;
};

// Unknown or mistyped keys keep their defaults.
PromptrailConfig configFromJson(const nlohmann::json &j);

// Reads <repoRoot>/.promptrail.json, falling back to $HOME/.promptrail.json.
// A missing file yields defaults; a malformed one is logged and ignored.
PromptrailConfig loadConfig(const QString &repoRoot);

// Per-repository salt for hash-mode redaction, created on first use.
std::string loadOrCreateSalt(const QString &stateDir);

} // namespace promptrail
