#pragma once

namespace promptrail {

enum class FileChangeStatus {
    Attributed,
    Clipped,
    Orphaned
};

enum class RedactionMode {
    Replace,
    Hash
};

enum class CaptureEventType {
    Prompt,
    Tool,
    Response,
    Session
};

} // namespace promptrail
