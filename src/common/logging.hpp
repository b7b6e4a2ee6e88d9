#pragma once

#include <optional>

#include <QString>

#include <nlohmann/json.hpp>

namespace promptrail::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// Accepts "debug", "info", "warn"/"warning" and "error", case-insensitively.
std::optional<LogLevel> parseLogLevel(const QString &name);

// Configures the sink for this process. The threshold comes from
// PROMPTRAIL_LOG_LEVEL (default info); trace mode lowers it to debug and
// mirrors every event into <process>-trace.log.
void initLogging(const QString &processName, bool traceEnabled);

bool isTraceEnabled();
LogLevel threshold();

// Fields stamped on every event of this process, e.g. the repository a hook
// runs in. An empty value removes the field.
void setProcessField(const QString &key, const QString &value);
nlohmann::json processFields();

// Thread-local correlation id linking the events of one operation.
void setCorrelationId(const QString &corrId);
QString currentCorrelationId();

class CorrelationScope {
public:
    explicit CorrelationScope(const QString &corrId);
    ~CorrelationScope();

private:
    QString m_prev;
};

// Structured log event. All fields are required; use empty strings where unknown.
void logEvent(LogLevel level,
              const QString &processName,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &why,
              const QString &how,
              const QString &who,
              const QString &correlationId,
              const nlohmann::json &context = nlohmann::json::object());

// PROMPTRAIL_LOG_DIR, else $XDG_DATA_HOME/promptrail/logs, else
// ~/.local/share/promptrail/logs.
QString logsDirPath();
QString defaultProcessName();
QString defaultWho();

} // namespace promptrail::logging

#define PRLOG_DEBUG(component, where, what, why, how, who, corr, ctxJson) \
    ::promptrail::logging::logEvent(::promptrail::logging::LogLevel::Debug, \
                                    ::promptrail::logging::defaultProcessName(), \
                                    (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define PRLOG_INFO(component, where, what, why, how, who, corr, ctxJson) \
    ::promptrail::logging::logEvent(::promptrail::logging::LogLevel::Info, \
                                    ::promptrail::logging::defaultProcessName(), \
                                    (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define PRLOG_WARN(component, where, what, why, how, who, corr, ctxJson) \
    ::promptrail::logging::logEvent(::promptrail::logging::LogLevel::Warn, \
                                    ::promptrail::logging::defaultProcessName(), \
                                    (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define PRLOG_ERROR(component, where, what, why, how, who, corr, ctxJson) \
    ::promptrail::logging::logEvent(::promptrail::logging::LogLevel::Error, \
                                    ::promptrail::logging::defaultProcessName(), \
                                    (component), (where), (what), (why), (how), (who), (corr), (ctxJson))
