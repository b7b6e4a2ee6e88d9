#include "common/logging.hpp"

#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QLockFile>

#include <unistd.h>

#include <cstdio>
#include <mutex>

namespace promptrail::logging {

namespace {

constexpr qint64 kRotateAtBytes = 5 * 1024 * 1024;
constexpr int kKeptGenerations = 3;

struct SinkState {
    std::mutex mutex;
    QString processName;
    bool trace = false;
    LogLevel threshold = LogLevel::Info;
    nlohmann::json fields = nlohmann::json::object();
};

SinkState &sink()
{
    static SinkState state;
    return state;
}

thread_local QString t_corrId;

const char *levelName(LogLevel level)
{
    switch (level) {
    case LogLevel::Debug:
        return "debug";
    case LogLevel::Info:
        return "info";
    case LogLevel::Warn:
        return "warn";
    case LogLevel::Error:
        return "error";
    }
    return "info";
}

// Several hook processes may share one log; only one of them rotates.
void rotate(const QString &path)
{
    if (QFileInfo(path).size() < kRotateAtBytes) {
        return;
    }
    QLockFile lock(path + QStringLiteral(".lock"));
    lock.setStaleLockTime(10000);
    if (!lock.tryLock(200)) {
        return;
    }
    if (QFileInfo(path).size() < kRotateAtBytes) {
        return;
    }
    QFile::remove(QStringLiteral("%1.%2").arg(path).arg(kKeptGenerations));
    for (int generation = kKeptGenerations - 1; generation >= 1; --generation) {
        QFile::rename(QStringLiteral("%1.%2").arg(path).arg(generation),
                      QStringLiteral("%1.%2").arg(path).arg(generation + 1));
    }
    QFile::rename(path, path + QStringLiteral(".1"));
}

void append(const QString &path, const QByteArray &line)
{
    rotate(path);
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Append)) {
        // Hooks must keep running even when the log directory is unwritable.
        fprintf(stderr, "%s", line.constData());
        return;
    }
    // One write per event so concurrent appenders do not interleave lines.
    file.write(line);
}

} // namespace

std::optional<LogLevel> parseLogLevel(const QString &name)
{
    const QString value = name.trimmed().toLower();
    if (value == QLatin1String("debug")) {
        return LogLevel::Debug;
    }
    if (value == QLatin1String("info")) {
        return LogLevel::Info;
    }
    if (value == QLatin1String("warn") || value == QLatin1String("warning")) {
        return LogLevel::Warn;
    }
    if (value == QLatin1String("error")) {
        return LogLevel::Error;
    }
    return std::nullopt;
}

void initLogging(const QString &processName, bool traceEnabled)
{
    SinkState &state = sink();
    std::lock_guard<std::mutex> lock(state.mutex);
    state.processName = processName;
    state.trace = traceEnabled;
    state.threshold = parseLogLevel(qEnvironmentVariable("PROMPTRAIL_LOG_LEVEL"))
                          .value_or(LogLevel::Info);
    if (traceEnabled) {
        state.threshold = LogLevel::Debug;
    }
}

bool isTraceEnabled()
{
    SinkState &state = sink();
    std::lock_guard<std::mutex> lock(state.mutex);
    return state.trace;
}

LogLevel threshold()
{
    SinkState &state = sink();
    std::lock_guard<std::mutex> lock(state.mutex);
    return state.threshold;
}

void setProcessField(const QString &key, const QString &value)
{
    SinkState &state = sink();
    std::lock_guard<std::mutex> lock(state.mutex);
    if (value.isEmpty()) {
        state.fields.erase(key.toStdString());
    } else {
        state.fields[key.toStdString()] = value.toStdString();
    }
}

nlohmann::json processFields()
{
    SinkState &state = sink();
    std::lock_guard<std::mutex> lock(state.mutex);
    return state.fields;
}

void setCorrelationId(const QString &corrId)
{
    t_corrId = corrId;
}

QString currentCorrelationId()
{
    return t_corrId;
}

CorrelationScope::CorrelationScope(const QString &corrId)
    : m_prev(t_corrId)
{
    t_corrId = corrId;
}

CorrelationScope::~CorrelationScope()
{
    t_corrId = m_prev;
}

QString logsDirPath()
{
    const QString overrideDir = qEnvironmentVariable("PROMPTRAIL_LOG_DIR");
    if (!overrideDir.isEmpty()) {
        return overrideDir;
    }
    QString dataHome = qEnvironmentVariable("XDG_DATA_HOME");
    if (dataHome.isEmpty()) {
        const QString home = qEnvironmentVariable("HOME");
        dataHome = home.isEmpty() ? QStringLiteral(".local/share")
                                  : home + QStringLiteral("/.local/share");
    }
    return dataHome + QStringLiteral("/promptrail/logs");
}

QString defaultProcessName()
{
    {
        SinkState &state = sink();
        std::lock_guard<std::mutex> lock(state.mutex);
        if (!state.processName.isEmpty()) {
            return state.processName;
        }
    }
    if (QCoreApplication::instance() && !QCoreApplication::applicationName().isEmpty()) {
        return QCoreApplication::applicationName();
    }
    return QStringLiteral("promptrail");
}

QString defaultWho()
{
    return QStringLiteral("uid:%1,pid:%2")
        .arg(static_cast<qint64>(getuid()))
        .arg(static_cast<qint64>(getpid()));
}

void logEvent(LogLevel level,
              const QString &processName,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &why,
              const QString &how,
              const QString &who,
              const QString &correlationId,
              const nlohmann::json &context)
{
    SinkState &state = sink();
    std::lock_guard<std::mutex> lock(state.mutex);
    const bool toMain = level >= state.threshold;
    if (!toMain && !state.trace) {
        return;
    }

    nlohmann::json event{
        {"ts", QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs).toStdString()},
        {"level", levelName(level)},
        {"component", component.toStdString()},
        {"where", where.toStdString()},
        {"what", what.toStdString()},
        {"why", why.toStdString()},
        {"how", how.toStdString()},
        {"who", who.toStdString()},
        {"corr", (correlationId.isEmpty() ? t_corrId : correlationId).toStdString()},
        {"ctx", context}
    };
    if (!state.fields.empty()) {
        event["process"] = state.fields;
    }
    const QByteArray line = QByteArray::fromStdString(
        event.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)) + '\n';

    const QString process = processName.isEmpty() ? QStringLiteral("promptrail") : processName;
    const QDir dir(logsDirPath());
    if (!dir.exists()) {
        QDir().mkpath(dir.path());
    }
    if (toMain) {
        append(dir.filePath(process + QStringLiteral(".log")), line);
    }
    if (state.trace) {
        append(dir.filePath(process + QStringLiteral("-trace.log")), line);
    }
}

} // namespace promptrail::logging
