#include <QtTest/QtTest>

#include <QDir>
#include <QFile>
#include <QTemporaryDir>

#include <utility>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"

class LoggingTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void init();

    void testParseLogLevel();
    void testLogDirResolution();
    void testEventWrittenWithProcessFields();
    void testThresholdFromEnvironment();
    void testTraceMirrorsDebugEvents();
    void testRotationKeepsGenerations();
    void testCorrelationScope();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevLogDir;
    QByteArray m_prevLevel;

    QString logPath(const QString &suffix) const;
    static void emitEvent(promptrail::logging::LogLevel level, const QString &what);
    static std::vector<nlohmann::json> readLines(const QString &path);
};

void LoggingTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevLogDir = qgetenv("PROMPTRAIL_LOG_DIR");
    m_prevLevel = qgetenv("PROMPTRAIL_LOG_LEVEL");
    qputenv("PROMPTRAIL_LOG_DIR", m_tempDir.filePath(QStringLiteral("logs")).toUtf8());
}

void LoggingTests::cleanupTestCase()
{
    for (const auto &saved : {std::make_pair("PROMPTRAIL_LOG_DIR", m_prevLogDir),
                              std::make_pair("PROMPTRAIL_LOG_LEVEL", m_prevLevel)}) {
        if (saved.second.isEmpty()) {
            qunsetenv(saved.first);
        } else {
            qputenv(saved.first, saved.second);
        }
    }
}

void LoggingTests::init()
{
    qunsetenv("PROMPTRAIL_LOG_LEVEL");
    QDir().mkpath(m_tempDir.filePath(QStringLiteral("logs")));
    QFile::remove(logPath(QStringLiteral(".log")));
    QFile::remove(logPath(QStringLiteral("-trace.log")));
    promptrail::logging::initLogging(QStringLiteral("promptrail-test"), false);
}

QString LoggingTests::logPath(const QString &suffix) const
{
    return m_tempDir.filePath(QStringLiteral("logs/promptrail-test") + suffix);
}

void LoggingTests::emitEvent(promptrail::logging::LogLevel level, const QString &what)
{
    promptrail::logging::logEvent(level,
                                  QStringLiteral("promptrail-test"),
                                  QStringLiteral("Test"),
                                  QStringLiteral("emitEvent"),
                                  what,
                                  QStringLiteral("unit_test"),
                                  QStringLiteral("direct_call"),
                                  promptrail::logging::defaultWho(),
                                  QString(),
                                  nlohmann::json{{"key", "value"}});
}

std::vector<nlohmann::json> LoggingTests::readLines(const QString &path)
{
    std::vector<nlohmann::json> lines;
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return lines;
    }
    while (!file.atEnd()) {
        const QByteArray line = file.readLine().trimmed();
        if (!line.isEmpty()) {
            lines.push_back(nlohmann::json::parse(line.toStdString()));
        }
    }
    return lines;
}

void LoggingTests::testParseLogLevel()
{
    using promptrail::logging::LogLevel;
    QVERIFY(promptrail::logging::parseLogLevel(QStringLiteral("DEBUG")) == LogLevel::Debug);
    QVERIFY(promptrail::logging::parseLogLevel(QStringLiteral(" warning ")) == LogLevel::Warn);
    QVERIFY(promptrail::logging::parseLogLevel(QStringLiteral("error")) == LogLevel::Error);
    QVERIFY(!promptrail::logging::parseLogLevel(QStringLiteral("loud")).has_value());
    QVERIFY(!promptrail::logging::parseLogLevel(QString()).has_value());
}

void LoggingTests::testLogDirResolution()
{
    QCOMPARE(promptrail::logging::logsDirPath(), m_tempDir.filePath(QStringLiteral("logs")));

    qunsetenv("PROMPTRAIL_LOG_DIR");
    const QByteArray prevXdg = qgetenv("XDG_DATA_HOME");
    qputenv("XDG_DATA_HOME", "/tmp/xdg-data");
    QCOMPARE(promptrail::logging::logsDirPath(), QStringLiteral("/tmp/xdg-data/promptrail/logs"));
    if (prevXdg.isEmpty()) {
        qunsetenv("XDG_DATA_HOME");
    } else {
        qputenv("XDG_DATA_HOME", prevXdg);
    }
    qputenv("PROMPTRAIL_LOG_DIR", m_tempDir.filePath(QStringLiteral("logs")).toUtf8());
}

void LoggingTests::testEventWrittenWithProcessFields()
{
    promptrail::logging::setProcessField(QStringLiteral("repo"), QStringLiteral("/work/app"));
    promptrail::logging::setProcessField(QStringLiteral("command"), QStringLiteral("attach"));
    emitEvent(promptrail::logging::LogLevel::Info, QStringLiteral("with_fields"));
    promptrail::logging::setProcessField(QStringLiteral("command"), QString());
    emitEvent(promptrail::logging::LogLevel::Warn, QStringLiteral("fewer_fields"));
    promptrail::logging::setProcessField(QStringLiteral("repo"), QString());
    emitEvent(promptrail::logging::LogLevel::Error, QStringLiteral("no_fields"));

    const auto lines = readLines(logPath(QStringLiteral(".log")));
    QCOMPARE(lines.size(), static_cast<size_t>(3));
    QCOMPARE(QString::fromStdString(lines.at(0).at("level").get<std::string>()),
             QStringLiteral("info"));
    QCOMPARE(QString::fromStdString(lines.at(0).at("process").at("command").get<std::string>()),
             QStringLiteral("attach"));
    QCOMPARE(QString::fromStdString(lines.at(0).at("ctx").at("key").get<std::string>()),
             QStringLiteral("value"));
    QVERIFY(!lines.at(1).at("process").contains("command"));
    QCOMPARE(QString::fromStdString(lines.at(1).at("process").at("repo").get<std::string>()),
             QStringLiteral("/work/app"));
    QVERIFY(!lines.at(2).contains("process"));
    QVERIFY(QString::fromStdString(lines.at(2).at("who").get<std::string>())
                .contains(QStringLiteral("pid:")));
}

void LoggingTests::testThresholdFromEnvironment()
{
    emitEvent(promptrail::logging::LogLevel::Debug, QStringLiteral("hidden_debug"));
    QVERIFY(!QFile::exists(logPath(QStringLiteral(".log"))));

    qputenv("PROMPTRAIL_LOG_LEVEL", "warn");
    promptrail::logging::initLogging(QStringLiteral("promptrail-test"), false);
    QVERIFY(promptrail::logging::threshold() == promptrail::logging::LogLevel::Warn);
    emitEvent(promptrail::logging::LogLevel::Info, QStringLiteral("hidden_info"));
    emitEvent(promptrail::logging::LogLevel::Warn, QStringLiteral("shown_warn"));

    const auto lines = readLines(logPath(QStringLiteral(".log")));
    QCOMPARE(lines.size(), static_cast<size_t>(1));
    QCOMPARE(QString::fromStdString(lines.front().at("what").get<std::string>()),
             QStringLiteral("shown_warn"));
    QVERIFY(!QFile::exists(logPath(QStringLiteral("-trace.log"))));
}

void LoggingTests::testTraceMirrorsDebugEvents()
{
    qputenv("PROMPTRAIL_LOG_LEVEL", "error");
    promptrail::logging::initLogging(QStringLiteral("promptrail-test"), true);
    QVERIFY(promptrail::logging::isTraceEnabled());
    QVERIFY(promptrail::logging::threshold() == promptrail::logging::LogLevel::Debug);

    emitEvent(promptrail::logging::LogLevel::Debug, QStringLiteral("traced"));

    QCOMPARE(readLines(logPath(QStringLiteral(".log"))).size(), static_cast<size_t>(1));
    const auto traced = readLines(logPath(QStringLiteral("-trace.log")));
    QCOMPARE(traced.size(), static_cast<size_t>(1));
    QCOMPARE(QString::fromStdString(traced.front().at("level").get<std::string>()),
             QStringLiteral("debug"));
}

void LoggingTests::testRotationKeepsGenerations()
{
    const QString path = logPath(QStringLiteral(".log"));
    const QByteArray filler(5 * 1024 * 1024, 'x');
    for (int round = 1; round <= 4; ++round) {
        QFile file(path);
        QVERIFY(file.open(QIODevice::WriteOnly | QIODevice::Truncate));
        file.write(filler);
        file.close();
        emitEvent(promptrail::logging::LogLevel::Info, QStringLiteral("after_rotation"));
    }

    QCOMPARE(readLines(path).size(), static_cast<size_t>(1));
    QVERIFY(QFile::exists(path + QStringLiteral(".1")));
    QVERIFY(QFile::exists(path + QStringLiteral(".2")));
    QVERIFY(QFile::exists(path + QStringLiteral(".3")));
    QVERIFY(!QFile::exists(path + QStringLiteral(".4")));
    QVERIFY(!QFile::exists(path + QStringLiteral(".lock")));
}

void LoggingTests::testCorrelationScope()
{
    promptrail::logging::setCorrelationId(QStringLiteral("outer"));
    {
        promptrail::logging::CorrelationScope scope(QStringLiteral("attach-abc"));
        QCOMPARE(promptrail::logging::currentCorrelationId(), QStringLiteral("attach-abc"));
        emitEvent(promptrail::logging::LogLevel::Info, QStringLiteral("scoped"));
    }
    QCOMPARE(promptrail::logging::currentCorrelationId(), QStringLiteral("outer"));
    promptrail::logging::setCorrelationId(QString());

    const auto lines = readLines(logPath(QStringLiteral(".log")));
    QCOMPARE(lines.size(), static_cast<size_t>(1));
    QCOMPARE(QString::fromStdString(lines.front().at("corr").get<std::string>()),
             QStringLiteral("attach-abc"));
}

QTEST_MAIN(LoggingTests)
#include "test_logging.moc"
