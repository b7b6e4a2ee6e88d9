#pragma once

#include <chrono>
#include <iosfwd>
#include <optional>

#include <QString>
#include <QStringList>

namespace promptrail {

class PromptrailCli
{
public:
    explicit PromptrailCli(std::istream &input);

    // Dispatches git hook and query subcommands.
    // returns exit code; hook subcommands always return 0
    int run(int argc, char *argv[]);

private:
    int dispatch(const QString &command, const QStringList &args);
    int runCapture(const QStringList &args);
    int runAttach(const QStringList &args);
    int runRewrite(const QStringList &args);
    int runPull(const QStringList &args);
    int runPush(const QStringList &args);
    int runBlame(const QStringList &args);
    int runReport(const QStringList &args);
    int runCache(const QStringList &args);
    int runStagingCount(const QStringList &args);

    std::optional<std::chrono::system_clock::time_point> parseIso8601(
        const QString &value) const;

    std::istream &m_input;
};

} // namespace promptrail
