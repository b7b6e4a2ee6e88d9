#include <QCoreApplication>

#include <cstring>
#include <iostream>
#include <vector>

#include "cli/PromptrailCli.hpp"
#include "common/logging.hpp"

#include <nlohmann/json.hpp>

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("promptrail"));

    // --trace may appear anywhere; the remaining arguments go to the CLI.
    bool trace = qEnvironmentVariableIntValue("PROMPTRAIL_TRACE") == 1;
    std::vector<char *> cliArgs;
    for (int i = 0; i < argc; ++i) {
        if (std::strcmp(argv[i], "--trace") == 0) {
            trace = true;
        } else {
            cliArgs.push_back(argv[i]);
        }
    }
    promptrail::logging::initLogging(QStringLiteral("promptrail"), trace);

    // Every event of this invocation shares one correlation id, so the lines
    // of concurrent hooks can be told apart.
    const QString command = cliArgs.size() > 1 ? QString::fromLocal8Bit(cliArgs[1])
                                               : QStringLiteral("usage");
    promptrail::logging::CorrelationScope scope(
        QStringLiteral("%1-%2").arg(command).arg(QCoreApplication::applicationPid()));
    PRLOG_DEBUG(QStringLiteral("main"),
                QStringLiteral("main"),
                QStringLiteral("cli_start"),
                QStringLiteral("hook_or_user_invocation"),
                QStringLiteral("cli"),
                promptrail::logging::defaultWho(),
                QString(),
                (nlohmann::json{{"argc", cliArgs.size()}, {"trace", trace}}));

    promptrail::PromptrailCli cli(std::cin);
    return cli.run(static_cast<int>(cliArgs.size()), cliArgs.data());
}
