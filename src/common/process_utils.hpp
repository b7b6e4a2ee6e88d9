#pragma once

#include <QByteArray>
#include <QString>
#include <QStringList>

namespace promptrail {

struct ProcessResult {
    bool started = false;
    bool finished = false;
    int exitCode = -1;
    QByteArray stdOut;
    QByteArray stdErr;

    bool ok() const
    {
        return started && finished && exitCode == 0;
    }
};

// Runs a program to completion, feeding stdinData when non-empty.
ProcessResult runProcess(const QString &program,
                         const QStringList &args,
                         const QString &workingDir,
                         const QByteArray &stdinData = QByteArray(),
                         int timeoutMs = 60000);

bool isProgramAvailable(const QString &program);

} // namespace promptrail
