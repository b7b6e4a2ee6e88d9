#include "common/process_utils.hpp"

#include <QProcess>
#include <QStandardPaths>

namespace promptrail {

ProcessResult runProcess(const QString &program,
                         const QStringList &args,
                         const QString &workingDir,
                         const QByteArray &stdinData,
                         int timeoutMs)
{
    ProcessResult result;

    QProcess process;
    if (!workingDir.isEmpty()) {
        process.setWorkingDirectory(workingDir);
    }
    process.start(program, args);
    if (!process.waitForStarted(5000)) {
        result.stdErr = process.errorString().toUtf8();
        return result;
    }
    result.started = true;

    if (!stdinData.isEmpty()) {
        process.write(stdinData);
    }
    process.closeWriteChannel();

    if (!process.waitForFinished(timeoutMs)) {
        process.kill();
        process.waitForFinished(1000);
        result.stdErr = QByteArrayLiteral("timed out");
        return result;
    }

    result.finished = process.exitStatus() == QProcess::NormalExit;
    result.exitCode = process.exitCode();
    result.stdOut = process.readAllStandardOutput();
    result.stdErr = process.readAllStandardError();
    return result;
}

bool isProgramAvailable(const QString &program)
{
    return !QStandardPaths::findExecutable(program).isEmpty();
}

} // namespace promptrail
