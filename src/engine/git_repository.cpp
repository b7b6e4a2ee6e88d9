#include "engine/git_repository.hpp"

#include <map>

#include <QDir>
#include <QRegularExpression>

#include "common/logging.hpp"

namespace promptrail {

namespace {

QString gitProgram()
{
    const QString overridden = qEnvironmentVariable("PROMPTRAIL_GIT");
    return overridden.isEmpty() ? QStringLiteral("git") : overridden;
}

std::string firstLine(const QByteArray &data)
{
    const int newline = data.indexOf('\n');
    return QString::fromUtf8(newline < 0 ? data : data.left(newline)).trimmed().toStdString();
}

bool isNullCommit(const std::string &commitId)
{
    return commitId.find_first_not_of('0') == std::string::npos;
}

} // namespace

std::vector<BlameEntry> parseBlamePorcelain(const QString &output)
{
    static const QRegularExpression header(
        QStringLiteral("^([0-9a-f]{40}|[0-9a-f]{64}) (\\d+) (\\d+)(?: \\d+)?$"));

    std::vector<BlameEntry> entries;
    std::map<std::string, std::string> filenames;
    BlameEntry current;
    bool inEntry = false;

    const QStringList lines = output.split(QLatin1Char('\n'));
    for (const QString &line : lines) {
        if (line.startsWith(QLatin1Char('\t'))) {
            if (inEntry) {
                auto it = filenames.find(current.commitId);
                if (it != filenames.end()) {
                    current.originalPath = it->second;
                }
                if (isNullCommit(current.commitId)) {
                    current.commitId.clear();
                }
                entries.push_back(current);
                inEntry = false;
            }
            continue;
        }
        const QRegularExpressionMatch match = header.match(line);
        if (match.hasMatch()) {
            current = BlameEntry{};
            current.commitId = match.captured(1).toStdString();
            current.originalLine = match.captured(2).toInt();
            current.finalLine = match.captured(3).toInt();
            inEntry = true;
            continue;
        }
        if (inEntry && line.startsWith(QLatin1String("filename "))) {
            filenames[current.commitId] = line.mid(9).toStdString();
        }
    }
    return entries;
}

GitRepository::GitRepository(const QString &workingDir)
    : m_workingDir(workingDir)
{
}

std::optional<GitRepository> GitRepository::discover(const QString &path)
{
    const ProcessResult result = runProcess(gitProgram(),
                                            {QStringLiteral("rev-parse"),
                                             QStringLiteral("--show-toplevel")},
                                            path);
    if (!result.ok()) {
        return std::nullopt;
    }
    const QString topLevel = QString::fromStdString(firstLine(result.stdOut));
    GitRepository repo(topLevel);
    repo.m_topLevel = topLevel;
    return repo;
}

ProcessResult GitRepository::run(const QStringList &args, const QByteArray &stdinData) const
{
    return runProcess(gitProgram(), args, m_workingDir, stdinData);
}

QString GitRepository::runOrThrow(const QStringList &args, const QByteArray &stdinData) const
{
    const ProcessResult result = run(args, stdinData);
    if (!result.ok()) {
        PRLOG_DEBUG(QStringLiteral("GitRepository"),
                    QStringLiteral("runOrThrow"),
                    QStringLiteral("git_command_failed"),
                    QStringLiteral("nonzero_exit"),
                    QStringLiteral("qprocess"),
                    logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"args", args.join(QLatin1Char(' ')).toStdString()},
                                    {"exitCode", result.exitCode},
                                    {"stderr", result.stdErr.toStdString()}}));
        throw GitError("git " + args.value(0).toStdString() + " failed: "
                       + QString::fromUtf8(result.stdErr).trimmed().toStdString());
    }
    return QString::fromUtf8(result.stdOut);
}

QString GitRepository::topLevel() const
{
    if (m_topLevel.isEmpty()) {
        m_topLevel = runOrThrow({QStringLiteral("rev-parse"), QStringLiteral("--show-toplevel")})
                         .trimmed();
    }
    return m_topLevel;
}

QString GitRepository::gitDir() const
{
    if (m_gitDir.isEmpty()) {
        m_gitDir = runOrThrow({QStringLiteral("rev-parse"), QStringLiteral("--absolute-git-dir")})
                       .trimmed();
    }
    return m_gitDir;
}

QString GitRepository::stateDir() const
{
    return QDir(gitDir()).filePath(QStringLiteral("promptrail"));
}

std::optional<std::string> GitRepository::resolveCommit(const std::string &rev) const
{
    const ProcessResult result = run({QStringLiteral("rev-parse"), QStringLiteral("--verify"),
                                      QStringLiteral("-q"),
                                      QString::fromStdString(rev + "^{commit}")});
    if (!result.ok()) {
        return std::nullopt;
    }
    return firstLine(result.stdOut);
}

std::vector<std::string> GitRepository::changedFiles(const std::string &commitId) const
{
    const QString output = runOrThrow({QStringLiteral("diff-tree"), QStringLiteral("--no-commit-id"),
                                       QStringLiteral("--name-only"), QStringLiteral("-r"),
                                       QStringLiteral("--root"), QString::fromStdString(commitId)});
    std::vector<std::string> files;
    for (const QString &line : output.split(QLatin1Char('\n'), Qt::SkipEmptyParts)) {
        files.push_back(line.trimmed().toStdString());
    }
    return files;
}

std::vector<std::pair<std::string, std::string>> GitRepository::renames(
    const std::string &fromCommit, const std::string &toCommit) const
{
    const ProcessResult result = run({QStringLiteral("diff"), QStringLiteral("-M"),
                                      QStringLiteral("--name-status"),
                                      QString::fromStdString(fromCommit),
                                      QString::fromStdString(toCommit)});
    std::vector<std::pair<std::string, std::string>> pairs;
    if (!result.ok()) {
        return pairs;
    }
    for (const QString &line : QString::fromUtf8(result.stdOut).split(QLatin1Char('\n'),
                                                                      Qt::SkipEmptyParts)) {
        const QStringList parts = line.split(QLatin1Char('\t'));
        if (parts.size() == 3 && parts.at(0).startsWith(QLatin1Char('R'))) {
            pairs.emplace_back(parts.at(1).toStdString(), parts.at(2).toStdString());
        }
    }
    return pairs;
}

std::vector<BlameEntry> GitRepository::blame(const std::string &path, const std::string &rev) const
{
    QStringList args{QStringLiteral("blame"), QStringLiteral("--porcelain")};
    if (!rev.empty()) {
        args << QString::fromStdString(rev);
    }
    args << QStringLiteral("--") << QString::fromStdString(path);
    return parseBlamePorcelain(runOrThrow(args));
}

std::string GitRepository::userIdentity() const
{
    const ProcessResult name = run({QStringLiteral("config"), QStringLiteral("user.name")});
    const ProcessResult email = run({QStringLiteral("config"), QStringLiteral("user.email")});
    const std::string userName = name.ok() ? firstLine(name.stdOut) : std::string("unknown");
    if (!email.ok() || email.stdOut.trimmed().isEmpty()) {
        return userName;
    }
    return userName + " <" + firstLine(email.stdOut) + ">";
}

std::optional<std::string> GitRepository::blobId(const std::string &commitId,
                                                 const std::string &path) const
{
    const ProcessResult result = run({QStringLiteral("rev-parse"), QStringLiteral("--verify"),
                                      QStringLiteral("-q"),
                                      QString::fromStdString(commitId + ":" + path)});
    if (!result.ok()) {
        return std::nullopt;
    }
    return firstLine(result.stdOut);
}

std::optional<std::string> GitRepository::blobContent(const std::string &blobId) const
{
    const ProcessResult result = run({QStringLiteral("cat-file"), QStringLiteral("blob"),
                                      QString::fromStdString(blobId)});
    if (!result.ok()) {
        return std::nullopt;
    }
    return result.stdOut.toStdString();
}

std::vector<std::string> GitRepository::parents(const std::string &commitId) const
{
    const ProcessResult result = run({QStringLiteral("rev-list"), QStringLiteral("--parents"),
                                      QStringLiteral("-n"), QStringLiteral("1"),
                                      QString::fromStdString(commitId)});
    std::vector<std::string> ids;
    if (!result.ok()) {
        return ids;
    }
    const QStringList parts = QString::fromStdString(firstLine(result.stdOut))
                                  .split(QLatin1Char(' '), Qt::SkipEmptyParts);
    for (int i = 1; i < parts.size(); ++i) {
        ids.push_back(parts.at(i).toStdString());
    }
    return ids;
}

std::optional<std::string> GitRepository::readNote(const QString &ref, const std::string &commitId) const
{
    const ProcessResult result = run({QStringLiteral("notes"), QStringLiteral("--ref"), ref,
                                      QStringLiteral("show"), QString::fromStdString(commitId)});
    if (!result.ok()) {
        return std::nullopt;
    }
    return result.stdOut.toStdString();
}

void GitRepository::writeNote(const QString &ref, const std::string &commitId,
                              const std::string &content) const
{
    runOrThrow({QStringLiteral("notes"), QStringLiteral("--ref"), ref, QStringLiteral("add"),
                QStringLiteral("-f"), QStringLiteral("-F"), QStringLiteral("-"),
                QString::fromStdString(commitId)},
               QByteArray::fromStdString(content));
}

std::vector<std::string> GitRepository::listNotes(const QString &ref) const
{
    std::vector<std::string> commits;
    if (!refTip(ref)) {
        return commits;
    }
    const QString output = runOrThrow({QStringLiteral("notes"), QStringLiteral("--ref"), ref,
                                       QStringLiteral("list")});
    // Each line is "<note-object> <annotated-commit>".
    for (const QString &line : output.split(QLatin1Char('\n'), Qt::SkipEmptyParts)) {
        const QStringList parts = line.split(QLatin1Char(' '), Qt::SkipEmptyParts);
        if (parts.size() == 2) {
            commits.push_back(parts.at(1).toStdString());
        }
    }
    return commits;
}

std::optional<std::string> GitRepository::refTip(const QString &ref) const
{
    const ProcessResult result = run({QStringLiteral("rev-parse"), QStringLiteral("--verify"),
                                      QStringLiteral("-q"), ref});
    if (!result.ok()) {
        return std::nullopt;
    }
    return firstLine(result.stdOut);
}

void GitRepository::updateRef(const QString &ref, const std::string &newValue,
                              const std::optional<std::string> &expectedOld) const
{
    QStringList args{QStringLiteral("update-ref"), ref, QString::fromStdString(newValue)};
    if (expectedOld) {
        // update-ref reads an empty old value as "must not exist", whatever
        // the repository's object format.
        args << QString::fromStdString(*expectedOld);
    }
    runOrThrow(args);
}

void GitRepository::deleteRef(const QString &ref,
                              const std::optional<std::string> &expectedOld) const
{
    if (!refTip(ref)) {
        return;
    }
    QStringList args{QStringLiteral("update-ref"), QStringLiteral("-d"), ref};
    if (expectedOld && !expectedOld->empty()) {
        args << QString::fromStdString(*expectedOld);
    }
    runOrThrow(args);
}

std::string GitRepository::treeOf(const std::string &commitId) const
{
    return runOrThrow({QStringLiteral("rev-parse"),
                       QString::fromStdString(commitId + "^{tree}")})
        .trimmed()
        .toStdString();
}

std::string GitRepository::commitTree(const std::string &tree,
                                      const std::vector<std::string> &parentIds,
                                      const std::string &message) const
{
    QStringList args{QStringLiteral("commit-tree"), QString::fromStdString(tree)};
    for (const auto &parent : parentIds) {
        args << QStringLiteral("-p") << QString::fromStdString(parent);
    }
    args << QStringLiteral("-m") << QString::fromStdString(message);
    return runOrThrow(args).trimmed().toStdString();
}

bool GitRepository::isAncestor(const std::string &ancestor, const std::string &descendant) const
{
    const ProcessResult result = run({QStringLiteral("merge-base"), QStringLiteral("--is-ancestor"),
                                      QString::fromStdString(ancestor),
                                      QString::fromStdString(descendant)});
    return result.ok();
}

GitRepository::FetchResult GitRepository::fetchRef(const QString &remote, const QString &source,
                                                   const QString &destination,
                                                   std::string *error) const
{
    const ProcessResult result = run({QStringLiteral("fetch"), QStringLiteral("--no-tags"), remote,
                                      QStringLiteral("+%1:%2").arg(source, destination)});
    if (result.ok()) {
        return FetchResult::Fetched;
    }
    const QString stderrText = QString::fromUtf8(result.stdErr);
    if (stderrText.contains(QLatin1String("couldn't find remote ref"), Qt::CaseInsensitive)) {
        return FetchResult::MissingRemoteRef;
    }
    if (error) {
        *error = stderrText.trimmed().toStdString();
    }
    return FetchResult::Failed;
}

GitRepository::PushResult GitRepository::pushRef(const QString &remote, const QString &ref,
                                                 std::string *error) const
{
    const ProcessResult result = run({QStringLiteral("push"), remote,
                                      QStringLiteral("%1:%1").arg(ref)});
    if (result.ok()) {
        return PushResult::Pushed;
    }
    const QString stderrText = QString::fromUtf8(result.stdErr);
    if (error) {
        *error = stderrText.trimmed().toStdString();
    }
    if (stderrText.contains(QLatin1String("rejected"))
        || stderrText.contains(QLatin1String("non-fast-forward"))
        || stderrText.contains(QLatin1String("fetch first"))) {
        return PushResult::Rejected;
    }
    return PushResult::Failed;
}

} // namespace promptrail
