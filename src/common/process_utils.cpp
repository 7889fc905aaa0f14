#include "common/process_utils.hpp"

#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <QProcess>
#include <QStandardPaths>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"

namespace foldermind {

namespace {

// Build trees put every target next to each other; installs put the daemon
// in bin/ and may put the bridge in libexec/.
const char *const kSiblingDirs[] = {
    ".",
    "../bin",
    "../libexec/foldermind",
};

QString executableIn(const QDir &dir, const QString &name)
{
    const QFileInfo info(dir.filePath(name));
    return info.isFile() && info.isExecutable() ? info.canonicalFilePath() : QString();
}

QString locateExecutable(const char *envName, const QString &binaryName)
{
    const QString overridePath = qEnvironmentVariable(envName);
    if (!overridePath.isEmpty()) {
        const QFileInfo info(overridePath);
        return info.isExecutable() ? info.absoluteFilePath() : QString();
    }

    if (QCoreApplication::instance()) {
        const QDir appDir(QCoreApplication::applicationDirPath());
        for (const char *relative : kSiblingDirs) {
            const QString found =
                executableIn(QDir(appDir.filePath(QString::fromLatin1(relative))), binaryName);
            if (!found.isEmpty()) {
                return found;
            }
        }
    }
    return QStandardPaths::findExecutable(binaryName);
}

} // namespace

QString locateDaemonExecutable()
{
    return locateExecutable("FOLDERMIND_DAEMON_PATH", QStringLiteral("foldermind-daemon"));
}

QString locateBridgeExecutable()
{
    return locateExecutable("FOLDERMIND_BRIDGE_PATH", QStringLiteral("foldermind-mcp"));
}

bool startDetached(const QString &executable, const QStringList &arguments,
                   QString *errorMessage)
{
    FMLOG_INFO(QStringLiteral("ProcessUtils"),
               QStringLiteral("startDetached"),
               QStringLiteral("spawn_process"),
               QStringLiteral("auto_start"),
               QStringLiteral("process_start_detached"),
               foldermind::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"executable", executable.toStdString()}}));

    if (executable.isEmpty()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("executable not found");
        }
        return false;
    }

    QProcess process;
    process.setProgram(executable);
    process.setArguments(arguments);
    process.setStandardInputFile(QProcess::nullDevice());
    process.setStandardOutputFile(QProcess::nullDevice());
    process.setStandardErrorFile(QProcess::nullDevice());
    qint64 pid = 0;
    if (!process.startDetached(&pid)) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("failed to spawn %1: %2")
                                .arg(executable, process.errorString());
        }
        return false;
    }
    return true;
}

} // namespace foldermind
