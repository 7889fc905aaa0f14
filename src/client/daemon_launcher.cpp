#include "client/daemon_launcher.hpp"

#include <QFileInfo>

#include "common/process_utils.hpp"

namespace foldermind {

ProcessDaemonLauncher::ProcessDaemonLauncher(QString explicitPath)
    : m_explicitPath(std::move(explicitPath))
{
}

bool ProcessDaemonLauncher::launch(QString *errorMessage)
{
    QString executable;
    if (!m_explicitPath.isEmpty()) {
        const QFileInfo info(m_explicitPath);
        if (!info.exists() || !info.isExecutable()) {
            if (errorMessage) {
                *errorMessage = QStringLiteral("daemon executable not found at %1").arg(m_explicitPath);
            }
            return false;
        }
        executable = info.absoluteFilePath();
    } else {
        executable = locateDaemonExecutable();
    }
    if (executable.isEmpty()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("foldermind-daemon executable not found");
        }
        return false;
    }
    return startDetached(executable, QStringList(), errorMessage);
}

} // namespace foldermind
