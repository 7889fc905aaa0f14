#pragma once

#include <QString>

namespace foldermind {

// Starts a daemon process. Implementations must not block until the daemon
// is healthy; the transport polls for that.
class DaemonLauncher {
public:
    virtual ~DaemonLauncher() = default;

    // On failure errorMessage receives the cause.
    virtual bool launch(QString *errorMessage) = 0;
};

// Spawns foldermind-daemon detached: explicit path first, then
// FOLDERMIND_DAEMON_PATH, a sibling binary, and PATH.
class ProcessDaemonLauncher : public DaemonLauncher {
public:
    explicit ProcessDaemonLauncher(QString explicitPath = QString());

    bool launch(QString *errorMessage) override;

private:
    QString m_explicitPath;
};

} // namespace foldermind
