#pragma once

#include <QString>
#include <QStringList>

namespace foldermind {

// Executable lookup: explicit env override, sibling of the running binary
// (dev build trees), then PATH. Empty when nothing is found.
QString locateDaemonExecutable();
QString locateBridgeExecutable();

// Spawns the executable detached from the caller. On failure errorMessage
// receives the reason.
bool startDetached(const QString &executable, const QStringList &arguments,
                   QString *errorMessage);

} // namespace foldermind
