#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "common/models.hpp"

namespace foldermind {

// Durable daemon state: the monitored folder list with lifecycle state, and
// the connection arbiter's assignment. Everything written here reads back
// unchanged after a restart.
class DaemonStateStore {
public:
    explicit DaemonStateStore(const std::string &databasePath);
    ~DaemonStateStore();

    DaemonStateStore(const DaemonStateStore &) = delete;
    DaemonStateStore &operator=(const DaemonStateStore &) = delete;

    // Inserts a new folder row and returns its assigned id. folder.id is ignored.
    FolderId insertFolder(const MonitoredFolder &folder);
    void saveFolder(const MonitoredFolder &folder);
    void deleteFolder(FolderId folderId);
    std::vector<MonitoredFolder> loadFolders() const;
    std::optional<MonitoredFolder> folder(FolderId folderId) const;

    void saveConnectionState(const ClientConnectionState &state);
    ClientConnectionState loadConnectionState() const;

    std::optional<std::string> getMeta(const std::string &key) const;
    void setMeta(const std::string &key, const std::string &value);

private:
    struct Impl;
    std::unique_ptr<Impl> impl;
};

} // namespace foldermind
