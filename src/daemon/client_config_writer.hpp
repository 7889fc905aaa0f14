#pragma once

#include <map>
#include <string>

#include "common/enums.hpp"

namespace foldermind {

// Rewrites one agent client's configuration so it reaches the daemon through
// the given transport. Throws std::runtime_error when the file cannot be
// written or the client is unknown.
class ClientConfigWriter {
public:
    virtual ~ClientConfigWriter() = default;

    virtual void writeConfig(const std::string &clientId,
                             TransportMode mode,
                             const std::string &address) = 0;
};

// Merges a "foldermind" entry into the client's mcpServers object and keeps
// every unrelated key.
class JsonClientConfigWriter : public ClientConfigWriter {
public:
    JsonClientConfigWriter(std::string homeDir, std::string bridgeExecutable);

    void writeConfig(const std::string &clientId,
                     TransportMode mode,
                     const std::string &address) override;

    // Overrides or adds a client's config file location.
    void setConfigPath(const std::string &clientId, const std::string &path);
    std::string configPath(const std::string &clientId) const;

    static constexpr const char *kServerKey = "foldermind";

private:
    std::string m_homeDir;
    std::string m_bridgeExecutable;
    std::map<std::string, std::string> m_paths;
};

} // namespace foldermind
