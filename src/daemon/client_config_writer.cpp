#include "daemon/client_config_writer.hpp"

#include <stdexcept>

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>

#include <nlohmann/json.hpp>

namespace foldermind {

JsonClientConfigWriter::JsonClientConfigWriter(std::string homeDir, std::string bridgeExecutable)
    : m_homeDir(std::move(homeDir))
    , m_bridgeExecutable(std::move(bridgeExecutable))
{
    m_paths = {
        {"claude-desktop", m_homeDir + "/.config/Claude/claude_desktop_config.json"},
        {"claude-code", m_homeDir + "/.claude.json"},
        {"cursor", m_homeDir + "/.cursor/mcp.json"},
        {"windsurf", m_homeDir + "/.windsurf/mcp.json"},
        {"codex-cli", m_homeDir + "/.codex/config.json"},
    };
    if (m_bridgeExecutable.empty()) {
        m_bridgeExecutable = "foldermind-mcp";
    }
}

void JsonClientConfigWriter::setConfigPath(const std::string &clientId, const std::string &path)
{
    m_paths[clientId] = path;
}

std::string JsonClientConfigWriter::configPath(const std::string &clientId) const
{
    const auto it = m_paths.find(clientId);
    return it == m_paths.end() ? std::string() : it->second;
}

void JsonClientConfigWriter::writeConfig(const std::string &clientId,
                                         TransportMode mode,
                                         const std::string &address)
{
    const std::string path = configPath(clientId);
    if (path.empty()) {
        throw std::runtime_error("no configuration path known for client " + clientId);
    }
    const QString filePath = QString::fromStdString(path);

    nlohmann::json root = nlohmann::json::object();
    QFile existing(filePath);
    if (existing.exists()) {
        if (!existing.open(QIODevice::ReadOnly)) {
            throw std::runtime_error("cannot read " + path + ": "
                                     + existing.errorString().toStdString());
        }
        const QByteArray data = existing.readAll();
        existing.close();
        if (!data.trimmed().isEmpty()) {
            root = nlohmann::json::parse(data.toStdString(), nullptr, false);
            if (root.is_discarded() || !root.is_object()) {
                throw std::runtime_error("refusing to overwrite unparseable config " + path);
            }
        }
    }

    nlohmann::json entry;
    if (mode == TransportMode::Stdio) {
        entry = {
            {"command", m_bridgeExecutable},
            {"args", nlohmann::json::array({"--client", clientId})}
        };
    } else {
        entry = {
            {"type", "http"},
            {"url", address}
        };
    }
    if (!root.contains("mcpServers") || !root["mcpServers"].is_object()) {
        root["mcpServers"] = nlohmann::json::object();
    }
    root["mcpServers"][kServerKey] = entry;

    if (!QDir().mkpath(QFileInfo(filePath).absolutePath())) {
        throw std::runtime_error("cannot create directory for " + path);
    }
    QSaveFile out(filePath);
    if (!out.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        throw std::runtime_error("cannot write " + path + ": " + out.errorString().toStdString());
    }
    const std::string serialized = root.dump(2) + "\n";
    out.write(serialized.data(), static_cast<qint64>(serialized.size()));
    if (!out.commit()) {
        throw std::runtime_error("cannot commit " + path + ": " + out.errorString().toStdString());
    }
}

} // namespace foldermind
