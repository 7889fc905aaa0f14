#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "daemon/folder_lifecycle.hpp"
#include "daemon/search_service.hpp"

namespace foldermind {

/**
 * McpHandler answers MCP JSON-RPC 2.0 messages (initialize, ping, tools/list,
 * tools/call) against the daemon's folders and search service. It is shared
 * by the HTTP /mcp endpoint and, through it, the stdio bridge.
 */
class McpHandler {
public:
    static constexpr const char *kProtocolVersion = "2024-11-05";

    static constexpr int kParseError = -32700;
    static constexpr int kInvalidRequest = -32600;
    static constexpr int kMethodNotFound = -32601;
    static constexpr int kInvalidParams = -32602;
    static constexpr int kInternalError = -32603;
    static constexpr int kCoordinateMismatch = -32001;
    static constexpr int kChannelDenied = -32002;

    McpHandler(FolderLifecycleOrchestrator &folders, const SearchService &search);

    // Returns nullopt for notifications (no "id"), which get no response.
    std::optional<nlohmann::json> handle(const nlohmann::json &message,
                                         const std::string &clientId);

    static nlohmann::json makeError(const nlohmann::json &id, int code,
                                    const std::string &message,
                                    const nlohmann::json &data = nullptr);
    static nlohmann::json makeResult(const nlohmann::json &id, const nlohmann::json &result);

    static nlohmann::json toolDefinitions();

private:
    nlohmann::json callTool(const std::string &name, const nlohmann::json &arguments);

    FolderLifecycleOrchestrator &m_folders;
    const SearchService &m_search;
};

} // namespace foldermind
