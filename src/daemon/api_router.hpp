#pragma once

#include <functional>
#include <map>
#include <string>

#include <nlohmann/json.hpp>

#include "daemon/connection_arbiter.hpp"
#include "daemon/folder_lifecycle.hpp"
#include "daemon/mcp_handler.hpp"
#include "daemon/search_service.hpp"
#include "store/coordinate_store.hpp"

namespace foldermind {

struct ApiRequest {
    std::string method;
    std::string path;
    std::map<std::string, std::string> query;
    std::string body;
};

struct ApiResponse {
    int status = 200;
    // Null for 204.
    nlohmann::json body;
};

/**
 * ApiRouter maps fallback-channel HTTP requests onto daemon components. It is
 * transport-free so the HTTP server, tests and the MCP bridge share one
 * request path. Exceptions become JSON {error, message, timestamp} bodies.
 */
class ApiRouter {
public:
    using InfoProvider = std::function<nlohmann::json()>;

    ApiRouter(FolderLifecycleOrchestrator &folders,
              const SearchService &search,
              ConnectionArbiter &arbiter,
              McpHandler &mcp,
              const CoordinateStore &store,
              InfoProvider serverInfo);

    ApiResponse handle(const ApiRequest &request);

    static ApiResponse errorResponse(int status, const std::string &error,
                                     const std::string &message);

private:
    ApiResponse dispatch(const ApiRequest &request);

    ApiResponse listFolders();
    ApiResponse addFolder(const nlohmann::json &body);
    ApiResponse removeFolder(const ApiRequest &request);
    ApiResponse folderStatus(const ApiRequest &request);
    ApiResponse retryFolder(const ApiRequest &request);
    ApiResponse search(const nlohmann::json &body);
    ApiResponse requestChannel(const ApiRequest &request, const nlohmann::json &body);
    ApiResponse setPrimary(const nlohmann::json &body);
    ApiResponse mcp(const ApiRequest &request);

    FolderLifecycleOrchestrator &m_folders;
    const SearchService &m_search;
    ConnectionArbiter &m_arbiter;
    McpHandler &m_mcp;
    const CoordinateStore &m_store;
    InfoProvider m_serverInfo;
};

} // namespace foldermind
