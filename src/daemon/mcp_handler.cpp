#include "daemon/mcp_handler.hpp"

#include <stdexcept>

#include "common/errors.hpp"
#include "common/foldermind_version.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace foldermind {

namespace {

nlohmann::json textContent(const nlohmann::json &payload)
{
    return nlohmann::json{
        {"content", nlohmann::json::array({
            nlohmann::json{{"type", "text"}, {"text", payload.dump(2)}}
        })},
        {"isError", false}
    };
}

nlohmann::json toolError(const std::string &message)
{
    return nlohmann::json{
        {"content", nlohmann::json::array({
            nlohmann::json{{"type", "text"}, {"text", message}}
        })},
        {"isError", true}
    };
}

std::int64_t requireId(const nlohmann::json &arguments, const char *key)
{
    if (!arguments.contains(key) || !arguments.at(key).is_number_integer()) {
        throw std::invalid_argument(std::string("missing integer argument '") + key + "'");
    }
    return arguments.at(key).get<std::int64_t>();
}

nlohmann::json schema(const nlohmann::json &properties, const nlohmann::json &required)
{
    return nlohmann::json{
        {"type", "object"},
        {"properties", properties},
        {"required", required}
    };
}

} // namespace

McpHandler::McpHandler(FolderLifecycleOrchestrator &folders, const SearchService &search)
    : m_folders(folders)
    , m_search(search)
{
}

nlohmann::json McpHandler::makeError(const nlohmann::json &id, int code,
                                     const std::string &message,
                                     const nlohmann::json &data)
{
    nlohmann::json error = {{"code", code}, {"message", message}};
    if (!data.is_null()) {
        error["data"] = data;
    }
    return nlohmann::json{{"jsonrpc", "2.0"}, {"id", id}, {"error", error}};
}

nlohmann::json McpHandler::makeResult(const nlohmann::json &id, const nlohmann::json &result)
{
    return nlohmann::json{{"jsonrpc", "2.0"}, {"id", id}, {"result", result}};
}

nlohmann::json McpHandler::toolDefinitions()
{
    nlohmann::json tools = nlohmann::json::array();
    tools.push_back({
        {"name", "list_folders"},
        {"description", "List monitored folders with their indexing state."},
        {"inputSchema", schema(nlohmann::json::object(), nlohmann::json::array())}
    });
    tools.push_back({
        {"name", "get_folder_status"},
        {"description", "Detailed status of one monitored folder."},
        {"inputSchema", schema({{"folderId", {{"type", "integer"}}}},
                               nlohmann::json::array({"folderId"}))}
    });
    tools.push_back({
        {"name", "search_content"},
        {"description", "Semantic search over indexed documents."},
        {"inputSchema", schema({{"query", {{"type", "string"}}},
                                {"limit", {{"type", "integer"}}},
                                {"folderId", {{"type", "integer"}}},
                                {"format", {{"type", "string"}}},
                                {"minScore", {{"type", "number"}}}},
                               nlohmann::json::array({"query"}))}
    });
    tools.push_back({
        {"name", "get_chunk_text"},
        {"description", "Reconstruct the full text of one chunk."},
        {"inputSchema", schema({{"chunkId", {{"type", "integer"}}}},
                               nlohmann::json::array({"chunkId"}))}
    });
    return tools;
}

std::optional<nlohmann::json> McpHandler::handle(const nlohmann::json &message,
                                                 const std::string &clientId)
{
    if (!message.is_object() || message.value("jsonrpc", "") != "2.0"
        || !message.contains("method") || !message.at("method").is_string()) {
        const nlohmann::json id = message.is_object() && message.contains("id")
            ? message.at("id")
            : nlohmann::json(nullptr);
        return makeError(id, kInvalidRequest, "Invalid Request");
    }

    const std::string method = message.at("method").get<std::string>();
    if (!message.contains("id")) {
        FMLOG_DEBUG(QStringLiteral("McpHandler"),
                    QStringLiteral("McpHandler::handle"),
                    QStringLiteral("mcp_notification"),
                    QString::fromStdString(method),
                    QStringLiteral("no_response"),
                    QString::fromStdString(clientId),
                    logging::currentCorrelationId(),
                    nlohmann::json::object());
        return std::nullopt;
    }
    const nlohmann::json id = message.at("id");
    const nlohmann::json params = message.contains("params") && message.at("params").is_object()
        ? message.at("params")
        : nlohmann::json::object();

    if (method == "initialize") {
        return makeResult(id, {
            {"protocolVersion", kProtocolVersion},
            {"capabilities", {{"tools", {{"listChanged", false}}}}},
            {"serverInfo", {{"name", "foldermind"}, {"version", FOLDERMIND_VERSION}}}
        });
    }
    if (method == "ping") {
        return makeResult(id, nlohmann::json::object());
    }
    if (method == "tools/list") {
        return makeResult(id, {{"tools", toolDefinitions()}});
    }
    if (method != "tools/call") {
        return makeError(id, kMethodNotFound, "Method not found: " + method);
    }

    const std::string name = params.value("name", "");
    const nlohmann::json arguments = params.contains("arguments") && params.at("arguments").is_object()
        ? params.at("arguments")
        : nlohmann::json::object();

    FMLOG_INFO(QStringLiteral("McpHandler"),
               QStringLiteral("McpHandler::handle"),
               QStringLiteral("tool_call"),
               QStringLiteral("mcp_request"),
               QString::fromStdString(name),
               QString::fromStdString(clientId),
               logging::currentCorrelationId(),
               nlohmann::json::object());

    try {
        return makeResult(id, callTool(name, arguments));
    } catch (const CoordinateMismatchError &error) {
        return makeError(id, kCoordinateMismatch, error.what(),
                         {{"error", "coordinate_mismatch"},
                          {"documentPath", error.documentPath()}});
    } catch (const std::invalid_argument &error) {
        return makeError(id, kInvalidParams, error.what());
    } catch (const std::out_of_range &error) {
        return makeResult(id, toolError(error.what()));
    } catch (const std::exception &error) {
        FMLOG_ERROR(QStringLiteral("McpHandler"),
                    QStringLiteral("McpHandler::handle"),
                    QStringLiteral("tool_failed"),
                    QString::fromStdString(error.what()),
                    QString::fromStdString(name),
                    QString::fromStdString(clientId),
                    logging::currentCorrelationId(),
                    nlohmann::json::object());
        return makeError(id, kInternalError, error.what());
    }
}

nlohmann::json McpHandler::callTool(const std::string &name, const nlohmann::json &arguments)
{
    if (name == "list_folders") {
        return textContent({{"folders", m_folders.listFolders()}});
    }
    if (name == "get_folder_status") {
        const FolderId folderId = requireId(arguments, "folderId");
        const std::optional<MonitoredFolder> folder = m_folders.folderStatus(folderId);
        if (!folder.has_value()) {
            throw std::out_of_range("unknown folder id " + std::to_string(folderId));
        }
        return textContent(*folder);
    }
    if (name == "search_content") {
        SearchRequest request;
        request.query = arguments.value("query", "");
        if (request.query.empty()) {
            throw std::invalid_argument("missing string argument 'query'");
        }
        request.limit = arguments.value("limit", request.limit);
        if (arguments.contains("folderId") && arguments.at("folderId").is_number_integer()) {
            request.folderId = arguments.at("folderId").get<FolderId>();
        }
        if (arguments.contains("format") && arguments.at("format").is_string()) {
            request.format = parseFormatString(arguments.at("format").get<std::string>());
        }
        request.minScore = arguments.value("minScore", request.minScore);
        return textContent({{"results", m_search.search(request)}});
    }
    if (name == "get_chunk_text") {
        const ChunkText chunk = m_search.chunkText(requireId(arguments, "chunkId"));
        return textContent({
            {"chunkId", chunk.chunk.id},
            {"coordinates", chunk.chunk.coordinates},
            {"document", chunk.document},
            {"text", chunk.text}
        });
    }
    throw std::invalid_argument("unknown tool '" + name + "'");
}

} // namespace foldermind
