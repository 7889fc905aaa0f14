#include "daemon/api_router.hpp"

#include <chrono>
#include <stdexcept>

#include "common/errors.hpp"
#include "common/foldermind_version.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace foldermind {

namespace {

class HttpError : public std::runtime_error {
public:
    HttpError(int status, std::string code, const std::string &message)
        : std::runtime_error(message)
        , m_status(status)
        , m_code(std::move(code))
    {
    }

    int status() const { return m_status; }
    const std::string &code() const { return m_code; }

private:
    int m_status;
    std::string m_code;
};

nlohmann::json parseBody(const std::string &body)
{
    if (body.empty()) {
        return nlohmann::json::object();
    }
    nlohmann::json parsed = nlohmann::json::parse(body, nullptr, false);
    if (parsed.is_discarded()) {
        throw HttpError(400, "invalid_json", "request body is not valid JSON");
    }
    return parsed;
}

std::int64_t queryId(const ApiRequest &request)
{
    const auto it = request.query.find("id");
    if (it == request.query.end() || it->second.empty()) {
        throw HttpError(400, "missing_id", "query parameter 'id' is required");
    }
    try {
        std::size_t used = 0;
        const long long value = std::stoll(it->second, &used);
        if (used != it->second.size()) {
            throw std::invalid_argument(it->second);
        }
        return value;
    } catch (const std::exception &) {
        throw HttpError(400, "invalid_id", "query parameter 'id' must be an integer");
    }
}

std::string clientIdOf(const ApiRequest &request, const nlohmann::json &body)
{
    if (body.is_object() && body.contains("clientId") && body.at("clientId").is_string()) {
        return body.at("clientId").get<std::string>();
    }
    const auto it = request.query.find("client");
    return it == request.query.end() ? std::string() : it->second;
}

ApiResponse ok(nlohmann::json body, int status = 200)
{
    return ApiResponse{status, std::move(body)};
}

} // namespace

ApiRouter::ApiRouter(FolderLifecycleOrchestrator &folders,
                     const SearchService &search,
                     ConnectionArbiter &arbiter,
                     McpHandler &mcp,
                     const CoordinateStore &store,
                     InfoProvider serverInfo)
    : m_folders(folders)
    , m_search(search)
    , m_arbiter(arbiter)
    , m_mcp(mcp)
    , m_store(store)
    , m_serverInfo(std::move(serverInfo))
{
}

ApiResponse ApiRouter::errorResponse(int status, const std::string &error,
                                     const std::string &message)
{
    return ApiResponse{status, nlohmann::json{
        {"error", error},
        {"message", message},
        {"timestamp", toIso8601Utc(std::chrono::system_clock::now())}
    }};
}

ApiResponse ApiRouter::handle(const ApiRequest &request)
{
    ApiResponse response;
    try {
        response = dispatch(request);
    } catch (const HttpError &error) {
        response = errorResponse(error.status(), error.code(), error.what());
    } catch (const InvalidPathError &error) {
        response = errorResponse(400, "invalid_path", error.what());
    } catch (const CoordinateMismatchError &error) {
        response = errorResponse(409, "coordinate_mismatch", error.what());
        response.body["documentPath"] = error.documentPath();
    } catch (const ConnectionConflictError &error) {
        response = errorResponse(409, error.reasonCode(), error.what());
        response.body["fallbackAddress"] = error.fallbackAddress();
        response.body["primaryClientId"] = error.primaryClientId();
    } catch (const EnvironmentError &error) {
        response = errorResponse(503, "environment_failure", error.what());
    } catch (const std::invalid_argument &error) {
        response = errorResponse(400, "invalid_request", error.what());
    } catch (const std::out_of_range &error) {
        response = errorResponse(404, "not_found", error.what());
    } catch (const std::exception &error) {
        response = errorResponse(500, "internal_error", error.what());
    }

    const nlohmann::json context = {
        {"method", request.method},
        {"path", request.path},
        {"status", response.status}
    };
    if (response.status >= 500) {
        FMLOG_ERROR(QStringLiteral("ApiRouter"),
                    QStringLiteral("ApiRouter::handle"),
                    QStringLiteral("api_request_failed"),
                    QString::fromStdString(response.body.value("message", "")),
                    QStringLiteral("http"),
                    QString(),
                    logging::currentCorrelationId(),
                    context);
    } else if (response.status >= 400) {
        FMLOG_WARN(QStringLiteral("ApiRouter"),
                   QStringLiteral("ApiRouter::handle"),
                   QStringLiteral("api_request_rejected"),
                   QString::fromStdString(response.body.value("error", "")),
                   QStringLiteral("http"),
                   QString(),
                   logging::currentCorrelationId(),
                   context);
    } else {
        FMLOG_DEBUG(QStringLiteral("ApiRouter"),
                    QStringLiteral("ApiRouter::handle"),
                    QStringLiteral("api_request"),
                    QStringLiteral("client_request"),
                    QStringLiteral("http"),
                    QString(),
                    logging::currentCorrelationId(),
                    context);
    }
    return response;
}

ApiResponse ApiRouter::dispatch(const ApiRequest &request)
{
    const std::string &method = request.method;
    const std::string &path = request.path;

    if (path == "/api/v1/health" && method == "GET") {
        return ok({{"status", "ok"}, {"version", FOLDERMIND_VERSION}});
    }
    if (path == "/api/v1/server/info" && method == "GET") {
        return ok(m_serverInfo ? m_serverInfo() : nlohmann::json::object());
    }
    if (path == "/api/v1/folders") {
        if (method == "GET") {
            return listFolders();
        }
        if (method == "POST") {
            return addFolder(parseBody(request.body));
        }
        if (method == "DELETE") {
            return removeFolder(request);
        }
    }
    if (path == "/api/v1/folders/status" && method == "GET") {
        return folderStatus(request);
    }
    if (path == "/api/v1/folders/retry" && method == "POST") {
        return retryFolder(request);
    }
    if (path == "/api/v1/search" && method == "POST") {
        return search(parseBody(request.body));
    }
    if (path == "/api/v1/notifications" && method == "GET") {
        return ok({{"notifications", m_folders.notifications()}});
    }
    if (path == "/api/v1/connection" && method == "GET") {
        return ok(m_arbiter.state());
    }
    if (path == "/api/v1/connection/request" && method == "POST") {
        return requestChannel(request, parseBody(request.body));
    }
    if (path == "/api/v1/connection/primary") {
        if (method == "POST") {
            return setPrimary(parseBody(request.body));
        }
        if (method == "DELETE") {
            m_arbiter.clearPrimary();
            return ok(m_arbiter.state());
        }
    }
    if (path == "/mcp" && method == "POST") {
        return mcp(request);
    }
    throw HttpError(404, "not_found", "no route for " + method + " " + path);
}

ApiResponse ApiRouter::listFolders()
{
    nlohmann::json folders = nlohmann::json::array();
    for (const MonitoredFolder &folder : m_folders.listFolders()) {
        nlohmann::json entry = folder;
        entry["documentCount"] = m_store.documentCount(folder.id);
        folders.push_back(entry);
    }
    return ok({{"folders", folders}});
}

ApiResponse ApiRouter::addFolder(const nlohmann::json &body)
{
    if (!body.is_object() || !body.contains("path") || !body.at("path").is_string()) {
        throw HttpError(400, "missing_path", "body field 'path' is required");
    }
    FolderConfig config;
    config.embeddingModelId = body.value("model", "");
    if (body.contains("exclude") && body.at("exclude").is_array()) {
        config.exclusionPatterns = body.at("exclude").get<std::vector<std::string>>();
    }
    const MonitoredFolder folder =
        m_folders.addFolder(body.at("path").get<std::string>(), config);
    return ok(folder, 201);
}

ApiResponse ApiRouter::removeFolder(const ApiRequest &request)
{
    const FolderId folderId = queryId(request);
    if (!m_folders.removeFolder(folderId)) {
        throw HttpError(404, "not_found", "unknown folder id " + std::to_string(folderId));
    }
    return ok({{"removed", true}, {"id", folderId}});
}

ApiResponse ApiRouter::folderStatus(const ApiRequest &request)
{
    const FolderId folderId = queryId(request);
    const std::optional<MonitoredFolder> folder = m_folders.folderStatus(folderId);
    if (!folder.has_value()) {
        throw HttpError(404, "not_found", "unknown folder id " + std::to_string(folderId));
    }
    nlohmann::json body = *folder;
    body["documentCount"] = m_store.documentCount(folderId);
    body["chunkCount"] = m_store.chunkCount(folderId);
    return ok(body);
}

ApiResponse ApiRouter::retryFolder(const ApiRequest &request)
{
    const FolderId folderId = queryId(request);
    if (!m_folders.folderStatus(folderId).has_value()) {
        throw HttpError(404, "not_found", "unknown folder id " + std::to_string(folderId));
    }
    if (!m_folders.retryFolder(folderId)) {
        throw HttpError(409, "not_in_error", "folder is not in the error state");
    }
    return ok({{"retrying", true}, {"id", folderId}}, 202);
}

ApiResponse ApiRouter::search(const nlohmann::json &body)
{
    if (!body.is_object() || !body.contains("query") || !body.at("query").is_string()) {
        throw HttpError(400, "missing_query", "body field 'query' is required");
    }
    SearchRequest request;
    request.query = body.at("query").get<std::string>();
    request.limit = body.value("limit", request.limit);
    if (body.contains("folderId") && body.at("folderId").is_number_integer()) {
        request.folderId = body.at("folderId").get<FolderId>();
    }
    if (body.contains("format") && body.at("format").is_string()) {
        request.format = parseFormatString(body.at("format").get<std::string>());
    }
    request.minScore = body.value("minScore", request.minScore);
    request.includeText = body.value("includeText", request.includeText);
    return ok({{"results", m_search.search(request)}});
}

ApiResponse ApiRouter::requestChannel(const ApiRequest &request, const nlohmann::json &body)
{
    const std::string clientId = clientIdOf(request, body);
    if (clientId.empty()) {
        throw HttpError(400, "missing_client", "clientId is required");
    }
    return ok(m_arbiter.requestLowLatencyChannel(clientId));
}

ApiResponse ApiRouter::setPrimary(const nlohmann::json &body)
{
    const std::string clientId = body.is_object() ? body.value("clientId", "") : std::string();
    if (clientId.empty()) {
        throw HttpError(400, "missing_client", "clientId is required");
    }
    const std::vector<ConfigWriteResult> results = m_arbiter.setPrimary(clientId);
    return ok({{"primaryClientId", clientId}, {"configs", results}});
}

ApiResponse ApiRouter::mcp(const ApiRequest &request)
{
    const std::string clientId = clientIdOf(request, nlohmann::json());
    m_arbiter.registerClient(clientId);

    const nlohmann::json message = nlohmann::json::parse(request.body, nullptr, false);
    if (message.is_discarded()) {
        return ok(McpHandler::makeError(nullptr, McpHandler::kParseError, "Parse error"));
    }
    const std::optional<nlohmann::json> reply = m_mcp.handle(message, clientId);
    if (!reply.has_value()) {
        return ApiResponse{202, nullptr};
    }
    return ok(*reply);
}

} // namespace foldermind
