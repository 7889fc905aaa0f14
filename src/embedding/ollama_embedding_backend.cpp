#include "embedding/ollama_embedding_backend.hpp"

#include <QUrl>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/http_request.hpp"

namespace foldermind {

OllamaEmbeddingBackend::OllamaEmbeddingBackend(const std::string &baseUrl,
                                               const std::string &model,
                                               std::chrono::milliseconds timeout)
    : m_baseUrl(baseUrl)
    , m_model(model)
    , m_timeout(timeout)
{
}

std::string OllamaEmbeddingBackend::modelId() const
{
    return "ollama:" + m_model;
}

int OllamaEmbeddingBackend::dimension() const
{
    return m_dimension.load();
}

std::vector<float> OllamaEmbeddingBackend::embed(const std::string &text)
{
    const nlohmann::json request = {
        {"model", m_model},
        {"prompt", text}
    };
    const QUrl url(QString::fromStdString(m_baseUrl + "/api/embeddings"));
    const HttpResponse response = performHttpRequest(
        "POST", url, QByteArray::fromStdString(request.dump()), m_timeout);

    if (!response.received) {
        throw EnvironmentError(EnvironmentCause::LibraryLoadFailure,
                               "embedding runtime unreachable at " + m_baseUrl + ": "
                                   + response.errorString.toStdString());
    }
    if (response.status != 200) {
        throw EnvironmentError(EnvironmentCause::RuntimeFailure,
                               "embedding runtime returned HTTP "
                                   + std::to_string(response.status) + " for model "
                                   + m_model);
    }

    const auto body = nlohmann::json::parse(response.body.toStdString(), nullptr, false);
    if (body.is_discarded() || !body.contains("embedding") || !body.at("embedding").is_array()) {
        throw EnvironmentError(EnvironmentCause::RuntimeFailure,
                               "embedding runtime returned an unexpected payload");
    }

    std::vector<float> embedding = body.at("embedding").get<std::vector<float>>();
    const int known = m_dimension.load();
    if (known != 0 && known != static_cast<int>(embedding.size())) {
        throw EnvironmentError(EnvironmentCause::NativeVersionMismatch,
                               "embedding dimension changed from " + std::to_string(known)
                                   + " to " + std::to_string(embedding.size()));
    }
    m_dimension.store(static_cast<int>(embedding.size()));
    return embedding;
}

} // namespace foldermind
