#include "embedding/embedding_provider.hpp"

#include "common/errors.hpp"
#include "embedding/hashing_embedding_backend.hpp"
#include "embedding/ollama_embedding_backend.hpp"

namespace foldermind {

namespace {

constexpr const char *kHashPrefix = "hash-";
constexpr const char *kOllamaPrefix = "ollama:";

bool startsWith(const std::string &value, const std::string &prefix)
{
    return value.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

DefaultEmbeddingProvider::DefaultEmbeddingProvider(std::string ollamaUrl)
    : m_ollamaUrl(std::move(ollamaUrl))
{
}

std::shared_ptr<EmbeddingBackend> DefaultEmbeddingProvider::backendFor(const std::string &modelId)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto it = m_backends.find(modelId);
    if (it != m_backends.end()) {
        return it->second;
    }

    std::shared_ptr<EmbeddingBackend> backend;
    if (startsWith(modelId, kHashPrefix)) {
        int dimension = 0;
        try {
            dimension = std::stoi(modelId.substr(std::string(kHashPrefix).size()));
        } catch (const std::exception &) {
            dimension = 0;
        }
        if (dimension <= 0 || dimension > 8192) {
            throw EnvironmentError(EnvironmentCause::LibraryLoadFailure,
                                   "invalid hashing model id: " + modelId);
        }
        backend = std::make_shared<HashingEmbeddingBackend>(dimension);
    } else if (startsWith(modelId, kOllamaPrefix)
               && modelId.size() > std::string(kOllamaPrefix).size()) {
        backend = std::make_shared<OllamaEmbeddingBackend>(
            m_ollamaUrl, modelId.substr(std::string(kOllamaPrefix).size()));
    } else {
        throw EnvironmentError(EnvironmentCause::LibraryLoadFailure,
                               "no embedding backend available for model " + modelId);
    }

    m_backends[modelId] = backend;
    return backend;
}

} // namespace foldermind
