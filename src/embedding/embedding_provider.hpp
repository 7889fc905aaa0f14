#pragma once

#include <map>
#include <mutex>

#include "embedding/embedding_backend.hpp"

namespace foldermind {

// Resolves "hash-<dimension>" and "ollama:<model>" ids, caching one backend
// per id. Unknown ids throw EnvironmentError(LibraryLoadFailure).
class DefaultEmbeddingProvider : public EmbeddingBackendProvider {
public:
    explicit DefaultEmbeddingProvider(std::string ollamaUrl);

    std::shared_ptr<EmbeddingBackend> backendFor(const std::string &modelId) override;

private:
    std::string m_ollamaUrl;
    std::mutex m_mutex;
    std::map<std::string, std::shared_ptr<EmbeddingBackend>> m_backends;
};

} // namespace foldermind
