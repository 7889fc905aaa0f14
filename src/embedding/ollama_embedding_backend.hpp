#pragma once

#include <atomic>
#include <chrono>

#include "embedding/embedding_backend.hpp"

namespace foldermind {

// Embeds through a local Ollama runtime ("ollama:<model>") using its
// /api/embeddings endpoint.
class OllamaEmbeddingBackend : public EmbeddingBackend {
public:
    OllamaEmbeddingBackend(const std::string &baseUrl, const std::string &model,
                           std::chrono::milliseconds timeout = std::chrono::seconds(180));

    std::string modelId() const override;
    int dimension() const override;
    std::vector<float> embed(const std::string &text) override;

private:
    std::string m_baseUrl;
    std::string m_model;
    std::chrono::milliseconds m_timeout;
    std::atomic<int> m_dimension{0};
};

} // namespace foldermind
