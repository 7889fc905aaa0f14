#pragma once

#include <memory>
#include <string>
#include <vector>

namespace foldermind {

// Turns text into a vector. Load and runtime failures are thrown as
// EnvironmentError so the orchestrator preserves indexed data.
class EmbeddingBackend {
public:
    virtual ~EmbeddingBackend() = default;

    virtual std::string modelId() const = 0;
    // 0 until known for backends that learn it from the first response.
    virtual int dimension() const = 0;
    virtual std::vector<float> embed(const std::string &text) = 0;
};

// Maps a folder's configured model id to a backend instance.
class EmbeddingBackendProvider {
public:
    virtual ~EmbeddingBackendProvider() = default;

    virtual std::shared_ptr<EmbeddingBackend> backendFor(const std::string &modelId) = 0;
};

} // namespace foldermind
