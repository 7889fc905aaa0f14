#pragma once

#include "embedding/embedding_backend.hpp"

namespace foldermind {

// Offline feature-hashing embedder ("hash-<dimension>"). Lowercased word
// unigrams and bigrams are hashed into signed buckets and L2-normalized, so
// equal text always yields an identical vector.
class HashingEmbeddingBackend : public EmbeddingBackend {
public:
    explicit HashingEmbeddingBackend(int dimension);

    std::string modelId() const override;
    int dimension() const override;
    std::vector<float> embed(const std::string &text) override;

private:
    int m_dimension;
};

} // namespace foldermind
