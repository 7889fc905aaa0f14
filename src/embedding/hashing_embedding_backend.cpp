#include "embedding/hashing_embedding_backend.hpp"

#include <cctype>
#include <cmath>
#include <cstdint>
#include <stdexcept>

namespace foldermind {

namespace {

std::uint64_t fnv1a(const std::string &value)
{
    std::uint64_t hash = 14695981039346656037ULL;
    for (unsigned char c : value) {
        hash ^= c;
        hash *= 1099511628211ULL;
    }
    return hash;
}

std::vector<std::string> words(const std::string &text)
{
    std::vector<std::string> out;
    std::string current;
    for (unsigned char c : text) {
        if (std::isalnum(c) || c >= 0x80) {
            current.push_back(static_cast<char>(std::tolower(c)));
        } else if (!current.empty()) {
            out.push_back(current);
            current.clear();
        }
    }
    if (!current.empty()) {
        out.push_back(current);
    }
    return out;
}

} // namespace

HashingEmbeddingBackend::HashingEmbeddingBackend(int dimension)
    : m_dimension(dimension)
{
    if (dimension <= 0) {
        throw std::invalid_argument("embedding dimension must be positive");
    }
}

std::string HashingEmbeddingBackend::modelId() const
{
    return "hash-" + std::to_string(m_dimension);
}

int HashingEmbeddingBackend::dimension() const
{
    return m_dimension;
}

std::vector<float> HashingEmbeddingBackend::embed(const std::string &text)
{
    std::vector<float> vector(static_cast<std::size_t>(m_dimension), 0.0f);
    const std::vector<std::string> tokens = words(text);

    auto addFeature = [&](const std::string &feature, float weight) {
        const std::uint64_t hash = fnv1a(feature);
        const std::size_t bucket = static_cast<std::size_t>(hash % static_cast<std::uint64_t>(m_dimension));
        const float sign = (hash >> 63) ? -1.0f : 1.0f;
        vector[bucket] += sign * weight;
    };

    for (std::size_t i = 0; i < tokens.size(); ++i) {
        addFeature(tokens[i], 1.0f);
        if (i + 1 < tokens.size()) {
            addFeature(tokens[i] + ' ' + tokens[i + 1], 0.5f);
        }
    }

    double norm = 0.0;
    for (float value : vector) {
        norm += static_cast<double>(value) * value;
    }
    if (norm > 0.0) {
        const float scale = static_cast<float>(1.0 / std::sqrt(norm));
        for (float &value : vector) {
            value *= scale;
        }
    }
    return vector;
}

} // namespace foldermind
