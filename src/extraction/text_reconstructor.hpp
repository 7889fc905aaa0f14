#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "extraction/format_extractor.hpp"

namespace foldermind {

// Regenerates chunk text from stored coordinates by dispatching to the
// extractor registered for the document's format. The store never holds
// text, so every snippet, audit and search result passes through here.
class TextReconstructor {
public:
    // Registers the built-in text and markdown extractors.
    TextReconstructor();

    // Replaces any extractor already registered for the same format.
    void registerExtractor(std::shared_ptr<FormatExtractor> extractor);
    bool supports(DocumentFormat format) const;

    std::vector<ExtractionCoordinates> plan(const DocumentHandle &document,
                                            const ChunkingOptions &options) const;

    // Throws CoordinateMismatchError when the coordinates cannot be resolved
    // or when the file no longer hashes to document.contentHash.
    std::string extract(const ExtractionCoordinates &coordinates,
                        const DocumentHandle &document) const;

    // Throws CoordinateMismatchError unless the file on disk still hashes to
    // document.contentHash. No-op for an empty hash.
    static void verifyContent(const DocumentHandle &document);

    static DocumentFormat formatForPath(const std::string &path);

    // SHA-256 hex of the file, or an empty string when it cannot be read.
    static std::string contentHash(const std::string &path);

private:
    std::shared_ptr<FormatExtractor> extractorFor(DocumentFormat format) const;

    mutable std::mutex m_mutex;
    std::map<DocumentFormat, std::shared_ptr<FormatExtractor>> m_extractors;
};

} // namespace foldermind
