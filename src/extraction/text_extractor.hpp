#pragma once

#include <string>
#include <vector>

#include "extraction/format_extractor.hpp"

namespace foldermind {

// Line-addressed extractor for plain text and markdown. Chunks are inclusive
// 1-based line ranges; markdown chunks also carry the nearest heading.
class TextExtractor : public FormatExtractor {
public:
    explicit TextExtractor(DocumentFormat format = DocumentFormat::Text);

    DocumentFormat format() const override;

    // Throws FolderError(MalformedContent) for binary or non UTF-8 files.
    std::vector<ExtractionCoordinates> plan(const DocumentHandle &document,
                                            const ChunkingOptions &options) const override;

    std::string extract(const ExtractionCoordinates &coordinates,
                        const DocumentHandle &document) const override;

    // Lines of the file without their terminators. A trailing newline does not
    // produce an extra empty line.
    static std::vector<std::string> splitLines(const std::string &content);

    // Rough token estimate: one token per four characters, rounded up.
    static int estimateTokens(const std::string &text);

private:
    DocumentFormat m_format;
};

} // namespace foldermind
