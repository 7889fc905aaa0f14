#pragma once

#include <string>
#include <vector>

#include "common/daemon_config.hpp"
#include "common/models.hpp"

namespace foldermind {

// One implementation per document format. plan() decides where chunks start
// and end; extract() regenerates the text of one chunk from its coordinates.
// extract() must be deterministic for an unchanged file and throws
// CoordinateMismatchError when the coordinates no longer resolve.
class FormatExtractor {
public:
    virtual ~FormatExtractor() = default;

    virtual DocumentFormat format() const = 0;

    virtual std::vector<ExtractionCoordinates> plan(const DocumentHandle &document,
                                                    const ChunkingOptions &options) const = 0;

    virtual std::string extract(const ExtractionCoordinates &coordinates,
                                const DocumentHandle &document) const = 0;
};

} // namespace foldermind
